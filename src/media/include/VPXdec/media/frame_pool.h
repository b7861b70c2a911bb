/* Copyright (c) V-Nova International Limited 2025-2026. All rights reserved.
 * This software is licensed under the BSD-3-Clause-Clear License by V-Nova Limited.
 * No patent licenses are granted under this license. For enquiries about patent licenses,
 * please contact legal@v-nova.com.
 * The VPXdec software is a stand-alone project and is NOT A CONTRIBUTION to any other project.
 * If the software is incorporated into another project, THE TERMS OF THE BSD-3-CLAUSE-CLEAR LICENSE
 * AND THE ADDITIONAL LICENSING INFORMATION CONTAINED IN THIS FILE MUST BE MAINTAINED, AND THE
 * SOFTWARE DOES NOT AND MUST NOT ADOPT THE LICENSE OF THE INCORPORATING PROJECT. However, the
 * software may be incorporated into a project under a compatible license provided the requirements
 * of the BSD-3-Clause-Clear license are respected, and V-Nova Limited remains
 * licensor of the software ONLY UNDER the BSD-3-Clause-Clear license (not the compatible license).
 * ANY ONWARD DISTRIBUTION, WHETHER STAND-ALONE OR AS PART OF ANY OTHER PROJECT, REMAINS SUBJECT TO
 * THE EXCLUSION OF PATENT LICENSES PROVISION OF THE BSD-3-CLAUSE-CLEAR LICENSE. */

#ifndef VD_VPXDEC_MEDIA_FRAME_POOL_H
#define VD_VPXDEC_MEDIA_FRAME_POOL_H

#include <VPXdec/common/class_utils.hpp>
#include <VPXdec/media/frame.h>
#include <VPXdec/media/frame_descriptor.h>
#include <VPXdec/media/types.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace vpxdec {

// - FrameCreator ---------------------------------------------------------------------------------

// Decides what a frame pool puts into a frame it creates.
class FrameCreator
{
public:
    virtual ~FrameCreator() = default;
    virtual ReturnCode createFrame(const FrameDescriptor& desc, Frame& frame) const = 0;
};

// Allocates pixel memory with default strides.
class DefaultFrameCreator : public FrameCreator
{
public:
    ReturnCode createFrame(const FrameDescriptor& desc, Frame& frame) const override
    {
        return frame.allocate(desc);
    }
};

// - FramePool ------------------------------------------------------------------------------------

// Host-owned, thread-safe pool of frames of one configured descriptor. Always hold the pool in a
// std::shared_ptr: frames handed out go back to it when their last reference is dropped (or are
// simply deleted if the pool has gone by then). Shared buffers attached to a frame are detached
// on its return, so that their backing memory can be recycled by its own pool.
class FramePool : public std::enable_shared_from_this<FramePool>
{
public:
    FramePool() = default;
    VDNoCopyNoMove(FramePool);
    ~FramePool() = default;

    // Set the geometry and creator. A null creator means DefaultFrameCreator. Frames already
    // cached for a previous configuration are dropped.
    ReturnCode configure(const FrameDescriptor& desc, std::unique_ptr<FrameCreator> creator = nullptr);

    bool isConfigured() const;
    FrameDescriptor descriptor() const;

    // Fails with Uninitialized before configure(), and InvalidParam if `desc` is not the
    // configured descriptor.
    ReturnCode getFrame(const FrameDescriptor& desc, std::shared_ptr<Frame>& frameOut);

    size_t availableFrames() const;
    size_t createdFrames() const;

private:
    void recycle(Frame* frame);

    mutable std::mutex m_mutex;
    bool m_configured = false;
    FrameDescriptor m_desc;
    std::unique_ptr<FrameCreator> m_creator;
    std::vector<std::unique_ptr<Frame>> m_free;
    size_t m_created = 0;
};

} // namespace vpxdec

#endif // VD_VPXDEC_MEDIA_FRAME_POOL_H
