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

#include <VPXdec/common/log.h>
#include <VPXdec/media/frame_pool.h>

#include <memory>
#include <new>
#include <utility>

namespace vpxdec {

static const LogComponent kComp = LogComponent::FramePool;

ReturnCode FramePool::configure(const FrameDescriptor& desc, std::unique_ptr<FrameCreator> creator)
{
    if (!desc.isValid()) {
        VDLogError("Invalid frame pool descriptor %ux%u\n", desc.width, desc.height);
        return ReturnCode::InvalidParam;
    }

    std::vector<std::unique_ptr<Frame>> dropped;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_desc = desc;
        m_creator = creator ? std::move(creator) : std::make_unique<DefaultFrameCreator>();
        m_configured = true;
        dropped.swap(m_free);
    }
    VDLogDebug("Configured %ux%u, %zu cached frames dropped\n", desc.width, desc.height,
               dropped.size());
    return ReturnCode::Success;
}

bool FramePool::isConfigured() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_configured;
}

FrameDescriptor FramePool::descriptor() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_desc;
}

ReturnCode FramePool::getFrame(const FrameDescriptor& desc, std::shared_ptr<Frame>& frameOut)
{
    std::unique_ptr<Frame> frame;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_configured) {
            VDLogError("Frame requested from an unconfigured pool\n");
            return ReturnCode::Uninitialized;
        }
        if (desc != m_desc) {
            VDLogError("Frame requested as %ux%u, pool is configured for %ux%u\n", desc.width,
                       desc.height, m_desc.width, m_desc.height);
            return ReturnCode::InvalidParam;
        }

        if (!m_free.empty()) {
            frame = std::move(m_free.back());
            m_free.pop_back();
        } else {
            frame.reset(new (std::nothrow) Frame());
            if (!frame) {
                VDLogError("Failed to allocate frame\n");
                return ReturnCode::Error;
            }
            if (const ReturnCode res = m_creator->createFrame(m_desc, *frame);
                res != ReturnCode::Success) {
                return res;
            }
            m_created++;
        }
    }

    // From here on the deleter owns the frame, including when the control block allocation
    // throws.
    std::weak_ptr<FramePool> weakPool = weak_from_this();
    Frame* pooled = frame.release();
    try {
        frameOut = std::shared_ptr<Frame>(pooled, [weakPool](Frame* returned) {
            if (std::shared_ptr<FramePool> pool = weakPool.lock()) {
                pool->recycle(returned);
            } else {
                delete returned;
            }
        });
    } catch (const std::bad_alloc&) {
        VDLogError("Failed to allocate frame reference\n");
        return ReturnCode::Error;
    }
    return ReturnCode::Success;
}

void FramePool::recycle(Frame* frame)
{
    std::unique_ptr<Frame> owned(frame);
    if (owned->isAttached()) {
        owned->detach();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_configured || owned->descriptor() != m_desc) {
        return;
    }
    try {
        m_free.push_back(std::move(owned));
    } catch (const std::bad_alloc&) {
        VDLogWarning("Frame could not be cached, freeing it\n");
    }
}

size_t FramePool::availableFrames() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_free.size();
}

size_t FramePool::createdFrames() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_created;
}

} // namespace vpxdec
