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

#ifndef VD_VPXDEC_MEDIA_BUFFER_H
#define VD_VPXDEC_MEDIA_BUFFER_H

#include <VPXdec/common/class_utils.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace vpxdec {

// - Buffer ---------------------------------------------------------------------------------------

// A zero-initialised byte region. Buffers are shared through std::shared_ptr, whose use count is
// the buffer's reference count: the memory lives until the pool and every frame viewing it have
// let go.
class Buffer
{
public:
    explicit Buffer(size_t capacity);
    VDNoCopyNoMove(Buffer);
    ~Buffer() = default;

    uint8_t* data() { return m_data.data(); }
    const uint8_t* data() const { return m_data.data(); }
    size_t size() const { return m_data.size(); }

    // Reallocate to at least `capacity` bytes. Contents are not preserved. Returns false if the
    // allocation failed, in which case the buffer is unchanged.
    bool grow(size_t capacity);

    void zero();

private:
    std::vector<uint8_t> m_data;
};

// - BufferPool -----------------------------------------------------------------------------------

// Per-decoder cache of buffers. A buffer is free again once the pool holds the only reference to
// it. All buffers handed out are at least bufferCapacity() bytes. The capacity only ever grows.
//
// Not synchronised: the pool is only touched from the thread running the owning decoder call.
class BufferPool
{
public:
    explicit BufferPool(size_t capacity = 0);
    VDNoCopyNoMove(BufferPool);
    ~BufferPool() = default;

    size_t bufferCapacity() const { return m_capacity; }
    void setBufferCapacity(size_t capacity);

    // Returns a free (or new) buffer of at least max(bufferCapacity(), minSize) bytes, or nullptr
    // if memory could not be allocated. The capacity is raised to minSize only once a buffer of
    // that size exists.
    std::shared_ptr<Buffer> getBuffer(size_t minSize = 0);

    size_t bufferCount() const { return m_buffers.size(); }

    // Number of references to pooled buffers that are held outside the pool.
    size_t outstandingReferences() const;

    void release();

private:
    size_t m_capacity = 0;
    std::vector<std::shared_ptr<Buffer>> m_buffers;
};

} // namespace vpxdec

#endif // VD_VPXDEC_MEDIA_BUFFER_H
