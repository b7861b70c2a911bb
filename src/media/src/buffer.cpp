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
#include <VPXdec/media/buffer.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <new>
#include <stdexcept>

namespace vpxdec {

static const LogComponent kComp = LogComponent::BufferPool;

// - Buffer ---------------------------------------------------------------------------------------

Buffer::Buffer(size_t capacity)
    : m_data(capacity, 0)
{}

bool Buffer::grow(size_t capacity)
{
    if (capacity <= m_data.size()) {
        return true;
    }
    try {
        std::vector<uint8_t> replacement(capacity, 0);
        m_data.swap(replacement);
    } catch (const std::bad_alloc&) {
        VDLogError("Failed to grow buffer from %zu to %zu bytes\n", m_data.size(), capacity);
        return false;
    } catch (const std::length_error&) {
        VDLogError("Buffer size %zu is too large\n", capacity);
        return false;
    }
    return true;
}

void Buffer::zero()
{
    if (!m_data.empty()) {
        memset(m_data.data(), 0, m_data.size());
    }
}

// - BufferPool -----------------------------------------------------------------------------------

BufferPool::BufferPool(size_t capacity)
    : m_capacity(capacity)
{}

void BufferPool::setBufferCapacity(size_t capacity)
{
    if (capacity > m_capacity) {
        VDLogDebug("Buffer capacity %zu -> %zu\n", m_capacity, capacity);
        m_capacity = capacity;
    }
}

std::shared_ptr<Buffer> BufferPool::getBuffer(size_t minSize)
{
    const size_t capacity = std::max(m_capacity, minSize);
    for (const std::shared_ptr<Buffer>& buffer : m_buffers) {
        if (buffer.use_count() != 1) {
            continue;
        }
        if (buffer->size() < capacity && !buffer->grow(capacity)) {
            return nullptr;
        }
        setBufferCapacity(capacity);
        return buffer;
    }

    std::shared_ptr<Buffer> buffer;
    try {
        buffer = std::make_shared<Buffer>(capacity);
        m_buffers.push_back(buffer);
    } catch (const std::bad_alloc&) {
        VDLogError("Failed to allocate a %zu byte buffer (%zu in pool)\n", capacity,
                   m_buffers.size());
        return nullptr;
    } catch (const std::length_error&) {
        VDLogError("Buffer size %zu is too large\n", capacity);
        return nullptr;
    }
    setBufferCapacity(capacity);
    VDLogTrace("New buffer of %zu bytes, %zu in pool\n", capacity, m_buffers.size());
    return buffer;
}

size_t BufferPool::outstandingReferences() const
{
    size_t count = 0;
    for (const std::shared_ptr<Buffer>& buffer : m_buffers) {
        count += static_cast<size_t>(buffer.use_count() - 1);
    }
    return count;
}

void BufferPool::release() { m_buffers.clear(); }

} // namespace vpxdec
