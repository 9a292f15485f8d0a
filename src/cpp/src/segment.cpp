#include "crashbus/segment.hpp"
#include "crashbus/wire.hpp"
#include <algorithm>

namespace crashbus {

std::vector<uint8_t> SegmentHeader::serialize() const {
    std::vector<uint8_t> buf;
    buf.reserve(kSize);
    write_u32_be(buf, message_id);
    write_u32_be(buf, (offset << 4) | (more_segments ? 1 : 0));
    return buf;
}

bool SegmentHeader::deserialize(const uint8_t* data, size_t len, SegmentHeader& out) {
    uint32_t id = 0, val = 0;
    if (!read_u32_be(data, len, id)) return false;
    if (!read_u32_be(data, len, val)) return false;
    out.message_id = id;
    out.offset = val >> 4;
    out.more_segments = (val & 0x01) != 0;
    return true;
}

std::vector<std::pair<SegmentHeader, std::vector<uint8_t>>> segment_frame(const std::vector<uint8_t>& frame, uint32_t message_id, size_t max_segment_size) {
    std::vector<std::pair<SegmentHeader, std::vector<uint8_t>>> segments;
    size_t chunk_limit = std::max<size_t>((max_segment_size / 16) * 16, 16);

    size_t pos = 0;
    do {
        size_t remaining = frame.size() - pos;
        bool more = remaining > chunk_limit;
        size_t chunk_size = more ? chunk_limit : remaining;

        SegmentHeader h;
        h.message_id = message_id;
        h.offset = (uint32_t)(pos / 16);
        h.more_segments = more;
        segments.push_back({h, std::vector<uint8_t>(frame.begin() + pos, frame.begin() + pos + chunk_size)});
        pos += chunk_size;
    } while (pos < frame.size());
    return segments;
}

bool SegmentReassembler::process_segment(const std::string& source, const SegmentHeader& header, const std::vector<uint8_t>& chunk,
                                         std::vector<uint8_t>& out, Clock::time_point now) {
    size_t byte_offset = (size_t)header.offset * 16;
    if (header.offset == 0 && !header.more_segments) {
        // Fits in one datagram
        out = chunk;
        return true;
    }

    std::string key = source + "#" + std::to_string(header.message_id);
    auto found = buffers.find(key);
    bool fresh = found == buffers.end();
    PartialFrame& partial = buffers[key];
    if (fresh) partial.first_seen = now;

    if ((header.more_segments && (chunk.empty() || chunk.size() % 16 != 0)) || byte_offset + chunk.size() > kMaxFrameSize) {
        buffers.erase(key);
        return false;
    }

    partial.segments[header.offset] = chunk;
    if (!header.more_segments) {
        partial.last_received = true;
        partial.expected_length = byte_offset + chunk.size();
    }
    if (!partial.last_received) return false;

    size_t received = 0;
    for (auto const& [off, data] : partial.segments) {
        if ((size_t)off * 16 != received) return false; // gap
        received += data.size();
    }
    if (received != partial.expected_length) return false;

    out.clear();
    out.reserve(received);
    for (auto const& [off, data] : partial.segments) {
        out.insert(out.end(), data.begin(), data.end());
    }
    buffers.erase(key);
    return true;
}

size_t SegmentReassembler::expire(Clock::time_point now, Clock::duration max_age) {
    size_t dropped = 0;
    for (auto it = buffers.begin(); it != buffers.end();) {
        if (now - it->second.first_seen > max_age) {
            it = buffers.erase(it);
            dropped++;
        } else {
            ++it;
        }
    }
    return dropped;
}

} // namespace crashbus
