#pragma once
#include <vector>
#include <cstdint>
#include <map>
#include <string>
#include <chrono>
#include <utility>

namespace crashbus {

/// Every datagram starts with this header; a frame too large for one datagram spans several.
///
/// Wire: u32 message_id, u32 (offset / 16) << 4 | more_segments.
/// All segments but the last carry a multiple of 16 bytes.
struct SegmentHeader {
    uint32_t message_id = 0;
    uint32_t offset = 0; // in 16-byte units
    bool more_segments = false;

    static constexpr size_t kSize = 8;

    std::vector<uint8_t> serialize() const;
    static bool deserialize(const uint8_t* data, size_t len, SegmentHeader& out);
};

// Reassembled frames larger than this are discarded
static constexpr size_t kMaxFrameSize = 16 * 1024 * 1024;

/// Splits frame into chunks of at most max_segment_size bytes (rounded down to 16).
std::vector<std::pair<SegmentHeader, std::vector<uint8_t>>> segment_frame(const std::vector<uint8_t>& frame, uint32_t message_id, size_t max_segment_size);

/// Collects segments per (source, message id) until a frame is complete.
/// Not thread-safe; owned by the receiving thread.
class SegmentReassembler {
public:
    using Clock = std::chrono::steady_clock;

    /// Returns true and fills out when this segment completes a frame.
    bool process_segment(const std::string& source, const SegmentHeader& header, const std::vector<uint8_t>& chunk, std::vector<uint8_t>& out, Clock::time_point now = Clock::now());

    /// Drops partial frames whose first segment arrived more than max_age ago. Returns how many.
    size_t expire(Clock::time_point now, Clock::duration max_age);

    size_t partial_count() const { return buffers.size(); }

private:
    struct PartialFrame {
        std::map<uint32_t, std::vector<uint8_t>> segments; // offset -> data
        bool last_received = false;
        size_t expected_length = 0;
        Clock::time_point first_seen;
    };

    // Key: "source#message_id"
    std::map<std::string, PartialFrame> buffers;
};

} // namespace crashbus
