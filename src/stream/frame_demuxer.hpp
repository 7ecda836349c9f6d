#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace codejoin::stream {

// Channel ids of the runtime's multiplexed attach/log stream.
enum class Channel : std::uint8_t {
    kStdin = 0,
    kStdout = 1,
    kStderr = 2,
    kSystem = 3
};

constexpr std::size_t kFrameHeaderSize = 8;

struct Frame {
    Channel channel = Channel::kStdout;
    std::string payload;
};

/**
 * Incremental reader for the 8-byte framed stream:
 * [channel:1][reserved:3][length:4 big-endian][payload:length].
 * Headers and payloads may arrive split across any number of Feed() calls.
 */
class FrameDemuxer {
public:
    std::vector<Frame> Feed(std::string_view chunk);

    bool HasPartialFrame() const { return !buffer_.empty(); }
    std::size_t PendingBytes() const { return buffer_.size(); }
    std::uint64_t FramesDecoded() const { return frames_; }

private:
    std::string buffer_;
    std::uint64_t frames_ = 0;
};

struct DemuxedOutput {
    std::string stdout_data;
    std::string stderr_data;
    // False when the stream ended inside a frame.
    bool complete = true;
    // Frames whose channel byte was not 0-3.
    std::size_t unknown_frames = 0;
};

DemuxedOutput Demultiplex(std::string_view stream);

std::string EncodeFrame(Channel channel, std::string_view payload);

}  // namespace codejoin::stream
