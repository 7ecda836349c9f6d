#include "stream/frame_demuxer.hpp"

namespace codejoin::stream {
namespace {

std::uint32_t ReadBigEndian32(std::string_view data) {
    return (static_cast<std::uint32_t>(static_cast<unsigned char>(data[0])) << 24) |
           (static_cast<std::uint32_t>(static_cast<unsigned char>(data[1])) << 16) |
           (static_cast<std::uint32_t>(static_cast<unsigned char>(data[2])) << 8) |
           static_cast<std::uint32_t>(static_cast<unsigned char>(data[3]));
}

}  // namespace

std::vector<Frame> FrameDemuxer::Feed(std::string_view chunk) {
    buffer_.append(chunk);
    std::vector<Frame> frames;
    std::size_t offset = 0;
    while (buffer_.size() - offset >= kFrameHeaderSize) {
        const std::string_view header(buffer_.data() + offset, kFrameHeaderSize);
        const auto length = ReadBigEndian32(header.substr(4));
        if (buffer_.size() - offset - kFrameHeaderSize < length) {
            break;
        }
        Frame frame{};
        frame.channel = static_cast<Channel>(static_cast<unsigned char>(header[0]));
        frame.payload.assign(buffer_, offset + kFrameHeaderSize, length);
        frames.push_back(std::move(frame));
        offset += kFrameHeaderSize + length;
        ++frames_;
    }
    buffer_.erase(0, offset);
    return frames;
}

DemuxedOutput Demultiplex(std::string_view stream) {
    DemuxedOutput output{};
    FrameDemuxer demuxer;
    for (auto& frame : demuxer.Feed(stream)) {
        switch (frame.channel) {
            case Channel::kStdin:
            case Channel::kStdout:
                output.stdout_data += frame.payload;
                break;
            case Channel::kStderr:
            case Channel::kSystem:
                output.stderr_data += frame.payload;
                break;
            default:
                // Unknown channel ids are treated as stdout, as BatchRunner does.
                output.stdout_data += frame.payload;
                ++output.unknown_frames;
                break;
        }
    }
    output.complete = !demuxer.HasPartialFrame();
    return output;
}

std::string EncodeFrame(Channel channel, std::string_view payload) {
    const auto length = static_cast<std::uint32_t>(payload.size());
    std::string frame;
    frame.reserve(kFrameHeaderSize + payload.size());
    frame.push_back(static_cast<char>(channel));
    frame.append(3, '\0');
    frame.push_back(static_cast<char>((length >> 24) & 0xff));
    frame.push_back(static_cast<char>((length >> 16) & 0xff));
    frame.push_back(static_cast<char>((length >> 8) & 0xff));
    frame.push_back(static_cast<char>(length & 0xff));
    frame.append(payload);
    return frame;
}

}  // namespace codejoin::stream
