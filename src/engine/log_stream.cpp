/**
 * @file log_stream.cpp
 * @brief LogDemuxer implementation.
 */

#include "engine/log_stream.hpp"

#include <algorithm>
#include <utility>

namespace codebox {

namespace {

uint32_t decode_u32(const uint8_t* buf) {
    return (static_cast<uint32_t>(buf[0]) << 24)
         | (static_cast<uint32_t>(buf[1]) << 16)
         | (static_cast<uint32_t>(buf[2]) << 8)
         | static_cast<uint32_t>(buf[3]);
}

}  // anonymous namespace

LogDemuxer::LogDemuxer(size_t limit) : limit_(limit) {}

void LogDemuxer::feed(std::string_view bytes) {
    while (!bytes.empty()) {
        if (frame_left_ == 0) {
            size_t take = std::min(HEADER_SIZE - header_fill_, bytes.size());
            std::copy_n(bytes.begin(), take, header_.begin() + static_cast<std::ptrdiff_t>(header_fill_));
            header_fill_ += take;
            bytes.remove_prefix(take);
            if (header_fill_ < HEADER_SIZE) return;

            header_fill_ = 0;
            frame_stream_ = header_[0];
            frame_left_ = decode_u32(header_.data() + 4);
            continue;
        }

        size_t take = std::min(frame_left_, bytes.size());
        append(frame_stream_, bytes.substr(0, take));
        frame_left_ -= take;
        bytes.remove_prefix(take);
    }
}

void LogDemuxer::append(uint8_t stream, std::string_view payload) {
    StreamCapture* target = nullptr;
    if (stream == static_cast<uint8_t>(LogStream::Stdout)) {
        target = &stdout_;
    } else if (stream == static_cast<uint8_t>(LogStream::Stderr)) {
        target = &stderr_;
    } else {
        return;  // stdin echo or unknown stream id
    }

    size_t room = limit_ > target->data.size() ? limit_ - target->data.size() : 0;
    if (payload.size() > room) {
        target->truncated = true;
        payload = payload.substr(0, room);
    }
    target->data.append(payload);
}

bool LogDemuxer::saturated() const noexcept {
    return stdout_.truncated && stderr_.truncated;
}

bool LogDemuxer::saturated(LogStream stream) const noexcept {
    return capture(stream).truncated;
}

const StreamCapture& LogDemuxer::capture(LogStream stream) const noexcept {
    return stream == LogStream::Stdout ? stdout_ : stderr_;
}

StreamCapture LogDemuxer::take(LogStream stream) noexcept {
    auto& src = stream == LogStream::Stdout ? stdout_ : stderr_;
    StreamCapture out = std::move(src);
    src = StreamCapture{};
    return out;
}

}  // namespace codebox
