/**
 * @file log_stream.hpp
 * @brief Demultiplexer for the engine's framed stdout/stderr log stream.
 *
 * Non-TTY containers deliver output as frames:
 *   [stream:u8][0:u8][0:u8][0:u8][length:u32 big-endian][payload]
 * Frames may arrive split across arbitrary read boundaries.
 */

#pragma once

#include "engine/container_engine.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace codebox {

class LogDemuxer {
public:
    static constexpr size_t HEADER_SIZE = 8;

    /// @param limit  Capture ceiling applied to each stream independently.
    explicit LogDemuxer(size_t limit);

    /// Consume the next bytes of the stream.
    void feed(std::string_view bytes);

    /// True when both streams are already past their ceiling.
    [[nodiscard]] bool saturated() const noexcept;
    /// True when @p stream is past its ceiling.
    [[nodiscard]] bool saturated(LogStream stream) const noexcept;

    /// True when the stream ended inside a frame.
    [[nodiscard]] bool incomplete() const noexcept { return header_fill_ != 0 || frame_left_ != 0; }

    [[nodiscard]] const StreamCapture& capture(LogStream stream) const noexcept;
    [[nodiscard]] StreamCapture take(LogStream stream) noexcept;

private:
    void append(uint8_t stream, std::string_view payload);

    size_t limit_;
    std::array<uint8_t, HEADER_SIZE> header_{};
    size_t header_fill_{0};
    uint8_t frame_stream_{0};
    size_t frame_left_{0};

    StreamCapture stdout_;
    StreamCapture stderr_;
};

}  // namespace codebox
