#pragma once

#include <bsplink/core/types.h>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace bsplink::ipc {

// LSP base-protocol framing used by BSP: a header block of "Name: value\r\n" lines
// (Content-Length required, Content-Type optional) terminated by an empty line, then exactly
// Content-Length bytes of UTF-8 JSON.
class MessageFramer {
public:
    static constexpr std::string_view kContentLength = "Content-Length";
    static constexpr std::string_view kContentType = "Content-Type";
    static constexpr std::string_view kHeaderTerminator = "\r\n\r\n";

    // Frame a serialized JSON body.
    [[nodiscard]] static std::string frame(std::string_view body);
};

// Buffered frame reader for the read loop
class FrameReader {
public:
    static constexpr size_t kMaxHeaderBytes = 8 * 1024;

    explicit FrameReader(size_t max_frame_size = 64 * 1024 * 1024)
        : max_frame_size_(max_frame_size) {}

    FrameReader(const FrameReader&) = delete;
    FrameReader& operator=(const FrameReader&) = delete;
    FrameReader(FrameReader&&) = delete;
    FrameReader& operator=(FrameReader&&) = delete;

    void append(std::span<const char> data) { buffer_.append(data.data(), data.size()); }
    void append(std::string_view data) { buffer_.append(data); }

    // Extract the next complete body. nullopt means more bytes are needed; an error
    // (ProtocolError) means the stream is corrupt and the connection must be failed.
    [[nodiscard]] Result<std::optional<std::string>> try_read_frame();

    [[nodiscard]] bool has_data() const noexcept { return !buffer_.empty(); }
    [[nodiscard]] size_t buffered() const noexcept { return buffer_.size(); }

    void clear() noexcept { buffer_.clear(); }

private:
    size_t max_frame_size_;
    std::string buffer_;
};

} // namespace bsplink::ipc
