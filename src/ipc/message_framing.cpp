#include <bsplink/core/format.h>
#include <bsplink/ipc/message_framing.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace bsplink::ipc {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string_view trim_view(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.remove_suffix(1);
    return s;
}

} // namespace

std::string MessageFramer::frame(std::string_view body) {
    std::string out = bsplink::format("{}: {}\r\n\r\n", kContentLength, body.size());
    out.append(body);
    return out;
}

Result<std::optional<std::string>> FrameReader::try_read_frame() {
    auto headerEnd = buffer_.find(MessageFramer::kHeaderTerminator);
    if (headerEnd == std::string::npos) {
        if (buffer_.size() > kMaxHeaderBytes) {
            return Error{ErrorCode::ProtocolError, "Frame header exceeds limit"};
        }
        return std::optional<std::string>{};
    }

    std::string_view headers(buffer_.data(), headerEnd);
    std::optional<size_t> contentLength;
    while (!headers.empty()) {
        auto eol = headers.find("\r\n");
        auto line = headers.substr(0, eol);
        headers = eol == std::string_view::npos ? std::string_view{} : headers.substr(eol + 2);

        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return Error{ErrorCode::ProtocolError,
                         bsplink::format("Malformed header line '{}'", line)};
        }
        auto name = trim_view(line.substr(0, colon));
        auto value = trim_view(line.substr(colon + 1));
        if (iequals(name, MessageFramer::kContentLength)) {
            size_t n = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
            if (ec != std::errc() || ptr != value.data() + value.size()) {
                return Error{ErrorCode::ProtocolError,
                             bsplink::format("Invalid Content-Length '{}'", value)};
            }
            contentLength = n;
        }
        // Content-Type and unknown headers are accepted and ignored.
    }

    if (!contentLength) {
        return Error{ErrorCode::ProtocolError, "Missing Content-Length header"};
    }
    if (*contentLength > max_frame_size_) {
        return Error{ErrorCode::ProtocolError,
                     bsplink::format("Frame too large ({} bytes)", *contentLength)};
    }

    auto bodyStart = headerEnd + MessageFramer::kHeaderTerminator.size();
    if (buffer_.size() - bodyStart < *contentLength) {
        return std::optional<std::string>{};
    }

    std::string body = buffer_.substr(bodyStart, *contentLength);
    buffer_.erase(0, bodyStart + *contentLength);
    return std::optional<std::string>{std::move(body)};
}

} // namespace bsplink::ipc
