#include <bsplink/client/analysis_reader.h>
#include <bsplink/core/format.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>

namespace bsplink::client {

std::string encode_analysis(std::string_view payload) {
    std::string out = bsplink::format("{} {}\n", kAnalysisFileMagic, kAnalysisFormatVersion);
    out.append(payload);
    return out;
}

Result<AnalysisContents> decode_analysis(std::string_view bytes, std::filesystem::path location) {
    auto eol = bytes.find('\n');
    if (eol == std::string_view::npos) {
        return Error{ErrorCode::DecodeFailed,
                     bsplink::format("analysis {} has no header", location.string())};
    }
    auto header = bytes.substr(0, eol);
    if (header.substr(0, kAnalysisFileMagic.size()) != kAnalysisFileMagic ||
        header.size() <= kAnalysisFileMagic.size() + 1 ||
        header[kAnalysisFileMagic.size()] != ' ') {
        return Error{ErrorCode::DecodeFailed,
                     bsplink::format("analysis {} has an invalid header", location.string())};
    }

    auto versionText = header.substr(kAnalysisFileMagic.size() + 1);
    int version = 0;
    auto [ptr, ec] =
        std::from_chars(versionText.data(), versionText.data() + versionText.size(), version);
    if (ec != std::errc{} || ptr != versionText.data() + versionText.size()) {
        return Error{ErrorCode::DecodeFailed,
                     bsplink::format("analysis {} has an invalid version", location.string())};
    }
    if (version != kAnalysisFormatVersion) {
        return Error{ErrorCode::DecodeFailed,
                     bsplink::format("analysis {} has unsupported version {}", location.string(),
                                     version)};
    }

    AnalysisContents contents;
    contents.location = std::move(location);
    contents.formatVersion = version;
    contents.payload.assign(bytes.substr(eol + 1));
    return contents;
}

Result<std::optional<AnalysisContents>>
FileAnalysisReader::read(const std::filesystem::path& location) {
    std::error_code ec;
    if (!std::filesystem::exists(location, ec)) {
        spdlog::debug("No analysis at {}", location.string());
        return std::optional<AnalysisContents>{};
    }
    auto size = std::filesystem::file_size(location, ec);
    if (ec) {
        return Error{ErrorCode::DecodeFailed,
                     bsplink::format("cannot stat {}: {}", location.string(), ec.message())};
    }
    if (size > maxBytes_) {
        return Error{ErrorCode::DecodeFailed,
                     bsplink::format("analysis {} is too large ({} bytes)", location.string(),
                                     size)};
    }

    std::ifstream in(location, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::DecodeFailed,
                     bsplink::format("cannot open {}", location.string())};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::DecodeFailed,
                     bsplink::format("read error on {}", location.string())};
    }

    auto decoded = decode_analysis(buffer.str(), location);
    if (!decoded) {
        return decoded.error();
    }
    return std::optional<AnalysisContents>{std::move(decoded).value()};
}

} // namespace bsplink::client
