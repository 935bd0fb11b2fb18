#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <bsplink/core/types.h>

namespace bsplink::client {

// First line of every analysis file written by the build server.
inline constexpr std::string_view kAnalysisFileMagic = "BSPLINK-ANALYSIS";
inline constexpr int kAnalysisFormatVersion = 1;

// Decoded analysis of one target for one compile. The payload is opaque to this library.
struct AnalysisContents {
    std::filesystem::path location;
    int formatVersion{kAnalysisFormatVersion};
    std::string payload;

    std::size_t sizeBytes() const noexcept { return payload.size() + location.native().size(); }
};

// Serialized file form: "<magic> <version>\n" followed by the payload.
std::string encode_analysis(std::string_view payload);
Result<AnalysisContents> decode_analysis(std::string_view bytes, std::filesystem::path location);

class IAnalysisReader {
public:
    virtual ~IAnalysisReader() = default;

    // Empty when no analysis exists at the location; DecodeFailed when it exists but cannot be
    // read or parsed.
    virtual Result<std::optional<AnalysisContents>> read(const std::filesystem::path& location) = 0;
};

class FileAnalysisReader : public IAnalysisReader {
public:
    explicit FileAnalysisReader(std::size_t maxBytes = 256 * 1024 * 1024) : maxBytes_(maxBytes) {}

    Result<std::optional<AnalysisContents>> read(const std::filesystem::path& location) override;

private:
    std::size_t maxBytes_;
};

} // namespace bsplink::client
