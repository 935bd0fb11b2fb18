#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace bsplink::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() == 1) {
                return std::filesystem::path(home);
            }
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Terminal sanitization
inline std::string sanitize_for_terminal(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        if (c >= 0x20 && c <= 0x7E) {
            out.push_back(static_cast<char>(c));
        } else if (c == '\n' || c == '\r' || c == '\t') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('?');
        }
    }
    return out;
}

inline bool env_truthy(const char* value) {
    if (!value)
        return false;
    std::string v(value);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v == "1" || v == "true" || v == "on" || v == "yes";
}

// Positive millisecond value from an environment variable, if set and parseable.
std::optional<std::chrono::milliseconds> env_milliseconds(const char* name);

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path
// $BSPLINK_CONFIG, else $XDG_CONFIG_HOME/bsplink/config.toml, else ~/.config/bsplink/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the runtime directory (sockets, ephemeral files)
/// $XDG_RUNTIME_DIR/bsplink or /tmp/bsplink-$UID
std::filesystem::path get_runtime_dir();

// Client endpoint resolution (env -> config -> default local socket). Returns the text form
// accepted by ipc::parse_endpoint.
std::string resolve_endpoint_from_config();

// Server binary resolution (env -> config -> "bsplink-server" looked up in PATH)
std::string resolve_server_binary_from_config();

} // namespace bsplink::config
