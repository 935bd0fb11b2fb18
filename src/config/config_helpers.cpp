#include <fstream>
#include <bsplink/config/config_helpers.h>

#include <unistd.h>

namespace bsplink::config {

std::optional<std::chrono::milliseconds> env_milliseconds(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw)
        return std::nullopt;
    try {
        long ms = std::stol(std::string(raw));
        if (ms > 0)
            return std::chrono::milliseconds(ms);
    } catch (const std::exception&) {
    }
    return std::nullopt;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside of quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Support both "client.endpoint" and "[client] endpoint"
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    if (const char* cfgEnv = std::getenv("BSPLINK_CONFIG"); cfgEnv && *cfgEnv) {
        return std::filesystem::path(cfgEnv);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv && *homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return {};
    }

    return configHome / "bsplink" / "config.toml";
}

std::filesystem::path get_runtime_dir() {
    if (const char* xdgRuntime = std::getenv("XDG_RUNTIME_DIR"); xdgRuntime && *xdgRuntime) {
        return std::filesystem::path(xdgRuntime) / "bsplink";
    }
    return std::filesystem::temp_directory_path() /
           ("bsplink-" + std::to_string(static_cast<unsigned long>(::getuid())));
}

std::string resolve_endpoint_from_config() {
    // 1) BSPLINK_ENDPOINT env
    if (const char* env = std::getenv("BSPLINK_ENDPOINT"); env && *env) {
        return env;
    }

    // 2) config.toml client.endpoint
    auto config_path = get_config_path();
    if (!config_path.empty() && std::filesystem::exists(config_path)) {
        if (auto value = parse_config_value(config_path, "client", "endpoint"); !value.empty()) {
            return value;
        }
    }

    // 3) Default local socket in the runtime directory
    return "local://" + (get_runtime_dir() / "bsp.sock").string();
}

std::string resolve_server_binary_from_config() {
    if (const char* env = std::getenv("BSPLINK_SERVER_BIN"); env && *env) {
        return env;
    }

    auto config_path = get_config_path();
    if (!config_path.empty() && std::filesystem::exists(config_path)) {
        if (auto value = parse_config_value(config_path, "server", "binary"); !value.empty()) {
            return expand_tilde(value).string();
        }
    }

    // Look next to the running executable first (build trees), then fall back to PATH.
    char buf[4096];
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n > 0) {
        buf[n] = '\0';
        auto candidate = std::filesystem::path(buf).parent_path() / "bsplink-server";
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec)) {
            return candidate.string();
        }
    }
    return "bsplink-server";
}

} // namespace bsplink::config
