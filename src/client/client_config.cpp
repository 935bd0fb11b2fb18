#include <bsplink/client/client_config.h>
#include <bsplink/config/config_helpers.h>
#include <bsplink/core/format.h>
#include <bsplink/ipc/endpoint.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>

namespace bsplink::client {

namespace {

std::optional<std::chrono::milliseconds> parse_millis(const std::string& raw) {
    if (raw.empty()) {
        return std::nullopt;
    }
    try {
        long ms = std::stol(raw);
        if (ms >= 0) {
            return std::chrono::milliseconds(ms);
        }
    } catch (const std::exception&) {
    }
    spdlog::warn("Ignoring invalid duration '{}' in config", raw);
    return std::nullopt;
}

std::vector<std::string> split_words(const std::string& raw) {
    std::vector<std::string> words;
    std::istringstream in(raw);
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

} // namespace

ClientConfig ClientConfig::load(const std::filesystem::path& configPath) {
    ClientConfig cfg;
    cfg.endpoint = config::resolve_endpoint_from_config();
    cfg.serverBinary = config::resolve_server_binary_from_config();

    auto path = configPath.empty() ? config::get_config_path() : configPath;
    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
        spdlog::debug("Reading client configuration from {}", path.string());
        if (!configPath.empty()) {
            // An explicit file wins over the default lookup for these two keys
            if (auto v = config::parse_config_value(path, "client", "endpoint"); !v.empty())
                cfg.endpoint = v;
            if (auto v = config::parse_config_value(path, "server", "binary"); !v.empty())
                cfg.serverBinary = config::expand_tilde(v);
        }
        if (auto v = parse_millis(config::parse_config_value(path, "client", "connect_timeout_ms")))
            cfg.connectTimeout = *v;
        if (auto v = parse_millis(config::parse_config_value(path, "client", "request_timeout_ms")))
            cfg.requestTimeout = *v;
        if (auto v =
                parse_millis(config::parse_config_value(path, "client", "readiness_timeout_ms")))
            cfg.readinessTimeout = *v;
        if (auto v = parse_millis(config::parse_config_value(path, "client", "idle_timeout_ms")))
            cfg.idleTimeout = *v;
        if (auto v = config::parse_config_value(path, "client", "readiness"); !v.empty()) {
            if (auto strategy = parse_readiness_strategy(v)) {
                cfg.readiness = *strategy;
            } else {
                spdlog::warn("Unknown readiness strategy '{}', using {}", v,
                             to_string(cfg.readiness));
            }
        }
        if (auto v = config::parse_config_value(path, "client", "autostart"); !v.empty())
            cfg.autoStart = config::env_truthy(v.c_str());
        if (auto v = config::parse_config_value(path, "client", "decode_threads"); !v.empty()) {
            try {
                cfg.decodeThreads = std::max<std::size_t>(1, std::stoul(v));
            } catch (const std::exception&) {
                spdlog::warn("Ignoring invalid decode_threads '{}'", v);
            }
        }
        if (auto v = config::parse_config_value(path, "server", "args"); !v.empty())
            cfg.serverArgs = split_words(v);
    }

    if (const char* noauto = std::getenv("BSPLINK_DISABLE_AUTOSTART");
        noauto && config::env_truthy(noauto)) {
        cfg.autoStart = false;
    }
    if (auto ms = config::env_milliseconds("BSPLINK_REQUEST_TIMEOUT_MS")) {
        cfg.requestTimeout = *ms;
    }
    return cfg;
}

Result<LauncherOptions> ClientConfig::launcher_options() const {
    auto parsed = ipc::parse_endpoint(endpoint);
    if (!parsed) {
        return parsed.error();
    }
    LauncherOptions options;
    options.endpoint = std::move(parsed).value();
    options.serverBinary = serverBinary;
    options.extraArgs = serverArgs;
    options.readiness = readiness;
    options.readinessTimeout = readinessTimeout;
    options.autoStart = autoStart;
    options.transport.connectTimeout = connectTimeout;
    options.transport.requestTimeout = requestTimeout;
    options.transport.idleTimeout = idleTimeout;
    if (!workspace.empty()) {
        options.extraArgs.push_back("--workspace");
        options.extraArgs.push_back(workspace.string());
    }
    return options;
}

} // namespace bsplink::client
