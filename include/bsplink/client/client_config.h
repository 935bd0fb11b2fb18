#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <bsplink/client/launcher.h>
#include <bsplink/core/types.h>

namespace bsplink::client {

struct ClientConfig {
    // Endpoint in text form, see ipc::parse_endpoint
    std::string endpoint;
    std::filesystem::path serverBinary{"bsplink-server"};
    std::vector<std::string> serverArgs;
    ReadinessStrategy readiness{ReadinessStrategy::Sentinel};
    bool autoStart{true};

    std::chrono::milliseconds connectTimeout{2000};
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds readinessTimeout{30000};
    std::chrono::milliseconds idleTimeout{0};

    // Workers decoding analyses
    std::size_t decodeThreads{2};
    std::size_t maxDecodedBytes{512 * 1024 * 1024};

    std::string clientName{"bsplink"};
    std::string clientVersion{"0.1.0"};
    std::filesystem::path workspace;
    std::vector<std::string> languageIds{"scala", "java"};

    /**
     * Defaults, then the config file ([client] and [server] sections), then environment:
     * BSPLINK_ENDPOINT, BSPLINK_SERVER_BIN, BSPLINK_DISABLE_AUTOSTART,
     * BSPLINK_REQUEST_TIMEOUT_MS.
     */
    static ClientConfig load(const std::filesystem::path& configPath = {});

    Result<LauncherOptions> launcher_options() const;
};

} // namespace bsplink::client
