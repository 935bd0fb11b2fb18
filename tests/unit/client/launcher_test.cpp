#include <gtest/gtest.h>

#include <bsplink/client/connection_registry.h>
#include <bsplink/client/launcher.h>
#include <bsplink/client/run_sync.h>
#include <bsplink/ipc/json_rpc_peer.h>

#include "common/bsp_test_helpers.h"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <future>
#include <set>
#include <vector>

#include <sys/stat.h>
#include <sys/wait.h>

namespace bsplink::client::test {

using namespace std::chrono_literals;

namespace {

// Executable /bin/sh script standing in for the server binary
std::filesystem::path write_script(const bsplink::tests::TempDir& dir, const std::string& name,
                                   const std::string& body) {
    auto path = bsplink::tests::write_file(dir / name, "#!/bin/sh\n" + body + "\n");
    ::chmod(path.c_str(), 0755);
    return path;
}

class LauncherTest : public ::testing::Test {
protected:
    void SetUp() override { ::unsetenv("BSPLINK_DISABLE_AUTOSTART"); }

    LauncherOptions options_for(std::filesystem::path binary) {
        LauncherOptions options;
        options.endpoint = ipc::LocalSocketEndpoint{dir_ / "bsp.sock"};
        options.serverBinary = std::move(binary);
        options.readinessTimeout = 500ms;
        options.transport.connectTimeout = 200ms;
        return options;
    }

    Result<LaunchResult> connect(LauncherOptions options, bool restart = false) {
        Launcher launcher(std::move(options));
        return run_sync(launcher.connect(restart), 10s);
    }

    bsplink::tests::TempDir dir_;
};

// Spawns the real bsplink-server through a wrapper script that records each pid
class LaunchedServerTest : public ::testing::Test {
protected:
    void SetUp() override {
#ifndef BSPLINK_SERVER_BINARY
        GTEST_SKIP() << "bsplink-server is not built";
#else
        ::unsetenv("BSPLINK_DISABLE_AUTOSTART");
        bsplink::tests::write_project(dir_.path(), "core", {}, {{"Core.scala", "object Core\n"}});
        server_ = wrapper("server", "");
#endif
    }

    void TearDown() override {
        for (auto pid : spawned()) {
            stop_pid(pid);
        }
    }

    std::filesystem::path wrapper(const std::string& name, const std::string& beforeExec) {
#ifdef BSPLINK_SERVER_BINARY
        return write_script(dir_, name,
                            "echo $$ >> '" + (dir_ / "spawns.log").string() + "'\n" + beforeExec +
                                "\nexec '" + std::string(BSPLINK_SERVER_BINARY) + "' \"$@\"");
#else
        return {};
#endif
    }

    LauncherOptions options_for(std::filesystem::path binary) {
        LauncherOptions options;
        options.endpoint = ipc::LocalSocketEndpoint{dir_ / "bsp.sock"};
        options.serverBinary = std::move(binary);
        options.extraArgs = {"--workspace", dir_.path().string(), "--log-level", "warn"};
        options.readinessTimeout = 10s;
        options.transport.connectTimeout = 500ms;
        return options;
    }

    std::vector<pid_t> spawned() const {
        std::vector<pid_t> pids;
        std::ifstream in(dir_ / "spawns.log");
        pid_t pid = 0;
        while (in >> pid) {
            pids.push_back(pid);
        }
        return pids;
    }

    static bool running(pid_t pid) {
        // Reaps an exited child so it stops counting as alive
        int status = 0;
        if (::waitpid(pid, &status, WNOHANG) == pid) {
            return false;
        }
        return ::kill(pid, 0) == 0 || errno != ESRCH;
    }

    static void stop_pid(pid_t pid) {
        if (::kill(pid, SIGTERM) != 0) {
            return;
        }
        if (!bsplink::tests::wait_until([pid] { return !running(pid); }, 5s)) {
            ::kill(pid, SIGKILL);
            ::waitpid(pid, nullptr, 0);
        }
    }

    // build/initialize over a fresh peer; returns the server's display name
    static std::string initialize(std::shared_ptr<ipc::Connection> connection) {
        auto peer = ipc::JsonRpcPeer::create(std::move(connection));
        peer->start();
        ipc::InitializeBuildParams params;
        params.displayName = "launcher-test";
        params.version = "1.0";
        params.rootUri = "file:///tmp";
        auto reply = run_sync(
            peer->request(std::string(ipc::methods::kInitialize), ipc::json(params), 5s), 6s);
        peer->close();
        if (!reply) {
            return "error: " + reply.error().message;
        }
        return reply.value().value("displayName", std::string());
    }

    BuildClientOptions client_options() const {
        BuildClientOptions options;
        options.workspace = dir_.path();
        options.requestTimeout = 5s;
        return options;
    }

    bsplink::tests::TempDir dir_;
    std::filesystem::path server_;
};

} // namespace

TEST(ReadyLine, FormatAndParse) {
    auto line = format_ready_line("local:///run/bsp.sock", "bsplink-1");
    EXPECT_EQ(line, "BSPLINK_SERVER_READY local:///run/bsp.sock bsplink-1");

    auto parsed = parse_ready_line(line + "\r");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->endpoint, "local:///run/bsp.sock");

    EXPECT_FALSE(parse_ready_line("Starting server...").has_value());
    EXPECT_FALSE(parse_ready_line("BSPLINK_SERVER_READY local:///x").has_value());
}

TEST(ReadinessStrategyNames, ParseKnownValues) {
    EXPECT_EQ(parse_readiness_strategy("probe"), ReadinessStrategy::Probe);
    EXPECT_EQ(parse_readiness_strategy("sentinel"), ReadinessStrategy::Sentinel);
    EXPECT_FALSE(parse_readiness_strategy("magic").has_value());
    EXPECT_STREQ(to_string(ReadinessStrategy::Probe), "probe");
}

TEST(ReadinessSignalTest, FirstResolutionWins) {
    ReadinessSignal signal;
    EXPECT_FALSE(signal.ready());
    EXPECT_FALSE(signal.wait_for(1ms).has_value());
    EXPECT_TRUE(signal.resolve({"tcp://127.0.0.1:1", "v1"}));
    EXPECT_FALSE(signal.resolve({"tcp://127.0.0.1:2", "v2"}));
    auto got = signal.wait_for(0ms);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->version, "v1");
}

TEST(LauncherArguments, SocketEndpoint) {
    LauncherOptions options;
    options.endpoint = ipc::TcpEndpoint{"127.0.0.1", 9123};
    options.extraArgs = {"--workspace", "/ws"};
    Launcher launcher(options);
    std::vector<std::string> expected = {"--endpoint", "tcp://127.0.0.1:9123", "--protocol-version",
                                         std::string(ipc::kServerProtocolToken), "--workspace",
                                         "/ws"};
    EXPECT_EQ(launcher.server_arguments(), expected);
}

TEST(LauncherArguments, StdioAndFifoEndpoints) {
    LauncherOptions stdio;
    stdio.endpoint = ipc::PipeEndpoint{0, 1, {}, {}};
    auto args = Launcher(stdio).server_arguments();
    ASSERT_FALSE(args.empty());
    EXPECT_EQ(args.front(), "--stdio");

    ipc::PipeEndpoint fifo;
    fifo.readPath = "/tmp/from-server";
    fifo.writePath = "/tmp/to-server";
    auto mirrored = Launcher::server_side_endpoint(fifo);
    auto& serverPipe = std::get<ipc::PipeEndpoint>(mirrored);
    EXPECT_EQ(serverPipe.readPath, "/tmp/to-server");
    EXPECT_EQ(serverPipe.writePath, "/tmp/from-server");
}

TEST_F(LauncherTest, AutostartDisabledReportsRefusal) {
    auto options = options_for("/bin/false");
    options.autoStart = false;
    auto r = connect(options);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ConnectionRefused);

    auto restart = connect(options, true);
    ASSERT_FALSE(restart);
    EXPECT_EQ(restart.error().code, ErrorCode::ConnectionRefused);
}

TEST_F(LauncherTest, DisableAutostartEnvironment) {
    ::setenv("BSPLINK_DISABLE_AUTOSTART", "1", 1);
    Launcher launcher(options_for("/bin/false"));
    ::unsetenv("BSPLINK_DISABLE_AUTOSTART");
    EXPECT_FALSE(launcher.options().autoStart);
}

TEST_F(LauncherTest, MissingBinaryIsSpawnFailure) {
    auto r = connect(options_for(dir_ / "no-such-server"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::SpawnFailed);
}

TEST_F(LauncherTest, ServerThatNeverAnnouncesTimesOut) {
    auto script = write_script(dir_, "silent-server", "sleep 10");
    auto r = connect(options_for(script));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ReadinessTimeout);
}

TEST_F(LauncherTest, ServerExitingEarlyIsSpawnFailure) {
    auto script = write_script(dir_, "crashing-server", "echo 'fatal: no workspace' >&2\nexit 3");
    auto r = connect(options_for(script));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::SpawnFailed);
    EXPECT_NE(r.error().message.find("status 3"), std::string::npos);
}

TEST_F(LauncherTest, LaunchLeavesSigpipeDisposition) {
    struct sigaction previous {};
    struct sigaction defaults {};
    defaults.sa_handler = SIG_DFL;
    ASSERT_EQ(::sigaction(SIGPIPE, &defaults, &previous), 0);

    auto script = write_script(dir_, "crashing-server", "exit 3");
    auto r = connect(options_for(script));
    EXPECT_FALSE(r);

    struct sigaction current {};
    ASSERT_EQ(::sigaction(SIGPIPE, nullptr, &current), 0);
    EXPECT_EQ(current.sa_handler, SIG_DFL);
    ::sigaction(SIGPIPE, &previous, nullptr);
}

TEST_F(LauncherTest, WrongProtocolTokenIsVersionMismatch) {
    auto script = write_script(dir_, "old-server",
                               "echo \"BSPLINK_SERVER_READY local://$PWD/x bsplink-0\"\nsleep 10");
    auto r = connect(options_for(script));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::VersionMismatch);
    EXPECT_NE(r.error().message.find("bsplink-0"), std::string::npos);
}

TEST_F(LauncherTest, ProbeStrategyNoticesDeadServer) {
    auto script = write_script(dir_, "quitter", "exit 0");
    auto options = options_for(script);
    options.readiness = ReadinessStrategy::Probe;
    options.readinessTimeout = 3s;
    options.probeBaseDelay = 10ms;
    auto r = connect(options);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::SpawnFailed);
}

TEST_F(LauncherTest, ProbeStrategyTimesOut) {
    auto script = write_script(dir_, "sleeper", "sleep 10");
    auto options = options_for(script);
    options.readiness = ReadinessStrategy::Probe;
    options.readinessTimeout = 300ms;
    options.probeBaseDelay = 10ms;
    options.probeMaxDelay = 40ms;
    auto r = connect(options);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ReadinessTimeout);
}

TEST_F(LaunchedServerTest, SentinelReadinessConnects) {
    Launcher launcher(options_for(server_));
    auto r = run_sync(launcher.connect(), 20s);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_TRUE(r.value().spawned);
    ASSERT_NE(r.value().process, nullptr);
    EXPECT_TRUE(r.value().process->is_alive());
    EXPECT_TRUE(r.value().process->detached());
    EXPECT_EQ(initialize(r.value().connection), "bsplink-server");
    r.value().process->terminate();
}

TEST_F(LaunchedServerTest, ProbeReadinessConnectsOnceListening) {
    // Slow start: the first probes are refused
    auto options = options_for(wrapper("slow-server", "sleep 0.3"));
    options.readiness = ReadinessStrategy::Probe;
    options.probeBaseDelay = 10ms;
    options.probeMaxDelay = 100ms;
    Launcher launcher(options);
    auto r = run_sync(launcher.connect(), 20s);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_TRUE(r.value().spawned);
    EXPECT_EQ(initialize(r.value().connection), "bsplink-server");
    r.value().process->terminate();
}

TEST_F(LaunchedServerTest, DetachedServerOutlivesItsHandle) {
    {
        Launcher launcher(options_for(server_));
        auto r = run_sync(launcher.connect(), 20s);
        ASSERT_TRUE(r) << r.error().message;
        r.value().connection->close();
    }
    auto pids = spawned();
    ASSERT_EQ(pids.size(), 1u);
    EXPECT_TRUE(running(pids[0]));

    // The next launch finds the server instead of starting another
    Launcher again(options_for(server_));
    auto r = run_sync(again.connect(), 20s);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_FALSE(r.value().spawned);
    EXPECT_EQ(r.value().process, nullptr);
    EXPECT_EQ(initialize(r.value().connection), "bsplink-server");
    EXPECT_EQ(spawned().size(), 1u);
}

TEST_F(LaunchedServerTest, RegistryRestartTerminatesTrackedServer) {
    ConnectionRegistry registry(client_options(), BuildEventHandlers{});
    auto first = registry.acquire(options_for(server_));
    ASSERT_TRUE(first) << first.error().message;
    ASSERT_EQ(spawned().size(), 1u);
    const auto oldPid = spawned()[0];

    auto second = registry.acquire(options_for(server_), true);
    ASSERT_TRUE(second) << second.error().message;
    EXPECT_NE(second.value(), first.value());
    EXPECT_FALSE(running(oldPid));

    auto pids = spawned();
    ASSERT_EQ(pids.size(), 2u);
    EXPECT_NE(pids[1], oldPid);
    auto targets = run_sync(second.value()->listBuildTargets(), 6s);
    ASSERT_TRUE(targets) << targets.error().message;
    EXPECT_EQ(targets.value().size(), 1u);

    // The last client shutting down stops the server
    registry.shutdown_all(2s);
    EXPECT_TRUE(bsplink::tests::wait_until([&] { return !running(pids[1]); }, 5s));
}

TEST_F(LaunchedServerTest, ConcurrentAcquireWaitsForOneSpawn) {
    auto options = options_for(wrapper("slow-server", "sleep 0.3"));
    ConnectionRegistry registry(client_options(), BuildEventHandlers{});

    std::vector<std::future<Result<std::shared_ptr<BuildClient>>>> callers;
    for (int i = 0; i < 4; ++i) {
        callers.push_back(std::async(std::launch::async,
                                     [&registry, options] { return registry.acquire(options); }));
    }
    std::set<BuildClient*> clients;
    for (auto& caller : callers) {
        auto acquired = caller.get();
        ASSERT_TRUE(acquired) << acquired.error().message;
        clients.insert(acquired.value().get());
    }
    EXPECT_EQ(clients.size(), 1u);
    EXPECT_EQ(spawned().size(), 1u);
    registry.shutdown_all(2s);
}

} // namespace bsplink::client::test
