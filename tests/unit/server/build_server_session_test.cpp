#include <gtest/gtest.h>

#include <bsplink/client/run_sync.h>
#include <bsplink/ipc/bsp_protocol.h>
#include <bsplink/ipc/json_rpc_peer.h>
#include <bsplink/server/build_server_session.h>

#include "common/bsp_test_helpers.h"

#include <atomic>
#include <future>
#include <mutex>
#include <vector>

namespace bsplink::server::test {

using namespace std::chrono_literals;
using ipc::json;

namespace {

struct Received {
    std::string method;
    json params;
};

// Engine that blocks every compile until released, for cancellation tests
class GatedEngine : public ICompileEngine {
public:
    Result<CompileOutput> compile(const CompileInputs& inputs) override {
        entered.fetch_add(1);
        bsplink::tests::wait_until([&] { return open.load() || inputs.cancelled(); }, 5s);
        CompileOutput out;
        out.status = inputs.cancelled() ? ipc::StatusCode::Cancelled : ipc::StatusCode::Ok;
        return out;
    }

    std::atomic<int> entered{0};
    std::atomic<bool> open{false};
};

class BuildServerSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        bsplink::tests::write_project(ws_.path(), "core", {},
                                      {{"Core.scala", "object Core\n"}});
        bsplink::tests::write_project(ws_.path(), "app", {"core"},
                                      {{"App.scala", "object App\n"}});
        workspace_ = std::make_shared<Workspace>(ws_.path());
        // One request thread: a compile sharing it would starve every other request
        requests_ = std::make_shared<ipc::ThreadPool>("requests", 1);
        compiles_ = std::make_shared<ipc::ThreadPool>("compiles", 2);
    }

    void TearDown() override {
        if (client_) {
            client_->close();
        }
        if (session_) {
            session_->close();
            // The close callback touches the fixture
            bsplink::tests::wait_until([&] { return closed_.load() > 0; }, 2s);
        }
        compiles_->stop();
        requests_->stop();
    }

    void start(std::shared_ptr<ICompileEngine> engine = std::make_shared<ManifestCompileEngine>()) {
        auto [clientSide, serverSide] = bsplink::tests::make_stream_pair();
        session_ = BuildServerSession::create(ipc::Connection::create(std::move(serverSide)),
                                              workspace_, std::move(engine),
                                              {requests_, compiles_});
        session_->start([this](const Error&) { closed_.fetch_add(1); });

        client_ = ipc::JsonRpcPeer::create(ipc::Connection::create(std::move(clientSide)));
        client_->set_notification_handler([this](const std::string& method, const json& params) {
            std::lock_guard<std::mutex> lock(mutex_);
            received_.push_back({method, params});
        });
        client_->start();
    }

    Result<json> request(const std::string& method, json params = json::object()) {
        return client::run_sync(client_->request(method, std::move(params), 5s), 6s);
    }

    void initialize() {
        ipc::InitializeBuildParams params;
        params.displayName = "test-client";
        params.version = "1.0";
        params.bspVersion = std::string(ipc::kBspVersion);
        params.rootUri = ipc::path_to_uri(ws_.path());
        auto reply = request(std::string(ipc::methods::kInitialize), json(params));
        ASSERT_TRUE(reply) << reply.error().message;
        ASSERT_TRUE(client_->notify(ipc::methods::kInitialized, json::object()));
    }

    json targets_param(std::initializer_list<const char*> names) {
        json targets = json::array();
        for (const auto* name : names) {
            targets.push_back(json(BuildTargetGraph::target_id(ws_.path(), name)));
        }
        return json{{"targets", targets}};
    }

    std::vector<Received> received() {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    std::vector<Received> of_method(std::string_view method) {
        std::vector<Received> out;
        for (auto& r : received()) {
            if (r.method == method) {
                out.push_back(r);
            }
        }
        return out;
    }

    bsplink::tests::TempDir ws_;
    std::shared_ptr<Workspace> workspace_;
    std::shared_ptr<ipc::ThreadPool> requests_;
    std::shared_ptr<ipc::ThreadPool> compiles_;
    std::shared_ptr<BuildServerSession> session_;
    std::shared_ptr<ipc::JsonRpcPeer> client_;
    std::atomic<int> closed_{0};
    std::mutex mutex_;
    std::vector<Received> received_;
};

} // namespace

TEST_F(BuildServerSessionTest, RequestsBeforeInitializeAreRejected) {
    start();
    auto r = request(std::string(ipc::methods::kBuildTargets));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidState);
    EXPECT_EQ(session_->state(), BuildServerSession::State::AwaitingInitialize);
}

TEST_F(BuildServerSessionTest, InitializeAdvertisesCapabilities) {
    start();
    ipc::InitializeBuildParams params;
    params.displayName = "test-client";
    params.version = "1.0";
    params.bspVersion = std::string(ipc::kBspVersion);
    params.rootUri = ipc::path_to_uri(ws_.path());
    auto reply = request(std::string(ipc::methods::kInitialize), json(params));
    ASSERT_TRUE(reply) << reply.error().message;

    auto result = ipc::decode_as<ipc::InitializeBuildResult>(reply.value());
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().bspVersion, ipc::kBspVersion);
    ASSERT_TRUE(result.value().capabilities.compileProvider.has_value());
    EXPECT_TRUE(result.value().capabilities.dependencySourcesProvider);
    EXPECT_TRUE(result.value().capabilities.canReload);
    EXPECT_EQ(session_->state(), BuildServerSession::State::Running);

    auto again = request(std::string(ipc::methods::kInitialize), json(params));
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::ProtocolError);
}

TEST_F(BuildServerSessionTest, MalformedInitializeIsInvalidParams) {
    start();
    auto r = request(std::string(ipc::methods::kInitialize), json{{"displayName", 3}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST_F(BuildServerSessionTest, ListsTargetsInDependencyOrder) {
    start();
    initialize();
    auto reply = request(std::string(ipc::methods::kBuildTargets));
    ASSERT_TRUE(reply);
    auto result = ipc::decode_as<ipc::WorkspaceBuildTargetsResult>(reply.value());
    ASSERT_TRUE(result);
    ASSERT_EQ(result.value().targets.size(), 2u);
    EXPECT_EQ(result.value().targets[0].displayName, std::optional<std::string>("core"));
    EXPECT_EQ(result.value().targets[1].dependencies.size(), 1u);
}

TEST_F(BuildServerSessionTest, TargetQueriesAndUnknownTarget) {
    start();
    initialize();
    auto options = request(std::string(ipc::methods::kScalacOptions), targets_param({"app"}));
    ASSERT_TRUE(options) << options.error().message;
    auto decoded = ipc::decode_as<ipc::ScalacOptionsResult>(options.value());
    ASSERT_TRUE(decoded);
    ASSERT_EQ(decoded.value().items.size(), 1u);
    EXPECT_EQ(decoded.value().items[0].options, std::vector<std::string>{"-deprecation"});

    auto sources = request(std::string(ipc::methods::kSources), targets_param({"core"}));
    ASSERT_TRUE(sources);

    auto unknown = request(std::string(ipc::methods::kSources), targets_param({"nope"}));
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::UnknownTarget);

    auto method = request("buildTarget/test", targets_param({"core"}));
    ASSERT_FALSE(method);
    EXPECT_NE(method.error().message.find("buildTarget/test"), std::string::npos);
}

TEST_F(BuildServerSessionTest, CompileStreamsTaskNotificationsPerTarget) {
    start();
    initialize();
    auto params = targets_param({"app"});
    params["originId"] = "c-1";
    auto reply = request(std::string(ipc::methods::kCompile), params);
    ASSERT_TRUE(reply) << reply.error().message;
    auto result = ipc::decode_as<ipc::CompileResult>(reply.value());
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().statusCode, ipc::StatusCode::Ok);
    EXPECT_EQ(result.value().originId, std::optional<std::string>("c-1"));

    // Notifications precede the response on the same connection
    auto starts = of_method(ipc::methods::kTaskStart);
    auto finishes = of_method(ipc::methods::kTaskFinish);
    ASSERT_EQ(starts.size(), 2u);
    ASSERT_EQ(finishes.size(), 2u);
    auto first = ipc::decode_as<ipc::TaskFinishParams>(finishes[0].params);
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value().originId, std::optional<std::string>("c-1"));
    auto report = first.value().compileReport();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->target, BuildTargetGraph::target_id(ws_.path(), "core"));
    ASSERT_TRUE(report->analysisOut.has_value());
    auto analysis = ipc::uri_to_path(*report->analysisOut);
    ASSERT_TRUE(analysis.has_value());
    EXPECT_TRUE(std::filesystem::exists(*analysis));
}

TEST_F(BuildServerSessionTest, FailedDependencyCancelsDependents) {
    bsplink::tests::write_project(ws_.path(), "core", {},
                                  {{"Core.scala", "val x: Int = \"s\" // bsplink:error mismatch\n"}});
    workspace_->reload();
    start();
    initialize();
    auto reply = request(std::string(ipc::methods::kCompile), targets_param({"app"}));
    ASSERT_TRUE(reply);
    auto result = ipc::decode_as<ipc::CompileResult>(reply.value());
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().statusCode, ipc::StatusCode::Error);

    auto finishes = of_method(ipc::methods::kTaskFinish);
    ASSERT_EQ(finishes.size(), 2u);
    EXPECT_EQ(finishes[0].params.at("status"), static_cast<int>(ipc::StatusCode::Error));
    EXPECT_EQ(finishes[1].params.at("status"), static_cast<int>(ipc::StatusCode::Cancelled));

    auto diagnostics = of_method(ipc::methods::kPublishDiagnostics);
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].params.at("diagnostics").size(), 1u);
}

TEST_F(BuildServerSessionTest, CancelRequestStopsCompile) {
    auto engine = std::make_shared<GatedEngine>();
    start(engine);
    initialize();

    auto pending = client_->send_request(ipc::methods::kCompile, targets_param({"app"}));
    ASSERT_TRUE(pending);
    ASSERT_TRUE(bsplink::tests::wait_until([&] { return engine->entered.load() == 1; }));
    ASSERT_TRUE(client_->cancel(pending.value().id));

    auto reply = client::run_sync(client_->await_response(pending.value(), 5s), 6s);
    ASSERT_TRUE(reply) << reply.error().message;
    auto result = ipc::decode_as<ipc::CompileResult>(reply.value());
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().statusCode, ipc::StatusCode::Cancelled);
    EXPECT_EQ(engine->entered.load(), 1);
}

TEST_F(BuildServerSessionTest, QueriesAnsweredWhileCompileRuns) {
    auto engine = std::make_shared<GatedEngine>();
    start(engine);
    initialize();

    auto first = client_->send_request(ipc::methods::kCompile, targets_param({"core"}));
    auto second = client_->send_request(ipc::methods::kCompile, targets_param({"app"}));
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    ASSERT_TRUE(bsplink::tests::wait_until([&] { return engine->entered.load() >= 1; }));

    auto targets = request(std::string(ipc::methods::kBuildTargets));
    ASSERT_TRUE(targets) << targets.error().message;
    EXPECT_EQ(targets.value().at("targets").size(), 2u);
    auto options = request(std::string(ipc::methods::kScalacOptions), targets_param({"app"}));
    ASSERT_TRUE(options) << options.error().message;
    // Both compiles are still held by the engine
    EXPECT_EQ(first.value().response.wait_for(0s), std::future_status::timeout);
    EXPECT_EQ(second.value().response.wait_for(0s), std::future_status::timeout);

    engine->open.store(true);
    for (const auto& pending : {first.value(), second.value()}) {
        auto reply = client::run_sync(client_->await_response(pending, 5s), 6s);
        ASSERT_TRUE(reply) << reply.error().message;
        auto result = ipc::decode_as<ipc::CompileResult>(reply.value());
        ASSERT_TRUE(result);
        EXPECT_EQ(result.value().statusCode, ipc::StatusCode::Ok);
    }
}

TEST_F(BuildServerSessionTest, ReloadNotifiesTargetChanges) {
    start();
    initialize();
    bsplink::tests::write_project(ws_.path(), "docs", {}, {});
    auto reply = request(std::string(ipc::methods::kReload), nullptr);
    ASSERT_TRUE(reply) << reply.error().message;

    ASSERT_TRUE(bsplink::tests::wait_until(
        [&] { return !of_method(ipc::methods::kDidChangeBuildTarget).empty(); }));
    auto change = of_method(ipc::methods::kDidChangeBuildTarget)[0];
    ASSERT_EQ(change.params.at("changes").size(), 1u);
    EXPECT_EQ(change.params.at("changes")[0].at("kind"),
              static_cast<int>(ipc::BuildTargetEventKind::Created));
}

TEST_F(BuildServerSessionTest, ShutdownThenExitClosesOnce) {
    start();
    initialize();
    ASSERT_TRUE(request(std::string(ipc::methods::kShutdown), nullptr));
    EXPECT_TRUE(session_->shutdown_requested());

    auto late = request(std::string(ipc::methods::kBuildTargets));
    ASSERT_FALSE(late);
    EXPECT_EQ(late.error().code, ErrorCode::InvalidState);

    ASSERT_TRUE(client_->notify(ipc::methods::kExit));
    ASSERT_TRUE(bsplink::tests::wait_until([&] { return closed_.load() == 1; }));
    EXPECT_EQ(session_->state(), BuildServerSession::State::Exited);
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(closed_.load(), 1);
}

TEST_F(BuildServerSessionTest, ClientHangupEndsSession) {
    start();
    initialize();
    client_->close();
    ASSERT_TRUE(bsplink::tests::wait_until([&] { return closed_.load() == 1; }));
    EXPECT_FALSE(session_->shutdown_requested());
}

} // namespace bsplink::server::test
