#include <gtest/gtest.h>
#include "client.h"
#include "compute_node.h"
#include "errors.h"
#include "../helpers/fake_runtime.h"
#include "../helpers/in_process_relay.h"
#include "relay_client.h"
#include <thread>

namespace neurax {
namespace {

using testing::DirectRuntime;
using testing::InProcessRelay;
using testing::InProcessRelayConnection;

// Client and compute node talking through an in-process relay, with tasks
// executed by the host interpreter behind the sandbox executor.
class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        relay = std::make_shared<InProcessRelay>();
        node_connection = std::make_shared<InProcessRelayConnection>(relay, "node");
        client_connection = std::make_shared<InProcessRelayConnection>(relay, "client");

        sandbox.timeout = std::chrono::seconds(10);
        sandbox.grace = std::chrono::seconds(1);
        node_config.device = "test-cpu";
        node_config.backoff.base = std::chrono::milliseconds(10);
        node_config.backoff.cap = std::chrono::milliseconds(50);

        client_config.connect_timeout = std::chrono::seconds(5);
        client_config.result_timeout = std::chrono::seconds(20);
        client_config.poll_interval = std::chrono::milliseconds(10);
    }

    void TearDown() override {
        if (node) {
            node->stop();
        }
    }

    void start_node(std::shared_ptr<IsolationRuntime> runtime) {
        node_config.sandbox = sandbox;
        auto executor = std::make_shared<SandboxExecutor>(sandbox, runtime);
        node.reset(new ComputeNode(node_connection, executor, node_config));
        node->start();
    }

    template <typename Predicate>
    static bool eventually(Predicate predicate) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return predicate();
    }

    static Task python(const std::string& code) {
        Task task;
        task.code = code;
        return task;
    }

    std::shared_ptr<InProcessRelay> relay;
    std::shared_ptr<InProcessRelayConnection> node_connection;
    std::shared_ptr<InProcessRelayConnection> client_connection;
    SandboxConfig sandbox;
    ComputeNodeConfig node_config;
    ClientConfig client_config;
    std::unique_ptr<ComputeNode> node;
};

#define REQUIRE_PYTHON()                                      \
    if (!testing::have_tool("python3")) {                     \
        GTEST_SKIP() << "python3 not installed";              \
    }

TEST_F(EndToEndTest, PrintOnePlusOne) {
    REQUIRE_PYTHON();
    // Given: A running compute node
    start_node(std::make_shared<DirectRuntime>());

    // When: The client submits print(1+1)
    Client client(client_connection, client_config);
    ExecutionResult result = client.submit(python("print(1+1)"));

    // Then: Exact output, and the node forgets the session
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "2\n");
    EXPECT_EQ(result.stderr_output, "");
    EXPECT_TRUE(eventually([this]() { return node->registry().size() == 0; }));
}

TEST_F(EndToEndTest, UncaughtErrorComesBackAsResult) {
    REQUIRE_PYTHON();
    start_node(std::make_shared<DirectRuntime>());

    Client client(client_connection, client_config);
    ExecutionResult result = client.submit(python("print('start')\n1/0\n"));

    EXPECT_NE(result.exit_code, 0);
    EXPECT_NE(result.exit_code, EXIT_CODE_NOT_EXECUTED);
    EXPECT_EQ(result.stdout_output, "start\n");
    EXPECT_NE(result.stderr_output.find("ZeroDivisionError"), std::string::npos);
}

TEST_F(EndToEndTest, MissingIsolationIsReportedNotBypassed) {
    // Given: A node whose runtime is unavailable and no fallback allowed
    start_node(std::make_shared<DirectRuntime>(false));

    // When: A task is submitted
    Client client(client_connection, client_config);
    ExecutionResult result = client.submit(python("print('should not run')"));

    // Then: It was not executed and the reason travelled back
    EXPECT_EQ(result.exit_code, EXIT_CODE_NOT_EXECUTED);
    EXPECT_EQ(result.stdout_output, "");
    EXPECT_NE(result.stderr_output.find("unavailable"), std::string::npos);
}

TEST_F(EndToEndTest, RelayOnlySeesSealedPayloads) {
    REQUIRE_PYTHON();
    start_node(std::make_shared<DirectRuntime>());

    Client client(client_connection, client_config);
    client.submit(python("MARKER_7731 = 'x'\nprint('MARKER_OUTPUT_8842')"));

    for (const auto& event : client_connection->emitted()) {
        std::string wire = MessageCodec::encode_relay_event(event);
        EXPECT_EQ(wire.find("MARKER_7731"), std::string::npos) << event.name;
    }
    for (const auto& event : node_connection->emitted()) {
        std::string wire = MessageCodec::encode_relay_event(event);
        EXPECT_EQ(wire.find("MARKER_OUTPUT_8842"), std::string::npos) << event.name;
    }
}

TEST_F(EndToEndTest, LateIceCandidateIsHarmless) {
    REQUIRE_PYTHON();
    start_node(std::make_shared<DirectRuntime>());
    client_config.session_id = "late-candidate";

    {
        Client client(client_connection, client_config);
        EXPECT_EQ(client.submit(python("print('one')")).stdout_output, "one\n");
    }
    ASSERT_TRUE(eventually([this]() { return node->registry().size() == 0; }));

    // When: A candidate for the finished session shows up
    IceCandidate candidate;
    candidate.candidate = "candidate:1 1 udp 1 127.0.0.1 9 typ host";
    ASSERT_TRUE(client_connection->emit(MessageCodec::ice_candidate("late-candidate", candidate)));

    // Then: The node shrugs and keeps serving
    client_config.session_id = "after-candidate";
    Client client(client_connection, client_config);
    EXPECT_EQ(client.submit(python("print('two')")).stdout_output, "two\n");
}

TEST_F(EndToEndTest, RegistrationAnnouncesDevice) {
    start_node(std::make_shared<DirectRuntime>());

    auto emitted = node_connection->emitted();
    ASSERT_FALSE(emitted.empty());
    EXPECT_EQ(emitted[0].name, "register_compute_node");
    EXPECT_EQ(emitted[0].data["device"].asString(), "test-cpu");
    EXPECT_EQ(emitted[0].data["status"].asString(), "available");
    EXPECT_TRUE(emitted[0].data["installed_tools"].isArray());
}

TEST_F(EndToEndTest, NoComputeNodeFailsFast) {
    // Given: Nobody registered with the relay
    Client client(client_connection, client_config);

    // When/Then: The relay's error ends the attempt well before the timeout
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(client.submit(python("print(1)")), ConnectionError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
}

TEST_F(EndToEndTest, SilentComputeNodeTimesOut) {
    // Given: A registered node that never answers offers
    ASSERT_TRUE(node_connection->connect());
    RelayEvent registration;
    registration.name = relay_events::REGISTER_COMPUTE_NODE;
    ASSERT_TRUE(node_connection->emit(registration));

    // When/Then: The readiness wait is bounded
    client_config.connect_timeout = std::chrono::milliseconds(300);
    Client client(client_connection, client_config);
    EXPECT_THROW(client.submit(python("print(1)")), ConnectionTimeoutError);
    node_connection->disconnect();
}

TEST_F(EndToEndTest, AbandonedHandshakeIsDropped) {
    // Given: A node with a short idle limit
    node_config.session_idle_timeout = std::chrono::milliseconds(200);
    start_node(std::make_shared<DirectRuntime>());

    // When: A peer offers a session and then never sends its key
    ASSERT_TRUE(client_connection->connect());
    ASSERT_TRUE(client_connection->emit(MessageCodec::create_session("abandoned")));
    ASSERT_TRUE(client_connection->emit(MessageCodec::offer("abandoned", RELAY_TUNNEL_TAG)));
    ASSERT_TRUE(eventually([this]() { return node->registry().size() == 1; }));

    // Then: The node gives up on it and closes the tunnel
    EXPECT_TRUE(eventually([this]() { return node->registry().size() == 0; }));
    EXPECT_TRUE(eventually([this]() { return relay->count("channel_close") >= 1; }));
    client_connection->disconnect();
}

TEST_F(EndToEndTest, IdleLimitSparesRunningTask) {
    REQUIRE_PYTHON();
    node_config.session_idle_timeout = std::chrono::milliseconds(200);
    start_node(std::make_shared<DirectRuntime>());

    // A task that runs several times longer than the idle limit still completes
    Client client(client_connection, client_config);
    ExecutionResult result = client.submit(python("import time\ntime.sleep(1)\nprint('done')\n"));

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "done\n");
}

TEST_F(EndToEndTest, RelayLossKillsRunningTaskAndReconnects) {
    REQUIRE_PYTHON();
    start_node(std::make_shared<DirectRuntime>());
    client_config.result_timeout = std::chrono::seconds(2);

    // Given: A long task in flight
    std::thread submitter([this]() {
        Client client(client_connection, client_config);
        EXPECT_THROW(client.submit(python("import time\ntime.sleep(60)\n")), ConnectionTimeoutError);
    });
    ASSERT_TRUE(eventually([this]() { return node->running_tasks() == 1; }));

    // When: The node loses the relay
    node_connection->sever();

    // Then: Sessions are gone, the task is killed, and the node comes back
    EXPECT_TRUE(eventually([this]() { return node->registry().size() == 0; }));
    EXPECT_TRUE(eventually([this]() { return node->running_tasks() == 0; }));
    EXPECT_TRUE(eventually([this]() { return relay->count("register_compute_node") == 2; }));
    submitter.join();
}

} // namespace
} // namespace neurax
