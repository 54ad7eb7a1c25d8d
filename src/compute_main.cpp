#include "compute_node.h"
#include "config.h"
#include "errors.h"
#include "logger.h"
#include "relay_client.h"
#include "sandbox.h"
#include <csignal>
#include <iostream>
#include <pthread.h>
#include <thread>

using namespace neurax;

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    ComputeOptions options;
    std::string error;
    if (!parse_compute_options(args, system_env, options, error)) {
        std::cerr << error << "\n\n" << compute_usage(argv[0]);
        return 1;
    }
    if (options.show_help) {
        std::cout << compute_usage(argv[0]);
        return 0;
    }
    Logger::instance().set_level(options.log_level);

    RelayEndpoint endpoint;
    if (!parse_relay_endpoint(options.node.relay_url, endpoint)) {
        std::cerr << "invalid signaling url '" << options.node.relay_url << "'" << std::endl;
        return 1;
    }

    // SIGINT/SIGTERM are handled by a dedicated thread; block them everywhere else
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    signal(SIGPIPE, SIG_IGN);

    std::cout << "NeuraX compute node" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;
    std::cout << "Relay:    " << endpoint.host << ":" << endpoint.port << std::endl;
    std::cout << "Device:   " << options.node.device << std::endl;
    std::cout << "Limits:   " << options.node.sandbox.timeout.count() << "s, "
              << options.node.sandbox.memory_limit_bytes / (1024 * 1024) << "MB, "
              << options.node.sandbox.cpu_limit << " CPU" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    auto relay = std::make_shared<TcpRelayConnection>(endpoint);
    auto executor = std::make_shared<SandboxExecutor>(options.node.sandbox);
    ComputeNode node(relay, executor, options.node);

    std::thread signal_thread([&node, signals]() {
        int received = 0;
        sigwait(&signals, &received);
        LOG_INFO("ComputeNode") << "received signal " << received;
        node.stop();
    });

    int status = 0;
    try {
        node.start();
        node.wait();
    } catch (const ConnectionError& e) {
        LOG_ERROR("ComputeNode") << e.what();
        status = 2;
    }

    node.stop();
    // Wake the signal thread if it is still waiting
    pthread_kill(signal_thread.native_handle(), SIGTERM);
    signal_thread.join();
    LOG_INFO("ComputeNode") << "stopped";
    return status;
}
