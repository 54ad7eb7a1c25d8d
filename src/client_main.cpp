#include "client.h"
#include "config.h"
#include "errors.h"
#include "logger.h"
#include "relay_client.h"
#include <csignal>
#include <iostream>

using namespace neurax;

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    ClientOptions options;
    std::string error;
    if (!parse_client_options(args, system_env, options, error)) {
        std::cerr << error << "\n\n" << client_usage(argv[0]);
        return 1;
    }
    if (options.show_help) {
        std::cout << client_usage(argv[0]);
        return 0;
    }
    Logger::instance().set_level(options.log_level);
    signal(SIGPIPE, SIG_IGN);

    RelayEndpoint endpoint;
    if (!parse_relay_endpoint(options.client.relay_url, endpoint)) {
        std::cerr << "invalid signaling url '" << options.client.relay_url << "'" << std::endl;
        return 1;
    }

    auto relay = std::make_shared<TcpRelayConnection>(endpoint);
    ExecutionResult result;
    try {
        Client client(relay, options.client);
        result = client.submit(options.task);
    } catch (const Error& e) {
        std::cerr << error_kind_name(e.kind()) << ": " << e.what() << std::endl;
        relay->disconnect();
        return 2;
    }
    relay->disconnect();

    std::cout << "Exit code: " << result.exit_code << std::endl;
    std::cout << "Execution time: " << result.execution_time << "s" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;
    std::cout << "[STDOUT]" << std::endl << result.stdout_output;
    if (!result.stderr_output.empty()) {
        std::cout << "[STDERR]" << std::endl << result.stderr_output;
    }
    std::cout << std::flush;

    // -1 (not executed) maps to 255 like any negative status
    return result.exit_code & 0xff;
}
