#include "config.h"
#include "sandbox.h"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace neurax {

const char* const DEFAULT_CLIENT_TASK =
    "# Example task: calculate fibonacci\n"
    "def fib(n):\n"
    "    if n <= 1:\n"
    "        return n\n"
    "    return fib(n-1) + fib(n-2)\n"
    "\n"
    "result = fib(30)\n"
    "print(f\"Fibonacci(30) = {result}\")\n";

namespace {

bool parse_positive(const std::string& text, long long& out) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos ||
        text.size() > 12) {
        return false;
    }
    out = std::stoll(text);
    return out > 0;
}

bool is_truthy(const std::string& value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

// Pulls the value of a "--flag value" pair; false when it is missing
bool take_value(const std::vector<std::string>& args, size_t& i, std::string& value,
                std::string& error) {
    if (i + 1 >= args.size()) {
        error = "missing value for " + args[i];
        return false;
    }
    value = args[++i];
    return true;
}

bool apply_log_level(const std::string& text, LogLevel& out, std::string& error) {
    if (!Logger::parse_level(text, out)) {
        error = "unknown log level '" + text + "'";
        return false;
    }
    return true;
}

} // namespace

std::string system_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? value : "";
}

bool parse_compute_options(const std::vector<std::string>& args, const EnvLookup& env,
                           ComputeOptions& out, std::string& error) {
    ComputeOptions options;
    options.node.relay_url = env("SIGNALING_SERVER_URL");
    options.node.sandbox.allow_unisolated = is_truthy(env("NEURAX_ALLOW_UNISOLATED"));
    if (!env("NEURAX_LOG_LEVEL").empty() &&
        !apply_log_level(env("NEURAX_LOG_LEVEL"), options.log_level, error)) {
        return false;
    }

    SandboxProfile profile = SandboxProfile::STANDARD;
    long long memory_mb = 0;
    long long timeout_seconds = 0;
    std::string runtime, image, shell_image, scratch_dir;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        std::string value;
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--allow-unisolated") {
            options.node.sandbox.allow_unisolated = true;
        } else if (arg == "--signaling-url") {
            if (!take_value(args, i, value, error)) return false;
            options.node.relay_url = value;
        } else if (arg == "--profile") {
            if (!take_value(args, i, value, error)) return false;
            if (!parse_profile(value, profile)) {
                error = "unknown profile '" + value + "' (expected standard or extended)";
                return false;
            }
        } else if (arg == "--memory") {
            if (!take_value(args, i, value, error)) return false;
            if (!parse_positive(value, memory_mb)) {
                error = "--memory expects a positive number of megabytes";
                return false;
            }
        } else if (arg == "--timeout") {
            if (!take_value(args, i, value, error)) return false;
            if (!parse_positive(value, timeout_seconds)) {
                error = "--timeout expects a positive number of seconds";
                return false;
            }
        } else if (arg == "--runtime") {
            if (!take_value(args, i, value, error)) return false;
            if (value != "docker" && value != "podman") {
                error = "unknown runtime '" + value + "' (expected docker or podman)";
                return false;
            }
            runtime = value;
        } else if (arg == "--image") {
            if (!take_value(args, i, image, error)) return false;
        } else if (arg == "--shell-image") {
            if (!take_value(args, i, shell_image, error)) return false;
        } else if (arg == "--scratch-dir") {
            if (!take_value(args, i, scratch_dir, error)) return false;
        } else if (arg == "--session-timeout") {
            long long idle_seconds = 0;
            if (!take_value(args, i, value, error)) return false;
            if (!parse_positive(value, idle_seconds)) {
                error = "--session-timeout expects a positive number of seconds";
                return false;
            }
            options.node.session_idle_timeout = std::chrono::seconds(idle_seconds);
        } else if (arg == "--device") {
            if (!take_value(args, i, value, error)) return false;
            options.node.device = value;
        } else if (arg == "--log-level") {
            if (!take_value(args, i, value, error)) return false;
            if (!apply_log_level(value, options.log_level, error)) return false;
        } else {
            error = "unknown option '" + arg + "'";
            return false;
        }
    }

    // Profile first, explicit limits on top
    bool allow_unisolated = options.node.sandbox.allow_unisolated;
    options.node.sandbox = SandboxConfig::for_profile(profile);
    options.node.sandbox.allow_unisolated = allow_unisolated;
    if (memory_mb > 0) {
        options.node.sandbox.memory_limit_bytes = static_cast<size_t>(memory_mb) * 1024 * 1024;
    }
    if (timeout_seconds > 0) {
        options.node.sandbox.timeout = std::chrono::seconds(timeout_seconds);
    }
    if (!runtime.empty()) options.node.sandbox.runtime = runtime;
    if (!image.empty()) options.node.sandbox.python_image = image;
    if (!shell_image.empty()) options.node.sandbox.shell_image = shell_image;
    if (!scratch_dir.empty()) options.node.sandbox.scratch_dir = scratch_dir;

    if (options.node.relay_url.empty()) {
        options.node.relay_url = DEFAULT_SIGNALING_URL;
    }
    out = options;
    return true;
}

bool parse_client_options(const std::vector<std::string>& args, const EnvLookup& env,
                          ClientOptions& out, std::string& error) {
    ClientOptions options;
    options.client.relay_url = env("SIGNALING_SERVER_URL");
    if (!env("NEURAX_LOG_LEVEL").empty() &&
        !apply_log_level(env("NEURAX_LOG_LEVEL"), options.log_level, error)) {
        return false;
    }

    std::string task_file;
    bool inline_task = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        std::string value;
        long long seconds = 0;
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--signaling-url") {
            if (!take_value(args, i, value, error)) return false;
            options.client.relay_url = value;
        } else if (arg == "--connect-timeout" || arg == "--result-timeout") {
            if (!take_value(args, i, value, error)) return false;
            if (!parse_positive(value, seconds)) {
                error = arg + " expects a positive number of seconds";
                return false;
            }
            auto& target = arg == "--connect-timeout" ? options.client.connect_timeout
                                                      : options.client.result_timeout;
            target = std::chrono::seconds(seconds);
        } else if (arg == "--session-id") {
            if (!take_value(args, i, value, error)) return false;
            options.client.session_id = value;
        } else if (arg == "--task") {
            if (!take_value(args, i, value, error)) return false;
            options.task.code = value;
            inline_task = true;
        } else if (arg == "--task-file") {
            if (!take_value(args, i, task_file, error)) return false;
        } else if (arg == "--kind") {
            if (!take_value(args, i, value, error)) return false;
            if (value != TASK_KIND_PYTHON && value != TASK_KIND_SHELL) {
                error = "unknown task kind '" + value + "'";
                return false;
            }
            options.task.kind = value;
        } else if (arg == "--log-level") {
            if (!take_value(args, i, value, error)) return false;
            if (!apply_log_level(value, options.log_level, error)) return false;
        } else {
            error = "unknown option '" + arg + "'";
            return false;
        }
    }

    if (inline_task && !task_file.empty()) {
        error = "--task and --task-file are mutually exclusive";
        return false;
    }
    if (!task_file.empty()) {
        std::ifstream file(task_file, std::ios::binary);
        if (!file) {
            error = "cannot read task file " + task_file;
            return false;
        }
        std::stringstream content;
        content << file.rdbuf();
        options.task.code = content.str();
    } else if (!inline_task) {
        options.task.code = DEFAULT_CLIENT_TASK;
        options.task.kind = TASK_KIND_PYTHON;
    }

    if (options.client.relay_url.empty()) {
        options.client.relay_url = DEFAULT_SIGNALING_URL;
    }
    out = options;
    return true;
}

std::string compute_usage(const std::string& program) {
    std::ostringstream usage;
    usage << "Usage: " << program << " [options]\n"
          << "  --signaling-url URL     relay address (env SIGNALING_SERVER_URL)\n"
          << "  --profile NAME          standard (30s, 1GB) or extended (300s, 2GB)\n"
          << "  --memory MB             memory ceiling per task\n"
          << "  --timeout SECONDS       wall clock limit per task\n"
          << "  --runtime NAME          docker or podman\n"
          << "  --image NAME            image for python_code tasks\n"
          << "  --shell-image NAME      image for shell_command tasks\n"
          << "  --scratch-dir PATH      where task files are staged\n"
          << "  --session-timeout SEC   drop sessions idle before their task (default 60)\n"
          << "  --device NAME           advertised device (default cpu)\n"
          << "  --allow-unisolated      run on the host when no runtime is available\n"
          << "                          (env NEURAX_ALLOW_UNISOLATED=1)\n"
          << "  --log-level LEVEL       debug, info, warning, error (env NEURAX_LOG_LEVEL)\n";
    return usage.str();
}

std::string client_usage(const std::string& program) {
    std::ostringstream usage;
    usage << "Usage: " << program << " [options]\n"
          << "  --signaling-url URL     relay address (env SIGNALING_SERVER_URL)\n"
          << "  --task CODE             code to run (default: Fibonacci example)\n"
          << "  --task-file PATH        read the code from a file\n"
          << "  --kind KIND             python_code or shell_command\n"
          << "  --session-id ID         session id (random by default)\n"
          << "  --connect-timeout SEC   wait for the compute node (default 30)\n"
          << "  --result-timeout SEC    wait for the result (default 60)\n"
          << "  --log-level LEVEL       debug, info, warning, error (env NEURAX_LOG_LEVEL)\n";
    return usage.str();
}

} // namespace neurax
