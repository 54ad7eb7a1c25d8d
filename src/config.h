#pragma once

#include "client.h"
#include "compute_node.h"
#include "logger.h"
#include "task.h"
#include <functional>
#include <string>
#include <vector>

namespace neurax {

constexpr const char* DEFAULT_SIGNALING_URL = "localhost:10000";

// Environment lookup; empty string when unset
using EnvLookup = std::function<std::string(const std::string&)>;
std::string system_env(const std::string& name);

struct ComputeOptions {
    ComputeNodeConfig node;
    LogLevel log_level = LogLevel::INFO;
    bool show_help = false;
};

struct ClientOptions {
    ClientConfig client;
    Task task;
    LogLevel log_level = LogLevel::INFO;
    bool show_help = false;
};

// Both return false and fill error on bad input. Flags override the
// environment; --profile is applied before --memory/--timeout.
bool parse_compute_options(const std::vector<std::string>& args, const EnvLookup& env,
                           ComputeOptions& out, std::string& error);
bool parse_client_options(const std::vector<std::string>& args, const EnvLookup& env,
                          ClientOptions& out, std::string& error);

std::string compute_usage(const std::string& program);
std::string client_usage(const std::string& program);

// Runs when no task is given
extern const char* const DEFAULT_CLIENT_TASK;

} // namespace neurax
