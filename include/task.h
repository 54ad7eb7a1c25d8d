#pragma once

#include <string>

namespace neurax {

// Exit code reserved for "execution could not be attempted" (runtime missing,
// timeout, setup failure). Always accompanied by a stderr explanation.
constexpr int EXIT_CODE_NOT_EXECUTED = -1;

constexpr const char* TASK_KIND_PYTHON = "python_code";
constexpr const char* TASK_KIND_SHELL = "shell_command";

// Request payload: consumed once by the executor, never persisted
struct Task {
    std::string code;
    std::string kind = TASK_KIND_PYTHON;
};

// Produced exactly once per task by one executor invocation
struct ExecutionResult {
    int exit_code = 0;
    std::string stdout_output;
    std::string stderr_output;
    double execution_time = 0.0;    // wall clock, seconds

    // Local bookkeeping, not part of the wire format
    bool timeout_occurred = false;
    bool isolated = false;

    static ExecutionResult not_executed(const std::string& reason, double elapsed = 0.0) {
        ExecutionResult result;
        result.exit_code = EXIT_CODE_NOT_EXECUTED;
        result.stderr_output = reason;
        result.execution_time = elapsed;
        return result;
    }
};

} // namespace neurax
