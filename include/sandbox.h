#pragma once

#include "task.h"
#include "constants.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace neurax {

enum class SandboxProfile {
    STANDARD,   // 30s, 1GB
    EXTENDED    // 300s, 2GB
};

bool parse_profile(const std::string& text, SandboxProfile& out);

// Sandbox configuration
struct SandboxConfig {
    size_t memory_limit_bytes = STANDARD_MEMORY_LIMIT_BYTES;
    std::chrono::seconds timeout = std::chrono::seconds(STANDARD_TIMEOUT_SECONDS);
    std::chrono::seconds grace = std::chrono::seconds(SUPERVISOR_GRACE_SECONDS);
    int cpu_limit = SANDBOX_CPU_SHARES;
    int max_open_files = MAX_OPEN_FILES;
    int max_processes = MAX_PROCESSES_PER_TASK;
    size_t max_output_bytes = MAX_OUTPUT_SIZE;          // per stream

    std::string runtime = "docker";                      // docker or podman
    std::string python_image = "python:3.11-slim";
    std::string shell_image = "alpine:3.19";
    std::string scratch_dir;                             // empty: system temp dir
    bool allow_unisolated = false;                       // host fallback when no runtime

    static SandboxConfig for_profile(SandboxProfile profile);
};

// How a task kind maps to a file and an in-sandbox command
struct TaskLayout {
    std::string file_name;      // e.g. task.py
    std::string interpreter;    // e.g. python
    std::string image;
};

// Returns false for kinds the executor does not know
bool task_layout(const std::string& kind, const SandboxConfig& config, TaskLayout& out);

// One way of running a prepared task file under isolation
class IsolationRuntime {
public:
    virtual ~IsolationRuntime() = default;

    virtual std::string name() const = 0;

    // True only when the runtime actually confines the task
    virtual bool isolated() const = 0;

    // Probe; never throws
    virtual bool available() const = 0;

    // argv that runs <task_dir>/<layout.file_name>
    virtual std::vector<std::string> command(const std::string& task_dir,
                                             const TaskLayout& layout,
                                             const std::string& instance_name,
                                             const SandboxConfig& config) const = 0;

    // Runs in the forked child right before exec
    virtual void prepare_child(const SandboxConfig& config) const { (void)config; }

    // Outer supervisor gave up on the invocation
    virtual void terminate(const std::string& instance_name) const { (void)instance_name; }
};

// docker/podman run --network none --read-only ...
class ContainerRuntime : public IsolationRuntime {
public:
    explicit ContainerRuntime(std::string binary = "docker");

    std::string name() const override { return binary_; }
    bool isolated() const override { return true; }
    bool available() const override;
    std::vector<std::string> command(const std::string& task_dir,
                                     const TaskLayout& layout,
                                     const std::string& instance_name,
                                     const SandboxConfig& config) const override;
    void terminate(const std::string& instance_name) const override;

private:
    std::string binary_;
};

// Un-isolated fallback: plain host process with rlimits and a seccomp
// filter that refuses IPv4/IPv6 sockets. Only used when explicitly allowed.
class HostProcessRuntime : public IsolationRuntime {
public:
    std::string name() const override { return "host"; }
    bool isolated() const override { return false; }
    bool available() const override;
    std::vector<std::string> command(const std::string& task_dir,
                                     const TaskLayout& layout,
                                     const std::string& instance_name,
                                     const SandboxConfig& config) const override;
    void prepare_child(const SandboxConfig& config) const override;
};

// Runs one task per call. Calls share no mutable state and may overlap.
// Never throws for task-level problems: unavailable runtime, timeout and
// setup failures come back as results with exit code -1.
class SandboxExecutor {
public:
    explicit SandboxExecutor(const SandboxConfig& config = SandboxConfig{},
                             std::shared_ptr<IsolationRuntime> runtime = nullptr,
                             std::shared_ptr<IsolationRuntime> fallback = nullptr);

    // cancelled, when set, is polled while the task runs; true kills it
    ExecutionResult execute(const Task& task, const std::atomic<bool>* cancelled = nullptr) const;

    // Startup check of the isolation runtime, logged either way
    bool probe_runtime() const;

    const SandboxConfig& config() const { return config_; }
    const IsolationRuntime& runtime() const { return *runtime_; }

private:
    SandboxConfig config_;
    std::shared_ptr<IsolationRuntime> runtime_;
    std::shared_ptr<IsolationRuntime> fallback_;
};

} // namespace neurax
