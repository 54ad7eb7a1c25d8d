#include "sandbox.h"
#include "errors.h"
#include "logger.h"
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <seccomp.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace neurax {

namespace {

constexpr int POLL_INTERVAL_MS = 100;
constexpr int EXIT_EXEC_FAILED = 127;
constexpr int EXIT_CONTAINER_START_FAILED = 125;   // docker/podman run itself failed
constexpr int EXIT_TIMEOUT_TERM = 124;             // coreutils timeout
constexpr int EXIT_TIMEOUT_KILL = 137;             // 128 + SIGKILL

struct ProcessOutcome {
    bool started = false;
    std::string start_error;
    int status = 0;
    bool reaped = false;
    bool deadline_hit = false;
    bool cancelled = false;
    std::string stdout_output;
    std::string stderr_output;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
};

// false on EOF or a hard error
bool drain(int fd, std::string& buffer, size_t cap, bool& truncated) {
    char chunk[PIPE_BUFFER_SIZE];
    ssize_t n = read(fd, chunk, sizeof(chunk));
    if (n > 0) {
        size_t room = buffer.size() < cap ? cap - buffer.size() : 0;
        size_t take = std::min(room, static_cast<size_t>(n));
        buffer.append(chunk, take);
        if (take < static_cast<size_t>(n)) {
            truncated = true;
        }
        return true;
    }
    if (n < 0 && (errno == EAGAIN || errno == EINTR)) {
        return true;
    }
    return false;
}

// fork/exec argv with stdout and stderr captured through pipes. The child
// gets its own process group so a kill reaches everything it spawned.
ProcessOutcome run_process(const std::vector<std::string>& argv,
                           const std::string& workdir,
                           std::chrono::steady_clock::time_point deadline,
                           const std::atomic<bool>* cancelled,
                           size_t max_output,
                           const std::function<void()>& child_setup,
                           const std::function<void()>& on_kill) {
    ProcessOutcome outcome;

    // Everything the child needs is built before fork
    std::vector<char*> args;
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];
    if (pipe(stdout_pipe) == -1) {
        outcome.start_error = std::string("failed to create pipes: ") + strerror(errno);
        return outcome;
    }
    if (pipe(stderr_pipe) == -1) {
        outcome.start_error = std::string("failed to create pipes: ") + strerror(errno);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return outcome;
    }

    pid_t pid = fork();
    if (pid == -1) {
        outcome.start_error = std::string("failed to fork process: ") + strerror(errno);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
        return outcome;
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        if (!workdir.empty() && chdir(workdir.c_str()) != 0) {
            perror("chdir");
            _exit(EXIT_EXEC_FAILED);
        }
        if (child_setup) {
            child_setup();
        }

        execvp(args[0], args.data());
        perror("execvp");
        _exit(EXIT_EXEC_FAILED);
    }

    // Parent process
    setpgid(pid, pid);
    outcome.started = true;
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    bool killed = false;
    auto kill_child = [&]() {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        if (on_kill) {
            on_kill();
        }
        killed = true;
    };
    auto check_limits = [&]() {
        if (killed) {
            return;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            outcome.deadline_hit = true;
            kill_child();
        } else if (cancelled && cancelled->load()) {
            outcome.cancelled = true;
            kill_child();
        }
    };

    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];
    while ((out_fd >= 0 || err_fd >= 0) && !killed) {
        struct pollfd fds[2];
        nfds_t count = 0;
        if (out_fd >= 0) {
            fds[count++] = {out_fd, POLLIN, 0};
        }
        if (err_fd >= 0) {
            fds[count++] = {err_fd, POLLIN, 0};
        }

        int ready = poll(fds, count, POLL_INTERVAL_MS);
        if (ready < 0 && errno != EINTR) {
            LOG_ERROR("Sandbox") << "poll failed: " << strerror(errno);
            break;
        }
        for (nfds_t i = 0; ready > 0 && i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            if (fds[i].fd == out_fd &&
                !drain(out_fd, outcome.stdout_output, max_output, outcome.stdout_truncated)) {
                close(out_fd);
                out_fd = -1;
            } else if (fds[i].fd == err_fd &&
                       !drain(err_fd, outcome.stderr_output, max_output, outcome.stderr_truncated)) {
                close(err_fd);
                err_fd = -1;
            }
        }
        check_limits();
    }
    if (out_fd >= 0) {
        close(out_fd);
    }
    if (err_fd >= 0) {
        close(err_fd);
    }

    // The child may close its pipes and keep running
    while (true) {
        int status = 0;
        pid_t waited = waitpid(pid, &status, killed ? 0 : WNOHANG);
        if (waited == pid) {
            outcome.status = status;
            outcome.reaped = true;
            break;
        }
        if (waited < 0 && errno != EINTR) {
            LOG_ERROR("Sandbox") << "waitpid failed: " << strerror(errno);
            break;
        }
        if (waited == 0) {
            check_limits();
            if (!killed) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
    }
    return outcome;
}

// Single-use directory holding the task file; removed on every exit path
class ScopedTaskDir {
public:
    explicit ScopedTaskDir(const std::string& parent) {
        std::filesystem::path base = parent.empty()
            ? std::filesystem::temp_directory_path()
            : std::filesystem::path(parent);
        std::string pattern = (base / "neurax-task-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (mkdtemp(buffer.data()) == nullptr) {
            throw std::runtime_error("cannot create task directory under " + base.string() +
                                     ": " + strerror(errno));
        }
        path_ = buffer.data();
        // Readable by the container user
        chmod(path_.c_str(), 0755);
    }

    ~ScopedTaskDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            LOG_WARN("Sandbox") << "failed to remove " << path_ << ": " << ec.message();
        }
    }

    ScopedTaskDir(const ScopedTaskDir&) = delete;
    ScopedTaskDir& operator=(const ScopedTaskDir&) = delete;

    const std::string& path() const { return path_; }

    void write(const std::string& file_name, const std::string& content) const {
        std::string file_path = path_ + "/" + file_name;
        std::ofstream file(file_path, std::ios::binary);
        if (!file) {
            throw std::runtime_error("cannot create task file " + file_path);
        }
        file << content;
        file.close();
        if (!file) {
            throw std::runtime_error("cannot write task file " + file_path);
        }
        chmod(file_path.c_str(), 0644);
    }

private:
    std::string path_;
};

std::string generate_instance_name() {
    std::random_device rd;
    std::ostringstream name;
    name << "neurax-task-" << std::hex << std::setfill('0');
    for (int i = 0; i < 2; ++i) {
        name << std::setw(8) << rd();
    }
    return name.str();
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

bool run_quietly(const std::vector<std::string>& argv, int timeout_seconds) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
    ProcessOutcome outcome = run_process(argv, "", deadline, nullptr, PIPE_BUFFER_SIZE,
                                         nullptr, nullptr);
    return outcome.started && outcome.reaped && !outcome.deadline_hit &&
           WIFEXITED(outcome.status) && WEXITSTATUS(outcome.status) == 0;
}

} // namespace

bool parse_profile(const std::string& text, SandboxProfile& out) {
    if (text == "standard") {
        out = SandboxProfile::STANDARD;
        return true;
    }
    if (text == "extended") {
        out = SandboxProfile::EXTENDED;
        return true;
    }
    return false;
}

SandboxConfig SandboxConfig::for_profile(SandboxProfile profile) {
    SandboxConfig config;
    if (profile == SandboxProfile::EXTENDED) {
        config.memory_limit_bytes = EXTENDED_MEMORY_LIMIT_BYTES;
        config.timeout = std::chrono::seconds(EXTENDED_TIMEOUT_SECONDS);
    }
    return config;
}

bool task_layout(const std::string& kind, const SandboxConfig& config, TaskLayout& out) {
    if (kind == TASK_KIND_PYTHON) {
        out = TaskLayout{"task.py", "python3", config.python_image};
        return true;
    }
    if (kind == TASK_KIND_SHELL) {
        out = TaskLayout{"task.sh", "sh", config.shell_image};
        return true;
    }
    return false;
}

// ContainerRuntime

ContainerRuntime::ContainerRuntime(std::string binary) : binary_(std::move(binary)) {}

bool ContainerRuntime::available() const {
    return run_quietly({binary_, "--version"}, RUNTIME_PROBE_TIMEOUT_SECONDS);
}

std::vector<std::string> ContainerRuntime::command(const std::string& task_dir,
                                                   const TaskLayout& layout,
                                                   const std::string& instance_name,
                                                   const SandboxConfig& config) const {
    std::string memory = std::to_string(config.memory_limit_bytes);
    std::string nofile = std::to_string(config.max_open_files);

    return {
        binary_, "run", "--rm",
        "--name", instance_name,
        "--network", "none",
        "--cpus", std::to_string(config.cpu_limit),
        "--memory", memory,
        "--memory-swap", memory,
        "--pids-limit", std::to_string(config.max_processes),
        "--ulimit", "nofile=" + nofile + ":" + nofile,
        "--read-only",
        "--tmpfs", "/scratch:rw,size=64m",
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "-v", task_dir + ":/task:ro",
        "-w", "/scratch",
        "-e", "HOME=/scratch",
        layout.image,
        "timeout", "-s", "KILL", std::to_string(config.timeout.count()),
        layout.interpreter, "/task/" + layout.file_name
    };
}

void ContainerRuntime::terminate(const std::string& instance_name) const {
    if (!run_quietly({binary_, "kill", instance_name}, RUNTIME_PROBE_TIMEOUT_SECONDS)) {
        LOG_DEBUG("Sandbox") << binary_ << " kill " << instance_name << " did not succeed";
    }
}

// HostProcessRuntime

bool HostProcessRuntime::available() const {
    return true;
}

std::vector<std::string> HostProcessRuntime::command(const std::string& task_dir,
                                                     const TaskLayout& layout,
                                                     const std::string& instance_name,
                                                     const SandboxConfig& config) const {
    (void)instance_name;
    (void)config;
    return {layout.interpreter, task_dir + "/" + layout.file_name};
}

void HostProcessRuntime::prepare_child(const SandboxConfig& config) const {
    struct rlimit limit;

    // Memory limit
    limit.rlim_cur = limit.rlim_max = config.memory_limit_bytes;
    setrlimit(RLIMIT_AS, &limit);

    // CPU time limit, a second past the wall clock budget
    limit.rlim_cur = limit.rlim_max = config.timeout.count() + 1;
    setrlimit(RLIMIT_CPU, &limit);

    // File descriptor limit
    limit.rlim_cur = limit.rlim_max = config.max_open_files;
    setrlimit(RLIMIT_NOFILE, &limit);

    // Process limit
    limit.rlim_cur = limit.rlim_max = config.max_processes;
    setrlimit(RLIMIT_NPROC, &limit);

    // No network: refuse IPv4/IPv6 sockets, allow everything else
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (!ctx) {
        fprintf(stderr, "network filter unavailable\n");
        _exit(EXIT_EXEC_FAILED);
    }
    int rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1,
                              SCMP_A0(SCMP_CMP_EQ, AF_INET));
    if (rc == 0) {
        rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1,
                              SCMP_A0(SCMP_CMP_EQ, AF_INET6));
    }
    if (rc == 0) {
        rc = seccomp_load(ctx);
    }
    seccomp_release(ctx);
    if (rc != 0) {
        fprintf(stderr, "network filter could not be installed: %s\n", strerror(-rc));
        _exit(EXIT_EXEC_FAILED);
    }
}

// SandboxExecutor

SandboxExecutor::SandboxExecutor(const SandboxConfig& config,
                                 std::shared_ptr<IsolationRuntime> runtime,
                                 std::shared_ptr<IsolationRuntime> fallback)
    : config_(config),
      runtime_(std::move(runtime)),
      fallback_(std::move(fallback)) {
    if (!runtime_) {
        runtime_ = std::make_shared<ContainerRuntime>(config_.runtime);
    }
    if (!fallback_ && config_.allow_unisolated) {
        fallback_ = std::make_shared<HostProcessRuntime>();
    }
}

bool SandboxExecutor::probe_runtime() const {
    bool ok = runtime_->available();
    if (ok) {
        LOG_INFO("Sandbox") << "isolation runtime '" << runtime_->name() << "' available";
    } else if (config_.allow_unisolated && fallback_) {
        LOG_WARN("Sandbox") << "isolation runtime '" << runtime_->name()
                            << "' unavailable; tasks will run UNISOLATED on the host";
    } else {
        LOG_WARN("Sandbox") << "isolation runtime '" << runtime_->name()
                            << "' unavailable; tasks will be refused";
    }
    return ok;
}

ExecutionResult SandboxExecutor::execute(const Task& task, const std::atomic<bool>* cancelled) const {
    auto start = std::chrono::steady_clock::now();

    TaskLayout layout;
    if (!task_layout(task.kind, config_, layout)) {
        LOG_WARN("Sandbox") << "refusing unsupported task type '" << task.kind << "'";
        return ExecutionResult::not_executed("Unsupported task type: " + task.kind,
                                             seconds_since(start));
    }

    const IsolationRuntime* chosen = runtime_.get();
    std::string notice;
    if (!runtime_->available()) {
        if (!config_.allow_unisolated || !fallback_) {
            SandboxUnavailableError error("isolation runtime '" + runtime_->name() +
                                          "' is not installed or not running; task was not executed");
            LOG_ERROR("Sandbox") << error.what();
            return ExecutionResult::not_executed(error.what(), seconds_since(start));
        }
        chosen = fallback_.get();
        notice = "WARNING: isolation runtime '" + runtime_->name() +
                 "' unavailable; task ran WITHOUT isolation on the host\n";
        LOG_WARN("Sandbox") << "running task unisolated via " << chosen->name();
    }

    try {
        ScopedTaskDir dir(config_.scratch_dir);
        dir.write(layout.file_name, task.code);

        std::string instance_name = generate_instance_name();
        std::vector<std::string> argv = chosen->command(dir.path(), layout, instance_name, config_);
        auto deadline = start + config_.timeout + config_.grace;

        LOG_INFO("Sandbox") << "executing " << task.kind << " (" << task.code.size()
                            << " bytes) via " << chosen->name() << " as " << instance_name;

        const SandboxConfig& config = config_;
        ProcessOutcome outcome = run_process(
            argv, dir.path(), deadline, cancelled, config_.max_output_bytes,
            [chosen, &config]() { chosen->prepare_child(config); },
            [chosen, &instance_name]() { chosen->terminate(instance_name); });

        double elapsed = seconds_since(start);
        if (!outcome.started) {
            return ExecutionResult::not_executed(notice + "Sandbox setup failed: " +
                                                 outcome.start_error, elapsed);
        }

        ExecutionResult result;
        result.execution_time = elapsed;
        result.isolated = chosen->isolated();
        result.stdout_output = std::move(outcome.stdout_output);
        result.stderr_output = notice + outcome.stderr_output;
        if (outcome.stdout_truncated) {
            result.stderr_output += "\n[stdout truncated at " +
                                    std::to_string(config_.max_output_bytes) + " bytes]\n";
        }
        if (outcome.stderr_truncated) {
            result.stderr_output += "\n[stderr truncated at " +
                                    std::to_string(config_.max_output_bytes) + " bytes]\n";
        }

        bool past_timeout = elapsed >= static_cast<double>(config_.timeout.count());
        if (outcome.deadline_hit) {
            result.exit_code = EXIT_CODE_NOT_EXECUTED;
            result.timeout_occurred = true;
        } else if (outcome.cancelled) {
            result.exit_code = EXIT_CODE_NOT_EXECUTED;
            result.stderr_output += "Execution cancelled: session closed\n";
        } else if (!outcome.reaped) {
            result.exit_code = EXIT_CODE_NOT_EXECUTED;
            result.stderr_output += "Sandbox lost track of the task process\n";
        } else if (WIFEXITED(outcome.status)) {
            int code = WEXITSTATUS(outcome.status);
            result.exit_code = code;
            if (chosen->isolated() && past_timeout &&
                (code == EXIT_TIMEOUT_KILL || code == EXIT_TIMEOUT_TERM)) {
                result.exit_code = EXIT_CODE_NOT_EXECUTED;
                result.timeout_occurred = true;
            } else if (chosen->isolated() && code == EXIT_CONTAINER_START_FAILED) {
                result.exit_code = EXIT_CODE_NOT_EXECUTED;
                result.stderr_output += "Sandbox setup failed: " + chosen->name() +
                                        " could not start the task container\n";
            }
        } else if (WIFSIGNALED(outcome.status)) {
            int sig = WTERMSIG(outcome.status);
            result.exit_code = 128 + sig;
            if (past_timeout && (sig == SIGKILL || sig == SIGXCPU)) {
                result.exit_code = EXIT_CODE_NOT_EXECUTED;
                result.timeout_occurred = true;
            }
        }

        if (result.timeout_occurred) {
            ExecutionTimeoutError error("task exceeded " +
                                        std::to_string(config_.timeout.count()) + " seconds");
            result.stderr_output += std::string(error.what()) + "\n";
            LOG_WARN("Sandbox") << instance_name << " timed out after " << elapsed << "s";
        } else {
            LOG_INFO("Sandbox") << instance_name << " finished with exit code "
                                << result.exit_code << " in " << elapsed << "s";
        }
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Sandbox") << "setup failed: " << e.what();
        return ExecutionResult::not_executed(notice + "Sandbox setup failed: " + e.what(),
                                             seconds_since(start));
    }
}

} // namespace neurax
