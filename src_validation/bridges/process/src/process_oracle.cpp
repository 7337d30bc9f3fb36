#include "golden_bridge/process_oracle.hpp"
#include "golden_bridge/errors.hpp"
#include "golden_bridge/wire_codec.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace golden::bridge {

namespace {

std::string quote(const std::string& s) {
    std::ostringstream os;
    os << '\"' << s << '\"';
    return os.str();
}

std::string errno_text(int err) {
    return std::strerror(err);
}

bool write_text(const fs::path& path, const std::string& text, std::string& diag) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) { diag += "open failed: " + path.string() + "\n"; return false; }
    ofs << text;
    if (!ofs) { diag += "write failed: " + path.string() + "\n"; return false; }
    return true;
}

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_{fd} {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_{other.release()} {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    int release() noexcept {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

struct Pipe {
    UniqueFd read;
    UniqueFd write;
};

Pipe make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw OracleUnavailableError("Unable to create pipe for oracle process: " + errno_text(errno));
    }
    return Pipe{UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}

void set_nonblocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Owns a spawned oracle: unless it has been reaped, the whole process group is killed
// and waited for on destruction.
class ChildProcess {
public:
    explicit ChildProcess(pid_t pid) : pid_{pid} {}
    ~ChildProcess() {
        if (pid_ > 0) {
            kill_group();
            int status = 0;
            while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
            }
        }
    }
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    void kill_group() noexcept {
        if (pid_ > 0) {
            ::kill(-pid_, SIGKILL);
            ::kill(pid_, SIGKILL);
        }
    }

    // Wait status once the child has exited, std::nullopt while it is still running.
    std::optional<int> try_wait() {
        int status = 0;
        const pid_t w = ::waitpid(pid_, &status, WNOHANG);
        if (w == pid_) {
            pid_ = -1;
            return status;
        }
        if (w < 0 && errno != EINTR) {
            const int err = errno;
            pid_ = -1;
            throw OracleProcessError("waitpid failed for oracle process: " + errno_text(err), -1, "");
        }
        return std::nullopt;
    }

    int wait() {
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0) {
            if (errno != EINTR) {
                const int err = errno;
                pid_ = -1;
                throw OracleProcessError("waitpid failed for oracle process: " + errno_text(err), -1, "");
            }
        }
        pid_ = -1;
        return status;
    }

private:
    pid_t pid_;
};

// SIGPIPE is ignored while feeding the oracle so an early oracle exit surfaces as EPIPE.
class ScopedSigpipeIgnore {
public:
    ScopedSigpipeIgnore() {
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        ::sigaction(SIGPIPE, &ignore, &previous_);
    }
    ~ScopedSigpipeIgnore() { ::sigaction(SIGPIPE, &previous_, nullptr); }
    ScopedSigpipeIgnore(const ScopedSigpipeIgnore&) = delete;
    ScopedSigpipeIgnore& operator=(const ScopedSigpipeIgnore&) = delete;

private:
    struct sigaction previous_ {};
};

bool is_executable_file(const fs::path& candidate) {
    std::error_code ec;
    return fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0;
}

fs::path resolve_executable(const fs::path& executable) {
    if (executable.empty()) {
        throw OracleUnavailableError("No oracle executable configured");
    }
    if (executable.has_parent_path()) {
        if (!is_executable_file(executable)) {
            throw OracleUnavailableError("Oracle executable not found or not executable: " + executable.string());
        }
        return fs::absolute(executable);
    }

    const char* path_env = std::getenv("PATH");
    const std::string_view search = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::size_t pos = 0;
    while (pos <= search.size()) {
        auto end = search.find(':', pos);
        if (end == std::string_view::npos) {
            end = search.size();
        }
        const auto dir = search.substr(pos, end - pos);
        const auto candidate = (dir.empty() ? fs::path(".") : fs::path(std::string{dir})) / executable;
        if (is_executable_file(candidate)) {
            return fs::absolute(candidate);
        }
        pos = end + 1;
    }
    throw OracleUnavailableError("Oracle executable '" + executable.string() + "' not found on PATH");
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}  // namespace

ProcessOracle::ProcessOracle(Config cfg) : cfg_(std::move(cfg)) {}

ProcessOracle::Outcome ProcessOracle::run_process(const std::vector<std::string>& args,
                                                  const std::string& stdin_text,
                                                  const char* tag) {
    const fs::path executable = resolve_executable(cfg_.executable);

    std::vector<std::string> argv_strings;
    argv_strings.reserve(args.size() + 1);
    argv_strings.push_back(executable.string());
    argv_strings.insert(argv_strings.end(), args.begin(), args.end());

    std::string command_line;
    for (const auto& arg : argv_strings) {
        if (!command_line.empty()) command_line += " ";
        command_line += quote(arg);
    }
    diag_ += std::string("[") + tag + "] cmd: " + command_line + "\n";

    // Everything the child needs is prepared before fork().
    std::vector<char*> argv;
    argv.reserve(argv_strings.size() + 1);
    for (auto& s : argv_strings) argv.push_back(s.data());
    argv.push_back(nullptr);
    const std::string cwd = cfg_.working_dir.string();

    Pipe in_pipe = make_pipe();
    Pipe out_pipe = make_pipe();
    Pipe err_pipe = make_pipe();
    Pipe exec_pipe = make_pipe();  // carries errno if exec fails; closed by O_CLOEXEC on success

    ScopedSigpipeIgnore sigpipe_guard;
    const auto started = std::chrono::steady_clock::now();

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw OracleUnavailableError("Unable to fork oracle process: " + errno_text(errno));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);
        ::dup2(in_pipe.read.get(), STDIN_FILENO);
        ::dup2(out_pipe.write.get(), STDOUT_FILENO);
        ::dup2(err_pipe.write.get(), STDERR_FILENO);
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            const int err = errno;
            if (::write(exec_pipe.write.get(), &err, sizeof(err)) < 0) {
            }
            ::_exit(127);
        }
        ::execv(argv[0], argv.data());
        const int err = errno;
        if (::write(exec_pipe.write.get(), &err, sizeof(err)) < 0) {
        }
        ::_exit(127);
    }

    ChildProcess child(pid);
    ++invocations_;

    in_pipe.read.reset();
    out_pipe.write.reset();
    err_pipe.write.reset();
    exec_pipe.write.reset();

    int exec_errno = 0;
    ssize_t exec_read = 0;
    do {
        exec_read = ::read(exec_pipe.read.get(), &exec_errno, sizeof(exec_errno));
    } while (exec_read < 0 && errno == EINTR);
    if (exec_read == static_cast<ssize_t>(sizeof(exec_errno))) {
        diag_ += std::string("[") + tag + "] launch failed: " + errno_text(exec_errno) + "\n";
        throw OracleUnavailableError("Unable to launch oracle " + quote(executable.string()) + ": " +
                                     errno_text(exec_errno));
    }

    Outcome outcome;
    const bool has_deadline = cfg_.timeout.count() > 0;
    const auto deadline = started + cfg_.timeout;

    auto fail_timeout = [&]() {
        child.kill_group();
        (void)child.wait();
        diag_ += std::string("[") + tag + "] timed out after " + std::to_string(cfg_.timeout.count()) + " ms\n";
        if (!cfg_.artifact_dir.empty()) {
            (void)write_text(cfg_.artifact_dir / (std::string(tag) + "_stderr.txt"), outcome.stderr_text, diag_);
            (void)write_text(cfg_.artifact_dir / "adapter_diag.txt", diag_, diag_);
        }
        throw OracleProcessError("Oracle timed out after " + std::to_string(cfg_.timeout.count()) + " ms", -1,
                                 outcome.stderr_text, true);
    };

    if (stdin_text.empty()) {
        in_pipe.write.reset();
    } else {
        set_nonblocking(in_pipe.write.get());
    }
    set_nonblocking(out_pipe.read.get());
    set_nonblocking(err_pipe.read.get());

    std::size_t written = 0;
    std::array<char, 65536> buffer{};

    auto drain = [&](const pollfd& pfd, UniqueFd& fd, std::string& sink) {
        if ((pfd.revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
            return;
        }
        const ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
        if (n > 0) {
            sink.append(buffer.data(), static_cast<std::size_t>(n));
        } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
            fd.reset();
        }
    };

    while (in_pipe.write.valid() || out_pipe.read.valid() || err_pipe.read.valid()) {
        std::array<pollfd, 3> fds{};
        nfds_t count = 0;
        int in_idx = -1;
        int out_idx = -1;
        int err_idx = -1;
        if (in_pipe.write.valid()) {
            in_idx = static_cast<int>(count);
            fds[count++] = pollfd{in_pipe.write.get(), POLLOUT, 0};
        }
        if (out_pipe.read.valid()) {
            out_idx = static_cast<int>(count);
            fds[count++] = pollfd{out_pipe.read.get(), POLLIN, 0};
        }
        if (err_pipe.read.valid()) {
            err_idx = static_cast<int>(count);
            fds[count++] = pollfd{err_pipe.read.get(), POLLIN, 0};
        }

        int wait_ms = -1;
        if (has_deadline) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                fail_timeout();
            }
            wait_ms = static_cast<int>(
                std::min<long long>(remaining.count(), std::numeric_limits<int>::max() - 1) + 1);
        }

        const int rc = ::poll(fds.data(), count, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw OracleProcessError("poll on oracle pipes failed: " + errno_text(errno), -1, outcome.stderr_text);
        }
        if (rc == 0) {
            continue;
        }

        if (in_idx >= 0 && fds[in_idx].revents != 0) {
            if ((fds[in_idx].revents & (POLLERR | POLLHUP)) != 0) {
                diag_ += std::string("[") + tag + "] oracle closed stdin after " + std::to_string(written) +
                         " of " + std::to_string(stdin_text.size()) + " bytes\n";
                in_pipe.write.reset();
            } else {
                const ssize_t n =
                    ::write(in_pipe.write.get(), stdin_text.data() + written, stdin_text.size() - written);
                if (n > 0) {
                    written += static_cast<std::size_t>(n);
                    if (written == stdin_text.size()) {
                        in_pipe.write.reset();
                    }
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    diag_ += std::string("[") + tag + "] write to oracle stdin failed: " + errno_text(errno) + "\n";
                    in_pipe.write.reset();
                }
            }
        }
        if (out_idx >= 0) drain(fds[out_idx], out_pipe.read, outcome.stdout_text);
        if (err_idx >= 0) drain(fds[err_idx], err_pipe.read, outcome.stderr_text);
    }

    int status = 0;
    if (has_deadline) {
        while (true) {
            if (const auto exited = child.try_wait()) {
                status = *exited;
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                fail_timeout();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    } else {
        status = child.wait();
    }
    outcome.exit_code = decode_wait_status(status);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    diag_ += std::string("[") + tag + "] rc=" + std::to_string(outcome.exit_code) +
             " elapsed=" + std::to_string(elapsed.count()) + "ms stdout=" +
             std::to_string(outcome.stdout_text.size()) + "B stderr=" + std::to_string(outcome.stderr_text.size()) +
             "B\n";

    if (!cfg_.artifact_dir.empty()) {
        const std::string prefix = tag;
        (void)write_text(cfg_.artifact_dir / (prefix + "_input.txt"), stdin_text, diag_);
        (void)write_text(cfg_.artifact_dir / (prefix + "_stdout.txt"), outcome.stdout_text, diag_);
        (void)write_text(cfg_.artifact_dir / (prefix + "_stderr.txt"), outcome.stderr_text, diag_);
        (void)write_text(cfg_.artifact_dir / "adapter_diag.txt", diag_, diag_);
    }
    return outcome;
}

ResultMap ProcessOracle::run_batch(const RequestSet& requests) {
    std::vector<std::string> args = cfg_.leading_args;
    args.insert(args.end(), cfg_.batch_args.begin(), cfg_.batch_args.end());

    const auto outcome = run_process(args, wire::encode_batch(requests), "batch");
    if (outcome.exit_code != 0) {
        throw OracleProcessError("Oracle batch run failed with exit code " + std::to_string(outcome.exit_code),
                                 outcome.exit_code, outcome.stderr_text);
    }
    if (!outcome.stderr_text.empty()) {
        diag_ += "[batch] oracle stderr:\n" + outcome.stderr_text;
        if (outcome.stderr_text.back() != '\n') diag_ += "\n";
    }
    return wire::decode_batch(outcome.stdout_text, diag_);
}

RawTable ProcessOracle::run_single(const Request& request) {
    std::vector<std::string> args = cfg_.leading_args;
    args.push_back(request.module());
    for (const auto& [key, value] : request.arguments()) {
        args.push_back(key + "=" + value);
    }

    const auto outcome = run_process(args, std::string{}, "single");
    if (outcome.exit_code != 0) {
        throw OracleProcessError("Oracle failed for '" + request.to_wire_line() + "' with exit code " +
                                     std::to_string(outcome.exit_code),
                                 outcome.exit_code, outcome.stderr_text);
    }
    return wire::decode_single(outcome.stdout_text);
}

}  // namespace golden::bridge
