#include "internal/process.hpp"

#include "conduit/errors.hpp"
#include "conduit/format.hpp"
#include "conduit/log.hpp"
#include "conduit/utils.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

extern char** environ;

using namespace conduit::literals;

namespace conduit::internal { namespace detail {

    struct pipe_pair {
        int read_end{-1};
        int write_end{-1};
    };

    static void close_fd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    static void close_pipe(pipe_pair& p) {
        close_fd(p.read_end);
        close_fd(p.write_end);
    }

    // Every pipe is close-on-exec so servers spawned concurrently never inherit each
    // other's stdin and miss EOF
    static pipe_pair open_pipe() {
        int fds[2]{};
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw launch_error{"pipe() failed: {}"_format(std::strerror(errno))};
        }
        return {.read_end = fds[0], .write_end = fds[1]};
    }

    static std::vector<std::string> build_environment(const server_spec& spec) {
        std::vector<std::string> env{};
        for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
            std::string_view kv{*entry};
            auto eq = kv.find('=');
            auto key = kv.substr(0, eq);
            if (!spec.env.contains(std::string{key})) {
                env.emplace_back(kv);
            }
        }
        for (const auto& [key, value] : spec.env) {
            env.push_back(key + "=" + value);
        }
        return env;
    }

    static std::vector<char*> as_argv(std::vector<std::string>& values) {
        std::vector<char*> argv{};
        argv.reserve(values.size() + 1);
        for (auto& value : values) {
            argv.push_back(value.data());
        }
        argv.push_back(nullptr);
        return argv;
    }

    // Only async-signal-safe calls between fork and exec; failures report errno through
    // the status pipe
    [[noreturn]] static void exec_child(
            pipe_pair& in, pipe_pair& out, pipe_pair& err, pipe_pair& status, const char* cwd,
            char* const* argv, char* const* envp) {
        ::setpgid(0, 0);

        sigset_t none{};
        ::sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::signal(SIGPIPE, SIG_DFL);
        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGTERM, SIG_DFL);

        ::dup2(in.read_end, STDIN_FILENO);
        ::dup2(out.write_end, STDOUT_FILENO);
        ::dup2(err.write_end, STDERR_FILENO);

        int code = 0;
        if (cwd != nullptr && ::chdir(cwd) != 0) {
            code = errno;
        }
        else {
            ::execvpe(argv[0], argv, envp);
            code = errno;
        }
        auto ignored = ::write(status.write_end, &code, sizeof(code));
        (void)ignored;
        _exit(127);
    }

}}  // namespace conduit::internal::detail

namespace conduit::internal {

    int decode_wait_status(int raw_status) {
        if (WIFEXITED(raw_status)) {
            return WEXITSTATUS(raw_status);
        }
        if (WIFSIGNALED(raw_status)) {
            return 128 + WTERMSIG(raw_status);
        }
        return 1;
    }

    child_process::child_process(const server_spec& spec) {
        detail::pipe_pair in{};
        detail::pipe_pair out{};
        detail::pipe_pair err{};
        detail::pipe_pair status{};

        try {
            in = detail::open_pipe();
            out = detail::open_pipe();
            err = detail::open_pipe();
            status = detail::open_pipe();
        } catch (...) {
            detail::close_pipe(in);
            detail::close_pipe(out);
            detail::close_pipe(err);
            detail::close_pipe(status);
            throw;
        }

        std::vector<std::string> args{};
        args.reserve(spec.args.size() + 1);
        args.push_back(spec.command);
        args.insert(args.end(), spec.args.begin(), spec.args.end());
        auto env = detail::build_environment(spec);
        auto argv = detail::as_argv(args);
        auto envp = detail::as_argv(env);
        std::string cwd = spec.working_dir ? spec.working_dir->string() : std::string{};

        auto pid = ::fork();
        if (pid < 0) {
            auto reason = std::strerror(errno);
            detail::close_pipe(in);
            detail::close_pipe(out);
            detail::close_pipe(err);
            detail::close_pipe(status);
            throw launch_error{"fork() failed for '{}': {}"_format(spec.name, reason)};
        }

        if (pid == 0) {
            detail::exec_child(
                    in, out, err, status, spec.working_dir ? cwd.c_str() : nullptr, argv.data(), envp.data());
        }

        ::setpgid(pid, pid);
        detail::close_fd(in.read_end);
        detail::close_fd(out.write_end);
        detail::close_fd(err.write_end);
        detail::close_fd(status.write_end);

        int child_errno = 0;
        ssize_t n = 0;
        do {
            n = ::read(status.read_end, &child_errno, sizeof(child_errno));
        } while (n < 0 && errno == EINTR);
        detail::close_fd(status.read_end);

        if (n > 0) {
            int raw = 0;
            ::waitpid(pid, &raw, 0);
            detail::close_pipe(in);
            detail::close_pipe(out);
            detail::close_pipe(err);
            throw launch_error{"failed to execute '{}' for server '{}': {}"_format(
                    spec.command, spec.name, std::strerror(child_errno))};
        }

        pid_ = pid;
        ::fcntl(in.write_end, F_SETFL, ::fcntl(in.write_end, F_GETFL, 0) | O_NONBLOCK);
        stdin_fd_ = in.write_end;
        stdout_fd_ = out.read_end;
        stderr_fd_ = err.read_end;
        log_debug{"spawned '", spec.name, "' pid=", pid_};
    }

    child_process::~child_process() {
        if (pid_ > 0) {
            terminate(std::chrono::milliseconds{0});
        }
        detail::close_fd(stdin_fd_);
        detail::close_fd(stdout_fd_);
        detail::close_fd(stderr_fd_);
    }

    bool child_process::write_all(std::string_view data, std::chrono::steady_clock::time_point deadline) {
        // a writer stuck behind a server that stopped reading must not hold up the others
        std::unique_lock lock{stdin_mutex_, deadline};
        if (!lock.owns_lock() || stdin_fd_ < 0) {
            return false;
        }
        const auto total = data.size();
        while (!data.empty()) {
            auto n = ::write(stdin_fd_, data.data(), data.size());
            if (n >= 0) {
                data.remove_prefix(static_cast<size_t>(n));
                continue;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                return false;
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                     deadline - std::chrono::steady_clock::now())
                                     .count();
            if (remaining <= 0 || stdin_closing_.load()) {
                if (data.size() != total) {
                    // half a frame is on the pipe; nothing written after it would parse
                    log_warn{"pid ", pid_, " stopped reading mid-message, closing its stdin"};
                    detail::close_fd(stdin_fd_);
                }
                return false;
            }
            pollfd pfd{.fd = stdin_fd_, .events = POLLOUT, .revents = 0};
            ::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining, 50)));
        }
        return true;
    }

    void child_process::close_stdin() {
        stdin_closing_.store(true);
        std::lock_guard lock{stdin_mutex_};
        detail::close_fd(stdin_fd_);
    }

    void child_process::record_status(int raw_status) const {
        exit_status_ = decode_wait_status(raw_status);
    }

    std::optional<int> child_process::try_reap() const {
        std::lock_guard lock{state_mutex_};
        if (exit_status_ || pid_ <= 0) {
            return exit_status_;
        }
        int raw = 0;
        auto r = ::waitpid(pid_, &raw, WNOHANG);
        if (r == pid_) {
            record_status(raw);
        }
        else if (r < 0 && errno == ECHILD) {
            exit_status_ = 1;
        }
        return exit_status_;
    }

    bool child_process::terminate(std::chrono::milliseconds grace, std::stop_token force) {
        close_stdin();
        if (try_reap()) {
            return true;
        }

        ::kill(-pid_, SIGTERM);
        auto deadline = utils::deadline_after(std::chrono::steady_clock::now(), grace);
        while (std::chrono::steady_clock::now() < deadline && !force.stop_requested()) {
            if (try_reap()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
        if (try_reap()) {
            return true;
        }

        if (force.stop_requested()) {
            log_warn{"pid ", pid_, " is being killed early"};
        }
        else if (grace.count() > 0) {
            log_warn{"pid ", pid_, " did not exit within ", grace.count(), "ms of SIGTERM, killing"};
        }
        ::kill(-pid_, SIGKILL);

        std::lock_guard lock{state_mutex_};
        if (!exit_status_) {
            int raw = 0;
            if (::waitpid(pid_, &raw, 0) == pid_) {
                record_status(raw);
            }
            else {
                exit_status_ = 1;
            }
        }
        return false;
    }

}  // namespace conduit::internal
