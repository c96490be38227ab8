#pragma once

#include "conduit/config.hpp"

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>

namespace conduit::internal {

    // One spawned server process with its three stdio pipes. The child leads its own
    // process group so terminal Ctrl-C reaches only us; termination goes through
    // terminate().
    class child_process {
      public:
        // Throws launch_error when pipes/fork fail or the command cannot be executed
        explicit child_process(const server_spec& spec);
        ~child_process();

        child_process(const child_process&) = delete;
        child_process& operator=(const child_process&) = delete;

        pid_t pid() const { return pid_; }
        int stdout_fd() const { return stdout_fd_; }
        int stderr_fd() const { return stderr_fd_; }

        // stdin is non-blocking; a server that stops reading fails the write at `deadline`,
        // and so does waiting at `deadline` for another writer to finish
        bool write_all(std::string_view data, std::chrono::steady_clock::time_point deadline);
        void close_stdin();

        // Non-blocking reap; returns the exit status once the child has exited
        std::optional<int> try_reap() const;
        std::optional<int> exit_status() const { return try_reap(); }

        // SIGTERM to the group, up to `grace` to exit, then SIGKILL. A stop request on
        // `force` ends the grace period early. Returns true when the process exited
        // without being killed.
        bool terminate(std::chrono::milliseconds grace, std::stop_token force = {});

      private:
        void record_status(int raw_status) const;

        pid_t pid_{-1};
        int stdin_fd_{-1};
        int stdout_fd_{-1};
        int stderr_fd_{-1};

        std::timed_mutex stdin_mutex_{};
        std::atomic<bool> stdin_closing_{false};
        mutable std::mutex state_mutex_{};
        mutable std::optional<int> exit_status_{};
    };

    // 128 + signal for signalled children, like a shell reports them
    int decode_wait_status(int raw_status);

}  // namespace conduit::internal
