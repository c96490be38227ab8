#pragma once

#include "config.hpp"
#include "dispatcher.hpp"
#include "runtime.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace conduit::cli {

    using namespace std::string_view_literals;

    enum class command_kind : uint8_t { servers, tools, ping, call, batch };

    inline constexpr std::string_view to_string(command_kind kind) {
        switch (kind) {
            case command_kind::servers:
                return "servers"sv;
            case command_kind::tools:
                return "tools"sv;
            case command_kind::ping:
                return "ping"sv;
            case command_kind::call:
                return "call"sv;
            case command_kind::batch:
                return "batch"sv;
        }
        return "servers"sv;
    }

    inline constexpr int exit_ok = 0;
    inline constexpr int exit_failure = 1;
    inline constexpr int exit_usage = 2;
    inline constexpr int exit_interrupted = 130;

    inline constexpr auto default_ping_timeout = std::chrono::seconds{5};

    struct command_options {
        command_kind kind{command_kind::servers};

        // tools
        bool json{false};

        // ping: server names or positions in the server list; empty means all
        std::vector<std::string> targets{};

        // ping and call
        std::optional<std::chrono::milliseconds> timeout{};

        // call
        std::string server{};
        std::string tool{};
        std::string arguments{"{}"};

        // batch: file path, "-" for stdin
        std::string batch_source{};
    };

    // Resolves cfg (file, environment, flags) and the command to run. Returns an exit code
    // when the process should stop here (help, version, --print-config, usage errors).
    std::optional<int> parse_cli(
            int argc,
            const char* const* argv,
            runtime_config& cfg,
            command_options& cmd,
            env_lookup lookup = process_env);

    // Parses a batch document: a JSON array of {server, tool, arguments, timeout}.
    // Throws config_error on malformed input.
    std::vector<tool_call_request> parse_batch(std::string_view json_text);

    // Narrows cfg.servers to what the command needs before anything is started
    void select_servers(runtime_config& cfg, const command_options& cmd);

    // Runs one command against an already constructed runtime
    int run_command(runtime& rt, const command_options& cmd, std::ostream& out, std::ostream& err);

    // Blocks SIGINT/SIGTERM in the calling thread and every thread it creates afterwards,
    // and ignores SIGPIPE. Call before any other thread exists.
    void block_shutdown_signals();

    // Delivers blocked SIGINT/SIGTERM to a callback from a dedicated thread
    class signal_watcher {
      public:
        explicit signal_watcher(std::function<void()> on_signal);
        ~signal_watcher();

        signal_watcher(const signal_watcher&) = delete;
        signal_watcher& operator=(const signal_watcher&) = delete;

        int signals_seen() const;

      private:
        void watch(std::stop_token stop);

        std::function<void()> on_signal_;
        std::atomic<int> seen_{0};
        std::jthread thread_;
    };

    // Full command lifecycle: runtime, signal delivery, command, shutdown
    int execute(runtime_config cfg, const command_options& cmd);

}  // namespace conduit::cli
