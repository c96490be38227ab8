#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "session.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace conduit {

    using namespace std::string_view_literals;

    enum class server_status : uint8_t {
        starting,
        ready,
        failed,
        stopped,
    };

    inline constexpr std::string_view to_string(server_status status) {
        switch (status) {
            case server_status::starting:
                return "starting"sv;
            case server_status::ready:
                return "ready"sv;
            case server_status::failed:
                return "failed"sv;
            case server_status::stopped:
                return "stopped"sv;
        }
        return "failed"sv;
    }

    struct tool_info {
        std::string name{};
        std::string description{};
        std::string input_schema{};
    };

    /*
     * Runtime binding of a server_spec to its process. Owned by server_registry; other
     * components receive a std::weak_ptr from a name lookup and must re-check status().
     *
     * starting -> ready -> stopped, starting -> failed, or starting -> stopped when stopped
     * mid-start. A ready server whose process dies is reported failed the next time its
     * status is read.
     */
    class server_handle {
      public:
        explicit server_handle(server_spec spec);

        server_handle(const server_handle&) = delete;
        server_handle& operator=(const server_handle&) = delete;

        const std::string& name() const { return spec_.name; }
        const server_spec& spec() const { return spec_; }

        server_status status() const;
        pid_t pid() const;
        std::optional<int> exit_status() const;
        std::string last_error() const;

        std::string server_name() const;
        std::string server_version() const;
        std::vector<tool_info> tools() const;

        // Forwards one JSON-RPC request to a ready server
        rpc_reply request(
                std::string_view method,
                std::string params_json,
                steady_clock::time_point deadline,
                std::stop_token stop) const;

      private:
        friend class server_registry;

        bool transition(server_status from, server_status to) const;
        // starting -> failed; false when a stop got there first
        bool fail(std::string message) const;
        std::shared_ptr<tool_session> session() const;

        const server_spec spec_;
        mutable std::atomic<server_status> status_{server_status::starting};

        // serializes start/stop of this handle
        std::mutex lifecycle_mutex_{};
        // cancels the handshake of a start in progress
        std::stop_source start_abort_{};

        mutable std::mutex info_mutex_{};
        std::shared_ptr<tool_session> session_{};
        mutable std::string last_error_{};
        std::string server_name_{};
        std::string server_version_{};
        std::vector<tool_info> tools_{};
    };

    using server_ref = std::weak_ptr<server_handle>;

    struct server_snapshot {
        std::string name{};
        server_status status{server_status::stopped};
        pid_t pid{-1};
        std::size_t tool_count{0};
        std::string server_name{};
        std::string last_error{};
    };

    struct launch_failure {
        std::string name{};
        std::string message{};
    };

    struct ping_result {
        std::string name{};
        bool ok{false};
        std::chrono::microseconds latency{0};
        std::string message{};
    };

    class server_registry {
      public:
        explicit server_registry(
                std::chrono::milliseconds startup_timeout = std::chrono::seconds{30},
                session_launcher launcher = launch_stdio_session);
        ~server_registry();

        server_registry(const server_registry&) = delete;
        server_registry& operator=(const server_registry&) = delete;

        // Spawns, handshakes and discovers tools. Throws launch_error; the failed handle
        // stays registered so later lookups report it as failed.
        server_ref start(const server_spec& spec);

        // Starts every spec concurrently; returns the ones that failed
        std::vector<launch_failure> start_all(const std::vector<server_spec>& specs);

        // Unknown names throw not_found_error; stopping twice is a no-op. A stop request on
        // `force` skips whatever remains of the grace period.
        void stop(std::string_view name, std::chrono::milliseconds grace, std::stop_token force = {});
        void stop(server_handle& handle, std::chrono::milliseconds grace, std::stop_token force = {});

        // Stops every handle concurrently and waits for all of them. The registry accepts no
        // further start() calls afterwards.
        void stop_all(std::chrono::milliseconds grace, std::stop_token force = {});

        // Throws not_found_error
        server_ref get(std::string_view name) const;
        bool contains(std::string_view name) const;

        std::vector<server_snapshot> list() const;
        std::vector<std::string> names() const;

        ping_result ping(std::string_view name, std::chrono::milliseconds timeout) const;

      private:
        void handshake(server_handle& handle, tool_session& session, steady_clock::time_point deadline);
        void discover_tools(server_handle& handle, tool_session& session, steady_clock::time_point deadline);

        std::chrono::milliseconds startup_timeout_;
        session_launcher launcher_;

        // aborts handshakes still running when stop_all begins
        std::stop_source starts_stop_{};
        std::atomic<bool> closed_{false};

        mutable std::shared_mutex table_mutex_{};
        std::map<std::string, std::shared_ptr<server_handle>, std::less<>> table_{};
    };

}  // namespace conduit
