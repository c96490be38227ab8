#pragma once

#include "config.hpp"
#include "errors.hpp"

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace conduit {

    using namespace std::string_view_literals;

    using steady_clock = std::chrono::steady_clock;

    enum class rpc_status : uint8_t {
        ok,
        rpc_error,
        timed_out,
        cancelled,
        disconnected,
    };

    inline constexpr std::string_view to_string(rpc_status status) {
        switch (status) {
            case rpc_status::ok:
                return "ok"sv;
            case rpc_status::rpc_error:
                return "rpc_error"sv;
            case rpc_status::timed_out:
                return "timed_out"sv;
            case rpc_status::cancelled:
                return "cancelled"sv;
            case rpc_status::disconnected:
                return "disconnected"sv;
        }
        return "disconnected"sv;
    }

    struct rpc_reply {
        rpc_status status{rpc_status::disconnected};
        std::string result{};  // raw JSON of the "result" member
        int error_code{0};
        std::string message{};

        bool ok() const { return status == rpc_status::ok; }
    };

    /*
     * Boundary to the tool-execution engine of one server: a JSON-RPC channel bound to a
     * live process. Implementations must allow request() from many threads at once and
     * correlate replies by request id.
     */
    class tool_session {
      public:
        virtual ~tool_session() = default;

        // Blocks until the correlated reply arrives, the deadline passes, stop is requested,
        // or the server goes away. A timed out or cancelled request is announced to the
        // server with notifications/cancelled.
        virtual rpc_reply request(
                std::string_view method,
                std::string params_json,
                steady_clock::time_point deadline,
                std::stop_token stop) = 0;

        virtual bool notify(std::string_view method, std::string params_json) = 0;

        virtual bool alive() const = 0;
        virtual pid_t pid() const = 0;
        virtual std::optional<int> exit_status() const = 0;

        // Ends the server: polite request, `grace` to exit, then forced. A stop request on
        // `force` cuts the grace period short. Idempotent.
        virtual void terminate(std::chrono::milliseconds grace, std::stop_token force) = 0;
    };

    // Spawns the process for a spec; throws launch_error if it cannot be executed
    using session_launcher = std::function<std::unique_ptr<tool_session>(const server_spec&)>;

    std::unique_ptr<tool_session> launch_stdio_session(const server_spec& spec);

}  // namespace conduit
