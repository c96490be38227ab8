#pragma once

#include "registry.hpp"
#include "slot_pool.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace conduit {

    using namespace std::string_view_literals;

    enum class call_error : uint8_t {
        none,
        launch_error,
        not_found,
        server_unavailable,
        timeout,
        shutting_down,
        tool_error,
        invalid_arguments,
    };

    inline constexpr std::string_view to_string(call_error kind) {
        switch (kind) {
            case call_error::none:
                return "none"sv;
            case call_error::launch_error:
                return "launch_error"sv;
            case call_error::not_found:
                return "not_found"sv;
            case call_error::server_unavailable:
                return "server_unavailable"sv;
            case call_error::timeout:
                return "timeout"sv;
            case call_error::shutting_down:
                return "shutting_down"sv;
            case call_error::tool_error:
                return "tool_error"sv;
            case call_error::invalid_arguments:
                return "invalid_arguments"sv;
        }
        return "none"sv;
    }

    struct tool_call_request {
        std::string server{};
        std::string tool{};
        std::string arguments{"{}"};
        std::optional<std::chrono::milliseconds> timeout{};
        std::optional<std::stop_token> stop{};
    };

    struct tool_call_result {
        call_error error{call_error::none};
        std::string message{};
        std::string payload{};  // raw JSON of the tools/call result
        std::string text{};     // text content joined by newlines
        std::chrono::milliseconds elapsed{0};

        bool ok() const { return error == call_error::none; }
    };

    struct dispatch_limits {
        std::chrono::milliseconds default_timeout{std::chrono::seconds{120}};
        std::size_t max_concurrency{4U};
    };

    /*
     * Routes tool calls to registry handles under a timeout and a concurrency limit.
     *
     * Every call draws one slot from a pool: the server's own pool when its spec sets
     * max_concurrency, otherwise the global pool. The request timeout bounds the wait for
     * a slot plus the execution. invoke() never throws for call failures.
     */
    class tool_dispatcher {
      public:
        tool_dispatcher(server_registry& registry, dispatch_limits limits);

        tool_dispatcher(const tool_dispatcher&) = delete;
        tool_dispatcher& operator=(const tool_dispatcher&) = delete;

        tool_call_result invoke(const tool_call_request& request);

        // New calls fail with shutting_down from now on
        void stop_accepting();
        bool accepting() const;

        // Cancels every call that is waiting for a slot or a reply
        void cancel_all();

        // True once no call is in flight, false if `timeout` passed or `stop` fired first
        bool wait_idle(std::chrono::milliseconds timeout, std::stop_token stop = {});

        std::size_t in_flight() const;

        const dispatch_limits& limits() const { return limits_; }
        const slot_pool& global_pool() const { return global_pool_; }

      private:
        slot_pool& pool_for(const server_spec& spec);
        std::chrono::milliseconds effective_timeout(const tool_call_request& request, const server_spec& spec) const;

        bool enter();
        void leave();

        server_registry& registry_;
        const dispatch_limits limits_;
        slot_pool global_pool_;

        std::mutex pools_mutex_{};
        std::map<std::string, std::unique_ptr<slot_pool>, std::less<>> server_pools_{};

        std::stop_source cancel_source_{};

        mutable std::mutex idle_mutex_{};
        std::condition_variable_any idle_cv_{};
        bool accepting_{true};
        std::size_t in_flight_{0};
    };

}  // namespace conduit
