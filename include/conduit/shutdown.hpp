#pragma once

#include "dispatcher.hpp"
#include "registry.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string_view>
#include <thread>

namespace conduit {

    using namespace std::string_view_literals;

    enum class shutdown_phase : uint8_t { running, draining, stopped };

    inline constexpr std::string_view to_string(shutdown_phase phase) {
        switch (phase) {
            case shutdown_phase::running:
                return "running"sv;
            case shutdown_phase::draining:
                return "draining"sv;
            case shutdown_phase::stopped:
                return "stopped"sv;
        }
        return "stopped"sv;
    }

    struct shutdown_graces {
        std::chrono::milliseconds drain{std::chrono::seconds{2}};
        std::chrono::milliseconds cancel{std::chrono::milliseconds{500}};
        std::chrono::milliseconds stop{std::chrono::seconds{3}};
    };

    /*
     * Drives running -> draining -> stopped.
     *
     * initiate_shutdown() never blocks: the first call moves to draining and starts a
     * worker that stops the dispatcher accepting, lets in-flight calls finish for the
     * drain grace, cancels what is left, then stops every registry handle. A second call
     * while draining forces the rest of the sequence through with no grace at all. The
     * dispatcher is always drained before the registry is torn down.
     */
    class shutdown_coordinator {
      public:
        shutdown_coordinator(tool_dispatcher& dispatcher, server_registry& registry, shutdown_graces graces);
        ~shutdown_coordinator();

        shutdown_coordinator(const shutdown_coordinator&) = delete;
        shutdown_coordinator& operator=(const shutdown_coordinator&) = delete;

        void initiate_shutdown();

        // initiate_shutdown() then wait()
        void run();

        void wait();
        bool wait_for(std::chrono::milliseconds timeout);

        shutdown_phase phase() const;
        bool forced() const { return force_.stop_requested(); }

      private:
        void sequence();
        void drain_calls();

        tool_dispatcher& dispatcher_;
        server_registry& registry_;
        const shutdown_graces graces_;

        std::stop_source force_{};

        mutable std::mutex mutex_{};
        std::condition_variable stopped_cv_{};
        shutdown_phase phase_{shutdown_phase::running};

        std::jthread worker_{};
    };

}  // namespace conduit
