#pragma once

#include "config.hpp"
#include "dispatcher.hpp"
#include "registry.hpp"
#include "session.hpp"
#include "shutdown.hpp"

#include <vector>

namespace conduit {

    // Owns registry, dispatcher and coordinator for one resolved config. Destruction runs
    // the shutdown sequence, so the dispatcher is drained before any server is stopped.
    class runtime {
      public:
        explicit runtime(runtime_config config, session_launcher launcher = launch_stdio_session);
        ~runtime() = default;

        runtime(const runtime&) = delete;
        runtime& operator=(const runtime&) = delete;

        // Starts every configured server in parallel and returns the ones that failed
        std::vector<launch_failure> start_servers();

        const runtime_config& config() const { return config_; }
        server_registry& registry() { return registry_; }
        tool_dispatcher& dispatcher() { return dispatcher_; }
        shutdown_coordinator& coordinator() { return coordinator_; }

      private:
        const runtime_config config_;
        server_registry registry_;
        tool_dispatcher dispatcher_;
        shutdown_coordinator coordinator_;
    };

    dispatch_limits limits_from(const runtime_config& config);
    shutdown_graces graces_from(const runtime_config& config);

}  // namespace conduit
