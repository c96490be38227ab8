#include "conduit/runtime.hpp"

#include "conduit/log.hpp"

#include <utility>

namespace conduit {

    dispatch_limits limits_from(const runtime_config& config) {
        return {.default_timeout = config.default_timeout, .max_concurrency = config.max_concurrency};
    }

    shutdown_graces graces_from(const runtime_config& config) {
        return {.drain = config.drain_grace, .cancel = config.cancel_grace, .stop = config.stop_grace};
    }

    runtime::runtime(runtime_config config, session_launcher launcher)
            : config_{std::move(config)},
              registry_{config_.startup_timeout, std::move(launcher)},
              dispatcher_{registry_, limits_from(config_)},
              coordinator_{dispatcher_, registry_, graces_from(config_)} {}

    std::vector<launch_failure> runtime::start_servers() {
        auto failures = registry_.start_all(config_.servers);
        log_info{"started ", config_.servers.size() - failures.size(), " of ", config_.servers.size(), " servers"};
        return failures;
    }

}  // namespace conduit
