#include "conduit/config.hpp"

#include "conduit/format.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>

using namespace conduit::literals;

namespace conduit { namespace detail {

    struct file_server_entry {
        std::string command{};
        std::vector<std::string> args{};
        std::optional<std::string> cwd{};
        std::map<std::string, std::string> env{};
        std::optional<double> timeout{};
        std::optional<std::int64_t> max_concurrency{};
        bool disabled{false};

        struct glaze {
            using T = file_server_entry;
            static constexpr auto value = glz::object(
                    &T::command,
                    &T::args,
                    &T::cwd,
                    &T::env,
                    &T::timeout,
                    "maxConcurrency",
                    &T::max_concurrency,
                    &T::disabled);
        };
    };

    struct file_defaults {
        std::optional<double> timeout{};
        std::optional<std::int64_t> max_concurrency{};
        std::optional<double> startup_timeout{};
        std::optional<double> drain_grace{};
        std::optional<double> cancel_grace{};
        std::optional<double> stop_grace{};

        struct glaze {
            using T = file_defaults;
            static constexpr auto value = glz::object(
                    &T::timeout,
                    "maxConcurrency",
                    &T::max_concurrency,
                    "startupTimeout",
                    &T::startup_timeout,
                    "drainGrace",
                    &T::drain_grace,
                    "cancelGrace",
                    &T::cancel_grace,
                    "stopGrace",
                    &T::stop_grace);
        };
    };

    struct config_file {
        std::map<std::string, file_server_entry> servers{};
        file_defaults defaults{};

        struct glaze {
            using T = config_file;
            static constexpr auto value = glz::object("mcpServers", &T::servers, "defaults", &T::defaults);
        };
    };

    static std::chrono::milliseconds require_duration(double seconds, std::string_view what) {
        auto ms = utils::seconds_to_ms(seconds);
        if (!ms || ms->count() == 0) {
            throw config_error{"{} must be a positive number of seconds (got {})"_format(what, seconds)};
        }
        return *ms;
    }

    static std::size_t require_concurrency(std::int64_t value, std::string_view what) {
        if (value <= 0) {
            throw config_error{"{} must be a positive integer (got {})"_format(what, value)};
        }
        return static_cast<std::size_t>(value);
    }

    static void apply_defaults(const file_defaults& defaults, runtime_config& cfg) {
        if (defaults.timeout) {
            cfg.default_timeout = require_duration(*defaults.timeout, "defaults.timeout"sv);
        }
        if (defaults.max_concurrency) {
            cfg.max_concurrency = require_concurrency(*defaults.max_concurrency, "defaults.maxConcurrency"sv);
        }
        if (defaults.startup_timeout) {
            cfg.startup_timeout = require_duration(*defaults.startup_timeout, "defaults.startupTimeout"sv);
        }
        if (defaults.drain_grace) {
            cfg.drain_grace = require_duration(*defaults.drain_grace, "defaults.drainGrace"sv);
        }
        if (defaults.cancel_grace) {
            cfg.cancel_grace = require_duration(*defaults.cancel_grace, "defaults.cancelGrace"sv);
        }
        if (defaults.stop_grace) {
            cfg.stop_grace = require_duration(*defaults.stop_grace, "defaults.stopGrace"sv);
        }
    }

    static server_spec make_spec(const std::string& name, file_server_entry&& entry) {
        if (name.empty()) {
            throw config_error{"mcpServers contains an entry with an empty name"};
        }
        if (utils::trim_view(entry.command).empty()) {
            throw config_error{"server '{}' has no command"_format(name)};
        }

        server_spec spec{};
        spec.name = name;
        spec.command = std::move(entry.command);
        spec.args = std::move(entry.args);
        if (entry.cwd && !entry.cwd->empty()) {
            spec.working_dir = std::filesystem::path{*entry.cwd};
        }
        spec.env = std::move(entry.env);
        if (entry.timeout) {
            spec.timeout = require_duration(*entry.timeout, "mcpServers.{}.timeout"_format(name));
        }
        if (entry.max_concurrency) {
            spec.max_concurrency =
                    require_concurrency(*entry.max_concurrency, "mcpServers.{}.maxConcurrency"_format(name));
        }
        return spec;
    }

}}  // namespace conduit::detail

namespace conduit {

    void parse_config(std::string_view json_text, runtime_config& cfg) {
        std::string buffer{json_text};
        detail::config_file file{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(file, buffer);
        if (ec) {
            throw config_error{"invalid config {}: {}"_format(cfg.config_path.string(), glz::format_error(ec, buffer))};
        }

        detail::apply_defaults(file.defaults, cfg);

        cfg.servers.clear();
        for (auto& [name, entry] : file.servers) {
            if (entry.disabled) {
                log_info{"skipping disabled server '", name, "'"};
                continue;
            }
            cfg.servers.push_back(detail::make_spec(name, std::move(entry)));
        }
        std::ranges::sort(cfg.servers, {}, &server_spec::name);
    }

    void load_config_file(runtime_config& cfg) {
        std::ifstream in{cfg.config_path};
        if (!in) {
            throw config_error{"could not open config file: {}"_format(cfg.config_path.string())};
        }
        std::string text{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
        parse_config(text, cfg);
        log_debug{"loaded ", cfg.servers.size(), " server(s) from ", cfg.config_path.string()};
    }

    std::optional<std::string> process_env(std::string_view name) {
        std::string key{name};
        if (const char* value = std::getenv(key.c_str()); value != nullptr) {
            return std::string{value};
        }
        return std::nullopt;
    }

    void apply_env_overrides(runtime_config& cfg, env_lookup lookup) {
        if (auto value = lookup(env_tool_timeout); value && !utils::trim_view(*value).empty()) {
            auto seconds = utils::parse_arithmetic<double>(*value);
            if (!seconds) {
                throw config_error{"{} must be a number of seconds (got '{}')"_format(env_tool_timeout, *value)};
            }
            cfg.default_timeout = detail::require_duration(*seconds, env_tool_timeout);
            log_debug{env_tool_timeout, " override: ", *seconds, "s"};
        }
        if (auto value = lookup(env_max_concurrency); value && !utils::trim_view(*value).empty()) {
            auto parsed = utils::parse_arithmetic<std::int64_t>(*value);
            if (!parsed) {
                throw config_error{"{} must be an integer (got '{}')"_format(env_max_concurrency, *value)};
            }
            cfg.max_concurrency = detail::require_concurrency(*parsed, env_max_concurrency);
            log_debug{env_max_concurrency, " override: ", *parsed};
        }
    }

    void apply_server_filter(runtime_config& cfg) {
        if (cfg.server_filter.empty()) {
            return;
        }
        std::set<std::string, std::less<>> wanted{cfg.server_filter.begin(), cfg.server_filter.end()};
        for (const auto& name : wanted) {
            if (std::ranges::find(cfg.servers, name, &server_spec::name) == cfg.servers.end()) {
                throw config_error{"server '{}' is not configured in {}"_format(name, cfg.config_path.string())};
            }
        }
        std::erase_if(cfg.servers, [&](const server_spec& spec) { return !wanted.contains(spec.name); });
    }

    std::string describe_config(const runtime_config& cfg) {
        std::ostringstream os{};
        os << "config=" << cfg.config_path.string() << '\n';
        os << "timeout=" << utils::ms_to_seconds(cfg.default_timeout) << "s\n";
        os << "max_concurrency=" << cfg.max_concurrency << '\n';
        os << "startup_timeout=" << utils::ms_to_seconds(cfg.startup_timeout) << "s\n";
        os << "drain_grace=" << utils::ms_to_seconds(cfg.drain_grace) << "s\n";
        os << "cancel_grace=" << utils::ms_to_seconds(cfg.cancel_grace) << "s\n";
        os << "stop_grace=" << utils::ms_to_seconds(cfg.stop_grace) << "s\n";
        os << "log_level=" << to_string(cfg.log_threshold) << '\n';
        for (const auto& spec : cfg.servers) {
            os << "server." << spec.name << "=" << spec.command;
            for (const auto& arg : spec.args) {
                os << ' ' << arg;
            }
            if (spec.timeout) {
                os << " [timeout=" << utils::ms_to_seconds(*spec.timeout) << "s]";
            }
            if (spec.max_concurrency) {
                os << " [max_concurrency=" << *spec.max_concurrency << "]";
            }
            os << '\n';
        }
        return os.str();
    }

}  // namespace conduit
