#pragma once

#include "log.hpp"
#include "utils.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace conduit {

    using namespace std::string_view_literals;
    using namespace std::chrono_literals;

    /*
     * Conduit Runtime Config Options
     *
     * Servers
     * - servers: One spec per enabled entry of the config file's "mcpServers" object.
     * - server_filter: Names selected with --server; empty means every configured server.
     *
     * Dispatch limits
     * - default_timeout: Wait-plus-execution budget for a tool call without its own timeout.
     * - max_concurrency: Global number of tool calls allowed in flight at once.
     *
     * Lifecycle
     * - startup_timeout: Budget for spawn + initialize handshake per server.
     * - drain_grace: Time in-flight calls get to finish once shutdown starts.
     * - cancel_grace: Time cancelled calls get to unwind before processes are stopped.
     * - stop_grace: Time a server gets to exit after SIGTERM before SIGKILL.
     *
     * Output
     * - log_threshold: Minimum level written to stderr.
     * - print_config: Print resolved config and exit.
     *
     * Per-server timeout/max_concurrency take precedence over the global values.
     * MCP_TOOL_TIMEOUT (seconds) and MCP_MAX_CONCURRENCY override the file; CLI flags
     * override both.
     */

    class config_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    struct server_spec {
        std::string name{};
        std::string command{};
        std::vector<std::string> args{};
        std::optional<std::filesystem::path> working_dir{};
        std::map<std::string, std::string> env{};
        std::optional<std::chrono::milliseconds> timeout{};
        std::optional<std::size_t> max_concurrency{};
    };

    struct runtime_config {
        std::filesystem::path config_path{"server_config.json"};
        std::vector<server_spec> servers{};
        std::vector<std::string> server_filter{};

        std::chrono::milliseconds default_timeout{120s};
        std::size_t max_concurrency{4U};

        std::chrono::milliseconds startup_timeout{30s};
        std::chrono::milliseconds drain_grace{2s};
        std::chrono::milliseconds cancel_grace{500ms};
        std::chrono::milliseconds stop_grace{3s};

        log_level log_threshold{log_level::warning};
        bool print_config{false};
    };

    inline constexpr auto env_tool_timeout = "MCP_TOOL_TIMEOUT"sv;
    inline constexpr auto env_max_concurrency = "MCP_MAX_CONCURRENCY"sv;

    // Parses config file text into cfg; servers are sorted by name
    void parse_config(std::string_view json_text, runtime_config& cfg);

    // Reads cfg.config_path and applies parse_config
    void load_config_file(runtime_config& cfg);

    // getenv is passed in so tests don't have to mutate the process environment
    using env_lookup = std::optional<std::string> (*)(std::string_view);
    std::optional<std::string> process_env(std::string_view name);
    void apply_env_overrides(runtime_config& cfg, env_lookup lookup = process_env);

    // Drops servers not named by cfg.server_filter; unknown names are a config_error
    void apply_server_filter(runtime_config& cfg);

    std::string describe_config(const runtime_config& cfg);

}  // namespace conduit
