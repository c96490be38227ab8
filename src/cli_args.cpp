#include "conduit/cli.hpp"
#include "conduit/log.hpp"
#include "conduit/utils.hpp"

#include "internal/protocol.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace conduit::cli {

    namespace detail {

        using namespace std::string_view_literals;

        static constexpr auto version_string = "conduit 0.1.0"sv;

        static bool apply_timeout_arg(
                std::optional<double> seconds, std::optional<std::chrono::milliseconds>& target, std::string_view flag) {
            if (!seconds) {
                return true;
            }
            target = utils::seconds_to_ms(*seconds);
            if (!target) {
                std::cerr << "invalid " << flag << " value: " << *seconds
                          << " (expected seconds > 0, at most a year)\n";
                return false;
            }
            return true;
        }

    }  // namespace detail

    std::optional<int> parse_cli(
            int argc, const char* const* argv, runtime_config& cfg, command_options& cmd, env_lookup lookup) {
        CLI::App app{"conduit: MCP server process manager"};
        app.require_subcommand(0, 1);

        bool show_version = false;
        bool quiet = false;
        bool verbose = false;
        std::string config_arg{cfg.config_path.string()};
        std::string log_level_arg{std::string{to_string(cfg.log_threshold)}};
        std::optional<double> timeout_arg{};
        std::optional<std::size_t> concurrency_arg{};
        std::vector<std::string> server_args{};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("-c,--config", config_arg, "Server configuration file");
        app.add_option("-s,--server", server_args, "Only manage this server (repeatable)");
        app.add_option("--timeout", timeout_arg, "Default tool call timeout in seconds");
        app.add_option("--max-concurrency", concurrency_arg, "Maximum tool calls in flight");
        app.add_option("--log-level", log_level_arg, "Log level: debug|info|warning|error|off");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("-q,--quiet", quiet, "Only log errors");
        app.add_flag("-v,--verbose", verbose, "Log everything, including server stderr");

        auto* servers_cmd = app.add_subcommand("servers", "Start configured servers and show their status");

        auto* tools_cmd = app.add_subcommand("tools", "List the tools exposed by all servers");
        tools_cmd->add_flag("--json", cmd.json, "Print tool definitions as JSON");

        std::optional<double> ping_timeout_arg{};
        auto* ping_cmd = app.add_subcommand("ping", "Measure round-trip latency to servers");
        ping_cmd->add_option("targets", cmd.targets, "Server names or indices (default: all)");
        ping_cmd->add_option("--timeout", ping_timeout_arg, "Seconds to wait per server");

        std::optional<double> call_timeout_arg{};
        auto* call_cmd = app.add_subcommand("call", "Invoke one tool");
        call_cmd->add_option("server", cmd.server, "Server name")->required();
        call_cmd->add_option("tool", cmd.tool, "Tool name")->required();
        call_cmd->add_option("-a,--args", cmd.arguments, "Arguments as a JSON object");
        call_cmd->add_option("--timeout", call_timeout_arg, "Seconds to allow for this call");

        auto* batch_cmd = app.add_subcommand("batch", "Run a JSON array of tool calls concurrently");
        batch_cmd->add_option("source", cmd.batch_source, "Batch file, or - for stdin")->required();

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << detail::version_string << '\n';
            return std::optional<int>{exit_ok};
        }

        if (quiet && verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{exit_usage};
        }
        if (!try_parse_log_level(log_level_arg, cfg.log_threshold)) {
            std::cerr << "invalid --log-level value: " << log_level_arg << " (expected debug|info|warning|error|off)\n";
            return std::optional<int>{exit_usage};
        }
        if (quiet) {
            cfg.log_threshold = log_level::error;
        }
        if (verbose) {
            cfg.log_threshold = log_level::debug;
        }
        set_log_threshold(cfg.log_threshold);

        std::optional<std::chrono::milliseconds> timeout{};
        if (!detail::apply_timeout_arg(timeout_arg, timeout, "--timeout") ||
            !detail::apply_timeout_arg(ping_timeout_arg, cmd.timeout, "ping --timeout") ||
            !detail::apply_timeout_arg(call_timeout_arg, cmd.timeout, "call --timeout")) {
            return std::optional<int>{exit_usage};
        }
        if (concurrency_arg && *concurrency_arg == 0U) {
            std::cerr << "invalid --max-concurrency value: 0 (expected at least 1)\n";
            return std::optional<int>{exit_usage};
        }
        if (call_cmd->parsed()) {
            auto arguments = internal::protocol::normalize_arguments(cmd.arguments);
            if (!arguments) {
                std::cerr << "invalid --args value: expected a JSON object\n";
                return std::optional<int>{exit_usage};
            }
            cmd.arguments = std::move(*arguments);
        }

        if (!cfg.print_config && app.get_subcommands().empty()) {
            std::cerr << app.help();
            return std::optional<int>{exit_usage};
        }

        // file < environment < flags
        cfg.config_path = config_arg;
        load_config_file(cfg);
        apply_env_overrides(cfg, lookup);
        if (timeout) {
            cfg.default_timeout = *timeout;
        }
        if (concurrency_arg) {
            cfg.max_concurrency = *concurrency_arg;
        }
        cfg.server_filter = server_args;
        apply_server_filter(cfg);

        if (cfg.print_config) {
            std::cout << describe_config(cfg);
            return std::optional<int>{exit_ok};
        }

        if (servers_cmd->parsed()) {
            cmd.kind = command_kind::servers;
        }
        else if (tools_cmd->parsed()) {
            cmd.kind = command_kind::tools;
        }
        else if (ping_cmd->parsed()) {
            cmd.kind = command_kind::ping;
        }
        else if (call_cmd->parsed()) {
            cmd.kind = command_kind::call;
        }
        else if (batch_cmd->parsed()) {
            cmd.kind = command_kind::batch;
        }

        return std::nullopt;
    }

}  // namespace conduit::cli
