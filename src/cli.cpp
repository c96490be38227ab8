#include "conduit/cli.hpp"

#include "conduit/format.hpp"
#include "conduit/log.hpp"
#include "conduit/utils.hpp"

#include "internal/protocol.hpp"

#include <glaze/glaze.hpp>

extern "C" {
#include <signal.h>
#include <string.h>
}

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <future>
#include <iostream>
#include <iterator>
#include <set>
#include <sstream>
#include <stdexcept>

using namespace conduit::literals;

namespace conduit::cli { namespace detail {

    namespace fs = std::filesystem;
    using namespace std::string_literals;

    struct batch_entry {
        std::string server{};
        std::string tool{};
        std::optional<glz::raw_json> arguments{};
        std::optional<double> timeout{};
        struct glaze {
            using T = batch_entry;
            static constexpr auto value = glz::object(&T::server, &T::tool, &T::arguments, &T::timeout);
        };
    };

    struct batch_output_record {
        std::string server{};
        std::string tool{};
        bool ok{false};
        std::string error{};
        std::string message{};
        std::string text{};
        glz::raw_json result{"null"};
        std::int64_t elapsed_ms{0};
        struct glaze {
            using T = batch_output_record;
            static constexpr auto value = glz::object(
                    &T::server,
                    &T::tool,
                    &T::ok,
                    &T::error,
                    &T::message,
                    &T::text,
                    &T::result,
                    "elapsedMs",
                    &T::elapsed_ms);
        };
    };

    struct tool_output_record {
        std::string server{};
        std::string name{};
        std::string description{};
        glz::raw_json input_schema{"{}"};
        struct glaze {
            using T = tool_output_record;
            static constexpr auto value =
                    glz::object(&T::server, &T::name, &T::description, "inputSchema", &T::input_schema);
        };
    };

    static std::string read_text_file(const fs::path& path) {
        std::ifstream in{path};
        if (!in) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        std::stringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    static std::string read_batch_source(std::string_view source) {
        if (source == "-"sv) {
            return std::string{std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{}};
        }
        return read_text_file(fs::path{source});
    }

    template <typename T>
    static void write_json_line(const T& value, std::ostream& os) {
        std::string json{};
        auto ec = glz::write_json(value, json);
        if (ec) {
            throw std::runtime_error("failed to serialize json output");
        }
        os << json << '\n';
    }

    static void print_text_block(std::string_view text, std::ostream& os) {
        os << text;
        if (!text.ends_with('\n')) {
            os << '\n';
        }
    }

    static void print_servers(const std::vector<server_snapshot>& servers, std::ostream& os) {
        if (servers.empty()) {
            os << "no servers configured\n";
            return;
        }
        os << "{:<20} {:<9} {:>8} {:>6}  {}\n"_format("name", "status", "pid", "tools", "detail");
        for (const auto& s : servers) {
            auto note = s.last_error.empty() ? s.server_name : s.last_error;
            os << "{:<20} {:<9} {:>8} {:>6}  {}\n"_format(
                    s.name, to_string(s.status), s.pid > 0 ? std::to_string(s.pid) : "-"s, s.tool_count, note);
        }
    }

    // First server (by name) to expose a tool name wins
    static std::vector<tool_output_record> unique_tools(const server_registry& registry) {
        std::vector<tool_output_record> out{};
        std::set<std::string, std::less<>> seen{};
        for (const auto& snapshot : registry.list()) {
            if (snapshot.status != server_status::ready) {
                continue;
            }
            auto handle = registry.get(snapshot.name).lock();
            if (!handle) {
                continue;
            }
            for (auto& tool : handle->tools()) {
                if (!seen.insert(tool.name).second) {
                    log_debug{"tool '", tool.name, "' from '", snapshot.name, "' shadowed by an earlier server"};
                    continue;
                }
                out.push_back(
                        {.server = snapshot.name,
                         .name = std::move(tool.name),
                         .description = std::move(tool.description),
                         .input_schema = glz::raw_json{tool.input_schema.empty() ? "{}"s : tool.input_schema}});
            }
        }
        return out;
    }

    static int run_servers(runtime& rt, std::ostream& out) {
        auto failures = rt.start_servers();
        print_servers(rt.registry().list(), out);
        return failures.empty() ? exit_ok : exit_failure;
    }

    static int run_tools(runtime& rt, const command_options& cmd, std::ostream& out) {
        (void)rt.start_servers();
        auto tools = unique_tools(rt.registry());

        if (cmd.json) {
            write_json_line(tools, out);
            return exit_ok;
        }

        if (tools.empty()) {
            out << "no tools available from any server\n";
            return exit_ok;
        }
        out << "{:<20} {:<28} {}\n"_format("server", "tool", "description");
        for (const auto& tool : tools) {
            auto description = tool.description.substr(0, tool.description.find('\n'));
            out << "{:<20} {:<28} {}\n"_format(tool.server, tool.name, description);
        }
        out << "total tools: {}\n"_format(tools.size());
        return exit_ok;
    }

    static int run_ping(runtime& rt, const command_options& cmd, std::ostream& out) {
        (void)rt.start_servers();
        auto timeout = cmd.timeout.value_or(default_ping_timeout);

        auto names = rt.registry().names();
        if (names.empty()) {
            out << "no servers to ping\n";
            return exit_failure;
        }

        std::vector<std::future<ping_result>> pending{};
        pending.reserve(names.size());
        for (const auto& name : names) {
            pending.push_back(std::async(
                    std::launch::async, [&rt, &name, timeout] { return rt.registry().ping(name, timeout); }));
        }

        int code = exit_ok;
        for (auto& f : pending) {
            auto result = f.get();
            if (result.ok) {
                out << "{:<20} ok      {:>9.2f} ms\n"_format(
                        result.name, static_cast<double>(result.latency.count()) / 1000.0);
            }
            else {
                out << "{:<20} FAILED  {}\n"_format(result.name, result.message);
                code = exit_failure;
            }
        }
        return code;
    }

    static int run_call(runtime& rt, const command_options& cmd, std::ostream& out, std::ostream& err) {
        (void)rt.start_servers();

        tool_call_request request{
                .server = cmd.server, .tool = cmd.tool, .arguments = cmd.arguments, .timeout = cmd.timeout};
        auto result = rt.dispatcher().invoke(request);
        if (!result.ok()) {
            err << "error ({}): {}\n"_format(to_string(result.error), result.message);
            if (!result.text.empty()) {
                print_text_block(result.text, out);
            }
            return exit_failure;
        }

        print_text_block(result.text.empty() ? result.payload : result.text, out);
        log_info{cmd.server, "/", cmd.tool, " completed in ", result.elapsed.count(), "ms"};
        return exit_ok;
    }

    static int run_batch(runtime& rt, const command_options& cmd, std::ostream& out) {
        auto requests = parse_batch(read_batch_source(cmd.batch_source));
        (void)rt.start_servers();

        // no more callers than the dispatcher has slots; the rest would only queue on them
        std::vector<tool_call_result> results(requests.size());
        std::atomic<std::size_t> next{0};
        auto workers = std::max<std::size_t>(std::min(rt.config().max_concurrency, requests.size()), 1U);

        std::vector<std::future<void>> pending{};
        pending.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            pending.push_back(std::async(std::launch::async, [&rt, &requests, &results, &next] {
                for (auto i = next.fetch_add(1); i < requests.size(); i = next.fetch_add(1)) {
                    results[i] = rt.dispatcher().invoke(requests[i]);
                }
            }));
        }
        for (auto& f : pending) {
            f.get();
        }

        std::vector<batch_output_record> records{};
        records.reserve(requests.size());
        int code = exit_ok;
        for (std::size_t i = 0; i < results.size(); ++i) {
            auto& result = results[i];
            if (!result.ok()) {
                code = exit_failure;
            }
            records.push_back(
                    {.server = requests[i].server,
                     .tool = requests[i].tool,
                     .ok = result.ok(),
                     .error = std::string{to_string(result.error)},
                     .message = std::move(result.message),
                     .text = std::move(result.text),
                     .result = glz::raw_json{result.payload.empty() ? "null"s : std::move(result.payload)},
                     .elapsed_ms = result.elapsed.count()});
        }
        write_json_line(records, out);
        return code;
    }

    static sigset_t shutdown_signal_set() {
        sigset_t set{};
        ::sigemptyset(&set);
        ::sigaddset(&set, SIGINT);
        ::sigaddset(&set, SIGTERM);
        return set;
    }

    // Accepts either a server name or its position in the sorted server list
    static std::string resolve_ping_target(const runtime_config& cfg, const std::string& target) {
        if (auto index = utils::parse_arithmetic<std::size_t>(target); index && *index < cfg.servers.size()) {
            return cfg.servers[*index].name;
        }
        return target;
    }

}}  // namespace conduit::cli::detail

namespace conduit::cli {

    std::vector<tool_call_request> parse_batch(std::string_view json_text) {
        std::vector<detail::batch_entry> entries{};
        std::string buffer{json_text};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(entries, buffer);
        if (ec) {
            throw config_error{"invalid batch: {}"_format(glz::format_error(ec, buffer))};
        }

        std::vector<tool_call_request> requests{};
        requests.reserve(entries.size());
        for (std::size_t i = 0; i < entries.size(); ++i) {
            auto& entry = entries[i];
            if (entry.server.empty() || entry.tool.empty()) {
                throw config_error{"batch entry {}: 'server' and 'tool' are required"_format(i)};
            }

            tool_call_request request{.server = std::move(entry.server), .tool = std::move(entry.tool)};
            if (entry.arguments) {
                auto arguments = internal::protocol::normalize_arguments(entry.arguments->str);
                if (!arguments) {
                    throw config_error{"batch entry {}: 'arguments' must be a JSON object"_format(i)};
                }
                request.arguments = std::move(*arguments);
            }
            if (entry.timeout) {
                request.timeout = utils::seconds_to_ms(*entry.timeout);
                if (!request.timeout) {
                    throw config_error{"batch entry {}: timeout must be positive and at most a year"_format(i)};
                }
            }
            requests.push_back(std::move(request));
        }
        return requests;
    }

    void select_servers(runtime_config& cfg, const command_options& cmd) {
        switch (cmd.kind) {
            case command_kind::call: {
                // an unconfigured name is left for the dispatcher to report as not_found
                std::erase_if(cfg.servers, [&](const server_spec& s) { return s.name != cmd.server; });
                break;
            }
            case command_kind::ping: {
                if (cmd.targets.empty()) {
                    break;
                }
                cfg.server_filter.clear();
                for (const auto& target : cmd.targets) {
                    cfg.server_filter.push_back(detail::resolve_ping_target(cfg, target));
                }
                apply_server_filter(cfg);
                break;
            }
            case command_kind::servers:
            case command_kind::tools:
            case command_kind::batch:
                break;
        }
    }

    int run_command(runtime& rt, const command_options& cmd, std::ostream& out, std::ostream& err) {
        log_debug{"running '", to_string(cmd.kind), "' with ", rt.config().servers.size(), " servers"};
        switch (cmd.kind) {
            case command_kind::servers:
                return detail::run_servers(rt, out);
            case command_kind::tools:
                return detail::run_tools(rt, cmd, out);
            case command_kind::ping:
                return detail::run_ping(rt, cmd, out);
            case command_kind::call:
                return detail::run_call(rt, cmd, out, err);
            case command_kind::batch:
                return detail::run_batch(rt, cmd, out);
        }
        return exit_usage;
    }

    // ── signals ────────────────────────────────────────────────────

    void block_shutdown_signals() {
        auto set = detail::shutdown_signal_set();
        if (int rc = ::pthread_sigmask(SIG_BLOCK, &set, nullptr); rc != 0) {
            throw std::runtime_error("failed to block shutdown signals: {}"_format(std::strerror(rc)));
        }
        ::signal(SIGPIPE, SIG_IGN);
    }

    signal_watcher::signal_watcher(std::function<void()> on_signal)
            : on_signal_{std::move(on_signal)}, thread_{[this](std::stop_token stop) { watch(stop); }} {}

    signal_watcher::~signal_watcher() {
        thread_.request_stop();
    }

    int signal_watcher::signals_seen() const {
        return seen_.load();
    }

    void signal_watcher::watch(std::stop_token stop) {
        auto set = detail::shutdown_signal_set();
        timespec slice{.tv_sec = 0, .tv_nsec = 100'000'000};

        while (!stop.stop_requested()) {
            int sig = ::sigtimedwait(&set, nullptr, &slice);
            if (sig < 0) {
                if (errno == EAGAIN || errno == EINTR) {
                    continue;
                }
                log_error{"sigtimedwait failed: ", std::strerror(errno)};
                return;
            }

            auto count = seen_.fetch_add(1) + 1;
            if (count == 1) {
                log_warn{"received ", ::strsignal(sig), ", shutting down"};
            }
            else {
                log_warn{"received ", ::strsignal(sig), " again, forcing shutdown"};
            }
            if (on_signal_) {
                on_signal_();
            }
        }
    }

    int execute(runtime_config cfg, const command_options& cmd) {
        block_shutdown_signals();
        select_servers(cfg, cmd);

        runtime rt{std::move(cfg)};
        signal_watcher watcher{[&rt] { rt.coordinator().initiate_shutdown(); }};

        int code = run_command(rt, cmd, std::cout, std::cerr);
        std::cout.flush();

        rt.coordinator().run();
        return watcher.signals_seen() > 0 ? exit_interrupted : code;
    }

}  // namespace conduit::cli
