#include "conduit/registry.hpp"

#include "conduit/format.hpp"
#include "conduit/log.hpp"
#include "conduit/utils.hpp"

#include "internal/protocol.hpp"

#include <future>
#include <utility>

using namespace conduit::literals;

namespace conduit { namespace detail {

    namespace protocol = internal::protocol;

    // Guards against servers that hand back the same cursor forever
    static constexpr std::size_t max_tool_pages = 64;

    static std::string describe_failure(const rpc_reply& reply) {
        if (reply.status == rpc_status::rpc_error) {
            return "{} (code {})"_format(reply.message, reply.error_code);
        }
        return reply.message.empty() ? std::string{to_string(reply.status)} : reply.message;
    }

}}  // namespace conduit::detail

namespace conduit {

    namespace protocol = internal::protocol;

    // ── server_handle ──────────────────────────────────────────────

    server_handle::server_handle(server_spec spec) : spec_{std::move(spec)} {}

    bool server_handle::transition(server_status from, server_status to) const {
        return status_.compare_exchange_strong(from, to);
    }

    bool server_handle::fail(std::string message) const {
        std::lock_guard lock{info_mutex_};
        if (!transition(server_status::starting, server_status::failed)) {
            return false;
        }
        last_error_ = std::move(message);
        return true;
    }

    std::shared_ptr<tool_session> server_handle::session() const {
        std::lock_guard lock{info_mutex_};
        return session_;
    }

    server_status server_handle::status() const {
        auto current = status_.load();
        if (current != server_status::ready) {
            return current;
        }

        auto s = session();
        if (s && !s->alive() && transition(server_status::ready, server_status::failed)) {
            auto code = s->exit_status();
            auto message = code ? "server exited unexpectedly (status {})"_format(*code)
                                : std::string{"server closed its output unexpectedly"};
            log_warn{"server '", name(), "': ", message};
            std::lock_guard lock{info_mutex_};
            last_error_ = std::move(message);
        }
        return status_.load();
    }

    pid_t server_handle::pid() const {
        auto s = session();
        return s ? s->pid() : -1;
    }

    std::optional<int> server_handle::exit_status() const {
        auto s = session();
        return s ? s->exit_status() : std::nullopt;
    }

    std::string server_handle::last_error() const {
        std::lock_guard lock{info_mutex_};
        return last_error_;
    }

    std::string server_handle::server_name() const {
        std::lock_guard lock{info_mutex_};
        return server_name_;
    }

    std::string server_handle::server_version() const {
        std::lock_guard lock{info_mutex_};
        return server_version_;
    }

    std::vector<tool_info> server_handle::tools() const {
        std::lock_guard lock{info_mutex_};
        return tools_;
    }

    rpc_reply server_handle::request(
            std::string_view method,
            std::string params_json,
            steady_clock::time_point deadline,
            std::stop_token stop) const {
        auto current = status();
        auto s = session();
        if (current != server_status::ready || !s) {
            return {.status = rpc_status::disconnected,
                    .message = "server '{}' is {}"_format(name(), to_string(current))};
        }
        return s->request(method, std::move(params_json), deadline, std::move(stop));
    }

    // ── server_registry ────────────────────────────────────────────

    server_registry::server_registry(std::chrono::milliseconds startup_timeout, session_launcher launcher)
            : startup_timeout_{startup_timeout}, launcher_{std::move(launcher)} {}

    server_registry::~server_registry() {
        stop_all(std::chrono::milliseconds{0});
    }

    server_ref server_registry::start(const server_spec& spec) {
        if (closed_.load()) {
            throw launch_error{"cannot start '{}': registry is shutting down"_format(spec.name)};
        }

        auto handle = std::make_shared<server_handle>(spec);
        std::shared_ptr<server_handle> previous{};
        {
            std::unique_lock lock{table_mutex_};
            if (auto it = table_.find(spec.name); it != table_.end()) {
                auto current = it->second->status();
                if (current == server_status::starting || current == server_status::ready) {
                    throw launch_error{"server '{}' is already {}"_format(spec.name, to_string(current))};
                }
                previous = std::exchange(it->second, handle);
            }
            else {
                table_.emplace(spec.name, handle);
            }
        }

        // a replaced failed handle may still own an unreaped process
        if (previous) {
            stop(*previous, std::chrono::milliseconds{0});
        }

        // stop_all aborts every start, stop() aborts just this one
        std::stop_callback abort_on_close{
                starts_stop_.get_token(), [&handle] { handle->start_abort_.request_stop(); }};

        std::lock_guard lifecycle{handle->lifecycle_mutex_};
        if (handle->status_.load() != server_status::starting) {
            throw launch_error{"server '{}' was stopped before it launched"_format(spec.name)};
        }
        log_debug{"starting '", spec.name, "': ", spec.command, " ",
                  utils::join_with_separator(spec.args, " ")};

        std::shared_ptr<tool_session> session{};
        try {
            session = launcher_(spec);
        }
        catch (const std::exception& e) {
            handle->fail(e.what());
            log_error{"failed to launch '", spec.name, "': ", e.what()};
            throw launch_error{"failed to launch '{}': {}"_format(spec.name, e.what())};
        }
        if (!session) {
            handle->fail("launcher returned no session");
            throw launch_error{"failed to launch '{}': launcher returned no session"_format(spec.name)};
        }

        {
            std::lock_guard lock{handle->info_mutex_};
            handle->session_ = session;
        }

        auto abandon = [&](std::string message) {
            session->terminate(std::chrono::milliseconds{0}, {});
            if (!handle->fail(message)) {
                message = "server '{}' was stopped while starting"_format(spec.name);
            }
            log_error{message};
            throw launch_error{message};
        };

        auto deadline = utils::deadline_after(steady_clock::now(), startup_timeout_);
        try {
            handshake(*handle, *session, deadline);
            discover_tools(*handle, *session, deadline);
        }
        catch (const launch_error& e) {
            abandon(e.what());
        }
        catch (const std::exception& e) {
            abandon("starting '{}' failed: {}"_format(spec.name, e.what()));
        }

        if (!handle->transition(server_status::starting, server_status::ready)) {
            session->terminate(std::chrono::milliseconds{0}, {});
            throw launch_error{"server '{}' was stopped while starting"_format(spec.name)};
        }
        log_info{"server '", spec.name, "' ready (pid ", session->pid(), ", ", handle->tools().size(), " tools)"};
        return handle;
    }

    void server_registry::handshake(server_handle& handle, tool_session& session, steady_clock::time_point deadline) {
        auto reply = session.request(
                "initialize",
                protocol::to_json(protocol::initialize_params{}),
                deadline,
                handle.start_abort_.get_token());
        if (!reply.ok()) {
            throw launch_error{
                    "initialize handshake with '{}' failed: {}"_format(handle.name(), detail::describe_failure(reply))};
        }

        protocol::initialize_result result{};
        auto ec = glz::read<protocol::lenient>(result, reply.result);
        if (ec) {
            throw launch_error{"'{}' sent a malformed initialize result"_format(handle.name())};
        }
        if (result.protocolVersion != protocol::mcp_protocol_version) {
            log_info{"server '", handle.name(), "' negotiated protocol ", result.protocolVersion};
        }

        {
            std::lock_guard lock{handle.info_mutex_};
            handle.server_name_ = std::move(result.serverInfo.name);
            handle.server_version_ = std::move(result.serverInfo.version);
        }

        if (!session.notify("notifications/initialized", "{}")) {
            throw launch_error{"could not confirm initialization with '{}'"_format(handle.name())};
        }
    }

    void server_registry::discover_tools(
            server_handle& handle, tool_session& session, steady_clock::time_point deadline) {
        std::vector<tool_info> tools{};
        std::optional<std::string> cursor{};

        for (std::size_t page = 0; page < max_tool_pages; ++page) {
            auto reply = session.request(
                    "tools/list",
                    protocol::to_json(protocol::tools_list_params{.cursor = cursor}),
                    deadline,
                    handle.start_abort_.get_token());

            // servers without the tools capability
            if (reply.status == rpc_status::rpc_error &&
                reply.error_code == static_cast<int>(glz::rpc::error_e::method_not_found)) {
                log_debug{"server '", handle.name(), "' does not list tools"};
                break;
            }
            if (!reply.ok()) {
                if (reply.status == rpc_status::cancelled || reply.status == rpc_status::disconnected) {
                    throw launch_error{"tool discovery on '{}' failed: {}"_format(
                            handle.name(), detail::describe_failure(reply))};
                }
                log_warn{"tools/list on '", handle.name(), "' failed: ", detail::describe_failure(reply)};
                break;
            }

            protocol::tools_list_result result{};
            auto ec = glz::read<protocol::lenient>(result, reply.result);
            if (ec) {
                log_warn{"'", handle.name(), "' sent a malformed tools/list result"};
                break;
            }
            for (auto& tool : result.tools) {
                tools.push_back(
                        {.name = std::move(tool.name),
                         .description = std::move(tool.description),
                         .input_schema = std::move(tool.inputSchema.str)});
            }

            if (!result.nextCursor || result.nextCursor->empty() || result.nextCursor == cursor) {
                break;
            }
            cursor = std::move(result.nextCursor);
        }

        std::lock_guard lock{handle.info_mutex_};
        handle.tools_ = std::move(tools);
    }

    std::vector<launch_failure> server_registry::start_all(const std::vector<server_spec>& specs) {
        std::vector<std::future<void>> pending{};
        pending.reserve(specs.size());
        for (const auto& spec : specs) {
            pending.push_back(std::async(std::launch::async, [this, &spec] { (void)start(spec); }));
        }

        std::vector<launch_failure> failures{};
        for (std::size_t i = 0; i < pending.size(); ++i) {
            try {
                pending[i].get();
            }
            catch (const std::exception& e) {
                failures.push_back({.name = specs[i].name, .message = e.what()});
            }
        }
        return failures;
    }

    void server_registry::stop(std::string_view name, std::chrono::milliseconds grace, std::stop_token force) {
        auto handle = get(name).lock();
        if (handle) {
            stop(*handle, grace, std::move(force));
        }
    }

    void server_registry::stop(server_handle& handle, std::chrono::milliseconds grace, std::stop_token force) {
        // a start in progress is abandoned, not waited out: its handshake is cancelled and
        // start() sees the handle already stopped
        bool abandoned = handle.transition(server_status::starting, server_status::stopped);
        handle.start_abort_.request_stop();

        std::lock_guard lifecycle{handle.lifecycle_mutex_};
        bool stopping = abandoned;
        if (!abandoned) {
            auto current = handle.status();
            if (current == server_status::stopped) {
                return;
            }
            // marked first so the exit we cause is not mistaken for a crash
            stopping = current == server_status::ready &&
                       handle.transition(server_status::ready, server_status::stopped);
        }

        auto session = handle.session();
        if (session) {
            session->terminate(grace, std::move(force));
        }
        if (stopping) {
            log_info{"server '", handle.name(), "' stopped"};
        }
    }

    void server_registry::stop_all(std::chrono::milliseconds grace, std::stop_token force) {
        closed_.store(true);
        starts_stop_.request_stop();

        std::vector<std::shared_ptr<server_handle>> handles{};
        {
            std::shared_lock lock{table_mutex_};
            for (const auto& [name, handle] : table_) {
                handles.push_back(handle);
            }
        }

        std::vector<std::future<void>> pending{};
        pending.reserve(handles.size());
        for (auto& handle : handles) {
            pending.push_back(std::async(std::launch::async, [this, &handle, grace, force] { stop(*handle, grace, force); }));
        }
        for (std::size_t i = 0; i < pending.size(); ++i) {
            try {
                pending[i].get();
            }
            catch (const std::exception& e) {
                log_error{"stopping '", handles[i]->name(), "' failed: ", e.what()};
            }
        }
    }

    server_ref server_registry::get(std::string_view name) const {
        std::shared_lock lock{table_mutex_};
        auto it = table_.find(name);
        if (it == table_.end()) {
            throw not_found_error{"unknown server '{}'"_format(name)};
        }
        return it->second;
    }

    bool server_registry::contains(std::string_view name) const {
        std::shared_lock lock{table_mutex_};
        return table_.find(name) != table_.end();
    }

    std::vector<server_snapshot> server_registry::list() const {
        std::vector<std::shared_ptr<server_handle>> handles{};
        {
            std::shared_lock lock{table_mutex_};
            for (const auto& [name, handle] : table_) {
                handles.push_back(handle);
            }
        }

        std::vector<server_snapshot> out{};
        out.reserve(handles.size());
        for (const auto& handle : handles) {
            out.push_back(
                    {.name = handle->name(),
                     .status = handle->status(),
                     .pid = handle->pid(),
                     .tool_count = handle->tools().size(),
                     .server_name = handle->server_name(),
                     .last_error = handle->last_error()});
        }
        return out;
    }

    std::vector<std::string> server_registry::names() const {
        std::shared_lock lock{table_mutex_};
        std::vector<std::string> out{};
        out.reserve(table_.size());
        for (const auto& [name, handle] : table_) {
            out.push_back(name);
        }
        return out;
    }

    ping_result server_registry::ping(std::string_view name, std::chrono::milliseconds timeout) const {
        ping_result out{.name = std::string{name}};
        auto handle = get(name).lock();
        if (!handle) {
            out.message = "server is gone";
            return out;
        }

        auto begin = steady_clock::now();
        auto reply = handle->request("ping", "{}", utils::deadline_after(begin, timeout), {});
        out.latency = std::chrono::duration_cast<std::chrono::microseconds>(steady_clock::now() - begin);
        out.ok = reply.ok();
        if (!out.ok) {
            out.message = detail::describe_failure(reply);
        }
        return out;
    }

}  // namespace conduit
