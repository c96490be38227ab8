#include "conduit/dispatcher.hpp"

#include "conduit/format.hpp"
#include "conduit/log.hpp"
#include "conduit/utils.hpp"

#include "internal/protocol.hpp"

#include <utility>

using namespace conduit::literals;

namespace conduit { namespace detail {

    namespace protocol = internal::protocol;

    static std::chrono::milliseconds elapsed_since(steady_clock::time_point begin) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(steady_clock::now() - begin);
    }

    static tool_call_result failure(call_error kind, std::string message, steady_clock::time_point begin) {
        return {.error = kind, .message = std::move(message), .elapsed = elapsed_since(begin)};
    }

    // Maps a tools/call reply onto a call result
    static tool_call_result interpret_reply(
            const tool_call_request& request, rpc_reply reply, bool shutting_down, steady_clock::time_point begin) {
        auto target = "{}/{}"_format(request.server, request.tool);
        switch (reply.status) {
            case rpc_status::ok:
                break;
            case rpc_status::rpc_error:
                return failure(
                        call_error::tool_error,
                        "{} failed: {} (code {})"_format(target, reply.message, reply.error_code),
                        begin);
            case rpc_status::timed_out:
                return failure(call_error::timeout, "{} timed out"_format(target), begin);
            case rpc_status::cancelled:
                return failure(
                        call_error::shutting_down,
                        shutting_down ? "{} was cancelled by shutdown"_format(target)
                                      : "{} was cancelled by the caller"_format(target),
                        begin);
            case rpc_status::disconnected:
                return failure(call_error::server_unavailable, std::move(reply.message), begin);
        }

        tool_call_result out{.payload = std::move(reply.result)};
        protocol::tool_call_result parsed{};
        auto ec = glz::read<protocol::lenient>(parsed, out.payload);
        if (ec) {
            log_debug{target, " returned a result without MCP content"};
        }
        else {
            out.text = protocol::joined_text(parsed);
            if (parsed.isError) {
                out.error = call_error::tool_error;
                out.message = out.text.empty() ? "{} reported an error"_format(target) : out.text;
            }
        }
        out.elapsed = elapsed_since(begin);
        return out;
    }

}}  // namespace conduit::detail

namespace conduit {

    namespace protocol = internal::protocol;

    tool_dispatcher::tool_dispatcher(server_registry& registry, dispatch_limits limits)
            : registry_{registry}, limits_{limits}, global_pool_{limits.max_concurrency} {}

    bool tool_dispatcher::enter() {
        std::lock_guard lock{idle_mutex_};
        if (!accepting_) {
            return false;
        }
        ++in_flight_;
        return true;
    }

    void tool_dispatcher::leave() {
        {
            std::lock_guard lock{idle_mutex_};
            --in_flight_;
        }
        idle_cv_.notify_all();
    }

    slot_pool& tool_dispatcher::pool_for(const server_spec& spec) {
        if (!spec.max_concurrency) {
            return global_pool_;
        }
        std::lock_guard lock{pools_mutex_};
        auto& pool = server_pools_[spec.name];
        if (!pool) {
            pool = std::make_unique<slot_pool>(*spec.max_concurrency);
        }
        return *pool;
    }

    std::chrono::milliseconds tool_dispatcher::effective_timeout(
            const tool_call_request& request, const server_spec& spec) const {
        if (request.timeout) {
            return *request.timeout;
        }
        return spec.timeout.value_or(limits_.default_timeout);
    }

    tool_call_result tool_dispatcher::invoke(const tool_call_request& request) {
        auto begin = steady_clock::now();

        if (!enter()) {
            return detail::failure(call_error::shutting_down, "shutting down, call rejected", begin);
        }
        struct in_flight_guard {
            tool_dispatcher& self;
            ~in_flight_guard() { self.leave(); }
        } guard{*this};

        std::shared_ptr<server_handle> handle{};
        try {
            handle = registry_.get(request.server).lock();
        }
        catch (const not_found_error& e) {
            return detail::failure(call_error::not_found, e.what(), begin);
        }
        if (!handle) {
            return detail::failure(call_error::server_unavailable, "server '{}' is gone"_format(request.server), begin);
        }

        auto status = handle->status();
        if (status != server_status::ready) {
            auto reason = handle->last_error();
            return detail::failure(
                    call_error::server_unavailable,
                    reason.empty() ? "server '{}' is {}"_format(request.server, to_string(status))
                                   : "server '{}' is {}: {}"_format(request.server, to_string(status), reason),
                    begin);
        }

        // one token fires for a caller cancel or a global cancel
        std::stop_source call_stop{};
        auto forward_stop = [&call_stop] { call_stop.request_stop(); };
        std::stop_callback on_cancel_all{cancel_source_.get_token(), forward_stop};
        std::optional<std::stop_callback<decltype(forward_stop)>> on_caller_stop{};
        if (request.stop) {
            on_caller_stop.emplace(*request.stop, forward_stop);
        }

        // checked before a slot is taken; raw text goes into a single-line frame
        auto arguments = protocol::normalize_arguments(request.arguments);
        if (!arguments) {
            return detail::failure(
                    call_error::invalid_arguments,
                    "{}/{} arguments are not a JSON object"_format(request.server, request.tool),
                    begin);
        }

        auto timeout = effective_timeout(request, handle->spec());
        auto deadline = utils::deadline_after(begin, timeout);

        auto acquisition = pool_for(handle->spec()).acquire(deadline, call_stop.get_token());
        switch (acquisition.status) {
            case acquire_status::acquired:
                break;
            case acquire_status::timed_out:
                return detail::failure(
                        call_error::timeout,
                        "{}/{} timed out after {}ms waiting for a concurrency slot"_format(
                                request.server, request.tool, timeout.count()),
                        begin);
            case acquire_status::cancelled:
                return detail::failure(
                        call_error::shutting_down,
                        "{}/{} was cancelled{} waiting for a concurrency slot"_format(
                                request.server,
                                request.tool,
                                cancel_source_.stop_requested() ? " by shutdown"sv : " by the caller"sv),
                        begin);
        }

        log_debug{"dispatching ", request.server, "/", request.tool, " (timeout ", timeout.count(), "ms)"};

        protocol::tool_call_params params{.name = request.tool, .arguments = glz::raw_json{std::move(*arguments)}};
        auto reply = handle->request("tools/call", protocol::to_json(params), deadline, call_stop.get_token());
        acquisition.slot.release();

        auto result = detail::interpret_reply(request, std::move(reply), cancel_source_.stop_requested(), begin);
        if (result.error == call_error::server_unavailable) {
            // records the crash on the handle
            (void)handle->status();
        }
        if (result.error == call_error::timeout) {
            log_warn{request.server, "/", request.tool, " timed out after ", timeout.count(), "ms"};
        }
        else if (!result.ok()) {
            log_info{request.server, "/", request.tool, ": ", to_string(result.error), ": ", result.message};
        }
        return result;
    }

    void tool_dispatcher::stop_accepting() {
        std::lock_guard lock{idle_mutex_};
        accepting_ = false;
    }

    bool tool_dispatcher::accepting() const {
        std::lock_guard lock{idle_mutex_};
        return accepting_;
    }

    void tool_dispatcher::cancel_all() {
        if (cancel_source_.request_stop()) {
            log_info{"cancelling ", in_flight(), " in-flight tool calls"};
        }
    }

    bool tool_dispatcher::wait_idle(std::chrono::milliseconds timeout, std::stop_token stop) {
        std::unique_lock lock{idle_mutex_};
        return idle_cv_.wait_for(lock, stop, timeout, [this] { return in_flight_ == 0; });
    }

    std::size_t tool_dispatcher::in_flight() const {
        std::lock_guard lock{idle_mutex_};
        return in_flight_;
    }

}  // namespace conduit
