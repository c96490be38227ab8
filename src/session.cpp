#include "conduit/session.hpp"

#include "conduit/format.hpp"
#include "conduit/log.hpp"

#include "internal/process.hpp"
#include "internal/protocol.hpp"

extern "C" {
#include <poll.h>
#include <unistd.h>
}

#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <variant>

using namespace conduit::literals;

namespace conduit { namespace detail {

    namespace protocol = internal::protocol;

    static constexpr int pump_poll_ms = 100;
    static constexpr auto notify_write_budget = std::chrono::seconds{1};
    // a request that already gave up holds its concurrency slot while this runs
    static constexpr auto cancel_write_budget = std::chrono::milliseconds{50};

    // Splits complete lines off the front of `buffer`, leaving a trailing partial line
    template <typename F>
    static void consume_lines(std::string& buffer, F&& on_line) {
        std::string::size_type start = 0;
        for (;;) {
            auto pos = buffer.find('\n', start);
            if (pos == std::string::npos) {
                break;
            }
            std::string_view line{buffer.data() + start, pos - start};
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            if (!line.empty()) {
                on_line(line);
            }
            start = pos + 1;
        }
        buffer.erase(0, start);
    }

    class stdio_session final : public tool_session {
      public:
        explicit stdio_session(const server_spec& spec)
                : name_{spec.name}, child_{spec}, pump_{[this](std::stop_token stop) { pump(stop); }} {}

        ~stdio_session() override { terminate(std::chrono::milliseconds{0}, {}); }

        rpc_reply request(
                std::string_view method,
                std::string params_json,
                steady_clock::time_point deadline,
                std::stop_token stop) override {
            if (!connected_.load()) {
                return {.status = rpc_status::disconnected, .message = "server '{}' is not connected"_format(name_)};
            }

            auto id = next_id_.fetch_add(1);
            {
                std::lock_guard lock{pending_mutex_};
                pending_.emplace(id, std::nullopt);
            }

            glz::rpc::request_t<glz::raw_json> frame{};
            frame.id = id;
            frame.method = method;
            frame.params = glz::raw_json{std::move(params_json)};
            auto line = protocol::to_json(frame);
            line.push_back('\n');

            if (!child_.write_all(line, deadline)) {
                std::lock_guard lock{pending_mutex_};
                pending_.erase(id);
                if (!connected_.load()) {
                    return {.status = rpc_status::disconnected,
                            .message = "server '{}' closed its input"_format(name_)};
                }
                return {.status = rpc_status::timed_out,
                        .message = "timed out writing {} to '{}'"_format(method, name_)};
            }

            std::unique_lock lock{pending_mutex_};
            replies_cv_.wait_until(lock, stop, deadline, [&] {
                auto it = pending_.find(id);
                return (it != pending_.end() && it->second.has_value()) || !connected_.load();
            });

            auto it = pending_.find(id);
            if (it != pending_.end() && it->second.has_value()) {
                auto reply = std::move(*it->second);
                pending_.erase(it);
                return reply;
            }
            pending_.erase(id);
            lock.unlock();

            if (!connected_.load()) {
                return {.status = rpc_status::disconnected,
                        .message = "server '{}' exited while {} was pending"_format(name_, method)};
            }

            bool cancelled = stop.stop_requested();
            auto reason = cancelled ? "cancelled"sv : "timeout"sv;
            auto announced = send_notification(
                    "notifications/cancelled",
                    protocol::to_json(protocol::cancelled_params{.requestId = id, .reason = std::string{reason}}),
                    steady_clock::now() + cancel_write_budget);
            log_debug{"'", name_, "' request ", id, " (", method, ") ", reason,
                      announced ? std::string_view{} : " (cancel notification not delivered)"sv};

            if (cancelled) {
                return {.status = rpc_status::cancelled, .message = "{} on '{}' was cancelled"_format(method, name_)};
            }
            return {.status = rpc_status::timed_out, .message = "{} on '{}' timed out"_format(method, name_)};
        }

        bool notify(std::string_view method, std::string params_json) override {
            return send_notification(method, std::move(params_json), steady_clock::now() + notify_write_budget);
        }

        bool alive() const override { return connected_.load() && !child_.exit_status().has_value(); }

        pid_t pid() const override { return child_.pid(); }

        std::optional<int> exit_status() const override { return child_.exit_status(); }

        void terminate(std::chrono::milliseconds grace, std::stop_token force) override {
            std::lock_guard guard{terminate_mutex_};
            if (terminated_) {
                return;
            }
            terminated_ = true;

            bool graceful = child_.terminate(grace, std::move(force));
            pump_.request_stop();
            if (pump_.joinable()) {
                pump_.join();
            }
            mark_disconnected();
            log_debug{"'", name_, "' terminated (", graceful ? "exited" : "killed", ", status ",
                      child_.exit_status().value_or(-1), ")"};
        }

      private:
        bool send_notification(std::string_view method, std::string params_json, steady_clock::time_point deadline) {
            if (!connected_.load()) {
                return false;
            }
            protocol::notification_frame frame{};
            frame.method = std::string{method};
            frame.params = glz::raw_json{std::move(params_json)};
            auto line = protocol::to_json(frame);
            line.push_back('\n');
            return child_.write_all(line, deadline);
        }

        void mark_disconnected() {
            {
                std::lock_guard lock{pending_mutex_};
                connected_.store(false);
            }
            replies_cv_.notify_all();
        }

        // I/O pump: routes replies to waiting requests and forwards stderr to the log
        void pump(std::stop_token stop) {
            std::string out_buf{};
            std::string err_buf{};
            pollfd fds[2]{};
            fds[0] = {.fd = child_.stdout_fd(), .events = POLLIN, .revents = 0};
            fds[1] = {.fd = child_.stderr_fd(), .events = POLLIN, .revents = 0};

            while (!stop.stop_requested() && fds[0].fd >= 0) {
                int ret = ::poll(fds, 2, pump_poll_ms);
                if (ret < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    log_warn{"poll failed for '", name_, "': ", std::strerror(errno)};
                    break;
                }
                if (ret == 0) {
                    continue;
                }

                char chunk[4096]{};
                for (int i = 0; i < 2; ++i) {
                    if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                        continue;
                    }
                    auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                    if (n > 0) {
                        auto& buf = i == 0 ? out_buf : err_buf;
                        buf.append(chunk, static_cast<size_t>(n));
                        if (i == 0) {
                            consume_lines(buf, [this](std::string_view line) { dispatch_line(line); });
                        }
                        else {
                            consume_lines(buf, [this](std::string_view line) {
                                log_debug{"[", name_, "] ", line};
                            });
                        }
                    }
                    else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                        fds[i].fd = -1;
                    }
                }
            }

            if (fds[0].fd < 0) {
                auto status = child_.try_reap();
                log_info{"server '", name_, "' closed stdout",
                         status ? " (exit status {})"_format(*status) : std::string{}};
            }
            mark_disconnected();
        }

        void dispatch_line(std::string_view line) {
            protocol::incoming_frame frame{};
            std::string buffer{line};
            auto ec = glz::read<protocol::lenient>(frame, buffer);
            if (ec) {
                log_debug{"[", name_, "] ignoring non JSON-RPC output: ", line};
                return;
            }

            if (frame.method) {
                handle_server_message(frame);
                return;
            }

            auto* id = std::get_if<std::int64_t>(&frame.id);
            if (id == nullptr) {
                log_debug{"[", name_, "] reply without numeric id: ", line};
                return;
            }

            rpc_reply reply{};
            if (frame.error) {
                reply.status = rpc_status::rpc_error;
                reply.error_code = frame.error->code;
                reply.message = std::move(frame.error->message);
            }
            else {
                reply.status = rpc_status::ok;
                reply.result = frame.result ? std::move(frame.result->str) : std::string{"null"};
            }

            {
                std::lock_guard lock{pending_mutex_};
                auto it = pending_.find(*id);
                if (it == pending_.end()) {
                    log_debug{"[", name_, "] dropping late reply for request ", *id};
                    return;
                }
                it->second = std::move(reply);
            }
            replies_cv_.notify_all();
        }

        // Server-initiated traffic: answer pings, refuse other requests, log notifications
        void handle_server_message(const protocol::incoming_frame& frame) {
            if (std::holds_alternative<glz::generic::null_t>(frame.id)) {
                log_debug{"[", name_, "] notification ", *frame.method};
                return;
            }

            glz::rpc::response_t<glz::raw_json> response{};
            response.id = frame.id;
            if (*frame.method == "ping"sv) {
                response.result = glz::raw_json{"{}"};
            }
            else {
                response.error = glz::rpc::error{
                        glz::rpc::error_e::method_not_found,
                        std::nullopt,
                        "Unsupported method: {}"_format(*frame.method)};
            }
            auto line = protocol::to_json(response);
            line.push_back('\n');
            if (!child_.write_all(line, steady_clock::now() + notify_write_budget)) {
                log_debug{"[", name_, "] could not answer ", *frame.method};
            }
        }

        std::string name_;
        internal::child_process child_;

        std::atomic<bool> connected_{true};
        std::atomic<std::int64_t> next_id_{1};

        std::mutex pending_mutex_{};
        std::condition_variable_any replies_cv_{};
        std::unordered_map<std::int64_t, std::optional<rpc_reply>> pending_{};

        std::mutex terminate_mutex_{};
        bool terminated_{false};

        // declared last: starts after every member it touches and stops first
        std::jthread pump_;
    };

}}  // namespace conduit::detail

namespace conduit {

    std::unique_ptr<tool_session> launch_stdio_session(const server_spec& spec) {
        return std::make_unique<detail::stdio_session>(spec);
    }

}  // namespace conduit
