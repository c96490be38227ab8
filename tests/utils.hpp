#pragma once

#include "conduit/cli.hpp"
#include "conduit/config.hpp"
#include "conduit/dispatcher.hpp"
#include "conduit/errors.hpp"
#include "conduit/format.hpp"
#include "conduit/log.hpp"
#include "conduit/registry.hpp"
#include "conduit/runtime.hpp"
#include "conduit/session.hpp"
#include "conduit/shutdown.hpp"
#include "conduit/slot_pool.hpp"
#include "conduit/utils.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#ifndef CONDUIT_FAKE_SERVER_PATH
#error "CONDUIT_FAKE_SERVER_PATH must point at the conduit_fake_server executable"
#endif

namespace conduit::test {

    using namespace std::chrono_literals;
    using namespace std::string_view_literals;

    namespace detail {
        namespace fs = std::filesystem;

        struct temp_dir {
            fs::path path{};

            explicit temp_dir(std::string_view prefix) {
                auto now = std::chrono::system_clock::now().time_since_epoch().count();
                std::ostringstream dir_name{};
                dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
                path = fs::temp_directory_path() / dir_name.str();
                fs::create_directories(path);
            }

            ~temp_dir() {
                std::error_code ec{};
                fs::remove_all(path, ec);
            }

            temp_dir(const temp_dir&) = delete;
            temp_dir& operator=(const temp_dir&) = delete;
        };

        inline void write_file(const fs::path& p, std::string_view content) {
            std::ofstream out{p};
            REQUIRE(out.good());
            out << content;
        }

        // Polls `pred` until it holds or `timeout` passes
        template <typename F>
        bool eventually(F&& pred, std::chrono::milliseconds timeout = 2s) {
            auto deadline = std::chrono::steady_clock::now() + timeout;
            while (std::chrono::steady_clock::now() < deadline) {
                if (pred()) {
                    return true;
                }
                std::this_thread::sleep_for(5ms);
            }
            return pred();
        }

        inline bool process_exists(pid_t pid) {
            return pid > 0 && ::kill(pid, 0) == 0;
        }
    }  // namespace detail

    inline server_spec fake_spec(std::string name, std::vector<std::string> args = {}) {
        server_spec spec{};
        spec.name = std::move(name);
        spec.command = CONDUIT_FAKE_SERVER_PATH;
        spec.args = std::move(args);
        spec.args.push_back("--name");
        spec.args.push_back(spec.name);
        return spec;
    }

    inline server_spec scripted_spec(std::string name, std::optional<std::size_t> max_concurrency = std::nullopt) {
        server_spec spec{};
        spec.name = std::move(name);
        spec.command = "scripted";
        spec.max_concurrency = max_concurrency;
        return spec;
    }

    // Shared state behind one scripted_session; tests keep it after the registry owns
    // the session itself
    struct session_control {
        std::chrono::milliseconds call_delay{0ms};
        bool fail_handshake{false};
        bool hang_handshake{false};
        bool throw_in_handshake{false};
        bool tool_reports_error{false};

        std::atomic<bool> alive{true};
        std::atomic<int> terminations{0};
        std::atomic<int> in_flight{0};
        std::atomic<int> peak{0};
        std::atomic<int> calls{0};
        std::atomic<int> handshakes{0};
        std::atomic<long long> last_grace_ms{-1};

        std::mutex mutex{};
        std::condition_variable_any cv{};
        std::vector<std::string> call_order{};

        void crash() {
            {
                std::lock_guard lock{mutex};
                alive.store(false);
            }
            cv.notify_all();
        }

        std::vector<std::string> order() {
            std::lock_guard lock{mutex};
            return call_order;
        }
    };

    // In-process tool_session: answers the handshake itself and holds each tools/call
    // for call_delay, so timing and concurrency can be observed without a subprocess
    class scripted_session final : public tool_session {
      public:
        explicit scripted_session(std::shared_ptr<session_control> control) : control_{std::move(control)} {}

        rpc_reply request(
                std::string_view method,
                std::string params_json,
                steady_clock::time_point deadline,
                std::stop_token stop) override {
            auto& c = *control_;
            if (!c.alive.load()) {
                return {.status = rpc_status::disconnected, .message = "scripted server is gone"};
            }

            if (method == "initialize"sv) {
                c.handshakes.fetch_add(1);
                if (c.hang_handshake) {
                    return wait_out(steady_clock::time_point::max(), stop, deadline);
                }
                if (c.throw_in_handshake) {
                    throw std::runtime_error("scripted handshake blew up");
                }
                if (c.fail_handshake) {
                    return {.status = rpc_status::rpc_error, .error_code = -32603, .message = "refused"};
                }
                return {.status = rpc_status::ok,
                        .result = R"({"protocolVersion":"2024-11-05","serverInfo":{"name":"scripted","version":"1"}})"};
            }
            if (method == "tools/list"sv) {
                return {.status = rpc_status::ok,
                        .result = R"({"tools":[{"name":"work","description":"scripted work","inputSchema":{}}]})"};
            }
            if (method == "ping"sv) {
                return {.status = rpc_status::ok, .result = "{}"};
            }

            c.calls.fetch_add(1);
            {
                std::lock_guard lock{c.mutex};
                c.call_order.push_back(params_json);
            }
            auto now_in_flight = c.in_flight.fetch_add(1) + 1;
            auto seen = c.peak.load();
            while (now_in_flight > seen && !c.peak.compare_exchange_weak(seen, now_in_flight)) {}

            auto reply = wait_out(steady_clock::now() + c.call_delay, stop, deadline);
            c.in_flight.fetch_sub(1);
            return reply;
        }

        bool notify(std::string_view, std::string) override { return control_->alive.load(); }

        bool alive() const override { return control_->alive.load(); }

        pid_t pid() const override { return 4242; }

        std::optional<int> exit_status() const override {
            if (control_->alive.load()) {
                return std::nullopt;
            }
            return 137;
        }

        void terminate(std::chrono::milliseconds grace, std::stop_token) override {
            control_->last_grace_ms.store(grace.count());
            control_->terminations.fetch_add(1);
            control_->crash();
        }

      private:
        // Holds until `finish`, then answers; earlier outcomes for stop, deadline or crash
        rpc_reply wait_out(steady_clock::time_point finish, std::stop_token stop, steady_clock::time_point deadline) {
            auto& c = *control_;
            auto until = std::min(finish, deadline);
            std::unique_lock lock{c.mutex};
            c.cv.wait_until(lock, stop, until, [&] { return !c.alive.load(); });

            if (!c.alive.load()) {
                return {.status = rpc_status::disconnected, .message = "scripted server is gone"};
            }
            if (stop.stop_requested()) {
                return {.status = rpc_status::cancelled, .message = "cancelled"};
            }
            if (finish > deadline) {
                return {.status = rpc_status::timed_out, .message = "timed out"};
            }
            if (c.tool_reports_error) {
                return {.status = rpc_status::ok,
                        .result = R"({"content":[{"type":"text","text":"tool broke"}],"isError":true})"};
            }
            return {.status = rpc_status::ok, .result = R"({"content":[{"type":"text","text":"done"}]})"};
        }

        std::shared_ptr<session_control> control_;
    };

    // Hands out scripted sessions by server name; must outlive the registry using it
    struct scripted_fleet {
        std::mutex mutex{};
        std::map<std::string, std::shared_ptr<session_control>> controls{};

        std::shared_ptr<session_control> control(const std::string& name) {
            std::lock_guard lock{mutex};
            auto& c = controls[name];
            if (!c) {
                c = std::make_shared<session_control>();
            }
            return c;
        }

        session_launcher launcher() {
            return [this](const server_spec& spec) -> std::unique_ptr<tool_session> {
                return std::make_unique<scripted_session>(control(spec.name));
            };
        }
    };

    inline tool_call_request call(std::string server, std::string arguments = "{}") {
        return {.server = std::move(server), .tool = "work", .arguments = std::move(arguments)};
    }

}  // namespace conduit::test
