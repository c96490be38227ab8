// Scriptable MCP server over stdio used by the test suite.
//
//   --name <n>        serverInfo.name (default "fake")
//   --no-handshake    never answer initialize
//   --exit-on-start   exit with status 3 before reading anything
//   --ignore-term     ignore SIGTERM and stdin EOF; only SIGKILL ends the process
//   --no-tools        answer tools/list with method_not_found
//
// Tools: echo {text}, sleep {ms, text, block}, crash, fail {text}, cancellations, stderr {text}
//
// sleep normally replies from a worker thread; with "block": true it sleeps on the
// thread that reads stdin, so nothing is read until it wakes.

#include "conduit/format.hpp"

#include "../src/internal/protocol.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <signal.h>
#include <unistd.h>
}

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace conduit::test::fake_server {

    using namespace std::string_view_literals;
    using namespace conduit::literals;
    namespace protocol = conduit::internal::protocol;

    struct options {
        std::string name{"fake"};
        bool handshake{true};
        bool exit_on_start{false};
        bool ignore_term{false};
        bool tools{true};
    };

    struct tool_args {
        std::string text{};
        int ms{0};
        bool block{false};
        struct glaze {
            using T = tool_args;
            static constexpr auto value = glz::object(&T::text, &T::ms, &T::block);
        };
    };

    static std::mutex out_mutex{};
    static std::atomic<int> cancellations{0};

    static void send(const std::string& json) {
        std::lock_guard lock{out_mutex};
        std::cout << json << '\n';
        std::cout.flush();
    }

    template <typename T>
    static std::string make_response(const glz::rpc::id_t& id, T&& result) {
        glz::rpc::response_t<std::decay_t<T>> resp{};
        resp.id = id;
        resp.result = std::forward<T>(result);
        std::string json{};
        (void)glz::write_json(resp, json);
        return json;
    }

    static std::string make_error_response(const glz::rpc::id_t& id, glz::rpc::error_e code, const std::string& message) {
        glz::rpc::response_t<glz::raw_json> resp{};
        resp.id = id;
        resp.error = glz::rpc::error{code, std::nullopt, message};
        std::string json{};
        (void)glz::write_json(resp, json);
        return json;
    }

    static std::string text_result(const glz::rpc::id_t& id, std::string text, bool is_error = false) {
        protocol::tool_call_result result{};
        result.content.push_back({.type = "text", .text = std::move(text)});
        result.isError = is_error;
        return make_response(id, std::move(result));
    }

    static std::string handle_initialize(const glz::rpc::id_t& id, const options& opts) {
        protocol::initialize_result result{};
        result.protocolVersion = std::string{protocol::mcp_protocol_version};
        result.serverInfo = {.name = opts.name, .version = "1.0.0"};
        return make_response(id, std::move(result));
    }

    static std::string handle_tools_list(const glz::rpc::id_t& id) {
        protocol::tools_list_result result{};
        for (auto name : {"echo"sv, "sleep"sv, "crash"sv, "fail"sv, "cancellations"sv, "stderr"sv}) {
            result.tools.push_back(
                    {.name = std::string{name},
                     .description = "fake {} tool"_format(name),
                     .inputSchema = glz::raw_json{R"({"type":"object"})"}});
        }
        return make_response(id, std::move(result));
    }

    // sleep replies from a worker thread, so replies can overtake each other
    static void handle_tools_call(
            const glz::rpc::id_t& id, std::string_view raw_params, std::vector<std::jthread>& workers) {
        protocol::tool_call_params params{};
        auto ec = glz::read<protocol::lenient>(params, raw_params);
        if (ec) {
            send(make_error_response(id, glz::rpc::error_e::invalid_params, "bad tools/call params"));
            return;
        }
        tool_args args{};
        (void)glz::read<protocol::lenient>(args, params.arguments.str);

        if (params.name == "echo"sv) {
            send(text_result(id, args.text));
        }
        else if (params.name == "sleep"sv && args.block) {
            std::this_thread::sleep_for(std::chrono::milliseconds{args.ms});
            send(text_result(id, args.text.empty() ? "slept {}ms"_format(args.ms) : args.text));
        }
        else if (params.name == "sleep"sv) {
            workers.emplace_back([id, args] {
                std::this_thread::sleep_for(std::chrono::milliseconds{args.ms});
                send(text_result(id, args.text.empty() ? "slept {}ms"_format(args.ms) : args.text));
            });
        }
        else if (params.name == "crash"sv) {
            std::_Exit(9);
        }
        else if (params.name == "fail"sv) {
            send(text_result(id, args.text.empty() ? std::string{"requested failure"} : args.text, true));
        }
        else if (params.name == "cancellations"sv) {
            send(text_result(id, std::to_string(cancellations.load())));
        }
        else if (params.name == "stderr"sv) {
            std::cerr << args.text << std::endl;
            send(text_result(id, "ok"));
        }
        else {
            send(make_error_response(id, glz::rpc::error_e::invalid_params, "Unknown tool: " + params.name));
        }
    }

    static options parse_options(int argc, char** argv) {
        options opts{};
        for (int i = 1; i < argc; ++i) {
            std::string_view arg{argv[i]};
            if (arg == "--name"sv && i + 1 < argc) {
                opts.name = argv[++i];
            }
            else if (arg == "--no-handshake"sv) {
                opts.handshake = false;
            }
            else if (arg == "--exit-on-start"sv) {
                opts.exit_on_start = true;
            }
            else if (arg == "--ignore-term"sv) {
                opts.ignore_term = true;
            }
            else if (arg == "--no-tools"sv) {
                opts.tools = false;
            }
        }
        return opts;
    }

    static int run(int argc, char** argv) {
        auto opts = parse_options(argc, argv);
        if (opts.exit_on_start) {
            return 3;
        }
        if (opts.ignore_term) {
            ::signal(SIGTERM, SIG_IGN);
        }

        std::vector<std::jthread> workers{};
        std::string line{};
        while (std::getline(std::cin, line)) {
            if (line.empty()) {
                continue;
            }

            glz::rpc::generic_request_t request{};
            auto ec = glz::read<protocol::lenient>(request, line);
            if (ec) {
                send(make_error_response({}, glz::rpc::error_e::parse_error, "JSON parse error"));
                continue;
            }

            bool is_notification = std::holds_alternative<glz::generic::null_t>(request.id);

            if (request.method == "initialize"sv) {
                if (opts.handshake) {
                    send(handle_initialize(request.id, opts));
                }
            }
            else if (request.method == "notifications/initialized"sv) {
                // no response
            }
            else if (request.method == "notifications/cancelled"sv) {
                cancellations.fetch_add(1);
            }
            else if (request.method == "ping"sv) {
                send(make_response(request.id, glz::raw_json{"{}"}));
            }
            else if (request.method == "tools/list"sv && opts.tools) {
                send(handle_tools_list(request.id));
            }
            else if (request.method == "tools/call"sv) {
                handle_tools_call(request.id, request.params.str, workers);
            }
            else if (!is_notification) {
                send(make_error_response(
                        request.id, glz::rpc::error_e::method_not_found, "Unknown method: " + std::string{request.method}));
            }
        }

        if (opts.ignore_term) {
            for (;;) {
                ::pause();
            }
        }
        return 0;
    }

}  // namespace conduit::test::fake_server

int main(int argc, char** argv) {
    return conduit::test::fake_server::run(argc, argv);
}
