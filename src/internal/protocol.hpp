#pragma once

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit::internal::protocol {

    using namespace std::string_view_literals;

    inline constexpr auto jsonrpc_version = "2.0"sv;
    inline constexpr auto mcp_protocol_version = "2024-11-05"sv;
    inline constexpr auto client_name = "conduit"sv;
    inline constexpr auto client_version = "0.1.0"sv;

    // ── Frames written to the server ───────────────────────────────

    // Requests go out as glz::rpc::request_t<glz::raw_json>, replies to server requests as
    // glz::rpc::response_t<glz::raw_json>; notifications carry no id at all
    struct notification_frame {
        std::string jsonrpc{jsonrpc_version};
        std::string method{};
        glz::raw_json params{"{}"};
        struct glaze {
            using T = notification_frame;
            static constexpr auto value = glz::object(&T::jsonrpc, &T::method, &T::params);
        };
    };

    // Error member as servers send it; `data` is free-form, so it is skipped
    struct error_object {
        int code{};
        std::string message{};
        struct glaze {
            using T = error_object;
            static constexpr auto value = glz::object(&T::code, &T::message);
        };
    };

    // ── Frames read from the server ────────────────────────────────

    // Anything the server writes: a reply (id + result/error), a request (id + method) or
    // a notification (method only)
    struct incoming_frame {
        glz::rpc::id_t id{};
        std::optional<std::string> method{};
        std::optional<glz::raw_json> result{};
        std::optional<error_object> error{};
        struct glaze {
            using T = incoming_frame;
            static constexpr auto value = glz::object(&T::id, &T::method, &T::result, &T::error);
        };
    };

    // ── MCP payloads ───────────────────────────────────────────────

    struct implementation_info {
        std::string name{};
        std::string version{};
        struct glaze {
            using T = implementation_info;
            static constexpr auto value = glz::object(&T::name, &T::version);
        };
    };

    struct initialize_params {
        std::string protocolVersion{mcp_protocol_version};
        glz::raw_json capabilities{"{}"};
        implementation_info clientInfo{std::string{client_name}, std::string{client_version}};
        struct glaze {
            using T = initialize_params;
            static constexpr auto value = glz::object(
                    "protocolVersion", &T::protocolVersion, "capabilities", &T::capabilities, "clientInfo",
                    &T::clientInfo);
        };
    };

    struct initialize_result {
        std::string protocolVersion{};
        implementation_info serverInfo{};
        struct glaze {
            using T = initialize_result;
            static constexpr auto value =
                    glz::object("protocolVersion", &T::protocolVersion, "serverInfo", &T::serverInfo);
        };
    };

    struct tool_definition {
        std::string name{};
        std::string description{};
        glz::raw_json inputSchema{"{}"};
        struct glaze {
            using T = tool_definition;
            static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
        };
    };

    struct tools_list_result {
        std::vector<tool_definition> tools{};
        std::optional<std::string> nextCursor{};
        struct glaze {
            using T = tools_list_result;
            static constexpr auto value = glz::object(&T::tools, "nextCursor", &T::nextCursor);
        };
    };

    struct tools_list_params {
        std::optional<std::string> cursor{};
        struct glaze {
            using T = tools_list_params;
            static constexpr auto value = glz::object(&T::cursor);
        };
    };

    struct tool_call_params {
        std::string name{};
        glz::raw_json arguments{"{}"};
        struct glaze {
            using T = tool_call_params;
            static constexpr auto value = glz::object(&T::name, &T::arguments);
        };
    };

    struct content_item {
        std::string type{};
        std::optional<std::string> text{};
        struct glaze {
            using T = content_item;
            static constexpr auto value = glz::object(&T::type, &T::text);
        };
    };

    struct tool_call_result {
        std::vector<content_item> content{};
        bool isError{false};
        struct glaze {
            using T = tool_call_result;
            static constexpr auto value = glz::object(&T::content, "isError", &T::isError);
        };
    };

    struct cancelled_params {
        std::int64_t requestId{};
        std::string reason{};
        struct glaze {
            using T = cancelled_params;
            static constexpr auto value = glz::object("requestId", &T::requestId, &T::reason);
        };
    };

    inline constexpr glz::opts lenient{.error_on_unknown_keys = false};

    template <typename T>
    std::string to_json(const T& value) {
        std::string json{};
        (void)glz::write_json(value, json);
        return json;
    }

    // Tool arguments as a single-line JSON object. Empty or whitespace-only text means
    // "no arguments"; anything that is not a valid JSON object gives nullopt.
    inline std::optional<std::string> normalize_arguments(std::string_view arguments) {
        auto first = arguments.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos) {
            return std::string{"{}"};
        }
        if (arguments[first] != '{') {
            return std::nullopt;
        }
        std::string buffer{arguments};
        if (glz::validate_json(buffer)) {
            return std::nullopt;
        }
        return glz::minify_json(buffer);
    }

    inline std::string joined_text(const tool_call_result& result) {
        std::string text{};
        for (const auto& item : result.content) {
            if (!item.text) {
                continue;
            }
            if (!text.empty()) {
                text.push_back('\n');
            }
            text += *item.text;
        }
        return text;
    }

}  // namespace conduit::internal::protocol
