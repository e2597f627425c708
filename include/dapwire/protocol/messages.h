#pragma once

#include <dapwire/core/types.h>

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dapwire {

// Insertion-ordered so "seq" and "type" lead every serialized message.
using json = nlohmann::ordered_json;

enum class MessageType { Request, Response, Event };

constexpr const char* toString(MessageType type) {
    switch (type) {
        case MessageType::Request: return "request";
        case MessageType::Response: return "response";
        case MessageType::Event: return "event";
    }
    return "unknown";
}

std::optional<MessageType> parseMessageType(std::string_view value) noexcept;

// Reads the "type" tag of a decoded message; nullopt when absent or not a known kind.
std::optional<MessageType> messageTypeOf(const json& message) noexcept;

struct Request {
    int64_t seq{0};
    std::string command;
    json arguments; // null when absent

    json to_json() const;
    static Result<Request> from_json(const json& j);
};

struct Response {
    int64_t seq{0}; // 0 until sent
    int64_t request_seq{0};
    std::string command;
    bool success{true};
    std::optional<std::string> message;
    json body;

    // Unsent response to `request`, ready to be filled in and passed to sendResponse().
    static Response answering(const Request& request, bool success = true);

    json to_json() const;
    static Result<Response> from_json(const json& j);
};

struct Event {
    int64_t seq{0};
    std::string event;
    json body;

    json to_json() const;
    static Result<Event> from_json(const json& j);
};

// Safe JSON parsing without exceptions
Result<json> parse_json(std::string_view input) noexcept;

} // namespace dapwire
