#include <dapwire/protocol/messages.h>

namespace dapwire {

namespace {

bool isEmptyPayload(const json& value) {
    return value.is_null() || (value.is_structured() && value.empty());
}

Result<void> requireObject(const json& j, const char* kind) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, std::string(kind) + " must be a JSON object"};
    }
    return {};
}

Result<int64_t> readInteger(const json& j, const char* key, bool required) {
    auto it = j.find(key);
    if (it == j.end()) {
        if (required) {
            return Error{ErrorCode::InvalidData, std::string("Missing '") + key + "' field"};
        }
        return int64_t{0};
    }
    if (!it->is_number_integer()) {
        return Error{ErrorCode::InvalidData, std::string("'") + key + "' must be an integer"};
    }
    return it->get<int64_t>();
}

Result<std::string> readString(const json& j, const char* key, bool required) {
    auto it = j.find(key);
    if (it == j.end()) {
        if (required) {
            return Error{ErrorCode::InvalidData, std::string("Missing '") + key + "' field"};
        }
        return std::string{};
    }
    if (!it->is_string()) {
        return Error{ErrorCode::InvalidData, std::string("'") + key + "' must be a string"};
    }
    return it->get<std::string>();
}

json readPayload(const json& j, const char* key) {
    auto it = j.find(key);
    return it == j.end() ? json() : *it;
}

} // namespace

std::optional<MessageType> parseMessageType(std::string_view value) noexcept {
    if (value == "request")
        return MessageType::Request;
    if (value == "response")
        return MessageType::Response;
    if (value == "event")
        return MessageType::Event;
    return std::nullopt;
}

std::optional<MessageType> messageTypeOf(const json& message) noexcept {
    if (!message.is_object()) {
        return std::nullopt;
    }
    auto it = message.find("type");
    if (it == message.end() || !it->is_string()) {
        return std::nullopt;
    }
    return parseMessageType(it->get_ref<const std::string&>());
}

// ============================================================================
// Request
// ============================================================================

json Request::to_json() const {
    json j;
    j["seq"] = seq;
    j["type"] = toString(MessageType::Request);
    j["command"] = command;
    if (!isEmptyPayload(arguments)) {
        j["arguments"] = arguments;
    }
    return j;
}

Result<Request> Request::from_json(const json& j) {
    if (auto ok = requireObject(j, "Request"); !ok) {
        return ok.error();
    }
    Request req;
    auto seq = readInteger(j, "seq", false);
    if (!seq)
        return seq.error();
    auto command = readString(j, "command", true);
    if (!command)
        return command.error();

    req.seq = seq.value();
    req.command = std::move(command).value();
    req.arguments = readPayload(j, "arguments");
    return req;
}

// ============================================================================
// Response
// ============================================================================

Response Response::answering(const Request& request, bool success) {
    Response resp;
    resp.request_seq = request.seq;
    resp.command = request.command;
    resp.success = success;
    return resp;
}

json Response::to_json() const {
    json j;
    j["seq"] = seq;
    j["type"] = toString(MessageType::Response);
    j["request_seq"] = request_seq;
    j["command"] = command;
    j["success"] = success;
    if (message) {
        j["message"] = *message;
    }
    if (!body.is_null()) {
        j["body"] = body;
    }
    return j;
}

Result<Response> Response::from_json(const json& j) {
    if (auto ok = requireObject(j, "Response"); !ok) {
        return ok.error();
    }
    auto seq = readInteger(j, "seq", false);
    if (!seq)
        return seq.error();
    auto requestSeq = readInteger(j, "request_seq", true);
    if (!requestSeq)
        return requestSeq.error();
    auto command = readString(j, "command", false);
    if (!command)
        return command.error();

    Response resp;
    resp.seq = seq.value();
    resp.request_seq = requestSeq.value();
    resp.command = std::move(command).value();

    if (auto it = j.find("success"); it != j.end()) {
        if (!it->is_boolean()) {
            return Error{ErrorCode::InvalidData, "'success' must be a boolean"};
        }
        resp.success = it->get<bool>();
    } else {
        resp.success = false;
    }
    if (auto it = j.find("message"); it != j.end() && it->is_string()) {
        resp.message = it->get<std::string>();
    }
    resp.body = readPayload(j, "body");
    return resp;
}

// ============================================================================
// Event
// ============================================================================

json Event::to_json() const {
    json j;
    j["seq"] = seq;
    j["type"] = toString(MessageType::Event);
    j["event"] = event;
    if (!body.is_null()) {
        j["body"] = body;
    }
    return j;
}

Result<Event> Event::from_json(const json& j) {
    if (auto ok = requireObject(j, "Event"); !ok) {
        return ok.error();
    }
    auto seq = readInteger(j, "seq", false);
    if (!seq)
        return seq.error();
    auto name = readString(j, "event", true);
    if (!name)
        return name.error();

    Event evt;
    evt.seq = seq.value();
    evt.event = std::move(name).value();
    evt.body = readPayload(j, "body");
    return evt;
}

Result<json> parse_json(std::string_view input) noexcept {
    if (input.empty()) {
        return Error{ErrorCode::InvalidData, "Empty input string for JSON parsing"};
    }

    try {
        return json::parse(input);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData, std::string("JSON parse error: ") + e.what() +
                                                 " at position " + std::to_string(e.byte)};
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("JSON parsing failed: ") + e.what()};
    }
}

} // namespace dapwire
