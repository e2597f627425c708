#include <dapwire/cli/wire_commands.h>

#include <dapwire/io/byte_sink.h>
#include <dapwire/protocol/frame_codec.h>
#include <dapwire/protocol/messages.h>
#include <dapwire/protocol/protocol_transport.h>

#include <spdlog/spdlog.h>

#include <array>
#include <memory>
#include <string>

namespace dapwire::cli {

namespace {

constexpr std::size_t kReadChunk = 16 * 1024;

bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

Result<void> sendLine(ProtocolTransport& transport, const json& message) {
    auto type = messageTypeOf(message);
    if (!type) {
        return Error{ErrorCode::InvalidData, "missing or unknown 'type'"};
    }

    switch (*type) {
        case MessageType::Request: {
            auto req = Request::from_json(message);
            if (!req) {
                return req.error();
            }
            auto sent = transport.sendRequest(req.value().command, req.value().arguments);
            if (!sent) {
                return sent.error();
            }
            return {};
        }
        case MessageType::Response: {
            auto resp = Response::from_json(message);
            if (!resp) {
                return resp.error();
            }
            Response outgoing = std::move(resp).value();
            outgoing.seq = 0;
            return transport.sendResponse(outgoing);
        }
        case MessageType::Event: {
            auto evt = Event::from_json(message);
            if (!evt) {
                return evt.error();
            }
            return transport.sendEvent(evt.value().event, evt.value().body);
        }
    }
    return Error{ErrorCode::InternalError, "unhandled message type"};
}

} // namespace

Result<WireReport> decodeStream(std::istream& in, std::ostream& out, const TransportConfig& cfg) {
    WireReport report;
    FrameDecoder decoder(cfg.maxContentLength, cfg.compactThreshold);
    std::array<char, kReadChunk> buf{};

    auto drain = [&]() -> Result<void> {
        while (auto body = decoder.next_frame()) {
            if (body->empty()) {
                continue;
            }
            auto parsed = parse_json(*body);
            if (!parsed) {
                ++report.failures;
                spdlog::warn("decode: {}", parsed.error().message);
                continue;
            }
            if (!messageTypeOf(parsed.value())) {
                spdlog::debug("decode: message without a known type");
            }
            out << parsed.value().dump() << '\n';
            if (!out.good()) {
                return Error{ErrorCode::WriteError, "failed writing decoded message"};
            }
            ++report.messages;
        }
        return {};
    };

    while (in.read(buf.data(), static_cast<std::streamsize>(buf.size())) || in.gcount() > 0) {
        decoder.append(std::string_view(buf.data(), static_cast<std::size_t>(in.gcount())));
        if (auto ok = drain(); !ok) {
            return ok.error();
        }
    }
    out.flush();

    if (decoder.headers_discarded() > 0) {
        spdlog::info("decode: skipped {} header block(s) without Content-Length",
                     decoder.headers_discarded());
    }
    if (decoder.buffered_bytes() > 0) {
        ++report.failures;
        spdlog::warn("decode: input ended inside a frame ({} bytes unconsumed)",
                     decoder.buffered_bytes());
    }
    return report;
}

Result<WireReport> encodeStream(std::istream& in, std::ostream& out, const TransportConfig& cfg) {
    WireReport report;
    ProtocolTransport transport(std::make_shared<OStreamSink>(out), cfg);

    std::string line;
    uint64_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (isBlank(line)) {
            continue;
        }
        auto parsed = parse_json(line);
        if (!parsed) {
            ++report.failures;
            spdlog::warn("encode: line {}: {}", lineNo, parsed.error().message);
            continue;
        }
        auto sent = sendLine(transport, parsed.value());
        if (!sent) {
            if (sent.error().code == ErrorCode::WriteError) {
                return sent.error();
            }
            ++report.failures;
            spdlog::warn("encode: line {}: {}", lineNo, sent.error().message);
            continue;
        }
        ++report.messages;
    }
    return report;
}

} // namespace dapwire::cli
