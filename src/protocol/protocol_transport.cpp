#include <dapwire/protocol/protocol_transport.h>

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace dapwire {

ProtocolTransport::ProtocolTransport(TransportConfig config)
    : ProtocolTransport(nullptr, std::move(config)) {}

ProtocolTransport::ProtocolTransport(std::shared_ptr<IByteSink> sink, TransportConfig config)
    : config_(std::move(config)), sink_(std::move(sink)),
      decoder_(config_.maxContentLength, config_.compactThreshold) {}

ProtocolTransport::~ProtocolTransport() {
    close();
}

void ProtocolTransport::setSink(std::shared_ptr<IByteSink> sink) {
    std::lock_guard<std::mutex> lk(sendMutex_);
    sink_ = std::move(sink);
}

// ============================================================================
// Outbound
// ============================================================================

Result<int64_t> ProtocolTransport::sendRequest(std::string_view command, json arguments,
                                               ResponseCallback callback) {
    Request request;
    request.command = std::string(command);
    request.arguments = std::move(arguments);

    auto render = [&request](int64_t seq) {
        request.seq = seq;
        return request.to_json();
    };

    if (!callback) {
        return sendMessage(MessageType::Request, render, nullptr);
    }
    PendingRequest pending{request.command, std::move(callback)};
    return sendMessage(MessageType::Request, render, &pending);
}

Result<void> ProtocolTransport::sendResponse(Response& response) {
    if (response.seq != 0) {
        Error err{ErrorCode::InvalidOperation,
                  "attempt to send more than one response for command " + response.command};
        spdlog::error("ProtocolTransport: {}", err.message);
        reportError(err);
        return err;
    }

    Response outgoing = response;
    auto sent = sendMessage(
        MessageType::Response,
        [&outgoing](int64_t seq) {
            outgoing.seq = seq;
            return outgoing.to_json();
        },
        nullptr);
    if (!sent) {
        return sent.error();
    }
    response.seq = sent.value();
    return {};
}

Result<void> ProtocolTransport::sendResponse(Response&& response) {
    Response owned = std::move(response);
    return sendResponse(owned);
}

Result<void> ProtocolTransport::sendEvent(std::string_view event, json body) {
    Event evt;
    evt.event = std::string(event);
    evt.body = std::move(body);
    auto sent = sendMessage(
        MessageType::Event,
        [&evt](int64_t seq) {
            evt.seq = seq;
            return evt.to_json();
        },
        nullptr);
    if (!sent) {
        return sent.error();
    }
    return {};
}

Result<int64_t> ProtocolTransport::sendMessage(MessageType type, const Renderer& render,
                                               PendingRequest* pending) {
    std::lock_guard<std::mutex> lk(sendMutex_);
    if (closed_.load()) {
        return Error{ErrorCode::InvalidState, "Transport closed"};
    }
    if (!sink_) {
        return Error{ErrorCode::InvalidState, "Transport not connected"};
    }

    const int64_t seq = sequence_;
    std::string body;
    try {
        body = render(seq).dump();
    } catch (const std::exception& e) {
        return Error{ErrorCode::SerializationError,
                     std::string("Failed to serialize ") + toString(type) + ": " + e.what()};
    }

    // Register before writing so a response racing the write cannot miss its callback
    if (pending) {
        std::lock_guard<std::mutex> plk(pendingMutex_);
        pending_.insert_or_assign(seq, std::move(*pending));
    }

    ++sequence_;
    const std::string frame = encode_frame(body);
    auto written = sink_->write(frame);
    if (!written) {
        if (pending) {
            std::lock_guard<std::mutex> plk(pendingMutex_);
            pending_.erase(seq);
        }
        spdlog::warn("ProtocolTransport: failed to write {} seq={}: {}", toString(type), seq,
                     written.error().message);
        return written.error();
    }

    messagesSent_.fetch_add(1, std::memory_order_relaxed);
    bytesSent_.fetch_add(frame.size(), std::memory_order_relaxed);
    if (config_.traceFrames) {
        spdlog::trace("ProtocolTransport: --> {}", body);
    }
    return seq;
}

// ============================================================================
// Inbound
// ============================================================================

void ProtocolTransport::handleData(std::span<const uint8_t> bytes) {
    handleData(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

void ProtocolTransport::handleData(std::string_view bytes) {
    if (closed_.load()) {
        spdlog::debug("ProtocolTransport: ignoring {} bytes after close", bytes.size());
        return;
    }

    decoder_.append(bytes);
    while (auto body = decoder_.next_frame()) {
        framesDecoded_.fetch_add(1, std::memory_order_relaxed);
        if (body->empty()) {
            emptyFrames_.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        dispatch(*body);
    }
    headersDiscarded_.store(decoder_.headers_discarded(), std::memory_order_relaxed);
}

void ProtocolTransport::dispatch(const std::string& body) {
    if (config_.traceFrames) {
        spdlog::trace("ProtocolTransport: <-- {}", body);
    }

    try {
        auto parsed = parse_json(body);
        if (!parsed) {
            decodeErrors_.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("ProtocolTransport: {}", parsed.error().message);
            reportError(parsed.error());
            return;
        }
        const json& message = parsed.value();

        auto type = messageTypeOf(message);
        if (!type) {
            unknownMessages_.fetch_add(1, std::memory_order_relaxed);
            spdlog::debug("ProtocolTransport: ignoring message without a known type");
            return;
        }

        switch (*type) {
            case MessageType::Event: {
                auto evt = Event::from_json(message);
                if (!evt) {
                    decodeErrors_.fetch_add(1, std::memory_order_relaxed);
                    reportError(evt.error());
                    return;
                }
                onEvent_.publish(evt.value());
                break;
            }
            case MessageType::Response:
                dispatchResponse(message);
                break;
            case MessageType::Request: {
                auto req = Request::from_json(message);
                if (!req) {
                    decodeErrors_.fetch_add(1, std::memory_order_relaxed);
                    reportError(req.error());
                    return;
                }
                onRequest_.publish(req.value());
                break;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("ProtocolTransport: dispatch failed: {}", e.what());
        reportError(Error{ErrorCode::InternalError, e.what()});
    }
}

void ProtocolTransport::dispatchResponse(const json& message) {
    auto resp = Response::from_json(message);
    if (!resp) {
        decodeErrors_.fetch_add(1, std::memory_order_relaxed);
        reportError(resp.error());
        return;
    }
    const Response& response = resp.value();

    ResponseCallback callback;
    {
        std::lock_guard<std::mutex> lk(pendingMutex_);
        auto it = pending_.find(response.request_seq);
        if (it != pending_.end()) {
            callback = std::move(it->second.callback);
            pending_.erase(it);
        }
    }

    if (!callback) {
        unmatchedResponses_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("ProtocolTransport: dropping response for unknown request_seq={} ({})",
                      response.request_seq, response.command);
        return;
    }
    callback(response);
}

void ProtocolTransport::reportError(Error error) {
    try {
        onError_.publish(error);
    } catch (const std::exception& e) {
        spdlog::error("ProtocolTransport: error subscriber threw while reporting '{}': {}",
                      error.message, e.what());
    }
}

// ============================================================================
// Teardown / introspection
// ============================================================================

void ProtocolTransport::close() {
    {
        std::lock_guard<std::mutex> lk(sendMutex_);
        if (closed_.exchange(true)) {
            return;
        }
    }

    std::unordered_map<int64_t, PendingRequest> orphaned;
    {
        std::lock_guard<std::mutex> lk(pendingMutex_);
        orphaned.swap(pending_);
    }
    if (orphaned.empty()) {
        return;
    }

    if (!config_.failPendingOnClose) {
        pendingDropped_.fetch_add(orphaned.size(), std::memory_order_relaxed);
        spdlog::warn("ProtocolTransport: closed with {} pending request(s); callbacks dropped",
                     orphaned.size());
        return;
    }

    spdlog::debug("ProtocolTransport: failing {} pending request(s) on close", orphaned.size());
    for (auto& [seq, pending] : orphaned) {
        Response failed;
        failed.request_seq = seq;
        failed.command = pending.command;
        failed.success = false;
        failed.message = errorToString(ErrorCode::TransportClosed);
        try {
            pending.callback(failed);
        } catch (const std::exception& e) {
            spdlog::error("ProtocolTransport: callback for seq={} threw on close: {}", seq,
                          e.what());
        }
    }
}

std::size_t ProtocolTransport::pendingRequestCount() const {
    std::lock_guard<std::mutex> lk(pendingMutex_);
    return pending_.size();
}

TransportStats ProtocolTransport::stats() const {
    TransportStats s;
    s.messagesSent = messagesSent_.load(std::memory_order_relaxed);
    s.bytesSent = bytesSent_.load(std::memory_order_relaxed);
    s.framesDecoded = framesDecoded_.load(std::memory_order_relaxed);
    s.emptyFrames = emptyFrames_.load(std::memory_order_relaxed);
    s.headersDiscarded = headersDiscarded_.load(std::memory_order_relaxed);
    s.decodeErrors = decodeErrors_.load(std::memory_order_relaxed);
    s.unmatchedResponses = unmatchedResponses_.load(std::memory_order_relaxed);
    s.unknownMessages = unknownMessages_.load(std::memory_order_relaxed);
    s.pendingDropped = pendingDropped_.load(std::memory_order_relaxed);
    return s;
}

} // namespace dapwire
