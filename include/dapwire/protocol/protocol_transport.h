#pragma once

#include <dapwire/core/channel.h>
#include <dapwire/core/types.h>
#include <dapwire/io/byte_sink.h>
#include <dapwire/protocol/frame_codec.h>
#include <dapwire/protocol/messages.h>
#include <dapwire/protocol/transport_config.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

namespace dapwire {

// Point-in-time counters; recovered protocol anomalies are only visible here and in debug logs.
struct TransportStats {
    uint64_t messagesSent{0};
    uint64_t bytesSent{0};
    uint64_t framesDecoded{0};
    uint64_t emptyFrames{0};
    uint64_t headersDiscarded{0};
    uint64_t decodeErrors{0};
    uint64_t unmatchedResponses{0};
    uint64_t unknownMessages{0};
    uint64_t pendingDropped{0};
};

/**
 * @brief Content-Length framed message transport with request/response correlation
 *
 * Outbound: every send assigns the next sequence number (starting at 1) and writes one frame
 * to the sink. Sends may come from several threads; frames never interleave and wire order
 * matches sequence order.
 *
 * Inbound: handleData() accepts arbitrarily chunked bytes and must be driven from a single
 * serial context per connection. Each complete frame is dispatched synchronously:
 * - events are published on onEvent()
 * - requests are published on onRequest()
 * - responses complete the callback registered for their request_seq, exactly once;
 *   responses without a pending entry are dropped
 * Malformed payloads are published on onError() and never stop later frames.
 * An exception from an event, request or response handler is published on onError() as
 * InternalError; one thrown by an onError() subscriber is logged. Neither leaves handleData().
 *
 * Sinks must not synchronously feed bytes back into the same transport.
 */
class ProtocolTransport {
public:
    using ResponseCallback = std::function<void(const Response&)>;

    explicit ProtocolTransport(TransportConfig config = {});
    explicit ProtocolTransport(std::shared_ptr<IByteSink> sink, TransportConfig config = {});
    ~ProtocolTransport();

    ProtocolTransport(const ProtocolTransport&) = delete;
    ProtocolTransport& operator=(const ProtocolTransport&) = delete;

    // Attach (or replace) the outbound sink.
    void setSink(std::shared_ptr<IByteSink> sink);

    Channel<Event>& onEvent() { return onEvent_; }
    Channel<Request>& onRequest() { return onRequest_; }
    Channel<Error>& onError() { return onError_; }

    /**
     * @brief Send a request
     * @param command Command name
     * @param arguments Omitted from the wire when null or empty
     * @param callback Invoked once with the matching response (or a synthesized failure on close)
     * @return The sequence number assigned to the request
     */
    Result<int64_t> sendRequest(std::string_view command, json arguments = nullptr,
                                ResponseCallback callback = {});

    // Rejects a response that already carries a nonzero seq (already sent); on success the assigned
    // seq is written back into `response`.
    Result<void> sendResponse(Response& response);
    Result<void> sendResponse(Response&& response);

    Result<void> sendEvent(std::string_view event, json body = nullptr);

    void handleData(std::string_view bytes);
    void handleData(std::span<const uint8_t> bytes);

    // Teardown. Idempotent; later sends fail with InvalidState and inbound bytes are ignored.
    void close();
    bool isClosed() const noexcept { return closed_.load(); }

    std::size_t pendingRequestCount() const;
    TransportStats stats() const;
    const TransportConfig& config() const noexcept { return config_; }

private:
    struct PendingRequest {
        std::string command;
        ResponseCallback callback;
    };

    using Renderer = std::function<json(int64_t seq)>;

    Result<int64_t> sendMessage(MessageType type, const Renderer& render,
                                PendingRequest* pending);
    void dispatch(const std::string& body);
    void dispatchResponse(const json& message);
    void reportError(Error error);

    TransportConfig config_;

    // Outbound: sequence counter and sink, serialized by sendMutex_
    mutable std::mutex sendMutex_;
    std::shared_ptr<IByteSink> sink_;
    int64_t sequence_{1};

    // Pending Request Table
    mutable std::mutex pendingMutex_;
    std::unordered_map<int64_t, PendingRequest> pending_;

    // Inbound: owned by the connection's serial receive context
    FrameDecoder decoder_;

    Channel<Event> onEvent_;
    Channel<Request> onRequest_;
    Channel<Error> onError_;

    std::atomic<bool> closed_{false};

    std::atomic<uint64_t> messagesSent_{0};
    std::atomic<uint64_t> bytesSent_{0};
    std::atomic<uint64_t> framesDecoded_{0};
    std::atomic<uint64_t> emptyFrames_{0};
    std::atomic<uint64_t> headersDiscarded_{0};
    std::atomic<uint64_t> decodeErrors_{0};
    std::atomic<uint64_t> unmatchedResponses_{0};
    std::atomic<uint64_t> unknownMessages_{0};
    std::atomic<uint64_t> pendingDropped_{0};
};

} // namespace dapwire
