#pragma once

#include <dapwire/core/types.h>
#include <dapwire/io/byte_sink.h>
#include <dapwire/protocol/protocol_transport.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

namespace dapwire {

/**
 * Binds a ProtocolTransport to a readable and a writable POSIX descriptor (pipe ends, a
 * socket, or a child process' stdio).
 *
 * Inbound bytes are read by a coroutine on the io_context and pushed into
 * ProtocolTransport::handleData(), which makes the io_context the transport's receive context.
 * Outbound frames are written synchronously to the output descriptor by the calling thread.
 *
 * The connector owns both descriptors; once the arguments validate, create() closes them on
 * failure. The same descriptor may be passed for input and output.
 */
class StreamConnector : public std::enable_shared_from_this<StreamConnector> {
public:
    // Invoked once when the read loop ends: success on end of stream or stop(), error otherwise.
    using CloseHandler = std::function<void(const Result<void>&)>;

    static constexpr std::size_t kReadChunkSize = 16 * 1024;

    static Result<std::shared_ptr<StreamConnector>>
    create(boost::asio::io_context& io, std::shared_ptr<ProtocolTransport> transport,
           int input_fd, int output_fd);

    ~StreamConnector();

    // Attaches the output sink to the transport and starts reading.
    void start(CloseHandler onClosed = {});

    // Ends the read loop; safe to call from any thread.
    void stop();

    std::shared_ptr<IByteSink> sink() const { return sink_; }
    std::shared_ptr<ProtocolTransport> transport() const { return transport_; }
    uint64_t bytesReceived() const noexcept { return bytesReceived_.load(); }

private:
    StreamConnector(boost::asio::io_context& io, std::shared_ptr<ProtocolTransport> transport,
                    int input_fd, std::shared_ptr<IByteSink> sink);

    static boost::asio::awaitable<void> readLoop(std::shared_ptr<StreamConnector> self);
    void finish(const Result<void>& outcome);

    boost::asio::io_context& io_;
    std::shared_ptr<ProtocolTransport> transport_;
    boost::asio::posix::stream_descriptor input_;
    std::shared_ptr<IByteSink> sink_;
    CloseHandler onClosed_;
    std::atomic<bool> started_{false};
    std::atomic<bool> finished_{false};
    std::atomic<uint64_t> bytesReceived_{0};
};

} // namespace dapwire
