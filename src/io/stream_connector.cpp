#include <dapwire/io/stream_connector.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>
#include <spdlog/spdlog.h>

#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <exception>
#include <mutex>
#include <string>
#include <string_view>

namespace dapwire {

using boost::asio::use_awaitable;

namespace {

// Writes each frame in full to the output descriptor.
class DescriptorSink : public IByteSink {
public:
    DescriptorSink(boost::asio::io_context& io, int fd) : out_(io, fd) {}

    Result<void> write(std::string_view frame) override {
        std::lock_guard<std::mutex> lk(mu_);
        boost::system::error_code ec;
        auto written =
            boost::asio::write(out_, boost::asio::buffer(frame.data(), frame.size()), ec);
        if (ec) {
            return Error{ErrorCode::WriteError, ec.message()};
        }
        if (written != frame.size()) {
            return Error{ErrorCode::WriteError, "Short write on output descriptor"};
        }
        return {};
    }

private:
    std::mutex mu_;
    boost::asio::posix::stream_descriptor out_;
};

} // namespace

Result<std::shared_ptr<StreamConnector>>
StreamConnector::create(boost::asio::io_context& io, std::shared_ptr<ProtocolTransport> transport,
                        int input_fd, int output_fd) {
    if (!transport) {
        return Error{ErrorCode::InvalidArgument, "StreamConnector requires a transport"};
    }
    if (input_fd < 0 || output_fd < 0) {
        return Error{ErrorCode::InvalidArgument, "Invalid file descriptor"};
    }

    // Each stream_descriptor closes its own handle
    if (output_fd == input_fd) {
        output_fd = ::dup(input_fd);
        if (output_fd < 0) {
            return Error{ErrorCode::NetworkError, std::string("dup: ") + std::strerror(errno)};
        }
    }

    std::shared_ptr<IByteSink> sink;
    try {
        sink = std::make_shared<DescriptorSink>(io, output_fd);
    } catch (const std::exception& e) {
        ::close(output_fd);
        ::close(input_fd);
        return Error{ErrorCode::NetworkError, std::string("output descriptor: ") + e.what()};
    }

    // From here the sink owns output_fd
    try {
        return std::shared_ptr<StreamConnector>(
            new StreamConnector(io, std::move(transport), input_fd, std::move(sink)));
    } catch (const std::exception& e) {
        ::close(input_fd);
        return Error{ErrorCode::NetworkError, std::string("input descriptor: ") + e.what()};
    }
}

StreamConnector::StreamConnector(boost::asio::io_context& io,
                                 std::shared_ptr<ProtocolTransport> transport, int input_fd,
                                 std::shared_ptr<IByteSink> sink)
    : io_(io), transport_(std::move(transport)), input_(io, input_fd), sink_(std::move(sink)) {}

StreamConnector::~StreamConnector() {
    boost::system::error_code ec;
    input_.close(ec);
}

void StreamConnector::start(CloseHandler onClosed) {
    if (started_.exchange(true)) {
        return;
    }
    onClosed_ = std::move(onClosed);
    transport_->setSink(sink_);
    boost::asio::co_spawn(io_, readLoop(shared_from_this()), boost::asio::detached);
}

void StreamConnector::stop() {
    boost::asio::post(io_, [self = shared_from_this()]() {
        boost::system::error_code ec;
        self->input_.cancel(ec);
        self->input_.close(ec);
    });
}

boost::asio::awaitable<void> StreamConnector::readLoop(std::shared_ptr<StreamConnector> self) {
    std::array<char, kReadChunkSize> buf{};
    for (;;) {
        boost::system::error_code ec;
        std::size_t n = co_await self->input_.async_read_some(
            boost::asio::buffer(buf), boost::asio::redirect_error(use_awaitable, ec));
        if (n > 0) {
            self->bytesReceived_.fetch_add(n);
            try {
                self->transport_->handleData(std::string_view(buf.data(), n));
            } catch (const std::exception& e) {
                spdlog::error("StreamConnector: inbound dispatch failed: {}", e.what());
                self->finish(Error{ErrorCode::InternalError, e.what()});
                co_return;
            }
        }
        if (!ec) {
            continue;
        }
        if (ec == boost::asio::error::eof) {
            spdlog::debug("StreamConnector: end of input stream");
            self->finish(Result<void>());
        } else if (ec == boost::asio::error::operation_aborted ||
                   ec == boost::asio::error::bad_descriptor) {
            spdlog::debug("StreamConnector: read loop stopped");
            self->finish(Result<void>());
        } else {
            spdlog::warn("StreamConnector: read failed: {}", ec.message());
            self->finish(Error{ErrorCode::NetworkError, ec.message()});
        }
        co_return;
    }
}

void StreamConnector::finish(const Result<void>& outcome) {
    if (finished_.exchange(true)) {
        return;
    }
    if (onClosed_) {
        onClosed_(outcome);
    }
}

} // namespace dapwire
