#pragma once

#include <dapwire/core/types.h>

#include <functional>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace dapwire {

/**
 * Outbound byte sink. Each write() receives one complete frame (header and body); an
 * implementation must emit it contiguously or fail.
 */
class IByteSink {
public:
    virtual ~IByteSink() = default;
    virtual Result<void> write(std::string_view frame) = 0;
};

// Writes frames to a std::ostream and flushes after each one.
class OStreamSink : public IByteSink {
public:
    explicit OStreamSink(std::ostream& out) : out_(out) {}
    Result<void> write(std::string_view frame) override;

private:
    std::ostream& out_;
};

// Accumulates frames in memory.
class StringSink : public IByteSink {
public:
    Result<void> write(std::string_view frame) override {
        std::lock_guard<std::mutex> lk(mu_);
        data_.append(frame);
        return {};
    }

    std::string str() const {
        std::lock_guard<std::mutex> lk(mu_);
        return data_;
    }

    // Returns the accumulated bytes and clears the sink.
    std::string take() {
        std::lock_guard<std::mutex> lk(mu_);
        std::string out;
        out.swap(data_);
        return out;
    }

private:
    mutable std::mutex mu_;
    std::string data_;
};

// Forwards each frame to a function, e.g. another transport's handleData().
class CallbackSink : public IByteSink {
public:
    using WriteFn = std::function<Result<void>(std::string_view)>;
    explicit CallbackSink(WriteFn fn) : fn_(std::move(fn)) {}

    Result<void> write(std::string_view frame) override {
        if (!fn_) {
            return Error{ErrorCode::WriteError, "No write target"};
        }
        return fn_(frame);
    }

private:
    WriteFn fn_;
};

} // namespace dapwire
