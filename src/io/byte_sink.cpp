#include <dapwire/io/byte_sink.h>

namespace dapwire {

Result<void> OStreamSink::write(std::string_view frame) {
    out_.write(frame.data(), static_cast<std::streamsize>(frame.size()));
    if (!out_.good()) {
        return Error{ErrorCode::WriteError, "failed writing frame"};
    }
    out_.flush();
    if (!out_.good()) {
        return Error{ErrorCode::WriteError, "failed flushing output"};
    }
    return {};
}

} // namespace dapwire
