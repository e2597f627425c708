#include <dapwire/protocol/frame_codec.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>

namespace dapwire {

std::string encode_frame(std::string_view body) {
    const std::string length = std::to_string(body.size());
    std::string frame;
    frame.reserve(kContentLengthPrefix.size() + length.size() + kHeaderSeparator.size() +
                  body.size());
    frame.append(kContentLengthPrefix);
    frame.append(length);
    frame.append(kHeaderSeparator);
    frame.append(body);
    return frame;
}

std::optional<std::size_t> parse_content_length(std::string_view header) noexcept {
    std::size_t pos = header.find(kContentLengthPrefix);
    while (pos != std::string_view::npos) {
        const std::size_t start = pos + kContentLengthPrefix.size();
        std::size_t end = start;
        while (end < header.size() && header[end] >= '0' && header[end] <= '9') {
            ++end;
        }
        if (end > start) {
            std::size_t value = 0;
            auto [ptr, ec] = std::from_chars(header.data() + start, header.data() + end, value);
            if (ec != std::errc{}) {
                return std::nullopt;
            }
            return value;
        }
        pos = header.find(kContentLengthPrefix, start);
    }
    return std::nullopt;
}

// ============================================================================
// FrameDecoder Implementation
// ============================================================================

FrameDecoder::FrameDecoder(std::size_t max_content_length, std::size_t compact_threshold)
    : max_content_length_(max_content_length), compact_threshold_(compact_threshold) {}

void FrameDecoder::reset() {
    buffer_.clear();
    read_pos_ = 0;
    scan_pos_ = 0;
    state_ = State::AwaitingHeader;
    expected_length_ = 0;
}

void FrameDecoder::append(std::string_view bytes) {
    if (bytes.empty()) {
        return;
    }
    compact();
    buffer_.append(bytes);
}

void FrameDecoder::append(std::span<const uint8_t> bytes) {
    append(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

void FrameDecoder::compact() {
    if (read_pos_ == 0) {
        return;
    }
    if (read_pos_ == buffer_.size()) {
        // Fully drained: keep the allocation, drop the contents
        buffer_.clear();
        read_pos_ = 0;
        scan_pos_ = 0;
        return;
    }
    if (read_pos_ >= compact_threshold_ || read_pos_ >= buffer_.size() - read_pos_) {
        buffer_.erase(0, read_pos_);
        scan_pos_ = scan_pos_ > read_pos_ ? scan_pos_ - read_pos_ : 0;
        read_pos_ = 0;
    }
}

bool FrameDecoder::try_consume_header() {
    const std::size_t from = std::max(read_pos_, scan_pos_);
    const auto sep = buffer_.find(kHeaderSeparator.data(), from, kHeaderSeparator.size());
    if (sep == std::string::npos) {
        // A separator may straddle the next chunk boundary
        if (buffer_.size() >= read_pos_ + kHeaderSeparator.size()) {
            scan_pos_ = buffer_.size() - (kHeaderSeparator.size() - 1);
        }
        return false;
    }

    const std::string_view header(buffer_.data() + read_pos_, sep - read_pos_);
    const auto length = parse_content_length(header);

    read_pos_ = sep + kHeaderSeparator.size();
    scan_pos_ = read_pos_;

    if (!length) {
        ++headers_discarded_;
        spdlog::debug("FrameDecoder: discarded header without Content-Length ({} bytes)",
                      header.size());
        return true;
    }
    if (max_content_length_ != 0 && *length > max_content_length_) {
        ++headers_discarded_;
        spdlog::warn("FrameDecoder: discarded header announcing {} bytes (limit {})", *length,
                     max_content_length_);
        return true;
    }

    expected_length_ = *length;
    state_ = State::AwaitingBody;
    return true;
}

std::optional<std::string> FrameDecoder::next_frame() {
    while (true) {
        if (state_ == State::AwaitingBody) {
            if (buffered_bytes() < expected_length_) {
                return std::nullopt;
            }
            std::string body = buffer_.substr(read_pos_, expected_length_);
            read_pos_ += expected_length_;
            scan_pos_ = read_pos_;
            expected_length_ = 0;
            state_ = State::AwaitingHeader;
            ++frames_decoded_;
            return body;
        }

        if (!try_consume_header()) {
            return std::nullopt;
        }
    }
}

} // namespace dapwire
