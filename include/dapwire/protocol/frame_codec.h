#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace dapwire {

// Wire format: "Content-Length: <N>\r\n\r\n" followed by N bytes of UTF-8 JSON.
inline constexpr std::string_view kContentLengthPrefix = "Content-Length: ";
inline constexpr std::string_view kHeaderSeparator = "\r\n\r\n";

inline constexpr std::size_t kDefaultMaxContentLength = 64 * 1024 * 1024;
inline constexpr std::size_t kDefaultCompactThreshold = 64 * 1024;

// Header immediately followed by body; N is the byte size of `body`.
std::string encode_frame(std::string_view body);

// Locates a `Content-Length: <digits>` token anywhere in the header text.
// Returns nullopt when absent or when the value does not fit in size_t.
std::optional<std::size_t> parse_content_length(std::string_view header) noexcept;

// Incremental framer. Bytes are appended in arbitrary chunks; next_frame() drains complete
// bodies one at a time in arrival order and returns nullopt once more input is required.
//
// The receive buffer grows at the back and is consumed through a read offset; the consumed
// prefix is compacted away on append once it passes the threshold or outweighs the unread
// remainder.
class FrameDecoder {
public:
    explicit FrameDecoder(std::size_t max_content_length = kDefaultMaxContentLength,
                          std::size_t compact_threshold = kDefaultCompactThreshold);

    FrameDecoder(const FrameDecoder&) = delete;
    FrameDecoder& operator=(const FrameDecoder&) = delete;

    void append(std::string_view bytes);
    void append(std::span<const uint8_t> bytes);

    // Next complete body (possibly empty for a zero-length frame).
    std::optional<std::string> next_frame();

    bool awaiting_body() const noexcept { return state_ == State::AwaitingBody; }
    std::size_t expected_length() const noexcept { return expected_length_; }
    std::size_t buffered_bytes() const noexcept { return buffer_.size() - read_pos_; }
    std::size_t capacity() const noexcept { return buffer_.capacity(); }

    uint64_t frames_decoded() const noexcept { return frames_decoded_; }
    // Header blocks dropped because they carried no usable Content-Length.
    uint64_t headers_discarded() const noexcept { return headers_discarded_; }

    void reset();

private:
    enum class State { AwaitingHeader, AwaitingBody };

    void compact();
    bool try_consume_header();

    std::string buffer_;
    std::size_t read_pos_{0};
    std::size_t scan_pos_{0}; // separator search resumes here
    State state_{State::AwaitingHeader};
    std::size_t expected_length_{0};

    std::size_t max_content_length_;
    std::size_t compact_threshold_;

    uint64_t frames_decoded_{0};
    uint64_t headers_discarded_{0};
};

} // namespace dapwire
