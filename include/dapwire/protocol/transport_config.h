#pragma once

#include <dapwire/protocol/frame_codec.h>

#include <cstddef>

namespace dapwire {

struct TransportConfig {
    // Headers announcing a larger body are discarded as framing errors; 0 = unlimited.
    std::size_t maxContentLength{kDefaultMaxContentLength};
    // Consumed receive-buffer prefix that forces compaction on the next append.
    std::size_t compactThreshold{kDefaultCompactThreshold};
    // On close(): true fails each pending request once, false drops them (counted).
    bool failPendingOnClose{true};
    // Log every inbound/outbound body at trace level.
    bool traceFrames{false};

    // Defaults overridden by DAPWIRE_MAX_CONTENT_LENGTH, DAPWIRE_COMPACT_THRESHOLD,
    // DAPWIRE_FAIL_PENDING_ON_CLOSE and DAPWIRE_TRACE_FRAMES. Unparsable values are ignored.
    static TransportConfig fromEnvironment();
};

} // namespace dapwire
