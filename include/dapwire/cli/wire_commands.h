#pragma once

#include <dapwire/core/types.h>
#include <dapwire/protocol/transport_config.h>

#include <cstdint>
#include <istream>
#include <ostream>

namespace dapwire::cli {

struct WireReport {
    uint64_t messages{0};
    uint64_t failures{0};
};

// Framed bytes in, one JSON message per line out. Malformed payloads are logged and skipped;
// a trailing partial frame counts as a failure.
Result<WireReport> decodeStream(std::istream& in, std::ostream& out, const TransportConfig& cfg);

// One JSON message per line in ("type" plus type-specific fields), framed bytes out.
// Messages are re-sequenced from 1; lines that cannot be sent are logged and skipped.
Result<WireReport> encodeStream(std::istream& in, std::ostream& out, const TransportConfig& cfg);

} // namespace dapwire::cli
