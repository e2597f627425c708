#include <dapwire/protocol/transport_config.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace dapwire {

namespace {

std::optional<std::size_t> envSize(const char* name) {
    const char* env = std::getenv(name);
    if (!env || !*env) {
        return std::nullopt;
    }
    std::string_view text(env);
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        spdlog::warn("Ignoring {}='{}': not a non-negative integer", name, text);
        return std::nullopt;
    }
    return value;
}

std::optional<bool> envFlag(const char* name) {
    const char* env = std::getenv(name);
    if (!env || !*env) {
        return std::nullopt;
    }
    std::string v(env);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "on" || v == "yes") {
        return true;
    }
    if (v == "0" || v == "false" || v == "off" || v == "no") {
        return false;
    }
    spdlog::warn("Ignoring {}='{}': expected a boolean", name, env);
    return std::nullopt;
}

} // namespace

TransportConfig TransportConfig::fromEnvironment() {
    TransportConfig cfg;
    if (auto v = envSize("DAPWIRE_MAX_CONTENT_LENGTH")) {
        cfg.maxContentLength = *v;
    }
    if (auto v = envSize("DAPWIRE_COMPACT_THRESHOLD")) {
        cfg.compactThreshold = *v;
    }
    if (auto v = envFlag("DAPWIRE_FAIL_PENDING_ON_CLOSE")) {
        cfg.failPendingOnClose = *v;
    }
    if (auto v = envFlag("DAPWIRE_TRACE_FRAMES")) {
        cfg.traceFrames = *v;
    }
    return cfg;
}

} // namespace dapwire
