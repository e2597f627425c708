#include <dapwire/cli/wire_commands.h>
#include <dapwire/protocol/transport_config.h>
#include <dapwire/version.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

spdlog::level::level_enum parseLevel(std::string level) {
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "info")
        return spdlog::level::info;
    if (level == "error")
        return spdlog::level::err;
    if (level == "critical")
        return spdlog::level::critical;
    if (level == "off")
        return spdlog::level::off;
    return spdlog::level::warn;
}

// stdout carries protocol bytes; all diagnostics go to stderr
void setupLogging(const std::string& level) {
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("dapwire", stderr_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(parseLevel(level));
    spdlog::flush_on(spdlog::level::warn);
}

int finish(const dapwire::Result<dapwire::cli::WireReport>& result, const char* verb) {
    if (!result) {
        spdlog::error("{} failed: {}", verb, result.error().message);
        return 2;
    }
    const auto& report = result.value();
    spdlog::info("{}: {} message(s), {} failure(s)", verb, report.messages, report.failures);
    return report.failures == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"dapwire - Content-Length framed debug protocol wire tool"};
    app.set_version_flag("--version", std::string(dapwire::version::string_v));
    app.require_subcommand(1);

    std::string logLevel = "warn";
    app.add_option("--log-level", logLevel, "trace|debug|info|warn|error|critical|off")
        ->envname("DAPWIRE_LOG_LEVEL");

    dapwire::TransportConfig config = dapwire::TransportConfig::fromEnvironment();
    std::size_t maxContentLength = config.maxContentLength;
    app.add_option("--max-content-length", maxContentLength,
                   "Largest accepted frame body in bytes (0 = unlimited)");
    bool trace = false;
    app.add_flag("--trace-frames", trace, "Log every frame body at trace level");

    auto* decode = app.add_subcommand("decode", "Framed stdin to one JSON message per line");
    auto* encode = app.add_subcommand("encode", "One JSON message per line to framed stdout");

    CLI11_PARSE(app, argc, argv);

    setupLogging(logLevel);
    config.maxContentLength = maxContentLength;
    config.traceFrames = config.traceFrames || trace;

    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    try {
        if (decode->parsed()) {
            return finish(dapwire::cli::decodeStream(std::cin, std::cout, config), "decode");
        }
        if (encode->parsed()) {
            return finish(dapwire::cli::encodeStream(std::cin, std::cout, config), "encode");
        }
    } catch (const std::exception& e) {
        spdlog::critical("Unhandled exception: {}", e.what());
        return 2;
    }
    return 0;
}
