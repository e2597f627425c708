#include <gtest/gtest.h>
#include <dapwire/cli/wire_commands.h>
#include <dapwire/protocol/frame_codec.h>
#include <dapwire/protocol/messages.h>

#include <sstream>
#include <string>
#include <vector>

namespace dapwire::test {

using cli::decodeStream;
using cli::encodeStream;

namespace {

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        out.push_back(line);
    }
    return out;
}

} // namespace

TEST(WireCommandsTest, DecodeWritesOneLinePerMessage) {
    std::istringstream in("Garbage\r\n\r\n" +
                          encode_frame(R"({"seq":1,"type":"request","command":"initialize"})") +
                          encode_frame("") +
                          encode_frame(R"({"seq":2,"type":"event","event":"initialized"})"));
    std::ostringstream out;

    auto report = decodeStream(in, out, TransportConfig{});
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_EQ(report.value().messages, 2u);
    EXPECT_EQ(report.value().failures, 0u);
    EXPECT_EQ(lines(out.str()),
              (std::vector<std::string>{R"({"seq":1,"type":"request","command":"initialize"})",
                                        R"({"seq":2,"type":"event","event":"initialized"})"}));
}

TEST(WireCommandsTest, DecodeCountsMalformedAndTruncatedFrames) {
    std::istringstream in(encode_frame("{not json") +
                          encode_frame(R"({"seq":2,"type":"event","event":"output"})") +
                          "Content-Length: 40\r\n\r\n{\"seq\":3");
    std::ostringstream out;

    auto report = decodeStream(in, out, TransportConfig{});
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_EQ(report.value().messages, 1u);
    EXPECT_EQ(report.value().failures, 2u);
    EXPECT_EQ(lines(out.str()).size(), 1u);
}

TEST(WireCommandsTest, EncodeResequencesMessages) {
    std::istringstream in(
        R"({"seq":40,"type":"request","command":"initialize","arguments":{"adapterID":"mock"}})"
        "\n"
        "\n"
        R"({"type":"event","event":"initialized"})"
        "\n"
        R"({"seq":7,"type":"response","request_seq":1,"command":"initialize","success":true})"
        "\n");
    std::ostringstream out;

    auto report = encodeStream(in, out, TransportConfig{});
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_EQ(report.value().messages, 3u);
    EXPECT_EQ(report.value().failures, 0u);

    const std::string expected =
        encode_frame(
            R"({"seq":1,"type":"request","command":"initialize","arguments":{"adapterID":"mock"}})") +
        encode_frame(R"({"seq":2,"type":"event","event":"initialized"})") +
        encode_frame(
            R"({"seq":3,"type":"response","request_seq":1,"command":"initialize","success":true})");
    EXPECT_EQ(out.str(), expected);
}

TEST(WireCommandsTest, EncodeSkipsLinesThatCannotBeSent) {
    std::istringstream in("not json\n"
                          R"({"type":"notification"})"
                          "\n"
                          R"({"type":"event"})"
                          "\n"
                          R"({"type":"event","event":"terminated"})"
                          "\n");
    std::ostringstream out;

    auto report = encodeStream(in, out, TransportConfig{});
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_EQ(report.value().messages, 1u);
    EXPECT_EQ(report.value().failures, 3u);
    EXPECT_EQ(out.str(), encode_frame(R"({"seq":1,"type":"event","event":"terminated"})"));
}

TEST(WireCommandsTest, EncodeThenDecodeRestoresMessages) {
    std::istringstream source(R"({"type":"event","event":"output","body":{"output":"hi\r\n\r\n"}})"
                              "\n");
    std::ostringstream framed;
    ASSERT_TRUE(encodeStream(source, framed, TransportConfig{}));

    std::istringstream wire(framed.str());
    std::ostringstream decoded;
    auto report = decodeStream(wire, decoded, TransportConfig{});
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_EQ(decoded.str(),
              R"({"seq":1,"type":"event","event":"output","body":{"output":"hi\r\n\r\n"}})"
              "\n");
}

} // namespace dapwire::test
