#include <gtest/gtest.h>

#include <vector>
#include "command_channel.hpp"
#include "fakes.hpp"

namespace picoled {
namespace {

using test::FakeBus;
using test::FakeLine;

class CommandChannelTest : public ::testing::Test {
protected:
    FakeLine dc{"dc"};
    FakeBus bus{dc};
};

TEST_F(CommandChannelTest, InitParksSelectorLow) {
    CommandChannel ch(bus, dc);
    dc.level = Level::High;
    ch.init();
    EXPECT_TRUE(dc.is_output);
    EXPECT_EQ(dc.level, Level::Low);
}

TEST_F(CommandChannelTest, BareCommandGoesOutWithSelectorLow) {
    CommandChannel ch(bus, dc);
    ch.init();
    ASSERT_EQ(ch.send_command(0xAF), Status::Ok);
    ASSERT_EQ(bus.writes.size(), 1u);
    EXPECT_EQ(bus.writes[0].bytes, std::vector<uint8_t>{0xAF});
    EXPECT_EQ(bus.writes[0].dc, Level::Low);
}

TEST_F(CommandChannelTest, CommandArgumentsTravelOnTheDataPath) {
    CommandChannel ch(bus, dc);
    ch.init();
    const uint8_t args[] = {0xC8, 0x80, 0xC8};
    ASSERT_EQ(ch.send_command(0xC1, args), Status::Ok);
    ASSERT_EQ(bus.writes.size(), 2u);
    EXPECT_EQ(bus.writes[0].bytes, std::vector<uint8_t>{0xC1});
    EXPECT_EQ(bus.writes[0].dc, Level::Low);
    EXPECT_EQ(bus.writes[1].bytes, (std::vector<uint8_t>{0xC8, 0x80, 0xC8}));
    EXPECT_EQ(bus.writes[1].dc, Level::High);
    EXPECT_EQ(dc.level, Level::Low);
}

TEST_F(CommandChannelTest, InlineCommandBytesStayLow) {
    CommandChannel ch(bus, dc);
    ch.init();
    const uint8_t bytes[] = {0xB3, 0xF1};
    ASSERT_EQ(ch.send_command_bytes(bytes, 2), Status::Ok);
    ASSERT_EQ(bus.writes.size(), 1u);
    EXPECT_EQ(bus.writes[0].bytes, (std::vector<uint8_t>{0xB3, 0xF1}));
    EXPECT_EQ(bus.writes[0].dc, Level::Low);
}

TEST_F(CommandChannelTest, EmptyArgumentListIsRejected) {
    CommandChannel ch(bus, dc);
    ch.init();
    const uint8_t arg = 0;
    EXPECT_EQ(ch.send_command(0xA0, nullptr, 1), Status::InvalidArgument);
    EXPECT_EQ(ch.send_command(0xA0, &arg, 0), Status::InvalidArgument);
    EXPECT_EQ(ch.send_command_bytes(nullptr, 0), Status::InvalidArgument);
    EXPECT_TRUE(bus.writes.empty());
}

TEST_F(CommandChannelTest, DataIsChunkedToTransferLimit) {
    CommandChannel ch(bus, dc, 255);
    ch.init();
    std::vector<uint8_t> payload(300);
    for (size_t i = 0; i < payload.size(); ++i) payload[i] = static_cast<uint8_t>(i);
    payload[0] = 0xAB;
    payload[1] = 0xCD;

    ASSERT_EQ(ch.send_data(payload.data(), payload.size()), Status::Ok);

    ASSERT_EQ(bus.writes.size(), 2u);
    EXPECT_EQ(bus.writes[0].bytes.size(), 255u);
    EXPECT_EQ(bus.writes[1].bytes.size(), 45u);
    EXPECT_EQ(bus.writes[0].dc, Level::High);
    EXPECT_EQ(bus.writes[1].dc, Level::High);
    EXPECT_EQ(bus.data_bytes(), payload);
    // One raise for the whole payload, one drop after the last chunk
    ASSERT_EQ(dc.history.size(), 3u);
    EXPECT_EQ(dc.history[1], Level::High);
    EXPECT_EQ(dc.history[2], Level::Low);
}

TEST_F(CommandChannelTest, DefaultLimitIs1024) {
    CommandChannel ch(bus, dc);
    ch.init();
    std::vector<uint8_t> payload(2049, 0x55);
    ASSERT_EQ(ch.send_data(payload.data(), payload.size()), Status::Ok);
    ASSERT_EQ(bus.writes.size(), 3u);
    EXPECT_EQ(bus.writes[0].bytes.size(), 1024u);
    EXPECT_EQ(bus.writes[1].bytes.size(), 1024u);
    EXPECT_EQ(bus.writes[2].bytes.size(), 1u);
}

TEST_F(CommandChannelTest, ZeroLimitStillMakesProgress) {
    CommandChannel ch(bus, dc, 0);
    EXPECT_EQ(ch.max_transfer_bytes(), 1u);
    ch.init();
    const uint8_t data[] = {1, 2, 3};
    ASSERT_EQ(ch.send_data(data, 3), Status::Ok);
    EXPECT_EQ(bus.writes.size(), 3u);
}

TEST_F(CommandChannelTest, EmptyPayloadTouchesNothing) {
    CommandChannel ch(bus, dc);
    ch.init();
    const size_t toggles = dc.history.size();
    EXPECT_EQ(ch.send_data(nullptr, 0), Status::Ok);
    EXPECT_TRUE(bus.writes.empty());
    EXPECT_EQ(dc.history.size(), toggles);
}

TEST_F(CommandChannelTest, TransportFailureStopsAndRestoresSelector) {
    CommandChannel ch(bus, dc, 100);
    ch.init();
    bus.fail_at = 1;
    std::vector<uint8_t> payload(350, 0xEE);
    EXPECT_EQ(ch.send_data(payload.data(), payload.size()), Status::TransportError);
    // First chunk ok, second fails, the rest is never attempted
    EXPECT_EQ(bus.writes.size(), 2u);
    EXPECT_EQ(dc.level, Level::Low);
}

TEST_F(CommandChannelTest, OpcodeFailureSkipsArguments) {
    CommandChannel ch(bus, dc);
    ch.init();
    bus.fail_at = 0;
    const uint8_t args[] = {0x12};
    EXPECT_EQ(ch.send_command(0xFD, args), Status::TransportError);
    EXPECT_EQ(bus.writes.size(), 1u);
    EXPECT_EQ(dc.level, Level::Low);
}

} // namespace
} // namespace picoled
