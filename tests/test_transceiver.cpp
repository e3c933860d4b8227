#include <gtest/gtest.h>

#include <string>

#include "fake_transport.hpp"
#include "transceiver.hpp"

class TransceiverTest : public ::testing::Test {
protected:
    void configure() {
        transceiver.mark_sample_rate_configured();
        transceiver.mark_filter_bandwidth_configured();
    }

    FakeTransport usb;
    Transceiver transceiver;
    std::string error;
};

TEST_F(TransceiverTest, ReceiveNeedsConfiguration) {
    EXPECT_EQ(transceiver.set_mode(usb, TransceiverMode::Receive, &error), Status::NotConfigured);
    EXPECT_NE(error.find("sample rate"), std::string::npos);

    transceiver.mark_sample_rate_configured();
    EXPECT_EQ(transceiver.set_mode(usb, TransceiverMode::Receive, &error), Status::NotConfigured);
    EXPECT_NE(error.find("filter bandwidth"), std::string::npos);

    EXPECT_TRUE(usb.control_calls().empty());
    EXPECT_EQ(transceiver.mode(), TransceiverMode::Off);
}

TEST_F(TransceiverTest, TransmitNeedsConfiguration) {
    EXPECT_EQ(transceiver.set_mode(usb, TransceiverMode::Transmit, &error), Status::NotConfigured);
    EXPECT_TRUE(usb.control_calls().empty());
}

TEST_F(TransceiverTest, SuccessfulModeSetUpdatesState) {
    configure();
    ASSERT_EQ(transceiver.set_mode(usb, TransceiverMode::Receive, &error), Status::Success);
    EXPECT_EQ(transceiver.mode(), TransceiverMode::Receive);

    const auto calls = usb.control_calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].request, req(Request::SetTransceiverMode));
    EXPECT_EQ(calls[0].value, 1);

    // repeating the current mode sends nothing
    EXPECT_EQ(transceiver.set_mode(usb, TransceiverMode::Receive, &error), Status::Success);
    EXPECT_EQ(usb.control_calls().size(), 1u);

    ASSERT_EQ(transceiver.set_mode(usb, TransceiverMode::Off, &error), Status::Success);
    EXPECT_EQ(transceiver.mode(), TransceiverMode::Off);
    EXPECT_EQ(usb.control_calls().back().value, 0);
}

TEST_F(TransceiverTest, FailedTransferKeepsState) {
    configure();
    usb.set_control_error(TransferError::Timeout);
    EXPECT_EQ(transceiver.set_mode(usb, TransceiverMode::Receive, &error), Status::TransportTimeout);
    EXPECT_EQ(transceiver.mode(), TransceiverMode::Off);

    usb.set_control_error(TransferError::None);
    ASSERT_EQ(transceiver.set_mode(usb, TransceiverMode::Receive, &error), Status::Success);

    usb.set_control_error(TransferError::Stall);
    EXPECT_EQ(transceiver.set_mode(usb, TransceiverMode::Off, &error), Status::TransportStall);
    EXPECT_EQ(transceiver.mode(), TransceiverMode::Receive);
}

TEST_F(TransceiverTest, StopOnVanishedDeviceEndsOff) {
    configure();
    ASSERT_EQ(transceiver.set_mode(usb, TransceiverMode::Receive, &error), Status::Success);

    usb.disconnect();
    EXPECT_EQ(transceiver.set_mode(usb, TransceiverMode::Off, &error), Status::TransportNoDevice);
    EXPECT_EQ(transceiver.mode(), TransceiverMode::Off);
}

TEST_F(TransceiverTest, DirectSwitchBetweenReceiveAndTransmitIsRejected) {
    configure();
    ASSERT_EQ(transceiver.set_mode(usb, TransceiverMode::Receive, &error), Status::Success);
    usb.clear_calls();

    EXPECT_EQ(transceiver.set_mode(usb, TransceiverMode::Transmit, &error), Status::InvalidTransition);
    EXPECT_TRUE(usb.control_calls().empty());
    EXPECT_EQ(transceiver.mode(), TransceiverMode::Receive);
}

TEST_F(TransceiverTest, OffIsAlwaysSent) {
    EXPECT_EQ(transceiver.set_mode(usb, TransceiverMode::Off, &error), Status::Success);
    EXPECT_EQ(transceiver.set_mode(usb, TransceiverMode::Off, &error), Status::Success);
    EXPECT_EQ(usb.control_calls().size(), 2u);
}

TEST_F(TransceiverTest, ForgetClearsConfiguration) {
    configure();
    ASSERT_EQ(transceiver.set_mode(usb, TransceiverMode::Receive, &error), Status::Success);

    transceiver.forget();
    EXPECT_EQ(transceiver.mode(), TransceiverMode::Off);
    EXPECT_FALSE(transceiver.is_configured());
    EXPECT_EQ(transceiver.set_mode(usb, TransceiverMode::Receive, &error), Status::NotConfigured);
}
