#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <complex>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "fake_transport.hpp"
#include "hackrf_one.hpp"

static const SdrConfig TEST_CONFIG {
    .center_freq_hz = 915000000ULL,
    .sample_rate = 10000000
};

class HackrfOneTest : public ::testing::Test {
protected:
    HackrfOneTest()
        : fake(std::make_shared<FakeTransport>())
        , device(std::make_unique<HackrfOne>(std::make_unique<SharedTransport>(fake)))
    {}

    // polls until `condition` holds or two seconds pass
    template <typename Condition>
    static bool wait_for(Condition condition) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (!condition()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return true;
    }

    std::shared_ptr<FakeTransport> fake;
    std::unique_ptr<HackrfOne> device;
};

TEST_F(HackrfOneTest, ConfigureIssuesRequestsInOrder) {
    ASSERT_EQ(device->configure(TEST_CONFIG), Status::Success);

    const std::vector<uint8_t> expected = {
        req(Request::SetFreq),
        req(Request::SampleRateSet),
        req(Request::BasebandFilterBandwidthSet),
        req(Request::SetLnaGain),
        req(Request::SetVgaGain),
        req(Request::AmpEnable),
        req(Request::AntennaEnable)
    };
    EXPECT_EQ(fake->requests(), expected);

    // 7 MHz derived from the 10 MHz sample rate
    const auto calls = fake->control_calls();
    EXPECT_EQ(calls[2].value, 0xCFC0);
    EXPECT_EQ(calls[2].index, 0x006A);
    EXPECT_EQ(calls[3].index, 16);
}

TEST_F(HackrfOneTest, ConfigureStopsAtFirstFailure) {
    fake->set_control_error(TransferError::Stall);
    EXPECT_EQ(device->configure(TEST_CONFIG), Status::TransportStall);
    EXPECT_EQ(fake->control_calls().size(), 1u);
    EXPECT_NE(device->get_last_error().find("set_freq"), std::string::npos);
}

TEST_F(HackrfOneTest, ConfigureRejectsBadGainWithoutSending) {
    SdrConfig config = TEST_CONFIG;
    config.lna_gain = 50;
    EXPECT_EQ(device->configure(config), Status::GainOutOfRange);
    EXPECT_EQ(fake->control_calls().size(), 3u);
    EXPECT_NE(device->get_last_error().find("above maximum"), std::string::npos);
}

TEST_F(HackrfOneTest, ExplicitFilterOverridesDerivedOne) {
    SdrConfig config = TEST_CONFIG;
    config.baseband_filter_bw = 5000000;
    ASSERT_EQ(device->configure(config), Status::Success);

    const auto calls = fake->control_calls();
    ASSERT_GE(calls.size(), 4u);
    EXPECT_EQ(calls[2].request, req(Request::BasebandFilterBandwidthSet));
    EXPECT_EQ(calls[3].request, req(Request::BasebandFilterBandwidthSet));
    EXPECT_EQ(calls[3].value, 0x4B40);
    EXPECT_EQ(calls[3].index, 0x004C);
}

TEST_F(HackrfOneTest, GainsAreNotTruncatedToAByte) {
    SdrConfig config = TEST_CONFIG;
    config.lna_gain = 264;
    EXPECT_EQ(device->configure(config), Status::GainOutOfRange);
    EXPECT_NE(device->get_last_error().find("264 dB above maximum"), std::string::npos);

    config.lna_gain = -8;
    EXPECT_EQ(device->configure(config), Status::GainOutOfRange);
    EXPECT_NE(device->get_last_error().find("-8 dB below minimum"), std::string::npos);

    for (const auto& call : fake->control_calls()) {
        EXPECT_NE(call.request, req(Request::SetLnaGain));
    }
}

TEST_F(HackrfOneTest, SampleRateAloneProgramsFilter) {
    ASSERT_EQ(device->set_sample_rate(20000000), Status::Success);

    const std::vector<uint8_t> expected = {
        req(Request::SampleRateSet),
        req(Request::BasebandFilterBandwidthSet)
    };
    EXPECT_EQ(fake->requests(), expected);

    // 15 MHz, the widest setting within 75% of 20 MHz
    const auto calls = fake->control_calls();
    EXPECT_EQ(calls[1].value, 0xE1C0);
    EXPECT_EQ(calls[1].index, 0x00E4);

    EXPECT_EQ(device->set_transceiver_mode(TransceiverMode::Receive), Status::Success);
}

TEST_F(HackrfOneTest, ZeroDividerIsInvalid) {
    EXPECT_EQ(device->set_sample_rate(10000000, 0), Status::InvalidArgument);
    EXPECT_TRUE(fake->control_calls().empty());
}

TEST_F(HackrfOneTest, StartReceiveRequiresReceiveMode) {
    std::unique_ptr<SampleStream> stream;
    EXPECT_EQ(device->start_receive(&stream), Status::NotReceiving);
    EXPECT_FALSE(stream);
}

TEST_F(HackrfOneTest, OneStreamAtATime) {
    ASSERT_EQ(device->configure(TEST_CONFIG), Status::Success);
    ASSERT_EQ(device->set_transceiver_mode(TransceiverMode::Receive), Status::Success);

    std::unique_ptr<SampleStream> first;
    ASSERT_EQ(device->start_receive(&first, 64), Status::Success);

    std::unique_ptr<SampleStream> second;
    EXPECT_EQ(device->start_receive(&second, 64), Status::StreamActive);
    EXPECT_FALSE(second);

    // the device-level stop reaches the stream between reads
    device->request_stop();
    std::vector<std::complex<int8_t>> samples;
    EXPECT_FALSE(first->next(samples));
    EXPECT_EQ(first->end_cause(), StreamEnd::Stopped);

    EXPECT_EQ(device->start_receive(&second, 64), Status::Success);
    second.reset();
    first.reset();
}

TEST_F(HackrfOneTest, StartRxRequiresConfiguration) {
    const SampleCallback callback = [](const std::complex<int8_t>*, std::size_t) {};
    EXPECT_EQ(device->start_rx(callback, 64), Status::NotConfigured);
    EXPECT_FALSE(device->is_streaming());
    EXPECT_EQ(device->transceiver_mode(), TransceiverMode::Off);
}

TEST_F(HackrfOneTest, StartAndStopRx) {
    ASSERT_EQ(device->configure(TEST_CONFIG), Status::Success);

    std::atomic<int> batches{0};
    const SampleCallback callback = [&](const std::complex<int8_t>*, std::size_t) { batches++; };
    ASSERT_EQ(device->start_rx(callback, 64), Status::Success);
    EXPECT_EQ(device->transceiver_mode(), TransceiverMode::Receive);
    EXPECT_EQ(device->start_rx(callback, 64), Status::StreamActive);

    ASSERT_TRUE(wait_for([&]() { return batches.load() > 0; }));
    EXPECT_TRUE(device->is_streaming());

    EXPECT_EQ(device->stop_rx(), Status::Success);
    EXPECT_FALSE(device->is_streaming());
    EXPECT_EQ(device->rx_end_cause(), StreamEnd::Stopped);
    EXPECT_EQ(device->transceiver_mode(), TransceiverMode::Off);

    const auto last = fake->control_calls().back();
    EXPECT_EQ(last.request, req(Request::SetTransceiverMode));
    EXPECT_EQ(last.value, 0);

    // stopping twice is harmless
    EXPECT_EQ(device->stop_rx(), Status::Success);
}

TEST_F(HackrfOneTest, NoEndCauseBeforeFirstRx) {
    EXPECT_EQ(device->rx_end_cause(), StreamEnd::NotStarted);
    EXPECT_FALSE(device->is_streaming());
}

TEST_F(HackrfOneTest, CallbackMayCallIntoDeviceWhileStopping) {
    ASSERT_EQ(device->configure(TEST_CONFIG), Status::Success);

    std::atomic<bool> in_callback{false};
    std::atomic<bool> called_back{false};
    HackrfOne* dev = device.get();
    const SampleCallback callback = [&](const std::complex<int8_t>*, std::size_t) {
        if (in_callback.exchange(true)) {
            return;
        }
        // give stop_rx() time to start waiting for this thread
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        dev->request_stop();
        called_back = true;
    };
    ASSERT_EQ(device->start_rx(callback, 64), Status::Success);
    ASSERT_TRUE(wait_for([&]() { return in_callback.load(); }));

    EXPECT_EQ(device->stop_rx(), Status::Success);
    EXPECT_TRUE(called_back.load());
    EXPECT_EQ(device->rx_end_cause(), StreamEnd::Stopped);
    EXPECT_EQ(device->transceiver_mode(), TransceiverMode::Off);
}

TEST_F(HackrfOneTest, UnplugDuringRx) {
    ASSERT_EQ(device->configure(TEST_CONFIG), Status::Success);
    const SampleCallback callback = [](const std::complex<int8_t>*, std::size_t) {};
    ASSERT_EQ(device->start_rx(callback, 64), Status::Success);

    fake->disconnect();
    ASSERT_TRUE(wait_for([&]() { return !device->is_streaming(); }));
    EXPECT_EQ(device->rx_end_cause(), StreamEnd::Disconnected);

    // switching off a vanished device fails but the state still ends Off
    EXPECT_EQ(device->stop_rx(), Status::TransportNoDevice);
    EXPECT_EQ(device->transceiver_mode(), TransceiverMode::Off);
}

TEST_F(HackrfOneTest, DestructionSwitchesOff) {
    ASSERT_EQ(device->configure(TEST_CONFIG), Status::Success);
    const SampleCallback callback = [](const std::complex<int8_t>*, std::size_t) {};
    ASSERT_EQ(device->start_rx(callback, 64), Status::Success);

    device.reset();

    const auto last = fake->control_calls().back();
    EXPECT_EQ(last.request, req(Request::SetTransceiverMode));
    EXPECT_EQ(last.value, 0);
}

TEST_F(HackrfOneTest, DestructionAfterPullStreamSwitchesOff) {
    ASSERT_EQ(device->configure(TEST_CONFIG), Status::Success);
    ASSERT_EQ(device->set_transceiver_mode(TransceiverMode::Receive), Status::Success);

    device.reset();

    const auto last = fake->control_calls().back();
    EXPECT_EQ(last.request, req(Request::SetTransceiverMode));
    EXPECT_EQ(last.value, 0);
}

TEST_F(HackrfOneTest, FirmwareGates) {
    fake->release = 0x0102;
    EXPECT_EQ(device->set_clkout_enable(true), Status::UnsupportedFirmware);
    EXPECT_NE(device->get_last_error().find("1.03"), std::string::npos);
    EXPECT_TRUE(fake->control_calls().empty());

    fake->release = 0x0101;
    EXPECT_EQ(device->reset(), Status::UnsupportedFirmware);
    EXPECT_TRUE(fake->control_calls().empty());

    fake->release = 0x0103;
    EXPECT_EQ(device->set_clkout_enable(true), Status::Success);
    EXPECT_EQ(device->reset(), Status::Success);
    EXPECT_EQ(fake->requests(), (std::vector<uint8_t>{req(Request::ClkoutEnable), req(Request::Reset)}));
}

TEST_F(HackrfOneTest, ResetForgetsConfiguration) {
    ASSERT_EQ(device->configure(TEST_CONFIG), Status::Success);
    ASSERT_EQ(device->set_transceiver_mode(TransceiverMode::Receive), Status::Success);

    ASSERT_EQ(device->reset(), Status::Success);
    EXPECT_EQ(device->transceiver_mode(), TransceiverMode::Off);
    EXPECT_EQ(device->set_transceiver_mode(TransceiverMode::Receive), Status::NotConfigured);
}

TEST_F(HackrfOneTest, DeviceInformation) {
    fake->queue_response({BOARD_ID_HACKRF1_OG});
    uint8_t board_id = BOARD_ID_UNDETECTED;
    ASSERT_EQ(device->board_id_read(&board_id), Status::Success);
    EXPECT_EQ(board_id, BOARD_ID_HACKRF1_OG);
    EXPECT_STREQ(board_id_name(board_id), "HackRF One");
    EXPECT_STREQ(board_id_name(0x42), "unrecognized");

    fake->queue_response({'g', 'i', 't', '-', '1', 0});
    std::string version;
    ASSERT_EQ(device->version_string_read(&version), Status::Success);
    EXPECT_EQ(version, "git-1");

    fake->queue_response(std::vector<uint8_t>(24, 0x11));
    PartIdSerialNo serno {};
    ASSERT_EQ(device->board_partid_serialno_read(&serno), Status::Success);
    EXPECT_EQ(serno.serial_no[0], 0x11111111u);

    EXPECT_EQ(device->usb_api_version().to_string(), "1.04");
    EXPECT_NE(device->get_device_info().find("HackRF"), std::string::npos);
}
