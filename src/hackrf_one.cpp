#include "hackrf_one.hpp"

#include <cstdio>

#include <fmt/format.h>

#include "usb_libusb.hpp"

Version Version::from_bcd(uint16_t raw) {
    // 0xJJMN: JJ major as two BCD digits, M minor, N sub-minor
    const uint8_t major_tens = (raw >> 12) & 0x0F;
    const uint8_t major_ones = (raw >> 8) & 0x0F;
    return Version {
        .major = static_cast<uint8_t>(major_tens * 10 + major_ones),
        .minor = static_cast<uint8_t>((raw >> 4) & 0x0F),
        .sub_minor = static_cast<uint8_t>(raw & 0x0F)
    };
}

std::string Version::to_string() const {
    return fmt::format("{}.{}{}", major, minor, sub_minor);
}

const char* board_id_name(uint8_t board_id) {
    switch (board_id) {
        case BOARD_ID_JELLYBEAN:    return "Jellybean";
        case BOARD_ID_JAWBREAKER:   return "Jawbreaker";
        case BOARD_ID_HACKRF1_OG:   return "HackRF One";
        case BOARD_ID_RAD1O:        return "rad1o";
        case BOARD_ID_HACKRF1_R9:   return "HackRF One r9";
        case BOARD_ID_UNDETECTED:   return "undetected";
        case BOARD_ID_UNRECOGNIZED:
        default:                    return "unrecognized";
    }
}

HackrfOne::HackrfOne(std::unique_ptr<UsbTransport> transport)
    : transport(std::move(transport))
{
}

HackrfOne::~HackrfOne() {
    request_stop();
    const Status stopped = stop_rx();
    if (stopped != Status::Success && stopped != Status::TransportNoDevice) {
        std::fprintf(stderr, "Warning: stop_rx() failed: %s\n", last_error.c_str());
    }

    // a pull-style receive may still have the radio on
    if (transceiver.mode() != TransceiverMode::Off) {
        std::string error;
        const Status result = transceiver.set_mode(*transport, TransceiverMode::Off, &error);
        if (result != Status::Success && result != Status::TransportNoDevice) {
            std::fprintf(stderr, "Warning: could not switch transceiver off: %s\n", error.c_str());
        }
    }
}

std::unique_ptr<HackrfOne> HackrfOne::open(const char* serial, std::string* error) {
    auto usb = std::make_unique<LibusbTransport>();
    if (!usb->open(serial)) {
        if (error) {
            *error = usb->get_last_error();
        }
        return nullptr;
    }
    return std::make_unique<HackrfOne>(std::move(usb));
}

Status HackrfOne::fail(Status status, std::string message) {
    last_error = std::move(message);
    return status;
}

Status HackrfOne::execute_command(const Command& command, std::vector<uint8_t>* response) {
    std::string error;
    const Status result = execute(*transport, encode(command), response, &error);
    if (result != Status::Success) {
        last_error = std::move(error);
    }
    return result;
}

Status HackrfOne::require_api_version(Version min, const char* operation) {
    const Version device = usb_api_version();
    if (device.packed() < min.packed()) {
        return fail(Status::UnsupportedFirmware,
            fmt::format("{} needs USB API {} or later, device has {}",
                operation, min.to_string(), device.to_string()));
    }
    return Status::Success;
}

Status HackrfOne::configure(const SdrConfig& config) {
    Status result;

    // Set center frequency
    result = set_freq(config.center_freq_hz);
    if (result != Status::Success) {
        return result;
    }

    // Set sample rate
    result = set_sample_rate(config.sample_rate, config.sample_rate_divider);
    if (result != Status::Success) {
        return result;
    }

    // Override the derived baseband filter bandwidth
    if (config.baseband_filter_bw != 0) {
        result = set_baseband_filter_bandwidth(config.baseband_filter_bw);
        if (result != Status::Success) {
            return result;
        }
    }

    // Set LNA and VGA gain
    result = set_lna_gain(config.lna_gain);
    if (result != Status::Success) {
        return result;
    }
    result = set_vga_gain(config.vga_gain);
    if (result != Status::Success) {
        return result;
    }

    // Enable/disable amplifier
    result = set_amp_enable(config.amp_enable);
    if (result != Status::Success) {
        return result;
    }

    // Enable/disable bias-tee
    return set_antenna_enable(config.bias_tee);
}

Status HackrfOne::set_freq(uint64_t hz) {
    return execute_command(SetFreq{hz});
}

Status HackrfOne::set_sample_rate(uint32_t hz, uint32_t divider) {
    if (divider == 0) {
        return fail(Status::InvalidArgument, "sample rate divider must be at least 1");
    }
    const Status result = execute_command(SetSampleRate{hz, divider});
    if (result != Status::Success) {
        return result;
    }
    transceiver.mark_sample_rate_configured();

    // anti-aliasing filter follows the new rate
    return set_baseband_filter_bandwidth(auto_baseband_filter_bw(hz, divider));
}

Status HackrfOne::set_baseband_filter_bandwidth(uint32_t hz) {
    const Status result = execute_command(SetBasebandFilterBandwidth{hz});
    if (result == Status::Success) {
        transceiver.mark_filter_bandwidth_configured();
    }
    return result;
}

Status HackrfOne::set_gain(GainStage stage, int db) {
    std::string reason;
    Status result = validate_gain(stage, db, &reason);
    if (result != Status::Success) {
        return fail(result, std::move(reason));
    }

    std::vector<uint8_t> ack;
    result = execute_command(gain_command(stage, db), &ack);
    if (result != Status::Success) {
        return result;
    }
    if (ack[0] == 0) {
        return fail(Status::DeviceRejected,
            fmt::format("device rejected {} gain of {} dB", gain_stage_name(stage), db));
    }
    return Status::Success;
}

Status HackrfOne::set_amp_enable(bool enable) {
    return execute_command(SetAmpEnable{enable});
}

Status HackrfOne::set_antenna_enable(bool enable) {
    return execute_command(SetAntennaEnable{enable});
}

Status HackrfOne::set_clkout_enable(bool enable) {
    const Status result = require_api_version(Version::from_bcd(0x0103), "clkout_enable");
    if (result != Status::Success) {
        return result;
    }
    return execute_command(SetClkoutEnable{enable});
}

Status HackrfOne::set_transceiver_mode(TransceiverMode mode) {
    std::string error;
    const Status result = transceiver.set_mode(*transport, mode, &error);
    if (result != Status::Success) {
        last_error = std::move(error);
    }
    return result;
}

Status HackrfOne::board_id_read(uint8_t* board_id) {
    std::vector<uint8_t> response;
    const Status result = execute_command(ReadBoardId{}, &response);
    if (result == Status::Success) {
        *board_id = response[0];
    }
    return result;
}

Status HackrfOne::version_string_read(std::string* version) {
    std::vector<uint8_t> response;
    const Status result = execute_command(ReadVersionString{}, &response);
    if (result == Status::Success) {
        *version = decode_version_string(response);
    }
    return result;
}

Status HackrfOne::board_partid_serialno_read(PartIdSerialNo* partid_serialno) {
    std::vector<uint8_t> response;
    const Status result = execute_command(ReadPartIdSerialNo{}, &response);
    if (result == Status::Success) {
        *partid_serialno = decode_partid_serialno(response);
    }
    return result;
}

Version HackrfOne::usb_api_version() const {
    return Version::from_bcd(transport->device_release());
}

Status HackrfOne::reset() {
    Status result = require_api_version(Version::from_bcd(0x0102), "reset");
    if (result != Status::Success) {
        return result;
    }
    result = execute_command(ResetDevice{});
    if (result == Status::Success) {
        transceiver.forget();
    }
    return result;
}

Status HackrfOne::start_receive(std::unique_ptr<SampleStream>* stream, std::size_t transfer_size) {
    if (transceiver.mode() != TransceiverMode::Receive) {
        return fail(Status::NotReceiving,
            fmt::format("cannot start a sample stream in {} mode", transceiver_mode_name(transceiver.mode())));
    }

    std::lock_guard<std::mutex> lock(stream_mutex);
    const auto current = active_control.lock();
    if (current && !current->ended.load(std::memory_order_acquire)) {
        return fail(Status::StreamActive, "a sample stream is already running on this device");
    }

    auto control = std::make_shared<StreamControl>();
    *stream = std::make_unique<SampleStream>(*transport, transceiver, control, transfer_size);
    active_control = control;
    return Status::Success;
}

void HackrfOne::request_stop() {
    std::lock_guard<std::mutex> lock(stream_mutex);
    if (const auto control = active_control.lock()) {
        control->request_stop();
    }
}

Status HackrfOne::start_rx(SampleCallback callback, std::size_t transfer_size) {
    {
        std::lock_guard<std::mutex> lock(stream_mutex);
        if (rx_stopping) {
            return fail(Status::StreamActive, "previous receive is still stopping");
        }
        if (rx_thread.joinable()) {
            if (!rx_stream->is_finished()) {
                return fail(Status::StreamActive, "already streaming");
            }
            rx_thread.join();
        }
        rx_stream.reset();
    }

    const bool switched_on = transceiver.mode() != TransceiverMode::Receive;
    Status result = set_transceiver_mode(TransceiverMode::Receive);
    if (result != Status::Success) {
        return result;
    }

    std::unique_ptr<SampleStream> stream;
    result = start_receive(&stream, transfer_size);
    if (result != Status::Success) {
        std::string error;
        if (switched_on && transceiver.set_mode(*transport, TransceiverMode::Off, &error) != Status::Success) {
            std::fprintf(stderr, "Warning: could not switch transceiver off: %s\n", error.c_str());
        }
        return result;
    }

    std::lock_guard<std::mutex> lock(stream_mutex);
    rx_stream = std::move(stream);
    SampleStream* rx = rx_stream.get();
    rx_thread = std::thread([rx, callback = std::move(callback)]() {
        rx->run(callback);
    });
    return Status::Success;
}

Status HackrfOne::stop_rx() {
    std::thread receiver;
    SampleStream* stream = nullptr;
    {
        std::lock_guard<std::mutex> lock(stream_mutex);
        if (!rx_thread.joinable() || rx_stopping) {
            return Status::Success;
        }
        rx_stopping = true;
        rx_stream->request_stop();
        receiver = std::move(rx_thread);
        stream = rx_stream.get();
    }

    // joined without the lock, the callback may still call into the device
    receiver.join();

    Status stream_status;
    std::string stream_error;
    {
        std::lock_guard<std::mutex> lock(stream_mutex);
        stream_status = stream->status();
        stream_error = stream->get_last_error();
        rx_stopping = false;
    }

    // always attempt to switch the radio off, even after a failed stream
    std::string error;
    const Status result = transceiver.set_mode(*transport, TransceiverMode::Off, &error);
    if (result != Status::Success) {
        return fail(result, std::move(error));
    }
    if (stream_status != Status::Success) {
        return fail(stream_status, std::move(stream_error));
    }
    return Status::Success;
}

bool HackrfOne::is_streaming() const {
    std::lock_guard<std::mutex> lock(stream_mutex);
    return rx_thread.joinable() && rx_stream && !rx_stream->is_finished();
}

StreamEnd HackrfOne::rx_end_cause() const {
    std::lock_guard<std::mutex> lock(stream_mutex);
    if (!rx_stream) {
        return StreamEnd::NotStarted;
    }
    return rx_stream->end_cause();
}
