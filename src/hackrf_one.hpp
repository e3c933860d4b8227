#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "commands.hpp"
#include "gain.hpp"
#include "sample_stream.hpp"
#include "status.hpp"
#include "transceiver.hpp"
#include "usb_transport.hpp"

// SDR configuration structure
struct SdrConfig {
    uint64_t center_freq_hz;
    uint32_t sample_rate;
    uint32_t sample_rate_divider = 1;
    uint32_t baseband_filter_bw = 0;    // 0 = keep the filter derived from the sample rate
    int lna_gain = 16;                  // 0-40 in steps of 8
    int vga_gain = 16;                  // 0-62 in steps of 2
    bool amp_enable = false;            // RF amplifier
    bool bias_tee = false;              // Antenna power
};

// USB API version, BCD-coded in bcdDevice as 0xJJMN
struct Version {
    uint8_t major;
    uint8_t minor;
    uint8_t sub_minor;

    static Version from_bcd(uint16_t raw);
    uint32_t packed() const { return (uint32_t(major) << 16) | (uint32_t(minor) << 8) | sub_minor; }
    std::string to_string() const;

    bool operator==(const Version&) const = default;
};

enum BoardId : uint8_t {
    BOARD_ID_JELLYBEAN = 0,
    BOARD_ID_JAWBREAKER = 1,
    BOARD_ID_HACKRF1_OG = 2,
    BOARD_ID_RAD1O = 3,
    BOARD_ID_HACKRF1_R9 = 4,
    BOARD_ID_UNRECOGNIZED = 0xFE,
    BOARD_ID_UNDETECTED = 0xFF
};

const char* board_id_name(uint8_t board_id);

class HackrfOne {
public:
    explicit HackrfOne(std::unique_ptr<UsbTransport> transport);
    ~HackrfOne();

    HackrfOne(const HackrfOne&) = delete;
    HackrfOne& operator=(const HackrfOne&) = delete;

    // Opens the first HackRF (or the one whose serial ends with `serial`)
    // through libusb. Returns nullptr and fills `error` on failure.
    static std::unique_ptr<HackrfOne> open(const char* serial, std::string* error);

    Status configure(const SdrConfig& config);

    Status set_freq(uint64_t hz);
    // Also programs the anti-aliasing filter to the widest setting within 75%
    // of hz / divider. An explicit filter bandwidth must be set afterwards.
    Status set_sample_rate(uint32_t hz, uint32_t divider = 1);
    Status set_baseband_filter_bandwidth(uint32_t hz);

    Status set_gain(GainStage stage, int db);
    Status set_lna_gain(int db) { return set_gain(GainStage::RxLna, db); }
    Status set_vga_gain(int db) { return set_gain(GainStage::RxVga, db); }
    Status set_txvga_gain(int db) { return set_gain(GainStage::TxVga, db); }

    Status set_amp_enable(bool enable);
    Status set_antenna_enable(bool enable);
    Status set_clkout_enable(bool enable);

    Status set_transceiver_mode(TransceiverMode mode);
    TransceiverMode transceiver_mode() const { return transceiver.mode(); }

    // Device information
    Status board_id_read(uint8_t* board_id);
    Status version_string_read(std::string* version);
    Status board_partid_serialno_read(PartIdSerialNo* partid_serialno);
    Version usb_api_version() const;
    std::string get_device_info() const { return transport->description(); }

    // Reboots the device; the transceiver is back to off and unconfigured.
    Status reset();

    // Pull-style stream, only while in receive mode.
    Status start_receive(std::unique_ptr<SampleStream>* stream,
                         std::size_t transfer_size = DEFAULT_TRANSFER_SIZE);
    // Stops whichever stream is active; safe from any thread, idempotent.
    void request_stop();

    // Receive on a background thread: enter receive mode, stream into the
    // callback until stop_rx() or the device goes away.
    Status start_rx(SampleCallback callback, std::size_t transfer_size = DEFAULT_TRANSFER_SIZE);
    Status stop_rx();
    bool is_streaming() const;
    // NotStarted until the first start_rx()
    StreamEnd rx_end_cause() const;

    // Error handling
    std::string get_last_error() const { return last_error; }

private:
    Status execute_command(const Command& command, std::vector<uint8_t>* response = nullptr);
    Status fail(Status status, std::string message);
    Status require_api_version(Version min, const char* operation);

    std::unique_ptr<UsbTransport> transport;
    Transceiver transceiver;
    std::string last_error;

    mutable std::mutex stream_mutex;
    std::weak_ptr<StreamControl> active_control;
    std::unique_ptr<SampleStream> rx_stream;
    std::thread rx_thread;
    bool rx_stopping = false;           // stop_rx() is joining rx_thread
};
