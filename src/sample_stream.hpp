#pragma once

#include <atomic>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "status.hpp"
#include "transceiver.hpp"
#include "usb_transport.hpp"

static const uint8_t RX_ENDPOINT_ADDRESS = 0x81;
static const std::size_t DEFAULT_TRANSFER_SIZE = 128 * 1024;

// Callback types: provide one decoded bulk transfer at a time
using SampleCallback = std::function<void(const std::complex<int8_t>*, std::size_t)>;
using FloatSampleCallback = std::function<void(const std::complex<float>*, std::size_t)>;

enum class StreamEnd {
    NotStarted,     // no stream was ever started on the device
    Running,
    Stopped,        // stop was requested
    Disconnected,   // device went away
    Failed          // any other transport or protocol error, see status()
};

const char* stream_end_name(StreamEnd end);

// Out-of-band cancellation shared between a stream and whoever may stop it.
struct StreamControl {
    std::atomic<bool> stop_requested{false};
    std::atomic<bool> ended{false};     // set by the stream once it terminated

    void request_stop() { stop_requested.store(true, std::memory_order_release); }
    bool stop_pending() const { return stop_requested.load(std::memory_order_acquire); }
};

// Pulls samples from the bulk IN endpoint while the transceiver is in receive
// mode. Stop requests are observed between bulk reads; an in-flight read is
// never interrupted. The stream does not touch the transceiver mode.
class SampleStream {
public:
    SampleStream(UsbTransport& transport,
                 const Transceiver& transceiver,
                 std::shared_ptr<StreamControl> control,
                 std::size_t transfer_size = DEFAULT_TRANSFER_SIZE);

    SampleStream(const SampleStream&) = delete;
    SampleStream& operator=(const SampleStream&) = delete;

    // Replace `out` with the next batch; false once the stream has ended.
    bool next(std::vector<std::complex<int8_t>>& out);
    bool next(std::vector<std::complex<float>>& out);

    // Run until the stream ends, handing every batch to the callback.
    StreamEnd run(const SampleCallback& callback);
    StreamEnd run(const FloatSampleCallback& callback);

    void request_stop() { control->request_stop(); }
    const std::shared_ptr<StreamControl>& stop_control() const { return control; }

    bool is_finished() const { return end_cause() != StreamEnd::Running; }
    StreamEnd end_cause() const { return end.load(std::memory_order_acquire); }

    // Success unless the stream ended Failed; read after the stream ended.
    Status status() const { return end_status; }
    const std::string& get_last_error() const { return last_error; }

    uint64_t bytes_received() const { return total_bytes.load(std::memory_order_relaxed); }
    std::size_t transfer_size() const { return buffer.size(); }

private:
    // One bulk read; nullptr once the stream has ended.
    const uint8_t* read_transfer(std::size_t* length);
    void finish(StreamEnd cause, Status status = Status::Success);

    UsbTransport& transport;
    const Transceiver& transceiver;
    std::shared_ptr<StreamControl> control;

    std::vector<uint8_t> buffer;
    std::atomic<StreamEnd> end{StreamEnd::Running};
    Status end_status = Status::Success;
    std::string last_error;
    std::atomic<uint64_t> total_bytes{0};
};
