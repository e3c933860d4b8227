#include "sample_stream.hpp"

#include <fmt/format.h>

#include "iq.hpp"

const char* stream_end_name(StreamEnd end) {
    switch (end) {
        case StreamEnd::NotStarted:   return "not started";
        case StreamEnd::Running:      return "running";
        case StreamEnd::Stopped:      return "stopped";
        case StreamEnd::Disconnected: return "disconnected";
        case StreamEnd::Failed:       return "failed";
    }
    return "unknown";
}

SampleStream::SampleStream(UsbTransport& transport,
                           const Transceiver& transceiver,
                           std::shared_ptr<StreamControl> control,
                           std::size_t transfer_size)
    : transport(transport)
    , transceiver(transceiver)
    , control(control ? std::move(control) : std::make_shared<StreamControl>())
{
    // one byte per I and Q component
    transfer_size &= ~std::size_t(1);
    if (transfer_size == 0) {
        transfer_size = DEFAULT_TRANSFER_SIZE;
    }
    buffer.resize(transfer_size);
}

void SampleStream::finish(StreamEnd cause, Status status) {
    end_status = status;
    end.store(cause, std::memory_order_release);
    control->ended.store(true, std::memory_order_release);
}

const uint8_t* SampleStream::read_transfer(std::size_t* length) {
    if (is_finished()) {
        return nullptr;
    }

    if (control->stop_pending() || transceiver.mode() != TransceiverMode::Receive) {
        finish(StreamEnd::Stopped);
        return nullptr;
    }

    std::size_t transferred = 0;
    const TransferError result = transport.bulk_transfer(
        RX_ENDPOINT_ADDRESS, buffer.data(), buffer.size(), &transferred);

    // A stop requested while the read was in flight ends the stream normally,
    // whatever the read returned; a device that vanished underneath it too.
    if (control->stop_pending()) {
        finish(StreamEnd::Stopped);
        return nullptr;
    }

    if (result != TransferError::None) {
        if (result == TransferError::NoDevice || !transport.is_connected()) {
            finish(StreamEnd::Disconnected);
            return nullptr;
        }
        last_error = fmt::format("bulk transfer failed after {} bytes: {}",
            total_bytes.load(std::memory_order_relaxed), transfer_error_name(result));
        finish(StreamEnd::Failed, status_from_transfer(result));
        return nullptr;
    }

    if (transferred % 2 != 0) {
        last_error = fmt::format("bulk transfer returned {} bytes, not a whole number of IQ pairs", transferred);
        finish(StreamEnd::Failed, Status::OddLengthTransfer);
        return nullptr;
    }

    total_bytes.fetch_add(transferred, std::memory_order_relaxed);
    *length = transferred;
    return buffer.data();
}

bool SampleStream::next(std::vector<std::complex<int8_t>>& out) {
    std::size_t length = 0;
    const uint8_t* data = read_transfer(&length);
    if (!data) {
        out.clear();
        return false;
    }
    decode_iq(data, length, out);
    return true;
}

bool SampleStream::next(std::vector<std::complex<float>>& out) {
    std::size_t length = 0;
    const uint8_t* data = read_transfer(&length);
    if (!data) {
        out.clear();
        return false;
    }
    decode_iq(data, length, out);
    return true;
}

StreamEnd SampleStream::run(const SampleCallback& callback) {
    std::vector<std::complex<int8_t>> samples;
    while (next(samples)) {
        if (callback) {
            callback(samples.data(), samples.size());
        }
    }
    return end_cause();
}

StreamEnd SampleStream::run(const FloatSampleCallback& callback) {
    std::vector<std::complex<float>> samples;
    while (next(samples)) {
        if (callback) {
            callback(samples.data(), samples.size());
        }
    }
    return end_cause();
}
