#include "transceiver.hpp"

#include <fmt/format.h>

TransceiverMode Transceiver::mode() const {
    std::lock_guard<std::mutex> lock(mutex);
    return current;
}

bool Transceiver::is_configured() const {
    std::lock_guard<std::mutex> lock(mutex);
    return sample_rate_configured && filter_bandwidth_configured;
}

void Transceiver::mark_sample_rate_configured() {
    std::lock_guard<std::mutex> lock(mutex);
    sample_rate_configured = true;
}

void Transceiver::mark_filter_bandwidth_configured() {
    std::lock_guard<std::mutex> lock(mutex);
    filter_bandwidth_configured = true;
}

void Transceiver::forget() {
    std::lock_guard<std::mutex> lock(mutex);
    current = TransceiverMode::Off;
    sample_rate_configured = false;
    filter_bandwidth_configured = false;
}

Status Transceiver::set_mode(UsbTransport& transport, TransceiverMode target, std::string* error) {
    std::lock_guard<std::mutex> lock(mutex);

    if (target != TransceiverMode::Off) {
        if (current == target) {
            return Status::Success;
        }
        if (current != TransceiverMode::Off) {
            if (error) {
                *error = fmt::format("cannot switch from {} to {} without going through off",
                    transceiver_mode_name(current), transceiver_mode_name(target));
            }
            return Status::InvalidTransition;
        }
        if (!sample_rate_configured || !filter_bandwidth_configured) {
            if (error) {
                *error = fmt::format("cannot enter {} mode: {} not configured",
                    transceiver_mode_name(target),
                    !sample_rate_configured ? "sample rate" : "baseband filter bandwidth");
            }
            return Status::NotConfigured;
        }
    }

    const Status result = execute(transport, encode(SetTransceiverMode{target}), nullptr, error);
    if (result == Status::Success) {
        current = target;
    } else if (target == TransceiverMode::Off && result == Status::TransportNoDevice) {
        // a vanished device is not receiving or transmitting anymore; the
        // lifecycle returns to Off on error
        current = TransceiverMode::Off;
    }
    return result;
}
