#pragma once

#include <mutex>
#include <string>

#include "commands.hpp"
#include "status.hpp"
#include "usb_transport.hpp"

// Tracks the device's transceiver mode. All state is guarded by one mutex and
// the mode-set transfer is issued while it is held, so there is a single
// writer at any time. The sample stream only reads mode().
class Transceiver {
    mutable std::mutex mutex;
    TransceiverMode current = TransceiverMode::Off;
    bool sample_rate_configured = false;
    bool filter_bandwidth_configured = false;

public:
    TransceiverMode mode() const;
    bool is_configured() const;

    void mark_sample_rate_configured();
    void mark_filter_bandwidth_configured();

    // device was reset: back to Off, configuration forgotten
    void forget();

    Status set_mode(UsbTransport& transport, TransceiverMode target, std::string* error);
};
