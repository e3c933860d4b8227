#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

enum class TransferDirection {
    Out,    // host to device
    In      // device to host
};

// Transport-level outcome of a single USB transfer
enum class TransferError {
    None,
    Timeout,
    Stall,
    NoDevice,
    Io,
    Overflow,
    Other
};

const char* transfer_error_name(TransferError error);

// Abstract USB connection to one opened device.
// Implementations must allow a control transfer on one thread while a
// bulk transfer is blocked on another.
class UsbTransport {
public:
    virtual ~UsbTransport() = default;

    // Vendor-type, device-recipient control transfer. For Out transfers
    // `data` holds `length` bytes to send, for In transfers it receives up
    // to `length` bytes. `transferred` is always written.
    virtual TransferError control_transfer(TransferDirection direction,
                                           uint8_t request,
                                           uint16_t value,
                                           uint16_t index,
                                           uint8_t* data,
                                           uint16_t length,
                                           std::size_t* transferred) = 0;

    virtual TransferError bulk_transfer(uint8_t endpoint,
                                        uint8_t* data,
                                        std::size_t length,
                                        std::size_t* transferred) = 0;

    virtual bool is_connected() const = 0;

    // bcdDevice from the device descriptor
    virtual uint16_t device_release() const = 0;

    virtual std::string description() const = 0;
};
