#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include <libusb.h>

#include "usb_transport.hpp"

static const uint16_t HACKRF_USB_VID = 0x1D50;
static const uint16_t HACKRF_JAWBREAKER_USB_PID = 0x604B;
static const uint16_t HACKRF_ONE_USB_PID = 0x6089;
static const uint16_t RAD1O_USB_PID = 0xCC15;

class LibusbTransport : public UsbTransport {
public:
    LibusbTransport();
    ~LibusbTransport() override;

    LibusbTransport(const LibusbTransport&) = delete;
    LibusbTransport& operator=(const LibusbTransport&) = delete;

    // Device lifecycle. A null or empty serial picks the first HackRF found,
    // otherwise the device whose serial number ends with `serial`.
    bool open(const char* serial);
    void close();

    void set_timeout(unsigned int ms) { timeout_ms = ms; }

    TransferError control_transfer(TransferDirection direction,
                                   uint8_t request,
                                   uint16_t value,
                                   uint16_t index,
                                   uint8_t* data,
                                   uint16_t length,
                                   std::size_t* transferred) override;

    TransferError bulk_transfer(uint8_t endpoint,
                                uint8_t* data,
                                std::size_t length,
                                std::size_t* transferred) override;

    bool is_connected() const override;
    uint16_t device_release() const override { return bcd_device; }
    std::string description() const override { return device_info; }

    std::string get_last_error() const { return last_error; }

private:
    TransferError classify(int result) const;

    libusb_context* context = nullptr;
    libusb_device_handle* handle = nullptr;
    unsigned int timeout_ms = 1000;
    uint16_t bcd_device = 0;
    mutable std::atomic<bool> connected{false};
    std::string device_info;
    std::string last_error;
};
