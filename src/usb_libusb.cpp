#include "usb_libusb.hpp"

#include <cstdio>
#include <cstring>

#include <fmt/format.h>

static const char* product_name(uint16_t pid) {
    switch (pid) {
        case HACKRF_ONE_USB_PID:        return "HackRF One";
        case HACKRF_JAWBREAKER_USB_PID: return "HackRF Jawbreaker";
        case RAD1O_USB_PID:             return "rad1o";
        default:                        return "HackRF";
    }
}

static bool is_hackrf(const libusb_device_descriptor& desc) {
    return desc.idVendor == HACKRF_USB_VID
        && (desc.idProduct == HACKRF_ONE_USB_PID
            || desc.idProduct == HACKRF_JAWBREAKER_USB_PID
            || desc.idProduct == RAD1O_USB_PID);
}

static bool ends_with(const char* s, const char* suffix) {
    const std::size_t n = std::strlen(s);
    const std::size_t m = std::strlen(suffix);
    return m <= n && std::strcmp(s + n - m, suffix) == 0;
}

LibusbTransport::LibusbTransport() = default;

LibusbTransport::~LibusbTransport() {
    close();
}

bool LibusbTransport::open(const char* serial) {
    if (handle) {
        return true;
    }
    if (serial != nullptr && serial[0] == '\0') {
        serial = nullptr;
    }

    int result = libusb_init(&context);
    if (result != LIBUSB_SUCCESS) {
        last_error = fmt::format("libusb_init() failed: {} ({})", libusb_error_name(result), result);
        context = nullptr;
        return false;
    }

    libusb_device** devs = nullptr;
    const ssize_t dev_cnt = libusb_get_device_list(context, &devs);
    if (dev_cnt < 0) {
        last_error = fmt::format("libusb_get_device_list() failed: {}", libusb_error_name(static_cast<int>(dev_cnt)));
        libusb_exit(context);
        context = nullptr;
        return false;
    }

    for (ssize_t d = 0; d < dev_cnt && handle == nullptr; d++) {
        libusb_device_descriptor desc;
        if (libusb_get_device_descriptor(devs[d], &desc) != LIBUSB_SUCCESS || !is_hackrf(desc)) {
            continue;
        }

        libusb_device_handle* candidate = nullptr;
        if (libusb_open(devs[d], &candidate) != LIBUSB_SUCCESS) {
            continue;
        }

        char sn[64] = {0};
        if (desc.iSerialNumber != 0) {
            const int len = libusb_get_string_descriptor_ascii(candidate, desc.iSerialNumber,
                reinterpret_cast<unsigned char*>(sn), sizeof(sn) - 1);
            if (len < 0) {
                std::fprintf(stderr, "Warning: could not read serial number: %s\n", libusb_error_name(len));
                sn[0] = '\0';
            }
        }

        if (serial != nullptr && !ends_with(sn, serial)) {
            libusb_close(candidate);
            continue;
        }

        handle = candidate;
        bcd_device = desc.bcdDevice;
        device_info = fmt::format("{} SerNo.: {}", product_name(desc.idProduct), sn[0] ? sn : "unknown");
    }
    libusb_free_device_list(devs, 1);

    if (handle == nullptr) {
        last_error = serial
            ? fmt::format("HackRF with serial {} not found", serial)
            : std::string("No HackRF devices found");
        libusb_exit(context);
        context = nullptr;
        return false;
    }

    int config = 0;
    if (libusb_get_configuration(handle, &config) == LIBUSB_SUCCESS && config != 1) {
        result = libusb_set_configuration(handle, 1);
        if (result != LIBUSB_SUCCESS) {
            last_error = fmt::format("libusb_set_configuration() failed: {} ({})", libusb_error_name(result), result);
            close();
            return false;
        }
    }

    result = libusb_claim_interface(handle, 0);
    if (result != LIBUSB_SUCCESS) {
        last_error = fmt::format("Found {}, but couldn't claim the interface: {} ({})",
            device_info, libusb_error_name(result), result);
        close();
        return false;
    }

    connected = true;
    return true;
}

void LibusbTransport::close() {
    if (handle) {
        if (connected) {
            const int result = libusb_release_interface(handle, 0);
            if (result != LIBUSB_SUCCESS && result != LIBUSB_ERROR_NO_DEVICE) {
                std::fprintf(stderr, "Warning: libusb_release_interface() failed: %s\n", libusb_error_name(result));
            }
        }
        libusb_close(handle);
        handle = nullptr;
    }
    connected = false;
    if (context) {
        libusb_exit(context);
        context = nullptr;
    }
}

TransferError LibusbTransport::classify(int result) const {
    switch (result) {
        case LIBUSB_SUCCESS:
            return TransferError::None;
        case LIBUSB_ERROR_TIMEOUT:
            return TransferError::Timeout;
        case LIBUSB_ERROR_PIPE:
            return TransferError::Stall;
        case LIBUSB_ERROR_NO_DEVICE:
            connected = false;
            return TransferError::NoDevice;
        case LIBUSB_ERROR_IO:
            return TransferError::Io;
        case LIBUSB_ERROR_OVERFLOW:
            return TransferError::Overflow;
        default:
            return TransferError::Other;
    }
}

TransferError LibusbTransport::control_transfer(TransferDirection direction,
                                                uint8_t request,
                                                uint16_t value,
                                                uint16_t index,
                                                uint8_t* data,
                                                uint16_t length,
                                                std::size_t* transferred) {
    *transferred = 0;
    if (!handle) {
        return TransferError::NoDevice;
    }

    const uint8_t request_type = uint8_t(LIBUSB_REQUEST_TYPE_VENDOR)
        | uint8_t(LIBUSB_RECIPIENT_DEVICE)
        | uint8_t(direction == TransferDirection::In ? LIBUSB_ENDPOINT_IN : LIBUSB_ENDPOINT_OUT);

    const int result = libusb_control_transfer(handle, request_type, request, value, index,
                                               data, length, timeout_ms);
    if (result < 0) {
        return classify(result);
    }
    *transferred = static_cast<std::size_t>(result);
    return TransferError::None;
}

TransferError LibusbTransport::bulk_transfer(uint8_t endpoint,
                                             uint8_t* data,
                                             std::size_t length,
                                             std::size_t* transferred) {
    *transferred = 0;
    if (!handle) {
        return TransferError::NoDevice;
    }

    int actual = 0;
    const int result = libusb_bulk_transfer(handle, endpoint, data, static_cast<int>(length),
                                            &actual, timeout_ms);
    *transferred = static_cast<std::size_t>(actual);
    return classify(result);
}

bool LibusbTransport::is_connected() const {
    if (!handle || !connected) {
        return false;
    }
    // cheap request that fails with NO_DEVICE once the device is unplugged
    int config = 0;
    if (libusb_get_configuration(handle, &config) == LIBUSB_ERROR_NO_DEVICE) {
        connected = false;
    }
    return connected;
}
