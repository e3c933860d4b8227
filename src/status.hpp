#pragma once

#include "usb_transport.hpp"

enum class Status {
    Success,

    // transport
    TransportTimeout,
    TransportStall,
    TransportNoDevice,
    TransportIo,
    TransportOverflow,
    TransportOther,

    // protocol
    ShortTransfer,
    DeviceRejected,
    OddLengthTransfer,

    // validation, nothing was sent
    GainOutOfRange,
    GainOffGrid,
    InvalidArgument,
    NotConfigured,
    UnsupportedFirmware,

    // caller contract
    NotReceiving,
    InvalidTransition,
    StreamActive
};

enum class ErrorCategory {
    None,
    Transport,
    Protocol,
    Validation,
    Contract
};

const char* status_name(Status status);
ErrorCategory status_category(Status status);
Status status_from_transfer(TransferError error);
