#include "status.hpp"

const char* transfer_error_name(TransferError error) {
    switch (error) {
        case TransferError::None:     return "none";
        case TransferError::Timeout:  return "timeout";
        case TransferError::Stall:    return "stall";
        case TransferError::NoDevice: return "no device";
        case TransferError::Io:       return "i/o error";
        case TransferError::Overflow: return "overflow";
        case TransferError::Other:    return "other";
    }
    return "unknown";
}

const char* status_name(Status status) {
    switch (status) {
        case Status::Success:             return "success";
        case Status::TransportTimeout:    return "transport timeout";
        case Status::TransportStall:      return "transport stall";
        case Status::TransportNoDevice:   return "device not present";
        case Status::TransportIo:         return "transport i/o error";
        case Status::TransportOverflow:   return "transport overflow";
        case Status::TransportOther:      return "transport error";
        case Status::ShortTransfer:       return "unexpected transfer length";
        case Status::DeviceRejected:      return "request rejected by device";
        case Status::OddLengthTransfer:   return "odd-length sample transfer";
        case Status::GainOutOfRange:      return "gain out of range";
        case Status::GainOffGrid:         return "gain not on step grid";
        case Status::InvalidArgument:     return "invalid argument";
        case Status::NotConfigured:       return "sample rate or filter bandwidth not configured";
        case Status::UnsupportedFirmware: return "unsupported by device firmware";
        case Status::NotReceiving:        return "transceiver not in receive mode";
        case Status::InvalidTransition:   return "invalid transceiver mode transition";
        case Status::StreamActive:        return "a sample stream is already active";
    }
    return "unknown";
}

ErrorCategory status_category(Status status) {
    switch (status) {
        case Status::Success:
            return ErrorCategory::None;
        case Status::TransportTimeout:
        case Status::TransportStall:
        case Status::TransportNoDevice:
        case Status::TransportIo:
        case Status::TransportOverflow:
        case Status::TransportOther:
            return ErrorCategory::Transport;
        case Status::ShortTransfer:
        case Status::DeviceRejected:
        case Status::OddLengthTransfer:
            return ErrorCategory::Protocol;
        case Status::GainOutOfRange:
        case Status::GainOffGrid:
        case Status::InvalidArgument:
        case Status::NotConfigured:
        case Status::UnsupportedFirmware:
            return ErrorCategory::Validation;
        case Status::NotReceiving:
        case Status::InvalidTransition:
        case Status::StreamActive:
            return ErrorCategory::Contract;
    }
    return ErrorCategory::Contract;
}

Status status_from_transfer(TransferError error) {
    switch (error) {
        case TransferError::None:     return Status::Success;
        case TransferError::Timeout:  return Status::TransportTimeout;
        case TransferError::Stall:    return Status::TransportStall;
        case TransferError::NoDevice: return Status::TransportNoDevice;
        case TransferError::Io:       return Status::TransportIo;
        case TransferError::Overflow: return Status::TransportOverflow;
        case TransferError::Other:    return Status::TransportOther;
    }
    return Status::TransportOther;
}
