#include "commands.hpp"

#include <algorithm>
#include <iterator>
#include <limits>

#include <fmt/format.h>

#define VERSION_STRING_MAX_LENGTH 255
#define PARTID_SERIALNO_LENGTH 24

// MAX2837 baseband filter settings, ascending
static const uint32_t max2837_filter_bw[] = {
    1750000, 2500000, 3500000, 5000000, 5500000, 6000000, 7000000, 8000000,
    9000000, 10000000, 12000000, 14000000, 15000000, 20000000, 24000000, 28000000
};

static void put_u32_le(uint8_t* dst, uint32_t v) {
    dst[0] = v & 0xFF;
    dst[1] = (v >> 8) & 0xFF;
    dst[2] = (v >> 16) & 0xFF;
    dst[3] = (v >> 24) & 0xFF;
}

static uint32_t get_u32_le(const uint8_t* src) {
    return uint32_t(src[0])
        | (uint32_t(src[1]) << 8)
        | (uint32_t(src[2]) << 16)
        | (uint32_t(src[3]) << 24);
}

const char* request_name(Request request) {
    switch (request) {
        case Request::SetTransceiverMode:         return "set_transceiver_mode";
        case Request::SampleRateSet:              return "sample_rate_set";
        case Request::BasebandFilterBandwidthSet: return "baseband_filter_bandwidth_set";
        case Request::BoardIdRead:                return "board_id_read";
        case Request::VersionStringRead:          return "version_string_read";
        case Request::SetFreq:                    return "set_freq";
        case Request::AmpEnable:                  return "amp_enable";
        case Request::BoardPartidSerialnoRead:    return "board_partid_serialno_read";
        case Request::SetLnaGain:                 return "set_lna_gain";
        case Request::SetVgaGain:                 return "set_vga_gain";
        case Request::SetTxvgaGain:               return "set_txvga_gain";
        case Request::AntennaEnable:              return "antenna_enable";
        case Request::Reset:                      return "reset";
        case Request::ClkoutEnable:               return "clkout_enable";
        default:                                  return "vendor_request";
    }
}

const char* transceiver_mode_name(TransceiverMode mode) {
    switch (mode) {
        case TransceiverMode::Off:      return "off";
        case TransceiverMode::Receive:  return "receive";
        case TransceiverMode::Transmit: return "transmit";
    }
    return "unknown";
}

std::array<uint8_t, 8> freq_params(uint64_t hz) {
    constexpr uint64_t MHZ = 1000000;
    constexpr uint64_t U32_MAX = std::numeric_limits<uint32_t>::max();

    const uint64_t mhz = hz / MHZ;
    const uint32_t freq_mhz = static_cast<uint32_t>(std::min(mhz, U32_MAX));
    // remainder relative to the (possibly saturated) MHz part
    const uint64_t rest = hz - uint64_t(freq_mhz) * MHZ;
    const uint32_t freq_hz = static_cast<uint32_t>(std::min(rest, U32_MAX));

    std::array<uint8_t, 8> buf;
    put_u32_le(buf.data(), freq_mhz);
    put_u32_le(buf.data() + 4, freq_hz);
    return buf;
}

uint32_t baseband_filter_bw_for(uint32_t bandwidth_hz) {
    // widest setting not above the request, the narrowest one otherwise
    const auto* end = std::end(max2837_filter_bw);
    const auto* it = std::upper_bound(std::begin(max2837_filter_bw), end, bandwidth_hz);
    if (it == std::begin(max2837_filter_bw)) {
        return *it;
    }
    return *(it - 1);
}

uint32_t auto_baseband_filter_bw(uint32_t sample_rate_hz, uint32_t divider) {
    if (divider == 0) {
        divider = 1;
    }
    const double effective = double(sample_rate_hz) / double(divider);
    return baseband_filter_bw_for(static_cast<uint32_t>(0.75 * effective));
}

namespace {

CommandDescriptor write_request(Request request, uint16_t value, uint16_t index,
                                std::vector<uint8_t> payload = {}) {
    return CommandDescriptor {
        .direction = TransferDirection::Out,
        .request = request,
        .value = value,
        .index = index,
        .payload = std::move(payload),
        .response_length = 0,
        .exact_response = true
    };
}

CommandDescriptor read_request(Request request, uint16_t value, uint16_t index,
                               uint16_t length, bool exact = true) {
    return CommandDescriptor {
        .direction = TransferDirection::In,
        .request = request,
        .value = value,
        .index = index,
        .payload = {},
        .response_length = length,
        .exact_response = exact
    };
}

CommandDescriptor encode_one(const SetFreq& c) {
    const auto buf = freq_params(c.hz);
    return write_request(Request::SetFreq, 0, 0, std::vector<uint8_t>(buf.begin(), buf.end()));
}

CommandDescriptor encode_one(const SetSampleRate& c) {
    std::vector<uint8_t> buf(8);
    put_u32_le(buf.data(), c.hz);
    put_u32_le(buf.data() + 4, c.divider);
    return write_request(Request::SampleRateSet, 0, 0, std::move(buf));
}

CommandDescriptor encode_one(const SetBasebandFilterBandwidth& c) {
    return write_request(Request::BasebandFilterBandwidthSet, c.hz & 0xFFFF, c.hz >> 16);
}

CommandDescriptor encode_one(const SetAmpEnable& c) {
    return write_request(Request::AmpEnable, c.enable ? 1 : 0, 0);
}

CommandDescriptor encode_one(const SetAntennaEnable& c) {
    return write_request(Request::AntennaEnable, c.enable ? 1 : 0, 0);
}

CommandDescriptor encode_one(const SetClkoutEnable& c) {
    return write_request(Request::ClkoutEnable, c.enable ? 1 : 0, 0);
}

// gain requests carry the dB value in the index field, value stays zero
CommandDescriptor encode_one(const SetLnaGain& c) {
    return read_request(Request::SetLnaGain, 0, c.db, 1);
}

CommandDescriptor encode_one(const SetVgaGain& c) {
    return read_request(Request::SetVgaGain, 0, c.db, 1);
}

CommandDescriptor encode_one(const SetTxvgaGain& c) {
    return read_request(Request::SetTxvgaGain, 0, c.db, 1);
}

CommandDescriptor encode_one(const SetTransceiverMode& c) {
    return write_request(Request::SetTransceiverMode, static_cast<uint16_t>(c.mode), 0);
}

CommandDescriptor encode_one(const ReadBoardId&) {
    return read_request(Request::BoardIdRead, 0, 0, 1);
}

CommandDescriptor encode_one(const ReadVersionString&) {
    return read_request(Request::VersionStringRead, 0, 0, VERSION_STRING_MAX_LENGTH, false);
}

CommandDescriptor encode_one(const ReadPartIdSerialNo&) {
    return read_request(Request::BoardPartidSerialnoRead, 0, 0, PARTID_SERIALNO_LENGTH);
}

CommandDescriptor encode_one(const ResetDevice&) {
    return write_request(Request::Reset, 0, 0);
}

}

CommandDescriptor encode(const Command& command) {
    return std::visit([](const auto& c) { return encode_one(c); }, command);
}

Status execute(UsbTransport& transport,
               const CommandDescriptor& descriptor,
               std::vector<uint8_t>* response,
               std::string* error) {
    const char* name = request_name(descriptor.request);
    std::size_t transferred = 0;
    TransferError result;

    if (descriptor.direction == TransferDirection::Out) {
        std::vector<uint8_t> payload = descriptor.payload;
        result = transport.control_transfer(TransferDirection::Out,
                                            static_cast<uint8_t>(descriptor.request),
                                            descriptor.value,
                                            descriptor.index,
                                            payload.empty() ? nullptr : payload.data(),
                                            static_cast<uint16_t>(payload.size()),
                                            &transferred);
        if (result != TransferError::None) {
            if (error) {
                *error = fmt::format("{} failed: {}", name, transfer_error_name(result));
            }
            return status_from_transfer(result);
        }
        if (transferred != payload.size()) {
            if (error) {
                *error = fmt::format("{} failed: sent {} of {} bytes", name, transferred, payload.size());
            }
            return Status::ShortTransfer;
        }
        return Status::Success;
    }

    std::vector<uint8_t> buf(descriptor.response_length);
    result = transport.control_transfer(TransferDirection::In,
                                        static_cast<uint8_t>(descriptor.request),
                                        descriptor.value,
                                        descriptor.index,
                                        buf.data(),
                                        descriptor.response_length,
                                        &transferred);
    if (result != TransferError::None) {
        if (error) {
            *error = fmt::format("{} failed: {}", name, transfer_error_name(result));
        }
        return status_from_transfer(result);
    }

    const bool length_ok = descriptor.exact_response
        ? transferred == descriptor.response_length
        : (transferred > 0 && transferred <= descriptor.response_length);
    if (!length_ok) {
        if (error) {
            *error = fmt::format("{} failed: received {} bytes, expected {}{}",
                name, transferred, descriptor.exact_response ? "" : "up to ",
                descriptor.response_length);
        }
        return Status::ShortTransfer;
    }

    buf.resize(transferred);
    if (response) {
        *response = std::move(buf);
    }
    return Status::Success;
}

std::string decode_version_string(const std::vector<uint8_t>& response) {
    auto end = std::find(response.begin(), response.end(), uint8_t(0));
    return std::string(response.begin(), end);
}

PartIdSerialNo decode_partid_serialno(const std::vector<uint8_t>& response) {
    PartIdSerialNo p {};
    if (response.size() < PARTID_SERIALNO_LENGTH) {
        return p;
    }
    const uint8_t* src = response.data();
    for (int i = 0; i < 2; i++) {
        p.part_id[i] = get_u32_le(src + 4 * i);
    }
    for (int i = 0; i < 4; i++) {
        p.serial_no[i] = get_u32_le(src + 8 + 4 * i);
    }
    return p;
}
