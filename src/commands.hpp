#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "status.hpp"
#include "usb_transport.hpp"

// Vendor request numbers of the HackRF firmware. Only part of the table is
// encoded by this driver; the rest is listed so the numbering stays whole.
enum class Request : uint8_t {
    SetTransceiverMode = 1,
    Max2837Write = 2,
    Max2837Read = 3,
    Si5351CWrite = 4,
    Si5351CRead = 5,
    SampleRateSet = 6,
    BasebandFilterBandwidthSet = 7,
    Rffc5071Write = 8,
    Rffc5071Read = 9,
    SpiflashErase = 10,
    SpiflashWrite = 11,
    SpiflashRead = 12,
    BoardIdRead = 14,
    VersionStringRead = 15,
    SetFreq = 16,
    AmpEnable = 17,
    BoardPartidSerialnoRead = 18,
    SetLnaGain = 19,
    SetVgaGain = 20,
    SetTxvgaGain = 21,
    AntennaEnable = 23,
    SetFreqExplicit = 24,
    UsbWcidVendorReq = 25,
    InitSweep = 26,
    OperacakeGetBoards = 27,
    OperacakeSetPorts = 28,
    SetHwSyncMode = 29,
    Reset = 30,
    OperacakeSetRanges = 31,
    ClkoutEnable = 32,
    SpiflashStatus = 33,
    SpiflashClearStatus = 34,
    OperacakeGpioTest = 35,
    CpldChecksum = 36,
    UiEnable = 37
};

const char* request_name(Request request);

enum class TransceiverMode : uint16_t {
    Off = 0,
    Receive = 1,
    Transmit = 2
};

const char* transceiver_mode_name(TransceiverMode mode);

// One operation per struct; Command is the closed set of encodable operations.
struct SetFreq { uint64_t hz; };
struct SetSampleRate { uint32_t hz; uint32_t divider; };
struct SetBasebandFilterBandwidth { uint32_t hz; };
struct SetAmpEnable { bool enable; };
struct SetAntennaEnable { bool enable; };
struct SetClkoutEnable { bool enable; };
struct SetLnaGain { uint16_t db; };
struct SetVgaGain { uint16_t db; };
struct SetTxvgaGain { uint16_t db; };
struct SetTransceiverMode { TransceiverMode mode; };
struct ReadBoardId {};
struct ReadVersionString {};
struct ReadPartIdSerialNo {};
struct ResetDevice {};

using Command = std::variant<
    SetFreq,
    SetSampleRate,
    SetBasebandFilterBandwidth,
    SetAmpEnable,
    SetAntennaEnable,
    SetClkoutEnable,
    SetLnaGain,
    SetVgaGain,
    SetTxvgaGain,
    SetTransceiverMode,
    ReadBoardId,
    ReadVersionString,
    ReadPartIdSerialNo,
    ResetDevice>;

struct CommandDescriptor {
    TransferDirection direction;
    Request request;
    uint16_t value;
    uint16_t index;
    std::vector<uint8_t> payload;   // Out only
    uint16_t response_length;       // In only
    bool exact_response;            // false: up to response_length, at least one byte

    bool operator==(const CommandDescriptor&) const = default;
};

CommandDescriptor encode(const Command& command);

// Performs exactly one control transfer for `descriptor`. In responses are
// stored in `response` (may be nullptr for Out). `error` receives a readable
// message on failure.
Status execute(UsbTransport& transport,
               const CommandDescriptor& descriptor,
               std::vector<uint8_t>* response,
               std::string* error);

// 8-byte payload of SetFreq: MHz part then Hz remainder, both u32 LE
std::array<uint8_t, 8> freq_params(uint64_t hz);

uint32_t baseband_filter_bw_for(uint32_t bandwidth_hz);
uint32_t auto_baseband_filter_bw(uint32_t sample_rate_hz, uint32_t divider);

// response decoding
struct PartIdSerialNo {
    uint32_t part_id[2];
    uint32_t serial_no[4];
};

std::string decode_version_string(const std::vector<uint8_t>& response);
PartIdSerialNo decode_partid_serialno(const std::vector<uint8_t>& response);
