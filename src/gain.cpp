#include "gain.hpp"

#include <fmt/format.h>

const char* gain_stage_name(GainStage stage) {
    switch (stage) {
        case GainStage::RxLna: return "LNA";
        case GainStage::RxVga: return "VGA";
        case GainStage::TxVga: return "TX VGA";
    }
    return "unknown";
}

GainLimits gain_limits(GainStage stage) {
    switch (stage) {
        case GainStage::RxLna: return {0, 40, 8};
        case GainStage::RxVga: return {0, 62, 2};
        case GainStage::TxVga: return {0, 47, 1};
    }
    return {0, 0, 1};
}

Status validate_gain(GainStage stage, int db, std::string* reason) {
    const GainLimits limits = gain_limits(stage);

    if (db < limits.min_db) {
        if (reason) {
            *reason = fmt::format("{} gain {} dB below minimum of {} dB",
                gain_stage_name(stage), db, limits.min_db);
        }
        return Status::GainOutOfRange;
    }
    if (db > limits.max_db) {
        if (reason) {
            *reason = fmt::format("{} gain {} dB above maximum of {} dB",
                gain_stage_name(stage), db, limits.max_db);
        }
        return Status::GainOutOfRange;
    }
    if ((db - limits.min_db) % limits.step_db != 0) {
        if (reason) {
            *reason = fmt::format("{} gain {} dB is not a multiple of the {} dB step",
                gain_stage_name(stage), db, limits.step_db);
        }
        return Status::GainOffGrid;
    }
    return Status::Success;
}

Command gain_command(GainStage stage, int db) {
    const auto value = static_cast<uint16_t>(db);
    switch (stage) {
        case GainStage::RxLna: return SetLnaGain{value};
        case GainStage::RxVga: return SetVgaGain{value};
        case GainStage::TxVga: return SetTxvgaGain{value};
    }
    return SetLnaGain{value};
}
