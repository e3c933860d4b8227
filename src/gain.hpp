#pragma once

#include <string>

#include "commands.hpp"
#include "status.hpp"

enum class GainStage {
    RxLna,      // IF gain, 0-40 dB in 8 dB steps
    RxVga,      // baseband gain, 0-62 dB in 2 dB steps
    TxVga       // 0-47 dB in 1 dB steps
};

struct GainLimits {
    int min_db;
    int max_db;
    int step_db;
};

const char* gain_stage_name(GainStage stage);
GainLimits gain_limits(GainStage stage);

// Rejects values off the stage's grid; `reason` names the violated bound.
Status validate_gain(GainStage stage, int db, std::string* reason);

// Only valid after validate_gain() succeeded for the same arguments.
Command gain_command(GainStage stage, int db);
