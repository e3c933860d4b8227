#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

// Receive statistics, written by the rx thread and reported by the main loop
class RxStatistics {
    uint64_t batches_received = 0;
    uint64_t samples_received = 0;
    uint64_t power_sum = 0;         // sum of I^2 + Q^2
    uint32_t peak_power = 0;
    uint64_t last_reset_timestamp = 0;
    uint64_t samples_total = 0;     // not cleared by reset()

    std::mutex mutex;

public:
    void register_batch(const std::complex<int8_t>* samples, std::size_t count);

    void reset(uint64_t current_timestamp);
    bool reporting_due(uint64_t current_timestamp);
    uint64_t total_samples();
    std::string to_string();
};
