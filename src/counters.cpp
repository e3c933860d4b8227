#include "counters.hpp"

#include <cmath>

#include <fmt/format.h>

#define REPORTING_PERIOD 1000


bool RxStatistics::reporting_due(uint64_t current_timestamp) {
    std::lock_guard<std::mutex> lock(mutex);
    return current_timestamp >= last_reset_timestamp + REPORTING_PERIOD;
}

void RxStatistics::register_batch(const std::complex<int8_t>* samples, std::size_t count) {
    uint64_t sum = 0;
    uint32_t peak = 0;
    for (std::size_t n = 0; n < count; n++) {
        const int32_t i = samples[n].real();
        const int32_t q = samples[n].imag();
        const uint32_t p = static_cast<uint32_t>(i * i + q * q);
        sum += p;
        if (p > peak) { peak = p; }
    }

    std::lock_guard<std::mutex> lock(mutex);
    batches_received++;
    samples_received += count;
    samples_total += count;
    power_sum += sum;
    if (peak > peak_power) { peak_power = peak; }
}

void RxStatistics::reset(uint64_t current_timestamp) {
    std::lock_guard<std::mutex> lock(mutex);

    batches_received = 0;
    samples_received = 0;
    power_sum = 0;
    peak_power = 0;
    last_reset_timestamp = current_timestamp;
}

uint64_t RxStatistics::total_samples() {
    std::lock_guard<std::mutex> lock(mutex);
    return samples_total;
}

std::string RxStatistics::to_string() {
    std::lock_guard<std::mutex> lock(mutex);

    // dBFS relative to a full-scale (128) component
    const double mean_power = samples_received
        ? double(power_sum) / double(samples_received)
        : 0.0;
    const double average_dbfs = mean_power > 0 ? 10.0 * std::log10(mean_power / (128.0 * 128.0)) : -100.0;
    const double peak_dbfs = peak_power > 0 ? 10.0 * std::log10(double(peak_power) / (128.0 * 128.0)) : -100.0;

    return fmt::format("{} {} {:.1f} {:.1f}",
        batches_received,
        samples_received,
        average_dbfs,
        peak_dbfs
    );
}
