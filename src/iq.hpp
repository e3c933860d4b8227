#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>
#include <vector>

// Samples arrive as interleaved signed 8-bit pairs, I before Q.
static constexpr float IQ_SCALE = 1.0f / 128.0f;

template <typename To, typename From>
constexpr std::complex<To> complex_cast(const std::complex<From>& c) noexcept {
    return {static_cast<To>(c.real()), static_cast<To>(c.imag())};
}

inline std::complex<int8_t> iq_to_cplx_i8(uint8_t i, uint8_t q) {
    return {static_cast<int8_t>(i), static_cast<int8_t>(q)};
}

// maps [-128, 127] onto [-1.0, 127/128]
inline std::complex<float> iq_to_cplx_f32(uint8_t i, uint8_t q) {
    return complex_cast<float>(iq_to_cplx_i8(i, q)) * IQ_SCALE;
}

// Both decoders replace the contents of `out` with length / 2 samples.
// A trailing odd byte is ignored.
inline void decode_iq(const uint8_t* buf, std::size_t length, std::vector<std::complex<int8_t>>& out) {
    const std::size_t count = length / 2;
    out.resize(count);
    for (std::size_t n = 0; n < count; ++n) {
        out[n] = iq_to_cplx_i8(buf[2 * n], buf[2 * n + 1]);
    }
}

inline void decode_iq(const uint8_t* buf, std::size_t length, std::vector<std::complex<float>>& out) {
    const std::size_t count = length / 2;
    out.resize(count);
    for (std::size_t n = 0; n < count; ++n) {
        out[n] = iq_to_cplx_f32(buf[2 * n], buf[2 * n + 1]);
    }
}
