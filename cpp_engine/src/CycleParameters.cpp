#include "CycleParameters.h"

#include <cmath>
#include <cstddef>
#include <cstring>

namespace cyclecmp {

namespace {

static inline std::uint32_t fnv1a32_update(std::uint32_t h, const void* data, std::size_t len) {
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<std::uint32_t>(p[i]);
        h *= 16777619u;
    }
    return h;
}

static inline std::uint32_t fnv1a32_begin() { return 2166136261u; }

static inline std::uint32_t fnv1a32_add_f64(std::uint32_t h, double v) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected double size");
    std::memcpy(&bits, &v, sizeof(v));
    return fnv1a32_update(h, &bits, sizeof(bits));
}

static inline bool positive(double v) { return std::isfinite(v) && v > 0.0; }
static inline bool atLeastOne(double v) { return std::isfinite(v) && v >= 1.0; }

} // namespace

bool CycleParameters::isValid() const {
    if (!std::isfinite(gamma) || gamma <= 1.0) return false;
    if (!positive(R_kJ_per_kgK) || !positive(cv_kJ_per_kgK) || !positive(cp_kJ_per_kgK)) return false;
    if (!positive(P1_kPa) || !positive(T1_K)) return false;
    if (!atLeastOne(compression_ratio)) return false;
    if (!atLeastOne(pressure_ratio) || !atLeastOne(cutoff_ratio)) return false;
    // Unused by the relations but still part of the parameter set.
    if (!std::isfinite(expansion_ratio)) return false;
    if (!positive(T3_atkinson_K)) return false;
    return true;
}

std::uint32_t CycleParameters::paramHash() const {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_f64(h, gamma);
    h = fnv1a32_add_f64(h, R_kJ_per_kgK);
    h = fnv1a32_add_f64(h, cv_kJ_per_kgK);
    h = fnv1a32_add_f64(h, cp_kJ_per_kgK);
    h = fnv1a32_add_f64(h, P1_kPa);
    h = fnv1a32_add_f64(h, T1_K);
    h = fnv1a32_add_f64(h, compression_ratio);
    h = fnv1a32_add_f64(h, pressure_ratio);
    h = fnv1a32_add_f64(h, cutoff_ratio);
    h = fnv1a32_add_f64(h, expansion_ratio);
    h = fnv1a32_add_f64(h, T3_atkinson_K);
    return h;
}

} // namespace cyclecmp
