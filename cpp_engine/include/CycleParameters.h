#pragma once

#include <cstdint>

namespace cyclecmp {

// Air-standard working-fluid and cycle parameters.
// Defaults reproduce the reference comparison (r_c = 12, air at 300 K / 100 kPa).
struct CycleParameters {
    // Working fluid
    double gamma = 1.4;           // specific heat ratio cp/cv
    double R_kJ_per_kgK = 0.287;  // gas constant
    double cv_kJ_per_kgK = 0.718; // specific heat at constant volume
    double cp_kJ_per_kgK = 1.005; // specific heat at constant pressure

    // State 1 (shared by every cycle)
    double P1_kPa = 100.0;
    double T1_K = 300.0;

    // Cycle ratios
    double compression_ratio = 12.0; // V1 / V2
    double pressure_ratio = 1.7;     // P3 / P2 (Dual, Otto)
    double cutoff_ratio = 1.55;      // V_after / V_before across isobaric heat addition
    double expansion_ratio = 17.0;   // Atkinson expansion ratio. Not used by any relation.

    // Atkinson peak temperature after isochoric heat addition
    double T3_atkinson_K = 1320.0;

    // V1 = R*T1/P1 (m^3/kg).
    double initialVolume() const { return R_kJ_per_kgK * T1_K / P1_kPa; }

    // Every field finite, gamma > 1, positive fluid properties and state 1,
    // ratios >= 1.
    bool isValid() const;

    // FNV-1a32 over every field in declaration order.
    std::uint32_t paramHash() const;
};

} // namespace cyclecmp
