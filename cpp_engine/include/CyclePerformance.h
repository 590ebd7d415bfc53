#pragma once

#include <string>

#include "CycleParameters.h"
#include "CycleStates.h"

namespace cyclecmp {

struct CyclePerformance {
    bool valid = false;
    CycleKind kind = CycleKind::Dual;

    double mass_kg = 0.0;   // m = P1*V1 / (R*T1)
    double Q_in_kJ = 0.0;
    double Q_out_kJ = 0.0;
    double W_net_kJ = 0.0;  // Q_in - Q_out
    double efficiency_pct = 0.0; // W_net / Q_in * 100
};

// Heat balance of one solved cycle:
//   Dual:     Q_in = m*cv*(T3-T2) + m*cp*(T4-T3), Q_out = m*cv*(T5-T1)
//   Otto:     Q_in = m*cv*(T3-T2),                Q_out = m*cv*(T4-T1)
//   Diesel:   Q_in = m*cp*(T3-T2),                Q_out = m*cv*(T4-T1)
//   Atkinson: Q_in = m*cv*(T3-T2),                Q_out = m*cp*(T4-T1)
// Returns valid == false for invalid states or non-positive heat input.
CyclePerformance computePerformance(const CycleParameters& p, const CycleStates& states);

// Fixed-format report (two decimals, K / kJ / %). Ends with a blank line.
std::string formatAtkinsonReport(const CycleStates& atkinson, const CyclePerformance& perf);

} // namespace cyclecmp
