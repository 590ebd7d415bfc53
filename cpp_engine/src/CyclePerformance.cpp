#include "CyclePerformance.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace cyclecmp {

namespace {

static std::size_t expectedStates(CycleKind kind) {
    return (kind == CycleKind::Dual) ? 5u : 4u;
}

} // namespace

CyclePerformance computePerformance(const CycleParameters& p, const CycleStates& states) {
    CyclePerformance perf;
    perf.kind = states.kind;
    if (!states.valid || !p.isValid() || states.points.size() != expectedStates(states.kind)) {
        return perf;
    }

    const StatePoint& s1 = states.state(1);
    const double m = s1.P_kPa * s1.V_m3_per_kg / (p.R_kJ_per_kgK * s1.T_K);
    const double cv = p.cv_kJ_per_kgK;
    const double cp = p.cp_kJ_per_kgK;

    const double T1 = s1.T_K;
    const double T2 = states.state(2).T_K;
    const double T3 = states.state(3).T_K;
    const double T4 = states.state(4).T_K;

    double Q_in = 0.0;
    double Q_out = 0.0;
    switch (states.kind) {
    case CycleKind::Dual:
        Q_in = m * cv * (T3 - T2) + m * cp * (T4 - T3);
        Q_out = m * cv * (states.state(5).T_K - T1);
        break;
    case CycleKind::Otto:
        Q_in = m * cv * (T3 - T2);
        Q_out = m * cv * (T4 - T1);
        break;
    case CycleKind::Diesel:
        Q_in = m * cp * (T3 - T2);
        Q_out = m * cv * (T4 - T1);
        break;
    case CycleKind::Atkinson:
        Q_in = m * cv * (T3 - T2);
        Q_out = m * cp * (T4 - T1);
        break;
    }

    if (!std::isfinite(Q_in) || !std::isfinite(Q_out) || Q_in <= 0.0) {
        return perf;
    }

    perf.mass_kg = m;
    perf.Q_in_kJ = Q_in;
    perf.Q_out_kJ = Q_out;
    perf.W_net_kJ = Q_in - Q_out;
    perf.efficiency_pct = perf.W_net_kJ / Q_in * 100.0;
    perf.valid = true;
    return perf;
}

std::string formatAtkinsonReport(const CycleStates& atkinson, const CyclePerformance& perf) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    out << "=== Atkinson Cycle Performance ===\n";
    if (!atkinson.valid || atkinson.points.size() < 4 || !perf.valid) {
        out << "(no valid Atkinson cycle)\n\n";
        return out.str();
    }
    out << "T1 = " << atkinson.state(1).T_K << " K, T2 = " << atkinson.state(2).T_K << " K\n";
    out << "T3 = " << atkinson.state(3).T_K << " K, T4 = " << atkinson.state(4).T_K << " K\n\n";
    out << "Heat Input (Q_in) = " << perf.Q_in_kJ << " kJ\n";
    out << "Heat Rejected (Q_out) = " << perf.Q_out_kJ << " kJ\n";
    out << "Net Work Output (W_net) = " << perf.W_net_kJ << " kJ\n";
    out << "Thermal Efficiency = " << perf.efficiency_pct << "%\n\n";
    return out.str();
}

} // namespace cyclecmp
