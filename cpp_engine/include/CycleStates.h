#pragma once

#include <array>
#include <cstddef>
#include <vector>

#include "CycleParameters.h"

namespace cyclecmp {

enum class CycleKind : int {
    Dual = 0,
    Otto = 1,
    Diesel = 2,
    Atkinson = 3,
};

constexpr int kNumCycles = 4;

enum class ProcessKind : int {
    Isentropic = 0, // P*V^gamma = const
    Isochoric = 1,  // V = const
    Isobaric = 2,   // P = const
};

const char* cycleName(CycleKind kind);
const char* processName(ProcessKind kind);

// Thermodynamic state at a cycle vertex (per unit mass).
struct StatePoint {
    double P_kPa = 0.0;
    double V_m3_per_kg = 0.0;
    double T_K = 0.0;
};

// Closed loop of state points.
// points[0] is state 1. legs[i] is the process from points[i] to
// points[(i + 1) % points.size()], so the last leg returns to state 1.
struct CycleStates {
    CycleKind kind = CycleKind::Dual;
    bool valid = false;
    std::vector<StatePoint> points;
    std::vector<ProcessKind> legs;

    // 1-based state number, as in the textbook labelling (state(1) == points[0]).
    const StatePoint& state(int number) const { return points.at(static_cast<std::size_t>(number - 1)); }
};

// Closed-form state-point solvers. Invalid parameters yield valid == false
// with no points.
CycleStates solveDual(const CycleParameters& p);
CycleStates solveOtto(const CycleParameters& p);
CycleStates solveDiesel(const CycleParameters& p);
CycleStates solveAtkinson(const CycleParameters& p);

CycleStates solveCycle(const CycleParameters& p, CycleKind kind);

// Dual, Otto, Diesel, Atkinson (plotting order).
std::array<CycleStates, kNumCycles> solveAllCycles(const CycleParameters& p);

} // namespace cyclecmp
