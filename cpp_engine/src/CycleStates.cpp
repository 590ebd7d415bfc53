#include "CycleStates.h"

#include <cmath>

namespace cyclecmp {

namespace {

static inline StatePoint makeState(double P_kPa, double V_m3_per_kg, double T_K) {
    StatePoint s;
    s.P_kPa = P_kPa;
    s.V_m3_per_kg = V_m3_per_kg;
    s.T_K = T_K;
    return s;
}

static inline StatePoint initialState(const CycleParameters& p) {
    return makeState(p.P1_kPa, p.initialVolume(), p.T1_K);
}

// 1 -> 2: isentropic compression through the compression ratio.
static inline StatePoint compress(const CycleParameters& p, const StatePoint& s1) {
    const double rc = p.compression_ratio;
    return makeState(s1.P_kPa * std::pow(rc, p.gamma),
                     s1.V_m3_per_kg / rc,
                     s1.T_K * std::pow(rc, p.gamma - 1.0));
}

// Isentropic expansion from s down to volume V_end.
static inline StatePoint expandTo(const CycleParameters& p, const StatePoint& s, double V_end) {
    const double ratio = s.V_m3_per_kg / V_end;
    return makeState(s.P_kPa * std::pow(ratio, p.gamma),
                     V_end,
                     s.T_K * std::pow(ratio, p.gamma - 1.0));
}

static CycleStates begin(const CycleParameters& p, CycleKind kind) {
    CycleStates c;
    c.kind = kind;
    if (!p.isValid()) {
        return c;
    }
    c.valid = true;
    c.points.reserve(5);
    c.legs.reserve(5);
    c.points.push_back(initialState(p));
    return c;
}

} // namespace

const char* cycleName(CycleKind kind) {
    switch (kind) {
    case CycleKind::Dual:     return "Dual";
    case CycleKind::Otto:     return "Otto";
    case CycleKind::Diesel:   return "Diesel";
    case CycleKind::Atkinson: return "Atkinson";
    }
    return "Unknown";
}

const char* processName(ProcessKind kind) {
    switch (kind) {
    case ProcessKind::Isentropic: return "isentropic";
    case ProcessKind::Isochoric:  return "isochoric";
    case ProcessKind::Isobaric:   return "isobaric";
    }
    return "unknown";
}

CycleStates solveDual(const CycleParameters& p) {
    CycleStates c = begin(p, CycleKind::Dual);
    if (!c.valid) return c;

    const StatePoint s1 = c.points[0];
    const StatePoint s2 = compress(p, s1);

    // Constant-volume heat addition.
    const StatePoint s3 = makeState(p.pressure_ratio * s2.P_kPa,
                                    s2.V_m3_per_kg,
                                    s2.T_K * p.pressure_ratio);

    // Constant-pressure heat addition through the cutoff ratio.
    const StatePoint s4 = makeState(s3.P_kPa,
                                    p.cutoff_ratio * s3.V_m3_per_kg,
                                    s3.T_K * p.cutoff_ratio);

    const StatePoint s5 = expandTo(p, s4, s1.V_m3_per_kg);

    c.points.push_back(s2);
    c.points.push_back(s3);
    c.points.push_back(s4);
    c.points.push_back(s5);
    c.legs = {ProcessKind::Isentropic, ProcessKind::Isochoric, ProcessKind::Isobaric,
              ProcessKind::Isentropic, ProcessKind::Isochoric};
    return c;
}

CycleStates solveOtto(const CycleParameters& p) {
    CycleStates c = begin(p, CycleKind::Otto);
    if (!c.valid) return c;

    const StatePoint s1 = c.points[0];
    const StatePoint s2 = compress(p, s1);

    const double T3 = s2.T_K * p.pressure_ratio;
    const StatePoint s3 = makeState(s2.P_kPa * (T3 / s2.T_K), s2.V_m3_per_kg, T3);

    const StatePoint s4 = expandTo(p, s3, s1.V_m3_per_kg);

    c.points.push_back(s2);
    c.points.push_back(s3);
    c.points.push_back(s4);
    c.legs = {ProcessKind::Isentropic, ProcessKind::Isochoric,
              ProcessKind::Isentropic, ProcessKind::Isochoric};
    return c;
}

CycleStates solveDiesel(const CycleParameters& p) {
    CycleStates c = begin(p, CycleKind::Diesel);
    if (!c.valid) return c;

    const StatePoint s1 = c.points[0];
    const StatePoint s2 = compress(p, s1);

    const StatePoint s3 = makeState(s2.P_kPa,
                                    p.cutoff_ratio * s2.V_m3_per_kg,
                                    s2.T_K * p.cutoff_ratio);

    const StatePoint s4 = expandTo(p, s3, s1.V_m3_per_kg);

    c.points.push_back(s2);
    c.points.push_back(s3);
    c.points.push_back(s4);
    c.legs = {ProcessKind::Isentropic, ProcessKind::Isobaric,
              ProcessKind::Isentropic, ProcessKind::Isochoric};
    return c;
}

CycleStates solveAtkinson(const CycleParameters& p) {
    CycleStates c = begin(p, CycleKind::Atkinson);
    if (!c.valid) return c;

    const StatePoint s1 = c.points[0];
    const StatePoint s2 = compress(p, s1);

    // Peak temperature is fixed; pressure follows from P/T = const at V2.
    const double T3 = p.T3_atkinson_K;
    const StatePoint s3 = makeState(s2.P_kPa * (T3 / s2.T_K), s2.V_m3_per_kg, T3);

    // Full expansion back to V1.
    const StatePoint s4 = expandTo(p, s3, s1.V_m3_per_kg);

    c.points.push_back(s2);
    c.points.push_back(s3);
    c.points.push_back(s4);
    c.legs = {ProcessKind::Isentropic, ProcessKind::Isochoric,
              ProcessKind::Isentropic, ProcessKind::Isochoric};
    return c;
}

CycleStates solveCycle(const CycleParameters& p, CycleKind kind) {
    switch (kind) {
    case CycleKind::Dual:     return solveDual(p);
    case CycleKind::Otto:     return solveOtto(p);
    case CycleKind::Diesel:   return solveDiesel(p);
    case CycleKind::Atkinson: return solveAtkinson(p);
    }
    CycleStates invalid;
    invalid.kind = kind;
    return invalid;
}

std::array<CycleStates, kNumCycles> solveAllCycles(const CycleParameters& p) {
    return {{
        solveDual(p),
        solveOtto(p),
        solveDiesel(p),
        solveAtkinson(p),
    }};
}

} // namespace cyclecmp
