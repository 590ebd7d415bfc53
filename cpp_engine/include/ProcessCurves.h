#pragma once

#include <cstddef>
#include <vector>

#include "CycleStates.h"

namespace cyclecmp {

constexpr int kSamplesPerLeg = 100;

struct CurvePoint {
    double V_m3_per_kg = 0.0;
    double P_kPa = 0.0;
};

// One process leg between two state points.
//
// Samples are produced on demand by sampleAt(); samples() materializes them.
//   - Isentropic / isobaric: sample_count evenly spaced volumes from start to end.
//   - Isochoric: the two endpoints only (vertical line).
// The first and last samples are exactly the declared endpoints.
class ProcessLeg {
public:
    ProcessLeg() = default;
    ProcessLeg(ProcessKind kind, const StatePoint& from, const StatePoint& to,
               double gamma, int sample_count = kSamplesPerLeg);

    ProcessKind kind() const { return kind_; }
    const StatePoint& from() const { return from_; }
    const StatePoint& to() const { return to_; }

    std::size_t sampleCount() const;

    // i in [0, sampleCount()). Out-of-range indices clamp to the nearest endpoint.
    CurvePoint sampleAt(std::size_t i) const;

    std::vector<CurvePoint> samples() const;

private:
    ProcessKind kind_ = ProcessKind::Isochoric;
    StatePoint from_{};
    StatePoint to_{};
    double gamma_ = 1.4;
    int sample_count_ = kSamplesPerLeg;
};

// Closed P-V loop for one cycle: legs in process order, last leg returns to state 1.
class CycleTrace {
public:
    CycleTrace() = default;

    // Builds one leg per CycleStates::legs entry. An invalid CycleStates
    // yields an empty trace.
    static CycleTrace build(const CycleStates& states, double gamma,
                            int samples_per_leg = kSamplesPerLeg);

    CycleKind kind() const { return kind_; }
    const std::vector<ProcessLeg>& legs() const { return legs_; }
    bool empty() const { return legs_.empty(); }

    // Concatenated samples of every leg, in order. Shared leg endpoints appear twice.
    const std::vector<double>& volumes() const { return V_; }
    const std::vector<double>& pressures() const { return P_; }

private:
    CycleKind kind_ = CycleKind::Dual;
    std::vector<ProcessLeg> legs_;
    std::vector<double> V_;
    std::vector<double> P_;
};

// Evenly spaced values from a to b inclusive; the last value is exactly b.
std::vector<double> linspace(double a, double b, int n);

} // namespace cyclecmp
