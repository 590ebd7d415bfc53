#include "ProcessCurves.h"

#include <algorithm>
#include <cmath>

namespace cyclecmp {

std::vector<double> linspace(double a, double b, int n) {
    std::vector<double> out;
    if (n <= 0) {
        return out;
    }
    if (n == 1) {
        out.push_back(b);
        return out;
    }
    out.reserve(static_cast<std::size_t>(n));
    const double span = b - a;
    const int steps = n - 1;
    for (int i = 0; i < steps; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(steps);
        out.push_back(a + span * t);
    }
    out.push_back(b);
    return out;
}

ProcessLeg::ProcessLeg(ProcessKind kind, const StatePoint& from, const StatePoint& to,
                       double gamma, int sample_count)
    : kind_(kind), from_(from), to_(to), gamma_(gamma),
      sample_count_(std::max(2, sample_count)) {}

std::size_t ProcessLeg::sampleCount() const {
    if (kind_ == ProcessKind::Isochoric) {
        return 2;
    }
    return static_cast<std::size_t>(sample_count_);
}

CurvePoint ProcessLeg::sampleAt(std::size_t i) const {
    const std::size_t n = sampleCount();
    CurvePoint c;

    // Endpoints are pinned to the state points (no drift from pow/linspace rounding).
    if (i == 0) {
        c.V_m3_per_kg = from_.V_m3_per_kg;
        c.P_kPa = from_.P_kPa;
        return c;
    }
    if (i >= n - 1) {
        c.V_m3_per_kg = to_.V_m3_per_kg;
        c.P_kPa = to_.P_kPa;
        return c;
    }

    const double t = static_cast<double>(i) / static_cast<double>(n - 1);
    const double V = from_.V_m3_per_kg + (to_.V_m3_per_kg - from_.V_m3_per_kg) * t;
    c.V_m3_per_kg = V;

    switch (kind_) {
    case ProcessKind::Isentropic:
        c.P_kPa = from_.P_kPa * std::pow(from_.V_m3_per_kg / V, gamma_);
        break;
    case ProcessKind::Isobaric:
        c.P_kPa = from_.P_kPa;
        break;
    case ProcessKind::Isochoric:
        // Unreachable: isochoric legs have no interior samples.
        c.P_kPa = from_.P_kPa;
        break;
    }
    return c;
}

std::vector<CurvePoint> ProcessLeg::samples() const {
    const std::size_t n = sampleCount();
    std::vector<CurvePoint> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(sampleAt(i));
    }
    return out;
}

CycleTrace CycleTrace::build(const CycleStates& states, double gamma, int samples_per_leg) {
    CycleTrace trace;
    trace.kind_ = states.kind;
    if (!states.valid || states.points.empty() || states.legs.size() != states.points.size()) {
        return trace;
    }

    const std::size_t n = states.points.size();
    trace.legs_.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const StatePoint& a = states.points[i];
        const StatePoint& b = states.points[(i + 1) % n];
        trace.legs_.emplace_back(states.legs[i], a, b, gamma, samples_per_leg);
    }

    std::size_t total = 0;
    for (const auto& leg : trace.legs_) {
        total += leg.sampleCount();
    }
    trace.V_.reserve(total);
    trace.P_.reserve(total);
    for (const auto& leg : trace.legs_) {
        for (std::size_t i = 0; i < leg.sampleCount(); ++i) {
            const CurvePoint c = leg.sampleAt(i);
            trace.V_.push_back(c.V_m3_per_kg);
            trace.P_.push_back(c.P_kPa);
        }
    }
    return trace;
}

} // namespace cyclecmp
