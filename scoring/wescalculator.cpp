/*-----------------------------------------------------------------------------
 *  wescalculator.cpp
 *---------------------------------------------------------------------------*/
#include "wescalculator.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>

#include "simulation/agentsimulator.hpp"
#include "visibility/vga.hpp"

namespace wayfinder {

/* ===== names / bands ======================================================== */
const char* wesBandName(WesBand b) noexcept
{
    switch (b)
    {
        case WesBand::Excellent:  return "excellent";
        case WesBand::Good:       return "good";
        case WesBand::Acceptable: return "acceptable";
        case WesBand::Poor:       return "poor";
        case WesBand::Critical:   return "critical";
    }
    return "critical";
}

const char* wesComponentName(WesComponent c) noexcept
{
    switch (c)
    {
        case WesComponent::Time:              return "time";
        case WesComponent::Detour:            return "detour";
        case WesComponent::Errors:            return "errors";
        case WesComponent::Hesitations:       return "hesitations";
        case WesComponent::VisualIntegration: return "visual_integration";
        case WesComponent::Signage:           return "signage";
        case WesComponent::Accessibility:     return "accessibility";
    }
    return "time";
}

const char* priorityLevelName(PriorityLevel p) noexcept
{
    switch (p)
    {
        case PriorityLevel::High:   return "HIGH";
        case PriorityLevel::Medium: return "MEDIUM";
        case PriorityLevel::Low:    return "LOW";
    }
    return "LOW";
}

WesBand wesBand(double score) noexcept
{
    if (score >= 90.0) return WesBand::Excellent;
    if (score >= 75.0) return WesBand::Good;
    if (score >= 60.0) return WesBand::Acceptable;
    if (score >= 45.0) return WesBand::Poor;
    return WesBand::Critical;
}

const char* wesGrade(double score) noexcept
{
    if (score >= 90.0) return "A+";
    if (score >= 85.0) return "A";
    if (score >= 80.0) return "A-";
    if (score >= 75.0) return "B+";
    if (score >= 70.0) return "B";
    if (score >= 65.0) return "B-";
    if (score >= 60.0) return "C+";
    if (score >= 55.0) return "C";
    if (score >= 50.0) return "C-";
    if (score >= 45.0) return "D";
    return "F";
}

double normalizeClamped(double v, const Bounds& b) noexcept
{
    if (std::isnan(v))
        return 0.0;
    if (b.hi <= b.lo)
        return v >= b.hi ? 1.0 : 0.0;
    return std::clamp((v - b.lo) / (b.hi - b.lo), 0.0, 1.0);
}

/* ===== inputs =============================================================== */
WesInputs WesInputs::fromAnalyses(const SimulationResult& simulation,
                                  const VgaResult*        visibility,
                                  double                  signage,
                                  double                  accessibility)
{
    WesInputs in;
    in.meanTime        = simulation.overall.meanTime;
    in.detourIndex     = simulation.overall.meanDetourIndex;
    in.meanErrors      = simulation.overall.meanErrors;
    in.meanHesitations = simulation.overall.meanHesitations;
    if (visibility)
        in.visualIntegration = visibility->summary.visualIntegration.mean;
    in.signage       = signage;
    in.accessibility = accessibility;
    return in;
}

/* ===== benchmarks =========================================================== */
BenchmarkReport compareToBenchmarks(const WesInputs& in, const WesBenchmarks& m)
{
    struct Row { WesComponent c; double value; double benchmark; bool upper; };
    const std::array<Row, kWesComponentCount> rows = {{
        {WesComponent::Time,              in.meanTime,          m.maxTime,              true},
        {WesComponent::Detour,            in.detourIndex,       m.maxDetour,            true},
        {WesComponent::Errors,            in.meanErrors,        m.maxErrors,            true},
        {WesComponent::Hesitations,       in.meanHesitations,   m.maxHesitations,       true},
        {WesComponent::VisualIntegration, in.visualIntegration, m.minVisualIntegration, false},
        {WesComponent::Signage,           in.signage,           m.minSignage,           false},
        {WesComponent::Accessibility,     in.accessibility,     m.minAccessibility,     false},
    }};

    BenchmarkReport report;
    for (const auto& r : rows)
    {
        auto& c = report.checks[static_cast<std::size_t>(r.c)];
        c.component     = r.c;
        c.value         = r.value;
        c.benchmark     = r.benchmark;
        c.upperLimit    = r.upper;
        c.meetsStandard = r.upper ? r.value <= r.benchmark : r.value >= r.benchmark;
        if (r.upper && r.benchmark > 0.0)
            c.percentOfBenchmark = r.value / r.benchmark * 100.0;
        report.met += c.meetsStandard;
    }
    report.compliancePercent = 100.0 * static_cast<double>(report.met) / static_cast<double>(kWesComponentCount);
    return report;
}

/* ===== WesCalculator ======================================================== */
WesCalculator::WesCalculator(WesConfig cfg, bool verbose)
    : cfg_{cfg}, verbose_{verbose}
{}

WesResult WesCalculator::evaluate(const WesInputs& in) const
{
    WesResult res;
    res.inputs = in;

    // external composites may arrive on a 0..100 scale
    auto unitScale = [&](double v, const char* name)
    {
        if (v > 1.0)
        {
            warn(res.diagnostics, "wes", name, "value above 1 read as a percentage");
            return v / 100.0;
        }
        return v;
    };
    res.inputs.signage       = unitScale(in.signage, "signage");
    res.inputs.accessibility = unitScale(in.accessibility, "accessibility");

    const auto& w = cfg_.weights;
    const auto& b = cfg_.bounds;

    const double weightSum = w.time + w.detour + w.errors + w.hesitations +
                             w.visualIntegration + w.signage + w.accessibility;
    if (std::abs(weightSum - 100.0) >= 0.01)
        warn(res.diagnostics, "wes", "weights",
             "weights sum to " + std::to_string(weightSum) + " instead of 100");

    struct Row { WesComponent c; double raw; const Bounds* bounds; double weight; bool penalty; };
    const std::array<Row, kWesComponentCount> rows = {{
        {WesComponent::Time,              res.inputs.meanTime,          &b.time,              w.time,              true},
        {WesComponent::Detour,            res.inputs.detourIndex,       &b.detour,            w.detour,            true},
        {WesComponent::Errors,            res.inputs.meanErrors,        &b.errors,            w.errors,            true},
        {WesComponent::Hesitations,       res.inputs.meanHesitations,   &b.hesitations,       w.hesitations,       true},
        {WesComponent::VisualIntegration, res.inputs.visualIntegration, &b.visualIntegration, w.visualIntegration, false},
        {WesComponent::Signage,           res.inputs.signage,           &b.signage,           w.signage,           false},
        {WesComponent::Accessibility,     res.inputs.accessibility,     &b.accessibility,     w.accessibility,     false},
    }};

    double total = 100.0;
    for (const auto& r : rows)
    {
        auto& cs = res.components[static_cast<std::size_t>(r.c)];
        cs.component  = r.c;
        cs.raw        = r.raw;
        cs.weight     = r.weight;
        cs.normalized = normalizeClamped(r.raw, *r.bounds);
        cs.clamped    = std::isnan(r.raw) || r.raw < r.bounds->lo || r.raw > r.bounds->hi;
        cs.quality    = r.penalty ? 1.0 - cs.normalized : cs.normalized;
        cs.contribution = r.penalty ? -r.weight * cs.normalized : r.weight * cs.normalized;
        total += cs.contribution;

        if (cs.clamped)
            warn(res.diagnostics, "wes", wesComponentName(r.c),
                 "value " + std::to_string(r.raw) + " outside [" + std::to_string(r.bounds->lo) +
                 ", " + std::to_string(r.bounds->hi) + "], clamped");
    }

    res.unclampedScore = total;
    res.score = std::clamp(total, 0.0, 100.0);
    res.band  = wesBand(res.score);
    res.grade = wesGrade(res.score);

    for (const auto& cs : res.components)
    {
        if (cs.quality >= cfg_.priorityThreshold)
            continue;
        ImprovementPriority p;
        p.component = cs.component;
        p.quality   = cs.quality;
        p.potential = 1.0 - cs.quality;
        p.impact    = p.potential * cs.weight * 0.9;
        p.level     = p.impact > 5.0 ? PriorityLevel::High
                    : p.impact > 2.0 ? PriorityLevel::Medium
                                     : PriorityLevel::Low;
        res.priorities.push_back(p);
    }
    std::stable_sort(res.priorities.begin(), res.priorities.end(),
                     [](const ImprovementPriority& a, const ImprovementPriority& b) {
                         return a.impact > b.impact;
                     });

    res.benchmarks = compareToBenchmarks(res.inputs, cfg_.benchmarks);

    if (verbose_)
        std::cout << "[wes] score " << res.score << " (" << wesBandName(res.band)
                  << ", " << res.grade << "), benchmarks met " << res.benchmarks.met
                  << "/" << kWesComponentCount << '\n';
    return res;
}

DesignComparison WesCalculator::compareDesigns(const std::vector<std::pair<std::string, double>>& scores)
{
    DesignComparison cmp;
    if (scores.empty())
        return cmp;

    std::size_t best = 0, worst = 0;
    double sum = 0.0;
    for (std::size_t i = 0; i < scores.size(); ++i)
    {
        sum += scores[i].second;
        if (scores[i].second > scores[best].second)  best = i;
        if (scores[i].second < scores[worst].second) worst = i;
    }

    const double n = static_cast<double>(scores.size());
    cmp.best       = scores[best].first;
    cmp.worst      = scores[worst].first;
    cmp.bestScore  = scores[best].second;
    cmp.worstScore = scores[worst].second;
    cmp.mean       = sum / n;
    cmp.range      = cmp.bestScore - cmp.worstScore;

    double sq = 0.0;
    for (const auto& s : scores)
        sq += (s.second - cmp.mean) * (s.second - cmp.mean);
    cmp.stddev = std::sqrt(sq / n);
    return cmp;
}

} // namespace wayfinder
