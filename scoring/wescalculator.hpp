#pragma once
/*-----------------------------------------------------------------------------
 *  wescalculator.hpp
 *
 *  Wayfinding Effectiveness Score: clamp-normalised sub-metrics combined into
 *  one 0..100 value with a band, a letter grade and a per-component
 *  breakdown.
 *---------------------------------------------------------------------------*/
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config.hpp"
#include "errors.hpp"

namespace wayfinder {

struct SimulationResult;
struct VgaResult;

enum class WesBand : std::uint8_t
{
    Excellent = 0, ///< >= 90
    Good,          ///< >= 75
    Acceptable,    ///< >= 60
    Poor,          ///< >= 45
    Critical
};

enum class WesComponent : std::uint8_t
{
    Time = 0,
    Detour,
    Errors,
    Hesitations,
    VisualIntegration,
    Signage,
    Accessibility
};

constexpr std::size_t kWesComponentCount = 7;

enum class PriorityLevel : std::uint8_t
{
    High = 0,
    Medium,
    Low
};

const char* wesBandName(WesBand b) noexcept;
const char* wesComponentName(WesComponent c) noexcept;
const char* priorityLevelName(PriorityLevel p) noexcept;

/** Band for a score; thresholds are inclusive lower bounds. */
WesBand     wesBand(double score) noexcept;
/** A+ .. F in five-point steps above 45. */
const char* wesGrade(double score) noexcept;

/** Linear clamp of v into [0,1] against b; values outside clamp. */
double normalizeClamped(double v, const Bounds& b) noexcept;

/** Raw sub-metrics. */
struct WesInputs
{
    double meanTime{0.0};          ///< seconds
    double detourIndex{1.0};
    double meanErrors{0.0};
    double meanHesitations{0.0};
    double visualIntegration{0.0}; ///< mean VI, [0,1]
    double signage{0.0};           ///< [0,1] or percent
    double accessibility{0.0};     ///< [0,1] or percent

    /** Scenario means of the simulation, mean VI of the VGA (0 without one). */
    static WesInputs fromAnalyses(const SimulationResult& simulation,
                                  const VgaResult*        visibility,
                                  double                  signage,
                                  double                  accessibility);
};

struct WesComponentScore
{
    WesComponent component{WesComponent::Time};
    double       raw{0.0};
    double       normalized{0.0};   ///< clamp-normalised value
    double       quality{0.0};      ///< 1 = best; 1-normalized for penalties
    double       weight{0.0};
    double       contribution{0.0}; ///< signed points added to 100
    bool         clamped{false};
};

struct ImprovementPriority
{
    WesComponent  component{WesComponent::Time};
    double        quality{0.0};
    double        potential{0.0};  ///< 1 - quality
    double        impact{0.0};     ///< potential * weight * 0.9
    PriorityLevel level{PriorityLevel::Low};
};

/** One sub-metric against its acceptable level. */
struct BenchmarkCheck
{
    WesComponent          component{WesComponent::Time};
    double                value{0.0};
    double                benchmark{0.0};
    bool                  upperLimit{true};  ///< value must stay at or below benchmark
    bool                  meetsStandard{false};
    std::optional<double> percentOfBenchmark; ///< upper limits only
};

struct BenchmarkReport
{
    std::array<BenchmarkCheck, kWesComponentCount> checks{};
    std::size_t                                    met{0};
    double                                         compliancePercent{0.0};

    const BenchmarkCheck& check(WesComponent c) const
    {
        return checks[static_cast<std::size_t>(c)];
    }
};

/** Compares unit-scale inputs with @p benchmarks. */
BenchmarkReport compareToBenchmarks(const WesInputs& in, const WesBenchmarks& benchmarks);

struct WesResult
{
    WesInputs                                        inputs;
    std::array<WesComponentScore, kWesComponentCount> components{};
    double                                           unclampedScore{0.0};
    double                                           score{0.0};
    WesBand                                          band{WesBand::Critical};
    std::string                                      grade;
    std::vector<ImprovementPriority>                 priorities; ///< highest impact first
    BenchmarkReport                                  benchmarks;
    Diagnostics                                      diagnostics;

    const WesComponentScore& component(WesComponent c) const
    {
        return components[static_cast<std::size_t>(c)];
    }
};

struct DesignComparison
{
    std::string best;
    std::string worst;
    double      bestScore{0.0};
    double      worstScore{0.0};
    double      mean{0.0};
    double      stddev{0.0};
    double      range{0.0};
};

class WesCalculator
{
public:
    explicit WesCalculator(WesConfig cfg = {}, bool verbose = false);

    /**
     * Never throws on out-of-range inputs; clamps and records a diagnostic.
     * Weights not summing to 100 are used as given, with a diagnostic.
     */
    WesResult evaluate(const WesInputs& in) const;

    /** Best/worst/spread over named scores; first name wins ties. */
    static DesignComparison compareDesigns(const std::vector<std::pair<std::string, double>>& scores);

    const WesConfig& config() const noexcept { return cfg_; }

private:
    WesConfig cfg_;
    bool      verbose_;
};

} // namespace wayfinder
