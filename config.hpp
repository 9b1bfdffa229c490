#pragma once
#include <cstdint>
#include <string>

#include "simulation/agentprofile.hpp"

namespace wayfinder {

    /** Configuration for the space-syntax analyzer. */
    struct SpaceSyntaxConfig {
        double bottleneckPercentile = 90.0; ///< choice above this percentile => bottleneck
        double hubPercentile = 90.0;        ///< integration above this percentile => hub
        double minRra = 0.01;               ///< RRA floor for nodes adjacent to all others
        double tieTolerance = 1e-9;         ///< equal-length tolerance for shortest paths
        bool parallel = true;               ///< run per-node BFS with cv::parallel_for_
    };

    /** Regular sampling grid over the walkable area. */
    struct SamplingConfig {
        double gridSpacing = 1.0;   ///< distance between grid points (map units)
        int maxSamples = 2000;      ///< hard cap on sample count
        double coarsenFactor = 1.25; ///< spacing multiplier applied while over the cap
        double wallEpsilon = 1e-6;  ///< points closer than this to a wall are dropped
    };

    /** Configuration for isovists and the visibility graph. */
    struct VisibilityConfig {
        SamplingConfig sampling;             ///< grid parameters
        int rayCount = 72;                   ///< rays per isovist (72 => every 5 degrees)
        double maxRayRange = 100.0;          ///< rays stop here when nothing is hit
        double areaNormalization = 1000.0;   ///< fixed isovist area giving a full area term
        double maxVisibilityDistance = 0.0;  ///< 0 => test every pair regardless of distance
        double blindSpotPercentile = 10.0;   ///< VI below this percentile => blind spot
        double wideVisibilityPercentile = 90.0; ///< VI above this percentile => wide view
        double degenerateAreaEpsilon = 1e-9; ///< isovists at or below this area are degenerate
        bool parallel = true;                ///< use cv::parallel_for_
    };

    /** Agent decision and movement model. */
    struct SimulationConfig {
        AgentProfileTable agents = defaultAgentProfiles(); ///< per-type error rate and speed
        double degreeFactor = 0.1;           ///< k_degree: extra error per additional branch
        double errorCap = 0.9;               ///< upper bound on the error probability
        double noSignageFactor = 2.0;        ///< multiplier when no sign is near the node
        double noLandmarkFactor = 1.67;      ///< multiplier when no landmark is near the node
        double cueRadius = 5.0;              ///< search radius for signs and landmarks
        bool requireCueLineOfSight = true;   ///< cue must be visible through the walls
        double decisionDwellSeconds = 2.0;   ///< pause added when leaving a decision point
        double errorPenaltySeconds = 10.0;   ///< extra time per wrong turn
        double hesitationPenaltySeconds = 5.0; ///< extra time per revisit
        double stepBudgetFactor = 10.0;      ///< budget = factor * hop diameter
        int minStepBudget = 20;              ///< lower bound of the step budget
        std::uint64_t seed = 20240601ULL;    ///< base seed of all sub-streams
        double recommendSuccessBelow = 0.7;  ///< flag scenarios with a lower success rate
        double recommendTimeAbove = 180.0;   ///< flag scenarios with a longer mean time (s)
        double recommendErrorsAbove = 1.5;   ///< flag scenarios with more mean errors
        bool keepTraces = false;             ///< retain per-agent traces in the result
        bool parallel = true;                ///< run trials with cv::parallel_for_
    };

    /** Closed interval used for linear clamp normalisation. */
    struct Bounds {
        double lo = 0.0;
        double hi = 1.0;
    };

    /** Penalty (alpha) and bonus (beta) weights of the composite score. */
    struct WesWeights {
        double time = 15.0;              ///< alpha1
        double detour = 10.0;            ///< alpha2
        double errors = 20.0;            ///< alpha3
        double hesitations = 10.0;       ///< alpha4
        double visualIntegration = 20.0; ///< beta1
        double signage = 15.0;           ///< beta2
        double accessibility = 10.0;     ///< beta3
    };

    /** Literature-derived normalisation bounds. */
    struct WesBounds {
        Bounds time{60.0, 300.0};        ///< seconds
        Bounds detour{1.0, 2.5};         ///< ratio
        Bounds errors{0.0, 5.0};         ///< wrong turns per trip
        Bounds hesitations{0.0, 8.0};    ///< revisits per trip
        Bounds visualIntegration{0.0, 1.0};
        Bounds signage{0.0, 1.0};        ///< after percent -> unit conversion
        Bounds accessibility{0.0, 1.0};
    };

    /** Acceptable levels reported next to the score (healthcare wayfinding). */
    struct WesBenchmarks {
        double maxTime = 300.0;            ///< seconds
        double maxDetour = 1.5;            ///< ratio
        double maxErrors = 3.0;            ///< wrong turns per trip
        double maxHesitations = 5.0;       ///< revisits per trip
        double minVisualIntegration = 0.3;
        double minSignage = 0.4;           ///< unit scale
        double minAccessibility = 0.5;     ///< unit scale
    };

    /** Composite scorer configuration. */
    struct WesConfig {
        WesWeights weights;
        WesBounds bounds;
        WesBenchmarks benchmarks;
        double priorityThreshold = 0.9; ///< components with quality >= this are not prioritised
    };

    /** Combined configuration for a full analysis. */
    struct AnalyzerConfig {
        SpaceSyntaxConfig spaceSyntax; ///< graph metrics
        VisibilityConfig visibility;   ///< isovists / VGA
        SimulationConfig simulation;   ///< agent model
        WesConfig wes;                 ///< composite score
        bool verbose = false;          ///< progress lines on stdout
    };

} // namespace wayfinder
