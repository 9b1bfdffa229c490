/*-----------------------------------------------------------------------------
 *  config_io.cpp
 *---------------------------------------------------------------------------*/
#include "config_io.hpp"

#include "errors.hpp"

namespace wayfinder {

namespace {

template <typename T>
void read(const YAML::Node& node, const char* key, T& out)
{
    if (node[key])
        out = node[key].as<T>();
}

void readBounds(const YAML::Node& node, const char* key, Bounds& out)
{
    const YAML::Node b = node[key];
    if (!b)
        return;
    if (b.IsSequence() && b.size() == 2)
    {
        out.lo = b[0].as<double>();
        out.hi = b[1].as<double>();
        return;
    }
    read(b, "lo", out.lo);
    read(b, "hi", out.hi);
}

void parseSpaceSyntax(const YAML::Node& n, SpaceSyntaxConfig& c)
{
    read(n, "bottleneck_percentile", c.bottleneckPercentile);
    read(n, "hub_percentile",        c.hubPercentile);
    read(n, "min_rra",               c.minRra);
    read(n, "tie_tolerance",         c.tieTolerance);
    read(n, "parallel",              c.parallel);
}

void parseVisibility(const YAML::Node& n, VisibilityConfig& c)
{
    read(n, "grid_spacing",               c.sampling.gridSpacing);
    read(n, "max_samples",                c.sampling.maxSamples);
    read(n, "coarsen_factor",             c.sampling.coarsenFactor);
    read(n, "wall_epsilon",               c.sampling.wallEpsilon);
    read(n, "ray_count",                  c.rayCount);
    read(n, "max_ray_range",              c.maxRayRange);
    read(n, "area_normalization",         c.areaNormalization);
    read(n, "max_visibility_distance",    c.maxVisibilityDistance);
    read(n, "blind_spot_percentile",      c.blindSpotPercentile);
    read(n, "wide_visibility_percentile", c.wideVisibilityPercentile);
    read(n, "degenerate_area_epsilon",    c.degenerateAreaEpsilon);
    read(n, "parallel",                   c.parallel);
}

void parseSimulation(const YAML::Node& n, SimulationConfig& c)
{
    if (const YAML::Node agents = n["agents"])
    {
        for (const auto& kv : agents)
        {
            const std::string name = kv.first.as<std::string>();
            const auto type = agentTypeFromString(name);
            if (!type)
                throw AnalysisError(Guard::InvalidConfig, "simulation.agents." + name,
                                    "unknown agent type");
            AgentProfile& p = c.agents[agentTypeIndex(*type)];
            read(kv.second, "base_error_rate", p.baseErrorRate);
            read(kv.second, "speed",           p.speed);
        }
    }

    read(n, "degree_factor",              c.degreeFactor);
    read(n, "error_cap",                  c.errorCap);
    read(n, "no_signage_factor",          c.noSignageFactor);
    read(n, "no_landmark_factor",         c.noLandmarkFactor);
    read(n, "cue_radius",                 c.cueRadius);
    read(n, "require_cue_line_of_sight",  c.requireCueLineOfSight);
    read(n, "decision_dwell_seconds",     c.decisionDwellSeconds);
    read(n, "error_penalty_seconds",      c.errorPenaltySeconds);
    read(n, "hesitation_penalty_seconds", c.hesitationPenaltySeconds);
    read(n, "step_budget_factor",         c.stepBudgetFactor);
    read(n, "min_step_budget",            c.minStepBudget);
    read(n, "seed",                       c.seed);
    read(n, "recommend_success_below",    c.recommendSuccessBelow);
    read(n, "recommend_time_above",       c.recommendTimeAbove);
    read(n, "recommend_errors_above",     c.recommendErrorsAbove);
    read(n, "keep_traces",                c.keepTraces);
    read(n, "parallel",                   c.parallel);
}

void parseWes(const YAML::Node& n, WesConfig& c)
{
    if (const YAML::Node w = n["weights"])
    {
        read(w, "time",               c.weights.time);
        read(w, "detour",             c.weights.detour);
        read(w, "errors",             c.weights.errors);
        read(w, "hesitations",        c.weights.hesitations);
        read(w, "visual_integration", c.weights.visualIntegration);
        read(w, "signage",            c.weights.signage);
        read(w, "accessibility",      c.weights.accessibility);
    }
    if (const YAML::Node b = n["bounds"])
    {
        readBounds(b, "time",               c.bounds.time);
        readBounds(b, "detour",             c.bounds.detour);
        readBounds(b, "errors",             c.bounds.errors);
        readBounds(b, "hesitations",        c.bounds.hesitations);
        readBounds(b, "visual_integration", c.bounds.visualIntegration);
        readBounds(b, "signage",            c.bounds.signage);
        readBounds(b, "accessibility",      c.bounds.accessibility);
    }
    if (const YAML::Node m = n["benchmarks"])
    {
        read(m, "max_time",               c.benchmarks.maxTime);
        read(m, "max_detour",             c.benchmarks.maxDetour);
        read(m, "max_errors",             c.benchmarks.maxErrors);
        read(m, "max_hesitations",        c.benchmarks.maxHesitations);
        read(m, "min_visual_integration", c.benchmarks.minVisualIntegration);
        read(m, "min_signage",            c.benchmarks.minSignage);
        read(m, "min_accessibility",      c.benchmarks.minAccessibility);
    }
    read(n, "priority_threshold", c.priorityThreshold);
}

void require(bool ok, const std::string& key, const std::string& what)
{
    if (!ok)
        throw AnalysisError(Guard::InvalidConfig, key, what);
}

bool isPercentile(double q) { return q >= 0.0 && q <= 100.0; }
bool isProbability(double p) { return p >= 0.0 && p <= 1.0; }

} // namespace

AnalyzerConfig parseConfig(const YAML::Node& root)
{
    AnalyzerConfig cfg;
    if (!root || root.IsNull())
        return cfg;

    try {
        if (root["space_syntax"]) parseSpaceSyntax(root["space_syntax"], cfg.spaceSyntax);
        if (root["visibility"])   parseVisibility(root["visibility"], cfg.visibility);
        if (root["simulation"])   parseSimulation(root["simulation"], cfg.simulation);
        if (root["wes"])          parseWes(root["wes"], cfg.wes);
        read(root, "verbose", cfg.verbose);
    } catch (const YAML::Exception& e) {
        throw AnalysisError(Guard::InvalidConfig, "config", e.what());
    }

    validate(cfg);
    return cfg;
}

AnalyzerConfig loadConfig(const std::string& path)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw AnalysisError(Guard::InvalidConfig, path, e.what());
    }
    return parseConfig(root);
}

void validate(const AnalyzerConfig& cfg)
{
    const auto& ss = cfg.spaceSyntax;
    require(isPercentile(ss.bottleneckPercentile), "space_syntax.bottleneck_percentile", "must be in [0,100]");
    require(isPercentile(ss.hubPercentile),        "space_syntax.hub_percentile",        "must be in [0,100]");
    require(ss.minRra > 0.0,                       "space_syntax.min_rra",               "must be positive");
    require(ss.tieTolerance >= 0.0,                "space_syntax.tie_tolerance",         "must not be negative");

    const auto& vis = cfg.visibility;
    require(vis.sampling.gridSpacing > 0.0,   "visibility.grid_spacing",   "must be positive");
    require(vis.sampling.maxSamples >= 1,     "visibility.max_samples",    "must be at least 1");
    require(vis.sampling.coarsenFactor > 1.0, "visibility.coarsen_factor", "must be greater than 1");
    require(vis.sampling.wallEpsilon >= 0.0,  "visibility.wall_epsilon",   "must not be negative");
    require(vis.rayCount >= 3,                "visibility.ray_count",      "must be at least 3");
    require(vis.maxRayRange > 0.0,            "visibility.max_ray_range",  "must be positive");
    require(vis.areaNormalization > 0.0,      "visibility.area_normalization", "must be positive");
    require(vis.maxVisibilityDistance >= 0.0, "visibility.max_visibility_distance", "must not be negative");
    require(isPercentile(vis.blindSpotPercentile),      "visibility.blind_spot_percentile",      "must be in [0,100]");
    require(isPercentile(vis.wideVisibilityPercentile), "visibility.wide_visibility_percentile", "must be in [0,100]");

    const auto& sim = cfg.simulation;
    for (AgentType t : kAllAgentTypes)
    {
        const auto& p = profileFor(sim.agents, t);
        const std::string key = std::string("simulation.agents.") + agentTypeName(t);
        require(isProbability(p.baseErrorRate), key + ".base_error_rate", "must be in [0,1]");
        require(p.speed > 0.0,                  key + ".speed",           "must be positive");
    }
    require(sim.degreeFactor >= 0.0,             "simulation.degree_factor",      "must not be negative");
    require(isProbability(sim.errorCap),         "simulation.error_cap",          "must be in [0,1]");
    require(sim.noSignageFactor >= 0.0,          "simulation.no_signage_factor",  "must not be negative");
    require(sim.noLandmarkFactor >= 0.0,         "simulation.no_landmark_factor", "must not be negative");
    require(sim.cueRadius >= 0.0,                "simulation.cue_radius",         "must not be negative");
    require(sim.decisionDwellSeconds >= 0.0,     "simulation.decision_dwell_seconds",     "must not be negative");
    require(sim.errorPenaltySeconds >= 0.0,      "simulation.error_penalty_seconds",      "must not be negative");
    require(sim.hesitationPenaltySeconds >= 0.0, "simulation.hesitation_penalty_seconds", "must not be negative");
    require(sim.stepBudgetFactor > 0.0,          "simulation.step_budget_factor", "must be positive");
    require(sim.minStepBudget >= 1,              "simulation.min_step_budget",    "must be at least 1");
    require(isProbability(sim.recommendSuccessBelow), "simulation.recommend_success_below", "must be in [0,1]");
    require(sim.recommendTimeAbove >= 0.0,       "simulation.recommend_time_above",   "must not be negative");
    require(sim.recommendErrorsAbove >= 0.0,     "simulation.recommend_errors_above", "must not be negative");

    const auto& w = cfg.wes.weights;
    for (double v : {w.time, w.detour, w.errors, w.hesitations,
                     w.visualIntegration, w.signage, w.accessibility})
        require(v >= 0.0, "wes.weights", "weights must not be negative");

    const auto& b = cfg.wes.bounds;
    require(b.time.hi > b.time.lo,                           "wes.bounds.time",               "hi must exceed lo");
    require(b.detour.hi > b.detour.lo,                       "wes.bounds.detour",             "hi must exceed lo");
    require(b.errors.hi > b.errors.lo,                       "wes.bounds.errors",             "hi must exceed lo");
    require(b.hesitations.hi > b.hesitations.lo,             "wes.bounds.hesitations",        "hi must exceed lo");
    require(b.visualIntegration.hi > b.visualIntegration.lo, "wes.bounds.visual_integration", "hi must exceed lo");
    require(b.signage.hi > b.signage.lo,                     "wes.bounds.signage",            "hi must exceed lo");
    require(b.accessibility.hi > b.accessibility.lo,         "wes.bounds.accessibility",      "hi must exceed lo");
    require(isProbability(cfg.wes.priorityThreshold),        "wes.priority_threshold",        "must be in [0,1]");

    const auto& m = cfg.wes.benchmarks;
    require(m.maxTime > 0.0,        "wes.benchmarks.max_time",        "must be positive");
    require(m.maxDetour > 0.0,      "wes.benchmarks.max_detour",      "must be positive");
    require(m.maxErrors > 0.0,      "wes.benchmarks.max_errors",      "must be positive");
    require(m.maxHesitations > 0.0, "wes.benchmarks.max_hesitations", "must be positive");
    require(isProbability(m.minVisualIntegration), "wes.benchmarks.min_visual_integration", "must be in [0,1]");
    require(isProbability(m.minSignage),           "wes.benchmarks.min_signage",            "must be in [0,1]");
    require(isProbability(m.minAccessibility),     "wes.benchmarks.min_accessibility",      "must be in [0,1]");
}

} // namespace wayfinder
