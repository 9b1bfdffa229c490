/*-----------------------------------------------------------------------------
 *  agentsimulator.cpp
 *---------------------------------------------------------------------------*/
#include "agentsimulator.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <limits>
#include <numeric>

#include "spacesyntax/spacesyntax.hpp"
#include "visibility/vga.hpp"

namespace wayfinder {

/* ===== cues ================================================================ */
const char* signageKindName(SignageKind k) noexcept
{
    switch (k)
    {
        case SignageKind::Directional:    return "directional";
        case SignageKind::Identification: return "identification";
        case SignageKind::Information:    return "information";
        case SignageKind::Regulatory:     return "regulatory";
        case SignageKind::Landmark:       return "landmark";
    }
    return "directional";
}

std::optional<SignageKind> signageKindFromString(const std::string& name)
{
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return std::tolower(c); });
    for (SignageKind k : {SignageKind::Directional, SignageKind::Identification,
                          SignageKind::Information, SignageKind::Regulatory,
                          SignageKind::Landmark})
    {
        if (s == signageKindName(k))
            return k;
    }
    return std::nullopt;
}

NodeCues computeNodeCues(const INavGraph&                g,
                         const std::vector<SignageItem>& signage,
                         const Walls&                    walls,
                         const SimulationConfig&         cfg)
{
    NodeCues cues;
    cues.sign.assign(g.size(), 0);
    cues.landmark.assign(g.size(), 0);

    const bool checkSight = cfg.requireCueLineOfSight && !walls.empty();
    for (NodeIndex v = 0; v < g.size(); ++v)
    {
        const cv::Point2d& p = g.node(v).position();
        for (const auto& item : signage)
        {
            if (distance(p, item.position) > cfg.cueRadius)
                continue;
            if (checkSight && !hasLineOfSight(p, item.position, walls))
                continue;
            if (item.kind == SignageKind::Landmark)
                cues.landmark[v] = 1;
            else
                cues.sign[v] = 1;
        }
    }
    return cues;
}

double errorProbability(const AgentProfile&     profile,
                        std::size_t             degree,
                        bool                    hasSign,
                        bool                    hasLandmark,
                        const SimulationConfig& cfg)
{
    const double branches = degree > 0 ? static_cast<double>(degree - 1) : 0.0;
    double p = profile.baseErrorRate * (1.0 + branches * cfg.degreeFactor);
    if (!hasSign)
        p *= cfg.noSignageFactor;
    if (!hasLandmark)
        p *= cfg.noLandmarkFactor;
    return std::clamp(p, 0.0, cfg.errorCap);
}

/* ===== scenario / contexts ================================================== */
std::size_t Scenario::populationSize() const
{
    std::size_t total = 0;
    for (const auto& kv : population)
        total += kv.second;
    return total;
}

ScenarioContext makeScenarioContext(const INavGraph&        g,
                                    NodeIndex               origin,
                                    NodeIndex               destination,
                                    const NodeCues&         cues,
                                    const SimulationConfig& cfg)
{
    ScenarioContext ctx;
    ctx.graph       = &g;
    ctx.cfg         = &cfg;
    ctx.cues        = &cues;
    ctx.origin      = origin;
    ctx.destination = destination;
    ctx.distanceToDestination = shortestDistances(g, destination);
    ctx.reachable   = std::isfinite(ctx.distanceToDestination[origin]);

    // budget scales with the hop diameter of the origin's component
    const auto hops = hopDistances(g, origin);
    std::vector<NodeIndex> component;
    for (NodeIndex v = 0; v < g.size(); ++v)
        if (hops[v] != kUnreachableHops)
            component.push_back(v);

    const double scaled = std::ceil(cfg.stepBudgetFactor * static_cast<double>(hopDiameter(g, component)));
    ctx.stepBudget = std::max(cfg.minStepBudget, static_cast<int>(scaled));
    return ctx;
}

std::uint64_t deriveSeed(std::uint64_t base, std::size_t scenario, std::size_t run, std::size_t agent)
{
    auto splitmix = [](std::uint64_t x)
    {
        x += 0x9E3779B97F4A7C15ULL;
        x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
        x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
        return x ^ (x >> 31);
    };

    std::uint64_t h = splitmix(base);
    h = splitmix(h ^ (static_cast<std::uint64_t>(scenario) * 0xD1B54A32D192ED03ULL));
    h = splitmix(h ^ (static_cast<std::uint64_t>(run)      * 0x8CB92BA72F3D8DD7ULL));
    h = splitmix(h ^ (static_cast<std::uint64_t>(agent)    * 0xA24BAED4963EE407ULL));
    return h != 0 ? h : 1ULL; // cv::RNG replaces a zero state
}

RunContext::RunContext(std::uint64_t baseSeed, std::size_t scenario, std::size_t run,
                       std::size_t agent, AgentType agentType)
    : scenarioIndex{scenario}
    , runIndex{run}
    , agentIndex{agent}
    , type{agentType}
    , rng{deriveSeed(baseSeed, scenario, run, agent)}
{}

/* ===== state machine ========================================================= */
const char* agentPhaseName(AgentPhase p) noexcept
{
    switch (p)
    {
        case AgentPhase::AtNode:   return "at_node";
        case AgentPhase::Deciding: return "deciding";
        case AgentPhase::Moving:   return "moving";
        case AgentPhase::Arrived:  return "arrived";
        case AgentPhase::Stuck:    return "stuck";
    }
    return "at_node";
}

AgentState initialAgentState(AgentType type, const ScenarioContext& ctx)
{
    AgentState s;
    s.type    = type;
    s.current = ctx.origin;
    s.path.push_back(ctx.origin);
    s.visited.assign(ctx.graph->size(), 0);
    s.visited[ctx.origin] = 1;
    return s;
}

namespace {

constexpr double kPathTolerance = 1e-9;

/*
 * Neighbour minimising edge weight + remaining distance. Equal costs go to the
 * neighbour strictly closer to the destination, then away from @p previous,
 * then to the lowest index.
 */
NodeIndex bestMove(const ScenarioContext& ctx, NodeIndex at, std::optional<NodeIndex> previous)
{
    const auto& dist = ctx.distanceToDestination;
    NodeIndex best = at;
    double bestCost = std::numeric_limits<double>::infinity();
    double bestDist = std::numeric_limits<double>::infinity();
    bool   bestBack = false;
    for (const auto& adj : ctx.graph->neighbours(at))
    {
        const double cost = adj.weight + dist[adj.to];
        const bool   back = previous && adj.to == *previous;

        bool take = cost < bestCost - kPathTolerance;
        if (!take && cost <= bestCost + kPathTolerance)
        {
            if (dist[adj.to] < bestDist - kPathTolerance)
                take = true;
            else if (dist[adj.to] <= bestDist + kPathTolerance)
                take = bestBack && !back;
        }
        if (take)
        {
            best     = adj.to;
            bestCost = cost;
            bestDist = dist[adj.to];
            bestBack = back;
        }
    }
    return best;
}

AgentState decide(AgentState s, const ScenarioContext& ctx, cv::RNG& rng)
{
    const auto& g    = *ctx.graph;
    const auto& cfg  = *ctx.cfg;
    const auto& dist = ctx.distanceToDestination;
    const NodeIndex at = s.current;

    // forward choices: everything except the way back, unless that is all there is
    std::vector<Adjacency> choices;
    for (const auto& adj : g.neighbours(at))
        if (!s.previous || adj.to != *s.previous)
            choices.push_back(adj);
    if (choices.empty())
        choices = g.neighbours(at);

    const bool decisionPoint = choices.size() > 1;
    const int  errorsBefore  = s.errors;
    NodeIndex next = bestMove(ctx, at, s.previous);

    if (decisionPoint)
    {
        ++s.decisions;

        std::vector<NodeIndex> incorrect;
        for (const auto& c : choices)
            if (c.weight + dist[c.to] > dist[at] + kPathTolerance)
                incorrect.push_back(c.to);

        const double p = errorProbability(profileFor(cfg.agents, s.type), g.degree(at),
                                          (*ctx.cues).sign[at] != 0,
                                          (*ctx.cues).landmark[at] != 0, cfg);
        const double u = rng.uniform(0.0, 1.0);
        if (u < p && !incorrect.empty())
        {
            next = incorrect[static_cast<std::size_t>(
                rng.uniform(0, static_cast<int>(incorrect.size())))];
            ++s.errors;
            s.time += cfg.errorPenaltySeconds;
        }
    }

    // a correct move taken with a sign at either end counts as using it
    if (s.errors == errorsBefore && ((*ctx.cues).sign[at] != 0 || (*ctx.cues).sign[next] != 0))
        ++s.signUsages;

    s.target          = next;
    s.leavingDecision = decisionPoint;
    s.phase           = AgentPhase::Moving;
    return s;
}

AgentState travel(AgentState s, const ScenarioContext& ctx)
{
    const auto& g   = *ctx.graph;
    const auto& cfg = *ctx.cfg;
    const NodeIndex from = s.current;
    const NodeIndex to   = *s.target;

    double w = 0.0;
    for (const auto& adj : g.neighbours(from))
        if (adj.to == to) { w = adj.weight; break; }

    const double speed = profileFor(cfg.agents, s.type).speed;
    s.distance += w;
    s.time     += w / speed;
    if (s.leavingDecision)
        s.time += cfg.decisionDwellSeconds;

    ++s.steps;
    s.previous = from;
    s.current  = to;
    s.target.reset();
    s.leavingDecision = false;
    s.path.push_back(to);

    if (s.visited[to])
    {
        ++s.hesitations;
        s.time += cfg.hesitationPenaltySeconds;
    }
    s.visited[to] = 1;
    s.phase = AgentPhase::AtNode;
    return s;
}

} // namespace

AgentState step(AgentState state, const ScenarioContext& ctx, cv::RNG& rng)
{
    switch (state.phase)
    {
        case AgentPhase::AtNode:
            if (state.current == ctx.destination)
                state.phase = AgentPhase::Arrived;
            else if (!ctx.reachable || state.steps >= ctx.stepBudget)
                state.phase = AgentPhase::Stuck;
            else
                state.phase = AgentPhase::Deciding;
            return state;

        case AgentPhase::Deciding:
            return decide(std::move(state), ctx, rng);

        case AgentPhase::Moving:
            return travel(std::move(state), ctx);

        case AgentPhase::Arrived:
        case AgentPhase::Stuck:
            return state;
    }
    return state;
}

AgentRun runAgent(const ScenarioContext& ctx, RunContext& run, bool keepPath)
{
    AgentState s = initialAgentState(run.type, ctx);
    while (!s.terminal())
        s = step(std::move(s), ctx, run.rng);

    AgentRun out;
    out.runIndex    = run.runIndex;
    out.agentIndex  = run.agentIndex;
    out.type        = run.type;
    out.outcome     = s.phase == AgentPhase::Arrived ? RunOutcome::Arrived : RunOutcome::Stuck;
    out.time        = s.time;
    out.distance    = s.distance;
    out.errors      = s.errors;
    out.hesitations = s.hesitations;
    out.steps       = s.steps;
    out.decisions   = s.decisions;
    out.signUsages  = s.signUsages;

    const auto& g = *ctx.graph;
    const double straight = distance(g.node(ctx.origin).position(),
                                     g.node(ctx.destination).position());
    if (ctx.origin != ctx.destination && straight > 0.0)
        out.detourIndex = std::max(1.0, polylineLength(g, s.path) / straight);

    if (keepPath)
        out.path = std::move(s.path);
    return out;
}

/* ===== aggregation ========================================================== */
namespace {

double mean(const std::vector<double>& v)
{
    return v.empty() ? 0.0 : std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

void aggregate(ScenarioResult& res)
{
    std::vector<double> time, errors, hesitations, dist, detour;
    std::size_t arrived = 0, firstPass = 0;
    double signs = 0.0;

    struct Acc { std::size_t n = 0, ok = 0, clean = 0; double t = 0, e = 0, h = 0; };
    std::array<Acc, kAgentTypeCount> acc{};

    for (const auto& r : res.runs)
    {
        time.push_back(r.time);
        errors.push_back(r.errors);
        hesitations.push_back(r.hesitations);
        dist.push_back(r.distance);
        detour.push_back(r.detourIndex);
        signs += r.signUsages;

        const bool ok = r.outcome == RunOutcome::Arrived;
        const bool clean = ok && r.errors == 0;
        arrived   += ok;
        firstPass += clean;

        auto& a = acc[agentTypeIndex(r.type)];
        ++a.n;
        a.ok    += ok;
        a.clean += clean;
        a.t     += r.time;
        a.e     += r.errors;
        a.h     += r.hesitations;
    }

    const double n = static_cast<double>(res.runs.size());
    res.time        = summarize(time);
    res.errors      = summarize(errors);
    res.hesitations = summarize(hesitations);
    res.distance    = summarize(dist);
    res.detour      = summarize(detour);
    res.detourIndex = detour.empty() ? 1.0 : mean(detour);
    if (n > 0)
    {
        res.successRate          = static_cast<double>(arrived) / n;
        res.firstPassSuccessRate = static_cast<double>(firstPass) / n;
        res.stuckRate            = 1.0 - res.successRate;
        res.meanSignUsage        = signs / n;
    }

    for (std::size_t t = 0; t < kAgentTypeCount; ++t)
    {
        const auto& a = acc[t];
        auto& b = res.byType[t];
        b.trials = a.n;
        if (a.n == 0)
            continue;
        const double cnt = static_cast<double>(a.n);
        b.successRate          = static_cast<double>(a.ok) / cnt;
        b.firstPassSuccessRate = static_cast<double>(a.clean) / cnt;
        b.meanTime             = a.t / cnt;
        b.meanErrors           = a.e / cnt;
        b.meanHesitations      = a.h / cnt;
    }
}

} // namespace

OverallStats summarizeScenarios(const std::vector<ScenarioResult>& scenarios)
{
    OverallStats o;
    if (scenarios.empty())
        return o;

    std::vector<double> success, time, errors, hes, detour;
    for (const auto& s : scenarios)
    {
        success.push_back(s.successRate);
        time.push_back(s.time.mean);
        errors.push_back(s.errors.mean);
        hes.push_back(s.hesitations.mean);
        detour.push_back(s.detourIndex);
    }
    o.meanSuccessRate = mean(success);
    o.meanTime        = mean(time);
    o.meanErrors      = mean(errors);
    o.meanHesitations = mean(hes);
    o.meanDetourIndex = mean(detour);

    std::size_t best = 0, worst = 0;
    for (std::size_t i = 1; i < scenarios.size(); ++i)
    {
        if (scenarios[i].successRate > scenarios[best].successRate)  best = i;
        if (scenarios[i].successRate < scenarios[worst].successRate) worst = i;
    }
    o.bestScenario  = scenarios[best].name;
    o.worstScenario = scenarios[worst].name;
    return o;
}

const char* recommendationKindName(RecommendationKind k) noexcept
{
    switch (k)
    {
        case RecommendationKind::LowSuccess:     return "low_success";
        case RecommendationKind::LongTravelTime: return "long_travel_time";
        case RecommendationKind::FrequentErrors: return "frequent_errors";
    }
    return "low_success";
}

std::vector<Recommendation> recommendScenarios(const std::vector<ScenarioResult>& scenarios,
                                               const SimulationConfig&            cfg)
{
    Recommendation success{RecommendationKind::LowSuccess, {}, {}};
    Recommendation slow{RecommendationKind::LongTravelTime, {}, {}};
    Recommendation lost{RecommendationKind::FrequentErrors, {}, {}};

    for (const auto& s : scenarios)
    {
        if (s.successRate < cfg.recommendSuccessBelow) success.scenarios.push_back(s.name);
        if (s.time.mean > cfg.recommendTimeAbove)      slow.scenarios.push_back(s.name);
        if (s.errors.mean > cfg.recommendErrorsAbove)  lost.scenarios.push_back(s.name);
    }

    auto joined = [](const std::vector<std::string>& names)
    {
        std::string out;
        for (const auto& n : names)
            out += (out.empty() ? "" : ", ") + n;
        return out;
    };

    std::vector<Recommendation> out;
    if (!success.scenarios.empty())
    {
        success.message = "improve routes " + joined(success.scenarios) + " (success rate below " +
                          std::to_string(static_cast<int>(std::lround(cfg.recommendSuccessBelow * 100.0))) + "%)";
        out.push_back(std::move(success));
    }
    if (!slow.scenarios.empty())
    {
        slow.message = "reduce travel time on " + joined(slow.scenarios);
        out.push_back(std::move(slow));
    }
    if (!lost.scenarios.empty())
    {
        lost.message = "add signage along " + joined(lost.scenarios);
        out.push_back(std::move(lost));
    }
    return out;
}

/* ===== AgentSimulator ======================================================== */
AgentSimulator::AgentSimulator(const INavGraph&         g,
                               Walls                    walls,
                               std::vector<SignageItem> signage,
                               SimulationConfig         cfg,
                               bool                     verbose)
    : graph_{g}
    , walls_{std::move(walls)}
    , signage_{std::move(signage)}
    , cfg_{std::move(cfg)}
    , cues_{computeNodeCues(graph_, signage_, walls_, cfg_)}
    , verbose_{verbose}
{}

ScenarioResult AgentSimulator::runScenario(const Scenario& scenario, std::size_t scenarioIndex) const
{
    const auto origin = graph_.find(scenario.origin);
    if (!origin)
        throw AnalysisError(Guard::UnknownNode, scenario.origin,
                            "scenario '" + scenario.name + "' origin not in the graph");
    const auto destination = graph_.find(scenario.destination);
    if (!destination)
        throw AnalysisError(Guard::UnknownNode, scenario.destination,
                            "scenario '" + scenario.name + "' destination not in the graph");

    const std::size_t population = scenario.populationSize();
    if (population == 0)
        throw AnalysisError(Guard::InvalidScenario, scenario.name, "empty population");
    if (scenario.runCount == 0)
        throw AnalysisError(Guard::InvalidScenario, scenario.name, "run count must be at least 1");
    if (scenario.runCount > static_cast<std::size_t>(std::numeric_limits<int>::max()) / population)
        throw AnalysisError(Guard::InvalidScenario, scenario.name,
                            "runs x population exceeds " + std::to_string(std::numeric_limits<int>::max()) + " trials");

    const ScenarioContext ctx = makeScenarioContext(graph_, *origin, *destination, cues_, cfg_);

    ScenarioResult res;
    res.name        = scenario.name;
    res.origin      = scenario.origin;
    res.destination = scenario.destination;
    res.reachable   = ctx.reachable;
    res.stepBudget  = ctx.stepBudget;

    if (!ctx.reachable)
        warn(res.diagnostics, "simulation", scenario.name,
             "destination " + scenario.destination + " unreachable from " +
             scenario.origin + ", every run ends stuck");

    // agent order inside a run: by type, then by count
    std::vector<AgentType> agents;
    agents.reserve(population);
    for (const auto& kv : scenario.population)
        agents.insert(agents.end(), kv.second, kv.first);

    const std::size_t trials = scenario.runCount * population;
    res.trials = trials;
    res.runs.resize(trials);

    auto body = [&](const cv::Range& range)
    {
        for (int t = range.start; t < range.end; ++t)
        {
            const std::size_t run   = static_cast<std::size_t>(t) / population;
            const std::size_t agent = static_cast<std::size_t>(t) % population;
            RunContext rc(cfg_.seed, scenarioIndex, run, agent, agents[agent]);
            res.runs[static_cast<std::size_t>(t)] = runAgent(ctx, rc, cfg_.keepTraces);
        }
    };
    const cv::Range all(0, static_cast<int>(trials));
    if (cfg_.parallel)
        cv::parallel_for_(all, body);
    else
        body(all);

    aggregate(res);

    if (verbose_)
    {
        std::cout << "[simulation] " << res.name << ": " << trials << " trials, success "
                  << res.successRate << ", mean time " << res.time.mean
                  << " s, mean errors " << res.errors.mean
                  << ", detour " << res.detourIndex << '\n';
    }
    return res;
}

SimulationResult AgentSimulator::run(const std::vector<Scenario>& scenarios,
                                     const SpaceSyntaxResult*     syntax,
                                     const VgaResult*             vga) const
{
    SimulationResult out;
    for (std::size_t i = 0; i < scenarios.size(); ++i)
    {
        out.scenarios.push_back(runScenario(scenarios[i], i));
        const auto& d = out.scenarios.back().diagnostics;
        out.diagnostics.insert(out.diagnostics.end(), d.begin(), d.end());
    }
    out.overall         = summarizeScenarios(out.scenarios);
    out.recommendations = recommendScenarios(out.scenarios, cfg_);
    out.decisionPoints = decisionPoints(syntax, vga);
    return out;
}

std::vector<DecisionPointInfo> AgentSimulator::decisionPoints(const SpaceSyntaxResult* syntax,
                                                              const VgaResult*         vga) const
{
    std::vector<DecisionPointInfo> out;
    const auto& firstTime = profileFor(cfg_.agents, AgentType::FirstTimeVisitor);

    for (NodeIndex v = 0; v < graph_.size(); ++v)
    {
        const auto& node = graph_.node(v);
        if (graph_.degree(v) < 3 && node.tag() != NodeTag::DecisionPoint)
            continue;

        DecisionPointInfo info;
        info.index    = v;
        info.id       = node.id();
        info.degree   = graph_.degree(v);
        info.sign     = cues_.sign[v] != 0;
        info.landmark = cues_.landmark[v] != 0;
        info.errorProbability = errorProbability(firstTime, info.degree, info.sign, info.landmark, cfg_);

        if (syntax && v < syntax->nodes.size())
            info.integration = syntax->nodes[v].integration;
        if (vga)
        {
            if (auto sample = nearestVisibleSample(*vga, node.position(), walls_))
                info.visualIntegration = vga->samples[*sample].visualIntegration;
        }
        out.push_back(std::move(info));
    }
    return out;
}

} // namespace wayfinder
