#pragma once
/*-----------------------------------------------------------------------------
 *  agentsimulator.hpp
 *
 *  Stochastic pedestrian simulation over a NavGraph. Each agent is a small
 *  state record advanced by a pure transition function until it arrives or
 *  gets stuck; every trial owns its own seeded random sub-stream, so the
 *  outcome does not depend on the order in which trials execute.
 *---------------------------------------------------------------------------*/
#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "config.hpp"
#include "errors.hpp"
#include "geometry.hpp"
#include "navgraph/navgraph.hpp"
#include "simulation/agentprofile.hpp"
#include "stats.hpp"

namespace wayfinder {

struct SpaceSyntaxResult;
struct VgaResult;

/* ---------- wayfinding cues ------------------------------------------------ */
enum class SignageKind : std::uint8_t
{
    Directional = 0,
    Identification,
    Information,
    Regulatory,
    Landmark        ///< memorable feature, counts for the landmark factor
};

const char*                signageKindName(SignageKind k) noexcept;
std::optional<SignageKind> signageKindFromString(const std::string& name);

/** One detected sign or landmark. */
struct SignageItem
{
    cv::Point2d position;
    SignageKind kind{SignageKind::Directional};
    std::string label;
};

/** Which nodes have a sign / landmark within reach. */
struct NodeCues
{
    std::vector<char> sign;
    std::vector<char> landmark;
};

/**
 * A cue counts for a node when it lies within cfg.cueRadius and, with
 * requireCueLineOfSight and a non-empty wall set, is visible from it.
 */
NodeCues computeNodeCues(const INavGraph&                g,
                         const std::vector<SignageItem>& signage,
                         const Walls&                    walls,
                         const SimulationConfig&         cfg);

/** p = min(cap, base * (1 + (deg-1)*k_degree) * signage factor * landmark factor). */
double errorProbability(const AgentProfile&     profile,
                        std::size_t             degree,
                        bool                    hasSign,
                        bool                    hasLandmark,
                        const SimulationConfig& cfg);

/* ---------- scenario ---------------------------------------------------------- */
struct Scenario
{
    std::string                      name;
    NodeId                           origin;
    NodeId                           destination;
    std::map<AgentType, std::size_t> population; ///< type -> agents per run
    std::size_t                      runCount{1};

    std::size_t populationSize() const;
};

/** Immutable per-scenario data shared by all its trials. */
struct ScenarioContext
{
    const INavGraph*        graph{nullptr};
    const SimulationConfig* cfg{nullptr};
    const NodeCues*         cues{nullptr};
    NodeIndex               origin{0};
    NodeIndex               destination{0};
    std::vector<double>     distanceToDestination; ///< weighted, +inf if unreachable
    bool                    reachable{false};
    int                     stepBudget{0};
};

ScenarioContext makeScenarioContext(const INavGraph&        g,
                                    NodeIndex               origin,
                                    NodeIndex               destination,
                                    const NodeCues&         cues,
                                    const SimulationConfig& cfg);

/** One trial: its identity and its private random stream. */
struct RunContext
{
    std::size_t scenarioIndex{0};
    std::size_t runIndex{0};
    std::size_t agentIndex{0};
    AgentType   type{AgentType::FirstTimeVisitor};
    cv::RNG     rng;

    RunContext(std::uint64_t baseSeed, std::size_t scenario, std::size_t run,
               std::size_t agent, AgentType agentType);
};

/** SplitMix64 mix of (base seed, scenario, run, agent). */
std::uint64_t deriveSeed(std::uint64_t base, std::size_t scenario, std::size_t run, std::size_t agent);

/* ---------- agent state machine ------------------------------------------- */
enum class AgentPhase : std::uint8_t
{
    AtNode = 0,
    Deciding,
    Moving,
    Arrived,
    Stuck
};

const char* agentPhaseName(AgentPhase p) noexcept;

struct AgentState
{
    AgentType                type{AgentType::FirstTimeVisitor};
    AgentPhase               phase{AgentPhase::AtNode};
    NodeIndex                current{0};
    std::optional<NodeIndex> previous;          ///< node the agent arrived from
    std::optional<NodeIndex> target;            ///< set while Moving
    bool                     leavingDecision{false};

    double distance{0.0};
    double time{0.0};
    int    errors{0};
    int    hesitations{0};
    int    steps{0};
    int    decisions{0};
    int    signUsages{0};           ///< correct moves with a sign at either end

    std::vector<NodeIndex> path;     ///< append-only, backtracks included
    std::vector<char>      visited;  ///< by node index

    bool terminal() const noexcept { return phase == AgentPhase::Arrived || phase == AgentPhase::Stuck; }
};

AgentState initialAgentState(AgentType type, const ScenarioContext& ctx);

/** One transition; the only side effect is drawing from @p rng. */
AgentState step(AgentState state, const ScenarioContext& ctx, cv::RNG& rng);

/* ---------- results ------------------------------------------------------------ */
enum class RunOutcome : std::uint8_t
{
    Arrived = 0,
    Stuck
};

struct AgentRun
{
    std::size_t            runIndex{0};
    std::size_t            agentIndex{0};
    AgentType              type{AgentType::FirstTimeVisitor};
    RunOutcome             outcome{RunOutcome::Arrived};
    double                 time{0.0};
    double                 distance{0.0};
    double                 detourIndex{1.0}; ///< node-position polyline / straight line, >= 1
    int                    errors{0};
    int                    hesitations{0};
    int                    steps{0};
    int                    decisions{0};
    int                    signUsages{0};
    std::vector<NodeIndex> path;  ///< only with keepTraces
};

/** Drive one agent from initialAgentState to a terminal state. */
AgentRun runAgent(const ScenarioContext& ctx, RunContext& run, bool keepPath);

struct TypeBreakdown
{
    std::size_t trials{0};
    double      successRate{0.0};
    double      firstPassSuccessRate{0.0};
    double      meanTime{0.0};
    double      meanErrors{0.0};
    double      meanHesitations{0.0};
};

struct ScenarioResult
{
    std::string  name;
    NodeId       origin;
    NodeId       destination;
    bool         reachable{true};
    int          stepBudget{0};
    std::size_t  trials{0};

    Distribution time;
    Distribution errors;
    Distribution hesitations;
    Distribution distance;
    Distribution detour;

    /**
     * Mean over runs of the walked path's polyline through node positions
     * divided by the straight origin-destination distance, so edge weights
     * (and AgentRun::distance) do not enter it.
     */
    double detourIndex{1.0};
    double firstPassSuccessRate{0.0}; ///< arrived with zero errors
    double successRate{0.0};
    double stuckRate{0.0};
    double meanSignUsage{0.0};

    std::array<TypeBreakdown, kAgentTypeCount> byType{};
    std::vector<AgentRun>                      runs;
    Diagnostics                                diagnostics;
};

struct OverallStats
{
    double      meanSuccessRate{0.0};
    double      meanTime{0.0};
    double      meanErrors{0.0};
    double      meanHesitations{0.0};
    double      meanDetourIndex{1.0};
    std::string bestScenario;   ///< highest success rate, first on ties
    std::string worstScenario;
};

enum class RecommendationKind : std::uint8_t
{
    LowSuccess = 0,   ///< success rate below threshold
    LongTravelTime,   ///< mean time above threshold
    FrequentErrors    ///< mean errors above threshold
};

const char* recommendationKindName(RecommendationKind k) noexcept;

/** Scenarios sharing one performance problem. */
struct Recommendation
{
    RecommendationKind       kind{RecommendationKind::LowSuccess};
    std::vector<std::string> scenarios; ///< in input order
    std::string              message;
};

/** One entry per flagged kind, in enum order; empty when nothing is flagged. */
std::vector<Recommendation> recommendScenarios(const std::vector<ScenarioResult>& scenarios,
                                               const SimulationConfig&            cfg);

/** Decision node as seen by the error model. */
struct DecisionPointInfo
{
    NodeIndex             index{0};
    NodeId                id;
    std::size_t           degree{0};
    std::optional<double> integration;
    std::optional<double> visualIntegration; ///< nearest visible VGA sample
    bool                  sign{false};
    bool                  landmark{false};
    double                errorProbability{0.0}; ///< first-time visitor
};

struct SimulationResult
{
    std::vector<ScenarioResult>    scenarios;
    OverallStats                   overall;
    std::vector<DecisionPointInfo> decisionPoints;
    std::vector<Recommendation>    recommendations;
    Diagnostics                    diagnostics;
};

OverallStats summarizeScenarios(const std::vector<ScenarioResult>& scenarios);

/* ---------- simulator ------------------------------------------------------ */
class AgentSimulator
{
public:
    AgentSimulator(const INavGraph&         g,
                   Walls                    walls,
                   std::vector<SignageItem> signage,
                   SimulationConfig         cfg = {},
                   bool                     verbose = false);

    /**
     * Throws UnknownNode for missing origin/destination ids and
     * InvalidScenario for an empty population, zero runs, or more
     * trials than fit an int range.
     */
    ScenarioResult runScenario(const Scenario& scenario, std::size_t scenarioIndex = 0) const;

    /** All scenarios plus the decision-point report. */
    SimulationResult run(const std::vector<Scenario>& scenarios,
                         const SpaceSyntaxResult*     syntax = nullptr,
                         const VgaResult*             vga = nullptr) const;

    /** Nodes of degree >= 3 or tagged as decision points. */
    std::vector<DecisionPointInfo> decisionPoints(const SpaceSyntaxResult* syntax,
                                                  const VgaResult*         vga) const;

    const NodeCues& cues() const noexcept { return cues_; }

private:
    const INavGraph&         graph_;
    Walls                    walls_;
    std::vector<SignageItem> signage_;
    SimulationConfig         cfg_;
    NodeCues                 cues_;
    bool                     verbose_;
};

} // namespace wayfinder
