#pragma once
/*-----------------------------------------------------------------------------
 *  spacesyntax.hpp
 *
 *  Per-node space-syntax measures over a NavGraph: depth, asymmetry,
 *  integration, choice (betweenness) and control. Every connected component
 *  is analysed on its own with its own node count k.
 *---------------------------------------------------------------------------*/
#include <cstddef>
#include <optional>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "navgraph/navgraph.hpp"
#include "stats.hpp"

namespace wayfinder {

/**
 * @brief Diamond normalisation constant D_k.
 *
 * Literal table for 3 <= k <= 16, closed form above that. Returns 0 for k < 3.
 */
double diamondValue(std::size_t k);

/** One row of the metric table. */
struct NodeSyntax
{
    NodeIndex   index{0};
    NodeId      id;
    std::size_t component{0};      ///< index into SpaceSyntaxResult::componentSizes
    std::size_t componentSize{0};  ///< k

    std::size_t degree{0};

    std::optional<double> totalDepth;  ///< sum of hop counts to the rest of the component
    std::optional<double> meanDepth;
    std::optional<double> ra;          ///< real asymmetry
    std::optional<double> rra;         ///< relative real asymmetry
    std::optional<double> integration; ///< 1 / RRA

    double choice{0.0};            ///< pair-counted-once betweenness
    double choiceNormalized{0.0};  ///< choice / ((k-1)(k-2)/2)
    double control{0.0};           ///< sum of 1/deg over neighbours
    double controllability{0.0};   ///< control / deg

    std::optional<double> closeness; ///< (k-1) / sum of weighted distances
    int eccentricity{0};             ///< longest hop distance inside the component

    bool isolated{false};          ///< no neighbours, depth measures undefined
    bool integrationCapped{false}; ///< RA was 0, RRA floored at minRra
    bool bottleneck{false};
    bool hub{false};               ///< well-integrated
};

struct SpaceSyntaxSummary
{
    Distribution degree;
    Distribution integration;  ///< over nodes with defined integration
    Distribution choice;       ///< normalised choice
    double       meanDepthMax{0.0};
    double       complexity{0.0}; ///< 0.4 mean degree + 0.3 max mean depth + 0.3 / mean integration
    std::size_t  components{0};
};

struct SpaceSyntaxResult
{
    std::vector<NodeSyntax>  nodes;          ///< by node index
    std::vector<std::size_t> componentSizes;
    std::vector<NodeIndex>   bottlenecks;    ///< ascending node index
    std::vector<NodeIndex>   hubs;
    double                   choiceThreshold{0.0};
    double                   integrationThreshold{0.0};
    SpaceSyntaxSummary       summary;
    Diagnostics              diagnostics;
};

/**
 * @brief Space-syntax analyzer.
 *
 * Stateless apart from its configuration; analyze() may be called
 * concurrently on different graphs.
 */
class SpaceSyntaxAnalyzer
{
public:
    explicit SpaceSyntaxAnalyzer(SpaceSyntaxConfig cfg = {}, bool verbose = false);

    /** Throws AnalysisError{TooFewNodes} for graphs with fewer than two nodes. */
    SpaceSyntaxResult analyze(const INavGraph& g) const;

private:
    void depthMeasures(const INavGraph& g,
                       const std::vector<std::vector<NodeIndex>>& components,
                       const std::vector<std::size_t>& componentOf,
                       std::vector<NodeSyntax>& rows) const;

    void choiceMeasures(const INavGraph& g, std::vector<NodeSyntax>& rows) const;

    SpaceSyntaxConfig cfg_;
    bool              verbose_;
};

} // namespace wayfinder
