/*-----------------------------------------------------------------------------
 *  spacesyntax.cpp
 *---------------------------------------------------------------------------*/
#include "spacesyntax.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iostream>
#include <limits>
#include <numeric>
#include <queue>
#include <string>

#include <opencv2/core.hpp>

namespace wayfinder {

/* ===== diamond constant =================================================== */
namespace {

// D_k for k = 3..16, closed form rounded to three decimals
constexpr std::array<double, 14> kDiamondTable = {
    0.211, 0.333, 0.352, 0.349, 0.340, 0.328, 0.317,
    0.306, 0.295, 0.285, 0.276, 0.267, 0.259, 0.251
};

constexpr std::size_t kDiamondTableFirst = 3;
constexpr std::size_t kDiamondTableLast  = 16;

} // namespace

double diamondValue(std::size_t k)
{
    if (k < kDiamondTableFirst)
        return 0.0;
    if (k <= kDiamondTableLast)
        return kDiamondTable[k - kDiamondTableFirst];

    const double kk = static_cast<double>(k);
    return 2.0 * (kk * (std::log2((kk + 2.0) / 3.0) - 1.0) + 1.0)
               / ((kk - 1.0) * (kk - 2.0));
}

/* ===== SpaceSyntaxAnalyzer ================================================= */
SpaceSyntaxAnalyzer::SpaceSyntaxAnalyzer(SpaceSyntaxConfig cfg, bool verbose)
    : cfg_{cfg}, verbose_{verbose}
{}

SpaceSyntaxResult SpaceSyntaxAnalyzer::analyze(const INavGraph& g) const
{
    const std::size_t n = g.size();
    if (n < 2)
        throw AnalysisError(Guard::TooFewNodes, std::to_string(n) + " nodes",
                            "space-syntax analysis needs at least two nodes");

    SpaceSyntaxResult res;
    res.nodes.resize(n);

    /* ---- components ---- */
    const auto components = connectedComponents(g);
    std::vector<std::size_t> componentOf(n, 0);
    for (std::size_t c = 0; c < components.size(); ++c)
    {
        res.componentSizes.push_back(components[c].size());
        for (NodeIndex v : components[c])
            componentOf[v] = c;
    }

    if (components.size() > 1)
        warn(res.diagnostics, "spacesyntax", "",
             "graph has " + std::to_string(components.size()) +
             " connected components, each analysed separately");

    for (NodeIndex v = 0; v < n; ++v)
    {
        auto& row = res.nodes[v];
        row.index         = v;
        row.id            = g.node(v).id();
        row.component     = componentOf[v];
        row.componentSize = components[componentOf[v]].size();
        row.degree        = g.degree(v);
        row.isolated      = (row.degree == 0);

        for (const auto& adj : g.neighbours(v))
            row.control += 1.0 / static_cast<double>(g.degree(adj.to));
        if (row.degree > 0)
            row.controllability = row.control / static_cast<double>(row.degree);
    }

    depthMeasures(g, components, componentOf, res.nodes);
    choiceMeasures(g, res.nodes);

    /* ---- diagnostics for undefined measures ---- */
    for (std::size_t c = 0; c < components.size(); ++c)
    {
        if (components[c].size() >= 3)
            continue;
        const auto& first = g.node(components[c].front()).id();
        warn(res.diagnostics, "spacesyntax", first,
             "component of " + std::to_string(components[c].size()) +
             " node(s): integration undefined");
    }
    for (const auto& row : res.nodes)
    {
        if (row.integrationCapped)
            warn(res.diagnostics, "spacesyntax", row.id,
                 "node adjacent to every other node, RRA floored at " +
                 std::to_string(cfg_.minRra));
    }

    /* ---- critical nodes ---- */
    std::vector<double> choices, integrations;
    for (const auto& row : res.nodes)
    {
        if (row.componentSize >= 3)
            choices.push_back(row.choiceNormalized);
        if (row.integration)
            integrations.push_back(*row.integration);
    }

    res.choiceThreshold      = percentile(choices, cfg_.bottleneckPercentile);
    res.integrationThreshold = percentile(integrations, cfg_.hubPercentile);

    for (auto& row : res.nodes)
    {
        if (row.componentSize >= 3 && row.choiceNormalized > res.choiceThreshold)
        {
            row.bottleneck = true;
            res.bottlenecks.push_back(row.index);
        }
        if (row.integration && *row.integration > res.integrationThreshold)
        {
            row.hub = true;
            res.hubs.push_back(row.index);
        }
    }

    /* ---- summary ---- */
    std::vector<double> degrees, meanDepths;
    for (const auto& row : res.nodes)
    {
        degrees.push_back(static_cast<double>(row.degree));
        if (row.meanDepth)
            meanDepths.push_back(*row.meanDepth);
    }

    auto& s = res.summary;
    s.components   = components.size();
    s.degree       = summarize(degrees);
    s.integration  = summarize(integrations);
    s.choice       = summarize(choices);
    s.meanDepthMax = meanDepths.empty() ? 0.0
                                        : *std::max_element(meanDepths.begin(), meanDepths.end());
    s.complexity   = 0.4 * s.degree.mean + 0.3 * s.meanDepthMax;
    if (s.integration.mean > 0.0)
        s.complexity += 0.3 / s.integration.mean;

    if (verbose_)
    {
        std::cout << "[spacesyntax] " << n << " nodes, " << components.size()
                  << " component(s), " << res.bottlenecks.size() << " bottleneck(s), "
                  << res.hubs.size() << " hub(s)\n";
    }
    return res;
}

/* ---------- depth, asymmetry, integration, closeness ---------------------- */
void SpaceSyntaxAnalyzer::depthMeasures(const INavGraph& g,
                                        const std::vector<std::vector<NodeIndex>>& components,
                                        const std::vector<std::size_t>& componentOf,
                                        std::vector<NodeSyntax>& rows) const
{
    const std::size_t n = g.size();

    // each index writes only its own row
    auto body = [&](const cv::Range& range)
    {
        for (int i = range.start; i < range.end; ++i)
        {
            const NodeIndex v = static_cast<NodeIndex>(i);
            auto& row = rows[v];
            const auto& comp = components[componentOf[v]];
            const std::size_t k = comp.size();

            if (row.isolated)
                continue;

            const auto hops = hopDistances(g, v);
            const auto dist = shortestDistances(g, v);

            double total = 0.0, weighted = 0.0;
            int ecc = 0;
            for (NodeIndex u : comp)
            {
                total    += hops[u];
                weighted += dist[u];
                ecc       = std::max(ecc, hops[u]);
            }

            row.eccentricity = ecc;
            row.totalDepth   = total;
            row.meanDepth    = total / static_cast<double>(k - 1);
            if (weighted > 0.0)
                row.closeness = static_cast<double>(k - 1) / weighted;

            if (k < 3)
                continue;

            const double ra = 2.0 * (*row.meanDepth - 1.0) / static_cast<double>(k - 2);
            double rra = ra / diamondValue(k);
            if (rra <= 0.0)
            {
                rra = cfg_.minRra;
                row.integrationCapped = true;
            }
            row.ra          = ra;
            row.rra         = rra;
            row.integration = 1.0 / rra;
        }
    };

    if (cfg_.parallel)
        cv::parallel_for_(cv::Range(0, static_cast<int>(n)), body);
    else
        body(cv::Range(0, static_cast<int>(n)));
}

/* ---------- choice (Brandes, weighted) ------------------------------------- */
void SpaceSyntaxAnalyzer::choiceMeasures(const INavGraph& g, std::vector<NodeSyntax>& rows) const
{
    const std::size_t n = g.size();
    const double inf = std::numeric_limits<double>::infinity();
    const double tol = cfg_.tieTolerance;

    std::vector<double> betweenness(n, 0.0);

    std::vector<double> dist(n), sigma(n), delta(n);
    std::vector<std::vector<NodeIndex>> pred(n);
    std::vector<NodeIndex> order;
    order.reserve(n);

    struct Item
    {
        double    d;
        NodeIndex v;
    };
    const auto cmp = [](const Item& a, const Item& b) {
        if (a.d != b.d) return a.d > b.d; // min-heap by distance
        return a.v > b.v;
    };

    for (NodeIndex s = 0; s < n; ++s)
    {
        std::fill(dist.begin(), dist.end(), inf);
        std::fill(sigma.begin(), sigma.end(), 0.0);
        std::fill(delta.begin(), delta.end(), 0.0);
        for (auto& p : pred) p.clear();
        order.clear();

        std::priority_queue<Item, std::vector<Item>, decltype(cmp)> pq(cmp);
        dist[s]  = 0.0;
        sigma[s] = 1.0;
        pq.push({0.0, s});

        std::vector<char> settled(n, 0);
        while (!pq.empty())
        {
            const Item it = pq.top();
            pq.pop();
            if (settled[it.v] || it.d > dist[it.v] + tol)
                continue;
            settled[it.v] = 1;
            order.push_back(it.v);

            for (const auto& adj : g.neighbours(it.v))
            {
                const NodeIndex w = adj.to;
                if (settled[w])
                    continue;
                const double nd = dist[it.v] + adj.weight;
                if (nd < dist[w] - tol)
                {
                    dist[w]  = nd;
                    sigma[w] = sigma[it.v];
                    pred[w].assign(1, it.v);
                    pq.push({nd, w});
                }
                else if (std::abs(nd - dist[w]) <= tol)
                {
                    sigma[w] += sigma[it.v];
                    pred[w].push_back(it.v);
                }
            }
        }

        for (auto rit = order.rbegin(); rit != order.rend(); ++rit)
        {
            const NodeIndex w = *rit;
            for (NodeIndex v : pred[w])
                delta[v] += sigma[v] / sigma[w] * (1.0 + delta[w]);
            if (w != s)
                betweenness[w] += delta[w];
        }
    }

    for (NodeIndex v = 0; v < n; ++v)
    {
        auto& row = rows[v];
        row.choice = betweenness[v] * 0.5; // each unordered pair was counted from both ends
        const std::size_t k = row.componentSize;
        if (k >= 3)
        {
            const double pairs = static_cast<double>(k - 1) * static_cast<double>(k - 2) * 0.5;
            row.choiceNormalized = row.choice / pairs;
        }
    }
}

} // namespace wayfinder
