/*-----------------------------------------------------------------------------
 *  navgraph.cpp
 *---------------------------------------------------------------------------*/
#include "navgraph.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <deque>
#include <limits>
#include <queue>

#include "errors.hpp"
#include "geometry.hpp"

namespace wayfinder {

/* ===== tags =============================================================== */
const char* nodeTagName(NodeTag t) noexcept
{
    switch (t)
    {
        case NodeTag::Unknown:       return "unknown";
        case NodeTag::Room:          return "room";
        case NodeTag::Corridor:      return "corridor";
        case NodeTag::DecisionPoint: return "decision_point";
        case NodeTag::Entrance:      return "entrance";
    }
    return "unknown";
}

std::optional<NodeTag> nodeTagFromString(const std::string& name)
{
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return c == '-' ? '_' : std::tolower(c); });
    for (NodeTag t : {NodeTag::Unknown, NodeTag::Room, NodeTag::Corridor,
                      NodeTag::DecisionPoint, NodeTag::Entrance})
    {
        if (s == nodeTagName(t))
            return t;
    }
    return std::nullopt;
}

/* ===== NavGraph =========================================================== */
NavGraph NavGraph::build(const std::vector<NodeSpec>& nodes,
                         const std::vector<EdgeSpec>& edges)
{
    NavGraph g;
    for (const auto& n : nodes)
        g.addNode(n.id, n.position, n.tag);
    for (const auto& e : edges)
        g.addEdge(e.a, e.b, e.weight);
    return g;
}

NodeIndex NavGraph::addNode(NodeId id, cv::Point2d position, NodeTag tag)
{
    if (byId_.count(id))
        throw AnalysisError(Guard::DuplicateNode, id, "node id already present in the graph");

    const NodeIndex idx = nodes_.size();
    byId_.emplace(id, idx);
    nodes_.emplace_back(std::move(id), position, tag);
    adj_.emplace_back();
    return idx;
}

void NavGraph::addEdge(const NodeId& a, const NodeId& b, std::optional<double> weight)
{
    const NodeIndex ia = index(a);
    const NodeIndex ib = index(b);

    if (ia == ib)
        throw AnalysisError(Guard::InvalidEdge, a, "self loop");

    const double w = weight ? *weight
                            : distance(nodes_[ia].position(), nodes_[ib].position());
    if (!std::isfinite(w) || w < 0.0)
        throw AnalysisError(Guard::InvalidEdge, a + "-" + b,
                            "edge weight must be finite and non-negative");

    /* repeated pair: keep the shorter connection */
    for (auto& e : edges_)
    {
        if ((e.a == ia && e.b == ib) || (e.a == ib && e.b == ia))
        {
            if (w < e.weight)
            {
                e.weight = w;
                for (auto& adj : adj_[ia]) if (adj.to == ib) adj.weight = w;
                for (auto& adj : adj_[ib]) if (adj.to == ia) adj.weight = w;
            }
            return;
        }
    }

    edges_.push_back({ia, ib, w});

    auto insertSorted = [](std::vector<Adjacency>& list, Adjacency entry)
    {
        auto it = std::lower_bound(list.begin(), list.end(), entry.to,
                                   [](const Adjacency& x, NodeIndex to){ return x.to < to; });
        list.insert(it, entry);
    };
    insertSorted(adj_[ia], {ib, w});
    insertSorted(adj_[ib], {ia, w});
}

std::optional<NodeIndex> NavGraph::find(const NodeId& id) const
{
    auto it = byId_.find(id);
    if (it == byId_.end())
        return std::nullopt;
    return it->second;
}

NodeIndex NavGraph::index(const NodeId& id) const
{
    auto it = byId_.find(id);
    if (it == byId_.end())
        throw AnalysisError(Guard::UnknownNode, id, "node id not present in the graph");
    return it->second;
}

std::optional<double> NavGraph::edgeWeight(NodeIndex a, NodeIndex b) const
{
    for (const auto& adj : adj_.at(a))
        if (adj.to == b)
            return adj.weight;
    return std::nullopt;
}

double NavGraph::pathWeight(const std::vector<NodeIndex>& path) const
{
    double total = 0.0;
    for (std::size_t i = 1; i < path.size(); ++i)
    {
        auto w = edgeWeight(path[i - 1], path[i]);
        if (!w)
            throw AnalysisError(Guard::InvalidEdge,
                                nodes_.at(path[i - 1]).id() + "-" + nodes_.at(path[i]).id(),
                                "consecutive path nodes are not adjacent");
        total += *w;
    }
    return total;
}

/* ===== traversal ========================================================== */
std::vector<std::vector<NodeIndex>> connectedComponents(const INavGraph& g)
{
    const std::size_t n = g.size();
    std::vector<char> seen(n, 0);
    std::vector<std::vector<NodeIndex>> out;

    for (NodeIndex start = 0; start < n; ++start)
    {
        if (seen[start]) continue;

        std::vector<NodeIndex> comp;
        std::deque<NodeIndex> queue{start};
        seen[start] = 1;
        while (!queue.empty())
        {
            const NodeIndex v = queue.front();
            queue.pop_front();
            comp.push_back(v);
            for (const auto& adj : g.neighbours(v))
            {
                if (seen[adj.to]) continue;
                seen[adj.to] = 1;
                queue.push_back(adj.to);
            }
        }
        std::sort(comp.begin(), comp.end());
        out.push_back(std::move(comp));
    }
    return out;
}

std::vector<int> hopDistances(const INavGraph& g, NodeIndex src)
{
    std::vector<int> depth(g.size(), kUnreachableHops);
    std::deque<NodeIndex> queue{src};
    depth[src] = 0;
    while (!queue.empty())
    {
        const NodeIndex v = queue.front();
        queue.pop_front();
        for (const auto& adj : g.neighbours(v))
        {
            if (depth[adj.to] != kUnreachableHops) continue;
            depth[adj.to] = depth[v] + 1;
            queue.push_back(adj.to);
        }
    }
    return depth;
}

namespace {

struct QueueItem
{
    double    d;
    NodeIndex v;
};

struct QueueOrder
{
    bool operator()(const QueueItem& a, const QueueItem& b) const
    {
        if (a.d != b.d) return a.d > b.d; // min-heap by distance
        return a.v > b.v;
    }
};

/**
 * Dijkstra with lowest-index predecessor on ties. A predecessor is frozen once
 * its node is settled and ties are only taken from settled nodes, so the
 * predecessor links always form a tree, zero-weight edges included.
 */
void dijkstra(const INavGraph& g, NodeIndex src,
              std::vector<double>& dist, std::vector<NodeIndex>* pred)
{
    const double inf = std::numeric_limits<double>::infinity();
    const double tol = 1e-9;
    const NodeIndex none = std::numeric_limits<NodeIndex>::max();

    dist.assign(g.size(), inf);
    if (pred) pred->assign(g.size(), none);
    std::vector<char> settled(g.size(), 0);

    std::priority_queue<QueueItem, std::vector<QueueItem>, QueueOrder> pq;
    dist[src] = 0.0;
    pq.push({0.0, src});

    while (!pq.empty())
    {
        const QueueItem top = pq.top();
        pq.pop();
        if (settled[top.v] || top.d > dist[top.v]) continue;
        settled[top.v] = 1;

        for (const auto& adj : g.neighbours(top.v))
        {
            if (settled[adj.to]) continue;
            const double nd = top.d + adj.weight;
            if (nd < dist[adj.to] - tol)
            {
                dist[adj.to] = nd;
                if (pred) (*pred)[adj.to] = top.v;
                pq.push({nd, adj.to});
            }
            else if (pred && nd <= dist[adj.to] + tol && top.v < (*pred)[adj.to])
            {
                (*pred)[adj.to] = top.v;
            }
        }
    }
}

} // namespace

std::vector<double> shortestDistances(const INavGraph& g, NodeIndex src)
{
    std::vector<double> dist;
    dijkstra(g, src, dist, nullptr);
    return dist;
}

std::vector<NodeIndex> shortestPath(const INavGraph& g, NodeIndex from, NodeIndex to)
{
    std::vector<double> dist;
    std::vector<NodeIndex> pred;
    dijkstra(g, from, dist, &pred);
    if (!std::isfinite(dist[to]))
        return {};

    std::vector<NodeIndex> path{to};
    while (path.back() != from)
        path.push_back(pred[path.back()]);
    std::reverse(path.begin(), path.end());
    return path;
}

int hopDiameter(const INavGraph& g, const std::vector<NodeIndex>& component)
{
    int diameter = 0;
    for (NodeIndex v : component)
    {
        const auto depth = hopDistances(g, v);
        for (NodeIndex u : component)
            diameter = std::max(diameter, depth[u]);
    }
    return diameter;
}

double polylineLength(const INavGraph& g, const std::vector<NodeIndex>& path)
{
    double total = 0.0;
    for (std::size_t i = 1; i < path.size(); ++i)
        total += distance(g.node(path[i - 1]).position(), g.node(path[i]).position());
    return total;
}

} // namespace wayfinder
