#pragma once
/*-----------------------------------------------------------------------------
 *  navgraph.hpp
 *
 *  Topological model of a floor: nodes (rooms, corridor points, decision
 *  points) with positions, joined by undirected weighted edges. Built once
 *  from the extraction collaborator's node/edge lists, then read-only.
 *---------------------------------------------------------------------------*/
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <opencv2/core.hpp>

namespace wayfinder {

using NodeId    = std::string;
using NodeIndex = std::size_t;

/* ---------- node semantics ------------------------------------------------ */
enum class NodeTag : std::uint8_t
{
    Unknown = 0,
    Room,
    Corridor,
    DecisionPoint,
    Entrance
};

const char*            nodeTagName(NodeTag t) noexcept;
std::optional<NodeTag> nodeTagFromString(const std::string& name);

/* ---------- collaborator input records ------------------------------------ */
/** Node as supplied by floor-plan extraction. */
struct NodeSpec
{
    NodeId      id;
    cv::Point2d position;
    NodeTag     tag{NodeTag::Unknown};
};

/** Edge as supplied by floor-plan extraction; no weight => Euclidean length. */
struct EdgeSpec
{
    NodeId                a;
    NodeId                b;
    std::optional<double> weight;
};

/* ---------- stored elements ----------------------------------------------- */
class NavNode
{
public:
    NavNode(NodeId id, cv::Point2d position, NodeTag tag)
        : id_{std::move(id)}, position_{position}, tag_{tag} {}

    const NodeId&      id()       const noexcept { return id_; }
    const cv::Point2d& position() const noexcept { return position_; }
    NodeTag            tag()      const noexcept { return tag_; }

private:
    NodeId      id_;
    cv::Point2d position_;
    NodeTag     tag_;
};

/** Stored once; the reverse direction is derived. */
struct NavEdge
{
    NodeIndex a{0};
    NodeIndex b{0};
    double    weight{0.0};
};

/** One entry of a neighbour list. */
struct Adjacency
{
    NodeIndex to{0};
    double    weight{0.0};
};

/* ---------- read interface ------------------------------------------------- */
class INavGraph
{
public:
    virtual ~INavGraph() = default;

    virtual std::size_t                   size()                     const noexcept = 0;
    virtual const NavNode&                node(NodeIndex i)          const = 0;
    /** Neighbours sorted by node index. */
    virtual const std::vector<Adjacency>& neighbours(NodeIndex i)    const = 0;
    virtual std::size_t                   degree(NodeIndex i)        const = 0;
    virtual std::optional<NodeIndex>      find(const NodeId& id)     const = 0;
};

/* ---------- concrete graph ------------------------------------------------- */
class NavGraph final : public INavGraph
{
public:
    /** Build from collaborator lists; throws AnalysisError on malformed input. */
    static NavGraph build(const std::vector<NodeSpec>& nodes,
                          const std::vector<EdgeSpec>& edges);

    /** Throws DuplicateNode. */
    NodeIndex addNode(NodeId id, cv::Point2d position, NodeTag tag = NodeTag::Unknown);

    /**
     * Undirected connection. Throws UnknownNode for a missing endpoint and
     * InvalidEdge for self loops or negative / non-finite weights. A repeated
     * pair keeps the smaller weight.
     */
    void addEdge(const NodeId& a, const NodeId& b, std::optional<double> weight = std::nullopt);

    /* INavGraph */
    std::size_t                   size()                  const noexcept override { return nodes_.size(); }
    const NavNode&                node(NodeIndex i)       const override { return nodes_.at(i); }
    const std::vector<Adjacency>& neighbours(NodeIndex i) const override { return adj_.at(i); }
    std::size_t                   degree(NodeIndex i)     const override { return adj_.at(i).size(); }
    std::optional<NodeIndex>      find(const NodeId& id)  const override;

    /** Like find() but throws UnknownNode. */
    NodeIndex                     index(const NodeId& id) const;

    std::size_t                   edgeCount() const noexcept { return edges_.size(); }
    const std::vector<NavEdge>&   edges()     const noexcept { return edges_; }

    std::optional<double>         edgeWeight(NodeIndex a, NodeIndex b) const;

    /** Sum of edge weights; throws InvalidEdge when two consecutive nodes are not adjacent. */
    double                        pathWeight(const std::vector<NodeIndex>& path) const;

private:
    std::vector<NavNode>                   nodes_;
    std::vector<NavEdge>                   edges_;
    std::vector<std::vector<Adjacency>>    adj_;
    std::unordered_map<NodeId, NodeIndex>  byId_;
};

/* ---------- traversal helpers --------------------------------------------- */
constexpr int kUnreachableHops = -1;

/** Connected components, each sorted, ordered by their lowest node index. */
std::vector<std::vector<NodeIndex>> connectedComponents(const INavGraph& g);

/** BFS edge counts from src; kUnreachableHops for other components. */
std::vector<int> hopDistances(const INavGraph& g, NodeIndex src);

/** Dijkstra over edge weights; +inf for other components. */
std::vector<double> shortestDistances(const INavGraph& g, NodeIndex src);

/** Weighted shortest path (inclusive); empty when unreachable. Ties prefer lower indices. */
std::vector<NodeIndex> shortestPath(const INavGraph& g, NodeIndex from, NodeIndex to);

/** Longest BFS distance between two nodes of the component. */
int hopDiameter(const INavGraph& g, const std::vector<NodeIndex>& component);

/** Euclidean length of the polyline through the node positions. */
double polylineLength(const INavGraph& g, const std::vector<NodeIndex>& path);

} // namespace wayfinder
