#pragma once
/*-----------------------------------------------------------------------------
 *  vga.hpp
 *
 *  Visibility graph analysis: sample grid over the walkable area, one
 *  isovist per sample, mutual-visibility graph and visual integration.
 *---------------------------------------------------------------------------*/
#include <cstddef>
#include <optional>
#include <vector>
#include <opencv2/core.hpp>

#include "config.hpp"
#include "errors.hpp"
#include "geometry.hpp"
#include "stats.hpp"
#include "visibility/isovist.hpp"

namespace wayfinder {

/* ---------- sampling ------------------------------------------------------- */
struct SampleGrid
{
    std::vector<cv::Point2d> points;     ///< row-major, y then x
    cv::Rect2d               region;     ///< extent the lattice was laid over
    double                   spacing{0.0}; ///< spacing actually used
    int                      coarsenings{0}; ///< how often the spacing was enlarged
};

/**
 * @brief Regular lattice over the walkable area.
 *
 * The area is @p boundary when given, otherwise the bounding box of @p walls.
 * Points outside the area or on a wall are dropped. While the raw lattice,
 * scaled by the share of the region the boundary covers (at least 1%),
 * exceeds maxSamples the spacing is multiplied by coarsenFactor without
 * generating points; after filtering the same step repeats while more than
 * maxSamples remain. Throws EmptySampling when nothing is left.
 */
SampleGrid generateSampleGrid(const Walls&                    walls,
                              const std::vector<cv::Point2d>& boundary,
                              const SamplingConfig&           cfg);

/* ---------- visibility graph ----------------------------------------------- */
/** Symmetric unweighted graph over sample indices. */
class VisibilityGraph
{
public:
    VisibilityGraph() = default;
    explicit VisibilityGraph(std::size_t n) : adj_(n) {}

    std::size_t size()      const noexcept { return adj_.size(); }
    std::size_t edgeCount() const noexcept { return edges_; }

    /** Adds a and b to each other's lists; a != b, call once per pair. */
    void connect(std::size_t a, std::size_t b);

    bool                            connected(std::size_t a, std::size_t b) const;
    const std::vector<std::size_t>& neighbours(std::size_t i) const { return adj_.at(i); }
    std::size_t                     degree(std::size_t i)     const { return adj_.at(i).size(); }

private:
    std::vector<std::vector<std::size_t>> adj_;
    std::size_t                           edges_{0};
};

/* ---------- results -------------------------------------------------------- */
struct VgaSample
{
    IsovistSample isovist;
    double        visualIntegration{0.0};
    bool          blindSpot{false};
    bool          wideVisibility{false};
};

struct VgaSummary
{
    Distribution visualIntegration;
    Distribution isovistArea;
    std::size_t  samples{0};
    std::size_t  visibilityEdges{0};
    std::size_t  blindSpots{0};
    std::size_t  wideVisibility{0};
    std::size_t  degenerate{0};
};

struct VgaResult
{
    SampleGrid               grid;
    std::vector<VgaSample>   samples;          ///< same order as grid.points
    VisibilityGraph          graph;
    std::size_t              maxVisibleNeighbours{0};
    double                   blindSpotThreshold{0.0};
    double                   wideVisibilityThreshold{0.0};
    std::vector<std::size_t> blindSpots;       ///< ascending sample index
    std::vector<std::size_t> wideVisibility;
    VgaSummary               summary;
    Diagnostics              diagnostics;
};

/**
 * @brief Nearest sample to @p p that @p p can see.
 *
 * Returns nullopt when no sample is visible.
 */
std::optional<std::size_t> nearestVisibleSample(const VgaResult&   vga,
                                                const cv::Point2d& p,
                                                const Walls&       walls);

/* ---------- analyzer -------------------------------------------------------- */
class VisibilityAnalyzer
{
public:
    explicit VisibilityAnalyzer(VisibilityConfig cfg = {}, bool verbose = false);

    /**
     * Grid, isovists, visibility graph, visual integration, blind spots.
     * The boundary outline, when given, occludes together with @p walls.
     */
    VgaResult analyze(const Walls& walls, const std::vector<cv::Point2d>& boundary = {}) const;

    /** Same pipeline on caller-supplied sample points. */
    VgaResult analyzePoints(const Walls& walls, const std::vector<cv::Point2d>& points) const;

private:
    void buildVisibilityGraph(const Walls& walls, VgaResult& res) const;
    void scoreSamples(VgaResult& res) const;

    VisibilityConfig cfg_;
    bool             verbose_;
};

} // namespace wayfinder
