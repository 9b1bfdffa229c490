/*-----------------------------------------------------------------------------
 *  vga.cpp
 *---------------------------------------------------------------------------*/
#include "vga.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>

#include <opencv2/imgproc.hpp>

namespace wayfinder {

/* ===== sampling ============================================================ */
namespace {

cv::Rect2d boundaryBounds(const std::vector<cv::Point2d>& boundary)
{
    double minX =  std::numeric_limits<double>::max(), minY =  std::numeric_limits<double>::max();
    double maxX = -std::numeric_limits<double>::max(), maxY = -std::numeric_limits<double>::max();
    for (const auto& p : boundary)
    {
        minX = std::min(minX, p.x); minY = std::min(minY, p.y);
        maxX = std::max(maxX, p.x); maxY = std::max(maxY, p.y);
    }
    return {minX, minY, maxX - minX, maxY - minY};
}

constexpr std::size_t kMaxAxisCount = static_cast<std::size_t>(std::numeric_limits<int>::max());

/* lattice points along one axis, at least one, clamped before the cast */
std::size_t axisCount(double extent, double spacing)
{
    const double q = std::floor(extent / spacing + 1e-9);
    if (!(q >= 1.0))
        return 1;
    if (q >= static_cast<double>(kMaxAxisCount))
        return kMaxAxisCount;
    return static_cast<std::size_t>(q);
}

/* centred lattice of @p count points */
std::vector<double> axisPositions(double start, double extent, double spacing, std::size_t count)
{
    const double first = start + (extent - spacing * static_cast<double>(count - 1)) * 0.5;

    std::vector<double> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
        out.push_back(first + spacing * static_cast<double>(i));
    return out;
}

bool onWall(const cv::Point2d& p, const Walls& walls, double eps)
{
    for (const auto& w : walls)
        if (pointSegmentDistance(p, w.a, w.b) <= eps)
            return true;
    return false;
}

} // namespace

SampleGrid generateSampleGrid(const Walls&                    walls,
                              const std::vector<cv::Point2d>& boundary,
                              const SamplingConfig&           cfg)
{
    if (!(cfg.gridSpacing > 0.0))
        throw AnalysisError(Guard::InvalidConfig, "visibility.grid_spacing",
                            "grid spacing must be positive");
    if (cfg.maxSamples < 1)
        throw AnalysisError(Guard::InvalidConfig, "visibility.max_samples",
                            "sample cap must be at least 1");
    if (!(cfg.coarsenFactor > 1.0))
        throw AnalysisError(Guard::InvalidConfig, "visibility.coarsen_factor",
                            "coarsening factor must be greater than 1");
    if (walls.empty() && boundary.size() < 3)
        throw AnalysisError(Guard::EmptySampling, "grid",
                            "no walls and no boundary polygon to sample");

    SampleGrid grid;
    grid.region  = boundary.size() >= 3 ? boundaryBounds(boundary) : wallBounds(walls);
    grid.spacing = cfg.gridSpacing;

    std::vector<cv::Point2f> contour;
    if (boundary.size() >= 3)
    {
        contour.reserve(boundary.size());
        for (const auto& p : boundary)
            contour.emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));
    }

    // share of the region inside the outline; scales the raw lattice estimate
    double fill = 1.0;
    const double regionArea = grid.region.width * grid.region.height;
    if (!contour.empty() && regionArea > 0.0)
        fill = std::clamp(polygonArea(boundary) / regionArea, 0.01, 1.0);

    const double cap = static_cast<double>(cfg.maxSamples);
    for (;;)
    {
        const std::size_t nx = axisCount(grid.region.width,  grid.spacing);
        const std::size_t ny = axisCount(grid.region.height, grid.spacing);

        // too dense even before filtering: coarsen without touching the points
        if (static_cast<double>(nx) * static_cast<double>(ny) * fill > cap)
        {
            grid.spacing *= cfg.coarsenFactor;
            ++grid.coarsenings;
            continue;
        }

        grid.points.clear();
        const auto xs = axisPositions(grid.region.x, grid.region.width,  grid.spacing, nx);
        const auto ys = axisPositions(grid.region.y, grid.region.height, grid.spacing, ny);

        for (double y : ys)
        {
            for (double x : xs)
            {
                const cv::Point2d p{x, y};
                if (!contour.empty() &&
                    cv::pointPolygonTest(contour, cv::Point2f(static_cast<float>(x), static_cast<float>(y)), false) <= 0)
                    continue;
                if (onWall(p, walls, cfg.wallEpsilon))
                    continue;
                grid.points.push_back(p);
            }
        }

        if (grid.points.size() <= static_cast<std::size_t>(cfg.maxSamples))
            break;
        grid.spacing *= cfg.coarsenFactor;
        ++grid.coarsenings;
    }

    if (grid.points.empty())
        throw AnalysisError(Guard::EmptySampling, "grid",
                            "sampling produced no point inside the walkable area");
    return grid;
}

/* ===== VisibilityGraph ===================================================== */
void VisibilityGraph::connect(std::size_t a, std::size_t b)
{
    adj_.at(a).push_back(b);
    adj_.at(b).push_back(a);
    ++edges_;
}

bool VisibilityGraph::connected(std::size_t a, std::size_t b) const
{
    const auto& list = adj_.at(a);
    return std::binary_search(list.begin(), list.end(), b);
}

/* ===== queries ============================================================= */
std::optional<std::size_t> nearestVisibleSample(const VgaResult&   vga,
                                                const cv::Point2d& p,
                                                const Walls&       walls)
{
    std::optional<std::size_t> best;
    double bestDist = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < vga.samples.size(); ++i)
    {
        const auto& origin = vga.samples[i].isovist.origin;
        const double d = distance(p, origin);
        if (d < bestDist && hasLineOfSight(p, origin, walls))
        {
            best     = i;
            bestDist = d;
        }
    }
    return best;
}

/* ===== VisibilityAnalyzer =================================================== */
VisibilityAnalyzer::VisibilityAnalyzer(VisibilityConfig cfg, bool verbose)
    : cfg_{cfg}, verbose_{verbose}
{}

VgaResult VisibilityAnalyzer::analyze(const Walls& walls, const std::vector<cv::Point2d>& boundary) const
{
    SampleGrid grid = generateSampleGrid(walls, boundary, cfg_.sampling);

    // the outline blocks rays and sight lines like any wall
    VgaResult res = analyzePoints(withBoundary(walls, boundary), grid.points);
    if (grid.coarsenings > 0)
        warn(res.diagnostics, "vga", "grid",
             "spacing coarsened " + std::to_string(grid.coarsenings) + " time(s) to " +
             std::to_string(grid.spacing) + " to respect the sample cap");
    res.grid = std::move(grid);
    return res;
}

VgaResult VisibilityAnalyzer::analyzePoints(const Walls& walls, const std::vector<cv::Point2d>& points) const
{
    if (points.empty())
        throw AnalysisError(Guard::EmptySampling, "grid", "no sample points supplied");
    if (cfg_.rayCount < 3)
        throw AnalysisError(Guard::InvalidConfig, "visibility.ray_count",
                            "at least three rays are needed for an isovist polygon");

    VgaResult res;
    res.grid.points  = points;
    res.grid.spacing = cfg_.sampling.gridSpacing;
    res.samples.resize(points.size());

    if (verbose_)
        std::cout << "[vga] " << points.size() << " samples, " << walls.size() << " walls\n";

    auto isovists = [&](const cv::Range& range)
    {
        for (int i = range.start; i < range.end; ++i)
        {
            res.samples[i].isovist = computeIsovist(points[i], walls, cfg_.rayCount,
                                                    cfg_.maxRayRange, cfg_.degenerateAreaEpsilon);
        }
    };
    const cv::Range all(0, static_cast<int>(points.size()));
    if (cfg_.parallel)
        cv::parallel_for_(all, isovists);
    else
        isovists(all);

    buildVisibilityGraph(walls, res);
    scoreSamples(res);

    for (std::size_t i = 0; i < res.samples.size(); ++i)
    {
        if (res.samples[i].isovist.degenerate)
            warn(res.diagnostics, "vga", "sample " + std::to_string(i),
                 "degenerate isovist (zero area)");
    }

    if (verbose_)
    {
        std::cout << "[vga] " << res.graph.edgeCount() << " visibility edges, "
                  << res.blindSpots.size() << " blind spot(s), "
                  << res.wideVisibility.size() << " wide-visibility point(s)\n";
    }
    return res;
}

/* ---------- pair tests ----------------------------------------------------- */
void VisibilityAnalyzer::buildVisibilityGraph(const Walls& walls, VgaResult& res) const
{
    const std::size_t n = res.samples.size();
    const double limit = cfg_.maxVisibilityDistance;

    // row i holds the visible j > i
    std::vector<std::vector<std::size_t>> rows(n);
    auto body = [&](const cv::Range& range)
    {
        for (int ii = range.start; ii < range.end; ++ii)
        {
            const std::size_t i = static_cast<std::size_t>(ii);
            const cv::Point2d& a = res.samples[i].isovist.origin;
            for (std::size_t j = i + 1; j < n; ++j)
            {
                const cv::Point2d& b = res.samples[j].isovist.origin;
                if (limit > 0.0 && distance(a, b) > limit)
                    continue;
                if (hasLineOfSight(a, b, walls))
                    rows[i].push_back(j);
            }
        }
    };
    const cv::Range all(0, static_cast<int>(n));
    if (cfg_.parallel)
        cv::parallel_for_(all, body);
    else
        body(all);

    // merged in index order, so neighbour lists come out sorted
    res.graph = VisibilityGraph(n);
    for (std::size_t i = 0; i < n; ++i)
        for (std::size_t j : rows[i])
            res.graph.connect(i, j);
}

/* ---------- visual integration --------------------------------------------- */
void VisibilityAnalyzer::scoreSamples(VgaResult& res) const
{
    const std::size_t n = res.samples.size();

    for (std::size_t i = 0; i < n; ++i)
    {
        res.samples[i].isovist.visibleNeighbours = res.graph.degree(i);
        res.maxVisibleNeighbours = std::max(res.maxVisibleNeighbours, res.graph.degree(i));
    }

    std::vector<double> vi(n), areas(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        auto& s = res.samples[i];
        const double visTerm = res.maxVisibleNeighbours > 0
            ? static_cast<double>(s.isovist.visibleNeighbours) / static_cast<double>(res.maxVisibleNeighbours)
            : 0.0;
        const double areaTerm = cfg_.areaNormalization > 0.0
            ? std::min(1.0, s.isovist.area / cfg_.areaNormalization)
            : 0.0;
        s.visualIntegration = 0.5 * visTerm + 0.5 * areaTerm;
        vi[i]    = s.visualIntegration;
        areas[i] = s.isovist.area;
    }

    res.blindSpotThreshold      = percentile(vi, cfg_.blindSpotPercentile);
    res.wideVisibilityThreshold = percentile(vi, cfg_.wideVisibilityPercentile);

    for (std::size_t i = 0; i < n; ++i)
    {
        auto& s = res.samples[i];
        if (s.visualIntegration < res.blindSpotThreshold)
        {
            s.blindSpot = true;
            res.blindSpots.push_back(i);
        }
        if (s.visualIntegration > res.wideVisibilityThreshold)
        {
            s.wideVisibility = true;
            res.wideVisibility.push_back(i);
        }
    }

    auto& sum = res.summary;
    sum.samples           = n;
    sum.visibilityEdges   = res.graph.edgeCount();
    sum.visualIntegration = summarize(vi);
    sum.isovistArea       = summarize(areas);
    sum.blindSpots        = res.blindSpots.size();
    sum.wideVisibility    = res.wideVisibility.size();
    sum.degenerate        = static_cast<std::size_t>(
        std::count_if(res.samples.begin(), res.samples.end(),
                      [](const VgaSample& s){ return s.isovist.degenerate; }));
}

} // namespace wayfinder
