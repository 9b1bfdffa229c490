#ifndef WAYFINDER_GEOMETRY_HPP
#define WAYFINDER_GEOMETRY_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <vector>
#include <opencv2/core.hpp>

namespace wayfinder {

/** One wall / obstacle edge. */
struct WallSegment
{
    cv::Point2d a;
    cv::Point2d b;
};

using Walls = std::vector<WallSegment>;

inline double cross2d(const cv::Point2d& a, const cv::Point2d& b)
{
    return a.x * b.y - a.y * b.x;
}

inline double distance(const cv::Point2d& a, const cv::Point2d& b)
{
    return std::hypot(a.x - b.x, a.y - b.y);
}

// distance(point, segment)
inline double pointSegmentDistance(const cv::Point2d& p,
                                   const cv::Point2d& a,
                                   const cv::Point2d& b)
{
    const cv::Point2d ap = p - a;
    const cv::Point2d ab = b - a;
    const double ab2 = ab.dot(ab);
    if (ab2 < 1e-18)
        return std::hypot(ap.x, ap.y);
    const double t = std::clamp(ap.dot(ab) / ab2, 0.0, 1.0);
    const cv::Point2d proj = a + t * ab;
    return std::hypot(proj.x - p.x, proj.y - p.y);
}

/**
 * @brief Ray/segment intersection.
 *
 * @param origin  Ray start.
 * @param dir     Unit direction.
 * @param wall    Segment to test.
 * @return        Distance along the ray to the hit (>= 0), or nullopt.
 *
 * Collinear overlaps return the distance to the nearest overlapping point.
 */
inline std::optional<double> raySegmentHit(const cv::Point2d& origin,
                                           const cv::Point2d& dir,
                                           const WallSegment& wall)
{
    const double eps = 1e-12;
    const cv::Point2d s = wall.b - wall.a;
    const cv::Point2d qmp = wall.a - origin;
    const double denom = cross2d(dir, s);

    if (std::abs(denom) < eps)
    {
        if (std::abs(cross2d(qmp, dir)) > 1e-9)
            return std::nullopt;                     // parallel, not collinear
        const double ta = qmp.dot(dir);
        const double tb = (wall.b - origin).dot(dir);
        if (ta < 0.0 && tb < 0.0)
            return std::nullopt;                     // behind the origin
        if ((ta <= 0.0 && tb >= 0.0) || (tb <= 0.0 && ta >= 0.0))
            return 0.0;                              // origin lies on the wall
        return std::min(ta, tb);
    }

    const double t = cross2d(qmp, s) / denom;   // along the ray
    const double u = cross2d(qmp, dir) / denom; // along the wall
    if (t < -1e-12 || u < -1e-12 || u > 1.0 + 1e-12)
        return std::nullopt;
    return std::max(0.0, t);
}

/** Closed segment intersection test (touching counts as intersecting). */
inline bool segmentsIntersect(const cv::Point2d& p0, const cv::Point2d& p1,
                              const cv::Point2d& q0, const cv::Point2d& q1)
{
    const double eps = 1e-12;
    auto orient = [&](const cv::Point2d& a, const cv::Point2d& b, const cv::Point2d& c) {
        const double v = cross2d(b - a, c - a);
        return (v > eps) ? 1 : ((v < -eps) ? -1 : 0);
    };
    auto onSegment = [&](const cv::Point2d& a, const cv::Point2d& b, const cv::Point2d& c) {
        return std::min(a.x, b.x) - eps <= c.x && c.x <= std::max(a.x, b.x) + eps &&
               std::min(a.y, b.y) - eps <= c.y && c.y <= std::max(a.y, b.y) + eps;
    };

    const int o1 = orient(p0, p1, q0);
    const int o2 = orient(p0, p1, q1);
    const int o3 = orient(q0, q1, p0);
    const int o4 = orient(q0, q1, p1);

    if (o1 != o2 && o3 != o4)
        return true;

    if (o1 == 0 && onSegment(p0, p1, q0)) return true;
    if (o2 == 0 && onSegment(p0, p1, q1)) return true;
    if (o3 == 0 && onSegment(q0, q1, p0)) return true;
    if (o4 == 0 && onSegment(q0, q1, p1)) return true;
    return false;
}

/** True when the straight segment a-b crosses no wall. */
inline bool hasLineOfSight(const cv::Point2d& a, const cv::Point2d& b, const Walls& walls)
{
    for (const auto& w : walls)
        if (segmentsIntersect(a, b, w.a, w.b))
            return false;
    return true;
}

/** Shoelace area of a closed polygon (vertex order either way). */
inline double polygonArea(const std::vector<cv::Point2d>& poly)
{
    if (poly.size() < 3)
        return 0.0;
    double twice = 0.0;
    for (std::size_t i = 0, j = poly.size() - 1; i < poly.size(); j = i++)
        twice += cross2d(poly[j], poly[i]);
    return std::abs(twice) * 0.5;
}

/** Closed perimeter: sum of consecutive vertex distances, last back to first. */
inline double polygonPerimeter(const std::vector<cv::Point2d>& poly)
{
    if (poly.size() < 2)
        return 0.0;
    double total = 0.0;
    for (std::size_t i = 0, j = poly.size() - 1; i < poly.size(); j = i++)
        total += distance(poly[j], poly[i]);
    return total;
}

/** Axis-aligned bounds of a set of walls. */
inline cv::Rect2d wallBounds(const Walls& walls)
{
    if (walls.empty())
        return {};
    double minX =  std::numeric_limits<double>::max(), minY =  std::numeric_limits<double>::max();
    double maxX = -std::numeric_limits<double>::max(), maxY = -std::numeric_limits<double>::max();
    for (const auto& w : walls)
    {
        minX = std::min({minX, w.a.x, w.b.x});
        minY = std::min({minY, w.a.y, w.b.y});
        maxX = std::max({maxX, w.a.x, w.b.x});
        maxY = std::max({maxY, w.a.y, w.b.y});
    }
    return {minX, minY, maxX - minX, maxY - minY};
}

/** @p walls plus the closed outline of @p boundary (ignored below 3 vertices). */
inline Walls withBoundary(const Walls& walls, const std::vector<cv::Point2d>& boundary)
{
    Walls out = walls;
    if (boundary.size() < 3)
        return out;
    for (std::size_t i = 0; i < boundary.size(); ++i)
        out.push_back({boundary[i], boundary[(i + 1) % boundary.size()]});
    return out;
}

} // namespace wayfinder

#endif // WAYFINDER_GEOMETRY_HPP
