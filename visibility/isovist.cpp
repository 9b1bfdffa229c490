/*-----------------------------------------------------------------------------
 *  isovist.cpp
 *---------------------------------------------------------------------------*/
#include "isovist.hpp"

#include <algorithm>
#include <cmath>

namespace wayfinder {

double castRay(const cv::Point2d& origin, double angle, const Walls& walls, double maxRange)
{
    const cv::Point2d dir{std::cos(angle), std::sin(angle)};
    double best = maxRange;
    for (const auto& w : walls)
    {
        auto hit = raySegmentHit(origin, dir, w);
        if (hit && *hit < best)
            best = *hit;
    }
    return best;
}

IsovistSample computeIsovist(const cv::Point2d& origin,
                             const Walls&       walls,
                             int                rayCount,
                             double             maxRange,
                             double             degenerateEpsilon)
{
    IsovistSample iso;
    iso.origin = origin;
    if (rayCount <= 0)
    {
        iso.degenerate = true;
        return iso;
    }

    iso.polygon.reserve(static_cast<std::size_t>(rayCount));
    const double step = 2.0 * CV_PI / static_cast<double>(rayCount);
    double radialSum = 0.0;

    for (int i = 0; i < rayCount; ++i)
    {
        const double angle = step * static_cast<double>(i);
        const double r = castRay(origin, angle, walls, maxRange);
        iso.polygon.emplace_back(origin.x + r * std::cos(angle),
                                 origin.y + r * std::sin(angle));
        iso.maxRadial = std::max(iso.maxRadial, r);
        radialSum += r;
    }
    iso.meanRadial = radialSum / static_cast<double>(rayCount);

    iso.area      = polygonArea(iso.polygon);
    iso.perimeter = polygonPerimeter(iso.polygon);

    if (iso.area <= degenerateEpsilon)
    {
        iso.area       = 0.0;
        iso.degenerate = true;
    }
    else if (iso.perimeter > 0.0)
    {
        iso.compactness = 4.0 * CV_PI * iso.area / (iso.perimeter * iso.perimeter);
    }
    return iso;
}

} // namespace wayfinder
