#pragma once
/*-----------------------------------------------------------------------------
 *  isovist.hpp
 *
 *  2-D isovists by ray casting against wall segments.
 *---------------------------------------------------------------------------*/
#include <cstddef>
#include <vector>
#include <opencv2/core.hpp>

#include "geometry.hpp"

namespace wayfinder {

/**
 * @brief Visible region around one sample point.
 */
struct IsovistSample
{
    cv::Point2d              origin;
    std::vector<cv::Point2d> polygon;      ///< ray endpoints, counter-clockwise from angle 0
    double                   area{0.0};
    double                   perimeter{0.0};
    double                   maxRadial{0.0};  ///< longest ray
    double                   meanRadial{0.0};
    double                   compactness{0.0}; ///< 4*pi*A / P^2, 1 for a disc
    std::size_t              visibleNeighbours{0}; ///< filled in by the visibility graph
    bool                     degenerate{false};    ///< zero area, kept and flagged
};

/**
 * @brief Length of one ray.
 *
 * @param origin    Ray start.
 * @param angle     Direction in radians.
 * @param walls     Obstacles.
 * @param maxRange  Returned when nothing is hit closer.
 */
double castRay(const cv::Point2d& origin, double angle, const Walls& walls, double maxRange);

/**
 * @brief Build the isovist of @p origin from @p rayCount evenly spaced rays.
 *
 * Polygons with area <= @p degenerateEpsilon get area 0 and the degenerate flag.
 */
IsovistSample computeIsovist(const cv::Point2d& origin,
                             const Walls&       walls,
                             int                rayCount,
                             double             maxRange,
                             double             degenerateEpsilon = 1e-9);

} // namespace wayfinder
