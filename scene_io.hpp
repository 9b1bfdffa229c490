#pragma once
/*-----------------------------------------------------------------------------
 *  scene_io.hpp
 *
 *  Inputs supplied by floor-plan extraction, signage detection and the
 *  compliance module, gathered in one record, plus a YAML reader for it.
 *---------------------------------------------------------------------------*/
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <yaml-cpp/yaml.h>

#include "geometry.hpp"
#include "navgraph/navgraph.hpp"
#include "simulation/agentsimulator.hpp"

namespace wayfinder {

/** Precomputed composites, [0,1] or [0,100]. */
struct ExternalScores
{
    double signage       = 0.0;
    double accessibility = 0.0;
};

struct Scene
{
    std::vector<NodeSpec>    nodes;
    std::vector<EdgeSpec>    edges;
    Walls                    walls;
    std::vector<cv::Point2d> boundary;  ///< walkable outline; empty => wall bounds
    std::vector<SignageItem> signage;
    std::vector<Scenario>    scenarios;
    ExternalScores           external;
};

/**
 * @brief Parse a scene document.
 *
 * Keys: nodes, edges, walls, boundary, signage, scenarios, external_scores.
 * Throws AnalysisError{InvalidConfig} on malformed entries.
 */
Scene parseScene(const YAML::Node& root);

/** Load and parse a scene file; the file name is reported on failure. */
Scene loadScene(const std::string& path);

} // namespace wayfinder
