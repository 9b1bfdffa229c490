#pragma once
/*-----------------------------------------------------------------------------
 *  analysis.hpp
 *
 *  Full pipeline: graph -> space syntax -> VGA -> simulation -> WES.
 *---------------------------------------------------------------------------*/
#include <optional>
#include <ostream>

#include "config.hpp"
#include "errors.hpp"
#include "navgraph/navgraph.hpp"
#include "scene_io.hpp"
#include "scoring/wescalculator.hpp"
#include "simulation/agentsimulator.hpp"
#include "spacesyntax/spacesyntax.hpp"
#include "visibility/vga.hpp"

namespace wayfinder {

struct AnalysisReport
{
    NavGraph                 graph;
    SpaceSyntaxResult        spaceSyntax;
    std::optional<VgaResult> visibility;   ///< empty without wall geometry
    SimulationResult         simulation;
    WesResult                wes;
    Diagnostics              diagnostics;  ///< every component's diagnostics, in pipeline order
};

/**
 * @brief Run every analyzer over @p scene.
 *
 * Fatal input problems propagate as AnalysisError; everything else ends up
 * in the report's diagnostics.
 */
AnalysisReport runAnalysis(const Scene& scene, const AnalyzerConfig& cfg);

/** Plain-text summary of a report. */
void printReport(std::ostream& os, const AnalysisReport& report);

} // namespace wayfinder
