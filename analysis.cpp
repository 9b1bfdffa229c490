/*-----------------------------------------------------------------------------
 *  analysis.cpp
 *---------------------------------------------------------------------------*/
#include "analysis.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

#include "config_io.hpp"

namespace wayfinder {

namespace {

void append(Diagnostics& into, const Diagnostics& from)
{
    into.insert(into.end(), from.begin(), from.end());
}

std::string optionalText(const std::optional<double>& v, int precision = 3)
{
    if (!v)
        return "-";
    std::ostringstream os;
    os << std::fixed << std::setprecision(precision) << *v;
    return os.str();
}

} // namespace

AnalysisReport runAnalysis(const Scene& scene, const AnalyzerConfig& cfg)
{
    validate(cfg);

    AnalysisReport report;
    report.graph = NavGraph::build(scene.nodes, scene.edges);
    if (cfg.verbose)
        std::cout << "[navgraph] " << report.graph.size() << " nodes, "
                  << report.graph.edgeCount() << " edges\n";

    report.spaceSyntax = SpaceSyntaxAnalyzer(cfg.spaceSyntax, cfg.verbose).analyze(report.graph);
    append(report.diagnostics, report.spaceSyntax.diagnostics);

    if (!scene.walls.empty() || scene.boundary.size() >= 3)
    {
        report.visibility = VisibilityAnalyzer(cfg.visibility, cfg.verbose).analyze(scene.walls, scene.boundary);
        append(report.diagnostics, report.visibility->diagnostics);
    }
    else
    {
        warn(report.diagnostics, "vga", "",
             "no wall geometry, visual integration undefined and scored as 0");
    }

    AgentSimulator simulator(report.graph, withBoundary(scene.walls, scene.boundary),
                             scene.signage, cfg.simulation, cfg.verbose);
    report.simulation = simulator.run(scene.scenarios, &report.spaceSyntax,
                                      report.visibility ? &*report.visibility : nullptr);
    append(report.diagnostics, report.simulation.diagnostics);

    if (scene.scenarios.empty())
        warn(report.diagnostics, "simulation", "", "no scenarios, movement metrics scored at their defaults");

    const WesInputs inputs = WesInputs::fromAnalyses(report.simulation,
                                                     report.visibility ? &*report.visibility : nullptr,
                                                     scene.external.signage,
                                                     scene.external.accessibility);
    report.wes = WesCalculator(cfg.wes, cfg.verbose).evaluate(inputs);
    append(report.diagnostics, report.wes.diagnostics);
    return report;
}

void printReport(std::ostream& os, const AnalysisReport& r)
{
    const auto& g = r.graph;
    os << std::fixed << std::setprecision(3);

    /* ---- space syntax ---- */
    os << "== Space syntax (" << g.size() << " nodes, "
       << r.spaceSyntax.summary.components << " component(s)) ==\n";
    os << std::left << std::setw(14) << "node" << std::right
       << std::setw(5)  << "deg"
       << std::setw(9)  << "MD"
       << std::setw(10) << "integ"
       << std::setw(9)  << "choice"
       << std::setw(9)  << "control"
       << "  flags\n";
    for (const auto& n : r.spaceSyntax.nodes)
    {
        os << std::left << std::setw(14) << n.id << std::right
           << std::setw(5)  << n.degree
           << std::setw(9)  << optionalText(n.meanDepth)
           << std::setw(10) << optionalText(n.integration)
           << std::setw(9)  << n.choiceNormalized
           << std::setw(9)  << n.control
           << "  "
           << (n.bottleneck ? "bottleneck " : "")
           << (n.hub ? "hub " : "")
           << (n.integrationCapped ? "capped " : "")
           << (n.isolated ? "isolated" : "")
           << '\n';
    }
    os << "complexity " << r.spaceSyntax.summary.complexity << "\n\n";

    /* ---- visibility ---- */
    if (r.visibility)
    {
        const auto& s = r.visibility->summary;
        os << "== Visibility ==\n"
           << "samples " << s.samples << " (spacing " << r.visibility->grid.spacing << ")"
           << ", visibility edges " << s.visibilityEdges << '\n'
           << "visual integration mean " << s.visualIntegration.mean
           << " min " << s.visualIntegration.min
           << " max " << s.visualIntegration.max << '\n'
           << "isovist area mean " << s.isovistArea.mean << '\n'
           << "blind spots " << s.blindSpots << ", wide-visibility points " << s.wideVisibility
           << ", degenerate " << s.degenerate << "\n\n";
    }

    /* ---- simulation ---- */
    os << "== Simulation ==\n";
    for (const auto& sc : r.simulation.scenarios)
    {
        os << sc.name << " (" << sc.origin << " -> " << sc.destination << ", "
           << sc.trials << " trials)\n"
           << "  time mean " << sc.time.mean << " s, median " << sc.time.median
           << ", p90 " << sc.time.p90 << '\n'
           << "  errors mean " << sc.errors.mean << ", hesitations mean " << sc.hesitations.mean << '\n'
           << "  detour index " << sc.detourIndex
           << ", first-pass success " << sc.firstPassSuccessRate
           << ", success " << sc.successRate
           << ", stuck " << sc.stuckRate << '\n'
           << "  sign usage mean " << sc.meanSignUsage << '\n';
    }
    for (const auto& dp : r.simulation.decisionPoints)
    {
        os << "  decision point " << dp.id << ": degree " << dp.degree
           << ", p(error) " << dp.errorProbability
           << (dp.sign ? ", sign" : "") << (dp.landmark ? ", landmark" : "") << '\n';
    }
    for (const auto& rec : r.simulation.recommendations)
        os << "  recommendation (" << recommendationKindName(rec.kind) << "): " << rec.message << '\n';
    os << '\n';

    /* ---- WES ---- */
    os << "== WES ==\n"
       << "score " << std::setprecision(1) << r.wes.score << " (" << wesBandName(r.wes.band)
       << ", " << r.wes.grade << ")\n" << std::setprecision(3);
    for (const auto& c : r.wes.components)
    {
        os << "  " << std::left << std::setw(20) << wesComponentName(c.component) << std::right
           << " raw " << std::setw(9) << c.raw
           << "  norm " << c.normalized
           << "  contribution " << std::showpos << c.contribution << std::noshowpos << '\n';
    }
    for (const auto& p : r.wes.priorities)
    {
        os << "  priority " << priorityLevelName(p.level) << ": "
           << wesComponentName(p.component) << " (impact " << p.impact << ")\n";
    }
    os << "  benchmarks met " << r.wes.benchmarks.met << "/" << kWesComponentCount
       << " (" << std::setprecision(1) << r.wes.benchmarks.compliancePercent << "%)\n"
       << std::setprecision(3);
    for (const auto& b : r.wes.benchmarks.checks)
    {
        if (b.meetsStandard)
            continue;
        os << "  below standard: " << wesComponentName(b.component) << " " << b.value
           << (b.upperLimit ? " > " : " < ") << b.benchmark << '\n';
    }

    if (!r.diagnostics.empty())
    {
        os << "\n== Diagnostics ==\n";
        for (const auto& d : r.diagnostics)
        {
            os << "[" << d.component << "]";
            if (!d.entity.empty())
                os << " " << d.entity;
            os << ": " << d.message << '\n';
        }
    }
}

} // namespace wayfinder
