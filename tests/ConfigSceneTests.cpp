#include "TestSupport.hpp"

#include <yaml-cpp/yaml.h>

#include "config_io.hpp"
#include "scene_io.hpp"

using namespace wayfinder;

static void TestEmptyConfigKeepsDefaults()
{
  const AnalyzerConfig cfg = parseConfig(YAML::Load(""));
  const AnalyzerConfig def;
  EXPECT_NEAR(cfg.wes.weights.errors, 20.0, 1e-12);
  EXPECT_EQ(cfg.visibility.rayCount, 72);
  EXPECT_EQ(cfg.simulation.seed, def.simulation.seed);
  EXPECT_FALSE(cfg.verbose);
}

static void TestParseSections()
{
  const AnalyzerConfig cfg = parseConfig(YAML::Load(R"(
verbose: true
space_syntax:
  bottleneck_percentile: 80
visibility:
  grid_spacing: 0.5
  ray_count: 36
simulation:
  seed: 99
  error_cap: 0.75
  agents:
    elderly: { base_error_rate: 0.4, speed: 0.7 }
    first-time: { speed: 1.2 }
wes:
  weights: { errors: 25 }
  bounds:
    time: [30, 240]
    detour: { lo: 1.0, hi: 3.0 }
  priority_threshold: 0.8
)"));

  EXPECT_TRUE(cfg.verbose);
  EXPECT_NEAR(cfg.spaceSyntax.bottleneckPercentile, 80.0, 1e-12);
  EXPECT_NEAR(cfg.spaceSyntax.hubPercentile, 90.0, 1e-12);
  EXPECT_NEAR(cfg.visibility.sampling.gridSpacing, 0.5, 1e-12);
  EXPECT_EQ(cfg.visibility.rayCount, 36);
  EXPECT_EQ(cfg.simulation.seed, static_cast<std::uint64_t>(99));
  EXPECT_NEAR(cfg.simulation.errorCap, 0.75, 1e-12);

  const auto& elderly = profileFor(cfg.simulation.agents, AgentType::Elderly);
  EXPECT_NEAR(elderly.baseErrorRate, 0.4, 1e-12);
  EXPECT_NEAR(elderly.speed, 0.7, 1e-12);
  const auto& visitor = profileFor(cfg.simulation.agents, AgentType::FirstTimeVisitor);
  EXPECT_NEAR(visitor.speed, 1.2, 1e-12);
  EXPECT_NEAR(visitor.baseErrorRate, 0.25, 1e-12);

  EXPECT_NEAR(cfg.wes.weights.errors, 25.0, 1e-12);
  EXPECT_NEAR(cfg.wes.weights.time, 15.0, 1e-12);
  EXPECT_NEAR(cfg.wes.bounds.time.lo, 30.0, 1e-12);
  EXPECT_NEAR(cfg.wes.bounds.time.hi, 240.0, 1e-12);
  EXPECT_NEAR(cfg.wes.bounds.detour.hi, 3.0, 1e-12);
  EXPECT_NEAR(cfg.wes.priorityThreshold, 0.8, 1e-12);
}

static void TestInvalidConfig()
{
  EXPECT_GUARD(parseConfig(YAML::Load("visibility: { ray_count: 2 }")), Guard::InvalidConfig);
  EXPECT_GUARD(parseConfig(YAML::Load("visibility: { grid_spacing: 0 }")), Guard::InvalidConfig);
  EXPECT_GUARD(parseConfig(YAML::Load("simulation: { error_cap: 1.5 }")), Guard::InvalidConfig);
  EXPECT_GUARD(parseConfig(YAML::Load("simulation: { agents: { tourist: { speed: 1 } } }")), Guard::InvalidConfig);
  EXPECT_GUARD(parseConfig(YAML::Load("simulation: { agents: { elderly: { speed: 0 } } }")), Guard::InvalidConfig);
  EXPECT_GUARD(parseConfig(YAML::Load("wes: { bounds: { errors: [5, 0] } }")), Guard::InvalidConfig);
  EXPECT_GUARD(parseConfig(YAML::Load("wes: { weights: { time: -1 } }")), Guard::InvalidConfig);
  EXPECT_GUARD(parseConfig(YAML::Load("space_syntax: { min_rra: 0 }")), Guard::InvalidConfig);
  EXPECT_GUARD(parseConfig(YAML::Load("wes: { benchmarks: { max_detour: 0 } }")), Guard::InvalidConfig);
  EXPECT_GUARD(parseConfig(YAML::Load("wes: { benchmarks: { min_signage: 40 } }")), Guard::InvalidConfig);
  EXPECT_GUARD(parseConfig(YAML::Load("simulation: { recommend_success_below: 70 }")), Guard::InvalidConfig);

  // wrong scalar type surfaces as InvalidConfig, not a YAML exception
  EXPECT_GUARD(parseConfig(YAML::Load("visibility: { ray_count: many }")), Guard::InvalidConfig);
  EXPECT_GUARD(loadConfig("does/not/exist.yml"), Guard::InvalidConfig);

  try {
    parseConfig(YAML::Load("simulation: { min_step_budget: 0 }"));
    EXPECT_TRUE(false);
  } catch (const AnalysisError& e) {
    EXPECT_EQ(e.entity(), std::string("simulation.min_step_budget"));
  }
}

static void TestDefaultFileMatchesBuiltIns()
{
  const AnalyzerConfig file = loadConfig("default.yml");
  const AnalyzerConfig def;
  EXPECT_NEAR(file.spaceSyntax.minRra, def.spaceSyntax.minRra, 1e-12);
  EXPECT_NEAR(file.visibility.areaNormalization, def.visibility.areaNormalization, 1e-12);
  EXPECT_EQ(file.visibility.sampling.maxSamples, def.visibility.sampling.maxSamples);
  EXPECT_NEAR(file.simulation.noLandmarkFactor, def.simulation.noLandmarkFactor, 1e-12);
  EXPECT_EQ(file.simulation.seed, def.simulation.seed);
  EXPECT_EQ(file.simulation.minStepBudget, def.simulation.minStepBudget);
  for (AgentType t : kAllAgentTypes)
  {
    EXPECT_NEAR(profileFor(file.simulation.agents, t).baseErrorRate,
                profileFor(def.simulation.agents, t).baseErrorRate, 1e-12);
    EXPECT_NEAR(profileFor(file.simulation.agents, t).speed,
                profileFor(def.simulation.agents, t).speed, 1e-12);
  }
  EXPECT_NEAR(file.wes.bounds.hesitations.hi, def.wes.bounds.hesitations.hi, 1e-12);
  EXPECT_NEAR(file.wes.weights.visualIntegration, def.wes.weights.visualIntegration, 1e-12);
  EXPECT_NEAR(file.simulation.recommendSuccessBelow, def.simulation.recommendSuccessBelow, 1e-12);
  EXPECT_NEAR(file.simulation.recommendTimeAbove, def.simulation.recommendTimeAbove, 1e-12);
  EXPECT_NEAR(file.simulation.recommendErrorsAbove, def.simulation.recommendErrorsAbove, 1e-12);
  EXPECT_NEAR(file.wes.benchmarks.maxTime, def.wes.benchmarks.maxTime, 1e-12);
  EXPECT_NEAR(file.wes.benchmarks.maxDetour, def.wes.benchmarks.maxDetour, 1e-12);
  EXPECT_NEAR(file.wes.benchmarks.minAccessibility, def.wes.benchmarks.minAccessibility, 1e-12);
}

static void TestBenchmarkOverrides()
{
  const AnalyzerConfig cfg = parseConfig(YAML::Load(R"(
simulation:
  recommend_time_above: 120
wes:
  benchmarks:
    max_time: 240
    min_signage: 0.6
)"));
  EXPECT_NEAR(cfg.simulation.recommendTimeAbove, 120.0, 1e-12);
  EXPECT_NEAR(cfg.simulation.recommendSuccessBelow, 0.7, 1e-12);
  EXPECT_NEAR(cfg.wes.benchmarks.maxTime, 240.0, 1e-12);
  EXPECT_NEAR(cfg.wes.benchmarks.minSignage, 0.6, 1e-12);
  EXPECT_NEAR(cfg.wes.benchmarks.maxDetour, 1.5, 1e-12);
}

static void TestParseScene()
{
  const Scene scene = parseScene(YAML::Load(R"(
nodes:
  - { id: a, x: 0, y: 0, tag: entrance }
  - { id: b, position: [3, 4] }
  - { id: c, x: 6, y: 0, tag: decision-point }
edges:
  - { from: a, to: b }
  - [b, c, 2.5]
walls:
  - [0, -1, 6, -1]
  - [[0, 5], [6, 5]]
boundary:
  - [0, -1]
  - [6, -1]
  - [6, 5]
signage:
  - { x: 1, y: 1, kind: landmark, label: statue }
  - { x: 2, y: 1 }
scenarios:
  - { origin: a, destination: c, runs: 5, population: { elderly: 2, first_time: 1 } }
external_scores: { signage: 64, accessibility: 0.9 }
)"));

  ASSERT_TRUE(scene.nodes.size() == 3);
  EXPECT_TRUE(scene.nodes[0].tag == NodeTag::Entrance);
  EXPECT_TRUE(scene.nodes[1].tag == NodeTag::Unknown);
  EXPECT_TRUE(scene.nodes[2].tag == NodeTag::DecisionPoint);
  EXPECT_NEAR(scene.nodes[1].position.y, 4.0, 1e-12);

  ASSERT_TRUE(scene.edges.size() == 2);
  EXPECT_FALSE(scene.edges[0].weight.has_value());
  EXPECT_NEAR(*scene.edges[1].weight, 2.5, 1e-12);

  ASSERT_TRUE(scene.walls.size() == 2);
  EXPECT_NEAR(scene.walls[1].b.x, 6.0, 1e-12);
  EXPECT_EQ(scene.boundary.size(), static_cast<std::size_t>(3));

  ASSERT_TRUE(scene.signage.size() == 2);
  EXPECT_TRUE(scene.signage[0].kind == SignageKind::Landmark);
  EXPECT_EQ(scene.signage[0].label, std::string("statue"));
  EXPECT_TRUE(scene.signage[1].kind == SignageKind::Directional);

  ASSERT_TRUE(scene.scenarios.size() == 1);
  const Scenario& sc = scene.scenarios[0];
  EXPECT_EQ(sc.name, std::string("scenario_0"));
  EXPECT_EQ(sc.runCount, static_cast<std::size_t>(5));
  EXPECT_EQ(sc.populationSize(), static_cast<std::size_t>(3));
  EXPECT_EQ(sc.population.at(AgentType::FirstTimeVisitor), static_cast<std::size_t>(1));

  EXPECT_NEAR(scene.external.signage, 64.0, 1e-12);
  EXPECT_NEAR(scene.external.accessibility, 0.9, 1e-12);

  // the parsed lists feed the graph builder directly
  const NavGraph g = NavGraph::build(scene.nodes, scene.edges);
  EXPECT_NEAR(*g.edgeWeight(g.index("a"), g.index("b")), 5.0, 1e-12);
}

static void TestBadScenes()
{
  EXPECT_GUARD(parseScene(YAML::Load("nodes: [ { id: a, x: 0, y: 0, tag: attic } ]")), Guard::InvalidConfig);
  EXPECT_GUARD(parseScene(YAML::Load("nodes: [ { id: a } ]")), Guard::InvalidConfig);
  EXPECT_GUARD(parseScene(YAML::Load("signage: [ { x: 0, y: 0, kind: neon } ]")), Guard::InvalidConfig);
  EXPECT_GUARD(parseScene(YAML::Load(
      "scenarios: [ { origin: a, destination: b, population: { robot: 1 } } ]")), Guard::InvalidConfig);
  EXPECT_GUARD(loadScene("missing_scene.yaml"), Guard::InvalidConfig);

  const Scene empty = parseScene(YAML::Load(""));
  EXPECT_TRUE(empty.nodes.empty());
  EXPECT_TRUE(empty.scenarios.empty());
}

static void TestClinicSceneFile()
{
  const Scene scene = loadScene("data/clinic_floor.yaml");
  EXPECT_EQ(scene.nodes.size(), static_cast<std::size_t>(7));
  EXPECT_EQ(scene.edges.size(), static_cast<std::size_t>(7));
  EXPECT_EQ(scene.walls.size(), static_cast<std::size_t>(6));
  EXPECT_EQ(scene.signage.size(), static_cast<std::size_t>(2));
  ASSERT_TRUE(scene.scenarios.size() == 2);
  EXPECT_EQ(scene.scenarios[0].populationSize(), static_cast<std::size_t>(9));
  EXPECT_EQ(scene.scenarios[1].runCount, static_cast<std::size_t>(20));
  EXPECT_NEAR(scene.external.signage, 72.0, 1e-12);
}

int main()
{
  TestEmptyConfigKeepsDefaults();
  TestParseSections();
  TestInvalidConfig();
  TestDefaultFileMatchesBuiltIns();
  TestBenchmarkOverrides();
  TestParseScene();
  TestBadScenes();
  TestClinicSceneFile();
  return FinishTests("wayfinder_config_scene_tests");
}
