#include "TestSupport.hpp"

#include "scoring/wescalculator.hpp"
#include "simulation/agentsimulator.hpp"

using namespace wayfinder;

// every sub-metric halfway between its bounds
static WesInputs MidRange()
{
  WesInputs in;
  in.meanTime          = 180.0;
  in.detourIndex       = 1.75;
  in.meanErrors        = 2.5;
  in.meanHesitations   = 4.0;
  in.visualIntegration = 0.5;
  in.signage           = 0.5;
  in.accessibility     = 0.5;
  return in;
}

static void TestNormalizeClamped()
{
  const Bounds b{60.0, 300.0};
  EXPECT_NEAR(normalizeClamped(60.0, b), 0.0, 1e-12);
  EXPECT_NEAR(normalizeClamped(180.0, b), 0.5, 1e-12);
  EXPECT_NEAR(normalizeClamped(1000.0, b), 1.0, 1e-12);
  EXPECT_NEAR(normalizeClamped(-5.0, b), 0.0, 1e-12);
  EXPECT_NEAR(normalizeClamped(std::nan(""), b), 0.0, 1e-12);

  const Bounds flat{2.0, 2.0};
  EXPECT_NEAR(normalizeClamped(1.0, flat), 0.0, 1e-12);
  EXPECT_NEAR(normalizeClamped(3.0, flat), 1.0, 1e-12);
}

static void TestMidRangeScore()
{
  const WesResult r = WesCalculator().evaluate(MidRange());
  // 100 - 0.5 * 55 + 0.5 * 45
  EXPECT_NEAR(r.unclampedScore, 95.0, 1e-9);
  EXPECT_NEAR(r.score, 95.0, 1e-9);
  EXPECT_TRUE(r.band == WesBand::Excellent);
  EXPECT_EQ(r.grade, std::string("A+"));
  EXPECT_TRUE(r.diagnostics.empty());

  const auto& errors = r.component(WesComponent::Errors);
  EXPECT_NEAR(errors.normalized, 0.5, 1e-12);
  EXPECT_NEAR(errors.quality, 0.5, 1e-12);
  EXPECT_NEAR(errors.contribution, -10.0, 1e-12);
  EXPECT_FALSE(errors.clamped);

  const auto& vi = r.component(WesComponent::VisualIntegration);
  EXPECT_NEAR(vi.contribution, 10.0, 1e-12);
}

static void TestScoreAlwaysInRange()
{
  WesInputs best;
  best.meanTime = 60.0;
  best.detourIndex = 1.0;
  best.visualIntegration = 1.0;
  best.signage = 1.0;
  best.accessibility = 1.0;
  const WesResult top = WesCalculator().evaluate(best);
  EXPECT_NEAR(top.unclampedScore, 145.0, 1e-9);
  EXPECT_NEAR(top.score, 100.0, 1e-12);

  WesInputs worst;
  worst.meanTime = 1e6;
  worst.detourIndex = 40.0;
  worst.meanErrors = 99.0;
  worst.meanHesitations = 99.0;
  const WesResult bottom = WesCalculator().evaluate(worst);
  EXPECT_NEAR(bottom.score, 45.0, 1e-9);
  EXPECT_TRUE(bottom.band == WesBand::Poor);
  EXPECT_TRUE(bottom.component(WesComponent::Time).clamped);
  EXPECT_FALSE(bottom.diagnostics.empty());

  // heavier penalties can push the sum below zero
  WesConfig heavy;
  heavy.weights.errors = 200.0;
  const WesResult floor = WesCalculator(heavy).evaluate(worst);
  EXPECT_TRUE(floor.unclampedScore < 0.0);
  EXPECT_NEAR(floor.score, 0.0, 1e-12);
  EXPECT_TRUE(floor.band == WesBand::Critical);
  EXPECT_EQ(floor.grade, std::string("F"));

  const WesResult zeros = WesCalculator().evaluate(WesInputs{});
  EXPECT_TRUE(zeros.score >= 0.0 && zeros.score <= 100.0);
}

static void TestMonotonicInErrors()
{
  // no bonuses, so the sum stays below the 100 cap
  const WesCalculator calc;
  double previous = 101.0;
  for (double e : {0.0, 1.0, 2.5, 4.0, 5.0})
  {
    WesInputs in = MidRange();
    in.visualIntegration = 0.0;
    in.signage = 0.0;
    in.accessibility = 0.0;
    in.meanErrors = e;
    const double s = calc.evaluate(in).score;
    EXPECT_TRUE(s < previous);
    previous = s;
  }

  // past the upper bound nothing changes any more
  WesInputs a = MidRange(), b = MidRange();
  a.meanErrors = 5.0;
  b.meanErrors = 8.0;
  EXPECT_NEAR(calc.evaluate(a).score, calc.evaluate(b).score, 1e-12);
}

static void TestBandsAndGrades()
{
  EXPECT_TRUE(wesBand(90.0) == WesBand::Excellent);
  EXPECT_TRUE(wesBand(89.999) == WesBand::Good);
  EXPECT_TRUE(wesBand(75.0) == WesBand::Good);
  EXPECT_TRUE(wesBand(60.0) == WesBand::Acceptable);
  EXPECT_TRUE(wesBand(45.0) == WesBand::Poor);
  EXPECT_TRUE(wesBand(44.9) == WesBand::Critical);

  EXPECT_EQ(std::string(wesGrade(86.0)), std::string("A"));
  EXPECT_EQ(std::string(wesGrade(80.0)), std::string("A-"));
  EXPECT_EQ(std::string(wesGrade(71.0)), std::string("B"));
  EXPECT_EQ(std::string(wesGrade(50.0)), std::string("C-"));
  EXPECT_EQ(std::string(wesGrade(12.0)), std::string("F"));
  EXPECT_EQ(std::string(wesBandName(WesBand::Acceptable)), std::string("acceptable"));
}

static void TestPercentInputs()
{
  WesInputs in = MidRange();
  in.signage = 72.0;
  in.accessibility = 0.8;
  const WesResult r = WesCalculator().evaluate(in);

  EXPECT_NEAR(r.inputs.signage, 0.72, 1e-12);
  EXPECT_NEAR(r.inputs.accessibility, 0.8, 1e-12);
  EXPECT_NEAR(r.component(WesComponent::Signage).normalized, 0.72, 1e-12);
  EXPECT_FALSE(r.component(WesComponent::Signage).clamped);
  ASSERT_TRUE(r.diagnostics.size() == 1);
  EXPECT_EQ(r.diagnostics[0].entity, std::string("signage"));
}

static void TestPriorities()
{
  const WesResult r = WesCalculator().evaluate(MidRange());
  ASSERT_TRUE(r.priorities.size() == kWesComponentCount);

  // impact = 0.5 * weight * 0.9; errors and VI tie at 9, errors listed first
  EXPECT_TRUE(r.priorities[0].component == WesComponent::Errors);
  EXPECT_TRUE(r.priorities[1].component == WesComponent::VisualIntegration);
  EXPECT_NEAR(r.priorities[0].impact, 9.0, 1e-12);
  EXPECT_NEAR(r.priorities[0].potential, 0.5, 1e-12);
  EXPECT_TRUE(r.priorities[0].level == PriorityLevel::High);

  for (std::size_t i = 1; i < r.priorities.size(); ++i)
    EXPECT_TRUE(r.priorities[i - 1].impact >= r.priorities[i].impact);

  const auto& last = r.priorities.back();
  EXPECT_NEAR(last.impact, 4.5, 1e-12);
  EXPECT_TRUE(last.level == PriorityLevel::Medium);

  // an almost perfect design only lists what is still below the threshold
  WesInputs good = MidRange();
  good.meanTime = 60.0;
  good.detourIndex = 1.0;
  good.meanErrors = 0.0;
  good.meanHesitations = 0.0;
  good.visualIntegration = 0.95;
  good.signage = 0.95;
  good.accessibility = 0.85;
  const WesResult g = WesCalculator().evaluate(good);
  ASSERT_TRUE(g.priorities.size() == 1);
  EXPECT_TRUE(g.priorities[0].component == WesComponent::Accessibility);
  EXPECT_TRUE(g.priorities[0].level == PriorityLevel::Low);
}

static void TestBenchmarks()
{
  const WesResult r = WesCalculator().evaluate(MidRange());
  const BenchmarkReport& b = r.benchmarks;

  const BenchmarkCheck& time = b.check(WesComponent::Time);
  EXPECT_TRUE(time.upperLimit);
  EXPECT_TRUE(time.meetsStandard);
  EXPECT_NEAR(time.benchmark, 300.0, 1e-12);
  ASSERT_TRUE(time.percentOfBenchmark.has_value());
  EXPECT_NEAR(*time.percentOfBenchmark, 60.0, 1e-9);

  // 1.75 against a 1.5 ceiling
  EXPECT_FALSE(b.check(WesComponent::Detour).meetsStandard);
  EXPECT_TRUE(b.check(WesComponent::Errors).meetsStandard);
  EXPECT_TRUE(b.check(WesComponent::Hesitations).meetsStandard);

  const BenchmarkCheck& vi = b.check(WesComponent::VisualIntegration);
  EXPECT_FALSE(vi.upperLimit);
  EXPECT_TRUE(vi.meetsStandard);
  EXPECT_FALSE(vi.percentOfBenchmark.has_value());
  EXPECT_TRUE(b.check(WesComponent::Signage).meetsStandard);
  // a minimum is met when reached exactly
  EXPECT_TRUE(b.check(WesComponent::Accessibility).meetsStandard);

  EXPECT_EQ(b.met, static_cast<std::size_t>(6));
  EXPECT_NEAR(b.compliancePercent, 600.0 / 7.0, 1e-9);

  // percent inputs are compared after scaling to [0,1]
  WesInputs in = MidRange();
  in.signage = 35.0;
  const WesResult pct = WesCalculator().evaluate(in);
  EXPECT_NEAR(pct.benchmarks.check(WesComponent::Signage).value, 0.35, 1e-12);
  EXPECT_FALSE(pct.benchmarks.check(WesComponent::Signage).meetsStandard);
  EXPECT_EQ(pct.benchmarks.met, static_cast<std::size_t>(5));

  WesConfig strict;
  strict.benchmarks.maxTime = 120.0;
  strict.benchmarks.maxDetour = 2.0;
  const WesResult s = WesCalculator(strict).evaluate(MidRange());
  EXPECT_FALSE(s.benchmarks.check(WesComponent::Time).meetsStandard);
  EXPECT_NEAR(*s.benchmarks.check(WesComponent::Time).percentOfBenchmark, 150.0, 1e-9);
  EXPECT_TRUE(s.benchmarks.check(WesComponent::Detour).meetsStandard);
}

static void TestWeightSumDiagnostic()
{
  WesConfig cfg;
  cfg.weights.errors = 30.0; // sums to 110
  const WesResult r = WesCalculator(cfg).evaluate(MidRange());
  ASSERT_TRUE(r.diagnostics.size() == 1);
  EXPECT_EQ(r.diagnostics[0].component, std::string("wes"));
  EXPECT_EQ(r.diagnostics[0].entity, std::string("weights"));

  // used as given: 100 - 0.5 * 65 + 0.5 * 45
  EXPECT_NEAR(r.score, 90.0, 1e-9);

  EXPECT_TRUE(WesCalculator().evaluate(MidRange()).diagnostics.empty());
}

static void TestCompareDesigns()
{
  const DesignComparison c = WesCalculator::compareDesigns({{"north", 72.0}, {"south", 88.0}, {"east", 72.0}, {"west", 60.0}});
  EXPECT_EQ(c.best, std::string("south"));
  EXPECT_EQ(c.worst, std::string("west"));
  EXPECT_NEAR(c.range, 28.0, 1e-12);
  EXPECT_NEAR(c.mean, 73.0, 1e-12);

  const DesignComparison tie = WesCalculator::compareDesigns({{"a", 50.0}, {"b", 50.0}});
  EXPECT_EQ(tie.best, std::string("a"));
  EXPECT_EQ(tie.worst, std::string("a"));
  EXPECT_NEAR(tie.stddev, 0.0, 1e-12);

  const DesignComparison none = WesCalculator::compareDesigns({});
  EXPECT_TRUE(none.best.empty());
}

static void TestInputsFromAnalyses()
{
  SimulationResult sim;
  sim.overall.meanTime = 95.0;
  sim.overall.meanDetourIndex = 1.3;
  sim.overall.meanErrors = 0.7;
  sim.overall.meanHesitations = 1.1;

  const WesInputs in = WesInputs::fromAnalyses(sim, nullptr, 72.0, 0.8);
  EXPECT_NEAR(in.meanTime, 95.0, 1e-12);
  EXPECT_NEAR(in.detourIndex, 1.3, 1e-12);
  EXPECT_NEAR(in.meanErrors, 0.7, 1e-12);
  EXPECT_NEAR(in.meanHesitations, 1.1, 1e-12);
  EXPECT_NEAR(in.visualIntegration, 0.0, 1e-12);
  EXPECT_NEAR(in.signage, 72.0, 1e-12);
}

int main()
{
  TestNormalizeClamped();
  TestMidRangeScore();
  TestScoreAlwaysInRange();
  TestMonotonicInErrors();
  TestBandsAndGrades();
  TestPercentInputs();
  TestPriorities();
  TestBenchmarks();
  TestWeightSumDiagnostic();
  TestCompareDesigns();
  TestInputsFromAnalyses();
  return FinishTests("wayfinder_wes_tests");
}
