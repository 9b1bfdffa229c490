#include "TestSupport.hpp"

#include <cmath>
#include <optional>

#include "visibility/isovist.hpp"
#include "visibility/vga.hpp"

using namespace wayfinder;

static void TestCastRay()
{
  const Walls box = MakeBox(0, 0, 10, 10);
  EXPECT_NEAR(castRay({5, 5}, 0.0, box, 100.0), 5.0, 1e-9);
  EXPECT_NEAR(castRay({2, 5}, CV_PI, box, 100.0), 2.0, 1e-9);
  EXPECT_NEAR(castRay({5, 5}, CV_PI / 4.0, box, 100.0), std::sqrt(50.0), 1e-9);
  // nothing to hit
  EXPECT_NEAR(castRay({0, 0}, 1.0, {}, 42.0), 42.0, 1e-12);
}

static void TestSquareRoomIsovist()
{
  const Walls box = MakeBox(0, 0, 10, 10);
  const IsovistSample iso = computeIsovist({5, 5}, box, 72, 100.0);

  EXPECT_EQ(iso.polygon.size(), static_cast<std::size_t>(72));
  EXPECT_NEAR(iso.area, 100.0, 1e-6);
  EXPECT_NEAR(iso.perimeter, 40.0, 1e-6);
  EXPECT_NEAR(iso.maxRadial, std::sqrt(50.0), 1e-9);
  EXPECT_FALSE(iso.degenerate);
  EXPECT_NEAR(iso.compactness, 4.0 * CV_PI * 100.0 / 1600.0, 1e-6);
}

static void TestOpenFieldApproachesDisc()
{
  const IsovistSample iso = computeIsovist({0, 0}, {}, 72, 10.0);
  const double disc = CV_PI * 100.0;
  EXPECT_TRUE(iso.area < disc);
  EXPECT_TRUE(iso.area > 0.99 * disc);
  EXPECT_NEAR(iso.meanRadial, 10.0, 1e-12);
}

static void TestDegenerateIsovist()
{
  const IsovistSample iso = computeIsovist({1, 1}, {}, 72, 0.0);
  EXPECT_TRUE(iso.degenerate);
  EXPECT_NEAR(iso.area, 0.0, 1e-12);
  EXPECT_NEAR(iso.compactness, 0.0, 1e-12);
}

static void TestGridLattice()
{
  const Walls box = MakeBox(0, 0, 10, 10);
  SamplingConfig cfg;
  cfg.gridSpacing = 1.0;
  const SampleGrid grid = generateSampleGrid(box, {}, cfg);
  EXPECT_EQ(grid.points.size(), static_cast<std::size_t>(100));
  EXPECT_EQ(grid.coarsenings, 0);
  EXPECT_NEAR(grid.points.front().x, 0.5, 1e-9);
  EXPECT_NEAR(grid.points.front().y, 0.5, 1e-9);
  EXPECT_NEAR(grid.points.back().x, 9.5, 1e-9);

  // one sample, in the middle, when the spacing matches the room size
  cfg.gridSpacing = 10.0;
  const SampleGrid single = generateSampleGrid(box, {}, cfg);
  ASSERT_TRUE(single.points.size() == 1);
  EXPECT_NEAR(single.points[0].x, 5.0, 1e-9);
  EXPECT_NEAR(single.points[0].y, 5.0, 1e-9);
}

static void TestGridCoarsening()
{
  const Walls box = MakeBox(0, 0, 10, 10);
  SamplingConfig cfg;
  cfg.gridSpacing = 1.0;
  cfg.maxSamples  = 30;

  const SampleGrid a = generateSampleGrid(box, {}, cfg);
  const SampleGrid b = generateSampleGrid(box, {}, cfg);
  EXPECT_TRUE(a.points.size() <= 30);
  EXPECT_TRUE(a.coarsenings > 0);
  EXPECT_TRUE(a.spacing > cfg.gridSpacing);
  EXPECT_EQ(a.points.size(), b.points.size());
  EXPECT_EQ(a.coarsenings, b.coarsenings);
  for (std::size_t i = 0; i < a.points.size() && i < b.points.size(); ++i)
    EXPECT_TRUE(a.points[i] == b.points[i]);

  // the analyzer reports the coarsening
  VisibilityConfig vcfg;
  vcfg.sampling = cfg;
  const VgaResult res = VisibilityAnalyzer(vcfg).analyze(box);
  EXPECT_TRUE(res.grid.coarsenings > 0);
  EXPECT_FALSE(res.diagnostics.empty());
}

static void TestBoundaryClipsGrid()
{
  // right triangle: half of the lattice falls outside
  const std::vector<cv::Point2d> tri{{0, 0}, {10, 0}, {0, 10}};
  SamplingConfig cfg;
  cfg.gridSpacing = 1.0;
  const SampleGrid grid = generateSampleGrid({}, tri, cfg);
  EXPECT_TRUE(grid.points.size() < 100);
  EXPECT_TRUE(grid.points.size() > 30);
  for (const auto& p : grid.points)
    EXPECT_TRUE(p.x + p.y < 10.0);
}

static void TestDenseGridCoarsensBeforeSampling()
{
  const Walls box = MakeBox(0, 0, 20, 20);
  SamplingConfig cfg;
  cfg.gridSpacing = 0.002;
  cfg.maxSamples  = 2000;

  const SampleGrid grid = generateSampleGrid(box, {}, cfg);
  EXPECT_TRUE(grid.points.size() <= 2000);
  EXPECT_TRUE(grid.points.size() > 1000);
  EXPECT_TRUE(grid.coarsenings > 20);

  // a per-axis count far beyond int range is clamped, then coarsened away
  cfg.gridSpacing = 1e-12;
  const SampleGrid tiny = generateSampleGrid(box, {}, cfg);
  EXPECT_TRUE(tiny.points.size() <= 2000);
  EXPECT_TRUE(tiny.points.size() > 1000);
  EXPECT_TRUE(tiny.spacing > 0.01);
}

static void TestBoundaryOccludes()
{
  // outline only, no interior walls: the room is still 10 x 10
  const std::vector<cv::Point2d> square{{0, 0}, {10, 0}, {10, 10}, {0, 10}};
  VisibilityConfig cfg;
  cfg.sampling.gridSpacing = 10.0;
  const VgaResult room = VisibilityAnalyzer(cfg).analyze({}, square);
  ASSERT_TRUE(room.samples.size() == 1);
  EXPECT_NEAR(room.samples[0].isovist.origin.x, 5.0, 1e-9);
  EXPECT_NEAR(room.samples[0].isovist.area, 100.0, 1e-6);
  EXPECT_NEAR(room.samples[0].isovist.perimeter, 40.0, 1e-6);

  // L-shaped outline of area 64 inside a 10 x 10 box; the missing 6 x 6
  // quadrant stays out of every isovist
  const std::vector<cv::Point2d> ell{{0, 0}, {10, 0}, {10, 4}, {4, 4}, {4, 10}, {0, 10}};
  cfg.sampling.gridSpacing = 2.0;
  const VgaResult lshape = VisibilityAnalyzer(cfg).analyze({}, ell);
  EXPECT_EQ(lshape.samples.size(), static_cast<std::size_t>(16));
  for (const auto& smp : lshape.samples)
    EXPECT_TRUE(smp.isovist.area < 70.0);

  // the arm tips cannot see each other
  std::optional<std::size_t> east, north;
  for (std::size_t i = 0; i < lshape.samples.size(); ++i)
  {
    const auto& o = lshape.samples[i].isovist.origin;
    if (std::abs(o.x - 9.0) < 1e-9 && std::abs(o.y - 3.0) < 1e-9) east = i;
    if (std::abs(o.x - 3.0) < 1e-9 && std::abs(o.y - 9.0) < 1e-9) north = i;
  }
  ASSERT_TRUE(east && north);
  EXPECT_FALSE(lshape.graph.connected(*east, *north));
}

static void TestSamplingGuards()
{
  SamplingConfig cfg;
  EXPECT_GUARD(generateSampleGrid({}, {}, cfg), Guard::EmptySampling);

  // every lattice point lies within the wall tolerance
  SamplingConfig wide = cfg;
  wide.wallEpsilon = 100.0;
  EXPECT_GUARD(generateSampleGrid(MakeBox(0, 0, 4, 4), {}, wide), Guard::EmptySampling);

  SamplingConfig bad = cfg;
  bad.gridSpacing = 0.0;
  EXPECT_GUARD(generateSampleGrid(MakeBox(0, 0, 4, 4), {}, bad), Guard::InvalidConfig);

  EXPECT_GUARD(VisibilityAnalyzer().analyzePoints(MakeBox(0, 0, 4, 4), {}), Guard::EmptySampling);

  VisibilityConfig fewRays;
  fewRays.rayCount = 2;
  EXPECT_GUARD(VisibilityAnalyzer(fewRays).analyze(MakeBox(0, 0, 4, 4)), Guard::InvalidConfig);
}

// box split by a full-height wall at x = 5; four samples left, one right
static VgaResult AnalyzeSplitRoom(bool parallel, Walls* wallsOut = nullptr)
{
  Walls walls = MakeBox(0, 0, 10, 10);
  walls.push_back({{5, 0}, {5, 10}});
  if (wallsOut)
    *wallsOut = walls;

  VisibilityConfig cfg;
  cfg.parallel = parallel;
  return VisibilityAnalyzer(cfg).analyzePoints(walls, {{1, 2}, {2, 5}, {3, 8}, {4, 4}, {7, 5}});
}

static void TestWallBlocksVisibility()
{
  const VgaResult res = AnalyzeSplitRoom(false);
  ASSERT_TRUE(res.samples.size() == 5);

  EXPECT_TRUE(res.graph.connected(0, 1));
  EXPECT_TRUE(res.graph.connected(3, 2));
  EXPECT_FALSE(res.graph.connected(1, 4));
  EXPECT_FALSE(res.graph.connected(4, 0));
  EXPECT_EQ(res.graph.edgeCount(), static_cast<std::size_t>(6));
  EXPECT_EQ(res.samples[4].isovist.visibleNeighbours, static_cast<std::size_t>(0));
  EXPECT_EQ(res.maxVisibleNeighbours, static_cast<std::size_t>(3));

  // symmetric adjacency
  for (std::size_t i = 0; i < res.graph.size(); ++i)
    for (std::size_t j : res.graph.neighbours(i))
      EXPECT_TRUE(res.graph.connected(j, i));

  // each half is 5 x 10
  EXPECT_TRUE(res.samples[4].isovist.area <= 50.0 + 1e-6);
  EXPECT_TRUE(res.samples[4].isovist.area > 45.0);
}

static void TestVisualIntegrationAndBlindSpots()
{
  Walls walls;
  const VgaResult res = AnalyzeSplitRoom(false, &walls);

  for (const auto& s : res.samples)
  {
    EXPECT_TRUE(s.visualIntegration >= 0.0);
    EXPECT_TRUE(s.visualIntegration <= 1.0);
  }
  const double left = res.samples[1].visualIntegration;
  EXPECT_NEAR(left, 0.5 + 0.5 * res.samples[1].isovist.area / 1000.0, 1e-12);
  EXPECT_NEAR(res.samples[4].visualIntegration, 0.5 * res.samples[4].isovist.area / 1000.0, 1e-12);

  // the closed-off sample is the only blind spot
  EXPECT_EQ(res.blindSpots, (std::vector<std::size_t>{4}));
  EXPECT_TRUE(res.samples[4].blindSpot);
  EXPECT_FALSE(res.samples[4].wideVisibility);
  EXPECT_EQ(res.summary.blindSpots, static_cast<std::size_t>(1));
  EXPECT_EQ(res.summary.samples, static_cast<std::size_t>(5));

  // nearest visible sample ignores the closer one behind the wall
  const auto nearest = nearestVisibleSample(res, {6, 1}, walls);
  ASSERT_TRUE(nearest.has_value());
  EXPECT_EQ(*nearest, static_cast<std::size_t>(4));
}

static void TestParallelMatchesSequential()
{
  const VgaResult a = AnalyzeSplitRoom(false);
  const VgaResult b = AnalyzeSplitRoom(true);
  ASSERT_TRUE(a.samples.size() == b.samples.size());
  for (std::size_t i = 0; i < a.samples.size(); ++i)
  {
    EXPECT_EQ(a.samples[i].visualIntegration, b.samples[i].visualIntegration);
    EXPECT_EQ(a.graph.neighbours(i), b.graph.neighbours(i));
  }
}

int main()
{
  TestCastRay();
  TestSquareRoomIsovist();
  TestOpenFieldApproachesDisc();
  TestDegenerateIsovist();
  TestGridLattice();
  TestGridCoarsening();
  TestDenseGridCoarsensBeforeSampling();
  TestBoundaryOccludes();
  TestBoundaryClipsGrid();
  TestSamplingGuards();
  TestWallBlocksVisibility();
  TestVisualIntegrationAndBlindSpots();
  TestParallelMatchesSequential();
  return FinishTests("wayfinder_visibility_tests");
}
