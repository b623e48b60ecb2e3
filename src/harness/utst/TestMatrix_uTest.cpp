/**
 * @file TestMatrix_uTest.cpp
 * @brief Unit tests for fqbench::harness::TestMatrixBuilder and the scenario helpers.
 *
 * Tests size labels, canonical file names, ordering, discovery and on-demand generation.
 */

#include "src/harness/inc/TestMatrix.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

#include "src/harness/inc/HarnessErrors.hpp"
#include "src/harness/utst/helpers/TestHelpers.hpp"

using fqbench::harness::CacheState;
using fqbench::harness::InputFormat;
using fqbench::harness::inputFileName;
using fqbench::harness::MatrixRequest;
using fqbench::harness::parseSizeLabel;
using fqbench::harness::readCountForLabel;
using fqbench::harness::SetupError;
using fqbench::harness::standardSizeLabels;
using fqbench::harness::TestMatrixBuilder;
using fqbench::harness::TestScenario;
using fqbench::harness::test::FakeGenerator;
using fqbench::harness::test::makeInputs;
using fqbench::harness::test::TempDir;
using fqbench::harness::test::writeFile;

namespace {

const std::vector<InputFormat> ALL_FMT{InputFormat::Raw, InputFormat::Gzip, InputFormat::Bgzip};

MatrixRequest request(const TempDir& dir, std::vector<std::string> sizes,
                      std::vector<InputFormat> formats, std::vector<CacheState> states) {
  MatrixRequest req;
  req.sizes = std::move(sizes);
  req.dataDir = dir.path();
  req.formats = std::move(formats);
  req.states = std::move(states);
  return req;
}

} // namespace

/* ----------------------------- Label Tests ----------------------------- */

/** @test Size labels map to read counts. */
TEST(TestMatrixTest, SizeLabels) {
  EXPECT_EQ(readCountForLabel("0.1m"), 100000u);
  EXPECT_EQ(readCountForLabel("1m"), 1000000u);
  EXPECT_EQ(readCountForLabel("70m"), 70000000u);
  EXPECT_FALSE(parseSizeLabel("10").has_value());
  EXPECT_FALSE(parseSizeLabel("1.5mm").has_value());
}

/** @test Out-of-range labels yield no value and no read count. */
TEST(TestMatrixTest, SizeLabelsOutOfRange) {
  EXPECT_FALSE(parseSizeLabel(std::string(400, '9') + "m").has_value());
  EXPECT_TRUE(parseSizeLabel("20000000000000m").has_value());
  EXPECT_EQ(readCountForLabel("20000000000000m"), 0u);
  EXPECT_EQ(readCountForLabel("18000000000000m"), 18000000000000000000u);
}

/** @test Canonical file names per format. */
TEST(TestMatrixTest, CanonicalFileNames) {
  EXPECT_EQ(inputFileName("1m", InputFormat::Raw), "1m.fastq");
  EXPECT_EQ(inputFileName("1m", InputFormat::Gzip), "1m.fastq.gz");
  EXPECT_EQ(inputFileName("1m", InputFormat::Bgzip), "1m.fastq_bgzipped.gz");
}

/** @test Scenario result stems and labels. */
TEST(TestMatrixTest, ScenarioNames) {
  const TestScenario S{"1m", InputFormat::Gzip, CacheState::Cold};
  EXPECT_EQ(S.resultStem(), "cold_gz");
  EXPECT_EQ(S.label(), "1m/gzip/cold");

  const TestScenario R{"0.1m", InputFormat::Bgzip, CacheState::ReallyCold};
  EXPECT_EQ(R.resultStem(), "really_cold_bgz");
}

/* ----------------------------- Expansion Tests ----------------------------- */

/** @test {1m} x {raw,gzip} x {hot,cold} yields exactly four scenarios in canonical order. */
TEST(TestMatrixTest, ExpandTwoByTwo) {
  const auto OUT = TestMatrixBuilder::expand({"1m"}, {InputFormat::Gzip, InputFormat::Raw},
                                             {CacheState::Cold, CacheState::Hot});

  const std::vector<TestScenario> EXPECTED{
      {"1m", InputFormat::Raw, CacheState::Hot},
      {"1m", InputFormat::Raw, CacheState::Cold},
      {"1m", InputFormat::Gzip, CacheState::Hot},
      {"1m", InputFormat::Gzip, CacheState::Cold},
  };
  EXPECT_EQ(OUT, EXPECTED);
}

/** @test Sizes are ordered numerically, not lexically, and duplicates removed. */
TEST(TestMatrixTest, SizesSortNumerically) {
  std::vector<std::string> sizes{"10m", "0.5m", "1m", "0.1m", "1m"};
  TestMatrixBuilder::sortSizes(sizes);

  EXPECT_EQ(sizes, (std::vector<std::string>{"0.1m", "0.5m", "1m", "10m"}));
}

/** @test Full matrix: one scenario per (size, format, state), no duplicates. */
TEST(TestMatrixTest, FullMatrixHasNoDuplicates) {
  const auto OUT = TestMatrixBuilder::expand(
      {"0.1m", "1m"}, ALL_FMT, {CacheState::Hot, CacheState::Cold, CacheState::ReallyCold});

  ASSERT_EQ(OUT.size(), 18u);
  std::set<std::string> labels;
  for (const auto& s : OUT) {
    labels.insert(s.label());
  }
  EXPECT_EQ(labels.size(), OUT.size());
  EXPECT_EQ(OUT.front().sizeLabel, "0.1m");
  EXPECT_EQ(OUT.back().sizeLabel, "1m");
}

/* ----------------------------- Build Tests ----------------------------- */

/** @test Pre-existing inputs trigger zero generator calls. */
TEST(TestMatrixTest, ExistingInputsNoGeneration) {
  TempDir dir;
  makeInputs(dir.path(), "0.1m", ALL_FMT);
  FakeGenerator gen;
  TestMatrixBuilder builder(gen);

  const auto PLAN = builder.build(request(dir, {"0.1m"}, ALL_FMT, {CacheState::Hot}));

  EXPECT_EQ(gen.calls, 0);
  EXPECT_EQ(PLAN.generationCalls, 0);
  EXPECT_EQ(PLAN.scenarios.size(), 3u);
  EXPECT_TRUE(PLAN.failures.empty());
}

/** @test Missing formats are generated once, for that size only. */
TEST(TestMatrixTest, MissingFormatGenerated) {
  TempDir dir;
  makeInputs(dir.path(), "0.1m", {InputFormat::Raw});
  makeInputs(dir.path(), "1m", ALL_FMT);
  FakeGenerator gen;
  TestMatrixBuilder builder(gen);

  const auto PLAN = builder.build(request(dir, {"1m", "0.1m"}, ALL_FMT, {CacheState::Hot}));

  ASSERT_EQ(gen.calls, 1);
  EXPECT_EQ(gen.requests[0].sizeLabel, "0.1m");
  EXPECT_EQ(gen.requests[0].formats,
            (std::vector<InputFormat>{InputFormat::Gzip, InputFormat::Bgzip}));
  EXPECT_EQ(PLAN.sizes, (std::vector<std::string>{"0.1m", "1m"}));
  EXPECT_EQ(PLAN.scenarios.size(), 6u);
}

/** @test A failed generation drops only that size and is reported. */
TEST(TestMatrixTest, GenerationFailureDropsSize) {
  TempDir dir;
  makeInputs(dir.path(), "0.1m", ALL_FMT);
  FakeGenerator gen;
  gen.failLabels.insert("10m");
  TestMatrixBuilder builder(gen);

  const auto PLAN =
      builder.build(request(dir, {"0.1m", "10m"}, ALL_FMT, {CacheState::Hot, CacheState::Cold}));

  EXPECT_EQ(PLAN.sizes, (std::vector<std::string>{"0.1m"}));
  ASSERT_EQ(PLAN.failures.size(), 1u);
  EXPECT_EQ(PLAN.failures[0].sizeLabel, "10m");
  EXPECT_NE(PLAN.failures[0].reason.find("refused"), std::string::npos);
  EXPECT_EQ(PLAN.scenarios.size(), 6u);
  for (const auto& s : PLAN.scenarios) {
    EXPECT_EQ(s.sizeLabel, "0.1m");
  }
}

/** @test Malformed explicit labels are a setup error. */
TEST(TestMatrixTest, InvalidExplicitLabelThrows) {
  TempDir dir;
  FakeGenerator gen;
  TestMatrixBuilder builder(gen);

  EXPECT_THROW((void)builder.build(request(dir, {"1m", "big"}, ALL_FMT, {CacheState::Hot})),
               SetupError);
  EXPECT_EQ(gen.calls, 0);
}

/** @test Auto mode discovers <label>.fastq files and ignores other names. */
TEST(TestMatrixTest, AutoDiscovery) {
  TempDir dir;
  makeInputs(dir.path(), "10m", {InputFormat::Raw});
  makeInputs(dir.path(), "0.5m", {InputFormat::Raw});
  writeFile(dir / "sample.fastq", "@r\nA\n+\nI\n");
  writeFile(dir / "2m.fastq.gz", "x");

  EXPECT_EQ(TestMatrixBuilder::discoverSizes(dir.path()),
            (std::vector<std::string>{"0.5m", "10m"}));

  FakeGenerator gen;
  TestMatrixBuilder builder(gen);
  const auto PLAN = builder.build(request(dir, {}, {InputFormat::Raw}, {CacheState::Hot}));

  EXPECT_EQ(gen.calls, 0);
  EXPECT_EQ(PLAN.sizes, (std::vector<std::string>{"0.5m", "10m"}));
}

/** @test Auto mode with an empty data directory generates the standard sizes. */
TEST(TestMatrixTest, AutoModeGeneratesStandardSet) {
  TempDir dir;
  FakeGenerator gen;
  TestMatrixBuilder builder(gen);

  const auto PLAN = builder.build(request(dir, {}, {InputFormat::Raw}, {CacheState::Hot}));

  EXPECT_EQ(gen.calls, static_cast<int>(standardSizeLabels().size()));
  EXPECT_EQ(PLAN.sizes, standardSizeLabels());
  EXPECT_EQ(PLAN.scenarios.size(), standardSizeLabels().size());
}
