/**
 * @file ResultWriter_uTest.cpp
 * @brief Unit tests for fqbench::harness::ResultWriter, ResultCsv and the run record.
 *
 * Tests the per-scenario file set, JSON and markdown content, the cache-status sidecar, CSV rows
 * and the run summary.
 */

#include "src/harness/inc/ResultWriter.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <json/json.h>

#include "src/harness/inc/HarnessErrors.hpp"
#include "src/harness/inc/HarnessUtils.hpp"
#include "src/harness/inc/ResultCsv.hpp"
#include "src/harness/utst/helpers/TestHelpers.hpp"

namespace fs = std::filesystem;

using fqbench::harness::Achieved;
using fqbench::harness::CacheMethod;
using fqbench::harness::CacheState;
using fqbench::harness::CacheStatus;
using fqbench::harness::captureHostname;
using fqbench::harness::capturePlatform;
using fqbench::harness::csvField;
using fqbench::harness::Degraded;
using fqbench::harness::InputFormat;
using fqbench::harness::PersistenceError;
using fqbench::harness::ResultWriter;
using fqbench::harness::RunRecord;
using fqbench::harness::ScenarioRecord;
using fqbench::harness::SkippedScenario;
using fqbench::harness::slurp;
using fqbench::harness::TestScenario;
using fqbench::harness::TrialResult;
using fqbench::harness::writeCsvHeader;
using fqbench::harness::writeCsvRow;
using fqbench::harness::test::TempDir;
using fqbench::harness::test::writeFile;

namespace {

CacheStatus statusFor(const TestScenario& s) {
  CacheStatus st;
  st.scenario = s;
  st.timestamp = "2026-01-01T00:00:00Z";
  st.originalFile = "/data/test-data/1m.fastq";
  st.stagedFile = st.originalFile;
  if (s.cacheState == CacheState::Hot) {
    st.outcome = Achieved{CacheMethod::RamCopy};
    st.stagedFile = "/dev/shm/fqbench_hot_raw_1m_42_1m.fastq";
  } else {
    st.outcome = Achieved{CacheMethod::KernelEviction};
    st.evictor = "vmtouch";
    st.residentAfter = 0.0;
  }
  return st;
}

TrialResult trial(const TestScenario& s, const std::string& tool, double mean, int exitCode = 0) {
  TrialResult r;
  r.scenario = s;
  r.toolId = tool;
  r.engine = "builtin";
  r.warmup = 0;
  r.runs = 3;
  r.stats.mean = mean;
  r.stats.median = mean;
  r.stats.min = mean;
  r.stats.max = mean;
  r.stats.samples = 3;
  r.exitCode = exitCode;
  r.outputPath = "/results/" + tool + ".txt";
  r.outputBytes = 8;
  return r;
}

Json::Value parseJson(const std::string& text) {
  Json::CharReaderBuilder rb;
  Json::Value root;
  std::string errs;
  std::istringstream in(text);
  EXPECT_TRUE(Json::parseFromStream(rb, in, &root, &errs)) << errs;
  return root;
}

std::size_t countLines(const std::string& s) {
  std::size_t n = 0;
  for (const char CH : s) {
    if (CH == '\n') {
      ++n;
    }
  }
  return n;
}

} // namespace

/* ----------------------------- Layout Tests ----------------------------- */

/** @test Run directory and per-scenario paths. */
TEST(ResultWriterTest, PathLayout) {
  TempDir dir;
  ResultWriter writer(dir.path(), "20260101_120000");
  const TestScenario S{"1m", InputFormat::Gzip, CacheState::Cold};

  EXPECT_EQ(writer.runDir(), dir / "benchmark_20260101_120000");
  EXPECT_TRUE(fs::is_directory(writer.runDir()));
  EXPECT_EQ(writer.scenarioFile(S, ".json"), writer.runDir() / "1m" / "cold_gz.json");
  EXPECT_EQ(writer.outputsDir(S), writer.runDir() / "1m" / "cold_gz_outputs");
}

/** @test Hot scenarios get json and md only; cold ones add the cache-status sidecar. */
TEST(ResultWriterTest, ScenarioFileSet) {
  TempDir dir;
  ResultWriter writer(dir.path(), "stamp");
  const TestScenario HOT{"1m", InputFormat::Raw, CacheState::Hot};
  const TestScenario COLD{"1m", InputFormat::Raw, CacheState::Cold};

  writer.writeScenario(statusFor(HOT), {trial(HOT, "seqtk", 0.5)});
  writer.writeScenario(statusFor(COLD), {trial(COLD, "seqtk", 0.9)});

  EXPECT_TRUE(fs::exists(writer.scenarioFile(HOT, ".json")));
  EXPECT_TRUE(fs::exists(writer.scenarioFile(HOT, ".md")));
  EXPECT_FALSE(fs::exists(writer.scenarioFile(HOT, "_cache_status.txt")));
  EXPECT_TRUE(fs::exists(writer.scenarioFile(COLD, "_cache_status.txt")));

  const std::string SIDECAR = slurp(writer.scenarioFile(COLD, "_cache_status.txt"));
  EXPECT_NE(SIDECAR.find("cache_method=kernel_eviction\n"), std::string::npos);
  EXPECT_NE(SIDECAR.find("evictor=vmtouch\n"), std::string::npos);
}

/* ----------------------------- Content Tests ----------------------------- */

/** @test Scenario JSON carries the scenario, cache status and per-tool statistics. */
TEST(ResultWriterTest, ScenarioJsonContent) {
  const TestScenario S{"0.1m", InputFormat::Bgzip, CacheState::Cold};
  CacheStatus st = statusFor(S);
  st.outcome = Degraded{CacheMethod::RamCopyFallback, "vmtouch not installed"};

  const Json::Value ROOT = parseJson(ResultWriter::toJsonString(
      ResultWriter::scenarioJson(st, {trial(S, "fast", 0.2), trial(S, "bad", 0.0, 1)})));

  EXPECT_EQ(ROOT["scenario"]["size"].asString(), "0.1m");
  EXPECT_EQ(ROOT["scenario"]["reads"].asUInt64(), 100000u);
  EXPECT_EQ(ROOT["scenario"]["format"].asString(), "bgzip");
  EXPECT_EQ(ROOT["scenario"]["cache_state"].asString(), "cold");
  EXPECT_EQ(ROOT["cache_status"]["method"].asString(), "ram_copy_fallback");
  EXPECT_TRUE(ROOT["cache_status"]["degraded"].asBool());
  EXPECT_EQ(ROOT["cache_status"]["reason"].asString(), "vmtouch not installed");

  ASSERT_EQ(ROOT["results"].size(), 2u);
  EXPECT_EQ(ROOT["results"][0]["command"].asString(), "fast");
  EXPECT_DOUBLE_EQ(ROOT["results"][0]["mean"].asDouble(), 0.2);
  EXPECT_EQ(ROOT["results"][0]["status"].asString(), "OK");
  EXPECT_EQ(ROOT["results"][1]["exit_code"].asInt(), 1);
  EXPECT_EQ(ROOT["results"][1]["status"].asString(), "FAIL(1)");
}

/** @test Markdown table is relative to the fastest successful tool. */
TEST(ResultWriterTest, MarkdownRelativeColumn) {
  const TestScenario S{"1m", InputFormat::Raw, CacheState::Hot};
  const std::string MD = ResultWriter::scenarioMarkdown(
      statusFor(S), {trial(S, "slow", 1.0), trial(S, "fast", 0.5), trial(S, "bad", 0.1, 2)});

  EXPECT_NE(MD.find("## 1m/raw/hot"), std::string::npos);
  EXPECT_NE(MD.find("| `slow` | 1.000 ± 0.000 | 1.000 | 1.000 | 2.00 | OK |"), std::string::npos);
  EXPECT_NE(MD.find("| `fast` | 0.500 ± 0.000 | 0.500 | 0.500 | 1.00 | OK |"), std::string::npos);
  EXPECT_NE(MD.find("| - | FAIL(2) |"), std::string::npos);
}

/** @test Sidecar names the RAM file only when it differs from the original. */
TEST(ResultWriterTest, CacheStatusText) {
  const TestScenario S{"1m", InputFormat::Raw, CacheState::Cold};
  CacheStatus st = statusFor(S);
  EXPECT_EQ(ResultWriter::cacheStatusText(st).find("ram_file="), std::string::npos);

  st.outcome = Degraded{CacheMethod::RamCopyFallback, "pages still resident"};
  st.stagedFile = "/dev/shm/copy.fastq";
  st.residentAfter = 1.0;
  const std::string TEXT = ResultWriter::cacheStatusText(st);
  EXPECT_NE(TEXT.find("ram_file=/dev/shm/copy.fastq\n"), std::string::npos);
  EXPECT_NE(TEXT.find("resident_after=1.0000\n"), std::string::npos);
  EXPECT_NE(TEXT.find("degraded_reason=pages still resident\n"), std::string::npos);
}

/* ----------------------------- CSV Tests ----------------------------- */

/** @test Header once per run; one row per trial across scenarios. */
TEST(ResultWriterTest, CsvAppendsAcrossScenarios) {
  TempDir dir;
  ResultWriter writer(dir.path(), "stamp");
  const TestScenario A{"1m", InputFormat::Raw, CacheState::Hot};
  const TestScenario B{"1m", InputFormat::Gzip, CacheState::Hot};

  writer.writeScenario(statusFor(A), {trial(A, "x", 0.1), trial(A, "y", 0.2)});
  writer.writeScenario(statusFor(B), {trial(B, "x", 0.3)});

  const std::string CSV = slurp(writer.runDir() / "results.csv");
  EXPECT_EQ(countLines(CSV), 4u);
  EXPECT_EQ(CSV.rfind("size,format,cacheState,tool", 0), 0u);
  EXPECT_NE(CSV.find("\n1m,gzip,hot,x,builtin,"), std::string::npos);
}

/** @test Every results.csv row carries timestamp, hostname and platform columns. */
TEST(ResultWriterTest, CsvCarriesHostMetadata) {
  TempDir dir;
  ResultWriter writer(dir.path(), "stamp");
  const TestScenario S{"1m", InputFormat::Raw, CacheState::Hot};

  writer.writeScenario(statusFor(S), {trial(S, "x", 0.1)});

  const std::string CSV = slurp(writer.runDir() / "results.csv");
  const std::string HEADER = CSV.substr(0, CSV.find('\n'));
  EXPECT_EQ(HEADER.substr(HEADER.size() - 28), ",timestamp,hostname,platform");
  const std::string HOST_TAIL =
      "," + csvField(captureHostname()) + "," + capturePlatform() + "\n";
  ASSERT_GE(CSV.size(), HOST_TAIL.size());
  EXPECT_EQ(CSV.substr(CSV.size() - HOST_TAIL.size()), HOST_TAIL);
}

/** @test Fields with separators are quoted; metadata columns are optional. */
TEST(ResultWriterTest, CsvQuotingAndMetadata) {
  EXPECT_EQ(csvField("plain"), "plain");
  EXPECT_EQ(csvField("a,b"), "\"a,b\"");
  EXPECT_EQ(csvField("say \"hi\""), "\"say \"\"hi\"\"\"");

  std::ostringstream csv;
  writeCsvHeader(csv, true);
  const TestScenario S{"1m", InputFormat::Raw, CacheState::Hot};
  writeCsvRow(csv, trial(S, "t", 0.1), "ram_copy", false, {"2026-01-01", "host", "x86_64"});

  const std::string OUT = csv.str();
  EXPECT_NE(OUT.find(",timestamp,hostname,platform\n"), std::string::npos);
  EXPECT_NE(OUT.find(",ram_copy,0,2026-01-01,host,x86_64\n"), std::string::npos);
}

/* ----------------------------- Summary Tests ----------------------------- */

/** @test Summary lists executed and skipped scenarios, failures and the result tree. */
TEST(ResultWriterTest, SummaryContent) {
  TempDir dir;
  ResultWriter writer(dir.path(), "stamp");
  const TestScenario HOT{"1m", InputFormat::Raw, CacheState::Hot};
  const TestScenario COLD{"1m", InputFormat::Raw, CacheState::Cold};

  RunRecord rec;
  rec.config.projectRoot = dir.path().string();
  rec.config.skipCompression = true;
  rec.engine = "builtin";
  rec.evictor = "fadvise";
  rec.tools = {"bad", "good"};
  rec.sizes = {"1m"};
  const auto RESULTS = std::vector<TrialResult>{trial(HOT, "bad", 0.1, 5), trial(HOT, "good", 0.2)};
  writer.writeScenario(statusFor(HOT), RESULTS);
  rec.executed.push_back(ScenarioRecord{statusFor(HOT), RESULTS});
  rec.skipped.push_back(SkippedScenario{COLD, "copy failed"});
  rec.generationFailures.push_back({"10m", "bbtools missing"});

  writer.writeSummary(rec);

  const std::string TEXT = slurp(writer.runDir() / "SUMMARY.txt");
  EXPECT_NE(TEXT.find("FASTQ Parser Benchmark Summary"), std::string::npos);
  EXPECT_NE(TEXT.find("Timing engine: builtin"), std::string::npos);
  EXPECT_NE(TEXT.find("Tools (2): bad good"), std::string::npos);
  EXPECT_NE(TEXT.find("Scenarios executed (1):\n  - 1m/raw/hot [ram_copy]"), std::string::npos);
  EXPECT_NE(TEXT.find("  - 1m/raw/cold: copy failed"), std::string::npos);
  EXPECT_NE(TEXT.find("  - 10m: bbtools missing"), std::string::npos);
  EXPECT_NE(TEXT.find("  - bad (1m/raw/hot): FAIL(5)"), std::string::npos);
  EXPECT_EQ(TEXT.find("good (1m/raw/hot)"), std::string::npos);
  // results.csv, hot_raw.json, hot_raw.md, SUMMARY.txt
  EXPECT_NE(TEXT.find("Total result files: 4"), std::string::npos);
}

/* ----------------------------- Failure Tests ----------------------------- */

/** @test A run directory that cannot be created is a persistence error. */
TEST(ResultWriterTest, UncreatableRunDirThrows) {
  TempDir dir;
  writeFile(dir / "blocker", "regular file");

  EXPECT_THROW(ResultWriter(dir / "blocker", "stamp"), PersistenceError);
}

/** @test A scenario directory that cannot be created is a persistence error. */
TEST(ResultWriterTest, UnwritableScenarioThrows) {
  TempDir dir;
  ResultWriter writer(dir.path(), "stamp");
  const TestScenario S{"1m", InputFormat::Raw, CacheState::Hot};
  writeFile(writer.runDir() / "1m", "blocks the size directory");

  EXPECT_THROW(writer.writeScenario(statusFor(S), {trial(S, "t", 0.1)}), PersistenceError);
}
