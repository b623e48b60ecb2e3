#ifndef FQBENCH_RESULTWRITER_HPP
#define FQBENCH_RESULTWRITER_HPP
/**
 * @file ResultWriter.hpp
 * @brief Persistence of one benchmark run under benchmark_results/benchmark_<stamp>/.
 *
 * Layout:
 *   environment.json                        host snapshot, once per run
 *   results.csv                             one row per trial, appended per scenario
 *   <size>/<state>_<fmt>.json               scenario, cache status, per-tool statistics
 *   <size>/<state>_<fmt>.md                 human-readable table
 *   <size>/<state>_<fmt>_cache_status.txt   cold and really_cold only
 *   <size>/<state>_<fmt>_outputs/<tool>.txt captured tool output (written by the runner)
 *   SUMMARY.txt                             run summary, at the end
 *
 * Every write failure raises PersistenceError. Files already written stay in place.
 */

#include <filesystem>
#include <string>
#include <vector>

#include <json/json.h>

#include "src/harness/inc/CacheState.hpp"
#include "src/harness/inc/HarnessConfig.hpp"
#include "src/harness/inc/Scenario.hpp"
#include "src/harness/inc/TestMatrix.hpp"
#include "src/harness/inc/TrialRunner.hpp"

namespace fqbench {
namespace harness {

/* ------------------------------- RunRecord ------------------------------- */

struct SkippedScenario {
  TestScenario scenario;
  std::string reason;
};

struct ScenarioRecord {
  CacheStatus status;
  std::vector<TrialResult> results;
};

/** @brief Everything the run summary needs. */
struct RunRecord {
  HarnessConfig config;
  std::string engine;
  std::string evictor;
  std::vector<std::string> tools;
  std::vector<std::string> sizes;
  std::vector<ScenarioRecord> executed;
  std::vector<SkippedScenario> skipped;
  std::vector<GenerationFailure> generationFailures;

  /** @brief "<tool> (<scenario>): <status>" for every trial that did not succeed. */
  std::vector<std::string> failingTrials() const;
};

/* ------------------------------ ResultWriter ------------------------------ */

class ResultWriter {
public:
  /**
   * @brief Create `<resultsDir>/benchmark_<stamp>/`.
   * @throws PersistenceError
   */
  ResultWriter(const std::filesystem::path& resultsDir, const std::string& stamp);

  const std::filesystem::path& runDir() const noexcept { return runDir_; }

  std::filesystem::path scenarioDir(const TestScenario& s) const { return runDir_ / s.sizeLabel; }
  std::filesystem::path scenarioFile(const TestScenario& s, const std::string& suffix) const {
    return scenarioDir(s) / (s.resultStem() + suffix);
  }
  std::filesystem::path outputsDir(const TestScenario& s) const {
    return scenarioFile(s, "_outputs");
  }

  /** @throws PersistenceError */
  void writeEnvironment(const Json::Value& env);

  /**
   * @brief Scenario JSON, markdown, cache sidecar (cold states) and CSV rows.
   * @throws PersistenceError
   */
  void writeScenario(const CacheStatus& status, const std::vector<TrialResult>& results);

  /** @throws PersistenceError */
  void writeSummary(const RunRecord& record);

  /* ------------------------------ Rendering ------------------------------ */

  /** @brief Host snapshot: os, kernel, cpu, ram, storage, tool versions, sudo, timestamp. */
  static Json::Value captureEnvironment(const HarnessConfig& cfg, const std::string& engine);

  static Json::Value scenarioJson(const CacheStatus& status,
                                  const std::vector<TrialResult>& results);
  static std::string scenarioMarkdown(const CacheStatus& status,
                                      const std::vector<TrialResult>& results);
  static std::string cacheStatusText(const CacheStatus& status);

  /** @brief JSON document with two-space indentation. */
  static std::string toJsonString(const Json::Value& v);

private:
  void writeFile(const std::filesystem::path& path, const std::string& content) const;
  void ensureDir(const std::filesystem::path& dir) const;
  void appendCsv(const CacheStatus& status, const std::vector<TrialResult>& results);

  std::filesystem::path runDir_;
  bool csvHeaderWritten_ = false;
};

} // namespace harness
} // namespace fqbench

#endif // FQBENCH_RESULTWRITER_HPP
