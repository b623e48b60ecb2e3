#ifndef FQBENCH_TRIALRUNNER_HPP
#define FQBENCH_TRIALRUNNER_HPP
/**
 * @file TrialRunner.hpp
 * @brief Runs every registered tool against one staged scenario through a TimingEngine.
 *
 * Per tool:
 *  - before each run: scratch dirs (ref/, tmp/) removed, then the staging preparation
 *  - stdout+stderr to <outputs>/<tool>.txt, truncated per run
 *  - after the last run: scratch dirs removed again
 *
 * A failing tool is recorded in its own TrialResult and never affects the others.
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "src/harness/inc/CacheState.hpp"
#include "src/harness/inc/HarnessConfig.hpp"
#include "src/harness/inc/Scenario.hpp"
#include "src/harness/inc/TimingEngine.hpp"
#include "src/harness/inc/TimingStats.hpp"
#include "src/harness/inc/ToolRegistry.hpp"

namespace fqbench {
namespace harness {

/* ------------------------------ TrialResult ------------------------------ */

struct TrialResult {
  TestScenario scenario;
  std::string toolId;
  Stats stats{};                      ///< Seconds
  int exitCode = 0;                   ///< First non-zero measured exit code
  std::filesystem::path outputPath;   ///< Captured output of the last run
  std::uintmax_t outputBytes = 0;     ///< Size of the captured output
  std::string error;                  ///< Engine-level failure
  std::string engine;                 ///< Engine that measured the trial
  int warmup = 0;
  int runs = 0;

  bool ok() const noexcept { return error.empty() && exitCode == 0; }

  /** @brief "OK", "FAIL(<code>)", "TIMEOUT" or "ERROR". */
  std::string statusText() const;
};

/* ------------------------------- TrialPlan ------------------------------- */

/** @brief Warmup and run counts for one cache state. */
struct TrialPlan {
  int warmup = 0;
  int runs = COLD_RUNS;
  bool minRuns = false; ///< runs is a minimum the engine may exceed
};

/** @brief Hot: configured warmup/runs (minimum). Cold states: no warmup, COLD_RUNS exactly. */
TrialPlan trialPlanFor(CacheState state, const HarnessConfig& cfg);

/* ------------------------------ TrialRunner ------------------------------ */

class TrialRunner {
public:
  /**
   * @param engine     Timing engine used for every tool.
   * @param workDir    Working directory of every tool run; scratch dirs are relative to it.
   * @param timeoutSec Per-run timeout (0 = none).
   */
  TrialRunner(TimingEngine& engine, std::filesystem::path workDir, int timeoutSec = 0)
      : engine_(engine), workDir_(std::move(workDir)), timeoutSec_(timeoutSec) {}

  /**
   * @brief Measure every tool of the registry, in registry order.
   * @param outputsDir Created when missing; receives <tool>.txt per tool.
   * @throws PersistenceError when outputsDir cannot be created.
   */
  std::vector<TrialResult> runScenario(const ToolRegistry& registry, const StagedInput& staged,
                                       const std::filesystem::path& outputsDir,
                                       const TrialPlan& plan);

  /** @brief Scratch directories tools may leave behind: ref, tmp. */
  static std::vector<std::filesystem::path> scratchDirs();

  /** @brief Per-run preparation: scratch removal followed by the staging step. */
  static RunPreparation prepareFor(const StagedInput& staged);

  /** @brief Post-tool step: scratch dir removal. */
  static RunPreparation concludeStep();

private:
  TrialResult runTool(const ToolAdapter& tool, const StagedInput& staged,
                      const std::filesystem::path& outputsDir, const TrialPlan& plan);

  TimingEngine& engine_;
  std::filesystem::path workDir_;
  int timeoutSec_;
};

} // namespace harness
} // namespace fqbench

#endif // FQBENCH_TRIALRUNNER_HPP
