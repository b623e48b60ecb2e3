/**
 * @file TrialRunner.cpp
 * @brief Per-tool measurement loop.
 */

#include "src/harness/inc/TrialRunner.hpp"

#include <cstdio>
#include <exception>
#include <system_error>

#include "src/harness/inc/HarnessErrors.hpp"
#include "src/harness/inc/Subprocess.hpp"

namespace fqbench {
namespace harness {

namespace fs = std::filesystem;

/* ------------------------------ TrialResult ------------------------------ */

std::string TrialResult::statusText() const {
  if (!error.empty()) {
    return "ERROR";
  }
  if (exitCode == EXIT_TIMEOUT) {
    return "TIMEOUT";
  }
  if (exitCode != 0) {
    return "FAIL(" + std::to_string(exitCode) + ")";
  }
  return "OK";
}

/* ------------------------------- TrialPlan ------------------------------- */

TrialPlan trialPlanFor(CacheState state, const HarnessConfig& cfg) {
  TrialPlan plan;
  if (state == CacheState::Hot) {
    plan.warmup = cfg.warmup;
    plan.runs = cfg.runs;
    plan.minRuns = true;
  } else {
    plan.warmup = 0;
    plan.runs = COLD_RUNS;
    plan.minRuns = false;
  }
  return plan;
}

/* ------------------------------ TrialRunner ------------------------------ */

std::vector<fs::path> TrialRunner::scratchDirs() { return {"ref", "tmp"}; }

RunPreparation TrialRunner::prepareFor(const StagedInput& staged) {
  RunPreparation prep = staged.perRun();
  const auto SCRATCH = scratchDirs();
  prep.removePaths.insert(prep.removePaths.begin(), SCRATCH.begin(), SCRATCH.end());
  return prep;
}

RunPreparation TrialRunner::concludeStep() {
  RunPreparation prep;
  prep.removePaths = scratchDirs();
  return prep;
}

std::vector<TrialResult> TrialRunner::runScenario(const ToolRegistry& registry,
                                                  const StagedInput& staged,
                                                  const fs::path& outputsDir,
                                                  const TrialPlan& plan) {
  std::error_code ec;
  fs::create_directories(outputsDir, ec);
  if (ec) {
    throw PersistenceError("cannot create " + outputsDir.string() + ": " + ec.message());
  }

  std::vector<TrialResult> results;
  results.reserve(registry.size());
  for (const auto& [id, tool] : registry) {
    std::printf("  Benchmarking %s (%s)...\n", id.c_str(),
                staged.status().scenario.label().c_str());
    std::fflush(stdout);

    TrialResult r = runTool(tool, staged, outputsDir, plan);
    if (!r.ok()) {
      std::fprintf(stderr, "  [WARN] %s: %s%s%s\n", id.c_str(), r.statusText().c_str(),
                   r.error.empty() ? "" : " - ", r.error.c_str());
    }
    results.push_back(std::move(r));
  }
  return results;
}

TrialResult TrialRunner::runTool(const ToolAdapter& tool, const StagedInput& staged,
                                 const fs::path& outputsDir, const TrialPlan& plan) {
  TrialResult r;
  r.scenario = staged.status().scenario;
  r.toolId = tool.identifier();
  r.outputPath = outputsDir / (tool.identifier() + ".txt");
  r.engine = engine_.name();
  r.warmup = plan.warmup;
  r.runs = plan.runs;

  TimingRequest req;
  req.name = tool.identifier();
  req.argv = tool.argv(staged.path());
  req.capturePath = r.outputPath;
  req.workDir = workDir_;
  req.warmup = plan.warmup;
  req.runs = plan.runs;
  req.minRuns = plan.minRuns;
  req.prepare = prepareFor(staged);
  req.conclude = concludeStep();
  req.timeoutSec = timeoutSec_;

  try {
    const TimingOutcome OUT = engine_.measure(req);
    r.stats = OUT.stats;
    r.exitCode = OUT.exitCode;
    r.error = OUT.error;
  } catch (const std::exception& e) {
    r.error = std::string(engine_.name()) + " engine failed: " + e.what();
  }

  std::error_code ec;
  const auto BYTES = fs::file_size(r.outputPath, ec);
  r.outputBytes = ec ? 0 : BYTES;
  return r;
}

} // namespace harness
} // namespace fqbench
