/**
 * @file TimingEngineBuiltin.cpp
 * @brief fork/exec timing engine and the engine factory.
 */

#include "src/harness/inc/TimingEngine.hpp"

#include <cstdio>

#include "src/harness/inc/HarnessUtils.hpp"
#include "src/harness/inc/Subprocess.hpp"

namespace fqbench {
namespace harness {

/* --------------------------------- API --------------------------------- */

std::unique_ptr<TimingEngine> TimingEngine::make(const std::string& name) {
  if (name == "builtin") {
    return std::make_unique<BuiltinTimingEngine>();
  }
  if (name == "hyperfine" || name == "auto") {
    if (commandAvailable("hyperfine")) {
      return std::make_unique<HyperfineTimingEngine>();
    }
    std::fprintf(stderr,
                 "\n[WARN] Timing engine 'hyperfine' requested but not found on PATH.\n"
                 "   Install it with: cargo install hyperfine\n"
                 "   Falling back to the builtin engine (fork/exec, steady clock).\n\n");
    return std::make_unique<BuiltinTimingEngine>();
  }
  return nullptr;
}

/* -------------------------- BuiltinTimingEngine -------------------------- */

TimingOutcome BuiltinTimingEngine::measure(const TimingRequest& req) {
  TimingOutcome out;

  ProcessSpec spec;
  spec.argv = req.argv;
  spec.stdoutPath = req.capturePath;
  spec.mergeStderr = true;
  spec.workDir = req.workDir;
  spec.timeoutSec = req.timeoutSec;

  const int TOTAL = req.warmup + req.runs;
  for (int i = 0; i < TOTAL; ++i) {
    const std::string PREP_ERR = applyPreparation(req.prepare, req.workDir);
    if (!PREP_ERR.empty()) {
      out.error = "prepare failed: " + PREP_ERR;
      break;
    }

    const ProcessResult R = runProcess(spec);
    if (!R.launched) {
      out.error = R.error;
      break;
    }
    if (R.timedOut) {
      std::fprintf(stderr, "  [WARN] %s: run %d killed after %d s timeout\n", req.name.c_str(),
                   i + 1, req.timeoutSec);
    }
    if (i >= req.warmup) {
      out.times.push_back(R.wallSeconds);
      out.exitCodes.push_back(R.exitCode);
    }
  }

  const std::string CONCLUDE_ERR = applyPreparation(req.conclude, req.workDir);
  if (!CONCLUDE_ERR.empty()) {
    std::fprintf(stderr, "  [WARN] %s: conclude step failed: %s\n", req.name.c_str(),
                 CONCLUDE_ERR.c_str());
  }

  std::vector<double> samples = out.times;
  out.stats = summarize(samples);
  out.exitCode = firstFailure(out.exitCodes);
  if (out.error.empty() && out.times.empty()) {
    out.error = "no measured runs";
  }
  return out;
}

} // namespace harness
} // namespace fqbench
