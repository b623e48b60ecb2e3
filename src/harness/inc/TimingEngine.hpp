#ifndef FQBENCH_TIMINGENGINE_HPP
#define FQBENCH_TIMINGENGINE_HPP
/**
 * @file TimingEngine.hpp
 * @brief Facade for the statistical timing engine that measures one tool command.
 *
 * Backends:
 *  - hyperfine: external engine; one hyperfine process per tool, JSON export parsed back.
 *  - builtin:   fork/exec per run with a monotonic clock; used when hyperfine is missing.
 *
 * Both backends honour the same request: warmup runs, measured runs, per-run preparation,
 * a conclude step after the last run, and stdout+stderr captured to one file that is
 * truncated on every run.
 */

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "src/harness/inc/CacheState.hpp"
#include "src/harness/inc/TimingStats.hpp"

namespace fqbench {
namespace harness {

/* ----------------------------- TimingRequest ----------------------------- */

struct TimingRequest {
  std::string name;                   ///< Tool identifier (hyperfine --command-name)
  std::vector<std::string> argv;      ///< Exact command; never re-split
  std::filesystem::path capturePath;  ///< stdout+stderr of each run (last run survives)
  std::filesystem::path workDir;      ///< Tools run here; relative scratch paths resolve here
  int warmup = 0;                     ///< Unmeasured runs
  int runs = 1;                       ///< Measured runs
  bool minRuns = false;               ///< runs is a minimum (hyperfine may add runs)
  RunPreparation prepare;             ///< Before every run, warmup included
  RunPreparation conclude;            ///< After the last run
  int timeoutSec = 0;                 ///< Per-run limit (0 = none)
};

/* ----------------------------- TimingOutcome ----------------------------- */

struct TimingOutcome {
  Stats stats{};                ///< Seconds
  std::vector<double> times;    ///< Measured wall times, run order
  std::vector<int> exitCodes;   ///< One per measured run
  int exitCode = 0;             ///< First non-zero measured exit code, else 0
  std::string error;            ///< Engine-level failure (no usable measurement)

  bool ok() const noexcept { return error.empty() && exitCode == 0; }
};

/** @brief First non-zero code, or 0. */
inline int firstFailure(const std::vector<int>& codes) {
  for (const int C : codes) {
    if (C != 0) {
      return C;
    }
  }
  return 0;
}

/* ------------------------------ TimingEngine ------------------------------ */

/**
 * @note Blocking; runs are strictly sequential.
 */
class TimingEngine {
public:
  virtual ~TimingEngine() = default;

  /** @return stable engine name ("hyperfine", "builtin"). */
  virtual std::string name() const = 0;

  /** @brief Measure one command. Tool failures are reported in the outcome, never thrown. */
  virtual TimingOutcome measure(const TimingRequest& req) = 0;

  /**
   * @brief Factory: "hyperfine", "builtin" or "auto".
   * "auto" picks hyperfine when it is on PATH and warns before falling back to builtin.
   * An explicit "hyperfine" that is missing also falls back with a warning.
   */
  static std::unique_ptr<TimingEngine> make(const std::string& name);
};

/* -------------------------- BuiltinTimingEngine -------------------------- */

class BuiltinTimingEngine final : public TimingEngine {
public:
  std::string name() const override { return "builtin"; }
  TimingOutcome measure(const TimingRequest& req) override;
};

/* ------------------------- HyperfineTimingEngine ------------------------- */

class HyperfineTimingEngine final : public TimingEngine {
public:
  explicit HyperfineTimingEngine(std::string executable = "hyperfine")
      : executable_(std::move(executable)) {}

  std::string name() const override { return "hyperfine"; }
  TimingOutcome measure(const TimingRequest& req) override;

  /** @brief hyperfine argument vector for a request (export written to exportPath). */
  std::vector<std::string> buildCommand(const TimingRequest& req,
                                        const std::filesystem::path& exportPath) const;

  /** @brief Render a RunPreparation as a /bin/sh command ("" when empty). */
  static std::string renderPreparation(const RunPreparation& prep);

  /**
   * @brief Parse a hyperfine `--export-json` document for the first result.
   * @return outcome with error set when the document is malformed.
   */
  static TimingOutcome parseExport(const std::string& json);

private:
  std::string executable_;
};

} // namespace harness
} // namespace fqbench

#endif // FQBENCH_TIMINGENGINE_HPP
