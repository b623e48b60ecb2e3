#ifndef FQBENCH_CACHESTATE_HPP
#define FQBENCH_CACHESTATE_HPP
/**
 * @file CacheState.hpp
 * @brief Staging of a scenario's input into a hot, cold or really-cold cache state.
 *
 * Strategies:
 *  - Hot:         copy into the RAM path; the copy is benchmarked.
 *  - Cold:        evict the canonical file's pages (re-evicted before every run). When the
 *                 evictor is missing, fails, or leaves the pages resident, fall back to a RAM
 *                 copy refreshed before every run. The fallback is a Degraded outcome, not an
 *                 error.
 *  - Really-Cold: regenerate the input into a fresh scratch directory right before the trial.
 *
 * Only total inability to produce a usable file raises CacheStagingError.
 */

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "src/harness/inc/DataGenerator.hpp"
#include "src/harness/inc/PageCacheEvictor.hpp"
#include "src/harness/inc/Scenario.hpp"

namespace fqbench {
namespace harness {

/* ------------------------------ CacheMethod ------------------------------ */

enum class CacheMethod { RamCopy, KernelEviction, RamCopyFallback, FreshRegeneration };

inline const char* cacheMethodName(CacheMethod m) noexcept {
  switch (m) {
  case CacheMethod::RamCopy:
    return "ram_copy";
  case CacheMethod::KernelEviction:
    return "kernel_eviction";
  case CacheMethod::RamCopyFallback:
    return "ram_copy_fallback";
  case CacheMethod::FreshRegeneration:
    return "fresh_regeneration";
  }
  return "unknown";
}

/* ---------------------------- StagingOutcome ---------------------------- */

/** @brief The requested strategy was carried out. */
struct Achieved {
  CacheMethod method{CacheMethod::RamCopy};
};

/** @brief A fallback strategy was used instead; reason says why. */
struct Degraded {
  CacheMethod method{CacheMethod::RamCopyFallback};
  std::string reason;
};

using StagingOutcome = std::variant<Achieved, Degraded>;

inline CacheMethod methodOf(const StagingOutcome& o) {
  return std::visit([](const auto& v) { return v.method; }, o);
}

inline bool isDegraded(const StagingOutcome& o) noexcept {
  return std::holds_alternative<Degraded>(o);
}

/* ------------------------------ CacheStatus ------------------------------ */

/** @brief Produced together with every staged file; never reconstructed afterwards. */
struct CacheStatus {
  TestScenario scenario;
  StagingOutcome outcome{Achieved{}};
  std::string timestamp;                ///< UTC, ISO 8601
  std::filesystem::path originalFile;   ///< Canonical input (or regenerated file)
  std::filesystem::path stagedFile;     ///< Path handed to every tool
  std::string evictor;                  ///< Backend tried for Cold (empty otherwise)
  std::optional<double> residentAfter;  ///< Page residency measured after eviction

  CacheMethod method() const { return methodOf(outcome); }
};

/* ---------------------------- RunPreparation ---------------------------- */

/**
 * @brief Declarative per-run preparation executed by timing engines before each run.
 * Order: remove paths, copy, evict.
 */
struct RunPreparation {
  std::vector<std::filesystem::path> removePaths; ///< Removed recursively (relative to workDir)
  std::optional<std::pair<std::filesystem::path, std::filesystem::path>> copy; ///< src -> dst
  std::vector<std::string> evictCommand;          ///< Empty = no eviction

  bool empty() const noexcept { return removePaths.empty() && !copy && evictCommand.empty(); }
};

/**
 * @brief Execute a RunPreparation in-process.
 * @return empty string on success, else a description of the first failing step.
 */
std::string applyPreparation(const RunPreparation& prep, const std::filesystem::path& workDir);

/* ------------------------------ StagedInput ------------------------------ */

/**
 * @brief Move-only handle to a ready-to-benchmark file.
 *
 * Owns every ephemeral path created for the scenario and removes them when destroyed,
 * whatever way the scenario ends.
 */
class StagedInput {
public:
  StagedInput(CacheStatus status, RunPreparation perRun, std::vector<std::filesystem::path> owned)
      : status_(std::move(status)), perRun_(std::move(perRun)), owned_(std::move(owned)) {}
  ~StagedInput() { release(); }

  StagedInput(const StagedInput&) = delete;
  StagedInput& operator=(const StagedInput&) = delete;
  StagedInput(StagedInput&& other) noexcept
      : status_(std::move(other.status_)), perRun_(std::move(other.perRun_)),
        owned_(std::move(other.owned_)) {
    other.owned_.clear();
  }
  StagedInput& operator=(StagedInput&& other) noexcept;

  const std::filesystem::path& path() const noexcept { return status_.stagedFile; }
  const CacheStatus& status() const noexcept { return status_; }
  const RunPreparation& perRun() const noexcept { return perRun_; }
  const std::vector<std::filesystem::path>& ownedPaths() const noexcept { return owned_; }

  /** @brief Remove owned paths now. Idempotent. */
  void release() noexcept;

private:
  CacheStatus status_;
  RunPreparation perRun_;
  std::vector<std::filesystem::path> owned_;
};

/* -------------------------- CacheStateController -------------------------- */

struct CacheStagingOptions {
  std::filesystem::path ramPath;     ///< Fast ephemeral storage
  std::filesystem::path dataDir;     ///< Canonical inputs
  double maxResidentAfterEvict = 0.5; ///< Above this, eviction is treated as failed
};

class CacheStateController {
public:
  /**
   * @param evictor   Backend for Cold; nullptr behaves like an unavailable facility.
   * @param generator Used by Really-Cold.
   */
  CacheStateController(CacheStagingOptions opts, PageCacheEvictor* evictor,
                       DataGenerator& generator)
      : opts_(std::move(opts)), evictor_(evictor), generator_(generator) {}

  /**
   * @brief Stage the scenario's input.
   * @throws CacheStagingError when no strategy yields a usable file.
   */
  StagedInput stage(const TestScenario& scenario);

  /** @brief RAM-path name unique to the scenario and this process. */
  std::filesystem::path stagedCopyPath(const TestScenario& scenario,
                                       const std::filesystem::path& canonical) const;

  /** @brief Scratch directory for a Really-Cold regeneration. */
  std::filesystem::path freshDataDir(const TestScenario& scenario) const;

private:
  StagedInput stageHot(const TestScenario& scenario, const std::filesystem::path& canonical);
  StagedInput stageCold(const TestScenario& scenario, const std::filesystem::path& canonical);
  StagedInput stageReallyCold(const TestScenario& scenario);

  /** Copy canonical -> dst. @throws CacheStagingError */
  void copyInto(const std::filesystem::path& src, const std::filesystem::path& dst) const;

  CacheStagingOptions opts_;
  PageCacheEvictor* evictor_;
  DataGenerator& generator_;
};

} // namespace harness
} // namespace fqbench

#endif // FQBENCH_CACHESTATE_HPP
