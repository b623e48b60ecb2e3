/**
 * @file CacheState.cpp
 * @brief Hot / Cold / Really-Cold staging strategies.
 */

#include "src/harness/inc/CacheState.hpp"

#include <cstdio>
#include <system_error>

#include <unistd.h>

#include "src/harness/inc/HarnessErrors.hpp"
#include "src/harness/inc/HarnessUtils.hpp"
#include "src/harness/inc/Subprocess.hpp"

namespace fqbench {
namespace harness {

namespace fs = std::filesystem;

/* ---------------------------- RunPreparation ---------------------------- */

std::string applyPreparation(const RunPreparation& prep, const fs::path& workDir) {
  std::error_code ec;
  for (const auto& p : prep.removePaths) {
    const fs::path TARGET = (p.is_absolute() || workDir.empty()) ? p : workDir / p;
    fs::remove_all(TARGET, ec);
    if (ec) {
      return "cannot remove " + TARGET.string() + ": " + ec.message();
    }
  }
  if (prep.copy) {
    fs::copy_file(prep.copy->first, prep.copy->second, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      return "cannot copy " + prep.copy->first.string() + " to " + prep.copy->second.string() +
             ": " + ec.message();
    }
  }
  if (!prep.evictCommand.empty()) {
    const ProcessResult R = runQuiet(prep.evictCommand);
    if (!R.ok()) {
      return prep.evictCommand.front() + " exited with code " + std::to_string(R.exitCode);
    }
  }
  return {};
}

/* ------------------------------ StagedInput ------------------------------ */

StagedInput& StagedInput::operator=(StagedInput&& other) noexcept {
  if (this != &other) {
    release();
    status_ = std::move(other.status_);
    perRun_ = std::move(other.perRun_);
    owned_ = std::move(other.owned_);
    other.owned_.clear();
  }
  return *this;
}

void StagedInput::release() noexcept {
  for (const auto& p : owned_) {
    std::error_code ec;
    fs::remove_all(p, ec);
    if (ec) {
      std::fprintf(stderr, "[WARN] Could not remove staged path %s: %s\n", p.c_str(),
                   ec.message().c_str());
    }
  }
  owned_.clear();
}

/* -------------------------- CacheStateController -------------------------- */

fs::path CacheStateController::stagedCopyPath(const TestScenario& scenario,
                                              const fs::path& canonical) const {
  return opts_.ramPath / ("fqbench_" + scenario.resultStem() + "_" + scenario.sizeLabel + "_" +
                          std::to_string(::getpid()) + "_" + canonical.filename().string());
}

fs::path CacheStateController::freshDataDir(const TestScenario& scenario) const {
  return opts_.dataDir / (".fresh_" + scenario.resultStem() + "_" + scenario.sizeLabel + "_" +
                          std::to_string(::getpid()));
}

void CacheStateController::copyInto(const fs::path& src, const fs::path& dst) const {
  std::error_code ec;
  fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    std::error_code rec;
    fs::remove(dst, rec);
    throw CacheStagingError("cannot copy " + src.string() + " to " + dst.string() + ": " +
                            ec.message());
  }
}

StagedInput CacheStateController::stage(const TestScenario& scenario) {
  if (scenario.cacheState == CacheState::ReallyCold) {
    return stageReallyCold(scenario);
  }

  const fs::path CANONICAL = inputFilePath(opts_.dataDir, scenario.sizeLabel, scenario.format);
  std::error_code ec;
  if (!fs::is_regular_file(CANONICAL, ec)) {
    throw CacheStagingError("input file missing: " + CANONICAL.string());
  }
  if (scenario.cacheState == CacheState::Hot) {
    return stageHot(scenario, CANONICAL);
  }
  return stageCold(scenario, CANONICAL);
}

StagedInput CacheStateController::stageHot(const TestScenario& scenario,
                                           const fs::path& canonical) {
  const fs::path COPY = stagedCopyPath(scenario, canonical);
  std::printf("Copying %s to RAM path (%s)...\n", canonical.filename().c_str(),
              opts_.ramPath.c_str());
  copyInto(canonical, COPY);

  CacheStatus st;
  st.scenario = scenario;
  st.outcome = Achieved{CacheMethod::RamCopy};
  st.timestamp = captureTimestamp();
  st.originalFile = canonical;
  st.stagedFile = COPY;
  return StagedInput(std::move(st), RunPreparation{}, {COPY});
}

StagedInput CacheStateController::stageCold(const TestScenario& scenario,
                                            const fs::path& canonical) {
  CacheStatus st;
  st.scenario = scenario;
  st.originalFile = canonical;

  std::string reason;
  if (evictor_ == nullptr) {
    reason = "no page-cache evictor configured";
  } else {
    st.evictor = evictor_->name();
    if (!evictor_->available()) {
      reason = evictor_->name() + " not available";
    } else {
      const EvictionResult R = evictor_->evict(canonical);
      if (!R.ok) {
        reason = R.reason.empty() ? evictor_->name() + " eviction failed" : R.reason;
      } else {
        st.residentAfter = evictor_->residentFraction(canonical);
        if (st.residentAfter && *st.residentAfter > opts_.maxResidentAfterEvict) {
          char buf[128];
          std::snprintf(buf, sizeof(buf), "%.0f%% of pages still resident after %s eviction",
                        *st.residentAfter * 100.0, evictor_->name().c_str());
          reason = buf;
        }
      }
    }
  }

  if (reason.empty()) {
    std::printf("Page cache evicted with %s - pages will be evicted before each run\n",
                evictor_->name().c_str());
    st.outcome = Achieved{CacheMethod::KernelEviction};
    st.timestamp = captureTimestamp();
    st.stagedFile = canonical;
    RunPreparation prep;
    prep.evictCommand = evictor_->evictCommand(canonical);
    return StagedInput(std::move(st), std::move(prep), {});
  }

  const fs::path COPY = stagedCopyPath(scenario, canonical);
  std::fprintf(stderr,
               "[WARN] %s: %s - falling back to RAM copy method\n"
               "       File will be copied to RAM before each run: %s\n",
               scenario.label().c_str(), reason.c_str(), COPY.c_str());
  copyInto(canonical, COPY);

  st.outcome = Degraded{CacheMethod::RamCopyFallback, reason};
  st.timestamp = captureTimestamp();
  st.stagedFile = COPY;
  RunPreparation prep;
  prep.removePaths.push_back(COPY);
  prep.copy = std::make_pair(canonical, COPY);
  return StagedInput(std::move(st), std::move(prep), {COPY});
}

StagedInput CacheStateController::stageReallyCold(const TestScenario& scenario) {
  const fs::path DIR = freshDataDir(scenario);
  std::error_code ec;
  fs::remove_all(DIR, ec);
  if (ec) {
    throw CacheStagingError("cannot clear " + DIR.string() + ": " + ec.message());
  }
  fs::create_directories(DIR, ec);
  if (ec) {
    throw CacheStagingError("cannot create " + DIR.string() + ": " + ec.message());
  }

  // Removed on every failure path below; ownership moves to the StagedInput on success.
  struct DirGuard {
    fs::path dir;
    bool armed = true;
    ~DirGuard() {
      if (armed) {
        std::error_code gec;
        fs::remove_all(dir, gec);
      }
    }
  } guard{DIR};

  std::printf("Regenerating %s from scratch in %s...\n", scenario.label().c_str(), DIR.c_str());
  GenerationRequest req;
  req.sizeLabel = scenario.sizeLabel;
  req.outDir = DIR;
  req.formats = {scenario.format};
  req.overwrite = true;
  try {
    generator_.generate(req);
  } catch (const GenerationError& e) {
    throw CacheStagingError(std::string("regeneration failed: ") + e.what());
  }

  const fs::path FRESH = inputFilePath(DIR, scenario.sizeLabel, scenario.format);
  if (!fs::is_regular_file(FRESH, ec)) {
    throw CacheStagingError("regeneration did not produce " + FRESH.string());
  }

  CacheStatus st;
  st.scenario = scenario;
  st.outcome = Achieved{CacheMethod::FreshRegeneration};
  st.timestamp = captureTimestamp();
  st.originalFile = FRESH;
  st.stagedFile = FRESH;
  guard.armed = false;
  return StagedInput(std::move(st), RunPreparation{}, {DIR});
}

} // namespace harness
} // namespace fqbench
