/**
 * @file Orchestrator.cpp
 * @brief Run loop and console progress.
 */

#include "src/harness/inc/Orchestrator.hpp"

#include <cstdio>
#include <cstdlib>
#include <optional>
#include <system_error>

#include "src/harness/inc/CacheState.hpp"
#include "src/harness/inc/HarnessErrors.hpp"
#include "src/harness/inc/HarnessReport.hpp"
#include "src/harness/inc/HarnessUtils.hpp"
#include "src/harness/inc/TestMatrix.hpp"
#include "src/harness/inc/ToolRegistry.hpp"
#include "src/harness/inc/TrialRunner.hpp"

namespace fqbench {
namespace harness {

namespace fs = std::filesystem;

namespace {

void printRule(char ch) {
  for (int i = 0; i < 42; ++i) {
    std::fputc(ch, stdout);
  }
  std::fputc('\n', stdout);
}

void printScenarioBanner(const TestScenario& s) {
  const char* KIND = "Hot";
  if (s.cacheState == CacheState::Cold) {
    KIND = "Cold";
  } else if (s.cacheState == CacheState::ReallyCold) {
    KIND = "Really-Cold";
  }
  std::printf("\n");
  printRule('=');
  std::printf("%s Benchmark: %s (%s)\n", KIND, formatName(s.format), s.sizeLabel.c_str());
  printRule('=');
}

} // namespace

/* ------------------------------ Orchestrator ------------------------------ */

Orchestrator::Orchestrator(HarnessConfig cfg) : cfg_(std::move(cfg)) {
  ownedGenerator_ = std::make_unique<BbtoolsGenerator>(cfg_.bbtoolsDir());
  ownedEvictor_ = PageCacheEvictor::make(cfg_.evictor);
  ownedEngine_ = TimingEngine::make(cfg_.engine);
  if (!ownedEngine_) {
    throw SetupError("unknown engine '" + cfg_.engine + "'");
  }
  generator_ = ownedGenerator_.get();
  evictor_ = ownedEvictor_.get();
  engine_ = ownedEngine_.get();
}

Orchestrator::Orchestrator(HarnessConfig cfg, DataGenerator& generator,
                           PageCacheEvictor* evictor, TimingEngine& engine)
    : cfg_(std::move(cfg)), generator_(&generator), evictor_(evictor), engine_(&engine) {}

void Orchestrator::exportEnvironment() const {
  if (::setenv("FQBENCH_ROOT", cfg_.root().c_str(), 1) != 0 ||
      ::setenv("BBTOOLS_PATH", cfg_.bbtoolsDir().c_str(), 1) != 0) {
    throw SetupError("cannot export FQBENCH_ROOT/BBTOOLS_PATH to the environment");
  }
}

int Orchestrator::run() {
  record_ = RunRecord{};
  record_.config = cfg_;
  record_.engine = engine_->name();
  record_.evictor = evictor_ ? evictor_->name() : std::string("none");

  exportEnvironment();

  const ToolRegistry REGISTRY = ToolRegistry::discover(cfg_.toolsDir());
  record_.tools = REGISTRY.identifiers();

  std::error_code ec;
  if (!fs::is_directory(cfg_.ramPath, ec)) {
    throw SetupError("RAM path is not a directory: " + cfg_.ramPath);
  }

  std::printf("\n");
  printRule('=');
  std::printf("FASTQ Parser Benchmark\n");
  printRule('=');
  std::printf("Tools (%zu):", REGISTRY.size());
  for (const auto& id : record_.tools) {
    std::printf(" %s", id.c_str());
  }
  std::printf("\n");

  MatrixRequest req;
  req.sizes = cfg_.sizes;
  req.dataDir = cfg_.dataDir();
  req.formats = cfg_.enabledFormats();
  req.states = cfg_.enabledCacheStates();
  TestMatrixBuilder builder(*generator_);
  const MatrixPlan PLAN = builder.build(req);
  record_.sizes = PLAN.sizes;
  record_.generationFailures = PLAN.failures;

  for (const auto& f : PLAN.failures) {
    std::fprintf(stderr, "[WARN] Size %s skipped: %s\n", f.sizeLabel.c_str(), f.reason.c_str());
  }
  if (PLAN.scenarios.empty()) {
    std::fprintf(stderr, "[ERROR] No scenarios left to benchmark in %s\n",
                 req.dataDir.c_str());
    return EXIT_NO_SCENARIOS;
  }

  ResultWriter writer(cfg_.resultsDir(), runDirectoryStamp());
  runDir_ = writer.runDir();
  std::printf("Capturing system information...\n");
  writer.writeEnvironment(ResultWriter::captureEnvironment(cfg_, engine_->name()));

  std::printf("Date: %s\n", captureLocalDate().c_str());
  std::printf("Test sizes to benchmark:");
  for (const auto& s : PLAN.sizes) {
    std::printf(" %s", s.c_str());
  }
  std::printf("\nWarmup runs: %d\nMin benchmark runs: %d\nTiming engine: %s\n", cfg_.warmup,
              cfg_.runs, engine_->name().c_str());
  std::printf("Results directory: %s\n", runDir_.c_str());

  CacheStagingOptions opts;
  opts.ramPath = cfg_.ramPath;
  opts.dataDir = cfg_.dataDir();
  CacheStateController controller(opts, evictor_, *generator_);
  TrialRunner runner(*engine_, cfg_.root(), cfg_.timeoutSec);

  for (const auto& scenario : PLAN.scenarios) {
    printScenarioBanner(scenario);

    std::optional<StagedInput> staged;
    try {
      staged.emplace(controller.stage(scenario));
    } catch (const CacheStagingError& e) {
      std::fprintf(stderr, "[ERROR] %s skipped: %s\n", scenario.label().c_str(), e.what());
      record_.skipped.push_back({scenario, e.what()});
      continue;
    }

    const TrialPlan TRIAL = trialPlanFor(scenario.cacheState, cfg_);
    std::printf("Running benchmarks with %d warmup runs and %s%d runs...\n", TRIAL.warmup,
                TRIAL.minRuns ? "minimum " : "", TRIAL.runs);
    auto results = runner.runScenario(REGISTRY, *staged, writer.outputsDir(scenario), TRIAL);

    writer.writeScenario(staged->status(), results);
    std::printf("Results saved to: %s\n", writer.scenarioFile(scenario, ".json").c_str());
    std::printf("Cache method: %s\n", cacheMethodName(staged->status().method()));

    record_.executed.push_back({staged->status(), std::move(results)});
  }

  writer.writeSummary(record_);

  std::printf("\n");
  printRule('=');
  std::printf("Benchmark Complete!\n");
  printRule('=');
  std::printf("All results saved to: %s\n", runDir_.c_str());
  printSummaryTable(record_);
  return EXIT_COMPLETED;
}

} // namespace harness
} // namespace fqbench
