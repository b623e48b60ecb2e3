#ifndef FQBENCH_ORCHESTRATOR_HPP
#define FQBENCH_ORCHESTRATOR_HPP
/**
 * @file Orchestrator.hpp
 * @brief The run loop: registry and matrix once, then stage -> measure -> persist per scenario.
 */

#include <filesystem>
#include <memory>

#include "src/harness/inc/DataGenerator.hpp"
#include "src/harness/inc/HarnessConfig.hpp"
#include "src/harness/inc/PageCacheEvictor.hpp"
#include "src/harness/inc/ResultWriter.hpp"
#include "src/harness/inc/TimingEngine.hpp"

namespace fqbench {
namespace harness {

/* ------------------------------ Exit Codes ------------------------------ */

inline constexpr int EXIT_COMPLETED = 0;          ///< Run finished (tool failures included)
inline constexpr int EXIT_NO_SCENARIOS = 1;       ///< Nothing left after generation failures
inline constexpr int EXIT_SETUP_ERROR = 2;        ///< Bad arguments, tools dir, duplicates
inline constexpr int EXIT_PERSISTENCE_ERROR = 3;  ///< Result tree could not be written

/* ------------------------------ Orchestrator ------------------------------ */

class Orchestrator {
public:
  /** @brief Production wiring: BBTools generator, configured evictor and engine. */
  explicit Orchestrator(HarnessConfig cfg);

  /**
   * @brief Injected collaborators (not owned). evictor may be nullptr.
   */
  Orchestrator(HarnessConfig cfg, DataGenerator& generator, PageCacheEvictor* evictor,
               TimingEngine& engine);

  /**
   * @brief Execute the whole run.
   * @return EXIT_COMPLETED or EXIT_NO_SCENARIOS.
   * @throws SetupError, PersistenceError
   */
  int run();

  const RunRecord& record() const noexcept { return record_; }

  /** @brief Result directory of the last run (empty before run()). */
  const std::filesystem::path& runDir() const noexcept { return runDir_; }

private:
  void exportEnvironment() const;

  HarnessConfig cfg_;
  std::unique_ptr<DataGenerator> ownedGenerator_;
  std::unique_ptr<PageCacheEvictor> ownedEvictor_;
  std::unique_ptr<TimingEngine> ownedEngine_;
  DataGenerator* generator_;
  PageCacheEvictor* evictor_;
  TimingEngine* engine_;

  RunRecord record_;
  std::filesystem::path runDir_;
};

} // namespace harness
} // namespace fqbench

#endif // FQBENCH_ORCHESTRATOR_HPP
