/**
 * @file FqBenchMain.cpp
 * @brief `fqbench` entry point: configuration, run, exit-code mapping.
 *
 * Usage:
 *   @code{.sh}
 *   # Every size found in test-data/, hot and cold, all formats
 *   ./fqbench
 *
 *   # Two sizes, hot only, raw only, five measured runs
 *   ./fqbench -z 0.1m,1m -s -C -r 5
 *
 *   # Add the really-cold scenarios (inputs regenerated with BBTools)
 *   ./fqbench --really-cold --bbtools /opt/BBTools
 *   @endcode
 */

#include <cstdio>
#include <exception>

#include "src/harness/inc/HarnessConfig.hpp"
#include "src/harness/inc/HarnessErrors.hpp"
#include "src/harness/inc/Orchestrator.hpp"

namespace fh = fqbench::harness;

int main(int argc, char** argv) {
  fh::HarnessConfig cfg;
  fh::populateFromEnv(cfg);

  try {
    fh::parseHarnessFlags(cfg, argc, argv);
  } catch (const fh::SetupError& e) {
    std::fprintf(stderr, "[ERROR] %s\nUse -h for help.\n", e.what());
    return fh::EXIT_SETUP_ERROR;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[ERROR] Bad arguments: %s\nUse -h for help.\n", e.what());
    return fh::EXIT_SETUP_ERROR;
  }
  if (cfg.showHelp) {
    fh::printUsage(stdout, argv[0]);
    return fh::EXIT_COMPLETED;
  }

  try {
    fh::Orchestrator orchestrator(cfg);
    return orchestrator.run();
  } catch (const fh::SetupError& e) {
    std::fprintf(stderr, "[ERROR] Setup failed: %s\n", e.what());
    return fh::EXIT_SETUP_ERROR;
  } catch (const fh::PersistenceError& e) {
    std::fprintf(stderr, "[ERROR] Could not write results: %s\n", e.what());
    return fh::EXIT_PERSISTENCE_ERROR;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[ERROR] %s\n", e.what());
    return fh::EXIT_SETUP_ERROR;
  }
}
