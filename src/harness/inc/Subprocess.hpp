#ifndef FQBENCH_SUBPROCESS_HPP
#define FQBENCH_SUBPROCESS_HPP
/**
 * @file Subprocess.hpp
 * @brief fork/exec wrapper used for tools, generators, evictors and timing engines.
 *
 * No shell is involved: the argument vector is passed to execvp as-is.
 * stdin is always /dev/null; stdout/stderr go to files, /dev/null, or the harness console.
 *
 * @note Blocking. One child at a time.
 */

#include <filesystem>
#include <string>
#include <vector>

namespace fqbench {
namespace harness {

/* ------------------------------ ProcessSpec ------------------------------ */

struct ProcessSpec {
  std::vector<std::string> argv;     ///< argv[0] is resolved through PATH
  std::filesystem::path stdoutPath{}; ///< Truncated and written; empty = /dev/null
  bool mergeStderr = true;           ///< stderr joins stdout; false = /dev/null
  std::filesystem::path workDir{};   ///< chdir before exec; empty = inherit
  int timeoutSec = 0;                ///< SIGKILL after this many seconds (0 = wait forever)
  bool inheritStdio = false;         ///< Keep the harness stdout/stderr (paths ignored)
};

/* ----------------------------- ProcessResult ----------------------------- */

/** @brief Exit code reported for a child killed by the timeout (matches timeout(1)). */
inline constexpr int EXIT_TIMEOUT = 124;

/** @brief Exit code reported when exec itself failed in the child (matches sh). */
inline constexpr int EXIT_EXEC_FAILED = 127;

struct ProcessResult {
  bool launched = false;  ///< fork succeeded
  int exitCode = -1;      ///< exit status; 128+N when killed by signal N; EXIT_TIMEOUT on timeout
  bool timedOut = false;
  double wallSeconds = 0; ///< fork to reap
  std::string error;      ///< Why launching failed (empty on success)

  bool ok() const noexcept { return launched && exitCode == 0; }
};

/* --------------------------------- API --------------------------------- */

/**
 * @brief Run a child to completion.
 * @note Never throws for child failures; inspect the result.
 */
ProcessResult runProcess(const ProcessSpec& spec);

/** @brief Convenience: run argv with all output discarded. */
ProcessResult runQuiet(const std::vector<std::string>& argv, int timeoutSec = 0);

/** @brief Quote one argument for /bin/sh (single quotes, embedded quotes escaped). */
std::string shellQuote(const std::string& arg);

/** @brief Join argv into a /bin/sh command line with every element quoted. */
std::string shellJoin(const std::vector<std::string>& argv);

} // namespace harness
} // namespace fqbench

#endif // FQBENCH_SUBPROCESS_HPP
