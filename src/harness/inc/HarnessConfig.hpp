#ifndef FQBENCH_HARNESSCONFIG_HPP
#define FQBENCH_HARNESSCONFIG_HPP
/**
 * @file HarnessConfig.hpp
 * @brief Run configuration for the FASTQ benchmark harness and its command-line parser.
 */

#include <cerrno>
#include <cstdio>  // std::fprintf
#include <cstdlib> // std::getenv, std::strtol
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "src/harness/inc/HarnessErrors.hpp"
#include "src/harness/inc/Scenario.hpp"

namespace fqbench {
namespace harness {

/* ----------------------------- HarnessConfig ----------------------------- */

/** @brief Fixed run count for cold and really-cold scenarios (staging is paid per run). */
inline constexpr int COLD_RUNS = 3;

/** @brief Run configuration (CLI-overridable, with environment fallbacks). */
struct HarnessConfig {
  int warmup = 1;                 ///< Hot warmup runs
  int runs = 2;                   ///< Hot minimum measured runs
  bool skipCold = false;          ///< Drop Cold scenarios
  bool skipCompression = false;   ///< Drop gzip and bgzip formats
  bool reallyCold = false;        ///< Enable Really-Cold scenarios (regenerates inputs)
  std::vector<std::string> sizes; ///< Explicit size labels; empty = auto-discover

  std::string projectRoot;        ///< Holds tools/, test-data/, benchmark_results/
  std::string ramPath = "/tmp";   ///< Fast ephemeral storage for staged copies
  std::string bbtoolsPath;        ///< BBTools install (default: <root>/BBTools)

  std::string engine = "auto";    ///< "hyperfine", "builtin", "auto"
  std::string evictor = "vmtouch"; ///< "vmtouch", "fadvise"
  int timeoutSec = 0;             ///< Per-run tool timeout in seconds (0 = none)

  bool showHelp = false;          ///< --help was given

  std::filesystem::path root() const {
    return projectRoot.empty() ? std::filesystem::current_path()
                               : std::filesystem::path(projectRoot);
  }
  std::filesystem::path toolsDir() const { return root() / "tools"; }
  std::filesystem::path dataDir() const { return root() / "test-data"; }
  std::filesystem::path resultsDir() const { return root() / "benchmark_results"; }
  std::filesystem::path bbtoolsDir() const {
    return bbtoolsPath.empty() ? root() / "BBTools" : std::filesystem::path(bbtoolsPath);
  }

  /** @brief Enabled formats in matrix order. */
  std::vector<InputFormat> enabledFormats() const {
    std::vector<InputFormat> out{InputFormat::Raw};
    if (!skipCompression) {
      out.push_back(InputFormat::Gzip);
      out.push_back(InputFormat::Bgzip);
    }
    return out;
  }

  /** @brief Enabled cache states in matrix order. */
  std::vector<CacheState> enabledCacheStates() const {
    std::vector<CacheState> out{CacheState::Hot};
    if (!skipCold) {
      out.push_back(CacheState::Cold);
    }
    if (reallyCold) {
      out.push_back(CacheState::ReallyCold);
    }
    return out;
  }
};

/* --------------------------------- API --------------------------------- */

/** @brief Split a comma or space separated list, trimming blanks and dropping empties. */
inline std::vector<std::string> parseList(std::string_view s) {
  std::vector<std::string> out;
  std::string item;
  const auto FLUSH = [&]() {
    if (!item.empty()) {
      out.emplace_back(std::move(item));
      item.clear();
    }
  };
  for (const char CH : s) {
    if (CH == ',' || CH == ' ' || CH == '\t') {
      FLUSH();
    } else {
      item.push_back(CH);
    }
  }
  FLUSH();
  return out;
}

/**
 * @brief Apply environment fallbacks: FQBENCH_ROOT, FQBENCH_RAM_PATH, BBTOOLS_PATH.
 * Called before flag parsing so that flags win.
 */
inline void populateFromEnv(HarnessConfig& cfg) {
  if (const char* v = std::getenv("FQBENCH_ROOT")) {
    cfg.projectRoot = v;
  }
  if (const char* v = std::getenv("FQBENCH_RAM_PATH")) {
    cfg.ramPath = v;
  }
  if (const char* v = std::getenv("BBTOOLS_PATH")) {
    cfg.bbtoolsPath = v;
  }
}

/**
 * @brief Parse harness flags into cfg.
 *
 * Recognized flags:
 *   -w, --warmup N          -r, --runs N           -z, --sizes LIST
 *   -s, --skip-cold         -C, --skip-compression --really-cold
 *   --root PATH             --ram-path PATH        --bbtools PATH
 *   --engine NAME           --evictor NAME         --timeout SEC
 *   -h, --help
 *
 * @throws SetupError on unknown flags, missing values, or malformed numbers/labels.
 */
inline void parseHarnessFlags(HarnessConfig& cfg, int argc, char** argv) {
  const auto NEED_ARG = [&](std::string_view name, int i) -> std::string {
    if (i + 1 >= argc) {
      throw SetupError("missing value for " + std::string(name));
    }
    return argv[i + 1];
  };

  const auto PARSE_INT = [](std::string_view name, const std::string& text, int minVal) -> int {
    errno = 0;
    char* end = nullptr;
    const long VAL = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || end == nullptr || *end != '\0' || errno == ERANGE) {
      throw SetupError("invalid number for " + std::string(name) + ": '" + text + "'");
    }
    if (VAL < minVal || VAL > 1000000) {
      throw SetupError(std::string(name) + " out of range: " + text);
    }
    return static_cast<int>(VAL);
  };

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];

    if (a == "-w" || a == "--warmup") {
      cfg.warmup = PARSE_INT(a, NEED_ARG(a, i), 0);
      ++i;
    } else if (a == "-r" || a == "--runs") {
      cfg.runs = PARSE_INT(a, NEED_ARG(a, i), 1);
      ++i;
    } else if (a == "-z" || a == "--sizes") {
      cfg.sizes = parseList(NEED_ARG(a, i));
      if (cfg.sizes.empty()) {
        throw SetupError("empty size list for " + std::string(a));
      }
      for (const auto& label : cfg.sizes) {
        if (!parseSizeLabel(label) || readCountForLabel(label) == 0) {
          throw SetupError("invalid size label '" + label + "' (expected e.g. 0.1m, 1m, 10m)");
        }
      }
      ++i;
    } else if (a == "-s" || a == "--skip-cold") {
      cfg.skipCold = true;
    } else if (a == "-C" || a == "--skip-compression") {
      cfg.skipCompression = true;
    } else if (a == "--really-cold") {
      cfg.reallyCold = true;
    } else if (a == "--root") {
      cfg.projectRoot = NEED_ARG(a, i);
      ++i;
    } else if (a == "--ram-path") {
      cfg.ramPath = NEED_ARG(a, i);
      ++i;
    } else if (a == "--bbtools") {
      cfg.bbtoolsPath = NEED_ARG(a, i);
      ++i;
    } else if (a == "--engine") {
      cfg.engine = NEED_ARG(a, i);
      if (cfg.engine != "hyperfine" && cfg.engine != "builtin" && cfg.engine != "auto") {
        throw SetupError("unknown engine '" + cfg.engine + "' (hyperfine, builtin, auto)");
      }
      ++i;
    } else if (a == "--evictor") {
      cfg.evictor = NEED_ARG(a, i);
      if (cfg.evictor != "vmtouch" && cfg.evictor != "fadvise") {
        throw SetupError("unknown evictor '" + cfg.evictor + "' (vmtouch, fadvise)");
      }
      ++i;
    } else if (a == "--timeout") {
      cfg.timeoutSec = PARSE_INT(a, NEED_ARG(a, i), 0);
      ++i;
    } else if (a == "-h" || a == "--help") {
      cfg.showHelp = true;
    } else {
      throw SetupError("unknown argument '" + std::string(a) + "'");
    }
  }
}

/** @brief Print usage, including the cache scenarios and the format set. */
inline void printUsage(std::FILE* out, const char* prog) {
  std::fprintf(out,
               "Usage: %s [options]\n"
               "\n"
               "Options:\n"
               "  -w, --warmup <n>        Warmup runs for Hot scenarios (default: 1)\n"
               "  -r, --runs <n>          Minimum measured runs for Hot scenarios (default: 2)\n"
               "  -z, --sizes <list>      Comma-separated size labels, e.g. \"0.1m,1m,10m\".\n"
               "                          Default: every <n>m.fastq found in test-data/.\n"
               "                          Missing inputs are generated automatically.\n"
               "  -s, --skip-cold         Skip Cold scenarios\n"
               "  -C, --skip-compression  Skip the gzip and bgzip formats\n"
               "      --really-cold       Add Really-Cold scenarios (regenerates inputs)\n"
               "      --root <path>       Project root (default: $FQBENCH_ROOT or cwd)\n"
               "      --ram-path <path>   Fast storage for staged copies (default: /tmp)\n"
               "      --bbtools <path>    BBTools directory (default: <root>/BBTools)\n"
               "      --engine <name>     Timing engine: hyperfine, builtin, auto (default)\n"
               "      --evictor <name>    Page-cache evictor: vmtouch (default), fadvise\n"
               "      --timeout <sec>     Per-run tool timeout (default: 0 = none)\n"
               "  -h, --help              Show this help message\n"
               "\n"
               "Cache scenarios:\n"
               "  hot          Input copied to the RAM path before measuring.\n"
               "  cold         Input pages evicted from the page cache before every run;\n"
               "               falls back to a fresh RAM copy per run when eviction is\n"
               "               unavailable. The method used is logged per scenario.\n"
               "  really_cold  Input regenerated from scratch right before measuring.\n"
               "\n"
               "Formats:\n"
               "  raw    <size>.fastq\n"
               "  gzip   <size>.fastq.gz\n"
               "  bgzip  <size>.fastq_bgzipped.gz\n"
               "\n"
               "Hot scenarios use --warmup/--runs; cold scenarios use %d runs, no warmup.\n"
               "Results are written to <root>/benchmark_results/benchmark_<timestamp>/.\n",
               prog, COLD_RUNS);
}

} // namespace harness
} // namespace fqbench

#endif // FQBENCH_HARNESSCONFIG_HPP
