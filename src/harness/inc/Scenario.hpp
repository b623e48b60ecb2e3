#ifndef FQBENCH_SCENARIO_HPP
#define FQBENCH_SCENARIO_HPP
/**
 * @file Scenario.hpp
 * @brief Test scenario model: size label x input format x cache state.
 */

#include <array>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fqbench {
namespace harness {

/* ----------------------------- Enumerations ----------------------------- */

/** @brief Input compression format. Declaration order is the matrix order. */
enum class InputFormat { Raw, Gzip, Bgzip };

/** @brief OS page-cache state the input is prepared into. Declaration order is the matrix order. */
enum class CacheState { Hot, Cold, ReallyCold };

inline constexpr std::array<InputFormat, 3> ALL_FORMATS{InputFormat::Raw, InputFormat::Gzip,
                                                        InputFormat::Bgzip};
inline constexpr std::array<CacheState, 3> ALL_CACHE_STATES{CacheState::Hot, CacheState::Cold,
                                                            CacheState::ReallyCold};

/** @brief Short tag used in result file names ("raw", "gz", "bgz"). */
inline const char* formatTag(InputFormat f) noexcept {
  switch (f) {
  case InputFormat::Raw:
    return "raw";
  case InputFormat::Gzip:
    return "gz";
  case InputFormat::Bgzip:
    return "bgz";
  }
  return "unknown";
}

/** @brief Human-readable format name. */
inline const char* formatName(InputFormat f) noexcept {
  switch (f) {
  case InputFormat::Raw:
    return "raw";
  case InputFormat::Gzip:
    return "gzip";
  case InputFormat::Bgzip:
    return "bgzip";
  }
  return "unknown";
}

inline const char* cacheStateName(CacheState c) noexcept {
  switch (c) {
  case CacheState::Hot:
    return "hot";
  case CacheState::Cold:
    return "cold";
  case CacheState::ReallyCold:
    return "really_cold";
  }
  return "unknown";
}

/** @brief True for the states that get a cache-status sidecar and the fixed run count. */
inline bool isColdState(CacheState c) noexcept { return c != CacheState::Hot; }

/* ------------------------------ Size labels ------------------------------ */

/**
 * @brief Parse a size label of the form `<digits>(.<digits>)?m`.
 * @return Millions of reads, or nullopt when the label does not match.
 */
inline std::optional<double> parseSizeLabel(std::string_view label) {
  if (label.size() < 2 || label.back() != 'm') {
    return std::nullopt;
  }
  const std::string_view NUM = label.substr(0, label.size() - 1);

  std::size_t i = 0;
  std::size_t intDigits = 0;
  while (i < NUM.size() && std::isdigit(static_cast<unsigned char>(NUM[i]))) {
    ++i;
    ++intDigits;
  }
  if (intDigits == 0) {
    return std::nullopt;
  }
  if (i < NUM.size()) {
    if (NUM[i] != '.') {
      return std::nullopt;
    }
    ++i;
    std::size_t fracDigits = 0;
    while (i < NUM.size() && std::isdigit(static_cast<unsigned char>(NUM[i]))) {
      ++i;
      ++fracDigits;
    }
    if (fracDigits == 0 || i != NUM.size()) {
      return std::nullopt;
    }
  }
  const std::string TEXT(NUM);
  errno = 0;
  const double VALUE = std::strtod(TEXT.c_str(), nullptr);
  if (errno == ERANGE || !std::isfinite(VALUE)) {
    return std::nullopt;
  }
  return VALUE;
}

/**
 * @brief Number of reads a size label stands for ("0.1m" -> 100000).
 * @return 0 for an invalid label or one whose count does not fit in 64 bits.
 */
inline std::uint64_t readCountForLabel(std::string_view label) {
  const auto MILLIONS = parseSizeLabel(label);
  if (!MILLIONS) {
    return 0;
  }
  // 2^64 is exact in a double; anything at or above it would not convert.
  constexpr double UINT64_LIMIT = 18446744073709551616.0;
  const double READS = *MILLIONS * 1000000.0 + 0.5;
  if (READS >= UINT64_LIMIT) {
    return 0;
  }
  return static_cast<std::uint64_t>(READS);
}

/* ----------------------------- Input files ----------------------------- */

/** @brief Canonical file name for a size label and format inside the data directory. */
inline std::string inputFileName(const std::string& sizeLabel, InputFormat f) {
  switch (f) {
  case InputFormat::Raw:
    return sizeLabel + ".fastq";
  case InputFormat::Gzip:
    return sizeLabel + ".fastq.gz";
  case InputFormat::Bgzip:
    return sizeLabel + ".fastq_bgzipped.gz";
  }
  return sizeLabel;
}

inline std::filesystem::path inputFilePath(const std::filesystem::path& dataDir,
                                           const std::string& sizeLabel, InputFormat f) {
  return dataDir / inputFileName(sizeLabel, f);
}

/* ----------------------------- TestScenario ----------------------------- */

/** @brief One (size, format, cache-state) combination under measurement. */
struct TestScenario {
  std::string sizeLabel;
  InputFormat format{InputFormat::Raw};
  CacheState cacheState{CacheState::Hot};

  /** @brief Result file stem inside the size directory, e.g. "cold_gz". */
  std::string resultStem() const {
    return std::string(cacheStateName(cacheState)) + "_" + formatTag(format);
  }

  /** @brief Display label, e.g. "1m/gzip/cold". */
  std::string label() const {
    return sizeLabel + "/" + formatName(format) + "/" + cacheStateName(cacheState);
  }

  bool operator==(const TestScenario& o) const {
    return sizeLabel == o.sizeLabel && format == o.format && cacheState == o.cacheState;
  }
  bool operator!=(const TestScenario& o) const { return !(*this == o); }
};

} // namespace harness
} // namespace fqbench

#endif // FQBENCH_SCENARIO_HPP
