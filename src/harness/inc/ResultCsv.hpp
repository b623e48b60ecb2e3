#ifndef FQBENCH_RESULTCSV_HPP
#define FQBENCH_RESULTCSV_HPP
/**
 * @file ResultCsv.hpp
 * @brief CSV helpers for the run-level results.csv (one row per trial).
 */

#include <ostream>
#include <string>

#include "src/harness/inc/TrialRunner.hpp"

namespace fqbench {
namespace harness {

/* --------------------------------- API --------------------------------- */

/**
 * @brief Quote a field when it contains a separator, quote or newline.
 */
inline std::string csvField(const std::string& s) {
  if (s.find_first_of(",\"\n") == std::string::npos) {
    return s;
  }
  std::string out = "\"";
  for (const char CH : s) {
    if (CH == '"') {
      out += "\"\"";
    } else {
      out.push_back(CH);
    }
  }
  out.push_back('"');
  return out;
}

/**
 * @brief Write the header for per-trial wall-time results (seconds).
 * @param includeMetadata When true, append `timestamp,hostname,platform`.
 */
inline void writeCsvHeader(std::ostream& csv, bool includeMetadata = false) {
  csv << "size,format,cacheState,tool,engine,warmup,runs,"
         "wallMedian,wallP10,wallP90,wallMin,wallMax,wallMean,wallStddev,wallCV,samples,"
         "exitCode,status,outputBytes,cacheMethod,degraded";
  if (includeMetadata) {
    csv << ",timestamp,hostname,platform";
  }
  csv << "\n";
}

/** @brief Metadata columns appended when the header was written with includeMetadata. */
struct CsvMetadata {
  std::string timestamp;
  std::string hostname;
  std::string platform;

  bool empty() const noexcept { return timestamp.empty() && hostname.empty() && platform.empty(); }
};

/**
 * @brief Write a single result row.
 * @param cacheMethod Method name from the scenario's CacheStatus.
 */
inline void writeCsvRow(std::ostream& csv, const TrialResult& row, const std::string& cacheMethod,
                        bool degraded, const CsvMetadata& meta = {}) {
  csv << row.scenario.sizeLabel << "," << formatName(row.scenario.format) << ","
      << cacheStateName(row.scenario.cacheState) << "," << csvField(row.toolId) << ","
      << row.engine << "," << row.warmup << "," << row.runs << "," << row.stats.median << ","
      << row.stats.p10 << "," << row.stats.p90 << "," << row.stats.min << "," << row.stats.max
      << "," << row.stats.mean << "," << row.stats.stddev << "," << row.stats.cv << ","
      << row.stats.samples << "," << row.exitCode << "," << csvField(row.statusText()) << ","
      << row.outputBytes << "," << cacheMethod << "," << (degraded ? "1" : "0");

  if (!meta.empty()) {
    csv << "," << meta.timestamp << "," << csvField(meta.hostname) << "," << meta.platform;
  }
  csv << "\n";
}

} // namespace harness
} // namespace fqbench

#endif // FQBENCH_RESULTCSV_HPP
