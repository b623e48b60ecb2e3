#ifndef FQBENCH_HARNESSREPORT_HPP
#define FQBENCH_HARNESSREPORT_HPP
/**
 * @file HarnessReport.hpp
 * @brief End-of-run console table: one row per tool x scenario.
 */

#include <algorithm>
#include <cstdio>
#include <string>
#include <vector>

#include "src/harness/inc/ResultWriter.hpp"

namespace fqbench {
namespace harness {

/* --------------------------------- API --------------------------------- */

/**
 * @brief Print mean, CV and status for every trial of the run.
 * @param out Destination stream (stdout in the harness).
 */
inline void printSummaryTable(const RunRecord& record, std::FILE* out = stdout) {
  std::size_t rows = 0;
  std::size_t maxToolLen = 4;      // "Tool"
  std::size_t maxScenarioLen = 8;  // "Scenario"
  for (const auto& sc : record.executed) {
    maxScenarioLen = std::max(maxScenarioLen, sc.status.scenario.label().size());
    for (const auto& r : sc.results) {
      maxToolLen = std::max(maxToolLen, r.toolId.size());
      ++rows;
    }
  }
  if (rows == 0) {
    return;
  }
  // Cap at 40 to prevent absurd widths
  maxToolLen = std::min<std::size_t>(maxToolLen, 40);

  const int TOOL_W = static_cast<int>(maxToolLen);
  const int SCEN_W = static_cast<int>(maxScenarioLen);
  const int TOTAL_WIDTH = TOOL_W + SCEN_W + 44;

  std::fprintf(out, "\n");
  for (int i = 0; i < TOTAL_WIDTH; ++i) {
    std::fputc('=', out);
  }
  std::fprintf(out, "\n%-*s  %-*s  %10s  %6s  %4s  %s\n", TOOL_W, "Tool", SCEN_W, "Scenario",
               "Mean (s)", "CV%", "Runs", "Status");
  for (int i = 0; i < TOTAL_WIDTH; ++i) {
    std::fputc('-', out);
  }
  std::fprintf(out, "\n");

  int okCount = 0;
  int failCount = 0;
  int degradedCount = 0;
  for (const auto& sc : record.executed) {
    const bool DEGRADED = isDegraded(sc.status.outcome);
    if (DEGRADED) {
      ++degradedCount;
    }
    for (const auto& r : sc.results) {
      std::string tool = r.toolId;
      if (tool.size() > maxToolLen) {
        tool = tool.substr(0, maxToolLen - 2) + "..";
      }
      std::string status = r.statusText();
      if (DEGRADED) {
        status += " (fallback)";
      }
      if (r.ok()) {
        ++okCount;
      } else {
        ++failCount;
      }
      std::fprintf(out, "%-*s  %-*s  %10.3f  %5.1f%%  %4zu  %s\n", TOOL_W, tool.c_str(), SCEN_W,
                   sc.status.scenario.label().c_str(), r.stats.mean, r.stats.cv * 100.0,
                   r.stats.samples, status.c_str());
    }
  }

  for (int i = 0; i < TOTAL_WIDTH; ++i) {
    std::fputc('-', out);
  }
  std::fprintf(out, "\n%zu trials | %d ok | %d failed | %d degraded scenarios | %zu skipped\n",
               rows, okCount, failCount, degradedCount, record.skipped.size());
}

} // namespace harness
} // namespace fqbench

#endif // FQBENCH_HARNESSREPORT_HPP
