/**
 * @file ResultWriter.cpp
 * @brief Result tree, environment snapshot and run summary.
 */

#include "src/harness/inc/ResultWriter.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

#include "src/harness/inc/HarnessErrors.hpp"
#include "src/harness/inc/HarnessUtils.hpp"
#include "src/harness/inc/ResultCsv.hpp"
#include "src/harness/inc/Subprocess.hpp"

namespace fqbench {
namespace harness {

namespace fs = std::filesystem;

namespace {

constexpr const char* CSV_NAME = "results.csv";

std::string fixed(double v, int prec) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", prec, v);
  return buf;
}

} // namespace

/* ------------------------------- RunRecord ------------------------------- */

std::vector<std::string> RunRecord::failingTrials() const {
  std::vector<std::string> out;
  for (const auto& sc : executed) {
    for (const auto& r : sc.results) {
      if (!r.ok()) {
        std::string line = r.toolId + " (" + r.scenario.label() + "): " + r.statusText();
        if (!r.error.empty()) {
          line += " - " + r.error;
        }
        out.push_back(std::move(line));
      }
    }
  }
  return out;
}

/* ------------------------------ ResultWriter ------------------------------ */

ResultWriter::ResultWriter(const fs::path& resultsDir, const std::string& stamp)
    : runDir_(resultsDir / ("benchmark_" + stamp)) {
  ensureDir(runDir_);
}

void ResultWriter::ensureDir(const fs::path& dir) const {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw PersistenceError("cannot create " + dir.string() + ": " + ec.message());
  }
}

void ResultWriter::writeFile(const fs::path& path, const std::string& content) const {
  std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!out) {
    throw PersistenceError("cannot open " + path.string() + " for writing");
  }
  out << content;
  out.flush();
  if (!out) {
    throw PersistenceError("write failed: " + path.string());
  }
}

std::string ResultWriter::toJsonString(const Json::Value& v) {
  Json::StreamWriterBuilder writer;
  writer["indentation"] = "  ";
  return Json::writeString(writer, v) + "\n";
}

void ResultWriter::writeEnvironment(const Json::Value& env) {
  writeFile(runDir_ / "environment.json", toJsonString(env));
}

void ResultWriter::writeScenario(const CacheStatus& status,
                                 const std::vector<TrialResult>& results) {
  const TestScenario& s = status.scenario;
  ensureDir(scenarioDir(s));
  writeFile(scenarioFile(s, ".json"), toJsonString(scenarioJson(status, results)));
  writeFile(scenarioFile(s, ".md"), scenarioMarkdown(status, results));
  if (isColdState(s.cacheState)) {
    writeFile(scenarioFile(s, "_cache_status.txt"), cacheStatusText(status));
  }
  appendCsv(status, results);
}

void ResultWriter::appendCsv(const CacheStatus& status, const std::vector<TrialResult>& results) {
  const fs::path PATH = runDir_ / CSV_NAME;
  std::ofstream csv(PATH, csvHeaderWritten_ ? std::ios::out | std::ios::app
                                            : std::ios::out | std::ios::trunc);
  if (!csv) {
    throw PersistenceError("cannot open " + PATH.string() + " for writing");
  }
  if (!csvHeaderWritten_) {
    writeCsvHeader(csv, true);
    csvHeaderWritten_ = true;
  }
  const CsvMetadata META{captureTimestamp(), captureHostname(), capturePlatform()};
  for (const auto& r : results) {
    writeCsvRow(csv, r, cacheMethodName(status.method()), isDegraded(status.outcome), META);
  }
  csv.flush();
  if (!csv) {
    throw PersistenceError("write failed: " + PATH.string());
  }
}

/* ------------------------------- Rendering ------------------------------- */

Json::Value ResultWriter::captureEnvironment(const HarnessConfig& cfg, const std::string& engine) {
  const std::string RAM = shellQuote(cfg.ramPath);
  const std::string ROOT = shellQuote(cfg.root().string());

  Json::Value env;
  env["os"] = captureCommand("uname -o 2>/dev/null || uname -s");
  env["kernel"] = captureCommand("uname -r");
  env["architecture"] = captureCommand("uname -m", capturePlatform());
  env["hostname"] = captureHostname();
  env["cpu"] = captureCommand("grep -m1 'model name' /proc/cpuinfo 2>/dev/null | cut -d':' -f2");
  env["cpu_cores"] = captureCommand("nproc 2>/dev/null");
  env["cpu_threads"] = captureCommand("grep -c processor /proc/cpuinfo 2>/dev/null");
  env["ram"] = captureCommand("free -h 2>/dev/null | awk '/^Mem:/ {print $2}'");
  env["ram_total_bytes"] = captureCommand("free -b 2>/dev/null | awk '/^Mem:/ {print $2}'");
  env["ram_path"] = cfg.ramPath;
  env["ram_path_filesystem"] =
      captureCommand("df -T " + RAM + " 2>/dev/null | tail -1 | awk '{print $2}'");
  env["disk_device"] = captureCommand("df " + ROOT + " 2>/dev/null | tail -1 | awk '{print $1}'");
  env["filesystem"] = captureCommand("df -T " + ROOT + " 2>/dev/null | tail -1 | awk '{print $2}'");
  env["disk_total"] = captureCommand("df -h " + ROOT + " 2>/dev/null | tail -1 | awk '{print $2}'");
  env["disk_available"] =
      captureCommand("df -h " + ROOT + " 2>/dev/null | tail -1 | awk '{print $4}'");
  env["git_revision"] =
      captureCommand("git -C " + ROOT + " describe --always --dirty 2>/dev/null");
  env["python_version"] = captureCommand("python3 --version 2>/dev/null | cut -d' ' -f2");
  env["python_path"] = captureCommand("command -v python3 2>/dev/null");
  env["hyperfine_version"] = captureCommand("hyperfine --version 2>/dev/null | cut -d' ' -f2");
  env["vmtouch_version"] =
      captureCommand("vmtouch 2>&1 | grep -m1 -o 'vmtouch v[0-9.]*' | cut -d'v' -f3");
  env["java_version"] = captureCommand("java -version 2>&1 | head -1 | cut -d'\"' -f2");
  env["cache_drop_available"] = (std::system("sudo -n true >/dev/null 2>&1") == 0);
  env["timing_engine"] = engine;
  env["evictor"] = cfg.evictor;
  env["timestamp"] = captureTimestamp();
  env["date_local"] = captureLocalDate();
  return env;
}

Json::Value ResultWriter::scenarioJson(const CacheStatus& status,
                                       const std::vector<TrialResult>& results) {
  const TestScenario& s = status.scenario;

  Json::Value root;
  Json::Value& sc = root["scenario"];
  sc["size"] = s.sizeLabel;
  sc["reads"] = static_cast<Json::UInt64>(readCountForLabel(s.sizeLabel));
  sc["format"] = formatName(s.format);
  sc["cache_state"] = cacheStateName(s.cacheState);

  Json::Value& cs = root["cache_status"];
  cs["method"] = cacheMethodName(status.method());
  cs["degraded"] = isDegraded(status.outcome);
  if (const auto* d = std::get_if<Degraded>(&status.outcome)) {
    cs["reason"] = d->reason;
  }
  cs["timestamp"] = status.timestamp;
  cs["original_file"] = status.originalFile.string();
  cs["staged_file"] = status.stagedFile.string();
  if (!status.evictor.empty()) {
    cs["evictor"] = status.evictor;
  }
  if (status.residentAfter) {
    cs["resident_after"] = *status.residentAfter;
  }

  Json::Value& arr = root["results"];
  arr = Json::Value(Json::arrayValue);
  for (const auto& r : results) {
    Json::Value e;
    e["command"] = r.toolId;
    e["engine"] = r.engine;
    e["warmup"] = r.warmup;
    e["runs"] = r.runs;
    e["mean"] = r.stats.mean;
    e["stddev"] = r.stats.stddev;
    e["median"] = r.stats.median;
    e["p10"] = r.stats.p10;
    e["p90"] = r.stats.p90;
    e["min"] = r.stats.min;
    e["max"] = r.stats.max;
    e["cv"] = r.stats.cv;
    e["samples"] = static_cast<Json::UInt64>(r.stats.samples);
    e["exit_code"] = r.exitCode;
    e["status"] = r.statusText();
    e["output_file"] = r.outputPath.string();
    e["output_bytes"] = static_cast<Json::UInt64>(r.outputBytes);
    if (!r.error.empty()) {
      e["error"] = r.error;
    }
    arr.append(e);
  }
  return root;
}

std::string ResultWriter::scenarioMarkdown(const CacheStatus& status,
                                           const std::vector<TrialResult>& results) {
  const TestScenario& s = status.scenario;

  double fastest = 0.0;
  for (const auto& r : results) {
    if (r.ok() && r.stats.mean > 0.0 && (fastest == 0.0 || r.stats.mean < fastest)) {
      fastest = r.stats.mean;
    }
  }

  std::ostringstream md;
  md << "## " << s.label() << "\n\n";
  md << "Cache method: `" << cacheMethodName(status.method()) << "`";
  if (const auto* d = std::get_if<Degraded>(&status.outcome)) {
    md << " (degraded: " << d->reason << ")";
  }
  md << "\n\n";
  md << "| Command | Mean [s] | Min [s] | Max [s] | Relative | Status |\n";
  md << "|:---|---:|---:|---:|---:|:---|\n";
  for (const auto& r : results) {
    md << "| `" << r.toolId << "` | " << fixed(r.stats.mean, 3) << " ± "
       << fixed(r.stats.stddev, 3) << " | " << fixed(r.stats.min, 3) << " | "
       << fixed(r.stats.max, 3) << " | ";
    if (r.ok() && fastest > 0.0) {
      md << fixed(r.stats.mean / fastest, 2);
    } else {
      md << "-";
    }
    md << " | " << r.statusText() << " |\n";
  }
  return md.str();
}

std::string ResultWriter::cacheStatusText(const CacheStatus& status) {
  std::ostringstream out;
  out << "cache_method=" << cacheMethodName(status.method()) << "\n";
  out << "timestamp=" << status.timestamp << "\n";
  out << "original_file=" << status.originalFile.string() << "\n";
  if (status.stagedFile != status.originalFile) {
    out << "ram_file=" << status.stagedFile.string() << "\n";
  }
  if (!status.evictor.empty()) {
    out << "evictor=" << status.evictor << "\n";
  }
  if (status.residentAfter) {
    out << "resident_after=" << fixed(*status.residentAfter, 4) << "\n";
  }
  if (const auto* d = std::get_if<Degraded>(&status.outcome)) {
    out << "degraded_reason=" << d->reason << "\n";
  }
  return out.str();
}

/* -------------------------------- Summary -------------------------------- */

void ResultWriter::writeSummary(const RunRecord& record) {
  const HarnessConfig& cfg = record.config;
  std::ostringstream out;

  out << "FASTQ Parser Benchmark Summary\n";
  out << "==============================\n";
  out << "Date: " << captureLocalDate() << "\n";
  out << "Host: " << captureHostname() << "\n";
  out << "\n";

  out << "Test Configuration:\n";
  out << "  Test sizes benchmarked:";
  for (const auto& sz : record.sizes) {
    out << " " << sz;
  }
  out << "\n";
  out << "  Warmup runs (hot): " << cfg.warmup << "\n";
  out << "  Benchmark runs (hot, minimum): " << cfg.runs << "\n";
  out << "  Benchmark runs (cold): " << COLD_RUNS << "\n";
  out << "  Timing engine: " << record.engine << "\n";
  out << "  Evictor: " << record.evictor << "\n";
  out << "  RAM path: " << cfg.ramPath << "\n";
  out << "  Tools (" << record.tools.size() << "):";
  for (const auto& t : record.tools) {
    out << " " << t;
  }
  out << "\n\n";

  out << "File sizes:\n";
  for (const auto& sz : record.sizes) {
    out << "  " << sz << ":\n";
    for (const InputFormat F : cfg.enabledFormats()) {
      char label[16];
      std::snprintf(label, sizeof(label), "%s:", formatName(F));
      char line[128];
      std::snprintf(line, sizeof(line), "    %-7s %s\n", label,
                    humanFileSize(inputFilePath(cfg.dataDir(), sz, F)).c_str());
      out << line;
    }
  }
  out << "\n";

  out << "Scenarios executed (" << record.executed.size() << "):\n";
  for (const auto& sc : record.executed) {
    out << "  - " << sc.status.scenario.label() << " [" << cacheMethodName(sc.status.method());
    if (const auto* d = std::get_if<Degraded>(&sc.status.outcome)) {
      out << ", degraded: " << d->reason;
    }
    out << "]\n";
  }
  if (!record.skipped.empty()) {
    out << "\nScenarios skipped (" << record.skipped.size() << "):\n";
    for (const auto& sk : record.skipped) {
      out << "  - " << sk.scenario.label() << ": " << sk.reason << "\n";
    }
  }
  if (!record.generationFailures.empty()) {
    out << "\nGeneration failures:\n";
    for (const auto& g : record.generationFailures) {
      out << "  - " << g.sizeLabel << ": " << g.reason << "\n";
    }
  }
  const auto FAILING = record.failingTrials();
  if (!FAILING.empty()) {
    out << "\nFailing tools:\n";
    for (const auto& f : FAILING) {
      out << "  - " << f << "\n";
    }
  }

  // Directory tree and file count; SUMMARY.txt itself is counted.
  std::vector<std::string> dirs{runDir_.string()};
  std::size_t files = 1;
  std::error_code ec;
  fs::recursive_directory_iterator it(runDir_, ec);
  if (ec) {
    throw PersistenceError("cannot list " + runDir_.string() + ": " + ec.message());
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      throw PersistenceError("cannot list " + runDir_.string() + ": " + ec.message());
    }
    if (it->is_directory(ec)) {
      dirs.push_back(it->path().string());
    } else if (it->path().filename() != "SUMMARY.txt") {
      ++files;
    }
  }
  std::sort(dirs.begin() + 1, dirs.end());

  out << "\nResult directories:\n";
  for (const auto& d : dirs) {
    out << "  " << d << "\n";
  }
  out << "\nTotal result files: " << files << "\n";

  writeFile(runDir_ / "SUMMARY.txt", out.str());
}

} // namespace harness
} // namespace fqbench
