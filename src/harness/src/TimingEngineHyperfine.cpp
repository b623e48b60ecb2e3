/**
 * @file TimingEngineHyperfine.cpp
 * @brief hyperfine backend: one hyperfine process per tool, JSON export parsed with jsoncpp.
 */

#include "src/harness/inc/TimingEngine.hpp"

#include <cstdio>
#include <sstream>
#include <system_error>

#include <json/json.h>

#include "src/harness/inc/HarnessUtils.hpp"
#include "src/harness/inc/Subprocess.hpp"

namespace fqbench {
namespace harness {

namespace fs = std::filesystem;

/* ------------------------------- Helpers ------------------------------- */

std::string HyperfineTimingEngine::renderPreparation(const RunPreparation& prep) {
  std::vector<std::string> steps;
  if (!prep.removePaths.empty()) {
    std::vector<std::string> rm{"rm", "-rf"};
    for (const auto& p : prep.removePaths) {
      rm.push_back(p.string());
    }
    steps.push_back(shellJoin(rm));
  }
  if (prep.copy) {
    steps.push_back(shellJoin({"cp", prep.copy->first.string(), prep.copy->second.string()}));
  }
  if (!prep.evictCommand.empty()) {
    steps.push_back(shellJoin(prep.evictCommand));
  }

  std::string out;
  for (const auto& s : steps) {
    if (!out.empty()) {
      out += " && ";
    }
    out += s;
  }
  return out;
}

std::vector<std::string>
HyperfineTimingEngine::buildCommand(const TimingRequest& req, const fs::path& exportPath) const {
  std::vector<std::string> cmd{executable_};
  cmd.push_back("--warmup");
  cmd.push_back(std::to_string(req.warmup));
  cmd.push_back(req.minRuns ? "--min-runs" : "--runs");
  cmd.push_back(std::to_string(req.runs));

  const std::string PREPARE = renderPreparation(req.prepare);
  if (!PREPARE.empty()) {
    cmd.push_back("--prepare");
    cmd.push_back(PREPARE);
  }
  cmd.push_back("--ignore-failure");
  cmd.push_back("--export-json");
  cmd.push_back(exportPath.string());
  cmd.push_back("--command-name");
  cmd.push_back(req.name);

  std::string body = shellJoin(req.argv) + " > " + shellQuote(req.capturePath.string()) + " 2>&1";
  if (req.timeoutSec > 0) {
    body = "timeout -k 1 " + std::to_string(req.timeoutSec) + " " + body;
  }
  cmd.push_back(body);
  return cmd;
}

TimingOutcome HyperfineTimingEngine::parseExport(const std::string& json) {
  TimingOutcome out;

  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errs;
  std::istringstream in(json);
  if (!Json::parseFromStream(builder, in, &root, &errs)) {
    out.error = "invalid hyperfine export: " + errs;
    return out;
  }

  const Json::Value& results = root["results"];
  if (!results.isArray() || results.empty()) {
    out.error = "hyperfine export has no results";
    return out;
  }

  const Json::Value& first = results[0];
  const Json::Value& times = first["times"];
  if (!times.isArray() || times.empty()) {
    out.error = "hyperfine export has no run times";
    return out;
  }
  for (const auto& t : times) {
    out.times.push_back(t.asDouble());
  }

  const Json::Value& codes = first["exit_codes"];
  if (codes.isArray()) {
    for (const auto& c : codes) {
      // null when hyperfine could not determine the status (killed by signal)
      out.exitCodes.push_back(c.isNull() ? -1 : c.asInt());
    }
  }

  std::vector<double> samples = out.times;
  out.stats = summarize(samples);
  out.exitCode = firstFailure(out.exitCodes);
  return out;
}

/* ------------------------- HyperfineTimingEngine ------------------------- */

TimingOutcome HyperfineTimingEngine::measure(const TimingRequest& req) {
  const fs::path EXPORT = uniqTempFile("fqbench_hyperfine_" + req.name, ".json");

  ProcessSpec spec;
  spec.argv = buildCommand(req, EXPORT);
  spec.workDir = req.workDir;
  spec.inheritStdio = true;
  const ProcessResult R = runProcess(spec);

  TimingOutcome out;
  if (!R.launched) {
    out.error = R.error;
  } else if (R.exitCode != 0) {
    out.error = executable_ + " exited with code " + std::to_string(R.exitCode);
  } else {
    const std::string DOC = slurp(EXPORT);
    out = DOC.empty() ? TimingOutcome{} : parseExport(DOC);
    if (DOC.empty()) {
      out.error = "hyperfine produced no export at " + EXPORT.string();
    }
  }

  std::error_code ec;
  fs::remove(EXPORT, ec);

  const std::string CONCLUDE_ERR = applyPreparation(req.conclude, req.workDir);
  if (!CONCLUDE_ERR.empty()) {
    std::fprintf(stderr, "  [WARN] %s: conclude step failed: %s\n", req.name.c_str(),
                 CONCLUDE_ERR.c_str());
  }
  return out;
}

} // namespace harness
} // namespace fqbench
