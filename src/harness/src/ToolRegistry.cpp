/**
 * @file ToolRegistry.cpp
 * @brief Tool discovery and direct invocation.
 */

#include "src/harness/inc/ToolRegistry.hpp"

#include <system_error>

#include <unistd.h>

#include "src/harness/inc/HarnessErrors.hpp"
#include "src/harness/inc/HarnessUtils.hpp"

namespace fqbench {
namespace harness {

namespace fs = std::filesystem;

/* ----------------------------- ToolAdapter ----------------------------- */

std::vector<std::string> ToolAdapter::argv(const fs::path& inputFile) const {
  return {descriptor_.invocationPath.string(), inputFile.string()};
}

InvocationResult ToolAdapter::invoke(const fs::path& inputFile, int timeoutSec) const {
  const fs::path CAPTURE = uniqTempFile("fqbench_invoke_" + descriptor_.identifier, ".txt");

  ProcessSpec spec;
  spec.argv = argv(inputFile);
  spec.stdoutPath = CAPTURE;
  spec.mergeStderr = true;
  spec.timeoutSec = timeoutSec;
  const ProcessResult PR = runProcess(spec);

  InvocationResult out;
  out.exitCode = PR.exitCode;
  out.wallSeconds = PR.wallSeconds;
  out.output = slurp(CAPTURE);

  std::error_code ec;
  fs::remove(CAPTURE, ec);
  return out;
}

/* ----------------------------- ToolRegistry ----------------------------- */

std::string ToolRegistry::normalizeIdentifier(const fs::path& file) {
  return file.filename().stem().string();
}

ToolRegistry ToolRegistry::discover(const fs::path& directory) {
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    throw SetupError("tool directory not found: " + directory.string());
  }

  std::map<std::string, ToolAdapter> tools;
  std::map<std::string, fs::path> origin;

  for (const auto& entry : fs::directory_iterator(directory, ec)) {
    const fs::path& p = entry.path();
    const std::string NAME = p.filename().string();
    if (NAME.empty() || NAME.front() == '.') {
      continue;
    }
    std::error_code fec;
    if (!entry.is_regular_file(fec) || fec) {
      continue;
    }
    if (::access(p.c_str(), X_OK) != 0) {
      continue;
    }

    const std::string ID = normalizeIdentifier(p);
    if (ID.empty()) {
      continue;
    }
    const auto PREV = origin.find(ID);
    if (PREV != origin.end()) {
      // Report in name order so the message is stable across filesystems.
      const std::string A = PREV->second.filename().string();
      throw (A < NAME) ? DuplicateToolError(ID, A, NAME) : DuplicateToolError(ID, NAME, A);
    }

    std::error_code aec;
    fs::path abs = fs::absolute(p, aec);
    if (aec) {
      abs = p;
    }
    origin.emplace(ID, p);
    tools.emplace(ID, ToolAdapter(ToolDescriptor{ID, abs}));
  }
  if (ec) {
    throw SetupError("cannot read tool directory " + directory.string() + ": " + ec.message());
  }
  if (tools.empty()) {
    throw SetupError("no executable tools found in " + directory.string());
  }

  return ToolRegistry(std::move(tools));
}

std::vector<std::string> ToolRegistry::identifiers() const {
  std::vector<std::string> out;
  out.reserve(tools_.size());
  for (const auto& kv : tools_) {
    out.push_back(kv.first);
  }
  return out;
}

} // namespace harness
} // namespace fqbench
