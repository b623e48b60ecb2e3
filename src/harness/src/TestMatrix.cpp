/**
 * @file TestMatrix.cpp
 * @brief Size discovery, input materialization and scenario expansion.
 */

#include "src/harness/inc/TestMatrix.hpp"

#include <algorithm>
#include <cstdio>
#include <system_error>

#include "src/harness/inc/HarnessErrors.hpp"

namespace fqbench {
namespace harness {

namespace fs = std::filesystem;

namespace {

template <typename T, std::size_t N>
std::vector<T> inCanonicalOrder(const std::array<T, N>& order, const std::vector<T>& enabled) {
  std::vector<T> out;
  for (const T VAL : order) {
    if (std::find(enabled.begin(), enabled.end(), VAL) != enabled.end()) {
      out.push_back(VAL);
    }
  }
  return out;
}

bool hasAnyFastq(const fs::path& dataDir) {
  std::error_code ec;
  if (!fs::is_directory(dataDir, ec)) {
    return false;
  }
  for (const auto& entry : fs::directory_iterator(dataDir, ec)) {
    if (entry.path().extension() == ".fastq") {
      return true;
    }
  }
  return false;
}

} // namespace

std::vector<std::string> TestMatrixBuilder::discoverSizes(const fs::path& dataDir) {
  std::vector<std::string> out;
  std::error_code ec;
  if (!fs::is_directory(dataDir, ec)) {
    return out;
  }
  for (const auto& entry : fs::directory_iterator(dataDir, ec)) {
    const fs::path& p = entry.path();
    if (p.extension() != ".fastq") {
      continue;
    }
    std::error_code fec;
    if (!entry.is_regular_file(fec)) {
      continue;
    }
    const std::string LABEL = p.stem().string();
    if (parseSizeLabel(LABEL)) {
      out.push_back(LABEL);
    }
  }
  sortSizes(out);
  return out;
}

void TestMatrixBuilder::sortSizes(std::vector<std::string>& labels) {
  std::stable_sort(labels.begin(), labels.end(), [](const std::string& a, const std::string& b) {
    const double VA = parseSizeLabel(a).value_or(0.0);
    const double VB = parseSizeLabel(b).value_or(0.0);
    if (VA != VB) {
      return VA < VB;
    }
    return a < b;
  });
  labels.erase(std::unique(labels.begin(), labels.end()), labels.end());
}

std::vector<TestScenario> TestMatrixBuilder::expand(const std::vector<std::string>& sizes,
                                                    const std::vector<InputFormat>& formats,
                                                    const std::vector<CacheState>& states) {
  std::vector<std::string> orderedSizes = sizes;
  sortSizes(orderedSizes);
  const auto FORMATS = inCanonicalOrder(ALL_FORMATS, formats);
  const auto STATES = inCanonicalOrder(ALL_CACHE_STATES, states);

  std::vector<TestScenario> out;
  out.reserve(orderedSizes.size() * FORMATS.size() * STATES.size());
  for (const auto& size : orderedSizes) {
    for (const InputFormat F : FORMATS) {
      for (const CacheState C : STATES) {
        out.push_back(TestScenario{size, F, C});
      }
    }
  }
  return out;
}

std::vector<InputFormat> TestMatrixBuilder::missingFormats(const fs::path& dataDir,
                                                           const std::string& label,
                                                           const std::vector<InputFormat>& formats) {
  std::vector<InputFormat> out;
  for (const InputFormat F : inCanonicalOrder(ALL_FORMATS, formats)) {
    std::error_code ec;
    if (!fs::is_regular_file(inputFilePath(dataDir, label, F), ec)) {
      out.push_back(F);
    }
  }
  return out;
}

std::string TestMatrixBuilder::ensureInputs(const fs::path& dataDir, const std::string& label,
                                            const std::vector<InputFormat>& formats, int& calls) {
  const auto MISSING = missingFormats(dataDir, label, formats);
  if (MISSING.empty()) {
    return {};
  }

  std::printf("Test files for size %s not found. Generating...\n", label.c_str());
  GenerationRequest req;
  req.sizeLabel = label;
  req.outDir = dataDir;
  req.formats = MISSING;
  ++calls;
  try {
    generator_.generate(req);
  } catch (const GenerationError& e) {
    return e.what();
  }

  const auto STILL_MISSING = missingFormats(dataDir, label, formats);
  if (!STILL_MISSING.empty()) {
    return std::string(generator_.name()) + " finished but " +
           inputFileName(label, STILL_MISSING.front()) + " is missing";
  }
  return {};
}

MatrixPlan TestMatrixBuilder::build(const MatrixRequest& req) {
  MatrixPlan plan;

  std::vector<std::string> sizes;
  if (!req.sizes.empty()) {
    for (const auto& label : req.sizes) {
      if (!parseSizeLabel(label)) {
        throw SetupError("invalid size label '" + label + "'");
      }
    }
    sizes = req.sizes;
    sortSizes(sizes);
    std::printf("Using specified sizes:");
  } else {
    std::printf("Auto-discovering test sizes from: %s\n", req.dataDir.c_str());
    if (!hasAnyFastq(req.dataDir)) {
      std::printf("No test files found. Generating standard test files...\n");
      for (const auto& label : standardSizeLabels()) {
        const std::string REASON = ensureInputs(req.dataDir, label, req.formats,
                                                plan.generationCalls);
        if (!REASON.empty()) {
          std::fprintf(stderr, "[WARN] Generation failed for %s: %s\n", label.c_str(),
                       REASON.c_str());
          plan.failures.push_back(GenerationFailure{label, REASON});
        }
      }
    }
    sizes = discoverSizes(req.dataDir);
    std::printf("Found %zu test sizes:", sizes.size());
  }
  for (const auto& s : sizes) {
    std::printf(" %s", s.c_str());
  }
  std::printf("\n");

  for (const auto& label : sizes) {
    const bool ALREADY_FAILED =
        std::any_of(plan.failures.begin(), plan.failures.end(),
                    [&](const GenerationFailure& f) { return f.sizeLabel == label; });
    if (ALREADY_FAILED) {
      continue;
    }
    const std::string REASON = ensureInputs(req.dataDir, label, req.formats, plan.generationCalls);
    if (!REASON.empty()) {
      std::fprintf(stderr, "[WARN] Generation failed for %s, skipping its scenarios: %s\n",
                   label.c_str(), REASON.c_str());
      plan.failures.push_back(GenerationFailure{label, REASON});
      continue;
    }
    plan.sizes.push_back(label);
  }

  plan.scenarios = expand(plan.sizes, req.formats, req.states);
  return plan;
}

} // namespace harness
} // namespace fqbench
