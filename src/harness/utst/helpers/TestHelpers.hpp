/**
 * @file TestHelpers.hpp
 * @brief Shared utilities for harness unit tests
 *
 * Provides scratch directories, executable tool scripts, and in-process fakes for the
 * data generator and the page-cache evictor.
 */

#ifndef FQBENCH_TEST_HELPERS_HPP
#define FQBENCH_TEST_HELPERS_HPP

#include <filesystem>
#include <fstream>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

#include "src/harness/inc/DataGenerator.hpp"
#include "src/harness/inc/HarnessErrors.hpp"
#include "src/harness/inc/HarnessUtils.hpp"
#include "src/harness/inc/PageCacheEvictor.hpp"
#include "src/harness/inc/Scenario.hpp"

namespace fqbench {
namespace harness {
namespace test {

/**
 * @brief Unique directory under the system temp dir, removed on destruction.
 */
class TempDir {
public:
  explicit TempDir(const std::string& stem = "fqbench_utst") {
    path_ = uniqTempFile(stem, "");
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const noexcept { return path_; }
  std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
  std::filesystem::path path_;
};

/** @brief Write `content` to `path`, creating parent directories. */
inline void writeFile(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

/**
 * @brief Write a /bin/sh script with the given body and mark it executable.
 * @param body Script lines without the shebang; "$1" is the input file.
 */
inline void writeScript(const std::filesystem::path& path, const std::string& body) {
  writeFile(path, "#!/bin/sh\n" + body + "\n");
  std::filesystem::permissions(path,
                               std::filesystem::perms::owner_all |
                                   std::filesystem::perms::group_read |
                                   std::filesystem::perms::group_exec |
                                   std::filesystem::perms::others_read |
                                   std::filesystem::perms::others_exec,
                               std::filesystem::perm_options::replace);
}

/** @brief Four-line FASTQ record repeated `reads` times. */
inline std::string makeFastq(int reads) {
  std::string out;
  for (int i = 0; i < reads; ++i) {
    out += "@read" + std::to_string(i) + "\nACGTACGTAC\n+\nIIIIIIIIII\n";
  }
  return out;
}

/** @brief Create every canonical file of `sizeLabel` for `formats` in `dataDir`. */
inline void makeInputs(const std::filesystem::path& dataDir, const std::string& sizeLabel,
                       const std::vector<InputFormat>& formats, int reads = 4) {
  for (const InputFormat F : formats) {
    writeFile(inputFilePath(dataDir, sizeLabel, F), makeFastq(reads));
  }
}

/**
 * @brief DataGenerator that writes small FASTQ files and counts calls.
 */
class FakeGenerator final : public DataGenerator {
public:
  std::string name() const override { return "fake"; }

  void generate(const GenerationRequest& req) override {
    ++calls;
    requests.push_back(req);
    if (failLabels.count(req.sizeLabel) != 0) {
      throw GenerationError("fake generator refused " + req.sizeLabel);
    }
    ++generation;
    for (const InputFormat F : req.formats) {
      const auto PATH = inputFilePath(req.outDir, req.sizeLabel, F);
      if (req.overwrite || !std::filesystem::exists(PATH)) {
        writeFile(PATH, makeFastq(2) + "# generation " + std::to_string(generation) + "\n");
      }
    }
  }

  int calls = 0;
  int generation = 0;
  std::vector<GenerationRequest> requests;
  std::set<std::string> failLabels;
};

/**
 * @brief PageCacheEvictor with scripted availability, result and residency.
 */
class FakeEvictor final : public PageCacheEvictor {
public:
  std::string name() const override { return "fake"; }
  bool available() const override { return isAvailable; }

  EvictionResult evict(const std::filesystem::path& file) override {
    ++evictCalls;
    lastFile = file;
    return evictOk ? EvictionResult{true, {}} : EvictionResult{false, "fake eviction failed"};
  }

  std::vector<std::string> evictCommand(const std::filesystem::path& file) const override {
    return {"true", file.string()};
  }

  std::optional<double> residentFraction(const std::filesystem::path&) const override {
    return resident;
  }

  bool isAvailable = true;
  bool evictOk = true;
  std::optional<double> resident = 0.0;
  int evictCalls = 0;
  std::filesystem::path lastFile;
};

} // namespace test
} // namespace harness
} // namespace fqbench

#endif // FQBENCH_TEST_HELPERS_HPP
