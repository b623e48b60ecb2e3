#ifndef FQBENCH_TESTMATRIX_HPP
#define FQBENCH_TESTMATRIX_HPP
/**
 * @file TestMatrix.hpp
 * @brief Expansion of sizes x formats x cache states into an ordered scenario list.
 *
 * Order: sizes numerically ascending, then formats (raw, gzip, bgzip), then cache states
 * (hot, cold, really-cold). Missing inputs are generated before their scenarios are enqueued;
 * a size whose generation fails is dropped and reported.
 */

#include <filesystem>
#include <string>
#include <vector>

#include "src/harness/inc/DataGenerator.hpp"
#include "src/harness/inc/Scenario.hpp"

namespace fqbench {
namespace harness {

/** @brief A size that was dropped because its inputs could not be generated. */
struct GenerationFailure {
  std::string sizeLabel;
  std::string reason;
};

struct MatrixRequest {
  std::vector<std::string> sizes;    ///< Explicit labels; empty = auto-discover
  std::filesystem::path dataDir;     ///< Canonical inputs live here
  std::vector<InputFormat> formats;  ///< Enabled formats (any order)
  std::vector<CacheState> states;    ///< Enabled cache states (any order)
};

struct MatrixPlan {
  std::vector<std::string> sizes;           ///< Sizes that made it into the run, ascending
  std::vector<TestScenario> scenarios;      ///< Ordered scenario sequence
  std::vector<GenerationFailure> failures;  ///< Sizes dropped by generation failure
  int generationCalls = 0;                  ///< Number of DataGenerator::generate() calls
};

/* ---------------------------- TestMatrixBuilder ---------------------------- */

class TestMatrixBuilder {
public:
  explicit TestMatrixBuilder(DataGenerator& generator) : generator_(generator) {}

  /**
   * @brief Resolve sizes, materialize missing inputs, and expand the matrix.
   * @throws SetupError for malformed explicit size labels.
   */
  MatrixPlan build(const MatrixRequest& req);

  /** @brief Size labels of every `<label>.fastq` in dataDir whose label is well-formed. */
  static std::vector<std::string> discoverSizes(const std::filesystem::path& dataDir);

  /** @brief Sort labels by their numeric value and drop duplicates. */
  static void sortSizes(std::vector<std::string>& labels);

  /** @brief Cartesian expansion in canonical order (inputs are reordered, not trusted). */
  static std::vector<TestScenario> expand(const std::vector<std::string>& sizes,
                                          const std::vector<InputFormat>& formats,
                                          const std::vector<CacheState>& states);

  /** @brief Enabled formats whose canonical file is absent for `label`. */
  static std::vector<InputFormat> missingFormats(const std::filesystem::path& dataDir,
                                                 const std::string& label,
                                                 const std::vector<InputFormat>& formats);

private:
  /** @return empty string on success, else the failure reason. */
  std::string ensureInputs(const std::filesystem::path& dataDir, const std::string& label,
                           const std::vector<InputFormat>& formats, int& calls);

  DataGenerator& generator_;
};

} // namespace harness
} // namespace fqbench

#endif // FQBENCH_TESTMATRIX_HPP
