#ifndef FQBENCH_DATAGENERATOR_HPP
#define FQBENCH_DATAGENERATOR_HPP
/**
 * @file DataGenerator.hpp
 * @brief Facade over the external synthetic-data pipeline (genome -> reads -> compression).
 *
 * The harness never synthesizes reads itself; it drives BBTools and gzip/pigz and checks
 * that the expected files appear.
 */

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "src/harness/inc/Scenario.hpp"

namespace fqbench {
namespace harness {

/* --------------------------- GenerationRequest --------------------------- */

struct GenerationRequest {
  std::string sizeLabel;            ///< e.g. "0.1m"
  std::filesystem::path outDir;     ///< Files land here as inputFileName(sizeLabel, fmt)
  std::vector<InputFormat> formats; ///< Formats that must exist afterwards
  bool overwrite = false;           ///< Regenerate even when a file already exists
};

/* ----------------------------- DataGenerator ----------------------------- */

/**
 * @note Blocking; large sizes take minutes.
 */
class DataGenerator {
public:
  virtual ~DataGenerator() = default;

  /** @brief Stable name for logs ("bbtools"). */
  virtual std::string name() const = 0;

  /**
   * @brief Make every requested format exist in req.outDir.
   * @throws GenerationError when any step fails or an expected file is missing afterwards.
   */
  virtual void generate(const GenerationRequest& req) = 0;
};

/* ---------------------------- BbtoolsGenerator ---------------------------- */

/**
 * @brief BBTools-backed generator.
 *
 * Steps (skipping files that already exist unless overwrite is set):
 *   1. randomgenome.sh len=100000 seed=42 out=<outDir>/ref_genome_<size>.fa
 *   2. randomreads.sh ref=<genome> out=<size>.fastq reads=<N> length=150 seed=42
 *   3. pigz -c (or gzip -c) <size>.fastq > <size>.fastq.gz
 *   4. randomreads.sh ... out=<size>.fastq_bgzipped.gz  (BBTools writes BGZF for .gz)
 *   5. remove the temporary genome
 */
class BbtoolsGenerator final : public DataGenerator {
public:
  explicit BbtoolsGenerator(std::filesystem::path bbtoolsDir) : dir_(std::move(bbtoolsDir)) {}

  std::string name() const override { return "bbtools"; }
  void generate(const GenerationRequest& req) override;

  static constexpr int GENOME_LENGTH = 100000;
  static constexpr int READ_LENGTH = 150;
  static constexpr int SEED = 42;

private:
  void runStep(const std::vector<std::string>& argv, const std::string& what) const;

  std::filesystem::path dir_;
};

/** @brief Standard sizes generated when auto-discovery finds no input at all. */
inline const std::vector<std::string>& standardSizeLabels() {
  static const std::vector<std::string> LABELS{"0.1m", "0.5m", "1m", "10m", "30m", "50m", "70m"};
  return LABELS;
}

} // namespace harness
} // namespace fqbench

#endif // FQBENCH_DATAGENERATOR_HPP
