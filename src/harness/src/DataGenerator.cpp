/**
 * @file DataGenerator.cpp
 * @brief BBTools + gzip/pigz implementation of the synthetic-data pipeline.
 */

#include "src/harness/inc/DataGenerator.hpp"

#include <algorithm>
#include <cstdio>
#include <system_error>

#include "src/harness/inc/HarnessErrors.hpp"
#include "src/harness/inc/HarnessUtils.hpp"
#include "src/harness/inc/Subprocess.hpp"

namespace fqbench {
namespace harness {

namespace fs = std::filesystem;

namespace {

bool wants(const GenerationRequest& req, InputFormat f) {
  return std::find(req.formats.begin(), req.formats.end(), f) != req.formats.end();
}

bool needsFile(const fs::path& p, bool overwrite) {
  std::error_code ec;
  return overwrite || !fs::exists(p, ec);
}

void requireNonEmpty(const fs::path& p, const std::string& what) {
  std::error_code ec;
  const auto BYTES = fs::file_size(p, ec);
  if (ec || BYTES == 0) {
    throw GenerationError(what + " did not produce " + p.string());
  }
}

} // namespace

void BbtoolsGenerator::runStep(const std::vector<std::string>& argv,
                               const std::string& what) const {
  const ProcessResult R = runQuiet(argv);
  if (!R.launched) {
    throw GenerationError(what + ": " + R.error);
  }
  if (R.exitCode != 0) {
    throw GenerationError(what + " failed with exit code " + std::to_string(R.exitCode));
  }
}

void BbtoolsGenerator::generate(const GenerationRequest& req) {
  const std::uint64_t READS = readCountForLabel(req.sizeLabel);
  if (READS == 0) {
    throw GenerationError("invalid size label '" + req.sizeLabel + "'");
  }

  std::error_code ec;
  fs::create_directories(req.outDir, ec);
  if (ec) {
    throw GenerationError("cannot create " + req.outDir.string() + ": " + ec.message());
  }

  const fs::path RAW = inputFilePath(req.outDir, req.sizeLabel, InputFormat::Raw);
  const fs::path GZ = inputFilePath(req.outDir, req.sizeLabel, InputFormat::Gzip);
  const fs::path BGZ = inputFilePath(req.outDir, req.sizeLabel, InputFormat::Bgzip);

  // gzip is compressed from the raw file, so raw is needed whenever gzip is.
  const bool NEED_GZ = wants(req, InputFormat::Gzip) && needsFile(GZ, req.overwrite);
  const bool NEED_RAW =
      (wants(req, InputFormat::Raw) || NEED_GZ) && needsFile(RAW, req.overwrite);
  const bool NEED_BGZ = wants(req, InputFormat::Bgzip) && needsFile(BGZ, req.overwrite);
  if (!NEED_RAW && !NEED_GZ && !NEED_BGZ) {
    return;
  }

  std::printf("Generating test files for size: %s (%llu reads)...\n", req.sizeLabel.c_str(),
              static_cast<unsigned long long>(READS));

  const fs::path GENOME = req.outDir / ("ref_genome_" + req.sizeLabel + ".fa");
  const std::string SEED_ARG = "seed=" + std::to_string(SEED);

  // The genome is temporary; remove it on every exit path.
  struct GenomeGuard {
    fs::path path;
    ~GenomeGuard() {
      std::error_code gec;
      fs::remove(path, gec);
    }
  } guard{GENOME};

  if (NEED_RAW || NEED_BGZ) {
    std::printf("  Creating reference genome...\n");
    runStep({(dir_ / "randomgenome.sh").string(), "len=" + std::to_string(GENOME_LENGTH), SEED_ARG,
             "out=" + GENOME.string(), "overwrite=t"},
            "randomgenome.sh");
    requireNonEmpty(GENOME, "randomgenome.sh");
  }

  const auto READS_ARGV = [&](const fs::path& out) -> std::vector<std::string> {
    return {(dir_ / "randomreads.sh").string(),
            "ref=" + GENOME.string(),
            "out=" + out.string(),
            "reads=" + std::to_string(READS),
            "length=" + std::to_string(READ_LENGTH),
            SEED_ARG,
            "overwrite=t"};
  };

  if (NEED_RAW) {
    std::printf("  Creating raw FASTQ (%llu reads)...\n", static_cast<unsigned long long>(READS));
    runStep(READS_ARGV(RAW), "randomreads.sh (raw)");
    requireNonEmpty(RAW, "randomreads.sh (raw)");
    std::printf("    %s (%s)\n", RAW.c_str(), humanFileSize(RAW).c_str());
  }

  if (NEED_GZ) {
    std::printf("  Creating gzipped FASTQ...\n");
    const std::string COMPRESSOR = commandAvailable("pigz") ? "pigz" : "gzip";
    ProcessSpec spec;
    spec.argv = {COMPRESSOR, "-c", RAW.string()};
    spec.stdoutPath = GZ;
    spec.mergeStderr = false;
    const ProcessResult R = runProcess(spec);
    if (!R.ok()) {
      fs::remove(GZ, ec);
      throw GenerationError(COMPRESSOR + " failed with exit code " + std::to_string(R.exitCode) +
                            (R.error.empty() ? "" : ": " + R.error));
    }
    requireNonEmpty(GZ, COMPRESSOR);
    std::printf("    %s (%s)\n", GZ.c_str(), humanFileSize(GZ).c_str());
  }

  if (NEED_BGZ) {
    std::printf("  Creating bgzipped FASTQ...\n");
    runStep(READS_ARGV(BGZ), "randomreads.sh (bgzip)");
    requireNonEmpty(BGZ, "randomreads.sh (bgzip)");
    std::printf("    %s (%s)\n", BGZ.c_str(), humanFileSize(BGZ).c_str());
  }
}

} // namespace harness
} // namespace fqbench
