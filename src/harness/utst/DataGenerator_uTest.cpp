/**
 * @file DataGenerator_uTest.cpp
 * @brief Unit tests for fqbench::harness::BbtoolsGenerator against stand-in BBTools scripts.
 *
 * The stand-ins write a few reads to their out= argument and log each call.
 */

#include "src/harness/inc/DataGenerator.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "src/harness/inc/HarnessErrors.hpp"
#include "src/harness/inc/HarnessUtils.hpp"
#include "src/harness/utst/helpers/TestHelpers.hpp"

namespace fs = std::filesystem;

using fqbench::harness::BbtoolsGenerator;
using fqbench::harness::GenerationError;
using fqbench::harness::GenerationRequest;
using fqbench::harness::InputFormat;
using fqbench::harness::inputFilePath;
using fqbench::harness::slurp;
using fqbench::harness::test::makeInputs;
using fqbench::harness::test::TempDir;
using fqbench::harness::test::writeScript;

namespace {

/** @brief BBTools directory whose scripts write to out= and append their name to calls.log. */
void makeBbtools(const TempDir& dir, int readsExit = 0) {
  const std::string LOG = (dir / "calls.log").string();
  const std::string WRITE_OUT = "for a in \"$@\"; do case \"$a\" in out=*) printf "
                                "'@r1\\nACGT\\n+\\nIIII\\n' > \"${a#out=}\";; esac; done";
  writeScript(dir / "bbtools" / "randomgenome.sh",
              "echo randomgenome >> '" + LOG + "'\n" + WRITE_OUT);
  writeScript(dir / "bbtools" / "randomreads.sh",
              "echo \"randomreads $*\" >> '" + LOG + "'\n" + WRITE_OUT + "\nexit " +
                  std::to_string(readsExit));
}

GenerationRequest request(const fs::path& outDir, std::vector<InputFormat> formats) {
  GenerationRequest req;
  req.sizeLabel = "0.1m";
  req.outDir = outDir;
  req.formats = std::move(formats);
  return req;
}

} // namespace

/** @test Raw and gzip are produced; the temporary genome is removed. */
TEST(DataGeneratorTest, RawAndGzip) {
  TempDir dir;
  makeBbtools(dir);
  BbtoolsGenerator gen(dir / "bbtools");

  gen.generate(request(dir / "data", {InputFormat::Raw, InputFormat::Gzip}));

  EXPECT_TRUE(fs::exists(inputFilePath(dir / "data", "0.1m", InputFormat::Raw)));
  EXPECT_TRUE(fs::exists(inputFilePath(dir / "data", "0.1m", InputFormat::Gzip)));
  EXPECT_FALSE(fs::exists(dir / "data" / "ref_genome_0.1m.fa"));

  const std::string CALLS = slurp(dir / "calls.log");
  EXPECT_NE(CALLS.find("reads=100000"), std::string::npos);
  EXPECT_NE(CALLS.find("length=150"), std::string::npos);
  EXPECT_NE(CALLS.find("seed=42"), std::string::npos);
}

/** @test Bgzip alone comes straight from randomreads; no raw file is left. */
TEST(DataGeneratorTest, BgzipOnly) {
  TempDir dir;
  makeBbtools(dir);
  BbtoolsGenerator gen(dir / "bbtools");

  gen.generate(request(dir / "data", {InputFormat::Bgzip}));

  EXPECT_TRUE(fs::exists(inputFilePath(dir / "data", "0.1m", InputFormat::Bgzip)));
  EXPECT_FALSE(fs::exists(inputFilePath(dir / "data", "0.1m", InputFormat::Raw)));
  EXPECT_NE(slurp(dir / "calls.log").find("out=" + (dir / "data").string() +
                                          "/0.1m.fastq_bgzipped.gz"),
            std::string::npos);
}

/** @test Existing files are left alone unless overwrite is set. */
TEST(DataGeneratorTest, ExistingFilesSkipped) {
  TempDir dir;
  makeBbtools(dir);
  makeInputs(dir / "data", "0.1m", {InputFormat::Raw});
  BbtoolsGenerator gen(dir / "bbtools");

  gen.generate(request(dir / "data", {InputFormat::Raw}));
  EXPECT_FALSE(fs::exists(dir / "calls.log"));

  auto req = request(dir / "data", {InputFormat::Raw});
  req.overwrite = true;
  gen.generate(req);
  EXPECT_TRUE(fs::exists(dir / "calls.log"));
}

/** @test A failing BBTools step is a GenerationError and still removes the genome. */
TEST(DataGeneratorTest, FailingStepThrows) {
  TempDir dir;
  makeBbtools(dir, 1);
  BbtoolsGenerator gen(dir / "bbtools");

  EXPECT_THROW(gen.generate(request(dir / "data", {InputFormat::Raw})), GenerationError);
  EXPECT_FALSE(fs::exists(dir / "data" / "ref_genome_0.1m.fa"));
}

/** @test Missing BBTools and malformed labels are GenerationErrors. */
TEST(DataGeneratorTest, BadSetupThrows) {
  TempDir dir;
  BbtoolsGenerator gen(dir / "no-bbtools");

  EXPECT_THROW(gen.generate(request(dir / "data", {InputFormat::Raw})), GenerationError);

  auto req = request(dir / "data", {InputFormat::Raw});
  req.sizeLabel = "big";
  EXPECT_THROW(gen.generate(req), GenerationError);
}
