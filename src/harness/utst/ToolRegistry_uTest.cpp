/**
 * @file ToolRegistry_uTest.cpp
 * @brief Unit tests for fqbench::harness::ToolRegistry and ToolAdapter.
 *
 * Tests discovery filters, identifier normalization, duplicate detection and direct invocation.
 */

#include "src/harness/inc/ToolRegistry.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "src/harness/inc/HarnessErrors.hpp"
#include "src/harness/utst/helpers/TestHelpers.hpp"

using fqbench::harness::DuplicateToolError;
using fqbench::harness::SetupError;
using fqbench::harness::ToolRegistry;
using fqbench::harness::test::TempDir;
using fqbench::harness::test::writeFile;
using fqbench::harness::test::writeScript;

/* ----------------------------- Discovery Tests ----------------------------- */

/** @test Only visible executable regular files are registered, in identifier order. */
TEST(ToolRegistryTest, DiscoverFiltersEntries) {
  TempDir dir;
  writeScript(dir / "needletail-rust.sh", "echo 4");
  writeScript(dir / "biofast-py1-4l.sh", "echo 4");
  writeScript(dir / "fastqscanMT2c", "echo 4");
  writeScript(dir / ".hidden.sh", "echo 4");
  writeFile(dir / "README.md", "not a tool");
  std::filesystem::create_directories(dir / "obsolete");
  writeScript(dir / "obsolete" / "old-tool.sh", "echo 4");

  const ToolRegistry REG = ToolRegistry::discover(dir.path());

  EXPECT_EQ(REG.identifiers(),
            (std::vector<std::string>{"biofast-py1-4l", "fastqscanMT2c", "needletail-rust"}));
  EXPECT_TRUE(REG.contains("needletail-rust"));
  EXPECT_FALSE(REG.contains("old-tool"));
  EXPECT_FALSE(REG.contains("README"));
  EXPECT_EQ(REG.at("needletail-rust").descriptor().invocationPath.filename(),
            "needletail-rust.sh");
  EXPECT_TRUE(REG.at("needletail-rust").descriptor().invocationPath.is_absolute());
}

/** @test Identifier is the file name with its last extension removed. */
TEST(ToolRegistryTest, NormalizeIdentifier) {
  EXPECT_EQ(ToolRegistry::normalizeIdentifier("tools/needletail-rust.sh"), "needletail-rust");
  EXPECT_EQ(ToolRegistry::normalizeIdentifier("paraseq-filt_pyMT2c.sh"), "paraseq-filt_pyMT2c");
  EXPECT_EQ(ToolRegistry::normalizeIdentifier("fastqscan"), "fastqscan");
  EXPECT_EQ(ToolRegistry::normalizeIdentifier("a.b.sh"), "a.b");
}

/** @test Two entries with the same identifier raise DuplicateToolError naming both. */
TEST(ToolRegistryTest, DuplicateIdentifierThrows) {
  TempDir dir;
  writeScript(dir / "seqtk.sh", "echo 1");
  writeScript(dir / "seqtk.py", "echo 2");

  try {
    (void)ToolRegistry::discover(dir.path());
    FAIL() << "expected DuplicateToolError";
  } catch (const DuplicateToolError& e) {
    EXPECT_EQ(e.identifier(), "seqtk");
    const std::string MSG = e.what();
    EXPECT_NE(MSG.find("seqtk.py"), std::string::npos);
    EXPECT_NE(MSG.find("seqtk.sh"), std::string::npos);
  }
}

/** @test DuplicateToolError is a SetupError. */
TEST(ToolRegistryTest, DuplicateIsSetupError) {
  TempDir dir;
  writeScript(dir / "x.sh", "true");
  writeScript(dir / "x.bash", "true");

  EXPECT_THROW((void)ToolRegistry::discover(dir.path()), SetupError);
}

/** @test A missing directory is a setup error. */
TEST(ToolRegistryTest, MissingDirectoryThrows) {
  TempDir dir;
  EXPECT_THROW((void)ToolRegistry::discover(dir / "does-not-exist"), SetupError);
}

/** @test A directory without usable entries is a setup error. */
TEST(ToolRegistryTest, EmptyDirectoryThrows) {
  TempDir dir;
  writeFile(dir / "notes.txt", "no exec bit");

  EXPECT_THROW((void)ToolRegistry::discover(dir.path()), SetupError);
}

/* ----------------------------- Adapter Tests ----------------------------- */

/** @test argv is exactly {invocationPath, input}. */
TEST(ToolRegistryTest, AdapterArgvIsPathAndInput) {
  TempDir dir;
  writeScript(dir / "count.sh", "echo ok");
  const ToolRegistry REG = ToolRegistry::discover(dir.path());

  const auto ARGV = REG.at("count").argv("/tmp/1m.fastq");

  ASSERT_EQ(ARGV.size(), 2u);
  EXPECT_EQ(ARGV[0], REG.at("count").descriptor().invocationPath.string());
  EXPECT_EQ(ARGV[1], "/tmp/1m.fastq");
}

/** @test invoke() captures combined output and exit code. */
TEST(ToolRegistryTest, InvokeCapturesOutputAndExitCode) {
  TempDir dir;
  writeScript(dir / "echoer.sh", "echo \"input=$1\"\necho warn >&2\nexit 3");
  const ToolRegistry REG = ToolRegistry::discover(dir.path());

  const auto R = REG.at("echoer").invoke("/data/0.1m.fastq");

  EXPECT_EQ(R.exitCode, 3);
  EXPECT_NE(R.output.find("input=/data/0.1m.fastq"), std::string::npos);
  EXPECT_NE(R.output.find("warn"), std::string::npos);
  EXPECT_GE(R.wallSeconds, 0.0);
}
