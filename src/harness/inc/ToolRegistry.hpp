#ifndef FQBENCH_TOOLREGISTRY_HPP
#define FQBENCH_TOOLREGISTRY_HPP
/**
 * @file ToolRegistry.hpp
 * @brief Discovery of benchmark subjects from a directory of uniform-contract executables.
 *
 * Contract of every tool wrapper: `<executable> <input-file-path>`, report on stdout,
 * exit code 0 on success. The harness never passes any other argument.
 */

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "src/harness/inc/Subprocess.hpp"

namespace fqbench {
namespace harness {

/* ---------------------------- ToolDescriptor ---------------------------- */

/** @brief Immutable description of one benchmark subject. */
struct ToolDescriptor {
  std::string identifier;               ///< File name without its extension
  std::filesystem::path invocationPath; ///< Absolute path to the executable
};

/* ------------------------------ ToolAdapter ------------------------------ */

/** @brief Output of a single direct tool invocation. */
struct InvocationResult {
  std::string output;     ///< Captured stdout + stderr
  int exitCode = -1;
  double wallSeconds = 0;
};

/**
 * @brief Uniform `invoke(path)` capability built from a descriptor.
 *
 * Timing engines use argv() to obtain the exact argument vector; invoke() runs the tool
 * once outside any engine (used for smoke checks and tests).
 */
class ToolAdapter {
public:
  explicit ToolAdapter(ToolDescriptor descriptor) : descriptor_(std::move(descriptor)) {}

  const ToolDescriptor& descriptor() const noexcept { return descriptor_; }
  const std::string& identifier() const noexcept { return descriptor_.identifier; }

  /** @brief `{invocationPath, inputFile}`. */
  std::vector<std::string> argv(const std::filesystem::path& inputFile) const;

  /** @brief Run the tool once against inputFile and capture its output. */
  InvocationResult invoke(const std::filesystem::path& inputFile, int timeoutSec = 0) const;

private:
  ToolDescriptor descriptor_;
};

/* ------------------------------ ToolRegistry ------------------------------ */

/**
 * @brief Immutable identifier -> adapter map produced once per run by discover().
 * Iteration order is identifier order.
 */
class ToolRegistry {
public:
  /**
   * @brief Scan `directory` (non-recursive) for executable regular files.
   *
   * Hidden files, directories and files without an execute bit are ignored.
   *
   * @throws SetupError          directory missing or no usable entries
   * @throws DuplicateToolError  two entries normalize to the same identifier
   */
  static ToolRegistry discover(const std::filesystem::path& directory);

  /** @brief Identifier for a file name: the name with its last extension removed. */
  static std::string normalizeIdentifier(const std::filesystem::path& file);

  std::size_t size() const noexcept { return tools_.size(); }
  bool contains(const std::string& identifier) const { return tools_.count(identifier) != 0; }

  /** @throws std::out_of_range for unknown identifiers. */
  const ToolAdapter& at(const std::string& identifier) const { return tools_.at(identifier); }

  std::vector<std::string> identifiers() const;

  auto begin() const noexcept { return tools_.cbegin(); }
  auto end() const noexcept { return tools_.cend(); }

private:
  explicit ToolRegistry(std::map<std::string, ToolAdapter> tools) : tools_(std::move(tools)) {}

  std::map<std::string, ToolAdapter> tools_;
};

} // namespace harness
} // namespace fqbench

#endif // FQBENCH_TOOLREGISTRY_HPP
