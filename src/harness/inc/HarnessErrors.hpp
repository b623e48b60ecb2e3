#ifndef FQBENCH_HARNESSERRORS_HPP
#define FQBENCH_HARNESSERRORS_HPP
/**
 * @file HarnessErrors.hpp
 * @brief Exception taxonomy for the benchmark harness.
 *
 * Fatal for the whole run: SetupError (incl. DuplicateToolError) and PersistenceError.
 * Scoped to one size or scenario: GenerationError and CacheStagingError.
 * Cache degradation and tool failures are not exceptions; they are recorded outcomes.
 */

#include <stdexcept>
#include <string>

namespace fqbench {
namespace harness {

/** @brief Base for every error raised by the harness. */
class HarnessError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/** @brief Missing tool directory, zero tools, bad arguments. Aborts before any scenario. */
class SetupError : public HarnessError {
public:
  using HarnessError::HarnessError;
};

/** @brief Two tool entries normalize to the same identifier. */
class DuplicateToolError : public SetupError {
public:
  DuplicateToolError(const std::string& identifier, const std::string& first,
                     const std::string& second)
      : SetupError("duplicate tool identifier '" + identifier + "': " + first + " and " + second),
        identifier_(identifier) {}

  const std::string& identifier() const noexcept { return identifier_; }

private:
  std::string identifier_;
};

/** @brief External data generation failed for one size. */
class GenerationError : public HarnessError {
public:
  using HarnessError::HarnessError;
};

/** @brief No cache strategy could produce a usable file for a scenario. */
class CacheStagingError : public HarnessError {
public:
  using HarnessError::HarnessError;
};

/** @brief Writing results failed. Aborts the remainder of the run. */
class PersistenceError : public HarnessError {
public:
  using HarnessError::HarnessError;
};

} // namespace harness
} // namespace fqbench

#endif // FQBENCH_HARNESSERRORS_HPP
