#ifndef FQBENCH_PAGECACHEEVICTOR_HPP
#define FQBENCH_PAGECACHEEVICTOR_HPP
/**
 * @file PageCacheEvictor.hpp
 * @brief Best-effort removal of one file's pages from the OS page cache.
 *
 * Backends:
 *  - vmtouch: `vmtouch -t <file>` then `vmtouch -e <file>` (userspace; may need privileges
 *    on some kernels). Unavailable when vmtouch is not on PATH.
 *  - fadvise: posix_fadvise(POSIX_FADV_DONTNEED) on the file; per-run re-eviction through
 *    `dd iflag=nocache count=0`, which issues the same advice.
 *
 * Neither backend can evict tmpfs/ramfs pages; residentFraction() lets callers check.
 */

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fqbench {
namespace harness {

/** @brief Outcome of one eviction attempt. */
struct EvictionResult {
  bool ok = false;
  std::string reason; ///< Why it failed (empty on success)
};

/* --------------------------- PageCacheEvictor --------------------------- */

class PageCacheEvictor {
public:
  virtual ~PageCacheEvictor() = default;

  /** @return stable backend name ("vmtouch", "fadvise"). */
  virtual std::string name() const = 0;

  /** @return false when the facility is missing on this host. */
  virtual bool available() const = 0;

  /** @brief Evict `file` now. Never throws. */
  virtual EvictionResult evict(const std::filesystem::path& file) = 0;

  /** @brief Argument vector that repeats the eviction from a separate process. */
  virtual std::vector<std::string> evictCommand(const std::filesystem::path& file) const = 0;

  /**
   * @brief Fraction [0,1] of the file's pages currently resident, via mmap + mincore.
   * @return nullopt when residency cannot be measured (empty file, mmap refused).
   */
  virtual std::optional<double> residentFraction(const std::filesystem::path& file) const;

  /** @brief Factory: "vmtouch" or "fadvise". Unknown names yield nullptr. */
  static std::unique_ptr<PageCacheEvictor> make(const std::string& name);
};

/* ---------------------------- VmtouchEvictor ---------------------------- */

class VmtouchEvictor final : public PageCacheEvictor {
public:
  std::string name() const override { return "vmtouch"; }
  bool available() const override;
  EvictionResult evict(const std::filesystem::path& file) override;
  std::vector<std::string> evictCommand(const std::filesystem::path& file) const override;
};

/* ---------------------------- FadviseEvictor ---------------------------- */

class FadviseEvictor final : public PageCacheEvictor {
public:
  std::string name() const override { return "fadvise"; }
  bool available() const override;
  EvictionResult evict(const std::filesystem::path& file) override;
  std::vector<std::string> evictCommand(const std::filesystem::path& file) const override;
};

} // namespace harness
} // namespace fqbench

#endif // FQBENCH_PAGECACHEEVICTOR_HPP
