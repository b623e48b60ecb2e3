/**
 * @file PageCacheEvictor.cpp
 * @brief vmtouch and posix_fadvise eviction backends, mincore residency probe.
 */

#include "src/harness/inc/PageCacheEvictor.hpp"

#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include "src/harness/inc/HarnessUtils.hpp"
#include "src/harness/inc/Subprocess.hpp"

namespace fqbench {
namespace harness {

namespace fs = std::filesystem;

/* --------------------------- PageCacheEvictor --------------------------- */

std::optional<double> PageCacheEvictor::residentFraction(const fs::path& file) const {
  const int FD = ::open(file.c_str(), O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return std::nullopt;
  }
  struct stat st {};
  if (::fstat(FD, &st) != 0 || st.st_size <= 0) {
    ::close(FD);
    return std::nullopt;
  }
  const auto LEN = static_cast<std::size_t>(st.st_size);
  void* addr = ::mmap(nullptr, LEN, PROT_READ, MAP_SHARED, FD, 0);
  ::close(FD);
  if (addr == MAP_FAILED) {
    return std::nullopt;
  }

  const long PAGE = ::sysconf(_SC_PAGESIZE);
  const std::size_t PAGES = (LEN + static_cast<std::size_t>(PAGE) - 1) / static_cast<std::size_t>(PAGE);
  std::vector<unsigned char> vec(PAGES);
  const int RC = ::mincore(addr, LEN, vec.data());
  ::munmap(addr, LEN);
  if (RC != 0) {
    return std::nullopt;
  }

  std::size_t resident = 0;
  for (const unsigned char V : vec) {
    resident += (V & 1u);
  }
  return static_cast<double>(resident) / static_cast<double>(PAGES);
}

std::unique_ptr<PageCacheEvictor> PageCacheEvictor::make(const std::string& name) {
  if (name == "vmtouch") {
    return std::make_unique<VmtouchEvictor>();
  }
  if (name == "fadvise") {
    return std::make_unique<FadviseEvictor>();
  }
  return nullptr;
}

/* ---------------------------- VmtouchEvictor ---------------------------- */

bool VmtouchEvictor::available() const { return commandAvailable("vmtouch"); }

EvictionResult VmtouchEvictor::evict(const fs::path& file) {
  if (!available()) {
    return {false, "vmtouch not available"};
  }
  // Touch first: confirms vmtouch can map the file at all before we trust -e.
  const ProcessResult TOUCH = runQuiet({"vmtouch", "-t", file.string()});
  if (!TOUCH.ok()) {
    return {false, "vmtouch -t failed with exit code " + std::to_string(TOUCH.exitCode)};
  }
  const ProcessResult EVICT = runQuiet(evictCommand(file));
  if (!EVICT.ok()) {
    return {false, "vmtouch -e failed with exit code " + std::to_string(EVICT.exitCode)};
  }
  return {true, {}};
}

std::vector<std::string> VmtouchEvictor::evictCommand(const fs::path& file) const {
  return {"vmtouch", "-e", file.string()};
}

/* ---------------------------- FadviseEvictor ---------------------------- */

bool FadviseEvictor::available() const {
#if defined(POSIX_FADV_DONTNEED)
  return true;
#else
  return false;
#endif
}

EvictionResult FadviseEvictor::evict(const fs::path& file) {
#if defined(POSIX_FADV_DONTNEED)
  const int FD = ::open(file.c_str(), O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return {false, std::string("open failed: ") + std::strerror(errno)};
  }
  // Dirty pages are not dropped by DONTNEED; flush them first.
  if (::fdatasync(FD) != 0) {
    const std::string ERR = std::strerror(errno);
    ::close(FD);
    return {false, "fdatasync failed: " + ERR};
  }
  const int RC = ::posix_fadvise(FD, 0, 0, POSIX_FADV_DONTNEED);
  ::close(FD);
  if (RC != 0) {
    return {false, std::string("posix_fadvise failed: ") + std::strerror(RC)};
  }
  return {true, {}};
#else
  (void)file;
  return {false, "posix_fadvise not supported on this platform"};
#endif
}

std::vector<std::string> FadviseEvictor::evictCommand(const fs::path& file) const {
  return {"dd", "if=" + file.string(), "iflag=nocache", "count=0", "status=none"};
}

} // namespace harness
} // namespace fqbench
