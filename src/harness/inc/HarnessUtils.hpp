#ifndef FQBENCH_HARNESSUTILS_HPP
#define FQBENCH_HARNESSUTILS_HPP
/**
 * @file HarnessUtils.hpp
 * @brief Small utilities shared across the harness.
 *
 * - Clock utilities (monotonic seconds, ISO-8601 and directory timestamps)
 * - File utilities (temp paths, slurp, human-readable sizes)
 * - Host probes (hostname, platform, command availability, command output capture)
 */

#include <array>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include <unistd.h> // gethostname

namespace fqbench {
namespace harness {

/* ---------------------------- Clock Utilities ---------------------------- */

/** @brief Seconds from a monotonic clock (arbitrary epoch). */
inline double nowSeconds() {
  using clock = std::chrono::steady_clock;
  return std::chrono::duration<double>(clock::now().time_since_epoch()).count();
}

/** @brief Current UTC time in ISO 8601 format. */
inline std::string captureTimestamp() {
  const auto NOW = std::chrono::system_clock::now();
  const auto T = std::chrono::system_clock::to_time_t(NOW);
  std::tm tm{};
  gmtime_r(&T, &tm);

  std::array<char, 32> buf{};
  std::strftime(buf.data(), buf.size(), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return std::string(buf.data());
}

/** @brief Local time as YYYYmmdd_HHMMSS, used to name run directories. */
inline std::string runDirectoryStamp() {
  const auto T = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&T, &tm);

  std::array<char, 32> buf{};
  std::strftime(buf.data(), buf.size(), "%Y%m%d_%H%M%S", &tm);
  return std::string(buf.data());
}

/** @brief Local date in `date(1)` style for human-readable reports. */
inline std::string captureLocalDate() {
  const auto T = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&T, &tm);

  std::array<char, 64> buf{};
  std::strftime(buf.data(), buf.size(), "%a %b %e %H:%M:%S %Z %Y", &tm);
  return std::string(buf.data());
}

/* ----------------------------- File Utilities ----------------------------- */

/**
 * @brief Create a unique temp file path with a given stem and extension.
 * @return Path like /tmp/fqbench_12345678901234567890.json
 */
inline std::filesystem::path uniqTempFile(const std::string& stem, const std::string& ext = ".log") {
  std::error_code ec;
  auto dir = std::filesystem::temp_directory_path(ec);
  if (ec) {
    dir = "/tmp";
  }
  std::random_device rd;
  std::mt19937_64 gen(rd());
  std::uniform_int_distribution<unsigned long long> dist;
  return dir / (stem + "_" + std::to_string(dist(gen)) + ext);
}

/** @brief Read whole file into memory (binary mode). Empty when unreadable. */
inline std::string slurp(const std::filesystem::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

/** @brief Format a byte count like `du -h` ("512B", "1.5K", "23M", "4.0G"). */
inline std::string humanSize(std::uintmax_t bytes) {
  static const char* const UNITS[] = {"B", "K", "M", "G", "T"};
  double val = static_cast<double>(bytes);
  int unit = 0;
  while (val >= 1024.0 && unit < 4) {
    val /= 1024.0;
    ++unit;
  }
  char buf[32];
  if (unit == 0) {
    std::snprintf(buf, sizeof(buf), "%juB", bytes);
  } else if (val < 10.0) {
    std::snprintf(buf, sizeof(buf), "%.1f%s", val, UNITS[unit]);
  } else {
    std::snprintf(buf, sizeof(buf), "%.0f%s", val, UNITS[unit]);
  }
  return buf;
}

/** @brief Size of a file as `humanSize`, or "N/A" when it does not exist. */
inline std::string humanFileSize(const std::filesystem::path& p) {
  std::error_code ec;
  const auto BYTES = std::filesystem::file_size(p, ec);
  return ec ? std::string("N/A") : humanSize(BYTES);
}

/* ------------------------------ Host Probes ------------------------------ */

/** @brief True when `name` resolves on PATH. */
inline bool commandAvailable(const std::string& name) {
  const std::string CMD = "command -v '" + name + "' >/dev/null 2>&1";
  return std::system(CMD.c_str()) == 0;
}

/**
 * @brief Run a shell command and return the first line of its output.
 * @return fallback when the command cannot be started or prints nothing.
 */
inline std::string captureCommand(const std::string& cmd, const std::string& fallback = "N/A") {
  std::array<char, 512> buf{};
  FILE* pipe = ::popen(cmd.c_str(), "r");
  if (!pipe) {
    return fallback;
  }

  std::string result;
  if (::fgets(buf.data(), static_cast<int>(buf.size()), pipe)) {
    result = buf.data();
  }
  ::pclose(pipe);

  while (!result.empty() && (result.back() == '\n' || result.back() == '\r' ||
                             result.back() == ' ' || result.back() == '\t')) {
    result.pop_back();
  }
  std::size_t lead = 0;
  while (lead < result.size() && (result[lead] == ' ' || result[lead] == '\t')) {
    ++lead;
  }
  result.erase(0, lead);
  return result.empty() ? fallback : result;
}

inline std::string captureHostname() {
  std::array<char, 256> buf{};
  if (gethostname(buf.data(), buf.size()) == 0) {
    buf.back() = '\0';
    return std::string(buf.data());
  }
  return "unknown";
}

inline std::string capturePlatform() {
#if defined(__x86_64__) || defined(_M_X64)
  return "x86_64";
#elif defined(__aarch64__) || defined(_M_ARM64)
  return "aarch64";
#elif defined(__arm__) || defined(_M_ARM)
  return "arm";
#elif defined(__i386__) || defined(_M_IX86)
  return "x86";
#elif defined(__riscv)
  return "riscv";
#else
  return "unknown";
#endif
}

} // namespace harness
} // namespace fqbench

#endif // FQBENCH_HARNESSUTILS_HPP
