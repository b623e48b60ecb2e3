/**
 * @file Subprocess.cpp
 * @brief fork/exec/waitpid implementation of runProcess().
 */

#include "src/harness/inc/Subprocess.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "src/harness/inc/HarnessUtils.hpp"

namespace fqbench {
namespace harness {

namespace {

/** Open `path` for writing (truncate) or /dev/null, then dup2 onto `target`. Child only. */
bool redirectTo(const std::filesystem::path& path, int target) {
  const char* p = path.empty() ? "/dev/null" : path.c_str();
  const int FD = ::open(p, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (FD < 0) {
    return false;
  }
  if (::dup2(FD, target) < 0) {
    ::close(FD);
    return false;
  }
  ::close(FD);
  return true;
}

int decodeStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

ProcessResult runProcess(const ProcessSpec& spec) {
  ProcessResult res;
  if (spec.argv.empty()) {
    res.error = "empty argument vector";
    return res;
  }

  std::vector<char*> cargv;
  cargv.reserve(spec.argv.size() + 1);
  for (const auto& s : spec.argv) {
    cargv.push_back(const_cast<char*>(s.c_str()));
  }
  cargv.push_back(nullptr);

  const double START = nowSeconds();
  const pid_t PID = ::fork();
  if (PID < 0) {
    res.error = std::string("fork failed: ") + std::strerror(errno);
    return res;
  }

  if (PID == 0) {
    // Child: only async-signal-safe calls from here on.
    const int NULL_IN = ::open("/dev/null", O_RDONLY);
    if (NULL_IN >= 0) {
      ::dup2(NULL_IN, STDIN_FILENO);
      ::close(NULL_IN);
    }
    if (spec.inheritStdio) {
      // keep both streams
    } else if (!redirectTo(spec.stdoutPath, STDOUT_FILENO)) {
      ::_exit(EXIT_EXEC_FAILED);
    } else if (spec.mergeStderr) {
      ::dup2(STDOUT_FILENO, STDERR_FILENO);
    } else if (!redirectTo({}, STDERR_FILENO)) {
      ::_exit(EXIT_EXEC_FAILED);
    }
    if (!spec.workDir.empty() && ::chdir(spec.workDir.c_str()) != 0) {
      ::_exit(EXIT_EXEC_FAILED);
    }
    ::execvp(cargv[0], cargv.data());
    ::_exit(EXIT_EXEC_FAILED);
  }

  res.launched = true;
  int status = 0;

  if (spec.timeoutSec <= 0) {
    while (::waitpid(PID, &status, 0) < 0) {
      if (errno != EINTR) {
        res.error = std::string("waitpid failed: ") + std::strerror(errno);
        res.wallSeconds = nowSeconds() - START;
        return res;
      }
    }
    res.wallSeconds = nowSeconds() - START;
    res.exitCode = decodeStatus(status);
    return res;
  }

  // Timed wait: 1 ms polling keeps wall-time error well below tool runtimes.
  const double DEADLINE = START + static_cast<double>(spec.timeoutSec);
  for (;;) {
    const pid_t R = ::waitpid(PID, &status, WNOHANG);
    if (R == PID) {
      res.wallSeconds = nowSeconds() - START;
      res.exitCode = decodeStatus(status);
      return res;
    }
    if (R < 0 && errno != EINTR) {
      res.error = std::string("waitpid failed: ") + std::strerror(errno);
      res.wallSeconds = nowSeconds() - START;
      return res;
    }
    if (nowSeconds() >= DEADLINE) {
      ::kill(PID, SIGKILL);
      while (::waitpid(PID, &status, 0) < 0 && errno == EINTR) {
      }
      res.wallSeconds = nowSeconds() - START;
      res.timedOut = true;
      res.exitCode = EXIT_TIMEOUT;
      return res;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}

ProcessResult runQuiet(const std::vector<std::string>& argv, int timeoutSec) {
  ProcessSpec spec;
  spec.argv = argv;
  spec.mergeStderr = true;
  spec.timeoutSec = timeoutSec;
  return runProcess(spec);
}

std::string shellQuote(const std::string& arg) {
  std::string out = "'";
  for (const char CH : arg) {
    if (CH == '\'') {
      out += "'\\''";
    } else {
      out.push_back(CH);
    }
  }
  out.push_back('\'');
  return out;
}

std::string shellJoin(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& a : argv) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += shellQuote(a);
  }
  return out;
}

} // namespace harness
} // namespace fqbench
