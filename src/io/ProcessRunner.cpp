/* @file ProcessRunner.cpp
 * @brief fork/execvp wrapper - pipe plumbing, EINTR-safe read loop and exit status decoding - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring> // for strerror
#include <stdexcept>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

// fwdeploy headers
#include "io/ProcessRunner.hpp"

using namespace fwdeploy::io;

namespace {

  std::string errnoText(const char* what) {
    return std::string("[ProcessRunner] ") + what + ": " + strerror(errno);
  }

  // argv storage must outlive execvp; build it before fork()
  std::vector<char*> makeArgv(const Command& cmd) {
    std::vector<char*> argv;
    argv.reserve(cmd.args.size() + 2);
    argv.push_back(const_cast<char*>(cmd.program.c_str()));
    for (const auto& a : cmd.args)
      argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    return argv;
  }

  int decodeStatus(int status) {
    if (WIFEXITED(status))
      return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
      return 128 + WTERMSIG(status);
    return -1;
  }

  int waitChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
      if (errno != EINTR)
        throw std::runtime_error(errnoText("waitpid"));
    }
    return decodeStatus(status);
  }

} // namespace

std::string Command::toString() const {
  std::string out = program;
  for (const auto& a : args) {
    out += ' ';
    if (a.find(' ') != std::string::npos)
      out += '"' + a + '"';
    else
      out += a;
  }
  return out;
}

ProcessResult PosixProcessRunner::run(const Command& cmd) {
  const auto started = std::chrono::steady_clock::now();
  auto argv = makeArgv(cmd);
  ProcessResult result;

  int pipeFds[2] = { -1, -1 };
  if (!cmd.interactive && ::pipe2(pipeFds, O_CLOEXEC) != 0)
    throw std::runtime_error(errnoText("pipe"));

  pid_t pid = ::fork();
  if (pid < 0) {
    std::string errMsg = errnoText("fork");
    if (!cmd.interactive) {
      ::close(pipeFds[0]);
      ::close(pipeFds[1]);
    }
    throw std::runtime_error(errMsg);
  }

  if (pid == 0) {
    // child: only async-signal-safe calls from here on
    if (!cmd.interactive) {
      ::dup2(pipeFds[1], STDOUT_FILENO);
      ::dup2(pipeFds[1], STDERR_FILENO);
    }
    if (!cmd.workingDir.empty() && ::chdir(cmd.workingDir.c_str()) != 0) {
      const char msg[] = "fwdeploy: cannot enter working directory\n";
      (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
      ::_exit(kExecFailed);
    }
    ::execvp(argv[0], argv.data());
    const char msg[] = "fwdeploy: failed to execute ";
    (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)!::write(STDERR_FILENO, argv[0], std::strlen(argv[0]));
    (void)!::write(STDERR_FILENO, "\n", 1);
    ::_exit(kExecFailed);
  }

  if (!cmd.interactive) {
    ::close(pipeFds[1]); // parent keeps the read end only

    char temp[4096];
    pollfd pfd{ pipeFds[0], POLLIN, 0 };
    for (;;) {
      int rc = ::poll(&pfd, 1, -1);
      if (rc == -1) {
        if (errno == EINTR)
          continue; // interrupted → retry
        std::string errMsg = errnoText("poll");
        ::close(pipeFds[0]);
        waitChild(pid);
        throw std::runtime_error(errMsg);
      }

      ssize_t n = ::read(pipeFds[0], temp, sizeof(temp));
      if (n > 0) {
        result.output.append(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // EOF, every writer has exited
        break;
      } else if (errno == EINTR || errno == EAGAIN) {
        continue;
      } else {
        std::string errMsg = errnoText("read");
        ::close(pipeFds[0]);
        waitChild(pid);
        throw std::runtime_error(errMsg);
      }
    }
    ::close(pipeFds[0]);
  }

  result.exitCode = waitChild(pid);
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  return result;
}
