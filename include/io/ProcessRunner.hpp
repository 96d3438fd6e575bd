#pragma once
/** @file  ProcessRunner.hpp
 *  @brief Launches external tools (cargo, rfp-cli, tio, ...) and captures their result.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <string>
#include <vector>

namespace fwdeploy {
  namespace io {

    /** One external tool invocation. `program` is resolved through PATH. */
    struct Command {
      std::string program;
      std::vector<std::string> args;
      std::string workingDir{};  ///< empty == inherit the caller's cwd
      bool interactive{ false }; ///< child inherits stdio, nothing is captured

      /// Shell-like rendering for logs ("rfp-cli -device ra -p app.hex").
      std::string toString() const;
    };

    struct ProcessResult {
      int exitCode{ 0 };  ///< 128+signal when the child was killed
      std::string output; ///< merged stdout + stderr
      std::chrono::milliseconds duration{ 0 };

      bool ok() const { return exitCode == 0; }
    };

    /**
 * @class ProcessRunner
 * @brief Abstract seam between the pipeline and the host's process table.
 *
 *  * Blocking: `run()` returns once the child has exited.
 *  * Tests substitute a fake that scripts results (see tests/fakes).
 */
    class ProcessRunner {
    public:
      virtual ~ProcessRunner() = default;

      /// Runs \p cmd to completion. Throws `std::runtime_error` only when the
      /// child cannot be created at all; a missing program yields exit code 127.
      virtual ProcessResult run(const Command& cmd) = 0;
    };

    /**
 * @class PosixProcessRunner
 * @brief fork/execvp implementation; stdout and stderr share one pipe.
 */
    class PosixProcessRunner : public ProcessRunner {
    public:
      PosixProcessRunner() = default;
      ~PosixProcessRunner() override = default;

      ProcessResult run(const Command& cmd) override;

    private:
      static constexpr int kExecFailed = 127;
    };

  } // namespace io
} // namespace fwdeploy
