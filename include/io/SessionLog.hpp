#pragma once
/** @file  SessionLog.hpp
 *  @brief Buffered CSV transcript of every tool invocation in a session.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include "io/ProcessRunner.hpp"

namespace fwdeploy {
  namespace io {

    /**
 * @class SessionLog
 * @brief RAII wrapper that opens a file in append mode, buffers rows and
 *        flushes on demand or when the buffer passes 4 kB.
 *
 *  Row layout: `timestamp,stage,command,exit_code,duration_ms`.
 *  The closing `result` row carries the summary line in the command column.
 */
    class SessionLog {
    public:
      SessionLog() = default;
      ~SessionLog(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path);
      bool isOpen() const { return fp_ != nullptr; }

      /** Label attached to subsequent rows (Building, Programming, ...). */
      void setStage(std::string stage) { stage_ = std::move(stage); }
      const std::string& stage() const { return stage_; }

      void record(const Command& cmd, const ProcessResult& res);
      void recordResult(const std::string& summary, int exitCode);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      //---non-copyable---------------------------------------------------
      SessionLog(const SessionLog&) = delete;
      SessionLog& operator=(const SessionLog&) = delete;

    private:
      void writeRow(const std::string& stage, const std::string& what, int exitCode,
                    long long durationMs);

      static constexpr std::size_t kFlushThreshold = 4096;

      FILE* fp_{ nullptr };
      std::vector<char> buffer_;
      std::string stage_{ "Idle" };
    };

    /**
 * @class RecordingProcessRunner
 * @brief Decorator that forwards to another runner and logs each call.
 */
    class RecordingProcessRunner : public ProcessRunner {
    public:
      RecordingProcessRunner(ProcessRunner& inner, SessionLog& log) : inner_(inner), log_(log) {}

      ProcessResult run(const Command& cmd) override {
        auto res = inner_.run(cmd);
        log_.record(cmd, res);
        return res;
      }

    private:
      ProcessRunner& inner_;
      SessionLog& log_;
    };

  } // namespace io
} // namespace fwdeploy
