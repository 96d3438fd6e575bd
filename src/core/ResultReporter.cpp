/* @file ResultReporter.cpp
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// fwdeploy headers
#include "core/ResultReporter.hpp"
#include "io/SessionLog.hpp"

using namespace fwdeploy::core;

int ResultReporter::exitCodeFor(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Build:
    return 1;
  case ErrorKind::DeviceNotFound:
    return 2;
  case ErrorKind::Flash:
    return 3;
  case ErrorKind::DeviceBusy:
    return 4;
  case ErrorKind::Permission:
    return 5;
  case ErrorKind::Config:
    return kUsage;
  default:
    return kInternal;
  }
}

std::string ResultReporter::summarize(const BuildArtifact& artifact) {
  return "OK: built " + artifact.target + " (" + toString(artifact.mode) + ") -> " +
         artifact.hexPath;
}

std::string ResultReporter::summarize(const FlashResult& result) {
  std::string what = result.artifact ? result.artifact->target : result.imagePath;
  std::string line = "OK: flashed " + what + " via " + describe(result.transport) + " in " +
                     std::to_string(result.duration.count()) + " ms";
  if (result.resetPerformed)
    line += ", target restarted";
  return line;
}

int ResultReporter::reportBuilt(const BuildArtifact& artifact) {
  return finish(summarize(artifact), kSuccess);
}

int ResultReporter::reportFlashed(const FlashResult& result) {
  return finish(summarize(result), kSuccess);
}

int ResultReporter::reportSuccess(const std::string& line) { return finish("OK: " + line, kSuccess); }

int ResultReporter::reportError(const DeployError& err) {
  int code = exitCodeFor(err.kind());
  std::string line = std::string("FAILED [") + toString(err.kind()) + "]: " + err.what();
  if (!err.toolOutput().empty()) {
    out_ << err.toolOutput();
    if (err.toolOutput().back() != '\n')
      out_ << '\n';
  }
  return finish(line, code);
}

int ResultReporter::reportUnexpected(const std::exception& err) {
  return finish(std::string("FAILED [internal]: ") + err.what(), kInternal);
}

int ResultReporter::finish(const std::string& line, int code) {
  out_ << line << '\n';
  if (log_)
    log_->recordResult(line, code);
  return code;
}
