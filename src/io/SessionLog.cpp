/* @file SessionLog.cpp
 * @brief CSV transcript writer.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <ctime>

// fwdeploy headers
#include "io/SessionLog.hpp"

using namespace fwdeploy::io;

namespace {

  std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%F %T", &tm);
    return buf;
  }

  // RFC 4180 quoting; tool command lines often contain commas (--map ICRNL,INLCRNL)
  std::string csvField(const std::string& in) {
    if (in.find_first_of(",\"\n") == std::string::npos)
      return in;
    std::string out = "\"";
    for (char c : in) {
      if (c == '"')
        out += '"';
      out += c;
    }
    out += '"';
    return out;
  }

} // namespace

SessionLog::~SessionLog() { close(); }

bool SessionLog::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "a");
  return fp_ != nullptr;
}

void SessionLog::record(const Command& cmd, const ProcessResult& res) {
  writeRow(stage_, cmd.toString(), res.exitCode, res.duration.count());
}

void SessionLog::recordResult(const std::string& summary, int exitCode) {
  writeRow("result", summary, exitCode, 0);
  flush();
}

void SessionLog::writeRow(const std::string& stage, const std::string& what, int exitCode,
                          long long durationMs) {
  if (!fp_)
    return;
  std::string row = timestamp() + ',' + csvField(stage) + ',' + csvField(what) + ',' +
                    std::to_string(exitCode) + ',' + std::to_string(durationMs) + '\n';
  buffer_.insert(buffer_.end(), row.begin(), row.end());
  if (buffer_.size() >= kFlushThreshold)
    flush();
}

bool SessionLog::flush() {
  if (!fp_)
    return false;
  if (!buffer_.empty()) {
    std::size_t n = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_);
    bool complete = n == buffer_.size();
    buffer_.clear();
    if (!complete)
      return false;
  }
  return std::fflush(fp_) == 0;
}

void SessionLog::close() {
  if (fp_) {
    flush();
    std::fclose(fp_);
  }
  fp_ = nullptr;
  buffer_.clear();
}
