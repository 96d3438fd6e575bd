/* @file FlashSession.cpp
 * @brief sequencing of the deploy pipeline, no retries
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// 3rd-party headers
#include <spdlog/spdlog.h>

// fwdeploy headers
#include "core/FlashSession.hpp"
#include "io/SessionLog.hpp"

using namespace fwdeploy::core;

const char* fwdeploy::core::toString(FlashSession::State s) {
  switch (s) {
  case FlashSession::State::Idle:
    return "Idle";
  case FlashSession::State::Building:
    return "Building";
  case FlashSession::State::Programming:
    return "Programming";
  case FlashSession::State::Resetting:
    return "Resetting";
  case FlashSession::State::Done:
    return "Done";
  case FlashSession::State::Failed:
    return "Failed";
  default:
    return "Unknown";
  }
}

FlashSession::FlashSession(ArtifactBuilder& builder, const TransportSelector& selector,
                           DeviceProgrammer& programmer, io::SessionLog* log)
    : builder_(builder), selector_(selector), programmer_(programmer), log_(log) {
  programmer_.registerPhaseCallback([this](DeviceProgrammer::Phase p) {
    transitionTo(p == DeviceProgrammer::Phase::Resetting ? State::Resetting : State::Programming);
  });
}

void FlashSession::begin() {
  if (currentState_ != State::Idle)
    throw std::logic_error(std::string("[FlashSession] session already used, state ") +
                           toString(currentState_));
}

void FlashSession::transitionTo(State next) {
  if (next == currentState_)
    return;
  spdlog::debug("[FlashSession] {} -> {}", toString(currentState_), toString(next));
  currentState_ = next;
  history_.push_back(next);
  if (log_)
    log_->setStage(toString(next));
}

BuildArtifact FlashSession::build(const std::string& target, std::optional<BuildMode> mode) {
  begin();
  try {
    transitionTo(State::Building);
    auto artifact = builder_.build(target, mode);
    transitionTo(State::Done);
    return artifact;
  } catch (...) {
    transitionTo(State::Failed);
    throw;
  }
}

FlashResult FlashSession::flash(const std::string& target, TransportMode transport,
                                std::optional<BuildMode> mode) {
  begin();
  try {
    transitionTo(State::Building);
    auto artifact = builder_.build(target, mode);
    // only reached with a complete hex image on disk
    auto descriptor = selector_.select(transport);
    transitionTo(State::Programming);
    auto result = programmer_.flashArtifact(artifact, descriptor);
    transitionTo(State::Done);
    return result;
  } catch (...) {
    transitionTo(State::Failed);
    throw;
  }
}

FlashResult FlashSession::flashBootloader(TransportMode transport, const std::string& image) {
  begin();
  try {
    auto descriptor = selector_.select(transport);
    transitionTo(State::Programming);
    auto result = programmer_.flashImage(image, descriptor);
    transitionTo(State::Done);
    return result;
  } catch (...) {
    transitionTo(State::Failed);
    throw;
  }
}
