#pragma once

/** @file  FlashSession.hpp
 *  @brief Per-invocation state machine: build → select → program → reset.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <optional>
#include <string>
#include <vector>

#include "core/ArtifactBuilder.hpp"
#include "core/DeviceProgrammer.hpp"
#include "core/TransportSelector.hpp"

namespace fwdeploy {
  namespace io {
    class SessionLog;
  }

  namespace core {

    class FlashSession {

    public:
      enum class State { Idle, Building, Programming, Resetting, Done, Failed };

      FlashSession(ArtifactBuilder& builder, const TransportSelector& selector,
                   DeviceProgrammer& programmer, io::SessionLog* log = nullptr);
      ~FlashSession() = default;

      // ---- Public API (each call consumes the session; errors propagate unchanged) ----
      BuildArtifact build(const std::string& target, std::optional<BuildMode> mode = std::nullopt);
      FlashResult flash(const std::string& target, TransportMode transport,
                        std::optional<BuildMode> mode = std::nullopt);
      FlashResult flashBootloader(TransportMode transport, const std::string& image);

      State state() const { return currentState_; }
      const std::vector<State>& history() const { return history_; } ///< every state visited

      FlashSession(const FlashSession&) = delete;
      FlashSession& operator=(const FlashSession&) = delete;

    private:
      void begin();
      void transitionTo(State next);

      ArtifactBuilder& builder_;
      const TransportSelector& selector_;
      DeviceProgrammer& programmer_;
      io::SessionLog* log_;

      State currentState_{ State::Idle };
      std::vector<State> history_{ State::Idle };
    };

    const char* toString(FlashSession::State s);

  } // namespace core
} // namespace fwdeploy
