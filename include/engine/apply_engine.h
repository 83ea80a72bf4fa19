///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file apply_engine.h
 * @brief Pushes a configuration into a running simulator in one ordered pass
 *
 * A full pass walks an explicit phase machine:
 *
 *   Idle -> Connecting -> Normalizing -> ApplyingPosition -> SettlingDelay
 *        -> ApplyingVelocity -> ApplyingRemainder -> Disconnecting -> Done
 *
 * Connecting may end the pass in ConnectionFailed. The read-back pass uses
 * Connecting -> Normalizing -> ReadingValues -> Disconnecting -> Done, and the
 * single-row pass skips the composite phases.
 *
 * Per remaining item, first applicable rule wins:
 *  1. exact mapping match   -> dispatch its event (terminal for the item)
 *  2. percent interpolation -> one native input event
 *  3. read-only             -> warning
 *  4. parse + direct write
 *
 * Recoverable problems become warnings in arrival order. Only a failed
 * connect ends a pass early. An exception escaping a pass (from an injected
 * sleeper or observer) still closes the session, ends the pass in Done and
 * then propagates; the next pass starts from Idle either way.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "config/engine_settings.h"
#include "engine/configuration_item.h"
#include "events/client_event_registry.h"
#include "events/event_dispatcher.h"
#include "sim/sim_session.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace SimPreset {

class VariableRegistry;

///////////////////////////////////////////////////////////////////////////////////////////////////
// Phase machine
///////////////////////////////////////////////////////////////////////////////////////////////////

enum class ApplyPhase {
    Idle,
    Connecting,
    Normalizing,
    ApplyingPosition,
    SettlingDelay,
    ApplyingVelocity,
    ApplyingRemainder,
    ReadingValues,
    Disconnecting,
    Done,
    ConnectionFailed
};

const char* ApplyPhaseToString(ApplyPhase phase);

/// True when @p to may directly follow @p from
bool IsLegalTransition(ApplyPhase from, ApplyPhase to);

///////////////////////////////////////////////////////////////////////////////////////////////////
// Results
///////////////////////////////////////////////////////////////////////////////////////////////////

enum class ApplyStatus {
    Completed,
    ConnectionFailed,
    Busy
};

struct ApplyResult {
    ApplyStatus status = ApplyStatus::Completed;
    size_t applied_count = 0;
    std::vector<std::string> warnings;
    std::vector<ConfigurationItem> items;   ///< canonicalized copies of the input rows
    std::string error;                      ///< set when status is ConnectionFailed
};

enum class RowApplyStatus {
    Applied,
    NotApplied,
    Refused,
    ConnectionFailed,
    Busy
};

struct RowApplyResult {
    RowApplyStatus status = RowApplyStatus::NotApplied;
    std::vector<std::string> warnings;
    std::string message;                    ///< refusal or connection error text
    ConfigurationItem item;
};

/// Operator-facing summary: applied count, then the warnings one per line
std::string FormatApplySummary(const ApplyResult& result);

///////////////////////////////////////////////////////////////////////////////////////////////////
// ApplyEngine
///////////////////////////////////////////////////////////////////////////////////////////////////

class ApplyEngine {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using PhaseObserver = std::function<void(ApplyPhase from, ApplyPhase to)>;

    ApplyEngine(SessionFactory session_factory,
                const VariableRegistry& registry,
                ClientEventRegistry& client_events = ClientEventRegistry::Global(),
                EngineSettings settings = EngineSettings());

    ApplyEngine(const ApplyEngine&) = delete;
    ApplyEngine& operator=(const ApplyEngine&) = delete;

    /// Replaces std::this_thread::sleep_for for the settle delay
    void SetSleeper(Sleeper sleeper);

    /// Called on every phase change of every pass
    void SetPhaseObserver(PhaseObserver observer);

    /// Full pass over @p items. The caller's rows are copied, never modified.
    ApplyResult Apply(const std::vector<ConfigurationItem>& items);

    /// Apply one non-composite row on its own connection
    RowApplyResult ApplyRow(const ConfigurationItem& item);

    /// Read the current simulator value of every row
    ApplyResult ReadBack(const std::vector<ConfigurationItem>& items);

    bool IsBusy() const { return busy.load(); }

    ApplyPhase GetPhase() const { return phase.load(); }

private:
    SessionFactory session_factory;
    const VariableRegistry& registry;
    ClientEventRegistry& client_events;
    EngineSettings settings;
    Sleeper sleeper;
    PhaseObserver phase_observer;

    std::atomic<bool> busy;
    std::atomic<ApplyPhase> phase;

    class PassGuard;
    class SessionGuard;

    /// Puts the phase back to Idle, also after a pass that was interrupted
    void BeginPass();
    void Transition(ApplyPhase to);

    /// Connecting phase; on failure @p error is set and the pass is over
    std::unique_ptr<SimSession> Connect(std::string& error);
    void Disconnect(std::unique_ptr<SimSession>& session);

    /// Closes @p session after an exception left the pass mid-phase; never throws
    void AbortPass(std::unique_ptr<SimSession>& session);

    InputEventSnapshot BuildSnapshot(SimSession& session, const std::vector<ConfigurationItem>& items,
                                     std::vector<std::string>& warnings);

    /// Resolution order for one non-composite item; @return true if applied
    bool ApplyItem(const ConfigurationItem& item, SimSession& session, EventDispatcher& dispatcher,
                   const InputEventSnapshot& snapshot, std::vector<std::string>& warnings);

    /// ApplyItem with escaping exceptions converted to a warning
    bool ApplyItemGuarded(const ConfigurationItem& item, SimSession& session, EventDispatcher& dispatcher,
                          const InputEventSnapshot& snapshot, std::vector<std::string>& warnings);
};

} // namespace SimPreset
