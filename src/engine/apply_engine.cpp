///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file apply_engine.cpp
 * @brief Apply / single-row / read-back passes over a simulator session
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "engine/apply_engine.h"
#include "codec/value_codec.h"
#include "engine/composite_group.h"
#include "engine/interpolation.h"
#include "logging/logger.h"
#include "registry/variable_registry.h"
#include "util/string_util.h"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <utility>

namespace SimPreset {

namespace {

long long ElapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count();
}

void DefaultSleep(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

void LogWarnings(const std::vector<std::string>& warnings) {
    for (const auto& warning : warnings) {
        LOG_WARN("{}", warning);
    }
}

} // namespace

///////////////////////////////////////////////////////////////////////////////////////////////////
// Phase machine
///////////////////////////////////////////////////////////////////////////////////////////////////

const char* ApplyPhaseToString(ApplyPhase phase) {
    switch (phase) {
        case ApplyPhase::Idle:              return "Idle";
        case ApplyPhase::Connecting:        return "Connecting";
        case ApplyPhase::Normalizing:       return "Normalizing";
        case ApplyPhase::ApplyingPosition:  return "ApplyingPosition";
        case ApplyPhase::SettlingDelay:     return "SettlingDelay";
        case ApplyPhase::ApplyingVelocity:  return "ApplyingVelocity";
        case ApplyPhase::ApplyingRemainder: return "ApplyingRemainder";
        case ApplyPhase::ReadingValues:     return "ReadingValues";
        case ApplyPhase::Disconnecting:     return "Disconnecting";
        case ApplyPhase::Done:              return "Done";
        case ApplyPhase::ConnectionFailed:  return "ConnectionFailed";
    }
    return "Unknown";
}

bool IsLegalTransition(ApplyPhase from, ApplyPhase to) {
    switch (from) {
        case ApplyPhase::Idle:
            return to == ApplyPhase::Connecting;
        case ApplyPhase::Connecting:
            return to == ApplyPhase::Normalizing || to == ApplyPhase::ConnectionFailed;
        case ApplyPhase::Normalizing:
            return to == ApplyPhase::ApplyingPosition ||
                   to == ApplyPhase::ApplyingRemainder ||
                   to == ApplyPhase::ReadingValues;
        case ApplyPhase::ApplyingPosition:
            return to == ApplyPhase::SettlingDelay;
        case ApplyPhase::SettlingDelay:
            return to == ApplyPhase::ApplyingVelocity;
        case ApplyPhase::ApplyingVelocity:
            return to == ApplyPhase::ApplyingRemainder;
        case ApplyPhase::ApplyingRemainder:
        case ApplyPhase::ReadingValues:
            return to == ApplyPhase::Disconnecting;
        case ApplyPhase::Disconnecting:
            return to == ApplyPhase::Done;
        case ApplyPhase::Done:
        case ApplyPhase::ConnectionFailed:
            return to == ApplyPhase::Idle;
    }
    return false;
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// Summary
///////////////////////////////////////////////////////////////////////////////////////////////////

std::string FormatApplySummary(const ApplyResult& result) {
    switch (result.status) {
        case ApplyStatus::ConnectionFailed:
            return "Failed to connect to the simulator: " + result.error;
        case ApplyStatus::Busy:
            return "Another configuration pass is already running.";
        case ApplyStatus::Completed:
            break;
    }

    std::string text = fmt::format("Config applied to simulator ({} variable(s) updated).", result.applied_count);
    if (!result.warnings.empty()) {
        text += "\n\nWarnings:\n";
        for (size_t i = 0; i < result.warnings.size(); ++i) {
            if (i > 0) {
                text += '\n';
            }
            text += result.warnings[i];
        }
    }
    return text;
}

///////////////////////////////////////////////////////////////////////////////////////////////////
// ApplyEngine
///////////////////////////////////////////////////////////////////////////////////////////////////

/// Holds the busy flag for the lifetime of one pass
class ApplyEngine::PassGuard {
private:
    std::atomic<bool>& flag;
    bool acquired;

public:
    explicit PassGuard(std::atomic<bool>& flag) : flag(flag), acquired(false) {
        bool expected = false;
        acquired = flag.compare_exchange_strong(expected, true);
    }

    ~PassGuard() {
        if (acquired) {
            flag.store(false);
        }
    }

    PassGuard(const PassGuard&) = delete;
    PassGuard& operator=(const PassGuard&) = delete;

    bool Acquired() const { return acquired; }
};

/// Closes the session if a pass unwinds before reaching Disconnect
class ApplyEngine::SessionGuard {
private:
    ApplyEngine& engine;
    std::unique_ptr<SimSession>& session;

public:
    SessionGuard(ApplyEngine& engine, std::unique_ptr<SimSession>& session)
        : engine(engine), session(session) {}

    ~SessionGuard() {
        if (session) {
            engine.AbortPass(session);
        }
    }

    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;
};

ApplyEngine::ApplyEngine(SessionFactory session_factory, const VariableRegistry& registry,
                         ClientEventRegistry& client_events, EngineSettings settings)
    : session_factory(std::move(session_factory)),
      registry(registry),
      client_events(client_events),
      settings(std::move(settings)),
      sleeper(DefaultSleep),
      busy(false),
      phase(ApplyPhase::Idle) {}

void ApplyEngine::SetSleeper(Sleeper new_sleeper) {
    sleeper = new_sleeper ? std::move(new_sleeper) : Sleeper(DefaultSleep);
}

void ApplyEngine::SetPhaseObserver(PhaseObserver observer) {
    phase_observer = std::move(observer);
}

void ApplyEngine::BeginPass() {
    const ApplyPhase previous = phase.load();
    if (previous == ApplyPhase::Idle) {
        return;
    }
    if (IsLegalTransition(previous, ApplyPhase::Idle)) {
        Transition(ApplyPhase::Idle);
        return;
    }
    LOG_WARN("Previous pass stopped in phase {}; resetting to Idle", ApplyPhaseToString(previous));
    phase.store(ApplyPhase::Idle);
}

void ApplyEngine::Transition(ApplyPhase to) {
    const ApplyPhase from = phase.load();
    if (!IsLegalTransition(from, to)) {
        throw std::logic_error(std::string("Illegal apply phase transition ") +
                               ApplyPhaseToString(from) + " -> " + ApplyPhaseToString(to));
    }
    phase.store(to);
    LOG_TRACE("Phase {} -> {}", ApplyPhaseToString(from), ApplyPhaseToString(to));
    if (phase_observer) {
        phase_observer(from, to);
    }
}

std::unique_ptr<SimSession> ApplyEngine::Connect(std::string& error) {
    Transition(ApplyPhase::Connecting);

    const auto started = std::chrono::steady_clock::now();
    std::unique_ptr<SimSession> session;
    bool failed = false;

    try {
        if (session_factory) {
            session = session_factory();
        }
        if (!session) {
            failed = true;
            error = "No simulator session available";
        } else {
            session->Connect(settings.client_name);
        }
    }
    catch (const std::exception& e) {
        failed = true;
        error = e.what();
    }

    if (failed) {
        session.reset();
        LOG_ERROR("Failed to connect to the simulator as '{}': {}", settings.client_name, error);
        Transition(ApplyPhase::ConnectionFailed);
        return nullptr;
    }

    LOG_INFO("Connected to the simulator as '{}' ({} ms)", settings.client_name, ElapsedMs(started));
    return session;
}

void ApplyEngine::Disconnect(std::unique_ptr<SimSession>& session) {
    Transition(ApplyPhase::Disconnecting);
    if (session) {
        try {
            if (session->IsConnected()) {
                session->Disconnect();
            }
        }
        catch (const std::exception& e) {
            LOG_DEBUG("Ignoring disconnect failure: {}", e.what());
        }
        session.reset();
    }
    Transition(ApplyPhase::Done);
}

void ApplyEngine::AbortPass(std::unique_ptr<SimSession>& session) {
    LOG_ERROR("Pass interrupted in phase {}; closing the simulator session", ApplyPhaseToString(phase.load()));
    phase.store(ApplyPhase::Disconnecting);
    try {
        if (session->IsConnected()) {
            session->Disconnect();
        }
    }
    catch (const std::exception& e) {
        LOG_DEBUG("Ignoring disconnect failure: {}", e.what());
    }
    session.reset();
    phase.store(ApplyPhase::Done);
}

InputEventSnapshot ApplyEngine::BuildSnapshot(SimSession& session, const std::vector<ConfigurationItem>& items,
                                              std::vector<std::string>& warnings) {
    const bool wanted = std::any_of(items.begin(), items.end(), [](const ConfigurationItem& item) {
        return item.HasEventMappings();
    });
    if (!wanted) {
        return InputEventSnapshot();
    }

    try {
        const auto started = std::chrono::steady_clock::now();
        InputEventSnapshot snapshot(session.EnumerateInputEvents());
        LOG_DEBUG("Enumerated {} input event(s) in {} ms", snapshot.Size(), ElapsedMs(started));
        return snapshot;
    }
    catch (const std::exception& e) {
        warnings.push_back(std::string("Failed to enumerate input events: ") + e.what());
        return InputEventSnapshot();
    }
}

bool ApplyEngine::ApplyItem(const ConfigurationItem& item, SimSession& session, EventDispatcher& dispatcher,
                            const InputEventSnapshot& snapshot, std::vector<std::string>& warnings) {
    // 1. Exact match on a configured value
    if (item.HasEventMappings()) {
        const EventMapping* match = FindMatchingMapping(item);
        if (match) {
            if (str_util::IsBlank(match->event_name)) {
                warnings.push_back("Event mapping for '" + item.name + "' has an empty event name and was skipped.");
            } else {
                return dispatcher.Dispatch(match->event_name, match->parameter, warnings);
            }
        }
    }

    // 2. Percent lever between two calibration points
    InterpolatedDispatch interpolated;
    if (InterpolationResolver::TryResolve(item, snapshot, interpolated)) {
        const std::string label = "Failed to send interpolated input event '" + interpolated.event_name + "'";
        if (dispatcher.DispatchNative(interpolated.descriptor, interpolated.parameter, label, warnings)) {
            return true;
        }
    }

    // 3. Nothing else can write a read-only variable
    if (!item.settable) {
        warnings.push_back("Variable '" + item.name + "' is read-only and no event mapping applied; skipped.");
        return false;
    }

    // 4. Direct write
    const ParseResult parsed = ValueCodec::Parse(item.value, item.data_type);
    if (!parsed.success) {
        warnings.push_back("Invalid value for '" + item.name + "': " + parsed.error);
        return false;
    }

    try {
        session.SetVariable(item.name, item.unit, parsed.value);
        LOG_DEBUG("Set '{}' [{}] = {}", item.name, item.unit, item.value);
        return true;
    }
    catch (const std::exception& e) {
        warnings.push_back("Failed to set '" + item.name + "': " + e.what());
        return false;
    }
}

bool ApplyEngine::ApplyItemGuarded(const ConfigurationItem& item, SimSession& session, EventDispatcher& dispatcher,
                                   const InputEventSnapshot& snapshot, std::vector<std::string>& warnings) {
    try {
        return ApplyItem(item, session, dispatcher, snapshot, warnings);
    }
    catch (const std::exception& e) {
        warnings.push_back("Failed to apply '" + item.name + "': " + e.what());
        return false;
    }
}

ApplyResult ApplyEngine::Apply(const std::vector<ConfigurationItem>& items) {
    ApplyResult result;

    PassGuard guard(busy);
    if (!guard.Acquired()) {
        LOG_WARN("Apply requested while another pass is running");
        result.status = ApplyStatus::Busy;
        return result;
    }

    BeginPass();
    const auto pass_started = std::chrono::steady_clock::now();
    LOG_INFO("Applying configuration ({} row(s))", items.size());

    std::string error;
    std::unique_ptr<SimSession> session = Connect(error);
    if (!session) {
        result.status = ApplyStatus::ConnectionFailed;
        result.error = error;
        return result;
    }
    SessionGuard session_guard(*this, session);

    Transition(ApplyPhase::Normalizing);
    std::vector<ConfigurationItem> pending;
    for (const auto& raw : items) {
        if (str_util::IsBlank(raw.name)) {
            continue;
        }
        ConfigurationItem item = NormalizeItem(raw, registry);
        result.items.push_back(item);
        if (!item.HasValue()) {
            result.warnings.push_back("Variable '" + item.name + "' has no stored value and was skipped.");
            continue;
        }
        pending.push_back(std::move(item));
    }

    Transition(ApplyPhase::ApplyingPosition);
    CompositeGroupBuilder composites;
    std::vector<ConfigurationItem> remainder;
    for (const auto& item : pending) {
        if (!composites.Accept(item, result.warnings)) {
            remainder.push_back(item);
        }
    }
    composites.Finalize();

    if (composites.HasInitPosition()) {
        const InitPosition& position = composites.GetInitPosition();
        try {
            session->SetInitPosition(position);
            LOG_INFO("Initial position set: lat={} lon={} alt={} hdg={} on_ground={} airspeed={}",
                     position.latitude, position.longitude, position.altitude,
                     position.heading, position.on_ground, position.airspeed);
        }
        catch (const std::exception& e) {
            result.warnings.push_back(std::string("Failed to set initial position: ") + e.what());
        }
    }

    Transition(ApplyPhase::SettlingDelay);
    LOG_DEBUG("Settling for {} ms", settings.settle_delay.count());
    sleeper(settings.settle_delay);

    Transition(ApplyPhase::ApplyingVelocity);
    if (composites.HasVelocityWorld()) {
        const VelocityWorld& velocity = composites.GetVelocityWorld();
        try {
            session->SetVelocityWorld(velocity);
            LOG_INFO("World velocity set: x={} y={} z={}", velocity.x, velocity.y, velocity.z);
        }
        catch (const std::exception& e) {
            result.warnings.push_back(std::string("Failed to set world velocity: ") + e.what());
        }
    }

    Transition(ApplyPhase::ApplyingRemainder);
    const InputEventSnapshot snapshot = BuildSnapshot(*session, remainder, result.warnings);
    EventDispatcher dispatcher(*session, snapshot, client_events);
    for (const auto& item : remainder) {
        if (ApplyItemGuarded(item, *session, dispatcher, snapshot, result.warnings)) {
            result.applied_count++;
        }
    }

    Disconnect(session);

    LogWarnings(result.warnings);
    LOG_INFO("Configuration applied in {} ms: {} variable(s) updated, {} warning(s)",
             ElapsedMs(pass_started), result.applied_count, result.warnings.size());
    LOG_FLUSH();
    return result;
}

RowApplyResult ApplyEngine::ApplyRow(const ConfigurationItem& raw) {
    RowApplyResult result;
    result.item = NormalizeItem(raw, registry);
    const ConfigurationItem& item = result.item;

    if (item.name.empty()) {
        result.status = RowApplyStatus::Refused;
        result.message = "Variable name is empty.";
        return result;
    }
    if (CompositeGroupBuilder::IsInitPositionMember(item.name)) {
        result.status = RowApplyStatus::Refused;
        result.message = "This variable is part of the aircraft's initial position group and can't be applied individually.";
        return result;
    }
    if (CompositeGroupBuilder::IsVelocityWorldMember(item.name)) {
        result.status = RowApplyStatus::Refused;
        result.message = "World velocity components must be applied together (X, Y, Z). Apply all rows instead.";
        return result;
    }
    if (!item.HasValue()) {
        result.status = RowApplyStatus::Refused;
        result.message = "'" + item.name + "' has no value to apply.";
        return result;
    }

    PassGuard guard(busy);
    if (!guard.Acquired()) {
        LOG_WARN("Row apply for '{}' requested while another pass is running", item.name);
        result.status = RowApplyStatus::Busy;
        return result;
    }

    BeginPass();
    LOG_INFO("Applying single row '{}' = '{}'", item.name, item.value);

    std::string error;
    std::unique_ptr<SimSession> session = Connect(error);
    if (!session) {
        result.status = RowApplyStatus::ConnectionFailed;
        result.message = error;
        return result;
    }
    SessionGuard session_guard(*this, session);

    Transition(ApplyPhase::Normalizing);
    const std::vector<ConfigurationItem> rows{item};

    Transition(ApplyPhase::ApplyingRemainder);
    const InputEventSnapshot snapshot = BuildSnapshot(*session, rows, result.warnings);
    EventDispatcher dispatcher(*session, snapshot, client_events);
    const bool applied = ApplyItemGuarded(item, *session, dispatcher, snapshot, result.warnings);

    Disconnect(session);

    result.status = applied ? RowApplyStatus::Applied : RowApplyStatus::NotApplied;
    LogWarnings(result.warnings);
    LOG_INFO("Row '{}' {}", item.name, applied ? "applied" : "not applied");
    return result;
}

ApplyResult ApplyEngine::ReadBack(const std::vector<ConfigurationItem>& items) {
    ApplyResult result;

    PassGuard guard(busy);
    if (!guard.Acquired()) {
        LOG_WARN("Read-back requested while another pass is running");
        result.status = ApplyStatus::Busy;
        return result;
    }

    BeginPass();
    const auto pass_started = std::chrono::steady_clock::now();
    LOG_INFO("Reading current values for {} row(s)", items.size());

    std::string error;
    std::unique_ptr<SimSession> session = Connect(error);
    if (!session) {
        result.status = ApplyStatus::ConnectionFailed;
        result.error = error;
        return result;
    }
    SessionGuard session_guard(*this, session);

    Transition(ApplyPhase::Normalizing);
    for (const auto& raw : items) {
        if (str_util::IsBlank(raw.name)) {
            continue;
        }
        ConfigurationItem item = NormalizeItem(raw, registry);
        item.event_mappings = CleanEventMappings(item.event_mappings);
        result.items.push_back(std::move(item));
    }

    Transition(ApplyPhase::ReadingValues);
    for (auto& item : result.items) {
        if (item.data_type == DataType::InitPosition) {
            result.warnings.push_back("Cannot read '" + item.name + "': data type '" +
                                      DataTypeToString(item.data_type) + "' is not supported.");
            item.value.clear();
            continue;
        }

        try {
            const TypedValue value = session->GetVariable(item.name, item.unit, item.data_type);
            item.value = ValueCodec::Format(value);
            result.applied_count++;
            LOG_TRACE("Read '{}' [{}] = {}", item.name, item.unit, item.value);
        }
        catch (const std::exception& e) {
            result.warnings.push_back("Failed to read '" + item.name + "': " + e.what());
            item.value.clear();
        }
    }

    Disconnect(session);

    LogWarnings(result.warnings);
    LOG_INFO("Read {} value(s) in {} ms, {} warning(s)",
             result.applied_count, ElapsedMs(pass_started), result.warnings.size());
    return result;
}

} // namespace SimPreset
