///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file test_apply_engine.cpp
 * @brief Integration tests for full apply passes against a scripted session
 *
 * These tests drive ApplyEngine end to end through FakeSession and check the
 * write order, the resolution order per item and the warnings produced.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_all.hpp>
#include "test_helpers.h"
#include "engine/apply_engine.h"
#include "registry/variable_registry.h"

#include <memory>
#include <stdexcept>

using namespace SimPreset;
using TestHelpers::FakeSessionScript;
using TestHelpers::MakeItem;
using TestHelpers::MakeMapping;
using TestHelpers::SessionJournal;

namespace {

/// Engine wired to a FakeSession factory, a private event registry and a recording sleeper
struct EngineHarness {
    std::shared_ptr<SessionJournal> journal = std::make_shared<SessionJournal>();
    VariableRegistry registry;
    ClientEventRegistry client_events;
    TestHelpers::RecordingSleeper sleeper{journal};
    std::unique_ptr<ApplyEngine> engine;

    explicit EngineHarness(FakeSessionScript script = FakeSessionScript()) {
        engine = std::make_unique<ApplyEngine>(TestHelpers::MakeSessionFactory(journal, std::move(script)),
                                               registry, client_events);
        engine->SetSleeper(sleeper);
    }
};

std::vector<ConfigurationItem> PositionRows() {
    return {
        MakeItem("PLANE LATITUDE", "10"),
        MakeItem("PLANE LONGITUDE", "20"),
        MakeItem("PLANE ALTITUDE", "1000"),
        MakeItem("PLANE PITCH DEGREES", "0"),
        MakeItem("PLANE BANK DEGREES", "0"),
        MakeItem("PLANE HEADING DEGREES TRUE", "90"),
        MakeItem("SIM ON GROUND", "1"),
        MakeItem("AIRSPEED TRUE", "150")
    };
}

ConfigurationItem ThrottleRow(const std::string& value) {
    ConfigurationItem item = MakeItem("general eng throttle lever position:1", value);
    item.event_mappings = {
        MakeMapping("0", "THROTTLE_1_AXIS", 0.0),
        MakeMapping("100", "THROTTLE_1_AXIS", 1.0)
    };
    return item;
}

FakeSessionScript ThrottleScript() {
    FakeSessionScript script;
    script.descriptors = {{"THROTTLE_1_AXIS", 4242}, {"FLAPS_SET", 4343}};
    return script;
}

} // namespace

TEST_CASE("Position group is written once with on-ground rules", "[integration][apply]") {
    EngineHarness harness;

    ApplyResult result = harness.engine->Apply(PositionRows());

    REQUIRE(result.status == ApplyStatus::Completed);
    REQUIRE(result.applied_count == 0);
    REQUIRE(result.warnings.empty());

    REQUIRE(harness.journal->positions.size() == 1);
    const InitPosition& position = harness.journal->positions[0];
    REQUIRE(position.latitude == 10.0);
    REQUIRE(position.longitude == 20.0);
    REQUIRE(position.altitude == 1000.0);
    REQUIRE(position.heading == 90.0);
    REQUIRE(position.on_ground == 1);
    REQUIRE(position.airspeed == 0);

    REQUIRE(harness.journal->variable_writes.empty());
    REQUIRE(harness.journal->input_events.empty());
    REQUIRE(harness.journal->velocities.empty());
    REQUIRE(harness.journal->enumerations == 0);
    REQUIRE(harness.journal->client_name == "SimPreset Config");
    REQUIRE(harness.journal->disconnects == 1);

    REQUIRE(harness.sleeper.delays->size() == 1);
    REQUIRE(harness.sleeper.delays->at(0).first == std::chrono::milliseconds(500));
}

TEST_CASE("Writes follow position, settle, velocity, remainder", "[integration][apply]") {
    EngineHarness harness;

    std::vector<ConfigurationItem> rows = {
        MakeItem("FLAPS HANDLE INDEX", "2"),
        MakeItem("VELOCITY WORLD X", "5"),
        MakeItem("PLANE LATITUDE", "47.5"),
        MakeItem("VELOCITY WORLD Y", "0"),
        MakeItem("AIRSPEED TRUE", "120"),
        MakeItem("VELOCITY WORLD Z", "200")
    };

    ApplyResult result = harness.engine->Apply(rows);
    REQUIRE(result.status == ApplyStatus::Completed);
    REQUIRE(result.applied_count == 1);
    REQUIRE(result.warnings.empty());

    const SessionJournal& journal = *harness.journal;
    const size_t position_at = journal.IndexOf("SetInitPosition");
    const size_t velocity_at = journal.IndexOf("SetVelocityWorld");
    const size_t flaps_at = journal.IndexOf("SetVariable:FLAPS HANDLE INDEX");

    REQUIRE(position_at < journal.calls.size());
    REQUIRE(position_at < velocity_at);
    REQUIRE(velocity_at < flaps_at);
    REQUIRE(flaps_at < journal.calls.size());

    // The settle delay happens right after the position write
    REQUIRE(harness.sleeper.delays->size() == 1);
    REQUIRE(harness.sleeper.delays->at(0).second == position_at + 1);

    REQUIRE(journal.positions[0].airspeed == 120);
    REQUIRE(journal.velocities.size() == 1);
    REQUIRE(journal.velocities[0].x == 5.0);
    REQUIRE(journal.velocities[0].z == 200.0);
    REQUIRE(journal.variable_writes.size() == 1);
    REQUIRE(journal.variable_writes[0].second.GetInt32() == 2);
}

TEST_CASE("On ground forces a zero world velocity", "[integration][apply]") {
    EngineHarness harness;

    std::vector<ConfigurationItem> rows = {
        MakeItem("SIM ON GROUND", "true"),
        MakeItem("VELOCITY WORLD X", "5"),
        MakeItem("VELOCITY WORLD Y", "1"),
        MakeItem("VELOCITY WORLD Z", "200")
    };

    harness.engine->Apply(rows);

    REQUIRE(harness.journal->velocities.size() == 1);
    REQUIRE(harness.journal->velocities[0].x == 0.0);
    REQUIRE(harness.journal->velocities[0].y == 0.0);
    REQUIRE(harness.journal->velocities[0].z == 0.0);
}

TEST_CASE("Partial world velocity is not sent", "[integration][apply]") {
    EngineHarness harness;

    harness.engine->Apply({MakeItem("VELOCITY WORLD X", "5"), MakeItem("VELOCITY WORLD Z", "200")});

    REQUIRE(harness.journal->velocities.empty());
    REQUIRE(harness.journal->positions.empty());
    REQUIRE(harness.journal->variable_writes.empty());
}

TEST_CASE("Phase machine sequence", "[integration][apply]") {
    EngineHarness harness;
    std::vector<ApplyPhase> phases;
    harness.engine->SetPhaseObserver([&](ApplyPhase, ApplyPhase to) { phases.push_back(to); });

    harness.engine->Apply({MakeItem("FLAPS HANDLE INDEX", "1")});

    const std::vector<ApplyPhase> expected = {
        ApplyPhase::Connecting,
        ApplyPhase::Normalizing,
        ApplyPhase::ApplyingPosition,
        ApplyPhase::SettlingDelay,
        ApplyPhase::ApplyingVelocity,
        ApplyPhase::ApplyingRemainder,
        ApplyPhase::Disconnecting,
        ApplyPhase::Done
    };
    REQUIRE(phases == expected);
    REQUIRE(harness.engine->GetPhase() == ApplyPhase::Done);

    SECTION("A second pass starts from Idle again") {
        phases.clear();
        harness.engine->Apply({MakeItem("FLAPS HANDLE INDEX", "1")});
        REQUIRE(phases.front() == ApplyPhase::Idle);
        REQUIRE(phases.back() == ApplyPhase::Done);
    }

    SECTION("Transition table") {
        REQUIRE(IsLegalTransition(ApplyPhase::Connecting, ApplyPhase::ConnectionFailed));
        REQUIRE_FALSE(IsLegalTransition(ApplyPhase::Normalizing, ApplyPhase::ConnectionFailed));
        REQUIRE_FALSE(IsLegalTransition(ApplyPhase::ApplyingPosition, ApplyPhase::ApplyingVelocity));
        REQUIRE_FALSE(IsLegalTransition(ApplyPhase::Idle, ApplyPhase::Done));
        REQUIRE(std::string(ApplyPhaseToString(ApplyPhase::SettlingDelay)) == "SettlingDelay");
    }
}

TEST_CASE("An interrupted pass still disconnects and the engine recovers", "[integration][apply]") {
    EngineHarness harness;

    int interrupted_connects = 0;

    SECTION("Sleeper throws during the settle delay") {
        harness.engine->SetSleeper([](std::chrono::milliseconds) {
            throw std::runtime_error("sleep interrupted");
        });

        REQUIRE_THROWS_WITH(harness.engine->Apply({MakeItem("FLAPS HANDLE INDEX", "1")}), "sleep interrupted");
        REQUIRE(harness.journal->disconnects == 1);
        REQUIRE(harness.journal->variable_writes.empty());
        REQUIRE(harness.engine->GetPhase() == ApplyPhase::Done);
        REQUIRE_FALSE(harness.engine->IsBusy());
        interrupted_connects = 1;
    }

    SECTION("Observer throws before the session exists") {
        bool armed = true;
        harness.engine->SetPhaseObserver([&](ApplyPhase, ApplyPhase to) {
            if (armed && to == ApplyPhase::Connecting) {
                armed = false;
                throw std::runtime_error("observer failed");
            }
        });

        REQUIRE_THROWS_WITH(harness.engine->Apply({MakeItem("FLAPS HANDLE INDEX", "1")}), "observer failed");
        REQUIRE(harness.journal->sessions_created == 0);
        REQUIRE(harness.engine->GetPhase() == ApplyPhase::Connecting);
        REQUIRE_FALSE(harness.engine->IsBusy());
    }

    harness.engine->SetSleeper(harness.sleeper);

    ApplyResult second = harness.engine->Apply({MakeItem("FLAPS HANDLE INDEX", "2")});
    REQUIRE(second.status == ApplyStatus::Completed);
    REQUIRE(second.applied_count == 1);
    REQUIRE(harness.engine->GetPhase() == ApplyPhase::Done);

    RowApplyResult row = harness.engine->ApplyRow(MakeItem("FLAPS HANDLE INDEX", "3"));
    REQUIRE(row.status == RowApplyStatus::Applied);

    REQUIRE(harness.journal->connects == interrupted_connects + 2);
    REQUIRE(harness.journal->disconnects == interrupted_connects + 2);
}

TEST_CASE("Connection failure ends the pass before any write", "[integration][apply]") {
    FakeSessionScript script;
    script.fail_connect = true;
    EngineHarness harness(script);

    std::vector<ApplyPhase> phases;
    harness.engine->SetPhaseObserver([&](ApplyPhase, ApplyPhase to) { phases.push_back(to); });

    ApplyResult result = harness.engine->Apply(PositionRows());

    REQUIRE(result.status == ApplyStatus::ConnectionFailed);
    REQUIRE(result.error == "Simulator is not running");
    REQUIRE(result.applied_count == 0);
    REQUIRE(result.warnings.empty());
    REQUIRE(harness.journal->calls == std::vector<std::string>{"Connect"});
    REQUIRE(harness.sleeper.delays->empty());
    REQUIRE(phases == std::vector<ApplyPhase>{ApplyPhase::Connecting, ApplyPhase::ConnectionFailed});

    REQUIRE(FormatApplySummary(result) == "Failed to connect to the simulator: Simulator is not running");
    REQUIRE_FALSE(harness.engine->IsBusy());
}

TEST_CASE("Factory without a session is a connection failure", "[integration][apply]") {
    VariableRegistry registry;
    ClientEventRegistry client_events;
    ApplyEngine engine([]() { return std::unique_ptr<SimSession>(); }, registry, client_events);

    ApplyResult result = engine.Apply({MakeItem("FLAPS HANDLE INDEX", "1")});
    REQUIRE(result.status == ApplyStatus::ConnectionFailed);
    REQUIRE_FALSE(result.error.empty());
}

TEST_CASE("Rows without a value are skipped once", "[integration][apply]") {
    EngineHarness harness;

    std::vector<ConfigurationItem> rows = {
        MakeItem("flaps handle index", "   "),
        MakeItem("PLANE LATITUDE", ""),
        MakeItem("   ", "5")
    };

    ApplyResult result = harness.engine->Apply(rows);

    REQUIRE(result.warnings.size() == 2);
    REQUIRE(result.warnings[0] == "Variable 'FLAPS HANDLE INDEX' has no stored value and was skipped.");
    REQUIRE(result.warnings[1] == "Variable 'PLANE LATITUDE' has no stored value and was skipped.");
    REQUIRE(result.items.size() == 2);
    REQUIRE(harness.journal->variable_writes.empty());
    REQUIRE(harness.journal->positions.empty());
}

TEST_CASE("Read-only rows without a matching mapping", "[integration][apply]") {
    EngineHarness harness;

    SECTION("No mapping at all") {
        ApplyResult result = harness.engine->Apply({MakeItem("LIGHT LANDING", "1")});
        REQUIRE(result.applied_count == 0);
        REQUIRE(result.warnings.size() == 1);
        REQUIRE(result.warnings[0] == "Variable 'LIGHT LANDING' is read-only and no event mapping applied; skipped.");
        REQUIRE(harness.journal->variable_writes.empty());
        REQUIRE(harness.journal->transmissions.empty());
    }

    SECTION("A matching mapping still drives the read-only variable") {
        ConfigurationItem item = MakeItem("LIGHT LANDING", "on");
        item.event_mappings = {MakeMapping("off", "LANDING_LIGHTS_OFF"), MakeMapping("ON", "LANDING_LIGHTS_ON")};

        ApplyResult result = harness.engine->Apply({item});
        REQUIRE(result.applied_count == 1);
        REQUIRE(result.warnings.empty());
        REQUIRE(harness.journal->enumerations == 1);
        REQUIRE(harness.journal->IndexOf("MapClientEvent:LANDING_LIGHTS_ON") < harness.journal->calls.size());
        REQUIRE(harness.journal->transmissions.size() == 1);
        REQUIRE(harness.journal->transmissions[0].first == USER_OBJECT_ID);
    }
}

TEST_CASE("Exact match takes precedence and is terminal", "[integration][apply]") {
    FakeSessionScript script = ThrottleScript();
    script.failing_input_events.insert(4242);
    EngineHarness harness(script);

    ApplyResult result = harness.engine->Apply({ThrottleRow("100")});

    // A failed exact match must not fall through to interpolation or a direct write
    REQUIRE(result.applied_count == 0);
    REQUIRE(result.warnings.size() == 1);
    REQUIRE(result.warnings[0] == "Failed to send input event 'THROTTLE_1_AXIS': Input event rejected");
    REQUIRE(harness.journal->CountOf("SetInputEvent:") == 1);
    REQUIRE(harness.journal->variable_writes.empty());
}

TEST_CASE("Percent rows between calibration points are interpolated", "[integration][apply]") {
    SECTION("Native dispatch with the interpolated parameter") {
        EngineHarness harness(ThrottleScript());
        ApplyResult result = harness.engine->Apply({ThrottleRow("25")});

        REQUIRE(result.applied_count == 1);
        REQUIRE(result.warnings.empty());
        REQUIRE(harness.journal->input_events.size() == 1);
        REQUIRE(harness.journal->input_events[0].first == 4242);
        REQUIRE(harness.journal->input_events[0].second == Catch::Approx(0.25));
        REQUIRE(harness.journal->variable_writes.empty());
    }

    SECTION("Failed interpolation falls through to the direct write") {
        FakeSessionScript script = ThrottleScript();
        script.failing_input_events.insert(4242);
        EngineHarness harness(script);

        ApplyResult result = harness.engine->Apply({ThrottleRow("25")});

        REQUIRE(result.applied_count == 1);
        REQUIRE(result.warnings.size() == 1);
        REQUIRE(result.warnings[0] == "Failed to send interpolated input event 'THROTTLE_1_AXIS': Input event rejected");
        REQUIRE(harness.journal->variable_writes.size() == 1);
        REQUIRE(harness.journal->variable_writes[0].first == "GENERAL ENG THROTTLE LEVER POSITION:1");
        REQUIRE(harness.journal->variable_writes[0].second.GetDouble() == 25.0);
    }

    SECTION("Enumeration failure disables native events") {
        FakeSessionScript script = ThrottleScript();
        script.fail_enumeration = true;
        EngineHarness harness(script);

        ApplyResult result = harness.engine->Apply({ThrottleRow("25")});

        REQUIRE(result.warnings.size() == 1);
        REQUIRE(result.warnings[0] == "Failed to enumerate input events: Enumeration timed out");
        REQUIRE(harness.journal->input_events.empty());
        REQUIRE(harness.journal->variable_writes.size() == 1);
        REQUIRE(result.applied_count == 1);
    }
}

TEST_CASE("Empty event name in a matching mapping", "[integration][apply]") {
    EngineHarness harness;

    ConfigurationItem item = MakeItem("GEAR HANDLE POSITION", "1");
    item.event_mappings = {MakeMapping("1", "   ")};

    ApplyResult result = harness.engine->Apply({item});

    REQUIRE(result.warnings.size() == 1);
    REQUIRE(result.warnings[0] == "Event mapping for 'GEAR HANDLE POSITION' has an empty event name and was skipped.");
    REQUIRE(result.applied_count == 1);
    REQUIRE(harness.journal->variable_writes.size() == 1);
    REQUIRE(harness.journal->variable_writes[0].second.GetInt32() == 1);
}

TEST_CASE("Legacy events are associated once per process", "[integration][apply]") {
    EngineHarness harness;

    ConfigurationItem item = MakeItem("ELECTRICAL MASTER BATTERY", "1");
    item.event_mappings = {MakeMapping("1", "MASTER_BATTERY_ON")};

    harness.engine->Apply({item});
    harness.engine->Apply({item});

    REQUIRE(harness.journal->sessions_created == 2);
    REQUIRE(harness.journal->CountOf("MapClientEvent:") == 1);
    REQUIRE(harness.journal->transmissions.size() == 2);
    REQUIRE(harness.journal->transmissions[1].second == FIRST_CLIENT_EVENT_ID);
    REQUIRE(harness.client_events.Size() == 1);
}

TEST_CASE("Per-item failures become warnings and the pass continues", "[integration][apply]") {
    FakeSessionScript script;
    script.failing_variables.insert("KOHLSMAN SETTING MB");
    script.fail_init_position = true;
    script.fail_velocity = true;
    script.fail_disconnect = true;
    EngineHarness harness(script);

    std::vector<ConfigurationItem> rows = {
        MakeItem("PLANE LATITUDE", "10"),
        MakeItem("VELOCITY WORLD X", "1"),
        MakeItem("VELOCITY WORLD Y", "1"),
        MakeItem("VELOCITY WORLD Z", "1"),
        MakeItem("FLAPS HANDLE INDEX", "two"),
        MakeItem("KOHLSMAN SETTING MB", "1013.25"),
        MakeItem("L:CUSTOM_VAR", "3.5", "number")
    };

    ApplyResult result = harness.engine->Apply(rows);

    REQUIRE(result.status == ApplyStatus::Completed);
    REQUIRE(result.applied_count == 1);
    REQUIRE(result.warnings == std::vector<std::string>{
        "Failed to set initial position: Initial position rejected",
        "Failed to set world velocity: World velocity rejected",
        "Invalid value for 'FLAPS HANDLE INDEX': Expected an integer or boolean value.",
        "Failed to set 'KOHLSMAN SETTING MB': Variable 'KOHLSMAN SETTING MB' rejected the write"
    });
    REQUIRE(harness.journal->variable_writes.size() == 1);
    REQUIRE(harness.journal->variable_writes[0].first == "L:CUSTOM_VAR");
    REQUIRE_FALSE(harness.engine->IsBusy());
}

TEST_CASE("Only one pass runs at a time", "[integration][apply]") {
    EngineHarness harness;
    ApplyResult nested;
    RowApplyResult nested_row;
    bool observed = false;

    harness.engine->SetPhaseObserver([&](ApplyPhase, ApplyPhase to) {
        if (to == ApplyPhase::ApplyingRemainder && !observed) {
            observed = true;
            REQUIRE(harness.engine->IsBusy());
            nested = harness.engine->Apply({MakeItem("FLAPS HANDLE INDEX", "3")});
            nested_row = harness.engine->ApplyRow(MakeItem("FLAPS HANDLE INDEX", "3"));
        }
    });

    ApplyResult outer = harness.engine->Apply({MakeItem("FLAPS HANDLE INDEX", "1")});

    REQUIRE(observed);
    REQUIRE(nested.status == ApplyStatus::Busy);
    REQUIRE(nested_row.status == RowApplyStatus::Busy);
    REQUIRE(outer.status == ApplyStatus::Completed);
    REQUIRE(outer.applied_count == 1);
    REQUIRE(harness.journal->sessions_created == 1);
    REQUIRE_FALSE(harness.engine->IsBusy());
}

TEST_CASE("Caller rows are not modified", "[integration][apply]") {
    EngineHarness harness;
    const std::vector<ConfigurationItem> rows = {MakeItem(" flaps handle index ", "1", "whatever")};

    ApplyResult result = harness.engine->Apply(rows);

    REQUIRE(rows[0].name == " flaps handle index ");
    REQUIRE(rows[0].unit == "whatever");
    REQUIRE(result.items[0].name == "FLAPS HANDLE INDEX");
    REQUIRE(result.items[0].unit == "number");
}

TEST_CASE("Summary text", "[integration][apply]") {
    ApplyResult result;
    result.applied_count = 3;
    REQUIRE(FormatApplySummary(result) == "Config applied to simulator (3 variable(s) updated).");

    result.warnings = {"first", "second"};
    REQUIRE(FormatApplySummary(result) ==
            "Config applied to simulator (3 variable(s) updated).\n\nWarnings:\nfirst\nsecond");
}
