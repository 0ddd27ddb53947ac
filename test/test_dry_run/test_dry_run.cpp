/*
 * File: test/test_dry_run/test_dry_run.cpp
 * Description: Dry-run projection: rendering, mock outputs, secret redaction,
 * and the lock / unlock sequences as seen through it.
 */
#include <unity.h>
#include <sodium.h>
#include <algorithm>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>
#include <vector>
#include "core/DetachedRunner.hpp"
#include "core/DryRunExecutor.hpp"
#include "core/LockSequencer.hpp"
#include "telemetry/CycleTelemetry.hpp"
#include "utils/ConfigTemplates.hpp"
#include "BerryMocks.h"

using namespace Berry::Core;

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// RENDERING
// ============================================================================

void test_render_plain_command(void) {
    Command cmd{"xinput", {"disable", "9"}};
    TEST_ASSERT_EQUAL_STRING("xinput disable 9", cmd.render().c_str());

    Command bare{"ft_lock", {}};
    TEST_ASSERT_EQUAL_STRING("ft_lock", bare.render().c_str());
}

void test_render_masks_sensitive_argument(void) {
    Command cmd{"xdotool", {"type", "hunter2"}, true};
    TEST_ASSERT_EQUAL_STRING("xdotool type ********", cmd.render().c_str());
}

// ============================================================================
// PROJECTION
// ============================================================================

void test_enabled_run_logs_instead_of_executing(void) {
    MockCommandExecutor real;
    RecordingLogger log;
    DryRunExecutor exec(real, log);
    exec.setEnabled(true);

    real.exitCodes["xinput disable 9"] = 3;
    TEST_ASSERT_EQUAL(0, exec.run(Command{"xinput", {"disable", "9"}}));
    TEST_ASSERT_EQUAL(0, real.calls().size());
    TEST_ASSERT_TRUE(log.hasLog("Would execute: xinput disable 9"));
}

void test_enabled_capture_returns_mock_outputs(void) {
    MockCommandExecutor real;
    RecordingLogger log;
    DryRunExecutor exec(real, log);
    exec.setEnabled(true);

    std::string listing = exec.capture(Command{"xinput", {"list"}});
    TEST_ASSERT_EQUAL_STRING(BerryTemplates::MOCK_XINPUT_LISTING.c_str(), listing.c_str());

    std::string sessions = exec.capture(Command{"loginctl", {"list-sessions", "--no-legend"}});
    TEST_ASSERT_EQUAL_STRING("c54 103457 abennar seat0", sessions.c_str());

    TEST_ASSERT_EQUAL_STRING("", exec.capture(Command{"which", {"xset"}}).c_str());
    TEST_ASSERT_EQUAL(0, real.calls().size());
    TEST_ASSERT_EQUAL(3, log.countLogs("Would execute: "));
}

void test_disabled_passes_through(void) {
    MockCommandExecutor real;
    RecordingLogger log;
    DryRunExecutor exec(real, log);
    real.exitCodes["xinput enable 10"] = 1;

    TEST_ASSERT_FALSE(exec.isEnabled());
    TEST_ASSERT_EQUAL(1, exec.run(Command{"xinput", {"enable", "10"}}));
    TEST_ASSERT_EQUAL(1, real.count("xinput enable 10"));
    TEST_ASSERT_EQUAL(0, log.countLogs("Would execute"));
}

void test_toggle_between_modes(void) {
    MockCommandExecutor real;
    RecordingLogger log;
    DryRunExecutor exec(real, log);

    exec.setEnabled(true);
    exec.run(Command{"ft_lock", {}});
    exec.setEnabled(false);
    exec.run(Command{"ft_lock", {}});

    TEST_ASSERT_EQUAL(1, real.count("ft_lock"));
    TEST_ASSERT_EQUAL(1, log.countLogs("Would execute: ft_lock"));
}

// ============================================================================
// SEQUENCER THROUGH THE PROJECTION
// ============================================================================

void test_unlock_phase_never_logs_the_secret(void) {
    MockCommandExecutor real;
    RecordingLogger log;
    CycleTelemetry telemetry;
    DryRunExecutor exec(real, log);
    exec.setEnabled(true);
    {
        DetachedRunner detached(telemetry, log);
        LockSequencer seq(exec, detached, log, telemetry);
        seq.unlockPhase("hunter2");
        TEST_ASSERT_TRUE(detached.waitIdle(std::chrono::seconds(5)));
    }

    TEST_ASSERT_EQUAL(1, log.countLogs("Would execute: ft_lock"));
    TEST_ASSERT_EQUAL(1, log.countLogs("Would execute: xdotool type ********"));
    TEST_ASSERT_EQUAL(1, log.countLogs("Would execute: xdotool key Return"));
    TEST_ASSERT_EQUAL(2, log.countLogs("Would execute: xset dpms force off"));
    TEST_ASSERT_EQUAL(0, log.countLogs("hunter2"));
    TEST_ASSERT_EQUAL_UINT64(1, telemetry.snapshot().unlocks);
}

void test_unlock_phase_awaited_order(void) {
    MockCommandExecutor real;
    RecordingLogger log;
    CycleTelemetry telemetry;
    DryRunExecutor exec(real, log);
    {
        DetachedRunner detached(telemetry, log);
        LockSequencer seq(exec, detached, log, telemetry);
        seq.unlockPhase("hunter2");
    }

    std::vector<std::string> awaited = real.awaitedCalls();
    TEST_ASSERT_EQUAL(3, awaited.size());
    TEST_ASSERT_EQUAL_STRING("ft_lock", awaited[0].c_str());
    TEST_ASSERT_EQUAL_STRING("xdotool type ********", awaited[1].c_str());
    TEST_ASSERT_EQUAL_STRING("xdotool key Return", awaited[2].c_str());

    // A valódi végrehajtó megkapja a titkot
    TEST_ASSERT_EQUAL(1, real.count("xdotool type ********"));
    std::vector<std::string> raw = real.rawCalls();
    TEST_ASSERT_TRUE(std::find(raw.begin(), raw.end(), "xdotool type hunter2") != raw.end());
}

void test_detached_display_off_failure_is_recorded_not_thrown(void) {
    MockCommandExecutor real;
    RecordingLogger log;
    CycleTelemetry telemetry;
    DryRunExecutor exec(real, log);
    real.exitCodes["xset dpms force off"] = 1;
    {
        DetachedRunner detached(telemetry, log);
        LockSequencer seq(exec, detached, log, telemetry);
        seq.lockPhase();
        TEST_ASSERT_TRUE(detached.waitIdle(std::chrono::seconds(5)));
        TEST_ASSERT_EQUAL(0, detached.inFlight());
    }

    TelemetrySnapshot snap = telemetry.snapshot();
    TEST_ASSERT_EQUAL_UINT64(1, snap.locks);
    TEST_ASSERT_EQUAL_UINT64(1, snap.detached_failures);
    TEST_ASSERT_NOT_EQUAL(std::string::npos, snap.last_detached_error.find("xset dpms force off"));
}

void test_detached_tasks_run_in_post_order_on_one_worker(void) {
    RecordingLogger log;
    CycleTelemetry telemetry;
    std::mutex guard;
    std::vector<int> order;
    std::set<std::thread::id> threads;
    {
        DetachedRunner detached(telemetry, log);
        for (int i = 0; i < 500; ++i) {
            detached.post("task", [&guard, &order, &threads, i]() {
                std::lock_guard<std::mutex> g(guard);
                order.push_back(i);
                threads.insert(std::this_thread::get_id());
            });
        }
        TEST_ASSERT_TRUE(detached.waitIdle(std::chrono::seconds(5)));
    }

    TEST_ASSERT_EQUAL(500, order.size());
    for (int i = 0; i < 500; ++i) {
        TEST_ASSERT_EQUAL(i, order[i]);
    }
    TEST_ASSERT_EQUAL(1, threads.size());
}

void test_awaited_launch_failure_throws(void) {
    MockCommandExecutor real;
    RecordingLogger log;
    CycleTelemetry telemetry;
    DryRunExecutor exec(real, log);
    real.failing.insert("ft_lock");

    bool threw = false;
    {
        DetachedRunner detached(telemetry, log);
        LockSequencer seq(exec, detached, log, telemetry);
        try {
            seq.initialLock();
        } catch (const CommandError&) {
            threw = true;
        }
    }
    TEST_ASSERT_TRUE(threw);
    TEST_ASSERT_EQUAL_UINT64(0, telemetry.snapshot().locks);
}

// ============================================================================
// MAIN RUNNER
// ============================================================================
int main(void) {
    if (sodium_init() < 0) return 1;
    UNITY_BEGIN();

    // Rendering
    RUN_TEST(test_render_plain_command);
    RUN_TEST(test_render_masks_sensitive_argument);

    // Projection
    RUN_TEST(test_enabled_run_logs_instead_of_executing);
    RUN_TEST(test_enabled_capture_returns_mock_outputs);
    RUN_TEST(test_disabled_passes_through);
    RUN_TEST(test_toggle_between_modes);

    // Sequencer
    RUN_TEST(test_unlock_phase_never_logs_the_secret);
    RUN_TEST(test_unlock_phase_awaited_order);
    RUN_TEST(test_detached_display_off_failure_is_recorded_not_thrown);
    RUN_TEST(test_detached_tasks_run_in_post_order_on_one_worker);
    RUN_TEST(test_awaited_launch_failure_throws);

    return UNITY_END();
}
