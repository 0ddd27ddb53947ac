/*
 * File: test/test_lifecycle/test_lifecycle.cpp
 * Description: Full integration tests for start / stop / dispose: precondition
 * gates, end-to-end runs in both schedule modes, cancellation and restart.
 */
#include <unity.h>
#include <sodium.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>
#include "core/LifecycleManager.hpp"
#include "utils/ConfigTemplates.hpp"
#include "BerryMocks.h"

using namespace Berry::Core;
using BerryUtils::ScheduleMode;
using BerryUtils::Settings;

static const std::chrono::seconds RUN_TIMEOUT(10);

// --- Helper: collaborators outlive the manager (declared first, destroyed last) ---
struct Harness {
    std::shared_ptr<MockCommandExecutor> real = std::make_shared<MockCommandExecutor>();
    RecordingLogger log;
    InMemorySecretStore secrets;
    StaticConfigSource config;
    std::atomic<int> prompts{0};
    std::optional<std::string> promptAnswer;
    std::unique_ptr<LifecycleManager> manager;

    Harness() {
        secrets.value = "hunter2";
        real->captureOutputs["xinput list"] = BerryTemplates::MOCK_XINPUT_LISTING;
        real->captureOutputs["loginctl list-sessions --no-legend"] = BerryTemplates::MOCK_LOGINCTL_SESSIONS;
    }

    LifecycleManager& build(bool withPrompt = false) {
        LifecycleManager::SecretPrompt prompt;
        if (withPrompt) {
            prompt = [this]() {
                prompts++;
                return promptAnswer;
            };
        }
        manager = std::make_unique<LifecycleManager>(real, secrets, config, log, prompt);
        return *manager;
    }

    // Hosszú zárolt várakozás: a ciklus a 7. lépésnél parkol
    void longHold() {
        config.update([](Settings& s) {
            s.duration = "1h";
            s.lockIntervalMin = "1m";
            s.lockIntervalMax = "1m";
        });
    }
};

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// END-TO-END SCENARIOS
// ============================================================================

void test_dry_run_duration_run_terminates_once(void) {
    Harness h;
    h.config.update([](Settings& s) {
        s.dryRun = true;
        s.duration = "2s";
        s.lockIntervalMin = "0.01s";
        s.lockIntervalMax = "0.01s";
    });
    LifecycleManager& m = h.build();

    auto begin = std::chrono::steady_clock::now();
    TEST_ASSERT_TRUE(m.start() == StartResult::Started);
    TEST_ASSERT_TRUE(h.log.hasNotification("BlueBerry started (DRY-RUN). Will run for 2s with 0.01s-0.01s intervals."));
    TEST_ASSERT_TRUE(h.log.hasLog("[Lifecycle] Running in duration mode"));

    TEST_ASSERT_TRUE(m.waitUntilIdle(RUN_TIMEOUT));
    TEST_ASSERT_TRUE(std::chrono::steady_clock::now() - begin >= std::chrono::seconds(2));
    TEST_ASSERT_FALSE(m.isActive());

    TEST_ASSERT_EQUAL(1, h.log.countLogs("Would execute: loginctl terminate-session c54"));
    TEST_ASSERT_TRUE(h.log.hasNotification("BlueBerry finished after 2s. Logged out."));
    TEST_ASSERT_EQUAL(0, h.real->calls().size());
    TEST_ASSERT_TRUE(m.telemetry().last_stop == StopReason::COMPLETED);
}

void test_bounded_cycle_run_ends_with_final_lock(void) {
    Harness h;
    h.config.update([](Settings& s) {
        s.mode = ScheduleMode::CycleCount;
        s.napTimeS = 0.01;
        s.weakTimeS = 0.01;
        s.stopAfterCycles = 3;
    });
    LifecycleManager& m = h.build();

    TEST_ASSERT_TRUE(m.start() == StartResult::Started);
    TEST_ASSERT_TRUE(h.log.hasLog("[Lifecycle] Running in cycles mode"));
    TEST_ASSERT_TRUE(m.waitUntilIdle(RUN_TIMEOUT));
    TEST_ASSERT_FALSE(m.isActive());

    // kezdő zár + 3 x (zár + újrazár) + záró zár
    TEST_ASSERT_EQUAL(8, h.real->count("ft_lock"));
    TEST_ASSERT_EQUAL(3, h.real->count("xdotool type ********"));
    TEST_ASSERT_EQUAL(3, h.real->count("xdotool key Return"));
    TEST_ASSERT_EQUAL(6, h.real->countPrefix("xinput enable"));
    TEST_ASSERT_EQUAL(0, h.real->countPrefix("loginctl terminate-session"));

    TelemetrySnapshot snap = m.telemetry();
    TEST_ASSERT_EQUAL_UINT64(3, snap.cycles_completed);
    TEST_ASSERT_TRUE(snap.last_stop == StopReason::COMPLETED);
    TEST_ASSERT_TRUE(h.log.hasNotification("BlueBerry finished after 3 cycles."));
}

void test_missing_secret_prompts_and_does_not_start(void) {
    Harness h;
    h.secrets.value.reset();
    h.promptAnswer = "  hunter3 ";
    LifecycleManager& m = h.build(true);

    TEST_ASSERT_TRUE(m.start() == StartResult::MissingSecret);
    TEST_ASSERT_FALSE(m.isActive());
    TEST_ASSERT_EQUAL(1, h.prompts.load());
    TEST_ASSERT_TRUE(h.log.hasNotification("BlueBerry cannot start: Secret is not set. Please set your password to continue."));
    TEST_ASSERT_TRUE(h.log.hasNotification("Secret set! Please start BlueBerry again."));
    TEST_ASSERT_EQUAL_STRING("hunter3", h.secrets.peek()->c_str());
    TEST_ASSERT_EQUAL(0, h.real->count("ft_lock"));
}

void test_missing_secret_without_prompt(void) {
    Harness h;
    h.secrets.value.reset();
    LifecycleManager& m = h.build();

    TEST_ASSERT_TRUE(m.start() == StartResult::MissingSecret);
    TEST_ASSERT_FALSE(m.isActive());
    TEST_ASSERT_FALSE(h.log.hasNotification("Secret set!"));
}

// ============================================================================
// PRECONDITIONS
// ============================================================================

void test_missing_binaries_block_start(void) {
    Harness h;
    h.real->missingPrograms = { "xdotool" };
    LifecycleManager& m = h.build();

    TEST_ASSERT_TRUE(m.start() == StartResult::MissingBinaries);
    TEST_ASSERT_FALSE(m.isActive());
    TEST_ASSERT_TRUE(h.log.hasNotification(
        "BlueBerry cannot start: Missing required system binaries: xdotool. Please install them first."));
    TEST_ASSERT_EQUAL(0, h.real->count("ft_lock"));
}

void test_invalid_intervals_block_start(void) {
    Harness h;
    h.config.update([](Settings& s) {
        s.lockIntervalMin = "25m";
        s.lockIntervalMax = "20m";
    });
    LifecycleManager& m = h.build();

    TEST_ASSERT_TRUE(m.start() == StartResult::InvalidConfig);
    TEST_ASSERT_FALSE(m.isActive());
    TEST_ASSERT_TRUE(h.log.hasNotification("cannot be greater than maximum"));
    TEST_ASSERT_TRUE(h.log.hasNotification("Please check your settings."));

    h.config.update([](Settings& s) { s.lockIntervalMax = "31m"; });
    TEST_ASSERT_TRUE(m.start() == StartResult::InvalidConfig);
    TEST_ASSERT_TRUE(h.log.hasNotification("Maximum lock interval exceeds 30 minutes limit"));

    // Javított beállításokkal indul
    h.longHold();
    TEST_ASSERT_TRUE(m.start() == StartResult::Started);
    m.stop();
}

void test_initial_lock_failure_blocks_start(void) {
    Harness h;
    h.real->failing.insert("ft_lock");
    LifecycleManager& m = h.build();

    TEST_ASSERT_TRUE(m.start() == StartResult::LockFailed);
    TEST_ASSERT_FALSE(m.isActive());
    TEST_ASSERT_TRUE(h.log.hasNotification("BlueBerry cannot start: failed to launch ft_lock."));
    TEST_ASSERT_TRUE(m.waitUntilIdle(std::chrono::milliseconds(10)));
}

void test_start_while_active_is_noop(void) {
    Harness h;
    h.longHold();
    LifecycleManager& m = h.build();

    TEST_ASSERT_TRUE(m.start() == StartResult::Started);
    TEST_ASSERT_TRUE(m.start() == StartResult::AlreadyActive);
    TEST_ASSERT_TRUE(m.isActive());
    TEST_ASSERT_EQUAL(1, h.log.countNotifications("BlueBerry started"));
    m.stop();
}

// ============================================================================
// CANCELLATION
// ============================================================================

void test_stop_during_locked_hold_cancels_everything(void) {
    Harness h;
    h.longHold();
    LifecycleManager& m = h.build();

    TEST_ASSERT_TRUE(m.start() == StartResult::Started);
    TEST_ASSERT_TRUE(waitUntil([&]() { return m.pendingTimerCount() == 1; }));

    m.stop();
    TEST_ASSERT_EQUAL(0, m.pendingTimerCount());
    TEST_ASSERT_FALSE(m.isActive());
    TEST_ASSERT_TRUE(m.waitUntilIdle(RUN_TIMEOUT));

    TEST_ASSERT_EQUAL(0, h.real->countPrefix("xinput disable"));
    TEST_ASSERT_EQUAL(0, h.real->countPrefix("xdotool type"));
    TEST_ASSERT_EQUAL(0, h.real->count("xdotool key Return"));
    TEST_ASSERT_EQUAL(0, h.real->countPrefix("xinput enable"));
    TEST_ASSERT_EQUAL(1, h.log.countNotifications("BlueBerry is stopped."));
    TEST_ASSERT_TRUE(m.telemetry().last_stop == StopReason::USER_STOP);
    TEST_ASSERT_EQUAL_UINT64(1, m.telemetry().timers_cancelled);
}

void test_stop_and_dispose_are_idempotent(void) {
    Harness h;
    h.longHold();
    LifecycleManager& m = h.build();

    m.stop(); // nem futott: nincs értesítés
    TEST_ASSERT_EQUAL(0, h.log.countNotifications("BlueBerry is stopped."));

    TEST_ASSERT_TRUE(m.start() == StartResult::Started);
    m.stop();
    m.stop();
    m.dispose();
    m.dispose();

    TEST_ASSERT_EQUAL(1, h.log.countNotifications("BlueBerry is stopped."));
    TEST_ASSERT_FALSE(m.isActive());
}

void test_concurrent_stop_notifies_once(void) {
    Harness h;
    h.longHold();
    LifecycleManager& m = h.build();

    TEST_ASSERT_TRUE(m.start() == StartResult::Started);
    TEST_ASSERT_TRUE(waitUntil([&]() { return m.pendingTimerCount() == 1; }));

    std::vector<std::thread> callers;
    for (int i = 0; i < 8; i++) {
        callers.emplace_back([&m, i]() {
            if (i % 2 == 0) m.stop();
            else m.dispose();
        });
    }
    for (auto& t : callers) t.join();

    TEST_ASSERT_EQUAL(1, h.log.countNotifications("BlueBerry is stopped."));
    TEST_ASSERT_EQUAL(0, m.pendingTimerCount());
    TEST_ASSERT_TRUE(m.waitUntilIdle(RUN_TIMEOUT));
}

void test_restart_after_stop(void) {
    Harness h;
    h.longHold();
    LifecycleManager& m = h.build();

    TEST_ASSERT_TRUE(m.start() == StartResult::Started);
    TEST_ASSERT_TRUE(waitUntil([&]() { return m.pendingTimerCount() == 1; }));
    m.stop();

    TEST_ASSERT_TRUE(m.start() == StartResult::Started);
    TEST_ASSERT_TRUE(m.isActive());
    TEST_ASSERT_TRUE(waitUntil([&]() { return m.pendingTimerCount() == 1; }));
    m.stop();
    TEST_ASSERT_TRUE(m.waitUntilIdle(RUN_TIMEOUT));
    TEST_ASSERT_EQUAL(2, h.log.countNotifications("BlueBerry is stopped."));
}

void test_destroying_active_manager_returns(void) {
    Harness h;
    h.longHold();
    h.build();

    TEST_ASSERT_TRUE(h.manager->start() == StartResult::Started);
    TEST_ASSERT_TRUE(waitUntil([&]() { return h.manager->pendingTimerCount() == 1; }));

    auto begin = std::chrono::steady_clock::now();
    h.manager.reset();
    TEST_ASSERT_TRUE(std::chrono::steady_clock::now() - begin < std::chrono::seconds(5));
}

// ============================================================================
// RUNTIME FAILURES
// ============================================================================

void test_runtime_config_change_stops_run(void) {
    Harness h;
    h.config.update([](Settings& s) {
        s.mode = ScheduleMode::CycleCount;
        s.napTimeS = 0.02;
        s.weakTimeS = 0.01;
    });
    LifecycleManager& m = h.build();

    TEST_ASSERT_TRUE(m.start() == StartResult::Started);
    TEST_ASSERT_TRUE(waitUntil([&]() { return m.telemetry().cycles_completed >= 1; }));
    h.config.update([](Settings& s) { s.napTimeS = -1; });

    TEST_ASSERT_TRUE(waitUntil([&]() { return !m.isActive(); }));
    TEST_ASSERT_TRUE(m.waitUntilIdle(RUN_TIMEOUT));
    TEST_ASSERT_TRUE(h.log.hasNotification(
        "BlueBerry stopped: napTimeS must be a non-negative number. Please check your settings."));
    TEST_ASSERT_TRUE(m.telemetry().last_stop == StopReason::CONFIG_INVALID);
    TEST_ASSERT_EQUAL(0, m.pendingTimerCount());
}

void test_fatal_action_stops_run_with_error(void) {
    Harness h;
    h.real->failing.insert("xdotool key Return");
    h.config.update([](Settings& s) {
        s.mode = ScheduleMode::CycleCount;
        s.napTimeS = 0.01;
        s.weakTimeS = 0.01;
    });
    LifecycleManager& m = h.build();

    TEST_ASSERT_TRUE(m.start() == StartResult::Started);
    TEST_ASSERT_TRUE(waitUntil([&]() { return !m.isActive(); }));
    TEST_ASSERT_TRUE(m.waitUntilIdle(RUN_TIMEOUT));

    TEST_ASSERT_TRUE(h.log.hasNotification("BlueBerry stopped: failed to launch xdotool key Return."));
    TEST_ASSERT_TRUE(m.telemetry().last_stop == StopReason::ACTION_FAILED);
    TEST_ASSERT_EQUAL(1, h.real->count("xdotool key Return"));
}

// ============================================================================
// SECRET MANAGEMENT
// ============================================================================

void test_set_and_clear_secret(void) {
    Harness h;
    h.secrets.value.reset();
    LifecycleManager& m = h.build();

    TEST_ASSERT_TRUE(m.setSecret("  new-password \n"));
    TEST_ASSERT_EQUAL_STRING("new-password", h.secrets.peek()->c_str());
    TEST_ASSERT_TRUE(h.log.hasNotification("Password updated securely."));

    TEST_ASSERT_FALSE(m.setSecret("   "));
    TEST_ASSERT_EQUAL_STRING("new-password", h.secrets.peek()->c_str());

    TEST_ASSERT_TRUE(m.clearSecret());
    TEST_ASSERT_FALSE(h.secrets.peek().has_value());
    TEST_ASSERT_TRUE(h.log.hasNotification("BlueBerry secret has been cleared."));
}

// ============================================================================
// MAIN RUNNER
// ============================================================================
int main(void) {
    if (sodium_init() < 0) return 1;
    UNITY_BEGIN();

    // Scenarios
    RUN_TEST(test_dry_run_duration_run_terminates_once);
    RUN_TEST(test_bounded_cycle_run_ends_with_final_lock);
    RUN_TEST(test_missing_secret_prompts_and_does_not_start);
    RUN_TEST(test_missing_secret_without_prompt);

    // Preconditions
    RUN_TEST(test_missing_binaries_block_start);
    RUN_TEST(test_invalid_intervals_block_start);
    RUN_TEST(test_initial_lock_failure_blocks_start);
    RUN_TEST(test_start_while_active_is_noop);

    // Cancellation
    RUN_TEST(test_stop_during_locked_hold_cancels_everything);
    RUN_TEST(test_stop_and_dispose_are_idempotent);
    RUN_TEST(test_concurrent_stop_notifies_once);
    RUN_TEST(test_restart_after_stop);
    RUN_TEST(test_destroying_active_manager_returns);

    // Runtime failures
    RUN_TEST(test_runtime_config_change_stops_run);
    RUN_TEST(test_fatal_action_stops_run_with_error);

    // Secrets
    RUN_TEST(test_set_and_clear_secret);

    return UNITY_END();
}
