// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "core/DetachedRunner.hpp"
#include "telemetry/CycleTelemetry.hpp"
#include "utils/Logger.hpp"

namespace Berry::Core {

    DetachedRunner::DetachedRunner(CycleTelemetry& stats, BerryUtils::ILogger& logger)
        : vent_scheduler(rxcpp::schedulers::make_event_loop()),
          vent_worker(vent_scheduler.create_worker(lifetime)),
          telemetry(stats),
          log(logger) {}

    DetachedRunner::~DetachedRunner() {
        {
            std::unique_lock<std::mutex> guard(lock);
            closed = true;
            idle.wait(guard, [this] { return pending == 0; });
        }
        if (lifetime.is_subscribed()) {
            lifetime.unsubscribe();
        }
    }

    void DetachedRunner::post(const std::string& label, std::function<void()> task) {
        {
            std::lock_guard<std::mutex> guard(lock);
            if (closed) return;
            ++pending;
        }

        vent_worker.schedule([this, label, task](const rxcpp::schedulers::schedulable&) {
            try {
                task();
            } catch (const std::exception& e) {
                telemetry.record_detached_failure(label + ": " + e.what());
                log.debug("[Detached] " + label + " failed: " + e.what());
            }
            finish();
        });
    }

    void DetachedRunner::finish() {
        std::lock_guard<std::mutex> guard(lock);
        --pending;
        if (pending == 0) {
            idle.notify_all();
        }
    }

    bool DetachedRunner::waitIdle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> guard(lock);
        return idle.wait_for(guard, timeout, [this] { return pending == 0; });
    }

    std::size_t DetachedRunner::inFlight() const {
        std::lock_guard<std::mutex> guard(lock);
        return pending;
    }
}
