// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler
// Fire-and-forget actions on the Vent event loop

#ifndef DETACHED_RUNNER_HPP
#define DETACHED_RUNNER_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>

#include <rxcpp/rx.hpp>

namespace BerryUtils { class ILogger; }

namespace Berry::Core {

    struct CycleTelemetry;

    /**
     * @brief Detached (nem megvárt) akciók futtatója.
     * A hibák nem vesznek el: a CycleTelemetry diagnosztikai nyelőjébe kerülnek.
     * A destruktor megvárja a még futó feladatokat.
     */
    class DetachedRunner {
    public:
        DetachedRunner(CycleTelemetry& telemetry, BerryUtils::ILogger& log);
        ~DetachedRunner();

        DetachedRunner(const DetachedRunner&) = delete;
        DetachedRunner& operator=(const DetachedRunner&) = delete;

        void post(const std::string& label, std::function<void()> task);

        // Tesztekhez és leállításhoz: vár, amíg minden feladat lefutott.
        bool waitIdle(std::chrono::milliseconds timeout);

        std::size_t inFlight() const;

    private:
        // The Vent: párhuzamos worker szálak
        rxcpp::schedulers::scheduler vent_scheduler;
        rxcpp::composite_subscription lifetime;
        // Egyetlen worker: a feladatok beküldési sorrendben futnak
        rxcpp::schedulers::worker vent_worker;

        CycleTelemetry& telemetry;
        BerryUtils::ILogger& log;

        mutable std::mutex lock;
        std::condition_variable idle;
        std::size_t pending = 0;
        bool closed = false;

        void finish();
    };
}

#endif
