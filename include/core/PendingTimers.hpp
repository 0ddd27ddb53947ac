// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler
// Cancelable timed waits tied to the run token

#ifndef PENDING_TIMERS_HPP
#define PENDING_TIMERS_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

#include <rxcpp/rx.hpp>

namespace Berry::Core {

    /**
     * @brief A futó időzített várakozások halmaza.
     * Minden várakozás gyermek-előfizetést köt a futás tokenjére: a token
     * leiratkozása vagy cancelAll() azonnal felébreszti.
     */
    class PendingTimers {
    public:
        PendingTimers() = default;
        PendingTimers(const PendingTimers&) = delete;
        PendingTimers& operator=(const PendingTimers&) = delete;

        /**
         * @brief Blokkol, amíg a késleltetés le nem telik vagy meg nem szakítják.
         * @return true, ha a teljes idő letelt és a token még él
         */
        bool sleepFor(std::chrono::milliseconds delay, rxcpp::composite_subscription token);

        // Minden várakozót felébreszt és kiüríti a halmazt. Visszaadja a megszakítottak számát.
        std::size_t cancelAll();

        std::size_t size() const;

    private:
        struct Entry {
            std::mutex m;
            std::condition_variable cv;
            bool cancelled = false;

            void cancel();
        };

        mutable std::mutex lock;
        std::map<uint64_t, std::shared_ptr<Entry>> entries;
        uint64_t nextId = 0;
    };
}

#endif
