// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "core/PendingTimers.hpp"

namespace Berry::Core {

    void PendingTimers::Entry::cancel() {
        {
            std::lock_guard<std::mutex> guard(m);
            cancelled = true;
        }
        cv.notify_all();
    }

    bool PendingTimers::sleepFor(std::chrono::milliseconds delay, rxcpp::composite_subscription token) {
        auto entry = std::make_shared<Entry>();
        uint64_t id;
        {
            std::lock_guard<std::mutex> guard(lock);
            if (!token.is_subscribed()) {
                return false;
            }
            id = nextId++;
            entries.emplace(id, entry);
        }

        // Ha a token közben leiratkozott, az add() azonnal lefuttatja a cancel-t.
        auto link = token.add([entry]() { entry->cancel(); });

        bool elapsed;
        {
            std::unique_lock<std::mutex> guard(entry->m);
            elapsed = !entry->cv.wait_for(guard, delay, [&entry] { return entry->cancelled; });
        }

        token.remove(link);
        {
            std::lock_guard<std::mutex> guard(lock);
            entries.erase(id);
        }

        return elapsed && token.is_subscribed();
    }

    std::size_t PendingTimers::cancelAll() {
        std::map<uint64_t, std::shared_ptr<Entry>> drained;
        {
            std::lock_guard<std::mutex> guard(lock);
            drained.swap(entries);
        }
        for (auto& kv : drained) {
            kv.second->cancel();
        }
        return drained.size();
    }

    std::size_t PendingTimers::size() const {
        std::lock_guard<std::mutex> guard(lock);
        return entries.size();
    }
}
