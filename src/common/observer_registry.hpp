#pragma once

#include <functional>
#include <memory>
#include <vector>
#include <algorithm>

namespace racesync {

/**
 * Per-topic listener registry.
 *
 * notify() walks a copy of the entry list, so a listener may unsubscribe
 * itself (or any other listener) from inside its callback. Entries detached
 * during a pass are skipped; entries added during a pass are not called until
 * the next notify().
 */
template<typename T>
class ObserverRegistry {
public:
    using Callback = std::function<void(const T&)>;
    using Unsubscribe = std::function<void()>;

    ObserverRegistry() : entries_(std::make_shared<EntryList>()) {}

    ObserverRegistry(const ObserverRegistry&) = delete;
    ObserverRegistry& operator=(const ObserverRegistry&) = delete;

    // Returned callable is idempotent and safe to call after the registry is gone
    Unsubscribe subscribe(Callback callback) {
        auto entry = std::make_shared<Entry>();
        entry->callback = std::move(callback);
        entries_->push_back(entry);

        std::weak_ptr<EntryList> weak_list = entries_;
        std::weak_ptr<Entry> weak_entry = entry;
        return [weak_list, weak_entry]() {
            auto entry = weak_entry.lock();
            if (!entry || !entry->active) return;
            entry->active = false;
            if (auto list = weak_list.lock()) {
                list->erase(std::remove(list->begin(), list->end(), entry), list->end());
            }
        };
    }

    void notify(const T& value) const {
        const EntryList snapshot = *entries_;
        for (const auto& entry : snapshot) {
            if (entry->active) {
                entry->callback(value);
            }
        }
    }

    size_t size() const { return entries_->size(); }
    bool empty() const { return entries_->empty(); }

private:
    struct Entry {
        Callback callback;
        bool active = true;
    };
    using EntryList = std::vector<std::shared_ptr<Entry>>;

    std::shared_ptr<EntryList> entries_;
};

} // namespace racesync
