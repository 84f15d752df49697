#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace kube_auth_proxy {

using ListenerId = std::uint64_t;

/// Ordered list of callbacks for one event.
/// A listener removed while an emit is in progress is not called afterwards,
/// so a handler may tear down its own emitter.
template <typename... Args>
class Listeners {
public:
    using Callback = std::function<void(Args...)>;

    ListenerId add(Callback callback) {
        const ListenerId id = ++mNextId;
        mEntries.push_back({id, std::move(callback)});
        return id;
    }

    void remove(ListenerId id) {
        mEntries.erase(std::remove_if(mEntries.begin(), mEntries.end(),
                                      [id](const Entry& e) { return e.id == id; }),
                       mEntries.end());
    }

    void clear() { mEntries.clear(); }

    std::size_t size() const { return mEntries.size(); }

    void emit(Args... args) {
        const auto snapshot = mEntries;
        for (const auto& entry : snapshot) {
            if (contains(entry.id)) {
                entry.callback(args...);
            }
        }
    }

private:
    struct Entry {
        ListenerId id;
        Callback   callback;
    };

    bool contains(ListenerId id) const {
        return std::any_of(mEntries.begin(), mEntries.end(),
                           [id](const Entry& e) { return e.id == id; });
    }

    std::vector<Entry> mEntries;
    ListenerId         mNextId = 0;
};

} // namespace kube_auth_proxy
