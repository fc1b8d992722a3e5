#include "ChangeNotifier.hpp"
#include <algorithm>

namespace discovery {

    std::string changeKindToString(ChangeKind kind) {
        switch (kind) {
            case ChangeKind::ADDED:      return "added";
            case ChangeKind::UPDATED:    return "updated";
            case ChangeKind::REMOVED:    return "removed";
            case ChangeKind::OVERFLOWED: return "overflow";
            default:                     return "unknown";
        }
    }

    // ------------------------------------------------------------
    // Subscription
    // ------------------------------------------------------------
    Subscription::Subscription(size_t queueCapacity)
        : capacity(std::max<size_t>(queueCapacity, 1)) {}

    void Subscription::push(const ChangeEvent& event) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (isClosed) {
                return;
            }
            if (queue.size() >= capacity) {
                queue.pop_front();
                droppedPending++;
                droppedTotal++;
            }
            queue.push_back(event);
        }
        cv.notify_one();
    }

    void Subscription::close() {
        {
            std::lock_guard<std::mutex> lock(mtx);
            isClosed = true;
        }
        cv.notify_all();
    }

    bool Subscription::popLocked(ChangeEvent& out) {
        if (droppedPending > 0) {
            out = ChangeEvent::overflow(droppedPending);
            droppedPending = 0;
            return true;
        }
        if (queue.empty()) {
            return false;
        }
        out = std::move(queue.front());
        queue.pop_front();
        return true;
    }

    bool Subscription::next(ChangeEvent& out) {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait(lock, [this] { return !queue.empty() || droppedPending > 0 || isClosed; });
        return popLocked(out);
    }

    bool Subscription::next(ChangeEvent& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait_for(lock, timeout, [this] { return !queue.empty() || droppedPending > 0 || isClosed; });
        return popLocked(out);
    }

    bool Subscription::tryNext(ChangeEvent& out) {
        std::lock_guard<std::mutex> lock(mtx);
        return popLocked(out);
    }

    bool Subscription::finished() const {
        std::lock_guard<std::mutex> lock(mtx);
        return isClosed && queue.empty() && droppedPending == 0;
    }

    bool Subscription::closed() const {
        std::lock_guard<std::mutex> lock(mtx);
        return isClosed;
    }

    size_t Subscription::pending() const {
        std::lock_guard<std::mutex> lock(mtx);
        return queue.size();
    }

    uint64_t Subscription::totalDropped() const {
        std::lock_guard<std::mutex> lock(mtx);
        return droppedTotal;
    }

    // ------------------------------------------------------------
    // ChangeNotifier
    // ------------------------------------------------------------
    ChangeNotifier::ChangeNotifier(size_t queueCapacity)
        : capacity(queueCapacity) {}

    Subscription::Ptr ChangeNotifier::subscribe() {
        auto subscription = std::make_shared<Subscription>(capacity);

        std::lock_guard<std::mutex> lock(mtx);
        if (isClosed) {
            subscription->close();
        } else {
            subscribers.push_back(subscription);
        }
        return subscription;
    }

    void ChangeNotifier::publish(const ChangeEvent& event) {
        std::lock_guard<std::mutex> lock(mtx);

        auto it = subscribers.begin();
        while (it != subscribers.end()) {
            if (auto subscription = it->lock()) {
                subscription->push(event);
                ++it;
            } else {
                it = subscribers.erase(it);
            }
        }
    }

    void ChangeNotifier::close() {
        std::lock_guard<std::mutex> lock(mtx);
        isClosed = true;

        for (auto& weak : subscribers) {
            if (auto subscription = weak.lock()) {
                subscription->close();
            }
        }
        subscribers.clear();
    }

    size_t ChangeNotifier::subscriberCount() const {
        std::lock_guard<std::mutex> lock(mtx);
        return static_cast<size_t>(std::count_if(subscribers.begin(), subscribers.end(),
            [](const std::weak_ptr<Subscription>& weak) { return !weak.expired(); }));
    }

} // namespace discovery
