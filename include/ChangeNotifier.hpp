#pragma once
#ifndef DISCOVERY_CHANGE_NOTIFIER_HPP
#define DISCOVERY_CHANGE_NOTIFIER_HPP

#include "Peer.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace discovery {

    enum class ChangeKind {
        ADDED,
        UPDATED,
        REMOVED,
        OVERFLOWED  // events were dropped for this subscriber, resync from a snapshot
    };

    struct ChangeEvent {
        ChangeKind kind = ChangeKind::ADDED;
        PeerRecord record;     // for REMOVED, the last known record of the identity
        uint64_t dropped = 0;  // only for OVERFLOWED

        const PeerIdentity& id() const { return record.id; }

        static ChangeEvent added(const PeerRecord& record) { return {ChangeKind::ADDED, record, 0}; }
        static ChangeEvent updated(const PeerRecord& record) { return {ChangeKind::UPDATED, record, 0}; }
        static ChangeEvent removed(const PeerRecord& record) { return {ChangeKind::REMOVED, record, 0}; }
        static ChangeEvent overflow(uint64_t dropped) { return {ChangeKind::OVERFLOWED, PeerRecord{}, dropped}; }
    };

    std::string changeKindToString(ChangeKind kind);

    /**
     * One subscriber's bounded queue. When full, the oldest event is dropped and the next
     * read returns an OVERFLOWED event carrying the number of dropped events before the
     * remaining ones. The producer never waits on the consumer.
     */
    class Subscription {
        public:
            using Ptr = std::shared_ptr<Subscription>;

            explicit Subscription(size_t capacity);

            /**
             * Blocks until an event is available. Returns false once the subscription is
             * closed and drained.
             */
            bool next(ChangeEvent& out);

            /**
             * Same as next() but gives up after timeout; false on timeout or closed and drained.
             */
            bool next(ChangeEvent& out, std::chrono::milliseconds timeout);

            bool tryNext(ChangeEvent& out);

            /** Closed and nothing left to read */
            bool finished() const;

            bool closed() const;

            size_t pending() const;

            uint64_t totalDropped() const;

        private:
            friend class ChangeNotifier;

            void push(const ChangeEvent& event);
            void close();
            bool popLocked(ChangeEvent& out);

            mutable std::mutex mtx;
            std::condition_variable cv;
            std::deque<ChangeEvent> queue;
            size_t capacity;
            uint64_t droppedPending = 0;
            uint64_t droppedTotal = 0;
            bool isClosed = false;
    };

    /**
     * Fan-out of table transitions. Holds subscribers weakly: dropping the last
     * Subscription::Ptr unsubscribes.
     */
    class ChangeNotifier {
        public:
            explicit ChangeNotifier(size_t queueCapacity = DEFAULT_SUBSCRIBER_QUEUE);

            Subscription::Ptr subscribe();

            /**
             * Appends to every live subscriber's queue. Callers serialize publish() in
             * transition order.
             */
            void publish(const ChangeEvent& event);

            /**
             * Closes every subscription; later subscribe() calls return closed ones.
             */
            void close();

            size_t subscriberCount() const;

        private:
            mutable std::mutex mtx;
            std::vector<std::weak_ptr<Subscription>> subscribers;
            size_t capacity;
            bool isClosed = false;
    };

} // namespace discovery

#endif // DISCOVERY_CHANGE_NOTIFIER_HPP
