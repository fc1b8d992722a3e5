#include "PeerTable.hpp"
#include <algorithm>
#include <iterator>

namespace discovery {

    std::string transitionToString(Transition transition) {
        switch (transition) {
            case Transition::ADDED:     return "ADDED";
            case Transition::UPDATED:   return "UPDATED";
            case Transition::REFRESHED: return "REFRESHED";
            case Transition::STALE:     return "STALE";
            default:                    return "UNKNOWN";
        }
    }

    std::optional<PeerRecord> PeerTable::get(const PeerIdentity& id) const {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = peers.find(id);
        if (it != peers.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::vector<PeerRecord> PeerTable::snapshot() const {
        std::lock_guard<std::mutex> lock(mtx);

        std::vector<PeerRecord> result;
        result.reserve(peers.size());

        std::transform(peers.begin(), peers.end(), std::back_inserter(result),
                      [](const auto& pair) { return pair.second; });

        return result;
    }

    Transition PeerTable::upsert(const PeerRecord& record) {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = peers.find(record.id);

        if (it == peers.end()) {
            peers.emplace(record.id, record);
            return Transition::ADDED;
        }

        PeerRecord& current = it->second;
        if (record.sequence <= current.sequence) {
            return Transition::STALE;
        }

        const bool changed = !current.sameDeclaredFields(record);
        const auto lastSeen = std::max(current.lastSeen, record.lastSeen);

        current = record;
        current.lastSeen = lastSeen;

        return changed ? Transition::UPDATED : Transition::REFRESHED;
    }

    std::optional<PeerRecord> PeerTable::remove(const PeerIdentity& id) {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = peers.find(id);
        if (it == peers.end()) {
            return std::nullopt;
        }

        PeerRecord removed = std::move(it->second);
        peers.erase(it);
        return removed;
    }

    std::vector<PeerRecord> PeerTable::findByEndpoint(const std::string& address, uint16_t port) const {
        std::lock_guard<std::mutex> lock(mtx);

        std::vector<PeerRecord> result;
        for (const auto& [id, record] : peers) {
            if (id.address == address && id.port == port) {
                result.push_back(record);
            }
        }
        return result;
    }

    std::vector<PeerIdentity> PeerTable::expired(Clock::time_point now, Clock::duration timeout) const {
        std::lock_guard<std::mutex> lock(mtx);

        std::vector<PeerIdentity> result;
        for (const auto& [id, record] : peers) {
            if (now - record.lastSeen > timeout) {
                result.push_back(id);
            }
        }
        return result;
    }

    size_t PeerTable::size() const {
        std::lock_guard<std::mutex> lock(mtx);
        return peers.size();
    }

    bool PeerTable::empty() const {
        std::lock_guard<std::mutex> lock(mtx);
        return peers.empty();
    }

    void PeerTable::clear() {
        std::lock_guard<std::mutex> lock(mtx);
        peers.clear();
    }

} // namespace discovery
