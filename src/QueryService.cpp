#include "QueryService.hpp"

namespace discovery {

    std::vector<PeerRecord> QueryService::currentPeers() const {
        return engine.table().snapshot();
    }

    SelfStatus QueryService::selfStatus() const {
        SelfStatus status;
        status.id = engine.selfIdentity();
        status.name = engine.config().name;
        status.masterUri = engine.config().masterUri;
        status.sequence = engine.sequence();
        status.state = engine.state();
        status.stats = engine.stats();
        status.peerCount = engine.table().size();
        return status;
    }

    std::optional<PeerRecord> QueryService::peer(const PeerIdentity& id) const {
        return engine.table().get(id);
    }

} // namespace discovery
