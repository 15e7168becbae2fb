#pragma once

#include "karta/scene/object_codec.h"

namespace karta {

// Outbound side of the replication transport. The transport itself (pub/sub,
// WebSocket) lives outside the engine; inbound traffic is delivered through
// ReplicatedStore::mergeRemote / mergeRemoteDelete.
class ReplicationChannel {
public:
    virtual ~ReplicationChannel() = default;
    virtual void publish(const ObjectDelta& delta) = 0;
    virtual void publishDelete(const ObjectId& id, const Stamp& stamp) = 0;
};

} // namespace karta
