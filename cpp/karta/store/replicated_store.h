#pragma once

#include "karta/core/constants.h"
#include "karta/core/types.h"
#include "karta/core/util.h"
#include "karta/scene/object_codec.h"
#include "karta/scene/scene_object.h"
#include "karta/store/replication_channel.h"

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace karta {

struct StoreOptions {
    // Must differ between peers. Empty picks a random one.
    std::string siteId;
    double coalesceWindowMs{constants::kCoalesceWindowMs};
};

enum class ChangeOrigin : std::uint8_t {
    Local = 0,
    Remote = 1,
    History = 2
};

struct StoreChange {
    ChangeOrigin origin{ChangeOrigin::Local};
    std::vector<ObjectId> upserted;
    std::vector<ObjectId> removed;

    bool empty() const { return upserted.empty() && removed.empty(); }
};

using StoreListener = std::function<void(const StoreChange&)>;
using SubscriptionId = std::uint32_t;

struct StoreStats {
    std::uint64_t localWrites{0};
    std::uint64_t rejectedLocalWrites{0};
    std::uint64_t remoteMerges{0};
    std::uint64_t staleRemoteWrites{0};
    std::uint64_t droppedRemoteObjects{0};
    std::uint64_t publishedDeltas{0};
    std::uint64_t publishedDeletes{0};
};

// Canonical object map with field-level last-writer-wins replication.
//
// Local writes are applied synchronously and stamped with a Lamport stamp.
// Single-object writes are coalesced for a short window before they are
// published; multi-object writes publish immediately. Remote merges run under
// a guard that rejects local writes, so nothing a subscriber does in reaction
// to a merge can be re-broadcast.
class ReplicatedStore {
public:
    explicit ReplicatedStore(StoreOptions options = {}, ClockFn clock = defaultClock());

    ReplicatedStore(const ReplicatedStore&) = delete;
    ReplicatedStore& operator=(const ReplicatedStore&) = delete;

    void setChannel(ReplicationChannel* channel) { channel_ = channel; }
    const std::string& siteId() const { return options_.siteId; }

    // =========================================================================
    // Local mutation
    // =========================================================================

    // Upsert. Creating an object needs every field its kind requires.
    bool apply(const ObjectId& id, const ObjectPatch& patch);
    bool applyMany(const std::vector<ObjectUpdate>& updates);
    bool remove(const ObjectId& id);
    bool removeMany(const std::vector<ObjectId>& ids);

    // Undo/redo entry point: diff, publish immediately, one notification.
    bool replaceAll(const ObjectMap& next);

    // =========================================================================
    // Remote merge
    // =========================================================================

    bool mergeRemote(const ObjectDelta& delta);
    std::size_t mergeRemoteBatch(const std::vector<ObjectDelta>& deltas);
    bool mergeRemoteDelete(const ObjectId& id, const Stamp& stamp);

    bool isMerging() const { return merging_; }

    // =========================================================================
    // Coalescing
    // =========================================================================

    // Publishes pending fields once the coalescing window has elapsed.
    void pump();
    void flush();
    bool hasPendingFlush() const { return !pending_.empty(); }

    // =========================================================================
    // Read access
    // =========================================================================

    ObjectMap snapshot() const { return objects_; }
    const ObjectMap& objects() const { return objects_; }
    const SceneObject* get(const ObjectId& id) const;
    bool contains(const ObjectId& id) const { return objects_.count(id) != 0; }
    std::size_t size() const { return objects_.size(); }
    std::int32_t nextZIndex() const;
    std::vector<const SceneObject*> sortedByZ() const;

    std::optional<Stamp> fieldStamp(const ObjectId& id, ObjectField field) const;
    std::optional<Stamp> tombstone(const ObjectId& id) const;

    SubscriptionId subscribe(StoreListener listener);
    void unsubscribe(SubscriptionId id);

    KartaError lastError() const { return lastError_; }
    const StoreStats& stats() const { return stats_; }

private:
    struct Record {
        SceneObject object;
        FieldMask present{0};
        std::array<Stamp, kFieldCount> stamps{};
        bool live{false};
    };

    enum class MergeResult : std::uint8_t {
        Applied,
        Unchanged,
        Dropped
    };

    Stamp nextStamp();
    void observe(const Stamp& stamp);
    bool rejectIfMerging();

    bool applyLocal(const ObjectId& id, const ObjectPatch& patch, bool& changed);
    bool removeLocal(const ObjectId& id);
    MergeResult mergeOne(const ObjectDelta& delta);
    void commitRecord(const ObjectId& id, Record& record);
    void queuePending(const ObjectId& id, FieldMask mask);
    void notify(const StoreChange& change);

    StoreOptions options_;
    ClockFn clock_;
    ReplicationChannel* channel_{nullptr};

    ObjectMap objects_;
    std::unordered_map<ObjectId, Record> records_;
    std::unordered_map<ObjectId, Stamp> tombstones_;
    std::uint64_t lamport_{0};

    std::unordered_map<ObjectId, FieldMask> pending_;
    std::vector<ObjectId> pendingOrder_;
    std::optional<double> flushDeadline_;

    std::vector<std::pair<SubscriptionId, StoreListener>> listeners_;
    SubscriptionId nextListenerId_{1};

    bool merging_{false};
    KartaError lastError_{KartaError::Ok};
    StoreStats stats_{};
};

std::size_t fieldIndex(ObjectField field);

} // namespace karta
