#include "karta/store/replicated_store.h"
#include "karta/core/logging.h"

#include <algorithm>

namespace karta {

namespace {

// Holds the merge flag for the lifetime of one remote merge, including the
// notification that follows it.
class MergeGuard {
public:
    explicit MergeGuard(bool& flag) : flag_(flag), previous_(flag) { flag_ = true; }
    ~MergeGuard() { flag_ = previous_; }

    MergeGuard(const MergeGuard&) = delete;
    MergeGuard& operator=(const MergeGuard&) = delete;

private:
    bool& flag_;
    bool previous_;
};

void eraseId(std::vector<ObjectId>& ids, const ObjectId& id) {
    ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
}

} // namespace

std::size_t fieldIndex(ObjectField field) {
    std::uint32_t bits = static_cast<std::uint32_t>(field);
    std::size_t index = 0;
    while (bits > 1u) {
        bits >>= 1;
        ++index;
    }
    return index;
}

ReplicatedStore::ReplicatedStore(StoreOptions options, ClockFn clock)
    : options_(std::move(options)),
      clock_(clock ? std::move(clock) : defaultClock()) {
    if (options_.siteId.empty()) {
        options_.siteId = randomSiteId();
    }
}

Stamp ReplicatedStore::nextStamp() {
    return Stamp{++lamport_, options_.siteId};
}

void ReplicatedStore::observe(const Stamp& stamp) {
    if (stamp.counter > lamport_) {
        lamport_ = stamp.counter;
    }
}

bool ReplicatedStore::rejectIfMerging() {
    if (!merging_) {
        return false;
    }
    lastError_ = KartaError::MergeInProgress;
    ++stats_.rejectedLocalWrites;
    KARTA_LOG_DEBUG("local write rejected while a remote merge is in progress");
    return true;
}

// ==============================================================================
// Local mutation
// ==============================================================================

bool ReplicatedStore::applyLocal(const ObjectId& id, const ObjectPatch& patch, bool& changed) {
    changed = false;
    if (id.empty()) {
        lastError_ = KartaError::InvalidObject;
        return false;
    }
    if (patch.empty()) {
        lastError_ = KartaError::Ok;
        return true;
    }

    auto it = records_.find(id);
    const bool creating = it == records_.end() || !it->second.live;

    Record next = it != records_.end() ? it->second : Record{};
    const SceneObject before = next.object;
    if (it == records_.end()) {
        next.object = patch.values;
    } else {
        ObjectCodec::copyFields(next.object, patch.values, patch.mask);
    }
    next.object.id = id;

    const FieldMask present = next.present | patch.mask;
    if (!validateObject(next.object, present)) {
        lastError_ = KartaError::InvalidObject;
        KARTA_LOG_WARN("rejected local write to %s: object would be invalid", id.c_str());
        return false;
    }
    sanitizeObject(next.object);

    const FieldMask written = creating ? patch.mask : ObjectCodec::diff(before, next.object, patch.mask);
    if (written == 0) {
        lastError_ = KartaError::Ok;
        return true;
    }

    const Stamp stamp = nextStamp();
    for (ObjectField f : kAllFields) {
        if (hasField(written, f)) {
            next.stamps[fieldIndex(f)] = stamp;
        }
    }
    next.present = present;
    next.live = true;

    objects_[id] = next.object;
    records_[id] = std::move(next);
    queuePending(id, written);

    ++stats_.localWrites;
    lastError_ = KartaError::Ok;
    changed = true;
    return true;
}

bool ReplicatedStore::apply(const ObjectId& id, const ObjectPatch& patch) {
    if (rejectIfMerging()) {
        return false;
    }

    bool changed = false;
    if (!applyLocal(id, patch, changed)) {
        return false;
    }
    if (changed) {
        // Trailing debounce: every write pushes the deadline out.
        flushDeadline_ = clock_() + options_.coalesceWindowMs;
        StoreChange change;
        change.origin = ChangeOrigin::Local;
        change.upserted.push_back(id);
        notify(change);
    }
    return true;
}

bool ReplicatedStore::applyMany(const std::vector<ObjectUpdate>& updates) {
    if (rejectIfMerging()) {
        return false;
    }

    bool ok = true;
    StoreChange change;
    change.origin = ChangeOrigin::Local;
    for (const ObjectUpdate& update : updates) {
        bool changed = false;
        if (!applyLocal(update.id, update.patch, changed)) {
            ok = false;
            continue;
        }
        if (changed) {
            change.upserted.push_back(update.id);
        }
    }

    flush();
    if (!change.empty()) {
        notify(change);
    }
    if (!ok) {
        lastError_ = KartaError::InvalidObject;
    }
    return ok;
}

bool ReplicatedStore::removeLocal(const ObjectId& id) {
    auto it = records_.find(id);
    if (it == records_.end() || !it->second.live) {
        lastError_ = KartaError::UnknownObject;
        return false;
    }

    const Stamp stamp = nextStamp();
    tombstones_[id] = stamp;
    records_.erase(it);
    objects_.erase(id);
    pending_.erase(id);
    eraseId(pendingOrder_, id);

    if (channel_) {
        channel_->publishDelete(id, stamp);
    }
    ++stats_.publishedDeletes;
    lastError_ = KartaError::Ok;
    return true;
}

bool ReplicatedStore::remove(const ObjectId& id) {
    if (rejectIfMerging()) {
        return false;
    }
    if (!removeLocal(id)) {
        return false;
    }
    StoreChange change;
    change.origin = ChangeOrigin::Local;
    change.removed.push_back(id);
    notify(change);
    return true;
}

bool ReplicatedStore::removeMany(const std::vector<ObjectId>& ids) {
    if (rejectIfMerging()) {
        return false;
    }

    bool ok = true;
    StoreChange change;
    change.origin = ChangeOrigin::Local;
    for (const ObjectId& id : ids) {
        if (removeLocal(id)) {
            change.removed.push_back(id);
        } else {
            ok = false;
        }
    }
    if (!change.empty()) {
        notify(change);
    }
    return ok;
}

bool ReplicatedStore::replaceAll(const ObjectMap& next) {
    if (rejectIfMerging()) {
        return false;
    }

    StoreChange change;
    change.origin = ChangeOrigin::History;

    std::vector<ObjectId> doomed;
    for (const auto& [id, obj] : objects_) {
        if (next.count(id) == 0) {
            doomed.push_back(id);
        }
    }
    std::sort(doomed.begin(), doomed.end());
    for (const ObjectId& id : doomed) {
        if (removeLocal(id)) {
            change.removed.push_back(id);
        }
    }

    std::vector<ObjectId> ids;
    ids.reserve(next.size());
    for (const auto& [id, obj] : next) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    for (const ObjectId& id : ids) {
        bool changed = false;
        if (!applyLocal(id, ObjectPatch::full(next.at(id)), changed)) {
            KARTA_LOG_WARN("replaceAll skipped invalid object %s", id.c_str());
            continue;
        }
        if (changed) {
            change.upserted.push_back(id);
        }
    }

    flush();
    notify(change);
    lastError_ = KartaError::Ok;
    return true;
}

// ==============================================================================
// Remote merge
// ==============================================================================

ReplicatedStore::MergeResult ReplicatedStore::mergeOne(const ObjectDelta& delta) {
    if (delta.id.empty()) {
        KARTA_LOG_WARN("dropping remote delta without an object id");
        ++stats_.droppedRemoteObjects;
        return MergeResult::Dropped;
    }

    for (const FieldWrite& w : delta.writes) {
        observe(w.stamp);
    }

    const auto tomb = tombstones_.find(delta.id);
    auto it = records_.find(delta.id);
    Record next = it != records_.end() ? it->second : Record{};
    next.object.id = delta.id;

    FieldMask applied = 0;
    for (const FieldWrite& w : delta.writes) {
        if (tomb != tombstones_.end() && w.stamp <= tomb->second) {
            ++stats_.staleRemoteWrites;
            continue;
        }
        const std::size_t index = fieldIndex(w.field);
        if (hasField(next.present, w.field) && w.stamp <= next.stamps[index]) {
            ++stats_.staleRemoteWrites;
            continue;
        }
        if (!ObjectCodec::write(next.object, w.field, w.value)) {
            KARTA_LOG_WARN("dropping remote object %s: field '%s' has the wrong type",
                delta.id.c_str(), fieldName(w.field));
            ++stats_.droppedRemoteObjects;
            return MergeResult::Dropped;
        }
        next.stamps[index] = w.stamp;
        next.present |= fieldBit(w.field);
        applied |= fieldBit(w.field);
    }

    if (applied == 0) {
        return MergeResult::Unchanged;
    }

    if (!validateObject(next.object, next.present)) {
        KARTA_LOG_WARN("dropping remote object %s (%s): missing or invalid required fields",
            delta.id.c_str(), kindName(next.object.kind));
        ++stats_.droppedRemoteObjects;
        return MergeResult::Dropped;
    }

    commitRecord(delta.id, next);
    return MergeResult::Applied;
}

void ReplicatedStore::commitRecord(const ObjectId& id, Record& record) {
    sanitizeObject(record.object);
    record.live = true;
    objects_[id] = record.object;
    records_[id] = std::move(record);
}

bool ReplicatedStore::mergeRemote(const ObjectDelta& delta) {
    MergeGuard guard(merging_);
    ++stats_.remoteMerges;

    if (mergeOne(delta) != MergeResult::Applied) {
        return false;
    }
    StoreChange change;
    change.origin = ChangeOrigin::Remote;
    change.upserted.push_back(delta.id);
    notify(change);
    return true;
}

std::size_t ReplicatedStore::mergeRemoteBatch(const std::vector<ObjectDelta>& deltas) {
    MergeGuard guard(merging_);
    ++stats_.remoteMerges;

    StoreChange change;
    change.origin = ChangeOrigin::Remote;
    for (const ObjectDelta& delta : deltas) {
        if (mergeOne(delta) == MergeResult::Applied) {
            change.upserted.push_back(delta.id);
        }
    }
    if (!change.empty()) {
        notify(change);
    }
    return change.upserted.size();
}

bool ReplicatedStore::mergeRemoteDelete(const ObjectId& id, const Stamp& stamp) {
    MergeGuard guard(merging_);
    ++stats_.remoteMerges;
    observe(stamp);

    auto tomb = tombstones_.find(id);
    if (tomb == tombstones_.end()) {
        tomb = tombstones_.emplace(id, stamp).first;
    } else if (tomb->second < stamp) {
        tomb->second = stamp;
    }
    const Stamp limit = tomb->second;

    auto it = records_.find(id);
    if (it == records_.end()) {
        return false;
    }

    // Fields written after the delete survive it; the object stays visible only
    // if those fields still form a complete object.
    Record& record = it->second;
    for (ObjectField f : kAllFields) {
        if (hasField(record.present, f) && record.stamps[fieldIndex(f)] <= limit) {
            record.present &= ~fieldBit(f);
        }
    }
    const bool wasLive = record.live;
    record.live = record.present != 0 && validateObject(record.object, record.present);
    const bool nowLive = record.live;
    if (record.present == 0) {
        records_.erase(it);
    }

    if (!wasLive || nowLive) {
        return false;
    }

    objects_.erase(id);
    pending_.erase(id);
    eraseId(pendingOrder_, id);

    StoreChange change;
    change.origin = ChangeOrigin::Remote;
    change.removed.push_back(id);
    notify(change);
    return true;
}

// ==============================================================================
// Coalescing
// ==============================================================================

void ReplicatedStore::queuePending(const ObjectId& id, FieldMask mask) {
    auto [it, inserted] = pending_.emplace(id, 0);
    if (inserted) {
        pendingOrder_.push_back(id);
    }
    it->second |= mask;
}

void ReplicatedStore::pump() {
    if (flushDeadline_ && clock_() >= *flushDeadline_) {
        flush();
    }
}

void ReplicatedStore::flush() {
    flushDeadline_.reset();
    if (pending_.empty()) {
        return;
    }

    const std::vector<ObjectId> order = std::move(pendingOrder_);
    const std::unordered_map<ObjectId, FieldMask> pending = std::move(pending_);
    pendingOrder_.clear();
    pending_.clear();

    for (const ObjectId& id : order) {
        const auto p = pending.find(id);
        const auto rec = records_.find(id);
        if (p == pending.end() || rec == records_.end() || !rec->second.live) {
            continue;
        }

        ObjectDelta delta;
        delta.id = id;
        for (ObjectField f : kAllFields) {
            if (!hasField(p->second, f)) {
                continue;
            }
            const Stamp& stamp = rec->second.stamps[fieldIndex(f)];
            // A newer remote write owns this field now.
            if (stamp.siteId != options_.siteId) {
                continue;
            }
            delta.writes.push_back(FieldWrite{f, ObjectCodec::read(rec->second.object, f), stamp});
        }
        if (delta.writes.empty()) {
            continue;
        }
        if (channel_) {
            channel_->publish(delta);
        }
        ++stats_.publishedDeltas;
    }
}

// ==============================================================================
// Read access
// ==============================================================================

const SceneObject* ReplicatedStore::get(const ObjectId& id) const {
    auto it = objects_.find(id);
    return it != objects_.end() ? &it->second : nullptr;
}

std::int32_t ReplicatedStore::nextZIndex() const {
    if (objects_.empty()) {
        return 0;
    }
    std::int32_t maxZ = objects_.begin()->second.zIndex;
    for (const auto& [id, obj] : objects_) {
        maxZ = std::max(maxZ, obj.zIndex);
    }
    return maxZ + 1;
}

std::vector<const SceneObject*> ReplicatedStore::sortedByZ() const {
    std::vector<const SceneObject*> out;
    out.reserve(objects_.size());
    for (const auto& [id, obj] : objects_) {
        out.push_back(&obj);
    }
    std::sort(out.begin(), out.end(), [](const SceneObject* a, const SceneObject* b) {
        if (a->zIndex != b->zIndex) return a->zIndex < b->zIndex;
        return a->id < b->id;
    });
    return out;
}

std::optional<Stamp> ReplicatedStore::fieldStamp(const ObjectId& id, ObjectField field) const {
    auto it = records_.find(id);
    if (it == records_.end() || !hasField(it->second.present, field)) {
        return std::nullopt;
    }
    return it->second.stamps[fieldIndex(field)];
}

std::optional<Stamp> ReplicatedStore::tombstone(const ObjectId& id) const {
    auto it = tombstones_.find(id);
    if (it == tombstones_.end()) {
        return std::nullopt;
    }
    return it->second;
}

SubscriptionId ReplicatedStore::subscribe(StoreListener listener) {
    const SubscriptionId id = nextListenerId_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void ReplicatedStore::unsubscribe(SubscriptionId id) {
    listeners_.erase(
        std::remove_if(listeners_.begin(), listeners_.end(),
            [id](const auto& entry) { return entry.first == id; }),
        listeners_.end());
}

void ReplicatedStore::notify(const StoreChange& change) {
    // Listeners may unsubscribe from inside the callback.
    const auto listeners = listeners_;
    for (const auto& [id, listener] : listeners) {
        if (listener) {
            listener(change);
        }
    }
}

} // namespace karta
