#include "karta/history/history_manager.h"
#include "karta/core/logging.h"
#include "karta/store/replicated_store.h"

#include <algorithm>

namespace karta {

HistoryManager::HistoryManager(ReplicatedStore& store, HistoryOptions options)
    : store_(store), options_(options) {
    if (options_.maxEntries == 0) {
        options_.maxEntries = 1;
    }
}

void HistoryManager::pushSnapshot(const ObjectMap& snapshot) {
    if (undoRedoing_) return;
    past_.push_back(snapshot);
    if (past_.size() > options_.maxEntries) {
        past_.erase(past_.begin(), past_.begin() + static_cast<std::ptrdiff_t>(past_.size() - options_.maxEntries));
    }
    future_.clear();
}

void HistoryManager::pushCurrent() {
    pushSnapshot(store_.snapshot());
}

bool HistoryManager::restore(std::vector<ObjectMap>& from, std::vector<ObjectMap>& to) {
    if (from.empty() || store_.isMerging()) {
        return false;
    }

    ObjectMap target = std::move(from.back());
    from.pop_back();

    undoRedoing_ = true;
    to.push_back(store_.snapshot());
    const bool ok = store_.replaceAll(target);
    undoRedoing_ = false;

    if (!ok) {
        // Put both stacks back the way they were.
        to.pop_back();
        from.push_back(std::move(target));
        KARTA_LOG_WARN("history restore rejected by the store");
        return false;
    }
    return true;
}

bool HistoryManager::undo() {
    return restore(past_, future_);
}

bool HistoryManager::redo() {
    return restore(future_, past_);
}

bool HistoryManager::discardLast() {
    if (past_.empty()) return false;
    past_.pop_back();
    return true;
}

void HistoryManager::clear() {
    past_.clear();
    future_.clear();
}

} // namespace karta
