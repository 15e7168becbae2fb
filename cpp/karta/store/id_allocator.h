#pragma once

#include "karta/core/types.h"

#include <cstdint>
#include <functional>
#include <string>

namespace karta {

using IdInUseFn = std::function<bool(const ObjectId&)>;

// Ids are "<site>-<counter>", unique across the document as long as site ids
// are. Counters already taken in the document (live or deleted) are skipped,
// so a reloaded session never reissues one.
class IdAllocator {
public:
    explicit IdAllocator(std::string siteId, IdInUseFn inUse = {})
        : siteId_(std::move(siteId)), inUse_(std::move(inUse)) {}

    ObjectId next() {
        ObjectId id;
        do {
            id = siteId_ + "-" + std::to_string(++counter_);
        } while (inUse_ && inUse_(id));
        return id;
    }

    const std::string& siteId() const { return siteId_; }

private:
    std::string siteId_;
    IdInUseFn inUse_;
    std::uint64_t counter_{0};
};

} // namespace karta
