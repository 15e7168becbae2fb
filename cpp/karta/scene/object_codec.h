#pragma once

#include "karta/scene/scene_object.h"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace karta {

// Lamport stamp. Total order: counter first, site id breaks ties.
struct Stamp {
    std::uint64_t counter{0};
    std::string siteId;
};

inline bool operator<(const Stamp& a, const Stamp& b) {
    if (a.counter != b.counter) return a.counter < b.counter;
    return a.siteId < b.siteId;
}
inline bool operator==(const Stamp& a, const Stamp& b) {
    return a.counter == b.counter && a.siteId == b.siteId;
}
inline bool operator!=(const Stamp& a, const Stamp& b) { return !(a == b); }
inline bool operator>(const Stamp& a, const Stamp& b) { return b < a; }
inline bool operator<=(const Stamp& a, const Stamp& b) { return !(b < a); }

// Wire representation of one field. monostate encodes "unset" for optional fields.
using FieldValue = std::variant<
    std::monostate,
    double,
    bool,
    std::string,
    std::vector<Point2>,
    std::vector<ObjectId>>;

struct FieldWrite {
    ObjectField field;
    FieldValue value;
    Stamp stamp;
};

// A replicated change to one object: full or partial, as produced by a peer.
struct ObjectDelta {
    ObjectId id;
    std::vector<FieldWrite> writes;
};

struct ObjectCodec {
    static FieldValue read(const SceneObject& obj, ObjectField field);

    // False when the value has the wrong alternative for the field; obj is untouched then.
    static bool write(SceneObject& obj, ObjectField field, const FieldValue& value);

    static void copyFields(SceneObject& dst, const SceneObject& src, FieldMask mask);

    // Bits of `mask` whose values differ between a and b.
    static FieldMask diff(const SceneObject& a, const SceneObject& b, FieldMask mask);
};

} // namespace karta
