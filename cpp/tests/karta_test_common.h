#pragma once

#include <gtest/gtest.h>

#include "karta/core/constants.h"
#include "karta/core/util.h"
#include "karta/editor.h"
#include "karta/scene/object_codec.h"
#include "karta/store/replicated_store.h"
#include "karta/store/replication_channel.h"
#include "karta/tools/overlay_surface.h"

#include <memory>
#include <string>
#include <vector>

namespace karta_test {

using namespace karta;

// Time only moves when a test says so.
class ManualClock {
public:
    ClockFn fn() const {
        auto t = time_;
        return [t]() { return *t; };
    }
    void advance(double ms) { *time_ += ms; }
    double now() const { return *time_; }

private:
    std::shared_ptr<double> time_ = std::make_shared<double>(1000.0);
};

class RecordingChannel : public ReplicationChannel {
public:
    void publish(const ObjectDelta& delta) override { deltas.push_back(delta); }
    void publishDelete(const ObjectId& id, const Stamp& stamp) override { deletes.emplace_back(id, stamp); }

    void clear() {
        deltas.clear();
        deletes.clear();
    }

    std::vector<ObjectDelta> deltas;
    std::vector<std::pair<ObjectId, Stamp>> deletes;
};

class RecordingSurface : public OverlaySurface {
public:
    struct StrokedRect {
        Rect rect;
        bool dashed;
    };

    float width() const override { return 800.0f; }
    float height() const override { return 600.0f; }

    void fillRect(const Rect& rect, Rgba) override { fills.push_back(rect); }
    void strokeRect(const Rect& rect, Rgba, float, bool dashed) override { strokes.push_back(StrokedRect{rect, dashed}); }
    void strokeLine(Point2 from, Point2 to, Rgba, float) override { lines.emplace_back(from, to); }

    std::vector<Rect> fills;
    std::vector<StrokedRect> strokes;
    std::vector<std::pair<Point2, Point2>> lines;
};

inline SceneObject rect(const std::string& id, float x, float y, float w, float h, std::int32_t z = 0) {
    return makeObject(ObjectKind::Rectangle, id, x, y, w, h, z);
}

inline bool addObject(ReplicatedStore& store, const SceneObject& obj) {
    return store.apply(obj.id, ObjectPatch::full(obj));
}

inline bool addRect(ReplicatedStore& store, const std::string& id, float x, float y, float w, float h, std::int32_t z = 0) {
    return addObject(store, rect(id, x, y, w, h, z));
}

// Full delta for `obj` with every field stamped (counter, site).
inline ObjectDelta fullDelta(const SceneObject& obj, std::uint64_t counter, const std::string& site) {
    ObjectDelta delta;
    delta.id = obj.id;
    const FieldMask mask = fieldsForKind(obj.kind);
    for (ObjectField f : kAllFields) {
        if (hasField(mask, f)) {
            delta.writes.push_back(FieldWrite{f, ObjectCodec::read(obj, f), Stamp{counter, site}});
        }
    }
    return delta;
}

inline ObjectDelta fieldDelta(const ObjectId& id, ObjectField field, FieldValue value, std::uint64_t counter, const std::string& site) {
    ObjectDelta delta;
    delta.id = id;
    delta.writes.push_back(FieldWrite{field, std::move(value), Stamp{counter, site}});
    return delta;
}

inline KeyEvent key(const std::string& k, std::uint32_t modifiers = 0, bool repeat = false) {
    KeyEvent e;
    e.key = k;
    e.code = k;
    e.modifiers = modifiers;
    e.repeat = repeat;
    return e;
}

constexpr std::uint32_t kShift = 1u;
constexpr std::uint32_t kCtrl = 2u;
constexpr std::uint32_t kAlt = 4u;
constexpr std::uint32_t kMeta = 8u;

// Editor with an identity viewport and a clock the test controls.
class EditorFixture : public ::testing::Test {
protected:
    EditorFixture() : editor(EditorOptions{}, clock.fn()) {
        editor.setCanvasSize(800.0f, 600.0f);
    }

    void drag(float x0, float y0, float x1, float y1, std::uint32_t modifiers = 0) {
        editor.mouseDown(x0, y0, 0, modifiers);
        editor.mouseMove((x0 + x1) * 0.5f, (y0 + y1) * 0.5f, 0, modifiers);
        editor.mouseMove(x1, y1, 0, modifiers);
        editor.mouseUp(x1, y1, 0, modifiers);
    }

    void click(float x, float y, std::uint32_t modifiers = 0) {
        editor.mouseDown(x, y, 0, modifiers);
        editor.mouseUp(x, y, 0, modifiers);
    }

    const SceneObject* only() {
        const ObjectMap& objects = editor.store().objects();
        return objects.size() == 1 ? &objects.begin()->second : nullptr;
    }

    ManualClock clock;
    Editor editor;
};

} // namespace karta_test
