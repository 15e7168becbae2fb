#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "karta/core/logging.h"
#include "karta/editor.h"
#include "karta/text/font_manager.h"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

#ifdef EMSCRIPTEN
namespace {

using karta::Editor;

// Flattened ToolEventResult; embind has no std::optional.
struct EventResult {
    bool handled;
    std::string cursor;
    bool requestRedraw;
};

EventResult toEventResult(const karta::ToolEventResult& r) {
    return EventResult{r.handled, r.cursor ? karta::cursorName(*r.cursor) : std::string(), r.requestRedraw};
}

// The host passes its replication peer id; two clients must not share one.
Editor* createEditorForSite(std::string siteId) {
    karta::EditorOptions options;
    options.store.siteId = std::move(siteId);
    return new Editor(std::move(options));
}

std::string siteIdOf(Editor& editor) {
    return editor.store().siteId();
}

EventResult mouseDown(Editor& editor, float x, float y, int button, std::uint32_t modifiers) {
    return toEventResult(editor.mouseDown(x, y, button, modifiers));
}

EventResult mouseMove(Editor& editor, float x, float y, int button, std::uint32_t modifiers) {
    return toEventResult(editor.mouseMove(x, y, button, modifiers));
}

EventResult mouseUp(Editor& editor, float x, float y, int button, std::uint32_t modifiers) {
    return toEventResult(editor.mouseUp(x, y, button, modifiers));
}

EventResult keyDown(Editor& editor, const karta::KeyEvent& e) {
    return toEventResult(editor.keyDown(e));
}

EventResult keyUp(Editor& editor, const karta::KeyEvent& e) {
    return toEventResult(editor.keyUp(e));
}

bool setActiveToolByName(Editor& editor, const std::string& name) {
    const std::optional<karta::ToolType> type = karta::toolFromName(name);
    return type && editor.setActiveTool(*type);
}

std::string activeToolName(Editor& editor) {
    return karta::toolName(editor.activeTool());
}

std::string cursorName(Editor& editor) {
    return karta::cursorName(editor.cursor());
}

emscripten::val selectedIds(Editor& editor) {
    emscripten::val out = emscripten::val::array();
    for (const karta::ObjectId& id : editor.selection().getSelectedIds()) {
        out.call<void>("push", id);
    }
    return out;
}

void setSelection(Editor& editor, emscripten::val ids) {
    editor.selection().setSelection(emscripten::vecFromJSArray<std::string>(ids));
}

emscripten::val viewport(Editor& editor) {
    const karta::Viewport& vp = editor.viewport();
    emscripten::val out = emscripten::val::object();
    out.set("x", vp.x);
    out.set("y", vp.y);
    out.set("zoom", vp.zoom);
    return out;
}

void setViewport(Editor& editor, float x, float y, float zoom) {
    editor.setViewport(karta::Viewport{x, y, zoom});
}

void setGrid(Editor& editor, float size, bool snapEnabled, bool snapToObjects, float threshold) {
    karta::GridSettings& grid = editor.grid();
    grid.size = size;
    grid.snapEnabled = snapEnabled;
    grid.snapToObjects = snapToObjects;
    grid.objectSnapThreshold = threshold;
}

// ==============================================================================
// Replication transport
// ==============================================================================

// Field values cross the boundary as plain JS values: numbers, booleans,
// strings, arrays of {x, y}, arrays of ids, and null for "unset".
emscripten::val encodeValue(const karta::FieldValue& value) {
    using emscripten::val;
    if (const double* d = std::get_if<double>(&value)) return val(*d);
    if (const bool* b = std::get_if<bool>(&value)) return val(*b);
    if (const std::string* s = std::get_if<std::string>(&value)) return val(*s);
    if (const auto* points = std::get_if<std::vector<karta::Point2>>(&value)) {
        val out = val::array();
        for (const karta::Point2& p : *points) {
            val point = val::object();
            point.set("x", p.x);
            point.set("y", p.y);
            out.call<void>("push", point);
        }
        return out;
    }
    if (const auto* ids = std::get_if<std::vector<karta::ObjectId>>(&value)) {
        val out = val::array();
        for (const karta::ObjectId& id : *ids) {
            out.call<void>("push", id);
        }
        return out;
    }
    return val::null();
}

karta::FieldValue decodeValue(karta::ObjectField field, const emscripten::val& v) {
    if (v.isNull() || v.isUndefined()) return std::monostate{};
    if (v.isNumber()) return v.as<double>();
    if (v.isTrue() || v.isFalse()) return v.as<bool>();
    if (v.isString()) return v.as<std::string>();
    if (field == karta::ObjectField::Points) {
        std::vector<karta::Point2> points;
        const unsigned length = v["length"].as<unsigned>();
        points.reserve(length);
        for (unsigned i = 0; i < length; ++i) {
            points.push_back(karta::Point2{v[i]["x"].as<float>(), v[i]["y"].as<float>()});
        }
        return points;
    }
    return emscripten::vecFromJSArray<karta::ObjectId>(v);
}

std::optional<karta::ObjectField> fieldFromName(const std::string& name) {
    for (karta::ObjectField field : karta::kAllFields) {
        if (name == karta::fieldName(field)) {
            return field;
        }
    }
    return std::nullopt;
}

emscripten::val encodeStamp(const karta::Stamp& stamp) {
    emscripten::val out = emscripten::val::object();
    // Counters stay well inside the 53-bit safe integer range.
    out.set("counter", static_cast<double>(stamp.counter));
    out.set("site", stamp.siteId);
    return out;
}

karta::Stamp decodeStamp(const emscripten::val& v) {
    return karta::Stamp{static_cast<std::uint64_t>(v["counter"].as<double>()), v["site"].as<std::string>()};
}

// Forwards outbound deltas to JS callbacks: onPublish({id, writes}) and
// onDelete(id, stamp).
class JsChannel : public karta::ReplicationChannel {
public:
    JsChannel(emscripten::val onPublish, emscripten::val onDelete)
        : onPublish_(std::move(onPublish)), onDelete_(std::move(onDelete)) {}

    void publish(const karta::ObjectDelta& delta) override {
        emscripten::val writes = emscripten::val::array();
        for (const karta::FieldWrite& w : delta.writes) {
            emscripten::val write = emscripten::val::object();
            write.set("field", std::string(karta::fieldName(w.field)));
            write.set("value", encodeValue(w.value));
            write.set("stamp", encodeStamp(w.stamp));
            writes.call<void>("push", write);
        }
        emscripten::val out = emscripten::val::object();
        out.set("id", delta.id);
        out.set("writes", writes);
        onPublish_(out);
    }

    void publishDelete(const karta::ObjectId& id, const karta::Stamp& stamp) override {
        onDelete_(id, encodeStamp(stamp));
    }

private:
    emscripten::val onPublish_;
    emscripten::val onDelete_;
};

// One channel per editor; replaced on reconnect.
std::unordered_map<const Editor*, std::unique_ptr<JsChannel>> g_channels;

void connect(Editor& editor, emscripten::val onPublish, emscripten::val onDelete) {
    auto channel = std::make_unique<JsChannel>(std::move(onPublish), std::move(onDelete));
    editor.setChannel(channel.get());
    g_channels[&editor] = std::move(channel);
}

void disconnect(Editor& editor) {
    editor.setChannel(nullptr);
    g_channels.erase(&editor);
}

bool mergeRemote(Editor& editor, emscripten::val delta) {
    karta::ObjectDelta decoded;
    decoded.id = delta["id"].as<std::string>();
    const emscripten::val writes = delta["writes"];
    const unsigned length = writes["length"].as<unsigned>();
    for (unsigned i = 0; i < length; ++i) {
        const emscripten::val w = writes[i];
        const std::optional<karta::ObjectField> field = fieldFromName(w["field"].as<std::string>());
        if (!field) {
            KARTA_LOG_WARN("remote write for unknown field on %s", decoded.id.c_str());
            continue;
        }
        decoded.writes.push_back(karta::FieldWrite{*field, decodeValue(*field, w["value"]), decodeStamp(w["stamp"])});
    }
    return editor.store().mergeRemote(decoded);
}

bool mergeRemoteDelete(Editor& editor, const std::string& id, emscripten::val stamp) {
    return editor.store().mergeRemoteDelete(id, decodeStamp(stamp));
}

// ==============================================================================
// Fonts
// ==============================================================================

karta::FontManager g_fonts;

std::uint32_t loadFont(Editor& editor, const std::string& bytes, const std::string& family, bool bold, bool italic) {
    if (!g_fonts.isInitialized() && !g_fonts.initialize()) {
        KARTA_LOG_WARN("font manager failed to initialize");
        return 0;
    }
    const std::uint32_t id = g_fonts.loadFontFromMemory(
        reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size(), family, bold, italic);
    if (id != 0) {
        editor.setLineShaper(&g_fonts);
    }
    return id;
}

} // namespace

EMSCRIPTEN_BINDINGS(karta_module) {
    emscripten::value_object<EventResult>("EventResult")
        .field("handled", &EventResult::handled)
        .field("cursor", &EventResult::cursor)
        .field("requestRedraw", &EventResult::requestRedraw);

    emscripten::value_object<karta::KeyEvent>("KeyEvent")
        .field("key", &karta::KeyEvent::key)
        .field("code", &karta::KeyEvent::code)
        .field("modifiers", &karta::KeyEvent::modifiers)
        .field("repeat", &karta::KeyEvent::repeat);

    emscripten::enum_<karta::AlignMode>("AlignMode")
        .value("Left", karta::AlignMode::Left)
        .value("Right", karta::AlignMode::Right)
        .value("Top", karta::AlignMode::Top)
        .value("Bottom", karta::AlignMode::Bottom)
        .value("CenterH", karta::AlignMode::CenterH)
        .value("CenterV", karta::AlignMode::CenterV);

    emscripten::enum_<karta::DistributeAxis>("DistributeAxis")
        .value("Horizontal", karta::DistributeAxis::Horizontal)
        .value("Vertical", karta::DistributeAxis::Vertical);

    emscripten::class_<Editor>("Editor")
        .constructor<>()
        .constructor(&createEditorForSite, emscripten::allow_raw_pointers())
        .function("siteId", &siteIdOf)
        .function("pump", &Editor::pump)
        .function("mouseDown", &mouseDown)
        .function("mouseMove", &mouseMove)
        .function("mouseUp", &mouseUp)
        .function("keyDown", &keyDown)
        .function("keyUp", &keyUp)
        .function("textInput", &Editor::textInput)
        .function("commitTextEdit", &Editor::commitTextEdit)
        .function("cancelTextEdit", &Editor::cancelTextEdit)
        .function("setActiveTool", &setActiveToolByName)
        .function("getActiveTool", &activeToolName)
        .function("getCursor", &cursorName)
        .function("getSelectedIds", &selectedIds)
        .function("setSelection", &setSelection)
        .function("deleteSelection", &Editor::deleteSelection)
        .function("undo", &Editor::undo)
        .function("redo", &Editor::redo)
        .function("copySelection", &Editor::copySelection)
        .function("paste", &Editor::paste)
        .function("duplicateSelection", &Editor::duplicateSelection)
        .function("selectAll", &Editor::selectAll)
        .function("groupSelection", &Editor::groupSelection)
        .function("ungroupSelection", &Editor::ungroupSelection)
        .function("bringForward", &Editor::bringForward)
        .function("sendBackward", &Editor::sendBackward)
        .function("bringToFront", &Editor::bringToFront)
        .function("sendToBack", &Editor::sendToBack)
        .function("alignSelection", &Editor::alignSelection)
        .function("distributeSelection", &Editor::distributeSelection)
        .function("setCanvasSize", &Editor::setCanvasSize)
        .function("getViewport", &viewport)
        .function("setViewport", &setViewport)
        .function("zoomAt", &Editor::zoomAt)
        .function("setZoomPreset", &Editor::setZoomPreset)
        .function("zoomToFit", &Editor::zoomToFit)
        .function("zoomToSelection", &Editor::zoomToSelection)
        .function("setGrid", &setGrid)
        .function("connect", &connect)
        .function("disconnect", &disconnect)
        .function("mergeRemote", &mergeRemote)
        .function("mergeRemoteDelete", &mergeRemoteDelete)
        .function("loadFont", &loadFont);
}
#endif
