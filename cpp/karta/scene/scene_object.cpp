#include "karta/scene/scene_object.h"
#include "karta/scene/object_codec.h"
#include "karta/core/util.h"

#include <cmath>

namespace karta {

namespace {

constexpr const char* kDefaultFontFamily = "Inter, system-ui, sans-serif";

bool finite(float v) {
    return std::isfinite(v);
}

} // namespace

const std::array<ObjectField, kFieldCount> kAllFields = {
    ObjectField::Kind, ObjectField::X, ObjectField::Y, ObjectField::Width, ObjectField::Height,
    ObjectField::Rotation, ObjectField::Opacity, ObjectField::ZIndex, ObjectField::Fill,
    ObjectField::Stroke, ObjectField::StrokeWidth, ObjectField::Visible, ObjectField::Locked,
    ObjectField::ParentId, ObjectField::Text, ObjectField::FontSize, ObjectField::FontFamily,
    ObjectField::FontWeight, ObjectField::FontStyle, ObjectField::TextAlign, ObjectField::LineHeight,
    ObjectField::Name, ObjectField::Points, ObjectField::Children, ObjectField::Src,
    ObjectField::X1, ObjectField::Y1, ObjectField::X2, ObjectField::Y2,
};

const char* kindName(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::Rectangle: return "rectangle";
        case ObjectKind::Ellipse: return "ellipse";
        case ObjectKind::Text: return "text";
        case ObjectKind::Frame: return "frame";
        case ObjectKind::Path: return "path";
        case ObjectKind::Image: return "image";
        case ObjectKind::Video: return "video";
        case ObjectKind::Group: return "group";
        case ObjectKind::Line: return "line";
        case ObjectKind::Arrow: return "arrow";
    }
    return "unknown";
}

std::optional<ObjectKind> kindFromName(const std::string& name) {
    static const std::pair<const char*, ObjectKind> table[] = {
        {"rectangle", ObjectKind::Rectangle}, {"ellipse", ObjectKind::Ellipse},
        {"text", ObjectKind::Text}, {"frame", ObjectKind::Frame},
        {"path", ObjectKind::Path}, {"image", ObjectKind::Image},
        {"video", ObjectKind::Video}, {"group", ObjectKind::Group},
        {"line", ObjectKind::Line}, {"arrow", ObjectKind::Arrow},
    };
    for (const auto& [n, k] : table) {
        if (name == n) return k;
    }
    return std::nullopt;
}

const char* textAlignName(TextAlign align) {
    switch (align) {
        case TextAlign::Left: return "left";
        case TextAlign::Center: return "center";
        case TextAlign::Right: return "right";
    }
    return "left";
}

std::optional<TextAlign> textAlignFromName(const std::string& name) {
    if (name == "left") return TextAlign::Left;
    if (name == "center") return TextAlign::Center;
    if (name == "right") return TextAlign::Right;
    return std::nullopt;
}

const char* fieldName(ObjectField field) {
    switch (field) {
        case ObjectField::Kind: return "type";
        case ObjectField::X: return "x";
        case ObjectField::Y: return "y";
        case ObjectField::Width: return "width";
        case ObjectField::Height: return "height";
        case ObjectField::Rotation: return "rotation";
        case ObjectField::Opacity: return "opacity";
        case ObjectField::ZIndex: return "zIndex";
        case ObjectField::Fill: return "fill";
        case ObjectField::Stroke: return "stroke";
        case ObjectField::StrokeWidth: return "strokeWidth";
        case ObjectField::Visible: return "visible";
        case ObjectField::Locked: return "locked";
        case ObjectField::ParentId: return "parentId";
        case ObjectField::Text: return "text";
        case ObjectField::FontSize: return "fontSize";
        case ObjectField::FontFamily: return "fontFamily";
        case ObjectField::FontWeight: return "fontWeight";
        case ObjectField::FontStyle: return "fontStyle";
        case ObjectField::TextAlign: return "textAlign";
        case ObjectField::LineHeight: return "lineHeight";
        case ObjectField::Name: return "name";
        case ObjectField::Points: return "points";
        case ObjectField::Children: return "children";
        case ObjectField::Src: return "src";
        case ObjectField::X1: return "x1";
        case ObjectField::Y1: return "y1";
        case ObjectField::X2: return "x2";
        case ObjectField::Y2: return "y2";
    }
    return "?";
}

FieldMask requiredFields(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::Rectangle:
        case ObjectKind::Ellipse:
            return kBaseRequiredFields;
        case ObjectKind::Text:
            return kBaseRequiredFields | ObjectField::Text | ObjectField::FontSize |
                   ObjectField::FontFamily | ObjectField::TextAlign;
        case ObjectKind::Frame:
            return kBaseRequiredFields | ObjectField::Name;
        case ObjectKind::Path:
            return kBaseRequiredFields | ObjectField::Points;
        case ObjectKind::Image:
        case ObjectKind::Video:
            return kBaseRequiredFields | ObjectField::Src;
        case ObjectKind::Group:
            return kBaseRequiredFields | ObjectField::Children;
        case ObjectKind::Line:
        case ObjectKind::Arrow:
            return kBaseRequiredFields | ObjectField::X1 | ObjectField::Y1 | ObjectField::X2 |
                   ObjectField::Y2;
    }
    return kBaseRequiredFields;
}

FieldMask fieldsForKind(ObjectKind kind) {
    FieldMask mask = kCommonFields | requiredFields(kind);
    if (kind == ObjectKind::Text) {
        mask = mask | ObjectField::FontWeight | ObjectField::FontStyle | ObjectField::LineHeight;
    }
    return mask;
}

// ==============================================================================
// ObjectPatch
// ==============================================================================

ObjectPatch ObjectPatch::full(const SceneObject& obj) {
    ObjectPatch patch;
    patch.values = obj;
    patch.mask = fieldsForKind(obj.kind);
    return patch;
}

ObjectPatch& ObjectPatch::setKind(ObjectKind v) {
    values.kind = v;
    mask |= fieldBit(ObjectField::Kind);
    return *this;
}

ObjectPatch& ObjectPatch::setX(float v) {
    values.x = v;
    mask |= fieldBit(ObjectField::X);
    return *this;
}

ObjectPatch& ObjectPatch::setY(float v) {
    values.y = v;
    mask |= fieldBit(ObjectField::Y);
    return *this;
}

ObjectPatch& ObjectPatch::setPosition(float x, float y) {
    return setX(x).setY(y);
}

ObjectPatch& ObjectPatch::setSize(float w, float h) {
    values.width = w;
    values.height = h;
    mask |= ObjectField::Width | ObjectField::Height;
    return *this;
}

ObjectPatch& ObjectPatch::setRect(const Rect& r) {
    return setPosition(r.x, r.y).setSize(r.width, r.height);
}

ObjectPatch& ObjectPatch::setRotation(float deg) {
    values.rotation = deg;
    mask |= fieldBit(ObjectField::Rotation);
    return *this;
}

ObjectPatch& ObjectPatch::setOpacity(float v) {
    values.opacity = v;
    mask |= fieldBit(ObjectField::Opacity);
    return *this;
}

ObjectPatch& ObjectPatch::setZIndex(std::int32_t z) {
    values.zIndex = z;
    mask |= fieldBit(ObjectField::ZIndex);
    return *this;
}

ObjectPatch& ObjectPatch::setFill(std::optional<std::string> v) {
    values.fill = std::move(v);
    mask |= fieldBit(ObjectField::Fill);
    return *this;
}

ObjectPatch& ObjectPatch::setStroke(std::optional<std::string> v) {
    values.stroke = std::move(v);
    mask |= fieldBit(ObjectField::Stroke);
    return *this;
}

ObjectPatch& ObjectPatch::setStrokeWidth(std::optional<float> v) {
    values.strokeWidth = v;
    mask |= fieldBit(ObjectField::StrokeWidth);
    return *this;
}

ObjectPatch& ObjectPatch::setVisible(bool v) {
    values.visible = v;
    mask |= fieldBit(ObjectField::Visible);
    return *this;
}

ObjectPatch& ObjectPatch::setLocked(bool v) {
    values.locked = v;
    mask |= fieldBit(ObjectField::Locked);
    return *this;
}

ObjectPatch& ObjectPatch::setText(std::string v) {
    values.text = std::move(v);
    mask |= fieldBit(ObjectField::Text);
    return *this;
}

ObjectPatch& ObjectPatch::setFontSize(float v) {
    values.fontSize = v;
    mask |= fieldBit(ObjectField::FontSize);
    return *this;
}

ObjectPatch& ObjectPatch::setFontFamily(std::string v) {
    values.fontFamily = std::move(v);
    mask |= fieldBit(ObjectField::FontFamily);
    return *this;
}

ObjectPatch& ObjectPatch::setTextAlign(TextAlign v) {
    values.textAlign = v;
    mask |= fieldBit(ObjectField::TextAlign);
    return *this;
}

ObjectPatch& ObjectPatch::setLineHeight(float v) {
    values.lineHeight = v;
    mask |= fieldBit(ObjectField::LineHeight);
    return *this;
}

ObjectPatch& ObjectPatch::setName(std::string v) {
    values.name = std::move(v);
    mask |= fieldBit(ObjectField::Name);
    return *this;
}

ObjectPatch& ObjectPatch::setPoints(std::vector<Point2> v) {
    values.points = std::move(v);
    mask |= fieldBit(ObjectField::Points);
    return *this;
}

ObjectPatch& ObjectPatch::setSrc(std::string v) {
    values.src = std::move(v);
    mask |= fieldBit(ObjectField::Src);
    return *this;
}

ObjectPatch& ObjectPatch::setEndpoints(float x1, float y1, float x2, float y2) {
    values.x1 = x1;
    values.y1 = y1;
    values.x2 = x2;
    values.y2 = y2;
    mask |= ObjectField::X1 | ObjectField::Y1 | ObjectField::X2 | ObjectField::Y2;
    return *this;
}

// ==============================================================================
// Factory / validation
// ==============================================================================

SceneObject makeObject(ObjectKind kind, ObjectId id, float x, float y, float w, float h, std::int32_t z) {
    SceneObject obj;
    obj.id = std::move(id);
    obj.kind = kind;
    obj.x = x;
    obj.y = y;
    obj.width = w;
    obj.height = h;
    obj.zIndex = z;

    switch (kind) {
        case ObjectKind::Rectangle:
        case ObjectKind::Ellipse:
            obj.fill = "#4a4a4a";
            obj.stroke = "#666666";
            obj.strokeWidth = 0.0f;
            break;
        case ObjectKind::Text:
            obj.fill = "#ffffff";
            obj.fontFamily = kDefaultFontFamily;
            break;
        case ObjectKind::Frame:
            obj.fill = "#ffffff";
            obj.name = "Frame";
            break;
        case ObjectKind::Path:
        case ObjectKind::Line:
        case ObjectKind::Arrow:
            obj.stroke = "#ffffff";
            obj.strokeWidth = 2.0f;
            break;
        case ObjectKind::Image:
        case ObjectKind::Video:
        case ObjectKind::Group:
            break;
    }
    return obj;
}

bool validateObject(const SceneObject& obj, FieldMask present) {
    if (obj.id.empty()) {
        return false;
    }
    const FieldMask required = requiredFields(obj.kind);
    if ((present & required) != required) {
        return false;
    }

    if (!finite(obj.x) || !finite(obj.y) || !finite(obj.width) || !finite(obj.height) ||
        !finite(obj.rotation) || !finite(obj.opacity)) {
        return false;
    }
    if (obj.strokeWidth && !finite(*obj.strokeWidth)) {
        return false;
    }

    switch (obj.kind) {
        case ObjectKind::Rectangle:
        case ObjectKind::Ellipse:
        case ObjectKind::Frame:
        case ObjectKind::Image:
        case ObjectKind::Video:
        case ObjectKind::Group:
            return true;
        case ObjectKind::Text:
            return finite(obj.fontSize) && obj.fontSize > 0.0f && finite(obj.lineHeight);
        case ObjectKind::Path:
            for (const Point2& p : obj.points) {
                if (!finite(p.x) || !finite(p.y)) return false;
            }
            return true;
        case ObjectKind::Line:
        case ObjectKind::Arrow:
            return finite(obj.x1) && finite(obj.y1) && finite(obj.x2) && finite(obj.y2);
    }
    return false;
}

bool sanitizeObject(SceneObject& obj) {
    const SceneObject before = obj;

    obj.x = clampValue(obj.x, constants::kMinCoordinate, constants::kMaxCoordinate);
    obj.y = clampValue(obj.y, constants::kMinCoordinate, constants::kMaxCoordinate);
    obj.width = clampValue(obj.width, constants::kMinDimension, constants::kMaxDimension);
    obj.height = clampValue(obj.height, constants::kMinDimension, constants::kMaxDimension);
    obj.opacity = clampValue(obj.opacity, 0.0f, 1.0f);
    obj.rotation = normalizeRotation(obj.rotation);
    if (obj.kind == ObjectKind::Text && obj.fontSize < 1.0f) {
        obj.fontSize = 1.0f;
    }

    return ObjectCodec::diff(before, obj, fieldsForKind(obj.kind)) != 0;
}

} // namespace karta
