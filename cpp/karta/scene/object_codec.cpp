#include "karta/scene/object_codec.h"

#include <cmath>

namespace karta {

namespace {

FieldValue optionalString(const std::optional<std::string>& v) {
    if (v) return *v;
    return std::monostate{};
}

bool readNumber(const FieldValue& value, float& out) {
    const double* d = std::get_if<double>(&value);
    if (!d) return false;
    out = static_cast<float>(*d);
    return true;
}

bool readOptionalString(const FieldValue& value, std::optional<std::string>& out) {
    if (std::holds_alternative<std::monostate>(value)) {
        out.reset();
        return true;
    }
    const std::string* s = std::get_if<std::string>(&value);
    if (!s) return false;
    out = *s;
    return true;
}

template <typename T>
bool readAs(const FieldValue& value, T& out) {
    const T* v = std::get_if<T>(&value);
    if (!v) return false;
    out = *v;
    return true;
}

} // namespace

FieldValue ObjectCodec::read(const SceneObject& obj, ObjectField field) {
    switch (field) {
        case ObjectField::Kind: return std::string(kindName(obj.kind));
        case ObjectField::X: return static_cast<double>(obj.x);
        case ObjectField::Y: return static_cast<double>(obj.y);
        case ObjectField::Width: return static_cast<double>(obj.width);
        case ObjectField::Height: return static_cast<double>(obj.height);
        case ObjectField::Rotation: return static_cast<double>(obj.rotation);
        case ObjectField::Opacity: return static_cast<double>(obj.opacity);
        case ObjectField::ZIndex: return static_cast<double>(obj.zIndex);
        case ObjectField::Fill: return optionalString(obj.fill);
        case ObjectField::Stroke: return optionalString(obj.stroke);
        case ObjectField::StrokeWidth:
            if (obj.strokeWidth) return static_cast<double>(*obj.strokeWidth);
            return std::monostate{};
        case ObjectField::Visible: return obj.visible;
        case ObjectField::Locked: return obj.locked;
        case ObjectField::ParentId: return optionalString(obj.parentId_);
        case ObjectField::Text: return obj.text;
        case ObjectField::FontSize: return static_cast<double>(obj.fontSize);
        case ObjectField::FontFamily: return obj.fontFamily;
        case ObjectField::FontWeight: return static_cast<double>(obj.fontWeight);
        case ObjectField::FontStyle:
            return std::string(obj.fontStyle == FontStyle::Italic ? "italic" : "normal");
        case ObjectField::TextAlign: return std::string(textAlignName(obj.textAlign));
        case ObjectField::LineHeight: return static_cast<double>(obj.lineHeight);
        case ObjectField::Name: return obj.name;
        case ObjectField::Points: return obj.points;
        case ObjectField::Children: return obj.children_;
        case ObjectField::Src: return obj.src;
        case ObjectField::X1: return static_cast<double>(obj.x1);
        case ObjectField::Y1: return static_cast<double>(obj.y1);
        case ObjectField::X2: return static_cast<double>(obj.x2);
        case ObjectField::Y2: return static_cast<double>(obj.y2);
    }
    return std::monostate{};
}

bool ObjectCodec::write(SceneObject& obj, ObjectField field, const FieldValue& value) {
    switch (field) {
        case ObjectField::Kind: {
            const std::string* s = std::get_if<std::string>(&value);
            if (!s) return false;
            auto kind = kindFromName(*s);
            if (!kind) return false;
            obj.kind = *kind;
            return true;
        }
        case ObjectField::X: return readNumber(value, obj.x);
        case ObjectField::Y: return readNumber(value, obj.y);
        case ObjectField::Width: return readNumber(value, obj.width);
        case ObjectField::Height: return readNumber(value, obj.height);
        case ObjectField::Rotation: return readNumber(value, obj.rotation);
        case ObjectField::Opacity: return readNumber(value, obj.opacity);
        case ObjectField::ZIndex: {
            const double* d = std::get_if<double>(&value);
            if (!d || !std::isfinite(*d)) return false;
            obj.zIndex = static_cast<std::int32_t>(*d);
            return true;
        }
        case ObjectField::Fill: return readOptionalString(value, obj.fill);
        case ObjectField::Stroke: return readOptionalString(value, obj.stroke);
        case ObjectField::StrokeWidth: {
            if (std::holds_alternative<std::monostate>(value)) {
                obj.strokeWidth.reset();
                return true;
            }
            float w = 0.0f;
            if (!readNumber(value, w)) return false;
            obj.strokeWidth = w;
            return true;
        }
        case ObjectField::Visible: return readAs(value, obj.visible);
        case ObjectField::Locked: return readAs(value, obj.locked);
        case ObjectField::ParentId: return readOptionalString(value, obj.parentId_);
        case ObjectField::Text: return readAs(value, obj.text);
        case ObjectField::FontSize: return readNumber(value, obj.fontSize);
        case ObjectField::FontFamily: return readAs(value, obj.fontFamily);
        case ObjectField::FontWeight: {
            float w = 0.0f;
            if (!readNumber(value, w) || !std::isfinite(w)) return false;
            obj.fontWeight = static_cast<std::uint16_t>(w);
            return true;
        }
        case ObjectField::FontStyle: {
            const std::string* s = std::get_if<std::string>(&value);
            if (!s) return false;
            if (*s == "italic") obj.fontStyle = FontStyle::Italic;
            else if (*s == "normal") obj.fontStyle = FontStyle::Normal;
            else return false;
            return true;
        }
        case ObjectField::TextAlign: {
            const std::string* s = std::get_if<std::string>(&value);
            if (!s) return false;
            auto align = textAlignFromName(*s);
            if (!align) return false;
            obj.textAlign = *align;
            return true;
        }
        case ObjectField::LineHeight: return readNumber(value, obj.lineHeight);
        case ObjectField::Name: return readAs(value, obj.name);
        case ObjectField::Points: return readAs(value, obj.points);
        case ObjectField::Children: return readAs(value, obj.children_);
        case ObjectField::Src: return readAs(value, obj.src);
        case ObjectField::X1: return readNumber(value, obj.x1);
        case ObjectField::Y1: return readNumber(value, obj.y1);
        case ObjectField::X2: return readNumber(value, obj.x2);
        case ObjectField::Y2: return readNumber(value, obj.y2);
    }
    return false;
}

void ObjectCodec::copyFields(SceneObject& dst, const SceneObject& src, FieldMask mask) {
    if (hasField(mask, ObjectField::Kind)) dst.kind = src.kind;
    if (hasField(mask, ObjectField::X)) dst.x = src.x;
    if (hasField(mask, ObjectField::Y)) dst.y = src.y;
    if (hasField(mask, ObjectField::Width)) dst.width = src.width;
    if (hasField(mask, ObjectField::Height)) dst.height = src.height;
    if (hasField(mask, ObjectField::Rotation)) dst.rotation = src.rotation;
    if (hasField(mask, ObjectField::Opacity)) dst.opacity = src.opacity;
    if (hasField(mask, ObjectField::ZIndex)) dst.zIndex = src.zIndex;
    if (hasField(mask, ObjectField::Fill)) dst.fill = src.fill;
    if (hasField(mask, ObjectField::Stroke)) dst.stroke = src.stroke;
    if (hasField(mask, ObjectField::StrokeWidth)) dst.strokeWidth = src.strokeWidth;
    if (hasField(mask, ObjectField::Visible)) dst.visible = src.visible;
    if (hasField(mask, ObjectField::Locked)) dst.locked = src.locked;
    if (hasField(mask, ObjectField::ParentId)) dst.parentId_ = src.parentId_;
    if (hasField(mask, ObjectField::Text)) dst.text = src.text;
    if (hasField(mask, ObjectField::FontSize)) dst.fontSize = src.fontSize;
    if (hasField(mask, ObjectField::FontFamily)) dst.fontFamily = src.fontFamily;
    if (hasField(mask, ObjectField::FontWeight)) dst.fontWeight = src.fontWeight;
    if (hasField(mask, ObjectField::FontStyle)) dst.fontStyle = src.fontStyle;
    if (hasField(mask, ObjectField::TextAlign)) dst.textAlign = src.textAlign;
    if (hasField(mask, ObjectField::LineHeight)) dst.lineHeight = src.lineHeight;
    if (hasField(mask, ObjectField::Name)) dst.name = src.name;
    if (hasField(mask, ObjectField::Points)) dst.points = src.points;
    if (hasField(mask, ObjectField::Children)) dst.children_ = src.children_;
    if (hasField(mask, ObjectField::Src)) dst.src = src.src;
    if (hasField(mask, ObjectField::X1)) dst.x1 = src.x1;
    if (hasField(mask, ObjectField::Y1)) dst.y1 = src.y1;
    if (hasField(mask, ObjectField::X2)) dst.x2 = src.x2;
    if (hasField(mask, ObjectField::Y2)) dst.y2 = src.y2;
}

FieldMask ObjectCodec::diff(const SceneObject& a, const SceneObject& b, FieldMask mask) {
    FieldMask out = 0;
    for (ObjectField f : kAllFields) {
        if (!hasField(mask, f)) continue;
        if (read(a, f) != read(b, f)) {
            out |= fieldBit(f);
        }
    }
    return out;
}

} // namespace karta
