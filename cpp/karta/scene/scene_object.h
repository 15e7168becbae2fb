#pragma once

#include "karta/core/constants.h"
#include "karta/core/types.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace karta {

class GroupResolver;
struct ObjectCodec;

enum class ObjectKind : std::uint8_t {
    Rectangle = 0,
    Ellipse = 1,
    Text = 2,
    Frame = 3,
    Path = 4,
    Image = 5,
    Video = 6,
    Group = 7,
    Line = 8,
    Arrow = 9
};

enum class TextAlign : std::uint8_t {
    Left = 0,
    Center = 1,
    Right = 2
};

enum class FontStyle : std::uint8_t {
    Normal = 0,
    Italic = 1
};

const char* kindName(ObjectKind kind);
std::optional<ObjectKind> kindFromName(const std::string& name);
const char* textAlignName(TextAlign align);
std::optional<TextAlign> textAlignFromName(const std::string& name);

// One bit per replicated field. Field-level last-writer-wins works on these units.
enum class ObjectField : std::uint32_t {
    Kind        = 1u << 0,
    X           = 1u << 1,
    Y           = 1u << 2,
    Width       = 1u << 3,
    Height      = 1u << 4,
    Rotation    = 1u << 5,
    Opacity     = 1u << 6,
    ZIndex      = 1u << 7,
    Fill        = 1u << 8,
    Stroke      = 1u << 9,
    StrokeWidth = 1u << 10,
    Visible     = 1u << 11,
    Locked      = 1u << 12,
    ParentId    = 1u << 13,
    Text        = 1u << 14,
    FontSize    = 1u << 15,
    FontFamily  = 1u << 16,
    FontWeight  = 1u << 17,
    FontStyle   = 1u << 18,
    TextAlign   = 1u << 19,
    LineHeight  = 1u << 20,
    Name        = 1u << 21,
    Points      = 1u << 22,
    Children    = 1u << 23,
    Src         = 1u << 24,
    X1          = 1u << 25,
    Y1          = 1u << 26,
    X2          = 1u << 27,
    Y2          = 1u << 28
};

using FieldMask = std::uint32_t;

constexpr FieldMask fieldBit(ObjectField f) {
    return static_cast<FieldMask>(f);
}

constexpr FieldMask operator|(ObjectField a, ObjectField b) {
    return fieldBit(a) | fieldBit(b);
}

constexpr FieldMask operator|(FieldMask a, ObjectField b) {
    return a | fieldBit(b);
}

constexpr bool hasField(FieldMask mask, ObjectField f) {
    return (mask & fieldBit(f)) != 0;
}

constexpr std::size_t kFieldCount = 29;
extern const std::array<ObjectField, kFieldCount> kAllFields;
const char* fieldName(ObjectField field);

constexpr FieldMask kGeometryFields =
    ObjectField::X | ObjectField::Y | ObjectField::Width | ObjectField::Height;

// Fields every object must carry before it is accepted into the document.
constexpr FieldMask kBaseRequiredFields =
    kGeometryFields | ObjectField::Kind | ObjectField::Rotation | ObjectField::Opacity |
    ObjectField::ZIndex;

// Common fields meaningful for every kind (required + optional).
constexpr FieldMask kCommonFields =
    kBaseRequiredFields | ObjectField::Fill | ObjectField::Stroke | ObjectField::StrokeWidth |
    ObjectField::Visible | ObjectField::Locked | ObjectField::ParentId;

FieldMask requiredFields(ObjectKind kind);
FieldMask fieldsForKind(ObjectKind kind);

// Closed tagged union over the scene object variants. Variant payload fields are
// only meaningful for their kind; see fieldsForKind().
struct SceneObject {
    ObjectId id;
    ObjectKind kind{ObjectKind::Rectangle};

    float x{0.0f};
    float y{0.0f};
    float width{constants::kMinDimension};
    float height{constants::kMinDimension};
    float rotation{0.0f};
    float opacity{1.0f};
    std::int32_t zIndex{0};

    std::optional<std::string> fill;
    std::optional<std::string> stroke;
    std::optional<float> strokeWidth;
    bool visible{true};
    bool locked{false};

    // Text
    std::string text;
    float fontSize{constants::kDefaultFontSize};
    std::string fontFamily;
    std::uint16_t fontWeight{400};
    FontStyle fontStyle{FontStyle::Normal};
    TextAlign textAlign{TextAlign::Left};
    float lineHeight{constants::kDefaultLineHeight};

    // Frame
    std::string name;

    // Path, relative to (x, y)
    std::vector<Point2> points;

    // Image / Video
    std::string src;

    // Line / Arrow, relative to (x, y)
    float x1{0.0f};
    float y1{0.0f};
    float x2{0.0f};
    float y2{0.0f};

    const std::optional<ObjectId>& parentId() const { return parentId_; }
    const std::vector<ObjectId>& children() const { return children_; }
    bool isChild() const { return parentId_.has_value(); }
    Rect rect() const { return Rect{x, y, width, height}; }

private:
    // Hierarchy links are written only by GroupResolver and the field codec.
    std::optional<ObjectId> parentId_;
    std::vector<ObjectId> children_;

    friend class GroupResolver;
    friend struct ObjectCodec;
};

using ObjectMap = std::unordered_map<ObjectId, SceneObject>;

// Sparse update of one object: only fields whose bit is set in `mask` are read
// from `values`. Hierarchy fields have no public setter.
struct ObjectPatch {
    FieldMask mask{0};
    SceneObject values;

    static ObjectPatch full(const SceneObject& obj);

    bool has(ObjectField f) const { return hasField(mask, f); }
    bool empty() const { return mask == 0; }

    // Only between kinds that share a field layout (rectangle and ellipse).
    ObjectPatch& setKind(ObjectKind v);
    ObjectPatch& setX(float v);
    ObjectPatch& setY(float v);
    ObjectPatch& setPosition(float x, float y);
    ObjectPatch& setSize(float w, float h);
    ObjectPatch& setRect(const Rect& r);
    ObjectPatch& setRotation(float deg);
    ObjectPatch& setOpacity(float v);
    ObjectPatch& setZIndex(std::int32_t z);
    ObjectPatch& setFill(std::optional<std::string> v);
    ObjectPatch& setStroke(std::optional<std::string> v);
    ObjectPatch& setStrokeWidth(std::optional<float> v);
    ObjectPatch& setVisible(bool v);
    ObjectPatch& setLocked(bool v);
    ObjectPatch& setText(std::string v);
    ObjectPatch& setFontSize(float v);
    ObjectPatch& setFontFamily(std::string v);
    ObjectPatch& setTextAlign(TextAlign v);
    ObjectPatch& setLineHeight(float v);
    ObjectPatch& setName(std::string v);
    ObjectPatch& setPoints(std::vector<Point2> v);
    ObjectPatch& setSrc(std::string v);
    ObjectPatch& setEndpoints(float x1, float y1, float x2, float y2);
};

struct ObjectUpdate {
    ObjectId id;
    ObjectPatch patch;
};

// Factory defaults used by tools, clipboard and tests.
SceneObject makeObject(ObjectKind kind, ObjectId id, float x, float y, float w, float h, std::int32_t z);

// Every numeric field finite and every field required by the kind present in `present`.
bool validateObject(const SceneObject& obj, FieldMask present);

// Clamp into document limits. Returns true if any value changed.
bool sanitizeObject(SceneObject& obj);


} // namespace karta
