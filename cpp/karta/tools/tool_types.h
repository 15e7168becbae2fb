#pragma once

#include "karta/core/types.h"

#include <cstdint>
#include <optional>
#include <string>

namespace karta {

enum class Modifier : std::uint32_t {
    Shift = 1 << 0,
    Ctrl = 1 << 1,
    Alt = 1 << 2,
    Meta = 1 << 3,
};

constexpr std::uint32_t modifierBit(Modifier m) {
    return static_cast<std::uint32_t>(m);
}

enum class ToolType : std::uint8_t {
    Select = 0,
    Hand = 1,
    Rectangle = 2,
    Ellipse = 3,
    Text = 4,
    Frame = 5,
    Pen = 6,
    Line = 7,
    Arrow = 8
};

const char* toolName(ToolType type);
std::optional<ToolType> toolFromName(const std::string& name);

enum class Cursor : std::uint8_t {
    Default = 0,
    Crosshair,
    Text,
    Move,
    Grab,
    Grabbing,
    NsResize,
    EwResize,
    NwseResize,
    NeswResize
};

// CSS cursor keyword.
const char* cursorName(Cursor cursor);

struct MouseEvent {
    float screenX{0.0f};
    float screenY{0.0f};
    float canvasX{0.0f};
    float canvasY{0.0f};
    int button{0};
    std::uint32_t modifiers{0};

    bool shift() const { return (modifiers & modifierBit(Modifier::Shift)) != 0; }
    bool ctrl() const { return (modifiers & modifierBit(Modifier::Ctrl)) != 0; }
    bool alt() const { return (modifiers & modifierBit(Modifier::Alt)) != 0; }
    bool meta() const { return (modifiers & modifierBit(Modifier::Meta)) != 0; }
};

// `key` is the DOM key value ("a", "Escape", "ArrowLeft"), `code` the
// physical key ("KeyA").
struct KeyEvent {
    std::string key;
    std::string code;
    std::uint32_t modifiers{0};
    bool repeat{false};

    bool shift() const { return (modifiers & modifierBit(Modifier::Shift)) != 0; }
    bool ctrl() const { return (modifiers & modifierBit(Modifier::Ctrl)) != 0; }
    bool alt() const { return (modifiers & modifierBit(Modifier::Alt)) != 0; }
    bool meta() const { return (modifiers & modifierBit(Modifier::Meta)) != 0; }
    // Ctrl on Linux/Windows, Cmd on macOS.
    bool command() const { return ctrl() || meta(); }
};

struct ToolEventResult {
    bool handled{false};
    std::optional<Cursor> cursor;
    bool requestRedraw{false};
};

inline ToolEventResult unhandled() {
    return ToolEventResult{};
}

inline ToolEventResult handled(bool redraw = false) {
    return ToolEventResult{true, std::nullopt, redraw};
}

inline ToolEventResult handledWithCursor(Cursor cursor, bool redraw = false) {
    return ToolEventResult{true, cursor, redraw};
}

// Ctrl/Cmd held while dragging bypasses grid and object snapping.
inline bool isSnapSuppressed(std::uint32_t modifiers) {
    return (modifiers & (modifierBit(Modifier::Ctrl) | modifierBit(Modifier::Meta))) != 0;
}

} // namespace karta
