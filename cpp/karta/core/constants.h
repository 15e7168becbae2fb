#pragma once

#include <cstddef>
#include <cstdint>

namespace karta::constants {

// ==============================================================================
// Document limits
// ==============================================================================

constexpr float kMaxCoordinate = 1000000.0f;
constexpr float kMinCoordinate = -1000000.0f;
constexpr float kMinDimension = 0.01f;
constexpr float kMaxDimension = 100000.0f;

// Smallest shape a drawing gesture or a resize may produce.
constexpr float kMinObjectSize = 10.0f;

// ==============================================================================
// Handles (screen pixels)
// ==============================================================================

constexpr float kHandleSizePx = 8.0f;
constexpr float kHandleTolerancePx = 2.0f;
constexpr float kRotationHandleOffsetPx = 20.0f;
constexpr float kRotationHandleTolerancePx = 4.0f;

// ==============================================================================
// Gestures
// ==============================================================================

constexpr double kDoubleClickMs = 300.0;
constexpr double kEditStartGuardMs = 100.0;
constexpr float kRotationSnapDeg = 15.0f;
constexpr float kLineAngleSnapDeg = 45.0f;
constexpr std::size_t kMinPathPoints = 2;
constexpr float kNudgeStep = 1.0f;
constexpr float kNudgeStepLarge = 10.0f;

// ==============================================================================
// Replication
// ==============================================================================

constexpr double kCoalesceWindowMs = 50.0;

// ==============================================================================
// History / clipboard
// ==============================================================================

constexpr std::size_t kMaxHistoryEntries = 50;
constexpr float kPasteOffset = 10.0f;

// Parent chains deeper than this are treated as corrupt.
constexpr std::size_t kMaxHierarchyDepth = 64;

// ==============================================================================
// Viewport
// ==============================================================================

constexpr float kMinZoom = 0.1f;
constexpr float kMaxZoom = 5.0f;
constexpr float kFitPadding = 50.0f;

// ==============================================================================
// Spatial index
// ==============================================================================

constexpr std::size_t kQuadTreeMaxItems = 10;
constexpr std::size_t kQuadTreeMaxDepth = 8;

// ==============================================================================
// Text defaults
// ==============================================================================

constexpr float kDefaultFontSize = 16.0f;
constexpr float kDefaultLineHeight = 1.2f;
constexpr float kTextMinWidth = 20.0f;
constexpr float kTextPadding = 4.0f;
constexpr float kFallbackAdvanceEm = 0.6f;

} // namespace karta::constants
