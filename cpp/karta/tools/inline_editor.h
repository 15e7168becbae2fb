#pragma once

#include "karta/core/types.h"
#include "karta/core/util.h"

#include <cstdint>
#include <optional>
#include <string>

namespace karta {

class GroupResolver;
class HistoryManager;
class ReplicatedStore;
class TextMeasurer;

enum class EditTarget : std::uint8_t {
    Text = 0,
    FrameName = 1
};

enum class EditPhase : std::uint8_t {
    Idle = 0,
    // Just opened. Commit requests are ignored so the click that opened the
    // editor cannot close it again.
    Starting = 1,
    Active = 2
};

// In-place editing of a text object's content or a frame's name.
//
// Starting -> Active happens on the first input or once kEditStartGuardMs has
// elapsed. Every input is written with a single-object apply, so keystrokes
// go through the store's coalescing window; text objects are re-measured on
// every input. One history entry covers the whole session.
class InlineEditor {
public:
    InlineEditor(ReplicatedStore& store, HistoryManager& history, GroupResolver& groups, TextMeasurer& measurer, ClockFn clock);

    InlineEditor(const InlineEditor&) = delete;
    InlineEditor& operator=(const InlineEditor&) = delete;

    // `createdForEdit` marks an object the caller has just created, with the
    // history snapshot for its creation already pushed.
    bool begin(const ObjectId& id, EditTarget target, bool createdForEdit = false);

    bool input(const std::string& value);

    // Returns false while Starting (the request is ignored) or when idle.
    // Text committed empty deletes the object; an empty frame name reverts.
    bool commit();

    // Restores the value the session started from. A text object created for
    // this session is removed along with its history entry.
    void cancel();

    EditPhase phase();
    bool isEditing() const { return phase_ != EditPhase::Idle; }
    EditTarget target() const { return target_; }
    const std::optional<ObjectId>& objectId() const { return objectId_; }
    const std::string& value() const { return value_; }

private:
    bool write(const std::string& value);
    bool finish();
    void reset();

    ReplicatedStore& store_;
    HistoryManager& history_;
    GroupResolver& groups_;
    TextMeasurer& measurer_;
    ClockFn clock_;

    EditPhase phase_ = EditPhase::Idle;
    EditTarget target_ = EditTarget::Text;
    std::optional<ObjectId> objectId_;
    std::string original_;
    std::string value_;
    double startedAt_ = 0.0;
    bool historyPushed_ = false;
    bool createdForEdit_ = false;
};

} // namespace karta
