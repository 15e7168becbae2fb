#include "karta/tools/inline_editor.h"

#include "karta/core/constants.h"
#include "karta/core/logging.h"
#include "karta/entity/group_resolver.h"
#include "karta/history/history_manager.h"
#include "karta/store/replicated_store.h"
#include "karta/text/text_measurer.h"

#include <utility>

namespace karta {

InlineEditor::InlineEditor(ReplicatedStore& store, HistoryManager& history, GroupResolver& groups, TextMeasurer& measurer, ClockFn clock)
    : store_(store), history_(history), groups_(groups), measurer_(measurer), clock_(std::move(clock)) {}

bool InlineEditor::begin(const ObjectId& id, EditTarget target, bool createdForEdit) {
    if (isEditing() && !finish()) {
        reset();
    }

    const SceneObject* obj = store_.get(id);
    if (!obj || obj->locked) {
        return false;
    }
    if (target == EditTarget::Text && obj->kind != ObjectKind::Text) {
        return false;
    }
    if (target == EditTarget::FrameName && obj->kind != ObjectKind::Frame) {
        return false;
    }

    phase_ = EditPhase::Starting;
    target_ = target;
    objectId_ = id;
    original_ = target == EditTarget::Text ? obj->text : obj->name;
    value_ = original_;
    startedAt_ = clock_();
    createdForEdit_ = createdForEdit;
    historyPushed_ = createdForEdit;
    return true;
}

bool InlineEditor::input(const std::string& value) {
    if (!isEditing()) {
        return false;
    }
    if (!store_.contains(*objectId_)) {
        // Removed underneath us, usually by a remote delete.
        reset();
        return false;
    }
    if (!historyPushed_) {
        history_.pushCurrent();
        historyPushed_ = true;
    }
    phase_ = EditPhase::Active;
    value_ = value;
    return write(value_);
}

bool InlineEditor::commit() {
    if (phase() != EditPhase::Active) {
        return false;
    }
    return finish();
}

void InlineEditor::cancel() {
    if (!isEditing()) {
        return;
    }
    const ObjectId id = *objectId_;
    if (createdForEdit_) {
        if (store_.contains(id) && !groups_.deleteObjects({id}, false)) {
            KARTA_LOG_WARN("could not remove cancelled text %s", id.c_str());
        }
        history_.discardLast();
    } else if (historyPushed_) {
        if (store_.contains(id) && !write(original_)) {
            KARTA_LOG_WARN("could not restore %s after cancelled edit", id.c_str());
        }
        store_.flush();
        history_.discardLast();
    }
    reset();
}

EditPhase InlineEditor::phase() {
    if (phase_ == EditPhase::Starting && clock_() - startedAt_ >= constants::kEditStartGuardMs) {
        phase_ = EditPhase::Active;
    }
    return phase_;
}

// ==============================================================================
// Internals
// ==============================================================================

bool InlineEditor::write(const std::string& value) {
    const SceneObject* obj = store_.get(*objectId_);
    if (!obj) {
        return false;
    }

    ObjectPatch patch;
    if (target_ == EditTarget::Text) {
        const TextDimensions dims = measurer_.measure(value, textStyleOf(*obj));
        patch.setText(value).setSize(dims.width, dims.height);
    } else {
        patch.setName(value);
    }
    if (!store_.apply(*objectId_, patch)) {
        KARTA_LOG_WARN("inline edit of %s was rejected", objectId_->c_str());
        return false;
    }
    return true;
}

bool InlineEditor::finish() {
    const ObjectId id = *objectId_;
    if (!store_.contains(id)) {
        reset();
        return false;
    }

    bool ok = true;
    if (target_ == EditTarget::Text && value_.empty()) {
        if (createdForEdit_) {
            ok = groups_.deleteObjects({id}, false);
            history_.discardLast();
        } else {
            if (!historyPushed_) {
                history_.pushCurrent();
            }
            ok = groups_.deleteObjects({id}, false);
        }
    } else if (target_ == EditTarget::FrameName && value_.empty()) {
        ok = write(original_);
    }

    store_.flush();
    reset();
    return ok;
}

void InlineEditor::reset() {
    phase_ = EditPhase::Idle;
    objectId_.reset();
    original_.clear();
    value_.clear();
    startedAt_ = 0.0;
    historyPushed_ = false;
    createdForEdit_ = false;
}

} // namespace karta
