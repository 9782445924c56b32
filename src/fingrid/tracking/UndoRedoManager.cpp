#include "fingrid/tracking/UndoRedoManager.hpp"
#include "fingrid/utils/ModuleLoggers.hpp"

namespace fingrid {
namespace tracking {

const SheetSnapshot* WorkbookSnapshot::find(int sheet_id) const {
    for (const auto& sheet : sheets) {
        if (sheet.sheet_id == sheet_id) {
            return &sheet;
        }
    }
    return nullptr;
}

UndoRedoManager::UndoRedoManager(size_t max_depth)
    : max_depth_(max_depth) {
}

void UndoRedoManager::reset(WorkbookSnapshot present) {
    past_.clear();
    future_.clear();
    present_ = std::move(present);
    TRACKING_DEBUG("Undo history reset ({} sheets)", present_.sheets.size());
}

void UndoRedoManager::commit(WorkbookSnapshot state) {
    past_.push_back(std::move(present_));
    present_ = std::move(state);
    future_.clear();

    while (past_.size() > max_depth_) {
        past_.pop_front();
    }
    TRACKING_DEBUG("Committed '{}' (undo depth {})", present_.label, past_.size());
}

std::optional<WorkbookSnapshot> UndoRedoManager::undo() {
    if (past_.empty()) {
        return std::nullopt;
    }
    TRACKING_INFO("Undo '{}'", present_.label);
    future_.push_back(std::move(present_));
    present_ = std::move(past_.back());
    past_.pop_back();
    return present_;
}

std::optional<WorkbookSnapshot> UndoRedoManager::redo() {
    if (future_.empty()) {
        return std::nullopt;
    }
    past_.push_back(std::move(present_));
    present_ = std::move(future_.back());
    future_.pop_back();
    TRACKING_INFO("Redo '{}'", present_.label);
    return present_;
}

std::shared_ptr<const core::CellMap> UndoRedoManager::reuse(int sheet_id, uint64_t revision) const {
    const SheetSnapshot* previous = present_.find(sheet_id);
    if (previous && previous->revision == revision) {
        return previous->cells;
    }
    return nullptr;
}

}} // namespace fingrid::tracking
