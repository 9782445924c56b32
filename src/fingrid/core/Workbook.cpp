#include "fingrid/core/Workbook.hpp"
#include "fingrid/calc/ConditionalFormatEngine.hpp"
#include "fingrid/utils/ModuleLoggers.hpp"
#include "fingrid/utils/TextUtils.hpp"
#include <fmt/format.h>
#include <set>
#include <utility>

namespace fingrid {
namespace core {

namespace {

WorksheetManager::Configuration managerConfiguration(const WorkbookOptions& options) {
    WorksheetManager::Configuration config;
    config.max_sheets = options.max_sheets;
    config.default_name_prefix = options.sheet_name_prefix;
    return config;
}

} // namespace

Workbook::Workbook(const WorkbookOptions& options)
    : options_(options)
    , manager_(*this, managerConfiguration(options))
    , recalculator_(*this)
    , undo_(options.max_undo_depth) {
    auto first = manager_.createWorksheet();
    if (!first) {
        throwError(first.error());
    }
    undo_.reset(captureSnapshot("create workbook"));
    CORE_DEBUG("Workbook created with sheet {}", first.value()->getName());
}

Workbook::~Workbook() = default;

std::unique_ptr<Workbook> Workbook::create(const WorkbookOptions& options) {
    return std::make_unique<Workbook>(options);
}

// ========== 工作表管理 ==========

Result<int> Workbook::createSheet(const std::string& name) {
    auto created = manager_.createWorksheet(name);
    if (!created) {
        CORE_WARN("Failed to create sheet '{}': {}", name, created.error().message);
        return created.error();
    }
    int id = created.value()->getSheetId();
    CORE_INFO("Created sheet {} (id {})", created.value()->getName(), id);
    afterStructureChange();
    return id;
}

VoidResult Workbook::switchSheet(int sheet_id) {
    return manager_.setActiveById(sheet_id);
}

VoidResult Workbook::switchSheet(const std::string& name) {
    return manager_.setActive(name);
}

VoidResult Workbook::renameSheet(int sheet_id, const std::string& new_name) {
    auto renamed = manager_.rename(sheet_id, new_name);
    if (!renamed) {
        return renamed;
    }
    afterStructureChange();
    return success();
}

Result<int> Workbook::copySheet(int sheet_id) {
    auto copied = manager_.copy(sheet_id);
    if (!copied) {
        return copied.error();
    }
    int id = copied.value()->getSheetId();
    CORE_INFO("Copied sheet {} to {} (id {})", sheet_id, copied.value()->getName(), id);
    afterStructureChange();
    return id;
}

VoidResult Workbook::deleteSheet(int sheet_id) {
    auto removed = manager_.removeById(sheet_id);
    if (!removed) {
        return removed;
    }
    CORE_INFO("Deleted sheet {}", sheet_id);
    afterStructureChange();
    return success();
}

std::shared_ptr<Worksheet> Workbook::getSheet(int sheet_id) const {
    return manager_.getById(sheet_id);
}

std::shared_ptr<Worksheet> Workbook::getSheet(const std::string& name) const {
    return manager_.getByName(name);
}

std::shared_ptr<Worksheet> Workbook::getActiveSheet() const {
    return manager_.getActive();
}

int Workbook::getActiveSheetId() const {
    auto active = manager_.getActive();
    return active ? active->getSheetId() : 0;
}

std::vector<std::string> Workbook::getSheetNames() const {
    std::vector<std::string> names;
    names.reserve(manager_.count());
    for (const auto& sheet : manager_.getAll()) {
        names.push_back(sheet->getName());
    }
    return names;
}

// ========== 撤销/重做 ==========

bool Workbook::undo() {
    auto state = undo_.undo();
    if (!state) {
        return false;
    }
    TRACKING_DEBUG("Undo to state '{}'", state->label);
    restoreSnapshot(*state);
    return true;
}

bool Workbook::redo() {
    auto state = undo_.redo();
    if (!state) {
        return false;
    }
    TRACKING_DEBUG("Redo to state '{}'", state->label);
    restoreSnapshot(*state);
    return true;
}

void Workbook::resetHistory() {
    undo_.reset(captureSnapshot("reset"));
}

// ========== 状态导出/导入 ==========

WorkbookState Workbook::exportState() const {
    WorkbookState state;
    state.active_sheet_id = getActiveSheetId();
    for (const auto& sheet : manager_.getAll()) {
        SheetState entry;
        entry.id = sheet->getSheetId();
        entry.name = sheet->getName();
        entry.metadata = sheet->getMetadata();
        entry.cells = sheet->getCells();
        state.sheets.push_back(std::move(entry));
    }
    return state;
}

VoidResult Workbook::importState(const WorkbookState& state) {
    auto check = validateState(state);
    if (!check) {
        CORE_WARN("Rejected workbook state: {}", check.error().fullMessage());
        return check;
    }
    if (state.sheets.size() > options_.max_sheets) {
        return makeError(ErrorCode::WorksheetLimitReached,
                         fmt::format("State has {} sheets, limit is {}", state.sheets.size(), options_.max_sheets));
    }

    manager_.clear();
    for (const auto& entry : state.sheets) {
        auto restored = manager_.restoreWorksheet(entry.id, entry.name);
        if (!restored) {
            // 已校验过的快照不会走到这里
            return restored.error();
        }
        auto& sheet = *restored.value();
        sheet.setMetadata(entry.metadata);
        sheet.replaceCells(entry.cells);
    }
    auto active = manager_.setActiveById(state.active_sheet_id);
    if (!active) {
        return active;
    }

    recalculator_.clearCache();
    recalculateAll();
    resetHistory();
    CORE_INFO("Imported workbook state with {} sheets", state.sheets.size());
    return success();
}

// ========== 计算 ==========

void Workbook::recalculateAll() {
    recalculator_.recalculateAll();
    refreshConditionalFormats();
}

CellValue Workbook::evaluate(int sheet_id, const std::string& formula) {
    auto sheet = manager_.getById(sheet_id);
    if (!sheet) {
        return FormulaError::Ref;
    }
    return recalculator_.evaluate(*sheet, formula);
}

// ========== 回调 ==========

void Workbook::onCellsChanged(Worksheet& sheet, const std::vector<CellAddress>& changed, const std::string& label) {
    if (!changed.empty()) {
        recalculator_.recalculate(sheet, changed);
    }
    refreshConditionalFormats();
    undo_.commit(captureSnapshot(fmt::format("{}: {}", sheet.getName(), label)));
}

void Workbook::onNamesChanged() {
    recalculateAll();
}

void Workbook::onFormatsChanged(Worksheet& sheet) {
    sheet.setFormatOverlay(calc::ConditionalFormatEngine::computeOverlay(sheet));
}

// ========== 内部 ==========

void Workbook::afterStructureChange() {
    recalculateAll();
}

void Workbook::refreshConditionalFormats() {
    for (const auto& sheet : manager_.getAll()) {
        sheet->setFormatOverlay(calc::ConditionalFormatEngine::computeOverlay(*sheet));
    }
}

tracking::WorkbookSnapshot Workbook::captureSnapshot(const std::string& label) const {
    tracking::WorkbookSnapshot snapshot;
    snapshot.label = label;
    for (const auto& sheet : manager_.getAll()) {
        tracking::SheetSnapshot entry;
        entry.sheet_id = sheet->getSheetId();
        entry.revision = sheet->getRevision();
        entry.cells = undo_.reuse(entry.sheet_id, entry.revision);
        if (!entry.cells) {
            entry.cells = std::make_shared<const CellMap>(sheet->getCells());
        }
        snapshot.sheets.push_back(std::move(entry));
    }
    return snapshot;
}

void Workbook::restoreSnapshot(const tracking::WorkbookSnapshot& snapshot) {
    for (const auto& sheet : manager_.getAll()) {
        const tracking::SheetSnapshot* entry = snapshot.find(sheet->getSheetId());
        if (entry && entry->cells) {
            sheet->restoreCells(*entry->cells, entry->revision);
        }
    }
    recalculateAll();
}

VoidResult Workbook::validateState(const WorkbookState& state) {
    if (state.sheets.empty()) {
        return makeError(ErrorCode::InvalidWorkbook, "Workbook state has no sheets");
    }

    std::set<int> ids;
    std::set<std::string> names;
    for (const auto& entry : state.sheets) {
        if (entry.id < 1 || !ids.insert(entry.id).second) {
            return makeError(ErrorCode::InvalidWorkbook, "Invalid or duplicate sheet id", std::to_string(entry.id));
        }
        auto name_check = WorksheetManager::validateName(entry.name);
        if (!name_check) {
            return name_check;
        }
        if (!names.insert(utils::TextUtils::toUpper(entry.name)).second) {
            return makeError(ErrorCode::DuplicateWorksheet, "Duplicate sheet name", entry.name);
        }
        for (const auto& cell : entry.cells) {
            const CellAddress& addr = cell.first;
            if (addr.row < 1 || addr.row > Constants::kMaxRows || addr.col < 1 || addr.col > Constants::kMaxColumns) {
                return makeError(ErrorCode::InvalidCellReference,
                                 fmt::format("Cell address out of range (row {}, column {})", addr.row, addr.col),
                                 entry.name);
            }
        }
    }
    if (ids.count(state.active_sheet_id) == 0) {
        return makeError(ErrorCode::InvalidWorkbook, "Active sheet id not found",
                         std::to_string(state.active_sheet_id));
    }
    return success();
}

}} // namespace fingrid::core
