#include "fingrid/core/WorksheetManager.hpp"
#include "fingrid/core/Constants.hpp"
#include "fingrid/core/Exception.hpp"
#include "fingrid/core/Workbook.hpp"
#include "fingrid/core/Worksheet.hpp"
#include "fingrid/utils/ModuleLoggers.hpp"
#include "fingrid/utils/TextUtils.hpp"
#include <algorithm>

namespace fingrid {
namespace core {

using utils::TextUtils;

WorksheetManager::WorksheetManager(Workbook& workbook, const Configuration& config)
    : workbook_(workbook)
    , config_(config) {
    if (config_.max_sheets == 0) {
        FINGRID_THROW_PARAM("max_sheets must be at least 1", "max_sheets");
    }
}

// 创建

Result<WorksheetManager::WorksheetPtr> WorksheetManager::createWorksheet(const std::string& name) {
    std::string worksheet_name = name.empty() ? generateUniqueName() : name;

    auto check = checkNewName(worksheet_name);
    if (!check) {
        CORE_ERROR("Cannot create worksheet '{}': {}", worksheet_name, check.error().message);
        return check.error();
    }

    auto created = insert(next_sheet_id_, worksheet_name);
    if (created) {
        ++next_sheet_id_;
    }
    return created;
}

Result<WorksheetManager::WorksheetPtr> WorksheetManager::restoreWorksheet(int id, const std::string& name) {
    if (id < 1 || id_index_.count(id) > 0) {
        return makeError(ErrorCode::InvalidWorksheet, "Invalid or duplicate worksheet id", std::to_string(id));
    }
    auto check = checkNewName(name);
    if (!check) {
        return check.error();
    }

    auto restored = insert(id, name);
    if (restored) {
        next_sheet_id_ = std::max(next_sheet_id_, id + 1);
    }
    return restored;
}

Result<WorksheetManager::WorksheetPtr> WorksheetManager::copy(int source_id) {
    WorksheetPtr source = getById(source_id);
    if (!source) {
        return makeError(ErrorCode::InvalidWorksheet, "Worksheet not found", std::to_string(source_id));
    }
    if (worksheets_.size() >= config_.max_sheets) {
        return makeError(ErrorCode::WorksheetLimitReached,
                         fmt::format("Maximum number of sheets reached: {}", config_.max_sheets));
    }

    const std::string name = copyName(source->getName());
    WorksheetPtr worksheet = source->clone(name, next_sheet_id_++);
    worksheets_.push_back(worksheet);

    size_t index = worksheets_.size() - 1;
    name_index_[TextUtils::toUpper(name)] = index;
    id_index_[worksheet->getSheetId()] = index;

    stats_.total_created++;
    CORE_INFO("Copied worksheet '{}' to '{}' (ID: {})", source->getName(), name, worksheet->getSheetId());
    return worksheet;
}

// 查找和访问

WorksheetManager::WorksheetPtr WorksheetManager::getByName(const std::string& name) const {
    auto it = name_index_.find(TextUtils::toUpper(name));
    if (it != name_index_.end() && it->second < worksheets_.size()) {
        return worksheets_[it->second];
    }
    return nullptr;
}

WorksheetManager::WorksheetPtr WorksheetManager::getById(int id) const {
    auto it = id_index_.find(id);
    if (it != id_index_.end() && it->second < worksheets_.size()) {
        return worksheets_[it->second];
    }
    return nullptr;
}

WorksheetManager::WorksheetPtr WorksheetManager::getByIndex(size_t index) const {
    if (index < worksheets_.size()) {
        return worksheets_[index];
    }
    return nullptr;
}

std::optional<size_t> WorksheetManager::indexOf(int id) const {
    auto it = id_index_.find(id);
    if (it == id_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<size_t> WorksheetManager::indexOfName(const std::string& name) const {
    auto it = name_index_.find(TextUtils::toUpper(name));
    if (it == name_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// 删除

VoidResult WorksheetManager::removeById(int id) {
    auto index = indexOf(id);
    if (!index) {
        return makeError(ErrorCode::InvalidWorksheet, "Worksheet not found", std::to_string(id));
    }
    if (worksheets_.size() <= 1) {
        CORE_WARN("Refusing to delete the last worksheet '{}'", worksheets_[*index]->getName());
        return makeError(ErrorCode::LastWorksheet, "Cannot delete the last worksheet",
                         worksheets_[*index]->getName());
    }

    const std::string name = worksheets_[*index]->getName();
    worksheets_.erase(worksheets_.begin() + static_cast<std::ptrdiff_t>(*index));
    rebuildIndexes();

    if (active_index_ > *index) {
        --active_index_;
    }
    if (active_index_ >= worksheets_.size()) {
        active_index_ = worksheets_.size() - 1;
    }

    stats_.total_deleted++;
    CORE_INFO("Deleted worksheet '{}' (ID: {}), active is now '{}'", name, id,
              worksheets_[active_index_]->getName());
    return success();
}

void WorksheetManager::clear() {
    stats_.total_deleted += worksheets_.size();
    worksheets_.clear();
    name_index_.clear();
    id_index_.clear();
    active_index_ = 0;
}

// 重命名

VoidResult WorksheetManager::rename(int id, const std::string& new_name) {
    WorksheetPtr worksheet = getById(id);
    if (!worksheet) {
        return makeError(ErrorCode::InvalidWorksheet, "Worksheet not found", std::to_string(id));
    }
    auto check = checkNewName(new_name, id);
    if (!check) {
        return check;
    }

    const std::string old_name = worksheet->getName();
    const size_t index = id_index_[id];
    name_index_.erase(TextUtils::toUpper(old_name));
    worksheet->setName(new_name);
    name_index_[TextUtils::toUpper(new_name)] = index;

    stats_.total_renamed++;
    CORE_INFO("Renamed worksheet '{}' to '{}'", old_name, new_name);
    return success();
}

// 活动工作表管理

VoidResult WorksheetManager::setActiveById(int id) {
    auto index = indexOf(id);
    if (!index) {
        return makeError(ErrorCode::InvalidWorksheet, "Worksheet not found", std::to_string(id));
    }
    active_index_ = *index;
    CORE_DEBUG("Active worksheet: {}", worksheets_[active_index_]->getName());
    return success();
}

VoidResult WorksheetManager::setActive(const std::string& name) {
    auto index = indexOfName(name);
    if (!index) {
        return makeError(ErrorCode::InvalidWorksheet, "Worksheet not found", name);
    }
    active_index_ = *index;
    CORE_DEBUG("Active worksheet: {}", worksheets_[active_index_]->getName());
    return success();
}

WorksheetManager::WorksheetPtr WorksheetManager::getActive() const {
    if (worksheets_.empty()) {
        return nullptr;
    }
    size_t safe_index = (active_index_ < worksheets_.size()) ? active_index_ : 0;
    return worksheets_[safe_index];
}

bool WorksheetManager::exists(const std::string& name) const {
    return name_index_.find(TextUtils::toUpper(name)) != name_index_.end();
}

// 验证和工具

VoidResult WorksheetManager::validateName(const std::string& name) {
    if (name.empty()) {
        return makeError(ErrorCode::InvalidWorksheet, "Worksheet name is empty");
    }
    if (TextUtils::length(name) > static_cast<size_t>(Constants::kMaxSheetNameLength)) {
        return makeError(ErrorCode::InvalidWorksheet, "Worksheet name is longer than 31 characters", name);
    }
    // 检查非法字符
    const std::string invalid_chars = "[]:*?/\\";
    if (name.find_first_of(invalid_chars) != std::string::npos) {
        return makeError(ErrorCode::InvalidWorksheet, "Worksheet name contains an invalid character", name);
    }
    return success();
}

std::string WorksheetManager::generateUniqueName(const std::string& prefix) const {
    std::string base = prefix.empty() ? config_.default_name_prefix : prefix;
    std::string name;
    int counter = 1;

    do {
        name = base + std::to_string(counter++);
    } while (exists(name));

    return name;
}

// 私有辅助方法

VoidResult WorksheetManager::checkNewName(const std::string& name, int ignore_id) const {
    auto valid = validateName(name);
    if (!valid) {
        return valid;
    }
    WorksheetPtr existing = getByName(name);
    if (existing && existing->getSheetId() != ignore_id) {
        return makeError(ErrorCode::DuplicateWorksheet, "Worksheet already exists", name);
    }
    if (ignore_id == 0 && worksheets_.size() >= config_.max_sheets) {
        return makeError(ErrorCode::WorksheetLimitReached,
                         fmt::format("Maximum number of sheets reached: {}", config_.max_sheets));
    }
    return success();
}

Result<WorksheetManager::WorksheetPtr> WorksheetManager::insert(int id, const std::string& name) {
    auto worksheet = std::make_shared<Worksheet>(name, workbook_, id);
    worksheets_.push_back(worksheet);

    size_t index = worksheets_.size() - 1;
    name_index_[TextUtils::toUpper(name)] = index;
    id_index_[id] = index;

    stats_.total_created++;
    CORE_DEBUG("Created worksheet: {} (ID: {})", name, id);
    return worksheet;
}

void WorksheetManager::rebuildIndexes() {
    name_index_.clear();
    id_index_.clear();

    for (size_t i = 0; i < worksheets_.size(); ++i) {
        const auto& ws = worksheets_[i];
        name_index_[TextUtils::toUpper(ws->getName())] = i;
        id_index_[ws->getSheetId()] = i;
    }
}

std::string WorksheetManager::copyName(const std::string& source_name) const {
    for (int n = 2;; ++n) {
        const std::string suffix = fmt::format(" ({})", n);
        const size_t limit = static_cast<size_t>(Constants::kMaxSheetNameLength) - suffix.size();
        std::string base = source_name;
        if (TextUtils::length(base) > limit) {
            base = TextUtils::left(base, limit);
        }
        std::string candidate = base + suffix;
        if (!exists(candidate)) {
            return candidate;
        }
    }
}

}} // namespace fingrid::core
