#include "fingrid/calc/Recalculator.hpp"
#include "fingrid/core/Workbook.hpp"
#include "fingrid/core/Worksheet.hpp"
#include "fingrid/formula/FunctionLibrary.hpp"
#include "fingrid/utils/AddressParser.hpp"
#include "fingrid/utils/ModuleLoggers.hpp"
#include "fingrid/utils/TextUtils.hpp"
#include <algorithm>
#include <limits>

namespace fingrid {
namespace calc {

using core::CellAddress;
using core::CellRange;
using core::CellValue;
using core::FormulaError;
using core::Worksheet;
using formula::RangeValues;
using formula::ReferenceInfo;

namespace {

// 缓存条目超过该数量时整体清空
constexpr size_t kMaxCachedFormulas = 65536;

bool inGrid(const CellAddress& addr) {
    return addr.row >= 1 && addr.row <= core::Constants::kMaxRows &&
           addr.col >= 1 && addr.col <= core::Constants::kMaxColumns;
}

// 求值期间把工作表压入上下文栈，离开作用域时弹出
class SheetScope {
public:
    SheetScope(std::vector<Worksheet*>& stack, Worksheet* sheet) : stack_(stack) {
        stack_.push_back(sheet);
    }
    ~SheetScope() { stack_.pop_back(); }

    SheetScope(const SheetScope&) = delete;
    SheetScope& operator=(const SheetScope&) = delete;

private:
    std::vector<Worksheet*>& stack_;
};

} // namespace

Recalculator::Recalculator(core::Workbook& workbook)
    : workbook_(workbook)
    , parser_(formula::FunctionLibrary::builtins()) {
    const core::WorkbookOptions& options = workbook_.getOptions();
    settings_.irr_max_iterations = options.irr_max_iterations;
    settings_.irr_tolerance = options.irr_tolerance;
    settings_.irr_initial_guess = options.irr_initial_guess;
    max_depth_ = options.max_eval_depth;
}

// ========== 重算入口 ==========

void Recalculator::recalculate(Worksheet& sheet, const std::vector<CellAddress>& changed) {
    std::vector<FormulaCell> cells = collectFormulaCells();
    pass_ = PassState{};

    std::vector<CellKey> frontier;
    frontier.reserve(changed.size());
    for (const CellAddress& addr : changed) {
        const CellKey key{sheet.getSheetId(), addr};
        frontier.push_back(key);
        const core::Cell* cell = sheet.read(addr);
        if (cell && cell->hasFormula()) {
            pass_.dirty.insert(key);
        }
    }

    // 引用闭包：逐层找出引用了上一层地址的公式
    while (!frontier.empty()) {
        std::vector<CellKey> next;
        for (const FormulaCell& fc : cells) {
            const CellKey key{fc.sheet->getSheetId(), fc.addr};
            if (!fc.ast || pass_.dirty.count(key) > 0) {
                continue;
            }
            const auto& refs = fc.ast->references();
            const bool hit = std::any_of(refs.begin(), refs.end(), [&](const ReferenceInfo& ref) {
                return std::any_of(frontier.begin(), frontier.end(), [&](const CellKey& target) {
                    return referenceHits(ref, *fc.sheet, target);
                });
            });
            if (hit) {
                pass_.dirty.insert(key);
                next.push_back(key);
            }
        }
        frontier = std::move(next);
    }

    if (pass_.dirty.empty()) {
        return;
    }
    CALC_DEBUG("Recalculating {} of {} formula cells after {} changes on {}",
               pass_.dirty.size(), cells.size(), changed.size(), sheet.getName());
    runPass(cells);
}

void Recalculator::recalculateAll() {
    std::vector<FormulaCell> cells = collectFormulaCells();
    pass_ = PassState{};
    for (const FormulaCell& fc : cells) {
        pass_.dirty.insert(CellKey{fc.sheet->getSheetId(), fc.addr});
    }
    CALC_INFO("Full recalculation of {} formula cells", cells.size());
    runPass(cells);
}

CellValue Recalculator::evaluate(Worksheet& sheet, const std::string& formula) {
    auto ast = parsed(formula);
    if (!ast) {
        return FormulaError::Generic;
    }
    pass_ = PassState{};
    SheetScope scope(pass_.sheet_stack, &sheet);
    return ast->evaluate(*this);
}

std::shared_ptr<const formula::FormulaAST> Recalculator::parsed(const std::string& formula) {
    auto it = cache_.find(formula);
    if (it != cache_.end()) {
        stats_.cache_hits++;
        return it->second;
    }
    stats_.cache_misses++;
    if (cache_.size() >= kMaxCachedFormulas) {
        CALC_DEBUG("Formula cache full ({} entries), clearing", cache_.size());
        cache_.clear();
    }

    std::shared_ptr<const formula::FormulaAST> ast;
    auto result = parser_.parse(formula);
    if (result) {
        ast = *result;
    } else {
        CALC_DEBUG("Formula {} does not parse: {}", formula, result.error().fullMessage());
    }
    cache_.emplace(formula, ast);
    return ast;
}

// ========== 求值过程 ==========

std::vector<Recalculator::FormulaCell> Recalculator::collectFormulaCells() {
    std::vector<FormulaCell> cells;
    for (const auto& sheet : workbook_.getSheets()) {
        for (const auto& [addr, cell] : sheet->getCells()) {
            if (cell.hasFormula()) {
                cells.push_back(FormulaCell{sheet.get(), addr, parsed(cell.getFormula())});
            }
        }
    }
    return cells;
}

void Recalculator::runPass(std::vector<FormulaCell>& cells) {
    stats_.passes++;
    size_t evaluated = evaluateDirty(cells);

    // 深度受限的单元格在下一轮重新求值；已完成的部分作为备忘，每轮都更浅
    size_t previous = std::numeric_limits<size_t>::max();
    while (!pass_.depth_limited.empty() && pass_.depth_limited.size() < previous) {
        previous = pass_.depth_limited.size();
        CALC_DEBUG("Re-evaluating {} cells limited by evaluation depth {}", previous, max_depth_);
        for (const CellKey& key : pass_.depth_limited) {
            pass_.done.erase(key);
        }
        pass_.depth_limited.clear();
        evaluated += evaluateDirty(cells);
    }
    if (!pass_.depth_limited.empty()) {
        CALC_WARN("{} cells remain limited by evaluation depth {}", pass_.depth_limited.size(), max_depth_);
    }

    stats_.cells_evaluated += pass_.done.size();
    stats_.circular_cells += pass_.circular.size();
    if (!pass_.circular.empty()) {
        CALC_WARN("Circular reference involving {} cells", pass_.circular.size());
    }
    CALC_DEBUG("Pass finished: {} roots, {} cells evaluated", evaluated, pass_.done.size());
    pass_ = PassState{};
}

size_t Recalculator::evaluateDirty(std::vector<FormulaCell>& cells) {
    size_t evaluated = 0;
    for (const FormulaCell& fc : cells) {
        const CellKey key{fc.sheet->getSheetId(), fc.addr};
        if (pass_.dirty.count(key) > 0 && pass_.done.count(key) == 0) {
            evaluateCell(*fc.sheet, fc.addr);
            ++evaluated;
        }
    }
    return evaluated;
}

void Recalculator::markStackDepthLimited() {
    pass_.depth_limited.insert(pass_.stack.begin(), pass_.stack.end());
}

CellValue Recalculator::evaluateCell(Worksheet& sheet, const CellAddress& addr) {
    const CellKey key{sheet.getSheetId(), addr};
    core::Cell* cell = sheet.findCell(addr);
    if (!cell) {
        return CellValue();
    }
    if (pass_.done.count(key) > 0) {
        if (pass_.depth_limited.count(key) > 0) {
            markStackDepthLimited();
        }
        return cell->getValue();
    }

    if (pass_.on_stack.count(key) > 0) {
        // 重入：从该单元格到栈顶的整段都在环上
        auto it = std::find(pass_.stack.begin(), pass_.stack.end(), key);
        for (; it != pass_.stack.end(); ++it) {
            pass_.circular.insert(*it);
        }
        return FormulaError::Circular;
    }

    if (static_cast<int>(pass_.stack.size()) >= max_depth_) {
        CALC_DEBUG("Evaluation depth limit {} reached at {}!{}", max_depth_, sheet.getName(),
                   utils::AddressParser::toString(addr));
        markStackDepthLimited();
        return FormulaError::Generic;
    }

    auto ast = parsed(cell->getFormula());
    CellValue value;
    if (!ast) {
        value = FormulaError::Generic;
    } else {
        pass_.stack.push_back(key);
        pass_.on_stack.insert(key);
        {
            SheetScope scope(pass_.sheet_stack, &sheet);
            value = ast->evaluate(*this);
        }
        pass_.on_stack.erase(key);
        pass_.stack.pop_back();
    }

    if (pass_.circular.count(key) > 0) {
        value = FormulaError::Circular;
    }

    CALC_TRACE("{}!{} = {}", sheet.getName(), utils::AddressParser::toString(addr), value.toDisplayString());
    sheet.setComputedValue(addr, value);
    pass_.done.insert(key);
    return value;
}

CellValue Recalculator::valueAt(Worksheet& sheet, const CellAddress& addr) {
    if (!inGrid(addr)) {
        return FormulaError::Ref;
    }
    const core::Cell* cell = sheet.read(addr);
    if (!cell) {
        return CellValue();
    }
    if (cell->hasFormula() && pass_.dirty.count(CellKey{sheet.getSheetId(), addr}) > 0) {
        return evaluateCell(sheet, addr);
    }
    return cell->getValue();
}

RangeValues Recalculator::blockValues(Worksheet& sheet, const CellRange& range) {
    if (!inGrid(range.first) || !inGrid(range.last)) {
        return RangeValues::single(FormulaError::Ref);
    }

    // 只访问已有单元格；求值会改写单元格的值，先收集地址
    std::vector<CellAddress> present;
    const core::CellMap& cells = sheet.getCells();
    auto it = cells.lower_bound(range.first);
    while (it != cells.end() && it->first.row <= range.last.row) {
        const CellAddress& addr = it->first;
        if (addr.col < range.first.col) {
            it = cells.lower_bound(CellAddress(addr.row, range.first.col));
        } else if (addr.col > range.last.col) {
            it = cells.lower_bound(CellAddress(addr.row + 1, range.first.col));
        } else {
            present.push_back(addr);
            ++it;
        }
    }

    RangeValues block(static_cast<size_t>(range.rowCount()), static_cast<size_t>(range.colCount()));
    for (const CellAddress& addr : present) {
        const size_t index = static_cast<size_t>(addr.row - range.first.row) * block.cols +
                             static_cast<size_t>(addr.col - range.first.col);
        block.add(index, valueAt(sheet, addr));
    }
    return block;
}

// ========== EvalContext ==========

CellValue Recalculator::cellValue(const std::string& sheet, const CellAddress& addr) {
    Worksheet* target = sheet.empty() ? currentSheet() : resolveSheet(sheet);
    if (!target) {
        return FormulaError::Ref;
    }
    return valueAt(*target, addr);
}

RangeValues Recalculator::rangeValues(const std::string& sheet, const CellRange& range) {
    Worksheet* target = sheet.empty() ? currentSheet() : resolveSheet(sheet);
    if (!target) {
        return RangeValues::single(FormulaError::Ref);
    }
    return blockValues(*target, range);
}

RangeValues Recalculator::sheetSpanValues(const std::string& first_sheet, const std::string& last_sheet,
                                          const CellRange& range) {
    auto first = sheetIndex(first_sheet);
    auto last = sheetIndex(last_sheet);
    if (!first || !last) {
        return RangeValues::single(FormulaError::Ref);
    }
    const size_t lo = std::min(*first, *last);
    const size_t hi = std::max(*first, *last);

    // 各表的块依次拼接成单列
    const auto& sheets = workbook_.getSheets();
    RangeValues result(0, 1);
    for (size_t i = lo; i <= hi; ++i) {
        RangeValues block = blockValues(*sheets[i], range);
        for (const RangeValues::Entry& entry : block.entries) {
            result.entries.push_back(RangeValues::Entry{result.rows + entry.index, entry.value});
        }
        result.rows += block.size();
    }
    return result;
}

RangeValues Recalculator::namedRangeValues(const std::string& name) {
    auto resolved = resolveName(name, currentSheet());
    if (!resolved) {
        return RangeValues::single(FormulaError::Ref);
    }
    return blockValues(*resolved->first, resolved->second);
}

// ========== 解析辅助 ==========

bool Recalculator::referenceHits(const ReferenceInfo& ref, Worksheet& owner, const CellKey& key) const {
    switch (ref.kind) {
        case ReferenceInfo::Kind::Range: {
            const Worksheet* target = ref.sheet.empty() ? &owner : resolveSheet(ref.sheet);
            return target && target->getSheetId() == key.first && ref.range.contains(key.second);
        }
        case ReferenceInfo::Kind::SheetSpan: {
            auto first = sheetIndex(ref.sheet);
            auto last = sheetIndex(ref.last_sheet);
            if (!first || !last || !ref.range.contains(key.second)) {
                return false;
            }
            const auto& sheets = workbook_.getSheets();
            const size_t lo = std::min(*first, *last);
            const size_t hi = std::max(*first, *last);
            for (size_t i = lo; i <= hi; ++i) {
                if (sheets[i]->getSheetId() == key.first) {
                    return true;
                }
            }
            return false;
        }
        case ReferenceInfo::Kind::Name: {
            auto resolved = resolveName(ref.name, &owner);
            return resolved && resolved->first->getSheetId() == key.first && resolved->second.contains(key.second);
        }
    }
    return false;
}

Worksheet* Recalculator::currentSheet() const {
    if (!pass_.sheet_stack.empty()) {
        return pass_.sheet_stack.back();
    }
    auto active = workbook_.getActiveSheet();
    return active.get();
}

Worksheet* Recalculator::resolveSheet(const std::string& name) const {
    return workbook_.getSheet(name).get();
}

std::optional<size_t> Recalculator::sheetIndex(const std::string& name) const {
    const auto& sheets = workbook_.getSheets();
    for (size_t i = 0; i < sheets.size(); ++i) {
        if (utils::TextUtils::equalsIgnoreCase(sheets[i]->getName(), name)) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<std::pair<Worksheet*, CellRange>> Recalculator::resolveName(const std::string& name,
                                                                          Worksheet* context) const {
    if (context) {
        if (auto named = context->findName(name)) {
            return std::make_pair(context, named->range);
        }
    }
    for (const auto& sheet : workbook_.getSheets()) {
        if (sheet.get() == context) {
            continue;
        }
        if (auto named = sheet->findName(name)) {
            return std::make_pair(sheet.get(), named->range);
        }
    }
    return std::nullopt;
}

}} // namespace fingrid::calc
