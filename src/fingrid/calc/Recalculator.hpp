#pragma once

#include "fingrid/core/CellAddress.hpp"
#include "fingrid/core/CellValue.hpp"
#include "fingrid/formula/EvalContext.hpp"
#include "fingrid/formula/FormulaAST.hpp"
#include "fingrid/formula/FormulaParser.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fingrid {
namespace core {
class Workbook;
class Worksheet;
}
namespace calc {

/**
 * @brief 重算控制器
 *
 * 不维护持久的依赖图：每次写入后扫描工作簿中全部公式单元格（使用按公式文本
 * 缓存的 AST），求出引用了被写地址的公式的传递闭包，在一次带备忘的求值中
 * 重新计算。求值过程中的访问栈用于发现循环引用，环上的单元格都得到 #CIRCULAR!。
 *
 * 单次递归深度不超过 max_eval_depth。触及上限时栈上的单元格暂记 #ERROR!，
 * 并在同一次重算的后续轮次中重新求值，直到待重算的集合不再缩小。
 */
class Recalculator : public formula::EvalContext {
public:
    struct Statistics {
        size_t passes = 0;
        size_t cells_evaluated = 0;
        size_t circular_cells = 0;
        size_t cache_hits = 0;
        size_t cache_misses = 0;
    };

    explicit Recalculator(core::Workbook& workbook);

    Recalculator(const Recalculator&) = delete;
    Recalculator& operator=(const Recalculator&) = delete;

    /**
     * @brief 写入后的增量重算
     * @param sheet 被写入的工作表
     * @param changed 被写入或删除的地址
     */
    void recalculate(core::Worksheet& sheet, const std::vector<core::CellAddress>& changed);

    /**
     * @brief 重新计算所有公式单元格（结构性操作、状态导入之后）
     */
    void recalculateAll();

    /**
     * @brief 在 sheet 上下文中求值一段公式，不写回任何单元格
     */
    core::CellValue evaluate(core::Worksheet& sheet, const std::string& formula);

    /**
     * @brief 取得公式的 AST，语法错误时为 nullptr
     */
    std::shared_ptr<const formula::FormulaAST> parsed(const std::string& formula);

    size_t cacheSize() const { return cache_.size(); }
    void clearCache() { cache_.clear(); }

    const Statistics& getStatistics() const { return stats_; }

    // ========== EvalContext ==========

    core::CellValue cellValue(const std::string& sheet, const core::CellAddress& addr) override;
    formula::RangeValues rangeValues(const std::string& sheet, const core::CellRange& range) override;
    formula::RangeValues sheetSpanValues(const std::string& first_sheet, const std::string& last_sheet,
                                         const core::CellRange& range) override;
    formula::RangeValues namedRangeValues(const std::string& name) override;
    const formula::CalcSettings& settings() const override { return settings_; }

private:
    using CellKey = std::pair<int, core::CellAddress>;

    struct FormulaCell {
        core::Worksheet* sheet;
        core::CellAddress addr;
        std::shared_ptr<const formula::FormulaAST> ast;
    };

    // 单次求值过程的状态
    struct PassState {
        std::set<CellKey> dirty;
        std::set<CellKey> done;
        std::vector<CellKey> stack;
        std::set<CellKey> on_stack;
        std::set<CellKey> circular;
        // 结果受深度上限影响、需要下一轮重新求值的单元格
        std::set<CellKey> depth_limited;
        std::vector<core::Worksheet*> sheet_stack;
    };

    std::vector<FormulaCell> collectFormulaCells();
    void runPass(std::vector<FormulaCell>& cells);
    size_t evaluateDirty(std::vector<FormulaCell>& cells);
    void markStackDepthLimited();

    /**
     * @brief 引用 ref（出现在 owner 的公式中）是否覆盖 key
     */
    bool referenceHits(const formula::ReferenceInfo& ref, core::Worksheet& owner, const CellKey& key) const;

    core::CellValue evaluateCell(core::Worksheet& sheet, const core::CellAddress& addr);
    core::CellValue valueAt(core::Worksheet& sheet, const core::CellAddress& addr);
    formula::RangeValues blockValues(core::Worksheet& sheet, const core::CellRange& range);

    core::Worksheet* currentSheet() const;
    core::Worksheet* resolveSheet(const std::string& name) const;
    std::optional<size_t> sheetIndex(const std::string& name) const;

    /**
     * @brief 命名范围解析：先查 context 所在工作表，再按创建顺序查其他工作表
     */
    std::optional<std::pair<core::Worksheet*, core::CellRange>> resolveName(const std::string& name,
                                                                           core::Worksheet* context) const;

    core::Workbook& workbook_;
    formula::FormulaParser parser_;
    formula::CalcSettings settings_;
    int max_depth_;

    std::unordered_map<std::string, std::shared_ptr<const formula::FormulaAST>> cache_;
    PassState pass_;
    Statistics stats_;
};

}} // namespace fingrid::calc
