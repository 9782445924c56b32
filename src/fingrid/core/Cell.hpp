#pragma once

#include "fingrid/core/CellValue.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fingrid {
namespace core {

/**
 * @brief 显示分类标签，只影响显示格式，不影响求值
 */
enum class CellType : uint8_t {
    Text = 0,
    Number = 1,
    Currency = 2,
    Percentage = 3,
    Date = 4,
    Boolean = 5,
    Formula = 6,
    Link = 7
};

const char* cellTypeName(CellType type) noexcept;
std::optional<CellType> parseCellType(const std::string& name) noexcept;

/**
 * @brief 根据值的形状推断显示分类
 *
 * 文本以 http 开头为链接，YYYY-MM-DD 开头为日期，$ 开头的数字为货币，
 * 数字加 % 为百分比。
 */
CellType detectCellType(const CellValue& value);

/**
 * @brief 样式：属性名到属性值的映射，如 {"fontWeight": "bold"}
 */
using CellStyle = std::map<std::string, std::string>;

/**
 * @brief 把 overlay 中的属性覆盖合并到 base
 */
void mergeStyle(CellStyle& base, const CellStyle& overlay);

/**
 * @brief 历史记录项：写入前的值及写入时间
 */
struct HistoryEntry {
    CellValue value;
    std::string timestamp;

    bool operator==(const HistoryEntry& other) const {
        return value == other.value && timestamp == other.timestamp;
    }
};

class Cell {
private:
    // 可选字段（只在需要时分配）
    struct ExtendedData {
        std::string formula;
        std::string link;
        std::string source_annotation;
        std::string comment;
        CellStyle style;
        std::vector<HistoryEntry> history;
    };

    CellValue value_;
    CellType type_ = CellType::Text;
    std::unique_ptr<ExtendedData> extended_;

    ExtendedData& ensureExtended();
    void deepCopyExtendedData(const Cell& other);

public:
    Cell() = default;
    explicit Cell(const CellValue& value);
    ~Cell() = default;

    Cell(const Cell& other);
    Cell& operator=(const Cell& other);
    Cell(Cell&& other) noexcept = default;
    Cell& operator=(Cell&& other) noexcept = default;

    // ========== 值 ==========

    const CellValue& getValue() const { return value_; }
    CellType getType() const { return type_; }

    /**
     * @brief 写入字面量：清除公式，类型按值推断
     */
    void setLiteral(const CellValue& value);

    /**
     * @brief 写入字面量并指定显示分类
     */
    void setLiteral(const CellValue& value, CellType type);

    /**
     * @brief 设置公式文本（含前导 =）；值由重算写入
     */
    void setFormula(const std::string& formula);

    /**
     * @brief 重算结果回写，只对公式单元格有意义
     */
    void setComputedValue(const CellValue& value) { value_ = value; }

    bool hasFormula() const { return extended_ && !extended_->formula.empty(); }
    const std::string& getFormula() const;

    // ========== 样式 ==========

    void setStyle(const CellStyle& style);
    void applyStyle(const CellStyle& style);
    const CellStyle& getStyle() const;
    bool hasStyle() const { return extended_ && !extended_->style.empty(); }

    // ========== 附加信息 ==========

    void setLink(const std::string& url);
    const std::string& getLink() const;

    void setSourceAnnotation(const std::string& source);
    const std::string& getSourceAnnotation() const;

    void setComment(const std::string& comment);
    const std::string& getComment() const;

    // ========== 历史 ==========

    void appendHistory(const CellValue& previous, const std::string& timestamp);
    const std::vector<HistoryEntry>& getHistory() const;

    /**
     * @brief 无值、无公式、无样式、无附加信息
     */
    bool isBlank() const;

    /**
     * @brief 内容相等（值、类型、公式、样式、附加信息、历史）
     */
    bool operator==(const Cell& other) const;
    bool operator!=(const Cell& other) const { return !(*this == other); }
};

}} // namespace fingrid::core
