#pragma once

#include "fingrid/core/CellAddress.hpp"
#include "fingrid/core/CellValue.hpp"
#include "fingrid/core/Expected.hpp"
#include "fingrid/formula/EvalContext.hpp"
#include <memory>
#include <string>
#include <vector>

namespace fingrid {
namespace formula {

struct FunctionSpec;

/**
 * @brief 公式中出现的一个引用，供重算控制器做依赖扫描
 */
struct ReferenceInfo {
    enum class Kind {
        Range,      // 单元格或范围，sheet 为空表示公式所在工作表
        SheetSpan,  // 3D 引用 sheet..last_sheet
        Name        // 命名范围
    };

    Kind kind = Kind::Range;
    std::string sheet;
    std::string last_sheet;
    core::CellRange range;
    std::string name;
};

/**
 * @brief 表达式节点基类
 */
class Expr {
public:
    virtual ~Expr() = default;

    /**
     * @brief 标量求值；纯范围引用在标量位置得到 #ERROR!
     */
    virtual core::CellValue evaluate(EvalContext& ctx) const = 0;

    /**
     * @brief 作为函数参数时按范围求值，默认把标量包装成 1x1
     */
    virtual RangeValues evaluateRange(EvalContext& ctx) const;

    /**
     * @brief 是否为引用（单元格、范围、3D、命名范围）
     *
     * 聚合函数对引用只取其中的数值，对字面量则做类型转换。
     */
    virtual bool isReference() const { return false; }

    virtual void collectReferences(std::vector<ReferenceInfo>& /*out*/) const {}

    /**
     * @brief 调试用的全括号形式
     */
    virtual std::string toString() const = 0;
};

using ExprPtr = std::unique_ptr<Expr>;

class LiteralExpr : public Expr {
public:
    explicit LiteralExpr(core::CellValue value) : value_(std::move(value)) {}

    core::CellValue evaluate(EvalContext& ctx) const override;
    std::string toString() const override;

    const core::CellValue& value() const { return value_; }

private:
    core::CellValue value_;
};

class CellRefExpr : public Expr {
public:
    CellRefExpr(std::string sheet, const core::CellAddress& address)
        : sheet_(std::move(sheet)), address_(address) {}

    core::CellValue evaluate(EvalContext& ctx) const override;
    bool isReference() const override { return true; }
    void collectReferences(std::vector<ReferenceInfo>& out) const override;
    std::string toString() const override;

private:
    std::string sheet_;
    core::CellAddress address_;
};

class RangeRefExpr : public Expr {
public:
    RangeRefExpr(std::string sheet, const core::CellRange& range)
        : sheet_(std::move(sheet)), range_(range) {}

    core::CellValue evaluate(EvalContext& ctx) const override;
    RangeValues evaluateRange(EvalContext& ctx) const override;
    bool isReference() const override { return true; }
    void collectReferences(std::vector<ReferenceInfo>& out) const override;
    std::string toString() const override;

private:
    std::string sheet_;
    core::CellRange range_;
};

/**
 * @brief 3D 引用 First:Last!A1 或 First:Last!A1:B2
 */
class SheetSpanRefExpr : public Expr {
public:
    SheetSpanRefExpr(std::string first_sheet, std::string last_sheet, const core::CellRange& range)
        : first_sheet_(std::move(first_sheet)), last_sheet_(std::move(last_sheet)), range_(range) {}

    core::CellValue evaluate(EvalContext& ctx) const override;
    RangeValues evaluateRange(EvalContext& ctx) const override;
    bool isReference() const override { return true; }
    void collectReferences(std::vector<ReferenceInfo>& out) const override;
    std::string toString() const override;

private:
    std::string first_sheet_;
    std::string last_sheet_;
    core::CellRange range_;
};

class NameRefExpr : public Expr {
public:
    explicit NameRefExpr(std::string name) : name_(std::move(name)) {}

    core::CellValue evaluate(EvalContext& ctx) const override;
    RangeValues evaluateRange(EvalContext& ctx) const override;
    bool isReference() const override { return true; }
    void collectReferences(std::vector<ReferenceInfo>& out) const override;
    std::string toString() const override;

private:
    std::string name_;
};

class UnaryExpr : public Expr {
public:
    UnaryExpr(char op, ExprPtr operand) : op_(op), operand_(std::move(operand)) {}

    core::CellValue evaluate(EvalContext& ctx) const override;
    void collectReferences(std::vector<ReferenceInfo>& out) const override;
    std::string toString() const override;

private:
    char op_;  // '+' 或 '-'
    ExprPtr operand_;
};

class PercentExpr : public Expr {
public:
    explicit PercentExpr(ExprPtr operand) : operand_(std::move(operand)) {}

    core::CellValue evaluate(EvalContext& ctx) const override;
    void collectReferences(std::vector<ReferenceInfo>& out) const override;
    std::string toString() const override;

private:
    ExprPtr operand_;
};

enum class BinaryOp {
    Add,
    Subtract,
    Multiply,
    Divide,
    Power,
    Concat,
    Equal,
    NotEqual,
    Less,
    LessEqual,
    Greater,
    GreaterEqual
};

const char* binaryOpSymbol(BinaryOp op) noexcept;

class BinaryExpr : public Expr {
public:
    BinaryExpr(BinaryOp op, ExprPtr lhs, ExprPtr rhs)
        : op_(op), lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}

    core::CellValue evaluate(EvalContext& ctx) const override;
    void collectReferences(std::vector<ReferenceInfo>& out) const override;
    std::string toString() const override;

private:
    BinaryOp op_;
    ExprPtr lhs_;
    ExprPtr rhs_;
};

/**
 * @brief 函数调用；spec 为空表示未知函数，求值得到 #ERROR!
 */
class CallExpr : public Expr {
public:
    CallExpr(std::string name, const FunctionSpec* spec, std::vector<ExprPtr> args)
        : name_(std::move(name)), spec_(spec), args_(std::move(args)) {}

    core::CellValue evaluate(EvalContext& ctx) const override;
    void collectReferences(std::vector<ReferenceInfo>& out) const override;
    std::string toString() const override;

    const std::string& name() const { return name_; }
    size_t argCount() const { return args_.size(); }

private:
    std::string name_;
    const FunctionSpec* spec_;
    std::vector<ExprPtr> args_;
};

/**
 * @brief 解析后的公式：根节点加上引用清单
 */
class FormulaAST {
public:
    FormulaAST(std::string source, ExprPtr root);

    const std::string& source() const { return source_; }
    const Expr& root() const { return *root_; }
    const std::vector<ReferenceInfo>& references() const { return references_; }

    core::CellValue evaluate(EvalContext& ctx) const;

private:
    std::string source_;
    ExprPtr root_;
    std::vector<ReferenceInfo> references_;
};

// ========== 求值共用的类型转换 ==========

/**
 * @brief 标量转数值：空为 0，布尔为 1/0，数值文本按宽松规则解析，其余为 #VALUE!
 */
core::Expected<double, core::FormulaError> toNumber(const core::CellValue& value);

/**
 * @brief 标量转布尔：数值非零为真，文本 TRUE/FALSE，其余为 #VALUE!
 */
core::Expected<bool, core::FormulaError> toBoolean(const core::CellValue& value);

/**
 * @brief 比较两个标量：数值 < 文本 < 布尔，文本忽略大小写；空值按对方类型取 0 或 ""
 * @return 负数、0、正数
 */
int compareValues(const core::CellValue& lhs, const core::CellValue& rhs);

/**
 * @brief 非有限数值映射为 #ERROR!
 */
core::CellValue finiteOrError(double value);

}} // namespace fingrid::formula
