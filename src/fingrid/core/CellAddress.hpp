#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <tuple>
#include <vector>

namespace fingrid {
namespace core {

/**
 * @brief 单元格坐标
 *
 * 行列均从 1 开始：A1 为 (row=1, col=1)。排序为行优先。
 */
struct CellAddress {
    int row = 0;
    int col = 0;

    CellAddress() = default;
    CellAddress(int r, int c) : row(r), col(c) {}

    bool isValid() const { return row >= 1 && col >= 1; }

    bool operator==(const CellAddress& other) const {
        return row == other.row && col == other.col;
    }
    bool operator!=(const CellAddress& other) const { return !(*this == other); }
    bool operator<(const CellAddress& other) const {
        return std::tie(row, col) < std::tie(other.row, other.col);
    }
};

/**
 * @brief 闭区间矩形范围，构造时规范化左上/右下角
 */
struct CellRange {
    CellAddress first;
    CellAddress last;

    CellRange() = default;
    CellRange(const CellAddress& a, const CellAddress& b)
        : first(std::min(a.row, b.row), std::min(a.col, b.col))
        , last(std::max(a.row, b.row), std::max(a.col, b.col)) {}
    explicit CellRange(const CellAddress& single) : first(single), last(single) {}

    int rowCount() const { return last.row - first.row + 1; }
    int colCount() const { return last.col - first.col + 1; }
    size_t size() const { return static_cast<size_t>(rowCount()) * static_cast<size_t>(colCount()); }
    bool isSingleCell() const { return first == last; }

    bool contains(const CellAddress& addr) const {
        return addr.row >= first.row && addr.row <= last.row &&
               addr.col >= first.col && addr.col <= last.col;
    }

    bool intersects(const CellRange& other) const {
        return first.row <= other.last.row && other.first.row <= last.row &&
               first.col <= other.last.col && other.first.col <= last.col;
    }

    /**
     * @brief 行优先展开为地址列表
     */
    std::vector<CellAddress> addresses() const {
        std::vector<CellAddress> result;
        result.reserve(size());
        for (int r = first.row; r <= last.row; ++r) {
            for (int c = first.col; c <= last.col; ++c) {
                result.emplace_back(r, c);
            }
        }
        return result;
    }

    bool operator==(const CellRange& other) const {
        return first == other.first && last == other.last;
    }
    bool operator!=(const CellRange& other) const { return !(*this == other); }
};

}} // namespace fingrid::core

namespace std {
template<>
struct hash<fingrid::core::CellAddress> {
    size_t operator()(const fingrid::core::CellAddress& addr) const noexcept {
        return (static_cast<size_t>(addr.row) << 16) ^ static_cast<size_t>(addr.col);
    }
};
} // namespace std
