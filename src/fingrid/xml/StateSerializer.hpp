#pragma once

#include "fingrid/core/Expected.hpp"
#include "fingrid/core/WorkbookState.hpp"
#include <string>

namespace fingrid {
namespace xml {

/**
 * @brief 工作簿状态与XML文本之间的转换
 *
 * 文档结构：
 * @code
 * <workbook version="1" activeSheet="1">
 *   <sheet id="1" name="Sheet1" rows="100" cols="26" frozenRows="1" frozenCols="1">
 *     <hiddenRow index="3"/>
 *     <rowHeight index="2" value="24"/>
 *     <merge ref="A1:B2"/>
 *     <name name="Revenue" ref="B2:B10"/>
 *     <conditionalFormat id="cf1" ref="A1:A10" condition="greaterThan" kind="number" value="5">
 *       <style key="color" value="red"/>
 *     </conditionalFormat>
 *     <cell ref="A1" type="number" kind="number" v="42" formula="=B1*2" link="..." source="..." comment="...">
 *       <style key="bold" value="true"/>
 *       <history kind="empty" v="" timestamp="..."/>
 *     </cell>
 *   </sheet>
 * </workbook>
 * @endcode
 *
 * 值以 kind + 文本两个属性保存，数值使用最短可往返表示。
 */
class StateSerializer {
public:
    static constexpr int kFormatVersion = 1;

    static std::string toXML(const core::WorkbookState& state);

    /**
     * @brief 解析XML文本；结构错误返回 XmlParseError / XmlMissingElement / InvalidFormat
     */
    static core::Result<core::WorkbookState> fromXML(const std::string& xml);

    static core::VoidResult saveToFile(const core::WorkbookState& state, const std::string& filepath);
    static core::Result<core::WorkbookState> loadFromFile(const std::string& filepath);
};

}} // namespace fingrid::xml
