#pragma once

#include <cstddef>
#include <stack>
#include <string>
#include <utility>
#include <vector>

namespace fingrid {
namespace xml {

/**
 * @brief 内存缓冲的XML流写入器
 *
 * 属性在元素开始标签关闭前批量写出；没有内容的元素自闭合。
 */
class XMLStreamWriter {
private:
    struct XMLAttribute {
        std::string key;
        std::string value;

        XMLAttribute(std::string k, std::string v)
            : key(std::move(k)), value(std::move(v)) {}
    };

    std::string buffer_;
    std::stack<std::string> element_stack_;
    bool in_element_ = false;
    std::vector<XMLAttribute> pending_attributes_;

    void ensureElementClosed();
    void writeAttributesToBuffer();

public:
    XMLStreamWriter() = default;
    ~XMLStreamWriter() = default;

    XMLStreamWriter(const XMLStreamWriter&) = delete;
    XMLStreamWriter& operator=(const XMLStreamWriter&) = delete;

    /**
     * @brief 文档操作
     */
    void startDocument(const std::string& encoding = "UTF-8");
    void endDocument();

    /**
     * @brief 元素操作
     * @throws ParameterException 元素名为空
     * @throws XMLException 没有可关闭的元素
     */
    void startElement(const std::string& name);
    void endElement();
    void writeEmptyElement(const std::string& name);

    /**
     * @brief 属性操作，只能紧跟在 startElement 之后
     */
    void writeAttribute(const std::string& name, const std::string& value);
    void writeAttribute(const std::string& name, const char* value);
    void writeAttribute(const std::string& name, int value);
    void writeAttribute(const std::string& name, double value);
    void writeAttribute(const std::string& name, bool value);

    void writeText(const std::string& text);

    void clear();
    std::string toString() const { return buffer_; }
    bool isEmpty() const { return buffer_.empty(); }
    size_t getDepth() const { return element_stack_.size(); }
};

}} // namespace fingrid::xml
