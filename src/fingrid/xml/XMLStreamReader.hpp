#pragma once

#include <cstddef>
#include <expat.h>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fingrid {
namespace xml {

// 解析错误枚举
enum class XMLParseError {
    Ok,                    // 解析成功
    InvalidInput,          // 无效输入
    ParserCreateFailed,    // 解析器创建失败
    ParseFailed,           // 解析失败
    CallbackError          // 回调函数错误
};

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

// 属性（指向 expat 内部缓冲区，仅在回调期间有效）
struct XMLAttribute {
    std::string_view name;
    std::string_view value;

    XMLAttribute(std::string_view n, std::string_view v)
        : name(n), value(v) {}
};

/**
 * @brief 基于libexpat的流式XML解析器
 *
 * SAX 风格的事件回调；小文档可用 parseToDOM 得到简单树结构。
 */
class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(std::string_view name, const std::vector<XMLAttribute>& attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;

private:
    XML_Parser parser_ = nullptr;

    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;
    int last_error_line_ = 0;

    std::vector<XMLAttribute> attributes_;
    std::string current_text_;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;

    bool trim_whitespace_ = true;
    size_t elements_parsed_ = 0;

    static void XMLCALL startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* userData, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* userData, const XML_Char* data, int len);

    bool initializeParser();
    void cleanupParser();
    void resetState();
    void flushText();
    void handleError(XMLParseError error, const std::string& message);

public:
    XMLStreamReader() = default;
    ~XMLStreamReader();

    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    void setStartElementCallback(StartElementCallback callback) { start_element_callback_ = std::move(callback); }
    void setEndElementCallback(EndElementCallback callback) { end_element_callback_ = std::move(callback); }
    void setTextCallback(TextCallback callback) { text_callback_ = std::move(callback); }
    void setTrimWhitespace(bool trim) { trim_whitespace_ = trim; }

    XMLParseError parseFromString(const std::string& xml_content);
    XMLParseError parseFromBuffer(const char* buffer, size_t size);

    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    int getLastErrorLine() const { return last_error_line_; }
    size_t getElementsParsed() const { return elements_parsed_; }
    std::string getParserVersion() const;

    // 简单DOM（适合小文档）
    struct SimpleElement {
        std::string name;
        std::unordered_map<std::string, std::string> attributes;
        std::string text;
        std::vector<std::unique_ptr<SimpleElement>> children;
        SimpleElement* parent = nullptr;

        explicit SimpleElement(const std::string& n) : name(n) {}

        SimpleElement* findChild(const std::string& element_name) const;
        std::vector<SimpleElement*> findChildren(const std::string& element_name) const;

        std::string getAttribute(const std::string& attr_name, const std::string& default_value = "") const;
        bool hasAttribute(const std::string& attr_name) const;
    };

    /**
     * @brief 将整个文档解析为树，失败时返回 nullptr，错误见 getLastErrorMessage()
     */
    std::unique_ptr<SimpleElement> parseToDOM(const std::string& xml_content);
};

}} // namespace fingrid::xml
