#include "fingrid/xml/XMLStreamReader.hpp"
#include "fingrid/utils/ModuleLoggers.hpp"
#include <climits>
#include <cstring>
#include <fmt/format.h>
#include <stack>

namespace fingrid {
namespace xml {

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();

    parser_ = XML_ParserCreate("UTF-8");
    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Failed to create XML parser");
        return false;
    }

    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

void XMLStreamReader::resetState() {
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    last_error_line_ = 0;
    attributes_.clear();
    current_text_.clear();
    elements_parsed_ = 0;
}

XMLParseError XMLStreamReader::parseFromString(const std::string& xml_content) {
    return parseFromBuffer(xml_content.data(), xml_content.size());
}

XMLParseError XMLStreamReader::parseFromBuffer(const char* buffer, size_t size) {
    resetState();
    if (!buffer || size == 0) {
        handleError(XMLParseError::InvalidInput, "Empty XML input");
        return last_error_;
    }
    if (size > static_cast<size_t>(INT_MAX)) {
        handleError(XMLParseError::InvalidInput, "XML input too large");
        return last_error_;
    }
    if (!initializeParser()) {
        return last_error_;
    }

    if (XML_Parse(parser_, buffer, static_cast<int>(size), 1) == XML_STATUS_ERROR) {
        // 回调中已记录的错误优先
        if (last_error_ == XMLParseError::Ok) {
            last_error_line_ = static_cast<int>(XML_GetCurrentLineNumber(parser_));
            handleError(XMLParseError::ParseFailed,
                        fmt::format("Parse error at line {}, column {}: {}",
                                    XML_GetCurrentLineNumber(parser_),
                                    XML_GetCurrentColumnNumber(parser_),
                                    XML_ErrorString(XML_GetErrorCode(parser_))));
        }
        cleanupParser();
        return last_error_;
    }

    cleanupParser();
    XML_DEBUG("Parsed {} bytes, {} elements", size, elements_parsed_);
    return last_error_;
}

std::string XMLStreamReader::getParserVersion() const {
    return XML_ExpatVersion();
}

// libexpat回调函数实现
void XMLCALL XMLStreamReader::startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    reader->flushText();
    reader->elements_parsed_++;

    reader->attributes_.clear();
    if (attrs) {
        for (int i = 0; attrs[i] && attrs[i + 1]; i += 2) {
            reader->attributes_.emplace_back(std::string_view{attrs[i], std::strlen(attrs[i])},
                                             std::string_view{attrs[i + 1], std::strlen(attrs[i + 1])});
        }
    }

    if (reader->start_element_callback_) {
        try {
            reader->start_element_callback_(std::string_view{name, std::strlen(name)}, reader->attributes_,
                                            reader->current_depth_);
        } catch (const std::exception& e) {
            reader->handleError(XMLParseError::CallbackError, "Start element callback error: " + std::string(e.what()));
            XML_StopParser(reader->parser_, XML_FALSE);
        }
    }
    reader->current_depth_++;
}

void XMLCALL XMLStreamReader::endElementHandler(void* userData, const XML_Char* name) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    reader->flushText();
    reader->current_depth_--;

    if (reader->end_element_callback_) {
        try {
            reader->end_element_callback_(std::string_view{name, std::strlen(name)}, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->handleError(XMLParseError::CallbackError, "End element callback error: " + std::string(e.what()));
            XML_StopParser(reader->parser_, XML_FALSE);
        }
    }
}

void XMLCALL XMLStreamReader::characterDataHandler(void* userData, const XML_Char* data, int len) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    if (len > 0) {
        reader->current_text_.append(data, static_cast<size_t>(len));
    }
}

void XMLStreamReader::flushText() {
    if (current_text_.empty()) {
        return;
    }
    std::string_view text{current_text_};
    if (trim_whitespace_) {
        size_t start = text.find_first_not_of(" \t\n\r");
        text = start == std::string_view::npos
                   ? std::string_view{}
                   : text.substr(start, text.find_last_not_of(" \t\n\r") - start + 1);
    }
    if (!text.empty() && text_callback_) {
        try {
            text_callback_(text, current_depth_);
        } catch (const std::exception& e) {
            handleError(XMLParseError::CallbackError, "Text callback error: " + std::string(e.what()));
            XML_StopParser(parser_, XML_FALSE);
        }
    }
    current_text_.clear();
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;
    XML_ERROR("XML parse error: {}", message);
}

// ========== SimpleElement ==========

XMLStreamReader::SimpleElement* XMLStreamReader::SimpleElement::findChild(const std::string& element_name) const {
    for (const auto& child : children) {
        if (child->name == element_name) {
            return child.get();
        }
    }
    return nullptr;
}

std::vector<XMLStreamReader::SimpleElement*> XMLStreamReader::SimpleElement::findChildren(
    const std::string& element_name) const {
    std::vector<SimpleElement*> result;
    for (const auto& child : children) {
        if (child->name == element_name) {
            result.push_back(child.get());
        }
    }
    return result;
}

std::string XMLStreamReader::SimpleElement::getAttribute(const std::string& attr_name,
                                                         const std::string& default_value) const {
    auto it = attributes.find(attr_name);
    return it != attributes.end() ? it->second : default_value;
}

bool XMLStreamReader::SimpleElement::hasAttribute(const std::string& attr_name) const {
    return attributes.find(attr_name) != attributes.end();
}

std::unique_ptr<XMLStreamReader::SimpleElement> XMLStreamReader::parseToDOM(const std::string& xml_content) {
    std::unique_ptr<SimpleElement> root;
    std::stack<SimpleElement*> element_stack;

    setStartElementCallback([&](std::string_view element_name, const std::vector<XMLAttribute>& attributes,
                                int /*depth*/) {
        auto element = std::make_unique<SimpleElement>(std::string(element_name));
        for (const auto& attr : attributes) {
            element->attributes[std::string(attr.name)] = std::string(attr.value);
        }

        SimpleElement* element_ptr = element.get();
        if (element_stack.empty()) {
            root = std::move(element);
        } else {
            element_ptr->parent = element_stack.top();
            element_stack.top()->children.push_back(std::move(element));
        }
        element_stack.push(element_ptr);
    });

    setEndElementCallback([&](std::string_view /*element_name*/, int /*depth*/) {
        if (!element_stack.empty()) {
            element_stack.pop();
        }
    });

    setTextCallback([&](std::string_view text, int /*depth*/) {
        if (!element_stack.empty()) {
            element_stack.top()->text.append(text.data(), text.size());
        }
    });

    XMLParseError result = parseFromString(xml_content);

    start_element_callback_ = nullptr;
    end_element_callback_ = nullptr;
    text_callback_ = nullptr;

    if (result != XMLParseError::Ok) {
        return nullptr;
    }
    return root;
}

}} // namespace fingrid::xml
