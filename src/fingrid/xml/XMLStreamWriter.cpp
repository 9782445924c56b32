#include "fingrid/xml/XMLStreamWriter.hpp"
#include "fingrid/core/Exception.hpp"
#include "fingrid/utils/ModuleLoggers.hpp"
#include "fingrid/xml/XMLEscapes.hpp"
#include <fmt/format.h>

namespace fingrid {
namespace xml {

void XMLStreamWriter::startDocument(const std::string& encoding) {
    buffer_ += "<?xml version=\"1.0\" encoding=\"";
    buffer_ += encoding;
    buffer_ += "\"?>\n";
}

void XMLStreamWriter::endDocument() {
    while (!element_stack_.empty()) {
        XML_WARN("Auto-closing unclosed element: {}", element_stack_.top());
        endElement();
    }
    buffer_ += '\n';
}

void XMLStreamWriter::startElement(const std::string& name) {
    if (name.empty()) {
        FINGRID_THROW_PARAM("Element name cannot be empty", "name");
    }

    ensureElementClosed();

    buffer_ += '<';
    buffer_ += name;

    element_stack_.push(name);
    in_element_ = true;
}

void XMLStreamWriter::endElement() {
    if (element_stack_.empty()) {
        throw core::XMLException("No element to close", -1, __FILE__, __LINE__);
    }

    std::string element_name = element_stack_.top();
    element_stack_.pop();

    if (in_element_) {
        // 自闭合元素
        writeAttributesToBuffer();
        buffer_ += "/>";
        in_element_ = false;
    } else {
        buffer_ += "</";
        buffer_ += element_name;
        buffer_ += '>';
    }
}

void XMLStreamWriter::writeEmptyElement(const std::string& name) {
    startElement(name);
    endElement();
}

void XMLStreamWriter::writeAttribute(const std::string& name, const std::string& value) {
    if (!in_element_) {
        throw core::XMLException(fmt::format("Cannot write attribute '{}' outside of element", name), -1,
                                 __FILE__, __LINE__);
    }
    pending_attributes_.emplace_back(name, value);
}

void XMLStreamWriter::writeAttribute(const std::string& name, const char* value) {
    writeAttribute(name, std::string(value ? value : ""));
}

void XMLStreamWriter::writeAttribute(const std::string& name, int value) {
    writeAttribute(name, std::to_string(value));
}

void XMLStreamWriter::writeAttribute(const std::string& name, double value) {
    // 最短可往返表示
    writeAttribute(name, fmt::format("{}", value));
}

void XMLStreamWriter::writeAttribute(const std::string& name, bool value) {
    writeAttribute(name, std::string(value ? "1" : "0"));
}

void XMLStreamWriter::writeText(const std::string& text) {
    ensureElementClosed();
    XMLEscapes::appendText(buffer_, text);
}

void XMLStreamWriter::clear() {
    buffer_.clear();
    pending_attributes_.clear();
    element_stack_ = std::stack<std::string>();
    in_element_ = false;
}

void XMLStreamWriter::ensureElementClosed() {
    if (in_element_) {
        writeAttributesToBuffer();
        buffer_ += '>';
        in_element_ = false;
    }
}

void XMLStreamWriter::writeAttributesToBuffer() {
    for (const auto& attr : pending_attributes_) {
        buffer_ += ' ';
        buffer_ += attr.key;
        buffer_ += "=\"";
        XMLEscapes::appendAttribute(buffer_, attr.value);
        buffer_ += '"';
    }
    pending_attributes_.clear();
}

}} // namespace fingrid::xml
