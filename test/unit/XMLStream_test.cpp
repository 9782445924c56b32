#include <gtest/gtest.h>
#include "fingrid/core/Exception.hpp"
#include "fingrid/xml/XMLStreamReader.hpp"
#include "fingrid/xml/XMLStreamWriter.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace fingrid::xml;

class XMLStreamWriterTest : public ::testing::Test {
protected:
    XMLStreamWriter writer;
};

// 测试元素、属性与文本的输出
TEST_F(XMLStreamWriterTest, ElementsAndEscaping) {
    writer.startDocument();
    writer.startElement("root");
    writer.writeAttribute("a", "x<y\"z");
    writer.startElement("child");
    writer.writeText("1 & 2");
    writer.endElement();
    writer.writeEmptyElement("empty");
    writer.endElement();
    writer.endDocument();

    EXPECT_EQ(writer.toString(),
              "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
              "<root a=\"x&lt;y&quot;z\"><child>1 &amp; 2</child><empty/></root>\n");
}

// 测试不同类型的属性值
TEST_F(XMLStreamWriterTest, TypedAttributes) {
    writer.startElement("cell");
    writer.writeAttribute("row", 5);
    writer.writeAttribute("rate", 0.25);
    writer.writeAttribute("hidden", true);
    writer.writeAttribute("note", "line1\nline2\ttab");
    EXPECT_EQ(writer.getDepth(), 1u);
    writer.endElement();

    EXPECT_EQ(writer.toString(), "<cell row=\"5\" rate=\"0.25\" hidden=\"1\" note=\"line1&#xA;line2&#x9;tab\"/>");
    EXPECT_EQ(writer.getDepth(), 0u);
}

// 未关闭的元素在文档结束时自动关闭
TEST_F(XMLStreamWriterTest, EndDocumentClosesElements) {
    writer.startElement("a");
    writer.startElement("b");
    writer.writeText("t");
    writer.endDocument();
    EXPECT_EQ(writer.toString(), "<a><b>t</b></a>\n");

    writer.clear();
    EXPECT_TRUE(writer.isEmpty());
    EXPECT_EQ(writer.getDepth(), 0u);
}

// 测试错误用法
TEST_F(XMLStreamWriterTest, MisuseThrows) {
    EXPECT_THROW(writer.endElement(), fingrid::core::XMLException);
    EXPECT_THROW(writer.startElement(""), fingrid::core::ParameterException);

    writer.startElement("a");
    writer.writeText("body");
    EXPECT_THROW(writer.writeAttribute("late", "x"), fingrid::core::XMLException);
}

class XMLStreamReaderTest : public ::testing::Test {
protected:
    XMLStreamReader reader;
};

// 测试解析为简单 DOM
TEST_F(XMLStreamReaderTest, ParseToDOM) {
    auto root = reader.parseToDOM(
        "<?xml version=\"1.0\"?>\n"
        "<workbook version=\"1\">\n"
        "  <sheet name=\"A &amp; B\" note=\"x&#xA;y\">  label  </sheet>\n"
        "  <sheet name=\"C\"/>\n"
        "  <other/>\n"
        "</workbook>");
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->name, "workbook");
    EXPECT_EQ(root->getAttribute("version"), "1");
    EXPECT_EQ(root->getAttribute("missing", "fallback"), "fallback");
    EXPECT_FALSE(root->hasAttribute("missing"));

    auto sheets = root->findChildren("sheet");
    ASSERT_EQ(sheets.size(), 2u);
    EXPECT_EQ(sheets[0]->getAttribute("name"), "A & B");
    EXPECT_EQ(sheets[0]->getAttribute("note"), "x\ny");
    EXPECT_EQ(sheets[0]->text, "label");
    EXPECT_EQ(sheets[0]->parent, root.get());
    EXPECT_EQ(root->findChild("other")->name, "other");
    EXPECT_EQ(root->findChild("absent"), nullptr);
    EXPECT_EQ(reader.getElementsParsed(), 4u);
}

// 测试事件回调与深度
TEST_F(XMLStreamReaderTest, StreamingCallbacks) {
    std::vector<std::string> events;
    reader.setStartElementCallback([&](std::string_view name, const std::vector<XMLAttribute>& attributes, int depth) {
        events.push_back("start " + std::string(name) + " " + std::to_string(depth) + " " +
                         std::to_string(attributes.size()));
    });
    reader.setEndElementCallback([&](std::string_view name, int depth) {
        events.push_back("end " + std::string(name) + " " + std::to_string(depth));
    });
    reader.setTextCallback([&](std::string_view text, int depth) {
        events.push_back("text " + std::string(text) + " " + std::to_string(depth));
    });

    ASSERT_EQ(reader.parseFromString("<a x=\"1\"><b y=\"2\" z=\"3\">hi</b></a>"), XMLParseError::Ok);
    std::vector<std::string> expected = {
        "start a 0 1", "start b 1 2", "text hi 2", "end b 1", "end a 0"
    };
    EXPECT_EQ(events, expected);
}

// 格式错误时返回错误与行号
TEST_F(XMLStreamReaderTest, MalformedInput) {
    EXPECT_EQ(reader.parseToDOM("<a>\n<b></a>"), nullptr);
    EXPECT_EQ(reader.getLastError(), XMLParseError::ParseFailed);
    EXPECT_FALSE(reader.getLastErrorMessage().empty());
    EXPECT_EQ(reader.getLastErrorLine(), 2);

    EXPECT_EQ(reader.parseFromString(""), XMLParseError::InvalidInput);
    EXPECT_FALSE(isSuccess(reader.getLastError()));
    EXPECT_FALSE(reader.getParserVersion().empty());
}

// 回调抛出异常时停止解析
TEST_F(XMLStreamReaderTest, CallbackErrorStopsParsing) {
    int seen = 0;
    reader.setStartElementCallback([&](std::string_view name, const std::vector<XMLAttribute>&, int) {
        ++seen;
        if (name == "bad") {
            throw std::runtime_error("rejected");
        }
    });
    EXPECT_EQ(reader.parseFromString("<a><bad/><c/></a>"), XMLParseError::CallbackError);
    EXPECT_EQ(seen, 2);
    EXPECT_NE(reader.getLastErrorMessage().find("rejected"), std::string::npos);
}
