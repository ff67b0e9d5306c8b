#pragma once

#include <quantum/core/errors.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace quantum::markup {

struct Element;

struct Attribute {
    std::string name;
    std::string value;
};

// One child of an element: either a nested element or a run of character data.
struct XmlNode {
    enum Type { ELEMENT, TEXT } type = TEXT;
    std::string text;   // for TEXT, entities already decoded
    bool cdata = false; // TEXT came from a CDATA section
    std::shared_ptr<Element> element;
    std::size_t line = 0;
    std::size_t column = 0;
};

struct Element {
    std::string name;
    std::vector<Attribute> attributes;
    std::vector<XmlNode> children;
    std::size_t line = 0;
    std::size_t column = 0;

    [[nodiscard]] bool has(std::string_view attr) const;
    [[nodiscard]] std::string attr(std::string_view attr, const std::string& fallback = {}) const;

    // "q:loop" -> "q" / "loop"; unprefixed names have an empty prefix.
    [[nodiscard]] std::string prefix() const;
    [[nodiscard]] std::string local_name() const;

    [[nodiscard]] std::vector<const Element*> child_elements() const;
    // Concatenated character data of the direct TEXT children.
    [[nodiscard]] std::string text() const;
};

// Tolerant XML reader for component sources. Accepts the XML prolog,
// comments, DOCTYPE, CDATA, both quote styles, valueless attributes, numeric
// and the five named entities, and HTML void elements left unclosed.
class Reader {
public:
    Reader(std::string_view source, std::string file = {});

    // Reads the whole input into a synthetic "#document" element whose
    // children are the top-level nodes.
    std::shared_ptr<Element> read_document();

private:
    void read_content(Element& parent);
    std::shared_ptr<Element> read_element();
    void read_attributes(Element& element);
    std::string read_name();
    std::string read_text_run();
    std::string decode_entities(std::string_view raw) const;

    bool eof() const { return pos_ >= src_.size(); }
    char peek(std::size_t offset = 0) const;
    bool starts_with(std::string_view token) const;
    void advance(std::size_t n = 1);
    void skip_ws();
    void skip_past(std::string_view terminator, const char* what);

    [[noreturn]] void fail(const std::string& message) const;
    core::SourceLocation here() const;

    std::string_view src_;
    std::string file_;
    std::size_t pos_ = 0;
    std::size_t line_ = 1;
    std::size_t column_ = 1;
};

bool is_void_element(std::string_view name);

} // namespace quantum::markup
