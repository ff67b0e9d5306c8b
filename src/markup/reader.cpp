#include <quantum/markup/reader.hpp>

#include <array>
#include <cctype>
#include <utility>

namespace quantum::markup {

namespace {

bool is_name_start(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_name_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == ':' || c == '-' || c == '.' || c == '@';
}

void append_utf8(std::string& out, unsigned long cp)
{
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

} // namespace

bool is_void_element(std::string_view name)
{
    static constexpr std::array<std::string_view, 14> voids = {
        "area", "base", "br", "col", "embed", "hr", "img", "input",
        "link", "meta", "param", "source", "track", "wbr"};
    for (auto v : voids) {
        if (v == name) return true;
    }
    return false;
}

// --- Element ---

bool Element::has(std::string_view attr) const
{
    for (const auto& a : attributes) {
        if (a.name == attr) return true;
    }
    return false;
}

std::string Element::attr(std::string_view attr, const std::string& fallback) const
{
    for (const auto& a : attributes) {
        if (a.name == attr) return a.value;
    }
    return fallback;
}

std::string Element::prefix() const
{
    auto colon = name.find(':');
    return colon == std::string::npos ? std::string{} : name.substr(0, colon);
}

std::string Element::local_name() const
{
    auto colon = name.find(':');
    return colon == std::string::npos ? name : name.substr(colon + 1);
}

std::vector<const Element*> Element::child_elements() const
{
    std::vector<const Element*> out;
    for (const auto& child : children) {
        if (child.type == XmlNode::ELEMENT) out.push_back(child.element.get());
    }
    return out;
}

std::string Element::text() const
{
    std::string out;
    for (const auto& child : children) {
        if (child.type == XmlNode::TEXT) out += child.text;
    }
    return out;
}

// --- Reader ---

Reader::Reader(std::string_view source, std::string file) : src_(source), file_(std::move(file)) {}

std::shared_ptr<Element> Reader::read_document()
{
    auto root = std::make_shared<Element>();
    root->name = "#document";
    root->line = 1;
    root->column = 1;
    read_content(*root);
    return root;
}

char Reader::peek(std::size_t offset) const
{
    return pos_ + offset < src_.size() ? src_[pos_ + offset] : '\0';
}

bool Reader::starts_with(std::string_view token) const
{
    return src_.substr(pos_, token.size()) == token;
}

void Reader::advance(std::size_t n)
{
    while (n-- > 0 && pos_ < src_.size()) {
        if (src_[pos_] == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        ++pos_;
    }
}

void Reader::skip_ws()
{
    while (!eof() && std::isspace(static_cast<unsigned char>(peek()))) advance();
}

void Reader::skip_past(std::string_view terminator, const char* what)
{
    auto end = src_.find(terminator, pos_);
    if (end == std::string_view::npos) fail(std::string("Unterminated ") + what);
    advance(end + terminator.size() - pos_);
}

core::SourceLocation Reader::here() const
{
    return core::SourceLocation{file_, line_, column_};
}

void Reader::fail(const std::string& message) const
{
    throw core::ParseError(message, here());
}

void Reader::read_content(Element& parent)
{
    const bool is_document = parent.name == "#document";

    auto push_text = [&parent](std::string text, bool cdata, std::size_t line, std::size_t column) {
        if (!cdata && !parent.children.empty() && parent.children.back().type == XmlNode::TEXT && !parent.children.back().cdata) {
            parent.children.back().text += text;
            return;
        }
        XmlNode node;
        node.type = XmlNode::TEXT;
        node.text = std::move(text);
        node.cdata = cdata;
        node.line = line;
        node.column = column;
        parent.children.push_back(std::move(node));
    };

    while (true) {
        if (eof()) {
            if (!is_document) {
                throw core::ParseError("Unclosed element <" + parent.name + ">",
                                       core::SourceLocation{file_, parent.line, parent.column});
            }
            return;
        }

        if (starts_with("<!--")) {
            skip_past("-->", "comment");
            continue;
        }
        if (starts_with("<![CDATA[")) {
            auto line = line_, column = column_;
            advance(9);
            auto end = src_.find("]]>", pos_);
            if (end == std::string_view::npos) fail("Unterminated CDATA section");
            std::string raw{src_.substr(pos_, end - pos_)};
            advance(end + 3 - pos_);
            push_text(std::move(raw), true, line, column);
            continue;
        }
        if (starts_with("<?")) {
            skip_past("?>", "processing instruction");
            continue;
        }
        if (starts_with("<!")) {
            skip_past(">", "declaration");
            continue;
        }
        if (starts_with("</")) {
            if (is_document) fail("Unexpected closing tag at top level");
            advance(2);
            auto name = read_name();
            if (name != parent.name) {
                fail("Mismatched closing tag </" + name + ">, expected </" + parent.name + ">");
            }
            skip_ws();
            if (peek() != '>') fail("Expected '>' after </" + name);
            advance();
            return;
        }
        if (peek() == '<' && is_name_start(peek(1))) {
            auto line = line_, column = column_;
            auto element = read_element();
            XmlNode node;
            node.type = XmlNode::ELEMENT;
            node.element = std::move(element);
            node.line = line;
            node.column = column;
            parent.children.push_back(std::move(node));
            continue;
        }

        auto line = line_, column = column_;
        push_text(read_text_run(), false, line, column);
    }
}

std::shared_ptr<Element> Reader::read_element()
{
    auto element = std::make_shared<Element>();
    element->line = line_;
    element->column = column_;
    advance(); // '<'
    element->name = read_name();
    read_attributes(*element);

    if (starts_with("/>")) {
        advance(2);
        return element;
    }
    if (peek() != '>') fail("Expected '>' to close <" + element->name);
    advance();

    if (is_void_element(element->name)) {
        // tolerate an explicit </br> right after the open tag
        auto saved_pos = pos_, saved_line = line_, saved_col = column_;
        skip_ws();
        std::string closing = "</" + element->name;
        if (starts_with(closing)) {
            advance(closing.size());
            skip_ws();
            if (peek() == '>') {
                advance();
                return element;
            }
        }
        pos_ = saved_pos;
        line_ = saved_line;
        column_ = saved_col;
        return element;
    }

    read_content(*element);
    return element;
}

void Reader::read_attributes(Element& element)
{
    while (true) {
        skip_ws();
        if (eof()) fail("Unexpected end of input inside <" + element.name + ">");
        if (peek() == '>' || starts_with("/>")) return;

        if (!is_name_start(peek()) && peek() != ':' && peek() != '@') {
            fail(std::string("Unexpected character '") + peek() + "' in <" + element.name + ">");
        }
        auto name = read_name();
        if (element.has(name)) fail("Duplicate attribute '" + name + "' on <" + element.name + ">");

        skip_ws();
        std::string value;
        if (peek() == '=') {
            advance();
            skip_ws();
            char quote = peek();
            if (quote != '"' && quote != '\'') fail("Attribute '" + name + "' value must be quoted");
            advance();
            auto end = src_.find(quote, pos_);
            if (end == std::string_view::npos) fail("Unterminated value for attribute '" + name + "'");
            value = decode_entities(src_.substr(pos_, end - pos_));
            advance(end + 1 - pos_);
        }
        element.attributes.push_back(Attribute{std::move(name), std::move(value)});
    }
}

std::string Reader::read_name()
{
    auto start = pos_;
    while (!eof() && is_name_char(peek())) advance();
    if (start == pos_) fail("Expected a tag or attribute name");
    return std::string{src_.substr(start, pos_ - start)};
}

std::string Reader::read_text_run()
{
    auto start = pos_;
    // a '<' that cannot start markup ("a < b") stays text
    do {
        advance();
    } while (!eof() && !(peek() == '<' && (is_name_start(peek(1)) || peek(1) == '/' || peek(1) == '!' || peek(1) == '?')));
    return decode_entities(src_.substr(start, pos_ - start));
}

std::string Reader::decode_entities(std::string_view raw) const
{
    std::string out;
    out.reserve(raw.size());
    std::size_t i = 0;
    while (i < raw.size()) {
        if (raw[i] != '&') {
            out.push_back(raw[i++]);
            continue;
        }
        auto semi = raw.find(';', i);
        if (semi == std::string_view::npos || semi - i > 10) {
            out.push_back(raw[i++]);
            continue;
        }
        auto entity = raw.substr(i + 1, semi - i - 1);
        if (entity == "lt") out.push_back('<');
        else if (entity == "gt") out.push_back('>');
        else if (entity == "amp") out.push_back('&');
        else if (entity == "quot") out.push_back('"');
        else if (entity == "apos") out.push_back('\'');
        else if (entity.size() > 1 && entity[0] == '#') {
            unsigned long cp = 0;
            bool ok = true;
            bool hex = entity[1] == 'x' || entity[1] == 'X';
            for (std::size_t k = hex ? 2 : 1; k < entity.size(); ++k) {
                char c = entity[k];
                if (hex && std::isxdigit(static_cast<unsigned char>(c))) {
                    cp = cp * 16 + static_cast<unsigned long>(std::isdigit(static_cast<unsigned char>(c)) ? c - '0' : (std::tolower(c) - 'a' + 10));
                } else if (!hex && std::isdigit(static_cast<unsigned char>(c))) {
                    cp = cp * 10 + static_cast<unsigned long>(c - '0');
                } else {
                    ok = false;
                    break;
                }
            }
            if (!ok || cp > 0x10FFFF) {
                out.append(raw.substr(i, semi - i + 1));
            } else {
                append_utf8(out, cp);
            }
        } else {
            // HTML entities such as &nbsp; pass through untouched
            out.append(raw.substr(i, semi - i + 1));
        }
        i = semi + 1;
    }
    return out;
}

} // namespace quantum::markup
