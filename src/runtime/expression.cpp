#include <quantum/runtime/expression.hpp>
#include <quantum/core/errors.hpp>
#include <quantum/support/str.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace quantum::runtime {

namespace str = support::str;

using NodePtr = std::shared_ptr<const ExprNode>;

namespace {

bool is_ident_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$'; }
bool is_ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$'; }

// Recursive descent over the raw text, producing an immutable tree.
class ExprCompiler {
public:
    explicit ExprCompiler(const std::string& s) : str_(s), pos_(0) {}

    NodePtr compile()
    {
        skip_ws();
        if (pos_ >= str_.size()) fail("Empty expression");
        auto root = parse_ternary();
        skip_ws();
        if (pos_ < str_.size()) fail(std::string("Unexpected '") + str_[pos_] + "'");
        return root;
    }

private:
    const std::string& str_;
    std::size_t pos_;

    [[noreturn]] void fail(const std::string& message) const
    {
        throw core::EvaluationError(message, str_, pos_);
    }

    void skip_ws() { while (pos_ < str_.size() && std::isspace(static_cast<unsigned char>(str_[pos_]))) ++pos_; }
    bool starts_with(std::string_view t) const { return str_.compare(pos_, t.size(), t) == 0; }

    // Word operators (and, or, not, eq, gt ...) must not be a prefix of an identifier.
    bool starts_with_word(std::string_view word) const
    {
        if (!starts_with(word)) return false;
        auto end = pos_ + word.size();
        return end >= str_.size() || !is_ident_char(str_[end]);
    }

    void expect(char c)
    {
        skip_ws();
        if (pos_ >= str_.size() || str_[pos_] != c) fail(std::string("Expected '") + c + "'");
        ++pos_;
        skip_ws();
    }

    std::shared_ptr<ExprNode> make(ExprNode::Kind kind, std::size_t offset) const
    {
        auto node = std::make_shared<ExprNode>();
        node->kind = kind;
        node->offset = offset;
        return node;
    }

    NodePtr binary(ExprNode::Kind kind, std::string op, NodePtr left, NodePtr right, std::size_t offset) const
    {
        auto node = make(kind, offset);
        node->text = std::move(op);
        node->children = {std::move(left), std::move(right)};
        return node;
    }

    NodePtr parse_ternary()
    {
        auto start = pos_;
        auto cond = parse_or();
        skip_ws();
        if (pos_ < str_.size() && str_[pos_] == '?') {
            ++pos_;
            skip_ws();
            auto then_branch = parse_ternary();
            expect(':');
            auto else_branch = parse_ternary();
            auto node = make(ExprNode::TERNARY, start);
            node->children = {cond, then_branch, else_branch};
            return node;
        }
        return cond;
    }

    NodePtr parse_or()
    {
        auto left = parse_and();
        for (;;) {
            skip_ws();
            auto at = pos_;
            if (starts_with("||")) pos_ += 2;
            else if (starts_with_word("or")) pos_ += 2;
            else break;
            skip_ws();
            left = binary(ExprNode::OR, "||", left, parse_and(), at);
        }
        return left;
    }

    NodePtr parse_and()
    {
        auto left = parse_equality();
        for (;;) {
            skip_ws();
            auto at = pos_;
            if (starts_with("&&")) pos_ += 2;
            else if (starts_with_word("and")) pos_ += 3;
            else break;
            skip_ws();
            left = binary(ExprNode::AND, "&&", left, parse_equality(), at);
        }
        return left;
    }

    NodePtr parse_equality()
    {
        auto left = parse_comparison();
        for (;;) {
            skip_ws();
            auto at = pos_;
            std::string op;
            if (starts_with("==")) { op = "=="; pos_ += 2; }
            else if (starts_with("!=")) { op = "!="; pos_ += 2; }
            else if (starts_with_word("neq")) { op = "!="; pos_ += 3; }
            else if (starts_with_word("eq")) { op = "=="; pos_ += 2; }
            else break;
            skip_ws();
            left = binary(ExprNode::BINARY, op, left, parse_comparison(), at);
        }
        return left;
    }

    NodePtr parse_comparison()
    {
        static const std::vector<std::pair<std::string, std::string>> symbols = {
            {"<=", "<="}, {">=", ">="}, {"<", "<"}, {">", ">"}};
        static const std::vector<std::pair<std::string, std::string>> words = {
            {"gte", ">="}, {"lte", "<="}, {"gt", ">"}, {"lt", "<"}};

        auto left = parse_additive();
        for (;;) {
            skip_ws();
            auto at = pos_;
            std::string op;
            for (const auto& [token, name] : symbols) {
                if (starts_with(token)) { op = name; pos_ += token.size(); break; }
            }
            if (op.empty()) {
                for (const auto& [token, name] : words) {
                    if (starts_with_word(token)) { op = name; pos_ += token.size(); break; }
                }
            }
            if (op.empty()) break;
            skip_ws();
            left = binary(ExprNode::BINARY, op, left, parse_additive(), at);
        }
        return left;
    }

    NodePtr parse_additive()
    {
        auto left = parse_multiplicative();
        for (;;) {
            skip_ws();
            if (pos_ >= str_.size() || (str_[pos_] != '+' && str_[pos_] != '-')) break;
            auto at = pos_;
            std::string op(1, str_[pos_++]);
            skip_ws();
            left = binary(ExprNode::BINARY, op, left, parse_multiplicative(), at);
        }
        return left;
    }

    NodePtr parse_multiplicative()
    {
        auto left = parse_unary();
        for (;;) {
            skip_ws();
            if (pos_ >= str_.size() || (str_[pos_] != '*' && str_[pos_] != '/' && str_[pos_] != '%')) break;
            auto at = pos_;
            std::string op(1, str_[pos_++]);
            skip_ws();
            left = binary(ExprNode::BINARY, op, left, parse_unary(), at);
        }
        return left;
    }

    NodePtr parse_unary()
    {
        skip_ws();
        auto at = pos_;
        std::string op;
        if (starts_with("!") && !starts_with("!=")) { op = "!"; pos_ += 1; }
        else if (starts_with("-")) { op = "-"; pos_ += 1; }
        else if (starts_with_word("not")) { op = "!"; pos_ += 3; }
        if (op.empty()) return parse_postfix();

        skip_ws();
        auto node = make(ExprNode::UNARY, at);
        node->text = op;
        node->children = {parse_unary()};
        return node;
    }

    NodePtr parse_postfix()
    {
        auto node = parse_primary();
        for (;;) {
            skip_ws();
            if (pos_ >= str_.size()) break;
            auto at = pos_;
            if (str_[pos_] == '.') {
                ++pos_;
                skip_ws();
                auto key = read_identifier();
                if (key.empty()) fail("Expected property name after '.'");
                auto member = make(ExprNode::MEMBER, at);
                member->text = key;
                member->children = {node};
                node = member;
            } else if (str_[pos_] == '[') {
                ++pos_;
                skip_ws();
                auto index = parse_ternary();
                expect(']');
                auto access = make(ExprNode::INDEX, at);
                access->children = {node, index};
                node = access;
            } else {
                break;
            }
        }
        return node;
    }

    std::string read_identifier()
    {
        if (pos_ >= str_.size() || !is_ident_start(str_[pos_])) return {};
        auto start = pos_;
        while (pos_ < str_.size() && is_ident_char(str_[pos_])) ++pos_;
        return str_.substr(start, pos_ - start);
    }

    NodePtr parse_primary()
    {
        skip_ws();
        if (pos_ >= str_.size()) fail("Unexpected end of expression");
        auto at = pos_;
        char c = str_[pos_];

        if (c == '(') {
            ++pos_;
            skip_ws();
            auto inner = parse_ternary();
            expect(')');
            return inner;
        }
        if (c == '\'' || c == '"') {
            auto node = make(ExprNode::LITERAL, at);
            node->literal = read_string();
            return node;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && pos_ + 1 < str_.size() && std::isdigit(static_cast<unsigned char>(str_[pos_ + 1])))) {
            auto node = make(ExprNode::LITERAL, at);
            node->literal = read_number();
            return node;
        }
        if (c == '[') return parse_array();
        if (c == '{') return parse_object();

        if (is_ident_start(c)) {
            auto name = read_identifier();
            if (name == "true" || name == "false") {
                auto node = make(ExprNode::LITERAL, at);
                node->literal = name == "true";
                return node;
            }
            if (name == "null" || name == "undefined") {
                return make(ExprNode::LITERAL, at);
            }
            // user.profile.name stays one name; the environment resolves the path
            while (pos_ + 1 < str_.size() && str_[pos_] == '.' && is_ident_start(str_[pos_ + 1])) {
                ++pos_;
                name += "." + read_identifier();
            }
            skip_ws();
            if (pos_ < str_.size() && str_[pos_] == '(') {
                ++pos_;
                auto call = make(ExprNode::CALL, at);
                call->text = name;
                call->children = parse_arguments(')');
                return call;
            }
            auto node = make(ExprNode::NAME, at);
            node->text = name;
            return node;
        }
        fail(std::string("Unexpected '") + c + "'");
    }

    std::vector<NodePtr> parse_arguments(char close)
    {
        std::vector<NodePtr> out;
        skip_ws();
        if (pos_ < str_.size() && str_[pos_] == close) {
            ++pos_;
            return out;
        }
        for (;;) {
            out.push_back(parse_ternary());
            skip_ws();
            if (pos_ < str_.size() && str_[pos_] == ',') {
                ++pos_;
                skip_ws();
                continue;
            }
            expect(close);
            return out;
        }
    }

    NodePtr parse_array()
    {
        auto node = make(ExprNode::ARRAY, pos_);
        ++pos_;
        node->children = parse_arguments(']');
        return node;
    }

    NodePtr parse_object()
    {
        auto node = make(ExprNode::OBJECT, pos_);
        ++pos_;
        skip_ws();
        if (pos_ < str_.size() && str_[pos_] == '}') {
            ++pos_;
            return node;
        }
        for (;;) {
            skip_ws();
            std::string key;
            if (pos_ < str_.size() && (str_[pos_] == '\'' || str_[pos_] == '"')) key = read_string();
            else key = read_identifier();
            if (key.empty()) fail("Expected object key");
            expect(':');
            node->keys.push_back(key);
            node->children.push_back(parse_ternary());
            skip_ws();
            if (pos_ < str_.size() && str_[pos_] == ',') {
                ++pos_;
                continue;
            }
            expect('}');
            return node;
        }
    }

    std::string read_string()
    {
        char quote = str_[pos_++];
        std::string out;
        while (pos_ < str_.size() && str_[pos_] != quote) {
            char c = str_[pos_++];
            if (c == '\\' && pos_ < str_.size()) {
                char e = str_[pos_++];
                switch (e) {
                    case 'n': out += '\n'; break;
                    case 't': out += '\t'; break;
                    case 'r': out += '\r'; break;
                    default: out += e; break;
                }
                continue;
            }
            out += c;
        }
        if (pos_ >= str_.size()) fail("Unterminated string literal");
        ++pos_;
        return out;
    }

    Value read_number()
    {
        auto start = pos_;
        while (pos_ < str_.size() && std::isdigit(static_cast<unsigned char>(str_[pos_]))) ++pos_;
        bool fractional = false;
        if (pos_ + 1 < str_.size() && str_[pos_] == '.' && std::isdigit(static_cast<unsigned char>(str_[pos_ + 1]))) {
            fractional = true;
            ++pos_;
            while (pos_ < str_.size() && std::isdigit(static_cast<unsigned char>(str_[pos_]))) ++pos_;
        }
        if (pos_ < str_.size() && (str_[pos_] == 'e' || str_[pos_] == 'E')) {
            auto save = pos_;
            ++pos_;
            if (pos_ < str_.size() && (str_[pos_] == '+' || str_[pos_] == '-')) ++pos_;
            if (pos_ < str_.size() && std::isdigit(static_cast<unsigned char>(str_[pos_]))) {
                fractional = true;
                while (pos_ < str_.size() && std::isdigit(static_cast<unsigned char>(str_[pos_]))) ++pos_;
            } else {
                pos_ = save;
            }
        }
        auto text = str_.substr(start, pos_ - start);
        if (fractional) return Value(std::stod(text));
        try {
            return Value(static_cast<std::int64_t>(std::stoll(text)));
        } catch (const std::out_of_range&) {
            return Value(std::stod(text));
        }
    }
};

// --- evaluation ---

class Evaluator {
public:
    Evaluator(const std::string& source, ExpressionEnvironment& env) : source_(source), env_(env) {}

    Value eval(const ExprNode& node)
    {
        switch (node.kind) {
            case ExprNode::LITERAL: return node.literal;
            case ExprNode::NAME: {
                auto found = env_.lookup(node.text);
                return found ? *found : Value();
            }
            case ExprNode::MEMBER: {
                auto base = eval(*node.children[0]);
                auto found = member(base, node.text);
                return found ? *found : Value();
            }
            case ExprNode::INDEX: return index(eval(*node.children[0]), eval(*node.children[1]));
            case ExprNode::UNARY: return unary(node);
            case ExprNode::AND: return is_truthy(eval(*node.children[0])) && is_truthy(eval(*node.children[1]));
            case ExprNode::OR: return is_truthy(eval(*node.children[0])) || is_truthy(eval(*node.children[1]));
            case ExprNode::TERNARY:
                return is_truthy(eval(*node.children[0])) ? eval(*node.children[1]) : eval(*node.children[2]);
            case ExprNode::BINARY: return binary(node);
            case ExprNode::CALL: return call(node);
            case ExprNode::ARRAY: {
                Value out = Value::array();
                for (const auto& child : node.children) out.push_back(eval(*child));
                return out;
            }
            case ExprNode::OBJECT: {
                Value out = Value::object();
                for (std::size_t i = 0; i < node.children.size(); ++i) out[node.keys[i]] = eval(*node.children[i]);
                return out;
            }
        }
        return Value();
    }

private:
    const std::string& source_;
    ExpressionEnvironment& env_;

    [[noreturn]] void fail(const ExprNode& node, const std::string& message) const
    {
        throw core::EvaluationError(message, source_, node.offset);
    }

    static Value index(const Value& base, const Value& key)
    {
        if (base.is_object()) {
            auto it = base.find(to_display(key));
            return it != base.end() ? *it : Value();
        }
        if (base.is_array() || base.is_string()) {
            auto n = numeric_value(key);
            if (!n || !n->is_number_integer()) {
                if (key.is_string()) {
                    auto found = member(base, key.get<std::string>());
                    return found ? *found : Value();
                }
                return Value();
            }
            auto i = n->get<std::int64_t>();
            if (base.is_array()) {
                if (i < 0 || static_cast<std::size_t>(i) >= base.size()) return Value();
                return base[static_cast<std::size_t>(i)];
            }
            const auto& s = base.get_ref<const std::string&>();
            if (i < 0 || static_cast<std::size_t>(i) >= s.size()) return Value();
            return std::string(1, s[static_cast<std::size_t>(i)]);
        }
        return Value();
    }

    Value unary(const ExprNode& node)
    {
        auto operand = eval(*node.children[0]);
        if (node.text == "!") return !is_truthy(operand);
        auto n = numeric_value(operand);
        if (!n) fail(node, "Cannot negate " + type_name(operand));
        if (n->is_number_integer()) return integer_arithmetic('-', 0, n->get<std::int64_t>());
        return Value(-n->get<double>());
    }

    Value arithmetic_operand(const ExprNode& node, const Value& v) const
    {
        auto n = numeric_value(v);
        if (!n) fail(node, "Arithmetic on non-numeric " + type_name(v) + " '" + to_display(v) + "'");
        return *n;
    }

    Value binary(const ExprNode& node)
    {
        auto left = eval(*node.children[0]);
        auto right = eval(*node.children[1]);
        const auto& op = node.text;

        if (op == "==") return loosely_equal(left, right);
        if (op == "!=") return !loosely_equal(left, right);
        if (op == "<") return compare(left, right) < 0;
        if (op == "<=") return compare(left, right) <= 0;
        if (op == ">") return compare(left, right) > 0;
        if (op == ">=") return compare(left, right) >= 0;

        if (op == "+") {
            if (left.is_array() && right.is_array()) {
                Value out = left;
                for (const auto& item : right) out.push_back(item);
                return out;
            }
            if (left.is_array() || left.is_object() || right.is_array() || right.is_object()) {
                fail(node, "Cannot add " + type_name(left) + " and " + type_name(right));
            }
            auto a = numeric_value(left);
            auto b = numeric_value(right);
            if (a && b) return arithmetic(node, op, *a, *b);
            return to_display(left) + to_display(right);
        }

        return arithmetic(node, op, arithmetic_operand(node, left), arithmetic_operand(node, right));
    }

    Value arithmetic(const ExprNode& node, const std::string& op, const Value& a, const Value& b) const
    {
        bool integral = a.is_number_integer() && b.is_number_integer();
        if (integral) {
            auto x = a.get<std::int64_t>();
            auto y = b.get<std::int64_t>();
            if (y == 0 && (op == "/" || op == "%")) fail(node, op == "/" ? "Division by zero" : "Modulo by zero");
            return integer_arithmetic(op[0], x, y);
        }
        double x = a.get<double>();
        double y = b.get<double>();
        if (op == "+") return x + y;
        if (op == "-") return x - y;
        if (op == "*") return x * y;
        if (y == 0) fail(node, op == "/" ? "Division by zero" : "Modulo by zero");
        if (op == "%") return std::fmod(x, y);
        return x / y;
    }

    Value call(const ExprNode& node)
    {
        auto lowered = str::to_lower(node.text);

        // isDefined looks at the binding itself, not its value
        if (lowered == "isdefined") {
            if (node.children.size() != 1) fail(node, "isDefined() takes exactly one argument");
            const auto& arg = *node.children[0];
            if (arg.kind == ExprNode::NAME) return env_.lookup(arg.text).has_value();
            auto name = eval(arg);
            return name.is_string() && env_.lookup(name.get<std::string>()).has_value();
        }

        std::vector<Value> args;
        args.reserve(node.children.size());
        for (const auto& child : node.children) args.push_back(eval(*child));

        if (auto builtin = builtins().find(lowered); builtin != builtins().end()) {
            return builtin->second(*this, node, args);
        }
        if (auto result = env_.call_function(node.text, args)) return *result;
        fail(node, "Unknown function '" + node.text + "'");
    }

    using Builtin = std::function<Value(const Evaluator&, const ExprNode&, const std::vector<Value>&)>;

    static const Value& arg(const std::vector<Value>& args, std::size_t i)
    {
        static const Value none;
        return i < args.size() ? args[i] : none;
    }

    double number_arg(const ExprNode& node, const std::vector<Value>& args, std::size_t i) const
    {
        return arithmetic_operand(node, arg(args, i)).get<double>();
    }

    static Value integral_if_whole(double d)
    {
        if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 9e15) return Value(static_cast<std::int64_t>(d));
        return Value(d);
    }

    static Value extreme(const Evaluator& self, const ExprNode& node, const std::vector<Value>& args, bool want_max)
    {
        std::vector<Value> items = args;
        if (args.size() == 1 && args[0].is_array()) items.assign(args[0].begin(), args[0].end());
        if (items.empty()) return Value();
        Value best = self.arithmetic_operand(node, items[0]);
        for (std::size_t i = 1; i < items.size(); ++i) {
            auto candidate = self.arithmetic_operand(node, items[i]);
            int order = compare(candidate, best);
            if (want_max ? order > 0 : order < 0) best = candidate;
        }
        return best;
    }

    static const std::unordered_map<std::string, Builtin>& builtins()
    {
        static const std::unordered_map<std::string, Builtin> table = {
            {"len", [](const Evaluator&, const ExprNode&, const std::vector<Value>& a) -> Value {
                 const auto& v = arg(a, 0);
                 if (v.is_string()) return static_cast<std::int64_t>(v.get_ref<const std::string&>().size());
                 if (v.is_array() || v.is_object()) return static_cast<std::int64_t>(v.size());
                 if (v.is_null()) return static_cast<std::int64_t>(0);
                 return static_cast<std::int64_t>(to_display(v).size());
             }},
            {"upper", [](const Evaluator&, const ExprNode&, const std::vector<Value>& a) -> Value {
                 return str::to_upper(to_display(arg(a, 0)));
             }},
            {"lower", [](const Evaluator&, const ExprNode&, const std::vector<Value>& a) -> Value {
                 return str::to_lower(to_display(arg(a, 0)));
             }},
            {"trim", [](const Evaluator&, const ExprNode&, const std::vector<Value>& a) -> Value {
                 return str::trim(to_display(arg(a, 0)));
             }},
            {"round", [](const Evaluator& self, const ExprNode& n, const std::vector<Value>& a) -> Value {
                 double x = self.number_arg(n, a, 0);
                 if (a.size() < 2) return integral_if_whole(std::round(x));
                 double scale = std::pow(10.0, self.number_arg(n, a, 1));
                 return std::round(x * scale) / scale;
             }},
            {"floor", [](const Evaluator& self, const ExprNode& n, const std::vector<Value>& a) -> Value {
                 return integral_if_whole(std::floor(self.number_arg(n, a, 0)));
             }},
            {"ceil", [](const Evaluator& self, const ExprNode& n, const std::vector<Value>& a) -> Value {
                 return integral_if_whole(std::ceil(self.number_arg(n, a, 0)));
             }},
            {"abs", [](const Evaluator& self, const ExprNode& n, const std::vector<Value>& a) -> Value {
                 auto v = self.arithmetic_operand(n, arg(a, 0));
                 if (v.is_number_integer()) {
                     auto x = v.get<std::int64_t>();
                     return x < 0 ? integer_arithmetic('-', 0, x) : Value(x);
                 }
                 return std::fabs(v.get<double>());
             }},
            {"min", [](const Evaluator& self, const ExprNode& n, const std::vector<Value>& a) -> Value {
                 return extreme(self, n, a, false);
             }},
            {"max", [](const Evaluator& self, const ExprNode& n, const std::vector<Value>& a) -> Value {
                 return extreme(self, n, a, true);
             }},
            {"contains", [](const Evaluator&, const ExprNode&, const std::vector<Value>& a) -> Value {
                 const auto& haystack = arg(a, 0);
                 const auto& needle = arg(a, 1);
                 if (haystack.is_array()) {
                     return std::any_of(haystack.begin(), haystack.end(),
                                        [&](const Value& item) { return loosely_equal(item, needle); });
                 }
                 if (haystack.is_object()) return haystack.contains(to_display(needle));
                 return to_display(haystack).find(to_display(needle)) != std::string::npos;
             }},
            {"join", [](const Evaluator& self, const ExprNode& n, const std::vector<Value>& a) -> Value {
                 const auto& items = arg(a, 0);
                 std::string separator = a.size() > 1 ? to_display(a[1]) : ",";
                 if (items.is_null()) return std::string{};
                 if (!items.is_array()) self.fail(n, "join() expects an array");
                 std::vector<std::string> parts;
                 for (const auto& item : items) parts.push_back(to_display(item));
                 return str::join(parts, separator);
             }},
            {"split", [](const Evaluator&, const ExprNode&, const std::vector<Value>& a) -> Value {
                 auto text = to_display(arg(a, 0));
                 std::string separator = a.size() > 1 ? to_display(a[1]) : ",";
                 Value out = Value::array();
                 if (text.empty()) return out;
                 if (separator.empty()) {
                     for (char c : text) out.push_back(std::string(1, c));
                     return out;
                 }
                 for (auto& part : str::split(text, separator)) out.push_back(part);
                 return out;
             }},
            {"default", [](const Evaluator&, const ExprNode&, const std::vector<Value>& a) -> Value {
                 const auto& v = arg(a, 0);
                 if (v.is_null() || (v.is_string() && v.get_ref<const std::string&>().empty())) return arg(a, 1);
                 return v;
             }},
            {"json", [](const Evaluator&, const ExprNode&, const std::vector<Value>& a) -> Value {
                 return arg(a, 0).dump();
             }},
            {"string", [](const Evaluator&, const ExprNode&, const std::vector<Value>& a) -> Value {
                 return to_display(arg(a, 0));
             }},
            {"number", [](const Evaluator& self, const ExprNode& n, const std::vector<Value>& a) -> Value {
                 return self.arithmetic_operand(n, arg(a, 0));
             }},
            {"keys", [](const Evaluator&, const ExprNode&, const std::vector<Value>& a) -> Value {
                 Value out = Value::array();
                 const auto& v = arg(a, 0);
                 if (v.is_object()) {
                     for (auto it = v.begin(); it != v.end(); ++it) out.push_back(it.key());
                 } else if (v.is_array()) {
                     for (std::size_t i = 0; i < v.size(); ++i) out.push_back(static_cast<std::int64_t>(i));
                 }
                 return out;
             }},
        };
        return table;
    }
};

} // namespace

const std::vector<std::string>& builtin_functions()
{
    static const std::vector<std::string> names = {
        "len", "upper", "lower", "trim", "round", "floor", "ceil", "abs", "min", "max",
        "contains", "join", "split", "default", "json", "string", "number", "keys", "isDefined"};
    return names;
}

CompiledExpression::CompiledExpression(ConstructionKey, std::string source, std::shared_ptr<const ExprNode> root)
    : source_(std::move(source)), root_(std::move(root))
{
}

std::string CompiledExpression::normalize(std::string_view text)
{
    auto trimmed = str::trim(text);
    if (trimmed.size() < 2 || trimmed.front() != '{' || trimmed.back() != '}') return trimmed;

    // Only strip when the first brace closes at the very end: "{a} + {b}" keeps its braces.
    int depth = 0;
    char quote = 0;
    for (std::size_t i = 0; i < trimmed.size(); ++i) {
        char c = trimmed[i];
        if (quote) {
            if (c == '\\') ++i;
            else if (c == quote) quote = 0;
            continue;
        }
        if (c == '\'' || c == '"') quote = c;
        else if (c == '{') ++depth;
        else if (c == '}' && --depth == 0 && i + 1 < trimmed.size()) return trimmed;
    }
    return str::trim(std::string_view(trimmed).substr(1, trimmed.size() - 2));
}

std::shared_ptr<const CompiledExpression> CompiledExpression::compile(std::string_view text)
{
    auto source = normalize(text);
    ExprCompiler compiler(source);
    auto root = compiler.compile();
    return std::make_shared<const CompiledExpression>(ConstructionKey{}, std::move(source), std::move(root));
}

Value CompiledExpression::evaluate(ExpressionEnvironment& env) const
{
    Evaluator evaluator(source_, env);
    return evaluator.eval(*root_);
}

} // namespace quantum::runtime
