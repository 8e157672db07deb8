#include "digen/type_ref.hpp"
#include "digen/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace digen {

namespace {

// ------------------------------------------------------------------
// Recursive-descent parser over one type expression
// ------------------------------------------------------------------
class type_parser {
public:
    static constexpr std::size_t max_nesting = 256;

    explicit type_parser(std::string_view text) : text_(text) {}

    type_ref parse_all() {
        skip_ws();
        if (at_end()) fail("empty type expression");
        type_ref result = parse_type();
        skip_ws();
        if (!at_end()) fail("unexpected trailing characters");
        return result;
    }

private:
    std::string_view text_;
    std::size_t pos_ = 0;
    std::size_t depth_ = 0;

    bool at_end() const noexcept { return pos_ >= text_.size(); }
    char peek() const noexcept { return at_end() ? '\0' : text_[pos_]; }

    [[noreturn]] void fail(std::string_view reason) const {
        throw type_parse_error(text_, pos_, reason);
    }

    void skip_ws() {
        while (!at_end() && std::isspace(static_cast<unsigned char>(text_[pos_])))
            ++pos_;
    }

    static bool ident_start(char c) {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
    }
    static bool ident_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    std::string parse_identifier() {
        if (!ident_start(peek())) fail("expected identifier");
        std::size_t start = pos_;
        while (!at_end() && ident_char(text_[pos_])) ++pos_;
        return std::string(text_.substr(start, pos_ - start));
    }

    std::string parse_qualified_name() {
        std::string name;
        if (text_.substr(pos_, 2) == "::") {
            name += "::";
            pos_ += 2;
        }
        name += parse_identifier();
        for (;;) {
            if (text_.substr(pos_, 2) == "::") {
                pos_ += 2;
                name += "::";
            } else if (peek() == '.') {
                ++pos_;
                name += '.';
            } else {
                break;
            }
            name += parse_identifier();
        }
        return name;
    }

    type_ref parse_type() {
        type_ref result(parse_qualified_name());
        skip_ws();
        if (peek() != '<') return result;
        if (++depth_ > max_nesting) fail("type expression nested too deeply");
        ++pos_;
        for (;;) {
            skip_ws();
            result.args.push_back(parse_type());
            skip_ws();
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            if (peek() == '>') {
                ++pos_;
                break;
            }
            fail(at_end() ? "unterminated argument list" : "expected ',' or '>'");
        }
        --depth_;
        return result;
    }
};

bool is_wildcard(const type_ref& t, const std::vector<std::string>& wildcards) {
    return t.args.empty()
        && std::find(wildcards.begin(), wildcards.end(), t.name) != wildcards.end();
}

} // anonymous namespace

type_ref::type_ref(std::string n, std::vector<type_ref> a)
    : name(std::move(n))
    , args(std::move(a))
{}

type_ref type_ref::parse(std::string_view text) {
    return type_parser(text).parse_all();
}

std::string type_ref::to_string() const {
    if (args.empty()) return name;
    std::string out = name + "<";
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) out += ", ";
        out += args[i].to_string();
    }
    out += ">";
    return out;
}

std::string type_ref::simple_name() const {
    auto colon = name.rfind("::");
    auto dot = name.rfind('.');
    std::size_t start = 0;
    if (colon != std::string::npos) start = colon + 2;
    if (dot != std::string::npos && dot + 1 > start) start = dot + 1;
    return name.substr(start);
}

std::string type_ref::definition_key() const {
    if (args.empty()) return name;
    return name + "`" + std::to_string(args.size());
}

bool type_ref::mentions(const std::vector<std::string>& params) const {
    if (std::find(params.begin(), params.end(), name) != params.end())
        return true;
    return std::any_of(args.begin(), args.end(),
                       [&](const type_ref& a) { return a.mentions(params); });
}

substitution_map bind_parameters(std::string_view owner,
                                 const std::vector<std::string>& params,
                                 const std::vector<type_ref>& args) {
    if (params.size() != args.size()) {
        throw substitution_error(owner,
            "expects " + std::to_string(params.size())
            + " type argument(s), got " + std::to_string(args.size()));
    }
    substitution_map bindings;
    for (std::size_t i = 0; i < params.size(); ++i) {
        bindings.emplace(params[i], args[i]);
    }
    return bindings;
}

type_ref substitute(const type_ref& type, const substitution_map& bindings) {
    auto it = bindings.find(type.name);
    if (it != bindings.end()) {
        if (!type.args.empty()) {
            throw substitution_error(type.to_string(),
                "generic parameter '" + type.name + "' cannot take type arguments");
        }
        return it->second;
    }
    type_ref result(type.name);
    result.args.reserve(type.args.size());
    for (auto& arg : type.args) {
        result.args.push_back(substitute(arg, bindings));
    }
    return result;
}

bool unify(const type_ref& pattern, const type_ref& target,
           const std::vector<std::string>& wildcards,
           substitution_map& bindings) {
    if (is_wildcard(pattern, wildcards)) {
        auto it = bindings.find(pattern.name);
        if (it == bindings.end()) {
            bindings.emplace(pattern.name, target);
            return true;
        }
        return it->second == target || is_wildcard(target, wildcards);
    }
    if (is_wildcard(target, wildcards)) return true;
    if (pattern.name != target.name || pattern.args.size() != target.args.size())
        return false;
    for (std::size_t i = 0; i < pattern.args.size(); ++i) {
        if (!unify(pattern.args[i], target.args[i], wildcards, bindings))
            return false;
    }
    return true;
}

} // namespace digen
