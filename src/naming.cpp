#include "digen/naming.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <iterator>
#include <cctype>

namespace digen {

namespace {

bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
char to_lower(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
char to_upper(char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); }

bool is_vowel(char c) {
    c = to_lower(c);
    return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u';
}

bool ends_with(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size()
        && text.substr(text.size() - suffix.size()) == suffix;
}

constexpr std::string_view keywords[] = {
    "alignas", "alignof", "and", "auto", "bool", "break", "case", "catch",
    "char", "class", "concept", "const", "continue", "default", "delete",
    "do", "double", "else", "enum", "explicit", "export", "extern", "false",
    "float", "for", "friend", "goto", "if", "inline", "int", "long",
    "mutable", "namespace", "new", "not", "operator", "or", "private",
    "protected", "public", "register", "requires", "return", "short",
    "signed", "sizeof", "static", "struct", "switch", "template", "this",
    "throw", "true", "try", "typedef", "typename", "union", "unsigned",
    "using", "virtual", "void", "volatile", "while"};

} // anonymous namespace

std::string resolve(std::string_view raw, naming_convention convention,
                    bool strip_leading_marker, std::string_view prefix,
                    char marker) {
    if (!prefix.empty() && internal::starts_with(raw, prefix)) {
        raw.remove_prefix(prefix.size());
    }
    if (strip_leading_marker && raw.size() >= 2 && raw[0] == marker && is_upper(raw[1])) {
        raw.remove_prefix(1);
    }

    std::string body;
    body.reserve(raw.size() + 4);
    switch (convention) {
    case naming_convention::camel_case:
        body = raw;
        if (!body.empty()) body[0] = to_lower(body[0]);
        break;
    case naming_convention::pascal_case:
        body = raw;
        if (!body.empty()) body[0] = to_upper(body[0]);
        break;
    case naming_convention::snake_case:
        for (std::size_t i = 0; i < raw.size(); ++i) {
            char c = raw[i];
            if (is_upper(c)) {
                if (i > 0 && body.back() != '_') body += '_';
                body += to_lower(c);
            } else {
                body += c;
            }
        }
        break;
    }
    return std::string(prefix) + body;
}

std::string pluralize(std::string_view name) {
    std::size_t digits = 0;
    while (digits < name.size()
           && std::isdigit(static_cast<unsigned char>(name[name.size() - 1 - digits])))
        ++digits;
    std::string body(name.substr(0, name.size() - digits));
    std::string_view number = name.substr(name.size() - digits);

    if (body.empty() || !std::isalpha(static_cast<unsigned char>(body.back()))) {
        body += "s";
    } else if (ends_with(body, "y") && body.size() >= 2 && !is_vowel(body[body.size() - 2])) {
        body.back() = 'i';
        body += "es";
    } else if (ends_with(body, "s") || ends_with(body, "x") || ends_with(body, "z")
               || ends_with(body, "ch") || ends_with(body, "sh")) {
        body += "es";
    } else {
        body += "s";
    }
    body += number;
    return body;
}

std::string parameter_name_from_field(std::string_view field_name) {
    while (!field_name.empty() && field_name.front() == '_') field_name.remove_prefix(1);
    if (internal::starts_with(field_name, "m_") && field_name.size() > 2) field_name.remove_prefix(2);
    std::string out(field_name);
    if (!out.empty()) out[0] = to_lower(out[0]);
    return out;
}

std::string escape_keyword(std::string identifier) {
    if (std::find(std::begin(keywords), std::end(keywords), identifier) != std::end(keywords))
        identifier += '_';
    return identifier;
}

} // namespace digen
