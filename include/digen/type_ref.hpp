#pragma once

#include "export.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace digen {

/// A parsed type expression such as `app::IRepo<app::User>`.
///
/// Names keep their qualification exactly as written (`::` or `.`
/// separators); equality is structural.  A generic parameter is simply a
/// name without arguments that appears in the owning type's parameter list.
struct DIGEN_EXPORT type_ref {
    std::string name;
    std::vector<type_ref> args;

    type_ref() = default;
    explicit type_ref(std::string n, std::vector<type_ref> a = {});

    /// Parse `text`; throws type_parse_error on malformed input.
    static type_ref parse(std::string_view text);

    /// Canonical spelling: `name<arg, arg>`.
    std::string to_string() const;

    /// Last segment of the qualified name, without arguments.
    std::string simple_name() const;

    std::size_t arity() const noexcept { return args.size(); }

    /// Key identifying the generic definition: name plus arity
    /// (`app::IRepo`1`).  Non-generic types use their bare name.
    std::string definition_key() const;

    /// True when any name in the expression is one of `params`.
    bool mentions(const std::vector<std::string>& params) const;

    bool operator==(const type_ref&) const = default;
};

using substitution_map = std::map<std::string, type_ref>;

/// Pair generic `params` with `args`; throws substitution_error when the
/// counts differ.  `owner` names the generic definition in the message.
DIGEN_EXPORT substitution_map bind_parameters(std::string_view owner,
                                              const std::vector<std::string>& params,
                                              const std::vector<type_ref>& args);

/// Replace every occurrence of a bound parameter.  Throws
/// substitution_error when a bound parameter is itself applied to
/// arguments (`T<int>`), which cannot be expressed.
DIGEN_EXPORT type_ref substitute(const type_ref& type, const substitution_map& bindings);

/// Structural match of `pattern` against `target`.  Names listed in
/// `wildcards` (on either side) match any sub-expression; the first binding
/// of a pattern wildcard is recorded in `bindings` and later occurrences
/// must agree with it.
DIGEN_EXPORT bool unify(const type_ref& pattern, const type_ref& target,
                        const std::vector<std::string>& wildcards,
                        substitution_map& bindings);

} // namespace digen
