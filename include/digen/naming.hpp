#pragma once

#include "export.hpp"
#include "descriptor.hpp"

#include <string>
#include <string_view>

namespace digen {

/// Derive an identifier from `raw` (usually a type's simple name).
///
///  - an existing `prefix` at the start of `raw` is removed first, so the
///    function is idempotent on its own output;
///  - a single leading `marker` is stripped when `strip_leading_marker` is
///    set and the following character is uppercase (`IDb` -> `Db`);
///  - the convention is applied and `prefix` prepended.
DIGEN_EXPORT std::string resolve(std::string_view raw, naming_convention convention,
                                 bool strip_leading_marker, std::string_view prefix,
                                 char marker = 'I');

/// Field identifier for a bulk-declared dependency.
inline std::string resolve(std::string_view raw, const naming_options& naming,
                           char marker = 'I') {
    return resolve(raw, naming.convention, naming.strip_leading_marker,
                   naming.prefix, marker);
}

/// English plural of an identifier, keeping a trailing number in place:
/// `_handler` -> `_handlers`, `_policy` -> `_policies`, `_service2` -> `_services2`.
DIGEN_EXPORT std::string pluralize(std::string_view name);

/// Constructor parameter name for an existing field: leading underscores
/// and an `m_` prefix are dropped, the rest is camelCased.
DIGEN_EXPORT std::string parameter_name_from_field(std::string_view field_name);

/// Append `_` to identifiers that are C++ keywords.
DIGEN_EXPORT std::string escape_keyword(std::string identifier);

} // namespace digen
