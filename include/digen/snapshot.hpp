#pragma once

#include "export.hpp"
#include "declaration.hpp"

#include <filesystem>
#include <string_view>

namespace digen {

/// Load a YAML declaration snapshot:
///
///     types:
///       - name: app::Cache
///         kind: class                 # or interface
///         base: "app::Base<T>"
///         interfaces: [app::ICache]
///         markers:
///           - Singleton               # shorthand for {name: Singleton}
///           - {name: DependsOn, types: [app::IDb], args: {naming: snake_case}}
///         fields:
///           - {name: _clock, type: app::IClock, markers: [Inject]}
///
/// Throws snapshot_error on unreadable files or a malformed top-level
/// layout.  A malformed entry under `types` is kept in
/// declaration_set::rejected and the remaining entries are read.
DIGEN_EXPORT declaration_set load_snapshot(const std::filesystem::path& path);

DIGEN_EXPORT declaration_set parse_snapshot(std::string_view yaml_text,
                                            std::string_view source = "<string>");

} // namespace digen
