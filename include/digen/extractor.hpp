#pragma once

#include "export.hpp"
#include "declaration.hpp"
#include "descriptor.hpp"

#include <vector>

namespace digen {

class diagnostic_sink;
struct analysis_options;

/// Everything the extractor learned about one declared type.
struct extraction_result {
    type_descriptor type;
    std::vector<dependency_descriptor> dependencies;
};

/// Read the markers of `decl` into descriptors.
///
/// Missing or partial markers are valid.  A malformed marker, argument or
/// type expression is reported as `malformed-marker` and the offending
/// piece is dropped or defaulted; the rest of the type is still extracted.
/// Throws declaration_error when the type itself cannot be identified (no
/// name, unparsable name, inconsistent generic parameter list).
DIGEN_EXPORT extraction_result extract(const type_declaration& decl,
                                       const analysis_options& options,
                                       diagnostic_sink& sink);

} // namespace digen
