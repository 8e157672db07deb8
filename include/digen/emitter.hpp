#pragma once

#include "export.hpp"
#include "descriptor.hpp"

#include <string>

namespace digen {

struct type_node;
struct registration_plan;
struct generation_options;

/// One emitted file.
struct generated_source {
    std::string path;           // file name, relative to the output directory
    std::string content;
    std::string type_key;       // empty for the registration entry point
};

/// `app::Repo<T>` -> `app_Repo_1.digen.inc`
DIGEN_EXPORT std::string fragment_file_name(const type_descriptor& type);

/// Constructor fragment for one type, meant to be included inside the
/// class body.  Inherited parameters come first and are forwarded to the
/// base; own dependencies are assigned in the body; members are declared
/// for bulk-declared dependencies.  Types binding configuration, directly
/// or through a base, take `const <configuration_type>& configuration`
/// last and read each bound field with `configuration.get<T>(key)`.
DIGEN_EXPORT generated_source emit_constructor(const type_node& node,
                                               const generation_options& options);

/// C++ condition for one rule, e.g.
/// `(environment == "Dev" || environment == "Test") && configuration.get("Mode") != "off"`.
DIGEN_EXPORT std::string render_condition(const conditional_rule& rule);

/// `add_<unit>_services` entry point issuing every planned registration.
DIGEN_EXPORT generated_source emit_registrations(const registration_plan& plan,
                                                 const generation_options& options);

} // namespace digen
