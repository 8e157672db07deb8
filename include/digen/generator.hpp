#pragma once

#include "export.hpp"
#include "cycle_detector.hpp"
#include "declaration.hpp"
#include "diagnostic.hpp"
#include "emitter.hpp"
#include "options.hpp"
#include "registration_planner.hpp"

#include <string_view>
#include <vector>

namespace digen {

struct generation_result {
    std::vector<generated_source> sources;      // fragments, then the entry point
    std::vector<diagnostic> diagnostics;
    std::vector<cycle> cycles;
    registration_plan plan;

    bool has_errors() const noexcept { return digen::has_errors(diagnostics); }

    /// nullptr when no file with that name was emitted.
    const generated_source* find_source(std::string_view path) const;
};

// ---------------------------------------------------------------
// generator: one synchronous pass over an immutable snapshot
// ---------------------------------------------------------------
class DIGEN_EXPORT generator {
public:
    explicit generator(analysis_options options = {});

    /// Extract, build the graph, detect cycles, validate lifetimes, plan
    /// registrations and emit code.  Faults are confined to the type that
    /// raised them and come back as diagnostics; run() itself only throws
    /// on allocation failure.
    generation_result run(const declaration_set& declarations) const;

    const analysis_options& options() const noexcept { return options_; }

private:
    analysis_options options_;
};

} // namespace digen
