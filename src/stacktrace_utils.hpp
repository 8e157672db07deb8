#pragma once

// Formatting of the traces digen_error captures, for the detail field of
// generic-substitution-failed and internal-error diagnostics.

#include "digen/exceptions.hpp"

#include <any>
#include <string>
#include <sstream>
#include <string_view>

#ifdef DIGEN_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace digen::internal {

/// Render a trace returned by capture_stacktrace().  Empty when the build
/// has no DIGEN_HAS_STACKTRACE or nothing was captured.
inline std::string format_stacktrace(const std::any& st) {
#ifdef DIGEN_HAS_STACKTRACE
    if (const auto* trace = std::any_cast<boost::stacktrace::stacktrace>(&st)) {
        if (trace->size() > 0) {
            std::ostringstream oss;
            oss << *trace;
            return oss.str();
        }
    }
#else
    (void)st;
#endif
    return {};
}

/// Format the fault raised while processing `subject` for the detail field
/// of an internal-error diagnostic.  Returns an empty string when the error
/// carries neither detail nor a stack.
inline std::string format_fault_detail(std::string_view subject,
                                       const digen_error& error) {
    std::string detail = error.diagnostic_detail();
    std::string trace = format_stacktrace(error.stacktrace());
    if (!trace.empty()) {
        if (!detail.empty()) detail += "\n";
        detail += "Fault stacktrace for " + std::string(subject) + ":\n" + trace;
    }
    return detail;
}

} // namespace digen::internal
