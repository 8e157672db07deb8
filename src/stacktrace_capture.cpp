#include "digen/exceptions.hpp"

#include <any>
#include <cstddef>

#ifdef DIGEN_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace digen::internal {

#ifdef DIGEN_HAS_STACKTRACE
namespace {

// Frames of this function and of digen_error's constructor.
constexpr std::size_t skipped_frames = 2;
// Enough to reach the analysis pass that raised the fault.
constexpr std::size_t max_frames = 48;

} // anonymous namespace
#endif

std::any capture_stacktrace() {
#ifdef DIGEN_HAS_STACKTRACE
    return std::any(boost::stacktrace::stacktrace(skipped_frames, max_frames));
#else
    return {};
#endif
}

} // namespace digen::internal
