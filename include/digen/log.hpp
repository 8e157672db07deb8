#pragma once

#include "export.hpp"

#include <boost/log/trivial.hpp>

#include <optional>
#include <string_view>

namespace digen::log {

using level = boost::log::trivial::severity_level;

/// Install a console sink on stderr and filter records below `min_level`.
/// Safe to call more than once; the last call wins.
///
/// The library never installs a filter of its own.  Until init() or
/// set_level() is called, Boost.Log's default core applies and every
/// record digen emits, trace and debug included, reaches the console.
/// Embedding callers that configure Boost.Log themselves need neither.
DIGEN_EXPORT void init(level min_level = boost::log::trivial::warning);

DIGEN_EXPORT void set_level(level min_level);

/// "trace", "debug", "info", "warning" (or "warn"), "error", "fatal".
DIGEN_EXPORT std::optional<level> level_from_string(std::string_view text);

} // namespace digen::log

#define DIGEN_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define DIGEN_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define DIGEN_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define DIGEN_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define DIGEN_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define DIGEN_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
