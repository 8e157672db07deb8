#include "digen/log.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <iostream>

namespace logging = boost::log;
namespace expr = boost::log::expressions;

namespace digen::log {

namespace {

boost::shared_ptr<logging::sinks::synchronous_sink<logging::sinks::text_ostream_backend>>
    console_sink;

} // anonymous namespace

void init(level min_level) {
    auto core = logging::core::get();
    if (console_sink) {
        core->remove_sink(console_sink);
    }
    console_sink = logging::add_console_log(
        std::clog,
        logging::keywords::format =
            (expr::stream << "digen ["
                          << expr::attr<logging::trivial::severity_level>("Severity")
                          << "] "
                          << expr::smessage));
    logging::add_common_attributes();
    set_level(min_level);
    DIGEN_LOG_DEBUG << "Logger initialized";
}

void set_level(level min_level) {
    logging::core::get()->set_filter(
        expr::attr<logging::trivial::severity_level>("Severity") >= min_level);
}

std::optional<level> level_from_string(std::string_view text) {
    if (text == "trace") return logging::trivial::trace;
    if (text == "debug") return logging::trivial::debug;
    if (text == "info") return logging::trivial::info;
    if (text == "warning" || text == "warn") return logging::trivial::warning;
    if (text == "error") return logging::trivial::error;
    if (text == "fatal") return logging::trivial::fatal;
    return std::nullopt;
}

} // namespace digen::log
