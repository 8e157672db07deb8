#include "digen/exceptions.hpp"
#include "stacktrace_utils.hpp"

#include <string>
#include <utility>

namespace digen {

std::string digen_error::format_message(const std::string& msg,
                                        const std::source_location& loc) {
    return msg + " [at " + loc.file_name() + ":"
           + std::to_string(loc.line()) + "]";
}

digen_error::digen_error(const std::string& message, std::source_location loc)
    : std::runtime_error(format_message(message, loc))
    , location_(loc)
    , stacktrace_(internal::capture_stacktrace())
{}

void digen_error::set_diagnostic_detail(std::string detail) {
    diagnostic_detail_ = std::move(detail);
}

void digen_error::append_context(const std::string& info) {
    if (!context_.empty()) {
        context_ += " -> ";
    }
    context_ += info;
    cached_what_.clear();
}

const char* digen_error::what() const noexcept {
    if (context_.empty()) {
        return std::runtime_error::what();
    }
    if (cached_what_.empty()) {
        try {
            cached_what_ = std::string(std::runtime_error::what())
                           + " (while processing " + context_ + ")";
        } catch (const std::bad_alloc&) {
            return std::runtime_error::what();
        }
    }
    return cached_what_.c_str();
}

std::string digen_error::full_diagnostic() const {
    std::string out = what();
    if (!diagnostic_detail_.empty()) {
        out += "\n" + diagnostic_detail_;
    }
    std::string trace = internal::format_stacktrace(stacktrace_);
    if (!trace.empty()) {
        out += "\nStacktrace:\n" + trace;
    }
    return out;
}

declaration_error::declaration_error(std::string_view type_name,
                                     std::string_view reason,
                                     std::source_location loc)
    : digen_error("Malformed declaration"
                  + (type_name.empty() ? std::string{}
                                       : " '" + std::string(type_name) + "'")
                  + ": " + std::string(reason), loc)
    , type_name_(type_name)
{}

type_parse_error::type_parse_error(std::string_view text, std::size_t position,
                                   std::string_view reason,
                                   std::source_location loc)
    : digen_error("Cannot parse type expression \"" + std::string(text)
                  + "\" at offset " + std::to_string(position) + ": "
                  + std::string(reason), loc)
    , text_(text)
    , position_(position)
{}

substitution_error::substitution_error(std::string_view type_name,
                                       std::string_view reason,
                                       std::source_location loc)
    : digen_error("Generic substitution failed for " + std::string(type_name)
                  + ": " + std::string(reason), loc)
    , type_name_(type_name)
{}

config_error::config_error(std::string_view key, std::string_view reason,
                           std::source_location loc)
    : digen_error("Invalid configuration"
                  + (key.empty() ? std::string{}
                                 : " at '" + std::string(key) + "'")
                  + ": " + std::string(reason), loc)
    , key_(key)
{}

snapshot_error::snapshot_error(std::string_view source, std::string_view reason,
                               std::source_location loc)
    : digen_error("Invalid declaration snapshot"
                  + (source.empty() ? std::string{}
                                    : " '" + std::string(source) + "'")
                  + ": " + std::string(reason), loc)
    , source_(source)
{}

} // namespace digen
