#pragma once

#include "export.hpp"

#include <any>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <source_location>

namespace digen {

namespace internal {
/// Capture the current call stack into a std::any.
/// Returns an empty std::any when stacktrace support is disabled.
/// Implemented in stacktrace_capture.cpp.
DIGEN_EXPORT std::any capture_stacktrace();
} // namespace internal

class DIGEN_EXPORT digen_error : public std::runtime_error {
public:
    explicit digen_error(const std::string& message,
                         std::source_location loc = std::source_location::current());

    const std::source_location& location() const noexcept { return location_; }

    /// Set extended diagnostic detail (e.g. the offending YAML node).
    void set_diagnostic_detail(std::string detail);

    /// Get extended diagnostic detail (empty if none).
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// Stack captured when the error was raised (empty without
    /// DIGEN_HAS_STACKTRACE).
    const std::any& stacktrace() const noexcept { return stacktrace_; }

    /// Return what() plus diagnostic detail and the captured stack (if
    /// present), separated by newlines.
    DIGEN_EXPORT std::string full_diagnostic() const;

    /// Append analysis context to this exception.  Each enclosing stage
    /// appends what it was working on, so the final what() reads e.g.
    ///   "... (while processing frame app::Base<T> -> app::Derived)"
    void append_context(const std::string& info);

    /// Override to append context (if any) to the base message.
    const char* what() const noexcept override;

private:
    std::source_location location_;
    std::string diagnostic_detail_;
    std::string context_;
    std::any stacktrace_;
    mutable std::string cached_what_;

    static std::string format_message(const std::string& msg,
                                      const std::source_location& loc);
};

/// Structurally malformed declaration input (missing name, bad kind, ...).
class DIGEN_EXPORT declaration_error : public digen_error {
public:
    declaration_error(std::string_view type_name, std::string_view reason,
                      std::source_location loc = std::source_location::current());

    const std::string& type_name() const noexcept { return type_name_; }

private:
    std::string type_name_;
};

class DIGEN_EXPORT type_parse_error : public digen_error {
public:
    type_parse_error(std::string_view text, std::size_t position,
                     std::string_view reason,
                     std::source_location loc = std::source_location::current());

    const std::string& text() const noexcept { return text_; }
    std::size_t position() const noexcept { return position_; }

private:
    std::string text_;
    std::size_t position_;
};

/// Generic parameter substitution could not be carried out.
class DIGEN_EXPORT substitution_error : public digen_error {
public:
    substitution_error(std::string_view type_name, std::string_view reason,
                       std::source_location loc = std::source_location::current());

    const std::string& type_name() const noexcept { return type_name_; }

private:
    std::string type_name_;
};

class DIGEN_EXPORT config_error : public digen_error {
public:
    config_error(std::string_view key, std::string_view reason,
                 std::source_location loc = std::source_location::current());

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

class DIGEN_EXPORT snapshot_error : public digen_error {
public:
    snapshot_error(std::string_view source, std::string_view reason,
                   std::source_location loc = std::source_location::current());

    const std::string& source() const noexcept { return source_; }

private:
    std::string source_;
};

} // namespace digen
