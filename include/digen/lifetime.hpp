#pragma once

#include <optional>
#include <string_view>

namespace digen {

/// Lifetime of a service, ordered singleton > scoped > transient.
/// `unassigned` marks a type without lifetime marker and without service
/// intent; it never takes part in lifetime checks or registration.
enum class lifetime_kind {
    unassigned,
    singleton,
    scoped,
    transient
};

constexpr std::string_view to_string(lifetime_kind lt) noexcept {
    constexpr std::string_view names[] = {"unassigned", "singleton", "scoped", "transient"};
    return names[static_cast<int>(lt)];
}

/// Marker spelling of a lifetime ("Singleton", "Scoped", "Transient").
constexpr std::string_view marker_name(lifetime_kind lt) noexcept {
    constexpr std::string_view names[] = {"", "Singleton", "Scoped", "Transient"};
    return names[static_cast<int>(lt)];
}

/// Accepts both the marker spelling and the lower-case spelling.
constexpr std::optional<lifetime_kind> parse_lifetime(std::string_view text) noexcept {
    if (text == "singleton" || text == "Singleton") return lifetime_kind::singleton;
    if (text == "scoped" || text == "Scoped") return lifetime_kind::scoped;
    if (text == "transient" || text == "Transient") return lifetime_kind::transient;
    return std::nullopt;
}

/// True when a consumer with lifetime `consumer` would capture `dependency`
/// beyond its intended life.  Only singleton consumers are affected.
constexpr bool captures_shorter_lived(lifetime_kind consumer,
                                      lifetime_kind dependency) noexcept {
    return consumer == lifetime_kind::singleton
        && (dependency == lifetime_kind::scoped
            || dependency == lifetime_kind::transient);
}

} // namespace digen
