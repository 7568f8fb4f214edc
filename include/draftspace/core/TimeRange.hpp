#pragma once

#include <draftspace/core/Error.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace DS {

/**
 * A (start, duration) placement on a timeline, in microseconds.
 *
 * An absent duration means "use the natural length of the source material";
 * it is recorded as absent and never computed here.
 */
struct TimeRange {
    std::chrono::microseconds                start{0};
    std::optional<std::chrono::microseconds> duration;

    auto operator==(TimeRange const&) const -> bool = default;
};

/**
 * Parse a duration expression such as "1h3m12s", "4.2s" or "1.5m".
 *
 * Grammar: one or more `<digits>[.<digits>]<unit>` tokens with no separator,
 * units `h`, `m`, `s`, most significant first, each at most once. Only the last
 * token may carry a fraction. Fractions below one microsecond are rounded to the
 * nearest microsecond.
 *
 * Fails with Error::Code::InvalidTimeFormat.
 */
auto ParseDuration(std::string_view text) -> Expected<std::chrono::microseconds>;

// Canonical rendering accepted by ParseDuration ("0s" for zero).
auto FormatDuration(std::chrono::microseconds value) -> std::string;

// start defaults to zero when omitted; duration stays absent when omitted.
auto ParseTimeRange(std::optional<std::string_view> start,
                    std::optional<std::string_view> duration) -> Expected<TimeRange>;

} // namespace DS
