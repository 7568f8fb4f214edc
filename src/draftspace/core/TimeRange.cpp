#include <draftspace/core/TimeRange.hpp>

#include <array>
#include <charconv>
#include <cstdint>
#include <limits>
#include <string>

namespace DS {

namespace {

constexpr std::array<char, 3>          kUnits{'h', 'm', 's'};
constexpr std::array<std::int64_t, 3>  kSecondsPerUnit{3600, 60, 1};
constexpr std::int64_t                 kMicrosPerSecond = 1'000'000;
// Digits past this point change the value by far less than a microsecond.
constexpr std::size_t                  kMaxFractionDigits = 15;

auto is_digit(char ch) -> bool {
    return ch >= '0' && ch <= '9';
}

auto time_error(std::string_view text, std::string_view reason) -> Error {
    std::string message{"invalid duration '"};
    message.append(text);
    message.append("': ");
    message.append(reason);
    return Error{Error::Code::InvalidTimeFormat, std::move(message)};
}

auto unit_index(char ch) -> int {
    for (std::size_t i = 0; i < kUnits.size(); ++i) {
        if (kUnits[i] == ch) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

auto pow10(std::size_t exponent) -> std::uint64_t {
    std::uint64_t value = 1;
    for (std::size_t i = 0; i < exponent; ++i) {
        value *= 10;
    }
    return value;
}

// Microseconds contributed by ".<digits>" of one unit, rounded half up.
auto fraction_micros(std::string_view digits, std::int64_t seconds_per_unit) -> std::int64_t {
    if (digits.size() > kMaxFractionDigits) {
        digits = digits.substr(0, kMaxFractionDigits);
    }
    std::uint64_t numerator = 0;
    std::from_chars(digits.data(), digits.data() + digits.size(), numerator);
    auto const scaled = numerator * static_cast<std::uint64_t>(seconds_per_unit);
    if (digits.size() <= 6) {
        return static_cast<std::int64_t>(scaled * pow10(6 - digits.size()));
    }
    auto const divisor = pow10(digits.size() - 6);
    return static_cast<std::int64_t>((scaled + divisor / 2) / divisor);
}

} // namespace

auto ParseDuration(std::string_view text) -> Expected<std::chrono::microseconds> {
    if (text.empty()) {
        return std::unexpected(time_error(text, "empty"));
    }

    constexpr auto kMax       = std::numeric_limits<std::int64_t>::max();
    std::int64_t   total      = 0;
    int            last_unit  = -1;
    bool           had_fraction = false;
    std::size_t    pos        = 0;

    while (pos < text.size()) {
        if (had_fraction) {
            return std::unexpected(time_error(text, "a fraction is only allowed on the last unit"));
        }

        auto const integer_begin = pos;
        while (pos < text.size() && is_digit(text[pos])) {
            ++pos;
        }
        if (pos == integer_begin) {
            return std::unexpected(time_error(text, "expected a number"));
        }
        std::int64_t integer = 0;
        auto const parsed = std::from_chars(text.data() + integer_begin, text.data() + pos, integer);
        if (parsed.ec != std::errc{}) {
            return std::unexpected(time_error(text, "value out of range"));
        }

        std::string_view fraction;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            auto const fraction_begin = pos;
            while (pos < text.size() && is_digit(text[pos])) {
                ++pos;
            }
            if (pos == fraction_begin) {
                return std::unexpected(time_error(text, "expected digits after '.'"));
            }
            fraction     = text.substr(fraction_begin, pos - fraction_begin);
            had_fraction = true;
        }

        if (pos >= text.size()) {
            return std::unexpected(time_error(text, "missing unit"));
        }
        auto const unit = unit_index(text[pos]);
        if (unit < 0) {
            return std::unexpected(time_error(text, std::string{"unknown unit '"} + text[pos] + "'"));
        }
        if (unit <= last_unit) {
            return std::unexpected(time_error(text, "units must appear once, most significant first"));
        }
        last_unit = unit;
        ++pos;

        auto const seconds_per_unit = kSecondsPerUnit[static_cast<std::size_t>(unit)];
        auto const micros_per_unit  = seconds_per_unit * kMicrosPerSecond;
        if (integer > (kMax - total) / micros_per_unit) {
            return std::unexpected(time_error(text, "value out of range"));
        }
        total += integer * micros_per_unit;

        if (!fraction.empty()) {
            auto const extra = fraction_micros(fraction, seconds_per_unit);
            if (extra > kMax - total) {
                return std::unexpected(time_error(text, "value out of range"));
            }
            total += extra;
        }
    }

    return std::chrono::microseconds{total};
}

auto FormatDuration(std::chrono::microseconds value) -> std::string {
    auto remaining = value.count();
    std::string out;
    if (remaining < 0) {
        // Not produced by ParseDuration; kept readable for diagnostics.
        out.push_back('-');
        remaining = -remaining;
    }

    auto const micros_per_hour   = kSecondsPerUnit[0] * kMicrosPerSecond;
    auto const micros_per_minute = kSecondsPerUnit[1] * kMicrosPerSecond;

    auto const hours = remaining / micros_per_hour;
    remaining %= micros_per_hour;
    auto const minutes = remaining / micros_per_minute;
    remaining %= micros_per_minute;
    auto const seconds  = remaining / kMicrosPerSecond;
    auto const fraction = remaining % kMicrosPerSecond;

    if (hours > 0) {
        out.append(std::to_string(hours));
        out.push_back('h');
    }
    if (minutes > 0) {
        out.append(std::to_string(minutes));
        out.push_back('m');
    }
    if (seconds > 0 || fraction > 0 || (hours == 0 && minutes == 0)) {
        out.append(std::to_string(seconds));
        if (fraction > 0) {
            auto digits = std::to_string(fraction);
            digits.insert(0, 6 - digits.size(), '0');
            while (!digits.empty() && digits.back() == '0') {
                digits.pop_back();
            }
            out.push_back('.');
            out.append(digits);
        }
        out.push_back('s');
    }
    return out;
}

auto ParseTimeRange(std::optional<std::string_view> start,
                    std::optional<std::string_view> duration) -> Expected<TimeRange> {
    TimeRange range;
    if (start) {
        auto parsed = ParseDuration(*start);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        range.start = *parsed;
    }
    if (duration) {
        auto parsed = ParseDuration(*duration);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        range.duration = *parsed;
    }
    return range;
}

} // namespace DS
