#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace od {

// An instant with the UTC offset it was written with. `seconds` and `nanos`
// always describe the instant in UTC; `offset_minutes` only affects rendering.
struct Timestamp {
    int64_t seconds = 0;
    int32_t nanos = 0;
    int32_t offset_minutes = 0;

    bool operator==(const Timestamp& o) const noexcept {
        return seconds == o.seconds && nanos == o.nanos && offset_minutes == o.offset_minutes;
    }
    bool operator!=(const Timestamp& o) const noexcept { return !(*this == o); }

    // Calendar year of the wall-clock time (UTC shifted by the offset).
    int64_t year() const noexcept;
};

// Parse "YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)". Fractions longer
// than nine digits are truncated. Returns nullopt on anything malformed or
// out of range.
std::optional<Timestamp> parse_rfc3339(const std::string& text);

// Render with the stored offset ("Z" when zero). The fraction is printed
// with trailing zeros removed, and omitted when zero.
std::string format_rfc3339(const Timestamp& ts);

} // namespace od
