#pragma once

/*
    --------------------------------------------
    Stanza::DateTime - calendar timestamp value
    --------------------------------------------
    The wire format is one fixed subset of ISO 8601 / RFC 3339:

        YYYY-MM-DDTHH:MM:SS[.fffffff][Z|+HH:MM|-HH:MM]

    - 1 to 7 fractional digits (100ns resolution)
    - years 0001 through 9999
    - offsets up to +/-14:00

    A timestamp remembers whether it was unspecified, UTC (`Z`) or carried
    an explicit offset, so `2000-01-01T00:00:00` writes back exactly as it
    was read. Trailing zero fractional digits are not written.
*/

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

#include "stanza/config.hpp"

namespace Stanza {

    struct DateTime {
        /// @brief 100 nanosecond ticks.
        using ticks = std::chrono::duration<std::int64_t, std::ratio<1, 10'000'000>>;

        enum class zone : uint8_t {
            unspecified, ///< No designator; wall-clock reading.
            utc,         ///< `Z` designator.
            offset,      ///< Explicit `+HH:MM` / `-HH:MM` offset.
        };

        std::chrono::local_time<ticks> local{};  ///< Wall-clock reading at `offset`.
        zone kind = zone::unspecified;
        std::chrono::minutes offset{ 0 };        ///< Meaningful only for `zone::offset`.

        /// @brief Builds an unspecified-zone timestamp from calendar parts.
        [[nodiscard]] STANZA_API static DateTime from_parts(int year, unsigned month, unsigned day,
                                                            int hour = 0, int minute = 0, int second = 0,
                                                            ticks fraction = ticks{ 0 });

        /// @brief Builds a UTC timestamp from a system clock time point.
        [[nodiscard]] STANZA_API static DateTime from_utc(std::chrono::sys_time<ticks> t);

        /// @brief The instant this value denotes; unspecified readings are taken as UTC.
        [[nodiscard]] STANZA_API std::chrono::sys_time<ticks> to_utc() const noexcept;

        friend bool operator==(const DateTime&, const DateTime&) = default;
    };

    /// @brief Longest text `format_date_time` can produce.
    inline constexpr std::size_t max_date_time_length = 33;

    /// @brief Parses the fixed timestamp format; nullopt when @p text is not in it.
    [[nodiscard]] STANZA_API std::optional<DateTime> parse_date_time(std::string_view text) noexcept;

    /// @brief Formats @p value into @p out, returning the number of bytes written.
    ///
    /// @details
    /// Returns 0 if the value lies outside years 0001-9999 or carries an
    /// offset beyond +/-14:00.
    STANZA_API std::size_t format_date_time(const DateTime& value, char (&out)[max_date_time_length]) noexcept;

} // namespace Stanza
