#pragma once


/*
    ----------------------------
    Stanza property name matching
    ----------------------------
    Incoming property names are matched against `TypeMetadata` without
    allocating. Every property stores a 64-bit key:

        bits  0..47   first six bytes of the name (byte i at bits 8i..8i+7)
        bits 48..63   name length, saturated at 0xFFFF

    Names of up to six bytes match on key equality alone. Longer names are
    confirmed byte by byte against the stored name, which separates names
    sharing their first six bytes and their length.

    Case-insensitive properties store the key of their ASCII lower-cased
    name; the input is folded the same way before comparing.
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "stanza/config.hpp"
#include "stanza/metadata.hpp"

namespace Stanza {

    [[nodiscard]] constexpr char ascii_lower(char c) noexcept {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
    }

    /// @brief Computes the packed key of @p name, optionally ASCII case-folded.
    [[nodiscard]] STANZA_API std::uint64_t pack_name_key(std::string_view name, bool fold) noexcept;

    /// @brief ASCII lower-cased copy of @p name.
    [[nodiscard]] STANZA_API std::string fold_name(std::string_view name);

    /// @brief Finds the property @p name refers to, or nullptr.
    ///
    /// @details
    /// The search starts at @p hint and wraps around; on a match @p hint is
    /// advanced past the matched property, so members arriving in declared
    /// order match on the first comparison.
    [[nodiscard]] STANZA_API const PropertyMetadata* match_property(const TypeMetadata& meta, std::string_view name, std::size_t& hint) noexcept;

} // namespace Stanza
