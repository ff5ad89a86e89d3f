#pragma once


/*
    ---------------------------------------------------
    Stanza layered configuration and policy resolution
    ---------------------------------------------------
    Configuration reaches a property from six places:

                         run-time            design-time
        property    configure_property   describe(): field(...).xxx()
        class       configure_type       describe(): t.options()
        global      Options::global()    Options(ConfigLayer)

    Each place is a `ConfigLayer` whose fields are individually nullable.
    `resolve(...)` walks the six layers in the fixed order

        property run-time -> property design-time ->
        class run-time    -> class design-time    ->
        global run-time   -> global design-time   -> built-in default

    separately for every field, so a layer that sets one option and leaves
    the others empty only overrides that one option.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "stanza/config.hpp"

namespace Stanza {

    /// @brief Transformation applied to declared names without an explicit override.
    enum class naming_policy : uint8_t {
        none,       ///< Use the declared name verbatim.
        camel_case, ///< Lower-case the leading upper-case run: `FirstName` -> `firstName`.
    };

    /// @brief One layer of nullable named options. An empty field means "inherit".
    struct ConfigLayer {
        std::optional<bool> case_insensitive;     ///< Match property names ignoring ASCII case.
        std::optional<bool> ignore_null_on_read;  ///< Leave the property untouched when the input is null.
        std::optional<bool> ignore_null_on_write; ///< Omit the property when its value is null.
        std::optional<bool> enum_as_string;       ///< Encode enums by member name instead of value.
        std::optional<naming_policy> naming;      ///< Naming policy for declared names.

        friend bool operator==(const ConfigLayer&, const ConfigLayer&) = default;
    };

    /// @brief Fully resolved options for one property (or one class).
    struct EffectivePolicy {
        bool case_insensitive = false;
        bool ignore_null_on_read = false;
        bool ignore_null_on_write = false;
        bool enum_as_string = false;
        naming_policy naming = naming_policy::none;

        friend bool operator==(const EffectivePolicy&, const EffectivePolicy&) = default;
    };

    /// @brief The run-time and design-time layer of a single scope; either may be null.
    struct LayerPair {
        const ConfigLayer* run_time = nullptr;
        const ConfigLayer* design_time = nullptr;
    };

    /// @brief Resolves the effective policy field by field.
    ///
    /// @details
    /// Pure and deterministic: the result depends only on the six layer
    /// snapshots. Null pointers are treated as fully empty layers.
    [[nodiscard]] STANZA_API EffectivePolicy resolve(const LayerPair& property, const LayerPair& cls, const LayerPair& global) noexcept;

    /// @brief Applies @p policy to a declared name.
    [[nodiscard]] STANZA_API std::string apply_naming(naming_policy policy, std::string_view declared);

} // namespace Stanza
