#pragma once


/*
    -------------------------------
    Stanza per-type metadata cache
    -------------------------------
    `TypeMetadata` is everything the engines need to read and write one
    described type under one `Options` instance: its properties in declared
    order with their wire names, accessors, resolved converters and
    effective policies, plus the class policy and callback hooks.

    Metadata is built on the first request for a type and never changes
    afterwards. Concurrent first requests may build redundantly; only the
    first result is published and every caller receives that one. A build
    failure (duplicate names, a property type without a converter, a
    converter bound to the wrong type) is cached as well and returned
    unchanged on every later request.
*/

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/policy.hpp"
#include "stanza/type_info.hpp"

namespace Stanza {

    class Converter;
    class Options;

    struct PropertyMetadata {
        std::string declared_name;
        std::string name;               ///< Wire name.
        std::string escaped_name;       ///< `name` quoted and escaped, ready to write.
        std::uint64_t key = 0;          ///< Packed match key, see name_matcher.hpp.
        std::string match_bytes;        ///< `name`, ASCII lower-cased when matching ignores case.
        const TypeDescriptor* type = nullptr;
        Accessor accessor;
        const Converter* converter = nullptr;
        EffectivePolicy policy;

        [[nodiscard]] bool read_only() const noexcept { return accessor.get_mut == nullptr; }
    };

    struct TypeMetadata {
        const TypeDescriptor* type = nullptr;
        std::vector<PropertyMetadata> properties;
        const Converter* converter = nullptr;   ///< The type's own converter.
        EffectivePolicy policy;                 ///< Class-level policy.
        Callbacks callbacks;
        bool any_case_insensitive = false;

        /// @brief Finds a property by its declared name.
        [[nodiscard]] STANZA_API const PropertyMetadata* find(std::string_view declared) const noexcept;
    };

    class TypeMetadataCache {
    public:
        explicit TypeMetadataCache(const Options& owner) noexcept : m_Options{ owner } {}

        TypeMetadataCache(const TypeMetadataCache&) = delete;
        TypeMetadataCache& operator=(const TypeMetadataCache&) = delete;

        [[nodiscard]] STANZA_API Result<const TypeMetadata*> get_or_build(const TypeDescriptor& type) const;

        /// @brief Number of builds run so far, published or not.
        [[nodiscard]] std::size_t builds() const noexcept { return m_Builds.load(std::memory_order_relaxed); }

    private:
        using Entry = Result<std::shared_ptr<const TypeMetadata>>;

        Entry build(const TypeDescriptor& type) const;

        const Options& m_Options;
        mutable std::shared_mutex m_Mutex;
        mutable std::unordered_map<std::type_index, Entry> m_Entries;
        mutable std::atomic<std::size_t> m_Builds{ 0 };
    };

} // namespace Stanza
