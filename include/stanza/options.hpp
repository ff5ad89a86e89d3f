#pragma once


/*
    ------------------------------------
    Stanza::Options - engine configuration
    ------------------------------------
    Every (de)serialization call takes an explicit `Options` instance. It
    carries the tokenizer and writer settings, the global, per-type and
    per-property run-time configuration layers, the registered converters,
    and it owns the metadata and converter caches built from all of them.

    -------------
    Life cycle
    -------------
    An instance is mutable until its first use. Any (de)serialization,
    `metadata<T>()` or `converter_for(...)` call freezes it irreversibly;
    from then on every setter fails with a `configuration` error and the
    instance may be shared freely between threads.

        Stanza::Options options{ Stanza::ConfigLayer{ .naming = Stanza::naming_policy::camel_case } };
        options.set_pretty(true);
        options.configure_type<Person>({ .ignore_null_on_write = true });
        options.configure_property<Person>("BirthDay", { .name = "born" });

        auto json = Stanza::serialize(person, options);    // freezes `options`

    The layer passed to the constructor is the global design-time layer;
    `configure_global` sets the global run-time layer, which takes
    precedence over it (see policy.hpp).

    -------------
    Settings
    -------------
    - `buffer_size`        initial streaming buffer and output flush threshold (16 KiB)
    - `max_buffer_size`    cap for a growing streaming buffer, 0 for none
    - `pretty`, `indent`   writer layout
    - `comment_handling`   `disallow` (strict) or `skip`
    - `allow_trailing_commas`
    - `max_depth`          nesting limit for reading and writing, 0 for none (64)
*/

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/policy.hpp"
#include "stanza/reader.hpp"
#include "stanza/type_info.hpp"
#include "stanza/writer.hpp"

namespace Stanza {

    class Converter;
    class ConverterRegistry;
    class EnumerableMaterializer;
    class TypeMetadataCache;
    struct TypeMetadata;

    /// @brief Run-time configuration of one property.
    struct PropertyConfig {
        ConfigLayer layer;
        std::optional<std::string> name;                ///< Wire name; bypasses the naming policy.
        std::shared_ptr<const Converter> converter;     ///< Must convert the property's declared type.
    };

    using ConverterMatcher = std::function<bool(const TypeDescriptor&)>;
    using ConverterFactory = std::function<std::shared_ptr<const Converter>(const TypeDescriptor&)>;

    class Options {
    public:
        STANZA_API Options();

        /// @brief Constructs options with a global design-time layer.
        STANZA_API explicit Options(const ConfigLayer& design_time);

        STANZA_API ~Options();

        Options(const Options&) = delete;
        Options& operator=(const Options&) = delete;

#pragma region Settings
        STANZA_API Result<void> set_buffer_size(std::size_t bytes);
        STANZA_API Result<void> set_max_buffer_size(std::size_t bytes);
        STANZA_API Result<void> set_pretty(bool pretty);
        STANZA_API Result<void> set_indent(std::size_t spaces);
        STANZA_API Result<void> set_comment_handling(comment_handling handling);
        STANZA_API Result<void> set_allow_trailing_commas(bool allow);
        STANZA_API Result<void> set_max_depth(std::size_t depth);

        [[nodiscard]] std::size_t buffer_size() const noexcept { return m_BufferSize; }
        [[nodiscard]] std::size_t max_buffer_size() const noexcept { return m_MaxBufferSize; }
        [[nodiscard]] bool pretty() const noexcept { return m_Pretty; }
        [[nodiscard]] std::size_t indent() const noexcept { return m_Indent; }
        [[nodiscard]] comment_handling comments() const noexcept { return m_Comments; }
        [[nodiscard]] bool allow_trailing_commas() const noexcept { return m_AllowTrailingCommas; }
        [[nodiscard]] std::size_t max_depth() const noexcept { return m_MaxDepth; }

        [[nodiscard]] STANZA_API ReaderOptions reader_options() const noexcept;
        [[nodiscard]] STANZA_API WriterOptions writer_options() const noexcept;
#pragma endregion

#pragma region Layers
        /// @brief Sets the global run-time layer.
        STANZA_API Result<void> configure_global(const ConfigLayer& layer);

        /// @brief Sets the class run-time layer of @p T.
        template<typename T>
        Result<void> configure_type(const ConfigLayer& layer) { return configure_type(type_of<T>(), layer); }

        /// @brief Sets the run-time configuration of the property @p T declares as @p declared.
        template<Describable T>
        Result<void> configure_property(std::string_view declared, PropertyConfig config) {
            return configure_property(type_of<T>(), declared, std::move(config));
        }

        STANZA_API Result<void> configure_type(const TypeDescriptor& type, const ConfigLayer& layer);
        STANZA_API Result<void> configure_property(const TypeDescriptor& type, std::string_view declared, PropertyConfig config);

        [[nodiscard]] const ConfigLayer& global_layer() const noexcept { return m_Global; }
        [[nodiscard]] const ConfigLayer& design_layer() const noexcept { return m_Design; }
        [[nodiscard]] STANZA_API const ConfigLayer* type_layer(const TypeDescriptor& type) const noexcept;
        [[nodiscard]] STANZA_API const PropertyConfig* property_config(const TypeDescriptor& type, std::string_view declared) const noexcept;
#pragma endregion

#pragma region Converters
        /// @brief Registers a converter for exactly its own type, ahead of every built-in.
        STANZA_API Result<void> add_converter(std::shared_ptr<const Converter> converter);

        /// @brief Registers a factory consulted for every type @p matcher accepts.
        STANZA_API Result<void> add_converter(ConverterMatcher matcher, ConverterFactory factory);

        /// @brief Installs the hook that builds enumerable containers from decoded elements.
        STANZA_API Result<void> set_enumerable_materializer(std::shared_ptr<const EnumerableMaterializer> materializer);
#pragma endregion

        [[nodiscard]] bool frozen() const noexcept { return m_Frozen.load(std::memory_order_acquire); }

        /// @brief Freezes the instance. Called by every operation that uses it.
        STANZA_API void freeze() const noexcept;

        /// @brief Metadata of @p T under these options, built on first request.
        template<typename T>
        Result<const TypeMetadata*> metadata() const { return metadata(type_of<T>()); }

        [[nodiscard]] STANZA_API Result<const TypeMetadata*> metadata(const TypeDescriptor& type) const;

        /// @brief The converter selected for values of @p type.
        ///
        /// @details Without @p enum_as_string the enum encoding is resolved
        /// from the class and global layers.
        [[nodiscard]] STANZA_API Result<const Converter*> converter_for(const TypeDescriptor& type, std::optional<bool> enum_as_string = std::nullopt) const;

        [[nodiscard]] const TypeMetadataCache& metadata_cache() const noexcept { return *m_Metadata; }
        [[nodiscard]] const ConverterRegistry& converters() const noexcept { return *m_Converters; }

    private:
        Result<void> check_mutable(std::string_view setting) const;

        std::size_t m_BufferSize = STANZA_DEFAULT_BUFFER_SIZE;
        std::size_t m_MaxBufferSize = 0;
        bool m_Pretty = false;
        std::size_t m_Indent = 2;
        comment_handling m_Comments = comment_handling::disallow;
        bool m_AllowTrailingCommas = false;
        std::size_t m_MaxDepth = STANZA_DEFAULT_MAX_DEPTH;

        ConfigLayer m_Design;
        ConfigLayer m_Global;
        std::unordered_map<std::type_index, ConfigLayer> m_TypeLayers;
        std::unordered_map<std::type_index, std::map<std::string, PropertyConfig, std::less<>>> m_PropertyConfigs;

        std::unique_ptr<ConverterRegistry> m_Converters;
        std::unique_ptr<TypeMetadataCache> m_Metadata;
        mutable std::atomic<bool> m_Frozen{ false };
    };

} // namespace Stanza
