#pragma once


/*
    ----------------------------------------------------------------
    Stanza - JSON object mapping for C++ types
    ----------------------------------------------------------------

    This is the main public header for Stanza

    It brings together:
        - Type declarations:            `describe(Stanza::TypeBuilder<T>&)`
        - Configuration:                `Stanza::Options`, `Stanza::ConfigLayer`
        - Error reporting:              `Stanza::Error`, `Stanza::Result<T>`
        - Reading:                      `Stanza::deserialize<T>(...)`,
                                        `Stanza::StreamReader<T>`
        - Writing:                      `Stanza::serialize(...)`,
                                        `Stanza::serialize_as<Runtime>(...)`
        - Custom conversion:            `Stanza::TypedConverter<T>`

    -------------------
    High-Level Overview
    -------------------
    - Mapping:
        * A C++ type is read from and written to JSON directly, without an
          intermediate document tree. Properties, their wire names and the
          converters for their types are resolved once per type and per
          `Options` instance, then reused by every call
    - Configuration:
        * Settings live in layers (global, class, property; each with a
          design-time and a run-time origin) and are merged per setting, so
          a run-time override of one setting keeps every other inherited
          value. See policy.hpp
    - Reading:
        * `Result<T> deserialize<T>(std::string_view, const Options&)`
        * `Result<T> deserialize<T>(std::span<const std::byte>, const Options&)`
        * `Result<T> deserialize<T>(std::istream&, const Options&, std::stop_token = {})`
        * Input may also be pushed chunk by chunk through `StreamReader<T>`
    - Writing:
        * `Result<std::string> serialize(const T&, const Options&)`
        * `Result<std::vector<std::byte>> serialize_to_bytes(const T&, const Options&)`
        * `Result<void> serialize(const T&, std::ostream&, const Options&, std::stop_token = {})`
        * `Result<void> serialize(const T&, const ChunkSink&, const Options&, std::stop_token = {})`
        * Values are written by their static type. `serialize_as<Runtime>`
          writes a base reference as one of its derived types

    -----
    Usage
    -----
        #include <stanza/stanza.hpp>

        struct Person {
            std::string first_name;
            std::string last_name;
            Stanza::DateTime birthday;
        };

        void describe(Stanza::TypeBuilder<Person>& t) {
            t.field<&Person::first_name>("FirstName");
            t.field<&Person::last_name>("LastName");
            t.field<&Person::birthday>("BirthDay");
        }

        int main() {
            Stanza::Options options;
            auto json = Stanza::serialize(Person{ "Jane", "Doe", {} }, options);
            if (!json) {
                std::println("{}", Stanza::to_string(json.error()));
                return 1;
            }
            std::println("{}", *json);
        }

    Include this header for the full API. For finer-grained control or faster
    build times, include the individual headers directly
*/

/// @defgroup Stanza Stanza JSON mapping library
/// @brief Core types and functions for Stanza

/// @defgroup StanzaAPI Top-level reading and writing API
/// @ingroup Stanza
/// @brief Free functions reading and writing whole documents

#include <concepts>
#include <cstddef>
#include <format>
#include <iosfwd>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/converter.hpp"
#include "stanza/date_time.hpp"
#include "stanza/engine.hpp"
#include "stanza/error.hpp"
#include "stanza/log.hpp"
#include "stanza/metadata.hpp"
#include "stanza/options.hpp"
#include "stanza/policy.hpp"
#include "stanza/streaming.hpp"
#include "stanza/type_info.hpp"
#include "stanza/writer.hpp"

namespace Stanza {

    /// @ingroup StanzaAPI
    /// @brief Reads a complete JSON document into a new @p T
    ///
    /// @details
    /// The whole document must be valid JSON and convertible to @p T. Any
    /// failure aborts the call; no partially read value is returned. The
    /// first call freezes @p options.
    ///
    /// @param json The UTF-8 JSON text
    /// @param options Configuration for this call
    ///
    /// @return The value on success, or an `Error` with location and property path
    template<std::default_initializable T>
    Result<T> deserialize(std::string_view json, const Options& options) {
        T value{};
        if (auto r = detail::deserialize_into(json, options, type_of<T>(), &value); !r) return std::unexpected(std::move(r.error()));
        return value;
    }

    /// @ingroup StanzaAPI
    /// @brief Reads a complete JSON document given as raw UTF-8 bytes
    template<std::default_initializable T>
    Result<T> deserialize(std::span<const std::byte> bytes, const Options& options) {
        return deserialize<T>(std::string_view{ reinterpret_cast<const char*>(bytes.data()), bytes.size() }, options);
    }

    /// @ingroup StanzaAPI
    /// @brief Reads a JSON document from a stream through the streaming buffer
    ///
    /// @details
    /// The stream is read in blocks of `Options::buffer_size` bytes until it
    /// ends. @p stop is checked before every block.
    template<std::default_initializable T>
    Result<T> deserialize(std::istream& is, const Options& options, std::stop_token stop = {}) {
        T value{};
        StreamSession session{ options, type_of<T>(), &value, std::move(stop) };
        if (auto r = session.read_from(is); !r) return std::unexpected(std::move(r.error()));
        return value;
    }

    /// @ingroup StanzaAPI
    /// @brief Writes @p value as JSON text
    ///
    /// @details
    /// The value is written by its static type @p T: members a derived type
    /// adds are not written. Use `serialize_as` to name the derived type.
    template<typename T>
    Result<std::string> serialize(const T& value, const Options& options) {
        Writer writer{ options.writer_options() };
        if (auto r = detail::serialize_value(writer, options, type_of<T>(), &value); !r) return std::unexpected(std::move(r.error()));
        return writer.take();
    }

    /// @ingroup StanzaAPI
    /// @brief Writes @p value as UTF-8 bytes
    template<typename T>
    Result<std::vector<std::byte>> serialize_to_bytes(const T& value, const Options& options) {
        auto text = serialize(value, options);
        if (!text) return std::unexpected(std::move(text.error()));
        const auto* first = reinterpret_cast<const std::byte*>(text->data());
        return std::vector<std::byte>(first, first + text->size());
    }

    /// @ingroup StanzaAPI
    /// @brief Writes @p value to @p os in blocks of about `Options::buffer_size` bytes
    template<typename T>
    Result<void> serialize(const T& value, std::ostream& os, const Options& options, std::stop_token stop = {}) {
        return detail::serialize_to_stream(options, type_of<T>(), &value, os, std::move(stop));
    }

    /// @ingroup StanzaAPI
    /// @brief Writes @p value to @p sink in blocks of about `Options::buffer_size` bytes
    template<typename T>
    Result<void> serialize(const T& value, const ChunkSink& sink, const Options& options, std::stop_token stop = {}) {
        return detail::serialize_to_sink(options, type_of<T>(), &value, sink, std::move(stop));
    }

    /// @ingroup StanzaAPI
    /// @brief Writes @p value, referenced through its base @p Static, as a @p Runtime
    ///
    /// @details
    /// Fails with a `write` error when @p value is not a @p Runtime.
    template<typename Runtime, typename Static>
        requires std::derived_from<Runtime, Static>
    Result<std::string> serialize_as(const Static& value, const Options& options) {
        static_assert(std::is_polymorphic_v<Static> || std::is_same_v<Runtime, Static>,
                      "the runtime type of a non-polymorphic value cannot be checked");
        const Runtime* runtime = nullptr;
        if constexpr (std::is_same_v<Runtime, Static>) runtime = &value;
        else runtime = dynamic_cast<const Runtime*>(&value);
        if (!runtime)
            return std::unexpected(Error::make(Error::category::write,
                std::format("Value is not a '{}'", type_of<Runtime>().name)));
        return serialize(*runtime, options);
    }

} // namespace Stanza
