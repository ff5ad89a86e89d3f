#pragma once


/*
    ------------------------------------------------
    Stanza::Error - Structured failure reporting
    ------------------------------------------------
    `Stanza::Error` describes every failure the library can report, from a
    malformed token deep inside a document to an attempt at reconfiguring
    an options instance that is already in use.

    ------
    Fields
    ------
    - `category kind`:
        * The taxonomy bucket of the failure:
            - `configuration`     mutating frozen options, conflicting
                                  declarations (duplicate names, converter
                                  bound to the wrong type)
            - `unsupported_type`  no converter resolvable for a type shape
            - `read`              malformed or type-mismatched input
            - `depth_exceeded`    nesting deeper than `max_depth`; fatal
            - `write`             value cannot be represented on the wire
            - `callback`          produced by user callback code
            - `cancelled`         a streaming call observed a stop request
    - `code errc`:
        * Detail for `read` failures (syntax category or `invalid_value` for
          a well-formed token the target type cannot hold)
    - `size_t offset`, `size_t line`, `size_t column`:
        * Location of the failing token. Offsets are absolute from the
          start of the document even when it arrived in chunks
    - `std::string path`:
        * Property path in the object graph, e.g. `$.Children[2].Name`
    - `std::string msg`:
        * Human-readable description; not stable for programmatic use

    -----
    Usage
    -----
    - Every fallible operation returns `Stanza::Result<T>`, an alias for
      `std::expected<T, Error>`
    - A failure aborts the whole call. Callers never observe a partially
      populated object
*/

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "stanza/config.hpp"


/// @defgroup StanzaError Errors
/// @ingroup Stanza
/// @brief Error taxonomy shared by the tokenizer, the engines and the options
namespace Stanza {

    /// @ingroup StanzaError
    /// @brief Structured error information produced by any Stanza operation.
    ///
    /// @details
    /// Errors are plain values. Read failures carry the location of the
    /// offending token; both read and write failures carry the property
    /// path that was being processed when the failure happened.
    struct Error {
        /// @ingroup StanzaError
        /// @brief Taxonomy of failures.
        enum class category : uint8_t {
            configuration,      ///< Frozen options mutated or irreconcilable declarations.
            unsupported_type,   ///< No converter resolvable for a type.
            read,               ///< Malformed or type-mismatched input.
            depth_exceeded,     ///< Maximum nesting depth exceeded.
            write,              ///< Value cannot be written.
            callback,           ///< Raised by a user-supplied callback.
            cancelled,          ///< A stop request was observed at an I/O boundary.
        };

        /// @ingroup StanzaError
        /// @brief Detail codes for read failures.
        ///
        /// @details
        /// The syntax codes mirror the violations of RFC 8259 the tokenizer
        /// detects; `invalid_value` is used by converters for well-formed
        /// tokens that do not fit the target (wrong token kind, out of range
        /// integer, unknown enum name, malformed timestamp).
        enum class code : uint8_t {
            none,                   ///< No detail.
            unexpected_character,   ///< Invalid or unexpected character.
            invalid_number,         ///< Malformed numeric literal.
            invalid_string,         ///< Malformed string literal.
            invalid_escape,         ///< Invalid escape sequence.
            invalid_unicode_escape, ///< Invalid or malformed Unicode escape.
            unexpected_end_of_input,///< Input ended prematurely.
            trailing_characters,    ///< Extra characters after valid JSON.
            invalid_value,          ///< Token does not convert to the target type.
            token_too_large,        ///< A single token exceeds the buffer cap.
        };

        category kind{};        ///< Failure taxonomy.
        code errc{};            ///< Detail for read failures.
        std::size_t offset{};   ///< Byte offset from the beginning of the document.
        std::size_t line{};     ///< Line number (1-based), 0 when unknown.
        std::size_t column{};   ///< Column number (1-based), 0 when unknown.
        std::string path{};     ///< Property path, empty when not applicable.
        std::string msg{};      ///< Human-readable diagnostic message.

        /// @brief Constructs a located error, used by the tokenizer and the read engine.
        STANZA_API static Error make(category k, code c, size_t o, size_t l, size_t col, std::string_view m);

        /// @brief Constructs an error without location information.
        STANZA_API static Error make(category k, std::string_view m);

        /// @brief Convenience for user callbacks reporting a failure.
        STANZA_API static Error callback_failed(std::string_view m);

        [[nodiscard]] bool is(category k) const noexcept { return kind == k; }
    };

    /// @ingroup StanzaError
    /// @brief Result of a fallible operation.
    template<typename T>
    using Result = std::expected<T, Error>;

    /// @ingroup StanzaError
    /// @brief Returns a stable name for an error category, e.g. `"ReadError"`.
    [[nodiscard]] STANZA_API std::string_view to_string(Error::category k) noexcept;

    /// @ingroup StanzaError
    /// @brief Renders a one-line diagnostic including location and path.
    [[nodiscard]] STANZA_API std::string to_string(const Error& e);

} // namespace Stanza
