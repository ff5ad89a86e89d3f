#pragma once


/*
    ---------------------------------------------
    Stanza::Reader - resumable RFC 8259 tokenizer
    ---------------------------------------------
    A forward-only pull tokenizer over one block of UTF-8 input. Each call
    to `read()` produces the next token of the document:

        {"a": [1, true]}  ->  start_object, property_name(a), start_array,
                              number(1), true_value, end_array, end_object

    The property name token also consumes the following ':'.

    --------------
    Chunked input
    --------------
    The document may arrive in several blocks. All state that has to
    survive between blocks (open containers, expectation, location) lives
    in a `ReaderState` owned by the caller. When the block ends in the
    middle of a token, a non-final reader does not consume it: `read()`
    returns false and `consumed()` reports how many bytes were fully
    tokenized. The caller keeps the unconsumed tail, appends more input and
    constructs a new `Reader` over it with the same state.

    A final reader treats the end of the block as the end of the document
    and reports truncated tokens as errors.

    -----------
    Validation
    -----------
    Strings are checked for control characters, escape syntax, surrogate
    pairing and UTF-8 well-formedness while they are scanned, so
    `get_string()` cannot fail afterwards. Nesting is checked against
    `ReaderOptions::max_depth` for every container, including those the
    caller only skips.
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/error.hpp"

namespace Stanza {

    enum class token_type : uint8_t {
        none,
        start_object,
        end_object,
        start_array,
        end_array,
        property_name,
        string,
        number,
        true_value,
        false_value,
        null,
    };

    /// @brief How `//` and `/* */` comments in the input are treated.
    enum class comment_handling : uint8_t {
        disallow,   ///< Comments are a syntax error.
        skip,       ///< Comments are treated as whitespace.
    };

    struct ReaderOptions {
        comment_handling comments = comment_handling::disallow;
        bool allow_trailing_commas = false;
        std::size_t max_depth = STANZA_DEFAULT_MAX_DEPTH;   ///< 0 disables the limit.
    };

    /// @brief Stack of single bits with 64 inline entries.
    class BitStack {
    public:
        void push(bool v) {
            std::size_t word = m_Size / 64;
            std::uint64_t mask = std::uint64_t{ 1 } << (m_Size % 64);
            if (word > m_Overflow.size()) m_Overflow.push_back(0);
            std::uint64_t& w = word == 0 ? m_Inline : m_Overflow[word - 1];
            if (v) w |= mask;
            else w &= ~mask;
            m_Size++;
        }

        bool pop() noexcept {
            bool v = top();
            m_Size--;
            return v;
        }

        [[nodiscard]] bool top() const noexcept {
            std::size_t i = m_Size - 1;
            std::size_t word = i / 64;
            const std::uint64_t& w = word == 0 ? m_Inline : m_Overflow[word - 1];
            return (w >> (i % 64)) & 1u;
        }

        void set_top(bool v) noexcept {
            std::size_t i = m_Size - 1;
            std::size_t word = i / 64;
            std::uint64_t& w = word == 0 ? m_Inline : m_Overflow[word - 1];
            std::uint64_t mask = std::uint64_t{ 1 } << (i % 64);
            if (v) w |= mask;
            else w &= ~mask;
        }

        [[nodiscard]] std::size_t size() const noexcept { return m_Size; }
        [[nodiscard]] bool empty() const noexcept { return m_Size == 0; }

    private:
        std::uint64_t m_Inline = 0;
        std::vector<std::uint64_t> m_Overflow;
        std::size_t m_Size = 0;
    };

    /// @brief Tokenizer state carried from one block of input to the next.
    struct ReaderState {
        enum class expect : uint8_t {
            value,              ///< Top-level value or the value after a name.
            value_or_end_array, ///< Right after '['.
            value_after_comma,  ///< After ',' inside an array.
            name_or_end_object, ///< Right after '{'.
            name,               ///< After ',' inside an object.
            comma_or_end,       ///< After a complete member or element.
            done,               ///< The top-level value is complete.
        };

        BitStack containers;            ///< true for objects, false for arrays.
        expect next = expect::value;
        std::size_t base_offset = 0;    ///< Absolute offset of the first byte of the current block.
        std::size_t line = 1;
        std::size_t column = 1;
    };

    class Reader {
    public:
        STANZA_API Reader(std::string_view data, bool final_block, ReaderState& state, const ReaderOptions& options = {}) noexcept;

        /// @brief Advances to the next token.
        ///
        /// @return true when a token was produced; false when the block is
        ///         exhausted. For a final block false means the document is
        ///         complete, otherwise more input is needed.
        [[nodiscard]] STANZA_API Result<bool> read();

        [[nodiscard]] token_type token() const noexcept { return m_Token; }

        /// @brief Bytes of the current token: string and name contents without
        ///        the quotes and still escaped, or the literal number text.
        [[nodiscard]] std::string_view raw() const noexcept { return m_Data.substr(m_ValueStart, m_ValueLength); }

        [[nodiscard]] bool has_escapes() const noexcept { return m_Escapes; }

        /// @brief Unescaped contents of the current string or property name.
        [[nodiscard]] STANZA_API std::string get_string() const;

        /// @brief Number of containers currently open.
        [[nodiscard]] std::size_t depth() const noexcept { return m_State.containers.size(); }

        /// @brief Bytes of this block that belong to completed tokens.
        [[nodiscard]] std::size_t consumed() const noexcept { return m_Idx; }

        [[nodiscard]] bool is_final() const noexcept { return m_Final; }

        [[nodiscard]] std::size_t token_offset() const noexcept { return m_State.base_offset + m_TokenStart.idx; }
        [[nodiscard]] std::size_t token_line() const noexcept { return m_TokenStart.line; }
        [[nodiscard]] std::size_t token_column() const noexcept { return m_TokenStart.column; }

        /// @brief A read error located at the start of the current token.
        [[nodiscard]] STANZA_API Error error(Error::code c, std::string_view msg) const;

        /// @brief Reports whether the container that starts at the current
        ///        token is complete within this block, without moving.
        [[nodiscard]] STANZA_API Result<bool> can_skip();

        /// @brief Consumes the rest of the value that starts at the current
        ///        token. The value must be complete (see `can_skip`).
        STANZA_API Result<void> skip();

        /// @brief Un-reads the current token.
        STANZA_API void rewind_last() noexcept;

    private:
        struct Checkpoint {
            std::size_t idx = 0;
            std::size_t line = 1;
            std::size_t column = 1;
            ReaderState::expect next = ReaderState::expect::value;
            std::size_t depth = 0;
            bool top = false;
        };

        enum class scan : uint8_t { complete, incomplete };

        [[nodiscard]] bool eof() const noexcept { return m_Idx >= m_Data.size(); }
        [[nodiscard]] char peek() const noexcept { return eof() ? '\0' : m_Data[m_Idx]; }
        char get() noexcept;

        [[nodiscard]] Checkpoint checkpoint() const noexcept;
        void restore(const Checkpoint& cp) noexcept;

        [[nodiscard]] Error make_error(Error::code c, std::string_view msg) const;
        [[nodiscard]] Error error_at(std::size_t i, Error::code c, std::string_view msg) const;
        [[nodiscard]] Result<scan> need_more(std::size_t i, Error::code c, std::string_view msg) const;

        Result<scan> skip_ws_and_comments();
        Result<scan> scan_value();
        Result<scan> scan_string();
        Result<scan> scan_number();
        Result<scan> scan_literal(std::string_view literal, token_type t, std::string_view fail_msg);
        Result<scan> scan_property_name();
        Result<void> start_container(bool object);
        void end_container();
        void after_value() noexcept;

        std::string_view m_Data;
        bool m_Final;
        ReaderState& m_State;
        ReaderOptions m_Options;

        std::size_t m_Idx = 0;
        token_type m_Token = token_type::none;
        std::size_t m_ValueStart = 0;
        std::size_t m_ValueLength = 0;
        bool m_Escapes = false;
        Checkpoint m_TokenStart;    ///< Location of the current token.
        Checkpoint m_Rewind;        ///< State before the current token, separators included.
    };

    namespace detail {

        /// @brief Checks @p s for well-formed UTF-8 and records the first bad byte.
        STANZA_API bool is_valid_utf8(std::string_view s, std::size_t& error_idx) noexcept;

        /// @brief Decodes a validated JSON string body into @p out.
        STANZA_API void unescape(std::string_view raw, std::string& out);

    } // namespace detail

} // namespace Stanza
