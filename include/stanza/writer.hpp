#pragma once


/*
    -------------------------------------
    Stanza::Writer - forward JSON emitter
    -------------------------------------
    Appends UTF-8 JSON text to an in-memory buffer, one primitive at a time.
    The writer tracks container nesting so separators and pretty-printing
    whitespace are inserted automatically:

        w.start_object();
        w.property("a");  w.number(std::int64_t{ 1 });
        w.property("b");  w.start_array(); w.boolean(true); w.end_array();
        w.end_object();                     // {"a":1,"b":[true]}

    Pretty output puts every member and element on its own line, indented
    by `WriterOptions::indent` spaces per level, with `": "` after names.
    Empty containers are written as `{}` and `[]`.

    ---------
    Flushing
    ---------
    A writer constructed with a `ChunkSink` hands the accumulated text to the
    sink whenever `flush_if_needed()` finds at least `flush_threshold` bytes
    buffered, and on `flush()`. Without a sink the text stays in `buffer()`.
*/

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/reader.hpp"

namespace Stanza {

    /// @brief Receives consecutive pieces of serialized output.
    using ChunkSink = std::function<Result<void>(std::string_view)>;

    struct WriterOptions {
        bool pretty = false;
        std::size_t indent = 2;
        std::size_t max_depth = STANZA_DEFAULT_MAX_DEPTH;   ///< 0 disables the limit.
        std::size_t flush_threshold = STANZA_DEFAULT_BUFFER_SIZE;
    };

    class Writer {
    public:
        explicit Writer(const WriterOptions& options = {}, ChunkSink sink = {}) noexcept
            : m_Options{ options }, m_Sink{ std::move(sink) } {}

        STANZA_API Result<void> start_object();
        STANZA_API Result<void> end_object();
        STANZA_API Result<void> start_array();
        STANZA_API Result<void> end_array();

        /// @brief Writes a property name that is already quoted and escaped.
        STANZA_API void property_name(std::string_view encoded);

        /// @brief Escapes and writes a property name.
        STANZA_API Result<void> property(std::string_view name);

        STANZA_API void null();
        STANZA_API void boolean(bool v);
        STANZA_API void number(std::int64_t v);
        STANZA_API void number(std::uint64_t v);

        /// @brief Writes the shortest text that reads back as @p v. NaN and infinities fail.
        STANZA_API Result<void> number(double v);
        STANZA_API Result<void> number(float v);

        /// @brief Escapes and writes a string value. Invalid UTF-8 fails.
        STANZA_API Result<void> string(std::string_view v);

        /// @brief Number of containers currently open.
        [[nodiscard]] std::size_t depth() const noexcept { return m_HasItems.size(); }

        [[nodiscard]] const std::string& buffer() const noexcept { return m_Buffer; }
        [[nodiscard]] std::string take() noexcept { return std::move(m_Buffer); }

        /// @brief Passes the buffered text to the sink once it reaches the flush threshold.
        STANZA_API Result<void> flush_if_needed();

        /// @brief Passes all buffered text to the sink.
        STANZA_API Result<void> flush();

    private:
        void before_value();
        void indent();
        Result<void> start_container(char open);
        void end_container(char close);

        WriterOptions m_Options;
        ChunkSink m_Sink;
        std::string m_Buffer;
        BitStack m_HasItems;
        bool m_AfterName = false;
    };

    /// @brief Appends @p s to @p out as a quoted JSON string. Returns false on invalid UTF-8.
    [[nodiscard]] STANZA_API bool append_quoted(std::string& out, std::string_view s);

} // namespace Stanza
