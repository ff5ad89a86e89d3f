#pragma once


/*
    -----------------------------------
    Stanza streaming input and output
    -----------------------------------
    Documents that arrive in pieces are read through one reusable buffer.
    Each refill appends input behind the bytes the tokenizer has not
    consumed yet, runs the `Deserializer` over the buffered text, and
    compacts away what was consumed. A token cut by a chunk boundary stays
    in the buffer until the rest arrives.

    The buffer starts at `Options::buffer_size` bytes and doubles whenever a
    single token does not fit. With `Options::max_buffer_size` set, a token
    larger than the cap fails with a `token_too_large` read error.

    Push-based reading, e.g. from a socket callback:

        Stanza::StreamReader<Person> reader{ options };
        for (auto chunk : chunks)
            if (auto r = reader.push(chunk); !r) return r.error();
        Stanza::Result<Person> person = reader.finish();

    A `std::stop_token` is checked before every refill and every flush; a
    stop request fails the call with a `cancelled` error.
*/

#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <span>
#include <stop_token>
#include <string_view>
#include <utility>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/engine.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"
#include "stanza/reader.hpp"
#include "stanza/type_info.hpp"
#include "stanza/writer.hpp"

namespace Stanza {

    /// @brief Growable input window with compaction.
    class StreamingBuffer {
    public:
        STANZA_API StreamingBuffer(std::size_t initial, std::size_t cap);

        /// @brief Free space behind the pending bytes, compacting or growing as needed.
        [[nodiscard]] STANZA_API Result<std::span<char>> writable();

        void commit(std::size_t n) noexcept { m_End += n; }
        void consume(std::size_t n) noexcept { m_Begin += n; }

        [[nodiscard]] std::string_view pending() const noexcept { return { m_Data.data() + m_Begin, m_End - m_Begin }; }
        [[nodiscard]] std::size_t capacity() const noexcept { return m_Data.size(); }

    private:
        std::vector<char> m_Data;
        std::size_t m_Begin = 0;
        std::size_t m_End = 0;
        std::size_t m_Cap;
    };

    /// @brief One streamed read of a document into @p root.
    class StreamSession {
    public:
        STANZA_API StreamSession(const Options& options, const TypeDescriptor& type, void* root, std::stop_token stop = {});

        StreamSession(const StreamSession&) = delete;
        StreamSession& operator=(const StreamSession&) = delete;

        /// @brief Buffers @p chunk and reads every token it completes.
        STANZA_API Result<void> push(std::string_view chunk);

        /// @brief Marks the end of input; fails unless the document is complete.
        STANZA_API Result<void> finish();

        /// @brief Reads @p is to its end.
        STANZA_API Result<void> read_from(std::istream& is);

        [[nodiscard]] std::size_t buffer_capacity() const noexcept { return m_Buffer.capacity(); }

    private:
        Result<void> refill_check();
        Result<void> process(bool final_block);
        Error fail(Error e);

        ReaderOptions m_ReaderOptions;
        ReaderState m_State;
        StreamingBuffer m_Buffer;
        Deserializer m_Deserializer;
        std::stop_token m_Stop;
        std::optional<Error> m_Failure;
    };

    /// @brief Push-based reader of one @p T.
    template<typename T>
    class StreamReader {
    public:
        explicit StreamReader(const Options& options, std::stop_token stop = {})
            : m_Session{ options, type_of<T>(), &m_Value, std::move(stop) } {}

        StreamReader(const StreamReader&) = delete;
        StreamReader& operator=(const StreamReader&) = delete;

        Result<void> push(std::string_view chunk) { return m_Session.push(chunk); }

        Result<void> push(std::span<const std::byte> chunk) {
            return m_Session.push({ reinterpret_cast<const char*>(chunk.data()), chunk.size() });
        }

        /// @brief Completes the read and hands out the value.
        Result<T> finish() {
            if (auto r = m_Session.finish(); !r) return std::unexpected(std::move(r.error()));
            return std::move(m_Value);
        }

        [[nodiscard]] std::size_t buffer_capacity() const noexcept { return m_Session.buffer_capacity(); }

    private:
        T m_Value{};
        StreamSession m_Session;
    };

    namespace detail {

        STANZA_API Result<void> serialize_to_sink(const Options& options, const TypeDescriptor& type, const void* src,
                                                  const ChunkSink& sink, std::stop_token stop);

        STANZA_API Result<void> serialize_to_stream(const Options& options, const TypeDescriptor& type, const void* src,
                                                    std::ostream& os, std::stop_token stop);

    } // namespace detail

} // namespace Stanza
