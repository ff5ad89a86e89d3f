#include "stanza/streaming.hpp"

#include <algorithm>
#include <cstring>
#include <format>

#include "stanza/log.hpp"


namespace Stanza {

    StreamingBuffer::StreamingBuffer(std::size_t initial, std::size_t cap)
        : m_Data(cap != 0 ? std::min(initial, cap) : initial), m_Cap{ cap } {}

    Result<std::span<char>> StreamingBuffer::writable() {
        if (m_Begin > 0) {
            std::memmove(m_Data.data(), m_Data.data() + m_Begin, m_End - m_Begin);
            m_End -= m_Begin;
            m_Begin = 0;
        }

        if (m_End == m_Data.size()) {
            // A single token fills the whole buffer
            if (m_Cap != 0 && m_Data.size() >= m_Cap)
                return std::unexpected(Error::make(Error::category::read, Error::code::token_too_large, 0, 0, 0,
                    std::format("Token exceeds the maximum buffer size of {} bytes", m_Cap)));
            std::size_t next = std::max<std::size_t>(m_Data.size() * 2, 1);
            if (m_Cap != 0) next = std::min(next, m_Cap);
            STANZA_LOG_TRACE("streaming buffer grows from {} to {} bytes", m_Data.size(), next);
            m_Data.resize(next);
        }
        return std::span<char>{ m_Data.data() + m_End, m_Data.size() - m_End };
    }

    StreamSession::StreamSession(const Options& options, const TypeDescriptor& type, void* root, std::stop_token stop)
        : m_ReaderOptions{ options.reader_options() },
          m_Buffer{ options.buffer_size(), options.max_buffer_size() },
          m_Deserializer{ options, type, root },
          m_Stop{ std::move(stop) } {}

    Error StreamSession::fail(Error e) {
        m_Failure = e;
        return e;
    }

    Result<void> StreamSession::refill_check() {
        if (m_Failure) return std::unexpected(*m_Failure);
        if (m_Stop.stop_requested()) {
            STANZA_LOG_INFO("stream read cancelled after {} bytes", m_State.base_offset);
            return std::unexpected(fail(Error::make(Error::category::cancelled, "Read cancelled")));
        }
        return {};
    }

    Result<void> StreamSession::process(bool final_block) {
        Reader reader{ m_Buffer.pending(), final_block, m_State, m_ReaderOptions };
        auto r = m_Deserializer.run(reader);
        if (!r) return std::unexpected(fail(std::move(r.error())));

        const std::size_t consumed = reader.consumed();
        m_State.base_offset += consumed;
        m_Buffer.consume(consumed);
        return {};
    }

    Result<void> StreamSession::push(std::string_view chunk) {
        while (!chunk.empty()) {
            if (auto c = refill_check(); !c) return c;

            auto space = m_Buffer.writable();
            if (!space) {
                Error e = std::move(space.error());
                e.offset = m_State.base_offset;
                e.line = m_State.line;
                e.column = m_State.column;
                return std::unexpected(fail(std::move(e)));
            }

            const std::size_t n = std::min(space->size(), chunk.size());
            std::memcpy(space->data(), chunk.data(), n);
            m_Buffer.commit(n);
            chunk.remove_prefix(n);

            if (auto r = process(false); !r) return r;
        }
        return {};
    }

    Result<void> StreamSession::finish() {
        if (auto c = refill_check(); !c) return c;
        return process(true);
    }

    Result<void> StreamSession::read_from(std::istream& is) {
        for (;;) {
            if (auto c = refill_check(); !c) return c;

            auto space = m_Buffer.writable();
            if (!space) {
                Error e = std::move(space.error());
                e.offset = m_State.base_offset;
                e.line = m_State.line;
                e.column = m_State.column;
                return std::unexpected(fail(std::move(e)));
            }

            is.read(space->data(), static_cast<std::streamsize>(space->size()));
            m_Buffer.commit(static_cast<std::size_t>(is.gcount()));

            if (is.bad() || (!is && !is.eof()))
                return std::unexpected(fail(Error::make(Error::category::read, "Input stream failed")));
            if (is.eof()) return process(true);
            if (auto r = process(false); !r) return r;
        }
    }

    namespace detail {

        Result<void> serialize_to_sink(const Options& options, const TypeDescriptor& type, const void* src,
                                       const ChunkSink& sink, std::stop_token stop) {
            std::size_t flushed = 0;
            ChunkSink guarded = [&](std::string_view chunk) -> Result<void> {
                if (stop.stop_requested()) {
                    STANZA_LOG_INFO("stream write cancelled after {} bytes", flushed);
                    return std::unexpected(Error::make(Error::category::cancelled, "Write cancelled"));
                }
                flushed += chunk.size();
                return sink(chunk);
            };
            Writer writer{ options.writer_options(), std::move(guarded) };
            return serialize_value(writer, options, type, src);
        }

        Result<void> serialize_to_stream(const Options& options, const TypeDescriptor& type, const void* src,
                                         std::ostream& os, std::stop_token stop) {
            return serialize_to_sink(options, type, src, [&os](std::string_view chunk) -> Result<void> {
                os.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
                if (!os) return std::unexpected(Error::make(Error::category::write, "Output stream failed"));
                return {};
            }, std::move(stop));
        }

    } // namespace detail

} // namespace Stanza
