#pragma once


/*
    ----------------------------------
    Stanza serialization engines
    ----------------------------------
    Reading is an explicit-stack state machine. A `Deserializer` is fed
    tokens by a `Reader` and keeps one `ReadFrame` per open object or
    collection, so nesting never deepens the native call stack and a
    document can be read across any number of input blocks: when a block
    runs out, `run` returns and the frames wait for the next block.

    Per call:

        start -> running (object frames: on_deserializing, members, on_deserialized)
              -> done
              -> failed     terminal; every later `run` returns the same error

    Writing is recursive through the converters; the writer enforces the
    depth limit so recursion is bounded by `max_depth`.

    Both directions report failures with the property path that was being
    processed, e.g. `$.Children[2].Name`.
*/

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/converter.hpp"
#include "stanza/error.hpp"
#include "stanza/metadata.hpp"
#include "stanza/options.hpp"
#include "stanza/reader.hpp"
#include "stanza/type_info.hpp"
#include "stanza/writer.hpp"

namespace Stanza {

    namespace detail {

        /// @brief Stack keeping its first N entries inline.
        template<typename T, std::size_t N>
        class InlineStack {
        public:
            T& push() {
                if (m_Size < N) return m_Inline[m_Size++];
                m_Size++;
                return m_Overflow.emplace_back();
            }

            void pop() {
                if (m_Size > N) m_Overflow.pop_back();
                else m_Inline[m_Size - 1] = T{};
                m_Size--;
            }

            [[nodiscard]] T& operator[](std::size_t i) noexcept { return i < N ? m_Inline[i] : m_Overflow[i - N]; }
            [[nodiscard]] const T& operator[](std::size_t i) const noexcept { return i < N ? m_Inline[i] : m_Overflow[i - N]; }
            [[nodiscard]] T& top() noexcept { return (*this)[m_Size - 1]; }
            [[nodiscard]] std::size_t size() const noexcept { return m_Size; }
            [[nodiscard]] bool empty() const noexcept { return m_Size == 0; }

        private:
            std::array<T, N> m_Inline{};
            std::vector<T> m_Overflow;
            std::size_t m_Size = 0;
        };

    } // namespace detail

    /// @brief One open object or collection of the document being read.
    struct ReadFrame {
        enum class kind : uint8_t { object, collection };

        kind type = kind::object;
        void* dest = nullptr;

        // object
        const TypeMetadata* meta = nullptr;
        const PropertyMetadata* property = nullptr;     ///< Member being read; null when skipped.
        std::size_t hint = 0;

        // collection
        const CollectionConverter* collection = nullptr;
        ElementBuffer buffer;
        void* pending = nullptr;                        ///< Element slot waiting for more input.
        std::size_t index = 0;
        bool in_element = false;
    };

    class ReadStack {
    public:
        explicit ReadStack(const Options& options) noexcept : m_Options{ options } {}

        [[nodiscard]] const Options& options() const noexcept { return m_Options; }

        ReadFrame& push() { return m_Frames.push(); }
        void pop() { m_Frames.pop(); }
        [[nodiscard]] ReadFrame& top() noexcept { return m_Frames.top(); }
        [[nodiscard]] std::size_t size() const noexcept { return m_Frames.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_Frames.empty(); }

        /// @brief The property path of the value being read.
        [[nodiscard]] STANZA_API std::string path() const;

    private:
        const Options& m_Options;
        detail::InlineStack<ReadFrame, 8> m_Frames;
    };

    class WriteStack {
    public:
        explicit WriteStack(const Options& options) noexcept : m_Options{ options } {}

        [[nodiscard]] const Options& options() const noexcept { return m_Options; }

        void enter(const PropertyMetadata& property) { m_Segments.push() = Segment{ &property, 0 }; }
        void enter(std::size_t index) { m_Segments.push() = Segment{ nullptr, index }; }
        void leave() { m_Segments.pop(); }

        [[nodiscard]] STANZA_API std::string path() const;

        /// @brief Attaches the current path to @p e unless it already has one.
        [[nodiscard]] STANZA_API Error annotate(Error e) const;

    private:
        struct Segment {
            const PropertyMetadata* property = nullptr;
            std::size_t index = 0;
        };

        const Options& m_Options;
        detail::InlineStack<Segment, 16> m_Segments;
    };

    class Deserializer {
    public:
        STANZA_API Deserializer(const Options& options, const TypeDescriptor& type, void* root) noexcept;

        Deserializer(const Deserializer&) = delete;
        Deserializer& operator=(const Deserializer&) = delete;

        /// @brief Consumes tokens until the block is exhausted.
        ///
        /// @return true once the document is complete. That requires a final
        ///         reader; with a non-final one the result is always false.
        [[nodiscard]] STANZA_API Result<bool> run(Reader& reader);

        [[nodiscard]] bool done() const noexcept { return m_Stage == stage::done; }
        [[nodiscard]] bool failed() const noexcept { return m_Stage == stage::failed; }

    private:
        enum class stage : uint8_t { start, running, done, failed };
        enum class step : uint8_t { next, need_more };

        Result<step> on_token(Reader& reader);
        Result<step> on_member(Reader& reader);
        Result<step> on_element(Reader& reader);
        Result<step> dispatch(Reader& reader, const Converter* converter, void* dest, bool ignore_null);
        Result<step> end_object(Reader& reader);
        Result<step> end_collection(Reader& reader);
        step value_done() noexcept;
        Error fail(Error e);

        ReadStack m_Stack;
        const TypeDescriptor& m_Type;
        void* m_Root;
        const Converter* m_Converter = nullptr;
        stage m_Stage = stage::start;
        std::size_t m_SkipDepth = 0;
        std::string m_Scratch;
        std::optional<Error> m_Failure;
    };

    namespace detail {

        /// @brief Reads a complete document from @p json into @p dest.
        STANZA_API Result<void> deserialize_into(std::string_view json, const Options& options, const TypeDescriptor& type, void* dest);

        /// @brief Writes @p src with its static type @p type and flushes @p writer.
        STANZA_API Result<void> serialize_value(Writer& writer, const Options& options, const TypeDescriptor& type, const void* src);

    } // namespace detail

} // namespace Stanza
