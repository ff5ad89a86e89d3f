#pragma once


/*
    -----------------------------------------
    Stanza converters and converter selection
    -----------------------------------------
    A `Converter` reads one JSON value into a C++ object of a fixed type and
    writes it back. Converters are stateless after construction and shared
    by every call that uses the owning `Options`.

    `strategy` tells the engines how a converter consumes input:
        - value       reads the current token (or a whole buffered container)
                      in one `try_read` call
        - object      driven by the engine from the type's metadata
        - collection  driven by the engine element by element

    User converters derive from `TypedConverter<T>` and are always value
    converters:

        struct UpperCase : Stanza::TypedConverter<std::string> {
            Stanza::Result<void> read_value(Stanza::Reader& r, std::string& out) const override;
            Stanza::Result<void> write_value(Stanza::Writer& w, const std::string& v) const override;
        };

    ---------
    Selection
    ---------
    `ConverterRegistry::lookup` picks, in order: an exact user converter,
    the first accepting user factory, a class-level converter declared in
    `describe`, then the built-in converter for the type's shape (see
    `type_shape`). Results, including failures, are cached per type and
    enum encoding.
*/

#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"
#include "stanza/reader.hpp"
#include "stanza/type_info.hpp"
#include "stanza/writer.hpp"

namespace Stanza {

    class ReadStack;
    class WriteStack;
    struct TypeMetadata;

    enum class strategy : uint8_t {
        value,
        object,
        collection,
    };

    class Converter {
    public:
        explicit Converter(const TypeDescriptor& type) noexcept : m_Type{ &type } {}
        virtual ~Converter() = default;

        Converter(const Converter&) = delete;
        Converter& operator=(const Converter&) = delete;

        [[nodiscard]] const TypeDescriptor& type() const noexcept { return *m_Type; }

        [[nodiscard]] virtual strategy kind() const noexcept { return strategy::value; }

        /// @brief Whether `try_read` accepts a null token.
        [[nodiscard]] virtual bool handles_null() const noexcept { return false; }

        /// @brief Whether @p src is written as null; drives skip-null-on-write.
        [[nodiscard]] virtual bool is_null(const void* /*src*/) const noexcept { return false; }

        /// @brief The converter that consumes a non-null token for @p dest.
        ///
        /// @details Wrappers such as `std::optional` prepare @p dest and
        /// forward to the converter of their element. Returns nullptr when
        /// the value cannot be constructed.
        [[nodiscard]] virtual const Converter* target(void*& /*dest*/) const { return this; }

        /// @brief Reads the value at the reader's current token into @p dest.
        ///
        /// @details For a container token the whole container is buffered
        /// and the converter must consume it through its end token.
        virtual Result<void> try_read(Reader& reader, void* dest, ReadStack& stack) const = 0;

        virtual Result<void> write(Writer& writer, const void* src, WriteStack& stack) const = 0;

    private:
        const TypeDescriptor* m_Type;
    };

    /// @brief Base for user converters of @p T.
    template<typename T>
    class TypedConverter : public Converter {
    public:
        TypedConverter() noexcept : Converter{ type_of<T>() } {}

        virtual Result<void> read_value(Reader& reader, T& out) const = 0;
        virtual Result<void> write_value(Writer& writer, const T& value) const = 0;

        Result<void> try_read(Reader& reader, void* dest, ReadStack&) const final {
            return read_value(reader, *static_cast<T*>(dest));
        }

        Result<void> write(Writer& writer, const void* src, WriteStack&) const final {
            return write_value(writer, *static_cast<const T*>(src));
        }
    };

    /// @brief Owns the intermediate element buffer of a collection being read.
    class ElementBuffer {
    public:
        ElementBuffer() noexcept = default;
        explicit ElementBuffer(const SequenceOps& ops) : m_Ops{ &ops }, m_Data{ ops.create_buffer(), ops.destroy_buffer } {}

        /// @brief Default-constructs a new trailing element and returns it.
        void* append() { return m_Ops->append(m_Data.get()); }
        [[nodiscard]] std::size_t size() const noexcept { return m_Data ? m_Ops->buffer_size(m_Data.get()) : 0; }
        [[nodiscard]] void* data() const noexcept { return m_Data.get(); }

    private:
        const SequenceOps* m_Ops = nullptr;
        std::unique_ptr<void, void (*)(void*)> m_Data{ nullptr, nullptr };
    };

    /// @brief Builds enumerable containers that are neither arrays nor lists.
    ///
    /// @details The buffer handed to `materialize` is a `std::deque` of the
    /// container's element type holding the decoded elements in input order.
    class EnumerableMaterializer {
    public:
        virtual ~EnumerableMaterializer() = default;

        [[nodiscard]] virtual bool can_materialize(const TypeDescriptor& target) const = 0;
        virtual Result<void> materialize(const TypeDescriptor& target, void* buffer, void* dest) const = 0;
    };

    /// @brief Materializer for one container type @p C.
    template<typename C, typename E = std::remove_cv_t<typename C::value_type>>
    class TypedMaterializer : public EnumerableMaterializer {
    public:
        [[nodiscard]] bool can_materialize(const TypeDescriptor& target) const final { return target.is(type_of<C>()); }

        Result<void> materialize(const TypeDescriptor&, void* buffer, void* dest) const final {
            return fill(*static_cast<std::deque<E>*>(buffer), *static_cast<C*>(dest));
        }

        virtual Result<void> fill(std::deque<E>& elements, C& out) const = 0;
    };

    /// @brief Default materializer: containers with `insert(value_type)`.
    class InsertMaterializer final : public EnumerableMaterializer {
    public:
        [[nodiscard]] bool can_materialize(const TypeDescriptor& target) const override { return target.sequence.insert != nullptr; }

        Result<void> materialize(const TypeDescriptor& target, void* buffer, void* dest) const override {
            target.sequence.insert(buffer, dest);
            return {};
        }
    };

#pragma region Composite converters

    class OptionalConverter final : public Converter {
    public:
        OptionalConverter(const TypeDescriptor& type, const Converter& element) noexcept
            : Converter{ type }, m_Element{ &element } {}

        [[nodiscard]] bool handles_null() const noexcept override { return true; }
        [[nodiscard]] bool is_null(const void* src) const noexcept override { return !type().optional.has_value(src); }
        [[nodiscard]] STANZA_API const Converter* target(void*& dest) const override;

        STANZA_API Result<void> try_read(Reader& reader, void* dest, ReadStack& stack) const override;
        STANZA_API Result<void> write(Writer& writer, const void* src, WriteStack& stack) const override;

    private:
        const Converter* m_Element;
    };

    /// @brief Converter of described types; metadata is resolved on first use.
    class ObjectConverter final : public Converter {
    public:
        ObjectConverter(const TypeDescriptor& type, const Options& options) noexcept
            : Converter{ type }, m_Options{ options } {}

        [[nodiscard]] strategy kind() const noexcept override { return strategy::object; }

        [[nodiscard]] STANZA_API Result<const TypeMetadata*> metadata() const;

        STANZA_API Result<void> try_read(Reader& reader, void* dest, ReadStack& stack) const override;
        STANZA_API Result<void> write(Writer& writer, const void* src, WriteStack& stack) const override;

    private:
        const Options& m_Options;
        mutable std::atomic<const TypeMetadata*> m_Metadata{ nullptr };
    };

    /// @brief Converter of arrays, lists and enumerables.
    class CollectionConverter final : public Converter {
    public:
        CollectionConverter(const TypeDescriptor& type, const Converter& element, const EnumerableMaterializer* materializer) noexcept
            : Converter{ type }, m_Element{ &element }, m_Materializer{ materializer } {}

        [[nodiscard]] strategy kind() const noexcept override { return strategy::collection; }

        [[nodiscard]] const Converter& element() const noexcept { return *m_Element; }

        /// @brief Whether values of the type can be built from input.
        [[nodiscard]] STANZA_API bool readable() const noexcept;

        /// @brief Moves the completed element buffer into @p dest.
        STANZA_API Result<void> materialize(void* buffer, void* dest) const;

        STANZA_API Result<void> try_read(Reader& reader, void* dest, ReadStack& stack) const override;
        STANZA_API Result<void> write(Writer& writer, const void* src, WriteStack& stack) const override;

    private:
        const Converter* m_Element;
        const EnumerableMaterializer* m_Materializer;
    };

#pragma endregion

    class ConverterRegistry {
    public:
        STANZA_API explicit ConverterRegistry(const Options& owner);
        STANZA_API ~ConverterRegistry();

        ConverterRegistry(const ConverterRegistry&) = delete;
        ConverterRegistry& operator=(const ConverterRegistry&) = delete;

        STANZA_API void add(std::shared_ptr<const Converter> converter);
        STANZA_API void add(ConverterMatcher matcher, ConverterFactory factory);
        STANZA_API void set_materializer(std::shared_ptr<const EnumerableMaterializer> materializer);

        /// @brief Converter for values of @p type; cached, failures included.
        [[nodiscard]] STANZA_API Result<const Converter*> lookup(const TypeDescriptor& type, bool enum_as_string) const;

    private:
        struct Key {
            std::type_index type;
            bool enum_as_string;

            bool operator==(const Key&) const = default;
        };

        struct KeyHash {
            std::size_t operator()(const Key& k) const noexcept {
                return std::hash<std::type_index>{}(k.type) ^ static_cast<std::size_t>(k.enum_as_string);
            }
        };

        using Entry = Result<std::shared_ptr<const Converter>>;

        Entry create(const TypeDescriptor& type, bool enum_as_string) const;
        Entry create_enum(const TypeDescriptor& type, bool enum_as_string) const;
        const EnumerableMaterializer* materializer_for(const TypeDescriptor& type) const noexcept;

        const Options& m_Options;
        std::unordered_map<std::type_index, std::shared_ptr<const Converter>> m_Builtins;
        std::unordered_map<std::type_index, std::shared_ptr<const Converter>> m_Exact;
        std::vector<std::pair<ConverterMatcher, ConverterFactory>> m_Factories;
        std::shared_ptr<const EnumerableMaterializer> m_Materializer;
        InsertMaterializer m_DefaultMaterializer;

        mutable std::shared_mutex m_Mutex;
        mutable std::unordered_map<Key, Entry, KeyHash> m_Cache;
    };

} // namespace Stanza
