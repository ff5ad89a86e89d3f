#pragma once


/*
    -----------------------------------------------------
    Stanza type descriptors and design-time declarations
    -----------------------------------------------------
    The engine never inspects C++ types at run time. Instead every type it
    touches is summarized once, at compile time, into a `TypeDescriptor`:
    a shape classification plus tables of plain function pointers that
    perform the few operations the converters need (reach the value of an
    optional, append to a collection buffer, read an enum's bits, ...).

    ------------
    Declarations
    ------------
    Object types take part by providing a `describe` overload that ADL can
    find, in the same namespace as the type:

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

    The builder's output, a `TypeDeclaration`, is the materialized list of
    design-time settings: the declared properties in order, their accessor
    bindings, the class and property `ConfigLayer`s, optional converter
    selections and the callback hooks the type implements. It is built once
    per type and is immutable; options-specific state lives in
    `TypeMetadata` (see metadata.hpp).

    Enums declare their member names the same way:

        void describe(Stanza::EnumBuilder<Color>& e) {
            e.value(Color::Red, "Red").value(Color::Green, "Green");
        }

    ---------
    Callbacks
    ---------
    A type opts into callbacks by implementing any of

        Stanza::Result<void> on_deserializing();
        Stanza::Result<void> on_deserialized();
        Stanza::Result<void> on_serializing() const;
        Stanza::Result<void> on_serialized(Stanza::Writer&) const;

    The capability is detected when the declaration is built.
*/

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <memory>
#include <optional>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/date_time.hpp"
#include "stanza/error.hpp"
#include "stanza/policy.hpp"

namespace Stanza {

    class Converter;
    class Writer;
    struct TypeDescriptor;
    struct TypeDeclaration;

    /// @brief Shape classification, in the order converters are selected.
    enum class type_shape : uint8_t {
        primitive,   ///< bool, integers, floating point, char, std::string, DateTime
        optional,    ///< std::optional<T>
        enumeration, ///< enum types
        array,       ///< std::array<T, N>, T[N]
        list,        ///< containers with push_back (vector, deque, list)
        enumerable,  ///< other ranges; need an EnumerableMaterializer to read
        object,      ///< types with a describe(TypeBuilder<T>&) declaration
        unknown,
    };

    using DescriptorFn = const TypeDescriptor& (*)();

    struct OptionalOps {
        DescriptorFn element = nullptr;
        bool (*has_value)(const void*) = nullptr;
        const void* (*value)(const void*) = nullptr;
        void* (*emplace)(void*) = nullptr;    ///< null when the element is not default constructible
        void (*reset)(void*) = nullptr;
    };

    struct EnumMember {
        std::string name;
        std::uint64_t bits;     ///< Underlying value, sign-extended for signed enums.
    };

    struct EnumOps {
        bool is_signed = false;
        std::int64_t min = 0;
        std::uint64_t max = 0;
        std::uint64_t (*get)(const void*) = nullptr;
        void (*set)(void*, std::uint64_t) = nullptr;
        std::span<const EnumMember> (*members)() = nullptr;
    };

    using VisitElement = Result<void> (*)(void* context, const void* element);

    /// @brief Collection operations. Reads decode into a buffer first and
    ///        move the completed buffer into the destination.
    struct SequenceOps {
        DescriptorFn element = nullptr;
        std::size_t extent = 0;                                     ///< Fixed length for arrays, 0 otherwise.
        Result<void> (*for_each)(const void*, void*, VisitElement) = nullptr;
        void* (*create_buffer)() = nullptr;
        void (*destroy_buffer)(void*) = nullptr;
        void* (*append)(void*) = nullptr;                           ///< Default-constructs a slot, returns it.
        std::size_t (*buffer_size)(const void*) = nullptr;
        void (*assign)(void* buffer, void* dest) = nullptr;         ///< Arrays and lists.
        void (*insert)(void* buffer, void* dest) = nullptr;         ///< Containers with insert(value_type).
    };

    struct ObjectOps {
        const TypeDeclaration& (*declaration)() = nullptr;
    };

    /// @brief Compile-time generated summary of a C++ type.
    struct TypeDescriptor {
        const std::type_info* info = nullptr;
        std::string_view name;
        type_shape shape = type_shape::unknown;
        OptionalOps optional;
        EnumOps enumeration;
        SequenceOps sequence;
        ObjectOps object;

        [[nodiscard]] std::type_index id() const noexcept { return std::type_index{ *info }; }
        [[nodiscard]] bool is(const TypeDescriptor& other) const noexcept { return *info == *other.info; }
    };

    /// @brief Returns the descriptor of @p T (cv-qualifiers and references ignored).
    template<typename T>
    const TypeDescriptor& type_of();

    // ------------------------------------------------------------
    // Declarations
    // ------------------------------------------------------------

    /// @brief Bound accessors for one property.
    struct Accessor {
        const void* (*get)(const void* object) = nullptr;
        void* (*get_mut)(void* object) = nullptr;    ///< null for read-only properties
    };

    struct PropertyDeclaration {
        std::string name;                          ///< Declared name.
        std::optional<std::string> json_name;      ///< Explicit wire name; bypasses naming policy.
        DescriptorFn type = nullptr;
        Accessor accessor;
        ConfigLayer layer;
        std::shared_ptr<const Converter> converter;
    };

    struct Callbacks {
        Result<void> (*on_deserializing)(void*) = nullptr;
        Result<void> (*on_deserialized)(void*) = nullptr;
        Result<void> (*on_serializing)(const void*) = nullptr;
        Result<void> (*on_serialized)(const void*, Writer&) = nullptr;
    };

    struct TypeDeclaration {
        ConfigLayer layer;
        std::vector<PropertyDeclaration> properties;
        std::shared_ptr<const Converter> converter;   ///< Class-level converter selection.
        Callbacks callbacks;

        [[nodiscard]] STANZA_API const PropertyDeclaration* find(std::string_view declared) const noexcept;
    };

    namespace detail {

        template<typename T>
        constexpr std::string_view type_name() noexcept {
            std::string_view fn = std::source_location::current().function_name();
            auto start = fn.find("T = ");
            if (start == std::string_view::npos) return fn;
            start += 4;
            auto end = fn.find(';', start);
            if (end == std::string_view::npos) end = fn.rfind(']');
            return fn.substr(start, end - start);
        }

        template<typename M>
        struct member_traits;

        template<typename M, typename C>
        struct member_traits<M C::*> {
            using value_type = M;
            using class_type = C;
        };

        template<typename G>
        struct getter_traits;

        template<typename R, typename C>
        struct getter_traits<R (C::*)() const> {
            using result_type = R;
            using class_type = C;
        };

        template<typename R, typename C>
        struct getter_traits<R (C::*)() const noexcept> {
            using result_type = R;
            using class_type = C;
        };

    } // namespace detail

    /// @brief Collects the design-time declaration of an object type.
    template<typename T>
    class TypeBuilder {
    public:
        /// @brief Fluent access to one declared property.
        class PropertyBuilder {
        public:
            PropertyBuilder(TypeDeclaration& decl, std::size_t index) noexcept : m_Decl{ decl }, m_Index{ index } {}

            PropertyBuilder& json_name(std::string_view n) { prop().json_name.emplace(n); return *this; }
            PropertyBuilder& case_insensitive(bool v = true) { prop().layer.case_insensitive = v; return *this; }
            PropertyBuilder& ignore_null_on_read(bool v = true) { prop().layer.ignore_null_on_read = v; return *this; }
            PropertyBuilder& ignore_null_on_write(bool v = true) { prop().layer.ignore_null_on_write = v; return *this; }
            PropertyBuilder& enum_as_string(bool v = true) { prop().layer.enum_as_string = v; return *this; }
            PropertyBuilder& naming(naming_policy p) { prop().layer.naming = p; return *this; }
            PropertyBuilder& converter(std::shared_ptr<const Converter> c) { prop().converter = std::move(c); return *this; }

        private:
            PropertyDeclaration& prop() { return m_Decl.properties[m_Index]; }

            TypeDeclaration& m_Decl;
            std::size_t m_Index;
        };

        /// @brief Class-level design-time layer.
        ConfigLayer& options() noexcept { return m_Decl.layer; }

        /// @brief Selects a converter for every use of `T` as a value.
        TypeBuilder& converter(std::shared_ptr<const Converter> c) { m_Decl.converter = std::move(c); return *this; }

        /// @brief Declares a data member as a read/write property.
        ///
        /// @details Members of a base class of `T` may be declared too.
        template<auto Member>
        PropertyBuilder field(std::string_view name) {
            using traits = detail::member_traits<decltype(Member)>;
            using member_type = typename traits::value_type;
            static_assert(std::is_base_of_v<typename traits::class_type, T>, "member must belong to T or one of its bases");

            PropertyDeclaration p;
            p.name.assign(name);
            p.type = &type_of<member_type>;
            p.accessor.get = [](const void* o) -> const void* {
                return std::addressof(static_cast<const T*>(o)->*Member);
            };
            if constexpr (!std::is_const_v<member_type>) {
                p.accessor.get_mut = [](void* o) -> void* {
                    return std::addressof(static_cast<T*>(o)->*Member);
                };
            }
            return add(std::move(p));
        }

        /// @brief Declares a read-only property backed by a const getter returning a reference.
        template<auto Getter>
        PropertyBuilder property(std::string_view name) {
            using traits = detail::getter_traits<decltype(Getter)>;
            using result_type = typename traits::result_type;
            static_assert(std::is_lvalue_reference_v<result_type>, "getter must return a reference");
            static_assert(std::is_base_of_v<typename traits::class_type, T>, "getter must belong to T or one of its bases");

            PropertyDeclaration p;
            p.name.assign(name);
            p.type = &type_of<std::remove_cvref_t<result_type>>;
            p.accessor.get = [](const void* o) -> const void* {
                return std::addressof((static_cast<const T*>(o)->*Getter)());
            };
            return add(std::move(p));
        }

        [[nodiscard]] TypeDeclaration finish() &&;

    private:
        PropertyBuilder add(PropertyDeclaration p) {
            m_Decl.properties.push_back(std::move(p));
            return PropertyBuilder{ m_Decl, m_Decl.properties.size() - 1 };
        }

        TypeDeclaration m_Decl;
    };

    /// @brief Collects the member names of an enum.
    template<typename E>
    class EnumBuilder {
        static_assert(std::is_enum_v<E>);
    public:
        EnumBuilder& value(E v, std::string_view name) {
            using U = std::underlying_type_t<E>;
            m_Members.push_back(EnumMember{ std::string{ name }, static_cast<std::uint64_t>(static_cast<U>(v)) });
            return *this;
        }

        [[nodiscard]] std::vector<EnumMember> finish() && { return std::move(m_Members); }

    private:
        std::vector<EnumMember> m_Members;
    };

    /// @brief Types with a design-time declaration.
    template<typename T>
    concept Describable = std::is_class_v<T> && requires(TypeBuilder<T>& b) { describe(b); };

    /// @brief Enums with declared member names.
    template<typename E>
    concept EnumDescribable = std::is_enum_v<E> && requires(EnumBuilder<E>& b) { describe(b); };

    template<typename T>
    concept HasOnDeserializing = requires(T& t) { { t.on_deserializing() } -> std::same_as<Result<void>>; };
    template<typename T>
    concept HasOnDeserialized = requires(T& t) { { t.on_deserialized() } -> std::same_as<Result<void>>; };
    template<typename T>
    concept HasOnSerializing = requires(const T& t) { { t.on_serializing() } -> std::same_as<Result<void>>; };
    template<typename T>
    concept HasOnSerialized = requires(const T& t, Writer& w) { { t.on_serialized(w) } -> std::same_as<Result<void>>; };

    template<typename T>
    TypeDeclaration TypeBuilder<T>::finish() && {
        if constexpr (HasOnDeserializing<T>)
            m_Decl.callbacks.on_deserializing = [](void* o) { return static_cast<T*>(o)->on_deserializing(); };
        if constexpr (HasOnDeserialized<T>)
            m_Decl.callbacks.on_deserialized = [](void* o) { return static_cast<T*>(o)->on_deserialized(); };
        if constexpr (HasOnSerializing<T>)
            m_Decl.callbacks.on_serializing = [](const void* o) { return static_cast<const T*>(o)->on_serializing(); };
        if constexpr (HasOnSerialized<T>)
            m_Decl.callbacks.on_serialized = [](const void* o, Writer& w) { return static_cast<const T*>(o)->on_serialized(w); };
        return std::move(m_Decl);
    }

    /// @brief The declaration of @p T, built on first call and immutable afterwards.
    template<Describable T>
    const TypeDeclaration& declaration_of() {
        static const TypeDeclaration decl = [] {
            TypeBuilder<T> b;
            describe(b);
            return std::move(b).finish();
        }();
        return decl;
    }

    template<typename E>
    std::span<const EnumMember> enum_members_of() {
        if constexpr (EnumDescribable<E>) {
            static const std::vector<EnumMember> members = [] {
                EnumBuilder<E> b;
                describe(b);
                return std::move(b).finish();
            }();
            return members;
        } else {
            return {};
        }
    }

    // ------------------------------------------------------------
    // Shape traits
    // ------------------------------------------------------------

    namespace detail {

        template<typename T>
        inline constexpr bool is_integer_v = std::is_integral_v<T>
            && !std::is_same_v<T, bool> && !std::is_same_v<T, char>
            && !std::is_same_v<T, wchar_t> && !std::is_same_v<T, char8_t>
            && !std::is_same_v<T, char16_t> && !std::is_same_v<T, char32_t>;

        template<typename T>
        inline constexpr bool is_primitive_v = std::is_same_v<T, bool> || std::is_same_v<T, char>
            || is_integer_v<T> || std::is_same_v<T, float> || std::is_same_v<T, double>
            || std::is_same_v<T, std::string> || std::is_same_v<T, DateTime>;

        template<typename T>
        struct is_optional : std::false_type {};
        template<typename E>
        struct is_optional<std::optional<E>> : std::true_type { using element = E; };

        template<typename T>
        struct is_std_array : std::false_type {};
        template<typename E, std::size_t N>
        struct is_std_array<std::array<E, N>> : std::true_type {};

        template<typename T>
        inline constexpr bool is_array_v = std::is_bounded_array_v<T> || is_std_array<T>::value;

        template<typename T>
        using element_of_t = std::remove_cvref_t<decltype(*std::begin(std::declval<T&>()))>;

        template<typename T>
        concept range_like = requires(const T& c) {
            std::begin(c);
            std::end(c);
        };

        template<typename T>
        concept list_like = range_like<T> && std::default_initializable<T> && requires(T& c, typename T::value_type v) {
            c.push_back(std::move(v));
            c.clear();
        };

        template<typename T>
        concept insertable = range_like<T> && std::default_initializable<T> && requires(T& c, typename T::value_type v) {
            c.insert(std::move(v));
            c.clear();
        };

        /// Buffer slot for C array elements, which a deque cannot hold directly.
        template<typename E>
        struct array_slot {
            E value;
        };

        template<typename E>
        using buffer_slot_t = std::conditional_t<std::is_array_v<E>, array_slot<E>, E>;

        template<typename E>
        using element_buffer_t = std::deque<buffer_slot_t<E>>;

        template<typename E>
        E& slot_value(buffer_slot_t<E>& slot) noexcept {
            if constexpr (std::is_array_v<E>) return slot.value;
            else return slot;
        }

        template<typename E>
        concept bufferable = std::default_initializable<std::remove_all_extents_t<E>> && std::movable<std::remove_all_extents_t<E>>;

        /// Moves @p src into @p dst, element by element for C arrays.
        template<typename E>
        void move_element(E& dst, E& src) {
            if constexpr (std::is_array_v<E>) {
                for (std::size_t i = 0; i < std::extent_v<E>; i++) move_element(dst[i], src[i]);
            } else {
                dst = std::move(src);
            }
        }

        template<typename T, typename E>
        SequenceOps make_sequence_ops() {
            using buffer_type = element_buffer_t<E>;
            SequenceOps ops;
            ops.element = &type_of<E>;
            ops.for_each = [](const void* c, void* ctx, VisitElement visit) -> Result<void> {
                for (const auto& e : *static_cast<const T*>(c)) {
                    const E& ref = e;
                    if (auto r = visit(ctx, std::addressof(ref)); !r) return r;
                }
                return {};
            };
            if constexpr (bufferable<E>) {
                ops.create_buffer = []() -> void* { return std::make_unique<buffer_type>().release(); };
                ops.destroy_buffer = [](void* b) { std::default_delete<buffer_type>{}(static_cast<buffer_type*>(b)); };
                ops.append = [](void* b) -> void* {
                    return std::addressof(slot_value<E>(static_cast<buffer_type*>(b)->emplace_back()));
                };
                ops.buffer_size = [](const void* b) { return static_cast<const buffer_type*>(b)->size(); };
            }
            return ops;
        }

        template<typename T>
        TypeDescriptor make_descriptor() {
            TypeDescriptor d;
            d.info = &typeid(T);
            d.name = type_name<T>();

            if constexpr (is_primitive_v<T>) {
                d.shape = type_shape::primitive;
            } else if constexpr (is_optional<T>::value) {
                using E = typename is_optional<T>::element;
                d.shape = type_shape::optional;
                d.optional.element = &type_of<E>;
                d.optional.has_value = [](const void* p) { return static_cast<const T*>(p)->has_value(); };
                d.optional.value = [](const void* p) -> const void* { return std::addressof(**static_cast<const T*>(p)); };
                d.optional.reset = [](void* p) { static_cast<T*>(p)->reset(); };
                if constexpr (std::default_initializable<E>)
                    d.optional.emplace = [](void* p) -> void* { return std::addressof(static_cast<T*>(p)->emplace()); };
            } else if constexpr (std::is_enum_v<T>) {
                using U = std::underlying_type_t<T>;
                d.shape = type_shape::enumeration;
                d.enumeration.is_signed = std::is_signed_v<U>;
                d.enumeration.min = static_cast<std::int64_t>(std::numeric_limits<U>::min());
                d.enumeration.max = static_cast<std::uint64_t>(std::numeric_limits<U>::max());
                d.enumeration.get = [](const void* p) { return static_cast<std::uint64_t>(static_cast<U>(*static_cast<const T*>(p))); };
                d.enumeration.set = [](void* p, std::uint64_t bits) { *static_cast<T*>(p) = static_cast<T>(static_cast<U>(bits)); };
                d.enumeration.members = &enum_members_of<T>;
            } else if constexpr (is_array_v<T>) {
                using E = element_of_t<T>;
                d.shape = type_shape::array;
                d.sequence = make_sequence_ops<T, E>();
                if constexpr (std::is_bounded_array_v<T>) d.sequence.extent = std::extent_v<T>;
                else d.sequence.extent = std::tuple_size_v<T>;
                if constexpr (bufferable<E>) {
                    d.sequence.assign = [](void* b, void* dest) {
                        auto& out = *static_cast<T*>(dest);
                        std::size_t i = 0;
                        for (auto& slot : *static_cast<element_buffer_t<E>*>(b)) move_element<E>(out[i++], slot_value<E>(slot));
                    };
                }
            } else if constexpr (list_like<T>) {
                using E = typename T::value_type;
                d.shape = type_shape::list;
                d.sequence = make_sequence_ops<T, E>();
                d.sequence.assign = [](void* b, void* dest) {
                    auto& out = *static_cast<T*>(dest);
                    out.clear();
                    for (auto& e : *static_cast<std::deque<E>*>(b)) out.push_back(std::move(e));
                };
            } else if constexpr (range_like<T> && requires { typename T::value_type; }) {
                using E = std::remove_cv_t<typename T::value_type>;
                d.shape = type_shape::enumerable;
                d.sequence = make_sequence_ops<T, E>();
                if constexpr (insertable<T>) {
                    d.sequence.insert = [](void* b, void* dest) {
                        auto& out = *static_cast<T*>(dest);
                        out.clear();
                        for (auto& e : *static_cast<std::deque<E>*>(b)) out.insert(std::move(e));
                    };
                }
            } else if constexpr (Describable<T>) {
                d.shape = type_shape::object;
                d.object.declaration = &declaration_of<T>;
            } else {
                d.shape = type_shape::unknown;
            }
            return d;
        }

    } // namespace detail

    template<typename T>
    const TypeDescriptor& type_of() {
        using U = std::remove_cvref_t<T>;
        if constexpr (!std::is_same_v<U, T>) {
            return type_of<U>();
        } else {
            static const TypeDescriptor d = detail::make_descriptor<T>();
            return d;
        }
    }

} // namespace Stanza
