#include "stanza/converter.hpp"

#include <charconv>
#include <format>
#include <limits>
#include <mutex>
#include <string>

#include "stanza/date_time.hpp"
#include "stanza/engine.hpp"
#include "stanza/log.hpp"


namespace Stanza {

#pragma region Primitives

    namespace {

        Error type_mismatch(const Reader& r, std::string_view expected, const TypeDescriptor& type) {
            return r.error(Error::code::invalid_value, std::format("Expected {} for '{}'", expected, type.name));
        }

        /// Unescaped text of the current string token, without copying when it has no escapes.
        std::string_view string_value(const Reader& r, std::string& scratch) {
            if (!r.has_escapes()) return r.raw();
            detail::unescape(r.raw(), scratch);
            return scratch;
        }

        class BooleanConverter final : public Converter {
        public:
            BooleanConverter() noexcept : Converter{ type_of<bool>() } {}

            Result<void> try_read(Reader& r, void* dest, ReadStack&) const override {
                switch (r.token()) {
                case token_type::true_value: *static_cast<bool*>(dest) = true; return {};
                case token_type::false_value: *static_cast<bool*>(dest) = false; return {};
                default: return std::unexpected(type_mismatch(r, "true or false", type()));
                }
            }

            Result<void> write(Writer& w, const void* src, WriteStack&) const override {
                w.boolean(*static_cast<const bool*>(src));
                return {};
            }
        };

        template<typename I>
        class IntegerConverter final : public Converter {
        public:
            IntegerConverter() noexcept : Converter{ type_of<I>() } {}

            Result<void> try_read(Reader& r, void* dest, ReadStack&) const override {
                if (r.token() != token_type::number) return std::unexpected(type_mismatch(r, "a number", type()));
                std::string_view text = r.raw();
                I value{};
                auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
                if (ec == std::errc::result_out_of_range)
                    return std::unexpected(r.error(Error::code::invalid_value, std::format("{} is out of range for '{}'", text, type().name)));
                if (ec != std::errc{} || ptr != text.data() + text.size())
                    return std::unexpected(r.error(Error::code::invalid_value, std::format("{} is not an integer", text)));
                *static_cast<I*>(dest) = value;
                return {};
            }

            Result<void> write(Writer& w, const void* src, WriteStack&) const override {
                I value = *static_cast<const I*>(src);
                if constexpr (std::is_signed_v<I>) w.number(static_cast<std::int64_t>(value));
                else w.number(static_cast<std::uint64_t>(value));
                return {};
            }
        };

        template<typename F>
        class FloatConverter final : public Converter {
        public:
            FloatConverter() noexcept : Converter{ type_of<F>() } {}

            Result<void> try_read(Reader& r, void* dest, ReadStack&) const override {
                if (r.token() != token_type::number) return std::unexpected(type_mismatch(r, "a number", type()));
                std::string_view text = r.raw();
                F value{};
                auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
                if (ec == std::errc::result_out_of_range)
                    return std::unexpected(r.error(Error::code::invalid_value, std::format("{} is out of range for '{}'", text, type().name)));
                if (ec != std::errc{}) return std::unexpected(r.error(Error::code::invalid_number, "Failed to parse number"));
                *static_cast<F*>(dest) = value;
                return {};
            }

            Result<void> write(Writer& w, const void* src, WriteStack&) const override {
                return w.number(*static_cast<const F*>(src));
            }
        };

        class CharConverter final : public Converter {
        public:
            CharConverter() noexcept : Converter{ type_of<char>() } {}

            Result<void> try_read(Reader& r, void* dest, ReadStack&) const override {
                if (r.token() != token_type::string) return std::unexpected(type_mismatch(r, "a string", type()));
                std::string scratch;
                std::string_view text = string_value(r, scratch);
                if (text.size() != 1 || static_cast<unsigned char>(text[0]) > 0x7F)
                    return std::unexpected(r.error(Error::code::invalid_value, "Expected a single ASCII character"));
                *static_cast<char*>(dest) = text[0];
                return {};
            }

            Result<void> write(Writer& w, const void* src, WriteStack&) const override {
                char c = *static_cast<const char*>(src);
                if (static_cast<unsigned char>(c) > 0x7F)
                    return std::unexpected(Error::make(Error::category::write, "Cannot write a non-ASCII char"));
                return w.string(std::string_view{ &c, 1 });
            }
        };

        class StringConverter final : public Converter {
        public:
            StringConverter() noexcept : Converter{ type_of<std::string>() } {}

            Result<void> try_read(Reader& r, void* dest, ReadStack&) const override {
                if (r.token() != token_type::string) return std::unexpected(type_mismatch(r, "a string", type()));
                auto& out = *static_cast<std::string*>(dest);
                if (r.has_escapes()) detail::unescape(r.raw(), out);
                else out.assign(r.raw());
                return {};
            }

            Result<void> write(Writer& w, const void* src, WriteStack&) const override {
                return w.string(*static_cast<const std::string*>(src));
            }
        };

        class DateTimeConverter final : public Converter {
        public:
            DateTimeConverter() noexcept : Converter{ type_of<DateTime>() } {}

            Result<void> try_read(Reader& r, void* dest, ReadStack&) const override {
                if (r.token() != token_type::string) return std::unexpected(type_mismatch(r, "a timestamp string", type()));
                std::string scratch;
                auto parsed = parse_date_time(string_value(r, scratch));
                if (!parsed) return std::unexpected(r.error(Error::code::invalid_value, "Invalid timestamp, expected YYYY-MM-DDTHH:MM:SS[.fffffff][Z|+HH:MM]"));
                *static_cast<DateTime*>(dest) = *parsed;
                return {};
            }

            Result<void> write(Writer& w, const void* src, WriteStack&) const override {
                char buf[max_date_time_length];
                std::size_t n = format_date_time(*static_cast<const DateTime*>(src), buf);
                if (n == 0) return std::unexpected(Error::make(Error::category::write, "Timestamp is outside the representable range"));
                return w.string(std::string_view{ buf, n });
            }
        };

#pragma endregion
#pragma region Enums

        /// Writes and reads the underlying integer value.
        class EnumConverter final : public Converter {
        public:
            explicit EnumConverter(const TypeDescriptor& type) noexcept : Converter{ type } {}

            Result<void> try_read(Reader& r, void* dest, ReadStack&) const override {
                if (r.token() != token_type::number) return std::unexpected(type_mismatch(r, "an integer", type()));
                const EnumOps& ops = type().enumeration;
                std::string_view text = r.raw();
                const char* end = text.data() + text.size();

                std::uint64_t bits = 0;
                bool in_range = false;
                std::from_chars_result res{};
                if (ops.is_signed) {
                    std::int64_t v = 0;
                    res = std::from_chars(text.data(), end, v);
                    in_range = v >= ops.min && (v < 0 || static_cast<std::uint64_t>(v) <= ops.max);
                    bits = static_cast<std::uint64_t>(v);
                } else {
                    res = std::from_chars(text.data(), end, bits);
                    in_range = bits <= ops.max;
                }
                if (res.ec == std::errc::result_out_of_range || (res.ec == std::errc{} && res.ptr == end && !in_range))
                    return std::unexpected(r.error(Error::code::invalid_value, std::format("{} is out of range for '{}'", text, type().name)));
                if (res.ec != std::errc{} || res.ptr != end)
                    return std::unexpected(r.error(Error::code::invalid_value, std::format("{} is not an integer", text)));
                ops.set(dest, bits);
                return {};
            }

            Result<void> write(Writer& w, const void* src, WriteStack&) const override {
                const EnumOps& ops = type().enumeration;
                std::uint64_t bits = ops.get(src);
                if (ops.is_signed) w.number(static_cast<std::int64_t>(bits));
                else w.number(bits);
                return {};
            }
        };

        /// Writes and reads declared member names.
        class EnumStringConverter final : public Converter {
        public:
            explicit EnumStringConverter(const TypeDescriptor& type) noexcept : Converter{ type } {}

            Result<void> try_read(Reader& r, void* dest, ReadStack&) const override {
                if (r.token() != token_type::string) return std::unexpected(type_mismatch(r, "a member name", type()));
                const EnumOps& ops = type().enumeration;
                std::string scratch;
                std::string_view name = string_value(r, scratch);
                for (const EnumMember& m : ops.members()) {
                    if (m.name == name) {
                        ops.set(dest, m.bits);
                        return {};
                    }
                }
                return std::unexpected(r.error(Error::code::invalid_value, std::format("'{}' is not a member of '{}'", name, type().name)));
            }

            Result<void> write(Writer& w, const void* src, WriteStack&) const override {
                const EnumOps& ops = type().enumeration;
                std::uint64_t bits = ops.get(src);
                for (const EnumMember& m : ops.members()) {
                    if (m.bits == bits) return w.string(m.name);
                }
                return std::unexpected(Error::make(Error::category::write,
                    std::format("Value {} of '{}' has no declared name", static_cast<std::int64_t>(bits), type().name)));
            }
        };

        template<typename T, typename C>
        void add_builtin(std::unordered_map<std::type_index, std::shared_ptr<const Converter>>& map) {
            map.emplace(type_of<T>().id(), std::make_shared<C>());
        }

        template<typename I>
        void add_integer(std::unordered_map<std::type_index, std::shared_ptr<const Converter>>& map) {
            add_builtin<I, IntegerConverter<I>>(map);
        }

    } // namespace

#pragma endregion
#pragma region Composites

    const Converter* OptionalConverter::target(void*& dest) const {
        const OptionalOps& ops = type().optional;
        if (ops.emplace == nullptr) return nullptr;
        dest = ops.emplace(dest);
        return m_Element->target(dest);
    }

    Result<void> OptionalConverter::try_read(Reader& reader, void* dest, ReadStack& stack) const {
        if (reader.token() == token_type::null) {
            type().optional.reset(dest);
            return {};
        }
        const Converter* inner = target(dest);
        if (inner == nullptr)
            return std::unexpected(Error::make(Error::category::unsupported_type, std::format("Type '{}' cannot be read", type().name)));
        return inner->try_read(reader, dest, stack);
    }

    Result<void> OptionalConverter::write(Writer& writer, const void* src, WriteStack& stack) const {
        const OptionalOps& ops = type().optional;
        if (!ops.has_value(src)) {
            writer.null();
            return {};
        }
        return m_Element->write(writer, ops.value(src), stack);
    }

    Result<void> ObjectConverter::try_read(Reader& reader, void*, ReadStack&) const {
        return std::unexpected(reader.error(Error::code::invalid_value, std::format("'{}' is read by the engine", type().name)));
    }

    Result<const TypeMetadata*> ObjectConverter::metadata() const {
        if (const TypeMetadata* m = m_Metadata.load(std::memory_order_acquire)) return m;
        auto r = m_Options.metadata(type());
        if (r) m_Metadata.store(*r, std::memory_order_release);
        return r;
    }

    bool CollectionConverter::readable() const noexcept {
        const TypeDescriptor& t = type();
        if (t.sequence.create_buffer == nullptr) return false;
        if (t.shape == type_shape::enumerable) return m_Materializer != nullptr;
        return t.sequence.assign != nullptr;
    }

    Result<void> CollectionConverter::materialize(void* buffer, void* dest) const {
        const TypeDescriptor& t = type();
        if (t.shape == type_shape::enumerable) return m_Materializer->materialize(t, buffer, dest);
        t.sequence.assign(buffer, dest);
        return {};
    }

    Result<void> CollectionConverter::try_read(Reader& reader, void*, ReadStack&) const {
        return std::unexpected(reader.error(Error::code::invalid_value, std::format("'{}' is read by the engine", type().name)));
    }

#pragma endregion
#pragma region Registry

    ConverterRegistry::ConverterRegistry(const Options& owner) : m_Options{ owner } {
        add_builtin<bool, BooleanConverter>(m_Builtins);
        add_builtin<char, CharConverter>(m_Builtins);
        add_builtin<std::string, StringConverter>(m_Builtins);
        add_builtin<DateTime, DateTimeConverter>(m_Builtins);
        add_builtin<float, FloatConverter<float>>(m_Builtins);
        add_builtin<double, FloatConverter<double>>(m_Builtins);
        add_integer<signed char>(m_Builtins);
        add_integer<unsigned char>(m_Builtins);
        add_integer<short>(m_Builtins);
        add_integer<unsigned short>(m_Builtins);
        add_integer<int>(m_Builtins);
        add_integer<unsigned int>(m_Builtins);
        add_integer<long>(m_Builtins);
        add_integer<unsigned long>(m_Builtins);
        add_integer<long long>(m_Builtins);
        add_integer<unsigned long long>(m_Builtins);
    }

    ConverterRegistry::~ConverterRegistry() = default;

    void ConverterRegistry::add(std::shared_ptr<const Converter> converter) {
        auto id = converter->type().id();
        m_Exact.insert_or_assign(id, std::move(converter));
    }

    void ConverterRegistry::add(ConverterMatcher matcher, ConverterFactory factory) {
        m_Factories.emplace_back(std::move(matcher), std::move(factory));
    }

    void ConverterRegistry::set_materializer(std::shared_ptr<const EnumerableMaterializer> materializer) {
        m_Materializer = std::move(materializer);
    }

    Result<const Converter*> ConverterRegistry::lookup(const TypeDescriptor& type, bool enum_as_string) const {
        const Key key{ type.id(), enum_as_string };
        {
            std::shared_lock lock{ m_Mutex };
            if (auto it = m_Cache.find(key); it != m_Cache.end()) {
                if (!it->second) return std::unexpected(it->second.error());
                return it->second->get();
            }
        }

        Entry created = create(type, enum_as_string);

        std::unique_lock lock{ m_Mutex };
        auto [it, inserted] = m_Cache.try_emplace(key, std::move(created));
        if (inserted && !it->second) STANZA_LOG_DEBUG("no converter for {}: {}", type.name, it->second.error().msg);
        if (!it->second) return std::unexpected(it->second.error());
        return it->second->get();
    }

    const EnumerableMaterializer* ConverterRegistry::materializer_for(const TypeDescriptor& type) const noexcept {
        if (m_Materializer && m_Materializer->can_materialize(type)) return m_Materializer.get();
        if (m_DefaultMaterializer.can_materialize(type)) return &m_DefaultMaterializer;
        return nullptr;
    }

    ConverterRegistry::Entry ConverterRegistry::create_enum(const TypeDescriptor& type, bool enum_as_string) const {
        if (!enum_as_string) return std::make_shared<EnumConverter>(type);
        if (type.enumeration.members().empty())
            return std::unexpected(Error::make(Error::category::configuration,
                std::format("Enum '{}' is written by name but declares no member names", type.name)));
        return std::make_shared<EnumStringConverter>(type);
    }

    ConverterRegistry::Entry ConverterRegistry::create(const TypeDescriptor& type, bool enum_as_string) const {
        if (auto it = m_Exact.find(type.id()); it != m_Exact.end()) return it->second;

        for (const auto& [matches, factory] : m_Factories) {
            if (!matches(type)) continue;
            auto converter = factory(type);
            if (!converter)
                return std::unexpected(Error::make(Error::category::configuration, std::format("Converter factory for '{}' returned no converter", type.name)));
            if (!converter->type().is(type))
                return std::unexpected(Error::make(Error::category::configuration,
                    std::format("Converter factory for '{}' produced a converter for '{}'", type.name, converter->type().name)));
            return converter;
        }

        switch (type.shape) {
        case type_shape::primitive: {
            if (auto it = m_Builtins.find(type.id()); it != m_Builtins.end()) return it->second;
            break;
        }
        case type_shape::optional: {
            auto element = lookup(type.optional.element(), enum_as_string);
            if (!element) return std::unexpected(element.error());
            return std::make_shared<OptionalConverter>(type, **element);
        }
        case type_shape::enumeration:
            return create_enum(type, enum_as_string);
        case type_shape::array:
        case type_shape::list:
        case type_shape::enumerable: {
            auto element = lookup(type.sequence.element(), enum_as_string);
            if (!element) return std::unexpected(element.error());
            const EnumerableMaterializer* m = type.shape == type_shape::enumerable ? materializer_for(type) : nullptr;
            return std::make_shared<CollectionConverter>(type, **element, m);
        }
        case type_shape::object: {
            const TypeDeclaration& decl = type.object.declaration();
            if (decl.converter) {
                if (!decl.converter->type().is(type))
                    return std::unexpected(Error::make(Error::category::configuration,
                        std::format("Converter declared for '{}' handles '{}'", type.name, decl.converter->type().name)));
                return decl.converter;
            }
            return std::make_shared<ObjectConverter>(type, m_Options);
        }
        case type_shape::unknown:
            break;
        }
        return std::unexpected(Error::make(Error::category::unsupported_type, std::format("No converter for type '{}'", type.name)));
    }

#pragma endregion

} // namespace Stanza
