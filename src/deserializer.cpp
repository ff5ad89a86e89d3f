#include "stanza/engine.hpp"

#include <format>

#include "stanza/log.hpp"
#include "stanza/name_matcher.hpp"


namespace Stanza {

    std::string ReadStack::path() const {
        std::string out = "$";
        for (std::size_t i = 0; i < m_Frames.size(); i++) {
            const ReadFrame& f = m_Frames[i];
            if (f.type == ReadFrame::kind::object) {
                if (f.property) std::format_to(std::back_inserter(out), ".{}", f.property->name);
            } else if (f.in_element) {
                std::format_to(std::back_inserter(out), "[{}]", f.index);
            }
        }
        return out;
    }

    Deserializer::Deserializer(const Options& options, const TypeDescriptor& type, void* root) noexcept
        : m_Stack{ options }, m_Type{ type }, m_Root{ root } {}

    Error Deserializer::fail(Error e) {
        if (e.path.empty() && e.kind != Error::category::callback) e.path = m_Stack.path();
        STANZA_LOG_DEBUG("reading {} failed at {}: {}", m_Type.name, e.path, e.msg);
        m_Stage = stage::failed;
        m_Failure = e;
        return e;
    }

    Result<bool> Deserializer::run(Reader& reader) {
        if (m_Stage == stage::failed) return std::unexpected(*m_Failure);

        if (m_Stage == stage::start) {
            auto converter = m_Stack.options().converter_for(m_Type);
            if (!converter) return std::unexpected(fail(std::move(converter.error())));
            m_Converter = *converter;
            m_Stage = stage::running;
        }

        for (;;) {
            auto more = reader.read();
            if (!more) return std::unexpected(fail(std::move(more.error())));
            if (!*more) {
                if (!reader.is_final()) return false;
                if (m_Stage != stage::done)
                    return std::unexpected(fail(reader.error(Error::code::unexpected_end_of_input, "Unexpected end of input")));
                return true;
            }

            auto s = on_token(reader);
            if (!s) return std::unexpected(fail(std::move(s.error())));
            if (*s == step::need_more) return false;
        }
    }

    Result<Deserializer::step> Deserializer::on_token(Reader& reader) {
        if (m_SkipDepth > 0) {
            switch (reader.token()) {
            case token_type::start_object:
            case token_type::start_array: m_SkipDepth++; break;
            case token_type::end_object:
            case token_type::end_array: m_SkipDepth--; break;
            default: break;
            }
            return step::next;
        }

        if (m_Stack.empty()) return dispatch(reader, m_Converter, m_Root, false);
        if (m_Stack.top().type == ReadFrame::kind::object) return on_member(reader);
        return on_element(reader);
    }

    Result<Deserializer::step> Deserializer::on_member(Reader& reader) {
        ReadFrame& f = m_Stack.top();
        switch (reader.token()) {
        case token_type::end_object:
            return end_object(reader);

        case token_type::property_name: {
            std::string_view name = reader.raw();
            if (reader.has_escapes()) {
                detail::unescape(name, m_Scratch);
                name = m_Scratch;
            }
            f.property = match_property(*f.meta, name, f.hint);
            if (!f.property) STANZA_LOG_TRACE("{}: no property matches '{}'", f.meta->type->name, name);
            return step::next;
        }

        default: {
            const PropertyMetadata* p = f.property;
            if (!p || p->read_only()) {
                if (reader.token() == token_type::start_object || reader.token() == token_type::start_array) m_SkipDepth = 1;
                return step::next;
            }
            return dispatch(reader, p->converter, p->accessor.get_mut(f.dest), p->policy.ignore_null_on_read);
        }
        }
    }

    Result<Deserializer::step> Deserializer::on_element(Reader& reader) {
        if (reader.token() == token_type::end_array) return end_collection(reader);

        ReadFrame& f = m_Stack.top();
        void* slot = f.pending;
        if (!slot) {
            slot = f.buffer.append();
            f.index = f.buffer.size() - 1;
        }
        f.pending = nullptr;
        f.in_element = true;

        const Converter* element = &f.collection->element();
        auto s = dispatch(reader, element, slot, false);
        // Only value converters ask for more input, so no frame was pushed
        if (s && *s == step::need_more) m_Stack.top().pending = slot;
        return s;
    }

    Result<Deserializer::step> Deserializer::dispatch(Reader& reader, const Converter* converter, void* dest, bool ignore_null) {
        const token_type t = reader.token();

        if (t == token_type::null) {
            if (ignore_null) return value_done();
            if (!converter->handles_null())
                return std::unexpected(reader.error(Error::code::invalid_value, std::format("Cannot convert null to '{}'", converter->type().name)));
            if (auto r = converter->try_read(reader, dest, m_Stack); !r) return std::unexpected(std::move(r.error()));
            return value_done();
        }

        const Converter* target = converter->target(dest);
        if (!target)
            return std::unexpected(Error::make(Error::category::unsupported_type, std::format("Type '{}' cannot be constructed", converter->type().name)));

        switch (target->kind()) {
        case strategy::value: {
            std::size_t depth = reader.depth();
            if (t == token_type::start_object || t == token_type::start_array) {
                auto complete = reader.can_skip();
                if (!complete) return std::unexpected(std::move(complete.error()));
                if (!*complete) {
                    reader.rewind_last();
                    return step::need_more;
                }
                depth--;
            }
            if (auto r = target->try_read(reader, dest, m_Stack); !r) return std::unexpected(std::move(r.error()));
            if (reader.depth() != depth)
                return std::unexpected(reader.error(Error::code::invalid_value,
                    std::format("Converter for '{}' did not consume the whole value", target->type().name)));
            return value_done();
        }

        case strategy::object: {
            if (t != token_type::start_object)
                return std::unexpected(reader.error(Error::code::invalid_value, std::format("Expected an object for '{}'", target->type().name)));
            auto meta = static_cast<const ObjectConverter*>(target)->metadata();
            if (!meta) return std::unexpected(std::move(meta.error()));

            ReadFrame& f = m_Stack.push();
            f.type = ReadFrame::kind::object;
            f.dest = dest;
            f.meta = *meta;
            if (f.meta->callbacks.on_deserializing) {
                if (auto r = f.meta->callbacks.on_deserializing(dest); !r) return std::unexpected(std::move(r.error()));
            }
            return step::next;
        }

        case strategy::collection: {
            if (t != token_type::start_array)
                return std::unexpected(reader.error(Error::code::invalid_value, std::format("Expected an array for '{}'", target->type().name)));
            auto* collection = static_cast<const CollectionConverter*>(target);
            if (!collection->readable())
                return std::unexpected(Error::make(Error::category::unsupported_type,
                    std::format("Type '{}' cannot be read: no way to build it from elements", target->type().name)));

            ElementBuffer buffer{ target->type().sequence };
            ReadFrame& f = m_Stack.push();
            f.type = ReadFrame::kind::collection;
            f.dest = dest;
            f.collection = collection;
            f.buffer = std::move(buffer);
            return step::next;
        }
        }
        return std::unexpected(Error::make(Error::category::unsupported_type, std::format("No converter for type '{}'", target->type().name)));
    }

    Result<Deserializer::step> Deserializer::end_object(Reader&) {
        ReadFrame& f = m_Stack.top();
        f.property = nullptr;
        if (f.meta->callbacks.on_deserialized) {
            if (auto r = f.meta->callbacks.on_deserialized(f.dest); !r) return std::unexpected(std::move(r.error()));
        }
        m_Stack.pop();
        return value_done();
    }

    Result<Deserializer::step> Deserializer::end_collection(Reader& reader) {
        ReadFrame& f = m_Stack.top();
        f.in_element = false;

        const std::size_t extent = f.collection->type().sequence.extent;
        if (extent != 0 && f.buffer.size() != extent)
            return std::unexpected(reader.error(Error::code::invalid_value,
                std::format("Expected {} elements for '{}', got {}", extent, f.collection->type().name, f.buffer.size())));

        if (auto r = f.collection->materialize(f.buffer.data(), f.dest); !r) return std::unexpected(std::move(r.error()));
        m_Stack.pop();
        return value_done();
    }

    Deserializer::step Deserializer::value_done() noexcept {
        if (m_Stack.empty()) m_Stage = stage::done;
        return step::next;
    }

    namespace detail {

        Result<void> deserialize_into(std::string_view json, const Options& options, const TypeDescriptor& type, void* dest) {
            ReaderState state;
            Reader reader{ json, true, state, options.reader_options() };
            Deserializer deserializer{ options, type, dest };
            auto r = deserializer.run(reader);
            if (!r) return std::unexpected(std::move(r.error()));
            return {};
        }

    } // namespace detail

} // namespace Stanza
