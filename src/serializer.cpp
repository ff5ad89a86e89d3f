#include "stanza/engine.hpp"

#include <format>

#include "stanza/log.hpp"


namespace Stanza {

    std::string WriteStack::path() const {
        std::string out = "$";
        for (std::size_t i = 0; i < m_Segments.size(); i++) {
            const Segment& s = m_Segments[i];
            if (s.property) std::format_to(std::back_inserter(out), ".{}", s.property->name);
            else std::format_to(std::back_inserter(out), "[{}]", s.index);
        }
        return out;
    }

    Error WriteStack::annotate(Error e) const {
        // Callback errors are passed through as the callback produced them
        if (e.path.empty() && e.kind != Error::category::callback) e.path = path();
        return e;
    }

    Result<void> ObjectConverter::write(Writer& writer, const void* src, WriteStack& stack) const {
        auto meta = metadata();
        if (!meta) return std::unexpected(stack.annotate(std::move(meta.error())));
        const TypeMetadata& m = **meta;

        if (m.callbacks.on_serializing) {
            if (auto r = m.callbacks.on_serializing(src); !r) return r;
        }
        if (auto r = writer.start_object(); !r) return std::unexpected(stack.annotate(std::move(r.error())));

        for (const PropertyMetadata& p : m.properties) {
            const void* value = p.accessor.get(src);
            if (p.policy.ignore_null_on_write && p.converter->is_null(value)) continue;

            stack.enter(p);
            writer.property_name(p.escaped_name);
            if (auto r = p.converter->write(writer, value, stack); !r) return std::unexpected(stack.annotate(std::move(r.error())));
            stack.leave();

            if (auto r = writer.flush_if_needed(); !r) return std::unexpected(stack.annotate(std::move(r.error())));
        }

        if (m.callbacks.on_serialized) {
            if (auto r = m.callbacks.on_serialized(src, writer); !r) return r;
        }
        return writer.end_object();
    }

    namespace {

        struct ElementContext {
            Writer& writer;
            WriteStack& stack;
            const Converter& element;
            std::size_t index = 0;
        };

    } // namespace

    Result<void> CollectionConverter::write(Writer& writer, const void* src, WriteStack& stack) const {
        if (auto r = writer.start_array(); !r) return std::unexpected(stack.annotate(std::move(r.error())));

        ElementContext ctx{ writer, stack, *m_Element };
        auto visited = type().sequence.for_each(src, &ctx, [](void* c, const void* e) -> Result<void> {
            auto& ctx = *static_cast<ElementContext*>(c);
            ctx.stack.enter(ctx.index++);
            if (auto r = ctx.element.write(ctx.writer, e, ctx.stack); !r) return std::unexpected(ctx.stack.annotate(std::move(r.error())));
            ctx.stack.leave();
            return ctx.writer.flush_if_needed();
        });
        if (!visited) return std::unexpected(stack.annotate(std::move(visited.error())));

        return writer.end_array();
    }

    namespace detail {

        Result<void> serialize_value(Writer& writer, const Options& options, const TypeDescriptor& type, const void* src) {
            auto converter = options.converter_for(type);
            if (!converter) return std::unexpected(std::move(converter.error()));

            WriteStack stack{ options };
            if (auto r = (*converter)->write(writer, src, stack); !r) {
                Error e = stack.annotate(std::move(r.error()));
                STANZA_LOG_DEBUG("writing {} failed at {}: {}", type.name, e.path, e.msg);
                return std::unexpected(std::move(e));
            }
            return writer.flush();
        }

    } // namespace detail

} // namespace Stanza
