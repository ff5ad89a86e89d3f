#include "stanza/metadata.hpp"

#include <format>
#include <mutex>

#include "stanza/converter.hpp"
#include "stanza/log.hpp"
#include "stanza/name_matcher.hpp"
#include "stanza/options.hpp"
#include "stanza/writer.hpp"


namespace Stanza {

    const PropertyDeclaration* TypeDeclaration::find(std::string_view declared) const noexcept {
        for (const PropertyDeclaration& p : properties) {
            if (p.name == declared) return &p;
        }
        return nullptr;
    }

    const PropertyMetadata* TypeMetadata::find(std::string_view declared) const noexcept {
        for (const PropertyMetadata& p : properties) {
            if (p.declared_name == declared) return &p;
        }
        return nullptr;
    }

    namespace {
        Error configuration_error(const TypeDescriptor& type, std::string_view msg) {
            return Error::make(Error::category::configuration, std::format("{}: {}", type.name, msg));
        }
    } // namespace

    Result<const TypeMetadata*> TypeMetadataCache::get_or_build(const TypeDescriptor& type) const {
        {
            std::shared_lock lock{ m_Mutex };
            if (auto it = m_Entries.find(type.id()); it != m_Entries.end()) {
                if (!it->second) return std::unexpected(it->second.error());
                return it->second->get();
            }
        }

        // Built without holding the lock; a racing builder's result may win
        Entry built = build(type);

        std::unique_lock lock{ m_Mutex };
        auto [it, inserted] = m_Entries.try_emplace(type.id(), std::move(built));
        if (inserted) {
            if (it->second) STANZA_LOG_DEBUG("metadata for {} published with {} properties", type.name, (*it->second)->properties.size());
            else STANZA_LOG_WARN("metadata for {} failed and is cached: {}", type.name, it->second.error().msg);
        }
        if (!it->second) return std::unexpected(it->second.error());
        return it->second->get();
    }

    TypeMetadataCache::Entry TypeMetadataCache::build(const TypeDescriptor& type) const {
        m_Builds.fetch_add(1, std::memory_order_relaxed);

        if (type.shape != type_shape::object)
            return std::unexpected(Error::make(Error::category::unsupported_type, std::format("Type '{}' has no declaration", type.name)));

        const TypeDeclaration& decl = type.object.declaration();
        const LayerPair global{ &m_Options.global_layer(), &m_Options.design_layer() };
        const LayerPair cls{ m_Options.type_layer(type), &decl.layer };

        auto meta = std::make_shared<TypeMetadata>();
        meta->type = &type;
        meta->policy = resolve({}, cls, global);
        meta->callbacks = decl.callbacks;

        auto own = m_Options.converters().lookup(type, meta->policy.enum_as_string);
        if (!own) return std::unexpected(own.error());
        meta->converter = *own;

        meta->properties.reserve(decl.properties.size());
        for (const PropertyDeclaration& d : decl.properties) {
            const PropertyConfig* run = m_Options.property_config(type, d.name);

            PropertyMetadata p;
            p.declared_name = d.name;
            p.type = &d.type();
            p.accessor = d.accessor;
            p.policy = resolve({ run ? &run->layer : nullptr, &d.layer }, cls, global);

            if (run && run->name) p.name = *run->name;
            else if (d.json_name) p.name = *d.json_name;
            else p.name = apply_naming(p.policy.naming, d.name);

            if (!append_quoted(p.escaped_name, p.name))
                return std::unexpected(configuration_error(type, std::format("property '{}' has a name that is not valid UTF-8", d.name)));

            const std::shared_ptr<const Converter>& selected = (run && run->converter) ? run->converter : d.converter;
            if (selected) {
                if (!selected->type().is(*p.type))
                    return std::unexpected(configuration_error(type, std::format("converter for property '{}' handles '{}', not '{}'",
                        d.name, selected->type().name, p.type->name)));
                p.converter = selected.get();
            } else {
                auto c = m_Options.converters().lookup(*p.type, p.policy.enum_as_string);
                if (!c) {
                    Error e = c.error();
                    e.msg = std::format("{}: property '{}': {}", type.name, d.name, e.msg);
                    return std::unexpected(std::move(e));
                }
                p.converter = *c;
            }

            bool fold = p.policy.case_insensitive;
            p.match_bytes = fold ? fold_name(p.name) : p.name;
            p.key = pack_name_key(p.name, fold);
            meta->any_case_insensitive = meta->any_case_insensitive || fold;

            for (const PropertyMetadata& other : meta->properties) {
                if (other.name == p.name)
                    return std::unexpected(configuration_error(type, std::format("duplicate property name '{}'", p.name)));
                if ((fold || other.policy.case_insensitive) && fold_name(other.name) == fold_name(p.name))
                    return std::unexpected(configuration_error(type, std::format("property names '{}' and '{}' collide when case is ignored", other.name, p.name)));
            }
            meta->properties.push_back(std::move(p));
        }
        return meta;
    }

} // namespace Stanza
