#include "stanza/options.hpp"

#include <format>

#include "stanza/converter.hpp"
#include "stanza/log.hpp"
#include "stanza/metadata.hpp"


namespace Stanza {

    Options::Options() : Options(ConfigLayer{}) {}

    Options::Options(const ConfigLayer& design_time)
        : m_Design{ design_time },
          m_Converters{ std::make_unique<ConverterRegistry>(*this) },
          m_Metadata{ std::make_unique<TypeMetadataCache>(*this) } {}

    Options::~Options() = default;

    void Options::freeze() const noexcept {
        bool expected = false;
        if (m_Frozen.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
            STANZA_LOG_DEBUG("options {} frozen", static_cast<const void*>(this));
    }

    Result<void> Options::check_mutable(std::string_view setting) const {
        if (frozen())
            return std::unexpected(Error::make(Error::category::configuration,
                std::format("Cannot change '{}': options are frozen after first use", setting)));
        return {};
    }

    Result<void> Options::set_buffer_size(std::size_t bytes) {
        if (auto r = check_mutable("buffer_size"); !r) return r;
        if (bytes == 0) return std::unexpected(Error::make(Error::category::configuration, "buffer_size must be positive"));
        m_BufferSize = bytes;
        return {};
    }

    Result<void> Options::set_max_buffer_size(std::size_t bytes) {
        if (auto r = check_mutable("max_buffer_size"); !r) return r;
        m_MaxBufferSize = bytes;
        return {};
    }

    Result<void> Options::set_pretty(bool pretty) {
        if (auto r = check_mutable("pretty"); !r) return r;
        m_Pretty = pretty;
        return {};
    }

    Result<void> Options::set_indent(std::size_t spaces) {
        if (auto r = check_mutable("indent"); !r) return r;
        m_Indent = spaces;
        return {};
    }

    Result<void> Options::set_comment_handling(comment_handling handling) {
        if (auto r = check_mutable("comment_handling"); !r) return r;
        m_Comments = handling;
        return {};
    }

    Result<void> Options::set_allow_trailing_commas(bool allow) {
        if (auto r = check_mutable("allow_trailing_commas"); !r) return r;
        m_AllowTrailingCommas = allow;
        return {};
    }

    Result<void> Options::set_max_depth(std::size_t depth) {
        if (auto r = check_mutable("max_depth"); !r) return r;
        m_MaxDepth = depth;
        return {};
    }

    ReaderOptions Options::reader_options() const noexcept {
        ReaderOptions o;
        o.comments = m_Comments;
        o.allow_trailing_commas = m_AllowTrailingCommas;
        o.max_depth = m_MaxDepth;
        return o;
    }

    WriterOptions Options::writer_options() const noexcept {
        WriterOptions o;
        o.pretty = m_Pretty;
        o.indent = m_Indent;
        o.max_depth = m_MaxDepth;
        o.flush_threshold = m_BufferSize;
        return o;
    }

    Result<void> Options::configure_global(const ConfigLayer& layer) {
        if (auto r = check_mutable("global layer"); !r) return r;
        m_Global = layer;
        return {};
    }

    Result<void> Options::configure_type(const TypeDescriptor& type, const ConfigLayer& layer) {
        if (auto r = check_mutable("type layer"); !r) return r;
        m_TypeLayers.insert_or_assign(type.id(), layer);
        return {};
    }

    Result<void> Options::configure_property(const TypeDescriptor& type, std::string_view declared, PropertyConfig config) {
        if (auto r = check_mutable("property configuration"); !r) return r;
        if (type.shape != type_shape::object || type.object.declaration().find(declared) == nullptr)
            return std::unexpected(Error::make(Error::category::configuration,
                std::format("{} declares no property '{}'", type.name, declared)));
        auto& props = m_PropertyConfigs[type.id()];
        auto it = props.find(declared);
        if (it == props.end()) props.emplace(std::string{ declared }, std::move(config));
        else it->second = std::move(config);
        return {};
    }

    const ConfigLayer* Options::type_layer(const TypeDescriptor& type) const noexcept {
        auto it = m_TypeLayers.find(type.id());
        return it == m_TypeLayers.end() ? nullptr : &it->second;
    }

    const PropertyConfig* Options::property_config(const TypeDescriptor& type, std::string_view declared) const noexcept {
        auto t = m_PropertyConfigs.find(type.id());
        if (t == m_PropertyConfigs.end()) return nullptr;
        auto p = t->second.find(declared);
        return p == t->second.end() ? nullptr : &p->second;
    }

    Result<void> Options::add_converter(std::shared_ptr<const Converter> converter) {
        if (auto r = check_mutable("converters"); !r) return r;
        if (!converter) return std::unexpected(Error::make(Error::category::configuration, "Cannot register a null converter"));
        m_Converters->add(std::move(converter));
        return {};
    }

    Result<void> Options::add_converter(ConverterMatcher matcher, ConverterFactory factory) {
        if (auto r = check_mutable("converters"); !r) return r;
        if (!matcher || !factory) return std::unexpected(Error::make(Error::category::configuration, "Converter matcher and factory are required"));
        m_Converters->add(std::move(matcher), std::move(factory));
        return {};
    }

    Result<void> Options::set_enumerable_materializer(std::shared_ptr<const EnumerableMaterializer> materializer) {
        if (auto r = check_mutable("enumerable materializer"); !r) return r;
        m_Converters->set_materializer(std::move(materializer));
        return {};
    }

    Result<const TypeMetadata*> Options::metadata(const TypeDescriptor& type) const {
        freeze();
        return m_Metadata->get_or_build(type);
    }

    Result<const Converter*> Options::converter_for(const TypeDescriptor& type, std::optional<bool> enum_as_string) const {
        freeze();
        if (!enum_as_string) {
            const ConfigLayer* design = type.shape == type_shape::object ? &type.object.declaration().layer : nullptr;
            enum_as_string = resolve({}, { type_layer(type), design }, { &m_Global, &m_Design }).enum_as_string;
        }
        return m_Converters->lookup(type, *enum_as_string);
    }

} // namespace Stanza
