#include "stanza/policy.hpp"

#include <array>
#include <cctype>

namespace Stanza {

    namespace {
        using layer_order = std::array<const ConfigLayer*, 6>;

        template<typename T>
        T first_set(const layer_order& layers, std::optional<T> ConfigLayer::* field, T fallback) noexcept {
            for (const ConfigLayer* layer : layers) {
                if (layer == nullptr) continue;
                const auto& v = layer->*field;
                if (v.has_value()) return *v;
            }
            return fallback;
        }
    } // namespace

    EffectivePolicy resolve(const LayerPair& property, const LayerPair& cls, const LayerPair& global) noexcept {
        const layer_order layers{
            property.run_time, property.design_time,
            cls.run_time, cls.design_time,
            global.run_time, global.design_time,
        };

        EffectivePolicy p;
        p.case_insensitive = first_set(layers, &ConfigLayer::case_insensitive, p.case_insensitive);
        p.ignore_null_on_read = first_set(layers, &ConfigLayer::ignore_null_on_read, p.ignore_null_on_read);
        p.ignore_null_on_write = first_set(layers, &ConfigLayer::ignore_null_on_write, p.ignore_null_on_write);
        p.enum_as_string = first_set(layers, &ConfigLayer::enum_as_string, p.enum_as_string);
        p.naming = first_set(layers, &ConfigLayer::naming, p.naming);
        return p;
    }

    std::string apply_naming(naming_policy policy, std::string_view declared) {
        std::string out{ declared };
        if (policy != naming_policy::camel_case || out.empty()) return out;

        // "URLValue" -> "urlValue", "ID" -> "id", "FirstName" -> "firstName"
        for (size_t i = 0; i < out.size(); i++) {
            unsigned char c = static_cast<unsigned char>(out[i]);
            if (!std::isupper(c)) break;
            bool next_lower = i + 1 < out.size() && std::islower(static_cast<unsigned char>(out[i + 1]));
            if (i > 0 && next_lower) break;
            out[i] = static_cast<char>(std::tolower(c));
        }
        return out;
    }

} // namespace Stanza
