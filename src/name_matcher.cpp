#include "stanza/name_matcher.hpp"

#include <algorithm>


namespace Stanza {

    namespace {
        constexpr std::size_t inline_bytes = 6;
        constexpr std::size_t max_length = 0xFFFF;

        bool same_bytes(std::string_view stored, std::string_view input, bool fold) noexcept {
            if (stored.size() != input.size()) return false;
            for (std::size_t i = 0; i < input.size(); i++) {
                char c = fold ? ascii_lower(input[i]) : input[i];
                if (c != stored[i]) return false;
            }
            return true;
        }
    } // namespace

    std::uint64_t pack_name_key(std::string_view name, bool fold) noexcept {
        std::uint64_t key = 0;
        std::size_t n = std::min(name.size(), inline_bytes);
        for (std::size_t i = 0; i < n; i++) {
            char c = fold ? ascii_lower(name[i]) : name[i];
            key |= std::uint64_t{ static_cast<unsigned char>(c) } << (8 * i);
        }
        key |= std::uint64_t{ std::min(name.size(), max_length) } << 48;
        return key;
    }

    std::string fold_name(std::string_view name) {
        std::string out{ name };
        for (char& c : out) c = ascii_lower(c);
        return out;
    }

    const PropertyMetadata* match_property(const TypeMetadata& meta, std::string_view name, std::size_t& hint) noexcept {
        const std::size_t n = meta.properties.size();
        if (n == 0) return nullptr;

        const std::uint64_t exact = pack_name_key(name, false);
        const std::uint64_t folded = meta.any_case_insensitive ? pack_name_key(name, true) : exact;

        std::size_t i = hint < n ? hint : 0;
        for (std::size_t tried = 0; tried < n; tried++, i = (i + 1 == n) ? 0 : i + 1) {
            const PropertyMetadata& p = meta.properties[i];
            bool fold = p.policy.case_insensitive;
            if (p.key != (fold ? folded : exact)) continue;
            if (name.size() > inline_bytes && !same_bytes(p.match_bytes, name, fold)) continue;
            hint = i + 1;
            return &p;
        }
        return nullptr;
    }

} // namespace Stanza
