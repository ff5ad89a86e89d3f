#include "stanza/writer.hpp"

#include <charconv>
#include <cmath>


namespace Stanza {

    namespace {
        void append_escaped(std::string& out, std::string_view s) {
            out.push_back('"');
            for (unsigned char c : s) {
                switch (c) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\b': out += "\\b"; break;
                case '\f': out += "\\f"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (c < 0x20) {
                        static constexpr char hex[] = "0123456789ABCDEF";
                        out += "\\u00";
                        out.push_back(hex[(c >> 4) & 0xF]);
                        out.push_back(hex[c & 0xF]);
                    } else {
                        out.push_back(static_cast<char>(c));
                    }
                    break;
                }
            }
            out.push_back('"');
        }
    } // namespace

    bool append_quoted(std::string& out, std::string_view s) {
        std::size_t bad = 0;
        if (!detail::is_valid_utf8(s, bad)) return false;
        append_escaped(out, s);
        return true;
    }

    void Writer::indent() {
        if (!m_Options.pretty) return;
        m_Buffer.push_back('\n');
        m_Buffer.append(depth() * m_Options.indent, ' ');
    }

    void Writer::before_value() {
        if (m_AfterName) {
            m_AfterName = false;
            return;
        }
        if (m_HasItems.empty()) return;
        if (m_HasItems.top()) m_Buffer.push_back(',');
        else m_HasItems.set_top(true);
        indent();
    }

    Result<void> Writer::start_container(char open) {
        if (m_Options.max_depth != 0 && depth() + 1 > m_Options.max_depth)
            return std::unexpected(Error::make(Error::category::depth_exceeded, "Maximum nesting depth exceeded"));
        before_value();
        m_Buffer.push_back(open);
        m_HasItems.push(false);
        return {};
    }

    void Writer::end_container(char close) {
        bool had_items = m_HasItems.pop();
        if (had_items) indent();
        m_Buffer.push_back(close);
    }

    Result<void> Writer::start_object() { return start_container('{'); }
    Result<void> Writer::start_array() { return start_container('['); }

    Result<void> Writer::end_object() {
        end_container('}');
        return {};
    }

    Result<void> Writer::end_array() {
        end_container(']');
        return {};
    }

    void Writer::property_name(std::string_view encoded) {
        before_value();
        m_Buffer += encoded;
        m_Buffer += m_Options.pretty ? ": " : ":";
        m_AfterName = true;
    }

    Result<void> Writer::property(std::string_view name) {
        std::string encoded;
        if (!append_quoted(encoded, name))
            return std::unexpected(Error::make(Error::category::write, "Invalid UTF-8 in property name"));
        property_name(encoded);
        return {};
    }

    void Writer::null() {
        before_value();
        m_Buffer += "null";
    }

    void Writer::boolean(bool v) {
        before_value();
        m_Buffer += v ? "true" : "false";
    }

    void Writer::number(std::int64_t v) {
        before_value();
        char buf[24];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
        m_Buffer.append(buf, ptr);
    }

    void Writer::number(std::uint64_t v) {
        before_value();
        char buf[24];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
        m_Buffer.append(buf, ptr);
    }

    Result<void> Writer::number(double v) {
        if (!std::isfinite(v)) return std::unexpected(Error::make(Error::category::write, "Cannot write a non-finite number"));
        before_value();
        char buf[64];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
        m_Buffer.append(buf, ptr);
        return {};
    }

    Result<void> Writer::number(float v) {
        if (!std::isfinite(v)) return std::unexpected(Error::make(Error::category::write, "Cannot write a non-finite number"));
        before_value();
        char buf[64];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
        m_Buffer.append(buf, ptr);
        return {};
    }

    Result<void> Writer::string(std::string_view v) {
        // Validate before the separator goes out
        std::size_t bad = 0;
        if (!detail::is_valid_utf8(v, bad)) return std::unexpected(Error::make(Error::category::write, "Invalid UTF-8 in string value"));
        before_value();
        append_escaped(m_Buffer, v);
        return {};
    }

    Result<void> Writer::flush_if_needed() {
        if (!m_Sink || m_Buffer.size() < m_Options.flush_threshold) return {};
        return flush();
    }

    Result<void> Writer::flush() {
        if (!m_Sink || m_Buffer.empty()) return {};
        auto r = m_Sink(m_Buffer);
        m_Buffer.clear();
        return r;
    }

} // namespace Stanza
