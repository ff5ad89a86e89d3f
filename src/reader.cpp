#include "stanza/reader.hpp"


namespace Stanza {

#pragma region Utf8

    namespace detail {

        bool is_valid_utf8(std::string_view s, std::size_t& error_idx) noexcept {
            const unsigned char* data = reinterpret_cast<const unsigned char*>(s.data());
            std::size_t n = s.size();

            for (std::size_t i = 0; i < n;) {
                unsigned char c = data[i];
                if (c <= 0x7F) {
                    i++;
                    continue;
                }

                // Length of the sequence and the allowed range of its second byte
                std::size_t len = 0;
                unsigned char lo = 0x80, hi = 0xBF;
                if (c >= 0xC2 && c <= 0xDF) len = 2;
                else if (c == 0xE0) { len = 3; lo = 0xA0; }
                else if (c == 0xED) { len = 3; hi = 0x9F; }
                else if (c >= 0xE1 && c <= 0xEF) len = 3;
                else if (c == 0xF0) { len = 4; lo = 0x90; }
                else if (c >= 0xF1 && c <= 0xF3) len = 4;
                else if (c == 0xF4) { len = 4; hi = 0x8F; }
                else {
                    error_idx = i;
                    return false;
                }

                if (i + len > n || data[i + 1] < lo || data[i + 1] > hi) {
                    error_idx = i;
                    return false;
                }
                for (std::size_t k = 2; k < len; k++) {
                    if ((data[i + k] & 0xC0) != 0x80) {
                        error_idx = i;
                        return false;
                    }
                }
                i += len;
            }
            return true;
        }

        namespace {
            void append_utf8(std::uint32_t cp, std::string& out) {
                if (cp <= 0x7F) {
                    out.push_back(static_cast<char>(cp));
                } else if (cp <= 0x7FF) {
                    out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                } else if (cp <= 0xFFFF) {
                    out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                } else {
                    out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                }
            }

            /// 1 on success, 0 when the input ends first, -1 on a non-hex digit.
            int read_hex4(std::string_view data, std::size_t pos, std::uint32_t& out) noexcept {
                std::uint32_t val = 0;
                for (std::size_t k = 0; k < 4; k++) {
                    if (pos + k >= data.size()) return 0;
                    char h = data[pos + k];
                    std::uint32_t digit = 0;
                    if (h >= '0' && h <= '9') digit = static_cast<std::uint32_t>(h - '0');
                    else if (h >= 'A' && h <= 'F') digit = static_cast<std::uint32_t>(10 + (h - 'A'));
                    else if (h >= 'a' && h <= 'f') digit = static_cast<std::uint32_t>(10 + (h - 'a'));
                    else return -1;
                    val = (val << 4) | digit;
                }
                out = val;
                return 1;
            }
        } // namespace

        void unescape(std::string_view raw, std::string& out) {
            out.clear();
            out.reserve(raw.size());
            for (std::size_t i = 0; i < raw.size(); i++) {
                char c = raw[i];
                if (c != '\\') {
                    out.push_back(c);
                    continue;
                }
                char esc = raw[++i];
                switch (esc) {
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    std::uint32_t first = 0;
                    read_hex4(raw, i + 1, first);
                    i += 4;
                    if (first >= 0xD800 && first <= 0xDBFF) {
                        std::uint32_t second = 0;
                        read_hex4(raw, i + 3, second);
                        i += 6;
                        first = 0x10000u + (((first - 0xD800) << 10) | (second - 0xDC00));
                    }
                    append_utf8(first, out);
                    break;
                }
                default: out.push_back(esc); break; // '"', '\\', '/'
                }
            }
        }

    } // namespace detail

#pragma endregion
#pragma region Reader

    namespace {
        bool is_ws(char c) noexcept { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }
        bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }
    } // namespace

    Reader::Reader(std::string_view data, bool final_block, ReaderState& state, const ReaderOptions& options) noexcept
        : m_Data{ data }, m_Final{ final_block }, m_State{ state }, m_Options{ options } {
        bool at_start = state.base_offset == 0 && state.containers.empty() && state.next == ReaderState::expect::value;
        if (at_start) {
            constexpr std::string_view bom = "\xEF\xBB\xBF";
            if (data.starts_with(bom)) m_Idx = bom.size();
            // A cut BOM waits for the rest of it.
            else if (!final_block && !data.empty() && bom.starts_with(data)) m_Data = {};
        }
        m_TokenStart = checkpoint();
        m_Rewind = m_TokenStart;
    }

    char Reader::get() noexcept {
        char c = m_Data[m_Idx++];
        if (c == '\n') {
            m_State.line++;
            m_State.column = 1;
        } else m_State.column++;
        return c;
    }

    Reader::Checkpoint Reader::checkpoint() const noexcept {
        Checkpoint cp;
        cp.idx = m_Idx;
        cp.line = m_State.line;
        cp.column = m_State.column;
        cp.next = m_State.next;
        cp.depth = m_State.containers.size();
        cp.top = cp.depth != 0 && m_State.containers.top();
        return cp;
    }

    void Reader::restore(const Checkpoint& cp) noexcept {
        m_Idx = cp.idx;
        m_State.line = cp.line;
        m_State.column = cp.column;
        m_State.next = cp.next;
        while (m_State.containers.size() > cp.depth) m_State.containers.pop();
        // Only the container closed by the rewound token can be missing
        if (m_State.containers.size() < cp.depth) m_State.containers.push(cp.top);
    }

    Error Reader::make_error(Error::code c, std::string_view msg) const {
        return Error::make(Error::category::read, c, m_State.base_offset + m_Idx, m_State.line, m_State.column, msg);
    }

    Error Reader::error_at(std::size_t i, Error::code c, std::string_view msg) const {
        // Strings and literals never span lines
        return Error::make(Error::category::read, c, m_State.base_offset + i, m_State.line, m_State.column + (i - m_Idx), msg);
    }

    Result<Reader::scan> Reader::need_more(std::size_t i, Error::code c, std::string_view msg) const {
        if (!m_Final) return scan::incomplete;
        return std::unexpected(error_at(i, c, msg));
    }

    Error Reader::error(Error::code c, std::string_view msg) const {
        return Error::make(Error::category::read, c, token_offset(), m_TokenStart.line, m_TokenStart.column, msg);
    }

    Result<bool> Reader::read() {
        const Checkpoint start = checkpoint();
        using expect = ReaderState::expect;

        while (true) {
            auto ws = skip_ws_and_comments();
            if (!ws) return std::unexpected(std::move(ws.error()));
            if (*ws == scan::incomplete) {
                restore(start);
                return false;
            }

            m_TokenStart = checkpoint();
            if (eof()) {
                m_Token = token_type::none;
                if (m_State.next == expect::done) return false;
                if (!m_Final) {
                    restore(start);
                    return false;
                }
                switch (m_State.next) {
                case expect::value:
                    if (m_State.containers.empty()) return std::unexpected(make_error(Error::code::unexpected_end_of_input, "Expected JSON value"));
                    return std::unexpected(make_error(Error::code::unexpected_end_of_input, "Unterminated object, expected value after ':'"));
                case expect::name_or_end_object:
                case expect::name:
                    return std::unexpected(make_error(Error::code::unexpected_end_of_input, "Unterminated object, expected '}' or string key"));
                case expect::value_or_end_array:
                case expect::value_after_comma:
                    return std::unexpected(make_error(Error::code::unexpected_end_of_input, "Unterminated array, expected value or ']'"));
                default:
                    return std::unexpected(make_error(Error::code::unexpected_end_of_input,
                        m_State.containers.top() ? "Unterminated object, expected ',' or '}'" : "Unterminated array, expected ',' or ']'"));
                }
            }

            char c = peek();
            Result<scan> r = scan::complete;
            switch (m_State.next) {
            case expect::done:
                return std::unexpected(make_error(Error::code::trailing_characters, "Trailing characters after top-level JSON value"));

            case expect::comma_or_end: {
                bool object = m_State.containers.top();
                if (c == ',') {
                    get();
                    m_State.next = object ? expect::name : expect::value_after_comma;
                    continue;
                }
                if (c == (object ? '}' : ']')) {
                    get();
                    end_container();
                    break;
                }
                return std::unexpected(make_error(Error::code::unexpected_character,
                    object ? "Expected ',' or '}' in object" : "Expected ',' or ']' in array"));
            }

            case expect::name_or_end_object:
            case expect::name:
                if (c == '"') {
                    r = scan_property_name();
                    break;
                }
                if (c == '}') {
                    if (m_State.next == expect::name && !m_Options.allow_trailing_commas)
                        return std::unexpected(make_error(Error::code::trailing_characters, "Trailing commas not allowed"));
                    get();
                    end_container();
                    break;
                }
                return std::unexpected(make_error(Error::code::unexpected_character, "Expected \" to start object key"));

            case expect::value_or_end_array:
            case expect::value_after_comma:
                if (c == ']') {
                    if (m_State.next == expect::value_after_comma && !m_Options.allow_trailing_commas)
                        return std::unexpected(make_error(Error::code::trailing_characters, "Trailing commas not allowed"));
                    get();
                    end_container();
                    break;
                }
                [[fallthrough]];
            case expect::value:
                r = scan_value();
                break;
            }

            if (!r) return std::unexpected(std::move(r.error()));
            if (*r == scan::incomplete) {
                restore(start);
                m_Token = token_type::none;
                return false;
            }
            m_Rewind = start;
            return true;
        }
    }

    std::string Reader::get_string() const {
        std::string out;
        if (m_Escapes) detail::unescape(raw(), out);
        else out.assign(raw());
        return out;
    }

    Result<bool> Reader::can_skip() {
        if (m_Token != token_type::start_object && m_Token != token_type::start_array) return true;

        const Checkpoint here = checkpoint();
        const token_type tok = m_Token;
        const Checkpoint token_start = m_TokenStart, rewind = m_Rewind;
        const std::size_t value_start = m_ValueStart, value_length = m_ValueLength;
        const bool escapes = m_Escapes;

        const std::size_t target = depth() - 1;
        Result<bool> complete = false;
        while (true) {
            auto r = read();
            if (!r) {
                complete = std::unexpected(std::move(r.error()));
                break;
            }
            if (!*r) break;
            if (depth() == target) {
                complete = true;
                break;
            }
        }

        restore(here);
        m_Token = tok;
        m_TokenStart = token_start;
        m_Rewind = rewind;
        m_ValueStart = value_start;
        m_ValueLength = value_length;
        m_Escapes = escapes;
        return complete;
    }

    Result<void> Reader::skip() {
        if (m_Token != token_type::start_object && m_Token != token_type::start_array) return {};
        const std::size_t target = depth() - 1;
        while (depth() > target) {
            auto r = read();
            if (!r) return std::unexpected(std::move(r.error()));
            if (!*r) return std::unexpected(make_error(Error::code::unexpected_end_of_input, "Incomplete value"));
        }
        return {};
    }

    void Reader::rewind_last() noexcept {
        restore(m_Rewind);
        m_TokenStart = m_Rewind;
        m_Token = token_type::none;
    }

    Result<Reader::scan> Reader::skip_ws_and_comments() {
        while (!eof()) {
            char c = peek();
            if (is_ws(c)) {
                get();
                continue;
            }
            if (c != '/') break;

            if (m_Options.comments == comment_handling::disallow)
                return std::unexpected(make_error(Error::code::unexpected_character, "Comments are not allowed"));
            if (m_Idx + 1 >= m_Data.size()) return need_more(m_Idx, Error::code::unexpected_character, "Unexpected '/'");

            char next = m_Data[m_Idx + 1];
            if (next == '/') {
                std::size_t end = m_Data.find('\n', m_Idx + 2);
                if (end == std::string_view::npos) {
                    if (!m_Final) return scan::incomplete;
                    end = m_Data.size();
                }
                while (m_Idx < end) get();
            } else if (next == '*') {
                std::size_t end = m_Data.find("*/", m_Idx + 2);
                if (end == std::string_view::npos) {
                    if (!m_Final) return scan::incomplete;
                    return std::unexpected(make_error(Error::code::unexpected_end_of_input, "Nonterminated block comment"));
                }
                while (m_Idx < end + 2) get();
            } else {
                return std::unexpected(make_error(Error::code::unexpected_character, "Unexpected '/'"));
            }
        }
        return scan::complete;
    }

    Result<Reader::scan> Reader::scan_value() {
        char c = peek();
        switch (c) {
        case '{':
        case '[': {
            if (auto r = start_container(c == '{'); !r) return std::unexpected(std::move(r.error()));
            return scan::complete;
        }
        case '"': {
            get();
            m_ValueStart = m_Idx;
            auto r = scan_string();
            if (!r || *r == scan::incomplete) return r;
            m_Token = token_type::string;
            after_value();
            return scan::complete;
        }
        case 't': return scan_literal("true", token_type::true_value, "Invalid 'true' literal");
        case 'f': return scan_literal("false", token_type::false_value, "Invalid 'false' literal");
        case 'n': return scan_literal("null", token_type::null, "Invalid 'null' literal");
        default:
            if (c == '-' || is_digit(c)) return scan_number();
            if (c == '.') return std::unexpected(make_error(Error::code::invalid_number, "Fractional values must start with a 0"));
            return std::unexpected(make_error(Error::code::unexpected_character, "Unexpected character while parsing value"));
        }
    }

    Result<Reader::scan> Reader::scan_string() {
        const std::size_t n = m_Data.size();
        std::size_t i = m_Idx;
        m_Escapes = false;

        while (true) {
            if (i >= n) return need_more(i, Error::code::unexpected_end_of_input, "Nonterminated string");
            unsigned char c = static_cast<unsigned char>(m_Data[i]);
            if (c == '"') break;
            if (c < 0x20) return std::unexpected(error_at(i, Error::code::invalid_string, "Control character in string"));
            if (c != '\\') {
                i++;
                continue;
            }

            m_Escapes = true;
            if (i + 1 >= n) return need_more(i, Error::code::invalid_escape, "Unfinished escape sequence");
            switch (m_Data[i + 1]) {
            case '"': case '\\': case '/': case 'b': case 'f': case 'n': case 'r': case 't':
                i += 2;
                continue;
            case 'u':
                break;
            default:
                return std::unexpected(error_at(i, Error::code::invalid_escape, "Invalid escape sequence"));
            }

            std::uint32_t first = 0;
            int h = detail::read_hex4(m_Data, i + 2, first);
            if (h == 0) return need_more(i, Error::code::invalid_unicode_escape, "Unexpected end in unicode escape");
            if (h < 0) return std::unexpected(error_at(i, Error::code::invalid_unicode_escape, "Invalid hex digit in unicode escape"));

            if (first >= 0xDC00 && first <= 0xDFFF)
                return std::unexpected(error_at(i, Error::code::invalid_unicode_escape, "Unpaired low surrogate"));
            if (first < 0xD800 || first > 0xDBFF) {
                i += 6;
                continue;
            }

            if (i + 6 >= n) return need_more(i, Error::code::invalid_unicode_escape, "Expected low surrogate after high surrogate");
            if (m_Data[i + 6] != '\\') return std::unexpected(error_at(i, Error::code::invalid_unicode_escape, "Expected low surrogate after high surrogate"));
            if (i + 7 >= n) return need_more(i, Error::code::invalid_unicode_escape, "Expected low surrogate after high surrogate");
            if (m_Data[i + 7] != 'u') return std::unexpected(error_at(i, Error::code::invalid_unicode_escape, "Expected low surrogate after high surrogate"));

            std::uint32_t second = 0;
            h = detail::read_hex4(m_Data, i + 8, second);
            if (h == 0) return need_more(i, Error::code::invalid_unicode_escape, "Unexpected end in unicode escape");
            if (h < 0) return std::unexpected(error_at(i + 6, Error::code::invalid_unicode_escape, "Invalid hex digit in unicode escape"));
            if (second < 0xDC00 || second > 0xDFFF) return std::unexpected(error_at(i + 6, Error::code::invalid_unicode_escape, "Invalid low surrogate"));
            i += 12;
        }

        m_ValueLength = i - m_ValueStart;
        std::size_t bad = 0;
        if (!detail::is_valid_utf8(raw(), bad))
            return std::unexpected(error_at(m_ValueStart + bad, Error::code::invalid_string, "Invalid UTF-8 sequence in string"));

        m_State.column += i + 1 - m_Idx;
        m_Idx = i + 1;
        return scan::complete;
    }

    Result<Reader::scan> Reader::scan_property_name() {
        get();
        m_ValueStart = m_Idx;
        auto r = scan_string();
        if (!r || *r == scan::incomplete) return r;

        auto ws = skip_ws_and_comments();
        if (!ws || *ws == scan::incomplete) return ws;
        if (eof()) return need_more(m_Idx, Error::code::unexpected_end_of_input, "Unterminated object, expected ':' after key");
        if (peek() != ':') return std::unexpected(make_error(Error::code::unexpected_character, "Expected ':' after object key"));
        get();

        m_Token = token_type::property_name;
        m_State.next = ReaderState::expect::value;
        return scan::complete;
    }

    Result<Reader::scan> Reader::scan_number() {
        const std::size_t n = m_Data.size();
        std::size_t i = m_Idx;
        auto at = [&](std::size_t k) { return k < n ? m_Data[k] : '\0'; };

        if (at(i) == '-') {
            i++;
            if (i >= n) return need_more(i, Error::code::unexpected_end_of_input, "Expected digit after '-'");
            if (!is_digit(at(i))) return std::unexpected(error_at(i, Error::code::unexpected_character, "Expected digit after '-'"));
        }

        char first_digit = at(i++);
        if (first_digit == '0' && is_digit(at(i))) return std::unexpected(error_at(i, Error::code::invalid_number, "Leading zeros disallowed"));
        while (is_digit(at(i))) i++;

        if (at(i) == '.') {
            i++;
            if (i >= n) return need_more(i, Error::code::invalid_number, "Expected digit after '.'");
            if (!is_digit(at(i))) return std::unexpected(error_at(i, Error::code::invalid_number, "Expected digit after '.'"));
            while (is_digit(at(i))) i++;
        }

        char p = at(i);
        if (p == 'e' || p == 'E') {
            i++;
            char sign = at(i);
            if (sign == '+' || sign == '-') i++;
            if (i >= n) return need_more(i, Error::code::invalid_number, "Expected digit in exponent");
            if (!is_digit(at(i))) return std::unexpected(error_at(i, Error::code::invalid_number, "Expected digit in exponent"));
            while (is_digit(at(i))) i++;

            char c = at(i);
            if (i < n && !(c == ',' || c == ']' || c == '}' || is_ws(c)))
                return std::unexpected(error_at(i, Error::code::invalid_number, "Invalid character in exponent"));
        }

        // The number may continue in the next block
        if (i >= n && !m_Final) return scan::incomplete;

        m_ValueStart = m_Idx;
        m_ValueLength = i - m_Idx;
        m_Escapes = false;
        m_State.column += i - m_Idx;
        m_Idx = i;
        m_Token = token_type::number;
        after_value();
        return scan::complete;
    }

    Result<Reader::scan> Reader::scan_literal(std::string_view literal, token_type t, std::string_view fail_msg) {
        for (std::size_t k = 0; k < literal.size(); k++) {
            std::size_t i = m_Idx + k;
            if (i >= m_Data.size()) return need_more(i, Error::code::unexpected_end_of_input, fail_msg);
            if (m_Data[i] != literal[k]) return std::unexpected(error_at(i, Error::code::unexpected_character, fail_msg));
        }
        m_ValueStart = m_Idx;
        m_ValueLength = literal.size();
        m_Escapes = false;
        m_State.column += literal.size();
        m_Idx += literal.size();
        m_Token = t;
        after_value();
        return scan::complete;
    }

    Result<void> Reader::start_container(bool object) {
        if (m_Options.max_depth != 0 && depth() + 1 > m_Options.max_depth)
            return std::unexpected(Error::make(Error::category::depth_exceeded, Error::code::none,
                m_State.base_offset + m_Idx, m_State.line, m_State.column, "Maximum nesting depth exceeded"));
        m_ValueStart = m_Idx;
        m_ValueLength = 1;
        get();
        m_State.containers.push(object);
        m_Token = object ? token_type::start_object : token_type::start_array;
        m_State.next = object ? ReaderState::expect::name_or_end_object : ReaderState::expect::value_or_end_array;
        return {};
    }

    void Reader::end_container() {
        bool object = m_State.containers.pop();
        m_ValueStart = m_Idx - 1;
        m_ValueLength = 1;
        m_Token = object ? token_type::end_object : token_type::end_array;
        after_value();
    }

    void Reader::after_value() noexcept {
        m_State.next = m_State.containers.empty() ? ReaderState::expect::done : ReaderState::expect::comma_or_end;
    }

#pragma endregion

} // namespace Stanza
