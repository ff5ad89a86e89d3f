#include "stanza/date_time.hpp"

#include <cstdlib>

namespace Stanza {

    using namespace std::chrono;

    namespace {
        constexpr int max_offset_minutes = 14 * 60;

        bool read_digits(std::string_view text, size_t pos, size_t count, int& out) noexcept {
            if (pos + count > text.size()) return false;
            int v = 0;
            for (size_t i = 0; i < count; i++) {
                char c = text[pos + i];
                if (c < '0' || c > '9') return false;
                v = v * 10 + (c - '0');
            }
            out = v;
            return true;
        }

        char* write_padded(char* p, int v, int width) noexcept {
            for (int i = width - 1; i >= 0; i--) {
                p[i] = static_cast<char>('0' + v % 10);
                v /= 10;
            }
            return p + width;
        }
    } // namespace

    DateTime DateTime::from_parts(int year, unsigned month, unsigned day, int hour, int minute, int second, ticks fraction) {
        DateTime dt;
        auto d = local_days{ std::chrono::year{ year } / std::chrono::month{ month } / std::chrono::day{ day } };
        dt.local = local_time<ticks>{ d } + hours{ hour } + minutes{ minute } + seconds{ second } + fraction;
        return dt;
    }

    DateTime DateTime::from_utc(sys_time<ticks> t) {
        DateTime dt;
        dt.local = local_time<ticks>{ t.time_since_epoch() };
        dt.kind = zone::utc;
        return dt;
    }

    sys_time<DateTime::ticks> DateTime::to_utc() const noexcept {
        auto since = local.time_since_epoch();
        if (kind == zone::offset) since -= offset;
        return sys_time<ticks>{ since };
    }

    std::optional<DateTime> parse_date_time(std::string_view text) noexcept {
        // YYYY-MM-DDTHH:MM:SS
        int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
        if (text.size() < 19) return std::nullopt;
        if (!read_digits(text, 0, 4, y) || text[4] != '-') return std::nullopt;
        if (!read_digits(text, 5, 2, mo) || text[7] != '-') return std::nullopt;
        if (!read_digits(text, 8, 2, d) || text[10] != 'T') return std::nullopt;
        if (!read_digits(text, 11, 2, h) || text[13] != ':') return std::nullopt;
        if (!read_digits(text, 14, 2, mi) || text[16] != ':') return std::nullopt;
        if (!read_digits(text, 17, 2, s)) return std::nullopt;

        year_month_day ymd{ std::chrono::year{ y }, std::chrono::month{ static_cast<unsigned>(mo) }, std::chrono::day{ static_cast<unsigned>(d) } };
        if (y < 1 || !ymd.ok() || h > 23 || mi > 59 || s > 59) return std::nullopt;

        size_t pos = 19;
        std::int64_t fraction = 0;
        if (pos < text.size() && text[pos] == '.') {
            pos++;
            size_t digits = 0;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                if (++digits > 7) return std::nullopt;
                fraction = fraction * 10 + (text[pos] - '0');
                pos++;
            }
            if (digits == 0) return std::nullopt;
            for (; digits < 7; digits++) fraction *= 10;
        }

        DateTime dt;
        dt.local = local_time<DateTime::ticks>{ local_days{ ymd } } + hours{ h } + minutes{ mi } + seconds{ s } + DateTime::ticks{ fraction };

        if (pos == text.size()) return dt;

        char z = text[pos];
        if (z == 'Z' && pos + 1 == text.size()) {
            dt.kind = DateTime::zone::utc;
            return dt;
        }
        if ((z == '+' || z == '-') && pos + 6 == text.size() && text[pos + 3] == ':') {
            int oh = 0, om = 0;
            if (!read_digits(text, pos + 1, 2, oh) || !read_digits(text, pos + 4, 2, om)) return std::nullopt;
            if (om > 59) return std::nullopt;
            int total = oh * 60 + om;
            if (total > max_offset_minutes) return std::nullopt;
            dt.kind = DateTime::zone::offset;
            dt.offset = minutes{ z == '-' ? -total : total };
            return dt;
        }
        return std::nullopt;
    }

    std::size_t format_date_time(const DateTime& value, char (&out)[max_date_time_length]) noexcept {
        auto day_point = floor<days>(value.local);
        year_month_day ymd{ day_point };
        int y = static_cast<int>(ymd.year());
        if (y < 1 || y > 9999) return 0;
        if (value.kind == DateTime::zone::offset && std::abs(value.offset.count()) > max_offset_minutes) return 0;

        hh_mm_ss<DateTime::ticks> tod{ value.local - day_point };

        char* p = out;
        p = write_padded(p, y, 4);
        *p++ = '-';
        p = write_padded(p, static_cast<int>(static_cast<unsigned>(ymd.month())), 2);
        *p++ = '-';
        p = write_padded(p, static_cast<int>(static_cast<unsigned>(ymd.day())), 2);
        *p++ = 'T';
        p = write_padded(p, static_cast<int>(tod.hours().count()), 2);
        *p++ = ':';
        p = write_padded(p, static_cast<int>(tod.minutes().count()), 2);
        *p++ = ':';
        p = write_padded(p, static_cast<int>(tod.seconds().count()), 2);

        auto fraction = static_cast<int>(tod.subseconds().count());
        if (fraction != 0) {
            *p++ = '.';
            char digits[7];
            write_padded(digits, fraction, 7);
            int n = 7;
            while (n > 0 && digits[n - 1] == '0') n--;
            for (int i = 0; i < n; i++) *p++ = digits[i];
        }

        switch (value.kind) {
        case DateTime::zone::unspecified: break;
        case DateTime::zone::utc: *p++ = 'Z'; break;
        case DateTime::zone::offset: {
            auto total = value.offset.count();
            *p++ = total < 0 ? '-' : '+';
            if (total < 0) total = -total;
            p = write_padded(p, static_cast<int>(total / 60), 2);
            *p++ = ':';
            p = write_padded(p, static_cast<int>(total % 60), 2);
            break;
        }
        }
        return static_cast<size_t>(p - out);
    }

} // namespace Stanza
