#include "stanza/error.hpp"

#include <format>

namespace Stanza {

    Error Error::make(category k, code c, size_t o, size_t l, size_t col, std::string_view m) {
        Error e;
        e.kind = k;
        e.errc = c;
        e.offset = o;
        e.line = l;
        e.column = col;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    Error Error::make(category k, std::string_view m) {
        Error e;
        e.kind = k;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    Error Error::callback_failed(std::string_view m) {
        return make(category::callback, m);
    }

    std::string_view to_string(Error::category k) noexcept {
        switch (k) {
        case Error::category::configuration: return "ConfigurationError";
        case Error::category::unsupported_type: return "UnsupportedTypeError";
        case Error::category::read: return "ReadError";
        case Error::category::depth_exceeded: return "DepthExceededError";
        case Error::category::write: return "WriteError";
        case Error::category::callback: return "CallbackError";
        case Error::category::cancelled: return "Cancelled";
        }
        return "Error";
    }

    std::string to_string(const Error& e) {
        std::string out{ to_string(e.kind) };
        if (!e.path.empty()) out += std::format(" at {}", e.path);
        if (e.line != 0) out += std::format(" (line {}, column {}, offset {})", e.line, e.column, e.offset);
        out += ": ";
        out += e.msg;
        return out;
    }

} // namespace Stanza
