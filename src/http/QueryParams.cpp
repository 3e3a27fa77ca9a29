#include "http/QueryParams.hpp"

#include <charconv>

namespace ohlcv::http {
namespace {

int hexDigit(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

}  // namespace

std::string url_decode(std::string_view value, bool plusAsSpace) {
    std::string out;
    out.reserve(value.size());
    std::size_t i = 0;
    while (i < value.size()) {
        const char ch = value[i];
        if (ch == '%' && i + 2 < value.size()) {
            const int hi = hexDigit(value[i + 1]);
            const int lo = hexDigit(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 3;
                continue;
            }
        }
        out.push_back(ch == '+' && plusAsSpace ? ' ' : ch);
        ++i;
    }
    return out;
}

QueryString::QueryString(std::string_view raw) {
    while (!raw.empty()) {
        const auto amp = raw.find('&');
        const auto part = raw.substr(0, amp);
        raw = amp == std::string_view::npos ? std::string_view{} : raw.substr(amp + 1);
        if (part.empty()) {
            continue;
        }
        const auto eq = part.find('=');
        if (eq == std::string_view::npos) {
            params_.emplace_back(url_decode(part, true), std::string{});
        } else {
            params_.emplace_back(url_decode(part.substr(0, eq), true), url_decode(part.substr(eq + 1), true));
        }
    }
}

std::optional<std::string> QueryString::value(std::string_view key) const {
    for (const auto& [name, text] : params_) {
        if (name == key) {
            return text;
        }
    }
    return std::nullopt;
}

std::optional<std::int64_t> QueryString::integer(std::string_view key) const {
    const auto text = value(key);
    if (!text || text->empty()) {
        return std::nullopt;
    }
    std::int64_t parsed = 0;
    const auto* end = text->data() + text->size();
    const auto [ptr, ec] = std::from_chars(text->data(), end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return parsed;
}

}  // namespace ohlcv::http
