#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>

static bool all_digits(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

int parse_int(const std::string& value, int min, int max, bool& ok) {
    ok = false;
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size() || v < min || v > max)
            return 0;
        ok = true;
        return v;
    } catch (const std::exception&) {
        return 0;
    }
}

unsigned int parse_uint(const std::string& value, unsigned int min, unsigned int max, bool& ok) {
    ok = false;
    if (!all_digits(value))
        return 0;
    try {
        unsigned long v = std::stoul(value);
        if (v < min || v > max)
            return 0;
        ok = true;
        return static_cast<unsigned int>(v);
    } catch (const std::exception&) {
        return 0;
    }
}

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (!all_digits(value))
        return 0;
    try {
        unsigned long long v = std::stoull(value);
        if (v < min || v > max)
            return 0;
        ok = true;
        return static_cast<size_t>(v);
    } catch (const std::exception&) {
        return 0;
    }
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    std::string val = value;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    unsigned long long mult = 1;
    auto ends_with = [&](const std::string& suf) {
        return val.size() >= suf.size() &&
               val.compare(val.size() - suf.size(), suf.size(), suf) == 0;
    };
    if (ends_with("kb")) {
        mult = 1024ull;
        val.erase(val.size() - 2);
    } else if (ends_with("mb")) {
        mult = 1024ull * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("gb")) {
        mult = 1024ull * 1024 * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("b")) {
        val.pop_back();
    }
    if (!all_digits(val))
        return 0;
    unsigned long long base = 0;
    try {
        base = std::stoull(val);
    } catch (const std::exception&) {
        return 0;
    }
    if (base > ULLONG_MAX / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<size_t>(total);
}

std::chrono::seconds parse_duration(const std::string& value, bool& ok) {
    ok = false;
    if (value.empty())
        return std::chrono::seconds(0);
    char unit = value.back();
    std::string num = value;
    if (unit == 's' || unit == 'm' || unit == 'h')
        num.pop_back();
    else if (std::isdigit(static_cast<unsigned char>(unit)))
        unit = 's';
    else
        return std::chrono::seconds(0);
    if (!all_digits(num))
        return std::chrono::seconds(0);
    long long n = 0;
    try {
        n = std::stoll(num);
    } catch (const std::exception&) {
        return std::chrono::seconds(0);
    }
    ok = true;
    switch (unit) {
    case 'm':
        return std::chrono::minutes(n);
    case 'h':
        return std::chrono::hours(n);
    default:
        return std::chrono::seconds(n);
    }
}

bool is_valid_utf8(const std::string& text) {
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t len = 0;
        unsigned int cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n)
            return false;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates and values past U+10FFFF
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
            return false;
        i += len;
    }
    return true;
}
