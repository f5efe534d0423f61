#include <od/timestamp.h>

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace od {

namespace {
    // Civil calendar <-> day count since 1970-01-01 (proleptic Gregorian).
    int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
        y -= m <= 2;
        const int64_t era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }

    void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
        z += 719468;
        const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        d = doy - (153 * mp + 2) / 5 + 1;
        m = mp < 10 ? mp + 3 : mp - 9;
        y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2);
    }

    bool is_leap(int64_t y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

    unsigned days_in_month(int64_t y, unsigned m) {
        static const unsigned table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        return m == 2 && is_leap(y) ? 29 : table[m - 1];
    }

    int64_t floor_div(int64_t a, int64_t b) {
        int64_t q = a / b;
        if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
        return q;
    }

    // Read exactly `n` digits at `pos`.
    bool digits(const std::string& s, size_t pos, size_t n, int& out) {
        if (pos + n > s.size()) return false;
        int v = 0;
        for (size_t k = pos; k < pos + n; ++k) {
            if (!std::isdigit(static_cast<unsigned char>(s[k]))) return false;
            v = v * 10 + (s[k] - '0');
        }
        out = v;
        return true;
    }
}

int64_t Timestamp::year() const noexcept {
    int64_t local = seconds + int64_t(offset_minutes) * 60;
    int64_t y;
    unsigned m, d;
    civil_from_days(floor_div(local, 86400), y, m, d);
    return y;
}

std::optional<Timestamp> parse_rfc3339(const std::string& s) {
    if (s.size() < 20) return std::nullopt;

    int year, month, day, hour, minute, second;
    if (!digits(s, 0, 4, year) || s[4] != '-' || !digits(s, 5, 2, month) || s[7] != '-' ||
        !digits(s, 8, 2, day) || s[10] != 'T' || !digits(s, 11, 2, hour) || s[13] != ':' ||
        !digits(s, 14, 2, minute) || s[16] != ':' || !digits(s, 17, 2, second))
        return std::nullopt;

    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || unsigned(day) > days_in_month(year, unsigned(month))) return std::nullopt;
    if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

    size_t pos = 19;
    int32_t nanos = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        size_t start = pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
        size_t n = pos - start;
        if (n == 0) return std::nullopt;
        // Digits past nanosecond precision are dropped.
        size_t used = std::min<size_t>(n, 9);
        for (size_t k = start; k < start + used; ++k) nanos = nanos * 10 + (s[k] - '0');
        for (size_t k = used; k < 9; ++k) nanos *= 10;
    }

    int32_t offset = 0;
    if (pos < s.size() && s[pos] == 'Z') {
        ++pos;
    } else if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
        int sign = s[pos] == '-' ? -1 : 1;
        int oh, om;
        if (!digits(s, pos + 1, 2, oh) || pos + 3 >= s.size() || s[pos + 3] != ':' ||
            !digits(s, pos + 4, 2, om))
            return std::nullopt;
        if (oh > 23 || om > 59) return std::nullopt;
        offset = sign * (oh * 60 + om);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != s.size()) return std::nullopt;

    Timestamp ts;
    int64_t days = days_from_civil(year, unsigned(month), unsigned(day));
    ts.seconds = days * 86400 + hour * 3600 + minute * 60 + second - int64_t(offset) * 60;
    ts.nanos = nanos;
    ts.offset_minutes = offset;
    return ts;
}

std::string format_rfc3339(const Timestamp& ts) {
    int64_t local = ts.seconds + int64_t(ts.offset_minutes) * 60;
    int64_t days = floor_div(local, 86400);
    int64_t rem = local - days * 86400;
    int64_t y;
    unsigned m, d;
    civil_from_days(days, y, m, d);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d", static_cast<long long>(y), m, d,
                  int(rem / 3600), int(rem % 3600 / 60), int(rem % 60));
    std::string out = buf;

    if (ts.nanos != 0) {
        std::snprintf(buf, sizeof(buf), ".%09d", int(ts.nanos));
        std::string frac = buf;
        while (frac.back() == '0') frac.pop_back();
        out += frac;
    }

    if (ts.offset_minutes == 0) {
        out += 'Z';
    } else {
        int off = ts.offset_minutes < 0 ? -ts.offset_minutes : ts.offset_minutes;
        std::snprintf(buf, sizeof(buf), "%c%02d:%02d", ts.offset_minutes < 0 ? '-' : '+', off / 60, off % 60);
        out += buf;
    }
    return out;
}

} // namespace od
