#include "hostcaps/probe/version_compare.h"

#include "hostcaps/core/text.h"

#include <cctype>
#include <cstddef>

namespace hostcaps::probe {

namespace {

enum Rank : int {
    RankUnknown = 0,
    RankDev,
    RankAlpha,
    RankBeta,
    RankRc,
    RankNumber,
    RankPatch,
};

bool is_digit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_numeric(const std::string& s)
{
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!is_digit(c)) {
            return false;
        }
    }
    return true;
}

int rank_of(const std::string& seg)
{
    if (is_numeric(seg)) {
        return RankNumber;
    }
    const std::string w = text::lower_ascii(seg);
    if (w == "dev")                return RankDev;
    if (w == "alpha" || w == "a")  return RankAlpha;
    if (w == "beta" || w == "b")   return RankBeta;
    if (w == "rc")                 return RankRc;
    if (w == "pl" || w == "p")     return RankPatch;
    return RankUnknown;
}

int sign(int v)
{
    return (v > 0) - (v < 0);
}

// Compare two digit strings of any length by value.
int compare_numeric(const std::string& a, const std::string& b)
{
    std::size_t ia = a.find_first_not_of('0');
    std::size_t ib = b.find_first_not_of('0');
    const std::string_view da = ia == std::string::npos ? std::string_view{} : std::string_view(a).substr(ia);
    const std::string_view db = ib == std::string::npos ? std::string_view{} : std::string_view(b).substr(ib);

    if (da.size() != db.size()) {
        return da.size() < db.size() ? -1 : 1;
    }
    return sign(da.compare(db));
}

int compare_segment(const std::string& a, const std::string& b)
{
    const int ra = rank_of(a);
    const int rb = rank_of(b);

    if (ra == RankNumber && rb == RankNumber) {
        return compare_numeric(a, b);
    }
    if (ra == RankUnknown && rb == RankUnknown) {
        return sign(text::lower_ascii(a).compare(text::lower_ascii(b)));
    }
    return sign(ra - rb);
}

} // namespace

std::vector<std::string> canonical_version_segments(std::string_view version)
{
    std::vector<std::string> out;
    std::string cur;

    auto flush = [&]() {
        if (!cur.empty()) {
            out.push_back(std::move(cur));
            cur.clear();
        }
    };

    for (char c : version) {
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            flush();
            continue;
        }
        if (!cur.empty() && is_digit(cur.back()) != is_digit(c)) {
            flush();
        }
        cur.push_back(c);
    }
    flush();
    return out;
}

int compare_versions(std::string_view a, std::string_view b)
{
    const auto sa = canonical_version_segments(a);
    const auto sb = canonical_version_segments(b);

    const std::size_t common = sa.size() < sb.size() ? sa.size() : sb.size();
    for (std::size_t i = 0; i < common; ++i) {
        const int c = compare_segment(sa[i], sb[i]);
        if (c != 0) {
            return c;
        }
    }

    if (sa.size() == sb.size()) {
        return 0;
    }

    // Only the first surplus segment decides.
    if (sa.size() > sb.size()) {
        return rank_of(sa[common]) < RankNumber ? -1 : 1;
    }
    return rank_of(sb[common]) < RankNumber ? 1 : -1;
}

} // namespace hostcaps::probe
