#include "version.hpp"

#include <sstream>
#include <cctype>
#include <algorithm>

namespace KoStore {

namespace {

    struct ParsedVersion {
        bool valid = false;
        std::vector<std::string> core;
        std::vector<std::string> prerelease;
    };

    bool isNumeric(const std::string& s)
    {
        return !s.empty() &&
               std::all_of(s.begin(), s.end(),
                           [](unsigned char c) { return std::isdigit(c); });
    }

    bool isIdentifier(const std::string& s, bool allowHyphen)
    {
        if (s.empty()) {
            return false;
        }
        for (unsigned char c : s) {
            if (!std::isalnum(c) && !(allowHyphen && c == '-')) {
                return false;
            }
        }
        return true;
    }

    // Splits on '.', keeping empty components so "1..2" and "1." are caught
    std::vector<std::string> splitDots(const std::string& s)
    {
        std::vector<std::string> parts;
        std::string::size_type start = 0;
        while (true) {
            auto pos = s.find('.', start);
            if (pos == std::string::npos) {
                parts.push_back(s.substr(start));
                break;
            }
            parts.push_back(s.substr(start, pos - start));
            start = pos + 1;
        }
        return parts;
    }

    ParsedVersion parse(const std::string& input)
    {
        ParsedVersion result;
        std::string s = Version::stripPrefix(input);
        if (s.empty()) {
            return result;
        }

        // Build metadata: validated, then ignored for ordering
        auto plus = s.find('+');
        if (plus != std::string::npos) {
            for (const auto& id : splitDots(s.substr(plus + 1))) {
                if (!isIdentifier(id, true)) {
                    return result;
                }
            }
            s = s.substr(0, plus);
        }

        auto dash = s.find('-');
        std::string core = (dash == std::string::npos) ? s : s.substr(0, dash);
        if (dash != std::string::npos) {
            result.prerelease = splitDots(s.substr(dash + 1));
            for (const auto& id : result.prerelease) {
                if (!isIdentifier(id, true)) {
                    return result;
                }
            }
        }

        result.core = splitDots(core);
        for (const auto& component : result.core) {
            if (!isIdentifier(component, false)) {
                return result;
            }
        }
        if (!isNumeric(result.core.front())) {
            return result;
        }

        result.valid = true;
        return result;
    }

    int compareIdentifiers(const std::string& a, const std::string& b)
    {
        if (isNumeric(a) && isNumeric(b)) {
            // Arbitrary length: drop leading zeros, then longer is bigger
            auto strip = [](const std::string& s) {
                auto pos = s.find_first_not_of('0');
                return pos == std::string::npos ? std::string("0") : s.substr(pos);
            };
            const std::string x = strip(a);
            const std::string y = strip(b);
            if (x.size() != y.size()) {
                return x.size() < y.size() ? -1 : 1;
            }
            int c = x.compare(y);
            return c < 0 ? -1 : (c > 0 ? 1 : 0);
        }
        int c = a.compare(b);
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }

    int compareParsed(const ParsedVersion& a, const ParsedVersion& b)
    {
        const size_t n = std::max(a.core.size(), b.core.size());
        for (size_t i = 0; i < n; ++i) {
            const std::string& x = i < a.core.size() ? a.core[i] : std::string("0");
            const std::string& y = i < b.core.size() ? b.core[i] : std::string("0");
            int c = compareIdentifiers(x, y);
            if (c != 0) {
                return c;
            }
        }

        // A release outranks any of its pre-releases
        if (a.prerelease.empty() || b.prerelease.empty()) {
            if (a.prerelease.empty() && b.prerelease.empty()) {
                return 0;
            }
            return a.prerelease.empty() ? 1 : -1;
        }

        const size_t m = std::min(a.prerelease.size(), b.prerelease.size());
        for (size_t i = 0; i < m; ++i) {
            int c = compareIdentifiers(a.prerelease[i], b.prerelease[i]);
            if (c != 0) {
                return c;
            }
        }
        if (a.prerelease.size() == b.prerelease.size()) {
            return 0;
        }
        return a.prerelease.size() < b.prerelease.size() ? -1 : 1;
    }

} // namespace

// ============================================================================
// Version::compare
// ============================================================================
Ordering Version::compare(const std::string& a, const std::string& b)
{
    const ParsedVersion pa = parse(a);
    const ParsedVersion pb = parse(b);

    if (!pa.valid || !pb.valid) {
        if (!pa.valid && !pb.valid) {
            return Ordering::Equal;
        }
        return pa.valid ? Ordering::Greater : Ordering::Less;
    }

    int c = compareParsed(pa, pb);
    if (c < 0) return Ordering::Less;
    if (c > 0) return Ordering::Greater;
    return Ordering::Equal;
}

bool Version::isNewer(const std::string& remote, const std::string& installed)
{
    return compare(remote, installed) == Ordering::Greater;
}

bool Version::isWellFormed(const std::string& version)
{
    return parse(version).valid;
}

std::string Version::newest(const std::vector<std::string>& versions)
{
    std::string best;
    bool first = true;
    for (const auto& v : versions) {
        if (first || compare(v, best) == Ordering::Greater) {
            best  = v;
            first = false;
        }
    }
    return best;
}

std::string Version::stripPrefix(const std::string& tag)
{
    if (tag.size() > 1 && (tag[0] == 'v' || tag[0] == 'V') &&
        std::isdigit(static_cast<unsigned char>(tag[1]))) {
        return tag.substr(1);
    }
    return tag;
}

const char* toString(Ordering ordering)
{
    switch (ordering) {
    case Ordering::Less:    return "Less";
    case Ordering::Equal:   return "Equal";
    case Ordering::Greater: return "Greater";
    }
    return "Unknown";
}

} // namespace KoStore
