// Anchor scanner and URL helpers for link discovery.
#include "mediagrab/LinkDiscovery.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <regex>
#include <curl/curl.h>

namespace mediagrab {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

UrlHandle newUrl() {
    return UrlHandle(curl_url(), &curl_url_cleanup);
}

// Read one part of a parsed URL; empty when the part is absent.
std::string urlPart(CURLU* h, CURLUPart part, unsigned int flags = 0) {
    char* value = nullptr;
    if (curl_url_get(h, part, &value, flags) != CURLUE_OK || !value) return {};
    std::string out(value);
    curl_free(value);
    return out;
}

// Parse `url` with the flags discovery uses for hrefs found in the wild.
bool parseUrl(CURLU* h, const std::string& url) {
    return curl_url_set(h, CURLUPART_URL, url.c_str(),
                        CURLU_URLENCODE | CURLU_NON_SUPPORT_SCHEME) == CURLUE_OK;
}

void appendUtf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x110000) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string decodeEntities(const std::string& s) {
    static const struct { const char* name; const char* text; } kNamed[] = {
        {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""},
        {"apos", "'"}, {"nbsp", " "},
    };
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '&') { out.push_back(s[i]); continue; }
        const std::size_t semi = s.find(';', i + 1);
        if (semi == std::string::npos || semi - i > 10) { out.push_back('&'); continue; }
        const std::string ent = s.substr(i + 1, semi - i - 1);
        bool decoded = false;
        if (!ent.empty() && ent[0] == '#') {
            const bool hex = ent.size() > 1 && (ent[1] == 'x' || ent[1] == 'X');
            const std::string digits = ent.substr(hex ? 2 : 1);
            if (!digits.empty()) {
                char* endp = nullptr;
                const unsigned long cp = std::strtoul(digits.c_str(), &endp, hex ? 16 : 10);
                if (endp && *endp == '\0' && cp > 0) {
                    appendUtf8(out, cp);
                    decoded = true;
                }
            }
        } else {
            for (const auto& n : kNamed) {
                if (ent == n.name) { out += n.text; decoded = true; break; }
            }
        }
        if (decoded) i = semi;
        else out.push_back('&');
    }
    return out;
}

// Text content of an anchor: every text run between tags, trimmed and joined.
std::string anchorText(const std::string& inner) {
    std::string out;
    std::size_t pos = 0;
    while (pos < inner.size()) {
        const std::size_t lt = inner.find('<', pos);
        const std::size_t end = (lt == std::string::npos) ? inner.size() : lt;
        out += trim(decodeEntities(inner.substr(pos, end - pos)));
        if (lt == std::string::npos) break;
        const std::size_t gt = inner.find('>', lt);
        if (gt == std::string::npos) break;
        pos = gt + 1;
    }
    return out;
}

// Position of the '>' closing the tag that starts at `from`, skipping quoted values.
std::size_t findTagEnd(const std::string& html, std::size_t from) {
    char quote = 0;
    for (std::size_t i = from; i < html.size(); ++i) {
        const char c = html[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '>') {
            return i;
        }
    }
    return std::string::npos;
}

bool hrefAttribute(const std::string& attrs, std::string& out) {
    static const std::regex kHref(
        R"re((?:^|\s)href\s*=\s*(?:"([^"]*)"|'([^']*)'|([^\s"'>]+)))re",
        std::regex::icase);
    std::smatch m;
    if (!std::regex_search(attrs, m, kHref)) return false;
    for (int g = 1; g <= 3; ++g) {
        if (m[g].matched) {
            out = decodeEntities(trim(m[g].str()));
            return true;
        }
    }
    return false;
}

std::string lastPathSegment(const std::string& url) {
    UrlHandle h = newUrl();
    if (!h || !parseUrl(h.get(), url)) return {};
    const std::string path = urlPart(h.get(), CURLUPART_PATH);
    const std::size_t p = path.rfind('/');
    return p == std::string::npos ? path : path.substr(p + 1);
}

} // namespace

const std::vector<std::string>& mediaExtensions() {
    static const std::vector<std::string> kExt = {
        ".mp3", ".wav", ".flac", ".ogg", ".m4a", ".aac"
    };
    return kExt;
}

bool isMediaUrl(const std::string& url) {
    const std::string lower = toLower(url);
    for (const auto& ext : mediaExtensions()) {
        if (endsWith(lower, ext) || endsWith(lower, ext + "download")) return true;
    }
    return false;
}

std::string fixDownloadSuffix(const std::string& name) {
    const std::string lower = toLower(name);
    for (const auto& ext : mediaExtensions()) {
        const std::string suffix = ext + "download";
        if (endsWith(lower, suffix)) return name.substr(0, name.size() - suffix.size()) + ext;
    }
    return name;
}

std::vector<Resource> extractMediaLinks(const std::string& html, const std::string& pageUrl) {
    std::vector<Resource> found;
    const std::string lower = toLower(html);

    std::size_t pos = 0;
    while ((pos = lower.find("<a", pos)) != std::string::npos) {
        const char next = (pos + 2 < lower.size()) ? lower[pos + 2] : '\0';
        if (!(std::isspace(static_cast<unsigned char>(next)) || next == '>')) {
            pos += 2;
            continue;
        }
        const std::size_t tagEnd = findTagEnd(html, pos + 2);
        if (tagEnd == std::string::npos) break;

        const std::string attrs = html.substr(pos + 2, tagEnd - pos - 2);
        const std::size_t close = lower.find("</a", tagEnd + 1);
        const std::string inner = (close == std::string::npos)
            ? std::string()
            : html.substr(tagEnd + 1, close - tagEnd - 1);
        pos = (close == std::string::npos) ? tagEnd + 1 : close + 3;

        std::string href;
        if (!hrefAttribute(attrs, href)) continue;

        const std::string absolute = resolveUrl(pageUrl, href);
        if (absolute.empty() || !isMediaUrl(absolute)) continue;

        std::string name = percentDecode(anchorText(inner));
        if (name.empty()) name = percentDecode(lastPathSegment(absolute));
        if (name.empty()) name = "unnamed_file";
        name = fixDownloadSuffix(name);

        found.push_back({absolute, name});
    }
    return found;
}

std::string resolveUrl(const std::string& base, const std::string& ref) {
    UrlHandle h = newUrl();
    if (!h) return {};
    const std::string r = trim(ref);
    if (!parseUrl(h.get(), trim(base))) {
        // Without a usable base only absolute references resolve
        return parseUrl(h.get(), r) ? urlPart(h.get(), CURLUPART_URL) : std::string();
    }
    if (!parseUrl(h.get(), r)) return {};
    return urlPart(h.get(), CURLUPART_URL);
}

std::string percentDecode(const std::string& text) {
    int len = 0;
    char* decoded = curl_easy_unescape(nullptr, text.c_str(), static_cast<int>(text.size()), &len);
    if (!decoded) return text;
    std::string out(decoded, static_cast<std::size_t>(len));
    curl_free(decoded);
    return out;
}

std::string normalizeUrl(const std::string& url) {
    const std::string trimmed = trim(url);
    // Unparsable text is keyed as written, minus the fragment
    const std::string fallback = trimmed.substr(0, trimmed.find('#'));
    UrlHandle h = newUrl();
    if (!h || !parseUrl(h.get(), trimmed)) return fallback;

    const std::string scheme = toLower(urlPart(h.get(), CURLUPART_SCHEME));
    const std::string host = toLower(urlPart(h.get(), CURLUPART_HOST));
    if (curl_url_set(h.get(), CURLUPART_FRAGMENT, nullptr, 0) != CURLUE_OK ||
        (!scheme.empty() &&
         curl_url_set(h.get(), CURLUPART_SCHEME, scheme.c_str(), CURLU_NON_SUPPORT_SCHEME) != CURLUE_OK) ||
        (!host.empty() && curl_url_set(h.get(), CURLUPART_HOST, host.c_str(), 0) != CURLUE_OK)) {
        return fallback;
    }
    return urlPart(h.get(), CURLUPART_URL);
}

} // namespace mediagrab
