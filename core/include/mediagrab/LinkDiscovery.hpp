// Link discovery: extract downloadable audio links from an HTML page.
// Pure functions; fetching the page is the caller's job (HttpClient::fetchText).
#pragma once
#include "Types.hpp"
#include <string>
#include <vector>

namespace mediagrab {

// Audio extensions accepted by discovery (lowercase, with leading dot).
const std::vector<std::string>& mediaExtensions();

// True if the lowercased URL ends with a media extension or with its
// "download" variant (".mp3download", ".flacdownload", ...).
bool isMediaUrl(const std::string& url);

// Rewrite a trailing ".mp3download"-style suffix to the real extension.
std::string fixDownloadSuffix(const std::string& name);

// Scan <a href> anchors, resolve them against pageUrl and keep media links.
// Names come from the anchor text, falling back to the last path segment.
// Order follows the document; duplicates are kept.
std::vector<Resource> extractMediaLinks(const std::string& html, const std::string& pageUrl);

// Resolve ref against base with libcurl's URL parser. Empty if either fails
// to parse (a bad base still accepts an absolute ref).
std::string resolveUrl(const std::string& base, const std::string& ref);

// Decode %XX escapes ("+" is left as is). Uses curl_easy_unescape.
std::string percentDecode(const std::string& text);

// Key used to detect already-known links: trimmed, scheme and host lowercased,
// fragment removed.
std::string normalizeUrl(const std::string& url);

} // namespace mediagrab
