// Title-case sanitizer for display names and destination file names.
#include "mediagrab/FileNames.hpp"
#include <cctype>
#include <cstring>

namespace mediagrab {

namespace {

bool isForbidden(char c) {
    return std::strchr("\\/*?:\"<>|", c) != nullptr && c != '\0';
}

// Bytes >= 0x80 belong to multi-byte UTF-8 letters; keep them inside a word.
bool isWordByte(unsigned char c) {
    return std::isalpha(c) || c >= 0x80;
}

} // namespace

std::string sanitizeFileName(const std::string& raw) {
    std::string kept;
    kept.reserve(raw.size());
    for (char c : raw) {
        if (!isForbidden(c)) kept.push_back(c);
    }

    std::size_t b = 0, e = kept.size();
    while (b < e && std::isspace(static_cast<unsigned char>(kept[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(kept[e - 1]))) --e;
    std::string out = kept.substr(b, e - b);

    // "absolum - live @ fest" -> "Absolum - Live @ Fest"
    bool inWord = false;
    for (char& c : out) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc < 0x80 && std::isalpha(uc)) {
            c = static_cast<char>(inWord ? std::tolower(uc) : std::toupper(uc));
        }
        inWord = isWordByte(uc);
    }
    return out;
}

} // namespace mediagrab
