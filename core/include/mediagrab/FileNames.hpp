// File name helpers used when creating items from discovered links.
#pragma once
#include <string>

namespace mediagrab {

// Remove characters forbidden in file names ( \ / * ? : " < > | ), trim
// surrounding whitespace and convert to Title Case. Returns an empty string
// when nothing usable remains.
std::string sanitizeFileName(const std::string& raw);

// Name used when a link yields no usable title.
inline const char* fallbackFileName() { return "unnamed_file"; }

} // namespace mediagrab
