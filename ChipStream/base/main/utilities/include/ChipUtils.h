#pragma once

#include <stddef.h>     // for size_t
#include <stdint.h>     // for uint8_t
#include <string>       // for string
#include <string_view>  // for string_view

namespace chipstream {

// Random version 4 UUID, lowercase hex.
std::string generateRandomUUID();

// Current UTC time as ISO-8601 with microseconds, e.g. 2024-05-01T12:00:00.123456Z
std::string isoTimestampUTC();

std::string toLower(std::string s);
void ltrim(std::string& s);
void rtrim(std::string& s);
void trim(std::string& s);
std::string trimmed(std::string s);
bool startsWith(std::string_view s, std::string_view prefix);
bool endsWith(std::string_view s, std::string_view suffix);

// Case-insensitive substring test (ASCII folding).
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

/**
 * Lowercased suffix of the last path component, dot included (".mp3").
 * Empty when the name has no dot or is a dotfile such as ".hidden".
 * Both '/' and '\\' count as separators, browsers send either.
 */
std::string fileExtension(const std::string& filename);

// Copies `bytes` as UTF-8, replacing each invalid sequence with U+FFFD.
std::string sanitizeUtf8(std::string_view bytes);

}  // namespace chipstream
