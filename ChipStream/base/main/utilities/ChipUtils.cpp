#include "ChipUtils.h"

#include <stdio.h>    // for snprintf
#include <time.h>     // for gmtime_r, strftime
#include <algorithm>  // for find_if, search
#include <cctype>     // for tolower, isspace
#include <chrono>     // for system_clock
#include <random>     // for mt19937, uniform_int_distribution, random_device

std::string chipstream::generateRandomUUID() {
  static thread_local std::mt19937 rng{std::random_device{}()};

  std::uniform_int_distribution<int> dist(0, 15);

  const char* v = "0123456789abcdef";
  const bool dash[] = {0, 0, 0, 0, 1, 0, 1, 0, 1, 0, 1, 0, 0, 0, 0, 0};

  std::string res;
  for (int i = 0; i < 16; i++) {
    if (dash[i])
      res += "-";
    res += v[dist(rng)];
    res += v[dist(rng)];
  }
  // Version 4, RFC 4122 variant
  res[14] = '4';
  res[19] = v[8 + (dist(rng) & 3)];
  return res;
}

std::string chipstream::isoTimestampUTC() {
  auto now = std::chrono::system_clock::now();
  time_t seconds = std::chrono::system_clock::to_time_t(now);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                    now.time_since_epoch())
                    .count() %
                1000000;

  struct tm parts;
  gmtime_r(&seconds, &parts);

  char date[32];
  strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &parts);
  char out[48];
  snprintf(out, sizeof(out), "%s.%06ldZ", date, (long)micros);
  return std::string(out);
}

std::string chipstream::toLower(std::string s) {
  for (char& c : s)
    c = (char)std::tolower((unsigned char)c);
  return s;
}

void chipstream::ltrim(std::string& s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

void chipstream::rtrim(std::string& s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

void chipstream::trim(std::string& s) {
  ltrim(s);
  rtrim(s);
}

std::string chipstream::trimmed(std::string s) {
  trim(s);
  return s;
}

bool chipstream::startsWith(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

bool chipstream::endsWith(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() &&
         s.substr(s.size() - suffix.size()) == suffix;
}

bool chipstream::containsIgnoreCase(const std::string& haystack,
                                    const std::string& needle) {
  if (needle.empty())
    return true;
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(),
                        needle.end(), [](char a, char b) {
                          return std::tolower((unsigned char)a) ==
                                 std::tolower((unsigned char)b);
                        });
  return it != haystack.end();
}

std::string chipstream::fileExtension(const std::string& filename) {
  size_t slash = filename.find_last_of("/\\");
  std::string base =
      slash == std::string::npos ? filename : filename.substr(slash + 1);

  size_t dot = base.rfind('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == base.size())
    return "";
  return toLower(base.substr(dot));
}

std::string chipstream::sanitizeUtf8(std::string_view bytes) {
  static const char* replacement = "\xEF\xBF\xBD";

  std::string out;
  out.reserve(bytes.size());

  size_t i = 0;
  while (i < bytes.size()) {
    auto b = (unsigned char)bytes[i];
    if (b < 0x80) {
      out.push_back((char)b);
      i++;
      continue;
    }

    // Expected sequence length and the allowed range of the second byte
    size_t need = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (b >= 0xC2 && b <= 0xDF) {
      need = 2;
    } else if (b == 0xE0) {
      need = 3;
      lo = 0xA0;
    } else if (b >= 0xE1 && b <= 0xEC) {
      need = 3;
    } else if (b == 0xED) {
      need = 3;
      hi = 0x9F;
    } else if (b >= 0xEE && b <= 0xEF) {
      need = 3;
    } else if (b == 0xF0) {
      need = 4;
      lo = 0x90;
    } else if (b >= 0xF1 && b <= 0xF3) {
      need = 4;
    } else if (b == 0xF4) {
      need = 4;
      hi = 0x8F;
    } else {
      out += replacement;
      i++;
      continue;
    }

    // Length of the valid prefix; a broken sequence is replaced once
    size_t got = 1;
    while (got < need && i + got < bytes.size()) {
      auto c = (unsigned char)bytes[i + got];
      unsigned char min = got == 1 ? lo : 0x80;
      unsigned char max = got == 1 ? hi : 0xBF;
      if (c < min || c > max)
        break;
      got++;
    }

    if (got == need) {
      out.append(bytes.data() + i, need);
    } else {
      out += replacement;
    }
    i += got;
  }
  return out;
}
