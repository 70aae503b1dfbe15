#pragma once
#include <string>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <vector>

inline std::string Ensure0x(const std::string& in) {
  if (in.size() >= 2 && (in[0] == '0') && (in[1] == 'x' || in[1] == 'X')) return in;
  return std::string("0x") + in;
}

inline std::string Strip0x(const std::string& s) {
  if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) return s.substr(2);
  return s;
}

inline std::string ToLowerHex(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

inline bool IsHexDigits(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isxdigit(c) != 0; });
}

// 0x-prefixed, 20-byte address.
inline bool IsHexAddress(const std::string& s) {
  std::string h = Strip0x(s);
  return s.size() == 42 && h.size() == 40 && IsHexDigits(h);
}

inline bool SameAddress(const std::string& a, const std::string& b) {
  return ToLowerHex(Strip0x(a)) == ToLowerHex(Strip0x(b));
}

inline int HexDigitValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + c - 'a';
  if (c >= 'A' && c <= 'F') return 10 + c - 'A';
  throw std::invalid_argument(std::string("invalid hex digit: ") + c);
}

// Base-unit amounts travel as long double; exact up to 2^64, approximate above.
inline long double HexToUnits(const std::string& hex) {
  std::string h = Strip0x(hex);
  long double v = 0.0L;
  for (char c : h) v = v * 16.0L + static_cast<long double>(HexDigitValue(c));
  return v;
}

// Minimal 0x-quantity ("0x0" for zero), fractional part truncated.
inline std::string UnitsToHex(long double units) {
  static const char* digits = "0123456789abcdef";
  long double v = std::floor(units);
  if (v < 1.0L) return "0x0";
  std::string out;
  while (v >= 1.0L) {
    long double q = std::floor(v / 16.0L);
    int d = static_cast<int>(v - q * 16.0L);
    if (d < 0) d = 0;
    if (d > 15) d = 15;
    out.push_back(digits[d]);
    v = q;
  }
  std::reverse(out.begin(), out.end());
  return "0x" + out;
}

inline unsigned long long HexToULL(const std::string& hex) {
  std::string h = Strip0x(hex);
  if (h.empty()) return 0ULL;
  return std::stoull(h, nullptr, 16);
}

// Odd-length input is left-padded with a zero nibble.
inline std::vector<unsigned char> HexToBytes(const std::string& hex) {
  std::string h = Strip0x(hex);
  if (h.size() % 2) h.insert(h.begin(), '0');
  std::vector<unsigned char> out;
  out.reserve(h.size() / 2);
  for (size_t i = 0; i + 1 < h.size(); i += 2) {
    out.push_back(static_cast<unsigned char>((HexDigitValue(h[i]) << 4) | HexDigitValue(h[i + 1])));
  }
  return out;
}

inline std::string BytesToHex0x(const unsigned char* data, size_t len) {
  static const char* hex = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2 + 2);
  out += "0x";
  for (size_t i = 0; i < len; ++i) { out += hex[data[i] >> 4]; out += hex[data[i] & 0xF]; }
  return out;
}

inline std::string BytesToHex0x(const std::vector<unsigned char>& data) {
  return BytesToHex0x(data.data(), data.size());
}
