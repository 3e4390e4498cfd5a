#include "eegmon/utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace eegmon {

static inline bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
  size_t b = 0;
  while (b < s.size() && is_space(s[b])) ++b;
  size_t e = s.size();
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

std::string strip_utf8_bom(std::string s) {
  // UTF-8 BOM bytes: EF BB BF
  if (s.size() >= 3) {
    const unsigned char b0 = static_cast<unsigned char>(s[0]);
    const unsigned char b1 = static_cast<unsigned char>(s[1]);
    const unsigned char b2 = static_cast<unsigned char>(s[2]);
    if (b0 == 0xEF && b1 == 0xBB && b2 == 0xBF) {
      return s.substr(3);
    }
  }
  return s;
}

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    out.push_back(item);
  }
  // Handle trailing empty field
  if (!s.empty() && s.back() == delim) out.emplace_back("");
  return out;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int to_int(const std::string& s) {
  try {
    const std::string t = trim(s);
    size_t idx = 0;
    int v = std::stoi(t, &idx, 10);
    if (idx == 0) throw std::invalid_argument("no digits");
    // Be strict: reject trailing garbage like "12abc".
    // (Trailing whitespace is already removed by trim().)
    if (idx != t.size()) throw std::invalid_argument("trailing characters");
    return v;
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse int from '" + s + "': " + e.what());
  }
}

double to_double(const std::string& s) {
  try {
    const std::string t = trim(s);
    if (t.empty()) throw std::invalid_argument("empty");

    auto parse_classic = [](const std::string& x, double* out) -> bool {
      if (!out) return false;
      std::istringstream iss(x);
      iss.imbue(std::locale::classic());
      double v = 0.0;
      iss >> v;
      if (!iss) return false;
      // Allow trailing whitespace, but reject any other trailing characters.
      iss >> std::ws;
      if (!iss.eof()) return false;
      *out = v;
      return true;
    };

    double v = 0.0;
    if (parse_classic(t, &v)) return v;

    // Users may provide a decimal comma (e.g. "0,5"). Either parse it
    // correctly or throw; never silently parse the "0".
    if (t.find('.') == std::string::npos) {
      const size_t cpos = t.find(',');
      if (cpos != std::string::npos) {
        if (t.find(',', cpos + 1) == std::string::npos) {
          std::string tc = t;
          tc[cpos] = '.';
          if (parse_classic(tc, &v)) return v;
        }
      }
    }

    throw std::invalid_argument("invalid");
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse double from '" + s + "': " + e.what());
  }
}

bool to_bool(const std::string& s) {
  const std::string t = to_lower(trim(s));
  if (t == "1" || t == "true" || t == "yes" || t == "on") return true;
  if (t == "0" || t == "false" || t == "no" || t == "off") return false;
  throw std::runtime_error("Failed to parse bool from '" + s + "'");
}

bool file_exists(const std::string& path) {
  return std::filesystem::exists(std::filesystem::u8path(path));
}

void ensure_directory(const std::string& path) {
  if (path.empty()) return;
  std::filesystem::create_directories(std::filesystem::u8path(path));
}

std::string join_path(const std::string& dir, const std::string& name) {
  if (dir.empty()) return name;
  return (std::filesystem::u8path(dir) / std::filesystem::u8path(name)).u8string();
}

bool write_text_file(const std::string& path, const std::string& content) {
  const std::filesystem::path p = std::filesystem::u8path(path);
  std::error_code ec;
  if (p.has_parent_path()) {
    std::filesystem::create_directories(p.parent_path(), ec);
  }

  std::ofstream out(p, std::ios::binary);
  if (!out) return false;
  out << content;
  return static_cast<bool>(out);
}

namespace {

static bool localtime_safe(std::time_t t, std::tm* out) {
#if defined(_WIN32)
  return out && localtime_s(out, &t) == 0;
#else
  return out && localtime_r(&t, out) != nullptr;
#endif
}

static bool gmtime_safe(std::time_t t, std::tm* out) {
#if defined(_WIN32)
  return out && gmtime_s(out, &t) == 0;
#else
  return out && gmtime_r(&t, out) != nullptr;
#endif
}

static long utc_offset_seconds(std::time_t t) {
  std::tm local_tm{};
  std::tm gm_tm{};
  if (!localtime_safe(t, &local_tm) || !gmtime_safe(t, &gm_tm)) return 0;

  // mktime() interprets its input as local time, so converting both broken-down
  // times yields the local UTC offset (including DST) for this instant.
  std::tm gm_as_local = gm_tm;
  gm_as_local.tm_isdst = -1;

  const std::time_t local_tt = std::mktime(&local_tm);
  const std::time_t gm_local_tt = std::mktime(&gm_as_local);
  if (local_tt == (std::time_t)-1 || gm_local_tt == (std::time_t)-1) return 0;

  return static_cast<long>(std::difftime(local_tt, gm_local_tt));
}

static std::string format_utc_offset(long offset_seconds) {
  char sign = '+';
  if (offset_seconds < 0) {
    sign = '-';
    offset_seconds = -offset_seconds;
  }

  const long total_minutes = offset_seconds / 60;
  const long hh = total_minutes / 60;
  const long mm = total_minutes % 60;

  std::ostringstream oss;
  oss << sign
      << std::setw(2) << std::setfill('0') << hh
      << ":"
      << std::setw(2) << std::setfill('0') << mm;
  return oss.str();
}

static std::string format_local(const char* fmt) {
  const std::time_t t = std::time(nullptr);
  std::tm tm{};
  if (!localtime_safe(t, &tm)) {
    // Fall back to UTC rather than failing a file name or log line.
    if (!gmtime_safe(t, &tm)) return std::string();
  }
  std::ostringstream oss;
  oss << std::put_time(&tm, fmt);
  return oss.str();
}

} // namespace

std::string now_string_local() {
  const std::time_t t = std::time(nullptr);
  return format_local("%Y-%m-%dT%H:%M:%S") + format_utc_offset(utc_offset_seconds(t));
}

std::string now_string_compact() {
  return format_local("%Y%m%d-%H%M%S");
}

std::string hex_bytes(const uint8_t* data, size_t n) {
  static const char* kHex = "0123456789abcdef";
  std::string out;
  if (!data || n == 0) return out;
  out.reserve(n * 3);
  for (size_t i = 0; i < n; ++i) {
    if (i > 0) out.push_back(' ');
    out.push_back(kHex[(data[i] >> 4) & 0x0F]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
  return out;
}

double monotonic_seconds() {
  using clock = std::chrono::steady_clock;
  return std::chrono::duration<double>(clock::now().time_since_epoch()).count();
}

} // namespace eegmon
