/*───────────────────────────────────────────────────────────
 *  common.hpp   –  logging + small shared helpers
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <algorithm>
#include <string>
#include <vector>

namespace induct {

/* ---------- logging ---------- */
enum class LogLevel : int { kInfo = 0, kWarn = 1, kError = 2, kSilent = 3 };

void     set_log_level(LogLevel lv);
LogLevel log_level();

void logI(const std::string& s);
void logW(const std::string& s);
void logE(const std::string& s);

/* ---------- numeric helpers ---------- */
template <typename T>
inline T clamp_val(const T& v, const T& lo, const T& hi)
{
    return std::max(lo, std::min(v, hi));
}

/* trims ASCII whitespace from both ends */
std::string trim_copy(const std::string& s);
std::string to_lower_copy(std::string s);

/* fixed-point text, e.g. fmt_fixed(87.25, 1) -> "87.3" */
std::string fmt_fixed(double v, int digits);

/* ---------- file helpers ---------- */
bool file_exists(const std::string& path);

/* write to <path>.tmp then rename over <path>; throws Error on failure */
void write_file_atomic(const std::string& path, const std::string& content);
std::string read_file(const std::string& path);

/* ISO-8601 local timestamp, seconds precision */
std::string now_iso8601();

} // namespace induct
