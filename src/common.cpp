#include "induct/common.hpp"

#include <atomic>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <sys/stat.h>   // stat

#include "induct/errors.hpp"

namespace induct {

static std::atomic<int> g_log_level{static_cast<int>(LogLevel::kInfo)};

void set_log_level(LogLevel lv) { g_log_level = static_cast<int>(lv); }
LogLevel log_level() { return static_cast<LogLevel>(g_log_level.load()); }

/* ── logging ─────────────────────────────────────────────── */
void logI(const std::string& s)
{
    if (g_log_level <= static_cast<int>(LogLevel::kInfo))
        std::cerr << "[INFO]  " << s << '\n';
}
void logW(const std::string& s)
{
    if (g_log_level <= static_cast<int>(LogLevel::kWarn))
        std::cerr << "[WARN]  " << s << '\n';
}
void logE(const std::string& s)
{
    if (g_log_level <= static_cast<int>(LogLevel::kError))
        std::cerr << "[ERR]   " << s << '\n';
}

std::string trim_copy(const std::string& s)
{
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string to_lower_copy(std::string s)
{
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string fmt_fixed(double v, int digits)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(digits) << v;
    return os.str();
}

/* ── files ───────────────────────────────────────────────── */
bool file_exists(const std::string& path)
{
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

void write_file_atomic(const std::string& path, const std::string& content)
{
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw Error("cannot open " + tmp + " for writing");
        out << content;
        out.flush();
        if (!out) throw Error("short write to " + tmp);
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        std::remove(tmp.c_str());
        throw Error("cannot rename " + tmp + " to " + path);
    }
}

std::string read_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Error("cannot open " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string now_iso8601()
{
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return buf;
}

} // namespace induct
