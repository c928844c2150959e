#include "induct/fleet_csv.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <optional>
#include <sstream>

#include "induct/common.hpp"
#include "induct/errors.hpp"

namespace induct {

namespace {

/* quotes may wrap a cell; "" inside quotes is a literal quote */
std::vector<std::string> split_csv_line(const std::string& line)
{
    std::vector<std::string> cells;
    std::string cur;
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (quoted) {
            if (ch == '"' && i + 1 < line.size() && line[i + 1] == '"') { cur += '"'; ++i; }
            else if (ch == '"') quoted = false;
            else cur += ch;
        } else if (ch == '"') {
            quoted = true;
        } else if (ch == ',') {
            cells.push_back(trim_copy(cur));
            cur.clear();
        } else {
            cur += ch;
        }
    }
    cells.push_back(trim_copy(cur));
    return cells;
}

std::optional<double> parse_double(const std::string& s)
{
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end != s.c_str() + s.size() || !std::isfinite(v)) return std::nullopt;
    return v;
}

std::optional<long> parse_long(const std::string& s)
{
    auto d = parse_double(s);
    if (!d) return std::nullopt;
    if (*d < static_cast<double>(std::numeric_limits<long>::min()) ||
        *d >= static_cast<double>(std::numeric_limits<long>::max()))
        return std::nullopt;
    return static_cast<long>(std::llround(*d));
}

std::optional<bool> parse_bool(const std::string& s)
{
    const std::string v = to_lower_copy(s);
    if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "1.0") return true;
    if (v == "0" || v == "false" || v == "no" || v == "n" || v == "0.0") return false;
    return std::nullopt;
}

} // namespace

std::vector<TrainRecord> read_fleet_csv(std::istream& in)
{
    std::string line;
    if (!std::getline(in, line)) throw InputError("fleet CSV has no header");
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::map<std::string, std::size_t> col;
    const auto header = split_csv_line(line);
    for (std::size_t c = 0; c < header.size(); ++c) col.emplace(to_lower_copy(header[c]), c);
    if (!col.count("train_id")) throw InputError("fleet CSV has no train_id column");

    std::vector<TrainRecord> out;
    std::size_t lineno = 1;
    while (std::getline(in, line)) {
        ++lineno;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim_copy(line).empty()) continue;

        const auto cells = split_csv_line(line);
        auto cell = [&](const char* name) -> std::string {
            auto it = col.find(name);
            return (it == col.end() || it->second >= cells.size()) ? std::string{} : cells[it->second];
        };

        TrainRecord r;
        r.train_id               = cell("train_id");
        r.depot                  = cell("depot");
        r.fitness_score          = parse_double(cell("fitness_score"));
        r.mileage                = parse_long(cell("mileage"));
        r.days_since_maintenance = parse_long(cell("days_since_maintenance"));
        r.open_work_orders       = parse_long(cell("open_work_orders"));
        r.cert_valid             = parse_bool(cell("cert_valid"));
        r.days_to_cert_expiry    = parse_long(cell("days_to_cert_expiry"));
        r.branding_hours         = parse_long(cell("branding_hours"));
        r.recent_delays          = parse_long(cell("recent_delays"));
        r.total_delay_minutes    = parse_double(cell("total_delay_minutes"));
        r.mechanical_issues      = parse_long(cell("mechanical_issues"));
        r.door_faults            = parse_long(cell("door_faults"));
        r.on_time_performance    = parse_double(cell("on_time_performance"));
        if (auto lbl = parse_long(cell("target_induct"))) r.target_induct = static_cast<int>(*lbl);

        if (r.train_id.empty()) throw InputError("line " + std::to_string(lineno) + " has no train_id");
        out.push_back(std::move(r));
    }
    if (out.empty()) throw InputError("fleet CSV has no data rows");
    return out;
}

std::vector<TrainRecord> load_fleet_csv(const std::string& path)
{
    std::ifstream in(path);
    if (!in) throw InputError("cannot open fleet file " + path);
    auto rows = read_fleet_csv(in);
    logI("loaded " + std::to_string(rows.size()) + " trains from " + path);
    return rows;
}

} // namespace induct
