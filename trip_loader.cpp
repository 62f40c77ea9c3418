#include <climits>
#include <stdexcept>
#include <string>
#include <vector>

#include "common.hpp"
#include "trip_loader.hpp"

namespace taxi_fare {

namespace {

std::string strip_cr(std::string s)
{
    if (!s.empty() && s.back() == '\r') s.pop_back();
    return s;
}

[[noreturn]] void bad_field(const std::string& where, const char* column,
                            const std::string& token, const char* expected)
{
    throw std::runtime_error(where + ": column " + column + " = '" + token +
                             "' is not " + expected);
}

int parse_int(const std::string& tok, const char* column, const std::string& where)
{
    size_t pos = 0;
    long   v   = 0;
    try {
        v = std::stol(tok, &pos);
    } catch (const std::exception&) {
        bad_field(where, column, tok, "an integer");
    }
    if (pos != tok.size() || v < INT_MIN || v > INT_MAX)
        bad_field(where, column, tok, "an integer");
    return static_cast<int>(v);
}

double parse_double(const std::string& tok, const char* column, const std::string& where)
{
    size_t pos = 0;
    double v   = 0;
    try {
        v = std::stod(tok, &pos);
    } catch (const std::exception&) {
        bad_field(where, column, tok, "a number");
    }
    if (pos != tok.size()) bad_field(where, column, tok, "a number");
    return v;
}

} // namespace

TripRecord parse_trip_line(const std::string& line, const std::string& where)
{
    std::vector<std::string> f = split_fields(line, ',');
    if (static_cast<int>(f.size()) != TRIP_COLUMNS) {
        throw std::runtime_error(where + ": expected " + std::to_string(TRIP_COLUMNS) +
                                 " columns, got " + std::to_string(f.size()));
    }
    for (auto& tok : f) tok = trim(tok);

    TripRecord t;
    /* category tokens are kept verbatim, empty included */
    t.vendor_id       = f[0];
    t.rate_code       = f[1];
    t.passenger_count = parse_int     (f[2], "PassengerCount", where);
    t.trip_time       = parse_int     (f[3], "TripTime", where);
    t.trip_distance   = parse_double  (f[4], "TripDistance", where);
    t.payment_type    = f[5];
    t.fare_amount     = parse_double  (f[6], "FareAmount", where);
    return t;
}

TripReader::TripReader(const std::string& path)
    : path_(path), in_(path)
{
    if (!in_.is_open())
        throw std::runtime_error("cannot open data file: " + path);

    std::string header;
    if (!std::getline(in_, header))
        throw std::runtime_error(path + ": missing header line");
    ++line_no_;

    /* column names are not checked, only the layout width */
    const size_t cols = split_fields(strip_cr(header), ',').size();
    if (static_cast<int>(cols) != TRIP_COLUMNS) {
        throw std::runtime_error(path + ": header has " + std::to_string(cols) +
                                 " columns, expected " + std::to_string(TRIP_COLUMNS));
    }
}

bool TripReader::next(TripRecord& out)
{
    std::string line;
    while (std::getline(in_, line)) {
        ++line_no_;
        line = strip_cr(line);
        if (trim(line).empty()) continue;

        out = parse_trip_line(line, path_ + ":" + std::to_string(line_no_));
        ++rows_;
        return true;
    }
    if (in_.bad())
        throw std::runtime_error("read error in " + path_);
    return false;
}

std::vector<TripRecord> load_trips(const std::string& path)
{
    TripReader reader(path);
    std::vector<TripRecord> trips(reader.begin(), reader.end());

    logI("Loaded " + std::to_string(trips.size()) + " trips from " + path);
    return trips;
}

} // namespace taxi_fare
