#include "market/CandleCsvReader.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace Confluence {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    const size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos)
        return "";
    const size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> out;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ','))
        out.push_back(trim(field));
    return out;
}

bool looks_numeric(const std::string& s) {
    if (s.empty())
        return false;
    const char c = s[0];
    return (c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.';
}

// The whole field must be consumed: "101.5abc" and "1.7e12" as a
// timestamp are errors, not 101.5 and 1.
double whole_double(const std::string& s, const char* name) {
    size_t pos = 0;
    const double v = std::stod(s, &pos);
    if (pos != s.size())
        throw std::invalid_argument(std::string(name) + " '" + s + "'");
    return v;
}

int64_t whole_int64(const std::string& s, const char* name) {
    size_t pos = 0;
    const long long v = std::stoll(s, &pos);
    if (pos != s.size())
        throw std::invalid_argument(std::string(name) + " '" + s + "'");
    return static_cast<int64_t>(v);
}

std::string where(const std::string& source, size_t line_no) {
    return source + ":" + std::to_string(line_no);
}

}

CandleSeries CandleCsvReader::read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open())
        throw std::runtime_error("[CSV] Cannot open file: " + path);
    return parse(in, path);
}

CandleSeries CandleCsvReader::parse(std::istream& in, const std::string& source) {
    std::vector<Candle> candles;
    std::vector<size_t> line_of;
    std::string line;
    size_t line_no = 0;
    bool header_checked = false;

    while (std::getline(in, line)) {
        ++line_no;
        const std::string text = trim(line);
        if (text.empty() || text[0] == '#')
            continue;

        const std::vector<std::string> f = split_fields(text);

        if (!header_checked) {
            header_checked = true;
            if (!f.empty() && !looks_numeric(f[0]))
                continue;
        }

        if (f.size() < 6) {
            throw std::runtime_error(
                "[CSV] " + where(source, line_no) + " expected 6 fields, got " +
                std::to_string(f.size()));
        }

        Candle c;
        try {
            c.timestamp = whole_int64(f[0], "timestamp");
            c.open      = whole_double(f[1], "open");
            c.high      = whole_double(f[2], "high");
            c.low       = whole_double(f[3], "low");
            c.close     = whole_double(f[4], "close");
            c.volume    = whole_double(f[5], "volume");
        } catch (const std::exception& e) {
            throw std::runtime_error(
                "[CSV] " + where(source, line_no) + " bad number: " + e.what());
        }

        candles.push_back(c);
        line_of.push_back(line_no);
    }

    const CandleCheck check = validate_candles(candles);
    if (!check.ok()) {
        std::cerr << "[CSV] rejected " << source << " row=" << check.index
                  << " error=" << to_string(check.error) << "\n";
        throw std::runtime_error(
            "[CSV] " + where(source, line_of[check.index]) + " " +
            to_string(check.error));
    }

    std::cerr << "[CSV] loaded " << source << " rows=" << candles.size() << "\n";
    return CandleSeries(std::move(candles));
}

}
