#pragma once

#include "market/Candle.hpp"

#include <istream>
#include <string>

namespace Confluence {

// Reads `timestamp,open,high,low,close,volume` rows. A header row, blank lines
// and lines starting with '#' are skipped. Malformed rows and contract
// violations throw std::runtime_error carrying the source name and line.
class CandleCsvReader {
public:
    static CandleSeries read_file(const std::string& path);
    static CandleSeries parse(std::istream& in, const std::string& source);
};

}
