#include "market/feed_csv.h"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace hedging {

namespace {

std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream iss(line);
    std::string field;
    while (std::getline(iss, field, ',')) {
        // Trim surrounding whitespace and a trailing CR from Windows files
        const auto first = field.find_first_not_of(" \t\r");
        const auto last = field.find_last_not_of(" \t\r");
        fields.push_back(first == std::string::npos ? "" : field.substr(first, last - first + 1));
    }
    return fields;
}

double parseNumber(const std::string& text, const std::string& column,
                   const std::string& source_name, size_t line_no) {
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed == text.size()) {
            return value;
        }
    } catch (const std::exception&) {
        // Reported below with file context
    }
    throw std::runtime_error(source_name + ":" + std::to_string(line_no) +
                             ": invalid " + column + " value '" + text + "'");
}

} // namespace

MarketFeed readFeedCsv(std::istream& is, const std::string& source_name) {
    std::string line;
    size_t line_no = 0;

    // Skip header
    if (!std::getline(is, line)) {
        throw std::runtime_error(source_name + ": empty market feed file");
    }
    ++line_no;

    std::vector<MarketSnapshot> snapshots;
    while (std::getline(is, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        auto fields = splitCsvLine(line);
        if (fields.size() != 5) {
            throw std::runtime_error(source_name + ":" + std::to_string(line_no) +
                                     ": expected 5 columns, got " + std::to_string(fields.size()));
        }

        MarketSnapshot snap;
        try {
            snap.date = Date::parse(fields[0]);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(source_name + ":" + std::to_string(line_no) + ": " + e.what());
        }
        snap.spot = parseNumber(fields[1], "spot", source_name, line_no);
        snap.vol = parseNumber(fields[2], "vol", source_name, line_no);
        snap.rate = parseNumber(fields[3], "sofr", source_name, line_no);
        snap.credit_spread = parseNumber(fields[4], "credit_spread", source_name, line_no);
        snapshots.push_back(snap);
    }

    return MarketFeed(std::move(snapshots));
}

MarketFeed loadFeedCsv(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Cannot open market feed file: " + path);
    }
    return readFeedCsv(ifs, path);
}

void writeFeedCsv(const MarketFeed& feed, std::ostream& os) {
    os << "date,spot,vol,sofr,credit_spread\n";
    os << std::setprecision(12);
    for (const auto& snap : feed) {
        os << snap.date << ',' << snap.spot << ',' << snap.vol << ','
           << snap.rate << ',' << snap.credit_spread << '\n';
    }
}

void saveFeedCsv(const MarketFeed& feed, const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Cannot write market feed file: " + path);
    }
    writeFeedCsv(feed, ofs);
}

} // namespace hedging
