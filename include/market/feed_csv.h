#pragma once

#include "market/market_feed.h"
#include <istream>
#include <ostream>
#include <string>

namespace hedging {

// CSV layout: date,spot,vol,sofr,credit_spread (header row required)

// Throws std::runtime_error on I/O or parse failures and
// std::invalid_argument if the parsed feed violates its invariants
MarketFeed readFeedCsv(std::istream& is, const std::string& source_name = "<stream>");
MarketFeed loadFeedCsv(const std::string& path);

void writeFeedCsv(const MarketFeed& feed, std::ostream& os);
void saveFeedCsv(const MarketFeed& feed, const std::string& path);

} // namespace hedging
