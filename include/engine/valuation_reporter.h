#pragma once

#include "engine/hedge_ledger.h"
#include "engine/portfolio.h"
#include "engine/rebalancing_cascade.h"
#include "market/market_feed.h"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace hedging {

// One line of the simulation output
struct ResultRow {
    Date date;
    double spot;
    double total_pnl;
    double cash;
    double stock_position;
    double gamma_hedge_position;
    double vega_hedge_position;
    double transaction_cost;
    double funding_cost;
};

// Mark-to-market decomposition at one snapshot
struct Valuation {
    double pv_base = 0.0;
    double pv_hedges = 0.0;
    double cash = 0.0;

    double total() const { return pv_base + pv_hedges + cash; }
};

struct RunSummary {
    double final_pnl = 0.0;
    double total_transaction_cost = 0.0;
    double total_funding_cost = 0.0;
    double min_pnl = 0.0;
    double max_drawdown = 0.0;  // largest peak-to-trough fall of total P&L
    size_t steps = 0;
    size_t rehedge_steps = 0;
};

// Daily mark-to-market of base book plus hedges plus cash
class ValuationReporter {
public:
    ValuationReporter(Portfolio base, HedgeInstruments hedges);

    Valuation value(const MarketSnapshot& snapshot, const HedgeState& state) const;

    // Values the book after the step and appends its row
    const ResultRow& record(const MarketSnapshot& snapshot, const HedgeState& state,
                            const StepReport& step);

    const std::vector<ResultRow>& rows() const { return rows_; }
    RunSummary summarize() const;
    void clear();

private:
    Portfolio base_;
    HedgeInstruments hedges_;
    std::vector<ResultRow> rows_;
    size_t rehedge_steps_ = 0;
};

// Export
void writeResultsCsv(const std::vector<ResultRow>& rows, std::ostream& os);
nlohmann::json resultsToJson(const std::string& scenario_name,
                             const std::vector<ResultRow>& rows,
                             const RunSummary& summary);
nlohmann::json summaryToJson(const RunSummary& summary);

} // namespace hedging
