#include "engine/valuation_reporter.h"
#include "engine/portfolio_aggregator.h"
#include <algorithm>
#include <iomanip>
#include <utility>

namespace hedging {

ValuationReporter::ValuationReporter(Portfolio base, HedgeInstruments hedges)
    : base_(std::move(base)), hedges_(std::move(hedges)) {}

Valuation ValuationReporter::value(const MarketSnapshot& snapshot, const HedgeState& state) const {
    const double S = snapshot.spot;

    Valuation v;
    v.pv_base = PortfolioAggregator::aggregate(base_, snapshot).price;

    v.pv_hedges = state.stock_position * S;
    if (hedges_.gamma) {
        v.pv_hedges += state.gamma_hedge_position *
                       hedges_.gamma->price(S, snapshot.date, snapshot.rate, snapshot.vol);
    }
    if (hedges_.vega) {
        v.pv_hedges += state.vega_hedge_position *
                       hedges_.vega->price(S, snapshot.date, snapshot.rate, snapshot.vol);
    }

    v.cash = state.cash;
    return v;
}

const ResultRow& ValuationReporter::record(const MarketSnapshot& snapshot, const HedgeState& state,
                                           const StepReport& step) {
    const Valuation v = value(snapshot, state);

    ResultRow row;
    row.date = snapshot.date;
    row.spot = snapshot.spot;
    row.total_pnl = v.total();
    row.cash = state.cash;
    row.stock_position = state.stock_position;
    row.gamma_hedge_position = state.gamma_hedge_position;
    row.vega_hedge_position = state.vega_hedge_position;
    row.transaction_cost = step.transactionCost();
    row.funding_cost = step.funding;

    if (step.rehedged) {
        ++rehedge_steps_;
    }
    rows_.push_back(row);
    return rows_.back();
}

RunSummary ValuationReporter::summarize() const {
    RunSummary summary;
    summary.steps = rows_.size();
    summary.rehedge_steps = rehedge_steps_;
    if (rows_.empty()) {
        return summary;
    }

    double peak = rows_.front().total_pnl;
    summary.min_pnl = rows_.front().total_pnl;
    for (const auto& row : rows_) {
        summary.total_transaction_cost += row.transaction_cost;
        summary.total_funding_cost += row.funding_cost;
        summary.min_pnl = std::min(summary.min_pnl, row.total_pnl);
        peak = std::max(peak, row.total_pnl);
        summary.max_drawdown = std::max(summary.max_drawdown, peak - row.total_pnl);
    }
    summary.final_pnl = rows_.back().total_pnl;
    return summary;
}

void ValuationReporter::clear() {
    rows_.clear();
    rehedge_steps_ = 0;
}

void writeResultsCsv(const std::vector<ResultRow>& rows, std::ostream& os) {
    os << "date,spot,total_pnl,cash,stock_position,gamma_hedge_position,"
          "vega_hedge_position,transaction_cost,funding_cost\n";
    os << std::setprecision(12);
    for (const auto& row : rows) {
        os << row.date << ','
           << row.spot << ','
           << row.total_pnl << ','
           << row.cash << ','
           << row.stock_position << ','
           << row.gamma_hedge_position << ','
           << row.vega_hedge_position << ','
           << row.transaction_cost << ','
           << row.funding_cost << '\n';
    }
}

nlohmann::json summaryToJson(const RunSummary& summary) {
    return {
        {"final_pnl", summary.final_pnl},
        {"total_transaction_cost", summary.total_transaction_cost},
        {"total_funding_cost", summary.total_funding_cost},
        {"min_pnl", summary.min_pnl},
        {"max_drawdown", summary.max_drawdown},
        {"steps", summary.steps},
        {"rehedge_steps", summary.rehedge_steps}
    };
}

nlohmann::json resultsToJson(const std::string& scenario_name,
                             const std::vector<ResultRow>& rows,
                             const RunSummary& summary) {
    nlohmann::json results = {
        {"scenario", scenario_name},
        {"summary", summaryToJson(summary)},
        {"rows", nlohmann::json::array()}
    };

    for (const auto& row : rows) {
        results["rows"].push_back({
            {"date", row.date.toString()},
            {"spot", row.spot},
            {"total_pnl", row.total_pnl},
            {"cash", row.cash},
            {"stock_position", row.stock_position},
            {"gamma_hedge_position", row.gamma_hedge_position},
            {"vega_hedge_position", row.vega_hedge_position},
            {"transaction_cost", row.transaction_cost},
            {"funding_cost", row.funding_cost}
        });
    }
    return results;
}

} // namespace hedging
