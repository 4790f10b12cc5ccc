#include "result_tables.hpp"
#include "dataset_validator.hpp"
#include "utils.hpp"

namespace simulator {

    using core::utils::formatNumber;
    using core::utils::timestampToString;

    data::Table tradeLogToTable(const std::vector<core::TradeLogEntry>& trade_log) {
        data::Table table;
        table.source = "trade_log";
        table.columns = {"timestamp", "action", "symbol", "shares", "price", "fees",
                         "cash", "portfolio_value", "cost_basis", "realized_pnl"};
        table.rows.reserve(trade_log.size());
        for (const auto& entry : trade_log) {
            table.rows.push_back({
                timestampToString(entry.timestamp),
                core::toString(entry.action),
                entry.symbol,
                formatNumber(entry.shares),
                formatNumber(entry.price),
                formatNumber(entry.fees),
                formatNumber(entry.cash_after),
                formatNumber(entry.portfolio_value_after),
                formatNumber(entry.cost_basis),
                entry.action == core::TradeAction::Sell ? formatNumber(entry.realized_pnl) : ""
            });
        }
        data::DatasetValidator::validateTradeLogTable(table);
        return table;
    }

    data::Table equityCurveToTable(const std::vector<core::PortfolioState>& equity_curve) {
        data::Table table;
        table.source = "equity_curve";
        table.columns = {"timestamp", "cash", "positions_value", "portfolio_value"};
        table.rows.reserve(equity_curve.size());
        for (const auto& state : equity_curve) {
            table.rows.push_back({
                timestampToString(state.timestamp),
                formatNumber(state.cash),
                formatNumber(state.positions_value),
                formatNumber(state.total_equity)
            });
        }
        return table;
    }

    data::Table rejectionsToTable(const std::vector<RejectionRecord>& rejections) {
        data::Table table;
        table.source = "rejections";
        table.columns = {"timestamp", "symbol", "signal", "reason", "message"};
        table.rows.reserve(rejections.size());
        for (const auto& rejection : rejections) {
            table.rows.push_back({
                timestampToString(rejection.timestamp),
                rejection.symbol,
                core::toString(rejection.signal),
                toString(rejection.reason),
                rejection.message
            });
        }
        return table;
    }

} // namespace simulator
