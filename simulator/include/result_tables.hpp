#pragma once

#include <vector>

#include "datatypes.hpp"
#include "simulation_driver.hpp"
#include "table.hpp"

namespace simulator {

    // Output datasets. Timestamps are ISO-8601 UTC and numbers use shortest round-trip
    // formatting, so identical runs produce identical files.
    // Throws core::IntegrityException if the built table fails the trade-log checks
    data::Table tradeLogToTable(const std::vector<core::TradeLogEntry>& trade_log);
    data::Table equityCurveToTable(const std::vector<core::PortfolioState>& equity_curve);
    data::Table rejectionsToTable(const std::vector<RejectionRecord>& rejections);

} // namespace simulator
