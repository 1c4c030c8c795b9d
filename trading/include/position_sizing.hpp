#pragma once

#include <string>

namespace trading {

    // Lots risking `risk_percent` of `balance` between entry and stop, floored to 0.01.
    // Zero when entry == stop or the inputs are not positive.
    double calculatePositionSize(double balance, double risk_percent,
                                 double entry_price, double stop_loss,
                                 const std::string& symbol);

    // Account-currency risk of `lots` between entry and stop
    double riskAmount(double lots, double entry_price, double stop_loss, const std::string& symbol);

} // namespace trading
