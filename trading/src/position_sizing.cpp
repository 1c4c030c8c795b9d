#include "position_sizing.hpp"
#include "symbols.hpp"
#include <cmath>

namespace trading {

    double calculatePositionSize(double balance, double risk_percent,
                                 double entry_price, double stop_loss,
                                 const std::string& symbol) {
        const double distance = std::abs(entry_price - stop_loss);
        if (distance == 0.0 || balance <= 0.0 || risk_percent <= 0.0) {
            return 0.0;
        }
        const double risk_money = balance * risk_percent / 100.0;
        const double lots = risk_money / (distance * core::contractSizeFor(symbol));
        return std::floor(lots * 100.0 + 1e-9) / 100.0;
    }

    double riskAmount(double lots, double entry_price, double stop_loss, const std::string& symbol) {
        return std::abs(entry_price - stop_loss) * lots * core::contractSizeFor(symbol);
    }

} // namespace trading
