#include "currency_converter.hpp"
#include "symbols.hpp"
#include "utils.hpp"
#include <stdexcept>

namespace trading {

    StaticRateCurrencyConverter::StaticRateCurrencyConverter(double leverage)
        : leverage_(leverage),
          rates_{
              {"EUR", 1.08},
              {"GBP", 1.27},
              {"AUD", 0.65},
              {"NZD", 0.60},
              {"CAD", 0.73},
              {"CHF", 1.13},
              {"USD", 1.0}
          }
    {
        if (leverage <= 0.0) {
            throw std::invalid_argument("Leverage must be positive.");
        }
    }

    double StaticRateCurrencyConverter::usdRate(const std::string& currency) const {
        auto it = rates_.find(currency);
        return it != rates_.end() ? it->second : 1.0;
    }

    double StaticRateCurrencyConverter::convertToAccountCurrency(const std::string& symbol,
                                                                 double raw_pnl,
                                                                 double price) const {
        if (raw_pnl == 0.0) return 0.0;
        if (core::utils::endsWith(symbol, "USD")) return raw_pnl;
        if (price == 0.0) return 0.0;
        return raw_pnl * usdRate(symbol.substr(0, 3)) / price;
    }

    double StaticRateCurrencyConverter::requiredMargin(const std::string& symbol, double lots, double price) const {
        const double base_margin = lots * core::contractSizeFor(symbol) / leverage_;
        if (core::utils::startsWith(symbol, "USD")) {
            return base_margin;
        }
        if (core::utils::endsWith(symbol, "USD")) {
            return base_margin * price;
        }
        return base_margin * usdRate(symbol.substr(0, 3));
    }

} // namespace trading
