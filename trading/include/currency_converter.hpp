#pragma once

#include <map>
#include <string>

namespace trading {

    // Converts instrument-currency amounts into the USD account currency
    class ICurrencyConverter {
    public:
        virtual ~ICurrencyConverter() = default;

        virtual double convertToAccountCurrency(const std::string& symbol, double raw_pnl, double price) const = 0;
        virtual double requiredMargin(const std::string& symbol, double lots, double price) const = 0;
    };

    // Approximation using fixed USD rates per base currency. Cross pairs are
    // valued without live quotes, so results drift from a real broker's.
    class StaticRateCurrencyConverter : public ICurrencyConverter {
    public:
        explicit StaticRateCurrencyConverter(double leverage = 100.0);

        double convertToAccountCurrency(const std::string& symbol, double raw_pnl, double price) const override;
        double requiredMargin(const std::string& symbol, double lots, double price) const override;

        // USD value of one unit of `currency`; 1.0 when unknown
        double usdRate(const std::string& currency) const;
        double leverage() const { return leverage_; }

    private:
        double leverage_;
        std::map<std::string, double> rates_;
    };

} // namespace trading
