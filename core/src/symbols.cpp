#include "symbols.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>

namespace core {

    namespace {

        const std::map<std::string, int>& digitTable() {
            static const std::map<std::string, int> table = {
                {"AUDUSD", 5}, {"EURAUD", 5}, {"EURJPY", 3}, {"EURUSD", 5},
                {"GBPAUD", 5}, {"GBPJPY", 3}, {"GBPUSD", 5}, {"NZDUSD", 5},
                {"USDCHF", 5}, {"USDJPY", 3}, {"XAGUSD", 3}, {"XAUUSD", 2},
                {"CUSTOM", 5}
            };
            return table;
        }

        bool isCurrencyPair(const std::string& symbol) {
            return symbol.size() == 6 &&
                   std::all_of(symbol.begin(), symbol.end(),
                               [](unsigned char c) { return std::isalpha(c) != 0; });
        }

    } // namespace

    double contractSizeFor(const std::string& symbol) {
        if (symbol.find("XAU") != std::string::npos) return 100.0;
        if (symbol.find("XAG") != std::string::npos) return 5000.0;
        if (isCurrencyPair(symbol) && symbol != "CUSTOM") return 100000.0;
        return 1.0;
    }

    SymbolSpec lookupSymbol(const std::string& symbol) {
        SymbolSpec spec;
        spec.name = symbol;
        spec.contract_size = contractSizeFor(symbol);

        const auto& digits = digitTable();
        auto it = digits.find(symbol);
        if (it != digits.end()) {
            spec.digits = it->second;
        } else {
            spec.digits = (symbol.size() >= 3 && symbol.compare(symbol.size() - 3, 3, "JPY") == 0) ? 3 : 5;
        }
        // One pip is the second-to-last quoted decimal
        spec.pip_size = std::pow(10.0, -(spec.digits - 1));

        if (isCurrencyPair(symbol) && symbol != "CUSTOM") {
            spec.base_currency = symbol.substr(0, 3);
            spec.quote_currency = symbol.substr(3, 3);
        }
        return spec;
    }

    const std::vector<std::string>& knownSymbols() {
        static const std::vector<std::string> symbols = {
            "AUDUSD", "EURAUD", "EURJPY", "EURUSD", "GBPAUD", "GBPJPY", "GBPUSD",
            "NZDUSD", "USDCHF", "USDJPY", "XAGUSD", "XAUUSD", "CUSTOM"
        };
        return symbols;
    }

} // namespace core
