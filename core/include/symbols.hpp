#pragma once

#include <string>
#include <vector>

namespace core {

    // Static reference data for a tradable instrument
    struct SymbolSpec {
        std::string name;
        double contract_size = 1.0; // Units per lot
        int digits = 5;             // Price precision
        double pip_size = 0.0001;
        std::string base_currency;  // Empty when the name is not a currency pair
        std::string quote_currency;
    };

    // Built-in specs, or one derived from the symbol name for unknown instruments
    SymbolSpec lookupSymbol(const std::string& symbol);

    // Symbols with a built-in spec, in display order
    const std::vector<std::string>& knownSymbols();

    double contractSizeFor(const std::string& symbol);

} // namespace core
