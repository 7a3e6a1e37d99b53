#pragma once

#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/name.hpp>

#include <limits>
#include <map>
#include <string>

namespace folio {

using namespace std;
using namespace eosio;

#define SYMBOL(sym_code, precision) symbol(symbol_code(sym_code), precision)

//oracle global state, read only
struct price_global_t {
    name                    version             = "1.o.o"_n;
    map<name, uint64_t>     prices              = {};
    uint64_t                price_history_count = 10;
    name                    quote_code          = "usdt"_n;
    symbol                  quote_symbol        = SYMBOL("USDT", 4);

    price_global_t() {}
    EOSLIB_SERIALIZE(price_global_t, (version)(prices)(price_history_count)(quote_code)(quote_symbol))

    typedef eosio::singleton< "global"_n, price_global_t > idx_t;
};

struct oracle_price_st {
    int64_t     price   = 0;            //quote units per one whole coin
    symbol      quote;
    bool        valid   = false;
};

/**
 * Latest price published by `oracle` for `coin`.
 * A coin the oracle does not track, or an oracle that was never initialized,
 * yields an invalid quote.
 */
inline oracle_price_st latest_price(const name& oracle, const name& coin) {
    oracle_price_st ret;
    price_global_t::idx_t global_tbl(oracle, oracle.value);
    if (!global_tbl.exists()) return ret;

    const auto conf = global_tbl.get();
    ret.quote = conf.quote_symbol;
    auto itr = conf.prices.find(coin);
    if (itr == conf.prices.end() || itr->second > (uint64_t)std::numeric_limits<int64_t>::max())
        return ret;

    ret.price = (int64_t)itr->second;
    ret.valid = true;
    return ret;
}

} // namespace folio
