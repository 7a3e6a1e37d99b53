#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>

#include <map>

using namespace eosio;
using std::map;

//price oracle stand-in for the unit tests, same global layout as the oracle read by folio.ledger
class [[eosio::contract("mock.oracle")]] mock_oracle : public contract {
   public:
      using contract::contract;

   struct [[eosio::table("global")]] price_global_t {
      name                    version             = "1.o.o"_n;
      map<name, uint64_t>     prices              = {};
      uint64_t                price_history_count = 10;
      name                    quote_code          = "usdt"_n;
      symbol                  quote_symbol        = symbol(symbol_code("USDT"), 4);

      EOSLIB_SERIALIZE( price_global_t, (version)(prices)(price_history_count)(quote_code)(quote_symbol) )
   };
   typedef eosio::singleton< "global"_n, price_global_t > global_singleton;

   ACTION setquote(const name& quote_code, const symbol& quote_symbol) {
      require_auth( get_self() );
      global_singleton global( get_self(), get_self().value );
      auto conf = global.get_or_default();
      conf.quote_code     = quote_code;
      conf.quote_symbol   = quote_symbol;
      global.set( conf, get_self() );
   }

   ACTION setprice(const name& coin, const uint64_t& price) {
      require_auth( get_self() );
      global_singleton global( get_self(), get_self().value );
      auto conf = global.get_or_default();
      conf.prices[coin] = price;
      global.set( conf, get_self() );
   }
};
