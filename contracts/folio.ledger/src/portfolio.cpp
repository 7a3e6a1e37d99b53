#include <folio.ledger/folio.ledger.hpp>
#include <token.hpp>

#include "safemath.hpp"
#include <utils.hpp>

namespace folio {
using namespace std;
using namespace wasm::safemath;

inline int64_t get_precision(const symbol &s) {
   return calc_precision(s.precision());
}

portfolio_t folio_ledger::_get_folio(const name& owner, portfolio_t::tbl_t& folios) {
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )
   auto itr = folios.find(owner.value);
   CHECKC( itr != folios.end(), err::NOT_OWNER, "portfolio not found: " + owner.to_string() )
   CHECKC( has_auth(owner), err::NOT_OWNER, "not owner of portfolio: " + owner.to_string() )
   return *itr;
}

void folio_ledger::_save_folio(portfolio_t::tbl_t& folios, const portfolio_t& folio) {
   auto itr = folios.find(folio.owner.value);
   CHECKC( itr != folios.end(), err::SYSTEM_ERROR, "portfolio vanished: " + folio.owner.to_string() )
   folios.modify(itr, same_payer, [&](auto& row) {
      row            = folio;
      row.updated_at = current_time_point();
   });
}

void folio_ledger::initfolio(const name& owner) {
   require_auth( owner );
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )

   portfolio_t::tbl_t folios(_self, _self.value);
   CHECKC( folios.find(owner.value) == folios.end(), err::ALREADY_EXISTS, "portfolio already exists: " + owner.to_string() )

   const auto& quote = _gstate.quote_symbol;
   auto now = current_time_point();
   folios.emplace(_self, [&](auto& row) {
      row.owner                  = owner;
      row.total_value            = asset(0, quote);
      row.total_shares           = TOTAL_SHARES;
      row.min_value_threshold    = asset(0, quote);
      row.max_value_threshold    = asset(asset::max_amount, quote);
      row.created_at             = now;
      row.updated_at             = now;
   });
}

void folio_ledger::addasset(const name& owner, const asset& quantity, const asset& value) {
   portfolio_t::tbl_t folios(_self, _self.value);
   auto folio = _get_folio(owner, folios);

   CHECKC( quantity.is_valid(), err::INVALID_ARGUMENT, "invalid quantity" )
   CHECKC( quantity.amount >= 0, err::INVALID_ARGUMENT, "quantity must not be negative" )
   CHECKC( value.symbol == _gstate.quote_symbol, err::SYMBOL_MISMATCH, "value symbol mismatch: " + symbol_to_string(value.symbol) )
   CHECKC( value.amount >= 0, err::INVALID_ARGUMENT, "value must not be negative" )

   folio.assets.push_back( folio_asset_st{ quantity, value } );
   folio.total_value += value;
   _save_folio(folios, folio);
}

void folio_ledger::setfeed(const symbol& sym, const name& oracle, const name& coin) {
   _check_admin();
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )
   CHECKC( sym.is_valid(), err::INVALID_ARGUMENT, "invalid symbol" )
   CHECKC( is_account(oracle), err::INVALID_ARGUMENT, "oracle account does not exist: " + oracle.to_string() )

   pricefeed_t::tbl_t feeds(_self, _self.value);
   CHECKC( feeds.find(sym.code().raw()) == feeds.end(), err::ALREADY_BOUND, "price feed already bound: " + sym.code().to_string() )
   feeds.emplace(_self, [&](auto& row) {
      row.sym     = sym;
      row.oracle  = oracle;
      row.coin    = coin;
   });
}

/**
 * @brief revalue one asset from its oracle
 *        value = amount * price / 10^precision, price being the quote units of one whole token
 */
void folio_ledger::refresh(const name& owner, const symbol& sym) {
   portfolio_t::tbl_t folios(_self, _self.value);
   auto folio = _get_folio(owner, folios);

   auto holding = folio.find_asset(sym);
   CHECKC( holding != nullptr, err::ASSET_NOT_FOUND, "asset not found: " + symbol_to_string(sym) )

   pricefeed_t::tbl_t feeds(_self, _self.value);
   auto feed = feeds.find(sym.code().raw());
   CHECKC( feed != feeds.end(), err::NO_ORACLE, "no price feed bound: " + sym.code().to_string() )
   CHECKC( feed->sym == sym, err::SYMBOL_MISMATCH, "price feed precision mismatch: " + symbol_to_string(feed->sym) )

   auto price = latest_price(feed->oracle, feed->coin);
   CHECKC( price.valid && price.price > 0, err::INVALID_PRICE, "invalid price for " + feed->coin.to_string() )
   CHECKC( price.quote == _gstate.quote_symbol, err::SYMBOL_MISMATCH, "oracle quote mismatch: " + symbol_to_string(price.quote) )

   auto old_value = holding->value;
   auto new_value = asset( mul_down(holding->quantity.amount, price.price, get_precision(sym)), _gstate.quote_symbol );
   TRACE_L("refresh ", owner, " ", sym, " price: ", price.price, " value: ", old_value, " -> ", new_value);

   folio.total_value += new_value - old_value;
   holding->value    = new_value;
   _save_folio(folios, folio);

   EMIT( valuelog_action, owner, sym, old_value, new_value )
}

void folio_ledger::withdraw(const name& owner, const name& bank, const name& to, const asset& quantity) {
   portfolio_t::tbl_t folios(_self, _self.value);
   auto folio = _get_folio(owner, folios);

   CHECKC( quantity.amount > 0, err::INVALID_ARGUMENT, "quantity must be positive" )
   CHECKC( is_account(to), err::INVALID_ARGUMENT, "to account does not exist: " + to.to_string() )

   auto holding = folio.find_asset(quantity.symbol);
   CHECKC( holding != nullptr, err::ASSET_NOT_FOUND, "asset not found: " + symbol_to_string(quantity.symbol) )
   CHECKC( quantity.amount <= holding->quantity.amount, err::INSUFFICIENT_BALANCE,
           "insufficient asset balance: " + holding->quantity.to_string() )

   //proportional to the amount held before this withdrawal
   int128_t delta = (int128_t)holding->value.amount * quantity.amount / holding->quantity.amount;
   auto value = asset( (int64_t)delta, holding->value.symbol );

   holding->quantity -= quantity;
   holding->value    -= value;
   folio.total_value -= value;
   _save_folio(folios, folio);

   _pay_from_custody( extended_symbol(quantity.symbol, bank), to, quantity, TYPE_WITHDRAW );
   EMIT( withdrawlog_action, owner, to, quantity, value )
}

void folio_ledger::emergencyout(const name& owner, const vector<extended_symbol>& tokens) {
   portfolio_t::tbl_t folios(_self, _self.value);
   auto folio = _get_folio(owner, folios);
   CHECKC( tokens.size() > 0, err::INVALID_ARGUMENT, "no tokens given" )

   //every holding of the symbol is drained, duplicates included
   for (const auto& ext_sym : tokens) {
      const auto& sym = ext_sym.get_symbol();
      asset quantity(0, sym);
      asset value(0, folio.total_value.symbol);
      bool found = false;
      for (auto& holding : folio.assets) {
         if (holding.quantity.symbol != sym) continue;
         found = true;
         quantity += holding.quantity;
         value    += holding.value;
         holding.quantity.amount = 0;
         holding.value.amount    = 0;
      }
      CHECKC( found, err::ASSET_NOT_FOUND, "asset not found: " + symbol_to_string(sym) )
      CHECKC( quantity.amount > 0, err::NOTHING_TO_WITHDRAW, "nothing to withdraw: " + symbol_to_string(sym) )
      folio.total_value -= value;

      _pay_from_custody( ext_sym, owner, quantity, TYPE_EMERGENCY );
      EMIT( withdrawlog_action, owner, owner, quantity, value )
   }
   _save_folio(folios, folio);
}

void folio_ledger::rebalance(const name& owner, const vector<symbol>& syms, const vector<uint64_t>& ratios) {
   portfolio_t::tbl_t folios(_self, _self.value);
   auto folio = _get_folio(owner, folios);
   CHECKC( syms.size() == ratios.size(), err::INVALID_ARGUMENT, "symbols and ratios size mismatch" )

   const auto captured = folio.total_value;
   for (size_t i = 0; i < syms.size(); i++) {
      auto holding = folio.find_asset(syms[i]);
      CHECKC( holding != nullptr, err::ASSET_NOT_FOUND, "asset not found: " + symbol_to_string(syms[i]) )

      int128_t target = (int128_t)captured.amount * ratios[i] / PERCENT_BOOST;
      CHECKC( target <= asset::max_amount, err::INVALID_ARGUMENT, "target value overflow" )
      holding->value = asset( (int64_t)target, captured.symbol );
   }
   _save_folio(folios, folio);
}

bool folio_ledger::checkrisk(const name& owner) {
   portfolio_t::tbl_t folios(_self, _self.value);
   auto itr = folios.find(owner.value);
   CHECKC( itr != folios.end(), err::NOT_OWNER, "portfolio not found: " + owner.to_string() )

   return itr->min_value_threshold <= itr->total_value && itr->total_value <= itr->max_value_threshold;
}

void folio_ledger::applyfees(const name& owner, const asset& bonus_threshold) {
   portfolio_t::tbl_t folios(_self, _self.value);
   auto folio = _get_folio(owner, folios);
   CHECKC( bonus_threshold.symbol == _gstate.quote_symbol, err::SYMBOL_MISMATCH, "threshold symbol mismatch: " + symbol_to_string(bonus_threshold.symbol) )

   int128_t total    = folio.total_value.amount;
   int128_t mgmt     = total * folio.management_fee / PERCENT_BOOST;
   int128_t perf     = total * folio.performance_fee / PERCENT_BOOST;
   if (folio.total_value > bonus_threshold)
      perf += total * PERFORMANCE_BONUS_PERCENT / PERCENT_BOOST;

   CHECKC( mgmt + perf <= total, err::INVALID_ARGUMENT, "fees exceed portfolio value" )
   auto remaining = total - mgmt - perf;

   const auto& quote = folio.total_value.symbol;
   folio.total_value = asset( (int64_t)remaining, quote );
   _save_folio(folios, folio);

   EMIT( feeslog_action, owner, asset((int64_t)mgmt, quote), asset((int64_t)perf, quote), folio.total_value )
}

void folio_ledger::setfees(const name& owner, const uint8_t& management_fee, const uint8_t& performance_fee) {
   portfolio_t::tbl_t folios(_self, _self.value);
   auto folio = _get_folio(owner, folios);
   CHECKC( management_fee <= PERCENT_BOOST, err::INVALID_ARGUMENT, "management fee exceeds 100%" )
   CHECKC( performance_fee <= PERCENT_BOOST, err::INVALID_ARGUMENT, "performance fee exceeds 100%" )

   folio.management_fee    = management_fee;
   folio.performance_fee   = performance_fee;
   _save_folio(folios, folio);
}

void folio_ledger::setriskband(const name& owner, const asset& min_value, const asset& max_value, const uint64_t& risk_score) {
   portfolio_t::tbl_t folios(_self, _self.value);
   auto folio = _get_folio(owner, folios);
   CHECKC( min_value.symbol == _gstate.quote_symbol && max_value.symbol == _gstate.quote_symbol,
           err::SYMBOL_MISMATCH, "risk band symbol mismatch" )
   CHECKC( min_value.amount >= 0 && min_value <= max_value, err::INVALID_ARGUMENT, "invalid risk band" )

   folio.min_value_threshold  = min_value;
   folio.max_value_threshold  = max_value;
   folio.risk_score           = risk_score;
   _save_folio(folios, folio);
}

} //namespace folio
