#include <folio.ledger/folio.ledger.hpp>
#include <token.hpp>

#include <utils.hpp>

namespace folio {
using namespace std;

void folio_ledger::_on_stake(const name& from, const asset& quant) {
   stake_t::tbl_t stakes(_self, _self.value);
   auto itr = stakes.find(from.value);
   auto now = current_time_point();
   asset staked = quant;

   if (itr == stakes.end()) {
      stakes.emplace(_self, [&](auto& row) {
         row.owner            = from;
         row.amount           = quant;
         row.last_staked_at   = now;
      });
   } else {
      staked = itr->amount + quant;
      stakes.modify(itr, same_payer, [&](auto& row) {
         row.amount           = staked;
         row.last_staked_at   = now;
      });
   }
   _gstate.total_staked += quant;

   EMIT( stakelog_action, from, quant, staked )
}

void folio_ledger::unstake(const name& owner, const asset& quantity) {
   require_auth( owner );
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )
   CHECKC( quantity.symbol == _gstate.gov_token.get_symbol(), err::SYMBOL_MISMATCH, "unstake symbol mismatch: " + symbol_to_string(quantity.symbol) )
   CHECKC( quantity.amount > 0, err::INVALID_ARGUMENT, "quantity must be positive" )

   stake_t::tbl_t stakes(_self, _self.value);
   auto itr = stakes.find(owner.value);
   CHECKC( itr != stakes.end() && itr->amount >= quantity, err::INSUFFICIENT_STAKE, "insufficient stake" )

   stakes.modify(itr, same_payer, [&](auto& row) {
      row.amount -= quantity;
   });
   _gstate.total_staked -= quantity;

   _pay_from_custody( _gstate.gov_token, owner, quantity, TYPE_UNSTAKE );
}

/**
 * @brief pay 1% of the stake for every full 30-day period since the last stake
 *        the stake time is kept, so a later claim counts the same periods again
 */
void folio_ledger::claimreward(const name& owner) {
   require_auth( owner );
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )

   stake_t::tbl_t stakes(_self, _self.value);
   auto itr = stakes.find(owner.value);
   CHECKC( itr != stakes.end() && itr->amount.amount > 0, err::INSUFFICIENT_STAKE, "nothing staked" )

   uint64_t elapsed = current_time_point().sec_since_epoch() - itr->last_staked_at.sec_since_epoch();
   uint64_t periods = elapsed / REWARD_PERIOD_SECONDS;
   int128_t amount  = (int128_t)itr->amount.amount * periods * REWARD_PERCENT_PER_PERIOD / PERCENT_BOOST;
   CHECKC( amount <= asset::max_amount, err::SYSTEM_ERROR, "reward overflow" )

   auto reward = asset( (int64_t)amount, itr->amount.symbol );
   TRACE_L("claimreward ", owner, " periods: ", periods, " reward: ", reward);
   if (reward.amount > 0)
      _pay_free_gov( owner, reward, TYPE_REWARD );

   EMIT( rewardlog_action, owner, reward, periods )
}

void folio_ledger::slash(const name& owner, const asset& quantity) {
   _check_admin();
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )
   CHECKC( quantity.symbol == _gstate.gov_token.get_symbol(), err::SYMBOL_MISMATCH, "slash symbol mismatch: " + symbol_to_string(quantity.symbol) )
   CHECKC( quantity.amount > 0, err::INVALID_ARGUMENT, "quantity must be positive" )

   stake_t::tbl_t stakes(_self, _self.value);
   auto itr = stakes.find(owner.value);
   CHECKC( itr != stakes.end() && itr->amount >= quantity, err::INSUFFICIENT_STAKE, "slash exceeds stake" )

   auto staked = itr->amount - quantity;
   stakes.modify(itr, same_payer, [&](auto& row) {
      row.amount = staked;
   });
   _gstate.total_staked -= quantity;

   EMIT( slashlog_action, owner, quantity, staked )
}

void folio_ledger::issuegov(const name& to, const asset& quantity, const string& memo) {
   _check_admin();
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )
   CHECKC( is_account(to), err::INVALID_ARGUMENT, "to account does not exist: " + to.to_string() )
   CHECKC( quantity.symbol == _gstate.gov_token.get_symbol(), err::SYMBOL_MISMATCH, "gov symbol mismatch: " + symbol_to_string(quantity.symbol) )
   CHECKC( quantity.amount > 0, err::INVALID_ARGUMENT, "quantity must be positive" )
   CHECKC( memo.size() <= 256, err::INVALID_ARGUMENT, "memo too long" )

   _pay_free_gov( to, quantity, memo );
   EMIT( govissuelog_action, to, quantity )
}

} //namespace folio
