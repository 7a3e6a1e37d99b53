#include <folio.ledger/folio.ledger.hpp>
#include <token.hpp>

#include <utils.hpp>

#include <algorithm>

namespace folio {
using namespace std;

/**
 * @brief buy a policy with a premium transferred in, memo "insure:<coverage amount>"
 *        the coverage amount is in the smallest unit of the governance token
 *        the premium stays in custody and funds later claims
 */
void folio_ledger::_on_insure(const name& from, const asset& premium, const string& coverage_str) {
   portfolio_t::tbl_t folios(_self, _self.value);
   CHECKC( folios.find(from.value) != folios.end(), err::NOT_OWNER, "portfolio not found: " + from.to_string() )

   const auto& sym = _gstate.gov_token.get_symbol();
   CHECKC( premium.symbol == sym, err::SYMBOL_MISMATCH, "premium symbol mismatch: " + symbol_to_string(premium.symbol) )
   CHECKC( !coverage_str.empty() && coverage_str.size() <= 18 &&
           std::all_of(coverage_str.begin(), coverage_str.end(), [](char c) { return c >= '0' && c <= '9'; }),
           err::MEMO_FORMAT_ERROR, "invalid coverage amount: " + coverage_str )

   auto coverage = asset( (int64_t)stoll(coverage_str), sym );
   CHECKC( coverage.amount > 0, err::INVALID_ARGUMENT, "coverage must be positive" )
   CHECKC( premium.amount == coverage.amount / PERCENT_BOOST, err::INVALID_ARGUMENT,
           "premium must be 1% of coverage: " + asset(coverage.amount / PERCENT_BOOST, sym).to_string() )

   policy_t::tbl_t policies(_self, _self.value);
   auto now = current_time_point();
   auto itr = policies.find(from.value);
   auto fill = [&](auto& row) {
      row.owner         = from;
      row.is_active     = true;
      row.coverage      = coverage;
      row.premium_paid  = premium;
      row.started_at    = now;
   };
   if (itr == policies.end())
      policies.emplace(_self, fill);
   else
      policies.modify(itr, same_payer, fill);

   EMIT( insurelog_action, from, coverage, premium )
}

//any active policy pays its full coverage, no loss is assessed
void folio_ledger::claiminsure(const name& owner) {
   require_auth( owner );
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )

   policy_t::tbl_t policies(_self, _self.value);
   auto itr = policies.find(owner.value);
   CHECKC( itr != policies.end() && itr->is_active, err::RECORD_NOT_FOUND, "no active policy: " + owner.to_string() )

   auto coverage = itr->coverage;
   policies.modify(itr, same_payer, [&](auto& row) {
      row.is_active = false;
   });

   _pay_free_gov( owner, coverage, TYPE_INSURANCE );
   EMIT( claimlog_action, owner, coverage )
}

} //namespace folio
