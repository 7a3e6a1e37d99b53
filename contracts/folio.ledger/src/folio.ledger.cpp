#include <folio.ledger/folio.ledger.hpp>
#include <token.hpp>

#include <utils.hpp>

namespace folio {

void folio_ledger::init(const name& admin, const extended_symbol& gov_token, const extended_symbol& native_token, const symbol& quote_symbol) {
   require_auth( _self );
   CHECKC( is_account(admin), err::INVALID_ARGUMENT, "admin account does not exist" )
   CHECKC( is_account(gov_token.get_contract()), err::CONTRACT_MISMATCH, "gov token bank does not exist" )
   CHECKC( is_account(native_token.get_contract()), err::CONTRACT_MISMATCH, "native token bank does not exist" )
   CHECKC( quote_symbol.is_valid(), err::SYMBOL_MISMATCH, "invalid quote symbol" )

   //counters and the pause state survive a re-init, only a changed gov symbol restarts the staking total
   if (_gstate.total_staked.symbol != gov_token.get_symbol()) {
      CHECKC( _gstate.total_staked.amount == 0, err::SYSTEM_ERROR, "cannot change gov token while stakes are open" )
      _gstate.total_staked = asset(0, gov_token.get_symbol());
   }
   _gstate.admin           = admin;
   _gstate.gov_token       = gov_token;
   _gstate.native_token    = native_token;
   _gstate.quote_symbol    = quote_symbol;
}

void folio_ledger::setenabled(const bool& enabled) {
   _check_admin();
   _gstate.enabled = enabled;
}

void folio_ledger::ontransfer(const name& from, const name& to, const asset& quant, const string& memo) {
   if (from == get_self() || to != get_self()) return;

   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )
   CHECKC( quant.amount > 0, err::INVALID_ARGUMENT, "quantity must be positive" )

   auto token_bank = get_first_receiver();
   auto parts = split( memo, ":" );
   if (parts[0] == TYPE_STAKE) {
      CHECKC( parts.size() == 1, err::MEMO_FORMAT_ERROR, "memo format error: " + memo )
      CHECKC( token_bank == _gstate.gov_token.get_contract(), err::CONTRACT_MISMATCH, "stake token bank mismatch: " + token_bank.to_string() )
      CHECKC( quant.symbol == _gstate.gov_token.get_symbol(), err::SYMBOL_MISMATCH, "stake symbol mismatch: " + symbol_to_string(quant.symbol) )
      _on_stake( from, quant );
      return;
   }
   if (parts[0] == TYPE_INSURE) {
      CHECKC( parts.size() == 2, err::MEMO_FORMAT_ERROR, "memo format error: " + memo )
      CHECKC( token_bank == _gstate.gov_token.get_contract(), err::CONTRACT_MISMATCH, "premium token bank mismatch: " + token_bank.to_string() )
      _on_insure( from, quant, string(parts[1]) );
      return;
   }

   TRACE_L("custody deposit: ", from, " ", quant, "@", token_bank);
}

void folio_ledger::_check_admin() {
   CHECKC( has_auth(_self) || has_auth(_gstate.admin), err::NO_AUTH, "no auth for operate" )
}

void folio_ledger::_pay_from_custody(const extended_symbol& ext_sym, const name& to, const asset& quant, const string& memo) {
   CHECKC( quant.symbol == ext_sym.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch: " + symbol_to_string(quant.symbol) )
   auto custody = token::get_balance( ext_sym.get_contract(), _self, quant.symbol );
   CHECKC( custody >= quant, err::INSUFFICIENT_BALANCE, "insufficient custody balance: " + custody.to_string() + " < " + quant.to_string() )

   TRANSFER( ext_sym.get_contract(), to, quant, memo )
}

void folio_ledger::_pay_free_gov(const name& to, const asset& quant, const string& memo) {
   auto custody = token::get_balance( _gstate.gov_token.get_contract(), _self, _gstate.gov_token.get_symbol() );
   CHECKC( custody - _gstate.total_staked >= quant, err::INSUFFICIENT_BALANCE,
           "insufficient free gov tokens: " + (custody - _gstate.total_staked).to_string() + " < " + quant.to_string() )

   _pay_from_custody( _gstate.gov_token, to, quant, memo );
}

void folio_ledger::valuelog(const name& owner, const symbol& sym, const asset& old_value, const asset& new_value) {
   require_auth(get_self());
   require_recipient(owner);
}

void folio_ledger::feeslog(const name& owner, const asset& management_fee, const asset& performance_fee, const asset& total_value) {
   require_auth(get_self());
   require_recipient(owner);
}

void folio_ledger::withdrawlog(const name& owner, const name& to, const asset& quantity, const asset& value) {
   require_auth(get_self());
   require_recipient(owner);
}

void folio_ledger::stakelog(const name& owner, const asset& quantity, const asset& staked) {
   require_auth(get_self());
   require_recipient(owner);
}

void folio_ledger::flashlog(const name& borrower, const asset& principal, const asset& fee) {
   require_auth(get_self());
   require_recipient(borrower);
}

void folio_ledger::govissuelog(const name& to, const asset& quantity) {
   require_auth(get_self());
   require_recipient(to);
}

void folio_ledger::proposallog(const uint64_t& proposal_id, const name& proposer, const time_point_sec& voting_deadline) {
   require_auth(get_self());
   require_recipient(proposer);
}

void folio_ledger::votelog(const name& voter, const uint64_t& proposal_id, const uint64_t& votes) {
   require_auth(get_self());
   require_recipient(voter);
}

void folio_ledger::insurelog(const name& owner, const asset& coverage, const asset& premium) {
   require_auth(get_self());
   require_recipient(owner);
}

void folio_ledger::claimlog(const name& owner, const asset& coverage) {
   require_auth(get_self());
   require_recipient(owner);
}

void folio_ledger::rewardlog(const name& owner, const asset& reward, const uint64_t& periods) {
   require_auth(get_self());
   require_recipient(owner);
}

void folio_ledger::slashlog(const name& owner, const asset& quantity, const asset& staked) {
   require_auth(get_self());
   require_recipient(owner);
}

} //namespace folio
