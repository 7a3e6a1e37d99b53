#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/permission.hpp>
#include <eosio/action.hpp>

#include <string>

#include <folio.ledger/folio.ledger.db.hpp>
#include <price.oracle/price.oracle.states.hpp>

namespace folio {

using std::string;
using std::vector;

using namespace eosio;

enum class err: uint8_t {
   NONE                 = 0,
   RECORD_NOT_FOUND     = 1,
   ALREADY_EXISTS       = 2,
   CONTRACT_MISMATCH    = 3,
   SYMBOL_MISMATCH      = 4,
   MEMO_FORMAT_ERROR    = 6,
   PAUSED               = 7,
   NO_AUTH              = 8,
   NOT_OWNER            = 9,
   ALREADY_BOUND        = 10,
   ASSET_NOT_FOUND      = 11,
   VOTING_CLOSED        = 12,
   INSUFFICIENT_BALANCE = 13,
   INSUFFICIENT_STAKE   = 14,
   INVALID_PRICE        = 15,
   NO_ORACLE            = 16,
   REPAYMENT_FAILED     = 17,
   ALREADY_EXECUTED     = 18,
   INVALID_ARGUMENT     = 19,
   NOTHING_TO_WITHDRAW  = 20,
   SYSTEM_ERROR         = 200
};

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, string("[[") + to_string((int)code) + string("]] ") + msg); }

#define EMIT(wrapper, ...) \
   {  folio_ledger::wrapper act{ _self, { {_self, active_permission} } };\
         act.send( __VA_ARGS__ );}

/**
 * The `folio.ledger` contract keeps one investment portfolio per account and
 * layers staking, flash loans, governance, insurance and referrals on top of it.
 *
 * Governance tokens, the native token and portfolio asset tokens are held in the
 * custody of the contract account. Value enters through token transfers
 * (see `ontransfer`) and leaves through inline `transfer` actions. Every action is
 * a single atomic transition: any failed check rolls back the whole transaction,
 * inline transfers included.
 */
class [[eosio::contract("folio.ledger")]] folio_ledger : public contract {
   public:
      using contract::contract;

   folio_ledger(eosio::name receiver, eosio::name code, datastream<const char*> ds): contract(receiver, code, ds),
        _global(get_self(), get_self().value)
    {
      _gstate = _global.exists() ? _global.get() : global_t{};
    }

    ~folio_ledger() { _global.set( _gstate, get_self() ); }

   /**
    * memo:
    *    "stake"                     governance token, adds to the sender's stake
    *    "insure:<coverage amount>"  governance token premium, buys a policy for the sender
    *    anything else               accepted into custody (flash-loan liquidity, reward and claim funding)
    */
   [[eosio::on_notify("*::transfer")]]
   void ontransfer(const name& from, const name& to, const asset& quant, const string& memo);

   //admin
   ACTION init(const name& admin, const extended_symbol& gov_token, const extended_symbol& native_token, const symbol& quote_symbol);
   ACTION setenabled(const bool& enabled);
   ACTION setfeed(const symbol& sym, const name& oracle, const name& coin);
   ACTION slash(const name& owner, const asset& quantity);
   ACTION issuegov(const name& to, const asset& quantity, const string& memo);

   //portfolio
   ACTION initfolio(const name& owner);
   ACTION addasset(const name& owner, const asset& quantity, const asset& value);
   ACTION refresh(const name& owner, const symbol& sym);
   ACTION withdraw(const name& owner, const name& bank, const name& to, const asset& quantity);
   ACTION emergencyout(const name& owner, const vector<extended_symbol>& tokens);
   ACTION rebalance(const name& owner, const vector<symbol>& syms, const vector<uint64_t>& ratios);
   [[eosio::action]] bool checkrisk(const name& owner);
   ACTION applyfees(const name& owner, const asset& bonus_threshold);
   ACTION setfees(const name& owner, const uint8_t& management_fee, const uint8_t& performance_fee);
   ACTION setriskband(const name& owner, const asset& min_value, const asset& max_value, const uint64_t& risk_score);

   //staking
   ACTION unstake(const name& owner, const asset& quantity);
   ACTION claimreward(const name& owner);

   //flash loan
   ACTION flashloan(const name& borrower, const asset& quantity);
   ACTION chkrepay(const name& borrower);

   //governance
   ACTION propose(const name& proposer, const string& description, const uint32_t& voting_period);
   ACTION vote(const name& voter, const uint64_t& proposal_id, const uint64_t& votes);

   //insurance, policies are bought by transfer (see `ontransfer`)
   ACTION claiminsure(const name& owner);

   //referral
   ACTION refer(const name& referrer, const name& new_user);

   //audit records
   ACTION valuelog(const name& owner, const symbol& sym, const asset& old_value, const asset& new_value);
   ACTION feeslog(const name& owner, const asset& management_fee, const asset& performance_fee, const asset& total_value);
   ACTION withdrawlog(const name& owner, const name& to, const asset& quantity, const asset& value);
   ACTION stakelog(const name& owner, const asset& quantity, const asset& staked);
   ACTION flashlog(const name& borrower, const asset& principal, const asset& fee);
   ACTION govissuelog(const name& to, const asset& quantity);
   ACTION proposallog(const uint64_t& proposal_id, const name& proposer, const time_point_sec& voting_deadline);
   ACTION votelog(const name& voter, const uint64_t& proposal_id, const uint64_t& votes);
   ACTION insurelog(const name& owner, const asset& coverage, const asset& premium);
   ACTION claimlog(const name& owner, const asset& coverage);
   ACTION rewardlog(const name& owner, const asset& reward, const uint64_t& periods);
   ACTION slashlog(const name& owner, const asset& quantity, const asset& staked);

   using chkrepay_action      = action_wrapper<"chkrepay"_n,     &folio_ledger::chkrepay>;
   using valuelog_action      = action_wrapper<"valuelog"_n,     &folio_ledger::valuelog>;
   using feeslog_action       = action_wrapper<"feeslog"_n,      &folio_ledger::feeslog>;
   using withdrawlog_action   = action_wrapper<"withdrawlog"_n,  &folio_ledger::withdrawlog>;
   using stakelog_action      = action_wrapper<"stakelog"_n,     &folio_ledger::stakelog>;
   using flashlog_action      = action_wrapper<"flashlog"_n,     &folio_ledger::flashlog>;
   using govissuelog_action   = action_wrapper<"govissuelog"_n,  &folio_ledger::govissuelog>;
   using proposallog_action   = action_wrapper<"proposallog"_n,  &folio_ledger::proposallog>;
   using votelog_action       = action_wrapper<"votelog"_n,      &folio_ledger::votelog>;
   using insurelog_action     = action_wrapper<"insurelog"_n,    &folio_ledger::insurelog>;
   using claimlog_action      = action_wrapper<"claimlog"_n,     &folio_ledger::claimlog>;
   using rewardlog_action     = action_wrapper<"rewardlog"_n,    &folio_ledger::rewardlog>;
   using slashlog_action      = action_wrapper<"slashlog"_n,     &folio_ledger::slashlog>;

   private:
      void _check_admin();

      //loads the portfolio of `owner` after the ownership check
      portfolio_t _get_folio(const name& owner, portfolio_t::tbl_t& folios);
      void _save_folio(portfolio_t::tbl_t& folios, const portfolio_t& folio);

      void _on_stake(const name& from, const asset& quant);
      void _on_insure(const name& from, const asset& premium, const string& coverage_str);
      void _pay_from_custody(const extended_symbol& ext_sym, const name& to, const asset& quant, const string& memo);
      //governance token payout that leaves staked principal untouched
      void _pay_free_gov(const name& to, const asset& quant, const string& memo);

      global_singleton     _global;
      global_t             _gstate;
};
} //namespace folio
