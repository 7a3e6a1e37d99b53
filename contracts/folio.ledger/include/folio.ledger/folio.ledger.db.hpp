#pragma once

#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <utils.hpp>
#include <folio.ledger.const.hpp>

#include <optional>
#include <string>
#include <vector>

namespace folio {

using namespace std;
using namespace eosio;

#define TBL struct [[eosio::table, eosio::contract("folio.ledger")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("folio.ledger")]]

NTBL("global") global_t {
    name                admin                   = "folio.admin"_n;
    extended_symbol     gov_token               = extended_symbol(GOV_SYMBOL,    GOV_BANK);     //staking, rewards, insurance
    extended_symbol     native_token            = extended_symbol(NATIVE_SYMBOL, NATIVE_BANK);  //lent by flash loans
    symbol              quote_symbol            = QUOTE_SYMBOL;                                 //portfolio valuation unit
    uint64_t            flash_fee_ratio         = DEFAULT_FLASH_FEE_RATIO;                      //5% = 500

    asset               total_staked            = asset(0, GOV_SYMBOL);
    uint64_t            total_votes             = 0;
    uint64_t            proposal_id             = 0;                                            //last issued proposal id
    bool                enabled                 = true;

    EOSLIB_SERIALIZE( global_t, (admin)(gov_token)(native_token)(quote_symbol)(flash_fee_ratio)
                                (total_staked)(total_votes)(proposal_id)(enabled) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

struct folio_asset_st {
    asset               quantity;                       //held amount, its symbol keys the asset
    asset               value;                          //in quote symbol

    EOSLIB_SERIALIZE( folio_asset_st, (quantity)(value) )
};

//Scope: _self
TBL portfolio_t {
    name                    owner;                      //PK
    asset                   total_value;
    uint64_t                total_shares            = TOTAL_SHARES;
    vector<folio_asset_st>  assets;                     //append only
    vector<asset>           historical_values;
    asset                   min_value_threshold;
    asset                   max_value_threshold;
    uint8_t                 management_fee          = 0;    //percent
    uint8_t                 performance_fee         = 0;    //percent
    uint64_t                risk_score              = 0;
    time_point_sec          created_at;
    time_point_sec          updated_at;

    portfolio_t() {}
    portfolio_t(const name& o): owner(o) {}

    uint64_t primary_key()const { return owner.value; }

    //first asset held under `sym`, if any
    folio_asset_st* find_asset(const symbol& sym) {
        for (auto& a : assets) {
            if (a.quantity.symbol == sym) return &a;
        }
        return nullptr;
    }

    typedef multi_index<"portfolios"_n, portfolio_t> tbl_t;

    EOSLIB_SERIALIZE( portfolio_t, (owner)(total_value)(total_shares)(assets)(historical_values)
                                   (min_value_threshold)(max_value_threshold)
                                   (management_fee)(performance_fee)(risk_score)
                                   (created_at)(updated_at) )
};

//Scope: _self
TBL pricefeed_t {
    symbol              sym;                            //PK: sym.code
    name                oracle;                         //oracle contract
    name                coin;                           //key in oracle prices map

    uint64_t primary_key()const { return sym.code().raw(); }

    typedef multi_index<"pricefeeds"_n, pricefeed_t> tbl_t;

    EOSLIB_SERIALIZE( pricefeed_t, (sym)(oracle)(coin) )
};

//Scope: _self
TBL stake_t {
    name                owner;                          //PK
    asset               amount;
    time_point_sec      last_staked_at;

    stake_t() {}
    stake_t(const name& o): owner(o) {}

    uint64_t primary_key()const { return owner.value; }

    typedef multi_index<"stakes"_n, stake_t> tbl_t;

    EOSLIB_SERIALIZE( stake_t, (owner)(amount)(last_staked_at) )
};

//Scope: _self
TBL flashloan_t {
    name                borrower;                       //PK
    asset               principal;
    asset               fee;
    asset               balance_before;                 //borrower balance prior to disbursement
    name                status;                         //disbursed | verified
    time_point_sec      borrowed_at;

    flashloan_t() {}
    flashloan_t(const name& b): borrower(b) {}

    uint64_t primary_key()const { return borrower.value; }

    typedef multi_index<"flashloans"_n, flashloan_t> tbl_t;

    EOSLIB_SERIALIZE( flashloan_t, (borrower)(principal)(fee)(balance_before)(status)(borrowed_at) )
};

//Scope: _self
TBL proposal_t {
    uint64_t            id;                             //PK, starts from 1
    name                proposer;
    string              description;
    uint64_t            vote_count              = 0;
    bool                executed                = false;
    time_point_sec      created_at;
    time_point_sec      voting_deadline;

    proposal_t() {}
    proposal_t(const uint64_t& i): id(i) {}

    uint64_t primary_key()const { return id; }
    uint64_t by_proposer()const { return proposer.value; }

    typedef multi_index<"proposals"_n, proposal_t,
        indexed_by<"proposer"_n, const_mem_fun<proposal_t, uint64_t, &proposal_t::by_proposer> >
    > tbl_t;

    EOSLIB_SERIALIZE( proposal_t, (id)(proposer)(description)(vote_count)(executed)(created_at)(voting_deadline) )
};

//Scope: _self
TBL policy_t {
    name                owner;                          //PK
    bool                is_active               = false;
    asset               coverage;
    asset               premium_paid;
    time_point_sec      started_at;

    policy_t() {}
    policy_t(const name& o): owner(o) {}

    uint64_t primary_key()const { return owner.value; }

    typedef multi_index<"policies"_n, policy_t> tbl_t;

    EOSLIB_SERIALIZE( policy_t, (owner)(is_active)(coverage)(premium_paid)(started_at) )
};

//Scope: _self
TBL referral_t {
    name                account;                        //PK, the referred account
    name                referrer;
    time_point_sec      created_at;

    referral_t() {}
    referral_t(const name& a): account(a) {}

    uint64_t primary_key()const { return account.value; }
    uint64_t by_referrer()const { return referrer.value; }

    typedef multi_index<"referrals"_n, referral_t,
        indexed_by<"referrer"_n, const_mem_fun<referral_t, uint64_t, &referral_t::by_referrer> >
    > tbl_t;

    EOSLIB_SERIALIZE( referral_t, (account)(referrer)(created_at) )
};

} //namespace folio
