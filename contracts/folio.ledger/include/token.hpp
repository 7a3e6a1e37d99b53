#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <string>

#define TRANSFER(bank, to, quantity, memo) \
    {	folio::token::transfer_action act{ bank, { {_self, active_permission} } };\
            act.send( _self, to, quantity , memo );}

namespace folio {

    using std::string;
    using namespace eosio;

    /**
     * Interface of the fungible token contracts consumed by `folio.ledger`.
     * Any token deployed with the standard `transfer` action and the standard
     * `accounts` table can back the governance, native or portfolio
     * asset symbols.
     */
    class [[eosio::contract("token")]] token : public contract
    {
    public:
        using contract::contract;

        ACTION transfer(const name &from, const name &to, const asset &quantity, const string &memo);

        using transfer_action = eosio::action_wrapper<"transfer"_n, &token::transfer>;

        static asset get_balance(const name &bank, const name &owner, const symbol &sym)
        {
            accounts accountstable(bank, owner.value);
            auto itr = accountstable.find(sym.code().raw());
            if (itr == accountstable.end()) return asset(0, sym);
            return itr->balance;
        }

    private:
        struct account
        {
            asset balance;

            uint64_t primary_key() const { return balance.symbol.code().raw(); }

            EOSLIB_SERIALIZE( account, (balance) )
        };

        typedef eosio::multi_index<"accounts"_n, account> accounts;
    };

} //namespace folio
