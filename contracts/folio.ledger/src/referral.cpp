#include <folio.ledger/folio.ledger.hpp>

#include <utils.hpp>

namespace folio {

void folio_ledger::refer(const name& referrer, const name& new_user) {
   require_auth( referrer );
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )
   CHECKC( referrer != new_user, err::INVALID_ARGUMENT, "cannot refer self" )
   CHECKC( is_account(new_user), err::INVALID_ARGUMENT, "account does not exist: " + new_user.to_string() )

   referral_t::tbl_t referrals(_self, _self.value);
   CHECKC( referrals.find(new_user.value) == referrals.end(), err::ALREADY_EXISTS, "referrer already recorded: " + new_user.to_string() )

   referrals.emplace(_self, [&](auto& row) {
      row.account    = new_user;
      row.referrer   = referrer;
      row.created_at = current_time_point();
   });
}

} //namespace folio
