#include <folio.ledger/folio.ledger.hpp>
#include <token.hpp>

#include <utils.hpp>

namespace folio {
using namespace std;

/**
 * @brief lend native tokens within a single transaction
 *
 *  1) disbursed: the record is written and the tokens are sent to the borrower
 *  2) verified:  `chkrepay` runs after every action spawned by the transfer and
 *                aborts the transaction unless the borrower holds principal + fee
 *
 *  Nothing is pulled back into custody, only the borrower balance is checked.
 */
void folio_ledger::flashloan(const name& borrower, const asset& quantity) {
   require_auth( borrower );
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )

   const auto& bank = _gstate.native_token.get_contract();
   CHECKC( quantity.symbol == _gstate.native_token.get_symbol(), err::SYMBOL_MISMATCH, "loan symbol mismatch: " + symbol_to_string(quantity.symbol) )
   CHECKC( quantity.amount > 0, err::INVALID_ARGUMENT, "quantity must be positive" )

   auto available = token::get_balance( bank, _self, quantity.symbol );
   CHECKC( quantity <= available, err::INSUFFICIENT_BALANCE, "insufficient liquidity: " + available.to_string() )

   int128_t fee_amount = (int128_t)quantity.amount * _gstate.flash_fee_ratio / PCT_BOOST;
   auto fee       = asset( (int64_t)fee_amount, quantity.symbol );
   auto before    = token::get_balance( bank, borrower, quantity.symbol );
   auto now       = current_time_point();

   flashloan_t::tbl_t loans(_self, _self.value);
   auto itr = loans.find(borrower.value);
   if (itr == loans.end()) {
      loans.emplace(_self, [&](auto& row) {
         row.borrower         = borrower;
         row.principal        = quantity;
         row.fee              = fee;
         row.balance_before   = before;
         row.status           = LOAN_DISBURSED;
         row.borrowed_at      = now;
      });
   } else {
      CHECKC( itr->status != LOAN_DISBURSED, err::ALREADY_EXISTS, "flash loan in progress: " + borrower.to_string() )
      loans.modify(itr, same_payer, [&](auto& row) {
         row.principal        = quantity;
         row.fee              = fee;
         row.balance_before   = before;
         row.status           = LOAN_DISBURSED;
         row.borrowed_at      = now;
      });
   }

   TRANSFER( bank, borrower, quantity, TYPE_FLASHLOAN )

   chkrepay_action verify{ _self, { {_self, active_permission} } };
   verify.send( borrower );
}

void folio_ledger::chkrepay(const name& borrower) {
   require_auth( _self );

   flashloan_t::tbl_t loans(_self, _self.value);
   auto itr = loans.find(borrower.value);
   CHECKC( itr != loans.end(), err::RECORD_NOT_FOUND, "flash loan not found: " + borrower.to_string() )
   CHECKC( itr->status == LOAN_DISBURSED, err::SYSTEM_ERROR, "flash loan not disbursed: " + itr->status.to_string() )

   auto due     = itr->principal + itr->fee;
   auto balance = token::get_balance( _gstate.native_token.get_contract(), borrower, due.symbol );
   TRACE_L("chkrepay ", borrower, " before: ", itr->balance_before, " now: ", balance, " due: ", due);
   CHECKC( balance >= due, err::REPAYMENT_FAILED, "repayment failed: " + balance.to_string() + " < " + due.to_string() )

   loans.modify(itr, same_payer, [&](auto& row) {
      row.status = LOAN_VERIFIED;
   });

   EMIT( flashlog_action, borrower, itr->principal, itr->fee )
}

} //namespace folio
