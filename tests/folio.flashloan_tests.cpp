#include "folio.ledger_tester.hpp"

using namespace folio_test;

namespace {

const symbol AMAX_SYM = symbol(8, "AMAX");
const name   BORROWER = "borrower"_n;

class flashloan_tester : public folio_ledger_tester {
public:
   flashloan_tester() {
      BOOST_REQUIRE_EQUAL( success(), issue( NATIVE_BANK, FOLIO_LEDGER, "1000.00000000 AMAX" ) );

      create_accounts( { BORROWER } );
      set_code( BORROWER, contracts::borrower_wasm() );
      set_abi( BORROWER, contracts::borrower_abi().data() );
      set_code_permission( BORROWER );
      produce_blocks();
      load_abi( borrower_abi, BORROWER );
   }

   action_result set_borrower_mode( const name& mode, const name& sink ) {
      return push( BORROWER, borrower_abi, BORROWER, "setmode"_n, mvo()
         ("mode", mode)
         ("sink", sink) );
   }

   action_result flashloan( const name& borrower, const string& quantity ) {
      return push_ledger( borrower, "flashloan"_n, mvo()
         ("borrower", borrower)
         ("quantity", quantity) );
   }

   asset amax_balance( const name& owner ) {
      return get_balance( NATIVE_BANK, owner, AMAX_SYM );
   }

   abi_serializer borrower_abi;
};

}

BOOST_AUTO_TEST_SUITE(folio_flashloan_tests)

BOOST_FIXTURE_TEST_CASE( unrepaid_loan_rolls_back, flashloan_tester ) try {
   BOOST_REQUIRE_EQUAL( asset::from_string("0.00000000 AMAX"), amax_balance( BOB ) );

   //bob ends up with the 100 principal only, 105 is due
   BOOST_REQUIRE( is_error( flashloan( BOB, "100.00000000 AMAX" ), 17 ) );

   BOOST_REQUIRE_EQUAL( asset::from_string("1000.00000000 AMAX"), amax_balance( FOLIO_LEDGER ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("0.00000000 AMAX"), amax_balance( BOB ) );
   BOOST_REQUIRE( get_flashloan( BOB ).is_null() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( covered_loan_is_verified, flashloan_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), issue( NATIVE_BANK, BOB, "10.00000000 AMAX" ) );

   BOOST_REQUIRE_EQUAL( success(), flashloan( BOB, "100.00000000 AMAX" ) );

   auto loan = get_flashloan( BOB );
   BOOST_REQUIRE_EQUAL( "verified", loan["status"].as_string() );
   BOOST_REQUIRE_EQUAL( asset::from_string("100.00000000 AMAX"), loan["principal"].as<asset>() );
   BOOST_REQUIRE_EQUAL( asset::from_string("5.00000000 AMAX"), loan["fee"].as<asset>() );
   BOOST_REQUIRE_EQUAL( asset::from_string("10.00000000 AMAX"), loan["balance_before"].as<asset>() );

   //the balance check does not pull the principal back
   BOOST_REQUIRE_EQUAL( asset::from_string("110.00000000 AMAX"), amax_balance( BOB ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("900.00000000 AMAX"), amax_balance( FOLIO_LEDGER ) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( spending_the_loan_rolls_back, flashloan_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), issue( NATIVE_BANK, BORROWER, "10.00000000 AMAX" ) );
   BOOST_REQUIRE_EQUAL( success(), set_borrower_mode( "spend"_n, CAROL ) );

   //the principal leaves the borrower before the balance check runs
   BOOST_REQUIRE( is_error( flashloan( BORROWER, "100.00000000 AMAX" ), 17 ) );

   BOOST_REQUIRE_EQUAL( asset::from_string("1000.00000000 AMAX"), amax_balance( FOLIO_LEDGER ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("10.00000000 AMAX"), amax_balance( BORROWER ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("0.00000000 AMAX"), amax_balance( CAROL ) );
   BOOST_REQUIRE( get_flashloan( BORROWER ).is_null() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( fee_paid_inside_the_loan_is_verified, flashloan_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), issue( NATIVE_BANK, BORROWER, "10.00000000 AMAX" ) );
   BOOST_REQUIRE_EQUAL( success(), set_borrower_mode( "payfee"_n, CAROL ) );

   BOOST_REQUIRE_EQUAL( success(), flashloan( BORROWER, "100.00000000 AMAX" ) );
   BOOST_REQUIRE_EQUAL( "verified", get_flashloan( BORROWER )["status"].as_string() );

   //10 held + 100 borrowed - 5 fee sent back
   BOOST_REQUIRE_EQUAL( asset::from_string("105.00000000 AMAX"), amax_balance( BORROWER ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("905.00000000 AMAX"), amax_balance( FOLIO_LEDGER ) );

   //spending is fine while the own balance still covers principal and fee
   produce_blocks();
   BOOST_REQUIRE_EQUAL( success(), set_borrower_mode( "spend"_n, CAROL ) );
   BOOST_REQUIRE_EQUAL( success(), flashloan( BORROWER, "100.00000000 AMAX" ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("105.00000000 AMAX"), amax_balance( BORROWER ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("100.00000000 AMAX"), amax_balance( CAROL ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("805.00000000 AMAX"), amax_balance( FOLIO_LEDGER ) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( repeated_loans_reuse_record, flashloan_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), issue( NATIVE_BANK, BOB, "50.00000000 AMAX" ) );
   BOOST_REQUIRE_EQUAL( success(), flashloan( BOB, "100.00000000 AMAX" ) );
   produce_blocks();

   BOOST_REQUIRE_EQUAL( success(), flashloan( BOB, "20.00000000 AMAX" ) );
   auto loan = get_flashloan( BOB );
   BOOST_REQUIRE_EQUAL( "verified", loan["status"].as_string() );
   BOOST_REQUIRE_EQUAL( asset::from_string("1.00000000 AMAX"), loan["fee"].as<asset>() );
   BOOST_REQUIRE_EQUAL( asset::from_string("150.00000000 AMAX"), loan["balance_before"].as<asset>() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( loan_rejects_bad_requests, flashloan_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), issue( NATIVE_BANK, BOB, "5000.00000000 AMAX" ) );

   BOOST_REQUIRE( is_error( flashloan( BOB, "1000.00000001 AMAX" ), 13 ) );
   BOOST_REQUIRE( is_error( flashloan( BOB, "0.00000000 AMAX" ), 19 ) );
   BOOST_REQUIRE( is_error( flashloan( BOB, "1.0000 FOLIO" ), 4 ) );

   BOOST_REQUIRE_EQUAL( success(), flashloan( BOB, "1000.00000000 AMAX" ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("0.00000000 AMAX"), amax_balance( FOLIO_LEDGER ) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( chkrepay_is_internal, flashloan_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), issue( NATIVE_BANK, BOB, "500.00000000 AMAX" ) );
   BOOST_REQUIRE_EQUAL( error( "missing authority of folio.ledger" ),
                        push_ledger( BOB, "chkrepay"_n, mvo()("borrower", BOB) ) );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
