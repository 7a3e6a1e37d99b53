#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>

#include <string>
#include <tuple>

using namespace eosio;
using std::string;

//flash loan borrower for the unit tests, acts on the principal while the loan is open
class [[eosio::contract("mock.borrower")]] mock_borrower : public contract {
   public:
      using contract::contract;

   //mode:
   //    hold     keep the principal
   //    spend    forward the principal to `sink`
   //    payfee   send the loan fee back to the lender
   struct [[eosio::table("config")]] config_t {
      name     mode        = "hold"_n;
      name     sink;
      uint64_t fee_ratio   = 500;

      EOSLIB_SERIALIZE( config_t, (mode)(sink)(fee_ratio) )
   };
   typedef eosio::singleton< "config"_n, config_t > config_singleton;

   ACTION setmode(const name& mode, const name& sink) {
      require_auth( get_self() );
      config_singleton config( get_self(), get_self().value );
      auto conf = config.get_or_default();
      conf.mode   = mode;
      conf.sink   = sink;
      config.set( conf, get_self() );
   }

   [[eosio::on_notify("amax.token::transfer")]]
   void ontransfer(const name& from, const name& to, const asset& quantity, const string& memo) {
      if (to != get_self() || memo != "flashloan") return;

      config_singleton config( get_self(), get_self().value );
      auto conf = config.get_or_default();

      if (conf.mode == "spend"_n) {
         send_transfer( conf.sink, quantity, "spent" );
      } else if (conf.mode == "payfee"_n) {
         auto fee = quantity;
         fee.amount = quantity.amount * conf.fee_ratio / 10000;
         send_transfer( from, fee, "flash fee" );
      }
   }

   private:
      void send_transfer(const name& to, const asset& quantity, const string& memo) {
         action( permission_level{ get_self(), "active"_n }, get_first_receiver(), "transfer"_n,
                 std::make_tuple( get_self(), to, quantity, memo ) ).send();
      }
};
