#pragma once

#include <cstdint>
#include <eosio/name.hpp>
#include <eosio/asset.hpp>
using namespace eosio;


static constexpr uint16_t  PCT_BOOST                  = 10000;
static constexpr uint16_t  PERCENT_BOOST              = 100;
static constexpr uint64_t  DAY_SECONDS                = 24 * 60 * 60;
static constexpr uint64_t  REWARD_PERIOD_SECONDS      = 30 * DAY_SECONDS;       //staking reward period: 30 days
static constexpr uint64_t  REWARD_PERCENT_PER_PERIOD  = 1;                      //1% per completed period
static constexpr uint64_t  PERFORMANCE_BONUS_PERCENT  = 5;                      //extra performance fee above bonus threshold
static constexpr uint64_t  TOTAL_SHARES               = 1'000'000;
static constexpr uint64_t  DEFAULT_FLASH_FEE_RATIO    = 500;                    //5% = 500 / PCT_BOOST
static constexpr uint64_t  MAX_DESCRIPTION_SIZE       = 1024;

static constexpr eosio::name active_permission        {"active"_n};

static constexpr name       GOV_BANK                  = "folio.token"_n;
static constexpr symbol     GOV_SYMBOL                = symbol(symbol_code("FOLIO"), 4);
static constexpr name       NATIVE_BANK               = "amax.token"_n;
static constexpr symbol     NATIVE_SYMBOL             = symbol(symbol_code("AMAX"), 8);
static constexpr symbol     QUOTE_SYMBOL              = symbol(symbol_code("USDT"), 4);

//transfer memos
static constexpr char       TYPE_STAKE[]              = "stake";
static constexpr char       TYPE_INSURE[]             = "insure";
static constexpr char       TYPE_UNSTAKE[]            = "unstake";
static constexpr char       TYPE_REWARD[]             = "reward";
static constexpr char       TYPE_WITHDRAW[]           = "withdraw";
static constexpr char       TYPE_EMERGENCY[]          = "emergency";
static constexpr char       TYPE_FLASHLOAN[]          = "flashloan";
static constexpr char       TYPE_INSURANCE[]          = "insurance";

//flash loan status
static constexpr name       LOAN_DISBURSED            = "disbursed"_n;
static constexpr name       LOAN_VERIFIED             = "verified"_n;
