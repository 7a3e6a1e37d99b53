#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>

using namespace std;

#define CHECK(exp, msg) { if (!(exp)) eosio::check(false, msg); }

#define TRACE(...) eosio::print( __VA_ARGS__ )
#define TRACE_L(...) TRACE( __VA_ARGS__, "\n" )

inline vector<string_view> split(string_view str, string_view delims = " ") {
    vector<string_view> res;
    std::size_t current, previous = 0;
    current = str.find_first_of(delims);
    while (current != std::string::npos) {
        res.push_back(str.substr(previous, current - previous));
        previous = current + 1;
        current = str.find_first_of(delims, previous);
    }
    res.push_back(str.substr(previous, current - previous));
    return res;
}

inline int64_t power(int64_t base, int64_t exp) {
    int64_t ret = 1;
    while( exp > 0  ) {
        ret *= base; --exp;
    }
    return ret;
}

inline int64_t power10(int64_t exp) {
    return power(10, exp);
}

inline int64_t calc_precision(int64_t digit) {
    CHECK(digit >= 0 && digit <= 18, "precision digit " + std::to_string(digit) + " should be in range[0,18]");
    return power10(digit);
}

inline string symbol_to_string(const eosio::symbol &s) {
    return std::to_string(s.precision()) + "," + s.code().to_string();
}
