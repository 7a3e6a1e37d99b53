#pragma once

#include <limits>
#include <utils.hpp>

namespace wasm { namespace safemath {

    template<typename T>
    uint128_t multiply_decimal_down(uint128_t a, uint128_t b, T precision) {
        return a * b / precision;
    }

    inline int64_t to_int64(uint128_t v) {
        CHECK( v <= (uint128_t)std::numeric_limits<int64_t>::max(), "int64 overflow" );
        return (int64_t)v;
    }

    #define mul_down(a, b, p) to_int64(multiply_decimal_down(a, b, p))

} } //safemath
