// Bonding curve math (templated, exact uint256 settlement path plus
// floating-point reference evaluations of the same closed forms)
//
// Curve:    price(x)    = base * (1 + x/S)^2            x = units sold, S = sellable supply
// Area:     A(a, b)     = base * ((S+b)^3 - (S+a)^3) / (3 * S^2 * WAD)
// Buy:      solve A(sold, sold + dx) = reserve_in for dx (cube root)
// Sell:     A(sold - dx, sold), closed form
//
// Prices are quoted in reserve units per WAD token units.
#pragma once

#include <cmath>
#include <cstddef>
#include <stdexcept>

#include "core/numeric_types.hpp"
#include "curve/constants.hpp"
#include "curve/errors.hpp"

namespace lc {
namespace curve {

// Result of sizing a trade: amount out and fee withheld
template <typename T>
struct TradeQuote {
    T amount{};
    T fee{};
    bool clamped{false};   // buy was cut down to the remaining sellable supply
};

template <typename T>
struct CurveTraits;

template <>
struct CurveTraits<uint256_t> {
    using Wide = uint512_t;
    static const uint256_t& WAD() { return curve::WAD(); }
    static const uint256_t& SELLABLE() { return SELLABLE_SUPPLY(); }
};

template <>
struct CurveTraits<double> {
    static double WAD() { return 1e18; }
    static double SELLABLE() { return 8e26; }
};

template <>
struct CurveTraits<long double> {
    static long double WAD() { return 1e18L; }
    static long double SELLABLE() { return 8e26L; }
};

// Cube-root solver bounds for the integer path
struct CbrtBounds {
    static constexpr std::size_t MAX_IT = 10;
    static constexpr std::size_t MAX_FIXUP = 4;
};

// floor(cbrt(N)) for 512-bit N.
// Seeded from a double estimate pushed above the root by more than its relative
// error (2^-30 >> 1e-15), so every Newton step y <- (2y + N/y^2)/3 decreases
// monotonically toward the root. From that seed the error squares each step and
// four steps reach the integer root for any N < 2^512; MAX_IT = 10 leaves slack.
// The result is certified with y^3 <= N < (y+1)^3.
inline uint512_t icbrt(const uint512_t& N) {
    if (N == 0) return 0;

    const double est = std::cbrt(N.convert_to<double>());
    uint512_t y = uint512_t(est);
    y += (y >> 30) + 2;

    for (std::size_t it = 0; it < CbrtBounds::MAX_IT; ++it) {
        const uint512_t y_next = (2 * y + N / (y * y)) / 3;
        if (y_next >= y) break;
        y = y_next;
    }

    for (std::size_t k = 0; k < CbrtBounds::MAX_FIXUP && y * y * y > N; ++k) --y;
    for (std::size_t k = 0; k < CbrtBounds::MAX_FIXUP && (y + 1) * (y + 1) * (y + 1) <= N; ++k) ++y;

    if (y * y * y > N || (y + 1) * (y + 1) * (y + 1) <= N) {
        throw invariant_violation("math: cube root did not converge");
    }
    return y;
}

template <typename T>
struct CurveMath;

// Exact integer curve. All divisions truncate; buys round the token amount down
// and sells round the reserve amount down, so a round trip never gains.
template <>
struct CurveMath<uint256_t> {
    using T = uint256_t;
    using W = uint512_t;
    using Traits = CurveTraits<T>;

    static T fee(const T& amount) {
        return narrow_u256(W(amount) * PLATFORM_FEE_BPS / BASIS_POINTS);
    }

    // Fraction of sellable supply sold, 1e18-scaled
    static T progress(const T& units_sold) {
        if (units_sold >= Traits::SELLABLE()) return Traits::WAD();
        return units_sold * Traits::WAD() / Traits::SELLABLE();
    }

    static T price(const T& base_price, const T& units_sold) {
        if (units_sold > Traits::SELLABLE()) return 0;
        const W f = W(Traits::WAD()) + W(progress(units_sold));
        const W wad = W(Traits::WAD());
        return narrow_u256(W(base_price) * f * f / (wad * wad));
    }

    // Reserve backing the segment [from, to] of the curve
    static T area(const T& base_price, const T& from, const T& to) {
        if (to < from) {
            throw std::invalid_argument("math: reversed curve segment");
        }
        const W S = W(Traits::SELLABLE());
        const W g0 = S + W(from);
        const W g1 = S + W(to);
        const W den = 3 * S * S * W(Traits::WAD());
        return narrow_u256(W(base_price) * (g1 * g1 * g1 - g0 * g0 * g0) / den);
    }

    // Units bought by reserve_in (already net of fee), clamped to remaining supply
    static T tokens_for_reserve(const T& base_price, const T& units_sold,
                                const T& reserve_in, bool* clamped = nullptr) {
        if (clamped) *clamped = false;
        if (base_price == 0) {
            throw invalid_trade("base price not set");
        }
        if (reserve_in == 0 || units_sold >= Traits::SELLABLE()) return 0;

        const W S = W(Traits::SELLABLE());
        const W g0 = S + W(units_sold);
        const W target = g0 * g0 * g0 + 3 * W(reserve_in) * S * S * W(Traits::WAD()) / W(base_price);
        const W g1 = icbrt(target);
        if (g1 <= g0) return 0;

        T units = narrow_u256(g1 - g0);
        const T remaining = Traits::SELLABLE() - units_sold;
        if (units > remaining) {
            units = remaining;
            if (clamped) *clamped = true;
        }
        return units;
    }

    // Gross reserve released by selling units_in back into the curve
    static T reserve_for_tokens(const T& base_price, const T& units_sold, const T& units_in) {
        if (units_in > units_sold) {
            throw invalid_trade("Cannot sell more than sold");
        }
        return area(base_price, units_sold - units_in, units_sold);
    }

    // Fee comes off the input; computed on the full input even when clamped
    static TradeQuote<T> quote_buy(const T& base_price, const T& units_sold, const T& reserve_in) {
        TradeQuote<T> q;
        q.fee = fee(reserve_in);
        q.amount = tokens_for_reserve(base_price, units_sold, reserve_in - q.fee, &q.clamped);
        return q;
    }

    // Fee comes off the computed payout
    static TradeQuote<T> quote_sell(const T& base_price, const T& units_sold, const T& units_in) {
        const T gross = reserve_for_tokens(base_price, units_sold, units_in);
        TradeQuote<T> q;
        q.fee = fee(gross);
        q.amount = gross - q.fee;
        return q;
    }
};

// Continuous reference curve. Same closed forms, evaluated in floating point
// with cancellation-free rearrangements; used to bound drift of the integer path.
template <typename T>
struct FloatCurveMath {
    using Traits = CurveTraits<T>;

    static T fee(T amount) {
        return amount * T(PLATFORM_FEE_BPS) / T(BASIS_POINTS);
    }

    static T progress(T units_sold) {
        if (units_sold >= Traits::SELLABLE()) return T(1);
        return units_sold / Traits::SELLABLE();
    }

    static T price(T base_price, T units_sold) {
        if (units_sold > Traits::SELLABLE()) return T(0);
        const T f = T(1) + progress(units_sold);
        return base_price * f * f;
    }

    // g1^3 - g0^3 = (g1 - g0)(g1^2 + g1 g0 + g0^2)
    static T area(T base_price, T from, T to) {
        const T S = Traits::SELLABLE();
        const T g0 = S + from;
        const T g1 = S + to;
        return base_price * (to - from) * (g1 * g1 + g1 * g0 + g0 * g0) / (T(3) * S * S * Traits::WAD());
    }

    // dx = g0 * ((1 + d)^(1/3) - 1), d = 3 r S^2 WAD / (base g0^3)
    static T tokens_for_reserve(T base_price, T units_sold, T reserve_in, bool* clamped = nullptr) {
        if (clamped) *clamped = false;
        if (!(base_price > T(0))) {
            throw invalid_trade("base price not set");
        }
        if (!(reserve_in > T(0)) || units_sold >= Traits::SELLABLE()) return T(0);

        const T S = Traits::SELLABLE();
        const T g0 = S + units_sold;
        const T d = T(3) * reserve_in * (S / g0) * (S / g0) * Traits::WAD() / (base_price * g0);
        T units = g0 * std::expm1(std::log1p(d) / T(3));

        const T remaining = S - units_sold;
        if (units > remaining) {
            units = remaining;
            if (clamped) *clamped = true;
        }
        return units;
    }

    static T reserve_for_tokens(T base_price, T units_sold, T units_in) {
        if (units_in > units_sold) {
            throw invalid_trade("Cannot sell more than sold");
        }
        return area(base_price, units_sold - units_in, units_sold);
    }

    static TradeQuote<T> quote_buy(T base_price, T units_sold, T reserve_in) {
        TradeQuote<T> q;
        q.fee = fee(reserve_in);
        q.amount = tokens_for_reserve(base_price, units_sold, reserve_in - q.fee, &q.clamped);
        return q;
    }

    static TradeQuote<T> quote_sell(T base_price, T units_sold, T units_in) {
        const T gross = reserve_for_tokens(base_price, units_sold, units_in);
        TradeQuote<T> q;
        q.fee = fee(gross);
        q.amount = gross - q.fee;
        return q;
    }
};

template <>
struct CurveMath<double> : FloatCurveMath<double> {};

template <>
struct CurveMath<long double> : FloatCurveMath<long double> {};

} // namespace curve
} // namespace lc
