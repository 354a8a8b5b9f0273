// Notification types emitted by a curve (event hub + curve-local events)
#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <boost/json.hpp>

#include "core/numeric_types.hpp"

namespace lc {
namespace events {

namespace json = boost::json;

inline json::string wei(const uint256_t& v) { return json::string(v.str()); }

// ---------------------------------------------------------------------------
// Event hub notifications
// ---------------------------------------------------------------------------

struct TokenTraded {
    Address token;
    Address trader;
    Address curve;
    bool is_buy{false};
    uint256_t reserve_amount{0};
    uint256_t token_amount{0};
    uint256_t new_price{0};
    uint256_t fee{0};
    uint64_t timestamp{0};

    json::object to_json() const {
        json::object o;
        o["type"] = "TokenTraded";
        o["token"] = token;
        o["trader"] = trader;
        o["curve"] = curve;
        o["is_buy"] = is_buy;
        o["reserve_amount"] = wei(reserve_amount);
        o["token_amount"] = wei(token_amount);
        o["new_price"] = wei(new_price);
        o["fee"] = wei(fee);
        o["timestamp"] = timestamp;
        return o;
    }
};

struct PlatformFeeCollected {
    Address source;
    std::string fee_type;   // "trading" or "graduation"
    uint256_t amount{0};
    uint64_t timestamp{0};

    json::object to_json() const {
        json::object o;
        o["type"] = "PlatformFeeCollected";
        o["source"] = source;
        o["fee_type"] = fee_type;
        o["amount"] = wei(amount);
        o["timestamp"] = timestamp;
        return o;
    }
};

struct LargePurchaseAttempted {
    Address token;
    Address buyer;
    Address curve;
    uint256_t attempted_amount{0};
    uint256_t current_holdings{0};
    uint256_t max_allowed{0};
    uint64_t timestamp{0};

    json::object to_json() const {
        json::object o;
        o["type"] = "LargePurchaseAttempted";
        o["token"] = token;
        o["buyer"] = buyer;
        o["curve"] = curve;
        o["attempted_amount"] = wei(attempted_amount);
        o["current_holdings"] = wei(current_holdings);
        o["max_allowed"] = wei(max_allowed);
        o["timestamp"] = timestamp;
        return o;
    }
};

struct TokenGraduated {
    Address token;
    Address creator;
    uint256_t total_raised{0};
    uint256_t liquidity_reserve{0};
    uint256_t creator_bonus{0};
    uint64_t timestamp{0};

    json::object to_json() const {
        json::object o;
        o["type"] = "TokenGraduated";
        o["token"] = token;
        o["creator"] = creator;
        o["total_raised"] = wei(total_raised);
        o["liquidity_reserve"] = wei(liquidity_reserve);
        o["creator_bonus"] = wei(creator_bonus);
        o["timestamp"] = timestamp;
        return o;
    }
};

// ---------------------------------------------------------------------------
// Curve-local notifications
// ---------------------------------------------------------------------------

struct TokenPurchased {
    Address buyer;
    uint256_t reserve_amount{0};
    uint256_t token_amount{0};

    json::object to_json() const {
        json::object o;
        o["type"] = "TokenPurchased";
        o["buyer"] = buyer;
        o["reserve_amount"] = wei(reserve_amount);
        o["token_amount"] = wei(token_amount);
        return o;
    }
};

struct TokenSold {
    Address seller;
    uint256_t token_amount{0};
    uint256_t reserve_amount{0};

    json::object to_json() const {
        json::object o;
        o["type"] = "TokenSold";
        o["seller"] = seller;
        o["token_amount"] = wei(token_amount);
        o["reserve_amount"] = wei(reserve_amount);
        return o;
    }
};

struct LiquidityCreated {
    Address token;
    uint256_t token_amount{0};
    uint256_t reserve_amount{0};

    json::object to_json() const {
        json::object o;
        o["type"] = "LiquidityCreated";
        o["token"] = token;
        o["token_amount"] = wei(token_amount);
        o["reserve_amount"] = wei(reserve_amount);
        return o;
    }
};

struct Graduated {
    uint256_t total_raised{0};
    uint256_t liquidity_reserve{0};
    uint256_t creator_bonus{0};
    uint256_t treasury_amount{0};

    json::object to_json() const {
        json::object o;
        o["type"] = "Graduated";
        o["total_raised"] = wei(total_raised);
        o["liquidity_reserve"] = wei(liquidity_reserve);
        o["creator_bonus"] = wei(creator_bonus);
        o["treasury_amount"] = wei(treasury_amount);
        return o;
    }
};

// Variant for all notification types
using Event = std::variant<TokenTraded, PlatformFeeCollected, LargePurchaseAttempted, TokenGraduated,
                           TokenPurchased, TokenSold, LiquidityCreated, Graduated>;

inline json::object event_to_json(const Event& ev) {
    return std::visit([](const auto& e) { return e.to_json(); }, ev);
}

inline json::array events_to_json(const std::vector<Event>& evs) {
    json::array arr;
    arr.reserve(evs.size());
    for (const auto& e : evs) {
        arr.push_back(event_to_json(e));
    }
    return arr;
}

} // namespace events
} // namespace lc
