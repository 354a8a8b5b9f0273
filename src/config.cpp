// Scenario configuration parsing implementation

#include "harness/config.hpp"

#include <stdexcept>
#include <string>

#include "core/json_utils.hpp"

namespace lc {
namespace harness {

namespace json = boost::json;

const char* action_name(ActionType t) {
    switch (t) {
        case ActionType::Buy: return "buy";
        case ActionType::Sell: return "sell";
        case ActionType::Pause: return "pause";
        case ActionType::Unpause: return "unpause";
        case ActionType::Advance: return "advance";
    }
    return "unknown";
}

namespace {

ScenarioAction parse_action(const json::object& a, const curve::CurveConfig& cc) {
    ScenarioAction act;
    const std::string type = get_str(a, "type");

    if (type == "buy") {
        act.type = ActionType::Buy;
        act.actor = get_str(a, "trader");
        act.amount = get_u256(a, "amount");
    } else if (type == "sell") {
        act.type = ActionType::Sell;
        act.actor = get_str(a, "trader");
        const auto* v = a.if_contains("amount");
        if (v && v->is_string() && v->as_string() == "all") {
            act.sell_all = true;
        } else {
            act.amount = get_u256(a, "amount");
        }
    } else if (type == "pause" || type == "unpause") {
        act.type = (type == "pause") ? ActionType::Pause : ActionType::Unpause;
        act.actor = get_str_opt(a, "caller", cc.owner);
    } else if (type == "advance") {
        act.type = ActionType::Advance;
        act.seconds = get_u64_opt(a, "seconds", 0);
    } else {
        throw std::runtime_error("unknown action type: " + type);
    }
    return act;
}

} // namespace

ScenarioInit parse_scenario_entry(const json::object& entry) {
    ScenarioInit out;

    if (auto* v = entry.if_contains("tag")) {
        if (v->is_string()) out.tag = v->as_string().c_str();
    }

    const auto* cv = entry.if_contains("curve");
    if (!cv || !cv->is_object()) {
        throw std::runtime_error("scenario '" + out.tag + "': missing 'curve' object");
    }
    const json::object& c = cv->as_object();
    out.echo_curve = c;

    auto& cc = out.curve;
    cc.curve = get_str_opt(c, "curve", "curve");
    cc.token = get_str_opt(c, "token", "token");
    cc.creator = get_str_opt(c, "creator", "creator");
    cc.treasury = get_str_opt(c, "treasury", "treasury");
    cc.owner = get_str_opt(c, "owner", "owner");
    cc.base_price = get_u256(c, "base_price");
    out.start_ts = get_u64_opt(c, "start_timestamp", out.start_ts);
    curve::validate(cc);

    if (auto* b = entry.if_contains("balances")) {
        for (const auto& kv : b->as_object()) {
            const Address who(kv.key());
            out.balances.emplace_back(who, parse_u256(kv.value()));
        }
    }

    if (auto* acts = entry.if_contains("actions")) {
        const auto& arr = acts->as_array();
        out.actions.reserve(arr.size());
        for (std::size_t i = 0; i < arr.size(); ++i) {
            try {
                out.actions.push_back(parse_action(arr[i].as_object(), cc));
            } catch (const std::exception& e) {
                throw std::runtime_error("scenario '" + out.tag + "' action " + std::to_string(i) +
                                         ": " + e.what());
            }
        }
    }

    return out;
}

std::vector<ScenarioInit> parse_scenarios(const json::value& root) {
    std::vector<json::object> entries;
    if (root.is_object()) {
        const auto& obj = root.as_object();
        if (obj.contains("scenarios")) {
            for (auto& v : obj.at("scenarios").as_array()) {
                entries.push_back(v.as_object());
            }
        } else if (obj.contains("curve")) {
            entries.push_back(obj);
        } else {
            throw std::runtime_error("Invalid scenarios json: expected 'scenarios' array or single 'curve'");
        }
    } else if (root.is_array()) {
        for (auto& v : root.as_array()) {
            entries.push_back(v.as_object());
        }
    } else {
        throw std::runtime_error("Invalid scenarios json root type");
    }

    std::vector<ScenarioInit> result;
    result.reserve(entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        ScenarioInit s = parse_scenario_entry(entries[i]);
        if (s.tag.empty()) s.tag = "scenario_" + std::to_string(i);
        result.push_back(std::move(s));
    }
    return result;
}

std::vector<ScenarioInit> load_scenarios(const std::string& path) {
    const std::string s = read_file(path);
    return parse_scenarios(json::parse(s));
}

} // namespace harness
} // namespace lc
