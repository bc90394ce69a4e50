#include "keeper/replay_runner.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "keeper/ledger_system.hpp"
#include "telemetry/csv_logger.hpp"
#include "telemetry/health_report.hpp"
#include "wallet/request_authenticator.hpp"
#include <fstream>
#include <stdexcept>

namespace {
  // Requests acting on behalf of a caller; only these are signature-checked
  bool CarriesCaller(const std::string& op) {
    return op == "mint" || op == "redeem" || op == "redeem_bond" || op == "enqueue_bond" ||
           op == "approve" || op == "pause" || op == "unpause" || op == "set_param" || op == "update_index";
  }

  std::string AmountText(const nlohmann::json& request, const char* key) {
    auto it = request.find(key);
    if (it == request.end()) throw std::invalid_argument(std::string("missing \"") + key + "\"");
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_unsigned()) return std::to_string(it->get<uint64_t>());
    throw std::invalid_argument(std::string("\"") + key + "\" must be a decimal string or an unsigned integer");
  }

  U256 Amount(const nlohmann::json& request, const char* key, unsigned decimals) {
    return FixedPoint::ParseDecimal(AmountText(request, key), decimals);
  }

  std::string Fmt(const U256& value, unsigned decimals) { return FixedPoint::FormatDecimal(value, decimals); }
}

ReplayRunner::ReplayRunner(LedgerSystem& system, ManualClock& clock, CsvLogger* csv, bool require_signatures)
  : system_(system), clock_(clock), csv_(csv), require_signatures_(require_signatures) {}

ReplayOutcome ReplayRunner::Apply(const nlohmann::json& request, size_t line) {
  ReplayOutcome outcome;
  outcome.line = line;
  Address caller;
  try {
    if (!request.is_object()) throw std::invalid_argument("request must be a JSON object");
    outcome.op = request.at("op").get<std::string>();
    caller = system_.ResolveAccount(request.value("caller", std::string("admin")));
    if (CarriesCaller(outcome.op)) {
      RequestAuth::Verify(request, caller, require_signatures_);
      // a verified signature spends the nonce even when the request then fails
      if (request.contains("signature")) nonces_.Consume(caller, RequestAuth::Nonce(request));
    }
    outcome.result = Dispatch(outcome.op, request, caller);
    outcome.ok = true;
  } catch (const LedgerError& e) {
    outcome.code = ErrorCodeName(e.Code());
    outcome.message = e.what();
  } catch (const std::invalid_argument& e) {
    outcome.code = "InvalidRequest";
    outcome.message = e.what();
  } catch (const nlohmann::json::exception& e) {
    outcome.code = "InvalidRequest";
    outcome.message = e.what();
  } catch (const std::exception& e) {
    outcome.code = "Error";
    outcome.message = e.what();
  }
  ++applied_;
  if (!outcome.ok) {
    ++failed_;
    BITRES_LOG_INFO("replay line " + std::to_string(line) + " " + outcome.op + " failed: " + outcome.message);
  }
  Record(outcome, caller);
  return outcome;
}

nlohmann::json ReplayRunner::Dispatch(const std::string& op, const nlohmann::json& request, const Address& caller) {
  auto& engine = system_.engine;
  auto& substrate = system_.substrate;
  const unsigned reserve_dec = system_.reserve.Decimals();
  const unsigned stable_dec = system_.stable.Decimals();

  if (op == "mint") {
    const U256 amount = Amount(request, "amount", reserve_dec);
    const MintResult r = substrate.Execute(op, [&] { return engine.Mint(caller, amount); });
    return {{"reserve_in", Fmt(r.reserve_in, reserve_dec)}, {"gross_stable", Fmt(r.gross_stable, stable_dec)},
            {"fee", Fmt(r.fee, stable_dec)}, {"stable_minted", Fmt(r.stable_minted, stable_dec)},
            {"reserve_price", Fmt(r.reserve_price, 18)}};
  }
  if (op == "redeem") {
    const U256 amount = Amount(request, "amount", stable_dec);
    const RedemptionQuote q = substrate.Execute(op, [&] { return engine.Redeem(caller, amount); });
    return {{"tier", RedemptionTierName(q.tier)}, {"fee", Fmt(q.fee, stable_dec)},
            {"net_stable", Fmt(q.net_stable, stable_dec)}, {"reserve_out", Fmt(q.reserve_out, reserve_dec)},
            {"bond_out", Fmt(q.bond_out, 18)}, {"backstop_out", Fmt(q.backstop_out, 18)},
            {"collateral_ratio", Fmt(q.collateral_ratio, 18)}};
  }
  if (op == "redeem_bond") {
    const U256 amount = Amount(request, "amount", system_.bond.Decimals());
    const BondRedemptionResult r = substrate.Execute(op, [&] { return engine.RedeemBond(caller, amount); });
    return {{"bond_burned", Fmt(r.bond_burned, 18)}, {"stable_out", Fmt(r.stable_out, stable_dec)},
            {"cap", Fmt(r.cap, stable_dec)}};
  }
  if (op == "enqueue_bond") {
    const U256 amount = Amount(request, "amount", system_.bond.Decimals());
    const uint64_t ticket = substrate.Execute(op, [&] { return engine.EnqueueBondRedemption(caller, amount); });
    return {{"ticket", ticket}, {"pending", engine.PendingBondRequests()}};
  }
  if (op == "process_bond_queue") {
    const size_t max = request.value("max", static_cast<size_t>(16));
    const auto outcomes = substrate.Execute(op, [&] { return engine.ProcessBondQueue(max); });
    nlohmann::json served = nlohmann::json::array();
    for (const auto& o : outcomes) {
      served.push_back({{"ticket", o.ticket}, {"caller", o.caller}, {"amount", Fmt(o.amount, 18)},
                        {"served", o.served}, {"error", o.error}});
    }
    return {{"outcomes", served}, {"pending", engine.PendingBondRequests()}};
  }
  if (op == "approve") {
    InMemoryTokenLedger& ledger = system_.Ledger(ParseAsset(request.value("asset", std::string("RESERVE"))));
    const Address spender = system_.ResolveAccount(request.value("spender", std::string("engine")));
    const std::string text = AmountText(request, "amount");
    const U256 amount = text == "max" ? FixedPoint::MaxU256() : FixedPoint::ParseDecimal(text, ledger.Decimals());
    substrate.Execute(op, [&] { ledger.Approve(caller, spender, amount); });
    return {{"owner", caller}, {"spender", spender}, {"asset", ledger.Symbol()}};
  }
  if (op == "fund") {
    InMemoryTokenLedger& ledger = system_.Ledger(ParseAsset(request.value("asset", std::string("RESERVE"))));
    const Address account = system_.ResolveAccount(request.at("account").get<std::string>());
    const U256 amount = Amount(request, "amount", ledger.Decimals());
    substrate.Execute(op, [&] { ledger.Mint(account, amount); });
    return {{"account", account}, {"balance", Fmt(ledger.BalanceOf(account), ledger.Decimals())}};
  }
  if (op == "swap") {
    ConstantProductPool& pool = system_.PoolFor(ParseAsset(request.at("asset").get<std::string>()));
    const bool zero_for_one = request.value("zero_for_one", true);
    const unsigned in_dec = zero_for_one ? pool.Token0Decimals() : pool.Token1Decimals();
    const unsigned out_dec = zero_for_one ? pool.Token1Decimals() : pool.Token0Decimals();
    const U256 amount = Amount(request, "amount", in_dec);
    const U256 out = substrate.Execute(op, [&] { return pool.Swap(zero_for_one, amount); });
    return {{"pair", pool.PairId()}, {"amount_out", Fmt(out, out_dec)}, {"spot_price0", Fmt(pool.SpotPrice0(), 18)}};
  }
  if (op == "advance") {
    const uint64_t seconds = request.at("seconds").get<uint64_t>();
    clock_.Advance(seconds);
    return {{"now", clock_.Now()}};
  }
  if (op == "poke") {
    std::vector<std::string> pairs;
    if (request.contains("pair")) pairs.push_back(request.at("pair").get<std::string>());
    else pairs = system_.twap.TrackedPairs();
    nlohmann::json shifted = nlohmann::json::object();
    for (const auto& pair : pairs) {
      shifted[pair] = substrate.Execute(op, [&] { return system_.twap.RecordObservationIfDue(pair); });
    }
    return {{"recorded", shifted}};
  }
  if (op == "set_feed") {
    StaticPriceFeed& feed = system_.StaticFeed(request.at("feed").get<std::string>());
    if (request.contains("price") && request.at("price").is_null()) {
      feed.Clear();
      return {{"feed", feed.Name()}, {"price", nullptr}};
    }
    const U256 price = Amount(request, "price", FixedPoint::kWadDecimals);
    feed.SetValue(price);
    return {{"feed", feed.Name()}, {"price", Fmt(price, 18)}};
  }
  if (op == "pause") {
    substrate.Execute(op, [&] { engine.Pause(caller); });
    return {{"paused", true}};
  }
  if (op == "unpause") {
    substrate.Execute(op, [&] { engine.Unpause(caller); });
    return {{"paused", false}};
  }
  if (op == "set_param") {
    const ParamType type = ParseParamType(request.at("param").get<std::string>());
    const std::string text = AmountText(request, "value");
    const U256 value = type == ParamType::BondFloorPrice ? FixedPoint::ParseDecimal(text) : FixedPoint::ParseInteger(text);
    substrate.Execute(op, [&] { system_.params.SetParam(caller, type, value); });
    return {{"param", ParamTypeName(type)}, {"value", value.str()}};
  }
  if (op == "update_index") {
    const IndexUpdate u = substrate.Execute(op, [&] { return system_.unit_index->Update(caller); });
    return {{"value", Fmt(u.value, 18)}, {"pce", Fmt(u.pce, 18)}, {"info", system_.unit_index->FormattedInfo()}};
  }
  if (op == "health") {
    return BuildHealthReport(system_.twap, system_.validator, engine, system_.vault);
  }
  throw std::invalid_argument("unknown op \"" + op + "\"");
}

void ReplayRunner::Record(const ReplayOutcome& outcome, const Address& caller) {
  if (!csv_) return;
  RequestRecord record;
  record.timestamp = std::to_string(clock_.Now());
  record.request = outcome.op;
  record.caller = caller;
  const auto& r = outcome.result;
  auto field = [&r](const char* key) { return r.contains(key) && r.at(key).is_string() ? r.at(key).get<std::string>() : std::string(); };
  if (outcome.op == "mint") {
    record.reserve_amount = field("reserve_in");
    record.stable_amount = field("stable_minted");
    record.fee = field("fee");
  } else if (outcome.op == "redeem") {
    record.reserve_amount = field("reserve_out");
    record.stable_amount = field("net_stable");
    record.bond_amount = field("bond_out");
    record.backstop_amount = field("backstop_out");
    record.fee = field("fee");
    record.collateral_ratio = field("collateral_ratio");
    record.detail = field("tier");
  } else if (outcome.op == "redeem_bond") {
    record.bond_amount = field("bond_burned");
    record.stable_amount = field("stable_out");
  }
  if (outcome.ok) csv_->LogRequest(record);
  else csv_->LogFailure(record, outcome.code, outcome.message);
}

std::vector<ReplayOutcome> ReplayRunner::RunStream(std::istream& in) {
  std::vector<ReplayOutcome> outcomes;
  std::string text;
  size_t line = 0;
  while (std::getline(in, text)) {
    ++line;
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos || text[first] == '#') continue;
    nlohmann::json request;
    try {
      request = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
      ReplayOutcome bad;
      bad.line = line;
      bad.code = "InvalidRequest";
      bad.message = e.what();
      ++applied_;
      ++failed_;
      BITRES_LOG_WARN("replay line " + std::to_string(line) + " is not JSON: " + e.what());
      outcomes.push_back(bad);
      continue;
    }
    outcomes.push_back(Apply(request, line));
  }
  return outcomes;
}

std::vector<ReplayOutcome> ReplayRunner::RunFile(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) throw std::runtime_error("cannot open replay file " + path);
  BITRES_LOG_INFO("replaying " + path);
  return RunStream(in);
}
