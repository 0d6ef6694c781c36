#include <algorithm>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "karma/api/core_api.hpp"
#include "karma/config/tables.hpp"
#include "karma/engine/aggregator.hpp"
#include "karma/engine/balance_sheet.hpp"
#include "karma/engine/evaluator.hpp"
#include "karma/engine/guidance.hpp"
#include "karma/engine/reward_adapter.hpp"
#include "karma/ledger/entry.hpp"
#include "karma/ledger/ledger.hpp"
#include "karma/ledger/verify.hpp"
#include "karma/util/hash.hpp"

namespace {

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "karmaledger-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

bool near(double lhs, double rhs) {
  return std::fabs(lhs - rhs) < 1e-9;
}

karma::ConfigPtr default_config() {
  return std::make_shared<const karma::KarmaConfig>(karma::default_karma_config());
}

struct SinkState {
  std::vector<std::string> lines;
  std::size_t failures_remaining = 0;
  bool always_fail = false;
  std::size_t attempts = 0;
};

// Keeps written lines in memory; failures are scripted through the shared state.
class MemorySink final : public karma::LedgerSink {
public:
  explicit MemorySink(std::shared_ptr<SinkState> state) : state_(std::move(state)) {}

  karma::Result write(const karma::LedgerEntry& entry, std::string_view line) override {
    (void)entry;
    ++state_->attempts;
    if (state_->always_fail) {
      return karma::Result::failure("disk unavailable");
    }
    if (state_->failures_remaining > 0) {
      --state_->failures_remaining;
      return karma::Result::failure("transient write error");
    }
    state_->lines.emplace_back(line);
    return karma::Result::success();
  }

private:
  std::shared_ptr<SinkState> state_;
};

std::shared_ptr<SinkState> open_memory_ledger(karma::LedgerLogger& ledger,
                                              std::size_t capacity = 10000,
                                              const std::string& data_dir = {}) {
  auto state = std::make_shared<SinkState>();
  karma::LedgerOptions options;
  options.data_dir = data_dir;
  options.trail_capacity = capacity;
  const karma::Result opened = ledger.open(options, std::make_unique<MemorySink>(state));
  assert(opened.ok);
  return state;
}

karma::Result record_simple(karma::LedgerLogger& ledger, const std::string& message,
                            const std::string& user = "user-1") {
  karma::LedgerEventDraft draft;
  draft.event_type = karma::EventType::KarmaAction;
  draft.component = "karma_engine";
  draft.message = message;
  draft.request_id = "req-" + message;
  draft.user_id = user;
  draft.data = {{"action", message}};
  return ledger.record(draft);
}

void assert_finite(const karma::ActionEvaluation& evaluation) {
  assert(std::isfinite(evaluation.positive_impact));
  assert(std::isfinite(evaluation.negative_impact));
  assert(std::isfinite(evaluation.dridha_delta));
  assert(std::isfinite(evaluation.adridha_delta));
  assert(std::isfinite(evaluation.sanchita_delta));
  assert(std::isfinite(evaluation.prarabdha_delta));
  assert(std::isfinite(evaluation.rnanubandhan_delta));
  assert(std::isfinite(evaluation.net_karma));
  for (const double component : evaluation.purushartha) {
    assert(std::isfinite(component));
  }
}

void test_evaluate_merit_action() {
  const karma::KarmaEvaluator evaluator(default_config());
  const auto eval = evaluator.evaluate({}, "completing_lessons", 1.0);

  assert(eval.classification == karma::ActionClass::Merit);
  assert(near(eval.positive_impact, 5.0));
  assert(near(eval.negative_impact, 0.0));
  assert(near(eval.sanchita_delta, 1.5));
  assert(near(eval.prarabdha_delta, 1.0));
  assert(near(eval.dridha_delta, 2.5));
  assert(near(eval.adridha_delta, 0.0));
  assert(near(eval.rnanubandhan_delta, 0.0));
  assert(near(eval.net_karma, 5.0));
  assert(near(eval.purushartha[0], 1.2));
  assert(near(eval.purushartha[1], 0.0));
  assert(near(eval.purushartha[2], 0.0));
  assert(near(eval.purushartha[3], 1.5));
  assert(eval.corrective_recommendations.empty());

  const auto volatile_merit = evaluator.evaluate({}, "helping_peers", 2.0);
  assert(near(volatile_merit.positive_impact, 20.0));
  assert(near(volatile_merit.adridha_delta, 10.0));
  assert(near(volatile_merit.dridha_delta, 0.0));
  assert(near(volatile_merit.net_karma, 40.0));
  assert(volatile_merit.corrective_recommendations.size() == 1);
  assert(volatile_merit.corrective_recommendations.front().practice == "Bhakti");
}

void test_evaluate_demerit_action() {
  const karma::KarmaEvaluator evaluator(default_config());
  const auto eval = evaluator.evaluate({}, "cheat", 1.0);

  assert(eval.classification == karma::ActionClass::Demerit);
  assert(eval.severity == "minor");
  assert(near(eval.negative_impact, 10.0));
  assert(near(eval.positive_impact, 0.0));
  assert(near(eval.rnanubandhan_delta, 10.0));
  assert(near(eval.adridha_delta, -5.0));
  assert(near(eval.net_karma, -10.0));
  assert(near(eval.purushartha[0], -1.2));
  assert(near(eval.purushartha[3], -1.5));
  assert(eval.corrective_recommendations.size() == 1);
  assert(eval.corrective_recommendations.front().practice == "Seva");
  assert(eval.corrective_recommendations.front().urgency == karma::Urgency::Medium);

  const auto maha = evaluator.evaluate({}, "violence", 1.0);
  assert(maha.severity == "maha");
  assert(near(maha.negative_impact, 50.0));
  assert(near(maha.rnanubandhan_delta, 200.0));
  assert(near(maha.purushartha[1], -1.0));
  assert(near(maha.purushartha[2], -0.8));
  assert(maha.corrective_recommendations.size() == 3);
  assert(maha.corrective_recommendations[0].practice == "Tap");
  assert(maha.corrective_recommendations[1].practice == "Seva");
  assert(maha.corrective_recommendations[2].practice == "Meditation");
}

void test_evaluate_unknown_action_and_totality() {
  const karma::KarmaEvaluator evaluator(default_config());
  const auto eval = evaluator.evaluate({}, "xyzzy_unknown", 1.0);

  assert(eval.classification == karma::ActionClass::Default);
  assert(near(eval.positive_impact, 5.0));
  assert(near(eval.sanchita_delta, 1.5));
  assert(near(eval.prarabdha_delta, 1.0));
  assert(near(eval.dridha_delta, 2.0));
  assert(near(eval.adridha_delta, 0.0));
  assert(near(eval.net_karma, 5.0));
  for (const double component : eval.purushartha) {
    assert(near(component, 0.0));
  }

  const std::vector<std::string> odd_actions = {
      "",
      "\xe0\xa4\xb8\xe0\xa5\x87\xe0\xa4\xb5\xe0\xa4\xbe",
      std::string(10000, 'x'),
      std::string{"\x01\n\t\x7f"},
      "cheat ",
  };
  for (const auto& action : odd_actions) {
    const auto odd = evaluator.evaluate({}, action, 1.0);
    assert(odd.action == action);
    assert(odd.classification == karma::ActionClass::Default);
    assert_finite(odd);
  }
}

void test_evaluation_is_deterministic() {
  const karma::KarmaEvaluator evaluator(default_config());
  karma::BalanceSheet sheet{{"DharmaPoints", 12.0}, {"Rnanubandhan", std::string{"oops"}}};

  const auto first = evaluator.evaluate(sheet, "theft", 1.5);
  const auto second = evaluator.evaluate(sheet, "theft", 1.5);
  assert(first.negative_impact == second.negative_impact);
  assert(first.rnanubandhan_delta == second.rnanubandhan_delta);
  assert(first.adridha_delta == second.adridha_delta);
  assert(first.net_karma == second.net_karma);
  assert(first.purushartha == second.purushartha);
  assert(first.corrective_recommendations.size() == second.corrective_recommendations.size());
  for (std::size_t i = 0; i < first.corrective_recommendations.size(); ++i) {
    assert(first.corrective_recommendations[i].practice ==
           second.corrective_recommendations[i].practice);
  }
}

void test_aggregate_scalar_debt() {
  const karma::NetKarmaAggregator aggregator(default_config());
  const karma::BalanceSheet sheet{{"Rnanubandhan", 12.5}};

  const auto net = aggregator.aggregate(sheet);
  assert(near(net.breakdown.rnanubandhan, 50.0));
  assert(near(net.net_karma, -50.0));
  assert(near(net.weighted_score, -12.5));

  const auto empty = aggregator.aggregate({});
  assert(near(empty.net_karma, 0.0));
  assert(near(empty.weighted_score, 0.0));
}

void test_aggregate_full_sheet() {
  const karma::NetKarmaAggregator aggregator(default_config());
  karma::BalanceSheet sheet;
  sheet["DharmaPoints"] = 10.0;
  sheet["SevaPoints"] = std::string{"20"};
  sheet["PunyaTokens"] = 5.0;
  sheet["PaapTokens"] = karma::SeverityMap{{"minor", 5.0}, {"maha", 2.0}, {"unlisted", 1.0}};
  sheet["DridhaKarma"] = 10.0;
  sheet["AdridhaKarma"] = 10.0;
  sheet["SanchitaKarma"] = 3.0;
  sheet["PrarabdhaKarma"] = 2.0;

  const auto net = aggregator.aggregate(sheet);
  assert(near(net.breakdown.positive_karma, 35.0));
  // The demerit table has no "major" row, so the unlisted tier counts at 1.0.
  assert(near(net.breakdown.negative_karma, 16.0));
  assert(near(net.net_karma, 35.0 - 16.0 + 8.0 + 3.0 + 3.0 + 2.0));
  assert(near(net.weighted_score, 8.0 + 3.0 + 3.0 + 2.0));

  const auto stability = aggregator.stability_profile(sheet);
  assert(near(stability.dridha_ratio, 0.5));
  assert(near(stability.total, 20.0));

  const auto scores = aggregator.purushartha_score(sheet);
  assert(near(scores[0], (10.0 + 10.0) * 1.2));
  assert(near(scores[1], (6.0 + 1.0) * 1.0));
  assert(near(scores[2], (8.0 + 2.0) * 0.8));
  assert(near(scores[3], (12.0 + 4.0) * 1.5));
}

void test_rnanubandhan_shape_tolerance() {
  const karma::NetKarmaAggregator aggregator(default_config());

  const karma::BalanceSheet as_map{
      {"Rnanubandhan", karma::SeverityMap{{"minor", 10.0}, {"medium", -5.0}}}};
  assert(near(aggregator.aggregate(as_map).breakdown.rnanubandhan, 20.0));

  karma::RecordList records;
  records.push_back({"minor", std::string{"4"}});
  records.push_back({"bogus_tier", 2.0});
  records.push_back({"major", std::string{"poison"}});
  records.push_back({"major", 1.0});
  const karma::BalanceSheet as_list{{"Rnanubandhan", records}};
  const auto list_ledger = aggregator.debt_ledger(as_list);
  assert(near(list_ledger.total_debt, 4.0 + 8.0 + 4.0));
  assert(list_ledger.obligations == 3);
  assert(near(list_ledger.severity_breakdown.at("bogus_tier").weighted_amount, 8.0));

  const karma::BalanceSheet poison_scalar{{"Rnanubandhan", std::string{"abc"}}};
  assert(near(aggregator.aggregate(poison_scalar).net_karma, 0.0));

  const karma::BalanceSheet textual_scalar{{"Rnanubandhan", std::string{"2.5"}}};
  assert(near(aggregator.aggregate(textual_scalar).breakdown.rnanubandhan, 10.0));

  const karma::BalanceSheet missing{{"DharmaPoints", 3.0}};
  assert(near(aggregator.aggregate(missing).breakdown.rnanubandhan, 0.0));
  assert(karma::normalize_debt(missing).empty());

  const karma::BalanceSheet nan_scalar{{"Rnanubandhan", std::nan("")}};
  assert(std::isfinite(aggregator.aggregate(nan_scalar).net_karma));

  // Structured values in scalar buckets read as zero.
  const karma::BalanceSheet wrong_shape{{"DharmaPoints", karma::SeverityMap{{"minor", 9.0}}}};
  assert(near(aggregator.aggregate(wrong_shape).breakdown.positive_karma, 0.0));
}

class FlatWeighting final : public karma::KarmaWeighting {
public:
  double weighted_score(const karma::BalanceSheet& sheet) const override {
    return static_cast<double>(sheet.size());
  }
};

void test_injected_weighting() {
  const karma::NetKarmaAggregator aggregator(default_config(), std::make_shared<FlatWeighting>());
  const karma::BalanceSheet sheet{{"DharmaPoints", 1.0}, {"SevaPoints", 1.0}};
  assert(near(aggregator.aggregate(sheet).weighted_score, 2.0));
}

void test_recommendation_ordering() {
  std::vector<karma::CorrectiveRecommendation> recs = {
      {"Daily Practice", "r", karma::Urgency::High, 1.6},
      {"Advanced Practice", "r", karma::Urgency::High, 1.5},
      {"Atonement", "r", karma::Urgency::Low, 1.7},
      {"Seva", "first", karma::Urgency::Medium, 1.2},
      {"Seva", "second", karma::Urgency::High, 1.2},
      {"Seva", "third", karma::Urgency::Medium, 1.2},
      {"Bhakti", "r", karma::Urgency::Low, 1.3},
  };
  karma::CorrectiveGuidance::rank(recs);

  assert(recs[0].practice == "Atonement");
  assert(recs[1].practice == "Daily Practice");
  assert(recs[2].practice == "Advanced Practice");
  assert(recs[3].practice == "Bhakti");
  assert(recs[4].reason == "second");
  assert(recs[5].reason == "first");
  assert(recs[6].reason == "third");
}

void test_whole_sheet_guidance() {
  const auto config = default_config();
  const karma::NetKarmaAggregator aggregator(config);
  const karma::CorrectiveGuidance guidance(config);

  const karma::BalanceSheet empty;
  const auto basic =
      guidance.for_sheet(empty, aggregator.aggregate(empty), aggregator.default_signals(empty));
  assert(basic.size() == 2);
  assert(basic[0].practice == "Seva");
  assert(basic[1].practice == "Meditation");

  const karma::BalanceSheet indebted{{"Rnanubandhan", 12.5},
                                     {"PaapTokens", karma::SeverityMap{{"minor", 25.0}}},
                                     {"DharmaPoints", 50.0},
                                     {"SevaPoints", 50.0},
                                     {"PunyaTokens", 60.0},
                                     {"AdridhaKarma", 10.0}};
  const auto heavy = guidance.for_sheet(indebted, aggregator.aggregate(indebted),
                                        aggregator.default_signals(indebted));
  assert(heavy.size() == 4);
  assert(heavy[0].practice == "Atonement");
  assert(heavy[1].practice == "Daily Practice");
  assert(heavy[2].practice == "Tap");
  assert(heavy[3].practice == "Bhakti");

  const auto stable =
      guidance.for_sheet(empty, karma::NetKarma{}, karma::GuidanceSignals{0.9, 0.0});
  assert(stable.front().practice == "Advanced Practice");
  assert(stable.front().urgency == karma::Urgency::Medium);
}

void test_reward_adapter() {
  const karma::RewardAdapter adapter(default_config());

  const auto lessons = adapter.adapt({}, "completing_lessons", 10.0);
  assert(near(lessons.karmic_factor, 0.05));
  assert(near(lessons.adjusted_reward, 10.5));
  assert(lessons.next_role == "learner");

  const auto cheat = adapter.adapt({}, "cheat", 10.0);
  assert(near(cheat.adjusted_reward, 9.0));

  const karma::BalanceSheet volunteer{{"DharmaPoints", 40.0}, {"SevaPoints", 10.0}};
  assert(near(adapter.merit(volunteer), 52.0));
  assert(adapter.adapt(volunteer, "helping_peers", 1.0).next_role == "volunteer");

  assert(adapter.role_from_merit(300.0) == "guru");
  assert(adapter.role_from_merit(149.9) == "volunteer");
  assert(adapter.role_from_merit(-20.0) == "learner");
}

void test_config_file_overrides() {
  const auto dir = temp_dir("config");
  const auto path = dir / "karma.conf";
  {
    std::ofstream out(path);
    out << "# tuned tables\n"
        << "demerit.cheat = medium, 20\n"
        << "reward.daily_reflection = 7, stable, DharmaPoints\n"
        << "guidance.Tap = 2.0\n"
        << "role.novice = 0\n"
        << "role.elder = 10\n"
        << "net_weight.dridha = abc\n"
        << "bogus.key = 1\n"
        << "ledger.trail_capacity = 50\n";
  }

  karma::KarmaConfig config = karma::default_karma_config();
  const karma::Result loaded = karma::load_karma_config(path.string(), config);
  assert(loaded.ok);
  assert(loaded.message.find("2 ignored entries") != std::string::npos);
  assert(near(config.net_weight_dridha, 0.8));
  assert(config.ledger_trail_capacity == 50);
  assert(near(karma::practice_weight(config, "Tap"), 2.0));

  const auto shared = std::make_shared<const karma::KarmaConfig>(config);
  const karma::KarmaEvaluator evaluator(shared);
  const auto cheat = evaluator.evaluate({}, "cheat", 1.0);
  assert(cheat.severity == "medium");
  assert(near(cheat.negative_impact, 20.0));
  assert(near(cheat.rnanubandhan_delta, 40.0));
  assert(cheat.corrective_recommendations.front().practice == "Tap");

  const auto reflection = evaluator.evaluate({}, "daily_reflection", 1.0);
  assert(reflection.classification == karma::ActionClass::Merit);
  assert(near(reflection.dridha_delta, 3.5));

  const karma::RewardAdapter adapter(shared);
  assert(adapter.role_from_merit(15.0) == "elder");
  assert(adapter.role_from_merit(5.0) == "novice");

  karma::KarmaConfig untouched = karma::default_karma_config();
  assert(!karma::load_karma_config((dir / "missing.conf").string(), untouched).ok);
}

void test_balance_sheet_parser() {
  const std::string text =
      "# sample\n"
      "DharmaPoints = 40\n"
      "SevaPoints = twelve\n"
      "PaapTokens.minor = 5\n"
      "PaapTokens.medium = 2\n"
      "Rnanubandhan[] = minor:4\n"
      "Rnanubandhan[] = 7\n"
      "Rnanubandhan[] = major:poison\n"
      "no equals sign\n";

  karma::BalanceSheet sheet;
  const karma::Result parsed = karma::parse_balance_sheet(text, sheet);
  assert(parsed.ok);
  assert(parsed.message.find("1 malformed") != std::string::npos);
  assert(near(karma::scalar_balance(sheet, karma::kDharmaPoints), 40.0));
  assert(near(karma::scalar_balance(sheet, karma::kSevaPoints), 0.0));

  const auto paap = karma::tiered_balance(sheet, karma::kPaapTokens);
  assert(paap.size() == 2);

  // Demerit tiers keep their sign; only debt amounts are magnitudes.
  karma::BalanceSheet signed_sheet;
  signed_sheet["PaapTokens"] = karma::SeverityMap{{"minor", -4.0}, {"medium", 2.0}};
  signed_sheet["Rnanubandhan"] = karma::SeverityMap{{"minor", -3.0}};
  const auto signed_paap = karma::tiered_balance(signed_sheet, karma::kPaapTokens);
  const auto minor = std::ranges::find_if(signed_paap, [](const karma::DebtRecord& record) {
    return record.severity == "minor";
  });
  assert(minor != signed_paap.end());
  assert(near(minor->amount, -4.0));
  const karma::NetKarmaAggregator aggregator(default_config());
  assert(near(aggregator.aggregate(signed_sheet).breakdown.negative_karma, -4.0 + 5.0));
  const auto signed_debt = karma::normalize_debt(signed_sheet);
  assert(signed_debt.size() == 1);
  assert(near(signed_debt[0].amount, 3.0));

  const auto debt = karma::normalize_debt(sheet);
  assert(debt.size() == 2);
  assert(debt[0].severity == "minor");
  assert(near(debt[0].amount, 4.0));
  assert(debt[1].severity == "major");
  assert(near(debt[1].amount, 7.0));

  karma::BalanceSheet missing;
  assert(!karma::load_balance_sheet("/nonexistent/karma/sheet.txt", missing).ok);
}

void test_entry_hash_properties() {
  karma::LedgerEntry entry;
  entry.timestamp = "2026-01-01T00:00:00.000000Z";
  entry.event_type = karma::EventType::KarmaAction;
  entry.component = "karma_engine";
  entry.request_id = "req-1";
  entry.message = "Karma action logged: cheat";
  entry.data = karma::normalize_fields({{"action", "cheat"}, {"a=b", "1"}, {"action", "theft"}});

  assert(entry.data.size() == 2);
  assert(entry.data[0].first == "action");
  assert(entry.data[0].second == "theft");
  assert(entry.data[1].first == "a_b");

  const auto blank = karma::normalize_fields({{"", "x"}, {"_", "y"}, {"\n", "z"}});
  assert(blank.size() == 1);
  assert(blank[0].first == "_");
  assert(blank[0].second == "z");

  // SHA-256("abc") and the chaining rule: payload bytes, then predecessor bytes.
  assert(karma::util::sha256_hex("abc") ==
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(karma::util::chained_hash("payload", karma::kGenesisHash) ==
         karma::util::sha256_hex("payload" + std::string{karma::kGenesisHash}));

  const std::string base = karma::compute_entry_hash(entry, karma::kGenesisHash);
  assert(base.size() == 64);
  assert(base == karma::compute_entry_hash(entry, karma::kGenesisHash));
  assert(base != karma::compute_entry_hash(entry, std::string(64, 'f')));

  karma::LedgerEntry empty_user = entry;
  empty_user.user_id = std::string{};
  assert(karma::compute_entry_hash(empty_user, karma::kGenesisHash) != base);

  karma::LedgerEntry empty_errors = entry;
  empty_errors.error_details = karma::Fields{};
  assert(karma::compute_entry_hash(empty_errors, karma::kGenesisHash) != base);

  entry.entry_hash = base;
  entry.previous_hash = karma::kGenesisHash;
  karma::LedgerEntry parsed;
  assert(karma::parse_entry_line(karma::serialize_entry_line(entry), parsed));
  assert(parsed.message == entry.message);
  assert(parsed.entry_hash == base);
  assert(karma::compute_entry_hash(parsed, parsed.previous_hash) == base);

  assert(!karma::parse_entry_line("not\ta\tledger\tline", parsed));
}

void test_ledger_chain_integrity() {
  karma::LedgerLogger ledger;
  const auto state = open_memory_ledger(ledger);

  for (int i = 0; i < 5; ++i) {
    const karma::Result recorded = record_simple(ledger, "action-" + std::to_string(i));
    assert(recorded.ok);
    assert(recorded.data == std::to_string(i));
  }
  assert(state->lines.size() == 5);

  const auto entries = ledger.retained_entries();
  assert(entries.size() == 5);
  assert(entries.front().previous_hash == karma::kGenesisHash);
  std::string previous = karma::kGenesisHash;
  for (std::size_t i = 0; i < entries.size(); ++i) {
    assert(entries[i].ledger_index == i);
    assert(entries[i].previous_hash == previous);
    assert(karma::compute_entry_hash(entries[i], previous) == entries[i].entry_hash);
    previous = entries[i].entry_hash;
  }

  const auto report = karma::verify_chain(entries);
  assert(report.intact);
  assert(report.checked == 5);

  const auto metrics = ledger.metrics();
  assert(metrics.next_ledger_index == 5);
  assert(metrics.previous_hash == entries.back().entry_hash);
  assert(metrics.karma_actions == 5);
}

void test_tamper_detection() {
  karma::LedgerLogger ledger;
  open_memory_ledger(ledger);
  for (int i = 0; i < 5; ++i) {
    assert(record_simple(ledger, "action-" + std::to_string(i)).ok);
  }

  auto entries = ledger.retained_entries();
  entries[2].message = "rewritten history";
  auto report = karma::verify_chain(entries);
  assert(!report.intact);
  assert(report.tampered_indices.size() == 1);
  assert(report.tampered_indices.front() == 2);

  entries = ledger.retained_entries();
  entries[3].data.emplace_back("injected", "1");
  report = karma::verify_chain(entries);
  assert(report.tampered_indices.size() == 1);
  assert(report.tampered_indices.front() == 3);

  entries = ledger.retained_entries();
  entries.erase(entries.begin() + 1);
  report = karma::verify_chain(entries);
  assert(!report.intact);
  assert(report.index_gaps.size() == 1);
  assert(report.index_gaps.front() == 1);
}

void test_trail_eviction_and_window_verification() {
  karma::LedgerLogger ledger;
  open_memory_ledger(ledger, 3);
  for (int i = 0; i < 7; ++i) {
    assert(record_simple(ledger, "action-" + std::to_string(i)).ok);
  }

  const auto entries = ledger.retained_entries();
  assert(entries.size() == 3);
  assert(entries[0].ledger_index == 4);
  assert(entries[2].ledger_index == 6);
  assert(karma::verify_chain(entries).intact);

  const auto metrics = ledger.metrics();
  assert(metrics.total_audit_entries == 3);
  assert(metrics.event_counts[static_cast<std::size_t>(karma::EventType::KarmaAction)] == 7);
}

void test_concurrent_index_monotonicity() {
  karma::LedgerLogger ledger;
  const auto state = open_memory_ledger(ledger);

  constexpr int kThreads = 8;
  constexpr int kPerThread = 50;
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&ledger, t] {
      for (int i = 0; i < kPerThread; ++i) {
        const karma::Result recorded =
            record_simple(ledger, "t" + std::to_string(t) + "-" + std::to_string(i),
                          "user-" + std::to_string(t));
        assert(recorded.ok);
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  const auto entries = ledger.retained_entries();
  assert(entries.size() == static_cast<std::size_t>(kThreads * kPerThread));
  std::vector<std::uint64_t> indices;
  for (const auto& entry : entries) {
    indices.push_back(entry.ledger_index);
  }
  std::ranges::sort(indices);
  for (std::size_t i = 0; i < indices.size(); ++i) {
    assert(indices[i] == i);
  }
  assert(karma::verify_chain(entries).intact);
  assert(state->lines.size() == indices.size());
}

void test_failed_writes_do_not_advance_chain() {
  const auto dir = temp_dir("failed-writes");
  karma::LedgerLogger ledger;
  const auto state = open_memory_ledger(ledger, 10000, dir.string());

  assert(record_simple(ledger, "first").ok);
  const auto before = ledger.metrics();

  state->always_fail = true;
  const karma::Result dropped = record_simple(ledger, "lost");
  assert(!dropped.ok);

  const auto after = ledger.metrics();
  assert(after.next_ledger_index == before.next_ledger_index);
  assert(after.previous_hash == before.previous_hash);
  assert(after.dropped_writes == 1);
  assert(after.write_retries == 2);
  assert(after.karma_actions == before.karma_actions);
  assert(after.total_audit_entries == 1);
  assert(std::filesystem::exists(dir / karma::kDiagnosticsLogFile));

  state->always_fail = false;
  state->failures_remaining = 1;
  const karma::Result recovered = record_simple(ledger, "second");
  assert(recovered.ok);
  assert(recovered.data == "1");

  const auto entries = ledger.retained_entries();
  assert(entries.size() == 2);
  assert(entries[1].previous_hash == entries[0].entry_hash);
  assert(karma::verify_chain(entries).intact);
  assert(ledger.metrics().write_retries == 3);
}

void test_convenience_recorders_and_metrics() {
  karma::LedgerLogger ledger;
  open_memory_ledger(ledger);

  assert(ledger.log_api_request("r1", "POST", "/log-action", std::string{"u1"}, std::nullopt,
                                {{"action", "cheat"}})
             .ok);
  assert(ledger.log_api_response("r1", 200, 0.25).ok);
  assert(ledger.log_api_response("r2", 500, 0.75).ok);
  assert(ledger.log_validation_error("r3", "missing", "user_id", "user_id is required").ok);
  assert(ledger.log_validation_error("r4", "missing", "user_id", "user_id is required").ok);
  assert(ledger.log_atonement("r5", "u1", "plan-1", "Tap", 5.0, 2.0, true).ok);
  assert(ledger.log_atonement("r6", "u1", "plan-2", "Tap", 0.0, 0.0, false).ok);
  assert(ledger.log_system_error("r7", "IOError", "disk full", std::string{"trace"}).ok);
  assert(ledger.log_security_event("r8", "nonce_reuse", "replayed request", "high").ok);
  assert(ledger.log_performance_metric("r9", "evaluate", 1.5).ok);
  assert(ledger.log_karma_action("r10", "u2", "helping_peers", 10.0, "learner", "help").ok);

  const auto metrics = ledger.metrics();
  assert(metrics.api_requests == 1);
  assert(metrics.event_counts[static_cast<std::size_t>(karma::EventType::ApiResponse)] == 2);
  assert(near(metrics.average_response_time, 0.5));
  assert(metrics.validation_errors == 2);
  assert(metrics.error_breakdown.at("missing:user_id") == 2);
  assert(metrics.atonement_completions == 1);
  assert(metrics.system_errors == 1);
  assert(metrics.security_events == 1);
  assert(metrics.karma_actions == 1);
  assert(metrics.next_ledger_index == 11);
  assert(metrics.uptime_hours >= 0.0);

  const auto security = ledger.audit_trail({.user_id = {},
                                            .event_type = karma::EventType::SecurityEvent,
                                            .limit = 100});
  assert(security.size() == 1);
  assert(security.front().level == karma::LogLevel::Error);

  const auto failed_atonement = ledger.audit_trail({.user_id = std::string{"u1"},
                                                    .event_type = karma::EventType::Atonement,
                                                    .limit = 1});
  assert(failed_atonement.size() == 1);
  assert(failed_atonement.front().level == karma::LogLevel::Error);

  const auto u1 = ledger.audit_trail({.user_id = std::string{"u1"}, .event_type = {}, .limit = 2});
  assert(u1.size() == 2);
  assert(u1[0].request_id == "r5");
  assert(u1[1].request_id == "r6");

  karma::LedgerEventDraft draft;
  draft.event_type = karma::EventType::ValidationError;
  draft.component = "validation";
  draft.message = "derived level";
  assert(ledger.record(draft).ok);
  assert(ledger.audit_trail({.user_id = {}, .event_type = {}, .limit = 1}).front().level ==
         karma::LogLevel::Warning);
}

void test_file_sink_routing_and_resume() {
  const auto dir = temp_dir("file-sink");

  std::string head_hash;
  {
    karma::CoreApi api;
    const karma::Result init = api.init({.app_data_dir = dir.string(), .config_path = {}});
    assert(init.ok);

    karma::KarmaActionDraft draft;
    draft.request_id = "req-1";
    draft.user_id = "user-7";
    draft.action = "cheat";
    draft.role = "learner";
    draft.intent = "test";
    const auto outcome = api.log_action({}, draft);
    assert(outcome.ledger.ok);
    assert(near(outcome.evaluation.net_karma, -10.0));

    assert(api.ledger().log_api_request("req-2", "GET", "/balance").ok);
    assert(api.ledger().log_system_error("req-3", "Timeout", "db timeout").ok);
    head_hash = api.ledger().metrics().previous_hash;

    const auto trail = api.ledger().audit_trail();
    assert(trail.size() == 3);
    assert(std::ranges::find(trail.front().data, std::pair<std::string, std::string>{
                                                      "additional_data.severity", "minor"}) !=
           trail.front().data.end());
  }

  const auto ledger_dir = dir / "ledger";
  assert(std::filesystem::exists(ledger_dir / karma::kAuditLogFile));
  assert(std::filesystem::exists(ledger_dir / karma::kApiLogFile));
  assert(std::filesystem::exists(ledger_dir / karma::kErrorLogFile));

  karma::CoreApi resumed;
  assert(resumed.init({.app_data_dir = dir.string(), .config_path = {}}).ok);
  const auto metrics = resumed.ledger().metrics();
  assert(metrics.next_ledger_index == 3);
  assert(metrics.previous_hash == head_hash);

  const karma::Result next = resumed.ledger().log_performance_metric("req-4", "load", 3.0);
  assert(next.ok);
  assert(next.data == "3");
}

void test_export_round_trip() {
  const auto dir = temp_dir("export");
  karma::LedgerLogger ledger;
  open_memory_ledger(ledger, 4);
  for (int i = 0; i < 6; ++i) {
    assert(record_simple(ledger, "line\twith\nbreaks-" + std::to_string(i)).ok);
  }

  const auto path = dir / "trail.tsv";
  const karma::Result exported = ledger.export_audit_trail(path.string());
  assert(exported.ok);
  assert(exported.data == "4");

  std::vector<karma::LedgerEntry> loaded;
  const karma::Result read = karma::load_exported_trail(path.string(), loaded);
  assert(read.ok);
  assert(read.data == "0");
  assert(loaded.size() == 4);
  assert(loaded.front().ledger_index == 2);
  assert(loaded.front().message == "line\twith\nbreaks-2");
  assert(karma::verify_chain(loaded).intact);

  loaded[1].user_id = "someone-else";
  const auto report = karma::verify_chain(loaded);
  assert(!report.intact);
  assert(report.tampered_indices.size() == 1);
  assert(report.tampered_indices.front() == 3);

  {
    std::ofstream out(path, std::ios::out | std::ios::app);
    out << "garbage line\n";
  }
  std::vector<karma::LedgerEntry> with_garbage;
  const karma::Result reread = karma::load_exported_trail(path.string(), with_garbage);
  assert(reread.ok);
  assert(reread.data == "1");
  assert(with_garbage.size() == 4);

  const auto not_export = dir / "plain.txt";
  {
    std::ofstream out(not_export);
    out << "hello\n";
  }
  std::vector<karma::LedgerEntry> none;
  assert(!karma::load_exported_trail(not_export.string(), none).ok);

  karma::LedgerLogger odd_keys;
  open_memory_ledger(odd_keys);
  karma::LedgerEventDraft draft;
  draft.event_type = karma::EventType::SystemError;
  draft.component = "system";
  draft.message = "odd keys";
  draft.request_id = "req-odd";
  draft.data = {{"", "blank-key"}, {"a=b", "1"}, {"a_b", "2"}, {"k", "v"}};
  draft.error_details = karma::Fields{{"", "e"}, {"code", "E1"}};
  draft.performance_metrics = karma::Fields{{"latency", "3"}, {"line\nkey", "4"}};
  assert(odd_keys.record(draft).ok);

  draft.data = {};
  draft.error_details = karma::Fields{};
  draft.performance_metrics.reset();
  assert(odd_keys.record(draft).ok);

  const auto odd_path = dir / "odd.tsv";
  assert(odd_keys.export_audit_trail(odd_path.string()).ok);
  std::vector<karma::LedgerEntry> odd_loaded;
  const karma::Result odd_read = karma::load_exported_trail(odd_path.string(), odd_loaded);
  assert(odd_read.ok);
  assert(odd_read.data == "0");
  assert(odd_loaded.size() == 2);
  assert(karma::verify_chain(odd_loaded).intact);

  const karma::Fields expected_data{{"_", "blank-key"}, {"a_b", "2"}, {"k", "v"}};
  assert(odd_loaded[0].data == expected_data);
  assert(odd_loaded[0].error_details.has_value());
  assert(odd_loaded[0].error_details->size() == 2);
  assert(odd_loaded[0].performance_metrics.has_value());
  assert(odd_loaded[0].performance_metrics->size() == 2);
  assert(odd_loaded[1].data.empty());
  assert(odd_loaded[1].error_details.has_value());
  assert(odd_loaded[1].error_details->empty());
  assert(!odd_loaded[1].performance_metrics.has_value());
}

void test_core_api_flow() {
  karma::CoreApi api;
  auto state = std::make_shared<SinkState>();
  const karma::Result init =
      api.init({.app_data_dir = {}, .config_path = {}}, std::make_unique<MemorySink>(state));
  assert(init.ok);

  const karma::BalanceSheet sheet{{"DharmaPoints", 40.0}, {"SevaPoints", 10.0}};
  const auto adjustment = api.adapt_reward(sheet, "completing_lessons", 10.0);
  assert(near(adjustment.adjusted_reward, 10.5));
  assert(adjustment.next_role == "volunteer");

  const auto guidance = api.corrective_guidance(sheet);
  assert(guidance.size() == 1);
  assert(guidance.front().practice == "Seva");

  state->always_fail = true;
  karma::KarmaActionDraft draft;
  draft.request_id = "req-x";
  draft.user_id = "user-x";
  draft.action = "selfless_service";
  const auto outcome = api.log_action(sheet, draft);
  assert(!outcome.ledger.ok);
  assert(near(outcome.evaluation.positive_impact, 25.0));
  assert(api.ledger().metrics().dropped_writes == 1);

  assert(api.ledger().is_open());
  assert(!api.init({.app_data_dir = {}, .config_path = {}},
                   std::make_unique<MemorySink>(std::make_shared<SinkState>()))
              .ok);

  karma::CoreApi uninitialized;
  assert(!uninitialized.init({.app_data_dir = {}, .config_path = {}}).ok);
  assert(!uninitialized.ledger().is_open());
  assert(!uninitialized.ledger().record({}).ok);
  const karma::BalanceSheet indebted{{"Rnanubandhan", 12.5}};
  assert(near(uninitialized.net_karma(indebted).net_karma, -50.0));
}

}  // namespace

int main() {
  const bool hashing_ready = karma::util::initialize_hashing();
  assert(hashing_ready);
  (void)hashing_ready;

  test_evaluate_merit_action();
  test_evaluate_demerit_action();
  test_evaluate_unknown_action_and_totality();
  test_evaluation_is_deterministic();
  test_aggregate_scalar_debt();
  test_aggregate_full_sheet();
  test_rnanubandhan_shape_tolerance();
  test_injected_weighting();
  test_recommendation_ordering();
  test_whole_sheet_guidance();
  test_reward_adapter();
  test_config_file_overrides();
  test_balance_sheet_parser();
  test_entry_hash_properties();
  test_ledger_chain_integrity();
  test_tamper_detection();
  test_trail_eviction_and_window_verification();
  test_concurrent_index_monotonicity();
  test_failed_writes_do_not_advance_chain();
  test_convenience_recorders_and_metrics();
  test_file_sink_routing_and_resume();
  test_export_round_trip();
  test_core_api_flow();

  std::cout << "karma core tests passed\n";
  return 0;
}
