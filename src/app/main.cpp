#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "karma/api/core_api.hpp"
#include "karma/engine/balance_sheet.hpp"
#include "karma/engine/evaluator.hpp"
#include "karma/engine/guidance.hpp"
#include "karma/ledger/verify.hpp"
#include "karma/model/app_meta.hpp"
#include "karma/util/canonical.hpp"
#include "karma/util/hash.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitTampered = 2;

struct CliOptions {
  std::string config_path;
  std::string data_dir = "karma-ledger-data";
  std::string sheet_path;
  std::string export_path;
  std::vector<std::string> positional;
};

void print_usage() {
  std::cout << karma::kAppDisplayName << " " << karma::kAppVersion << " (" << karma::kBuildRelease
            << ")\n\n"
            << "usage: karma-ledger [--config FILE] [--data-dir DIR] <command> [args]\n\n"
            << "  evaluate <action> [intensity] [--sheet FILE]\n"
            << "  aggregate --sheet FILE\n"
            << "  guidance --sheet FILE\n"
            << "  adapt <action> <base_reward> [--sheet FILE]\n"
            << "  record <user_id> <action> [intensity] [--sheet FILE] [--export FILE]\n"
            << "  verify <export_file>\n";
}

karma::Result parse_args(int argc, char** argv, CliOptions& options) {
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    const auto take_value = [&](std::string& target) -> bool {
      if (i + 1 >= argc) {
        return false;
      }
      target = argv[++i];
      return true;
    };

    if (arg == "--config") {
      if (!take_value(options.config_path)) {
        return karma::Result::failure("--config needs a file.");
      }
    } else if (arg == "--data-dir") {
      if (!take_value(options.data_dir)) {
        return karma::Result::failure("--data-dir needs a directory.");
      }
    } else if (arg == "--sheet") {
      if (!take_value(options.sheet_path)) {
        return karma::Result::failure("--sheet needs a file.");
      }
    } else if (arg == "--export") {
      if (!take_value(options.export_path)) {
        return karma::Result::failure("--export needs a file.");
      }
    } else if (arg.starts_with("--")) {
      return karma::Result::failure("Unknown option: " + std::string{arg});
    } else {
      options.positional.emplace_back(arg);
    }
  }

  if (options.positional.empty()) {
    return karma::Result::failure("Missing command.");
  }
  return karma::Result::success();
}

karma::Result load_sheet(const CliOptions& options, bool required, karma::BalanceSheet& sheet) {
  if (options.sheet_path.empty()) {
    return required ? karma::Result::failure("This command needs --sheet FILE.")
                    : karma::Result::success();
  }
  return karma::load_balance_sheet(options.sheet_path, sheet);
}

std::optional<double> number_arg(const CliOptions& options, std::size_t index, double fallback) {
  if (options.positional.size() <= index) {
    return fallback;
  }
  return karma::util::parse_double(options.positional[index]);
}

std::string recommendations_text(const std::vector<karma::CorrectiveRecommendation>& list) {
  if (list.empty()) {
    return "  (none)\n";
  }
  std::string text;
  for (const auto& rec : list) {
    text += "  [" + std::string{karma::urgency_name(rec.urgency)} + "] " + rec.practice +
            " w=" + karma::util::format_number(rec.weight) + " - " + rec.reason + "\n";
  }
  return text;
}

std::string evaluation_text(const karma::ActionEvaluation& evaluation) {
  using karma::util::format_number;

  std::string text;
  text += "Action: " + evaluation.action + " x" + format_number(evaluation.intensity) + " (" +
          std::string{karma::action_class_name(evaluation.classification)};
  if (!evaluation.severity.empty()) {
    text += ", " + evaluation.severity;
  }
  text += ")\n";
  text += "Positive impact: " + format_number(evaluation.positive_impact) + "\n";
  text += "Negative impact: " + format_number(evaluation.negative_impact) + "\n";
  text += "Dridha: " + format_number(evaluation.dridha_delta) +
          "  Adridha: " + format_number(evaluation.adridha_delta) + "\n";
  text += "Sanchita: " + format_number(evaluation.sanchita_delta) +
          "  Prarabdha: " + format_number(evaluation.prarabdha_delta) + "\n";
  text += "Rnanubandhan: " + format_number(evaluation.rnanubandhan_delta) + "\n";
  text += "Purushartha:";
  for (std::size_t i = 0; i < karma::kPurusharthaCount; ++i) {
    text += " " + std::string{karma::purushartha_name(static_cast<karma::Purushartha>(i))} + "=" +
            format_number(evaluation.purushartha[i]);
  }
  text += "\nNet karma: " + format_number(evaluation.net_karma) + "\n";
  text += "Corrective guidance:\n" + recommendations_text(evaluation.corrective_recommendations);
  return text;
}

int run_evaluate(const karma::CoreApi& api, const CliOptions& options) {
  if (options.positional.size() < 2) {
    std::cerr << "evaluate needs an action.\n";
    return kExitFailure;
  }
  const auto intensity = number_arg(options, 2, 1.0);
  if (!intensity) {
    std::cerr << "Intensity is not a number: " << options.positional[2] << '\n';
    return kExitFailure;
  }

  karma::BalanceSheet sheet;
  const karma::Result loaded = load_sheet(options, false, sheet);
  if (!loaded.ok) {
    std::cerr << loaded.message << '\n';
    return kExitFailure;
  }

  std::cout << evaluation_text(api.evaluate(sheet, options.positional[1], *intensity));
  return kExitOk;
}

int run_aggregate(const karma::CoreApi& api, const CliOptions& options) {
  using karma::util::format_number;

  karma::BalanceSheet sheet;
  const karma::Result loaded = load_sheet(options, true, sheet);
  if (!loaded.ok) {
    std::cerr << loaded.message << '\n';
    return kExitFailure;
  }

  const karma::NetKarma net = api.net_karma(sheet);
  const karma::StabilityProfile stability = api.stability_profile(sheet);
  const karma::PurusharthaVector scores = api.purushartha_score(sheet);

  std::string text;
  text += "Net karma: " + format_number(net.net_karma) + "\n";
  text += "Weighted score: " + format_number(net.weighted_score) + "\n";
  text += "Positive: " + format_number(net.breakdown.positive_karma) + "\n";
  text += "Negative: " + format_number(net.breakdown.negative_karma) + "\n";
  text += "Dridha: " + format_number(net.breakdown.dridha_karma) +
          "  Adridha: " + format_number(net.breakdown.adridha_karma) +
          "  (dridha ratio " + format_number(stability.dridha_ratio) + ")\n";
  text += "Sanchita: " + format_number(net.breakdown.sanchita_karma) +
          "  Prarabdha: " + format_number(net.breakdown.prarabdha_karma) + "\n";
  text += "Rnanubandhan: " + format_number(net.breakdown.rnanubandhan) + "\n";
  text += "Purushartha:";
  for (std::size_t i = 0; i < karma::kPurusharthaCount; ++i) {
    text += " " + std::string{karma::purushartha_name(static_cast<karma::Purushartha>(i))} + "=" +
            format_number(scores[i]);
  }
  text += "\n";
  std::cout << text;
  return kExitOk;
}

int run_guidance(const karma::CoreApi& api, const CliOptions& options) {
  karma::BalanceSheet sheet;
  const karma::Result loaded = load_sheet(options, true, sheet);
  if (!loaded.ok) {
    std::cerr << loaded.message << '\n';
    return kExitFailure;
  }

  std::cout << "Corrective guidance:\n" << recommendations_text(api.corrective_guidance(sheet));
  return kExitOk;
}

int run_adapt(const karma::CoreApi& api, const CliOptions& options) {
  if (options.positional.size() < 3) {
    std::cerr << "adapt needs an action and a base reward.\n";
    return kExitFailure;
  }
  const auto base_reward = karma::util::parse_double(options.positional[2]);
  if (!base_reward) {
    std::cerr << "Base reward is not a number: " << options.positional[2] << '\n';
    return kExitFailure;
  }

  karma::BalanceSheet sheet;
  const karma::Result loaded = load_sheet(options, false, sheet);
  if (!loaded.ok) {
    std::cerr << loaded.message << '\n';
    return kExitFailure;
  }

  const karma::RewardAdjustment adjustment =
      api.adapt_reward(sheet, options.positional[1], *base_reward);
  std::cout << "Adjusted reward: " << karma::util::format_number(adjustment.adjusted_reward)
            << "\nKarmic factor: " << karma::util::format_number(adjustment.karmic_factor)
            << "\nMerit: " << karma::util::format_number(adjustment.merit)
            << "\nNext role: " << adjustment.next_role << '\n';
  return kExitOk;
}

int run_record(karma::CoreApi& api, const CliOptions& options) {
  if (options.positional.size() < 3) {
    std::cerr << "record needs a user id and an action.\n";
    return kExitFailure;
  }
  const auto intensity = number_arg(options, 3, 1.0);
  if (!intensity) {
    std::cerr << "Intensity is not a number: " << options.positional[3] << '\n';
    return kExitFailure;
  }

  karma::BalanceSheet sheet;
  const karma::Result loaded = load_sheet(options, false, sheet);
  if (!loaded.ok) {
    std::cerr << loaded.message << '\n';
    return kExitFailure;
  }

  karma::KarmaActionDraft draft;
  draft.request_id = "cli-" + std::to_string(karma::util::unix_timestamp_now());
  draft.user_id = options.positional[1];
  draft.action = options.positional[2];
  draft.intensity = *intensity;
  draft.role = "cli";
  draft.intent = "manual";

  const karma::ActionLogOutcome outcome = api.log_action(sheet, draft);
  std::cout << evaluation_text(outcome.evaluation);
  if (!outcome.ledger.ok) {
    std::cerr << outcome.ledger.message << '\n';
    return kExitFailure;
  }
  std::cout << "Ledger index: " << outcome.ledger.data << '\n';

  if (!options.export_path.empty()) {
    const karma::Result exported = api.ledger().export_audit_trail(options.export_path);
    if (!exported.ok) {
      std::cerr << exported.message << '\n';
      return kExitFailure;
    }
    std::cout << exported.message << '\n';
  }
  return kExitOk;
}

int run_verify(const CliOptions& options) {
  if (options.positional.size() < 2) {
    std::cerr << "verify needs an export file.\n";
    return kExitFailure;
  }
  if (!karma::util::initialize_hashing()) {
    std::cerr << "Failed to initialize libsodium.\n";
    return kExitFailure;
  }

  std::vector<karma::LedgerEntry> entries;
  const karma::Result loaded = karma::load_exported_trail(options.positional[1], entries);
  if (!loaded.ok) {
    std::cerr << loaded.message << '\n';
    return kExitFailure;
  }
  std::cout << loaded.message << '\n';

  const karma::ChainVerificationReport report = karma::verify_chain(entries);
  std::cout << report.details << '\n';
  for (const auto index : report.tampered_indices) {
    std::cout << "  tampered: " << index << '\n';
  }
  for (const auto index : report.index_gaps) {
    std::cout << "  missing index: " << index << '\n';
  }
  return report.intact && loaded.data == "0" ? kExitOk : kExitTampered;
}

}  // namespace

int main(int argc, char** argv) {
  CliOptions options;
  const karma::Result parsed = parse_args(argc, argv, options);
  if (!parsed.ok) {
    std::cerr << parsed.message << "\n\n";
    print_usage();
    return kExitFailure;
  }

  const std::string& command = options.positional.front();
  if (command == "help") {
    print_usage();
    return kExitOk;
  }
  if (command == "verify") {
    return run_verify(options);
  }

  karma::CoreApi api;
  const karma::Result init = api.init({
      .app_data_dir = options.data_dir,
      .config_path = options.config_path,
      .resume_chain = true,
  });
  if (!init.ok) {
    std::cerr << "karma-ledger init failed: " << init.message << '\n';
    return kExitFailure;
  }

  if (command == "evaluate") {
    return run_evaluate(api, options);
  }
  if (command == "aggregate") {
    return run_aggregate(api, options);
  }
  if (command == "guidance") {
    return run_guidance(api, options);
  }
  if (command == "adapt") {
    return run_adapt(api, options);
  }
  if (command == "record") {
    return run_record(api, options);
  }

  std::cerr << "Unknown command: " << command << "\n\n";
  print_usage();
  return kExitFailure;
}
