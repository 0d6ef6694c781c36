#include "karma/ledger/verify.hpp"

#include <fstream>
#include <string>

#include "karma/ledger/entry.hpp"
#include "karma/model/app_meta.hpp"

namespace karma {

ChainVerificationReport verify_chain(const std::vector<LedgerEntry>& entries) {
  ChainVerificationReport report;
  if (entries.empty()) {
    report.details = "No entries to verify.";
    return report;
  }

  std::string expected_previous =
      entries.front().ledger_index == 0 ? kGenesisHash : entries.front().previous_hash;
  std::uint64_t expected_index = entries.front().ledger_index;

  for (const auto& entry : entries) {
    ++report.checked;

    if (entry.ledger_index != expected_index) {
      report.index_gaps.push_back(expected_index);
    }

    const bool linked = entry.previous_hash == expected_previous;
    const bool hashed = compute_entry_hash(entry, entry.previous_hash) == entry.entry_hash;
    if (!linked || !hashed) {
      report.tampered_indices.push_back(entry.ledger_index);
    }

    // Continue from the recorded hash so one mutation flags only its own index.
    expected_previous = entry.entry_hash;
    expected_index = entry.ledger_index + 1U;
  }

  report.intact = report.tampered_indices.empty() && report.index_gaps.empty();
  if (report.intact) {
    report.details = "Chain intact across " + std::to_string(report.checked) + " entries.";
  } else {
    report.details = "Chain broken: " + std::to_string(report.tampered_indices.size()) +
                     " tampered entr" + (report.tampered_indices.size() == 1 ? "y" : "ies") +
                     ", " + std::to_string(report.index_gaps.size()) + " index gap(s).";
  }
  return report;
}

Result load_exported_trail(std::string_view path, std::vector<LedgerEntry>& entries) {
  std::ifstream in{std::string{path}};
  if (!in) {
    return Result::failure("Audit export not readable: " + std::string{path});
  }

  std::string header;
  if (!std::getline(in, header) || header.rfind("#\t" + std::string{kExportFormat}, 0) != 0) {
    return Result::failure("Not a " + std::string{kExportFormat} + " file: " + std::string{path});
  }

  entries.clear();
  std::size_t malformed = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line.front() == '#') {
      continue;
    }

    LedgerEntry entry;
    if (parse_entry_line(line, entry)) {
      entries.push_back(std::move(entry));
    } else {
      ++malformed;
    }
  }

  return Result::success("Loaded " + std::to_string(entries.size()) + " entries, " +
                             std::to_string(malformed) + " malformed line(s) skipped.",
                         std::to_string(malformed));
}

}  // namespace karma
