#include "karma/ledger/sink.hpp"

#include <array>
#include <filesystem>
#include <fstream>

#include "karma/ledger/entry.hpp"

namespace karma {

Result FileLedgerSink::open(std::string_view data_dir) {
  std::error_code ec;
  std::filesystem::create_directories(std::filesystem::path{data_dir}, ec);
  if (ec) {
    return Result::failure("Failed to create ledger directory: " + ec.message());
  }

  data_dir_ = std::string{data_dir};
  return Result::success("Ledger sink ready at " + data_dir_);
}

std::string_view FileLedgerSink::channel_for(std::string_view component) {
  if (component == "api") {
    return kApiLogFile;
  }
  if (component == "system") {
    return kErrorLogFile;
  }
  return kAuditLogFile;
}

std::string FileLedgerSink::path_for(std::string_view file) const {
  return (std::filesystem::path{data_dir_} / std::string{file}).string();
}

Result FileLedgerSink::write(const LedgerEntry& entry, std::string_view line) {
  if (data_dir_.empty()) {
    return Result::failure("Ledger sink is not open.");
  }

  std::ofstream out(path_for(channel_for(entry.component)), std::ios::out | std::ios::app);
  if (!out) {
    return Result::failure("Failed to open ledger channel file.");
  }

  out << line;
  out.flush();
  if (!out.good()) {
    return Result::failure("Failed to flush ledger channel file.");
  }

  return Result::success();
}

std::optional<ChainHead> FileLedgerSink::recover_head() const {
  if (data_dir_.empty()) {
    return std::nullopt;
  }

  std::optional<ChainHead> head;
  for (const std::string_view file : std::array{kApiLogFile, kAuditLogFile, kErrorLogFile}) {
    std::ifstream in(path_for(file));
    if (!in) {
      continue;
    }

    std::string line;
    while (std::getline(in, line)) {
      LedgerEntry entry;
      if (!parse_entry_line(line, entry)) {
        continue;
      }
      if (!head || entry.ledger_index >= head->next_index) {
        head = ChainHead{entry.ledger_index + 1U, entry.entry_hash};
      }
    }
  }
  return head;
}

}  // namespace karma
