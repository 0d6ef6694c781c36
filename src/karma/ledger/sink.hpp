#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "karma/model/types.hpp"

namespace karma {

inline constexpr std::string_view kApiLogFile = "api.log";
inline constexpr std::string_view kAuditLogFile = "audit.log";
inline constexpr std::string_view kErrorLogFile = "errors.log";

struct ChainHead {
  std::uint64_t next_index = 0;
  std::string previous_hash;
};

// Durable destination for ledger entries. `line` is the serialized form of `entry`.
class LedgerSink {
public:
  virtual ~LedgerSink() = default;

  virtual Result write(const LedgerEntry& entry, std::string_view line) = 0;

  // Head of a chain already persisted by this sink, if any.
  [[nodiscard]] virtual std::optional<ChainHead> recover_head() const { return std::nullopt; }
};

// One append-only file per channel under a data directory.
class FileLedgerSink final : public LedgerSink {
public:
  Result open(std::string_view data_dir);

  Result write(const LedgerEntry& entry, std::string_view line) override;
  [[nodiscard]] std::optional<ChainHead> recover_head() const override;

  static std::string_view channel_for(std::string_view component);

  [[nodiscard]] const std::string& data_dir() const { return data_dir_; }

private:
  [[nodiscard]] std::string path_for(std::string_view file) const;

  std::string data_dir_;
};

}  // namespace karma
