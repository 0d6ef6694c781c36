#pragma once

#include <string_view>
#include <vector>

#include "karma/model/types.hpp"

namespace karma {

// Recomputes every hash from content and predecessor. A window that starts at index 0 links
// to the genesis sentinel; any other window trusts its first recorded predecessor.
ChainVerificationReport verify_chain(const std::vector<LedgerEntry>& entries);

// Reads a file written by LedgerLogger::export_audit_trail. Malformed lines are skipped and
// counted in the result message.
Result load_exported_trail(std::string_view path, std::vector<LedgerEntry>& entries);

}  // namespace karma
