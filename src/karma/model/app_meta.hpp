#pragma once

#include <string_view>

#ifndef KARMA_LEDGER_APP_VERSION
#define KARMA_LEDGER_APP_VERSION "0.1.0"
#endif

#ifndef KARMA_LEDGER_BUILD_RELEASE
#define KARMA_LEDGER_BUILD_RELEASE "Ledger Phase 1"
#endif

namespace karma {

inline constexpr std::string_view kAppDisplayName = "karmaledger";
inline constexpr std::string_view kExportFormat = "karmaledger-audit-export-v1";
inline constexpr std::string_view kAppVersion = KARMA_LEDGER_APP_VERSION;
inline constexpr std::string_view kBuildRelease = KARMA_LEDGER_BUILD_RELEASE;

}  // namespace karma
