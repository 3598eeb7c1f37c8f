#pragma once

#include <string_view>

namespace apmcore::metric_names {

inline constexpr std::string_view kWebTransactionPrefix = "WebTransaction/";
inline constexpr std::string_view kOtherTransactionPrefix = "OtherTransaction/";

inline constexpr std::string_view kExternalPrefix = "External/";
inline constexpr std::string_view kExternalTransactionPrefix = "ExternalTransaction/";
inline constexpr std::string_view kExternalAll = "External/all";
inline constexpr std::string_view kExternalAllWeb = "External/allWeb";
inline constexpr std::string_view kExternalAllOther = "External/allOther";

inline constexpr std::string_view kAllSuffix = "/all";

} // namespace apmcore::metric_names
