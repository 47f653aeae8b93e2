#ifndef PUMP_STATE_HPP
#define PUMP_STATE_HPP

// =============================================================================
// State snapshot layout
//
//   {
//     "version": 1,
//     "tokens":   [ TokenRecord, ... ],
//     "balances": [ {"token": 1, "owner": "0x..", "amount": "123"}, ... ],
//     "vault":    [ {"account": "0x..", "amount": "456"}, ... ]
//   }
//
// Amounts are decimal strings; addresses are 0x-prefixed hex.
// =============================================================================

#include <nlohmann/json_fwd.hpp>

#include "curve.hpp"

namespace pump {

constexpr int STATE_VERSION = 1;

void to_json(nlohmann::json& j, const TokenRecord& record);

// Throws std::invalid_argument (or a nlohmann::json exception) on
// malformed input
void from_json(const nlohmann::json& j, TokenRecord& record);

} // namespace pump

#endif // PUMP_STATE_HPP
