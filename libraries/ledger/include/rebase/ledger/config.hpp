#pragma once
#include <rebase/ledger/types.hpp>

namespace rebase { namespace ledger { namespace config {

static constexpr uint64_t _KB = 1024;
static constexpr uint64_t _MB = _KB * 1024;
static constexpr uint64_t _GB = _MB * 1024;

/** Balances, credits and multipliers are fixed point with a denominator of 10^18 */
const static uint64_t precision = 1000000000000000000ULL;

const static auto default_state_dir_name     = "state";
const static auto default_state_size         = 64*_MB;

/** A fresh ledger starts out with one credit per token unit scaled by precision */
const static uint64_t default_rebasing_credits_per_token = precision;

/** Largest total supply the ledger accepts, 2^128 - 1 */
inline const uint256_t& default_max_supply() {
   static const uint256_t max_supply = (uint256_t(1) << 128) - 1;
   return max_supply;
}

} } } // namespace rebase::ledger::config
