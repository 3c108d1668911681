/**
 * Fixed-point arithmetic for the Group Service. Shared by the contract and the
 * native unit tests, so it only depends on the standard headers that eosio.cdt
 * ships for wasm.
 */

#pragma once

#include <cstdint>
#include <vector>

namespace groupmath {

typedef unsigned __int128 uint128;

//one full unit (100%) for distrust rates and recipient ratios
static constexpr uint64_t PRECISION = 1000000000000000000ULL;

//NOTE: callers guarantee a * b / d fits in 64 bits (b <= d everywhere below)
inline uint64_t mul_div(uint64_t a, uint64_t b, uint64_t d) {
	if (d == 0) {
		return 0;
	}
	return static_cast<uint64_t>(uint128(a) * b / d);
}

/**
 * Stake weighted through origin scores: sum(stake_i * score_i) / max_score.
 */
inline uint64_t verified_amount(const std::vector<uint64_t>& stakes, const std::vector<uint64_t>& scores, uint64_t max_score) {
	if (max_score == 0) {
		return 0;
	}

	uint128 weighted = 0;
	for (size_t i = 0; i < stakes.size() && i < scores.size(); i++) {
		weighted += uint128(stakes[i]) * scores[i];
	}

	return static_cast<uint64_t>(weighted / max_score);
}

/**
 * Share of the activity's total votes cast as distrust against a group owner.
 * Unverified groups and rounds without votes carry no penalty.
 */
inline uint64_t distrust_rate(bool verified, uint64_t distrust, uint64_t total_votes) {
	if (!verified || total_votes == 0) {
		return 0;
	}
	if (distrust >= total_votes) {
		return PRECISION;
	}
	return mul_div(distrust, PRECISION, total_votes);
}

/**
 * Multiplier applied to a group's verified amount. Complement of distrust_rate
 * when there is information, pass-through (PRECISION) when there is none.
 */
inline uint64_t distrust_reduction(bool verified, uint64_t distrust, uint64_t total_votes) {
	if (!verified || total_votes == 0) {
		return PRECISION;
	}
	return PRECISION - distrust_rate(verified, distrust, total_votes);
}

inline uint64_t generated_amount(uint64_t verified, uint64_t reduction) {
	return mul_div(verified, reduction, PRECISION);
}

//pool * generated / total_generated, zero when nothing was generated
inline uint64_t reward_share(uint64_t pool, uint64_t generated, uint64_t total_generated) {
	if (total_generated == 0 || generated > total_generated) {
		return 0;
	}
	return mul_div(pool, generated, total_generated);
}

struct split_result {
	std::vector<uint64_t> amounts;
	uint64_t residual;
};

/**
 * Splits a reward by ratios of PRECISION. Truncation dust stays in the residual,
 * so sum(amounts) + residual == reward.
 */
inline split_result split_reward(uint64_t reward, const std::vector<uint64_t>& ratios) {
	split_result result;
	result.residual = reward;

	for (uint64_t ratio : ratios) {
		uint64_t amount = ratio >= PRECISION ? reward : mul_div(reward, ratio, PRECISION);
		if (amount > result.residual) {
			amount = result.residual;
		}
		result.amounts.push_back(amount);
		result.residual -= amount;
	}

	return result;
}

/**
 * Allocates an amount proportionally to weights. The remainder left by
 * truncation goes to the first largest weight, so parts always sum to amount
 * unless every weight is zero.
 */
inline std::vector<uint64_t> allocate(uint64_t amount, const std::vector<uint64_t>& weights) {
	std::vector<uint64_t> parts(weights.size(), 0);

	uint128 total = 0;
	size_t largest = 0;
	for (size_t i = 0; i < weights.size(); i++) {
		total += weights[i];
		if (weights[i] > weights[largest]) {
			largest = i;
		}
	}

	if (total == 0) {
		return parts;
	}

	uint64_t assigned = 0;
	for (size_t i = 0; i < weights.size(); i++) {
		parts[i] = static_cast<uint64_t>(uint128(amount) * weights[i] / total);
		assigned += parts[i];
	}
	parts[largest] += amount - assigned;

	return parts;
}

} // namespace groupmath
