// evmpre: Ethereum precompiled contracts execution layer
// Copyright 2025 The evmpre Authors.
// SPDX-License-Identifier: Apache-2.0

#include "gas.hpp"
#include "codec.hpp"
#include "precompiles_internal.hpp"
#include <intx/intx.hpp>
#include <algorithm>
#include <iterator>

namespace evmpre::gas
{
using evmc::bytes_view;

namespace
{
/// Converts the wide cost to the gas value, saturating at GasCostMax.
constexpr uint64_t saturate(const intx::uint256& cost) noexcept
{
    return cost > GasCostMax ? GasCostMax : static_cast<uint64_t>(cost);
}

template <uint64_t BaseCost, uint64_t WordCost>
constexpr uint64_t cost_per_input_word(size_t input_size) noexcept
{
    return saturate(intx::uint256{BaseCost} +
                    intx::uint256{WordCost} * codec::num_words(input_size));
}

/// Linear cost of a list of fixed-size entries. Trailing partial entries are not counted.
template <uint64_t BaseCost, uint64_t EntryCost, size_t EntrySize>
constexpr uint64_t cost_per_entry(size_t input_size) noexcept
{
    const auto k = input_size / EntrySize;
    return saturate(intx::uint256{BaseCost} + intx::uint256{EntryCost} * k);
}

/// The expmod pricing schedule.
struct ExpmodSchedule
{
    uint64_t min_gas;

    /// The iteration count weight of every exponent byte beyond the first 32.
    unsigned exp_byte_multiplier;

    intx::uint256 (*mult_complexity)(const intx::uint256& max_len) noexcept;

    unsigned divisor;
};

constexpr ExpmodSchedule EIP198_SCHEDULE{
    0, 8,
    [](const intx::uint256& x) noexcept {
        const auto xx = x * x;
        if (x <= 64)
            return xx;
        else if (x <= 1024)
            return (xx >> 2) + 96 * x - 3072;
        else
            return (xx >> 4) + 480 * x - 199680;
    },
    20};

constexpr ExpmodSchedule EIP2565_SCHEDULE{
    200, 8,
    [](const intx::uint256& x) noexcept {
        const auto w = (x + 7) >> 3;
        return w * w;
    },
    3};

constexpr ExpmodSchedule EIP7883_SCHEDULE{
    500, 16,
    [](const intx::uint256& x) noexcept {
        if (x <= 32)
            return intx::uint256{16};
        const auto w = (x + 7) >> 3;
        return 2 * w * w;
    },
    1};

PrecompileAnalysis expmod_analyze(bytes_view input, const ExpmodSchedule& schedule) noexcept
{
    using namespace intx;

    const auto base_len = codec::load_uint256(input, 0);
    const auto exp_len = codec::load_uint256(input, 32);
    const auto mod_len = codec::load_uint256(input, 64);

    // Zero multiplication complexity makes the exponent irrelevant. This does not hold
    // for EIP-7883 which charges the base complexity also for empty operands.
    if (base_len == 0 && mod_len == 0 && schedule.mult_complexity(0) == 0)
        return {schedule.min_gas, 0};

    static constexpr auto LEN_LIMIT = std::numeric_limits<size_t>::max();
    if (base_len > LEN_LIMIT || exp_len > LEN_LIMIT || mod_len > LEN_LIMIT)
        return {GasCostMax, 0};

    // The exponent head is its first 32 bytes, right-aligned in the word when shorter.
    const auto exp_size = static_cast<size_t>(exp_len);
    const auto exp_head_size = std::min(exp_size, codec::WORD_SIZE);
    uint8_t exp_head[codec::WORD_SIZE]{};
    const auto exp_offset = EXPMOD_HEADER_SIZE + base_len;
    if (exp_offset < input.size())
    {
        codec::read_fixed(&exp_head[codec::WORD_SIZE - exp_head_size], input,
            static_cast<size_t>(exp_offset), exp_head_size);
    }
    const auto exp_head_bits = codec::bit_width({exp_head, std::size(exp_head)});

    uint256 iteration_count = exp_head_bits > 1 ? exp_head_bits - 1 : 0;
    if (exp_size > codec::WORD_SIZE)
        iteration_count += uint256{schedule.exp_byte_multiplier} * (exp_size - codec::WORD_SIZE);
    iteration_count = std::max(iteration_count, uint256{1});

    const auto max_len = std::max(base_len, mod_len);
    const auto gas = schedule.mult_complexity(max_len) * iteration_count / schedule.divisor;
    return {std::max(schedule.min_gas, saturate(gas)), static_cast<size_t>(mod_len)};
}

constexpr uint16_t G1MSM_DISCOUNTS[] = {1000, 949, 848, 797, 764, 750, 738, 728, 719, 712, 705,
    698, 692, 687, 682, 677, 673, 669, 665, 661, 658, 654, 651, 648, 645, 642, 640, 637, 635, 632,
    630, 627, 625, 623, 621, 619, 617, 615, 613, 611, 609, 608, 606, 604, 603, 601, 599, 598, 596,
    595, 593, 592, 591, 589, 588, 586, 585, 584, 582, 581, 580, 579, 577, 576, 575, 574, 573, 572,
    570, 569, 568, 567, 566, 565, 564, 563, 562, 561, 560, 559, 558, 557, 556, 555, 554, 553, 552,
    551, 550, 549, 548, 547, 547, 546, 545, 544, 543, 542, 541, 540, 540, 539, 538, 537, 536, 536,
    535, 534, 533, 532, 532, 531, 530, 529, 528, 528, 527, 526, 525, 525, 524, 523, 522, 522, 521,
    520, 520, 519};

constexpr uint16_t G2MSM_DISCOUNTS[] = {1000, 1000, 923, 884, 855, 832, 812, 796, 782, 770, 759,
    749, 740, 732, 724, 717, 711, 704, 699, 693, 688, 683, 679, 674, 670, 666, 663, 659, 655, 652,
    649, 646, 643, 640, 637, 634, 632, 629, 627, 624, 622, 620, 618, 615, 613, 611, 609, 607, 606,
    604, 602, 600, 598, 597, 595, 593, 592, 590, 589, 587, 586, 584, 583, 582, 580, 579, 578, 576,
    575, 574, 573, 571, 570, 569, 568, 567, 566, 565, 563, 562, 561, 560, 559, 558, 557, 556, 555,
    554, 553, 552, 552, 551, 550, 549, 548, 547, 546, 545, 545, 544, 543, 542, 541, 541, 540, 539,
    538, 537, 537, 536, 535, 535, 534, 533, 532, 532, 531, 530, 530, 529, 528, 528, 527, 526, 526,
    525, 524, 524};

static_assert(std::size(G1MSM_DISCOUNTS) == 128);
static_assert(std::size(G2MSM_DISCOUNTS) == 128);

template <size_t N>
constexpr uint64_t discount(const uint16_t (&table)[N], size_t k) noexcept
{
    return table[std::clamp(k, size_t{1}, N) - 1];
}

/// The EIP-2537 MSM cost: ⌊k · mul_cost · discount(k) / 1000⌋. Zero entries cost nothing.
uint64_t msm_cost(size_t k, uint64_t mul_cost, uint64_t (*discount_fn)(size_t) noexcept) noexcept
{
    if (k == 0)
        return 0;
    return saturate(intx::uint256{k} * mul_cost * discount_fn(k) / 1000);
}
}  // namespace

uint64_t bls12_g1msm_discount(size_t k) noexcept
{
    return discount(G1MSM_DISCOUNTS, k);
}

uint64_t bls12_g2msm_discount(size_t k) noexcept
{
    return discount(G2MSM_DISCOUNTS, k);
}

PrecompileAnalysis ecrecover_analyze(bytes_view /*input*/) noexcept
{
    return {3000, 32};
}

PrecompileAnalysis sha256_analyze(bytes_view input) noexcept
{
    return {cost_per_input_word<60, 12>(input.size()), 32};
}

PrecompileAnalysis ripemd160_analyze(bytes_view input) noexcept
{
    return {cost_per_input_word<600, 120>(input.size()), 32};
}

PrecompileAnalysis identity_analyze(bytes_view input) noexcept
{
    return {cost_per_input_word<15, 3>(input.size()), input.size()};
}

PrecompileAnalysis expmod_analyze_eip198(bytes_view input) noexcept
{
    return expmod_analyze(input, EIP198_SCHEDULE);
}

PrecompileAnalysis expmod_analyze_eip2565(bytes_view input) noexcept
{
    return expmod_analyze(input, EIP2565_SCHEDULE);
}

PrecompileAnalysis expmod_analyze_eip7883(bytes_view input) noexcept
{
    return expmod_analyze(input, EIP7883_SCHEDULE);
}

PrecompileAnalysis ecadd_analyze_byzantium(bytes_view /*input*/) noexcept
{
    return {500, codec::bn254::G1_SIZE};
}

PrecompileAnalysis ecmul_analyze_byzantium(bytes_view /*input*/) noexcept
{
    return {40000, codec::bn254::G1_SIZE};
}

PrecompileAnalysis ecpairing_analyze_byzantium(bytes_view input) noexcept
{
    return {cost_per_entry<100000, 80000, BN254_PAIR_SIZE>(input.size()), 32};
}

PrecompileAnalysis ecadd_analyze_istanbul(bytes_view /*input*/) noexcept
{
    return {150, codec::bn254::G1_SIZE};
}

PrecompileAnalysis ecmul_analyze_istanbul(bytes_view /*input*/) noexcept
{
    return {6000, codec::bn254::G1_SIZE};
}

PrecompileAnalysis ecpairing_analyze_istanbul(bytes_view input) noexcept
{
    return {cost_per_entry<45000, 34000, BN254_PAIR_SIZE>(input.size()), 32};
}

PrecompileAnalysis blake2bf_analyze(bytes_view input) noexcept
{
    // The number of rounds is the cost, also for malformed input.
    uint8_t rounds[4];
    codec::read_fixed(rounds, input, 0, sizeof(rounds));
    return {intx::be::unsafe::load<uint32_t>(rounds), BLAKE2BF_OUTPUT_SIZE};
}

PrecompileAnalysis point_evaluation_analyze(bytes_view /*input*/) noexcept
{
    static constexpr auto POINT_EVALUATION_PRECOMPILE_GAS = 50000;
    return {POINT_EVALUATION_PRECOMPILE_GAS, 64};
}

PrecompileAnalysis bls12_g1add_analyze(bytes_view /*input*/) noexcept
{
    static constexpr auto BLS12_G1ADD_PRECOMPILE_GAS = 375;
    return {BLS12_G1ADD_PRECOMPILE_GAS, BLS12_G1_POINT_SIZE};
}

PrecompileAnalysis bls12_g1msm_analyze(bytes_view input) noexcept
{
    static constexpr auto G1MUL_GAS_COST = 12000;
    const auto k = input.size() / BLS12_G1_MUL_INPUT_SIZE;
    return {msm_cost(k, G1MUL_GAS_COST, bls12_g1msm_discount), BLS12_G1_POINT_SIZE};
}

PrecompileAnalysis bls12_g2add_analyze(bytes_view /*input*/) noexcept
{
    static constexpr auto BLS12_G2ADD_PRECOMPILE_GAS = 600;
    return {BLS12_G2ADD_PRECOMPILE_GAS, BLS12_G2_POINT_SIZE};
}

PrecompileAnalysis bls12_g2msm_analyze(bytes_view input) noexcept
{
    static constexpr auto G2MUL_GAS_COST = 22500;
    const auto k = input.size() / BLS12_G2_MUL_INPUT_SIZE;
    return {msm_cost(k, G2MUL_GAS_COST, bls12_g2msm_discount), BLS12_G2_POINT_SIZE};
}

PrecompileAnalysis bls12_pairing_check_analyze(bytes_view input) noexcept
{
    return {cost_per_entry<37700, 32600, BLS12_PAIR_SIZE>(input.size()), 32};
}

PrecompileAnalysis bls12_map_fp_to_g1_analyze(bytes_view /*input*/) noexcept
{
    static constexpr auto BLS12_MAP_FP_TO_G1_PRECOMPILE_GAS = 5500;
    return {BLS12_MAP_FP_TO_G1_PRECOMPILE_GAS, BLS12_G1_POINT_SIZE};
}

PrecompileAnalysis bls12_map_fp2_to_g2_analyze(bytes_view /*input*/) noexcept
{
    static constexpr auto BLS12_MAP_FP2_TO_G2_PRECOMPILE_GAS = 23800;
    return {BLS12_MAP_FP2_TO_G2_PRECOMPILE_GAS, BLS12_G2_POINT_SIZE};
}

PrecompileAnalysis p256verify_analyze_rip7212(bytes_view /*input*/) noexcept
{
    return {3450, 32};
}

PrecompileAnalysis p256verify_analyze_eip7951(bytes_view /*input*/) noexcept
{
    return {6900, 32};
}
}  // namespace evmpre::gas
