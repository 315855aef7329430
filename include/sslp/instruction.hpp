#ifndef SSLP_INSTRUCTION_HPP
#define SSLP_INSTRUCTION_HPP

#include <cstdint>
#include <vector>

#include "types.hpp"

namespace sslp {

// =============================================================================
// Match Instruction (decoded hook payload)
// =============================================================================

// UseAssetA / UseAssetB name the asset the reservoir fronts for the
// contribution; the caller supplies the other one.
enum class MatchInstruction : uint8_t {
    None = 0,
    UseAssetA = 1,
    UseAssetB = 2
};

namespace instruction {

// Wire tags for the one-byte payload
constexpr uint8_t TAG_USE_ASSET_A = 0x01;
constexpr uint8_t TAG_USE_ASSET_B = 0x02;

// Decode a hook payload.
//   empty       -> None
//   {0x01}      -> UseAssetA
//   {0x02}      -> UseAssetB
//   otherwise   -> errors::INVALID_ASSET_SELECTION
// Returns errors::OK and writes `out` on success; `out` is untouched on error.
int32_t decode(const std::vector<uint8_t>& payload, MatchInstruction& out);

std::vector<uint8_t> encode(MatchInstruction instr);

// Matched asset for a non-None instruction
inline Asset matched_asset(MatchInstruction instr) {
    return instr == MatchInstruction::UseAssetA ? Asset::A : Asset::B;
}

inline std::vector<uint8_t> use(Asset asset) {
    return encode(asset == Asset::A ? MatchInstruction::UseAssetA : MatchInstruction::UseAssetB);
}

} // namespace instruction

} // namespace sslp

#endif // SSLP_INSTRUCTION_HPP
