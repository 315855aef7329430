// =============================================================================
// instruction.cpp - Hook payload codec
// =============================================================================

#include "sslp/instruction.hpp"

namespace sslp {
namespace instruction {

int32_t decode(const std::vector<uint8_t>& payload, MatchInstruction& out) {
    if (payload.empty()) {
        out = MatchInstruction::None;
        return errors::OK;
    }

    // Anything but a single known tag is rejected rather than defaulted
    if (payload.size() != 1) {
        return errors::INVALID_ASSET_SELECTION;
    }

    switch (payload[0]) {
    case TAG_USE_ASSET_A:
        out = MatchInstruction::UseAssetA;
        return errors::OK;
    case TAG_USE_ASSET_B:
        out = MatchInstruction::UseAssetB;
        return errors::OK;
    default:
        return errors::INVALID_ASSET_SELECTION;
    }
}

std::vector<uint8_t> encode(MatchInstruction instr) {
    switch (instr) {
    case MatchInstruction::UseAssetA:
        return {TAG_USE_ASSET_A};
    case MatchInstruction::UseAssetB:
        return {TAG_USE_ASSET_B};
    case MatchInstruction::None:
        break;
    }
    return {};
}

} // namespace instruction
} // namespace sslp
