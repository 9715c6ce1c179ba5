// =============================================================================
// asset_id.cpp - (kind, timestamp) <-> 256-bit asset id
// =============================================================================

#include "hyper/asset_id.hpp"
#include "hyper/errors.hpp"

namespace hyper {

const char* to_string(AssetKind kind) {
    switch (kind) {
        case AssetKind::LP: return "LP";
        case AssetKind::LONG: return "LONG";
        case AssetKind::SHORT: return "SHORT";
        case AssetKind::WITHDRAWAL_SHARE: return "WITHDRAWAL_SHARE";
    }
    return "UNKNOWN";
}

namespace asset_id {

namespace {

const U256 TIMESTAMP_MASK = (U256(1) << KIND_SHIFT) - 1;

}  // namespace

U256 encode(AssetKind kind, const U256& timestamp) {
    if (timestamp > TIMESTAMP_MASK) {
        throw ValidationError(errors::INVALID_TIMESTAMP,
                              "asset_id: timestamp exceeds 248 bits");
    }
    return (U256(static_cast<uint8_t>(kind)) << KIND_SHIFT) | timestamp;
}

DecodedAsset decode(const U256& id) {
    unsigned tag = static_cast<unsigned>(id >> KIND_SHIFT);
    if (tag > static_cast<unsigned>(AssetKind::WITHDRAWAL_SHARE)) {
        throw ValidationError(errors::INVALID_ASSET_ID,
                              "asset_id: unknown kind tag " + std::to_string(tag));
    }
    return DecodedAsset{static_cast<AssetKind>(tag), id & TIMESTAMP_MASK};
}

} // namespace asset_id

} // namespace hyper
