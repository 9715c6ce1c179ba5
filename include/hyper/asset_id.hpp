#ifndef HYPER_ASSET_ID_HPP
#define HYPER_ASSET_ID_HPP

#include "types.hpp"

namespace hyper {

// =============================================================================
// Asset Kinds
// =============================================================================

enum class AssetKind : uint8_t {
    LP = 0,
    LONG = 1,
    SHORT = 2,
    WITHDRAWAL_SHARE = 3
};

const char* to_string(AssetKind kind);

struct DecodedAsset {
    AssetKind kind;
    U256 timestamp;

    bool operator==(const DecodedAsset& other) const {
        return kind == other.kind && timestamp == other.timestamp;
    }
};

// =============================================================================
// AssetId Packing
// Layout: [ kind : 8 bits ][ timestamp : 248 bits ]
// =============================================================================

namespace asset_id {

constexpr unsigned KIND_SHIFT = 248;

// Throws ValidationError(INVALID_TIMESTAMP) if timestamp needs more than 248 bits
U256 encode(AssetKind kind, const U256& timestamp);

// Throws ValidationError(INVALID_ASSET_ID) on an unknown kind tag
DecodedAsset decode(const U256& id);

inline U256 encode(AssetKind kind, uint64_t timestamp) {
    return encode(kind, U256(timestamp));
}

} // namespace asset_id

} // namespace hyper

#endif // HYPER_ASSET_ID_HPP
