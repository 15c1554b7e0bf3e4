#pragma once

#include <cstdint>
#include <string>

namespace ff {

// --- PlayerPosition ---
// Values 0-4 index the per-position config tables.
enum class PlayerPosition : uint8_t { QB = 0, RB, WR, TE, OTHER };

constexpr int NUM_POSITIONS = 5;

inline int positionIndex(PlayerPosition p) {
    return static_cast<int>(p);
}

const char* positionName(PlayerPosition p);

// Case-insensitive, surrounding whitespace ignored. Anything unlisted is OTHER.
PlayerPosition parsePosition(const std::string& name);

// --- FeatureSchema ---
// Numeric value is the schema version persisted with a trained model.
enum class FeatureSchema : uint8_t {
    BASE = 1,      // 10 fields
    EXTENDED = 2   // 12 fields: + years_since_epoch, team_consistency
};

// --- AgeSampling ---
enum class AgeSampling : uint8_t {
    IDENTITY_STABLE,  // pure function of (player, position)
    RESAMPLED         // fresh random draw on every call
};

} // namespace ff
