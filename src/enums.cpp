#include "ff/enums.h"
#include <algorithm>
#include <cctype>

namespace ff {

const char* positionName(PlayerPosition p) {
    switch (p) {
        case PlayerPosition::QB: return "QB";
        case PlayerPosition::RB: return "RB";
        case PlayerPosition::WR: return "WR";
        case PlayerPosition::TE: return "TE";
        case PlayerPosition::OTHER: return "OTHER";
    }
    return "OTHER";
}

PlayerPosition parsePosition(const std::string& name) {
    std::string normalized;
    for (char c : name) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        normalized += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    if (normalized == "QB") return PlayerPosition::QB;
    if (normalized == "RB") return PlayerPosition::RB;
    if (normalized == "WR") return PlayerPosition::WR;
    if (normalized == "TE") return PlayerPosition::TE;
    return PlayerPosition::OTHER;
}

} // namespace ff
