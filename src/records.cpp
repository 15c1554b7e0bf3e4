#include "ff/records.h"
#include <algorithm>

namespace ff {

int latestSeasonYear(const std::vector<SeasonRecord>& records) {
    int latest = 0;
    for (auto& r : records) {
        latest = std::max(latest, r.year);
    }
    return latest;
}

std::vector<SeasonRecord> selectSeason(const std::vector<SeasonRecord>& records, int year) {
    std::vector<SeasonRecord> out;
    for (auto& r : records) {
        if (r.year == year) out.push_back(r);
    }
    return out;
}

} // namespace ff
