#include "ff/transition_extractor.h"
#include <algorithm>
#include <cmath>
#include <map>

namespace ff {

TrainingSet extractTransitions(const std::vector<SeasonRecord>& history, FeatureBuilder& builder) {
    TrainingSet set;
    set.schema = builder.schema();
    set.epochYear = builder.epochYear();

    // Ordered map keeps the output order independent of input order.
    std::map<std::string, std::vector<SeasonRecord>> byPlayer;
    for (auto& record : history) {
        if (record.playerName.empty()) continue;
        byPlayer[record.playerName].push_back(record);
    }

    for (auto& entry : byPlayer) {
        std::vector<SeasonRecord>& seasons = entry.second;
        if (seasons.size() < 2) {
            set.playersSkipped++;
            continue;
        }

        std::stable_sort(seasons.begin(), seasons.end(),
                         [](const SeasonRecord& a, const SeasonRecord& b) { return a.year < b.year; });

        PlayerPosition position = seasons.back().position;
        AttributeEstimate attrs = builder.estimator().estimate(entry.first, position);

        bool used = false;
        for (size_t i = 0; i + 1 < seasons.size(); ++i) {
            const SeasonRecord& current = seasons[i];
            const SeasonRecord& next = seasons[i + 1];
            if (next.year != current.year + 1) {
                set.nonConsecutivePairs++;
                continue;
            }

            bool sameTeam = current.team == next.team;
            set.features.push_back(builder.build(current, position, attrs, sameTeam));

            double label = next.fantasyPoints;
            if (!std::isfinite(label) || label < 0.0) label = 0.0;
            set.labels.push_back(label);

            set.transitions.push_back({entry.first, position, current.year, next.year});
            used = true;
        }
        if (used) set.playersUsed++;
    }

    return set;
}

} // namespace ff
