/**
 * Build Fetch - Candidate Selector Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "CandidateSelector.hpp"
#include "core/AcquisitionError.hpp"

#include <algorithm>
#include <set>

#include <spdlog/spdlog.h>

namespace buildfetch {

namespace {

qint64 sizeKey(const CandidateFile& candidate) {
    return candidate.sizeHint.value_or(-1);
}

} // anonymous namespace

bool CandidateSelector::outranks(const CandidateFile& a, const CandidateFile& b) {
    int rankA = packageKindRank(a.kind);
    int rankB = packageKindRank(b.kind);
    if (rankA != rankB) {
        return rankA > rankB;
    }
    if (sizeKey(a) != sizeKey(b)) {
        return sizeKey(a) > sizeKey(b);
    }
    return QString::compare(a.name, b.name, Qt::CaseSensitive) > 0;
}

std::vector<CandidateFile> CandidateSelector::rank(const std::vector<CandidateFile>& candidates) {
    std::vector<CandidateFile> ranked;
    std::set<QString> seen;
    for (const auto& candidate : candidates) {
        if (seen.insert(candidate.url.toString()).second) {
            ranked.push_back(candidate);
        }
    }

    std::stable_sort(ranked.begin(), ranked.end(), &CandidateSelector::outranks);
    return ranked;
}

CandidateFile CandidateSelector::select(const std::vector<CandidateFile>& candidates) {
    if (candidates.empty()) {
        throw NotFoundError("No package candidates found");
    }

    std::vector<CandidateFile> ranked = rank(candidates);

    for (const auto& candidate : ranked) {
        spdlog::debug("Candidate: {} [{}] size={}",
                      candidate.name.toStdString(),
                      packageKindLabel(candidate.kind),
                      candidate.sizeHint ? std::to_string(*candidate.sizeHint) : std::string("?"));
    }

    if (ranked.size() > 1 && !outranks(ranked[0], ranked[1])) {
        std::vector<std::string> urls;
        for (const auto& candidate : ranked) {
            urls.push_back(candidate.url.toString().toStdString());
        }
        AmbiguousError error("Cannot choose between " + ranked[0].name.toStdString() +
                             " and " + ranked[1].name.toStdString());
        error.withCandidates(std::move(urls));
        throw error;
    }

    const CandidateFile& winner = ranked.front();
    spdlog::info("Selected {} [{}] out of {} candidates",
                 winner.name.toStdString(), packageKindLabel(winner.kind), ranked.size());
    return winner;
}

} // namespace buildfetch
