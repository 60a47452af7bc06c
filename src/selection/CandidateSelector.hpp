/**
 * Build Fetch - Candidate Selector
 *
 * Picks the single best package from a repository walk.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <vector>

#include "repository/RemoteEntry.hpp"

namespace buildfetch {

/**
 * Candidate ranking
 *
 * Order, best first:
 *   1. Package kind: FULL_UPDATE > OTA > FULL > UPDATE > unrecognized
 *   2. Larger sizeHint (unknown sorts below any known size)
 *   3. Lexicographically greater name (plain code-unit comparison, so
 *      "v2" beats "v10")
 */
class CandidateSelector {
public:
    /**
     * Select the winner
     *
     * @throws NotFoundError when there are no candidates
     * @throws AmbiguousError when the top two cannot be ordered; carries
     *         every candidate URL
     */
    static CandidateFile select(const std::vector<CandidateFile>& candidates);

    /**
     * All candidates, best first, duplicates (same URL) removed
     */
    static std::vector<CandidateFile> rank(const std::vector<CandidateFile>& candidates);

    /**
     * Strict ordering used by rank(): true when a beats b
     */
    static bool outranks(const CandidateFile& a, const CandidateFile& b);
};

} // namespace buildfetch
