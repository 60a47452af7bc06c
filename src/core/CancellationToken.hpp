/**
 * Build Fetch - Cancellation Token
 *
 * Cooperative cancellation shared between a caller and a running acquisition.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <atomic>
#include <memory>

namespace buildfetch {

/**
 * Shared cancellation flag
 *
 * Copies share the same flag. Long-running work checks it at every
 * suspension point (listing fetch, metadata probe, each received chunk).
 */
class CancellationToken {
public:
    CancellationToken()
        : m_flag(std::make_shared<std::atomic<bool>>(false))
    {
    }

    void cancel() { m_flag->store(true); }
    bool isCancelled() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace buildfetch
