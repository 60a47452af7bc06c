/**
 * Build Fetch - Qt HTTP Client
 *
 * HttpClient implementation on QNetworkAccessManager.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "HttpClient.hpp"
#include "core/config/AuthConfig.hpp"
#include "core/config/FetchConfig.hpp"

#include <QByteArray>
#include <QNetworkRequest>

class QNetworkReply;

namespace buildfetch {

/**
 * Authenticated HTTP client
 *
 * Each call runs its own QNetworkAccessManager and QEventLoop on the calling
 * thread, so the client can be used from worker threads concurrently.
 *
 * Authentication is HTTP Basic (username + password) or an API key header,
 * whichever AuthConfig::scheme() selects.
 */
class QtHttpClient : public HttpClient {
public:
    QtHttpClient(const AuthConfig& auth, const TransferSettings& settings);
    ~QtHttpClient() override;

    HttpResponse head(
        const QUrl& url,
        const CancellationToken& cancel = CancellationToken()
    ) override;

    HttpResponse get(
        const QUrl& url,
        qint64 rangeStart,
        const QString& ifRange,
        const BodySink& sink,
        const CancellationToken& cancel = CancellationToken()
    ) override;

private:
    QNetworkRequest buildRequest(const QUrl& url) const;

    /**
     * Run the reply's event loop until it finishes, times out or is cancelled
     *
     * @param idleTimeout Restart the timeout whenever bytes arrive
     */
    HttpResponse waitForReply(
        QNetworkReply* reply,
        const BodySink* sink,
        const CancellationToken& cancel,
        int timeoutMs,
        bool idleTimeout
    );

    QByteArray m_authHeaderName;
    QByteArray m_authHeaderValue;
    TransferSettings m_settings;
};

} // namespace buildfetch
