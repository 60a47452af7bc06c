/**
 * Build Fetch - HTTP Capability
 *
 * Narrow, pre-authenticated HTTP interface consumed by the acquisition engine.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <functional>
#include <optional>

#include <QByteArray>
#include <QString>
#include <QUrl>

#include "core/CancellationToken.hpp"

namespace buildfetch {

/**
 * Status line and the headers the engine cares about
 */
struct HttpResponse {
    int statusCode = 0;
    std::optional<qint64> contentLength;
    QString etag;
    QString lastModified;
    QString contentRange;        // e.g. "bytes 100-199/200"
    QByteArray body;             // Only filled by fetchText()

    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }

    /**
     * Total resource length from Content-Range ("bytes a-b/total")
     */
    std::optional<qint64> rangeTotal() const;
};

/**
 * Receives body bytes as they arrive, together with the response status and
 * headers they belong to. Return false to abort the transfer.
 */
using BodySink = std::function<bool(const HttpResponse& response, const QByteArray& chunk)>;

/**
 * Abstract HTTP client
 *
 * Implementations:
 * - QtHttpClient: QNetworkAccessManager with Basic or API-key authentication
 * - FakeHttpClient (tests): in-memory repository
 *
 * Transport failures (timeouts, connection resets) throw TransportError.
 * Cancellation throws CancelledError. HTTP error statuses are returned in
 * the response; callers decide how to treat them.
 * Implementations must be safe to call from several threads at once.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * Metadata probe
     */
    virtual HttpResponse head(
        const QUrl& url,
        const CancellationToken& cancel = CancellationToken()
    ) = 0;

    /**
     * Streaming GET
     *
     * @param url Resource to fetch
     * @param rangeStart Byte offset to request with "Range: bytes=N-" (0 = whole resource)
     * @param ifRange Validator sent as If-Range with a ranged request, so a
     *        server holding a different version answers 200 with the whole body
     * @param sink Body consumer, only invoked for 2xx responses
     * @param cancel Cancellation token checked while waiting
     */
    virtual HttpResponse get(
        const QUrl& url,
        qint64 rangeStart,
        const QString& ifRange,
        const BodySink& sink,
        const CancellationToken& cancel = CancellationToken()
    ) = 0;

    /**
     * GET the whole resource into HttpResponse::body
     */
    HttpResponse fetchText(
        const QUrl& url,
        const CancellationToken& cancel = CancellationToken()
    ) {
        QByteArray body;
        HttpResponse response = get(url, 0, QString(), [&body](const HttpResponse&, const QByteArray& chunk) {
            body.append(chunk);
            return true;
        }, cancel);
        response.body = body;
        return response;
    }

protected:
    HttpClient() = default;
};

inline std::optional<qint64> HttpResponse::rangeTotal() const {
    int slash = contentRange.lastIndexOf('/');
    if (slash < 0) {
        return std::nullopt;
    }
    bool ok = false;
    qint64 total = contentRange.mid(slash + 1).trimmed().toLongLong(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return total;
}

} // namespace buildfetch
