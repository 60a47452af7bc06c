/**
 * Build Fetch - Qt HTTP Client Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "QtHttpClient.hpp"
#include "core/AcquisitionError.hpp"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QTimer>

#include <spdlog/spdlog.h>

namespace buildfetch {

namespace {
    constexpr const char* USER_AGENT = "build-fetch/0.1.0";
    constexpr int CANCEL_POLL_MS = 100;

void captureHeaders(QNetworkReply* reply, HttpResponse& response) {
    response.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();

    QVariant length = reply->header(QNetworkRequest::ContentLengthHeader);
    if (length.isValid()) {
        response.contentLength = length.toLongLong();
    }

    response.etag = QString::fromUtf8(reply->rawHeader("ETag")).trimmed();
    response.lastModified = QString::fromUtf8(reply->rawHeader("Last-Modified")).trimmed();
    response.contentRange = QString::fromUtf8(reply->rawHeader("Content-Range")).trimmed();
}

} // anonymous namespace

QtHttpClient::QtHttpClient(const AuthConfig& auth, const TransferSettings& settings)
    : m_settings(settings)
{
    switch (auth.scheme()) {
        case AuthScheme::Basic: {
            QByteArray credentials = QByteArray::fromStdString(auth.username + ":" + auth.password);
            m_authHeaderName = "Authorization";
            m_authHeaderValue = "Basic " + credentials.toBase64();
            spdlog::info("Using Basic Authentication with username: {}", auth.username);
            break;
        }
        case AuthScheme::ApiKey:
            m_authHeaderName = QByteArray::fromStdString(auth.apiKeyHeader);
            m_authHeaderValue = QByteArray::fromStdString(auth.apiKey);
            spdlog::info("Using API key authentication ({})", auth.apiKeyHeader);
            break;
        case AuthScheme::None:
            spdlog::error("Repository credentials not configured. Downloads will likely fail.");
            break;
    }
}

QtHttpClient::~QtHttpClient() = default;

QNetworkRequest QtHttpClient::buildRequest(const QUrl& url) const {
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::UserAgentHeader, USER_AGENT);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    if (!m_authHeaderName.isEmpty()) {
        request.setRawHeader(m_authHeaderName, m_authHeaderValue);
    }
    return request;
}

HttpResponse QtHttpClient::head(const QUrl& url, const CancellationToken& cancel) {
    if (cancel.isCancelled()) {
        throw CancelledError("Cancelled before metadata probe");
    }

    spdlog::debug("HEAD {}", url.toString().toStdString());

    QNetworkAccessManager manager;
    QNetworkReply* reply = manager.head(buildRequest(url));
    return waitForReply(reply, nullptr, cancel, m_settings.requestTimeoutMs, false);
}

HttpResponse QtHttpClient::get(
    const QUrl& url,
    qint64 rangeStart,
    const QString& ifRange,
    const BodySink& sink,
    const CancellationToken& cancel
) {
    if (cancel.isCancelled()) {
        throw CancelledError("Cancelled before request");
    }

    QNetworkRequest request = buildRequest(url);
    if (rangeStart > 0) {
        request.setRawHeader("Range", "bytes=" + QByteArray::number(rangeStart) + "-");
        if (!ifRange.isEmpty()) {
            request.setRawHeader("If-Range", ifRange.toUtf8());
        }
    }

    spdlog::debug("GET {} (from byte {})", url.toString().toStdString(), rangeStart);

    QNetworkAccessManager manager;
    QNetworkReply* reply = manager.get(request);

    // Body reads are bounded by inactivity, not total duration
    return waitForReply(reply, &sink, cancel, m_settings.stallTimeoutMs, true);
}

HttpResponse QtHttpClient::waitForReply(
    QNetworkReply* reply,
    const BodySink* sink,
    const CancellationToken& cancel,
    int timeoutMs,
    bool idleTimeout
) {
    HttpResponse response;
    bool headersCaptured = false;
    bool timedOut = false;
    bool cancelled = false;
    bool sinkAborted = false;

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QTimer cancelPoll;

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);

    QObject::connect(&timer, &QTimer::timeout, [&]() {
        timedOut = true;
        reply->abort();
    });

    QObject::connect(&cancelPoll, &QTimer::timeout, [&]() {
        if (cancel.isCancelled()) {
            cancelled = true;
            reply->abort();
        }
    });

    if (sink) {
        QObject::connect(reply, &QNetworkReply::readyRead, [&]() {
            if (!headersCaptured) {
                captureHeaders(reply, response);
                headersCaptured = true;
            }
            if (idleTimeout) {
                timer.start(timeoutMs);
            }

            QByteArray chunk = reply->readAll();
            if (!response.isSuccess() || chunk.isEmpty() || sinkAborted) {
                return;
            }
            if (!(*sink)(response, chunk)) {
                sinkAborted = true;
                reply->abort();
            }
        });
    }

    timer.start(timeoutMs);
    cancelPoll.start(CANCEL_POLL_MS);
    loop.exec();
    timer.stop();
    cancelPoll.stop();

    if (!headersCaptured) {
        captureHeaders(reply, response);
    }

    // Drain anything that arrived together with finished()
    if (sink && response.isSuccess() && !sinkAborted && !cancelled && !timedOut) {
        QByteArray rest = reply->readAll();
        if (!rest.isEmpty() && !(*sink)(response, rest)) {
            sinkAborted = true;
        }
    }

    QNetworkReply::NetworkError error = reply->error();
    QString errorString = reply->errorString();
    QString url = reply->url().toString();
    reply->deleteLater();

    if (cancelled || sinkAborted) {
        throw CancelledError("Request cancelled: " + url.toStdString());
    }

    if (timedOut) {
        spdlog::warn("Request timed out after {} ms: {}", timeoutMs, url.toStdString());
        TransportError timeout("Request timed out");
        timeout.withUrl(url.toStdString());
        throw timeout;
    }

    if (error != QNetworkReply::NoError && (response.statusCode == 0 || response.isSuccess())) {
        // Connection-level failure, possibly after part of the body arrived
        spdlog::warn("Transport failure: {} - {}", url.toStdString(), errorString.toStdString());
        TransportError failure(errorString.toStdString());
        failure.withUrl(url.toStdString()).withHttpStatus(response.statusCode);
        throw failure;
    }

    return response;
}

} // namespace buildfetch
