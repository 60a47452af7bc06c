/**
 * Build Fetch - Qt HTTP Client Tests
 *
 * Runs QtHttpClient against a QTcpServer on 127.0.0.1. The server lives on
 * the test thread and is serviced by the client's own event loop.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include <QElapsedTimer>
#include <QHash>
#include <QHostAddress>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTimer>

#include "core/AcquisitionError.hpp"
#include "network/QtHttpClient.hpp"

using namespace buildfetch;

namespace {

/**
 * Minimal HTTP/1.1 responder
 *
 * /stall    accepts the request and never answers
 * /missing  404 with a body
 * /drop     200 announcing 100000 bytes, closes after 1000
 * /file     200 "hello world" with an ETag
 * /echo     200 with the request head as the body
 */
class LocalHttpServer {
public:
    LocalHttpServer() {
        QObject::connect(&m_server, &QTcpServer::newConnection, [this]() {
            while (QTcpSocket* socket = m_server.nextPendingConnection()) {
                QObject::connect(socket, &QTcpSocket::readyRead, [this, socket]() {
                    onReadyRead(socket);
                });
                QObject::connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
            }
        });
        m_server.listen(QHostAddress::LocalHost, 0);
    }

    bool isListening() const { return m_server.isListening(); }

    QUrl url(const QString& path) const {
        return QUrl(QString("http://127.0.0.1:%1%2").arg(m_server.serverPort()).arg(path));
    }

private:
    void onReadyRead(QTcpSocket* socket) {
        QByteArray& buffer = m_buffers[socket];
        buffer += socket->readAll();
        int end = buffer.indexOf("\r\n\r\n");
        if (end < 0) {
            return;
        }
        QByteArray request = buffer.left(end);
        m_buffers.remove(socket);

        QList<QByteArray> requestLine = request.left(request.indexOf("\r\n")).split(' ');
        QByteArray method = requestLine.value(0);
        QByteArray path = requestLine.value(1);
        bool headOnly = method == "HEAD";

        if (path == "/stall") {
            return;
        }
        if (path == "/missing") {
            send(socket, "404 Not Found", QByteArray(), "no such file", headOnly);
        } else if (path == "/drop") {
            socket->write("HTTP/1.1 200 OK\r\nContent-Length: 100000\r\nConnection: close\r\n\r\n");
            socket->write(QByteArray(1000, 'x'));
            socket->disconnectFromHost();
        } else if (path == "/file") {
            send(socket, "200 OK", "ETag: \"v1\"\r\n", "hello world", headOnly);
        } else if (path == "/echo") {
            send(socket, "200 OK", QByteArray(), request, headOnly);
        } else {
            send(socket, "404 Not Found", QByteArray(), QByteArray(), headOnly);
        }
    }

    void send(QTcpSocket* socket, const QByteArray& status, const QByteArray& headers,
              const QByteArray& body, bool headOnly) {
        QByteArray out = "HTTP/1.1 " + status + "\r\n" + headers +
                         "Content-Length: " + QByteArray::number(body.size()) + "\r\n" +
                         "Connection: close\r\n\r\n";
        if (!headOnly) {
            out += body;
        }
        socket->write(out);
        socket->disconnectFromHost();
    }

    QTcpServer m_server;
    QHash<QTcpSocket*, QByteArray> m_buffers;
};

} // anonymous namespace

class QtHttpClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(server.isListening());
        settings.requestTimeoutMs = 5000;
        settings.stallTimeoutMs = 5000;
    }

    LocalHttpServer server;
    TransferSettings settings;
    AuthConfig auth;
};

TEST_F(QtHttpClientTest, ProbeReturnsLengthAndEtag) {
    QtHttpClient http(auth, settings);
    HttpResponse response = http.head(server.url("/file"));

    EXPECT_EQ(response.statusCode, 200);
    EXPECT_EQ(response.contentLength, 11);
    EXPECT_EQ(response.etag, "\"v1\"");
}

TEST_F(QtHttpClientTest, StreamsBodyToSink) {
    QtHttpClient http(auth, settings);
    HttpResponse response = http.fetchText(server.url("/file"));

    EXPECT_EQ(response.statusCode, 200);
    EXPECT_EQ(response.body, QByteArray("hello world"));
}

TEST_F(QtHttpClientTest, ErrorBodyNeverReachesSink) {
    QtHttpClient http(auth, settings);
    int sinkCalls = 0;
    HttpResponse response = http.get(server.url("/missing"), 0, QString(),
        [&sinkCalls](const HttpResponse&, const QByteArray&) {
            ++sinkCalls;
            return true;
        });

    EXPECT_EQ(response.statusCode, 404);
    EXPECT_EQ(sinkCalls, 0);
}

TEST_F(QtHttpClientTest, SilentServerTimesOutAsRetryableTransportError) {
    settings.requestTimeoutMs = 300;
    settings.stallTimeoutMs = 300;
    QtHttpClient http(auth, settings);

    QElapsedTimer elapsed;
    elapsed.start();
    try {
        http.head(server.url("/stall"));
        FAIL() << "Expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_TRUE(e.isRetryable());
    }

    EXPECT_THROW(http.get(server.url("/stall"), 0, QString(),
                          [](const HttpResponse&, const QByteArray&) { return true; }),
                 TransportError);
    EXPECT_LT(elapsed.elapsed(), 4000);
}

TEST_F(QtHttpClientTest, ConnectionDroppedMidBodyIsTransportError) {
    QtHttpClient http(auth, settings);
    QByteArray received;

    try {
        http.get(server.url("/drop"), 0, QString(),
            [&received](const HttpResponse&, const QByteArray& chunk) {
                received += chunk;
                return true;
            });
        FAIL() << "Expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_TRUE(e.isRetryable());
        EXPECT_EQ(e.url(), server.url("/drop").toString().toStdString());
    }
    EXPECT_LE(received.size(), 1000);
}

TEST_F(QtHttpClientTest, CancellationAbortsPendingRequest) {
    QtHttpClient http(auth, settings);
    CancellationToken cancel;
    QTimer::singleShot(150, [cancel]() mutable { cancel.cancel(); });

    QElapsedTimer elapsed;
    elapsed.start();
    EXPECT_THROW(http.get(server.url("/stall"), 0, QString(),
                          [](const HttpResponse&, const QByteArray&) { return true; }, cancel),
                 CancelledError);
    EXPECT_LT(elapsed.elapsed(), 4000);
}

TEST_F(QtHttpClientTest, SinkCanAbortTransfer) {
    QtHttpClient http(auth, settings);
    EXPECT_THROW(http.get(server.url("/file"), 0, QString(),
                          [](const HttpResponse&, const QByteArray&) { return false; }),
                 CancelledError);
}

TEST_F(QtHttpClientTest, SendsBasicAuthorization) {
    auth.username = "ci";
    auth.password = "secret";
    QtHttpClient http(auth, settings);

    QByteArray head = http.fetchText(server.url("/echo")).body.toLower();
    EXPECT_TRUE(head.contains("authorization: basic " + QByteArray("ci:secret").toBase64().toLower()))
        << head.toStdString();
}

TEST_F(QtHttpClientTest, SendsApiKeyHeader) {
    auth.apiKey = "key-123";
    QtHttpClient http(auth, settings);

    QByteArray head = http.fetchText(server.url("/echo")).body.toLower();
    EXPECT_TRUE(head.contains("x-jfrog-art-api: key-123")) << head.toStdString();
    EXPECT_FALSE(head.contains("authorization:"));
}

TEST_F(QtHttpClientTest, RangedRequestCarriesIfRange) {
    QtHttpClient http(auth, settings);
    QByteArray head;
    http.get(server.url("/echo"), 6, "\"v1\"",
        [&head](const HttpResponse&, const QByteArray& chunk) {
            head += chunk;
            return true;
        });

    head = head.toLower();
    EXPECT_TRUE(head.contains("range: bytes=6-")) << head.toStdString();
    EXPECT_TRUE(head.contains("if-range: \"v1\"")) << head.toStdString();
}
