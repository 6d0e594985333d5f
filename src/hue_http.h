#pragma once

#include <QByteArray>
#include <QList>
#include <QString>
#include <QUrl>
#include <QtNetwork/qtnetworkglobal.h>
#if QT_CONFIG(ssl)
#include <QSslError>
#endif

class QNetworkAccessManager;
class QNetworkReply;
class QNetworkRequest;

namespace hueclient {

inline constexpr int kRequestTimeoutMs = 2000;

struct ConnectionSettings {
    QString host;
    int port = 0;
    bool useTls = true;
    QString appKey;
    // PEM trust anchors for the peer. Empty means the system store.
    QByteArray caCertificatesPem;
    bool verifyPeer = true;
    // Bridge certificates name the bridge id, not the address we dial.
    bool allowHostNameMismatch = false;
};

struct HttpResult {
    bool ok = false;
    // 0 when no HTTP response was received at all.
    int statusCode = 0;
    QByteArray payload;
    QString error;
};

// "Send request, get status + body". Implementations own connection reuse,
// TLS and the per-request timeout.
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    HttpResult get(const ConnectionSettings &settings,
                   const QString &path,
                   bool includeAppKey = true,
                   const QByteArray &accept = QByteArrayLiteral("application/json"),
                   int timeoutMs = kRequestTimeoutMs) const;

    HttpResult postJson(const ConnectionSettings &settings,
                        const QString &path,
                        const QByteArray &payload,
                        bool includeAppKey,
                        int timeoutMs = kRequestTimeoutMs) const;

    HttpResult putJson(const ConnectionSettings &settings,
                       const QString &path,
                       const QByteArray &payload,
                       bool includeAppKey = true,
                       int timeoutMs = kRequestTimeoutMs) const;

    virtual HttpResult request(const ConnectionSettings &settings,
                               const QByteArray &method,
                               const QString &path,
                               const QByteArray &payload,
                               bool includeAppKey,
                               const QByteArray &accept,
                               int timeoutMs) const = 0;
};

#if QT_CONFIG(ssl)
// True when every error is a host-name mismatch and the connection allows it.
bool sslErrorsTolerable(const QList<QSslError> &errors, bool allowHostNameMismatch);
#endif

class HttpClient final : public HttpTransport
{
public:
    explicit HttpClient(QNetworkAccessManager *manager);

    HttpResult request(const ConnectionSettings &settings,
                       const QByteArray &method,
                       const QString &path,
                       const QByteArray &payload,
                       bool includeAppKey,
                       const QByteArray &accept,
                       int timeoutMs) const override;

    // Starts a long-lived GET without a timeout. The caller owns the reply.
    QNetworkReply *openStream(const ConnectionSettings &settings,
                              const QString &path,
                              const QByteArray &accept,
                              QString *error = nullptr) const;

    static QString effectiveHost(const ConnectionSettings &settings);
    static QUrl endpointUrl(const ConnectionSettings &settings, const QString &path);

private:
    static bool waitForReply(QNetworkReply *reply, int timeoutMs);
    static HttpResult collectResult(QNetworkReply *reply);

    bool buildRequest(const ConnectionSettings &settings,
                      const QString &path,
                      bool includeAppKey,
                      const QByteArray &accept,
                      bool hasJsonBody,
                      QNetworkRequest *request,
                      QString *error = nullptr) const;

    QNetworkAccessManager *m_manager = nullptr;
};

} // namespace hueclient
