#include "hue_http.h"

#include <algorithm>

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>
#if QT_CONFIG(ssl)
#include <QSslCertificate>
#include <QSslConfiguration>
#include <QSslError>
#include <QSslSocket>
#endif

#include "hue_logging.h"

namespace hueclient {

namespace {

void applyTlsPolicy(QNetworkReply *reply, bool allowHostNameMismatch)
{
#if QT_CONFIG(ssl)
    QObject::connect(reply,
                     &QNetworkReply::sslErrors,
                     reply,
                     [reply, allowHostNameMismatch](const QList<QSslError> &errors) {
        if (sslErrorsTolerable(errors, allowHostNameMismatch)) {
            reply->ignoreSslErrors();
            return;
        }
        for (const QSslError &sslError : errors)
            qCWarning(hueHttpLog) << "TLS error for" << reply->url().toString() << sslError.errorString();
    });
#else
    Q_UNUSED(reply);
    Q_UNUSED(allowHostNameMismatch);
#endif
}

} // namespace

#if QT_CONFIG(ssl)
bool sslErrorsTolerable(const QList<QSslError> &errors, bool allowHostNameMismatch)
{
    if (!allowHostNameMismatch || errors.isEmpty())
        return false;
    return std::all_of(errors.cbegin(), errors.cend(), [](const QSslError &sslError) {
        return sslError.error() == QSslError::HostNameMismatch;
    });
}
#endif

HttpResult HttpTransport::get(const ConnectionSettings &settings,
                              const QString &path,
                              bool includeAppKey,
                              const QByteArray &accept,
                              int timeoutMs) const
{
    return request(settings, QByteArrayLiteral("GET"), path, {}, includeAppKey, accept, timeoutMs);
}

HttpResult HttpTransport::postJson(const ConnectionSettings &settings,
                                   const QString &path,
                                   const QByteArray &payload,
                                   bool includeAppKey,
                                   int timeoutMs) const
{
    return request(settings,
                   QByteArrayLiteral("POST"),
                   path,
                   payload,
                   includeAppKey,
                   QByteArrayLiteral("application/json"),
                   timeoutMs);
}

HttpResult HttpTransport::putJson(const ConnectionSettings &settings,
                                  const QString &path,
                                  const QByteArray &payload,
                                  bool includeAppKey,
                                  int timeoutMs) const
{
    return request(settings,
                   QByteArrayLiteral("PUT"),
                   path,
                   payload,
                   includeAppKey,
                   QByteArrayLiteral("application/json"),
                   timeoutMs);
}

HttpClient::HttpClient(QNetworkAccessManager *manager)
    : m_manager(manager)
{
}

QString HttpClient::effectiveHost(const ConnectionSettings &settings)
{
    return settings.host.trimmed();
}

QUrl HttpClient::endpointUrl(const ConnectionSettings &settings, const QString &path)
{
    QUrl url;
    url.setScheme(settings.useTls ? QStringLiteral("https") : QStringLiteral("http"));
    url.setHost(effectiveHost(settings));
    url.setPort(settings.port > 0 ? settings.port : (settings.useTls ? 443 : 80));
    url.setPath(path.startsWith(QLatin1Char('/')) ? path : QLatin1Char('/') + path);
    return url;
}

bool HttpClient::buildRequest(const ConnectionSettings &settings,
                              const QString &path,
                              bool includeAppKey,
                              const QByteArray &accept,
                              bool hasJsonBody,
                              QNetworkRequest *request,
                              QString *error) const
{
    if (effectiveHost(settings).isEmpty()) {
        if (error)
            *error = QStringLiteral("Bridge host is empty");
        return false;
    }

    QNetworkRequest out(endpointUrl(settings, path));
    out.setRawHeader("Accept", accept);
    out.setRawHeader("User-Agent", "hueclient/1.0");
    if (hasJsonBody)
        out.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    if (includeAppKey && !settings.appKey.isEmpty())
        out.setRawHeader("hue-application-key", settings.appKey.toUtf8());

    if (settings.useTls) {
#if QT_CONFIG(ssl)
        // The bridge certificate chains to its own root, not a public CA.
        QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
        if (!settings.caCertificatesPem.isEmpty())
            ssl.setCaCertificates(QSslCertificate::fromData(settings.caCertificatesPem, QSsl::Pem));
        ssl.setPeerVerifyMode(settings.verifyPeer ? QSslSocket::VerifyPeer : QSslSocket::VerifyNone);
        out.setSslConfiguration(ssl);
#else
        if (error)
            *error = QStringLiteral("TLS support is not available in this Qt build");
        return false;
#endif
    }

    *request = out;
    return true;
}

HttpResult HttpClient::request(const ConnectionSettings &settings,
                               const QByteArray &method,
                               const QString &path,
                               const QByteArray &payload,
                               bool includeAppKey,
                               const QByteArray &accept,
                               int timeoutMs) const
{
    HttpResult result;
    if (!m_manager) {
        result.error = QStringLiteral("Network manager unavailable");
        return result;
    }

    QNetworkRequest networkRequest;
    if (!buildRequest(settings, path, includeAppKey, accept, !payload.isEmpty(), &networkRequest, &result.error))
        return result;

    const QString url = networkRequest.url().toString();
    qCDebug(hueHttpLog) << method << url;

    QNetworkReply *reply = m_manager->sendCustomRequest(networkRequest, method, payload);
    if (!reply) {
        result.error = QStringLiteral("Failed to create network request");
        return result;
    }
    applyTlsPolicy(reply, settings.allowHostNameMismatch);

    if (!waitForReply(reply, timeoutMs > 0 ? timeoutMs : kRequestTimeoutMs)) {
        qCWarning(hueHttpLog) << "Request timed out:" << method << url;
        reply->abort();
        reply->deleteLater();
        result.error = QStringLiteral("Request timed out");
        return result;
    }

    result = collectResult(reply);
    if (!result.ok)
        qCWarning(hueHttpLog) << "Request failed:" << method << url << result.error;
    reply->deleteLater();
    return result;
}

bool HttpClient::waitForReply(QNetworkReply *reply, int timeoutMs)
{
    if (reply->isFinished())
        return true;

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(timeoutMs);
    loop.exec();
    return reply->isFinished();
}

HttpResult HttpClient::collectResult(QNetworkReply *reply)
{
    HttpResult result;
    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.payload = reply->readAll();

    const bool success = result.statusCode >= 200 && result.statusCode < 300;
    if (success && reply->error() == QNetworkReply::NoError)
        result.ok = true;
    else if (result.statusCode > 0)
        result.error = QStringLiteral("HTTP %1").arg(result.statusCode);
    else
        result.error = reply->errorString();
    return result;
}

QNetworkReply *HttpClient::openStream(const ConnectionSettings &settings,
                                      const QString &path,
                                      const QByteArray &accept,
                                      QString *error) const
{
    if (!m_manager) {
        if (error)
            *error = QStringLiteral("Network manager unavailable");
        return nullptr;
    }

    QNetworkRequest request;
    if (!buildRequest(settings, path, true, accept, false, &request, error))
        return nullptr;

    qCDebug(hueHttpLog) << "GET (stream)" << request.url().toString();
    QNetworkReply *reply = m_manager->get(request);
    if (!reply) {
        if (error)
            *error = QStringLiteral("Failed to create network request");
        return nullptr;
    }
    applyTlsPolicy(reply, settings.allowHostNameMismatch);
    return reply;
}

} // namespace hueclient
