#include "BackendClient.h"
#include <QJsonDocument>
#include <QNetworkProxy>
#include <QTimer>

BackendClient::BackendClient(QObject *parent)
    : QObject(parent)
    , m_networkManager(new QNetworkAccessManager(this))
    , m_baseUrl("http://127.0.0.1:8000")
    , m_timeoutMs(3000)
{
    // The worker only ever listens on loopback
    m_networkManager->setProxy(QNetworkProxy::NoProxy);
}

BackendClient::BackendClient(const QString &baseUrl, QObject *parent)
    : QObject(parent)
    , m_networkManager(new QNetworkAccessManager(this))
    , m_baseUrl(baseUrl)
    , m_timeoutMs(3000)
{
    // The worker only ever listens on loopback
    m_networkManager->setProxy(QNetworkProxy::NoProxy);
}

void BackendClient::setBaseUrl(const QString &url)
{
    m_baseUrl = url;
}

QNetworkRequest BackendClient::createRequest(const QString &endpoint) const
{
    QUrl url(m_baseUrl + endpoint);
    QNetworkRequest request(url);
    request.setRawHeader("Accept", "application/json");
    return request;
}

QJsonObject BackendClient::parseResponse(QNetworkReply *reply, bool &ok, QString &errorMsg)
{
    ok = false;

    if (reply->error() != QNetworkReply::NoError) {
        errorMsg = reply->errorString();
        return QJsonObject();
    }

    QByteArray data = reply->readAll();
    QJsonDocument doc = QJsonDocument::fromJson(data);

    if (!doc.isObject()) {
        errorMsg = "Invalid JSON response";
        return QJsonObject();
    }

    ok = true;
    return doc.object();
}

namespace {

// A worker that accepted the connection but never answers must not stall the health check
void abortAfter(QNetworkReply *reply, int ms)
{
    if (ms <= 0)
        return;
    QTimer::singleShot(ms, reply, [reply]() {
        if (reply->isRunning())
            reply->abort();
    });
}

} // namespace

// ============================================================================
// Health Check
// ============================================================================

void BackendClient::healthCheck()
{
    QNetworkRequest request = createRequest("/");
    QNetworkReply *reply = m_networkManager->get(request);
    abortAfter(reply, m_timeoutMs);
    connect(reply, &QNetworkReply::finished, this, &BackendClient::handleHealthReply);
}

void BackendClient::handleHealthReply()
{
    QNetworkReply *reply = qobject_cast<QNetworkReply*>(sender());
    if (!reply) return;
    reply->deleteLater();

    HealthCheckResult result;
    bool ok;
    QString errorMsg;

    QJsonObject json = parseResponse(reply, ok, errorMsg);

    if (!ok) {
        result.errorMessage = errorMsg;
        emit healthCheckCompleted(result);
        return;
    }

    result.status = json["status"].toString();
    if (result.status != "running") {
        result.errorMessage = QString("Unexpected backend status: %1").arg(result.status);
        emit healthCheckCompleted(result);
        return;
    }

    result.success = true;
    result.name = json["name"].toString();
    result.version = json["version"].toString();

    emit healthCheckCompleted(result);
}

// ============================================================================
// Status
// ============================================================================

void BackendClient::fetchStatus()
{
    QNetworkRequest request = createRequest("/status");
    QNetworkReply *reply = m_networkManager->get(request);
    abortAfter(reply, m_timeoutMs);
    connect(reply, &QNetworkReply::finished, this, &BackendClient::handleStatusReply);
}

void BackendClient::handleStatusReply()
{
    QNetworkReply *reply = qobject_cast<QNetworkReply*>(sender());
    if (!reply) return;
    reply->deleteLater();

    BackendStatusResult result;
    bool ok;
    QString errorMsg;

    QJsonObject json = parseResponse(reply, ok, errorMsg);

    if (!ok) {
        result.errorMessage = errorMsg;
        emit statusCompleted(result);
        return;
    }

    result.success = true;
    result.isCapturing = json["is_capturing"].toBool();
    result.connectedClients = json["connected_clients"].toInt();
    result.transcriptionQueueSize = json["transcription_queue_size"].toInt();
    result.transcriber = json["transcriber"].toObject();

    emit statusCompleted(result);
}
