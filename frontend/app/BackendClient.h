#ifndef BACKENDCLIENT_H
#define BACKENDCLIENT_H

#include <QObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QJsonObject>

/**
 * @brief Health check result (GET /).
 */
struct HealthCheckResult {
    bool success = false;
    QString errorMessage;
    QString name;
    QString version;
    QString status;
};

/**
 * @brief Worker status (GET /status).
 */
struct BackendStatusResult {
    bool success = false;
    QString errorMessage;

    bool isCapturing = false;
    int connectedClients = 0;
    int transcriptionQueueSize = 0;
    QJsonObject transcriber;
};

/**
 * @brief Client for the worker's HTTP API.
 *
 * The supervisor only knows that the worker process was created. This
 * client is how the shell finds out whether the worker actually serves on
 * the port it was given.
 */
class BackendClient : public QObject
{
    Q_OBJECT

public:
    explicit BackendClient(QObject *parent = nullptr);
    explicit BackendClient(const QString &baseUrl, QObject *parent = nullptr);

    void setBaseUrl(const QString &url);
    QString baseUrl() const { return m_baseUrl; }

    void setTimeout(int ms) { m_timeoutMs = ms; }
    int timeout() const { return m_timeoutMs; }

    // API methods
    void healthCheck();
    void fetchStatus();

signals:
    void healthCheckCompleted(const HealthCheckResult &result);
    void statusCompleted(const BackendStatusResult &result);

private slots:
    void handleHealthReply();
    void handleStatusReply();

private:
    QNetworkRequest createRequest(const QString &endpoint) const;
    QJsonObject parseResponse(QNetworkReply *reply, bool &ok, QString &errorMsg);

    QNetworkAccessManager *m_networkManager;
    QString m_baseUrl;
    int m_timeoutMs;
};

#endif // BACKENDCLIENT_H
