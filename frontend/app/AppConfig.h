#ifndef APPCONFIG_H
#define APPCONFIG_H

#include <QString>

struct LaunchSettings;

/**
 * @brief Application configuration manager.
 *
 * Reads configuration from app.yaml and provides access to settings.
 */
class AppConfig
{
public:
    static AppConfig& instance();

    // Load configuration from file; defaults are restored first
    bool load(const QString &configPath = QString());
    void resetToDefaults();

    QString loadedPath() const { return m_loadedPath; }

    // Backend settings
    QString sidecarName() const { return m_sidecarName; }
    QString executablePath() const { return m_executablePath; }
    QString backendHost() const { return m_backendHost; }
    quint16 fallbackPort() const { return m_fallbackPort; }
    QString modeVariable() const { return m_modeVariable; }
    QString modeValue() const { return m_modeValue; }
    QString portVariable() const { return m_portVariable; }
    bool singleInstance() const { return m_singleInstance; }

    // Health check settings
    int healthIntervalMs() const { return m_healthIntervalMs; }
    int healthMaxAttempts() const { return m_healthMaxAttempts; }

    // UI settings
    bool openBrowser() const { return m_openBrowser; }

    // Logging
    bool debugLogging() const { return m_debugLogging; }

    QString backendBaseUrl(quint16 port) const;
    LaunchSettings launchSettings() const;

private:
    AppConfig();
    ~AppConfig() = default;
    AppConfig(const AppConfig&) = delete;
    AppConfig& operator=(const AppConfig&) = delete;

    QString m_loadedPath;

    // Backend
    QString m_sidecarName;
    QString m_executablePath;
    QString m_backendHost;
    quint16 m_fallbackPort;
    QString m_modeVariable;
    QString m_modeValue;
    QString m_portVariable;
    bool m_singleInstance;

    // Health
    int m_healthIntervalMs;
    int m_healthMaxAttempts;

    // UI
    bool m_openBrowser;

    // Logging
    bool m_debugLogging;
};

#endif // APPCONFIG_H
