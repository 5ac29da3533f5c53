#include "AppConfig.h"
#include "supervisor/BackendLauncher.h"
#include "supervisor/PortAllocator.h"
#include <QFile>
#include <QDir>
#include <QCoreApplication>
#include <QDebug>

// Simple YAML parsing: "section:" lines followed by indented "key: value" lines

namespace {

// Drops a trailing "# comment" that is not inside a quoted string
QString stripInlineComment(const QString &line)
{
    bool quoted = false;
    for (int i = 0; i < line.length(); ++i) {
        const QChar c = line.at(i);
        if (c == '"')
            quoted = !quoted;
        else if (c == '#' && !quoted && (i == 0 || line.at(i - 1).isSpace()))
            return line.left(i).trimmed();
    }
    return line;
}

} // namespace

AppConfig& AppConfig::instance()
{
    static AppConfig instance;
    return instance;
}

AppConfig::AppConfig()
{
    resetToDefaults();
}

void AppConfig::resetToDefaults()
{
    m_loadedPath.clear();
    m_sidecarName = "AudioTranscribe";
    m_executablePath.clear();
    m_backendHost = "127.0.0.1";
    m_fallbackPort = PortAllocator::DefaultFallbackPort;
    m_modeVariable = "TAURI";
    m_modeValue = "1";
    m_portVariable.clear();
    m_singleInstance = false;
    m_healthIntervalMs = 1000;
    m_healthMaxAttempts = 30;
    m_openBrowser = false;
    m_debugLogging = false;
}

bool AppConfig::load(const QString &configPath)
{
    resetToDefaults();

    QString path = configPath;
    if (path.isEmpty()) {
        // Default config location: ../config/app.yaml relative to executable
        QDir appDir(QCoreApplication::applicationDirPath());
        appDir.cdUp();
        path = appDir.filePath("config/app.yaml");
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Could not open config file:" << path;
        qWarning() << "Using default configuration.";
        return false;
    }

    QString currentSection;
    while (!file.atEnd()) {
        const QString rawLine = QString::fromUtf8(file.readLine());
        const QString line = stripInlineComment(rawLine.trimmed());

        // Skip comments and empty lines
        if (line.isEmpty())
            continue;

        // Check for section (no leading spaces, ends with :)
        if (!rawLine.startsWith(' ') && !rawLine.startsWith('\t') && line.endsWith(':') && !line.contains('"')) {
            currentSection = line.left(line.length() - 1);
            continue;
        }

        // Parse key: value
        int colonPos = line.indexOf(':');
        if (colonPos <= 0)
            continue;

        QString key = line.left(colonPos).trimmed();
        QString value = line.mid(colonPos + 1).trimmed();

        // Remove quotes if present
        if (value.length() >= 2 && value.startsWith('"') && value.endsWith('"')) {
            value = value.mid(1, value.length() - 2);
        }

        if (currentSection == "backend") {
            if (key == "sidecar_name") m_sidecarName = value;
            else if (key == "executable_path") m_executablePath = value;
            else if (key == "host") m_backendHost = value;
            else if (key == "fallback_port") {
                bool ok = false;
                uint port = value.toUInt(&ok);
                if (ok && port > 0 && port <= 65535)
                    m_fallbackPort = static_cast<quint16>(port);
                else
                    qWarning() << "Ignoring invalid fallback_port:" << value;
            }
            else if (key == "mode_variable" || key == "mode_value") {
                // The supervised-mode flag is always injected
                if (value.isEmpty())
                    qWarning() << "Ignoring invalid" << key << ": empty value";
                else if (key == "mode_variable")
                    m_modeVariable = value;
                else
                    m_modeValue = value;
            }
            else if (key == "port_variable") m_portVariable = value;
            else if (key == "single_instance") m_singleInstance = (value == "true");
        }
        else if (currentSection == "health") {
            if (key == "interval_ms") m_healthIntervalMs = qMax(100, value.toInt());
            else if (key == "max_attempts") m_healthMaxAttempts = qMax(0, value.toInt());
        }
        else if (currentSection == "ui") {
            if (key == "open_browser") m_openBrowser = (value == "true");
        }
        else if (currentSection == "logging") {
            if (key == "debug") m_debugLogging = (value == "true");
        }
    }

    file.close();
    m_loadedPath = path;
    qDebug() << "Configuration loaded from:" << path;
    return true;
}

QString AppConfig::backendBaseUrl(quint16 port) const
{
    return QString("http://%1:%2").arg(m_backendHost).arg(port);
}

LaunchSettings AppConfig::launchSettings() const
{
    LaunchSettings settings;
    settings.sidecarName = m_sidecarName;
    settings.modeVariable = m_modeVariable;
    settings.modeValue = m_modeValue;
    settings.portVariable = m_portVariable;
    settings.singleInstance = m_singleInstance;
    return settings;
}
