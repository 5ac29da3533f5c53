#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QLabel>
#include <QTimer>

class BackendClient;
class BackendLauncher;
class QPushButton;

struct HealthCheckResult;
struct BackendStatusResult;

/**
 * @brief Main window of the Audio Transcribe shell.
 *
 * Starts the backend once at startup, shows where it listens and polls it
 * until it answers.
 */
class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(BackendLauncher *launcher, QWidget *parent = nullptr);
    ~MainWindow();

private slots:
    void startBackend();
    void openInBrowser();
    void pollHealth();

    // Backend responses
    void onHealthCheckCompleted(const HealthCheckResult &result);
    void onStatusCompleted(const BackendStatusResult &result);

    void showAbout();

private:
    void setupUi();
    void setupConnections();
    void setBackendState(const QString &text, const QString &color);
    void showError(const QString &title, const QString &message);

    BackendLauncher *m_launcher;
    BackendClient *m_backendClient;

    QLabel *m_endpointLabel;
    QLabel *m_backendStatusLabel;
    QLabel *m_captureLabel;
    QPushButton *m_btnStart;
    QPushButton *m_btnOpenBrowser;

    QTimer *m_healthTimer;
    QTimer *m_statusTimer;
    int m_healthAttempts;
    quint16 m_port;
    bool m_online;
};

#endif // MAINWINDOW_H
