#include "mainwindow.h"
#include "app/AppConfig.h"
#include "app/BackendClient.h"
#include "supervisor/BackendLauncher.h"

#include <QAction>
#include <QDesktopServices>
#include <QHBoxLayout>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QPushButton>
#include <QStatusBar>
#include <QUrl>
#include <QVBoxLayout>
#include <QDebug>

MainWindow::MainWindow(BackendLauncher *launcher, QWidget *parent)
    : QMainWindow(parent)
    , m_launcher(launcher)
    , m_backendClient(new BackendClient(this))
    , m_endpointLabel(nullptr)
    , m_backendStatusLabel(nullptr)
    , m_captureLabel(nullptr)
    , m_btnStart(nullptr)
    , m_btnOpenBrowser(nullptr)
    , m_healthTimer(new QTimer(this))
    , m_statusTimer(new QTimer(this))
    , m_healthAttempts(0)
    , m_port(0)
    , m_online(false)
{
    setupUi();
    setupConnections();

    m_healthTimer->setInterval(AppConfig::instance().healthIntervalMs());
    m_statusTimer->setInterval(5000);

    // Start the backend once the event loop runs so the window shows first
    QTimer::singleShot(0, this, &MainWindow::startBackend);
}

MainWindow::~MainWindow()
{
}

void MainWindow::setupUi()
{
    setWindowTitle(tr("Audio Transcribe"));
    resize(480, 200);

    QWidget *central = new QWidget(this);
    QVBoxLayout *layout = new QVBoxLayout(central);

    QLabel *title = new QLabel(tr("<h2>Audio Transcribe</h2>"), central);
    m_endpointLabel = new QLabel(tr("Backend endpoint: -"), central);
    m_endpointLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);

    QHBoxLayout *buttons = new QHBoxLayout();
    m_btnStart = new QPushButton(tr("Start Backend"), central);
    m_btnStart->setEnabled(false);
    m_btnOpenBrowser = new QPushButton(tr("Open in Browser"), central);
    m_btnOpenBrowser->setEnabled(false);
    buttons->addWidget(m_btnStart);
    buttons->addWidget(m_btnOpenBrowser);
    buttons->addStretch();

    layout->addWidget(title);
    layout->addWidget(m_endpointLabel);
    layout->addLayout(buttons);
    layout->addStretch();
    setCentralWidget(central);

    QMenu *fileMenu = menuBar()->addMenu(tr("&File"));
    QAction *quitAction = fileMenu->addAction(tr("&Quit"));
    quitAction->setShortcut(QKeySequence::Quit);
    connect(quitAction, &QAction::triggered, this, &QWidget::close);

    QMenu *helpMenu = menuBar()->addMenu(tr("&Help"));
    QAction *aboutAction = helpMenu->addAction(tr("&About"));
    connect(aboutAction, &QAction::triggered, this, &MainWindow::showAbout);

    m_backendStatusLabel = new QLabel(tr("Backend: Starting..."));
    m_captureLabel = new QLabel();
    statusBar()->addWidget(m_backendStatusLabel);
    statusBar()->addPermanentWidget(m_captureLabel);
}

void MainWindow::setupConnections()
{
    connect(m_btnStart, &QPushButton::clicked, this, &MainWindow::startBackend);
    connect(m_btnOpenBrowser, &QPushButton::clicked, this, &MainWindow::openInBrowser);
    connect(m_healthTimer, &QTimer::timeout, this, &MainWindow::pollHealth);
    connect(m_statusTimer, &QTimer::timeout, m_backendClient, &BackendClient::fetchStatus);

    connect(m_backendClient, &BackendClient::healthCheckCompleted, this, &MainWindow::onHealthCheckCompleted);
    connect(m_backendClient, &BackendClient::statusCompleted, this, &MainWindow::onStatusCompleted);
}

// ============================================================================
// Backend Startup
// ============================================================================

void MainWindow::startBackend()
{
    m_btnStart->setEnabled(false);

    StartBackendResult result = m_launcher->startBackend();
    if (!result.success) {
        setBackendState(tr("Backend: Failed to start"), "red");
        m_btnStart->setEnabled(true);
        showError(tr("Backend Error"), result.errorMessage);
        return;
    }

    m_port = result.port;
    m_online = false;
    m_healthAttempts = 0;

    const QString baseUrl = AppConfig::instance().backendBaseUrl(m_port);
    m_backendClient->setBaseUrl(baseUrl);
    m_endpointLabel->setText(tr("Backend endpoint: %1").arg(baseUrl));
    setBackendState(tr("Backend: Waiting for port %1...").arg(m_port), "orange");

    if (AppConfig::instance().healthMaxAttempts() > 0)
        m_healthTimer->start();
}

void MainWindow::pollHealth()
{
    ++m_healthAttempts;
    m_backendClient->healthCheck();
}

void MainWindow::openInBrowser()
{
    if (m_port == 0)
        return;

    const QUrl url(AppConfig::instance().backendBaseUrl(m_port) + "/");
    if (!QDesktopServices::openUrl(url)) {
        showError(tr("Open Failed"), tr("Could not open %1").arg(url.toString()));
    }
}

// ============================================================================
// Backend Responses
// ============================================================================

void MainWindow::onHealthCheckCompleted(const HealthCheckResult &result)
{
    if (m_online)
        return;

    if (result.success) {
        m_online = true;
        m_healthTimer->stop();
        setBackendState(tr("Backend: Online (v%1)").arg(result.version), "green");
        m_btnOpenBrowser->setEnabled(true);

        m_backendClient->fetchStatus();
        m_statusTimer->start();

        if (AppConfig::instance().openBrowser())
            openInBrowser();
        return;
    }

    if (m_healthAttempts >= AppConfig::instance().healthMaxAttempts()) {
        m_healthTimer->stop();
        qWarning() << "Backend did not answer on port" << m_port << ":" << result.errorMessage;
        setBackendState(tr("Backend: Not responding on port %1").arg(m_port), "red");
        m_btnStart->setEnabled(true);
    }
}

void MainWindow::onStatusCompleted(const BackendStatusResult &result)
{
    if (!result.success) {
        m_statusTimer->stop();
        m_online = false;
        m_btnOpenBrowser->setEnabled(false);
        m_btnStart->setEnabled(true);
        m_captureLabel->clear();
        setBackendState(tr("Backend: Offline"), "red");
        return;
    }

    m_captureLabel->setText(tr("Capturing: %1 | Clients: %2 | Queue: %3")
                                .arg(result.isCapturing ? tr("yes") : tr("no"))
                                .arg(result.connectedClients)
                                .arg(result.transcriptionQueueSize));
}

// ============================================================================
// Helpers
// ============================================================================

void MainWindow::setBackendState(const QString &text, const QString &color)
{
    m_backendStatusLabel->setText(text);
    m_backendStatusLabel->setStyleSheet(QString("color: %1;").arg(color));
}

void MainWindow::showError(const QString &title, const QString &message)
{
    QMessageBox::critical(this, title, message);
}

void MainWindow::showAbout()
{
    QMessageBox::about(this, tr("About Audio Transcribe"),
        tr("<h2>Audio Transcribe</h2>"
           "<p>Desktop shell for the Audio Transcribe backend.</p>"
           "<p>Version 0.1.0</p>"
           "<p>The shell starts the bundled backend on a free local port "
           "and shows where it can be reached.</p>"));
}
