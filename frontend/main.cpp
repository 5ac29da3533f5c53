#include "mainwindow.h"
#include "app/AppConfig.h"
#include "supervisor/BackendLauncher.h"
#include "supervisor/ExecutableResolver.h"

#include <QApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <memory>

int main(int argc, char *argv[])
{
    QApplication a(argc, argv);
    QApplication::setApplicationName("AudioTranscribe");
    QApplication::setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Audio Transcribe desktop shell");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption(QStringList() << "c" << "config",
                                    "Configuration file (default: ../config/app.yaml).",
                                    "path");
    parser.addOption(configOption);
    parser.process(a);

    AppConfig &config = AppConfig::instance();
    config.load(parser.value(configOption));

    // QT_LOGGING_RULES still takes precedence over this
    QLoggingCategory::setFilterRules(config.debugLogging() ? "*.debug=true" : "*.debug=false");

    std::unique_ptr<ExecutableResolver> resolver;
    if (!config.executablePath().isEmpty())
        resolver.reset(new ExplicitPathResolver(config.executablePath()));
    else
        resolver.reset(new SidecarResolver());

    PortAllocator allocator(config.fallbackPort());
    BackendLauncher launcher(config.launchSettings(), resolver.get(), allocator);

    // Stop the backend when the shell closes
    QObject::connect(&a, &QCoreApplication::aboutToQuit, [&launcher]() {
        launcher.supervisor()->stopAll();
    });

    MainWindow w(&launcher);
    w.show();
    return a.exec();
}
