#include "ExecutableResolver.h"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>

namespace {

QString executableFileName(const QString &name)
{
#ifdef Q_OS_WIN
    if (!name.endsWith(".exe", Qt::CaseInsensitive))
        return name + ".exe";
#endif
    return name;
}

bool checkExecutable(const QString &path, QString &errorMsg)
{
    QFileInfo info(path);
    if (!info.exists()) {
        errorMsg = QString("Executable not found: %1").arg(path);
        return false;
    }
    if (!info.isFile() || !info.isExecutable()) {
        errorMsg = QString("Not an executable file: %1").arg(path);
        return false;
    }
    return true;
}

} // namespace

// ============================================================================
// SidecarResolver
// ============================================================================

SidecarResolver::SidecarResolver(const QString &baseDir)
    : m_baseDir(baseDir)
{
}

QString SidecarResolver::baseDir() const
{
    if (!m_baseDir.isEmpty())
        return m_baseDir;
    return QCoreApplication::applicationDirPath();
}

QStringList SidecarResolver::candidatePaths(const QString &name) const
{
    QDir dir(baseDir());
    const QString fileName = executableFileName(name);

    QStringList paths;
    paths << dir.filePath(fileName)
          << dir.filePath(name + "/" + fileName)
          << dir.filePath("binaries/" + fileName);
    return paths;
}

QString SidecarResolver::resolve(const QString &name, QString &errorMsg) const
{
    if (name.isEmpty()) {
        errorMsg = "Empty sidecar name";
        return QString();
    }

    const QStringList paths = candidatePaths(name);
    for (const QString &path : paths) {
        QFileInfo info(path);
        if (info.isFile() && info.isExecutable())
            return info.absoluteFilePath();
    }

    errorMsg = QString("Sidecar '%1' not found in %2 (searched: %3)")
                   .arg(name, QDir::toNativeSeparators(baseDir()), paths.join(", "));
    return QString();
}

// ============================================================================
// ExplicitPathResolver
// ============================================================================

ExplicitPathResolver::ExplicitPathResolver(const QString &path)
    : m_path(path)
{
}

QString ExplicitPathResolver::resolve(const QString &name, QString &errorMsg) const
{
    Q_UNUSED(name);

    if (!checkExecutable(m_path, errorMsg))
        return QString();
    return QFileInfo(m_path).absoluteFilePath();
}
