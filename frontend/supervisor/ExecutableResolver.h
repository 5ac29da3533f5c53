#ifndef EXECUTABLERESOLVER_H
#define EXECUTABLERESOLVER_H

#include <QString>
#include <QStringList>

/**
 * @brief Maps the logical name of a bundled worker to an executable path.
 *
 * The supervisor only ever sees logical names; where the packaging layer
 * puts the binary is this class's business.
 */
class ExecutableResolver
{
public:
    virtual ~ExecutableResolver() = default;

    // Returns the absolute path, or an empty string with errorMsg set
    virtual QString resolve(const QString &name, QString &errorMsg) const = 0;
};

/**
 * @brief Finds a sidecar binary shipped next to the shell.
 *
 * Search order, relative to the base directory:
 * - <name>
 * - <name>/<name>      (one-folder bundle)
 * - binaries/<name>
 *
 * The platform executable suffix is appended where there is one.
 */
class SidecarResolver : public ExecutableResolver
{
public:
    // Empty baseDir means the application directory
    explicit SidecarResolver(const QString &baseDir = QString());

    QString resolve(const QString &name, QString &errorMsg) const override;

    QString baseDir() const;
    QStringList candidatePaths(const QString &name) const;

private:
    QString m_baseDir;
};

/**
 * @brief Resolves every name to one configured path.
 */
class ExplicitPathResolver : public ExecutableResolver
{
public:
    explicit ExplicitPathResolver(const QString &path);

    QString resolve(const QString &name, QString &errorMsg) const override;

private:
    QString m_path;
};

#endif // EXECUTABLERESOLVER_H
