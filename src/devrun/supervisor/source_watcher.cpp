#include "source_watcher.h"

#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>

namespace devrun {

Q_LOGGING_CATEGORY(lcWatch, "devrun.reload")

SourceWatcher::SourceWatcher(const QString& rootDir,
                             const QStringList& ignoreNames,
                             const QStringList& suffixes,
                             QObject* parent)
    : QObject(parent)
    , m_root(QDir(rootDir).absolutePath())
    , m_ignoreNames(ignoreNames)
    , m_suffixes(suffixes) {
    connect(&m_watcher, &QFileSystemWatcher::directoryChanged,
            this, &SourceWatcher::onDirectoryChanged);
    connect(&m_watcher, &QFileSystemWatcher::fileChanged,
            this, &SourceWatcher::onFileChanged);
}

bool SourceWatcher::start(QString& error) {
    error.clear();
    if (m_watching) {
        return true;
    }
    if (!QFileInfo(m_root).isDir()) {
        error = QStringLiteral("watch root is not a directory: %1").arg(m_root);
        return false;
    }
    watchTree(m_root, false);
    if (m_watcher.directories().isEmpty()) {
        error = QStringLiteral("failed to watch %1").arg(m_root);
        return false;
    }
    m_watching = true;
    qCInfo(lcWatch, "watching %lld directories, %lld files under %s",
           static_cast<long long>(m_watcher.directories().size()),
           static_cast<long long>(m_watcher.files().size()),
           qUtf8Printable(m_root));
    return true;
}

void SourceWatcher::stop() {
    if (!m_watcher.directories().isEmpty()) {
        m_watcher.removePaths(m_watcher.directories());
    }
    if (!m_watcher.files().isEmpty()) {
        m_watcher.removePaths(m_watcher.files());
    }
    m_snapshots.clear();
    m_watching = false;
}

bool SourceWatcher::isIgnored(const QString& path) const {
    const QString relative = QDir(m_root).relativeFilePath(path);
    const QStringList parts = relative.split('/', Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        if (m_ignoreNames.contains(part)) {
            return true;
        }
    }
    return false;
}

bool SourceWatcher::isRelevant(const QString& filePath) const {
    if (m_suffixes.isEmpty()) {
        return true;
    }
    return m_suffixes.contains(QFileInfo(filePath).suffix(), Qt::CaseInsensitive);
}

void SourceWatcher::onDirectoryChanged(const QString& dir) {
    if (!m_snapshots.contains(dir)) {
        return;
    }
    if (!QFileInfo(dir).isDir()) {
        // 目录被删除：其中所有文件都算变更
        const Snapshot old = m_snapshots.take(dir);
        for (auto it = old.constBegin(); it != old.constEnd(); ++it) {
            emit changed(it.key());
        }
        return;
    }

    const Snapshot old = m_snapshots.value(dir);
    const Snapshot now = scanFiles(dir);
    m_snapshots.insert(dir, now);

    QStringList newFiles;
    for (auto it = now.constBegin(); it != now.constEnd(); ++it) {
        const auto prev = old.constFind(it.key());
        if (prev == old.constEnd()) {
            newFiles.append(it.key());
            emit changed(it.key());
        } else if (prev.value() != it.value()) {
            emit changed(it.key());
        }
    }
    for (auto it = old.constBegin(); it != old.constEnd(); ++it) {
        if (!now.contains(it.key())) {
            emit changed(it.key());
        }
    }
    addPaths(newFiles);

    // 新建的子目录
    const QFileInfoList subdirs = QDir(dir).entryInfoList(
        QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden | QDir::NoSymLinks);
    for (const QFileInfo& info : subdirs) {
        const QString path = info.absoluteFilePath();
        if (!m_snapshots.contains(path) && !isIgnored(path)) {
            watchTree(path, true);
        }
    }
}

void SourceWatcher::onFileChanged(const QString& path) {
    if (QFileInfo::exists(path) && !m_watcher.files().contains(path)) {
        addPaths({path});
    }
    const QString dir = QFileInfo(path).absolutePath();
    auto snapshot = m_snapshots.find(dir);
    if (snapshot != m_snapshots.end()) {
        if (QFileInfo::exists(path)) {
            snapshot->insert(path, QFileInfo(path).lastModified());
        } else {
            snapshot->remove(path);
        }
    }
    emit changed(path);
}

void SourceWatcher::watchTree(const QString& dir, bool emitNewFiles) {
    if (isIgnored(dir) && dir != m_root) {
        return;
    }
    const Snapshot files = scanFiles(dir);
    m_snapshots.insert(dir, files);

    QStringList paths{dir};
    for (auto it = files.constBegin(); it != files.constEnd(); ++it) {
        paths.append(it.key());
        if (emitNewFiles) {
            emit changed(it.key());
        }
    }
    addPaths(paths);

    const QFileInfoList subdirs = QDir(dir).entryInfoList(
        QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden | QDir::NoSymLinks);
    for (const QFileInfo& info : subdirs) {
        const QString path = info.absoluteFilePath();
        if (!isIgnored(path)) {
            watchTree(path, emitNewFiles);
        }
    }
}

SourceWatcher::Snapshot SourceWatcher::scanFiles(const QString& dir) const {
    Snapshot snapshot;
    const QFileInfoList files = QDir(dir).entryInfoList(QDir::Files | QDir::Hidden);
    for (const QFileInfo& info : files) {
        const QString path = info.absoluteFilePath();
        if (isRelevant(path) && !isIgnored(path)) {
            snapshot.insert(path, info.lastModified());
        }
    }
    return snapshot;
}

void SourceWatcher::addPaths(const QStringList& paths) {
    const QStringList watchedFiles = m_watcher.files();
    const QStringList watchedDirs = m_watcher.directories();
    QStringList fresh;
    for (const QString& path : paths) {
        if (!watchedFiles.contains(path) && !watchedDirs.contains(path)) {
            fresh.append(path);
        }
    }
    if (fresh.isEmpty()) {
        return;
    }
    const QStringList failed = m_watcher.addPaths(fresh);
    for (const QString& path : failed) {
        qCWarning(lcWatch, "cannot watch %s", qUtf8Printable(path));
    }
}

} // namespace devrun
