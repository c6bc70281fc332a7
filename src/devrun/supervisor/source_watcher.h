#pragma once

#include <QDateTime>
#include <QFileSystemWatcher>
#include <QHash>
#include <QObject>
#include <QStringList>

#include "devrun/devrun_export.h"

namespace devrun {

/**
 * 递归源码树监视
 *
 * QFileSystemWatcher 本身不递归：对每个未忽略的子目录单独 addPath，
 * 目录变化时重新扫描并与快照比较，找出新增、删除、修改的文件。
 * 编辑器的原子保存（写临时文件再 rename）会让文件从监视列表中消失，
 * 这里在 fileChanged 时重新加入。
 */
class DEVRUN_API SourceWatcher : public QObject {
    Q_OBJECT
public:
    SourceWatcher(const QString& rootDir,
                  const QStringList& ignoreNames,
                  const QStringList& suffixes,
                  QObject* parent = nullptr);

    bool start(QString& error);
    void stop();

    bool isWatching() const { return m_watching; }
    QStringList watchedDirectories() const { return m_watcher.directories(); }
    QStringList watchedFiles() const { return m_watcher.files(); }

    /// 路径中任一组成部分在忽略列表中
    bool isIgnored(const QString& path) const;
    /// 后缀过滤；列表为空时所有文件都相关
    bool isRelevant(const QString& filePath) const;

signals:
    void changed(const QString& path);

private:
    using Snapshot = QHash<QString, QDateTime>;

    void onDirectoryChanged(const QString& dir);
    void onFileChanged(const QString& path);
    void watchTree(const QString& dir, bool emitNewFiles);
    Snapshot scanFiles(const QString& dir) const;
    void addPaths(const QStringList& paths);

    QString m_root;
    QStringList m_ignoreNames;
    QStringList m_suffixes;
    QFileSystemWatcher m_watcher;
    QHash<QString, Snapshot> m_snapshots;   // 目录 → 相关文件及修改时间
    bool m_watching = false;
};

} // namespace devrun
