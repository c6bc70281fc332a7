#include "runtime_state.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>

namespace devrun {

RuntimeState RuntimeState::load(const QString& filePath, QString& error) {
    RuntimeState state;
    error.clear();

    if (!QFileInfo::exists(filePath)) {
        return state;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        error = "cannot open runtime state file: " + filePath;
        return state;
    }

    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        error = "runtime state file is corrupt: " + filePath;
        return state;
    }

    const QJsonObject obj = doc.object();
    state.present = true;
    state.initialized = obj.value("initialized").toBool(false);
    state.resetCount = obj.value("resetCount").toInt(0);
    state.lastResetError = obj.value("lastResetError").toString();
    const QString resetAt = obj.value("lastResetAt").toString();
    if (!resetAt.isEmpty()) {
        state.lastResetAt = QDateTime::fromString(resetAt, Qt::ISODateWithMs);
    }
    return state;
}

bool RuntimeState::save(const QString& filePath, QString& error) const {
    error.clear();
    if (!QDir().mkpath(QFileInfo(filePath).absolutePath())) {
        error = "cannot create state directory for " + filePath;
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        error = "cannot write runtime state file: " + filePath;
        return false;
    }
    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        error = "cannot commit runtime state file: " + file.errorString();
        return false;
    }
    return true;
}

QJsonObject RuntimeState::toJson() const {
    QJsonObject obj;
    obj["initialized"] = initialized;
    obj["resetCount"] = resetCount;
    if (lastResetAt.isValid()) {
        obj["lastResetAt"] = lastResetAt.toString(Qt::ISODateWithMs);
    }
    if (!lastResetError.isEmpty()) {
        obj["lastResetError"] = lastResetError;
    }
    return obj;
}

} // namespace devrun
