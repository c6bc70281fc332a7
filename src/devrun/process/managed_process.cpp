#include "managed_process.h"

namespace devrun {

QString ProcessSpec::displayCommand() const {
    QStringList parts{program};
    for (const QString& arg : arguments) {
        parts.append(arg.contains(' ') ? '"' + arg + '"' : arg);
    }
    return parts.join(' ');
}

} // namespace devrun
