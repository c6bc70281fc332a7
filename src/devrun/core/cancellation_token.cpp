#include "cancellation_token.h"

namespace devrun {

CancellationToken::CancellationToken(QObject* parent)
    : QObject(parent) {
}

void CancellationToken::cancel(const QString& reason) {
    if (m_cancelled) {
        return;
    }
    m_cancelled = true;
    m_reason = reason.isEmpty() ? QStringLiteral("cancelled") : reason;
    emit cancelled(m_reason);
}

} // namespace devrun
