#ifndef JANUSTRANSACTIONREGISTRY_H
#define JANUSTRANSACTIONREGISTRY_H

#include <QHash>
#include <QJsonObject>
#include <QString>
#include <functional>
#include "backend/domain/models/KvmError.h"

/**
 * @brief Pending signaling RPCs keyed by transaction id
 *
 * Each waiter fires exactly once: either with the first inbound message
 * carrying its id, or with the error passed to failAll(). The entry is
 * removed before the completion runs, so a completion may register new
 * transactions.
 */
class JanusTransactionRegistry {
public:
    using Completion = std::function<void(const KvmError& error, const QJsonObject& response)>;

    // 32 hex characters, never reused within this registry
    QString newTransactionId();

    // Returns false when the id is already pending
    bool registerWaiter(const QString& transactionId, Completion completion);
    QString registerWaiter(Completion completion);

    // True when a pending waiter was resolved
    bool resolve(const QString& transactionId, const QJsonObject& response);
    // Number of waiters failed
    int failAll(const KvmError& error);

    bool isPending(const QString& transactionId) const { return m_pending.contains(transactionId); }
    int pendingCount() const { return m_pending.size(); }

private:
    QHash<QString, Completion> m_pending;
};

#endif // JANUSTRANSACTIONREGISTRY_H
