#include "backend/network/signaling/JanusTransactionRegistry.h"
#include <QUuid>

QString JanusTransactionRegistry::newTransactionId() {
    QString id;
    do {
        id = QUuid::createUuid().toString(QUuid::Id128);
    } while (m_pending.contains(id));
    return id;
}

bool JanusTransactionRegistry::registerWaiter(const QString& transactionId, Completion completion) {
    if (transactionId.isEmpty() || m_pending.contains(transactionId)) {
        return false;
    }
    m_pending.insert(transactionId, std::move(completion));
    return true;
}

QString JanusTransactionRegistry::registerWaiter(Completion completion) {
    const QString id = newTransactionId();
    m_pending.insert(id, std::move(completion));
    return id;
}

bool JanusTransactionRegistry::resolve(const QString& transactionId, const QJsonObject& response) {
    auto it = m_pending.find(transactionId);
    if (it == m_pending.end()) {
        return false;
    }
    Completion completion = std::move(it.value());
    m_pending.erase(it);
    if (completion) completion(KvmError(), response);
    return true;
}

int JanusTransactionRegistry::failAll(const KvmError& error) {
    QHash<QString, Completion> pending;
    pending.swap(m_pending);
    for (auto it = pending.begin(); it != pending.end(); ++it) {
        if (it.value()) it.value()(error, QJsonObject());
    }
    return pending.size();
}
