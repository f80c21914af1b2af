#ifndef REACHABILITYPROBE_H
#define REACHABILITYPROBE_H

#include <QObject>
#include <QString>
#include <functional>

/**
 * @brief TCP connect check run before any control-plane traffic
 */
class IReachabilityProbe {
public:
    using Callback = std::function<void(bool reachable, const QString& error)>;

    static constexpr int DEFAULT_TIMEOUT_MS = 5000;

    virtual ~IReachabilityProbe() = default;
    virtual void probe(const QString& host, int port, int timeoutMs, Callback callback) = 0;
};

class TcpReachabilityProbe : public QObject, public IReachabilityProbe {
    Q_OBJECT

public:
    explicit TcpReachabilityProbe(QObject* parent = nullptr);
    ~TcpReachabilityProbe() override = default;

    void probe(const QString& host, int port, int timeoutMs, Callback callback) override;
};

#endif // REACHABILITYPROBE_H
