#ifndef ICONTROLPLANE_H
#define ICONTROLPLANE_H

#include <QString>
#include <functional>
#include "backend/domain/models/KvmError.h"

using ErrorCallback = std::function<void(const KvmError& error)>;

template<typename T>
using ResultCallback = std::function<void(const KvmError& error, const T& result)>;

/**
 * @brief Control-plane operations the session lifecycle depends on
 *
 * Every call is a single asynchronous request/response exchange; the
 * callback fires exactly once. A successful login() replaces the token
 * attached to all later calls on the same instance.
 */
class IControlPlane {
public:
    virtual ~IControlPlane() = default;

    virtual QString authToken() const = 0;
    virtual void setAuthToken(const QString& token) = 0;

    // AuthenticationFailed when the appliance rejects the current cookie
    virtual void checkAuth(ErrorCallback callback) = 0;
    virtual void login(const QString& user, const QString& password, ResultCallback<QString> callback) = 0;
    virtual void setHidConnected(bool connected, ErrorCallback callback) = 0;
    virtual void setEdid(const QString& edidHex, ErrorCallback callback) = 0;
};

#endif // ICONTROLPLANE_H
