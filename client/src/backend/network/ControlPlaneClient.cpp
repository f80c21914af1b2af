#include "backend/network/ControlPlaneClient.h"
#include "backend/network/ApplianceEndpoints.h"
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QHttpMultiPart>
#include <QHttpPart>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSslConfiguration>
#include <QSslSocket>
#include <QPointer>
#include <QDebug>

namespace {
    const QByteArray FORM_CONTENT_TYPE = "application/x-www-form-urlencoded";
    const QByteArray JSON_CONTENT_TYPE = "application/json";
    const QByteArray OCTET_CONTENT_TYPE = "application/octet-stream";

    QString boolParam(bool value) {
        return value ? QStringLiteral("true") : QStringLiteral("false");
    }

    QUrlQuery queryFromMap(const QMap<QString, QString>& params) {
        QUrlQuery query;
        for (auto it = params.constBegin(); it != params.constEnd(); ++it) {
            query.addQueryItem(it.key(), it.value());
        }
        return query;
    }

    QHttpPart formField(const QString& name, const QByteArray& value) {
        QHttpPart part;
        part.setHeader(QNetworkRequest::ContentDispositionHeader, QString("form-data; name=\"%1\"").arg(name));
        part.setBody(value);
        return part;
    }
}

ControlPlaneClient::ControlPlaneClient(const QString& host, int port, const QString& authToken,
                                       QNetworkAccessManager* network, QObject* parent)
    : QObject(parent)
    , m_authToken(authToken)
    , m_network(network ? network : new QNetworkAccessManager(this))
{
    m_baseUrl.setScheme("https");
    m_baseUrl.setHost(host);
    m_baseUrl.setPort(port);
}

ControlPlaneClient::~ControlPlaneClient() = default;

void ControlPlaneClient::setScheme(const QString& scheme) {
    m_baseUrl.setScheme(scheme);
}

// ---------------------------------------------------------------------------
// Transport

void ControlPlaneClient::sendRequest(const QByteArray& verb, const QString& path, const QUrlQuery& query,
                                     const QByteArray& body, const QByteArray& contentType, int timeoutMs,
                                     RawHandler handler, QHttpMultiPart* multipart) {
    QUrl url = m_baseUrl;
    url.setPath(path.startsWith('/') ? path : QStringLiteral("/") + path);
    if (!query.isEmpty()) {
        url.setQuery(query);
    }

    QNetworkRequest request(url);
    request.setTransferTimeout(timeoutMs);
    // Redirect statuses are reported to the caller, never followed
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::ManualRedirectPolicy);
    if (!contentType.isEmpty()) {
        request.setHeader(QNetworkRequest::ContentTypeHeader, contentType);
    }
    if (!m_authToken.isEmpty()) {
        request.setRawHeader("Cookie", ApplianceEndpoints::authCookie(m_authToken));
    }
    if (url.scheme() == "https") {
        QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
        ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
        request.setSslConfiguration(ssl);
    }

    QNetworkReply* reply = nullptr;
    if (multipart) {
        reply = m_network->post(request, multipart);
        multipart->setParent(reply);
    } else if (verb == "GET") {
        reply = m_network->get(request);
    } else {
        reply = m_network->sendCustomRequest(request, verb, body);
    }

    connect(reply, &QNetworkReply::sslErrors, reply, [reply](const QList<QSslError>&) {
        reply->ignoreSslErrors();
    });

    QPointer<ControlPlaneClient> self(this);
    connect(reply, &QNetworkReply::finished, this, [self, reply, handler, path]() {
        reply->deleteLater();
        if (!self) return;
        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        const QByteArray data = reply->readAll();
        if (status == 0) {
            QString message = reply->errorString();
            if (reply->error() == QNetworkReply::OperationCanceledError) {
                message = QString("Request to %1 timed out").arg(path);
            }
            handler(KvmError::connectionFailed(message), 0, data);
            return;
        }
        handler(KvmError(), status, data);
    });
}

void ControlPlaneClient::sendChecked(const QByteArray& verb, const QString& path, const QUrlQuery& query,
                                     const QByteArray& body, const QByteArray& contentType, RawHandler handler,
                                     QHttpMultiPart* multipart) {
    sendRequest(verb, path, query, body, contentType, REQUEST_TIMEOUT_MS,
        [handler, verb, path](const KvmError& error, int status, const QByteArray& data) {
            if (error.isError()) {
                qWarning() << "ControlPlaneClient:" << verb << path << "failed:" << error.message();
                handler(error, status, data);
                return;
            }
            if (status < 200 || status > 299) {
                const KvmError httpError = errorForStatus(status, data);
                qWarning() << "ControlPlaneClient:" << verb << path << "->" << status << httpError.message();
                handler(httpError, status, data);
                return;
            }
            handler(KvmError(), status, data);
        }, multipart);
}

void ControlPlaneClient::sendJson(const QByteArray& verb, const QString& path, const QUrlQuery& query,
                                  const QByteArray& body, const QByteArray& contentType, JsonHandler handler) {
    sendChecked(verb, path, query, body, contentType,
        [handler, path](const KvmError& error, int, const QByteArray& data) {
            if (error.isError()) {
                handler(error, QJsonValue());
                return;
            }
            QJsonValue result;
            if (!unwrapEnvelope(data, &result)) {
                handler(KvmError::decodingFailed(QString("Malformed envelope from %1").arg(path)), QJsonValue());
                return;
            }
            handler(KvmError(), result);
        });
}

KvmError ControlPlaneClient::errorForStatus(int status, const QByteArray& body) {
    QString message;
    QJsonValue result;
    if (unwrapEnvelope(body, &result) && result.isObject()) {
        const QJsonObject obj = result.toObject();
        if (obj.value("error_msg").isString()) {
            message = obj.value("error_msg").toString();
        } else if (obj.value("message").isString()) {
            message = obj.value("message").toString();
        }
    }
    if (message.isNull()) {
        message = QString::fromUtf8(body);
    }
    if (status == 401 || status == 403) {
        return KvmError(KvmErrorKind::AuthenticationFailed, message, status);
    }
    return KvmError::httpError(status, message);
}

bool ControlPlaneClient::unwrapEnvelope(const QByteArray& body, QJsonValue* result) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return false;
    }
    const QJsonObject obj = doc.object();
    if (!obj.value("ok").isBool() || !obj.contains("result")) {
        return false;
    }
    if (result) *result = obj.value("result");
    return true;
}

template<typename T>
void ControlPlaneClient::getTyped(const QString& path, const QUrlQuery& query, ResultCallback<T> callback) {
    sendJson("GET", path, query, QByteArray(), QByteArray(),
        [callback, path](const KvmError& error, const QJsonValue& result) {
            if (error.isError()) {
                callback(error, T());
                return;
            }
            bool ok = false;
            const T value = T::fromJson(result.toObject(), &ok);
            if (!ok) {
                callback(KvmError::decodingFailed(QString("Unexpected payload from %1").arg(path)), T());
                return;
            }
            callback(KvmError(), value);
        });
}

void ControlPlaneClient::postForm(const QString& path, const QUrlQuery& query, ErrorCallback callback) {
    sendJson("POST", path, query, QByteArray(), FORM_CONTENT_TYPE,
        [callback](const KvmError& error, const QJsonValue&) { callback(error); });
}

void ControlPlaneClient::postEmpty(const QString& path, ErrorCallback callback) {
    sendJson("POST", path, QUrlQuery(), QByteArray(), QByteArray(),
        [callback](const KvmError& error, const QJsonValue&) { callback(error); });
}

void ControlPlaneClient::getEmpty(const QString& path, const QUrlQuery& query, ErrorCallback callback) {
    sendJson("GET", path, query, QByteArray(), QByteArray(),
        [callback](const KvmError& error, const QJsonValue&) { callback(error); });
}

void ControlPlaneClient::getObject(const QString& path, ResultCallback<QJsonObject> callback) {
    sendJson("GET", path, QUrlQuery(), QByteArray(), QByteArray(),
        [callback](const KvmError& error, const QJsonValue& result) {
            callback(error, result.toObject());
        });
}

// ---------------------------------------------------------------------------
// Auth and init

void ControlPlaneClient::isInited(ResultCallback<InitStatus> callback) {
    getTyped<InitStatus>("api/init/is_inited", QUrlQuery(), callback);
}

void ControlPlaneClient::checkAuth(ErrorCallback callback) {
    getEmpty("api/auth/check", QUrlQuery(), callback);
}

void ControlPlaneClient::login(const QString& user, const QString& password, ResultCallback<QString> callback) {
    auto* multipart = new QHttpMultiPart(QHttpMultiPart::FormDataType);
    multipart->append(formField("user", user.toUtf8()));
    multipart->append(formField("passwd", password.toUtf8()));

    QPointer<ControlPlaneClient> self(this);
    sendChecked("POST", "api/auth/login", QUrlQuery(), QByteArray(), QByteArray(),
        [self, callback](const KvmError& error, int, const QByteArray& data) {
            if (error.isError()) {
                callback(error, QString());
                return;
            }
            QJsonValue result;
            const QString token = unwrapEnvelope(data, &result) ? result.toObject().value("token").toString() : QString();
            if (token.isEmpty()) {
                callback(KvmError::decodingFailed("Login response carried no token"), QString());
                return;
            }
            if (self) {
                self->m_authToken = token;
                qDebug() << "ControlPlaneClient: Logged in, token" << ApplianceEndpoints::redactToken(token);
            }
            callback(KvmError(), token);
        }, multipart);
}

// ---------------------------------------------------------------------------
// System / streamer

void ControlPlaneClient::getSystemConfig(ResultCallback<SystemConfig> callback) {
    sendJson("GET", "api/system/get_config", QUrlQuery(), QByteArray(), QByteArray(),
        [callback](const KvmError& error, const QJsonValue& result) {
            if (error.isError()) {
                callback(error, SystemConfig());
                return;
            }
            bool ok = false;
            const SystemConfig config = SystemConfig::fromJson(result.toObject().value("config").toObject(), &ok);
            callback(ok ? KvmError() : KvmError::decodingFailed("Unexpected system config payload"), config);
        });
}

void ControlPlaneClient::setSystemConfig(const SystemConfig& config, ResultCallback<SystemConfig> callback) {
    const QByteArray body = QJsonDocument(config.toJson()).toJson(QJsonDocument::Compact);
    sendJson("POST", "api/system/set_config", QUrlQuery(), body, JSON_CONTENT_TYPE,
        [callback](const KvmError& error, const QJsonValue& result) {
            if (error.isError()) {
                callback(error, SystemConfig());
                return;
            }
            bool ok = false;
            const SystemConfig applied = SystemConfig::fromJson(result.toObject().value("config").toObject(), &ok);
            callback(ok ? KvmError() : KvmError::decodingFailed("Unexpected system config payload"), applied);
        });
}

void ControlPlaneClient::getStreamerState(ResultCallback<StreamerState> callback) {
    getTyped<StreamerState>("api/streamer", QUrlQuery(), callback);
}

void ControlPlaneClient::setStreamerParams(const QMap<QString, QString>& params, ErrorCallback callback) {
    postForm("api/streamer/set_params", queryFromMap(params), callback);
}

void ControlPlaneClient::resetStreamer(ErrorCallback callback) {
    postEmpty("api/streamer/reset", callback);
}

void ControlPlaneClient::getTurnCredentials(ResultCallback<TurnCredentials> callback) {
    getTyped<TurnCredentials>("api/turn/get_turn", QUrlQuery(), callback);
}

// ---------------------------------------------------------------------------
// HID one-shot commands

void ControlPlaneClient::getHidState(ResultCallback<QJsonObject> callback) {
    getObject("api/hid", callback);
}

void ControlPlaneClient::setHidParams(const QMap<QString, QString>& params, ErrorCallback callback) {
    postForm("api/hid/set_params", queryFromMap(params), callback);
}

void ControlPlaneClient::setHidConnected(bool connected, ErrorCallback callback) {
    QUrlQuery query;
    query.addQueryItem("connected", boolParam(connected));
    postForm("api/hid/set_connected", query, callback);
}

void ControlPlaneClient::resetHid(ErrorCallback callback) {
    postEmpty("api/hid/reset", callback);
}

void ControlPlaneClient::getHidKeymaps(ResultCallback<HidKeymaps> callback) {
    getTyped<HidKeymaps>("api/hid/keymaps", QUrlQuery(), callback);
}

void ControlPlaneClient::sendHidShortcut(const QStringList& keys, ErrorCallback callback) {
    QUrlQuery query;
    query.addQueryItem("keys", keys.join(','));
    postForm("api/hid/events/send_shortcut", query, callback);
}

void ControlPlaneClient::sendHidKey(const QString& key, std::optional<bool> state, std::optional<bool> finish, ErrorCallback callback) {
    QUrlQuery query;
    query.addQueryItem("key", key);
    if (state) query.addQueryItem("state", boolParam(*state));
    if (finish) query.addQueryItem("finish", boolParam(*finish));
    postForm("api/hid/events/send_key", query, callback);
}

void ControlPlaneClient::sendHidMouseButton(const QString& button, std::optional<bool> state, ErrorCallback callback) {
    QUrlQuery query;
    query.addQueryItem("button", button);
    if (state) query.addQueryItem("state", boolParam(*state));
    postForm("api/hid/events/send_mouse_button", query, callback);
}

void ControlPlaneClient::sendHidMouseMove(int toX, int toY, ErrorCallback callback) {
    QUrlQuery query;
    query.addQueryItem("to_x", QString::number(toX));
    query.addQueryItem("to_y", QString::number(toY));
    postForm("api/hid/events/send_mouse_move", query, callback);
}

void ControlPlaneClient::sendHidMouseRelative(int deltaX, int deltaY, ErrorCallback callback) {
    QUrlQuery query;
    query.addQueryItem("delta_x", QString::number(deltaX));
    query.addQueryItem("delta_y", QString::number(deltaY));
    postForm("api/hid/events/send_mouse_relative", query, callback);
}

void ControlPlaneClient::sendHidMouseWheel(int deltaX, int deltaY, ErrorCallback callback) {
    QUrlQuery query;
    query.addQueryItem("delta_x", QString::number(deltaX));
    query.addQueryItem("delta_y", QString::number(deltaY));
    postForm("api/hid/events/send_mouse_wheel", query, callback);
}

// ---------------------------------------------------------------------------
// EDID

QString ControlPlaneClient::edidFromBody(const QByteArray& body) {
    QJsonValue result;
    if (unwrapEnvelope(body, &result)) {
        if (result.isString()) return result.toString();
        const QJsonObject obj = result.toObject();
        if (obj.value("edid").isString()) return obj.value("edid").toString();
        if (obj.value("EDID").isString()) return obj.value("EDID").toString();
    }
    return QString::fromUtf8(body);
}

void ControlPlaneClient::getEdid(ResultCallback<QString> callback) {
    sendChecked("GET", "api/upgrade/get_edid", QUrlQuery(), QByteArray(), QByteArray(),
        [callback](const KvmError& error, int, const QByteArray& data) {
            callback(error, error.isError() ? QString() : edidFromBody(data));
        });
}

void ControlPlaneClient::setEdid(const QString& edidHex, ErrorCallback callback) {
    auto* multipart = new QHttpMultiPart(QHttpMultiPart::FormDataType);
    multipart->append(formField("edid", edidHex.toUtf8()));
    sendChecked("POST", "api/upgrade/edid", QUrlQuery(), QByteArray(), QByteArray(),
        [callback](const KvmError& error, int, const QByteArray&) { callback(error); }, multipart);
}

// ---------------------------------------------------------------------------
// Mass storage

void ControlPlaneClient::getMsdState(ResultCallback<QJsonObject> callback) {
    getObject("api/msd", callback);
}

void ControlPlaneClient::setMsdParams(std::optional<QString> image, std::optional<bool> cdrom, std::optional<bool> rw, ErrorCallback callback) {
    QUrlQuery query;
    if (image) query.addQueryItem("image", *image);
    if (cdrom) query.addQueryItem("cdrom", boolParam(*cdrom));
    if (rw) query.addQueryItem("rw", boolParam(*rw));
    postForm("api/msd/set_params", query, callback);
}

void ControlPlaneClient::setMsdConnected(bool connected, ErrorCallback callback) {
    QUrlQuery query;
    query.addQueryItem("connected", boolParam(connected));
    postForm("api/msd/set_connected", query, callback);
}

void ControlPlaneClient::msdPartitionShow(ResultCallback<MsdPartitionMap> callback) {
    sendJson("GET", "api/msd/partition_show", QUrlQuery(), QByteArray(), QByteArray(),
        [callback](const KvmError& error, const QJsonValue& result) {
            if (error.isError()) {
                callback(error, MsdPartitionMap());
                return;
            }
            bool ok = false;
            const MsdPartitionMap devices = msdPartitionsFromJson(result.toObject(), &ok);
            callback(ok ? KvmError() : KvmError::decodingFailed("Unexpected partition payload"), devices);
        });
}

void ControlPlaneClient::msdPartitionConnect(ErrorCallback callback) {
    getEmpty("api/msd/partition_connect", QUrlQuery(), callback);
}

void ControlPlaneClient::msdPartitionDisconnect(ErrorCallback callback) {
    getEmpty("api/msd/partition_disconnect", QUrlQuery(), callback);
}

void ControlPlaneClient::msdPartitionFormat(const QString& path, ErrorCallback callback) {
    QUrlQuery query;
    query.addQueryItem("path", path);
    getEmpty("api/msd/partition_format", query, callback);
}

void ControlPlaneClient::msdRead(const QString& image, std::optional<QString> compress, ResultCallback<QByteArray> callback) {
    QUrlQuery query;
    query.addQueryItem("image", image);
    if (compress) query.addQueryItem("compress", *compress);
    sendChecked("GET", "api/msd/read", query, QByteArray(), QByteArray(),
        [callback](const KvmError& error, int, const QByteArray& data) {
            callback(error, error.isError() ? QByteArray() : data);
        });
}

void ControlPlaneClient::msdWrite(const QString& image, const QByteArray& data, std::optional<QString> prefix,
                                  std::optional<bool> removeIncomplete, ResultCallback<MsdWriteResult> callback) {
    QUrlQuery query;
    query.addQueryItem("image", image);
    if (prefix) query.addQueryItem("prefix", *prefix);
    if (removeIncomplete) query.addQueryItem("remove_incomplete", boolParam(*removeIncomplete));
    sendJson("POST", "api/msd/write", query, data, OCTET_CONTENT_TYPE,
        [callback](const KvmError& error, const QJsonValue& result) {
            if (error.isError()) {
                callback(error, MsdWriteResult());
                return;
            }
            bool ok = false;
            const MsdWriteResult written = MsdWriteResult::fromJson(result.toObject(), &ok);
            callback(ok ? KvmError() : KvmError::decodingFailed("Unexpected write payload"), written);
        });
}

QList<MsdWriteResult> ControlPlaneClient::writeResultsFromLines(const QByteArray& body) {
    QList<MsdWriteResult> results;
    const QList<QByteArray> lines = body.split('\n');
    for (const QByteArray& raw : lines) {
        const QByteArray line = raw.trimmed();
        if (line.isEmpty()) continue;
        QJsonValue wrapped;
        bool ok = false;
        MsdWriteResult r;
        if (unwrapEnvelope(line, &wrapped)) {
            r = MsdWriteResult::fromJson(wrapped.toObject(), &ok);
        } else {
            r = MsdWriteResult::fromJson(QJsonDocument::fromJson(line).object(), &ok);
        }
        if (ok) results.append(r);
    }
    return results;
}

void ControlPlaneClient::msdWriteRemote(const QUrl& url, std::optional<QString> image, std::optional<QString> prefix,
                                        std::optional<bool> insecure, std::optional<double> timeoutSeconds,
                                        std::optional<bool> removeIncomplete, ResultCallback<QList<MsdWriteResult>> callback) {
    QUrlQuery query;
    query.addQueryItem("url", url.toString(QUrl::FullyEncoded));
    if (image) query.addQueryItem("image", *image);
    if (prefix) query.addQueryItem("prefix", *prefix);
    if (insecure) query.addQueryItem("insecure", boolParam(*insecure));
    if (timeoutSeconds) query.addQueryItem("timeout", QString::number(*timeoutSeconds));
    if (removeIncomplete) query.addQueryItem("remove_incomplete", boolParam(*removeIncomplete));
    sendChecked("POST", "api/msd/write_remote", query, QByteArray(), FORM_CONTENT_TYPE,
        [callback](const KvmError& error, int, const QByteArray& data) {
            callback(error, error.isError() ? QList<MsdWriteResult>() : writeResultsFromLines(data));
        });
}

void ControlPlaneClient::msdRemove(const QString& image, ErrorCallback callback) {
    QUrlQuery query;
    query.addQueryItem("image", image);
    postForm("api/msd/remove", query, callback);
}

void ControlPlaneClient::msdReset(ErrorCallback callback) {
    postEmpty("api/msd/reset", callback);
}

// ---------------------------------------------------------------------------
// ATX power

void ControlPlaneClient::getAtxState(ResultCallback<QJsonObject> callback) {
    getObject("api/atx", callback);
}

void ControlPlaneClient::atxPower(AtxPowerAction action, std::optional<bool> wait, ErrorCallback callback) {
    QUrlQuery query;
    query.addQueryItem("action", atxPowerActionToString(action));
    if (wait) query.addQueryItem("wait", boolParam(*wait));
    postForm("api/atx/power", query, callback);
}

void ControlPlaneClient::atxClick(AtxButton button, std::optional<bool> wait, ErrorCallback callback) {
    QUrlQuery query;
    query.addQueryItem("button", atxButtonToString(button));
    if (wait) query.addQueryItem("wait", boolParam(*wait));
    postForm("api/atx/click", query, callback);
}

// ---------------------------------------------------------------------------
// Discovery

void ControlPlaneClient::probe(const QString& path, std::function<void(const KvmError& error, int status, const QByteArray& body)> callback) {
    sendRequest("GET", path, QUrlQuery(), QByteArray(), QByteArray(), PROBE_TIMEOUT_MS, callback);
}
