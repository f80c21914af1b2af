#ifndef CONTROLPLANECLIENT_H
#define CONTROLPLANECLIENT_H

#include <QObject>
#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QMap>
#include <QStringList>
#include <QUrl>
#include <QUrlQuery>
#include <optional>
#include "backend/domain/models/ApplianceTypes.h"
#include "backend/network/IControlPlane.h"

class QNetworkAccessManager;
class QNetworkReply;
class QHttpMultiPart;

/**
 * @brief HTTPS client for one appliance's REST control plane
 *
 * Responses use the {"ok": bool, "result": ...} envelope. Non-2xx replies
 * become HttpError carrying result.error_msg / result.message when present,
 * otherwise the raw body; 401 and 403 become AuthenticationFailed.
 * Self-signed certificates are accepted.
 */
class ControlPlaneClient : public QObject, public IControlPlane {
    Q_OBJECT

public:
    static constexpr int REQUEST_TIMEOUT_MS = 10000;
    static constexpr int PROBE_TIMEOUT_MS = 3000;

    // network may be shared between clients; when null the client owns one
    ControlPlaneClient(const QString& host, int port, const QString& authToken = QString(),
                       QNetworkAccessManager* network = nullptr, QObject* parent = nullptr);
    ~ControlPlaneClient() override;

    QUrl baseUrl() const { return m_baseUrl; }
    // Discovery probes plain-http ports with the same client
    void setScheme(const QString& scheme);

    QString authToken() const override { return m_authToken; }
    void setAuthToken(const QString& token) override { m_authToken = token; }

    // Auth and init
    void isInited(ResultCallback<InitStatus> callback);
    void checkAuth(ErrorCallback callback) override;
    void login(const QString& user, const QString& password, ResultCallback<QString> callback) override;

    // System / streamer
    void getSystemConfig(ResultCallback<SystemConfig> callback);
    void setSystemConfig(const SystemConfig& config, ResultCallback<SystemConfig> callback);
    void getStreamerState(ResultCallback<StreamerState> callback);
    void setStreamerParams(const QMap<QString, QString>& params, ErrorCallback callback);
    void resetStreamer(ErrorCallback callback);
    void getTurnCredentials(ResultCallback<TurnCredentials> callback);

    // HID one-shot commands
    void getHidState(ResultCallback<QJsonObject> callback);
    void setHidParams(const QMap<QString, QString>& params, ErrorCallback callback);
    void setHidConnected(bool connected, ErrorCallback callback) override;
    void resetHid(ErrorCallback callback);
    void getHidKeymaps(ResultCallback<HidKeymaps> callback);
    void sendHidShortcut(const QStringList& keys, ErrorCallback callback);
    void sendHidKey(const QString& key, std::optional<bool> state, std::optional<bool> finish, ErrorCallback callback);
    void sendHidMouseButton(const QString& button, std::optional<bool> state, ErrorCallback callback);
    void sendHidMouseMove(int toX, int toY, ErrorCallback callback);
    void sendHidMouseRelative(int deltaX, int deltaY, ErrorCallback callback);
    void sendHidMouseWheel(int deltaX, int deltaY, ErrorCallback callback);

    // EDID
    void getEdid(ResultCallback<QString> callback);
    void setEdid(const QString& edidHex, ErrorCallback callback) override;

    // Mass storage
    void getMsdState(ResultCallback<QJsonObject> callback);
    void setMsdParams(std::optional<QString> image, std::optional<bool> cdrom, std::optional<bool> rw, ErrorCallback callback);
    void setMsdConnected(bool connected, ErrorCallback callback);
    void msdPartitionShow(ResultCallback<MsdPartitionMap> callback);
    void msdPartitionConnect(ErrorCallback callback);
    void msdPartitionDisconnect(ErrorCallback callback);
    void msdPartitionFormat(const QString& path, ErrorCallback callback);
    void msdRead(const QString& image, std::optional<QString> compress, ResultCallback<QByteArray> callback);
    void msdWrite(const QString& image, const QByteArray& data, std::optional<QString> prefix,
                  std::optional<bool> removeIncomplete, ResultCallback<MsdWriteResult> callback);
    void msdWriteRemote(const QUrl& url, std::optional<QString> image, std::optional<QString> prefix,
                        std::optional<bool> insecure, std::optional<double> timeoutSeconds,
                        std::optional<bool> removeIncomplete, ResultCallback<QList<MsdWriteResult>> callback);
    void msdRemove(const QString& image, ErrorCallback callback);
    void msdReset(ErrorCallback callback);

    // ATX power
    void getAtxState(ResultCallback<QJsonObject> callback);
    void atxPower(AtxPowerAction action, std::optional<bool> wait, ErrorCallback callback);
    void atxClick(AtxButton button, std::optional<bool> wait, ErrorCallback callback);

    // Discovery: any HTTP status is a result, only transport failures are errors
    void probe(const QString& path, std::function<void(const KvmError& error, int status, const QByteArray& body)> callback);

    // Pure helpers, exposed for tests
    static KvmError errorForStatus(int status, const QByteArray& body);
    static bool unwrapEnvelope(const QByteArray& body, QJsonValue* result);
    static QString edidFromBody(const QByteArray& body);
    static QList<MsdWriteResult> writeResultsFromLines(const QByteArray& body);

private:
    using RawHandler = std::function<void(const KvmError& error, int status, const QByteArray& body)>;
    using JsonHandler = std::function<void(const KvmError& error, const QJsonValue& result)>;

    void sendRequest(const QByteArray& verb, const QString& path, const QUrlQuery& query,
                     const QByteArray& body, const QByteArray& contentType, int timeoutMs,
                     RawHandler handler, QHttpMultiPart* multipart = nullptr);
    void sendChecked(const QByteArray& verb, const QString& path, const QUrlQuery& query,
                     const QByteArray& body, const QByteArray& contentType, RawHandler handler,
                     QHttpMultiPart* multipart = nullptr);
    void sendJson(const QByteArray& verb, const QString& path, const QUrlQuery& query,
                  const QByteArray& body, const QByteArray& contentType, JsonHandler handler);

    // GET returning a typed, envelope-wrapped result
    template<typename T>
    void getTyped(const QString& path, const QUrlQuery& query, ResultCallback<T> callback);
    // POST with query parameters and an empty form body
    void postForm(const QString& path, const QUrlQuery& query, ErrorCallback callback);
    void postEmpty(const QString& path, ErrorCallback callback);
    void getEmpty(const QString& path, const QUrlQuery& query, ErrorCallback callback);
    void getObject(const QString& path, ResultCallback<QJsonObject> callback);

    QUrl m_baseUrl;
    QString m_authToken;
    QNetworkAccessManager* m_network;
};

#endif // CONTROLPLANECLIENT_H
