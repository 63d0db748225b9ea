#pragma once

#include <QByteArray>
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVariant>

#include "bridgeconfig.h"
#include "bridgetypes.h"
#include "transports.h"

class QNetworkAccessManager;
class QNetworkReply;
class QNetworkRequest;

namespace hmbridge {

struct CallResult {
    bool     ok = false;
    QVariant value;
    QString  error;
    int      faultCode = 0;     // Non-zero when the CCU answered with a fault
};

// Converts the parent entries of a listDevices/newDevices description list
// into inventory records. Channel entries only contribute their index.
bool inventoryFromDescriptions(const QVariantList &descriptions, Inventory &inventory, QString &errorString);

// XML-RPC client of the CCU interface process (HmIP-RF on port 2010).
class HomematicClient : public ControllerLink
{
    Q_OBJECT

public:
    explicit HomematicClient(QObject *parent = nullptr);
    ~HomematicClient() override;

    void setEndpoint(const XmlRpcEndpoint &endpoint);
    void setTimeout(int timeoutMs);
    XmlRpcEndpoint endpoint() const { return m_endpoint; }

    // Blocking calls; the event loop keeps running while they wait.
    CallResult call(const QString &method, const QVariantList &params) const;
    bool listDevices(Inventory &inventory, QString &errorString) override;
    bool init(const QString &callbackUrl, const QString &interfaceId, QString &errorString) override;
    bool deinit(const QString &callbackUrl, QString &errorString) override;

    // Asynchronous calls, reported through setValueFinished and pingFinished.
    bool setValue(const Command &command, QString &errorString) override;
    bool ping(const QString &interfaceId, QString &errorString) override;

    int pendingCalls() const override { return m_pending.size(); }
    QList<Command> abandonPending() override;

private:
    QNetworkRequest buildRequest() const;
    QNetworkReply *post(const QString &method, const QVariantList &params) const;
    static CallResult resultFromReply(QNetworkReply *reply);

    QNetworkAccessManager *m_manager = nullptr;
    XmlRpcEndpoint m_endpoint;
    int m_timeoutMs = 10000;
    QHash<QNetworkReply *, Command> m_pending;
    QNetworkReply *m_pingReply = nullptr;
};

} // namespace hmbridge
