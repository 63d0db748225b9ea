#include "homematicclient.h"

#include <QEventLoop>
#include <QLoggingCategory>
#include <QMap>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>
#include <QVariantMap>

#include "xmlrpc/xmlrpc.h"

Q_LOGGING_CATEGORY(homematicLog, "hmbridge.homematic")

namespace {

int channelIndexOf(const QString &channelAddress)
{
    const int colon = channelAddress.lastIndexOf(QLatin1Char(':'));
    if (colon < 0)
        return -1;
    bool ok = false;
    const int index = channelAddress.mid(colon + 1).toInt(&ok);
    return ok ? index : -1;
}

}

namespace hmbridge {

bool inventoryFromDescriptions(const QVariantList &descriptions, Inventory &inventory, QString &errorString)
{
    inventory.clear();
    QMap<QString, InventoryEntry> parents;   // Sorted by address
    QHash<QString, int> highestChannel;

    for (const QVariant &item : descriptions) {
        if (item.typeId() != QMetaType::QVariantMap) {
            errorString = QStringLiteral("device description is not a struct");
            return false;
        }
        const QVariantMap desc = item.toMap();
        const QString address = desc.value(QStringLiteral("ADDRESS")).toString().trimmed();
        const QString parent = desc.value(QStringLiteral("PARENT")).toString().trimmed();
        if (address.isEmpty()) {
            errorString = QStringLiteral("device description without ADDRESS");
            return false;
        }

        if (!parent.isEmpty()) {
            bool ok = false;
            int index = desc.value(QStringLiteral("INDEX")).toInt(&ok);
            if (!ok)
                index = channelIndexOf(address);
            if (index >= 0)
                highestChannel[parent] = qMax(highestChannel.value(parent, -1), index);
            continue;
        }

        InventoryEntry entry;
        entry.address = address;
        entry.model = desc.value(QStringLiteral("TYPE")).toString().trimmed();
        entry.firmware = desc.value(QStringLiteral("FIRMWARE")).toString().trimmed();
        const QStringList children = desc.value(QStringLiteral("CHILDREN")).toStringList();
        for (const QString &child : children) {
            const int index = channelIndexOf(child);
            if (index >= 0)
                highestChannel[address] = qMax(highestChannel.value(address, -1), index);
        }
        parents.insert(address, entry);
    }

    for (auto it = parents.begin(); it != parents.end(); ++it) {
        it.value().channelCount = highestChannel.value(it.key(), -1) + 1;
        inventory.push_back(it.value());
    }
    return true;
}

HomematicClient::HomematicClient(QObject *parent)
    : ControllerLink(parent)
    , m_manager(new QNetworkAccessManager(this))
{
}

HomematicClient::~HomematicClient()
{
    abandonPending();
}

void HomematicClient::setEndpoint(const XmlRpcEndpoint &endpoint)
{
    m_endpoint = endpoint;
}

void HomematicClient::setTimeout(int timeoutMs)
{
    m_timeoutMs = timeoutMs > 0 ? timeoutMs : 10000;
}

QNetworkRequest HomematicClient::buildRequest() const
{
    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(m_endpoint.host);
    url.setPort(m_endpoint.port);
    url.setPath(m_endpoint.path.isEmpty() ? QStringLiteral("/") : m_endpoint.path);

    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("text/xml"));
    request.setRawHeader("User-Agent", "hm-mqtt-bridge/1.0");
    request.setTransferTimeout(m_timeoutMs);
    if (!m_endpoint.username.isEmpty() && !m_endpoint.password.isEmpty()) {
        const QByteArray credentials = m_endpoint.username.toUtf8() + ':' + m_endpoint.password.toUtf8();
        request.setRawHeader("Authorization", "Basic " + credentials.toBase64());
    }
    return request;
}

QNetworkReply *HomematicClient::post(const QString &method, const QVariantList &params) const
{
    qCDebug(homematicLog).noquote() << "->" << method << params.size() << "params";
    return m_manager->post(buildRequest(), xmlrpc::buildMethodCall(method, params));
}

CallResult HomematicClient::resultFromReply(QNetworkReply *reply)
{
    CallResult result;
    const QByteArray payload = reply->readAll();
    if (reply->error() != QNetworkReply::NoError) {
        result.error = reply->errorString();
        return result;
    }

    xmlrpc::Response response;
    QString errorString;
    if (!xmlrpc::parseResponse(payload, response, errorString)) {
        result.error = QStringLiteral("Malformed response: %1").arg(errorString);
        return result;
    }
    if (response.fault) {
        result.faultCode = response.faultCode;
        result.error = QStringLiteral("Fault %1: %2").arg(response.faultCode).arg(response.faultString);
        return result;
    }
    result.ok = true;
    result.value = response.value;
    return result;
}

CallResult HomematicClient::call(const QString &method, const QVariantList &params) const
{
    CallResult result;
    if (m_endpoint.host.isEmpty() || m_endpoint.port <= 0) {
        result.error = QStringLiteral("CCU endpoint not configured");
        return result;
    }

    QNetworkReply *reply = post(method, params);
    if (!reply) {
        result.error = QStringLiteral("Failed to create network request");
        return result;
    }

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    timer.start(m_timeoutMs);
    loop.exec();

    if (timedOut) {
        reply->abort();
        reply->deleteLater();
        result.error = QStringLiteral("%1 timed out").arg(method);
        return result;
    }

    result = resultFromReply(reply);
    reply->deleteLater();
    if (!result.ok)
        qCWarning(homematicLog).noquote() << method << "failed:" << result.error;
    return result;
}

bool HomematicClient::listDevices(Inventory &inventory, QString &errorString)
{
    const CallResult result = call(QStringLiteral("listDevices"), {});
    if (!result.ok) {
        errorString = QStringLiteral("listDevices: %1").arg(result.error);
        return false;
    }
    if (result.value.typeId() != QMetaType::QVariantList) {
        errorString = QStringLiteral("listDevices did not return an array");
        return false;
    }
    if (!inventoryFromDescriptions(result.value.toList(), inventory, errorString))
        return false;
    qCInfo(homematicLog) << "CCU reports" << inventory.size() << "devices";
    return true;
}

bool HomematicClient::init(const QString &callbackUrl, const QString &interfaceId, QString &errorString)
{
    const CallResult result = call(QStringLiteral("init"), { callbackUrl, interfaceId });
    if (!result.ok) {
        errorString = QStringLiteral("init: %1").arg(result.error);
        return false;
    }
    qCInfo(homematicLog).noquote() << "Registered callback" << callbackUrl << "as" << interfaceId;
    return true;
}

bool HomematicClient::deinit(const QString &callbackUrl, QString &errorString)
{
    const CallResult result = call(QStringLiteral("init"), { callbackUrl, QString() });
    if (!result.ok) {
        errorString = QStringLiteral("deinit: %1").arg(result.error);
        return false;
    }
    qCInfo(homematicLog).noquote() << "Deregistered callback" << callbackUrl;
    return true;
}

bool HomematicClient::setValue(const Command &command, QString &errorString)
{
    const QString channelAddress = QStringLiteral("%1:%2").arg(command.address).arg(command.channel);
    QNetworkReply *reply = post(QStringLiteral("setValue"), { channelAddress, command.key, command.value });
    if (!reply) {
        errorString = QStringLiteral("Failed to create network request");
        return false;
    }

    m_pending.insert(reply, command);
    connect(reply, &QNetworkReply::finished, this, [this, reply]() {
        const auto it = m_pending.find(reply);
        if (it == m_pending.end())
            return;
        const Command command = it.value();
        m_pending.erase(it);
        const CallResult result = resultFromReply(reply);
        reply->deleteLater();
        if (result.ok) {
            qCDebug(homematicLog).noquote() << "setValue" << command.address << command.channel
                                            << command.key << "done";
        } else {
            qCWarning(homematicLog).noquote() << "setValue" << command.address << command.channel
                                              << command.key << "failed:" << result.error;
        }
        emit setValueFinished(command, result.ok, result.error);
    });
    return true;
}

bool HomematicClient::ping(const QString &interfaceId, QString &errorString)
{
    if (m_pingReply) {
        errorString = QStringLiteral("ping already in flight");
        return false;
    }
    m_pingReply = post(QStringLiteral("ping"), { interfaceId });
    if (!m_pingReply) {
        errorString = QStringLiteral("Failed to create network request");
        return false;
    }
    QNetworkReply *reply = m_pingReply;
    connect(reply, &QNetworkReply::finished, this, [this, reply]() {
        if (m_pingReply != reply)
            return;
        m_pingReply = nullptr;
        const CallResult result = resultFromReply(reply);
        reply->deleteLater();
        emit pingFinished(result.ok, result.error);
    });
    return true;
}

QList<Command> HomematicClient::abandonPending()
{
    QList<Command> abandoned;
    const auto pending = m_pending;
    m_pending.clear();
    for (auto it = pending.constBegin(); it != pending.constEnd(); ++it) {
        abandoned.push_back(it.value());
        it.key()->abort();
        it.key()->deleteLater();
    }
    if (m_pingReply) {
        QNetworkReply *reply = m_pingReply;
        m_pingReply = nullptr;
        reply->abort();
        reply->deleteLater();
    }
    return abandoned;
}

} // namespace hmbridge
