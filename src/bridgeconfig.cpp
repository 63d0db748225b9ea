#include "bridgeconfig.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QUrl>

#include "topics.h"

namespace {

using namespace hmbridge;

bool readString(const QJsonObject &object, const QString &key, QString &out, QString &errorString)
{
    const QJsonValue value = object.value(key);
    if (value.isUndefined() || value.isNull())
        return true;
    if (!value.isString()) {
        errorString = QStringLiteral("config key '%1' must be a string").arg(key);
        return false;
    }
    out = value.toString().trimmed();
    return true;
}

bool readInt(const QJsonObject &object, const QString &key, int minimum, int &out, QString &errorString)
{
    const QJsonValue value = object.value(key);
    if (value.isUndefined() || value.isNull())
        return true;
    if (!value.isDouble()) {
        errorString = QStringLiteral("config key '%1' must be a number").arg(key);
        return false;
    }
    const int parsed = value.toInt(minimum - 1);
    if (parsed < minimum) {
        errorString = QStringLiteral("config key '%1' must be an integer >= %2").arg(key).arg(minimum);
        return false;
    }
    out = parsed;
    return true;
}

// Accepts "host[:port]" without a scheme, as the CCU tooling does.
QUrl parseUrl(const QString &text, const QString &defaultScheme)
{
    QString input = text.trimmed();
    if (!input.contains(QStringLiteral("://")))
        input = QStringLiteral("%1://%2").arg(defaultScheme, input);
    return QUrl(input, QUrl::StrictMode);
}

}

namespace hmbridge {

void configureParser(QCommandLineParser &parser)
{
    parser.setApplicationDescription(QStringLiteral("Homematic CCU to MQTT bridge"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        { QStringLiteral("config"),
          QStringLiteral("Location of config file (default: %1)").arg(QString::fromLatin1(kDefaultConfigFile)),
          QStringLiteral("file") },
        { QStringLiteral("broker"),
          QStringLiteral("MQTT broker (default: mqtt://localhost)"),
          QStringLiteral("url") },
        { QStringLiteral("listen"),
          QStringLiteral("Where to listen for connections from CCU (default: xmlrpc://0.0.0.0)"),
          QStringLiteral("url") },
        { QStringLiteral("connect"),
          QStringLiteral("XML-RPC server of CCU, e.g. xmlrpc://ccu.local:2010"),
          QStringLiteral("url") },
        { QStringLiteral("debug"),
          QStringLiteral("Enable logging of debug messages") },
    });
}

bool loadConfig(const QCommandLineParser &parser, BridgeConfig &config, QString &errorString)
{
    errorString.clear();
    if (parser.isSet(QStringLiteral("config"))) {
        config.configFile = parser.value(QStringLiteral("config"));
        config.configFileExplicit = true;
    }

    if (QFile::exists(config.configFile)) {
        if (!loadConfigFile(config.configFile, config, errorString))
            return false;
    } else if (config.configFileExplicit) {
        errorString = QStringLiteral("Failed to open configuration file %1: no such file").arg(config.configFile);
        return false;
    }

    if (parser.isSet(QStringLiteral("broker")))
        config.broker = parser.value(QStringLiteral("broker")).trimmed();
    if (parser.isSet(QStringLiteral("listen")))
        config.listen = parser.value(QStringLiteral("listen")).trimmed();
    if (parser.isSet(QStringLiteral("connect")))
        config.connect = parser.value(QStringLiteral("connect")).trimmed();
    if (parser.isSet(QStringLiteral("debug")))
        config.debug = true;

    return validateConfig(config, errorString);
}

bool loadConfigFile(const QString &path, BridgeConfig &config, QString &errorString)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        errorString = QStringLiteral("Failed to open configuration file %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        errorString = QStringLiteral("Failed to parse configuration file %1: %2 at offset %3")
                          .arg(path, parseError.errorString())
                          .arg(parseError.offset);
        return false;
    }
    if (!doc.isObject()) {
        errorString = QStringLiteral("Configuration file %1 does not contain a JSON object").arg(path);
        return false;
    }
    if (!applyConfigObject(doc.object(), config, errorString)) {
        errorString = QStringLiteral("%1: %2").arg(path, errorString);
        return false;
    }
    return true;
}

bool applyConfigObject(const QJsonObject &object, BridgeConfig &config, QString &errorString)
{
    if (!readString(object, QStringLiteral("broker"), config.broker, errorString)
        || !readString(object, QStringLiteral("listen"), config.listen, errorString)
        || !readString(object, QStringLiteral("connect"), config.connect, errorString)
        || !readString(object, QStringLiteral("callbackHost"), config.callbackHost, errorString)
        || !readString(object, QStringLiteral("caFile"), config.caFile, errorString)
        || !readString(object, QStringLiteral("topicNamespace"), config.topicNamespace, errorString)
        || !readString(object, QStringLiteral("discoveryPrefix"), config.discoveryPrefix, errorString)
        || !readString(object, QStringLiteral("interfaceId"), config.interfaceId, errorString)) {
        return false;
    }

    if (!readInt(object, QStringLiteral("retryIntervalMs"), 1000, config.retryIntervalMs, errorString)
        || !readInt(object, QStringLiteral("pingIntervalMs"), 0, config.pingIntervalMs, errorString)
        || !readInt(object, QStringLiteral("requestTimeoutMs"), 100, config.requestTimeoutMs, errorString)
        || !readInt(object, QStringLiteral("eventQueueCapacity"), 1, config.eventQueueCapacity, errorString)
        || !readInt(object, QStringLiteral("shutdownTimeoutMs"), 0, config.shutdownTimeoutMs, errorString)
        || !readInt(object, QStringLiteral("qos"), 0, config.qos, errorString)) {
        return false;
    }

    const QJsonValue debug = object.value(QStringLiteral("debug"));
    if (!debug.isUndefined() && !debug.isNull()) {
        if (!debug.isBool()) {
            errorString = QStringLiteral("config key 'debug' must be a boolean");
            return false;
        }
        config.debug = debug.toBool();
    }
    return true;
}

bool parseBrokerUrl(const QString &url, BrokerEndpoint &endpoint, QString &errorString)
{
    const QUrl parsed = parseUrl(url, QStringLiteral("mqtt"));
    const QString scheme = parsed.scheme().toLower();
    if (!parsed.isValid() || (scheme != QLatin1String("mqtt") && scheme != QLatin1String("mqtts"))
        || parsed.host().isEmpty()) {
        errorString = QStringLiteral("Invalid broker URL '%1', expected mqtt[s]://[user:pass@]host[:port]").arg(url);
        return false;
    }

    endpoint.tls = scheme == QLatin1String("mqtts");
    endpoint.host = parsed.host();
    endpoint.port = parsed.port(endpoint.tls ? 8883 : 1883);
    endpoint.username = parsed.userName();
    endpoint.password = parsed.password();
    return true;
}

bool parseListenUrl(const QString &url, XmlRpcEndpoint &endpoint, QString &errorString)
{
    const QUrl parsed = parseUrl(url, QStringLiteral("xmlrpc"));
    if (!parsed.isValid() || parsed.scheme().toLower() != QLatin1String("xmlrpc") || parsed.host().isEmpty()) {
        errorString = QStringLiteral("Invalid XML-RPC URL '%1', expected xmlrpc://host[:port]").arg(url);
        return false;
    }

    endpoint.host = parsed.host();
    endpoint.port = parsed.port(0);
    endpoint.path = parsed.path();
    endpoint.username = parsed.userName();
    endpoint.password = parsed.password();
    return true;
}

bool parseConnectUrl(const QString &url, XmlRpcEndpoint &endpoint, QString &errorString)
{
    if (!parseListenUrl(url, endpoint, errorString))
        return false;
    if (endpoint.port <= 0) {
        errorString = QStringLiteral("XML-RPC URL '%1' of the CCU needs a port, e.g. xmlrpc://ccu.local:2010").arg(url);
        return false;
    }
    if (endpoint.username.isEmpty())
        endpoint.username = QStringLiteral("Admin");
    return true;
}

bool validateConfig(const BridgeConfig &config, QString &errorString)
{
    BrokerEndpoint broker;
    if (!parseBrokerUrl(config.broker, broker, errorString))
        return false;

    XmlRpcEndpoint endpoint;
    if (!parseListenUrl(config.listen, endpoint, errorString))
        return false;

    if (config.connect.isEmpty()) {
        errorString = QStringLiteral("No CCU configured, use --connect xmlrpc://host:port");
        return false;
    }
    if (!parseConnectUrl(config.connect, endpoint, errorString))
        return false;

    const QString ns = config.topicNamespace;
    if (ns.isEmpty() || ns.contains(QLatin1Char('+')) || ns.contains(QLatin1Char('#'))) {
        errorString = QStringLiteral("Invalid topic namespace '%1'").arg(ns);
        return false;
    }
    if (config.discoveryPrefix.isEmpty() || !TopicScheme::isValidSegment(config.discoveryPrefix)) {
        errorString = QStringLiteral("Invalid discovery prefix '%1'").arg(config.discoveryPrefix);
        return false;
    }
    if (config.interfaceId.isEmpty()) {
        errorString = QStringLiteral("Interface id must not be empty");
        return false;
    }
    if (config.qos > 2) {
        errorString = QStringLiteral("Invalid MQTT qos %1").arg(config.qos);
        return false;
    }
    return true;
}

} // namespace hmbridge
