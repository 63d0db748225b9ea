#pragma once

#include <QJsonObject>
#include <QString>

class QCommandLineParser;

namespace hmbridge {

inline constexpr const char *kDefaultConfigFile = "/var/lib/hm-mqtt-bridge/config.json";

struct BrokerEndpoint {
    QString host;
    int     port = 1883;
    QString username;
    QString password;
    bool    tls = false;
};

struct XmlRpcEndpoint {
    QString host;
    int     port = 0;
    QString path;
    QString username;
    QString password;
};

struct BridgeConfig {
    QString configFile = QString::fromLatin1(kDefaultConfigFile);
    bool    configFileExplicit = false;

    QString broker = QStringLiteral("mqtt://localhost");
    QString listen = QStringLiteral("xmlrpc://0.0.0.0");
    QString connect;
    QString callbackHost;           // Address the CCU calls back on; derived when empty
    QString caFile;
    bool    debug = false;

    QString topicNamespace = QStringLiteral("Homematic");
    QString discoveryPrefix = QStringLiteral("homeassistant");
    QString interfaceId = QStringLiteral("mqttbridge");

    int retryIntervalMs = 10000;
    int pingIntervalMs = 60000;
    int requestTimeoutMs = 10000;
    int eventQueueCapacity = 1024;
    int shutdownTimeoutMs = 5000;
    int qos = 2;
};

void configureParser(QCommandLineParser &parser);

// Reads the config file, then lets the command line override it. A missing
// file is only an error when it was named on the command line.
bool loadConfig(const QCommandLineParser &parser, BridgeConfig &config, QString &errorString);

bool loadConfigFile(const QString &path, BridgeConfig &config, QString &errorString);
bool applyConfigObject(const QJsonObject &object, BridgeConfig &config, QString &errorString);

bool parseBrokerUrl(const QString &url, BrokerEndpoint &endpoint, QString &errorString);
bool parseListenUrl(const QString &url, XmlRpcEndpoint &endpoint, QString &errorString);
// Like parseListenUrl, but the port is mandatory and the user defaults to Admin.
bool parseConnectUrl(const QString &url, XmlRpcEndpoint &endpoint, QString &errorString);

bool validateConfig(const BridgeConfig &config, QString &errorString);

} // namespace hmbridge
