#include "TestUtils.hpp"
#include <QtCore/QDateTime>
#include <QtCore/QDir>
#include <QtCore/QElapsedTimer>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QPointer>
#include <QtCore/QRandomGenerator>
#include <QtNetwork/QHostAddress>
#include <QtNetwork/QTcpServer>
#include <QtNetwork/QTcpSocket>
#include <QtTest/QTest>

namespace WhisperGui {
namespace Test {

QTemporaryDir* TestUtils::tempDir_ = nullptr;

void TestUtils::initializeTestEnvironment() {
    if (!tempDir_) {
        tempDir_ = new QTemporaryDir();
        if (!tempDir_->isValid()) {
            qFatal("Failed to create temporary directory for tests");
        }
    }

    logMessage("Test environment initialized");
}

void TestUtils::cleanupTestEnvironment() {
    if (tempDir_) {
        delete tempDir_;
        tempDir_ = nullptr;
    }
    logMessage("Test environment cleaned up");
}

QString TestUtils::createTempDirectory(const QString& prefix) {
    if (!tempDir_) {
        initializeTestEnvironment();
    }

    QString dirName = QString("%1_%2_%3")
                     .arg(prefix)
                     .arg(QDateTime::currentMSecsSinceEpoch())
                     .arg(QRandomGenerator::global()->generate());

    QString fullPath = tempDir_->path() + "/" + dirName;
    if (!QDir().mkpath(fullPath)) {
        return QString();
    }
    return fullPath;
}

void TestUtils::cleanupTempDirectory(const QString& path) {
    QDir dir(path);
    if (dir.exists()) {
        dir.removeRecursively();
    }
}

QString TestUtils::getTempPath() {
    if (!tempDir_) {
        initializeTestEnvironment();
    }
    return tempDir_->path();
}

QString TestUtils::createTestTextFile(const QString& directory, const QString& content, const QString& filename) {
    return createTestBinaryFile(directory, content.toUtf8(), filename);
}

QString TestUtils::createTestBinaryFile(const QString& directory, const QByteArray& content, const QString& filename) {
    QString filePath = QDir(directory).filePath(filename);
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        logMessage(QString("Failed to create test file %1").arg(filePath));
        return QString();
    }
    file.write(content);
    file.close();
    return filePath;
}

QString TestUtils::writeScript(const QString& directory, const QString& name, const QString& body) {
    QString path = createTestTextFile(directory, QString("#!/bin/sh\n%1\n").arg(body), name);
    if (path.isEmpty()) {
        return path;
    }
    QFile::setPermissions(path, QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner |
                                QFileDevice::ReadGroup | QFileDevice::ExeGroup);
    return path;
}

bool TestUtils::waitForCondition(std::function<bool()> condition, int timeoutMs, int checkIntervalMs) {
    QElapsedTimer timer;
    timer.start();

    while (timer.elapsed() < timeoutMs) {
        if (condition()) {
            return true;
        }
        QTest::qWait(checkIntervalMs);
    }

    return condition();
}

QByteArray TestUtils::generateRandomData(int size) {
    QByteArray data;
    data.resize(size);
    for (int i = 0; i < size; ++i) {
        data[i] = static_cast<char>(QRandomGenerator::global()->bounded(256));
    }
    return data;
}

bool TestUtils::compareFileContent(const QString& filePath, const QByteArray& expected) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return false;
    }
    return file.readAll() == expected;
}

void TestUtils::assertFileExists(const QString& filePath, const QString& context) {
    if (!QFileInfo::exists(filePath)) {
        QString message = QString("File does not exist: %1").arg(filePath);
        if (!context.isEmpty()) {
            message += QString(" (context: %1)").arg(context);
        }
        QFAIL(qPrintable(message));
    }
}

void TestUtils::assertFileNotExists(const QString& filePath, const QString& context) {
    if (QFileInfo::exists(filePath)) {
        QString message = QString("File should not exist: %1").arg(filePath);
        if (!context.isEmpty()) {
            message += QString(" (context: %1)").arg(context);
        }
        QFAIL(qPrintable(message));
    }
}

void TestUtils::logMessage(const QString& message) {
    WHISPERGUI_DEBUG("[test] {}", message.toStdString());
}

TestHttpServer::TestHttpServer(QObject* parent)
    : QObject(parent) {}

TestHttpServer::~TestHttpServer() {
    stop();
}

bool TestHttpServer::start() {
    stop();

    server_ = new QTcpServer(this);
    if (!server_->listen(QHostAddress::LocalHost, 0)) {
        TestUtils::logMessage(QString("Failed to start test HTTP server: %1").arg(server_->errorString()));
        delete server_;
        server_ = nullptr;
        return false;
    }

    connect(server_, &QTcpServer::newConnection, this, &TestHttpServer::handleNewConnection);
    TestUtils::logMessage(QString("Test HTTP server listening on port %1").arg(server_->serverPort()));
    return true;
}

void TestHttpServer::stop() {
    if (server_) {
        server_->close();
        delete server_;
        server_ = nullptr;
    }
}

QUrl TestHttpServer::url(const QString& path) const {
    return QUrl(QString("http://127.0.0.1:%1%2").arg(port()).arg(path));
}

quint16 TestHttpServer::port() const {
    return server_ ? server_->serverPort() : 0;
}

void TestHttpServer::setRoute(const QString& path, const Route& route) {
    routes_.insert(path, route);
}

int TestHttpServer::requestCount(const QString& path) const {
    return requestCounts_.value(path, 0);
}

void TestHttpServer::handleNewConnection() {
    while (server_ && server_->hasPendingConnections()) {
        QTcpSocket* client = server_->nextPendingConnection();
        connect(client, &QTcpSocket::disconnected, client, &QObject::deleteLater);
        connect(client, &QTcpSocket::readyRead, this, [this, client]() {
            handleRequest(client);
        });
    }
}

void TestHttpServer::handleRequest(QTcpSocket* client) {
    // Headers only; GET requests carry no body
    if (client->property("handled").toBool() || !client->peek(8192).contains("\r\n\r\n")) {
        return;
    }
    client->setProperty("handled", true);

    const QByteArray request = client->readAll();
    const QList<QByteArray> requestLine = request.left(request.indexOf("\r\n")).split(' ');
    const QString path = requestLine.size() > 1 ? QString::fromLatin1(requestLine.at(1)) : QString("/");
    requestCounts_[path] += 1;

    Route route;
    if (routes_.contains(path)) {
        route = routes_.value(path);
    } else {
        route.status = 404;
        route.body = "Not Found";
    }

    QByteArray header = QString("HTTP/1.1 %1 %2\r\n")
                           .arg(route.status)
                           .arg(route.status >= 200 && route.status < 300 ? "OK" : "Error")
                           .toLatin1();
    header += "Content-Type: application/octet-stream\r\n";
    if (route.declareLength) {
        header += "Content-Length: " + QByteArray::number(route.body.size()) + "\r\n";
    }
    header += "Connection: close\r\n\r\n";
    client->write(header);

    writeChunks(client, route.body, route);
}

void TestHttpServer::writeChunks(QTcpSocket* client, QByteArray remaining, const Route& route) {
    const int size = route.chunkSize > 0 ? route.chunkSize : remaining.size();
    client->write(remaining.left(size));
    client->flush();
    remaining.remove(0, size);

    if (route.dropAfterFirstChunk && !remaining.isEmpty()) {
        client->abort();
        return;
    }

    if (remaining.isEmpty()) {
        client->disconnectFromHost();
        return;
    }

    QPointer<QTcpSocket> guard(client);
    QTimer::singleShot(route.chunkDelayMs, this, [this, guard, remaining, route]() {
        if (guard) {
            writeChunks(guard, remaining, route);
        }
    });
}

} // namespace Test
} // namespace WhisperGui
