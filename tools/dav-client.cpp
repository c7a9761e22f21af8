/*
 * This file is part of the webdav-client package
 *
 * Copyright (C) 2025 Damien Caliste <dcaliste@free.fr>
 * Copyright (C) 2026 The webdav-client authors.
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public License
 * version 2.1 as published by the Free Software Foundation.
 *
 * This library is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA
 * 02110-1301 USA
 */

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QSet>
#include <QTimer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTextStream>
#include <QDebug>

#include <cstdlib>

#include <davclient.h>

static bool splitPair(const QString &value, QString *first, QString *second)
{
    const int separator = value.indexOf(QLatin1Char(':'));
    if (separator < 0) {
        return false;
    }
    *first = value.left(separator);
    *second = value.mid(separator + 1);
    return true;
}

class DavCli : public QCoreApplication
{
public:
    DavCli(int argc, char *argv[])
        : QCoreApplication(argc, argv)
        , mFailed(false)
    {
        setApplicationName("dav-client");

        mParser.setApplicationDescription("Command line tool to execute WebDAV requests with a server.");
        mParser.addHelpOption();

        mParser.addOption(QCommandLineOption(QStringList() << "s" << "server",
                                            "server address (like https://dav.example.org/remote.php/dav).", "server"));
        mParser.addOption(QCommandLineOption(QStringList() << "ignore-ssl-errors",
                                            "ignore SSL errors and continue."));
        mParser.addOption(QCommandLineOption(QStringList() << "certificate",
                                            "trust the server certificate stored in file (PEM or DER).", "file"));
        mParser.addOption(QCommandLineOption(QStringList() << "u" << "user",
                                            "authenticate by username.", "login"));
        mParser.addOption(QCommandLineOption(QStringList() << "P" << "password",
                                            "authenticate with a password.", "passwd"));
        mParser.addOption(QCommandLineOption(QStringList() << "a" << "auth",
                                            "authentication scheme: anonymous, basic or digest (default is basic when a user is given).", "scheme"));

        mParser.addOption(QCommandLineOption(QStringList() << "l" << "list",
                                             "list the resources at path.", "path"));
        mParser.addOption(QCommandLineOption(QStringList() << "depth",
                                             "depth of the listing, a number or infinity (default is 1).", "depth", "1"));
        mParser.addOption(QCommandLineOption(QStringList() << "json",
                                             "print the listing as JSON."));

        mParser.addOption(QCommandLineOption(QStringList() << "g" << "get",
                                             "download a resource.", "path"));
        mParser.addOption(QCommandLineOption(QStringList() << "o" << "output",
                                             "file to write the downloaded resource to (default is standard output).", "file"));

        mParser.addOption(QCommandLineOption(QStringList() << "p" << "put",
                                             "send a file as a resource on server.", "path:file"));
        mParser.addOption(QCommandLineOption(QStringList() << "content-type",
                                             "content type of the sent resource.", "type"));

        mParser.addOption(QCommandLineOption(QStringList() << "d" << "delete",
                                             "delete a resource.", "path"));
        mParser.addOption(QCommandLineOption(QStringList() << "mkcol",
                                             "create a collection.", "path"));
        mParser.addOption(QCommandLineOption(QStringList() << "move",
                                             "move or rename a resource.", "from:to"));
        mParser.addOption(QCommandLineOption(QStringList() << "copy",
                                             "copy a resource.", "from:to"));
        mParser.addOption(QCommandLineOption(QStringList() << "no-overwrite",
                                             "do not replace an existing destination when copying."));
        mParser.addOption(QCommandLineOption(QStringList() << "unzip",
                                             "extract an archive on the server.", "path"));

        mParser.process(*this);

        mDAV = new WebDav::Client(mParser.value("s"), this);

        const QString scheme = mParser.isSet("a")
            ? mParser.value("a").toLower()
            : (mParser.isSet("u") ? QStringLiteral("basic") : QStringLiteral("anonymous"));
        if (scheme == "basic") {
            mDAV->setAuth(WebDav::Auth::basic(mParser.value("u"), mParser.value("P")));
        } else if (scheme == "digest") {
            mDAV->setAuth(WebDav::Auth::digest(mParser.value("u"), mParser.value("P")));
        } else if (scheme != "anonymous") {
            qWarning() << "unknown authentication scheme" << scheme;
            ::exit(1);
        }

        if (mParser.isSet("ignore-ssl-errors"))
            mDAV->setIgnoreSSLErrors(true);
        if (mParser.isSet("certificate") && !mDAV->setServerCertificate(mParser.value("certificate"))) {
            qWarning() << "cannot use certificate from" << mParser.value("certificate");
            ::exit(1);
        }

        connect(mDAV, &WebDav::Client::listFinished, this, &DavCli::onListFinished);
        connect(mDAV, &WebDav::Client::getFinished, this, &DavCli::onGetFinished);
        connect(mDAV, &WebDav::Client::putFinished, this, &DavCli::onPutFinished);
        connect(mDAV, &WebDav::Client::deleteFinished, this,
                [this] (const WebDav::Client::Reply &reply) { onFinished("delete", reply); });
        connect(mDAV, &WebDav::Client::mkcolFinished, this,
                [this] (const WebDav::Client::Reply &reply) { onFinished("mkcol", reply); });
        connect(mDAV, &WebDav::Client::moveFinished, this,
                [this] (const WebDav::Client::Reply &reply) { onFinished("move", reply); });
        connect(mDAV, &WebDav::Client::copyFinished, this,
                [this] (const WebDav::Client::Reply &reply) { onFinished("copy", reply); });
        connect(mDAV, &WebDav::Client::unzipFinished, this,
                [this] (const WebDav::Client::Reply &reply) { onFinished("unzip", reply); });

        QTimer::singleShot(0, this, [this] () { execute(); });
    }

    // Runs the next requested operation, one at a time, in the order below.
    void execute()
    {
        if (mParser.isSet("list") && !mDone.contains("list")) {
            mDone.insert("list");
            const QString depth = mParser.value("depth");
            bool ok = false;
            const int levels = depth.toInt(&ok);
            if (depth.toLower() == "infinity") {
                mDAV->list(mParser.value("list"), WebDav::Depth::infinity());
            } else if (ok && levels >= 0) {
                mDAV->list(mParser.value("list"), WebDav::Depth::number(levels));
            } else {
                qWarning() << "wrong depth" << depth;
                exit(1);
            }
        } else if (mParser.isSet("get") && !mDone.contains("get")) {
            mDone.insert("get");
            mDAV->get(mParser.value("get"));
        } else if (mParser.isSet("put") && !mDone.contains("put")) {
            mDone.insert("put");
            QString path, fileName;
            if (!splitPair(mParser.value("put"), &path, &fileName)) {
                qWarning() << "wrong put format. Awaited path:file.";
                exit(1);
                return;
            }
            QFile file(fileName);
            if (!file.open(QIODevice::ReadOnly)) {
                qWarning() << "cannot read data from" << fileName;
                exit(1);
                return;
            }
            mDAV->put(path, file.readAll(), mParser.value("content-type"));
        } else if (mParser.isSet("delete") && !mDone.contains("delete")) {
            mDone.insert("delete");
            mDAV->deleteResource(mParser.value("delete"));
        } else if (mParser.isSet("mkcol") && !mDone.contains("mkcol")) {
            mDone.insert("mkcol");
            mDAV->mkcol(mParser.value("mkcol"));
        } else if (mParser.isSet("move") && !mDone.contains("move")) {
            mDone.insert("move");
            QString from, to;
            if (!splitPair(mParser.value("move"), &from, &to)) {
                qWarning() << "wrong move format. Awaited from:to.";
                exit(1);
                return;
            }
            mDAV->move(from, to);
        } else if (mParser.isSet("copy") && !mDone.contains("copy")) {
            mDone.insert("copy");
            QString from, to;
            if (!splitPair(mParser.value("copy"), &from, &to)) {
                qWarning() << "wrong copy format. Awaited from:to.";
                exit(1);
                return;
            }
            mDAV->copy(from, to, !mParser.isSet("no-overwrite"));
        } else if (mParser.isSet("unzip") && !mDone.contains("unzip")) {
            mDone.insert("unzip");
            mDAV->unzip(mParser.value("unzip"));
        } else {
            exit(mFailed ? 1 : 0);
        }
    }

    bool reportError(const WebDav::Client::Reply &reply)
    {
        if (!reply.hasError()) {
            return false;
        }
        mFailed = true;
        qWarning().noquote() << reply.uri << ":" << reply.error.toString();
        if (!reply.errorData.isEmpty())
            qWarning() << reply.errorData;
        return true;
    }

    void onListFinished(const WebDav::Client::Reply &reply,
                        const QList<WebDav::ListEntity> &entities)
    {
        if (!reportError(reply)) {
            if (mParser.isSet("json")) {
                QJsonArray array;
                for (const WebDav::ListEntity &entity : entities) {
                    array.append(entity.toJson());
                }
                QTextStream(stdout) << QJsonDocument(array).toJson();
            } else {
                qInfo() << "  entities:" << (entities.isEmpty() ? "[]" : "");
                for (const WebDav::ListEntity &entity : entities) {
                    qInfo() << "  - href:" << entity.href();
                    qInfo() << "    type:" << (entity.isFolder() ? "folder" : "file");
                    qInfo() << "    last modified:" << entity.lastModified().toString(Qt::ISODate);
                    qInfo() << "    etag:" << entity.tag();
                    if (entity.isFile()) {
                        qInfo() << "    length:" << entity.file().contentLength;
                        qInfo() << "    content type:" << entity.file().contentType;
                    } else {
                        qInfo() << "    address book:" << (entity.folder().isAddressBook ? "yes" : "no");
                        if (entity.folder().quotaUsedBytes.isValid())
                            qInfo() << "    quota used:" << entity.folder().quotaUsedBytes.toLongLong();
                        if (entity.folder().quotaAvailableBytes.isValid())
                            qInfo() << "    quota available:" << entity.folder().quotaAvailableBytes.toLongLong();
                    }
                }
            }
        }

        execute();
    }

    void onGetFinished(const WebDav::Client::Reply &reply, const QByteArray &data)
    {
        if (!reportError(reply)) {
            if (mParser.isSet("output")) {
                QFile file(mParser.value("output"));
                if (!file.open(QIODevice::WriteOnly) || file.write(data) != data.length()) {
                    qWarning() << "cannot write data to" << mParser.value("output");
                    mFailed = true;
                }
            } else {
                QFile out;
                if (out.open(stdout, QIODevice::WriteOnly)) {
                    out.write(data);
                }
            }
        }

        execute();
    }

    void onPutFinished(const WebDav::Client::Reply &reply, const QString &etag)
    {
        if (!reportError(reply)) {
            qInfo() << "  put:";
            qInfo() << "  - href:" << reply.uri;
            qInfo() << "  - etag:" << etag;
        }

        execute();
    }

    void onFinished(const char *operation, const WebDav::Client::Reply &reply)
    {
        if (!reportError(reply)) {
            qInfo().noquote() << QString::fromLatin1("  %1:").arg(QLatin1String(operation));
            qInfo() << "  - href:" << reply.uri;
        }

        execute();
    }

    QCommandLineParser mParser;
    WebDav::Client *mDAV;
    QSet<QString> mDone;
    bool mFailed;
};

int main(int argc, char *argv[])
{
    DavCli app(argc, argv);

    return app.exec();
}
