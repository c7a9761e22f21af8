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

#ifndef WEBDAV_DAVCLIENT_H
#define WEBDAV_DAVCLIENT_H

#include <QObject>
#include <QScopedPointer>
#include <QList>
#include <QByteArray>

#include "davexport.h"
#include "davtypes.h"
#include "daverror.h"

namespace WebDav {
class ClientPrivate;
class Transport;

class WEBDAV_EXPORT Client : public QObject
{
    Q_OBJECT

public:
    struct Reply
    {
        QString uri;
        int statusCode;
        Error error;
        QByteArray errorData;

        Reply(const QString &path, int code, const Error &err, const QByteArray &data)
            : uri(path), statusCode(code), error(err), errorData(data) {}
        bool hasError() const
        {
            return error.isError();
        }
    };

    Client(const QString &serverAddress, QObject *parent = nullptr);
    Client(const QString &serverAddress, Transport *transport, QObject *parent = nullptr);
    ~Client();

    QString serverAddress() const;

    Auth auth() const;
    void setAuth(const Auth &auth);

    bool ignoreSSLErrors() const;
    void setIgnoreSSLErrors(bool ignore);

    bool setServerCertificate(const QString &path);

    void list(const QString &path, const Depth &depth = Depth::number(1));
    void get(const QString &path);
    void put(const QString &path, const QByteArray &data,
             const QString &contentType = QString());
    void deleteResource(const QString &path);
    void mkcol(const QString &path);
    void move(const QString &from, const QString &to);
    void copy(const QString &from, const QString &to, bool overwrite = true);
    void unzip(const QString &path);

signals:
    void listFinished(const Reply &reply, const QList<WebDav::ListEntity> &entities);
    void getFinished(const Reply &reply, const QByteArray &data);
    void putFinished(const Reply &reply, const QString &etag);
    void deleteFinished(const Reply &reply);
    void mkcolFinished(const Reply &reply);
    void moveFinished(const Reply &reply);
    void copyFinished(const Reply &reply);
    void unzipFinished(const Reply &reply);

private:
    QScopedPointer<ClientPrivate> d;
};
}

#endif
