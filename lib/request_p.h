/*
 * This file is part of the webdav-client package
 *
 * Copyright (C) 2013 Jolla Ltd. and/or its subsidiary(-ies).
 * Copyright (C) 2026 The webdav-client authors.
 *
 * Contributors: Mani Chandrasekar <maninc@gmail.com>
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
 *
 */

#ifndef WEBDAV_REQUEST_H
#define WEBDAV_REQUEST_H

#include "settings_p.h"
#include "daverror.h"

#include <QObject>
#include <QPointer>
#include <QSharedPointer>
#include <QNetworkReply>
#include <QSslError>
#include <QNetworkRequest>

class DigestSession;

namespace WebDav {
class Transport;
}

class WEBDAV_EXPORT Request : public QObject
{
    Q_OBJECT
public:
    explicit Request(WebDav::Transport *transport,
                     Settings *settings,
                     const QString &requestType,
                     QObject *parent = 0);

    QString command() const;
    bool hasError() const;
    WebDav::Error error() const;
    QByteArray errorData() const;
    int statusCode() const;

    static QUrl joinUrl(const QString &serverAddress, const QString &path);
    static QByteArray destinationPath(const QString &serverAddress, const QString &path);

Q_SIGNALS:
    void finished(const QString &uri);

protected Q_SLOTS:
    virtual void slotSslErrors(QList<QSslError>);
    void requestFinished();

protected:
    bool prepareRequest(QNetworkRequest *request, const QString &requestPath);
    void sendRequest(const QNetworkRequest &request, const QByteArray &data = QByteArray());
    virtual void handleReply(QNetworkReply *reply) = 0;

    bool wasDeleted() const;

    void finishedWithSuccess();
    void finishedWithError(const WebDav::Error &error, const QByteArray &errorData);
    void finishedWithReplyResult(QNetworkReply *reply);
    void finishedWithReplyData(const QByteArray &data);
    bool readStatus(QNetworkReply *reply);

    void debugRequest(const QNetworkRequest &request, const QByteArray &data);
    void debugReply(const QNetworkReply &reply, const QByteArray &data);

    QString debuggingString(const QNetworkRequest &request, const QByteArray &data);
    QString debuggingString(const QNetworkReply &reply, const QByteArray &data);

    WebDav::Transport *mTransport;
    const QString REQUEST_TYPE;
    Settings* mSettings;
    QString mUri;

private:
    void sendAuthorized(const QNetworkRequest &request, const QByteArray &data);
    void sendWithDigest(const QNetworkRequest &request, const QByteArray &data);

    QSharedPointer<DigestSession> mDigestSession;
    QPointer<Request> mSelfPointer;
    int mStatusCode;
    WebDav::Error mError;
    QByteArray mErrorData;
};

#endif // WEBDAV_REQUEST_H
