/*
 * This file is part of the webdav-client package
 *
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

#ifndef WEBDAV_DIGESTSESSION_H
#define WEBDAV_DIGESTSESSION_H

#include <QByteArray>
#include <QMutex>
#include <QScopedPointer>
#include <QUrl>

#include <functional>

#include "davexport.h"
#include "daverror.h"
#include "digestchallenge_p.h"

class QObject;
class QNetworkReply;
class QNetworkRequest;

namespace WebDav {
class Transport;
}

/*
  The Digest state shared by every request of one client: absent until a
  probe succeeds, then reused for every later request.
*/
class WEBDAV_EXPORT DigestSession
{
public:
    DigestSession();
    ~DigestSession();

    bool isEstablished() const;

    WebDav::Error update(const QByteArray &header);

    WebDav::Error authorize(const QByteArray &verb, const QUrl &url,
                            const QString &username, const QString &password,
                            QByteArray *header);

    QNetworkReply *probe(WebDav::Transport *transport, const QNetworkRequest &request,
                         const QByteArray &verb, const QByteArray &body,
                         QObject *context, std::function<void(const WebDav::Error &)> done);

private:
    Q_DISABLE_COPY(DigestSession)

    mutable QMutex mMutex;
    QScopedPointer<DigestChallenge> mChallenge;
    // Nonce-count of the next response.
    unsigned int mNonceCount;
};

#endif
