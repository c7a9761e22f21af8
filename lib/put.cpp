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

#include "put_p.h"

Put::Put(WebDav::Transport *transport, Settings *settings, QObject *parent)
    : Request(transport, settings, "PUT", parent)
{
}

void Put::sendData(const QString &remotePath, const QByteArray &data,
                   const QString &contentType)
{
    mUpdatedETag.clear();

    QNetworkRequest request;
    if (!prepareRequest(&request, remotePath)) {
        return;
    }
    request.setHeader(QNetworkRequest::ContentLengthHeader, data.length());
    request.setHeader(QNetworkRequest::ContentTypeHeader,
                      contentType.isEmpty() ? QStringLiteral("application/octet-stream") : contentType);
    sendRequest(request, data);
}

void Put::handleReply(QNetworkReply *reply)
{
    // Server may update the etag as soon as the content is received and send back a new etag
    for (const QNetworkReply::RawHeaderPair &header : reply->rawHeaderPairs()) {
        if (header.first.toLower() == QByteArray("etag")) {
            mUpdatedETag = QString::fromUtf8(header.second);
        }
    }

    finishedWithReplyResult(reply);
}

QString Put::updatedETag() const
{
    return mUpdatedETag;
}
