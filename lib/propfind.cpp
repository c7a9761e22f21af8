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

#include "propfind_p.h"
#include "logging_p.h"

PropFind::PropFind(WebDav::Transport *transport, Settings *settings, QObject *parent)
    : Request(transport, settings, "PROPFIND", parent)
{
}

void PropFind::listEntities(const QString &remotePath, const WebDav::Depth &depth)
{
    const QByteArray requestData(QByteArrayLiteral(
            "<D:propfind xmlns:D=\"DAV:\">"
            "<D:allprop/>"
            "</D:propfind>"
    ));
    mEntities.clear();

    QNetworkRequest request;
    if (!prepareRequest(&request, remotePath)) {
        return;
    }
    request.setRawHeader("Depth", depth.headerValue());
    request.setHeader(QNetworkRequest::ContentLengthHeader, requestData.length());
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/xml; charset=utf-8");
    sendRequest(request, requestData);
}

void PropFind::handleReply(QNetworkReply *reply)
{
    if (!readStatus(reply)) {
        return;
    }

    const QByteArray data = reply->readAll();
    debugReply(*reply, data);

    // Only a multistatus answer carries a listing.
    if (statusCode() != 207) {
        finishedWithError(WebDav::Error::statusMismatched(WebDav::Error::DecodeError, statusCode(), 207),
                          data);
        return;
    }

    WebDav::Error error;
    mEntities = WebDav::ListEntity::fromData(data, &error);
    if (error.isError()) {
        finishedWithError(error, data);
    } else {
        qCDebug(lcDav) << "Listed" << mEntities.count() << "entities at" << mUri;
        finishedWithSuccess();
    }
}

const QList<WebDav::ListEntity>& PropFind::entities() const
{
    return mEntities;
}
