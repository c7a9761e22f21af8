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

#include "get_p.h"

Get::Get(WebDav::Transport *transport, Settings *settings, QObject *parent)
    : Request(transport, settings, "GET", parent)
{
}

void Get::getResource(const QString &remotePath)
{
    mData.clear();

    QNetworkRequest request;
    if (!prepareRequest(&request, remotePath)) {
        return;
    }
    sendRequest(request);
}

void Get::handleReply(QNetworkReply *reply)
{
    if (!readStatus(reply)) {
        return;
    }

    const QByteArray data = reply->readAll();
    if (statusCode() / 100 == 2) {
        // Resource content is not dumped, it may be large or binary.
        debugReply(*reply, QByteArray());
        mData = data;
    } else {
        debugReply(*reply, data);
    }
    finishedWithReplyData(data);
}

QByteArray Get::data() const
{
    return mData;
}
