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

#include "unzip_p.h"

#include <QUrlQuery>

Unzip::Unzip(WebDav::Transport *transport, Settings *settings, QObject *parent)
    : Request(transport, settings, "POST", parent)
{
}

void Unzip::unzip(const QString &remotePath)
{
    QUrlQuery form;
    form.addQueryItem(QStringLiteral("method"), QStringLiteral("UNZIP"));
    const QByteArray requestData = form.query(QUrl::FullyEncoded).toUtf8();

    QNetworkRequest request;
    if (!prepareRequest(&request, remotePath)) {
        return;
    }
    request.setHeader(QNetworkRequest::ContentLengthHeader, requestData.length());
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/x-www-form-urlencoded");
    sendRequest(request, requestData);
}

void Unzip::handleReply(QNetworkReply *reply)
{
    finishedWithReplyResult(reply);
}
