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

#include "davtransport.h"

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QBuffer>

WebDav::NetworkTransport::NetworkTransport(QNetworkAccessManager *manager)
    : mManager(manager)
{
}

QNetworkReply *WebDav::NetworkTransport::send(const QNetworkRequest &request,
                                              const QByteArray &verb,
                                              const QByteArray &body)
{
    if (body.isEmpty()) {
        return mManager->sendCustomRequest(request, verb);
    }

    QBuffer *buffer = new QBuffer;
    buffer->setData(body);
    QNetworkReply *reply = mManager->sendCustomRequest(request, verb, buffer);
    buffer->setParent(reply);
    return reply;
}
