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

#ifndef WEBDAV_DAVTRANSPORT_H
#define WEBDAV_DAVTRANSPORT_H

#include <QByteArray>
#include <QNetworkRequest>

#include "davexport.h"

class QNetworkAccessManager;
class QNetworkReply;

namespace WebDav {
/*!
  \class Transport

  \brief Sends one HTTP request and hands back its reply.

  The returned reply belongs to the caller, who releases it with
  deleteLater() once finished() has been emitted. The HTTP status is
  read from QNetworkRequest::HttpStatusCodeAttribute; a reply without
  one never reached the server.
*/
class WEBDAV_EXPORT Transport
{
public:
    virtual ~Transport() {}

    virtual QNetworkReply *send(const QNetworkRequest &request,
                                const QByteArray &verb,
                                const QByteArray &body) = 0;
};

class WEBDAV_EXPORT NetworkTransport : public Transport
{
public:
    explicit NetworkTransport(QNetworkAccessManager *manager);

    QNetworkReply *send(const QNetworkRequest &request,
                        const QByteArray &verb,
                        const QByteArray &body) override;

private:
    QNetworkAccessManager *mManager;
};
}

#endif
