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

#ifndef WEBDAV_PUT_H
#define WEBDAV_PUT_H

#include "request_p.h"

class Put : public Request
{
    Q_OBJECT

public:
    Put(WebDav::Transport *transport, Settings *settings, QObject *parent = nullptr);

    void sendData(const QString &remotePath, const QByteArray &data,
                  const QString &contentType = QString());
    QString updatedETag() const;

protected:
    virtual void handleReply(QNetworkReply *reply);

private:
    QString mUpdatedETag;
};

#endif
