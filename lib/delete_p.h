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

#ifndef WEBDAV_DELETE_H
#define WEBDAV_DELETE_H

#include "request_p.h"

class Delete : public Request
{
    Q_OBJECT

public:
    Delete(WebDav::Transport *transport, Settings *settings, QObject *parent = nullptr);

    void deleteResource(const QString &remotePath);

protected:
    virtual void handleReply(QNetworkReply *reply);
};

#endif
