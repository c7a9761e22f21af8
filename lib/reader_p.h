/*
 * This file is part of the webdav-client package
 *
 * Copyright (C) 2013 Jolla Ltd. and/or its subsidiary(-ies).
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
 *
 */

#ifndef WEBDAV_READER_H
#define WEBDAV_READER_H

#include <QByteArray>
#include <QList>

#include "davtypes.h"

class QXmlStreamReader;

class Reader
{
public:
    Reader();
    ~Reader();

    void read(const QByteArray &data);
    bool hasError() const;
    WebDav::Error error() const;
    const QList<WebDav::ListResponse>& results() const;

private:
    void readMultiStatus();
    void readResponse();
    void readPropStat(WebDav::PropStat *propStat);
    void readProp(WebDav::PropertyBag *prop);
    void readResourceType(WebDav::ResourceType *resourceType);
    void readNumber(const QString &field, QVariant *number);
    void fail(const WebDav::Error &error);

private:
    QXmlStreamReader *mReader = nullptr;
    bool mValidResponse = false;
    WebDav::Error mError;
    QList<WebDav::ListResponse> mResults;
};

#endif // WEBDAV_READER_H
