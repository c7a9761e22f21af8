/*
 * This file is part of the webdav-client package
 *
 * Copyright (C) 2025 Damien Caliste <dcaliste@free.fr>
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

#ifndef WEBDAV_DAVTYPES_H
#define WEBDAV_DAVTYPES_H

#include <QString>
#include <QList>
#include <QDateTime>
#include <QVariant>
#include <QJsonObject>
#include <QMetaType>

#include "davexport.h"
#include "daverror.h"

namespace WebDav {
struct WEBDAV_EXPORT Auth {
    enum Mode {
        Anonymous,
        Basic,
        Digest
    };

    Mode mode = Anonymous;
    QString username;
    QString password;

    Auth() {}
    Auth(Mode mode, const QString &username, const QString &password)
        : mode(mode), username(username), password(password) {}

    static Auth anonymous() { return Auth(); }
    static Auth basic(const QString &username, const QString &password)
    {
        return Auth(Basic, username, password);
    }
    static Auth digest(const QString &username, const QString &password)
    {
        return Auth(Digest, username, password);
    }

    bool operator==(const Auth &other) const
    {
        return mode == other.mode
            && username == other.username
            && password == other.password;
    }
};

struct WEBDAV_EXPORT Depth {
    enum Kind {
        Number,
        Infinity
    };

    Kind kind = Number;
    int value = 0;

    Depth() {}
    Depth(Kind kind, int value) : kind(kind), value(value) {}

    static Depth number(int value) { return Depth(Number, value); }
    static Depth infinity() { return Depth(Infinity, 0); }

    QByteArray headerValue() const;
};

struct WEBDAV_EXPORT ResourceType {
    bool collection = false;
    bool redirectRef = false;
    bool redirectLifetime = false;
    bool addressBook = false;
};

// Properties of one propstat block. Absent values are an invalid
// QDateTime, an invalid QVariant or a null QString.
struct WEBDAV_EXPORT PropertyBag {
    QDateTime lastModified;
    bool hasResourceType = false;
    ResourceType resourceType;
    QVariant quotaUsedBytes;
    QVariant quotaAvailableBytes;
    QString tag;
    QVariant contentLength;
    QString contentType;
    QString calendarData;
};

struct WEBDAV_EXPORT PropStat {
    QString status;
    PropertyBag prop;

    int statusCode() const;
    bool isSuccess() const;
};

struct WEBDAV_EXPORT ListResponse {
    QString href;
    QList<PropStat> propStats;

    static QList<ListResponse> fromData(const QByteArray &data, Error *error = nullptr);
};

struct WEBDAV_EXPORT ListFile {
    QString href;
    QDateTime lastModified;
    qint64 contentLength = 0;
    QString contentType;
    QString tag;
};

struct WEBDAV_EXPORT ListFolder {
    QString href;
    QDateTime lastModified;
    QVariant quotaUsedBytes;
    QVariant quotaAvailableBytes;
    QString tag;
    bool isAddressBook = false;
};

class WEBDAV_EXPORT ListEntity
{
public:
    enum Type {
        File,
        Folder
    };

    ListEntity();
    ListEntity(const ListFile &file);
    ListEntity(const ListFolder &folder);

    Type type() const;
    bool isFile() const;
    bool isFolder() const;

    const ListFile &file() const;
    const ListFolder &folder() const;

    QString href() const;
    QString tag() const;
    QDateTime lastModified() const;

    QJsonObject toJson() const;

    static ListEntity fromResponse(const ListResponse &response, Error *error = nullptr);
    static QList<ListEntity> fromData(const QByteArray &data, Error *error = nullptr);
    static ListEntity fromJson(const QJsonObject &json, bool *isOk = nullptr);

private:
    Type mType;
    ListFile mFile;
    ListFolder mFolder;
};
}

Q_DECLARE_METATYPE(WebDav::Depth)
Q_DECLARE_METATYPE(WebDav::ListEntity)

#endif
