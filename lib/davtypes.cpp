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

#include "davtypes.h"
#include "httpdate_p.h"
#include "logging_p.h"

#include <QStringList>
#include <QJsonValue>

namespace {
    const QString FILE_KEY = QStringLiteral("File");
    const QString FOLDER_KEY = QStringLiteral("Folder");
    const QString HREF_KEY = QStringLiteral("href");
    const QString LAST_MODIFIED_KEY = QStringLiteral("getlastmodified");
    const QString CONTENT_LENGTH_KEY = QStringLiteral("getcontentlength");
    const QString CONTENT_TYPE_KEY = QStringLiteral("getcontenttype");
    const QString TAG_KEY = QStringLiteral("getetag");
    const QString QUOTA_USED_KEY = QStringLiteral("quota-used-bytes");
    const QString QUOTA_AVAILABLE_KEY = QStringLiteral("quota-available-bytes");
    const QString ADDRESS_BOOK_KEY = QStringLiteral("addressbook");

    QJsonValue optionalString(const QString &value)
    {
        return value.isNull() ? QJsonValue() : QJsonValue(value);
    }

    QJsonValue optionalNumber(const QVariant &value)
    {
        return value.isValid() ? QJsonValue(double(value.toLongLong())) : QJsonValue();
    }

    QString stringFromJson(const QJsonObject &json, const QString &key)
    {
        const QJsonValue value = json.value(key);
        return value.isString() ? value.toString() : QString();
    }

    QVariant numberFromJson(const QJsonObject &json, const QString &key)
    {
        const QJsonValue value = json.value(key);
        return value.isDouble() ? QVariant(qint64(value.toDouble())) : QVariant();
    }

    bool commonFromJson(const QJsonObject &json, QString *href, QDateTime *lastModified, QString *tag)
    {
        if (!json.value(HREF_KEY).isString()) {
            return false;
        }
        *href = json.value(HREF_KEY).toString();
        *lastModified = HttpDate::parse(stringFromJson(json, LAST_MODIFIED_KEY));
        *tag = stringFromJson(json, TAG_KEY);
        return lastModified->isValid();
    }
}

QByteArray WebDav::Depth::headerValue() const
{
    switch (kind) {
    case Number:
        return QByteArray::number(value);
    case Infinity:
        return QByteArrayLiteral("infinity");
    }
    return QByteArray();
}

/*!
  Returns the HTTP code of a status line like "HTTP/1.1 200 OK",
  or 0 when the line does not carry one.
*/
int WebDav::PropStat::statusCode() const
{
    const QStringList tokens = status.simplified().split(QLatin1Char(' '));
    return tokens.length() > 1 ? tokens[1].toInt() : 0;
}

bool WebDav::PropStat::isSuccess() const
{
    const QStringList tokens = status.simplified().split(QLatin1Char(' '));
    return tokens.length() > 1 && tokens[1].startsWith(QLatin1Char('2'));
}

WebDav::ListEntity::ListEntity()
    : mType(File)
{
}

WebDav::ListEntity::ListEntity(const ListFile &file)
    : mType(File), mFile(file)
{
}

WebDav::ListEntity::ListEntity(const ListFolder &folder)
    : mType(Folder), mFolder(folder)
{
}

WebDav::ListEntity::Type WebDav::ListEntity::type() const
{
    return mType;
}

bool WebDav::ListEntity::isFile() const
{
    return mType == File;
}

bool WebDav::ListEntity::isFolder() const
{
    return mType == Folder;
}

const WebDav::ListFile &WebDav::ListEntity::file() const
{
    return mFile;
}

const WebDav::ListFolder &WebDav::ListEntity::folder() const
{
    return mFolder;
}

QString WebDav::ListEntity::href() const
{
    switch (mType) {
    case File:
        return mFile.href;
    case Folder:
        return mFolder.href;
    }
    return QString();
}

QString WebDav::ListEntity::tag() const
{
    switch (mType) {
    case File:
        return mFile.tag;
    case Folder:
        return mFolder.tag;
    }
    return QString();
}

QDateTime WebDav::ListEntity::lastModified() const
{
    switch (mType) {
    case File:
        return mFile.lastModified;
    case Folder:
        return mFolder.lastModified;
    }
    return QDateTime();
}

/*!
  Build the entity described by \param response.

  Only the first propstat block with a 2xx status is considered. A
  collection becomes a Folder, anything else a File. Redirect references
  are refused. When it fails, \param error tells why and the returned
  entity should be ignored.
*/
WebDav::ListEntity WebDav::ListEntity::fromResponse(const ListResponse &response, Error *error)
{
    if (error)
        *error = Error();

    const PropStat *authoritative = nullptr;
    for (const PropStat &propStat : response.propStats) {
        if (propStat.isSuccess()) {
            authoritative = &propStat;
            break;
        }
    }
    if (!authoritative) {
        if (error)
            *error = Error::fieldNotFound(QStringLiteral("propstat with valid status"));
        return ListEntity();
    }

    const PropertyBag &prop = authoritative->prop;
    if (prop.resourceType.redirectRef || prop.resourceType.redirectLifetime) {
        if (error)
            *error = Error::fieldNotSupported(QStringLiteral("redirect_ref"));
        return ListEntity();
    }

    if (prop.resourceType.collection) {
        ListFolder folder;
        folder.href = response.href;
        // Some servers omit it on address book roots.
        folder.lastModified = prop.lastModified.isValid()
            ? prop.lastModified
            : QDateTime::fromMSecsSinceEpoch(0, Qt::UTC);
        folder.quotaUsedBytes = prop.quotaUsedBytes;
        folder.quotaAvailableBytes = prop.quotaAvailableBytes;
        folder.tag = prop.tag;
        folder.isAddressBook = prop.resourceType.addressBook;
        return ListEntity(folder);
    }

    if (!prop.lastModified.isValid()) {
        if (error)
            *error = Error::fieldNotFound(QStringLiteral("last_modified"));
        return ListEntity();
    }
    ListFile file;
    file.href = response.href;
    file.lastModified = prop.lastModified;
    file.contentLength = prop.contentLength.isValid() ? prop.contentLength.toLongLong() : 0;
    file.contentType = prop.contentType.isNull() ? QStringLiteral("") : prop.contentType;
    file.tag = prop.tag;
    return ListEntity(file);
}

/*!
  Decode a whole multistatus body. The first failing response aborts the
  decoding, and an empty list is returned.
*/
QList<WebDav::ListEntity> WebDav::ListEntity::fromData(const QByteArray &data, Error *error)
{
    Error readError;
    const QList<ListResponse> responses = ListResponse::fromData(data, &readError);
    if (readError.isError()) {
        if (error)
            *error = readError;
        return QList<ListEntity>();
    }

    QList<ListEntity> entities;
    for (const ListResponse &response : responses) {
        Error entityError;
        const ListEntity entity = fromResponse(response, &entityError);
        if (entityError.isError()) {
            qCWarning(lcDav) << "Cannot decode response for" << response.href
                             << ":" << entityError.toString();
            if (error)
                *error = entityError;
            return QList<ListEntity>();
        }
        entities.append(entity);
    }
    if (error)
        *error = Error();
    return entities;
}

QJsonObject WebDav::ListEntity::toJson() const
{
    QJsonObject content;
    switch (mType) {
    case File:
        content.insert(HREF_KEY, mFile.href);
        content.insert(LAST_MODIFIED_KEY, HttpDate::format(mFile.lastModified));
        content.insert(CONTENT_LENGTH_KEY, double(mFile.contentLength));
        content.insert(CONTENT_TYPE_KEY, mFile.contentType);
        content.insert(TAG_KEY, optionalString(mFile.tag));
        return QJsonObject{{FILE_KEY, content}};
    case Folder:
        content.insert(HREF_KEY, mFolder.href);
        content.insert(LAST_MODIFIED_KEY, HttpDate::format(mFolder.lastModified));
        content.insert(QUOTA_USED_KEY, optionalNumber(mFolder.quotaUsedBytes));
        content.insert(QUOTA_AVAILABLE_KEY, optionalNumber(mFolder.quotaAvailableBytes));
        content.insert(TAG_KEY, optionalString(mFolder.tag));
        content.insert(ADDRESS_BOOK_KEY, mFolder.isAddressBook);
        return QJsonObject{{FOLDER_KEY, content}};
    }
    return QJsonObject();
}

WebDav::ListEntity WebDav::ListEntity::fromJson(const QJsonObject &json, bool *isOk)
{
    if (isOk)
        *isOk = false;

    if (json.value(FILE_KEY).isObject()) {
        const QJsonObject content = json.value(FILE_KEY).toObject();
        ListFile file;
        if (!commonFromJson(content, &file.href, &file.lastModified, &file.tag)) {
            return ListEntity();
        }
        file.contentLength = qint64(content.value(CONTENT_LENGTH_KEY).toDouble());
        file.contentType = content.value(CONTENT_TYPE_KEY).toString();
        if (isOk)
            *isOk = true;
        return ListEntity(file);
    } else if (json.value(FOLDER_KEY).isObject()) {
        const QJsonObject content = json.value(FOLDER_KEY).toObject();
        ListFolder folder;
        if (!commonFromJson(content, &folder.href, &folder.lastModified, &folder.tag)) {
            return ListEntity();
        }
        folder.quotaUsedBytes = numberFromJson(content, QUOTA_USED_KEY);
        folder.quotaAvailableBytes = numberFromJson(content, QUOTA_AVAILABLE_KEY);
        folder.isAddressBook = content.value(ADDRESS_BOOK_KEY).toBool();
        if (isOk)
            *isOk = true;
        return ListEntity(folder);
    }
    return ListEntity();
}
