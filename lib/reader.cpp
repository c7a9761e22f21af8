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

#include "reader_p.h"
#include "httpdate_p.h"
#include "logging_p.h"

#include <QXmlStreamReader>

Reader::Reader()
{
}

Reader::~Reader()
{
    delete mReader;
}

void Reader::read(const QByteArray &data)
{
    delete mReader;
    mReader = new QXmlStreamReader(data);
    mReader->setNamespaceProcessing(true);
    mValidResponse = false;
    mError = WebDav::Error();
    mResults.clear();

    while (mReader->readNextStartElement()) {
        if (mReader->name() == "multistatus") {
            mValidResponse = true;
            readMultiStatus();
        } else {
            mReader->skipCurrentElement();
        }
    }

    if (mError.isError()) {
        // Already set by fail().
    } else if (mReader->hasError()) {
        mError = WebDav::Error::xmlMalformed(mReader->errorString());
    } else if (!mValidResponse) {
        mError = WebDav::Error::xmlMalformed(QStringLiteral("no multistatus element"));
    }
    if (mError.isError()) {
        qCWarning(lcDav) << "Cannot read multistatus response:" << mError.toString();
        mResults.clear();
    }
}

bool Reader::hasError() const
{
    return mError.isError();
}

WebDav::Error Reader::error() const
{
    return mError;
}

const QList<WebDav::ListResponse>& Reader::results() const
{
    return mResults;
}

void Reader::fail(const WebDav::Error &error)
{
    if (!mError.isError()) {
        mError = error;
    }
    mReader->raiseError(error.toString());
}

void Reader::readMultiStatus()
{
    while (mReader->readNextStartElement()) {
        if (mReader->name() == "response") {
            readResponse();
        } else {
            mReader->skipCurrentElement();
        }
    }
}

void Reader::readResponse()
{
    WebDav::ListResponse response;
    bool hasHref = false;
    while (mReader->readNextStartElement()) {
        if (mReader->name() == "href" && !hasHref) {
            response.href = mReader->readElementText();
            hasHref = true;
        } else if (mReader->name() == "propstat") {
            WebDav::PropStat propStat;
            readPropStat(&propStat);
            response.propStats.append(propStat);
        } else {
            mReader->skipCurrentElement();
        }
    }
    if (mReader->hasError()) {
        return;
    }
    if (!hasHref) {
        fail(WebDav::Error::fieldNotFound(QStringLiteral("href")));
        return;
    }

    mResults.append(response);
}

void Reader::readPropStat(WebDav::PropStat *propStat)
{
    while (mReader->readNextStartElement()) {
        if (mReader->name() == "prop") {
            readProp(&propStat->prop);
        } else if (mReader->name() == "status") {
            propStat->status = mReader->readElementText().trimmed();
        } else {
            mReader->skipCurrentElement();
        }
    }
}

void Reader::readProp(WebDav::PropertyBag *prop)
{
    while (mReader->readNextStartElement()) {
        if (mReader->name() == "getlastmodified") {
            const QString value = mReader->readElementText().trimmed();
            if (!value.isEmpty()) {
                prop->lastModified = HttpDate::parse(value);
                if (!prop->lastModified.isValid()) {
                    fail(WebDav::Error::invalidFieldValue(QStringLiteral("last_modified"), value));
                    return;
                }
            }
        } else if (mReader->name() == "resourcetype") {
            prop->hasResourceType = true;
            readResourceType(&prop->resourceType);
        } else if (mReader->name() == "quota-used-bytes") {
            readNumber(QStringLiteral("quota_used_bytes"), &prop->quotaUsedBytes);
        } else if (mReader->name() == "quota-available-bytes") {
            readNumber(QStringLiteral("quota_available_bytes"), &prop->quotaAvailableBytes);
        } else if (mReader->name() == "getcontentlength") {
            readNumber(QStringLiteral("content_length"), &prop->contentLength);
        } else if (mReader->name() == "getetag") {
            const QString tag = mReader->readElementText();
            if (!tag.isEmpty()) {
                prop->tag = tag;
            }
        } else if (mReader->name() == "getcontenttype") {
            const QString contentType = mReader->readElementText();
            if (!contentType.isEmpty()) {
                prop->contentType = contentType;
            }
        } else if (mReader->name() == "calendar-data") {
            const QString data = mReader->readElementText(QXmlStreamReader::IncludeChildElements).trimmed();
            if (!data.isEmpty()) {
                prop->calendarData = data;
            }
        } else {
            mReader->skipCurrentElement();
        }
    }
}

void Reader::readResourceType(WebDav::ResourceType *resourceType)
{
    /* e.g.:
        <D:resourcetype><card:addressbook xmlns:card="urn:ietf:params:xml:ns:carddav"/><D:collection/></D:resourcetype>
    */
    while (mReader->readNextStartElement()) {
        if (mReader->name() == "collection") {
            resourceType->collection = true;
        } else if (mReader->name() == "redirectref") {
            resourceType->redirectRef = true;
        } else if (mReader->name() == "redirect-lifetime") {
            resourceType->redirectLifetime = true;
        } else if (mReader->name() == "addressbook") {
            resourceType->addressBook = true;
        }
        mReader->skipCurrentElement();
    }
}

void Reader::readNumber(const QString &field, QVariant *number)
{
    const QString value = mReader->readElementText().trimmed();
    if (value.isEmpty()) {
        return;
    }
    bool ok = false;
    const qint64 parsed = value.toLongLong(&ok);
    if (!ok) {
        fail(WebDav::Error::invalidFieldValue(field, value));
        return;
    }
    *number = QVariant(parsed);
}

/*!
  Read a multistatus XML body into its response records, in document
  order. On failure, an empty list is returned and \param error, if not
  null, tells what could not be decoded.
*/
QList<WebDav::ListResponse> WebDav::ListResponse::fromData(const QByteArray &data, WebDav::Error *error)
{
    Reader reader;
    reader.read(data);
    if (error)
        *error = reader.error();
    return reader.results();
}
