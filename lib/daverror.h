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

#ifndef WEBDAV_DAVERROR_H
#define WEBDAV_DAVERROR_H

#include <QString>
#include <QNetworkReply>
#include <QMetaType>

#include "davexport.h"

namespace WebDav {
struct WEBDAV_EXPORT Error
{
    // Which stage failed.
    enum Kind {
        NoError,
        TransportError,
        AuthProbeError,
        AuthComputeError,
        DecodeError,
        ServerError
    };

    // What exactly failed in that stage.
    enum Code {
        None,
        NetworkFailure,
        StatusMismatched,
        NoAuthHeaderInResponse,
        InvalidAuthHeader,
        MissingAuthContext,
        DigestComputation,
        XmlMalformed,
        FieldNotFound,
        FieldNotSupported,
        InvalidFieldValue,
        ServerException
    };

    Kind kind = NoError;
    Code code = None;
    QNetworkReply::NetworkError networkError = QNetworkReply::NoError;
    int responseCode = 0;
    int expectedCode = 0;
    QString field;
    QString value;
    QString exception;
    QString message;

    bool isError() const { return kind != NoError; }
    QString toString() const;

    static Error transport(QNetworkReply::NetworkError error, const QString &message);
    static Error statusMismatched(Kind kind, int responseCode, int expectedCode);
    static Error noAuthHeaderInResponse();
    static Error invalidAuthHeader(const QString &message);
    static Error missingAuthContext();
    static Error digestComputation(const QString &message);
    static Error xmlMalformed(const QString &message);
    static Error fieldNotFound(const QString &field);
    static Error fieldNotSupported(const QString &field);
    static Error invalidFieldValue(const QString &field, const QString &value);
    static Error server(int responseCode, const QString &exception, const QString &message);
};
}

Q_DECLARE_METATYPE(WebDav::Error)

#endif
