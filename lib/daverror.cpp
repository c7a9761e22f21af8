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

#include "daverror.h"

namespace {
    QString kindName(WebDav::Error::Kind kind)
    {
        switch (kind) {
        case WebDav::Error::NoError:
            return QStringLiteral("NoError");
        case WebDav::Error::TransportError:
            return QStringLiteral("Transport");
        case WebDav::Error::AuthProbeError:
            return QStringLiteral("AuthProbe");
        case WebDav::Error::AuthComputeError:
            return QStringLiteral("AuthCompute");
        case WebDav::Error::DecodeError:
            return QStringLiteral("Decode");
        case WebDav::Error::ServerError:
            return QStringLiteral("Server");
        }
        return QString();
    }
}

/*!
  \class Error

  \brief A failure reported by any stage of a DAV operation.

  kind tells which stage failed, code tells what failed in it. The
  remaining members are only meaningful for some codes: responseCode and
  expectedCode for StatusMismatched, field and value for the decoding
  failures, exception and message for ServerException, and networkError
  for NetworkFailure.
*/

QString WebDav::Error::toString() const
{
    switch (code) {
    case None:
        return QStringLiteral("no error");
    case NetworkFailure:
        return QString::fromLatin1("%1 error: network failure %2 (%3)")
            .arg(kindName(kind)).arg(int(networkError)).arg(message);
    case StatusMismatched:
        return QString::fromLatin1("%1 error: status mismatched, got %2 while expecting %3")
            .arg(kindName(kind)).arg(responseCode).arg(expectedCode);
    case NoAuthHeaderInResponse:
        return QString::fromLatin1("%1 error: no WWW-Authenticate header in response")
            .arg(kindName(kind));
    case InvalidAuthHeader:
        return QString::fromLatin1("%1 error: invalid WWW-Authenticate header (%2)")
            .arg(kindName(kind)).arg(message);
    case MissingAuthContext:
        return QString::fromLatin1("%1 error: missing digest authentication context")
            .arg(kindName(kind));
    case DigestComputation:
        return QString::fromLatin1("%1 error: cannot compute digest response (%2)")
            .arg(kindName(kind)).arg(message);
    case XmlMalformed:
        return QString::fromLatin1("%1 error: malformed XML (%2)")
            .arg(kindName(kind)).arg(message);
    case FieldNotFound:
        return QString::fromLatin1("%1 error: field not found '%2'")
            .arg(kindName(kind)).arg(field);
    case FieldNotSupported:
        return QString::fromLatin1("%1 error: field not supported '%2'")
            .arg(kindName(kind)).arg(field);
    case InvalidFieldValue:
        return QString::fromLatin1("%1 error: invalid value '%2' for field '%3'")
            .arg(kindName(kind)).arg(value).arg(field);
    case ServerException:
        return QString::fromLatin1("%1 error: HTTP %2, %3: %4")
            .arg(kindName(kind)).arg(responseCode).arg(exception).arg(message);
    }
    return QString();
}

WebDav::Error WebDav::Error::transport(QNetworkReply::NetworkError error, const QString &message)
{
    Error e;
    e.kind = TransportError;
    e.code = NetworkFailure;
    e.networkError = error;
    e.message = message;
    return e;
}

WebDav::Error WebDav::Error::statusMismatched(Kind kind, int responseCode, int expectedCode)
{
    Error e;
    e.kind = kind;
    e.code = StatusMismatched;
    e.responseCode = responseCode;
    e.expectedCode = expectedCode;
    return e;
}

WebDav::Error WebDav::Error::noAuthHeaderInResponse()
{
    Error e;
    e.kind = AuthProbeError;
    e.code = NoAuthHeaderInResponse;
    e.responseCode = 401;
    return e;
}

WebDav::Error WebDav::Error::invalidAuthHeader(const QString &message)
{
    Error e;
    e.kind = AuthProbeError;
    e.code = InvalidAuthHeader;
    e.message = message;
    return e;
}

WebDav::Error WebDav::Error::missingAuthContext()
{
    Error e;
    e.kind = AuthComputeError;
    e.code = MissingAuthContext;
    return e;
}

WebDav::Error WebDav::Error::digestComputation(const QString &message)
{
    Error e;
    e.kind = AuthComputeError;
    e.code = DigestComputation;
    e.message = message;
    return e;
}

WebDav::Error WebDav::Error::xmlMalformed(const QString &message)
{
    Error e;
    e.kind = DecodeError;
    e.code = XmlMalformed;
    e.message = message;
    return e;
}

WebDav::Error WebDav::Error::fieldNotFound(const QString &field)
{
    Error e;
    e.kind = DecodeError;
    e.code = FieldNotFound;
    e.field = field;
    return e;
}

WebDav::Error WebDav::Error::fieldNotSupported(const QString &field)
{
    Error e;
    e.kind = DecodeError;
    e.code = FieldNotSupported;
    e.field = field;
    return e;
}

WebDav::Error WebDav::Error::invalidFieldValue(const QString &field, const QString &value)
{
    Error e;
    e.kind = DecodeError;
    e.code = InvalidFieldValue;
    e.field = field;
    e.value = value;
    return e;
}

WebDav::Error WebDav::Error::server(int responseCode, const QString &exception, const QString &message)
{
    Error e;
    e.kind = ServerError;
    e.code = ServerException;
    e.responseCode = responseCode;
    e.exception = exception;
    e.message = message;
    return e;
}
