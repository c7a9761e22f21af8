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

#ifndef WEBDAV_DIGESTCHALLENGE_H
#define WEBDAV_DIGESTCHALLENGE_H

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QUrl>

#include <libfilezilla/http/digest.hpp>

#include "davexport.h"
#include "daverror.h"

/*
  The Digest challenge of a WWW-Authenticate header (RFC 7616), as read
  by libfilezilla's parser.
*/
class WEBDAV_EXPORT DigestChallenge
{
public:
    DigestChallenge();

    static bool parse(const QByteArray &header, DigestChallenge *challenge,
                      QString *errorMessage = nullptr);

    // Computes the Authorization header value for one \a method request
    // on \a url. \a nonceCount is the count of this response, and is
    // advanced by one on success only.
    WebDav::Error respond(const QByteArray &method, const QUrl &url,
                          const QString &username, const QString &password,
                          unsigned int *nonceCount, QByteArray *header) const;

    QString realm() const;
    QString nonce() const;
    QString opaque() const;
    QStringList qop() const;
    QString algorithm() const;
    QString domain() const;
    bool stale() const;

private:
    QString param(const char *name) const;

    fz::http::auth_params mParams;
};

#endif
