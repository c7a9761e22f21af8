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

#ifndef WEBDAV_SETTINGS_H
#define WEBDAV_SETTINGS_H

#include <QString>
#include <QList>
#include <QSharedPointer>
#include <QSslCertificate>

#include "davtypes.h"

class DigestSession;

class WEBDAV_EXPORT Settings
{
public:
    Settings();

    void setServerAddress(const QString &serverAddress);
    QString serverAddress() const;

    // Resets the digest session, challenges do not carry over.
    void setAuth(const WebDav::Auth &auth);
    WebDav::Auth auth() const;

    void setIgnoreSSLErrors(bool ignore);
    bool ignoreSSLErrors() const;

    void addCaCertificates(const QList<QSslCertificate> &certificates);
    QList<QSslCertificate> caCertificates() const;

    QSharedPointer<DigestSession> digestSession() const;

private:
    QString mServerAddress;
    WebDav::Auth mAuth;
    bool mIgnoreSSLErrors;
    QList<QSslCertificate> mCaCertificates;
    QSharedPointer<DigestSession> mDigestSession;
};

#endif // WEBDAV_SETTINGS_H
