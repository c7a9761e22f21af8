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

#include "settings_p.h"
#include "digestsession_p.h"

Settings::Settings()
    : mIgnoreSSLErrors(false)
    , mDigestSession(new DigestSession)
{
}

void Settings::setServerAddress(const QString &serverAddress)
{
    mServerAddress = serverAddress;
}

QString Settings::serverAddress() const
{
    return mServerAddress;
}

void Settings::setAuth(const WebDav::Auth &auth)
{
    mAuth = auth;
    // Requests in flight keep the session they started with.
    mDigestSession.reset(new DigestSession);
}

WebDav::Auth Settings::auth() const
{
    return mAuth;
}

void Settings::setIgnoreSSLErrors(bool ignore)
{
    mIgnoreSSLErrors = ignore;
}

bool Settings::ignoreSSLErrors() const
{
    return mIgnoreSSLErrors;
}

void Settings::addCaCertificates(const QList<QSslCertificate> &certificates)
{
    mCaCertificates += certificates;
}

QList<QSslCertificate> Settings::caCertificates() const
{
    return mCaCertificates;
}

QSharedPointer<DigestSession> Settings::digestSession() const
{
    return mDigestSession;
}
