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

#include "davclient.h"
#include "davtransport.h"

#include <QNetworkAccessManager>
#include <QFile>
#include <QSslCertificate>

#include "settings_p.h"
#include "request_p.h"
#include "propfind_p.h"
#include "get_p.h"
#include "put_p.h"
#include "delete_p.h"
#include "mkcol_p.h"
#include "transfer_p.h"
#include "unzip_p.h"
#include "logging_p.h"

namespace {
    WebDav::Client::Reply reply(const Request &request, const QString &path)
    {
        return WebDav::Client::Reply(path, request.statusCode(),
                                     request.error(),
                                     request.errorData());
    }

    bool isPemFormat(const QByteArray &data)
    {
        return data.left(30).toUpper().contains("-----BEGIN");
    }
}

class WebDav::ClientPrivate
{
public:
    ClientPrivate(const QString &serverAddress)
        : m_transport(nullptr)
    {
        m_settings.setServerAddress(serverAddress);
    }

    ~ClientPrivate()
    {
    }

    Settings m_settings;
    Transport *m_transport;
    QScopedPointer<Transport> m_ownedTransport;
};

/*!
  \class Client

  \preliminary
  \brief A client implementation for WebDAV operations.

  Instances of this class can be used to perform WebDAV operations on
  one server, with one set of credentials. Every operation is
  asynchronous and reports its completion with a dedicated signal
  carrying a Reply.
*/

/*!
  Create a new client to perform DAV operations on \param serverAddress.
  The server address should have the form as http[s]://dav.example.org,
  optionally followed by the path of the DAV root.
*/
WebDav::Client::Client(const QString &serverAddress, QObject *parent)
    : QObject(parent), d(new ClientPrivate(serverAddress))
{
    d->m_ownedTransport.reset(new NetworkTransport(new QNetworkAccessManager(this)));
    d->m_transport = d->m_ownedTransport.data();
}

/*!
  Create a new client sending its requests through \param transport,
  which must outlive the client.
*/
WebDav::Client::Client(const QString &serverAddress, Transport *transport, QObject *parent)
    : QObject(parent), d(new ClientPrivate(serverAddress))
{
    d->m_transport = transport;
}

WebDav::Client::~Client()
{
}

/*!
  Returns the server address as defined on construction.
*/
QString WebDav::Client::serverAddress() const
{
    return d->m_settings.serverAddress();
}

WebDav::Auth WebDav::Client::auth() const
{
    return d->m_settings.auth();
}

/*!
  Set the authentication used for every following request. Any digest
  challenge obtained with previous credentials is forgotten.
*/
void WebDav::Client::setAuth(const Auth &auth)
{
    d->m_settings.setAuth(auth);
}

/*!
  Returns true if the client should ignore SSL errors, like self-signed certificates.
*/
bool WebDav::Client::ignoreSSLErrors() const
{
    return d->m_settings.ignoreSSLErrors();
}

/*!
  Set if the client should ignore SSL errors.
*/
void WebDav::Client::setIgnoreSSLErrors(bool ignore)
{
    d->m_settings.setIgnoreSSLErrors(ignore);
}

/*!
  Trust the certificate stored at \param path, in PEM or DER format,
  for the server connections. Returns false when the file cannot be
  read or holds no certificate.
*/
bool WebDav::Client::setServerCertificate(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcDav) << "Cannot open certificate file" << path << ":" << file.errorString();
        return false;
    }
    const QByteArray data = file.readAll();
    const QList<QSslCertificate> certificates =
        QSslCertificate::fromData(data, isPemFormat(data) ? QSsl::Pem : QSsl::Der);
    if (certificates.isEmpty()) {
        qCWarning(lcDav) << "No certificate found in" << path;
        return false;
    }
    d->m_settings.addCaCertificates(certificates);
    return true;
}

/*!
  Request the properties of the resources at \param path, up to
  \param depth levels below it.

  The decoded entities are exposed in the listFinished() signal, in the
  order of the server answer.
*/
void WebDav::Client::list(const QString &path, const Depth &depth)
{
    PropFind *propfind = new PropFind(d->m_transport, &d->m_settings, this);
    connect(propfind, &Request::finished, this,
            [this, propfind] (const QString &uri) {
                propfind->deleteLater();

                emit listFinished(reply(*propfind, uri), propfind->entities());
            });
    propfind->listEntities(path, depth);
}

/*!
  Download the content of the resource at \param path, exposed in the
  getFinished() signal.
*/
void WebDav::Client::get(const QString &path)
{
    Get *get = new Get(d->m_transport, &d->m_settings, this);
    connect(get, &Request::finished, this,
            [this, get] (const QString &uri) {
                get->deleteLater();

                emit getFinished(reply(*get, uri), get->data());
            });
    get->getResource(path);
}

/*!
  Send \param data to the server at \param path location, with
  \param contentType or application/octet-stream when empty.

  When the operation is complete, the putFinished() signal will be
  emitted. The \param etag of this signal is the new etag of the resource as
  saved on the server. It may be empty if the server configuration don't reply
  with the new etag.
*/
void WebDav::Client::put(const QString &path, const QByteArray &data,
                         const QString &contentType)
{
    Put *put = new Put(d->m_transport, &d->m_settings, this);
    connect(put, &Request::finished, this,
            [this, put] (const QString &uri) {
                put->deleteLater();

                emit putFinished(reply(*put, uri), put->updatedETag());
            });
    put->sendData(path, data, contentType);
}

/*!
  Delete the resource from the server at \param path.
*/
void WebDav::Client::deleteResource(const QString &path)
{
    Delete *del = new Delete(d->m_transport, &d->m_settings, this);
    connect(del, &Request::finished, this,
            [this, del] (const QString &uri) {
                del->deleteLater();

                emit deleteFinished(reply(*del, uri));
            });
    del->deleteResource(path);
}

/*!
  Create a collection at \param path.
*/
void WebDav::Client::mkcol(const QString &path)
{
    MkCol *mkcol = new MkCol(d->m_transport, &d->m_settings, this);
    connect(mkcol, &Request::finished, this,
            [this, mkcol] (const QString &uri) {
                mkcol->deleteLater();

                emit mkcolFinished(reply(*mkcol, uri));
            });
    mkcol->createCollection(path);
}

/*!
  Move or rename the resource at \param from to \param to. Both paths
  are relative to the server address.
*/
void WebDav::Client::move(const QString &from, const QString &to)
{
    Transfer *move = new Transfer(d->m_transport, &d->m_settings, Transfer::Move, this);
    connect(move, &Request::finished, this,
            [this, move] (const QString &uri) {
                move->deleteLater();

                emit moveFinished(reply(*move, uri));
            });
    move->transfer(from, to);
}

/*!
  Copy the resource at \param from to \param to. An existing resource
  at \param to is replaced only when \param overwrite is true.
*/
void WebDav::Client::copy(const QString &from, const QString &to, bool overwrite)
{
    Transfer *copy = new Transfer(d->m_transport, &d->m_settings, Transfer::Copy, this);
    connect(copy, &Request::finished, this,
            [this, copy] (const QString &uri) {
                copy->deleteLater();

                emit copyFinished(reply(*copy, uri));
            });
    copy->transfer(from, to, overwrite);
}

/*!
  Ask the server to extract the archive at \param path in place.
*/
void WebDav::Client::unzip(const QString &path)
{
    Unzip *unzip = new Unzip(d->m_transport, &d->m_settings, this);
    connect(unzip, &Request::finished, this,
            [this, unzip] (const QString &uri) {
                unzip->deleteLater();

                emit unzipFinished(reply(*unzip, uri));
            });
    unzip->unzip(path);
}
