/*
 * This file is part of the webdav-client package
 *
 * Copyright (C) 2013 Jolla Ltd. and/or its subsidiary(-ies).
 * Copyright (C) 2026 The webdav-client authors.
 *
 * Contributors: Bea Lam <bea.lam@jollamobile.com>
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

#include "request_p.h"
#include "digestsession_p.h"
#include "davtransport.h"
#include "logging_p.h"

#include <QSslConfiguration>
#include <QStringList>
#include <QXmlStreamReader>

namespace {
    /* e.g.:
        <d:error xmlns:d="DAV:" xmlns:s="http://sabredav.org/ns">
          <s:exception>Sabre\DAV\Exception\NotFound</s:exception>
          <s:message>File with name foo could not be located</s:message>
        </d:error>
    */
    WebDav::Error serverError(int code, const QByteArray &data)
    {
        QXmlStreamReader reader(data);
        reader.setNamespaceProcessing(true);

        QString exception;
        QString message;
        bool hasException = false;
        bool hasMessage = false;
        if (reader.readNextStartElement() && reader.name() == "error") {
            while (reader.readNextStartElement()) {
                if (reader.name() == "exception") {
                    exception = reader.readElementText();
                    hasException = true;
                } else if (reader.name() == "message") {
                    message = reader.readElementText();
                    hasMessage = true;
                } else {
                    reader.skipCurrentElement();
                }
            }
        }

        if (reader.hasError() || !hasException || !hasMessage) {
            return WebDav::Error::server(code,
                                         QStringLiteral("server exception and parse error"),
                                         QString::fromUtf8(data));
        }
        return WebDav::Error::server(code, exception, message);
    }
}

Request::Request(WebDav::Transport *transport,
                 Settings *settings,
                 const QString &requestType,
                 QObject *parent)
    : QObject(parent)
    , mTransport(transport)
    , REQUEST_TYPE(requestType)
    , mSettings(settings)
    , mDigestSession(settings->digestSession())
    , mStatusCode(0)
{
    mSelfPointer = this;
}

bool Request::hasError() const
{
    return mError.isError();
}

WebDav::Error Request::error() const
{
    return mError;
}

QByteArray Request::errorData() const
{
    return mErrorData;
}

int Request::statusCode() const
{
    return mStatusCode;
}

QString Request::command() const
{
    return REQUEST_TYPE;
}

/*!
  Returns \param serverAddress and \param path joined by a single slash.
*/
QUrl Request::joinUrl(const QString &serverAddress, const QString &path)
{
    QString base = serverAddress;
    while (base.endsWith(QLatin1Char('/'))) {
        base.chop(1);
    }
    QString relative = path;
    while (relative.startsWith(QLatin1Char('/'))) {
        relative.remove(0, 1);
    }
    return QUrl(base + QLatin1Char('/') + relative);
}

/*!
  Returns the value of a Destination header for \param path: the path of
  \param serverAddress and \param path joined by a single slash.
*/
QByteArray Request::destinationPath(const QString &serverAddress, const QString &path)
{
    QString base = QUrl(serverAddress).path();
    while (base.endsWith(QLatin1Char('/'))) {
        base.chop(1);
    }
    QString relative = path;
    while (relative.startsWith(QLatin1Char('/'))) {
        relative.remove(0, 1);
    }
    return QUrl::toPercentEncoding(base + QLatin1Char('/') + relative, "/");
}

/*!
  Read the HTTP status of \param reply. A reply without one never got an
  answer from the server: the request is then finished with a transport
  error and false is returned.
*/
bool Request::readStatus(QNetworkReply *reply)
{
    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!status.isValid()) {
        qCWarning(lcDav) << "The" << command() << "operation failed with error:" << reply->error();
        finishedWithError(WebDav::Error::transport(reply->error(), reply->errorString()),
                          QByteArray());
        return false;
    }
    mStatusCode = status.toInt();
    return true;
}

void Request::finishedWithReplyResult(QNetworkReply *reply)
{
    if (!readStatus(reply)) {
        return;
    }

    const QByteArray data(reply->readAll());
    debugReply(*reply, data);
    finishedWithReplyData(data);
}

/*!
  Finish according to the status read by readStatus(): any 2xx is a
  success, anything else a server error described by \param data.
*/
void Request::finishedWithReplyData(const QByteArray &data)
{
    if (mStatusCode / 100 == 2) {
        finishedWithSuccess();
    } else {
        qCWarning(lcDav) << "The" << command()
                         << "operation failed with HTTP code:" << mStatusCode;
        finishedWithError(serverError(mStatusCode, data), data);
    }
}

void Request::slotSslErrors(QList<QSslError> errors)
{
    QNetworkReply *reply = qobject_cast<QNetworkReply*>(sender());
    if (!reply) {
        return;
    }

    if (mSettings->ignoreSSLErrors()) {
        qCDebug(lcDav) << "Ignoring SSL error response";
        reply->ignoreSslErrors(errors);
    } else {
        qCWarning(lcDav) << command() << "request received SSL error response!";
    }
}

void Request::requestFinished()
{
    if (wasDeleted()) {
        qCDebug(lcDav) << command() << "request was aborted";
        return;
    }

    QNetworkReply *reply = qobject_cast<QNetworkReply*>(sender());
    if (!reply) {
        finishedWithError(WebDav::Error::transport(QNetworkReply::UnknownNetworkError,
                                                   QStringLiteral("no reply")),
                          QByteArray());
        return;
    }
    reply->deleteLater();

    qCDebug(lcDav) << command() << "request finished:" << reply->error();

    handleReply(reply);
}

void Request::finishedWithError(const WebDav::Error &error, const QByteArray &errorData)
{
    mError = error;
    mErrorData = errorData;
    qCWarning(lcDav) << command() << "request failed at" << mUri << ":" << error.toString();
    emit finished(mUri);
}

void Request::finishedWithSuccess()
{
    mError = WebDav::Error();
    emit finished(mUri);
}

/*!
  Point \param request to \param requestPath on the server. When the
  server address has no host, the request is finished with an error and
  false is returned.
*/
bool Request::prepareRequest(QNetworkRequest *request, const QString &requestPath)
{
    mUri = requestPath;

    const QUrl url = joinUrl(mSettings->serverAddress(), requestPath);
    if (!url.isValid() || url.host().isEmpty()) {
        finishedWithError(WebDav::Error::fieldNotFound(QStringLiteral("host")), QByteArray());
        return false;
    }
    request->setUrl(url);

    const QList<QSslCertificate> certificates = mSettings->caCertificates();
    if (!certificates.isEmpty()) {
        QSslConfiguration configuration = request->sslConfiguration();
        configuration.setCaCertificates(configuration.caCertificates() + certificates);
        request->setSslConfiguration(configuration);
    }
    return true;
}

/*!
  Authenticate \param request with the client credentials and send it.
  With Digest, the first request of a session is preceded by a probe.
*/
void Request::sendRequest(const QNetworkRequest &request, const QByteArray &data)
{
    const WebDav::Auth auth = mSettings->auth();
    switch (auth.mode) {
    case WebDav::Auth::Anonymous:
        sendAuthorized(request, data);
        return;
    case WebDav::Auth::Basic: {
        QNetworkRequest authorized(request);
        authorized.setRawHeader("Authorization",
                                QByteArray("Basic ") + QString::fromLatin1("%1:%2").arg(auth.username, auth.password).toUtf8().toBase64());
        sendAuthorized(authorized, data);
        return;
    }
    case WebDav::Auth::Digest: {
        if (mDigestSession->isEstablished()) {
            sendWithDigest(request, data);
            return;
        }
        QNetworkReply *probe = mDigestSession->probe(mTransport, request,
                                                     REQUEST_TYPE.toLatin1(), data, this,
                                                     [this, request, data] (const WebDav::Error &error) {
            if (error.isError()) {
                finishedWithError(error, QByteArray());
            } else {
                sendWithDigest(request, data);
            }
        });
        connect(probe, &QNetworkReply::sslErrors, this, &Request::slotSslErrors);
        return;
    }
    }
}

void Request::sendWithDigest(const QNetworkRequest &request, const QByteArray &data)
{
    const WebDav::Auth auth = mSettings->auth();
    QByteArray header;
    const WebDav::Error error = mDigestSession->authorize(REQUEST_TYPE.toLatin1(), request.url(),
                                                          auth.username, auth.password,
                                                          &header);
    if (error.isError()) {
        finishedWithError(error, QByteArray());
        return;
    }

    QNetworkRequest authorized(request);
    authorized.setRawHeader("Authorization", header);
    sendAuthorized(authorized, data);
}

void Request::sendAuthorized(const QNetworkRequest &request, const QByteArray &data)
{
    QNetworkReply *reply = mTransport->send(request, REQUEST_TYPE.toLatin1(), data);
    debugRequest(request, data);
    connect(reply, &QNetworkReply::finished, this, &Request::requestFinished);
    connect(reply, &QNetworkReply::sslErrors, this, &Request::slotSslErrors);
}

bool Request::wasDeleted() const
{
    return mSelfPointer == 0;
}

void Request::debugRequest(const QNetworkRequest &request, const QByteArray &data)
{
    if (!lcDavProtocol().isDebugEnabled()) {
        return;
    }
    const QStringList lines = debuggingString(request, data).split('\n', QString::SkipEmptyParts);
    for (QString line : lines) {
        qCDebug(lcDavProtocol) << line.replace('\r', ' ');
    }
}

void Request::debugReply(const QNetworkReply &reply, const QByteArray &data)
{
    if (!lcDavProtocol().isDebugEnabled()) {
        return;
    }
    const QStringList lines = debuggingString(reply, data).split('\n', QString::SkipEmptyParts);
    for (QString line : lines) {
        qCDebug(lcDavProtocol) << line.replace('\r', ' ');
    }
}

QString Request::debuggingString(const QNetworkRequest &request, const QByteArray &data)
{
    QStringList text;
    text += "---------------------------------------------------------------------";
    const QList<QByteArray> &rawHeaderList = request.rawHeaderList();
    for (const QByteArray &rawHeader : rawHeaderList) {
        const QByteArray &rawHeaderData = request.rawHeader(rawHeader);
        if (rawHeader == "Authorization" && rawHeaderData.startsWith("Basic")) {
            text += rawHeader + " : " + "Basic user:password";
        } else {
            text += rawHeader + " : " + rawHeaderData;
        }
    }
    QUrl censoredUrl = request.url();
    if (!censoredUrl.userInfo().isEmpty()) {
        censoredUrl.setUserName(QStringLiteral("user"));
        censoredUrl.setPassword(QStringLiteral("pass"));
    }
    text += "URL = " + censoredUrl.toString();
    text += "Request : " + REQUEST_TYPE +  "\n" + data;
    text += "---------------------------------------------------------------------\n";
    return text.join(QChar('\n'));
}

QString Request::debuggingString(const QNetworkReply &reply, const QByteArray &data)
{
    QStringList text;
    text += "---------------------------------------------------------------------";
    text += REQUEST_TYPE + " response status code: " + reply.attribute(QNetworkRequest::HttpStatusCodeAttribute).toString();
    const QList<QNetworkReply::RawHeaderPair> headers = reply.rawHeaderPairs();
    text += REQUEST_TYPE + " response headers:";
    for (const QNetworkReply::RawHeaderPair &header : headers) {
        text += "\t" + header.first + " : " + header.second;
    }
    if (!data.isEmpty()) {
        text += REQUEST_TYPE + " response data:" + data;
    }
    text += "---------------------------------------------------------------------\n";
    return text.join(QChar('\n'));
}
