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

#include "digestsession_p.h"
#include "davtransport.h"
#include "logging_p.h"

#include <QMutexLocker>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTextCodec>

DigestSession::DigestSession()
    : mNonceCount(1)
{
}

DigestSession::~DigestSession()
{
}

bool DigestSession::isEstablished() const
{
    QMutexLocker locker(&mMutex);
    return !mChallenge.isNull();
}

/*!
  Replace the stored challenge with the one read from \param header.
  On failure, the previous challenge, if any, is kept. When the server
  repeats the current nonce, its nonce-count carries over so that no
  count is ever sent twice with the same nonce.
*/
WebDav::Error DigestSession::update(const QByteArray &header)
{
    QScopedPointer<DigestChallenge> challenge(new DigestChallenge);
    QString errorMessage;
    if (!DigestChallenge::parse(header, challenge.data(), &errorMessage)) {
        qCWarning(lcDav) << "Cannot read digest challenge:" << errorMessage;
        return WebDav::Error::invalidAuthHeader(errorMessage);
    }

    QMutexLocker locker(&mMutex);
    if (mChallenge.isNull() || mChallenge->nonce() != challenge->nonce()
        || mChallenge->realm() != challenge->realm()) {
        mNonceCount = 1;
    }
    mChallenge.reset(challenge.take());
    qCDebug(lcDav) << "Digest session established for realm" << mChallenge->realm();
    return WebDav::Error();
}

/*!
  Compute the Authorization header for a \param verb request on \param url.
  The lock is held for the whole computation so that each response gets
  its own nonce-count.
*/
WebDav::Error DigestSession::authorize(const QByteArray &verb, const QUrl &url,
                                       const QString &username, const QString &password,
                                       QByteArray *header)
{
    QMutexLocker locker(&mMutex);
    if (mChallenge.isNull()) {
        return WebDav::Error::missingAuthContext();
    }
    return mChallenge->respond(verb, url, username, password, &mNonceCount, header);
}

/*!
  Send \param request without credentials, expecting the server to reject
  it with a Digest challenge. \param done is called once, in the thread of
  \param context, with the outcome. The session lock is not held while
  waiting for the server.

  Returns the probe reply, so the caller can follow its SSL errors.
*/
QNetworkReply *DigestSession::probe(WebDav::Transport *transport, const QNetworkRequest &request,
                                    const QByteArray &verb, const QByteArray &body,
                                    QObject *context, std::function<void(const WebDav::Error &)> done)
{
    QNetworkRequest probeRequest(request);
    probeRequest.setRawHeader("Authorization", QByteArray());

    qCDebug(lcDav) << "Probing" << verb << "on" << request.url().path() << "for a digest challenge";
    QNetworkReply *reply = transport->send(probeRequest, verb, body);
    QObject::connect(reply, &QNetworkReply::finished, context, [this, reply, done] () {
        reply->deleteLater();

        const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
        if (!status.isValid()) {
            done(WebDav::Error::transport(reply->error(), reply->errorString()));
            return;
        }
        const int code = status.toInt();
        if (code != 401) {
            qCWarning(lcDav) << "Digest probe expected 401, got" << code;
            done(WebDav::Error::statusMismatched(WebDav::Error::AuthProbeError, code, 401));
            return;
        }
        if (!reply->hasRawHeader("WWW-Authenticate")) {
            done(WebDav::Error::noAuthHeaderInResponse());
            return;
        }

        const QByteArray header = reply->rawHeader("WWW-Authenticate");
        QTextCodec::ConverterState state;
        QTextCodec::codecForName("UTF-8")->toUnicode(header.constData(), header.size(), &state);
        if (state.invalidChars > 0) {
            done(WebDav::Error::invalidAuthHeader(QStringLiteral("header is not valid UTF-8")));
            return;
        }
        done(update(header));
    });
    return reply;
}
