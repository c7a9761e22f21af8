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

#include "digestchallenge_p.h"
#include "logging_p.h"

#include <libfilezilla/logger.hpp>
#include <libfilezilla/uri.hpp>

namespace {
    // Forwards what libfilezilla reports while computing a response.
    class DigestLogger : public fz::logger_interface
    {
    public:
        void do_log(fz::logmsg::type, std::wstring &&msg) override
        {
            mMessage = QString::fromStdWString(msg);
            qCWarning(lcDav) << mMessage;
        }

        QString message() const
        {
            return mMessage;
        }

    private:
        QString mMessage;
    };
}

DigestChallenge::DigestChallenge()
{
}

/*!
  Read the Digest challenge of a WWW-Authenticate \param header into
  \param challenge. Other schemes offered in the same header are ignored.

  Returns false, with a reason in \param errorMessage, when the header has
  no Digest challenge or when that challenge lacks a nonce or a realm.
  \param challenge is left untouched in that case.
*/
bool DigestChallenge::parse(const QByteArray &header, DigestChallenge *challenge,
                            QString *errorMessage)
{
    const fz::http::auth_challenges challenges = fz::http::parse_auth_challenges(header.toStdString());
    const fz::http::auth_challenges::const_iterator digest = challenges.find("Digest");
    if (digest == challenges.cend()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("no Digest challenge in \"%1\"").arg(QString::fromUtf8(header));
        return false;
    }

    fz::http::auth_params params = digest->second;
    if (params.find("nonce") == params.cend()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("missing nonce in Digest challenge");
        return false;
    }
    if (params.find("realm") == params.cend()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("missing realm in Digest challenge");
        return false;
    }

    // libfilezilla looks for an exact "auth" token.
    fz::http::auth_params::iterator qop = params.find("qop");
    if (qop != params.end()) {
        QStringList tokens;
        const QList<QByteArray> values = QByteArray::fromStdString(qop->second).split(',');
        for (const QByteArray &value : values) {
            const QByteArray token = value.trimmed().toLower();
            if (!token.isEmpty())
                tokens.append(QString::fromLatin1(token));
        }
        qop->second = tokens.join(QLatin1Char(',')).toStdString();
    }

    challenge->mParams = params;
    return true;
}

WebDav::Error DigestChallenge::respond(const QByteArray &method, const QUrl &url,
                                       const QString &username, const QString &password,
                                       unsigned int *nonceCount, QByteArray *header) const
{
    fz::uri target;
    target.path_ = url.path(QUrl::FullyDecoded).toStdString();
    if (target.path_.empty()) {
        target.path_ = "/";
    }
    if (url.hasQuery()) {
        target.query_ = url.query(QUrl::FullyEncoded).toStdString();
    }

    DigestLogger logger;
    unsigned int count = *nonceCount;
    const std::string value = fz::http::build_digest_authorization(
        mParams, count, method.toStdString(), target,
        username.toStdString(), password.toStdString(), logger);
    if (value.empty()) {
        return WebDav::Error::digestComputation(logger.message().isEmpty()
                                                ? QStringLiteral("cannot compute digest response")
                                                : logger.message());
    }

    *nonceCount = count;
    *header = QByteArray::fromStdString(value);
    return WebDav::Error();
}

QString DigestChallenge::param(const char *name) const
{
    const fz::http::auth_params::const_iterator it = mParams.find(name);
    if (it == mParams.cend()) {
        return QString();
    }
    return QString::fromStdString(it->second);
}

QString DigestChallenge::realm() const
{
    return param("realm");
}

QString DigestChallenge::nonce() const
{
    return param("nonce");
}

QString DigestChallenge::opaque() const
{
    return param("opaque");
}

QStringList DigestChallenge::qop() const
{
    const QString value = param("qop");
    if (value.isEmpty()) {
        return QStringList();
    }
    return value.split(QLatin1Char(','));
}

QString DigestChallenge::algorithm() const
{
    return param("algorithm");
}

QString DigestChallenge::domain() const
{
    return param("domain");
}

bool DigestChallenge::stale() const
{
    return param("stale").compare(QStringLiteral("true"), Qt::CaseInsensitive) == 0;
}
