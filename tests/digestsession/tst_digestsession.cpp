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

#include <QtTest>
#include <QObject>

#include <digestsession_p.h>

#include "../common/mocktransport.h"

namespace {
    const QByteArray CHALLENGE(
        "Digest realm=\"example.com\", qop=\"auth\", "
        "nonce=\"dcd98b7102dd2f0e8b11d0f600bfb0c093\", "
        "opaque=\"5ccc069c403ebaf9f0171e9517f40e41\"");
}

class tst_DigestSession : public QObject
{
    Q_OBJECT

public:
    tst_DigestSession();
    virtual ~tst_DigestSession();

private slots:
    void update();
    void updateWithBadHeaderKeepsChallenge();
    void authorizeWithoutChallenge();
    void authorizeIncrementsNonceCount();
    void updateWithSameNonceKeepsCount();
    void updateWithNewNonceResetsCount();

    void probe();
    void probeFailure_data();
    void probeFailure();

private:
    void probeWith(DigestSession *session, MockTransport *transport,
                   WebDav::Error *result, const QByteArray &verb = "GET");
};

tst_DigestSession::tst_DigestSession()
{
}

tst_DigestSession::~tst_DigestSession()
{
}

void tst_DigestSession::probeWith(DigestSession *session, MockTransport *transport,
                                  WebDav::Error *result, const QByteArray &verb)
{
    QNetworkRequest request(QUrl(QStringLiteral("http://example.com/dav/file.txt")));
    bool called = false;
    session->probe(transport, request, verb, QByteArray("payload"), this,
                   [&called, result] (const WebDav::Error &error) {
                       called = true;
                       *result = error;
                   });
    QTRY_VERIFY_WITH_TIMEOUT(called, 1000);
}

void tst_DigestSession::update()
{
    DigestSession session;
    QVERIFY(!session.isEstablished());
    QVERIFY(!session.update(CHALLENGE).isError());
    QVERIFY(session.isEstablished());
}

void tst_DigestSession::updateWithBadHeaderKeepsChallenge()
{
    DigestSession session;
    QVERIFY(!session.update(CHALLENGE).isError());

    const WebDav::Error error = session.update("Digest realm=\"example.com\", qop=\"auth\"");
    QCOMPARE(error.kind, WebDav::Error::AuthProbeError);
    QCOMPARE(error.code, WebDav::Error::InvalidAuthHeader);
    QVERIFY(session.isEstablished());

    QByteArray header;
    QVERIFY(!session.authorize("GET", QUrl(QStringLiteral("http://example.com/")),
                               QStringLiteral("user"), QStringLiteral("password"),
                               &header).isError());
    QVERIFY(header.contains("nonce=\"dcd98b7102dd2f0e8b11d0f600bfb0c093\""));
}

void tst_DigestSession::authorizeWithoutChallenge()
{
    DigestSession session;
    QByteArray header;
    const WebDav::Error error = session.authorize("GET", QUrl(QStringLiteral("http://example.com/")),
                                                  QStringLiteral("user"), QStringLiteral("password"),
                                                  &header);
    QCOMPARE(error.kind, WebDav::Error::AuthComputeError);
    QCOMPARE(error.code, WebDav::Error::MissingAuthContext);
    QVERIFY(header.isEmpty());
}

void tst_DigestSession::authorizeIncrementsNonceCount()
{
    DigestSession session;
    QVERIFY(!session.update(CHALLENGE).isError());

    const QUrl url(QStringLiteral("http://example.com/dav/file.txt"));
    QByteArray first, second, third;
    QVERIFY(!session.authorize("GET", url, QStringLiteral("user"), QStringLiteral("password"),
                               &first).isError());
    QVERIFY(!session.authorize("GET", url, QStringLiteral("user"), QStringLiteral("password"),
                               &second).isError());
    QVERIFY(!session.authorize("PUT", url, QStringLiteral("user"), QStringLiteral("password"),
                               &third).isError());
    QVERIFY(first.startsWith("Digest"));
    QVERIFY(first.contains("uri=\"/dav/file.txt\""));
    QVERIFY(first.contains("nc=00000001"));
    QVERIFY(second.contains("nc=00000002"));
    QVERIFY(third.contains("nc=00000003"));
}

void tst_DigestSession::updateWithSameNonceKeepsCount()
{
    DigestSession session;
    QVERIFY(!session.update(CHALLENGE).isError());

    const QUrl url(QStringLiteral("http://example.com/dav/file.txt"));
    QByteArray header;
    QVERIFY(!session.authorize("GET", url, QStringLiteral("user"), QStringLiteral("password"),
                               &header).isError());
    QVERIFY(header.contains("nc=00000001"));

    // A concurrent probe stores the same challenge again.
    QVERIFY(!session.update(CHALLENGE).isError());
    QVERIFY(!session.authorize("GET", url, QStringLiteral("user"), QStringLiteral("password"),
                               &header).isError());
    QVERIFY(header.contains("nc=00000002"));
}

void tst_DigestSession::updateWithNewNonceResetsCount()
{
    DigestSession session;
    QVERIFY(!session.update(CHALLENGE).isError());

    const QUrl url(QStringLiteral("http://example.com/dav/file.txt"));
    QByteArray header;
    QVERIFY(!session.authorize("GET", url, QStringLiteral("user"), QStringLiteral("password"),
                               &header).isError());

    QVERIFY(!session.update("Digest realm=\"example.com\", qop=\"auth\", nonce=\"fresh\"").isError());
    QVERIFY(!session.authorize("GET", url, QStringLiteral("user"), QStringLiteral("password"),
                               &header).isError());
    QVERIFY(header.contains("nonce=\"fresh\""));
    QVERIFY(header.contains("nc=00000001"));
}

void tst_DigestSession::probe()
{
    MockTransport transport;
    transport.fallback = MockResponse(401).withHeader("WWW-Authenticate", CHALLENGE);

    DigestSession session;
    WebDav::Error error;
    probeWith(&session, &transport, &error, "PROPFIND");
    if (QTest::currentTestFailed())
        return;
    QVERIFY2(!error.isError(), qPrintable(error.toString()));
    QVERIFY(session.isEstablished());

    QCOMPARE(transport.sent.count(), 1);
    QCOMPARE(transport.sent[0].verb, QByteArray("PROPFIND"));
    QCOMPARE(transport.sent[0].url(), QUrl(QStringLiteral("http://example.com/dav/file.txt")));
    QCOMPARE(transport.sent[0].body, QByteArray("payload"));
    QVERIFY(!transport.sent[0].hasHeader("Authorization"));
}

void tst_DigestSession::probeFailure_data()
{
    QTest::addColumn<int>("statusCode");
    QTest::addColumn<QByteArray>("header");
    QTest::addColumn<int>("kind");
    QTest::addColumn<int>("code");
    QTest::addColumn<int>("responseCode");

    QTest::newRow("not challenged")
        << 200 << QByteArray()
        << int(WebDav::Error::AuthProbeError) << int(WebDav::Error::StatusMismatched) << 200;
    QTest::newRow("forbidden")
        << 403 << CHALLENGE
        << int(WebDav::Error::AuthProbeError) << int(WebDav::Error::StatusMismatched) << 403;
    QTest::newRow("no header")
        << 401 << QByteArray()
        << int(WebDav::Error::AuthProbeError) << int(WebDav::Error::NoAuthHeaderInResponse) << 401;
    QTest::newRow("no nonce")
        << 401 << QByteArray("Digest realm=\"example.com\"")
        << int(WebDav::Error::AuthProbeError) << int(WebDav::Error::InvalidAuthHeader) << 0;
    QTest::newRow("basic challenge")
        << 401 << QByteArray("Basic realm=\"example.com\"")
        << int(WebDav::Error::AuthProbeError) << int(WebDav::Error::InvalidAuthHeader) << 0;
    QTest::newRow("not utf-8")
        << 401 << QByteArray("Digest realm=\"\xff\xfe\", nonce=\"n\"")
        << int(WebDav::Error::AuthProbeError) << int(WebDav::Error::InvalidAuthHeader) << 0;
    QTest::newRow("connection refused")
        << 0 << QByteArray()
        << int(WebDav::Error::TransportError) << int(WebDav::Error::NetworkFailure) << 0;
}

void tst_DigestSession::probeFailure()
{
    QFETCH(int, statusCode);
    QFETCH(QByteArray, header);
    QFETCH(int, kind);
    QFETCH(int, code);
    QFETCH(int, responseCode);

    MockTransport transport;
    transport.fallback = MockResponse(statusCode);
    if (!header.isEmpty()) {
        transport.fallback.withHeader("WWW-Authenticate", header);
    }

    DigestSession session;
    WebDav::Error error;
    probeWith(&session, &transport, &error);
    if (QTest::currentTestFailed())
        return;
    QCOMPARE(int(error.kind), kind);
    QCOMPARE(int(error.code), code);
    QCOMPARE(error.responseCode, responseCode);
    if (error.code == WebDav::Error::StatusMismatched) {
        QCOMPARE(error.expectedCode, 401);
    }
    QVERIFY(!session.isEstablished());
}

QTEST_MAIN(tst_DigestSession)
#include "tst_digestsession.moc"
