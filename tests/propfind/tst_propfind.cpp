/* -*- c-basic-offset: 4 -*- */
/*
 * Copyright (C) 2020 Caliste Damien.
 * Copyright (C) 2026 The webdav-client authors.
 * Contact: Damien Caliste <dcaliste@free.fr>
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
#include <QSignalSpy>

#include <propfind_p.h>

#include "../common/mocktransport.h"

namespace {
    const QByteArray HEADER("<?xml version='1.0' encoding='utf-8'?>");

    QByteArray multistatus(const QByteArray &responses)
    {
        return HEADER + "<d:multistatus xmlns:d='DAV:' xmlns:s='http://sabredav.org/ns' xmlns:card='urn:ietf:params:xml:ns:carddav'>"
            + responses + "</d:multistatus>";
    }

    QDateTime date(int year, int month, int day, int hour = 0, int minute = 0)
    {
        return QDateTime(QDate(year, month, day), QTime(hour, minute), Qt::UTC);
    }

    WebDav::ListEntity file(const QString &href, const QDateTime &lastModified,
                            qint64 contentLength, const QString &contentType,
                            const QString &tag = QString())
    {
        WebDav::ListFile entity;
        entity.href = href;
        entity.lastModified = lastModified;
        entity.contentLength = contentLength;
        entity.contentType = contentType;
        entity.tag = tag;
        return WebDav::ListEntity(entity);
    }

    WebDav::ListEntity folder(const QString &href, const QDateTime &lastModified,
                              const QString &tag = QString(), bool isAddressBook = false,
                              const QVariant &quotaUsed = QVariant(),
                              const QVariant &quotaAvailable = QVariant())
    {
        WebDav::ListFolder entity;
        entity.href = href;
        entity.lastModified = lastModified;
        entity.tag = tag;
        entity.isAddressBook = isAddressBook;
        entity.quotaUsedBytes = quotaUsed;
        entity.quotaAvailableBytes = quotaAvailable;
        return WebDav::ListEntity(entity);
    }
}

class tst_Propfind : public QObject
{
    Q_OBJECT

public:
    tst_Propfind();
    virtual ~tst_Propfind();

public slots:
    void init();
    void cleanup();

private slots:
    void listRequest_data();
    void listRequest();

    void parseListResponse_data();
    void parseListResponse();

    void unexpectedStatus_data();
    void unexpectedStatus();

    void transportFailure();

private:
    void list(const WebDav::Depth &depth = WebDav::Depth::number(1));

    MockTransport *mTransport;
    Settings mSettings;
    PropFind *mRequest;
};

tst_Propfind::tst_Propfind()
{
    mSettings.setServerAddress(QStringLiteral("https://dav.example.org/remote.php/dav/"));
}

tst_Propfind::~tst_Propfind()
{
}

void tst_Propfind::init()
{
    mTransport = new MockTransport;
    mRequest = new PropFind(mTransport, &mSettings);
}

void tst_Propfind::cleanup()
{
    delete mRequest;
    delete mTransport;
}

void tst_Propfind::list(const WebDav::Depth &depth)
{
    QSignalSpy finished(mRequest, &Request::finished);
    mRequest->listEntities(QStringLiteral("/files/user/"), depth);
    QTRY_COMPARE(finished.count(), 1);
    QCOMPARE(finished.first().first().toString(), QStringLiteral("/files/user/"));
}

void tst_Propfind::listRequest_data()
{
    QTest::addColumn<WebDav::Depth>("depth");
    QTest::addColumn<QByteArray>("header");

    QTest::newRow("resource only") << WebDav::Depth::number(0) << QByteArray("0");
    QTest::newRow("children") << WebDav::Depth::number(1) << QByteArray("1");
    QTest::newRow("subtree") << WebDav::Depth::infinity() << QByteArray("infinity");
}

void tst_Propfind::listRequest()
{
    QFETCH(WebDav::Depth, depth);
    QFETCH(QByteArray, header);

    mTransport->fallback = MockResponse(207, multistatus(QByteArray()));
    list(depth);
    if (QTest::currentTestFailed())
        return;

    QCOMPARE(mTransport->sent.length(), 1);
    const SentRequest &sent = mTransport->sent.first();
    QCOMPARE(sent.verb, QByteArray("PROPFIND"));
    QCOMPARE(sent.url(), QUrl(QStringLiteral("https://dav.example.org/remote.php/dav/files/user/")));
    QCOMPARE(sent.header("Depth"), header);
    QCOMPARE(sent.request.header(QNetworkRequest::ContentTypeHeader).toString(),
             QStringLiteral("application/xml; charset=utf-8"));
    QCOMPARE(sent.body, QByteArray("<D:propfind xmlns:D=\"DAV:\"><D:allprop/></D:propfind>"));
    QVERIFY(!mRequest->hasError());
    QVERIFY(mRequest->entities().isEmpty());
}

void tst_Propfind::parseListResponse_data()
{
    QTest::addColumn<QByteArray>("data");
    QTest::addColumn<int>("errorCode");
    QTest::addColumn<QString>("errorField");
    QTest::addColumn<QList<WebDav::ListEntity> >("entities");

    QTest::newRow("empty listing")
        << multistatus(QByteArray())
        << int(WebDav::Error::None)
        << QString()
        << QList<WebDav::ListEntity>();

    QTest::newRow("one file")
        << multistatus("<d:response><d:href>/remote.php/dav/files/user/a.txt</d:href><d:propstat><d:prop>"
                       "<d:getlastmodified>Wed, 10 Apr 2019 14:00:00 GMT</d:getlastmodified>"
                       "<d:getcontentlength>42</d:getcontentlength>"
                       "<d:getcontenttype>text/plain</d:getcontenttype>"
                       "<d:getetag>\"abc\"</d:getetag>"
                       "<d:resourcetype/>"
                       "</d:prop><d:status>HTTP/1.1 200 OK</d:status></d:propstat></d:response>")
        << int(WebDav::Error::None)
        << QString()
        << (QList<WebDav::ListEntity>()
            << file(QStringLiteral("/remote.php/dav/files/user/a.txt"), date(2019, 4, 10, 14),
                    42, QStringLiteral("text/plain"), QStringLiteral("\"abc\"")));

    QTest::newRow("first propstat not found")
        << multistatus("<d:response><d:href>/remote.php/dav/files/user/a.txt</d:href>"
                       "<d:propstat><d:prop><d:getcontentlength/><d:quota-used-bytes/></d:prop>"
                       "<d:status>HTTP/1.1 404 Not Found</d:status></d:propstat>"
                       "<d:propstat><d:prop><d:getlastmodified>Wed, 10 Apr 2019 14:00:00 GMT</d:getlastmodified>"
                       "<d:resourcetype/></d:prop><d:status>HTTP/1.1 200 OK</d:status></d:propstat>"
                       "</d:response>")
        << int(WebDav::Error::None)
        << QString()
        << (QList<WebDav::ListEntity>()
            << file(QStringLiteral("/remote.php/dav/files/user/a.txt"), date(2019, 4, 10, 14),
                    0, QStringLiteral("")));

    QTest::newRow("only the first successful propstat")
        << multistatus("<d:response><d:href>/remote.php/dav/files/user/a.txt</d:href>"
                       "<d:propstat><d:prop><d:getlastmodified>Wed, 10 Apr 2019 14:00:00 GMT</d:getlastmodified></d:prop>"
                       "<d:status>HTTP/1.1 200 OK</d:status></d:propstat>"
                       "<d:propstat><d:prop><d:getcontentlength>42</d:getcontentlength></d:prop>"
                       "<d:status>HTTP/1.1 200 OK</d:status></d:propstat>"
                       "</d:response>")
        << int(WebDav::Error::None)
        << QString()
        << (QList<WebDav::ListEntity>()
            << file(QStringLiteral("/remote.php/dav/files/user/a.txt"), date(2019, 4, 10, 14),
                    0, QStringLiteral("")));

    QTest::newRow("no successful propstat")
        << multistatus("<d:response><d:href>/remote.php/dav/files/user/secret</d:href>"
                       "<d:propstat><d:prop><d:getlastmodified/></d:prop>"
                       "<d:status>HTTP/1.1 403 Forbidden</d:status></d:propstat>"
                       "</d:response>")
        << int(WebDav::Error::FieldNotFound)
        << QStringLiteral("propstat with valid status")
        << QList<WebDav::ListEntity>();

    QTest::newRow("redirect reference")
        << multistatus("<d:response><d:href>/remote.php/dav/files/user/link</d:href>"
                       "<d:propstat><d:prop><d:resourcetype><d:redirectref/></d:resourcetype>"
                       "<d:getlastmodified>Wed, 10 Apr 2019 14:00:00 GMT</d:getlastmodified></d:prop>"
                       "<d:status>HTTP/1.1 200 OK</d:status></d:propstat>"
                       "</d:response>")
        << int(WebDav::Error::FieldNotSupported)
        << QStringLiteral("redirect_ref")
        << QList<WebDav::ListEntity>();

    QTest::newRow("folder with quota")
        << multistatus("<d:response><d:href>/remote.php/dav/files/user/</d:href>"
                       "<d:propstat><d:prop><d:resourcetype><d:collection/></d:resourcetype>"
                       "<d:getlastmodified>Mon, 01 Jan 2024 10:30:00 GMT</d:getlastmodified>"
                       "<d:getetag>\"5f\"</d:getetag>"
                       "<d:quota-used-bytes>1000</d:quota-used-bytes>"
                       "<d:quota-available-bytes>-3</d:quota-available-bytes></d:prop>"
                       "<d:status>HTTP/1.1 200 OK</d:status></d:propstat>"
                       "</d:response>")
        << int(WebDav::Error::None)
        << QString()
        << (QList<WebDav::ListEntity>()
            << folder(QStringLiteral("/remote.php/dav/files/user/"), date(2024, 1, 1, 10, 30),
                      QStringLiteral("\"5f\""), false, qint64(1000), qint64(-3)));

    QTest::newRow("address book without last modification")
        << multistatus("<d:response><d:href>/remote.php/dav/addressbooks/users/user/contacts/</d:href>"
                       "<d:propstat><d:prop><d:resourcetype><d:collection/><card:addressbook/></d:resourcetype></d:prop>"
                       "<d:status>HTTP/1.1 200 OK</d:status></d:propstat>"
                       "<d:propstat><d:prop><d:getlastmodified/></d:prop>"
                       "<d:status>HTTP/1.1 404 Not Found</d:status></d:propstat>"
                       "</d:response>")
        << int(WebDav::Error::None)
        << QString()
        << (QList<WebDav::ListEntity>()
            << folder(QStringLiteral("/remote.php/dav/addressbooks/users/user/contacts/"),
                      QDateTime::fromMSecsSinceEpoch(0, Qt::UTC), QString(), true));

    QTest::newRow("file without last modification")
        << multistatus("<d:response><d:href>/remote.php/dav/files/user/a.txt</d:href>"
                       "<d:propstat><d:prop><d:getcontentlength>42</d:getcontentlength></d:prop>"
                       "<d:status>HTTP/1.1 200 OK</d:status></d:propstat>"
                       "</d:response>")
        << int(WebDav::Error::FieldNotFound)
        << QStringLiteral("last_modified")
        << QList<WebDav::ListEntity>();

    QTest::newRow("empty etag")
        << multistatus("<d:response><d:href>/remote.php/dav/files/user/a.txt</d:href>"
                       "<d:propstat><d:prop><d:getlastmodified>Wed, 10 Apr 2019 14:00:00 GMT</d:getlastmodified>"
                       "<d:getetag></d:getetag><d:getcontenttype></d:getcontenttype></d:prop>"
                       "<d:status>HTTP/1.1 200 OK</d:status></d:propstat>"
                       "</d:response>")
        << int(WebDav::Error::None)
        << QString()
        << (QList<WebDav::ListEntity>()
            << file(QStringLiteral("/remote.php/dav/files/user/a.txt"), date(2019, 4, 10, 14),
                    0, QStringLiteral("")));

    QTest::newRow("invalid last modification")
        << multistatus("<d:response><d:href>/remote.php/dav/files/user/a.txt</d:href>"
                       "<d:propstat><d:prop><d:getlastmodified>2019-04-10</d:getlastmodified></d:prop>"
                       "<d:status>HTTP/1.1 200 OK</d:status></d:propstat>"
                       "</d:response>")
        << int(WebDav::Error::InvalidFieldValue)
        << QStringLiteral("last_modified")
        << QList<WebDav::ListEntity>();

    QTest::newRow("malformed XML")
        << QByteArray("<d:multistatus xmlns:d='DAV:'><d:response>")
        << int(WebDav::Error::XmlMalformed)
        << QString()
        << QList<WebDav::ListEntity>();

    QTest::newRow("server order preserved")
        << multistatus("<d:response><d:href>/remote.php/dav/files/user/</d:href>"
                       "<d:propstat><d:prop><d:resourcetype><d:collection/></d:resourcetype>"
                       "<d:getlastmodified>Mon, 01 Jan 2024 10:30:00 GMT</d:getlastmodified></d:prop>"
                       "<d:status>HTTP/1.1 200 OK</d:status></d:propstat></d:response>"
                       "<d:response><d:href>/remote.php/dav/files/user/z.txt</d:href>"
                       "<d:propstat><d:prop><d:getlastmodified>Tue, 02 Jan 2024 00:00:00 GMT</d:getlastmodified>"
                       "<d:getcontentlength>1</d:getcontentlength></d:prop>"
                       "<d:status>HTTP/1.1 200 OK</d:status></d:propstat></d:response>"
                       "<d:response><d:href>/remote.php/dav/files/user/a.txt</d:href>"
                       "<d:propstat><d:prop><d:getlastmodified>Wed, 03 Jan 2024 00:00:00 GMT</d:getlastmodified>"
                       "<d:getcontentlength>2</d:getcontentlength></d:prop>"
                       "<d:status>HTTP/1.1 200 OK</d:status></d:propstat></d:response>")
        << int(WebDav::Error::None)
        << QString()
        << (QList<WebDav::ListEntity>()
            << folder(QStringLiteral("/remote.php/dav/files/user/"), date(2024, 1, 1, 10, 30))
            << file(QStringLiteral("/remote.php/dav/files/user/z.txt"), date(2024, 1, 2), 1, QStringLiteral(""))
            << file(QStringLiteral("/remote.php/dav/files/user/a.txt"), date(2024, 1, 3), 2, QStringLiteral("")));

    QTest::newRow("one failing response drops the listing")
        << multistatus("<d:response><d:href>/remote.php/dav/files/user/a.txt</d:href>"
                       "<d:propstat><d:prop><d:getlastmodified>Wed, 03 Jan 2024 00:00:00 GMT</d:getlastmodified></d:prop>"
                       "<d:status>HTTP/1.1 200 OK</d:status></d:propstat></d:response>"
                       "<d:response><d:href>/remote.php/dav/files/user/b.txt</d:href>"
                       "<d:propstat><d:prop><d:getcontentlength>2</d:getcontentlength></d:prop>"
                       "<d:status>HTTP/1.1 200 OK</d:status></d:propstat></d:response>")
        << int(WebDav::Error::FieldNotFound)
        << QStringLiteral("last_modified")
        << QList<WebDav::ListEntity>();
}

void tst_Propfind::parseListResponse()
{
    QFETCH(QByteArray, data);
    QFETCH(int, errorCode);
    QFETCH(QString, errorField);
    QFETCH(QList<WebDav::ListEntity>, entities);

    mTransport->fallback = MockResponse(207, data);
    list();
    if (QTest::currentTestFailed())
        return;

    QCOMPARE(int(mRequest->error().code), errorCode);
    QCOMPARE(mRequest->error().field, errorField);
    if (errorCode != WebDav::Error::None) {
        QCOMPARE(mRequest->error().kind, WebDav::Error::DecodeError);
        QCOMPARE(mRequest->errorData(), data);
    }
    QCOMPARE(mRequest->statusCode(), 207);

    const QList<WebDav::ListEntity> response = mRequest->entities();
    QCOMPARE(response.length(), entities.length());
    for (int i = 0; i < entities.length(); ++i) {
        QCOMPARE(response[i].type(), entities[i].type());
        QCOMPARE(response[i].toJson(), entities[i].toJson());
        QCOMPARE(response[i].lastModified(), entities[i].lastModified());
    }
}

void tst_Propfind::unexpectedStatus_data()
{
    QTest::addColumn<int>("status");

    QTest::newRow("plain success") << 200;
    QTest::newRow("not found") << 404;
    QTest::newRow("server failure") << 500;
}

void tst_Propfind::unexpectedStatus()
{
    QFETCH(int, status);

    mTransport->fallback = MockResponse(status, multistatus(QByteArray()));
    list();
    if (QTest::currentTestFailed())
        return;

    QVERIFY(mRequest->hasError());
    QCOMPARE(mRequest->error().kind, WebDav::Error::DecodeError);
    QCOMPARE(mRequest->error().code, WebDav::Error::StatusMismatched);
    QCOMPARE(mRequest->error().responseCode, status);
    QCOMPARE(mRequest->error().expectedCode, 207);
    QCOMPARE(mRequest->statusCode(), status);
    QVERIFY(mRequest->entities().isEmpty());
}

void tst_Propfind::transportFailure()
{
    MockResponse refused(0);
    refused.networkError = QNetworkReply::HostNotFoundError;
    mTransport->fallback = refused;
    list();
    if (QTest::currentTestFailed())
        return;

    QCOMPARE(mRequest->error().kind, WebDav::Error::TransportError);
    QCOMPARE(mRequest->error().code, WebDav::Error::NetworkFailure);
    QCOMPARE(mRequest->error().networkError, QNetworkReply::HostNotFoundError);
}

#include "tst_propfind.moc"
QTEST_MAIN(tst_Propfind)
