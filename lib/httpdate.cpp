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

#include "httpdate_p.h"

#include <QLocale>
#include <QRegularExpression>
#include <QStringList>

namespace {
    // IMF-fixdate, or an RFC 2822 date with a numeric zone. The whole
    // value must match.
    const QRegularExpression DATE_PATTERN(QStringLiteral(
        "^(?:(?:Mon|Tue|Wed|Thu|Fri|Sat|Sun), )?"
        "(\\d{1,2}) (Jan|Feb|Mar|Apr|May|Jun|Jul|Aug|Sep|Oct|Nov|Dec) (\\d{4}) "
        "(\\d{2}):(\\d{2}):(\\d{2}) (GMT|[+-]\\d{4})$"));

    const QStringList MONTHS = QStringList()
        << QStringLiteral("Jan") << QStringLiteral("Feb") << QStringLiteral("Mar")
        << QStringLiteral("Apr") << QStringLiteral("May") << QStringLiteral("Jun")
        << QStringLiteral("Jul") << QStringLiteral("Aug") << QStringLiteral("Sep")
        << QStringLiteral("Oct") << QStringLiteral("Nov") << QStringLiteral("Dec");
}

QDateTime HttpDate::parse(const QString &input)
{
    const QRegularExpressionMatch match = DATE_PATTERN.match(input.trimmed());
    if (!match.hasMatch()) {
        return QDateTime();
    }

    const QDate date(match.captured(3).toInt(),
                     MONTHS.indexOf(match.captured(2)) + 1,
                     match.captured(1).toInt());
    const QTime time(match.captured(4).toInt(),
                     match.captured(5).toInt(),
                     match.captured(6).toInt());
    if (!date.isValid() || !time.isValid()) {
        return QDateTime();
    }

    int offset = 0;
    const QString zone = match.captured(7);
    if (zone != QStringLiteral("GMT")) {
        const int hours = zone.mid(1, 2).toInt();
        const int minutes = zone.mid(3, 2).toInt();
        if (minutes > 59) {
            return QDateTime();
        }
        offset = (hours * 60 + minutes) * 60;
        if (zone.startsWith(QLatin1Char('-'))) {
            offset = -offset;
        }
    }

    return QDateTime(date, time, Qt::UTC).addSecs(-offset);
}

QString HttpDate::format(const QDateTime &dateTime)
{
    return QLocale::c().toString(dateTime.toUTC(),
                                 QStringLiteral("ddd, dd MMM yyyy HH:mm:ss 'GMT'"));
}
