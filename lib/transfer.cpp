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

#include "transfer_p.h"

Transfer::Transfer(WebDav::Transport *transport, Settings *settings, Mode mode,
                   QObject *parent)
    : Request(transport, settings, mode == Move ? "MOVE" : "COPY", parent)
    , mMode(mode)
{
}

/*!
  Send \param fromPath to \param toPath. \param overwrite is only
  meaningful for a copy, a move never sends the Overwrite header.
*/
void Transfer::transfer(const QString &fromPath, const QString &toPath, bool overwrite)
{
    QNetworkRequest request;
    if (!prepareRequest(&request, fromPath)) {
        return;
    }
    request.setRawHeader("Destination", destinationPath(mSettings->serverAddress(), toPath));
    switch (mMode) {
    case Move:
        break;
    case Copy:
        request.setRawHeader("Overwrite", overwrite ? "T" : "F");
        break;
    }
    sendRequest(request);
}

void Transfer::handleReply(QNetworkReply *reply)
{
    finishedWithReplyResult(reply);
}
