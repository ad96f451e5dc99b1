/*
 * Copyright (c) 2025, Petr Bena <petr@bena.rocks>
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */

#include "vimapi_Helper.h"
#include "../session.h"
#include "../jsonrpcclient.h"
#include "../failure.h"
#include <QDebug>

namespace VimAPI
{
    const QString Helper::NullRef = "null";

    QString Helper::SessionId(Vim::Session* session)
    {
        if (!session || !session->IsLoggedIn())
            throw Failure(Failure::NOT_AUTHENTICATED, "Not logged in to the host agent");

        return session->getSessionId();
    }

    QVariant Helper::Invoke(Vim::Session* session, const QString& method, const QVariantList& params, bool allowResend)
    {
        QByteArray request = Vim::JsonRpcClient::buildJsonRpcCall(method, params,
                                                                  Vim::JsonRpcClient::nextRequestId(),
                                                                  session->getRequestContext());
        QByteArray response = session->sendApiRequest(request, allowResend);
        if (response.isEmpty())
        {
            qWarning() << "VimAPI:" << method << "failed:" << session->getLastError();
            throw Failure(Failure::TRANSPORT_ERROR, QString("%1: %2").arg(method, session->getLastError()));
        }

        return Vim::JsonRpcClient::parseJsonRpcResponse(response);
    }

    bool Helper::IsNullOrEmptyRef(const QString& ref)
    {
        return ref.isEmpty() || ref == NullRef;
    }
}
