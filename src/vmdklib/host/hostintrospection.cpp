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

#include "hostintrospection.h"
#include "../vim/failure.h"
#include "../vim/jsonrpcclient.h"
#include "../vim/network/connection.h"
#include <QtCore/QDebug>

namespace Vmdk
{
    RpcHostIntrospection::RpcHostIntrospection(Vim::Connection* connection) : m_connection(connection)
    {
    }

    QVariant RpcHostIntrospection::Get(const QString& node)
    {
        QByteArray request = Vim::JsonRpcClient::buildJsonRpcCall("vsi.get", QVariantList() << node,
                                                                  Vim::JsonRpcClient::nextRequestId());
        QByteArray response = this->m_connection->SendRequest(request);
        if (response.isEmpty())
        {
            qWarning() << "RpcHostIntrospection: vsi.get" << node << "failed:" << this->m_connection->GetLastError();
            throw Failure(Failure::TRANSPORT_ERROR, QString("vsi.get %1: %2").arg(node, this->m_connection->GetLastError()));
        }

        return Vim::JsonRpcClient::parseJsonRpcResponse(response);
    }
} // namespace Vmdk
