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

#ifndef VIM_CONNECTION_H
#define VIM_CONNECTION_H

#include "../../vmdklib_global.h"
#include <QtCore/QByteArray>
#include <QtCore/QMap>
#include <QtCore/QString>

class QSslSocket;

namespace Vim
{
    /**
     * @brief Blocking HTTP transport to the local host agent
     *
     * The service handles exactly one request at a time, so unlike a GUI client
     * there is no worker thread: SendRequest() writes the POST and blocks until
     * the response body was read. A socket dropped by the host agent is
     * re-established transparently on the next request.
     */
    class VMDKLIB_EXPORT Connection
    {
        public:
            static const int NETWORK_TIMEOUT_MS = 30000;

            Connection();
            ~Connection();

            Connection(const Connection&) = delete;
            Connection& operator=(const Connection&) = delete;

            bool ConnectToHost(const QString& hostname, int port, bool useTls);
            void Disconnect();
            bool IsConnected() const;

            QString GetHostname() const;
            int GetPort() const;
            QString GetLastError() const;

            /**
             * @brief Send a JSON-RPC request and BLOCK waiting for the response
             *
             * When the socket turns out to be dropped the request is sent once
             * more over a fresh socket. With allowResend false that only happens
             * if no byte of the request was written, so a call that is not
             * idempotent never reaches the host agent twice.
             * @param data request body
             * @param allowResend resend a request that may already have been delivered
             * @return response body, empty on transport failure (see GetLastError())
             */
            QByteArray SendRequest(const QByteArray& data, bool allowResend = true);

        private:
            bool openSocket();
            QByteArray sendRequestSync(const QByteArray& request, bool& requestSent);
            QByteArray readHttpResponse(QMap<QString, QString>& headers);

            class Private;
            Private* d;
    };
} // namespace Vim

#endif // VIM_CONNECTION_H
