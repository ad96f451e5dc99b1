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

#ifndef VIM_JSONRPCCLIENT_H
#define VIM_JSONRPCCLIENT_H

#include "../vmdklib_global.h"
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <QtCore/QByteArray>

namespace Vim
{
    /**
     * @brief JSON-RPC 2.0 encoding/decoding for the host agent endpoint
     *
     * Requests are plain JSON-RPC 2.0 objects with an additional "context"
     * member that carries request context values (the caller identity used by
     * the host agent when writing its own logs).
     */
    class VMDKLIB_EXPORT JsonRpcClient
    {
        public:
            /**
             * @brief Build a JSON-RPC 2.0 request
             *
             * @param method The API method name (e.g., "VirtualMachine.ReconfigVM_Task")
             * @param params The parameters array (already converted to QVariant)
             * @param requestId Unique request ID
             * @param context Request context values, omitted when empty
             * @return JSON-RPC request as UTF-8 encoded JSON
             *
             * Output format:
             * {
             *   "jsonrpc": "2.0",
             *   "method": "VirtualMachine.ReconfigVM_Task",
             *   "params": ["session-id", "vm-42", {...}],
             *   "context": {"realUser": "dvolplug"},
             *   "id": 1
             * }
             */
            static QByteArray buildJsonRpcCall(const QString& method, const QVariantList& params,
                                               int requestId, const QVariantMap& context = QVariantMap());

            /**
             * @brief Parse a JSON-RPC 2.0 response
             *
             * @param json The raw JSON response
             * @return The "result" member (or its "Value" member when wrapped in a Status envelope)
             *
             * Throws Failure when the response carries an error object, a
             * {"Status": "Failure"} envelope, or cannot be parsed at all. Fault
             * objects found in error.data are converted with Failure::FromFault().
             */
            static QVariant parseJsonRpcResponse(const QByteArray& json);

            /**
             * @brief Get the last error message
             * @return Error message from last parseJsonRpcResponse() failure
             */
            static QString lastError();

            static int nextRequestId();

        private:
            JsonRpcClient() = delete;

            static QString s_lastError;
            static int s_requestId;
    };
} // namespace Vim

#endif // VIM_JSONRPCCLIENT_H
