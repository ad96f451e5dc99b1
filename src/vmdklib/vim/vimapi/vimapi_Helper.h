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

#ifndef VIMAPI_HELPER_H
#define VIMAPI_HELPER_H

#include "../../vmdklib_global.h"
#include <QString>
#include <QVariant>
#include <QVariantList>

namespace Vim
{
    class Session;
}

namespace VimAPI
{
    /**
     * @brief Shared plumbing of the static call wrappers
     */
    class VMDKLIB_EXPORT Helper
    {
        private:
            Helper() = delete; // Static-only class

        public:
            static const QString NullRef;

            /**
             * @brief Session id of a logged in session
             *
             * Throws Failure(NOT_AUTHENTICATED) when the session is missing or logged out,
             * so callers can treat it the same way as an expired session.
             */
            static QString SessionId(Vim::Session* session);

            /**
             * @brief Send one JSON-RPC call through the session and return its result
             *
             * Throws Failure for transport problems and for faults reported by the host agent.
             * Calls that start work on the host pass allowResend = false.
             */
            static QVariant Invoke(Vim::Session* session, const QString& method, const QVariantList& params, bool allowResend = true);

            /**
             * @brief Check if a managed object reference is null or empty
             */
            static bool IsNullOrEmptyRef(const QString& ref);
    };
}

#endif // VIMAPI_HELPER_H
