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

#ifndef VIM_SESSION_H
#define VIM_SESSION_H

#include "../vmdklib_global.h"
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariantMap>

namespace Vim
{
    class Connection;

    /**
     * @brief One authenticated session with the host agent
     *
     * A Session never re-authenticates on its own. When the host agent
     * reports the session as expired, SessionManager replaces the whole
     * Session object.
     */
    class VMDKLIB_EXPORT Session
    {
        public:
            explicit Session(Connection* connection);
            ~Session();

            Session(const Session&) = delete;
            Session& operator=(const Session&) = delete;

            /**
             * @brief Log in with a local (ticket based) identity
             * @param username Host local account
             * @param realUser Caller identity attached to every request for log correlation
             */
            bool Login(const QString& username, const QString& realUser);
            void Logout();
            bool IsLoggedIn() const;

            QString getSessionId() const;
            QString getLastError() const;
            QStringList getLastErrorDescription() const;

            // Context values sent along with every API call
            QVariantMap getRequestContext() const;

            /**
             * @brief Send an API call, always synchronous
             * @param allowResend false for calls that must not be submitted twice,
             *        see Connection::SendRequest()
             */
            QByteArray sendApiRequest(const QByteArray& jsonRequest, bool allowResend = true);

        private:
            QByteArray buildLoginRequest(const QString& username);
            QByteArray buildLogoutRequest();

            class Private;
            Private* d;
    };
} // namespace Vim

#endif // VIM_SESSION_H
