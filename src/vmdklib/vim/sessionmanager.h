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

#ifndef VIM_SESSIONMANAGER_H
#define VIM_SESSIONMANAGER_H

#include "../vmdklib_global.h"
#include <QtCore/QObject>
#include <QtCore/QSharedPointer>
#include <QtCore/QString>

namespace Vim
{
    class HypervisorClient;
    class Session;

    /**
     * @brief Owns the one authenticated session the service uses
     *
     * Every component that talks to the hypervisor holds a reference to the
     * same SessionManager and asks it for the current session right before a
     * call. Reconnect() replaces the held session as a whole, so a component
     * that fetched the session before the swap keeps a valid (but expired)
     * object until it drops its reference.
     */
    class VMDKLIB_EXPORT SessionManager : public QObject
    {
        Q_OBJECT
        public:
            SessionManager(HypervisorClient* client, const QString& username, const QString& realUser, QObject* parent = nullptr);
            ~SessionManager();

            // Log in; throws Failure when the host agent refuses
            void Connect();

            /**
             * @brief Replace the held session with a freshly authenticated one
             *
             * The old session is only dropped after the new login succeeded,
             * a failed reconnect leaves the previous handle in place and
             * rethrows. Calling it again right after a successful reconnect
             * simply swaps in another fresh session.
             */
            void Reconnect();

            void Disconnect();
            bool IsConnected() const;

            QSharedPointer<Session> GetSession() const;
            HypervisorClient* GetClient() const { return this->m_client; }

            // Identity attached to every call for audit correlation
            QString GetCallerIdentity() const { return this->m_realUser; }

        signals:
            void connected();
            void reconnected();

        private:
            QSharedPointer<Session> login();

            HypervisorClient* m_client;
            QString m_username;
            QString m_realUser;
            QSharedPointer<Session> m_session;
    };
} // namespace Vim

#endif // VIM_SESSIONMANAGER_H
