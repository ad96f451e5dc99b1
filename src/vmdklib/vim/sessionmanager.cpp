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

#include "sessionmanager.h"
#include "hypervisorclient.h"
#include "session.h"
#include "failure.h"
#include <QtCore/QDebug>

namespace Vim
{
    SessionManager::SessionManager(HypervisorClient* client, const QString& username, const QString& realUser, QObject* parent)
        : QObject(parent), m_client(client), m_username(username), m_realUser(realUser)
    {
    }

    SessionManager::~SessionManager()
    {
        this->Disconnect();
    }

    QSharedPointer<Session> SessionManager::login()
    {
        Session* session = this->m_client->Login(this->m_username, this->m_realUser);
        return QSharedPointer<Session>(session);
    }

    void SessionManager::Connect()
    {
        qInfo() << "SessionManager: connecting to host agent as" << this->m_username << "for" << this->m_realUser;
        this->m_session = this->login();
        emit this->connected();
    }

    void SessionManager::Reconnect()
    {
        qInfo() << "SessionManager: session expired, reconnecting";

        QSharedPointer<Session> fresh;
        try
        {
            fresh = this->login();
        } catch (const Failure& failure)
        {
            qCritical() << "SessionManager: reconnect failed:" << failure.what();
            throw;
        }

        // Dropping the last reference to the expired session logs it out best effort
        this->m_session = fresh;

        emit this->reconnected();
    }

    void SessionManager::Disconnect()
    {
        if (!this->m_session)
            return;

        qDebug() << "SessionManager: logging out";
        QSharedPointer<Session> session = this->m_session;
        this->m_session.clear();

        try
        {
            this->m_client->Logout(session.data());
        } catch (const Failure& failure)
        {
            qWarning() << "SessionManager: logout failed:" << failure.what();
        }
    }

    bool SessionManager::IsConnected() const
    {
        return !this->m_session.isNull();
    }

    QSharedPointer<Session> SessionManager::GetSession() const
    {
        return this->m_session;
    }
} // namespace Vim
