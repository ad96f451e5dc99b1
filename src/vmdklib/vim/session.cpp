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

#include "session.h"
#include "network/connection.h"
#include "jsonrpcclient.h"
#include "failure.h"
#include <QtCore/QDebug>

namespace Vim
{
    class Session::Private
    {
        public:
            Connection* connection = nullptr;
            bool loggedIn = false;
            QString sessionId;
            QString realUser;
            QString lastError;
            QStringList lastErrorDescription;
    };

    Session::Session(Connection* connection) : d(new Private)
    {
        this->d->connection = connection;
    }

    Session::~Session()
    {
        if (this->d->loggedIn)
            this->Logout();
        delete this->d;
    }

    bool Session::Login(const QString& username, const QString& realUser)
    {
        this->d->lastError.clear();
        this->d->lastErrorDescription.clear();
        this->d->realUser = realUser;

        if (!this->d->connection)
        {
            this->d->lastError = "No connection object available";
            return false;
        }

        QByteArray response = this->d->connection->SendRequest(this->buildLoginRequest(username));
        if (response.isEmpty())
        {
            this->d->lastError = "Failed to send login request: " + this->d->connection->GetLastError();
            this->d->lastErrorDescription = QStringList() << Failure::TRANSPORT_ERROR << this->d->lastError;
            return false;
        }

        try
        {
            QVariant result = JsonRpcClient::parseJsonRpcResponse(response);
            if (result.toString().isEmpty())
            {
                this->d->lastError = "Host agent returned no session id";
                this->d->lastErrorDescription = QStringList() << Failure::INTERNAL_ERROR << this->d->lastError;
                return false;
            }

            this->d->sessionId = result.toString();
            this->d->loggedIn = true;
            qDebug() << "Session: Login successful as" << username << "sessionId"
                     << this->d->sessionId.left(8) + "...";
            return true;
        } catch (const Failure& failure)
        {
            this->d->lastErrorDescription = failure.errorDescription();
            if (failure.errorCode() == Failure::INVALID_LOGIN)
                this->d->lastError = QString("Authentication failed for '%1'").arg(username);
            else
                this->d->lastError = failure.message();
            return false;
        }
    }

    void Session::Logout()
    {
        if (!this->d->loggedIn)
            return;

        if (this->d->connection && !this->d->sessionId.isEmpty())
        {
            // Best effort, the session may already be gone on the host side
            QByteArray response = this->d->connection->SendRequest(this->buildLogoutRequest());
            if (response.isEmpty())
                qDebug() << "Session: logout request was not answered:" << this->d->connection->GetLastError();
        }

        this->d->sessionId.clear();
        this->d->loggedIn = false;
    }

    bool Session::IsLoggedIn() const
    {
        return this->d->loggedIn;
    }

    QString Session::getSessionId() const
    {
        return this->d->sessionId;
    }

    QString Session::getLastError() const
    {
        return this->d->lastError;
    }

    QStringList Session::getLastErrorDescription() const
    {
        return this->d->lastErrorDescription;
    }

    QVariantMap Session::getRequestContext() const
    {
        QVariantMap context;
        if (!this->d->realUser.isEmpty())
            context.insert("realUser", this->d->realUser);
        return context;
    }

    QByteArray Session::sendApiRequest(const QByteArray& jsonRequest, bool allowResend)
    {
        if (!this->d->connection || !this->d->loggedIn)
        {
            this->d->lastError = "Not connected or not logged in";
            return QByteArray();
        }

        QByteArray response = this->d->connection->SendRequest(jsonRequest, allowResend);
        if (response.isEmpty())
            this->d->lastError = this->d->connection->GetLastError();

        return response;
    }

    QByteArray Session::buildLoginRequest(const QString& username)
    {
        QVariantList params;
        params << username;

        return JsonRpcClient::buildJsonRpcCall("SessionManager.LoginLocal", params,
                                               JsonRpcClient::nextRequestId(), this->getRequestContext());
    }

    QByteArray Session::buildLogoutRequest()
    {
        QVariantList params;
        params << this->d->sessionId;

        return JsonRpcClient::buildJsonRpcCall("SessionManager.Logout", params,
                                               JsonRpcClient::nextRequestId(), this->getRequestContext());
    }
} // namespace Vim
