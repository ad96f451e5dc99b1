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

#include "connection.h"
#include <QtNetwork/QSslSocket>
#include <QtNetwork/QSslConfiguration>
#include <QtCore/QDebug>

namespace Vim
{
    class Connection::Private
    {
        public:
            QSslSocket* socket = nullptr;
            QString hostname;
            int port = 443;
            bool useTls = true;
            QString lastError;
    };

    Connection::Connection() : d(new Private)
    {
    }

    Connection::~Connection()
    {
        this->Disconnect();
        delete this->d;
    }

    bool Connection::ConnectToHost(const QString& hostname, int port, bool useTls)
    {
        this->Disconnect();

        this->d->hostname = hostname;
        this->d->port = port;
        this->d->useTls = useTls;

        return this->openSocket();
    }

    void Connection::Disconnect()
    {
        if (!this->d->socket)
            return;

        if (this->d->socket->state() == QAbstractSocket::ConnectedState)
        {
            this->d->socket->disconnectFromHost();
            if (this->d->socket->state() != QAbstractSocket::UnconnectedState)
                this->d->socket->waitForDisconnected(1000);
        }

        delete this->d->socket;
        this->d->socket = nullptr;
    }

    bool Connection::IsConnected() const
    {
        return this->d->socket && this->d->socket->state() == QAbstractSocket::ConnectedState;
    }

    QString Connection::GetHostname() const
    {
        return this->d->hostname;
    }

    int Connection::GetPort() const
    {
        return this->d->port;
    }

    QString Connection::GetLastError() const
    {
        return this->d->lastError;
    }

    bool Connection::openSocket()
    {
        this->Disconnect();
        this->d->lastError.clear();

        this->d->socket = new QSslSocket();

        if (this->d->useTls)
        {
            // The host agent listens on localhost with a self-signed certificate
            QSslConfiguration sslConfig = this->d->socket->sslConfiguration();
            sslConfig.setPeerVerifyMode(QSslSocket::VerifyNone);
            this->d->socket->setSslConfiguration(sslConfig);
            this->d->socket->connectToHostEncrypted(this->d->hostname, this->d->port);
        } else
        {
            this->d->socket->connectToHost(this->d->hostname, this->d->port);
        }

        if (!this->d->socket->waitForConnected(NETWORK_TIMEOUT_MS))
        {
            this->d->lastError = QString("Failed to connect to %1:%2 - %3")
                                     .arg(this->d->hostname)
                                     .arg(this->d->port)
                                     .arg(this->d->socket->errorString());
            qWarning() << "Connection:" << this->d->lastError;
            return false;
        }

        if (this->d->useTls && !this->d->socket->waitForEncrypted(NETWORK_TIMEOUT_MS))
        {
            this->d->lastError = QString("SSL handshake with %1 failed - %2")
                                     .arg(this->d->hostname)
                                     .arg(this->d->socket->errorString());
            qWarning() << "Connection:" << this->d->lastError;
            return false;
        }

        qDebug() << "Connection: connected to" << this->d->hostname << ":" << this->d->port;
        return true;
    }

    QByteArray Connection::SendRequest(const QByteArray& data, bool allowResend)
    {
        if (this->d->hostname.isEmpty())
        {
            this->d->lastError = "No host configured";
            return QByteArray();
        }

        // Keep-alive connections are closed by the host agent when idle
        if (!this->IsConnected() && !this->openSocket())
            return QByteArray();

        bool requestSent = false;
        QByteArray response = this->sendRequestSync(data, requestSent);
        if (response.isEmpty() && !this->IsConnected())
        {
            if (requestSent && !allowResend)
            {
                qWarning() << "Connection: socket dropped after the request was sent, not resending";
                return QByteArray();
            }

            qDebug() << "Connection: socket dropped during request, reconnecting once";
            if (!this->openSocket())
                return QByteArray();
            response = this->sendRequestSync(data, requestSent);
        }

        return response;
    }

    QByteArray Connection::sendRequestSync(const QByteArray& request, bool& requestSent)
    {
        requestSent = false;

        QByteArray httpRequest;
        httpRequest += "POST /sdk/jsonrpc HTTP/1.1\r\n";
        httpRequest += "Host: " + this->d->hostname.toUtf8() + "\r\n";
        httpRequest += "User-Agent: vmdkopsd/1.0\r\n";
        httpRequest += "Content-Type: application/json\r\n";
        httpRequest += "Content-Length: " + QByteArray::number(request.size()) + "\r\n";
        httpRequest += "Connection: keep-alive\r\n";
        httpRequest += "\r\n";
        httpRequest += request;

        qint64 written = this->d->socket->write(httpRequest);
        requestSent = written > 0;
        if (written != httpRequest.size())
        {
            this->d->lastError = "Failed to write complete request";
            qWarning() << "Connection:" << this->d->lastError;
            return QByteArray();
        }

        if (!this->d->socket->waitForBytesWritten(NETWORK_TIMEOUT_MS))
        {
            this->d->lastError = "Timeout waiting for bytes written - " + this->d->socket->errorString();
            qWarning() << "Connection:" << this->d->lastError;
            return QByteArray();
        }

        // WaitForUpdates is a long poll, the response may take a while
        while (this->d->socket->bytesAvailable() == 0)
        {
            if (this->d->socket->waitForReadyRead(NETWORK_TIMEOUT_MS))
                break;
            if (this->d->socket->state() != QAbstractSocket::ConnectedState)
            {
                this->d->lastError = "Connection closed while waiting for response - " + this->d->socket->errorString();
                qWarning() << "Connection:" << this->d->lastError;
                return QByteArray();
            }
        }

        QMap<QString, QString> headers;
        return this->readHttpResponse(headers);
    }

    QByteArray Connection::readHttpResponse(QMap<QString, QString>& headers)
    {
        QByteArray statusLine;

        // Read until we have the headers
        while (this->d->socket->canReadLine() || this->d->socket->waitForReadyRead(5000))
        {
            QByteArray line = this->d->socket->readLine();

            if (statusLine.isEmpty())
            {
                statusLine = line.trimmed();
                continue;
            }

            // Empty line marks end of headers
            if (line == "\r\n" || line == "\n")
                break;

            int colonPos = line.indexOf(':');
            if (colonPos > 0)
            {
                QString headerName = QString::fromLatin1(line.left(colonPos)).trimmed();
                QString headerValue = QString::fromLatin1(line.mid(colonPos + 1)).trimmed();
                headers[headerName.toLower()] = headerValue;
            }
        }

        const QList<QByteArray> statusParts = statusLine.split(' ');
        if (statusParts.size() < 2)
        {
            this->d->lastError = QString("Invalid HTTP response: %1").arg(QString::fromLatin1(statusLine));
            qWarning() << "Connection:" << this->d->lastError;
            return QByteArray();
        }

        // JSON-RPC faults are delivered with 500 as well, only the body matters
        int statusCode = statusParts[1].toInt();
        if (statusCode != 200 && statusCode != 500)
        {
            this->d->lastError = QString("HTTP error %1").arg(statusCode);
            qWarning() << "Connection:" << this->d->lastError;
            return QByteArray();
        }

        int contentLength = headers.value("content-length", "-1").toInt();

        QByteArray body;
        if (contentLength > 0)
        {
            while (body.size() < contentLength)
            {
                if (this->d->socket->bytesAvailable() > 0 || this->d->socket->waitForReadyRead(5000))
                {
                    body += this->d->socket->read(contentLength - body.size());
                } else
                {
                    this->d->lastError = "Timeout reading response body";
                    qWarning() << "Connection:" << this->d->lastError;
                    return QByteArray();
                }
            }
        } else
        {
            // No Content-Length, read until connection closes or timeout
            body += this->d->socket->readAll();
            while (this->d->socket->waitForReadyRead(1000))
                body += this->d->socket->readAll();
        }

        if (headers.value("connection").compare("close", Qt::CaseInsensitive) == 0)
            this->Disconnect();

        return body;
    }
} // namespace Vim
