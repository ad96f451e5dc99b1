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

#include "vmcichannel.h"
#include <QtCore/QDebug>

namespace Vmdk
{
    VmciChannel::VmciChannel(const QString& libraryPath, int maxRequestSize)
        : m_library(libraryPath), m_maxRequestSize(maxRequestSize), m_socket(-1),
          m_init(nullptr), m_getOneOp(nullptr), m_reply(nullptr), m_close(nullptr)
    {
    }

    VmciChannel::~VmciChannel()
    {
        this->Close();
    }

    bool VmciChannel::Open()
    {
        if (this->m_socket >= 0)
            return true;

        if (!this->m_library.load())
        {
            this->m_lastError = this->m_library.errorString();
            qCritical() << "VmciChannel: failed to load" << this->m_library.fileName() << ":" << this->m_lastError;
            return false;
        }

        this->m_init = reinterpret_cast<InitFunc>(this->m_library.resolve("vmci_init"));
        this->m_getOneOp = reinterpret_cast<GetOneOpFunc>(this->m_library.resolve("vmci_get_one_op"));
        this->m_reply = reinterpret_cast<ReplyFunc>(this->m_library.resolve("vmci_reply"));
        this->m_close = reinterpret_cast<CloseFunc>(this->m_library.resolve("vmci_close"));

        if (!this->m_init || !this->m_getOneOp || !this->m_reply || !this->m_close)
        {
            this->m_lastError = "VMCI library is missing required symbols: " + this->m_library.errorString();
            qCritical() << "VmciChannel:" << this->m_lastError;
            this->m_library.unload();
            return false;
        }

        this->m_socket = this->m_init();
        if (this->m_socket < 0)
        {
            this->m_lastError = "vmci_init failed";
            qCritical() << "VmciChannel:" << this->m_lastError;
            return false;
        }

        qInfo() << "VmciChannel: listening on VMCI socket" << this->m_socket;
        return true;
    }

    bool VmciChannel::NextRequest(ChannelRequest& request)
    {
        if (this->m_socket < 0)
        {
            this->m_lastError = "Channel is not open";
            return false;
        }

        QByteArray buffer(this->m_maxRequestSize, '\0');
        qint32 cartel = 0;
        int client = this->m_getOneOp(this->m_socket, &cartel, buffer.data(), buffer.size());
        if (client == -1)
        {
            this->m_lastError = "vmci_get_one_op failed";
            return false;
        }

        request.clientHandle = client;
        request.callerToken = cartel;
        // The shim NUL-terminates the payload
        int length = buffer.indexOf('\0');
        request.payload = length >= 0 ? buffer.left(length) : buffer;

        qDebug() << "VmciChannel: vmci_get_one_op returns" << client << "buffer" << request.payload;
        return true;
    }

    bool VmciChannel::Reply(const ChannelRequest& request, const QByteArray& reply)
    {
        if (!this->m_reply)
        {
            this->m_lastError = "Channel is not open";
            return false;
        }

        int err = this->m_reply(request.clientHandle, reply.constData());
        qDebug() << "VmciChannel: vmci_reply returned" << err;
        if (err != 0)
        {
            this->m_lastError = QString("vmci_reply failed with %1").arg(err);
            return false;
        }
        return true;
    }

    void VmciChannel::Close()
    {
        if (this->m_socket >= 0 && this->m_close)
        {
            this->m_close(this->m_socket);
            qDebug() << "VmciChannel: closed socket" << this->m_socket;
        }
        this->m_socket = -1;
    }

    QString VmciChannel::GetLastError() const
    {
        return this->m_lastError;
    }
} // namespace Vmdk
