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

#include "serverloop.h"
#include "messagechannel.h"
#include "requestdispatcher.h"
#include "../host/identityresolver.h"
#include "../volumes/operationerror.h"
#include <QtCore/QDebug>
#include <cerrno>
#include <cstring>
#include <signal.h>

namespace
{
    Vmdk::ServerLoop* s_signalledLoop = nullptr;

    void handleStopSignal(int signalNumber)
    {
        Q_UNUSED(signalNumber);
        if (s_signalledLoop)
            s_signalledLoop->RequestStop();
    }

    bool setHandler(int signalNumber, void (*handler)(int))
    {
        struct sigaction action;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        action.sa_handler = handler;
        if (sigaction(signalNumber, &action, nullptr) != 0)
        {
            qWarning() << "ServerLoop: failed to set handler for signal" << signalNumber << ":" << strerror(errno);
            return false;
        }
        return true;
    }
} // namespace

namespace Vmdk
{
    ServerLoop::ServerLoop(MessageChannel* channel, IdentityResolver* identity, RequestDispatcher* dispatcher, int maxSkipCount)
        : m_channel(channel), m_identity(identity), m_dispatcher(dispatcher), m_maxSkipCount(maxSkipCount), m_stop(0)
    {
    }

    void ServerLoop::Run()
    {
        if (!this->m_channel->Open())
            throw FatalChannelError("Failed to open request channel: " + this->m_channel->GetLastError());

        int skipCount = this->m_maxSkipCount;
        while (!this->IsStopRequested())
        {
            ChannelRequest request;
            if (!this->m_channel->NextRequest(request))
            {
                if (this->IsStopRequested())
                    break;

                qWarning() << "ServerLoop: VMCI Get Ops failed - ignoring and moving on:" << this->m_channel->GetLastError();
                --skipCount;
                if (skipCount <= 0)
                {
                    this->m_channel->Close();
                    throw FatalChannelError("Too many errors from VMCI Get Ops - giving up.");
                }
                continue;
            }

            skipCount = this->m_maxSkipCount;

            QByteArray reply = this->ProcessRequest(request);
            if (!this->m_channel->Reply(request, reply))
                qWarning() << "ServerLoop: reply to client" << request.clientHandle << "failed:" << this->m_channel->GetLastError();
        }

        qInfo() << "ServerLoop: stop requested, closing channel";
        this->m_channel->Close();
    }

    QByteArray ServerLoop::ProcessRequest(const ChannelRequest& request)
    {
        VmContext vm;
        try
        {
            vm = this->m_identity->Resolve(request.callerToken);
        } catch (const OperationError& error)
        {
            qWarning() << "ServerLoop:" << error.message();
            return RequestDispatcher::ErrorReply(error.message());
        }

        return this->m_dispatcher->HandleRequest(vm, request.payload);
    }

    void ServerLoop::RequestStop()
    {
        this->m_stop.storeRelaxed(1);
    }

    bool ServerLoop::IsStopRequested() const
    {
        return this->m_stop.loadRelaxed() != 0;
    }

    bool ServerLoop::InstallStopSignals(ServerLoop* loop)
    {
        s_signalledLoop = loop;
        return setHandler(SIGINT, handleStopSignal) && setHandler(SIGTERM, handleStopSignal);
    }

    void ServerLoop::RemoveStopSignals()
    {
        setHandler(SIGINT, SIG_DFL);
        setHandler(SIGTERM, SIG_DFL);
        s_signalledLoop = nullptr;
    }
} // namespace Vmdk
