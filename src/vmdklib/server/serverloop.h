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

#ifndef VMDK_SERVERLOOP_H
#define VMDK_SERVERLOOP_H

#include "../vmdklib_global.h"
#include <QtCore/QAtomicInt>
#include <QtCore/QByteArray>

namespace Vmdk
{
    class MessageChannel;
    class IdentityResolver;
    class RequestDispatcher;
    struct ChannelRequest;

    /**
     * @brief Receives requests from the channel and answers them, one at a time
     *
     * A request is fully processed, including any wait for hypervisor tasks,
     * before the next one is read. Receive errors are tolerated up to
     * maxSkipCount in a row since the channel reopens its socket by itself;
     * any successful receive resets the count.
     */
    class VMDKLIB_EXPORT ServerLoop
    {
        public:
            ServerLoop(MessageChannel* channel, IdentityResolver* identity, RequestDispatcher* dispatcher, int maxSkipCount);

            /**
             * @brief Serve until RequestStop() or until the channel gives up
             * @throws FatalChannelError when the channel can't be opened or keeps failing
             */
            void Run();

            // Safe to call from a signal handler
            void RequestStop();
            bool IsStopRequested() const;

            /**
             * @brief Make SIGINT and SIGTERM call RequestStop() on loop
             *
             * The handlers are installed without SA_RESTART so a receive blocked
             * in the channel returns with EINTR and Run() sees the stop request.
             */
            static bool InstallStopSignals(ServerLoop* loop);
            static void RemoveStopSignals();

            QByteArray ProcessRequest(const ChannelRequest& request);

        private:
            MessageChannel* m_channel;
            IdentityResolver* m_identity;
            RequestDispatcher* m_dispatcher;
            int m_maxSkipCount;
            QAtomicInt m_stop;
    };
} // namespace Vmdk

#endif // VMDK_SERVERLOOP_H
