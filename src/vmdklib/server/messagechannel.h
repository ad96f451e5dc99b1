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

#ifndef VMDK_MESSAGECHANNEL_H
#define VMDK_MESSAGECHANNEL_H

#include "../vmdklib_global.h"
#include <QtCore/QByteArray>
#include <QtCore/QString>

namespace Vmdk
{
    struct ChannelRequest
    {
        // Handle the reply has to be sent to
        int clientHandle = -1;
        // Cartel id of the calling guest process
        qint32 callerToken = 0;
        QByteArray payload;
    };

    /**
     * @brief Blocking guest to host request channel
     *
     * One request is received, answered and only then the next one is read.
     */
    class VMDKLIB_EXPORT MessageChannel
    {
        public:
            virtual ~MessageChannel() {}

            virtual bool Open() = 0;

            /**
             * @brief Block until the next request arrives
             * @return false on a receive error; the channel may recover by itself, so the caller can try again
             */
            virtual bool NextRequest(ChannelRequest& request) = 0;

            virtual bool Reply(const ChannelRequest& request, const QByteArray& reply) = 0;

            virtual void Close() = 0;

            virtual QString GetLastError() const = 0;
    };
} // namespace Vmdk

#endif // VMDK_MESSAGECHANNEL_H
