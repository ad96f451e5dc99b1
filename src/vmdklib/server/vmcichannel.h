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

#ifndef VMDK_VMCICHANNEL_H
#define VMDK_VMCICHANNEL_H

#include "messagechannel.h"
#include <QtCore/QLibrary>

namespace Vmdk
{
    /**
     * @brief MessageChannel on top of the VMCI socket shim library
     *
     * The shim exports:
     *   int vmci_init(void)                                        - listening socket or -1
     *   int vmci_get_one_op(int sock, int32_t* cartel, char* buf, int size)
     *                                                              - client socket or -1
     *   int vmci_reply(int client, const char* reply)              - 0 on success
     *   int vmci_close(int sock)
     */
    class VMDKLIB_EXPORT VmciChannel : public MessageChannel
    {
        public:
            VmciChannel(const QString& libraryPath, int maxRequestSize);
            ~VmciChannel();

            bool Open() override;
            bool NextRequest(ChannelRequest& request) override;
            bool Reply(const ChannelRequest& request, const QByteArray& reply) override;
            void Close() override;
            QString GetLastError() const override;

        private:
            typedef int (*InitFunc)();
            typedef int (*GetOneOpFunc)(int, qint32*, char*, int);
            typedef int (*ReplyFunc)(int, const char*);
            typedef int (*CloseFunc)(int);

            QLibrary m_library;
            int m_maxRequestSize;
            int m_socket;
            QString m_lastError;

            InitFunc m_init;
            GetOneOpFunc m_getOneOp;
            ReplyFunc m_reply;
            CloseFunc m_close;
    };
} // namespace Vmdk

#endif // VMDK_VMCICHANNEL_H
