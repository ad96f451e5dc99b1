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

#ifndef VIM_RPCHYPERVISORCLIENT_H
#define VIM_RPCHYPERVISORCLIENT_H

#include "hypervisorclient.h"

namespace Vim
{
    class Connection;

    /**
     * @brief HypervisorClient talking JSON-RPC to the local host agent
     *
     * All sessions created by Login() share the given connection, which must
     * outlive them.
     */
    class VMDKLIB_EXPORT RpcHypervisorClient : public HypervisorClient
    {
        public:
            explicit RpcHypervisorClient(Connection* connection);

            Session* Login(const QString& username, const QString& realUser) override;
            void Logout(Session* session) override;
            QString FindVmByName(Session* session, const QString& vmName) override;
            DeviceList GetDevices(Session* session, const QString& vmRef) override;
            QString ReconfigureVm(Session* session, const QString& vmRef, const DeviceChangeList& changes) override;
            QString CreateTaskFilter(Session* session, const QStringList& taskRefs) override;
            UpdateSet WaitForUpdates(Session* session, const QString& version) override;
            void DestroyFilter(Session* session, const QString& filterRef) override;

        private:
            Connection* m_connection;
    };
} // namespace Vim

#endif // VIM_RPCHYPERVISORCLIENT_H
