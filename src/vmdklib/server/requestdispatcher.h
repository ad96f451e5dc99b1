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

#ifndef VMDK_REQUESTDISPATCHER_H
#define VMDK_REQUESTDISPATCHER_H

#include "../vmdklib_global.h"
#include "../host/vmcontext.h"
#include "../utils/serviceconfig.h"
#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <QtCore/QVariantMap>

namespace Vmdk
{
    class VmdkManager;
    class DiskAttacher;
    class ToolRunner;

    /**
     * @brief Turns one request envelope into one reply
     *
     * Request: {"cmd": "create", "details": {"Name": "vol1", "Opts": {"size": "1gb"}}}
     * Reply:   the result of the command, null for commands without a result,
     *          or {"Error": "message"}
     */
    class VMDKLIB_EXPORT RequestDispatcher
    {
        public:
            RequestDispatcher(VmdkManager* volumes, DiskAttacher* attacher, ToolRunner* toolRunner, const ServiceConfig& config);

            // Never throws, every failure ends up in an error reply
            QByteArray HandleRequest(const VmContext& vm, const QByteArray& payload);

            /**
             * @brief Run a command on behalf of vm
             * @return result of the command, an invalid QVariant when there is none
             * @throws OperationError, Failure
             */
            QVariant Execute(const VmContext& vm, const QString& cmd, const QString& volumeName, const QVariantMap& options);

            /**
             * @brief Volume directory for VMs on the datastore of configPath
             *
             * The directory sits next to the VM's own folder and is created
             * when it doesn't exist yet.
             * @throws OperationError
             */
            QString GetVolumePath(const QString& configPath);

            static QByteArray ErrorReply(const QString& message);
            static QByteArray SerializeResult(const QVariant& result);

        private:
            VmdkManager* m_volumes;
            DiskAttacher* m_attacher;
            ToolRunner* m_toolRunner;
            ServiceConfig m_config;
    };
} // namespace Vmdk

#endif // VMDK_REQUESTDISPATCHER_H
