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

#ifndef VIM_HYPERVISORCLIENT_H
#define VIM_HYPERVISORCLIENT_H

#include "../vmdklib_global.h"
#include "virtualdevice.h"
#include "propertyupdate.h"
#include <QtCore/QString>
#include <QtCore/QStringList>

namespace Vim
{
    class Session;

    /**
     * @brief Calls the volume service makes against the hypervisor
     *
     * Every call except Login reports failures by throwing Failure; callers
     * decide what to do about Failure::AuthExpired. Implementations never
     * retry on their own.
     */
    class VMDKLIB_EXPORT HypervisorClient
    {
        public:
            virtual ~HypervisorClient() {}

            /**
             * @brief Authenticate and return a new logged in session
             * @return session owned by the caller; throws Failure when login fails
             */
            virtual Session* Login(const QString& username, const QString& realUser) = 0;
            virtual void Logout(Session* session) = 0;

            // Managed object reference of the VM with the given display name, empty when there is none
            virtual QString FindVmByName(Session* session, const QString& vmName) = 0;

            // One enumeration of all virtual devices of the VM
            virtual DeviceList GetDevices(Session* session, const QString& vmRef) = 0;

            // Submit a reconfiguration, returns the task reference
            virtual QString ReconfigureVm(Session* session, const QString& vmRef, const DeviceChangeList& changes) = 0;

            // Subscribe to state changes of the given tasks, returns the filter reference
            virtual QString CreateTaskFilter(Session* session, const QStringList& taskRefs) = 0;

            // Block until something changed after version (empty version: initial state)
            virtual UpdateSet WaitForUpdates(Session* session, const QString& version) = 0;

            virtual void DestroyFilter(Session* session, const QString& filterRef) = 0;
    };
} // namespace Vim

#endif // VIM_HYPERVISORCLIENT_H
