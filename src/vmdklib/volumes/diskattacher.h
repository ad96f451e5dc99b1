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

#ifndef VMDK_DISKATTACHER_H
#define VMDK_DISKATTACHER_H

#include "../vmdklib_global.h"
#include "../host/vmcontext.h"
#include "../vim/virtualdevice.h"
#include "../vim/taskwaiter.h"
#include <QtCore/QString>
#include <QtCore/QVariantMap>

namespace Vim
{
    class SessionManager;
}

namespace Vmdk
{
    class MetadataStore;

    // SCSI address of an attached disk as reported to the guest
    struct VMDKLIB_EXPORT DiskSlot
    {
        int unit = -1;
        int bus = -1;

        // {"Unit": "3", "Bus": "0"}
        QVariantMap ToVariantMap() const;
    };

    /**
     * @brief Attaches volumes to and detaches them from VMs
     *
     * Disks are attached to a paravirtual SCSI controller, one is added if
     * the VM doesn't have any. Both operations read the VM's device list
     * once, decide everything on that snapshot, submit a single
     * reconfiguration and wait for its task. None of this is safe to run
     * concurrently for the same VM: two attaches could pick the same slot.
     *
     * Hypervisor state is authoritative, a metadata write that fails after
     * a successful reconfiguration is only logged.
     */
    class VMDKLIB_EXPORT DiskAttacher
    {
        public:
            static const char* const DISK_LABEL;

            DiskAttacher(Vim::SessionManager* sessionManager, MetadataStore* metadata);

            /**
             * @brief Attach the volume at vmdkPath to vm
             *
             * Attaching a volume that is already attached to vm is not an
             * error, the slot it occupies is returned and nothing is changed.
             * @throws OperationError
             */
            DiskSlot Attach(const QString& vmdkPath, const VmContext& vm);

            // @throws OperationError, NotFound when vm has no disk backed by vmdkPath
            void Detach(const QString& vmdkPath, const VmContext& vm);

            /**
             * @brief Managed object reference of the VM called vmName
             *
             * Reconnects once if the session expired.
             * @throws OperationError(NotFound) when there is no such VM
             */
            QString FindVm(const QString& vmName);

            /**
             * @brief Disk in devices backed by the volume at vmdkPath
             *
             * Backing names look like "[datastore] dockvols/vol1.vmdk". The
             * volume directory is resolved through symlinks and the part after
             * the datastore has to end with "<directory name>/<descriptor name>".
             * @return index into devices or -1
             */
            static int FindDeviceByPath(const QString& vmdkPath, const Vim::DeviceList& devices);

        private:
            void setStatusAttached(const QString& vmdkPath, const QString& vmUuid);
            void setStatusDetached(const QString& vmdkPath);
            void reconfigure(const QString& vmRef, const Vim::DeviceChangeList& changes);

            Vim::SessionManager* m_sessionManager;
            MetadataStore* m_metadata;
            Vim::TaskWaiter m_taskWaiter;
    };
} // namespace Vmdk

#endif // VMDK_DISKATTACHER_H
