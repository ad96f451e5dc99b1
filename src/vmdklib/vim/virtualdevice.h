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

#ifndef VIM_VIRTUALDEVICE_H
#define VIM_VIRTUALDEVICE_H

#include "../vmdklib_global.h"
#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QVariantMap>

namespace Vim
{
    /**
     * @brief Immutable view of one virtual device of a VM
     *
     * The host agent describes devices as records with a "_type"
     * discriminator. Only SCSI controllers and virtual disks are interesting
     * for volume placement; every other device is kept as Other so the
     * snapshot stays complete. The original record is retained because a
     * remove change has to reference the exact device the host reported.
     */
    class VMDKLIB_EXPORT VirtualDevice
    {
        public:
            enum Kind
            {
                Other,
                ScsiController,
                Disk
            };

            // SCSI controllers use keys 1000..1003, i.e. 1000 + bus number
            static constexpr int CONTROLLER_KEY_OFFSET = 1000;
            static constexpr int MAX_SCSI_CONTROLLERS = 4;
            // Unit 7 is taken by the controller itself
            static constexpr int CONTROLLER_UNIT_NUMBER = 7;
            static constexpr int MAX_UNIT_NUMBER = 15;

            static const char* const PARAVIRTUAL_CONTROLLER_TYPE;
            static const char* const DISK_TYPE;

            VirtualDevice();

            static VirtualDevice FromVariantMap(const QVariantMap& record);

            // New paravirtual controller on the given bus, for an add change
            static VirtualDevice NewParaVirtualController(int busNumber);

            // New disk backed by an existing descriptor, for an add change
            static VirtualDevice NewDisk(const QString& fileName, int controllerKey, int unitNumber, const QString& label);

            Kind GetKind() const { return this->m_kind; }
            QString GetType() const;
            int GetKey() const;

            bool IsController() const { return this->m_kind == ScsiController; }
            bool IsDisk() const { return this->m_kind == Disk; }
            bool IsParaVirtualController() const;

            // Controller properties
            int GetBusNumber() const;

            // Disk properties
            int GetControllerKey() const;
            int GetUnitNumber() const;
            QString GetBackingFileName() const;
            QString GetLabel() const;

            QVariantMap ToVariantMap() const { return this->m_record; }

        private:
            static Kind kindForType(const QString& type);

            Kind m_kind;
            QVariantMap m_record;
    };

    typedef QList<VirtualDevice> DeviceList;

    struct VMDKLIB_EXPORT DeviceChange
    {
        enum Operation
        {
            Add,
            Remove
        };

        DeviceChange(Operation operation, const VirtualDevice& device)
            : operation(operation), device(device)
        {
        }

        Operation operation;
        VirtualDevice device;

        QVariantMap ToVariantMap() const;
    };

    typedef QList<DeviceChange> DeviceChangeList;
} // namespace Vim

#endif // VIM_VIRTUALDEVICE_H
