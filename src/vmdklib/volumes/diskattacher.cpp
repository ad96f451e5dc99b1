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

#include "diskattacher.h"
#include "metadatastore.h"
#include "operationerror.h"
#include "../vim/failure.h"
#include "../vim/hypervisorclient.h"
#include "../vim/session.h"
#include "../vim/sessionmanager.h"
#include <QtCore/QDebug>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QSet>

namespace Vmdk
{
    const char* const DiskAttacher::DISK_LABEL = "dockerDataVolume";

    QVariantMap DiskSlot::ToVariantMap() const
    {
        QVariantMap result;
        result.insert("Unit", QString::number(this->unit));
        result.insert("Bus", QString::number(this->bus));
        return result;
    }

    DiskAttacher::DiskAttacher(Vim::SessionManager* sessionManager, MetadataStore* metadata)
        : m_sessionManager(sessionManager), m_metadata(metadata), m_taskWaiter(sessionManager)
    {
    }

    QString DiskAttacher::FindVm(const QString& vmName)
    {
        Vim::HypervisorClient* client = this->m_sessionManager->GetClient();

        QString vmRef;
        try
        {
            vmRef = client->FindVmByName(this->m_sessionManager->GetSession().data(), vmName);
        } catch (const Failure& failure)
        {
            if (failure.kind() != Failure::AuthExpired)
                throw;

            qWarning() << "DiskAttacher: session expired while looking up" << vmName << "- reconnecting";
            this->m_sessionManager->Reconnect();
            vmRef = client->FindVmByName(this->m_sessionManager->GetSession().data(), vmName);
        }

        if (vmRef.isEmpty())
            throw OperationError(OperationError::NotFound, QString("VM %1 not found").arg(vmName));

        return vmRef;
    }

    int DiskAttacher::FindDeviceByPath(const QString& vmdkPath, const Vim::DeviceList& devices)
    {
        QFileInfo descriptor(vmdkPath);
        QString volumeDir = descriptor.absolutePath();
        QString realVolumeDir = QFileInfo(volumeDir).canonicalFilePath();
        if (realVolumeDir.isEmpty())
            realVolumeDir = volumeDir;

        const QString virtualDisk = QFileInfo(realVolumeDir).fileName() + "/" + descriptor.fileName();

        for (int i = 0; i < devices.size(); ++i)
        {
            const Vim::VirtualDevice& device = devices.at(i);
            if (!device.IsDisk())
                continue;

            // "[datastore] path/to/disk.vmdk", datastore names may contain spaces
            QString backing = device.GetBackingFileName();
            if (backing.startsWith('['))
            {
                int close = backing.indexOf("] ");
                if (close >= 0)
                    backing = backing.mid(close + 2);
            }

            if (backing == virtualDisk || backing.endsWith("/" + virtualDisk))
            {
                qDebug() << "DiskAttacher: FindDeviceByPath: MATCH:" << backing;
                return i;
            }
        }

        return -1;
    }

    DiskSlot DiskAttacher::Attach(const QString& vmdkPath, const VmContext& vm)
    {
        QString vmRef = this->FindVm(vm.name);
        qInfo() << "*** attachVMDK:" << vmdkPath << "to" << vm.name << "uuid=" << vm.uuid;

        Vim::DeviceList devices = this->m_sessionManager->GetClient()->GetDevices(this->m_sessionManager->GetSession().data(), vmRef);

        Vim::DeviceList controllers;
        for (const Vim::VirtualDevice& device : devices)
        {
            if (device.IsController())
                controllers.append(device);
        }

        Vim::DeviceChangeList changes;
        DiskSlot slot;
        int controllerKey = -1;

        const Vim::VirtualDevice* paravirtual = nullptr;
        for (const Vim::VirtualDevice& controller : controllers)
        {
            if (controller.IsParaVirtualController())
            {
                paravirtual = &controller;
                break;
            }
        }

        if (paravirtual)
        {
            controllerKey = paravirtual->GetKey();
            slot.bus = paravirtual->GetBusNumber();
        } else
        {
            qWarning() << "DiskAttacher: PVSCSI adapter is missing - trying to add one";
            if (controllers.size() >= Vim::VirtualDevice::MAX_SCSI_CONTROLLERS)
            {
                QString message = "Failed to place PVSCSI adapter - out of bus slots";
                qCritical() << "DiskAttacher:" << message << "VM=" << vm.uuid;
                throw OperationError(OperationError::HypervisorFault, message);
            }

            QSet<int> takenBuses;
            for (const Vim::VirtualDevice& controller : controllers)
                takenBuses.insert(controller.GetBusNumber());

            int bus = 0;
            while (takenBuses.contains(bus))
                ++bus;

            Vim::VirtualDevice controller = Vim::VirtualDevice::NewParaVirtualController(bus);
            changes.append(Vim::DeviceChange(Vim::DeviceChange::Add, controller));
            controllerKey = controller.GetKey();
            slot.bus = bus;
            // Fresh controller, the first slot is free
            slot.unit = 0;
        }

        int existing = FindDeviceByPath(vmdkPath, devices);
        if (existing >= 0)
        {
            const Vim::VirtualDevice& device = devices.at(existing);
            qWarning() << "DiskAttacher: disk" << vmdkPath << "already attached. VM=" << vm.uuid;
            this->setStatusAttached(vmdkPath, vm.uuid);

            DiskSlot attached;
            attached.unit = device.GetUnitNumber();
            attached.bus = device.GetControllerKey() - Vim::VirtualDevice::CONTROLLER_KEY_OFFSET;
            return attached;
        }

        if (slot.unit < 0)
        {
            QSet<int> takenUnits;
            for (const Vim::VirtualDevice& device : devices)
            {
                if (device.IsDisk() && device.GetControllerKey() == controllerKey)
                    takenUnits.insert(device.GetUnitNumber());
            }

            for (int unit = 0; unit <= Vim::VirtualDevice::MAX_UNIT_NUMBER; ++unit)
            {
                if (unit == Vim::VirtualDevice::CONTROLLER_UNIT_NUMBER || takenUnits.contains(unit))
                    continue;
                slot.unit = unit;
                break;
            }

            if (slot.unit < 0)
            {
                QString message = "Failed to place new disk - out of disk slots";
                qCritical() << "DiskAttacher:" << message << "VM=" << vm.uuid;
                throw OperationError(OperationError::HypervisorFault, message);
            }

            qDebug() << "DiskAttacher: controllerKey=" << controllerKey << "slot=" << slot.unit;
        }

        Vim::VirtualDevice disk = Vim::VirtualDevice::NewDisk("[] " + vmdkPath, controllerKey, slot.unit, DISK_LABEL);
        changes.append(Vim::DeviceChange(Vim::DeviceChange::Add, disk));

        try
        {
            this->reconfigure(vmRef, changes);
        } catch (const Failure& failure)
        {
            QString message = failure.message();

            QVariantMap metadata = this->m_metadata->GetAll(vmdkPath);
            QString owner = metadata.value(MetadataStore::KEY_ATTACHED_VM).toString();
            if (metadata.value(MetadataStore::KEY_STATUS).toString() == MetadataStore::STATUS_ATTACHED && owner != vm.uuid)
                message += QString(" disk %1 already attached to VM=%2").arg(vmdkPath, owner);

            qWarning() << "DiskAttacher: attach of" << vmdkPath << "failed:" << message;
            throw OperationError(OperationError::HypervisorFault, message);
        }

        this->setStatusAttached(vmdkPath, vm.uuid);
        qInfo() << "DiskAttacher: disk" << vmdkPath << "successfully attached. diskSlot=" << slot.unit << "busNumber=" << slot.bus;
        return slot;
    }

    void DiskAttacher::Detach(const QString& vmdkPath, const VmContext& vm)
    {
        QString vmRef = this->FindVm(vm.name);
        qInfo() << "*** detachVMDK:" << vmdkPath << "from" << vm.name << "VM uuid=" << vm.uuid;

        Vim::DeviceList devices = this->m_sessionManager->GetClient()->GetDevices(this->m_sessionManager->GetSession().data(), vmRef);

        int index = FindDeviceByPath(vmdkPath, devices);
        if (index < 0)
        {
            // Expected when an earlier attach failed and the guest still asks to detach
            QString message = QString("Detach failed: disk=%1 not found. VM=%2").arg(vmdkPath, vm.uuid);
            qWarning() << "DiskAttacher:" << message;
            throw OperationError(OperationError::NotFound, message);
        }

        Vim::DeviceChangeList changes;
        changes.append(Vim::DeviceChange(Vim::DeviceChange::Remove, devices.at(index)));

        try
        {
            this->reconfigure(vmRef, changes);
        } catch (const Failure& failure)
        {
            QStringList details = failure.faultMessages();
            for (const QString& detail : details)
                qWarning() << "DiskAttacher:" << detail;

            if (details.isEmpty() && !failure.message().isEmpty())
                details << failure.message();

            QString message = QString("Failed to detach %1").arg(vmdkPath);
            if (!details.isEmpty())
                message += ": " + details.join("; ");
            throw OperationError(OperationError::HypervisorFault, message);
        }

        this->setStatusDetached(vmdkPath);
        qInfo() << "DiskAttacher: disk detached" << vmdkPath;
    }

    void DiskAttacher::reconfigure(const QString& vmRef, const Vim::DeviceChangeList& changes)
    {
        QString taskRef = this->m_sessionManager->GetClient()->ReconfigureVm(this->m_sessionManager->GetSession().data(), vmRef, changes);
        this->m_taskWaiter.Wait(QStringList() << taskRef);
    }

    void DiskAttacher::setStatusAttached(const QString& vmdkPath, const QString& vmUuid)
    {
        qDebug() << "DiskAttacher: set status=attached disk=" << vmdkPath << "VM=" << vmUuid;

        QVariantMap metadata = this->m_metadata->GetAll(vmdkPath);
        metadata.insert(MetadataStore::KEY_STATUS, MetadataStore::STATUS_ATTACHED);
        metadata.insert(MetadataStore::KEY_ATTACHED_VM, vmUuid);
        if (!this->m_metadata->SetAll(vmdkPath, metadata))
            qWarning() << "DiskAttacher: attach: failed to save disk metadata" << vmdkPath;
    }

    void DiskAttacher::setStatusDetached(const QString& vmdkPath)
    {
        qDebug() << "DiskAttacher: set status=detached disk=" << vmdkPath;

        QVariantMap metadata = this->m_metadata->GetAll(vmdkPath);
        metadata.insert(MetadataStore::KEY_STATUS, MetadataStore::STATUS_DETACHED);
        metadata.remove(MetadataStore::KEY_ATTACHED_VM);
        if (!this->m_metadata->SetAll(vmdkPath, metadata))
            qWarning() << "DiskAttacher: detach: failed to save disk metadata" << vmdkPath;
    }
} // namespace Vmdk
