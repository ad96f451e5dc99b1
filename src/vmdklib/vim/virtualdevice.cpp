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

#include "virtualdevice.h"

namespace Vim
{
    const char* const VirtualDevice::PARAVIRTUAL_CONTROLLER_TYPE = "ParaVirtualSCSIController";
    const char* const VirtualDevice::DISK_TYPE = "VirtualDisk";

    VirtualDevice::VirtualDevice() : m_kind(Other)
    {
    }

    VirtualDevice VirtualDevice::FromVariantMap(const QVariantMap& record)
    {
        VirtualDevice device;
        device.m_record = record;
        device.m_kind = kindForType(record.value("_type").toString());
        return device;
    }

    VirtualDevice VirtualDevice::NewParaVirtualController(int busNumber)
    {
        QVariantMap record;
        record.insert("_type", PARAVIRTUAL_CONTROLLER_TYPE);
        record.insert("key", CONTROLLER_KEY_OFFSET + busNumber);
        record.insert("busNumber", busNumber);
        record.insert("sharedBus", "noSharing");
        return FromVariantMap(record);
    }

    VirtualDevice VirtualDevice::NewDisk(const QString& fileName, int controllerKey, int unitNumber, const QString& label)
    {
        QVariantMap backing;
        backing.insert("_type", "VirtualDiskFlatVer2BackingInfo");
        backing.insert("fileName", fileName);
        backing.insert("diskMode", "persistent");

        QVariantMap deviceInfo;
        deviceInfo.insert("label", label);
        deviceInfo.insert("summary", label);

        QVariantMap record;
        record.insert("_type", DISK_TYPE);
        record.insert("backing", backing);
        record.insert("deviceInfo", deviceInfo);
        record.insert("controllerKey", controllerKey);
        record.insert("unitNumber", unitNumber);
        return FromVariantMap(record);
    }

    QString VirtualDevice::GetType() const
    {
        return this->m_record.value("_type").toString();
    }

    int VirtualDevice::GetKey() const
    {
        return this->m_record.value("key", -1).toInt();
    }

    bool VirtualDevice::IsParaVirtualController() const
    {
        return this->m_kind == ScsiController && this->GetType() == PARAVIRTUAL_CONTROLLER_TYPE;
    }

    int VirtualDevice::GetBusNumber() const
    {
        return this->m_record.value("busNumber", -1).toInt();
    }

    int VirtualDevice::GetControllerKey() const
    {
        return this->m_record.value("controllerKey", -1).toInt();
    }

    int VirtualDevice::GetUnitNumber() const
    {
        return this->m_record.value("unitNumber", -1).toInt();
    }

    QString VirtualDevice::GetBackingFileName() const
    {
        return this->m_record.value("backing").toMap().value("fileName").toString();
    }

    QString VirtualDevice::GetLabel() const
    {
        return this->m_record.value("deviceInfo").toMap().value("label").toString();
    }

    VirtualDevice::Kind VirtualDevice::kindForType(const QString& type)
    {
        if (type == DISK_TYPE)
            return Disk;

        if (type == PARAVIRTUAL_CONTROLLER_TYPE
            || type == "VirtualLsiLogicController"
            || type == "VirtualLsiLogicSASController"
            || type == "VirtualBusLogicController")
        {
            return ScsiController;
        }

        return Other;
    }

    QVariantMap DeviceChange::ToVariantMap() const
    {
        QVariantMap change;
        change.insert("operation", this->operation == Add ? "add" : "remove");
        change.insert("device", this->device.ToVariantMap());
        return change;
    }
} // namespace Vim
