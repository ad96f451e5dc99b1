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

#include "rpchypervisorclient.h"
#include "session.h"
#include "failure.h"
#include "vimapi/vimapi_Helper.h"
#include "vimapi/vimapi_VirtualMachine.h"
#include "vimapi/vimapi_PropertyCollector.h"
#include <QtCore/QDebug>

namespace Vim
{
    RpcHypervisorClient::RpcHypervisorClient(Connection* connection) : m_connection(connection)
    {
    }

    Session* RpcHypervisorClient::Login(const QString& username, const QString& realUser)
    {
        Session* session = new Session(this->m_connection);
        if (!session->Login(username, realUser))
        {
            QStringList description = session->getLastErrorDescription();
            QString error = session->getLastError();
            delete session;

            qWarning() << "RpcHypervisorClient: login as" << username << "failed:" << error;
            if (description.isEmpty())
                description << Failure::INVALID_LOGIN << error;
            throw Failure(description);
        }

        return session;
    }

    void RpcHypervisorClient::Logout(Session* session)
    {
        if (session)
            session->Logout();
    }

    QString RpcHypervisorClient::FindVmByName(Session* session, const QString& vmName)
    {
        QString vmRef = VimAPI::VirtualMachine::FindByName(session, vmName);
        if (VimAPI::Helper::IsNullOrEmptyRef(vmRef))
            return QString();
        return vmRef;
    }

    DeviceList RpcHypervisorClient::GetDevices(Session* session, const QString& vmRef)
    {
        DeviceList devices;
        const QVariantList records = VimAPI::VirtualMachine::GetDevices(session, vmRef);
        for (const QVariant& record : records)
            devices.append(VirtualDevice::FromVariantMap(record.toMap()));
        return devices;
    }

    QString RpcHypervisorClient::ReconfigureVm(Session* session, const QString& vmRef, const DeviceChangeList& changes)
    {
        QVariantList deviceChange;
        for (const DeviceChange& change : changes)
            deviceChange.append(change.ToVariantMap());

        QVariantMap spec;
        spec.insert("deviceChange", deviceChange);

        QString taskRef = VimAPI::VirtualMachine::ReconfigVM_Task(session, vmRef, spec);
        if (VimAPI::Helper::IsNullOrEmptyRef(taskRef))
            throw Failure(Failure::INTERNAL_ERROR, "ReconfigVM_Task returned no task reference");
        return taskRef;
    }

    QString RpcHypervisorClient::CreateTaskFilter(Session* session, const QStringList& taskRefs)
    {
        QVariantList objectSet;
        for (const QString& taskRef : taskRefs)
        {
            QVariantMap objectSpec;
            objectSpec.insert("obj", taskRef);
            objectSet.append(objectSpec);
        }

        QVariantMap propertySpec;
        propertySpec.insert("type", "Task");
        propertySpec.insert("pathSet", QVariantList());
        propertySpec.insert("all", true);

        QVariantMap filterSpec;
        filterSpec.insert("objectSet", objectSet);
        filterSpec.insert("propSet", QVariantList() << propertySpec);

        return VimAPI::PropertyCollector::CreateFilter(session, filterSpec, true);
    }

    UpdateSet RpcHypervisorClient::WaitForUpdates(Session* session, const QString& version)
    {
        return UpdateSet::FromVariant(VimAPI::PropertyCollector::WaitForUpdates(session, version));
    }

    void RpcHypervisorClient::DestroyFilter(Session* session, const QString& filterRef)
    {
        VimAPI::PropertyCollector::DestroyFilter(session, filterRef);
    }
} // namespace Vim
