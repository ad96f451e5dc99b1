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

#include "identityresolver.h"
#include "hostintrospection.h"
#include "../utils/misc.h"
#include "../vim/failure.h"
#include "../volumes/operationerror.h"
#include <QtCore/QDebug>
#include <QtCore/QVariantMap>

namespace Vmdk
{
    IdentityResolver::IdentityResolver(HostIntrospection* introspection) : m_introspection(introspection)
    {
    }

    VmContext IdentityResolver::Resolve(qint32 cartel)
    {
        QString vmmLeader;
        QVariantMap groupInfo;

        try
        {
            vmmLeader = this->m_introspection->Get(QString("/userworld/cartel/%1/vmmLeader").arg(cartel)).toString();
            if (vmmLeader.isEmpty())
                throw OperationError(OperationError::IdentityLookup, QString("No VMM leader for cartel %1").arg(cartel));

            groupInfo = this->m_introspection->Get(QString("/vm/%1/vmmGroupInfo").arg(vmmLeader)).toMap();
        } catch (const Failure& failure)
        {
            qWarning() << "IdentityResolver: lookup of cartel" << cartel << "failed:" << failure.what();
            throw OperationError(OperationError::IdentityLookup,
                                 QString("Failed to identify VM for cartel %1: %2").arg(cartel).arg(failure.message()));
        }

        VmContext vm;
        vm.name = groupInfo.value("displayName").toString();
        vm.configPath = groupInfo.value("cfgPath").toString();
        vm.uuid = Misc::FormatUuid(groupInfo.value("uuid").toString());

        if (vm.name.isEmpty() || vm.configPath.isEmpty() || vm.uuid.isEmpty())
        {
            qWarning() << "IdentityResolver: incomplete group info for VMM leader" << vmmLeader << groupInfo;
            throw OperationError(OperationError::IdentityLookup,
                                 QString("Incomplete VM information for cartel %1").arg(cartel));
        }

        qDebug() << "IdentityResolver: cartel" << cartel << "->" << vm.name << vm.uuid;
        return vm;
    }
} // namespace Vmdk
