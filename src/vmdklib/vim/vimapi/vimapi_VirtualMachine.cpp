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

#include "vimapi_VirtualMachine.h"
#include "vimapi_Helper.h"
#include "../session.h"

namespace VimAPI
{
    QString VirtualMachine::FindByName(Vim::Session* session, const QString& vmName)
    {
        QVariantList params;
        params << Helper::SessionId(session) << "vmFolder" << vmName;

        return Helper::Invoke(session, "Folder.FindChild", params).toString();
    }

    QVariantList VirtualMachine::GetDevices(Vim::Session* session, const QString& vm)
    {
        QVariantList params;
        params << Helper::SessionId(session) << vm;

        return Helper::Invoke(session, "VirtualMachine.get_devices", params).toList();
    }

    QString VirtualMachine::ReconfigVM_Task(Vim::Session* session, const QString& vm, const QVariantMap& spec)
    {
        QVariantList params;
        params << Helper::SessionId(session) << vm << spec;

        // A reconfigure is never submitted twice
        return Helper::Invoke(session, "VirtualMachine.ReconfigVM_Task", params, false).toString(); // Returns task ref
    }
}
