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

#ifndef VIMAPI_VIRTUALMACHINE_H
#define VIMAPI_VIRTUALMACHINE_H

#include "../../vmdklib_global.h"
#include <QString>
#include <QVariantList>
#include <QVariantMap>

namespace Vim
{
    class Session;
}

namespace VimAPI
{
    /// <summary>
    /// Static methods for virtual machine operations (managed object: VirtualMachine)
    /// </summary>
    class VMDKLIB_EXPORT VirtualMachine
    {
        private:
            VirtualMachine() = delete;

        public:
            /// <summary>
            /// Find a VM by display name in the root VM folder
            /// </summary>
            /// <returns>VM reference, or an empty string when there is no such VM</returns>
            static QString FindByName(Vim::Session* session, const QString& vmName);

            /// <summary>
            /// Get config.hardware.device of the VM
            /// </summary>
            static QVariantList GetDevices(Vim::Session* session, const QString& vm);

            /// <summary>
            /// Reconfigure the VM
            /// </summary>
            /// <param name="spec">Config spec, {"deviceChange": [...]}</param>
            /// <returns>Task reference</returns>
            static QString ReconfigVM_Task(Vim::Session* session, const QString& vm, const QVariantMap& spec);
    };
}

#endif // VIMAPI_VIRTUALMACHINE_H
