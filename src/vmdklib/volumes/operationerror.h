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

#ifndef VMDK_OPERATIONERROR_H
#define VMDK_OPERATIONERROR_H

#include "../vmdklib_global.h"
#include <QtCore/QString>
#include <stdexcept>

namespace Vmdk
{
    /**
     * @brief Failure of a single volume request
     *
     * Thrown by the lifecycle manager, the attachment engine, the identity
     * resolver and the dispatcher. The server loop turns it into an error
     * reply, it never ends the loop.
     */
    class VMDKLIB_EXPORT OperationError : public std::runtime_error
    {
        public:
            enum Kind
            {
                Validation,      // bad command, bad name, volume already exists
                ToolInvocation,  // external tool exited non-zero
                HypervisorFault, // reconfiguration rejected or failed
                Consistency,     // metadata out of sync with the disk
                NotFound,        // VM or device not present
                IdentityLookup   // caller could not be mapped to a VM
            };

            OperationError(Kind kind, const QString& message);

            Kind kind() const { return this->m_kind; }
            QString message() const { return this->m_message; }

            static QString KindToString(Kind kind);

        private:
            Kind m_kind;
            QString m_message;
    };

    /**
     * @brief The message channel kept failing, the service can't go on
     */
    class VMDKLIB_EXPORT FatalChannelError : public std::runtime_error
    {
        public:
            explicit FatalChannelError(const QString& message);
    };
} // namespace Vmdk

#endif // VMDK_OPERATIONERROR_H
