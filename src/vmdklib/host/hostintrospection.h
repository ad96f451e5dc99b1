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

#ifndef VMDK_HOSTINTROSPECTION_H
#define VMDK_HOSTINTROSPECTION_H

#include "../vmdklib_global.h"
#include <QtCore/QString>
#include <QtCore/QVariant>

namespace Vim
{
    class Connection;
}

namespace Vmdk
{
    /**
     * @brief Read access to the host's kernel information tree
     *
     * Nodes are addressed by path, e.g. /userworld/cartel/1234/vmmLeader.
     */
    class VMDKLIB_EXPORT HostIntrospection
    {
        public:
            virtual ~HostIntrospection() {}

            // Value of the node; throws Failure when it can't be read
            virtual QVariant Get(const QString& node) = 0;
    };

    // Reads nodes through the host agent ("vsi.get")
    class VMDKLIB_EXPORT RpcHostIntrospection : public HostIntrospection
    {
        public:
            explicit RpcHostIntrospection(Vim::Connection* connection);

            QVariant Get(const QString& node) override;

        private:
            Vim::Connection* m_connection;
    };
} // namespace Vmdk

#endif // VMDK_HOSTINTROSPECTION_H
