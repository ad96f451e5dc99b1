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

#ifndef VMDK_SERVICECONFIG_H
#define VMDK_SERVICECONFIG_H

#include "../vmdklib_global.h"
#include <QtCore/QString>

namespace Vmdk
{
    /**
     * @brief Service configuration
     *
     * Read once at startup from an INI file, every key is optional and falls
     * back to the value a default installation uses.
     *
     * [log]        file, level (debug|info|warning|critical)
     * [hypervisor] host, port, tls, user, realUser
     * [channel]    library, maxSkipCount, maxRequestSize
     * [volumes]    directory, defaultSize, maxDescriptorSize, vsanDevices
     * [tools]      vmkfstools, mkfs, osfsMkdir, objtool
     */
    class VMDKLIB_EXPORT ServiceConfig
    {
        public:
            static const char* const DEFAULT_CONFIG_FILE;

            ServiceConfig();

            // Returns defaults overridden by whatever the file sets, a missing file is not an error
            static ServiceConfig Load(const QString& fileName);

            // log
            QString logFile;
            QString logLevel;

            // hypervisor
            QString hypervisorHost;
            int hypervisorPort;
            bool hypervisorTls;
            QString hypervisorUser;
            QString realUser;

            // channel
            QString channelLibrary;
            int maxSkipCount;
            int maxRequestSize;

            // volumes
            QString volumeDirectory;
            QString defaultVolumeSize;
            qint64 maxDescriptorSize;
            QString vsanDevicesPath;

            // tools
            QString vmkfstoolsPath;
            QString mkfsPath;
            QString osfsMkdirPath;
            QString objtoolPath;
    };
} // namespace Vmdk

#endif // VMDK_SERVICECONFIG_H
