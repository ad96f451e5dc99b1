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

#ifndef VMDK_METADATASTORE_H
#define VMDK_METADATASTORE_H

#include "../vmdklib_global.h"
#include <QtCore/QString>
#include <QtCore/QVariantMap>

namespace Vmdk
{
    /**
     * @brief Per volume key/value metadata, addressed by descriptor path
     *
     * Keys used by the service:
     *   status         - STATUS_DETACHED or STATUS_ATTACHED
     *   attachedVMUuid - UUID of the VM the volume is attached to (attached only)
     *   volOpts        - user supplied options from create, stored opaquely
     */
    class VMDKLIB_EXPORT MetadataStore
    {
        public:
            static const char* const KEY_STATUS;
            static const char* const KEY_ATTACHED_VM;
            static const char* const KEY_VOLUME_OPTIONS;
            static const char* const STATUS_DETACHED;
            static const char* const STATUS_ATTACHED;

            virtual ~MetadataStore() {}

            virtual bool Create(const QString& vmdkPath, const QString& status, const QVariantMap& options) = 0;

            // Empty map when there is nothing stored or it can't be read
            virtual QVariantMap GetAll(const QString& vmdkPath) = 0;

            virtual bool SetAll(const QString& vmdkPath, const QVariantMap& metadata) = 0;

            virtual bool Remove(const QString& vmdkPath) = 0;
    };

    /**
     * @brief Keeps the metadata as a JSON file next to the descriptor
     *
     * /vmfs/volumes/ds1/dockvols/vol1.vmdk -> /vmfs/volumes/ds1/dockvols/vol1-vmdkops.json
     */
    class VMDKLIB_EXPORT SidecarMetadataStore : public MetadataStore
    {
        public:
            static QString SidecarPath(const QString& vmdkPath);

            bool Create(const QString& vmdkPath, const QString& status, const QVariantMap& options) override;
            QVariantMap GetAll(const QString& vmdkPath) override;
            bool SetAll(const QString& vmdkPath, const QVariantMap& metadata) override;
            bool Remove(const QString& vmdkPath) override;
    };
} // namespace Vmdk

#endif // VMDK_METADATASTORE_H
