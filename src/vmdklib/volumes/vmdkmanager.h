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

#ifndef VMDK_VMDKMANAGER_H
#define VMDK_VMDKMANAGER_H

#include "../vmdklib_global.h"
#include "../utils/serviceconfig.h"
#include <QtCore/QString>
#include <QtCore/QVariantList>
#include <QtCore/QVariantMap>

namespace Vmdk
{
    class ToolRunner;
    class MetadataStore;

    /**
     * @brief Creates, removes and lists volume descriptors
     *
     * Disk files are only ever touched through the external disk tools, this
     * class never writes descriptor or backing data itself. All operations
     * throw OperationError on failure.
     */
    class VMDKLIB_EXPORT VmdkManager
    {
        public:
            static const char* const DESCRIPTOR_EXTENSION;
            static const char* const DESCRIPTOR_SIGNATURE;

            VmdkManager(ToolRunner* toolRunner, MetadataStore* metadata, const ServiceConfig& config);

            /**
             * @brief Create, register and format a new volume
             *
             * The disk is created with the size from options["size"] (or the
             * configured default), then a detached metadata record holding
             * options is written and finally the backing is formatted with
             * ext4 labelled volumeName. A failure after the disk exists
             * deletes the disk again.
             */
            void Create(const QString& vmdkPath, const QString& volumeName, const QVariantMap& options);

            void Remove(const QString& vmdkPath);

            // [{"Name": ..., "Attributes": {}}] for every descriptor directly in directory
            QVariantList List(const QString& directory) const;

            bool IsDescriptor(const QString& filePath) const;

            /**
             * @brief Locate the device or file holding the data of a volume
             *
             * Either the flat file next to the descriptor or, for object store
             * backed disks, the device node published after opening the object.
             * @return empty string when no backing can be found
             */
            QString ResolveBacking(const QString& vmdkPath);

        private:
            void format(const QString& vmdkPath, const QString& volumeName);
            bool deleteDisk(const QString& vmdkPath, QString* output);

            ToolRunner* m_toolRunner;
            MetadataStore* m_metadata;
            ServiceConfig m_config;
    };
} // namespace Vmdk

#endif // VMDK_VMDKMANAGER_H
