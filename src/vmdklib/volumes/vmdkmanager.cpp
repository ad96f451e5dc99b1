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

#include "vmdkmanager.h"
#include "metadatastore.h"
#include "operationerror.h"
#include "toolrunner.h"
#include "../utils/misc.h"
#include <QtCore/QDebug>
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QRegularExpression>

namespace Vmdk
{
    const char* const VmdkManager::DESCRIPTOR_EXTENSION = ".vmdk";
    const char* const VmdkManager::DESCRIPTOR_SIGNATURE = "# Disk DescriptorFile";

    VmdkManager::VmdkManager(ToolRunner* toolRunner, MetadataStore* metadata, const ServiceConfig& config)
        : m_toolRunner(toolRunner), m_metadata(metadata), m_config(config)
    {
    }

    void VmdkManager::Create(const QString& vmdkPath, const QString& volumeName, const QVariantMap& options)
    {
        qInfo() << "*** createVMDK:" << vmdkPath << "opts=" << options;

        if (QFileInfo::exists(vmdkPath))
            throw OperationError(OperationError::Validation, QString("File %1 already exists").arg(vmdkPath));

        QString size = options.value("size").toString();
        if (size.isEmpty())
        {
            size = this->m_config.defaultVolumeSize;
            qDebug() << "VmdkManager: using default size" << size;
        }

        ToolResult created = this->m_toolRunner->Run(this->m_config.vmkfstoolsPath,
                                                     QStringList() << "-d" << "thin" << "-c" << size << vmdkPath);
        if (!created.Succeeded())
        {
            throw OperationError(OperationError::ToolInvocation,
                                 QString("Failed to create %1. %2").arg(vmdkPath, Misc::CompactOutput(created.output)));
        }

        if (!this->m_metadata->Create(vmdkPath, MetadataStore::STATUS_DETACHED, options))
        {
            QString message = QString("Failed to create meta-data store for %1").arg(vmdkPath);
            qWarning() << "VmdkManager:" << message;

            QString output;
            if (!this->deleteDisk(vmdkPath, &output))
                qWarning() << "VmdkManager: rollback of" << vmdkPath << "failed:" << output;

            throw OperationError(OperationError::Consistency, message);
        }

        this->format(vmdkPath, volumeName);
    }

    void VmdkManager::format(const QString& vmdkPath, const QString& volumeName)
    {
        QString backing = this->ResolveBacking(vmdkPath);
        if (backing.isEmpty())
        {
            qWarning() << "VmdkManager: no backing found for" << vmdkPath;
        } else
        {
            ToolResult formatted = this->m_toolRunner->Run(this->m_config.mkfsPath,
                                                           QStringList() << "-qF" << "-L" << volumeName << backing);
            if (formatted.Succeeded())
                return;

            qWarning() << "VmdkManager: failed to format" << vmdkPath << ":" << formatted.output;
        }

        // Don't leave an unformatted volume behind

        QString output;
        if (this->deleteDisk(vmdkPath, &output))
        {
            if (!this->m_metadata->Remove(vmdkPath))
                qWarning() << "VmdkManager: failed to remove meta-data for" << vmdkPath;
            throw OperationError(OperationError::ToolInvocation, QString("Failed to format %1.").arg(vmdkPath));
        }

        qCritical() << "VmdkManager: failed to delete unformatted volume" << vmdkPath << ":" << output;
        throw OperationError(OperationError::ToolInvocation,
                             QString("Unable to format %1 and unable to delete volume. Please delete it manually.").arg(vmdkPath));
    }

    QString VmdkManager::ResolveBacking(const QString& vmdkPath)
    {
        QString flatBacking = vmdkPath;
        flatBacking.replace(DESCRIPTOR_EXTENSION, "-flat.vmdk");
        if (QFileInfo(flatBacking).isFile())
            return flatBacking;

        QFile descriptor(vmdkPath);
        if (!descriptor.open(QIODevice::ReadOnly | QIODevice::Text))
        {
            qWarning() << "VmdkManager: can't read descriptor" << vmdkPath << ":" << descriptor.errorString();
            return QString();
        }
        QString data = QString::fromUtf8(descriptor.readAll());
        descriptor.close();

        static const QRegularExpression objectExtent("RW .* VMFS \"vsan://(.*)\"");
        QRegularExpressionMatch match = objectExtent.match(data);
        if (!match.hasMatch())
            return QString();

        QString objectId = match.captured(1);
        qDebug() << "VmdkManager: got volume object id" << objectId;

        ToolResult opened = this->m_toolRunner->Run(this->m_config.objtoolPath, QStringList() << "open" << "-u" << objectId);
        QString devicePath = QDir(this->m_config.vsanDevicesPath).filePath(objectId);
        if (opened.Succeeded() && QFileInfo::exists(devicePath))
            return devicePath;

        qWarning() << "VmdkManager: object" << objectId << "could not be opened:" << opened.output;
        return QString();
    }

    void VmdkManager::Remove(const QString& vmdkPath)
    {
        qInfo() << "*** removeVMDK:" << vmdkPath;

        QString output;
        if (!this->deleteDisk(vmdkPath, &output))
        {
            throw OperationError(OperationError::ToolInvocation,
                                 QString("Failed to remove %1. %2").arg(vmdkPath, Misc::CompactOutput(output)));
        }

        if (!this->m_metadata->Remove(vmdkPath))
            qWarning() << "VmdkManager: failed to remove metadata of" << vmdkPath;
    }

    bool VmdkManager::deleteDisk(const QString& vmdkPath, QString* output)
    {
        ToolResult result = this->m_toolRunner->Run(this->m_config.vmkfstoolsPath, QStringList() << "-U" << vmdkPath);
        if (output)
            *output = result.output;
        return result.Succeeded();
    }

    bool VmdkManager::IsDescriptor(const QString& filePath) const
    {
        QFileInfo info(filePath);
        if (!info.isFile() || !info.fileName().endsWith(DESCRIPTOR_EXTENSION) || info.size() >= this->m_config.maxDescriptorSize)
            return false;

        QFile file(filePath);
        if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
        {
            qWarning() << "VmdkManager: failed to open" << filePath << "for descriptor check";
            return false;
        }

        return file.readLine().startsWith(DESCRIPTOR_SIGNATURE);
    }

    QVariantList VmdkManager::List(const QString& directory) const
    {
        QVariantList volumes;

        QDir dir(directory);
        const QStringList entries = dir.entryList(QDir::Files | QDir::NoDotAndDotDot);
        for (const QString& entry : entries)
        {
            if (!this->IsDescriptor(dir.filePath(entry)))
                continue;

            QVariantMap volume;
            volume.insert("Name", Misc::StripExtension(entry, DESCRIPTOR_EXTENSION));
            volume.insert("Attributes", QVariantMap());
            volumes.append(volume);
        }

        return volumes;
    }
} // namespace Vmdk
