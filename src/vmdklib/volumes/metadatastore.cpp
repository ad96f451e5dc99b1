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

#include "metadatastore.h"
#include <QtCore/QDebug>
#include <QtCore/QFile>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QSaveFile>

namespace Vmdk
{
    const char* const MetadataStore::KEY_STATUS = "status";
    const char* const MetadataStore::KEY_ATTACHED_VM = "attachedVMUuid";
    const char* const MetadataStore::KEY_VOLUME_OPTIONS = "volOpts";
    const char* const MetadataStore::STATUS_DETACHED = "detached";
    const char* const MetadataStore::STATUS_ATTACHED = "attached";

    QString SidecarMetadataStore::SidecarPath(const QString& vmdkPath)
    {
        QString base = vmdkPath;
        if (base.endsWith(".vmdk"))
            base.chop(5);
        return base + "-vmdkops.json";
    }

    bool SidecarMetadataStore::Create(const QString& vmdkPath, const QString& status, const QVariantMap& options)
    {
        QVariantMap metadata;
        metadata.insert(KEY_STATUS, status);
        metadata.insert(KEY_VOLUME_OPTIONS, options);
        return this->SetAll(vmdkPath, metadata);
    }

    QVariantMap SidecarMetadataStore::GetAll(const QString& vmdkPath)
    {
        QFile file(SidecarPath(vmdkPath));
        if (!file.open(QIODevice::ReadOnly))
            return QVariantMap();

        QJsonParseError parseError;
        QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject())
        {
            qWarning() << "SidecarMetadataStore: corrupt metadata for" << vmdkPath << ":" << parseError.errorString();
            return QVariantMap();
        }

        return doc.object().toVariantMap();
    }

    bool SidecarMetadataStore::SetAll(const QString& vmdkPath, const QVariantMap& metadata)
    {
        QSaveFile file(SidecarPath(vmdkPath));
        if (!file.open(QIODevice::WriteOnly))
        {
            qWarning() << "SidecarMetadataStore: can't open" << file.fileName() << ":" << file.errorString();
            return false;
        }

        QByteArray data = QJsonDocument(QJsonObject::fromVariantMap(metadata)).toJson(QJsonDocument::Compact);
        if (file.write(data) != data.size())
        {
            qWarning() << "SidecarMetadataStore: write to" << file.fileName() << "failed:" << file.errorString();
            file.cancelWriting();
            return false;
        }

        if (!file.commit())
        {
            qWarning() << "SidecarMetadataStore: commit of" << file.fileName() << "failed:" << file.errorString();
            return false;
        }

        return true;
    }

    bool SidecarMetadataStore::Remove(const QString& vmdkPath)
    {
        QString path = SidecarPath(vmdkPath);
        if (!QFile::exists(path))
            return true;
        return QFile::remove(path);
    }
} // namespace Vmdk
