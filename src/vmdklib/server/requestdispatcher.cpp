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

#include "requestdispatcher.h"
#include "../vim/failure.h"
#include "../volumes/diskattacher.h"
#include "../volumes/operationerror.h"
#include "../volumes/toolrunner.h"
#include "../volumes/vmdkmanager.h"
#include <QtCore/QDebug>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>

namespace Vmdk
{
    RequestDispatcher::RequestDispatcher(VmdkManager* volumes, DiskAttacher* attacher, ToolRunner* toolRunner, const ServiceConfig& config)
        : m_volumes(volumes), m_attacher(attacher), m_toolRunner(toolRunner), m_config(config)
    {
    }

    QByteArray RequestDispatcher::HandleRequest(const VmContext& vm, const QByteArray& payload)
    {
        QJsonParseError parseError;
        QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject())
        {
            qWarning() << "RequestDispatcher: failed to parse request:" << parseError.errorString();
            return ErrorReply(QString("Failed to parse json '%1'.").arg(QString::fromUtf8(payload)));
        }

        QVariantMap request = doc.object().toVariantMap();
        if (!request.contains("cmd") || request.value("details").typeId() != QMetaType::QVariantMap)
            return ErrorReply("Invalid request: 'cmd' and 'details' are required");

        QVariantMap details = request.value("details").toMap();
        if (!details.contains("Name"))
            return ErrorReply("Invalid request: 'details.Name' is required");

        QString cmd = request.value("cmd").toString();
        QString name = details.value("Name").toString();
        QVariantMap options = details.value("Opts").toMap();

        try
        {
            QVariant result = this->Execute(vm, cmd, name, options);
            qDebug() << "RequestDispatcher: executeRequest ret =" << result;
            return SerializeResult(result);
        } catch (const OperationError& error)
        {
            qWarning() << "RequestDispatcher:" << cmd << "failed (" << OperationError::KindToString(error.kind()) << "):" << error.message();
            return ErrorReply(error.message());
        } catch (const Failure& failure)
        {
            qWarning() << "RequestDispatcher:" << cmd << "failed with hypervisor fault:" << failure.what();
            return ErrorReply(failure.message());
        } catch (const std::exception& exception)
        {
            qCritical() << "RequestDispatcher:" << cmd << "failed:" << exception.what();
            return ErrorReply(QString::fromLocal8Bit(exception.what()));
        }
    }

    QVariant RequestDispatcher::Execute(const VmContext& vm, const QString& cmd, const QString& volumeName, const QVariantMap& options)
    {
        static const QStringList commands = QStringList() << "create" << "remove" << "list" << "attach" << "detach";
        if (!commands.contains(cmd))
            throw OperationError(OperationError::Validation, "Unknown command:" + cmd);

        QString volumePath = this->GetVolumePath(vm.configPath);

        if (cmd == "list")
            return this->m_volumes->List(volumePath);

        if (volumeName.isEmpty() || volumeName.contains('/'))
            throw OperationError(OperationError::Validation, QString("Invalid volume name '%1'").arg(volumeName));

        QString vmdkPath = QDir(volumePath).filePath(volumeName + VmdkManager::DESCRIPTOR_EXTENSION);

        if (cmd == "create")
        {
            this->m_volumes->Create(vmdkPath, volumeName, options);
            return QVariant();
        } else if (cmd == "remove")
        {
            this->m_volumes->Remove(vmdkPath);
            return QVariant();
        } else if (cmd == "attach")
        {
            return this->m_attacher->Attach(vmdkPath, vm).ToVariantMap();
        }

        this->m_attacher->Detach(vmdkPath, vm);
        return QVariant();
    }

    QString RequestDispatcher::GetVolumePath(const QString& configPath)
    {
        // <datastore>/<vm folder>/<vm>.vmx -> <datastore>/dockvols
        QFileInfo vmFolder(QFileInfo(configPath).absolutePath());
        QString path = QDir(vmFolder.absolutePath()).filePath(this->m_config.volumeDirectory);

        if (QFileInfo(path).isDir())
        {
            qDebug() << "RequestDispatcher: found" << path << "- returning";
            return path;
        }

        ToolResult result = this->m_toolRunner->Run(this->m_config.osfsMkdirPath, QStringList() << "-n" << path);
        if (!result.Succeeded())
        {
            qWarning() << "RequestDispatcher: failed to create" << path << ":" << result.output;
            throw OperationError(OperationError::ToolInvocation, QString("Failed initializing volume path %1").arg(path));
        }

        qInfo() << "RequestDispatcher:" << path << "created";
        return path;
    }

    QByteArray RequestDispatcher::ErrorReply(const QString& message)
    {
        QJsonObject error;
        error.insert("Error", message);
        return QJsonDocument(error).toJson(QJsonDocument::Compact);
    }

    QByteArray RequestDispatcher::SerializeResult(const QVariant& result)
    {
        if (!result.isValid() || result.isNull())
            return "null";

        if (result.typeId() == QMetaType::QVariantList)
            return QJsonDocument(QJsonArray::fromVariantList(result.toList())).toJson(QJsonDocument::Compact);

        return QJsonDocument(QJsonObject::fromVariantMap(result.toMap())).toJson(QJsonDocument::Compact);
    }
} // namespace Vmdk
