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

#include "logging.h"
#include <QtCore/QDateTime>
#include <QtCore/QMutexLocker>

namespace Vmdk
{
    QtMessageHandler Logging::s_originalHandler = nullptr;
    bool Logging::s_installed = false;
    QtMsgType Logging::s_minimumLevel = QtInfoMsg;
    QFile* Logging::s_logFile = nullptr;
    QMutex Logging::s_mutex;

    bool Logging::Install(const QString& fileName, QtMsgType minimumLevel)
    {
        QMutexLocker locker(&Logging::s_mutex);

        Logging::s_minimumLevel = minimumLevel;

        bool opened = true;
        if (!fileName.isEmpty() && !Logging::s_logFile)
        {
            QFile* file = new QFile(fileName);
            if (file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text))
            {
                Logging::s_logFile = file;
            } else
            {
                delete file;
                opened = false;
            }
        }

        if (!Logging::s_installed)
        {
            Logging::s_originalHandler = qInstallMessageHandler(Logging::messageHandler);
            Logging::s_installed = true;
        }

        return opened;
    }

    void Logging::Uninstall()
    {
        QMutexLocker locker(&Logging::s_mutex);
        if (Logging::s_installed)
        {
            qInstallMessageHandler(Logging::s_originalHandler);
            Logging::s_originalHandler = nullptr;
            Logging::s_installed = false;
        }

        if (Logging::s_logFile)
        {
            Logging::s_logFile->close();
            delete Logging::s_logFile;
            Logging::s_logFile = nullptr;
        }
    }

    QtMsgType Logging::LevelFromString(const QString& level)
    {
        const QString lower = level.trimmed().toLower();
        if (lower == "debug")
            return QtDebugMsg;
        if (lower == "warning" || lower == "warn")
            return QtWarningMsg;
        if (lower == "critical" || lower == "error")
            return QtCriticalMsg;
        return QtInfoMsg;
    }

    int Logging::severity(QtMsgType type)
    {
        switch (type)
        {
            case QtInfoMsg:
                return 1;
            case QtWarningMsg:
                return 2;
            case QtCriticalMsg:
            case QtFatalMsg:
                return 3;
            default:
                return 0;
        }
    }

    QString Logging::FormatMessage(QtMsgType type, const QString& message)
    {
        QString typeStr;
        switch (type)
        {
            case QtDebugMsg:
                typeStr = "DEBUG";
                break;
            case QtInfoMsg:
                typeStr = "INFO";
                break;
            case QtWarningMsg:
                typeStr = "WARNING";
                break;
            case QtCriticalMsg:
                typeStr = "ERROR";
                break;
            case QtFatalMsg:
                typeStr = "FATAL";
                break;
        }

        QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
        return QString("%1 %2 %3").arg(timestamp, typeStr, message);
    }

    void Logging::messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
    {
        if (Logging::severity(type) < Logging::severity(Logging::s_minimumLevel))
            return;

        // Keep console output
        if (Logging::s_originalHandler)
            Logging::s_originalHandler(type, context, msg);

        QMutexLocker locker(&Logging::s_mutex);
        if (Logging::s_logFile)
        {
            Logging::s_logFile->write(Logging::FormatMessage(type, msg).toUtf8());
            Logging::s_logFile->write("\n");
            Logging::s_logFile->flush();
        }
    }
} // namespace Vmdk
