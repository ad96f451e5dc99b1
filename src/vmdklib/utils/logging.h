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

#ifndef VMDK_LOGGING_H
#define VMDK_LOGGING_H

#include "../vmdklib_global.h"
#include <QtCore/QFile>
#include <QtCore/QMutex>
#include <QtCore/QString>
#include <QtCore/QtGlobal>

namespace Vmdk
{
    /**
     * @brief Routes Qt's message macros into the service log file
     *
     * Every qDebug/qInfo/qWarning/qCritical at or above the configured level
     * is appended to the log file as "yyyy-MM-dd hh:mm:ss.zzz LEVEL message"
     * and passed on to the handler that was installed before (stderr by
     * default).
     */
    class VMDKLIB_EXPORT Logging
    {
        private:
            Logging() = delete;

        public:
            // Returns false when the log file can't be opened, the handler is installed anyway
            static bool Install(const QString& fileName, QtMsgType minimumLevel);
            static void Uninstall();

            // "debug", "info", "warning", "critical"; anything else is info
            static QtMsgType LevelFromString(const QString& level);

            static QString FormatMessage(QtMsgType type, const QString& message);

        private:
            static void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);
            static int severity(QtMsgType type);

            static QtMessageHandler s_originalHandler;
            static bool s_installed;
            static QtMsgType s_minimumLevel;
            static QFile* s_logFile;
            static QMutex s_mutex;
    };
} // namespace Vmdk

#endif // VMDK_LOGGING_H
