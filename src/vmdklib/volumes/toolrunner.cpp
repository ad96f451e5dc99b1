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

#include "toolrunner.h"
#include <QtCore/QDebug>
#include <QtCore/QProcess>

namespace Vmdk
{
    ToolResult QProcessToolRunner::Run(const QString& program, const QStringList& arguments)
    {
        ToolResult result;

        qDebug() << "QProcessToolRunner: running" << program << arguments;

        QProcess process;
        process.setProcessChannelMode(QProcess::MergedChannels);
        process.start(program, arguments);

        if (!process.waitForStarted())
        {
            result.exitCode = -1;
            result.output = process.errorString();
            qWarning() << "QProcessToolRunner: failed to start" << program << ":" << result.output;
            return result;
        }

        // Disk tools may run for a long time on large volumes
        process.waitForFinished(-1);

        result.output = QString::fromLocal8Bit(process.readAll());
        if (process.exitStatus() != QProcess::NormalExit)
        {
            result.exitCode = -1;
            if (result.output.isEmpty())
                result.output = process.errorString();
        } else
        {
            result.exitCode = process.exitCode();
        }

        qDebug() << "QProcessToolRunner:" << program << "exited with" << result.exitCode;
        return result;
    }
} // namespace Vmdk
