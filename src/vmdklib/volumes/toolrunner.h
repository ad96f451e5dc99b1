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

#ifndef VMDK_TOOLRUNNER_H
#define VMDK_TOOLRUNNER_H

#include "../vmdklib_global.h"
#include <QtCore/QString>
#include <QtCore/QStringList>

namespace Vmdk
{
    struct ToolResult
    {
        int exitCode = -1;
        // stdout and stderr, merged
        QString output;

        bool Succeeded() const { return this->exitCode == 0; }
    };

    /**
     * @brief Runs an external command line tool to completion
     */
    class VMDKLIB_EXPORT ToolRunner
    {
        public:
            virtual ~ToolRunner() {}

            virtual ToolResult Run(const QString& program, const QStringList& arguments) = 0;
    };

    class VMDKLIB_EXPORT QProcessToolRunner : public ToolRunner
    {
        public:
            ToolResult Run(const QString& program, const QStringList& arguments) override;
    };
} // namespace Vmdk

#endif // VMDK_TOOLRUNNER_H
