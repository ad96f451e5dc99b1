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

#ifndef VIMAPI_PROPERTYCOLLECTOR_H
#define VIMAPI_PROPERTYCOLLECTOR_H

#include "../../vmdklib_global.h"
#include <QString>
#include <QVariant>
#include <QVariantMap>

namespace Vim
{
    class Session;
}

namespace VimAPI
{
    /// <summary>
    /// Static methods for the session's property collector (incremental change subscription)
    /// </summary>
    class VMDKLIB_EXPORT PropertyCollector
    {
        private:
            PropertyCollector() = delete;

        public:
            /// <summary>
            /// Create a filter over the objects named in filterSpec
            /// </summary>
            /// <param name="filterSpec">{"objectSet": [{"obj": ref}], "propSet": [{"type": ..., "all": true}]}</param>
            /// <param name="partialUpdates">Report only changed properties</param>
            /// <returns>Filter reference</returns>
            static QString CreateFilter(Vim::Session* session, const QVariantMap& filterSpec, bool partialUpdates);

            /// <summary>
            /// Block until a filtered object changes after version
            /// </summary>
            /// <param name="version">Cursor returned by the previous call, empty for the initial state</param>
            static QVariant WaitForUpdates(Vim::Session* session, const QString& version);

            /// <summary>
            /// Destroy a filter (managed object: PropertyFilter)
            /// </summary>
            static void DestroyFilter(Vim::Session* session, const QString& filter);
    };
}

#endif // VIMAPI_PROPERTYCOLLECTOR_H
