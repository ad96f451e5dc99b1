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

#ifndef VIM_PROPERTYUPDATE_H
#define VIM_PROPERTYUPDATE_H

#include "../vmdklib_global.h"
#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QVariant>

namespace Vim
{
    struct PropertyChange
    {
        QString name;
        QString op;
        QVariant value;
    };

    struct ObjectUpdate
    {
        QString obj;
        QString kind;
        QList<PropertyChange> changes;
    };

    /**
     * @brief One answer of WaitForUpdates
     *
     * The version is an opaque cursor: passing it to the next WaitForUpdates
     * call returns only the changes made after this update. The filter sets of
     * the wire format are flattened, the waiter only cares about objects.
     *
     * Wire format:
     * {
     *   "version": "3",
     *   "filterSet": [{
     *     "filter": "session[52b1]filter-7",
     *     "objectSet": [{
     *       "obj": "task-118",
     *       "kind": "modify",
     *       "changeSet": [{"name": "info.state", "op": "assign", "val": "running"}]
     *     }]
     *   }]
     * }
     */
    struct VMDKLIB_EXPORT UpdateSet
    {
        QString version;
        QList<ObjectUpdate> objects;

        static UpdateSet FromVariant(const QVariant& value);
    };
} // namespace Vim

#endif // VIM_PROPERTYUPDATE_H
