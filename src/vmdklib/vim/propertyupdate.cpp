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

#include "propertyupdate.h"
#include <QtCore/QVariantMap>
#include <QtCore/QVariantList>

namespace Vim
{
    UpdateSet UpdateSet::FromVariant(const QVariant& value)
    {
        UpdateSet update;
        const QVariantMap map = value.toMap();

        update.version = map.value("version").toString();

        const QVariantList filterSets = map.value("filterSet").toList();
        for (const QVariant& filterSet : filterSets)
        {
            const QVariantList objectSets = filterSet.toMap().value("objectSet").toList();
            for (const QVariant& objectSetVar : objectSets)
            {
                const QVariantMap objectSet = objectSetVar.toMap();

                ObjectUpdate object;
                object.obj = objectSet.value("obj").toString();
                object.kind = objectSet.value("kind").toString();

                const QVariantList changeSet = objectSet.value("changeSet").toList();
                for (const QVariant& changeVar : changeSet)
                {
                    const QVariantMap changeMap = changeVar.toMap();

                    PropertyChange change;
                    change.name = changeMap.value("name").toString();
                    change.op = changeMap.value("op").toString();
                    change.value = changeMap.value("val");
                    object.changes.append(change);
                }

                if (!object.obj.isEmpty())
                    update.objects.append(object);
            }
        }

        return update;
    }
} // namespace Vim
