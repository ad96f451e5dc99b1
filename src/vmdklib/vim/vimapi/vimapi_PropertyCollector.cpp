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

#include "vimapi_PropertyCollector.h"
#include "vimapi_Helper.h"
#include "../session.h"

namespace VimAPI
{
    QString PropertyCollector::CreateFilter(Vim::Session* session, const QVariantMap& filterSpec, bool partialUpdates)
    {
        QVariantList params;
        params << Helper::SessionId(session) << filterSpec << partialUpdates;

        return Helper::Invoke(session, "PropertyCollector.CreateFilter", params).toString();
    }

    QVariant PropertyCollector::WaitForUpdates(Vim::Session* session, const QString& version)
    {
        QVariantList params;
        params << Helper::SessionId(session) << version;

        return Helper::Invoke(session, "PropertyCollector.WaitForUpdates", params);
    }

    void PropertyCollector::DestroyFilter(Vim::Session* session, const QString& filter)
    {
        QVariantList params;
        params << Helper::SessionId(session) << filter;

        Helper::Invoke(session, "PropertyFilter.Destroy", params);
    }
}
