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

#ifndef VIM_TASKWAITER_H
#define VIM_TASKWAITER_H

#include "../vmdklib_global.h"
#include <QtCore/QHash>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariantMap>

namespace Vim
{
    class SessionManager;
    struct PropertyChange;

    /**
     * @brief Blocks until a set of hypervisor tasks reached a terminal state
     *
     * Subscribes to the tasks through a property filter and follows the
     * update cursor until every task succeeded. The first task that ends in
     * the error state is reported by throwing its fault, siblings still
     * running are not awaited. There is no timeout, the wait is bounded only
     * by the lifetime of the tasks on the host.
     *
     * The filter is destroyed on every exit path.
     */
    class VMDKLIB_EXPORT TaskWaiter
    {
        public:
            static const char* const STATE_QUEUED;
            static const char* const STATE_RUNNING;
            static const char* const STATE_SUCCESS;
            static const char* const STATE_ERROR;

            explicit TaskWaiter(SessionManager* sessionManager);

            /**
             * @brief Wait for all tasks in taskRefs
             *
             * If the filter can't be created because the session expired the
             * session is re-established once and the filter creation retried
             * once, any further failure propagates.
             *
             * @throws Failure with the fault of the first failed task
             */
            void Wait(const QStringList& taskRefs);

        private:
            struct TaskState
            {
                QString state;
                QVariantMap error;
            };

            static void applyChange(TaskState& task, const PropertyChange& change);

            SessionManager* m_sessionManager;
    };
} // namespace Vim

#endif // VIM_TASKWAITER_H
