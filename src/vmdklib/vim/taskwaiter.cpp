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

#include "taskwaiter.h"
#include "sessionmanager.h"
#include "hypervisorclient.h"
#include "session.h"
#include "failure.h"
#include <QtCore/QDebug>
#include <QtCore/QSet>
#include <QtCore/QSharedPointer>

namespace
{
    // Destroys the property filter when the wait is left, whichever way
    class ScopedFilter
    {
        public:
            ScopedFilter(Vim::HypervisorClient* client, const QSharedPointer<Vim::Session>& session, const QString& filterRef)
                : m_client(client), m_session(session), m_filterRef(filterRef)
            {
            }

            ~ScopedFilter()
            {
                try
                {
                    this->m_client->DestroyFilter(this->m_session.data(), this->m_filterRef);
                } catch (const Failure& failure)
                {
                    qWarning() << "TaskWaiter: failed to destroy filter" << this->m_filterRef << ":" << failure.what();
                }
            }

            ScopedFilter(const ScopedFilter&) = delete;
            ScopedFilter& operator=(const ScopedFilter&) = delete;

        private:
            Vim::HypervisorClient* m_client;
            QSharedPointer<Vim::Session> m_session;
            QString m_filterRef;
    };
} // namespace

namespace Vim
{
    const char* const TaskWaiter::STATE_QUEUED = "queued";
    const char* const TaskWaiter::STATE_RUNNING = "running";
    const char* const TaskWaiter::STATE_SUCCESS = "success";
    const char* const TaskWaiter::STATE_ERROR = "error";

    TaskWaiter::TaskWaiter(SessionManager* sessionManager) : m_sessionManager(sessionManager)
    {
    }

    void TaskWaiter::Wait(const QStringList& taskRefs)
    {
        if (taskRefs.isEmpty())
            return;

        HypervisorClient* client = this->m_sessionManager->GetClient();
        QSharedPointer<Session> session = this->m_sessionManager->GetSession();

        QString filterRef;
        try
        {
            filterRef = client->CreateTaskFilter(session.data(), taskRefs);
        } catch (const Failure& failure)
        {
            if (failure.kind() != Failure::AuthExpired)
                throw;

            qWarning() << "TaskWaiter: session expired while creating filter, reconnecting:" << failure.what();
            this->m_sessionManager->Reconnect();
            session = this->m_sessionManager->GetSession();
            filterRef = client->CreateTaskFilter(session.data(), taskRefs);
        }

        ScopedFilter filter(client, session, filterRef);

        QSet<QString> pending(taskRefs.begin(), taskRefs.end());
        QHash<QString, TaskState> tasks;
        QString version;

        while (!pending.isEmpty())
        {
            UpdateSet updates = client->WaitForUpdates(session.data(), version);
            version = updates.version;

            for (const ObjectUpdate& update : updates.objects)
            {
                if (!pending.contains(update.obj))
                    continue;

                TaskState& task = tasks[update.obj];
                for (const PropertyChange& change : update.changes)
                    applyChange(task, change);

                if (task.state == STATE_SUCCESS)
                {
                    qDebug() << "TaskWaiter: task" << update.obj << "completed";
                    pending.remove(update.obj);
                } else if (task.state == STATE_ERROR)
                {
                    qWarning() << "TaskWaiter: task" << update.obj << "failed";
                    if (task.error.isEmpty())
                        throw Failure(QStringList() << Failure::INTERNAL_ERROR << QString("Task %1 failed").arg(update.obj));
                    throw Failure::FromFault(task.error);
                }
            }
        }
    }

    void TaskWaiter::applyChange(TaskState& task, const PropertyChange& change)
    {
        if (change.name == "info")
        {
            QVariantMap info = change.value.toMap();
            if (info.contains("state"))
                task.state = info.value("state").toString();
            if (info.contains("error"))
                task.error = info.value("error").toMap();
        } else if (change.name == "info.state")
        {
            task.state = change.value.toString();
        } else if (change.name == "info.error")
        {
            task.error = change.value.toMap();
        }
    }
} // namespace Vim
