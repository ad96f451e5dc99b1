#include <QtTest>
#include "vim/sessionmanager.h"
#include "vim/taskwaiter.h"
#include "test_helpers.h"

class TaskWaiterTests : public QObject
{
    Q_OBJECT

private slots:
    void init()
    {
        this->m_hypervisor.reset(new FakeHypervisor());
        this->m_sessions.reset(new Vim::SessionManager(this->m_hypervisor.data(), "dcui", "dvolplug"));
        this->m_sessions->Connect();
    }

    void cleanup()
    {
        this->m_sessions.reset();
        this->m_hypervisor.reset();
    }

    void wait_followsCursorUntilSuccess()
    {
        this->m_hypervisor->scriptedUpdates
            << FakeHypervisor::TaskUpdate("1", "task-1", "info.state", "queued")
            << FakeHypervisor::TaskUpdate("2", "task-1", "info.state", "running")
            << FakeHypervisor::TaskUpdate("3", "task-1", "info.state", "success");

        Vim::TaskWaiter waiter(this->m_sessions.data());
        waiter.Wait(QStringList() << "task-1");

        QCOMPARE(this->m_hypervisor->waitVersions, QStringList() << "" << "1" << "2");
        QCOMPARE(this->m_hypervisor->createFilterCount, 1);
        QCOMPARE(this->m_hypervisor->destroyFilterCount, 1);
    }

    void wait_acceptsWholeInfoObject()
    {
        QVariantMap info;
        info.insert("state", "success");
        this->m_hypervisor->scriptedUpdates << FakeHypervisor::TaskUpdate("1", "task-1", "info", info);

        Vim::TaskWaiter waiter(this->m_sessions.data());
        waiter.Wait(QStringList() << "task-1");

        QCOMPARE(this->m_hypervisor->waitCount, 1);
    }

    void wait_waitsForEveryTask()
    {
        this->m_hypervisor->scriptedUpdates
            << FakeHypervisor::TaskUpdate("1", "task-1", "info.state", "success")
            << FakeHypervisor::TaskUpdate("2", "task-2", "info.state", "running")
            << FakeHypervisor::TaskUpdate("3", "task-2", "info.state", "success");

        Vim::TaskWaiter waiter(this->m_sessions.data());
        waiter.Wait(QStringList() << "task-1" << "task-2");

        QCOMPARE(this->m_hypervisor->waitCount, 3);
    }

    void wait_firstErrorIsRaisedWithoutAwaitingSiblings()
    {
        Vim::UpdateSet failed = FakeHypervisor::TaskUpdate("3", "task-1", "info.error",
                                                           FakeHypervisor::Fault(Failure::GENERIC_VM_CONFIG_FAULT, "Reconfiguration failed"));
        Vim::PropertyChange state;
        state.name = "info.state";
        state.op = "assign";
        state.value = "error";
        failed.objects.first().changes.append(state);

        this->m_hypervisor->scriptedUpdates
            << FakeHypervisor::TaskUpdate("1", "task-1", "info.state", "queued")
            << FakeHypervisor::TaskUpdate("2", "task-1", "info.state", "running")
            << failed
            << FakeHypervisor::TaskUpdate("4", "task-2", "info.state", "success");

        Vim::TaskWaiter waiter(this->m_sessions.data());
        try
        {
            waiter.Wait(QStringList() << "task-1" << "task-2");
            QFAIL("a failed task must be raised");
        } catch (const Failure& failure)
        {
            QCOMPARE(failure.errorCode(), QString(Failure::GENERIC_VM_CONFIG_FAULT));
            QCOMPARE(failure.message(), QString("Reconfiguration failed"));
            QVERIFY(failure.kind() == Failure::DeviceFault);
        }

        // task-2 was still pending, its update is never fetched
        QCOMPARE(this->m_hypervisor->waitCount, 3);
        QCOMPARE(this->m_hypervisor->scriptedUpdates.size(), 1);
        QCOMPARE(this->m_hypervisor->destroyFilterCount, 1);
    }

    void wait_errorAfterSiblingSucceeded_isRaised()
    {
        this->m_hypervisor->scriptedUpdates
            << FakeHypervisor::TaskUpdate("1", "task-1", "info.state", "success")
            << FakeHypervisor::TaskUpdate("2", "task-2", "info.state", "error");

        Vim::TaskWaiter waiter(this->m_sessions.data());
        try
        {
            waiter.Wait(QStringList() << "task-1" << "task-2");
            QFAIL("a failed task must be raised");
        } catch (const Failure& failure)
        {
            QCOMPARE(failure.message(), QString("Task task-2 failed"));
        }

        QCOMPARE(this->m_hypervisor->waitCount, 2);
    }

    void wait_ignoresUnrelatedObjects()
    {
        this->m_hypervisor->scriptedUpdates
            << FakeHypervisor::TaskUpdate("1", "task-99", "info.state", "error")
            << FakeHypervisor::TaskUpdate("2", "task-1", "info.state", "success");

        Vim::TaskWaiter waiter(this->m_sessions.data());
        waiter.Wait(QStringList() << "task-1");

        QCOMPARE(this->m_hypervisor->waitCount, 2);
    }

    void wait_hasNoDeadline()
    {
        // There is no timeout: a task that never reaches a terminal state
        // blocks the caller for as long as the host keeps it running. The
        // test scripts the terminal state explicitly for that reason.
        for (int i = 1; i <= 50; ++i)
            this->m_hypervisor->scriptedUpdates << FakeHypervisor::TaskUpdate(QString::number(i), "task-1", "info.state", "running");
        this->m_hypervisor->scriptedUpdates << FakeHypervisor::TaskUpdate("51", "task-1", "info.state", "success");

        Vim::TaskWaiter waiter(this->m_sessions.data());
        waiter.Wait(QStringList() << "task-1");

        QCOMPARE(this->m_hypervisor->waitCount, 51);
    }

    void wait_authExpiredOnFilterCreation_reconnectsOnce()
    {
        this->m_hypervisor->createFilterFaults << Failure::NOT_AUTHENTICATED;

        Vim::TaskWaiter waiter(this->m_sessions.data());
        waiter.Wait(QStringList() << "task-1");

        QCOMPARE(this->m_hypervisor->loginCount, 2);
        QCOMPARE(this->m_hypervisor->createFilterCount, 2);
        QCOMPARE(this->m_hypervisor->destroyFilterCount, 1);
    }

    void wait_authExpiredTwice_propagates()
    {
        this->m_hypervisor->createFilterFaults << Failure::NOT_AUTHENTICATED << Failure::SESSION_INVALID;

        Vim::TaskWaiter waiter(this->m_sessions.data());
        try
        {
            waiter.Wait(QStringList() << "task-1");
            QFAIL("a second authentication fault must propagate");
        } catch (const Failure& failure)
        {
            QVERIFY(failure.kind() == Failure::AuthExpired);
        }

        QCOMPARE(this->m_hypervisor->loginCount, 2);
        QCOMPARE(this->m_hypervisor->createFilterCount, 2);
        QCOMPARE(this->m_hypervisor->waitCount, 0);
        QCOMPARE(this->m_hypervisor->destroyFilterCount, 0);
    }

    void wait_otherFilterFault_doesNotReconnect()
    {
        this->m_hypervisor->createFilterFaults << "InvalidArgument";

        Vim::TaskWaiter waiter(this->m_sessions.data());
        QVERIFY_EXCEPTION_THROWN(waiter.Wait(QStringList() << "task-1"), Failure);

        QCOMPARE(this->m_hypervisor->loginCount, 1);
        QCOMPARE(this->m_hypervisor->createFilterCount, 1);
    }

    void wait_emptyTaskList_returnsImmediately()
    {
        Vim::TaskWaiter waiter(this->m_sessions.data());
        waiter.Wait(QStringList());

        QCOMPARE(this->m_hypervisor->createFilterCount, 0);
    }

private:
    QScopedPointer<FakeHypervisor> m_hypervisor;
    QScopedPointer<Vim::SessionManager> m_sessions;
};

QTEST_APPLESS_MAIN(TaskWaiterTests)
#include "test_taskwaiter.moc"
