#include <QtTest>
#include <QTemporaryDir>
#include "vim/sessionmanager.h"
#include "volumes/diskattacher.h"
#include "volumes/operationerror.h"
#include "test_helpers.h"

namespace
{
    const char* const VM_UUID = "564d6865-2f33-29ad-6feb-87ea38f9083b";
    const char* const LSI_LOGIC = "VirtualLsiLogicController";
}

class DiskAttacherTests : public QObject
{
    Q_OBJECT

private slots:
    void init()
    {
        this->m_dir.reset(new QTemporaryDir());
        QVERIFY(this->m_dir->isValid());
        QVERIFY(QDir(this->m_dir->path()).mkpath("dockvols"));
        this->m_vmdkPath = this->m_dir->filePath("dockvols/vol1.vmdk");
        QVERIFY(WriteDescriptor(this->m_vmdkPath));

        this->m_vm.name = "vm1";
        this->m_vm.uuid = VM_UUID;
        this->m_vm.configPath = this->m_dir->filePath("vm1/vm1.vmx");

        this->m_hypervisor.reset(new FakeHypervisor());
        this->m_hypervisor->AddVm("vm1", "vm-101");
        this->m_sessions.reset(new Vim::SessionManager(this->m_hypervisor.data(), "dcui", "dvolplug"));
        this->m_sessions->Connect();
        this->m_metadata.reset(new MemoryMetadataStore());
        this->m_attacher.reset(new Vmdk::DiskAttacher(this->m_sessions.data(), this->m_metadata.data()));
    }

    void cleanup()
    {
        this->m_attacher.reset();
        this->m_sessions.reset();
        this->m_hypervisor.reset();
    }

    void attach_twice_returnsSameSlotAndReconfiguresOnce()
    {
        this->m_hypervisor->AddController("vm-101", Vim::VirtualDevice::PARAVIRTUAL_CONTROLLER_TYPE, 0);

        Vmdk::DiskSlot first = this->m_attacher->Attach(this->m_vmdkPath, this->m_vm);
        Vmdk::DiskSlot second = this->m_attacher->Attach(this->m_vmdkPath, this->m_vm);

        QCOMPARE(first.unit, 0);
        QCOMPARE(first.bus, 0);
        QCOMPARE(second.unit, first.unit);
        QCOMPARE(second.bus, first.bus);
        QCOMPARE(this->m_hypervisor->reconfigurations.size(), 1);

        const QVariantMap record = this->m_metadata->records.value(this->m_vmdkPath);
        QCOMPARE(record.value("status").toString(), QString("attached"));
        QCOMPARE(record.value("attachedVMUuid").toString(), QString(VM_UUID));
    }

    void attach_reportsUnitAndBusAsStrings()
    {
        this->m_hypervisor->AddController("vm-101", Vim::VirtualDevice::PARAVIRTUAL_CONTROLLER_TYPE, 1);

        QVariantMap result = this->m_attacher->Attach(this->m_vmdkPath, this->m_vm).ToVariantMap();

        QCOMPARE(result.value("Unit").toString(), QString("0"));
        QCOMPARE(result.value("Bus").toString(), QString("1"));
    }

    void attach_submitsPersistentDiskOnParavirtualController()
    {
        this->m_hypervisor->AddController("vm-101", Vim::VirtualDevice::PARAVIRTUAL_CONTROLLER_TYPE, 0);

        this->m_attacher->Attach(this->m_vmdkPath, this->m_vm);

        QCOMPARE(this->m_hypervisor->reconfigurations.size(), 1);
        const Vim::DeviceChangeList changes = this->m_hypervisor->reconfigurations.first().second;
        QCOMPARE(changes.size(), 1);
        QVERIFY(changes.first().operation == Vim::DeviceChange::Add);

        const Vim::VirtualDevice disk = changes.first().device;
        QVERIFY(disk.IsDisk());
        QCOMPARE(disk.GetBackingFileName(), "[] " + this->m_vmdkPath);
        QCOMPARE(disk.ToVariantMap().value("backing").toMap().value("diskMode").toString(), QString("persistent"));
        QCOMPARE(disk.GetLabel(), QString("dockerDataVolume"));
        QCOMPARE(disk.GetControllerKey(), 1000);
    }

    void attach_withUnitsTaken_picksLowestFreeUnit()
    {
        this->m_hypervisor->AddController("vm-101", Vim::VirtualDevice::PARAVIRTUAL_CONTROLLER_TYPE, 0);
        for (int unit = 0; unit < 3; ++unit)
            this->m_hypervisor->AddDisk("vm-101", QString("[datastore1] vm1/vm1_%1.vmdk").arg(unit), 0, unit);

        Vmdk::DiskSlot slot = this->m_attacher->Attach(this->m_vmdkPath, this->m_vm);

        QCOMPARE(slot.unit, 3);
        QCOMPARE(slot.bus, 0);
    }

    void attach_skipsControllerUnit()
    {
        this->m_hypervisor->AddController("vm-101", Vim::VirtualDevice::PARAVIRTUAL_CONTROLLER_TYPE, 0);
        for (int unit = 0; unit <= 6; ++unit)
            this->m_hypervisor->AddDisk("vm-101", QString("[datastore1] vm1/vm1_%1.vmdk").arg(unit), 0, unit);

        Vmdk::DiskSlot slot = this->m_attacher->Attach(this->m_vmdkPath, this->m_vm);

        QCOMPARE(slot.unit, 8);
    }

    void attach_ignoresDisksOfOtherControllers()
    {
        this->m_hypervisor->AddController("vm-101", LSI_LOGIC, 0);
        this->m_hypervisor->AddController("vm-101", Vim::VirtualDevice::PARAVIRTUAL_CONTROLLER_TYPE, 1);
        this->m_hypervisor->AddDisk("vm-101", "[datastore1] vm1/vm1.vmdk", 0, 0);

        Vmdk::DiskSlot slot = this->m_attacher->Attach(this->m_vmdkPath, this->m_vm);

        QCOMPARE(slot.unit, 0);
        QCOMPARE(slot.bus, 1);
    }

    void attach_allUnitsTaken_failsWithoutReconfigure()
    {
        this->m_hypervisor->AddController("vm-101", Vim::VirtualDevice::PARAVIRTUAL_CONTROLLER_TYPE, 0);
        for (int unit = 0; unit <= 15; ++unit)
        {
            if (unit == 7)
                continue;
            this->m_hypervisor->AddDisk("vm-101", QString("[datastore1] vm1/vm1_%1.vmdk").arg(unit), 0, unit);
        }

        try
        {
            this->m_attacher->Attach(this->m_vmdkPath, this->m_vm);
            QFAIL("attach must fail when the controller is full");
        } catch (const Vmdk::OperationError& error)
        {
            QVERIFY(error.message().contains("out of disk slots"));
        }

        QVERIFY(this->m_hypervisor->reconfigurations.isEmpty());
        QVERIFY(!this->m_metadata->records.contains(this->m_vmdkPath));
    }

    void attach_withoutParavirtualController_addsOneOnFreeBus()
    {
        this->m_hypervisor->AddController("vm-101", LSI_LOGIC, 0);
        this->m_hypervisor->AddController("vm-101", LSI_LOGIC, 1);

        Vmdk::DiskSlot slot = this->m_attacher->Attach(this->m_vmdkPath, this->m_vm);

        QCOMPARE(slot.bus, 2);
        QCOMPARE(slot.unit, 0);

        const Vim::DeviceChangeList changes = this->m_hypervisor->reconfigurations.first().second;
        QCOMPARE(changes.size(), 2);
        QVERIFY(changes.at(0).device.IsParaVirtualController());
        QCOMPARE(changes.at(0).device.GetKey(), 1002);
        QCOMPARE(changes.at(0).device.GetBusNumber(), 2);
        QCOMPARE(changes.at(1).device.GetControllerKey(), 1002);
        QCOMPARE(changes.at(1).device.GetUnitNumber(), 0);
    }

    void attach_fourForeignControllers_failsOutOfBusSlots()
    {
        for (int bus = 0; bus < 4; ++bus)
            this->m_hypervisor->AddController("vm-101", LSI_LOGIC, bus);

        try
        {
            this->m_attacher->Attach(this->m_vmdkPath, this->m_vm);
            QFAIL("attach must fail when all buses are taken");
        } catch (const Vmdk::OperationError& error)
        {
            QVERIFY(error.message().contains("out of bus slots"));
        }

        QVERIFY(this->m_hypervisor->reconfigurations.isEmpty());
    }

    void attach_fault_namesOtherOwnerFromMetadata()
    {
        this->m_hypervisor->AddController("vm-101", Vim::VirtualDevice::PARAVIRTUAL_CONTROLLER_TYPE, 0);
        this->m_hypervisor->reconfigureFault = FakeHypervisor::Fault(Failure::FILE_LOCKED, "Failed to lock the file");

        QVariantMap record;
        record.insert("status", "attached");
        record.insert("attachedVMUuid", "564d0000-0000-0000-0000-000000000001");
        this->m_metadata->records.insert(this->m_vmdkPath, record);

        try
        {
            this->m_attacher->Attach(this->m_vmdkPath, this->m_vm);
            QFAIL("attach must fail when the task fails");
        } catch (const Vmdk::OperationError& error)
        {
            QVERIFY(error.kind() == Vmdk::OperationError::HypervisorFault);
            QCOMPARE(error.message(), QString("Failed to lock the file disk %1 already attached to VM=564d0000-0000-0000-0000-000000000001")
                                          .arg(this->m_vmdkPath));
        }

        QVERIFY(this->m_metadata->records.value(this->m_vmdkPath) == record);
        QCOMPARE(this->m_hypervisor->destroyFilterCount, 1);
    }

    void attach_fault_withoutOtherOwner_reportsFaultOnly()
    {
        this->m_hypervisor->AddController("vm-101", Vim::VirtualDevice::PARAVIRTUAL_CONTROLLER_TYPE, 0);
        this->m_hypervisor->reconfigureFault = FakeHypervisor::Fault(Failure::INVALID_DEVICE_SPEC, "Invalid configuration for device '0'.");
        this->m_metadata->Create(this->m_vmdkPath, "detached", QVariantMap());

        try
        {
            this->m_attacher->Attach(this->m_vmdkPath, this->m_vm);
            QFAIL("attach must fail when the task fails");
        } catch (const Vmdk::OperationError& error)
        {
            QCOMPARE(error.message(), QString("Invalid configuration for device '0'."));
        }

        QCOMPARE(this->m_metadata->records.value(this->m_vmdkPath).value("status").toString(), QString("detached"));
    }

    void attach_whenMetadataWriteFails_stillSucceeds()
    {
        this->m_hypervisor->AddController("vm-101", Vim::VirtualDevice::PARAVIRTUAL_CONTROLLER_TYPE, 0);
        this->m_metadata->failSetAll = true;

        Vmdk::DiskSlot slot = this->m_attacher->Attach(this->m_vmdkPath, this->m_vm);

        QCOMPARE(slot.unit, 0);
        QCOMPARE(this->m_hypervisor->reconfigurations.size(), 1);
    }

    void attach_unknownVm_isNotFound()
    {
        this->m_vm.name = "ghost";

        try
        {
            this->m_attacher->Attach(this->m_vmdkPath, this->m_vm);
            QFAIL("attach to an unknown VM must fail");
        } catch (const Vmdk::OperationError& error)
        {
            QVERIFY(error.kind() == Vmdk::OperationError::NotFound);
        }
    }

    void attach_sessionExpiredDuringLookup_reconnectsOnce()
    {
        this->m_hypervisor->AddController("vm-101", Vim::VirtualDevice::PARAVIRTUAL_CONTROLLER_TYPE, 0);
        this->m_hypervisor->findVmFaults << Failure::NOT_AUTHENTICATED;

        Vmdk::DiskSlot slot = this->m_attacher->Attach(this->m_vmdkPath, this->m_vm);

        QCOMPARE(slot.unit, 0);
        QCOMPARE(this->m_hypervisor->loginCount, 2);
    }

    void attach_sessionExpiredTwiceDuringLookup_propagates()
    {
        this->m_hypervisor->findVmFaults << Failure::NOT_AUTHENTICATED << Failure::NOT_AUTHENTICATED;

        QVERIFY_EXCEPTION_THROWN(this->m_attacher->Attach(this->m_vmdkPath, this->m_vm), Failure);
        QCOMPARE(this->m_hypervisor->loginCount, 2);
        QVERIFY(this->m_hypervisor->reconfigurations.isEmpty());
    }

    void detach_noMatchingDevice_isNotFoundWithoutReconfigure()
    {
        this->m_hypervisor->AddController("vm-101", Vim::VirtualDevice::PARAVIRTUAL_CONTROLLER_TYPE, 0);
        this->m_hypervisor->AddDisk("vm-101", "[datastore1] vm1/vm1.vmdk", 0, 0);

        try
        {
            this->m_attacher->Detach(this->m_vmdkPath, this->m_vm);
            QFAIL("detach of a disk that isn't attached must fail");
        } catch (const Vmdk::OperationError& error)
        {
            QVERIFY(error.kind() == Vmdk::OperationError::NotFound);
            QCOMPARE(error.message(), QString("Detach failed: disk=%1 not found. VM=%2").arg(this->m_vmdkPath, QString(VM_UUID)));
        }

        QVERIFY(this->m_hypervisor->reconfigurations.isEmpty());
    }

    void detach_afterAttach_removesDiskAndMarksDetached()
    {
        this->m_hypervisor->AddController("vm-101", Vim::VirtualDevice::PARAVIRTUAL_CONTROLLER_TYPE, 0);
        this->m_attacher->Attach(this->m_vmdkPath, this->m_vm);

        this->m_attacher->Detach(this->m_vmdkPath, this->m_vm);

        QCOMPARE(this->m_hypervisor->reconfigurations.size(), 2);
        const Vim::DeviceChangeList changes = this->m_hypervisor->reconfigurations.last().second;
        QCOMPARE(changes.size(), 1);
        QVERIFY(changes.first().operation == Vim::DeviceChange::Remove);
        QVERIFY(changes.first().device.IsDisk());

        QCOMPARE(Vmdk::DiskAttacher::FindDeviceByPath(this->m_vmdkPath, this->m_hypervisor->devices.value("vm-101")), -1);

        const QVariantMap record = this->m_metadata->records.value(this->m_vmdkPath);
        QCOMPARE(record.value("status").toString(), QString("detached"));
        QVERIFY(!record.contains("attachedVMUuid"));
    }

    void detach_fault_aggregatesFaultMessages()
    {
        this->m_hypervisor->AddController("vm-101", Vim::VirtualDevice::PARAVIRTUAL_CONTROLLER_TYPE, 0);
        this->m_hypervisor->AddDisk("vm-101", "[datastore1] dockvols/vol1.vmdk", 0, 1);
        this->m_hypervisor->reconfigureFault = FakeHypervisor::Fault(Failure::GENERIC_VM_CONFIG_FAULT, "Device busy",
                                                                     QStringList() << "Hot remove failed" << "Device is in use");

        try
        {
            this->m_attacher->Detach(this->m_vmdkPath, this->m_vm);
            QFAIL("detach must fail when the task fails");
        } catch (const Vmdk::OperationError& error)
        {
            QVERIFY(error.kind() == Vmdk::OperationError::HypervisorFault);
            QCOMPARE(error.message(), QString("Failed to detach %1: Hot remove failed; Device is in use").arg(this->m_vmdkPath));
        }
    }

    void findDeviceByPath_matchesDatastoreRelativeBacking()
    {
        FakeHypervisor hypervisor;
        hypervisor.AddDisk("vm", "[datastore1] dockvols/vol10.vmdk", 0, 0);
        hypervisor.AddDisk("vm", "[datastore1] elsewhere/vol1.vmdk", 0, 1);
        hypervisor.AddDisk("vm", "[datastore1] dockvols/vol1.vmdk", 0, 2);

        QCOMPARE(Vmdk::DiskAttacher::FindDeviceByPath(this->m_vmdkPath, hypervisor.devices.value("vm")), 2);
    }

    void findDeviceByPath_datastoreNameWithSpaces()
    {
        FakeHypervisor hypervisor;
        hypervisor.AddDisk("vm", "[SSD Store] elsewhere/vol1.vmdk", 0, 0);
        hypervisor.AddDisk("vm", "[SSD Store] dockvols/vol1.vmdk", 0, 1);

        QCOMPARE(Vmdk::DiskAttacher::FindDeviceByPath(this->m_vmdkPath, hypervisor.devices.value("vm")), 1);
    }

    void attach_alreadyAttachedOnDatastoreWithSpaces_doesNotReconfigure()
    {
        this->m_hypervisor->AddController("vm-101", Vim::VirtualDevice::PARAVIRTUAL_CONTROLLER_TYPE, 0);
        this->m_hypervisor->AddDisk("vm-101", "[SSD Store] dockvols/vol1.vmdk", 0, 4);

        Vmdk::DiskSlot slot = this->m_attacher->Attach(this->m_vmdkPath, this->m_vm);

        QCOMPARE(slot.unit, 4);
        QCOMPARE(slot.bus, 0);
        QVERIFY(this->m_hypervisor->reconfigurations.isEmpty());

        this->m_attacher->Detach(this->m_vmdkPath, this->m_vm);
        QCOMPARE(this->m_hypervisor->reconfigurations.size(), 1);
    }

private:
    QScopedPointer<QTemporaryDir> m_dir;
    QScopedPointer<FakeHypervisor> m_hypervisor;
    QScopedPointer<Vim::SessionManager> m_sessions;
    QScopedPointer<MemoryMetadataStore> m_metadata;
    QScopedPointer<Vmdk::DiskAttacher> m_attacher;
    QString m_vmdkPath;
    Vmdk::VmContext m_vm;
};

QTEST_APPLESS_MAIN(DiskAttacherTests)
#include "test_diskattacher.moc"
