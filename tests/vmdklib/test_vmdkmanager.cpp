#include <QtTest>
#include <QTemporaryDir>
#include "volumes/operationerror.h"
#include "volumes/vmdkmanager.h"
#include "test_helpers.h"

class VmdkManagerTests : public QObject
{
    Q_OBJECT

private slots:
    void init()
    {
        this->m_dir.reset(new QTemporaryDir());
        QVERIFY(this->m_dir->isValid());
        this->m_tools.reset(new RecordingToolRunner());
        this->m_metadata.reset(new MemoryMetadataStore());
        this->m_config = MakeTestConfig();
    }

    void create_onExistingPath_failsWithoutRunningTools()
    {
        const QString path = this->m_dir->filePath("vol1.vmdk");
        QVERIFY(WriteDescriptor(path));

        Vmdk::VmdkManager manager(this->m_tools.data(), this->m_metadata.data(), this->m_config);
        try
        {
            manager.Create(path, "vol1", QVariantMap());
            QFAIL("create on an existing descriptor must fail");
        } catch (const Vmdk::OperationError& error)
        {
            QVERIFY(error.kind() == Vmdk::OperationError::Validation);
            QVERIFY(error.message().contains("already exists"));
        }

        QVERIFY(this->m_tools->calls.isEmpty());
        QVERIFY(this->m_metadata->records.isEmpty());
    }

    void create_withDefaults_createsRegistersAndFormats()
    {
        const QString path = this->m_dir->filePath("vol1.vmdk");
        const QString flat = this->m_dir->filePath("vol1-flat.vmdk");

        Vmdk::VmdkManager manager(this->m_tools.data(), this->m_metadata.data(), this->m_config);
        manager.Create(path, "vol1", QVariantMap());

        QCOMPARE(this->m_tools->calls.size(), 2);
        QCOMPARE(this->m_tools->calls.at(0).second, QStringList() << "-d" << "thin" << "-c" << "100mb" << path);
        QCOMPARE(this->m_tools->calls.at(1).first, QString("mkfs.ext4"));
        QCOMPARE(this->m_tools->calls.at(1).second, QStringList() << "-qF" << "-L" << "vol1" << flat);

        const QVariantMap record = this->m_metadata->records.value(path);
        QCOMPARE(record.value("status").toString(), QString("detached"));
        QVERIFY(!record.contains("attachedVMUuid"));
    }

    void create_withOptions_passesSizeAndStoresOptions()
    {
        const QString path = this->m_dir->filePath("vol2.vmdk");
        QVariantMap options;
        options.insert("size", "2gb");
        options.insert("policy", "gold");

        Vmdk::VmdkManager manager(this->m_tools.data(), this->m_metadata.data(), this->m_config);
        manager.Create(path, "vol2", options);

        QCOMPARE(this->m_tools->calls.at(0).second.at(3), QString("2gb"));
        QVERIFY(this->m_metadata->records.value(path).value("volOpts").toMap() == options);
    }

    void create_whenCreateToolFails_reportsOutput()
    {
        const QString path = this->m_dir->filePath("vol1.vmdk");
        this->m_tools->Script("vmkfstools", 1, "Failed to create virtual disk: No space left on device");

        Vmdk::VmdkManager manager(this->m_tools.data(), this->m_metadata.data(), this->m_config);
        try
        {
            manager.Create(path, "vol1", QVariantMap());
            QFAIL("create must fail when the disk tool fails");
        } catch (const Vmdk::OperationError& error)
        {
            QVERIFY(error.kind() == Vmdk::OperationError::ToolInvocation);
            QVERIFY(error.message().startsWith("Failed to create " + path));
            QVERIFY(error.message().contains("No space left on device"));
        }

        QVERIFY(this->m_metadata->records.isEmpty());
        QCOMPARE(this->m_tools->CountCalls("mkfs.ext4"), 0);
    }

    void create_whenMetadataFails_deletesDisk()
    {
        const QString path = this->m_dir->filePath("vol1.vmdk");
        this->m_metadata->failCreate = true;

        Vmdk::VmdkManager manager(this->m_tools.data(), this->m_metadata.data(), this->m_config);
        try
        {
            manager.Create(path, "vol1", QVariantMap());
            QFAIL("create must fail when metadata can't be written");
        } catch (const Vmdk::OperationError& error)
        {
            QVERIFY(error.kind() == Vmdk::OperationError::Consistency);
            QCOMPARE(error.message(), QString("Failed to create meta-data store for %1").arg(path));
        }

        QCOMPARE(this->m_tools->CountCalls("vmkfstools", "-U"), 1);
        QCOMPARE(this->m_tools->calls.last().second, QStringList() << "-U" << path);
        QCOMPARE(this->m_tools->CountCalls("mkfs.ext4"), 0);
        QVERIFY(!QFileInfo::exists(path));
    }

    void create_whenMetadataAndRollbackFail_keepsOriginalError()
    {
        const QString path = this->m_dir->filePath("vol1.vmdk");
        this->m_metadata->failCreate = true;
        this->m_tools->Script("vmkfstools", 0);
        this->m_tools->Script("vmkfstools", 1, "Device or resource busy");

        Vmdk::VmdkManager manager(this->m_tools.data(), this->m_metadata.data(), this->m_config);
        try
        {
            manager.Create(path, "vol1", QVariantMap());
            QFAIL("create must fail when metadata can't be written");
        } catch (const Vmdk::OperationError& error)
        {
            QCOMPARE(error.message(), QString("Failed to create meta-data store for %1").arg(path));
        }
    }

    void create_whenFormatFails_deletesDisk()
    {
        const QString path = this->m_dir->filePath("vol1.vmdk");
        this->m_tools->Script("mkfs.ext4", 1, "mkfs failed");

        Vmdk::VmdkManager manager(this->m_tools.data(), this->m_metadata.data(), this->m_config);
        try
        {
            manager.Create(path, "vol1", QVariantMap());
            QFAIL("create must fail when formatting fails");
        } catch (const Vmdk::OperationError& error)
        {
            QCOMPARE(error.message(), QString("Failed to format %1.").arg(path));
        }

        QCOMPARE(this->m_tools->CountCalls("vmkfstools", "-U"), 1);
        QVERIFY(!this->m_metadata->records.contains(path));
    }

    void create_whenFormatAndDeleteFail_warnsAboutOrphan()
    {
        const QString path = this->m_dir->filePath("vol1.vmdk");
        this->m_tools->Script("mkfs.ext4", 1, "mkfs failed");
        this->m_tools->Script("vmkfstools", 0);
        this->m_tools->Script("vmkfstools", 1, "Device or resource busy");

        Vmdk::VmdkManager manager(this->m_tools.data(), this->m_metadata.data(), this->m_config);
        try
        {
            manager.Create(path, "vol1", QVariantMap());
            QFAIL("create must fail when formatting fails");
        } catch (const Vmdk::OperationError& error)
        {
            QCOMPARE(error.message(),
                     QString("Unable to format %1 and unable to delete volume. Please delete it manually.").arg(path));
        }
    }

    void create_whenBackingIsMissing_deletesDisk()
    {
        const QString path = this->m_dir->filePath("vol1.vmdk");
        this->m_tools->simulateDisks = false;

        Vmdk::VmdkManager manager(this->m_tools.data(), this->m_metadata.data(), this->m_config);
        try
        {
            manager.Create(path, "vol1", QVariantMap());
            QFAIL("create must fail without a backing to format");
        } catch (const Vmdk::OperationError& error)
        {
            QCOMPARE(error.message(), QString("Failed to format %1.").arg(path));
        }

        QCOMPARE(this->m_tools->CountCalls("mkfs.ext4"), 0);
        QCOMPARE(this->m_tools->CountCalls("vmkfstools", "-U"), 1);
        QVERIFY(!this->m_metadata->records.contains(path));
    }

    void resolveBacking_objectStoreDisk_opensObject()
    {
        const QString objectId = "52c3e5a1-7bd4-0c12-8e4f-020000a1b2c3";
        const QString path = this->m_dir->filePath("vol1.vmdk");
        QVERIFY(WriteDescriptor(path, QString("RW 204800 VMFS \"vsan://%1\"\n").arg(objectId)));

        QVERIFY(QDir().mkpath(this->m_dir->filePath("vsan")));
        QFile device(this->m_dir->filePath("vsan/" + objectId));
        QVERIFY(device.open(QIODevice::WriteOnly));
        device.close();

        this->m_config.vsanDevicesPath = this->m_dir->filePath("vsan");
        this->m_tools->simulateDisks = false;

        Vmdk::VmdkManager manager(this->m_tools.data(), this->m_metadata.data(), this->m_config);
        QCOMPARE(manager.ResolveBacking(path), this->m_dir->filePath("vsan/" + objectId));
        QCOMPARE(this->m_tools->calls.size(), 1);
        QCOMPARE(this->m_tools->calls.at(0).second, QStringList() << "open" << "-u" << objectId);
    }

    void resolveBacking_withoutFlatOrObject_isEmpty()
    {
        const QString path = this->m_dir->filePath("vol1.vmdk");
        QVERIFY(WriteDescriptor(path, "RW 204800 SPARSE \"vol1-delta.vmdk\"\n"));

        Vmdk::VmdkManager manager(this->m_tools.data(), this->m_metadata.data(), this->m_config);
        QVERIFY(manager.ResolveBacking(path).isEmpty());
        QVERIFY(this->m_tools->calls.isEmpty());
    }

    void list_returnsOnlyDescriptors()
    {
        QFile descriptor(this->m_dir->filePath("vol1.vmdk"));
        QVERIFY(descriptor.open(QIODevice::WriteOnly));
        QByteArray content = "# Disk DescriptorFile\n";
        content.append(QByteArray(40 - content.size() - 1, 'x'));
        content.append('\n');
        QCOMPARE(content.size(), 40);
        descriptor.write(content);
        descriptor.close();

        QFile unrelated(this->m_dir->filePath("notes.txt"));
        QVERIFY(unrelated.open(QIODevice::WriteOnly));
        unrelated.write("# Disk DescriptorFile\n");
        unrelated.close();

        QFile data(this->m_dir->filePath("vol1-flat.vmdk"));
        QVERIFY(data.open(QIODevice::WriteOnly));
        data.write(QByteArray(20000, '\0'));
        data.close();

        QFile foreign(this->m_dir->filePath("other.vmdk"));
        QVERIFY(foreign.open(QIODevice::WriteOnly));
        foreign.write("not a descriptor\n");
        foreign.close();

        Vmdk::VmdkManager manager(this->m_tools.data(), this->m_metadata.data(), this->m_config);
        const QVariantList volumes = manager.List(this->m_dir->path());

        QCOMPARE(volumes.size(), 1);
        const QVariantMap volume = volumes.first().toMap();
        QCOMPARE(volume.value("Name").toString(), QString("vol1"));
        QVERIFY(volume.value("Attributes").toMap().isEmpty());
        QVERIFY(this->m_tools->calls.isEmpty());
    }

    void remove_runsDeleteToolAndDropsMetadata()
    {
        const QString path = this->m_dir->filePath("vol1.vmdk");
        QVERIFY(WriteDescriptor(path));
        this->m_metadata->records.insert(path, QVariantMap());

        Vmdk::VmdkManager manager(this->m_tools.data(), this->m_metadata.data(), this->m_config);
        manager.Remove(path);

        QCOMPARE(this->m_tools->calls.size(), 1);
        QCOMPARE(this->m_tools->calls.at(0).second, QStringList() << "-U" << path);
        QVERIFY(!this->m_metadata->records.contains(path));
    }

    void remove_whenToolFails_reportsOutput()
    {
        const QString path = this->m_dir->filePath("vol1.vmdk");
        this->m_tools->Script("vmkfstools", 255, "File not found");

        Vmdk::VmdkManager manager(this->m_tools.data(), this->m_metadata.data(), this->m_config);
        try
        {
            manager.Remove(path);
            QFAIL("remove must fail when the delete tool fails");
        } catch (const Vmdk::OperationError& error)
        {
            QVERIFY(error.kind() == Vmdk::OperationError::ToolInvocation);
            QCOMPARE(error.message(), QString("Failed to remove %1. File not found").arg(path));
        }
    }

private:
    QScopedPointer<QTemporaryDir> m_dir;
    QScopedPointer<RecordingToolRunner> m_tools;
    QScopedPointer<MemoryMetadataStore> m_metadata;
    Vmdk::ServiceConfig m_config;
};

QTEST_APPLESS_MAIN(VmdkManagerTests)
#include "test_vmdkmanager.moc"
