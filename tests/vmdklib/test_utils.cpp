#include <QtTest>
#include <QFile>
#include <QRegularExpression>
#include <QTemporaryDir>
#include "utils/logging.h"
#include "utils/misc.h"
#include "utils/serviceconfig.h"
#include "volumes/metadatastore.h"

class UtilsTests : public QObject
{
    Q_OBJECT

private slots:
    void formatUuid_acceptsRawAndSeparatedForms()
    {
        const QString expected = "564d6865-2f33-29ad-6feb-87ea38f9083b";
        QCOMPARE(Vmdk::Misc::FormatUuid("564d68652f3329ad6feb87ea38f9083b"), expected);
        QCOMPARE(Vmdk::Misc::FormatUuid("56 4d 68 65 2f 33 29 ad-6f eb 87 ea 38 f9 08 3b"), expected);
        QCOMPARE(Vmdk::Misc::FormatUuid("564D6865-2F33-29AD-6FEB-87EA38F9083B"), expected);
    }

    void formatUuid_rejectsMalformedInput()
    {
        QVERIFY(Vmdk::Misc::FormatUuid("").isEmpty());
        QVERIFY(Vmdk::Misc::FormatUuid("564d6865").isEmpty());
        QVERIFY(Vmdk::Misc::FormatUuid("564d68652f3329ad6feb87ea38f9083bff").isEmpty());
        QVERIFY(Vmdk::Misc::FormatUuid("564d68652f3329ad6feb87ea38f9083x").isEmpty());
    }

    void stripExtension_onlyRemovesMatchingSuffix()
    {
        QCOMPARE(Vmdk::Misc::StripExtension("vol1.vmdk", ".vmdk"), QString("vol1"));
        QCOMPARE(Vmdk::Misc::StripExtension("vol1.txt", ".vmdk"), QString("vol1.txt"));
    }

    void logging_levelFromString()
    {
        QCOMPARE(Vmdk::Logging::LevelFromString("debug"), QtDebugMsg);
        QCOMPARE(Vmdk::Logging::LevelFromString(" WARNING "), QtWarningMsg);
        QCOMPARE(Vmdk::Logging::LevelFromString("error"), QtCriticalMsg);
        QCOMPARE(Vmdk::Logging::LevelFromString("info"), QtInfoMsg);
        QCOMPARE(Vmdk::Logging::LevelFromString("chatty"), QtInfoMsg);
    }

    void logging_formatMessage()
    {
        const QString line = Vmdk::Logging::FormatMessage(QtWarningMsg, "VMCI Get Ops failed");
        QRegularExpression pattern("^\\d{4}-\\d{2}-\\d{2} \\d{2}:\\d{2}:\\d{2}\\.\\d{3} WARNING VMCI Get Ops failed$");
        QVERIFY2(pattern.match(line).hasMatch(), qPrintable(line));

        QVERIFY(Vmdk::Logging::FormatMessage(QtCriticalMsg, "x").endsWith(" ERROR x"));
    }

    void logging_writesToFileAboveLevel()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString logFile = dir.filePath("vmdk_ops.log");

        QVERIFY(Vmdk::Logging::Install(logFile, QtInfoMsg));
        qDebug() << "below threshold";
        qInfo() << "service ready";
        Vmdk::Logging::Uninstall();

        QFile file(logFile);
        QVERIFY(file.open(QIODevice::ReadOnly));
        const QString content = QString::fromUtf8(file.readAll());
        QVERIFY(content.contains("INFO service ready"));
        QVERIFY(!content.contains("below threshold"));
    }

    void serviceConfig_missingFile_usesDefaults()
    {
        Vmdk::ServiceConfig config = Vmdk::ServiceConfig::Load("/nonexistent/vmdkops.conf");
        QCOMPARE(config.volumeDirectory, QString("dockvols"));
        QCOMPARE(config.defaultVolumeSize, QString("100mb"));
        QCOMPARE(config.maxSkipCount, 100);
        QCOMPARE(config.maxDescriptorSize, qint64(10000));
        QCOMPARE(config.hypervisorUser, QString("dcui"));
        QCOMPARE(config.realUser, QString("dvolplug"));
    }

    void serviceConfig_fileOverridesDefaults()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString fileName = dir.filePath("vmdkops.conf");

        QFile file(fileName);
        QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Text));
        file.write("[log]\n"
                   "level=DEBUG\n"
                   "[channel]\n"
                   "maxSkipCount=0\n"
                   "[volumes]\n"
                   "directory=volumes\n"
                   "defaultSize=1gb\n"
                   "[tools]\n"
                   "vmkfstools=/opt/bin/vmkfstools\n");
        file.close();

        Vmdk::ServiceConfig config = Vmdk::ServiceConfig::Load(fileName);
        QCOMPARE(config.logLevel, QString("debug"));
        QCOMPARE(config.maxSkipCount, 100);
        QCOMPARE(config.volumeDirectory, QString("volumes"));
        QCOMPARE(config.defaultVolumeSize, QString("1gb"));
        QCOMPARE(config.vmkfstoolsPath, QString("/opt/bin/vmkfstools"));
        QCOMPARE(config.mkfsPath, Vmdk::ServiceConfig().mkfsPath);
    }

    void sidecarStore_createGetSetRemove()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString vmdkPath = dir.filePath("vol1.vmdk");
        Vmdk::SidecarMetadataStore store;

        QCOMPARE(Vmdk::SidecarMetadataStore::SidecarPath(vmdkPath), dir.filePath("vol1-vmdkops.json"));
        QVERIFY(store.GetAll(vmdkPath).isEmpty());

        QVariantMap options;
        options.insert("size", "1gb");
        QVERIFY(store.Create(vmdkPath, Vmdk::MetadataStore::STATUS_DETACHED, options));

        QVariantMap metadata = store.GetAll(vmdkPath);
        QCOMPARE(metadata.value(Vmdk::MetadataStore::KEY_STATUS).toString(), QString("detached"));
        QCOMPARE(metadata.value(Vmdk::MetadataStore::KEY_VOLUME_OPTIONS).toMap().value("size").toString(), QString("1gb"));

        metadata.insert(Vmdk::MetadataStore::KEY_STATUS, Vmdk::MetadataStore::STATUS_ATTACHED);
        metadata.insert(Vmdk::MetadataStore::KEY_ATTACHED_VM, "564d6865-2f33-29ad-6feb-87ea38f9083b");
        QVERIFY(store.SetAll(vmdkPath, metadata));
        QCOMPARE(store.GetAll(vmdkPath).value(Vmdk::MetadataStore::KEY_ATTACHED_VM).toString(),
                 QString("564d6865-2f33-29ad-6feb-87ea38f9083b"));

        QVERIFY(store.Remove(vmdkPath));
        QVERIFY(!QFile::exists(Vmdk::SidecarMetadataStore::SidecarPath(vmdkPath)));
        QVERIFY(store.Remove(vmdkPath));
    }

    void sidecarStore_corruptFile_readsEmpty()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString vmdkPath = dir.filePath("vol1.vmdk");

        QFile file(Vmdk::SidecarMetadataStore::SidecarPath(vmdkPath));
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("{\"status\": ");
        file.close();

        Vmdk::SidecarMetadataStore store;
        QVERIFY(store.GetAll(vmdkPath).isEmpty());
    }
};

QTEST_APPLESS_MAIN(UtilsTests)
#include "test_utils.moc"
