/*
 * Copyright (c) 2025, Petr Bena <petr@bena.rocks>
 * All rights reserved.
 */

#include "test_helpers.h"
#include "server/serverloop.h"
#include "vim/session.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>

Vim::Session* FakeHypervisor::Login(const QString& username, const QString& realUser)
{
    Q_UNUSED(username);
    Q_UNUSED(realUser);
    ++this->loginCount;
    return new Vim::Session(nullptr);
}

void FakeHypervisor::Logout(Vim::Session* session)
{
    Q_UNUSED(session);
    ++this->logoutCount;
}

QString FakeHypervisor::FindVmByName(Vim::Session* session, const QString& vmName)
{
    Q_UNUSED(session);
    if (!this->findVmFaults.isEmpty())
        throw Failure(this->findVmFaults.takeFirst(), "The session is not authenticated.");
    return this->vms.value(vmName);
}

Vim::DeviceList FakeHypervisor::GetDevices(Vim::Session* session, const QString& vmRef)
{
    Q_UNUSED(session);
    return this->devices.value(vmRef);
}

QString FakeHypervisor::ReconfigureVm(Vim::Session* session, const QString& vmRef, const Vim::DeviceChangeList& changes)
{
    Q_UNUSED(session);
    QString taskRef = QString("task-%1").arg(this->m_nextTask++);
    this->reconfigurations.append(qMakePair(vmRef, changes));
    this->m_pendingTasks.insert(taskRef, qMakePair(vmRef, changes));
    return taskRef;
}

QString FakeHypervisor::CreateTaskFilter(Vim::Session* session, const QStringList& taskRefs)
{
    Q_UNUSED(session);
    ++this->createFilterCount;
    if (!this->createFilterFaults.isEmpty())
        throw Failure(this->createFilterFaults.takeFirst(), "The session is not authenticated.");

    this->m_filterTasks = taskRefs;
    return QString("filter-%1").arg(this->createFilterCount);
}

Vim::UpdateSet FakeHypervisor::WaitForUpdates(Vim::Session* session, const QString& version)
{
    Q_UNUSED(session);
    ++this->waitCount;
    this->waitVersions.append(version);

    if (!this->scriptedUpdates.isEmpty())
        return this->scriptedUpdates.takeFirst();

    Vim::UpdateSet updates;
    updates.version = QString::number(++this->m_version);

    for (const QString& taskRef : this->m_filterTasks)
    {
        QVariantMap info;
        if (this->reconfigureFault.isEmpty())
        {
            info.insert("state", "success");
            if (this->m_pendingTasks.contains(taskRef))
            {
                QPair<QString, Vim::DeviceChangeList> task = this->m_pendingTasks.take(taskRef);
                this->applyChanges(task.first, task.second);
            }
        } else
        {
            info.insert("state", "error");
            info.insert("error", this->reconfigureFault);
            this->m_pendingTasks.remove(taskRef);
        }

        Vim::PropertyChange change;
        change.name = "info";
        change.op = "assign";
        change.value = info;

        Vim::ObjectUpdate object;
        object.obj = taskRef;
        object.kind = "modify";
        object.changes.append(change);
        updates.objects.append(object);
    }

    return updates;
}

void FakeHypervisor::DestroyFilter(Vim::Session* session, const QString& filterRef)
{
    Q_UNUSED(session);
    Q_UNUSED(filterRef);
    ++this->destroyFilterCount;
}

void FakeHypervisor::applyChanges(const QString& vmRef, const Vim::DeviceChangeList& changes)
{
    Vim::DeviceList& list = this->devices[vmRef];
    for (const Vim::DeviceChange& change : changes)
    {
        if (change.operation == Vim::DeviceChange::Add)
        {
            QVariantMap record = change.device.ToVariantMap();
            if (!record.contains("key"))
                record.insert("key", this->m_nextKey++);
            list.append(Vim::VirtualDevice::FromVariantMap(record));
        } else
        {
            for (int i = 0; i < list.size(); ++i)
            {
                if (list.at(i).GetKey() == change.device.GetKey())
                {
                    list.removeAt(i);
                    break;
                }
            }
        }
    }
}

void FakeHypervisor::AddVm(const QString& name, const QString& ref)
{
    this->vms.insert(name, ref);
    if (!this->devices.contains(ref))
        this->devices.insert(ref, Vim::DeviceList());
}

void FakeHypervisor::AddController(const QString& vmRef, const QString& type, int busNumber)
{
    QVariantMap record;
    record.insert("_type", type);
    record.insert("key", Vim::VirtualDevice::CONTROLLER_KEY_OFFSET + busNumber);
    record.insert("busNumber", busNumber);
    this->devices[vmRef].append(Vim::VirtualDevice::FromVariantMap(record));
}

void FakeHypervisor::AddDisk(const QString& vmRef, const QString& fileName, int busNumber, int unitNumber)
{
    Vim::VirtualDevice disk = Vim::VirtualDevice::NewDisk(fileName, Vim::VirtualDevice::CONTROLLER_KEY_OFFSET + busNumber,
                                                          unitNumber, "Hard disk");
    QVariantMap record = disk.ToVariantMap();
    record.insert("key", this->m_nextKey++);
    this->devices[vmRef].append(Vim::VirtualDevice::FromVariantMap(record));
}

Vim::UpdateSet FakeHypervisor::TaskUpdate(const QString& version, const QString& taskRef, const QString& property, const QVariant& value)
{
    Vim::PropertyChange change;
    change.name = property;
    change.op = "assign";
    change.value = value;

    Vim::ObjectUpdate object;
    object.obj = taskRef;
    object.kind = "modify";
    object.changes.append(change);

    Vim::UpdateSet updates;
    updates.version = version;
    updates.objects.append(object);
    return updates;
}

QVariantMap FakeHypervisor::Fault(const QString& type, const QString& message, const QStringList& faultMessages)
{
    QVariantList messages;
    for (const QString& text : faultMessages)
    {
        QVariantMap entry;
        entry.insert("key", "msg.fault");
        entry.insert("message", text);
        messages.append(entry);
    }

    QVariantMap fault;
    fault.insert("_type", type);
    fault.insert("msg", message);
    fault.insert("faultMessage", messages);
    return fault;
}

Vmdk::ToolResult RecordingToolRunner::Run(const QString& program, const QStringList& arguments)
{
    this->calls.append(qMakePair(program, arguments));

    const QString name = QFileInfo(program).fileName();
    Vmdk::ToolResult result;
    result.exitCode = 0;
    if (!this->m_scripted.value(name).isEmpty())
        result = this->m_scripted[name].takeFirst();

    if (!result.Succeeded() || !this->simulateDisks || arguments.isEmpty())
        return result;

    const QString path = arguments.last();
    QString flatPath = path;
    flatPath.replace(".vmdk", "-flat.vmdk");

    if (name == "vmkfstools" && arguments.first() == "-d")
    {
        WriteDescriptor(path);
        QFile flat(flatPath);
        if (flat.open(QIODevice::WriteOnly))
            flat.write(QByteArray(64, '\0'));
    } else if (name == "vmkfstools" && arguments.first() == "-U")
    {
        QFile::remove(path);
        QFile::remove(flatPath);
    } else if (name == "osfs-mkdir")
    {
        QDir().mkpath(path);
    }

    return result;
}

void RecordingToolRunner::Script(const QString& program, int exitCode, const QString& output)
{
    Vmdk::ToolResult result;
    result.exitCode = exitCode;
    result.output = output;
    this->m_scripted[program].append(result);
}

int RecordingToolRunner::CountCalls(const QString& program, const QString& firstArgument) const
{
    int count = 0;
    for (const QPair<QString, QStringList>& call : this->calls)
    {
        if (QFileInfo(call.first).fileName() != program)
            continue;
        if (!firstArgument.isEmpty() && (call.second.isEmpty() || call.second.first() != firstArgument))
            continue;
        ++count;
    }
    return count;
}

bool MemoryMetadataStore::Create(const QString& vmdkPath, const QString& status, const QVariantMap& options)
{
    if (this->failCreate)
        return false;

    QVariantMap record;
    record.insert(KEY_STATUS, status);
    record.insert(KEY_VOLUME_OPTIONS, options);
    this->records.insert(vmdkPath, record);
    return true;
}

QVariantMap MemoryMetadataStore::GetAll(const QString& vmdkPath)
{
    return this->records.value(vmdkPath);
}

bool MemoryMetadataStore::SetAll(const QString& vmdkPath, const QVariantMap& metadata)
{
    if (this->failSetAll)
        return false;
    this->records.insert(vmdkPath, metadata);
    return true;
}

bool MemoryMetadataStore::Remove(const QString& vmdkPath)
{
    this->records.remove(vmdkPath);
    return true;
}

bool ScriptedChannel::Open()
{
    this->opened = true;
    return true;
}

bool ScriptedChannel::NextRequest(Vmdk::ChannelRequest& request)
{
    ++this->receiveCount;

    if (this->m_script.isEmpty())
    {
        if (this->stopLoop)
            this->stopLoop->RequestStop();
        return false;
    }

    QPair<bool, Vmdk::ChannelRequest> entry = this->m_script.takeFirst();
    if (!entry.first)
        return false;

    request = entry.second;
    return true;
}

bool ScriptedChannel::Reply(const Vmdk::ChannelRequest& request, const QByteArray& reply)
{
    Q_UNUSED(request);
    this->replies.append(reply);
    return !this->failReplies;
}

void ScriptedChannel::Close()
{
    this->closed = true;
}

QString ScriptedChannel::GetLastError() const
{
    return "scripted receive failure";
}

void ScriptedChannel::QueueRequest(qint32 cartel, const QByteArray& payload)
{
    Vmdk::ChannelRequest request;
    request.clientHandle = this->m_nextHandle++;
    request.callerToken = cartel;
    request.payload = payload;
    this->m_script.append(qMakePair(true, request));
}

void ScriptedChannel::QueueFailure()
{
    this->m_script.append(qMakePair(false, Vmdk::ChannelRequest()));
}

QVariant FakeIntrospection::Get(const QString& node)
{
    if (!this->nodes.contains(node))
        throw Failure(QStringList() << Failure::INTERNAL_ERROR << QString("No such node %1").arg(node));
    return this->nodes.value(node);
}

void FakeIntrospection::AddVm(qint32 cartel, const QString& leader, const QString& name, const QString& rawUuid, const QString& cfgPath)
{
    QVariantMap groupInfo;
    groupInfo.insert("displayName", name);
    groupInfo.insert("uuid", rawUuid);
    groupInfo.insert("cfgPath", cfgPath);

    this->nodes.insert(QString("/userworld/cartel/%1/vmmLeader").arg(cartel), leader);
    this->nodes.insert(QString("/vm/%1/vmmGroupInfo").arg(leader), groupInfo);
}

Vmdk::ServiceConfig MakeTestConfig()
{
    Vmdk::ServiceConfig config;
    config.logFile.clear();
    config.vmkfstoolsPath = "vmkfstools";
    config.mkfsPath = "mkfs.ext4";
    config.osfsMkdirPath = "osfs-mkdir";
    config.objtoolPath = "objtool";
    return config;
}

bool WriteDescriptor(const QString& path, const QString& extraText)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text))
        return false;

    file.write("# Disk DescriptorFile\nversion=1\n");
    file.write(extraText.toUtf8());
    return true;
}
