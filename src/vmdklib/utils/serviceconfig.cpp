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

#include "serviceconfig.h"
#include <QtCore/QDebug>
#include <QtCore/QFileInfo>
#include <QtCore/QSettings>

namespace Vmdk
{
    const char* const ServiceConfig::DEFAULT_CONFIG_FILE = "/etc/vmware/vmdkops/vmdkops.conf";

    ServiceConfig::ServiceConfig()
        : logFile("/var/log/vmware/vmdk_ops.log"),
          logLevel("info"),
          hypervisorHost("localhost"),
          hypervisorPort(443),
          hypervisorTls(true),
          hypervisorUser("dcui"),
          realUser("dvolplug"),
          channelLibrary("/usr/lib/vmware/vmdkops/bin/libvmci_srv.so"),
          maxSkipCount(100),
          maxRequestSize(4096),
          volumeDirectory("dockvols"),
          defaultVolumeSize("100mb"),
          maxDescriptorSize(10000),
          vsanDevicesPath("/vmfs/devices/vsan"),
          vmkfstoolsPath("/sbin/vmkfstools"),
          mkfsPath("/usr/lib/vmware/vmdkops/bin/mkfs.ext4"),
          osfsMkdirPath("/usr/lib/vmware/osfs/bin/osfs-mkdir"),
          objtoolPath("/usr/lib/vmware/osfs/bin/objtool")
    {
    }

    ServiceConfig ServiceConfig::Load(const QString& fileName)
    {
        ServiceConfig config;

        if (!QFileInfo::exists(fileName))
        {
            qWarning() << "ServiceConfig: configuration file" << fileName << "not found, using defaults";
            return config;
        }

        QSettings settings(fileName, QSettings::IniFormat);
        if (settings.status() != QSettings::NoError)
        {
            qWarning() << "ServiceConfig: failed to read" << fileName << "- using defaults";
            return config;
        }

        settings.beginGroup("log");
        config.logFile = settings.value("file", config.logFile).toString();
        config.logLevel = settings.value("level", config.logLevel).toString().toLower();
        settings.endGroup();

        settings.beginGroup("hypervisor");
        config.hypervisorHost = settings.value("host", config.hypervisorHost).toString();
        config.hypervisorPort = settings.value("port", config.hypervisorPort).toInt();
        config.hypervisorTls = settings.value("tls", config.hypervisorTls).toBool();
        config.hypervisorUser = settings.value("user", config.hypervisorUser).toString();
        config.realUser = settings.value("realUser", config.realUser).toString();
        settings.endGroup();

        settings.beginGroup("channel");
        config.channelLibrary = settings.value("library", config.channelLibrary).toString();
        config.maxSkipCount = settings.value("maxSkipCount", config.maxSkipCount).toInt();
        config.maxRequestSize = settings.value("maxRequestSize", config.maxRequestSize).toInt();
        settings.endGroup();

        settings.beginGroup("volumes");
        config.volumeDirectory = settings.value("directory", config.volumeDirectory).toString();
        config.defaultVolumeSize = settings.value("defaultSize", config.defaultVolumeSize).toString();
        config.maxDescriptorSize = settings.value("maxDescriptorSize", config.maxDescriptorSize).toLongLong();
        config.vsanDevicesPath = settings.value("vsanDevices", config.vsanDevicesPath).toString();
        settings.endGroup();

        settings.beginGroup("tools");
        config.vmkfstoolsPath = settings.value("vmkfstools", config.vmkfstoolsPath).toString();
        config.mkfsPath = settings.value("mkfs", config.mkfsPath).toString();
        config.osfsMkdirPath = settings.value("osfsMkdir", config.osfsMkdirPath).toString();
        config.objtoolPath = settings.value("objtool", config.objtoolPath).toString();
        settings.endGroup();

        if (config.maxSkipCount <= 0)
        {
            qWarning() << "ServiceConfig: invalid channel/maxSkipCount, using 100";
            config.maxSkipCount = 100;
        }

        qDebug() << "ServiceConfig: loaded" << fileName;
        return config;
    }
} // namespace Vmdk
