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

#include "failure.h"
#include <QVariantList>

const char* const Failure::NOT_AUTHENTICATED = "NotAuthenticated";
const char* const Failure::SESSION_INVALID = "SESSION_INVALID";
const char* const Failure::INVALID_LOGIN = "InvalidLogin";
const char* const Failure::GENERIC_VM_CONFIG_FAULT = "GenericVmConfigFault";
const char* const Failure::INVALID_DEVICE_SPEC = "InvalidDeviceSpec";
const char* const Failure::INVALID_DEVICE_BACKING = "InvalidDeviceBacking";
const char* const Failure::FILE_NOT_FOUND = "FileNotFound";
const char* const Failure::FILE_LOCKED = "FileLocked";
const char* const Failure::TOO_MANY_DEVICES = "TooManyDevices";
const char* const Failure::TASK_IN_PROGRESS = "TaskInProgress";
const char* const Failure::TRANSPORT_ERROR = "TRANSPORT_ERROR";
const char* const Failure::INTERNAL_ERROR = "INTERNAL_ERROR";

Failure::Failure(const QStringList& errorDescription)
    : std::runtime_error(Failure::buildErrorText(errorDescription).toStdString())
    , m_errorDescription(errorDescription)
    , m_errorText(Failure::buildErrorText(errorDescription))
{
}

Failure::Failure(const QString& errorCode)
    : Failure(QStringList() << errorCode)
{
}

Failure::Failure(const QString& errorCode, const QString& message)
    : Failure(QStringList() << errorCode << message)
{
}

Failure Failure::FromFault(const QVariantMap& fault)
{
    QString type = fault.value("_type").toString();
    if (type.isEmpty())
        type = fault.value("faultType").toString();
    if (type.isEmpty())
        type = Failure::INTERNAL_ERROR;

    QStringList description;
    description << type << fault.value("msg").toString();

    const QVariantList messages = fault.value("faultMessage").toList();
    for (const QVariant& entry : messages)
    {
        QString text = entry.toMap().value("message").toString();
        if (text.isEmpty())
            text = entry.toString();
        if (!text.isEmpty())
            description << text;
    }

    return Failure(description);
}

QStringList Failure::faultMessages() const
{
    return this->m_errorDescription.mid(2);
}

QString Failure::errorCode() const
{
    return this->m_errorDescription.isEmpty() ? QString() : this->m_errorDescription.first();
}

Failure::Kind Failure::kind() const
{
    return Failure::KindForCode(this->errorCode());
}

Failure::Kind Failure::KindForCode(const QString& code)
{
    if (code == NOT_AUTHENTICATED || code == SESSION_INVALID)
        return AuthExpired;

    if (code == GENERIC_VM_CONFIG_FAULT || code == INVALID_DEVICE_SPEC
        || code == INVALID_DEVICE_BACKING || code == FILE_NOT_FOUND
        || code == FILE_LOCKED || code == TOO_MANY_DEVICES)
    {
        return DeviceFault;
    }

    return GenericFault;
}

// The host message (second element) is preferred; if the host did not send one,
// combine the non-empty bits of the description
QString Failure::buildErrorText(const QStringList& errorDescription)
{
    if (errorDescription.isEmpty())
        return "Unknown hypervisor error";

    if (errorDescription.count() > 1 && !errorDescription[1].trimmed().isEmpty())
        return errorDescription[1].trimmed();

    QStringList cleanBits;
    for (const QString& s : errorDescription)
    {
        QString trimmed = s.trimmed();
        if (!trimmed.isEmpty())
            cleanBits.append(trimmed);
    }

    return cleanBits.join(" - ");
}
