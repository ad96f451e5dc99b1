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

#ifndef VIM_FAILURE_H
#define VIM_FAILURE_H

#include "../vmdklib_global.h"
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <stdexcept>

/*!
 * \brief Hypervisor fault exception class
 *
 * Represents a fault reported by the host agent, either as a JSON-RPC failure
 * status or as a task that ended in the error state.
 *
 * Faults have format: ["FaultType", "message", "sub message", ...]
 * The first element is the fault type, the second the human readable message,
 * the rest are the individual fault messages reported by the host (if any).
 */
class VMDKLIB_EXPORT Failure : public std::runtime_error
{
    public:
        enum Kind
        {
            AuthExpired,
            DeviceFault,
            GenericFault
        };

        // Fault type constants used by the host agent
        static const char* const NOT_AUTHENTICATED;
        static const char* const SESSION_INVALID;
        static const char* const INVALID_LOGIN;
        static const char* const GENERIC_VM_CONFIG_FAULT;
        static const char* const INVALID_DEVICE_SPEC;
        static const char* const INVALID_DEVICE_BACKING;
        static const char* const FILE_NOT_FOUND;
        static const char* const FILE_LOCKED;
        static const char* const TOO_MANY_DEVICES;
        static const char* const TASK_IN_PROGRESS;
        static const char* const TRANSPORT_ERROR;
        static const char* const INTERNAL_ERROR;

        explicit Failure(const QStringList& errorDescription);
        explicit Failure(const QString& errorCode);
        Failure(const QString& errorCode, const QString& message);

        /**
         * @brief Build a failure from a fault object
         *
         * Accepts {"_type": ..., "msg": ..., "faultMessage": [{"key": ..., "message": ...}]}
         * as found in task error info and in JSON-RPC error data.
         */
        static Failure FromFault(const QVariantMap& fault);

        const QStringList& errorDescription() const { return this->m_errorDescription; }
        QString message() const { return this->m_errorText; }

        // Individual messages the host attached to the fault (may be empty)
        QStringList faultMessages() const;

        // Error code (first element of errorDescription)
        QString errorCode() const;

        Kind kind() const;

        static Kind KindForCode(const QString& code);

    private:
        static QString buildErrorText(const QStringList& errorDescription);

        QStringList m_errorDescription;
        QString m_errorText;
};

#endif // VIM_FAILURE_H
