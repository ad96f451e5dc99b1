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

#include "jsonrpcclient.h"
#include "failure.h"
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonArray>
#include <QtCore/QStringList>
#include <QtCore/QDebug>

namespace Vim
{
    QString JsonRpcClient::s_lastError;
    int JsonRpcClient::s_requestId = 0;

    QByteArray JsonRpcClient::buildJsonRpcCall(const QString& method, const QVariantList& params,
                                               int requestId, const QVariantMap& context)
    {
        QJsonObject request;
        request["jsonrpc"] = "2.0";
        request["method"] = method;
        request["id"] = requestId;
        request["params"] = QJsonArray::fromVariantList(params);

        if (!context.isEmpty())
            request["context"] = QJsonObject::fromVariantMap(context);

        QJsonDocument doc(request);
        return doc.toJson(QJsonDocument::Compact);
    }

    QVariant JsonRpcClient::parseJsonRpcResponse(const QByteArray& json)
    {
        s_lastError.clear();

        if (json.isEmpty())
        {
            s_lastError = "Empty response from host agent";
            qWarning() << "JsonRpcClient:" << s_lastError;
            throw Failure(Failure::TRANSPORT_ERROR, s_lastError);
        }

        QJsonParseError parseError;
        QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);

        if (parseError.error != QJsonParseError::NoError)
        {
            s_lastError = QString("JSON parse error: %1 at offset %2")
                              .arg(parseError.errorString())
                              .arg(parseError.offset);
            qWarning() << "JsonRpcClient:" << s_lastError;
            throw Failure(Failure::TRANSPORT_ERROR, s_lastError);
        }

        if (!doc.isObject())
        {
            s_lastError = "Response is not a JSON object";
            qWarning() << "JsonRpcClient:" << s_lastError;
            throw Failure(Failure::TRANSPORT_ERROR, s_lastError);
        }

        QJsonObject response = doc.object();

        if (response.value("jsonrpc").toString() != "2.0")
        {
            s_lastError = "Response is not JSON-RPC 2.0";
            qWarning() << "JsonRpcClient:" << s_lastError;
            throw Failure(Failure::TRANSPORT_ERROR, s_lastError);
        }

        if (response.contains("error"))
        {
            QJsonObject error = response["error"].toObject();
            int code = error["code"].toInt();
            QString message = error["message"].toString();

            s_lastError = QString("JSON-RPC error %1: %2").arg(code).arg(message);
            qWarning() << "JsonRpcClient:" << s_lastError << "payload:" << QString::fromUtf8(json.left(256));

            // The host agent puts the fault object in "data"
            const QJsonValue dataVal = error.value("data");
            if (dataVal.isObject())
            {
                QVariantMap fault = dataVal.toObject().toVariantMap();
                if (fault.value("msg").toString().isEmpty())
                    fault.insert("msg", message);
                throw Failure::FromFault(fault);
            }

            if (dataVal.isArray())
            {
                QStringList description;
                for (const QJsonValue& v : dataVal.toArray())
                    description << v.toVariant().toString();
                if (!description.isEmpty())
                    throw Failure(description);
            }

            throw Failure(Failure::INTERNAL_ERROR, s_lastError);
        }

        if (!response.contains("result"))
        {
            s_lastError = "Response missing 'result' field";
            qWarning() << "JsonRpcClient:" << s_lastError;
            throw Failure(Failure::TRANSPORT_ERROR, s_lastError);
        }

        QJsonValue result = response["result"];

        if (result.isObject())
        {
            QJsonObject resultObj = result.toObject();

            if (resultObj.contains("Status"))
            {
                QString status = resultObj["Status"].toString();

                if (status == "Success")
                {
                    if (resultObj.contains("Value"))
                        return resultObj["Value"].toVariant();

                    // Some methods return void
                    return QVariant();
                } else if (status == "Failure")
                {
                    QStringList errors;
                    for (const QJsonValue& val : resultObj["ErrorDescription"].toArray())
                        errors.append(val.toString());

                    s_lastError = QString("Host agent error: %1").arg(errors.join(", "));
                    qWarning() << "JsonRpcClient:" << s_lastError;
                    throw Failure(errors);
                }

                s_lastError = QString("Unknown Status: %1").arg(status);
                qWarning() << "JsonRpcClient:" << s_lastError;
                throw Failure(Failure::TRANSPORT_ERROR, s_lastError);
            }
        }

        return result.toVariant();
    }

    QString JsonRpcClient::lastError()
    {
        return s_lastError;
    }

    int JsonRpcClient::nextRequestId()
    {
        return ++s_requestId;
    }
} // namespace Vim
