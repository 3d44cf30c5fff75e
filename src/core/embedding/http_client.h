#pragma once

#include "core/shared/cancellation.h"

#include <QByteArray>
#include <QJsonDocument>
#include <QList>
#include <QPair>
#include <QString>
#include <QUrl>

namespace sx {

struct HttpResponse {
    enum class Error {
        None,
        Timeout,
        Cancelled,
        Transport,  // connection refused, DNS, TLS, reset
        Http,       // a response with a non-2xx status
    };

    Error error = Error::None;
    int statusCode = 0;
    QByteArray body;
    QString errorString;

    bool ok() const { return error == Error::None; }
    // Transport failures, timeouts, 429 and 5xx are worth another attempt.
    bool isRetryable() const;
};

using HttpHeaders = QList<QPair<QByteArray, QByteArray>>;

// Blocking JSON POST, usable from any thread. Each call runs its own
// QNetworkAccessManager inside a local event loop on the calling thread.
// The request is aborted when the context is cancelled, when its deadline
// passes or after timeoutMs, whichever comes first.
HttpResponse postJson(const QUrl& url, const QJsonDocument& body, const HttpHeaders& headers,
                      const CallContext& context, int timeoutMs);

} // namespace sx
