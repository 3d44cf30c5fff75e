#include "core/embedding/http_client.h"

#include <QElapsedTimer>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

#include <algorithm>
#include <memory>

namespace sx {

namespace {

constexpr int kCancelPollMs = 20;

} // anonymous namespace

bool HttpResponse::isRetryable() const
{
    switch (error) {
    case Error::None:
    case Error::Cancelled:
        return false;
    case Error::Timeout:
    case Error::Transport:
        return true;
    case Error::Http:
        return statusCode == 429 || statusCode >= 500;
    }
    return false;
}

HttpResponse postJson(const QUrl& url, const QJsonDocument& body, const HttpHeaders& headers,
                      const CallContext& context, int timeoutMs)
{
    HttpResponse response;
    if (context.token.isCancelled()) {
        response.error = HttpResponse::Error::Cancelled;
        response.errorString = QStringLiteral("cancelled before send");
        return response;
    }

    const int budgetMs = std::min(std::max(timeoutMs, 1), std::max(context.remainingMs(timeoutMs), 1));

    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QByteArrayLiteral("application/json"));
    for (const auto& header : headers) {
        request.setRawHeader(header.first, header.second);
    }

    QNetworkAccessManager manager;
    QEventLoop loop;
    // Declared after the manager so the reply is destroyed first.
    const std::unique_ptr<QNetworkReply> reply(
        manager.post(request, body.toJson(QJsonDocument::Compact)));

    bool timedOut = false;
    bool cancelled = false;
    QElapsedTimer elapsed;
    elapsed.start();

    QTimer poll;
    poll.setInterval(kCancelPollMs);
    QObject::connect(&poll, &QTimer::timeout, &loop, [&]() {
        if (reply->isFinished()) {
            return;
        }
        if (context.token.isCancelled()) {
            cancelled = true;
            reply->abort();
        } else if (elapsed.elapsed() >= budgetMs || context.expired()) {
            timedOut = true;
            reply->abort();
        }
    });
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);

    poll.start();
    if (!reply->isFinished()) {
        loop.exec();
    }
    poll.stop();

    response.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.body = reply->readAll();

    if (cancelled) {
        response.error = HttpResponse::Error::Cancelled;
        response.errorString = QStringLiteral("cancelled");
    } else if (timedOut) {
        response.error = HttpResponse::Error::Timeout;
        response.errorString = QStringLiteral("timed out after %1 ms").arg(elapsed.elapsed());
    } else if (response.statusCode > 0 && (response.statusCode < 200 || response.statusCode >= 300)) {
        response.error = HttpResponse::Error::Http;
        response.errorString = QStringLiteral("HTTP %1").arg(response.statusCode);
    } else if (reply->error() != QNetworkReply::NoError) {
        response.error = HttpResponse::Error::Transport;
        response.errorString = reply->errorString();
    }

    return response;
}

} // namespace sx
