#include "notify/channels.hpp"
#include "common/logger.hpp"
#include <curl/curl.h>

using json = nlohmann::json;

namespace {

size_t discardWriteCallback(void* /*contents*/, size_t size, size_t nmemb, void* /*userp*/) {
    return size * nmemb;
}

} // namespace

WebhookChannel::WebhookChannel(long timeoutSeconds) : timeoutSeconds_(timeoutSeconds) {}

bool WebhookChannel::deliver(const Notification& notification, const UserConfig& userConfig) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        Logger::error("Failed to initialize CURL for webhook");
        return false;
    }

    json body = notification.payload;
    body["text"] = notification.subject + "\n" + notification.body;
    std::string postData = body.dump();

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, userConfig.webhookUrl.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, postData.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(postData.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discardWriteCallback);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        Logger::error(std::string("Webhook request failed: ") + curl_easy_strerror(res));
        return false;
    }
    if (httpCode < 200 || httpCode >= 300) {
        Logger::error("Webhook returned HTTP " + std::to_string(httpCode));
        return false;
    }
    return true;
}

EmailChannel::EmailChannel(std::string sendmailPath, ProcessRunner runner)
    : sendmailPath_(std::move(sendmailPath)), runner_(std::move(runner)) {}

std::string EmailChannel::formatMessage(const Notification& notification, const std::string& recipient) {
    std::string message;
    message += "To: " + recipient + "\n";
    message += "Subject: " + notification.subject + "\n";
    message += "Content-Type: text/plain; charset=UTF-8\n";
    message += "\n";
    message += notification.body;
    return message;
}

bool EmailChannel::deliver(const Notification& notification, const UserConfig& userConfig) {
    ProcessOptions options = runner_.getOptions();
    options.stdinData = formatMessage(notification, userConfig.notifyEmail);

    ProcessRunner mailer(options);
    ProcessResult proc = mailer.run({sendmailPath_, "-t"}, [](StreamKind stream, const std::string& line) {
        if (stream == StreamKind::Stderr) {
            Logger::debug("[sendmail] " + line);
        }
    });

    if (!proc.started) {
        Logger::error("Failed to start sendmail: " + proc.error);
        return false;
    }
    if (!proc.success()) {
        Logger::error("sendmail exited with code " + std::to_string(proc.exitCode));
        return false;
    }
    return true;
}
