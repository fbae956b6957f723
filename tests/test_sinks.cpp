#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <string>
#include <thread>

#include "../src/core/fd.hpp"
#include "../src/core/logger.hpp"
#include "../src/sinks/http_post.hpp"
#include "../src/sinks/twilio_notifier.hpp"
#include "../src/sinks/webhook.hpp"
#include "fakes.hpp"

using namespace std::chrono_literals;

// Listening socket on 127.0.0.1 with a kernel-chosen port.
static pw::Fd listen_local(int& port) {
    pw::Fd s(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!s) return s;
    sockaddr_in a{};
    a.sin_family = AF_INET;
    a.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    a.sin_port = 0;
    socklen_t len = sizeof(a);
    if (::bind(s.get(), reinterpret_cast<sockaddr*>(&a), sizeof(a)) != 0 || ::listen(s.get(), 4) != 0 ||
        ::getsockname(s.get(), reinterpret_cast<sockaddr*>(&a), &len) != 0)
        return pw::Fd();
    port = ntohs(a.sin_port);
    return s;
}

// Accepts one connection, reads one request with its body, answers with reply.
static void serve_once(int lfd, const std::string& reply, std::string& request) {
    pw::Fd c(::accept(lfd, nullptr, nullptr));
    if (!c) return;
    timeval tv{5, 0};
    ::setsockopt(c.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    size_t want = std::string::npos;
    char buf[4096];
    for (;;) {
        auto head = request.find("\r\n\r\n");
        if (head != std::string::npos && want == std::string::npos) {
            auto cl = request.find("Content-Length: ");
            size_t body = cl != std::string::npos && cl < head ? std::stoul(request.substr(cl + 16)) : 0;
            want = head + 4 + body;
        }
        if (want != std::string::npos && request.size() >= want) break;
        ssize_t n = ::recv(c.get(), buf, sizeof(buf), 0);
        if (n <= 0) return;
        request.append(buf, static_cast<size_t>(n));
    }
    ssize_t sent = ::send(c.get(), reply.data(), reply.size(), MSG_NOSIGNAL);
    (void)sent;
}

static std::string http_reply(const std::string& status, const std::string& body) {
    return "HTTP/1.1 " + status + "\r\nContent-Type: application/json\r\nContent-Length: " +
           std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" + body;
}

int main() {
    pw::set_log_level(pw::LogLevel::ERROR);

    // Form encoding for the SMS request body.
    assert(pw::TwilioNotifier::form_encode("slow site") == "slow+site");
    assert(pw::TwilioNotifier::form_encode("+15550100") == "%2B15550100");
    assert(pw::TwilioNotifier::form_encode("a&b=c") == "a%26b%3Dc");
    assert(pw::TwilioNotifier::form_encode("caf\xc3\xa9") == "caf%C3%A9");
    assert(pw::TwilioNotifier::form_encode("A-z_0.9~") == "A-z_0.9~");

    // A peer that accepts the connection but never answers: the POST gives up
    // once the total timeout passes.
    {
        int port = 0;
        pw::Fd lfd = listen_local(port);
        if (!lfd) return 1;
        pw::HttpPostRequest req;
        req.url = "http://127.0.0.1:" + std::to_string(port) + "/hook";
        req.body = "{}";
        req.content_type = "application/json";
        req.connect_timeout_s = 1;
        req.total_timeout_s = 1;
        pw::HttpPostResponse resp;
        auto t0 = std::chrono::steady_clock::now();
        if (pw::http_post(req, resp)) return 2;
        auto took = std::chrono::steady_clock::now() - t0;
        if (took > 5s) return 3;
        if (resp.error.empty()) return 4;
    }

    // Nothing listening: publish logs the failure and returns.
    {
        int port = 0;
        {
            pw::Fd gone = listen_local(port);
            if (!gone) return 10;
        }
        pw::WebhookPublisher hook("http://127.0.0.1:" + std::to_string(port) + "/hook");
        auto t0 = std::chrono::steady_clock::now();
        hook.publish(pw_test::make_sample("https://a.example/", 12));
        if (std::chrono::steady_clock::now() - t0 > 15s) return 11;
    }

    // Delivered webhook: the sample arrives as one JSON document.
    {
        int port = 0;
        pw::Fd lfd = listen_local(port);
        if (!lfd) return 20;
        std::string request;
        std::thread srv([&]() { serve_once(lfd.get(), http_reply("204 No Content", ""), request); });
        pw::WebhookPublisher hook("http://127.0.0.1:" + std::to_string(port) + "/hook");
        hook.publish(pw_test::make_sample("https://a.example/", 12));
        srv.join();
        if (request.rfind("POST /hook ", 0) != 0) return 21;
        if (request.find("Content-Type: application/json") == std::string::npos) return 22;
        if (request.find("\"url\":\"https://a.example/\"") == std::string::npos) return 23;
        if (request.find("\"resp_code\":200") == std::string::npos) return 24;
    }

    // SMS request: account path, basic auth, To/From/Body form fields.
    {
        int port = 0;
        pw::Fd lfd = listen_local(port);
        if (!lfd) return 30;
        std::string request;
        std::thread srv([&]() {
            serve_once(lfd.get(), http_reply("201 Created", "{\"sid\": \"SM42\", \"status\": \"queued\"}"),
                       request);
        });
        pw::TwilioCredentials creds;
        creds.account_sid = "AC1";
        creds.auth_token = "tok";
        creds.sender = "+15550000";
        creds.api_base = "http://127.0.0.1:" + std::to_string(port);
        pw::TwilioNotifier sms(creds);
        bool sent = sms.send("slow site", "+15550100");
        srv.join();
        if (!sent) return 31;
        if (request.rfind("POST /2010-04-01/Accounts/AC1/Messages.json ", 0) != 0) return 32;
        if (request.find("Authorization: Basic QUMxOnRvaw==") == std::string::npos) return 33;
        if (request.find("Content-Type: application/x-www-form-urlencoded") == std::string::npos)
            return 34;
        if (request.find("\r\n\r\nTo=%2B15550100&From=%2B15550000&Body=slow+site") == std::string::npos)
            return 35;
    }

    // An HTTP error status from the SMS API is a failed send.
    {
        int port = 0;
        pw::Fd lfd = listen_local(port);
        if (!lfd) return 40;
        std::string request;
        std::thread srv([&]() { serve_once(lfd.get(), http_reply("401 Unauthorized", "{}"), request); });
        pw::TwilioCredentials creds;
        creds.account_sid = "AC1";
        creds.auth_token = "bad";
        creds.sender = "+15550000";
        creds.api_base = "http://127.0.0.1:" + std::to_string(port);
        pw::TwilioNotifier sms(creds);
        bool sent = sms.send("x", "+15550100");
        srv.join();
        if (sent) return 41;
    }
    return 0;
}
