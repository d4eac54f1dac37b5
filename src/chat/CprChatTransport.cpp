#include "CprChatTransport.hpp"
#include "utils/Profile.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <cctype>

namespace chat
{

CprChatTransport::CprChatTransport() = default;

CprChatTransport::~CprChatTransport()
{
    cancel();
}

bool CprChatTransport::begin(const ChatRequest& request)
{
    if (running_.load(std::memory_order_acquire))
    {
        last_error_ = "a request is already in flight";
        return false;
    }
    if (request.endpoint.empty())
    {
        last_error_ = "no chat endpoint configured";
        return false;
    }

    joinWorker();
    last_error_.clear();
    cancel_.store(false, std::memory_order_relaxed);
    running_.store(true, std::memory_order_release);

    std::string body = buildRequestBody(request).dump();
    PLOG_INFO << "Chat request to " << request.endpoint << " (" << request.messages.size() << " messages)";
    worker_ = std::thread(&CprChatTransport::run, this, request, std::move(body));
    return true;
}

void CprChatTransport::drain(std::vector<TransportEvent>& out) { events_.drain(out); }

void CprChatTransport::cancel()
{
    cancel_.store(true, std::memory_order_relaxed);
    joinWorker();
}

void CprChatTransport::joinWorker()
{
    if (worker_.joinable())
        worker_.join();
}

int CprChatTransport::parseStatusLine(std::string_view header)
{
    if (header.substr(0, 5) != "HTTP/")
        return 0;

    std::size_t sp = header.find(' ');
    if (sp == std::string_view::npos || header.size() < sp + 4)
        return 0;

    int code = 0;
    for (std::size_t i = sp + 1; i < sp + 4; ++i)
    {
        if (!std::isdigit(static_cast<unsigned char>(header[i])))
            return 0;
        code = code * 10 + (header[i] - '0');
    }
    return code;
}

std::string CprChatTransport::describeHttpFailure(int status, std::string_view body)
{
    nlohmann::json j = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
    if (!j.is_discarded() && j.is_object())
    {
        auto err = j.find("error");
        if (err != j.end())
        {
            if (err->is_string() && !err->get_ref<const std::string&>().empty())
                return err->get<std::string>();
            if (err->is_object())
            {
                auto msg = err->find("message");
                if (msg != err->end() && msg->is_string())
                    return msg->get<std::string>();
            }
        }
    }
    return "HTTP " + std::to_string(status);
}

void CprChatTransport::run(ChatRequest request, std::string body)
{
    PROFILE_THREAD_NAME("ChatTransport");

    // Written only by libcurl callbacks on this thread
    int header_status = 0;
    std::string error_body;
    std::size_t received = 0;

    auto failed_status = [&header_status] { return header_status != 0 && (header_status < 200 || header_status >= 300); };

    cpr::Session session;
    session.SetUrl(cpr::Url{ request.endpoint });
    session.SetHeader(cpr::Header{ { "Content-Type", "application/json" }, { "Accept", "text/event-stream" } });
    session.SetBody(cpr::Body{ body });
    session.SetConnectTimeout(cpr::ConnectTimeout{ request.connect_timeout_ms });
    session.SetTimeout(cpr::Timeout{ request.timeout_ms });
    session.SetHeaderCallback(cpr::HeaderCallback(
        [this, &header_status](std::string_view header, intptr_t) -> bool
        {
            if (int code = parseStatusLine(header))
                header_status = code;
            return !cancel_.load(std::memory_order_relaxed);
        }));
    session.SetWriteCallback(cpr::WriteCallback(
        [this, &failed_status, &error_body, &received](std::string_view data, intptr_t) -> bool
        {
            if (cancel_.load(std::memory_order_relaxed))
                return false;
            if (failed_status())
            {
                error_body.append(data);
                return true;
            }
            received += data.size();
            TransportEvent ev;
            ev.kind = TransportEvent::Kind::Data;
            ev.data = std::string(data);
            events_.push(std::move(ev));
            return true;
        }));
    session.SetProgressCallback(cpr::ProgressCallback(
        [](cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, intptr_t userdata) -> bool
        {
            auto flag = reinterpret_cast<std::atomic<bool>*>(userdata);
            return !(flag && flag->load());
        },
        reinterpret_cast<intptr_t>(&cancel_)));

    cpr::Response r = session.Post();

    TransportEvent done;
    if (cancel_.load(std::memory_order_relaxed))
    {
        done.kind = TransportEvent::Kind::Failed;
        done.error = "Request cancelled";
    }
    else if (r.error)
    {
        done.kind = TransportEvent::Kind::Failed;
        done.error = r.error.message.empty() ? std::string("network error") : r.error.message;
    }
    else
    {
        int status = r.status_code != 0 ? r.status_code : header_status;
        done.status = status;
        if (status >= 200 && status < 300)
        {
            done.kind = TransportEvent::Kind::Completed;
        }
        else
        {
            done.kind = TransportEvent::Kind::Failed;
            done.error = describeHttpFailure(status, error_body.empty() ? std::string_view(r.text) : error_body);
        }
    }

    if (done.kind == TransportEvent::Kind::Failed)
        PLOG_WARNING << "Chat request failed: " << done.error;
    else
        PLOG_INFO << "Chat stream completed, " << received << " bytes";

    events_.push(std::move(done));
    running_.store(false, std::memory_order_release);
}

} // namespace chat
