#include "renderer_bridge.hpp"

#include <casement/logger.hpp>

#include "../window/window_registry.hpp"
#include "channels.hpp"
#include "codec.hpp"
#include "message_broker.hpp"

#include <algorithm>
#include <cerrno>
#include <exception>
#include <memory>
#include <poll.h>
#include <unistd.h>

namespace casement
{

using ipc::ErrorCode;
using ipc::MessageType;

RendererBridge::RendererBridge(MessageBroker& broker, WindowRegistry& windows, WindowBackend& backend)
    : broker_(broker),
      windows_(windows),
      backend_(backend),
      session_id_(static_cast<ipc::SessionId>(::getpid()))
{
}

RendererBridge::~RendererBridge()
{
    close();
}

bool RendererBridge::listen(const std::string& path)
{
    if (!server_.listen(path))
    {
        CASEMENT_LOG_ERROR("bridge", "Failed to listen on {}", path);
        return false;
    }
    CASEMENT_LOG_INFO("bridge", "Listening on {}", path);
    return true;
}

void RendererBridge::close()
{
    clients_.clear();
    server_.close();
}

bool RendererBridge::is_attached(WindowId window_id) const
{
    return std::any_of(clients_.begin(),
                       clients_.end(),
                       [window_id](const Client& c)
                       { return c.window_id == window_id && c.conn && c.conn->is_open(); });
}

// ─── Event loop ──────────────────────────────────────────────────────────────

void RendererBridge::poll(int timeout_ms)
{
    if (!server_.is_listening())
        return;

    // [0] = listen socket, [1..N] = renderer sockets
    std::vector<struct pollfd> pfds;
    pfds.reserve(1 + clients_.size());
    pfds.push_back({server_.listen_fd(), POLLIN, 0});
    for (auto& c : clients_)
        pfds.push_back({c.conn ? c.conn->fd() : -1, POLLIN, 0});

    int rc = ::poll(pfds.data(), static_cast<nfds_t>(pfds.size()), timeout_ms);
    if (rc < 0)
    {
        if (errno != EINTR)
            CASEMENT_LOG_ERROR("bridge", "poll() failed: errno {}", errno);
        return;
    }

    // Handle existing renderers first; accepting may reallocate clients_.
    const size_t polled = clients_.size();
    for (size_t i = 0; i < polled; ++i)
    {
        const short revents = pfds[1 + i].revents;
        if ((revents & (POLLIN | POLLHUP | POLLERR)) == 0)
            continue;

        Client& client = clients_[i];
        if (!client.conn || !client.conn->is_open())
            continue;

        auto msg = client.conn->recv();
        if (!msg)
        {
            CASEMENT_LOG_INFO("bridge", "Renderer disconnected (window={})", client.window_id);
            client.conn->close();
            continue;
        }

        try
        {
            handle_message(client, *msg);
        }
        catch (const std::exception& e)
        {
            CASEMENT_LOG_ERROR("bridge",
                               "Handling {} from window {} failed: {}",
                               ipc::message_type_name(msg->header.type),
                               client.window_id,
                               e.what());
        }
    }

    std::erase_if(clients_, [](const Client& c) { return !c.conn || !c.conn->is_open(); });

    if (pfds[0].revents & POLLIN)
    {
        while (auto conn = server_.try_accept())
        {
            CASEMENT_LOG_DEBUG("bridge", "New connection (fd={})", conn->fd());
            clients_.push_back({std::move(conn), next_token_++, INVALID_WINDOW});
        }
    }
}

void RendererBridge::handle_message(Client& client, const ipc::Message& msg)
{
    switch (msg.header.type)
    {
        case MessageType::HELLO:
            handle_hello(client, msg);
            break;

        case MessageType::REQ_SEND:
        case MessageType::REQ_INVOKE:
            handle_request(client, msg);
            break;

        case MessageType::EVT_WILL_NAVIGATE:
        case MessageType::EVT_POPUP:
        case MessageType::EVT_DID_NAVIGATE:
        case MessageType::EVT_LOAD_FAILED:
        case MessageType::EVT_CERT_ERROR:
        case MessageType::EVT_KEY:
        case MessageType::EVT_BLUR:
            handle_surface_report(client, msg);
            break;

        default:
            CASEMENT_LOG_WARN("bridge",
                              "Unexpected {} from window {}",
                              ipc::message_type_name(msg.header.type),
                              client.window_id);
            break;
    }
}

// ─── Handshake ───────────────────────────────────────────────────────────────

void RendererBridge::handle_hello(Client& client, const ipc::Message& msg)
{
    auto hello = ipc::decode_hello(msg.payload);
    if (!hello)
    {
        reply_err(client, msg.header.request_id, ErrorCode::MALFORMED, "malformed HELLO");
        client.conn->close();
        return;
    }
    if (hello->protocol_major != ipc::PROTOCOL_MAJOR)
    {
        CASEMENT_LOG_WARN("bridge",
                          "Renderer speaks protocol {}.{}, expected {}.x",
                          hello->protocol_major,
                          hello->protocol_minor,
                          ipc::PROTOCOL_MAJOR);
        reply_err(client, msg.header.request_id, ErrorCode::PROTOCOL_MISMATCH, "protocol mismatch");
        client.conn->close();
        return;
    }

    auto role = role_from_name(hello->role);
    if (!role)
    {
        reply_err(client, msg.header.request_id, ErrorCode::UNKNOWN_ROLE, "unknown role '" + hello->role + "'");
        client.conn->close();
        return;
    }

    NativeWindow* win = windows_.window(*role);
    if (!win || win->is_destroyed())
    {
        CASEMENT_LOG_WARN("bridge", "Renderer for {} arrived with no such window", role_name(*role));
        reply_err(client, msg.header.request_id, ErrorCode::NOT_ATTACHED, "no window for role");
        client.conn->close();
        return;
    }

    // A newer renderer replaces the old one for the same window.
    for (auto& other : clients_)
    {
        if (&other != &client && other.window_id == win->id() && other.conn)
        {
            CASEMENT_LOG_INFO("bridge", "Replacing renderer of window {}", win->id());
            other.conn->close();
        }
    }

    client.window_id = win->id();

    ipc::WelcomePayload wp;
    wp.session_id = session_id_;
    wp.window_id  = win->id();
    auto it       = surfaces_.find(win->id());
    if (it != surfaces_.end())
    {
        wp.url         = it->second.url;
        wp.zoom_factor = it->second.zoom;
    }
    else
    {
        wp.url = win->current_url();
    }

    send_to(client, MessageType::WELCOME, ipc::encode_welcome(wp), msg.header.request_id);
    CASEMENT_LOG_INFO("bridge",
                      "Renderer attached to {} window {} (build={})",
                      role_name(*role),
                      win->id(),
                      hello->renderer_build);
}

// ─── Requests ────────────────────────────────────────────────────────────────

void RendererBridge::handle_request(Client& client, const ipc::Message& msg)
{
    const bool           invoke     = msg.header.type == MessageType::REQ_INVOKE;
    const ipc::RequestId request_id = msg.header.request_id;

    auto req = ipc::decode_channel(msg.payload);
    if (!req)
    {
        CASEMENT_LOG_WARN("bridge", "Malformed request from window {}", client.window_id);
        if (invoke)
            reply_err(client, request_id, ErrorCode::MALFORMED, "malformed request");
        return;
    }

    if (client.window_id == INVALID_WINDOW && req->channel != ipc::channels::WINDOW_SHOW)
    {
        CASEMENT_LOG_WARN("bridge", "{} from a connection without HELLO", req->channel);
        if (invoke)
            reply_err(client, request_id, ErrorCode::NOT_ATTACHED, "say HELLO first");
        return;
    }

    if (!broker_.has_channel(req->channel))
    {
        CASEMENT_LOG_WARN("bridge", "Rejected unknown channel '{}'", req->channel);
        if (invoke)
            reply_err(client, request_id, ErrorCode::UNKNOWN_CHANNEL, "unknown channel");
        return;
    }

    Request request{client.window_id, std::move(req->channel), std::move(req->args)};

    if (!invoke)
    {
        broker_.dispatch(request);
        return;
    }

    // The reply may come after this call returns (app.openSignIn), when the
    // renderer could be gone; look it up again by token.
    struct ReplyState
    {
        bool replied = false;
    };
    auto           state = std::make_shared<ReplyState>();
    const uint64_t token = client.token;
    broker_.dispatch(request,
                     [this, state, token, request_id](const ipc::Payload& result)
                     {
                         if (state->replied)
                             return;
                         state->replied = true;
                         if (Client* c = client_for_token(token))
                             reply_ok(*c, request_id, result);
                         else
                             CASEMENT_LOG_DEBUG("bridge", "Reply to request {} dropped, renderer gone", request_id);
                     });

    // Handlers without a result neither answer nor keep the reply.
    if (!state->replied && state.use_count() == 1)
        reply_ok(client, request_id, {});
}

// ─── Surface reports ─────────────────────────────────────────────────────────

void RendererBridge::handle_surface_report(Client& client, const ipc::Message& msg)
{
    const MessageType    type       = msg.header.type;
    const ipc::RequestId request_id = msg.header.request_id;

    auto answer = [&](bool allow)
    {
        if (request_id != ipc::INVALID_REQUEST && client.conn && client.conn->is_open())
            reply_ok(client, request_id, {{"allow", allow}});
    };

    NativeWindow* win = client.window_id != INVALID_WINDOW ? backend_.find_window(client.window_id) : nullptr;
    if (!win || win->is_destroyed())
    {
        CASEMENT_LOG_DEBUG("bridge", "{} for a window that is gone", ipc::message_type_name(type));
        answer(false);
        return;
    }

    if (type == MessageType::EVT_KEY)
    {
        auto key = ipc::decode_evt_key(msg.payload);
        if (key && key_handler_)
            key_handler_(key->key, key->action, key->mods);
        return;
    }
    if (type == MessageType::EVT_BLUR)
    {
        // Copy: the handler may hide or destroy the window.
        auto blurred = win->events().blurred;
        if (blurred)
            blurred();
        return;
    }

    auto nav = ipc::decode_evt_navigation(msg.payload);
    if (!nav)
    {
        CASEMENT_LOG_WARN("bridge", "Malformed {} from window {}", ipc::message_type_name(type), win->id());
        answer(false);
        return;
    }

    WindowEvents events = win->events();
    switch (type)
    {
        case MessageType::EVT_WILL_NAVIGATE:
            answer(events.will_navigate ? events.will_navigate(nav->url) : true);
            break;

        case MessageType::EVT_POPUP:
            answer(events.popup_requested ? events.popup_requested(nav->url) : false);
            break;

        case MessageType::EVT_DID_NAVIGATE:
            if (!nav->in_page)
                surfaces_[win->id()].url = nav->url;
            if (events.did_navigate)
                events.did_navigate(nav->url, nav->in_page);
            break;

        case MessageType::EVT_LOAD_FAILED:
            if (events.load_failed)
                events.load_failed(nav->error_code, nav->description, nav->url);
            break;

        case MessageType::EVT_CERT_ERROR:
            answer(events.certificate_error ? events.certificate_error(nav->url, nav->description) : false);
            break;

        default:
            break;
    }
}

// ─── SurfaceLink ─────────────────────────────────────────────────────────────

bool RendererBridge::deliver(uint64_t window_id, const std::string& channel, const ipc::Payload& payload)
{
    Client* client = client_for_window(window_id);
    if (!client)
        return false;

    ipc::ChannelPayload cp;
    cp.channel = channel;
    cp.args    = payload;
    return send_to(*client, MessageType::EVT_BROADCAST, ipc::encode_channel(cp));
}

void RendererBridge::load_url(uint64_t window_id, const std::string& url)
{
    surfaces_[window_id].url = url;
    if (Client* client = client_for_window(window_id))
        send_to(*client, MessageType::CMD_LOAD_URL, ipc::encode_cmd_load_url({url}));
}

void RendererBridge::set_zoom(uint64_t window_id, double factor)
{
    surfaces_[window_id].zoom = factor;
    if (Client* client = client_for_window(window_id))
        send_to(*client, MessageType::CMD_SET_ZOOM, ipc::encode_cmd_set_zoom({factor}));
}

void RendererBridge::detach(uint64_t window_id)
{
    surfaces_.erase(window_id);
    // Closing the socket tells the renderer its window is gone. The slot is
    // swept on the next poll().
    for (auto& c : clients_)
    {
        if (c.window_id == window_id && c.conn)
            c.conn->close();
    }
}

// ─── Helpers ─────────────────────────────────────────────────────────────────

bool RendererBridge::send_to(Client&              client,
                             MessageType          type,
                             std::vector<uint8_t> payload,
                             ipc::RequestId       request_id)
{
    if (!client.conn || !client.conn->is_open())
        return false;

    ipc::Message msg;
    msg.header.type        = type;
    msg.header.seq         = next_seq_++;
    msg.header.request_id  = request_id;
    msg.header.session_id  = session_id_;
    msg.header.window_id   = client.window_id;
    msg.payload            = std::move(payload);
    msg.header.payload_len = static_cast<uint32_t>(msg.payload.size());

    if (!client.conn->send(msg))
    {
        CASEMENT_LOG_WARN("bridge",
                          "Sending {} to window {} failed; dropping renderer",
                          ipc::message_type_name(type),
                          client.window_id);
        client.conn->close();
        return false;
    }
    return true;
}

void RendererBridge::reply_ok(Client& client, ipc::RequestId request_id, const ipc::Payload& result)
{
    send_to(client, MessageType::RESP_OK, ipc::encode_resp_ok({request_id, result}), request_id);
}

void RendererBridge::reply_err(Client&            client,
                               ipc::RequestId     request_id,
                               ErrorCode          code,
                               const std::string& message)
{
    send_to(client,
            MessageType::RESP_ERR,
            ipc::encode_resp_err({request_id, static_cast<uint32_t>(code), message}),
            request_id);
}

RendererBridge::Client* RendererBridge::client_for_window(WindowId window_id)
{
    if (window_id == INVALID_WINDOW)
        return nullptr;
    for (auto& c : clients_)
    {
        if (c.window_id == window_id && c.conn && c.conn->is_open())
            return &c;
    }
    return nullptr;
}

RendererBridge::Client* RendererBridge::client_for_token(uint64_t token)
{
    for (auto& c : clients_)
    {
        if (c.token == token && c.conn && c.conn->is_open())
            return &c;
    }
    return nullptr;
}

}   // namespace casement
