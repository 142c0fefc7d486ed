#pragma once

#include "../window/native_window.hpp"
#include "../window/surface_link.hpp"
#include "message.hpp"
#include "transport.hpp"

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace casement
{

class MessageBroker;
class WindowRegistry;

// Shell side of the renderer protocol.
//
// Each window's web surface is drawn by a renderer process that connects to
// the shell socket and says HELLO with the role it hosts. The bridge attaches
// it to the live window of that role and from then on:
//   - REQ_SEND / REQ_INVOKE go to the MessageBroker, sender = that window
//   - surface reports (navigation, popups, certificate errors, load
//     failures, key presses, blur) reach the window's WindowEvents
//   - broadcasts, page loads and zoom changes flow back as commands
//
// A connection that never says HELLO may only send window.show; that is how
// a second shell instance asks the running one to come forward.
//
// Runs on the event loop thread; poll() never blocks longer than asked.
class RendererBridge : public SurfaceLink
{
   public:
    using KeyHandler = std::function<void(int key, int action, int mods)>;

    RendererBridge(MessageBroker& broker, WindowRegistry& windows, WindowBackend& backend);
    ~RendererBridge() override;

    RendererBridge(const RendererBridge&)            = delete;
    RendererBridge& operator=(const RendererBridge&) = delete;

    bool listen(const std::string& path);
    void close();

    bool               is_listening() const { return server_.is_listening(); }
    const std::string& socket_path() const { return server_.path(); }

    // Accept new renderers and handle every message that arrives within
    // `timeout_ms`.
    void poll(int timeout_ms);

    void set_key_handler(KeyHandler handler) { key_handler_ = std::move(handler); }

    size_t client_count() const { return clients_.size(); }
    bool   is_attached(WindowId window_id) const;

    // SurfaceLink
    bool deliver(uint64_t window_id, const std::string& channel, const ipc::Payload& payload) override;
    void load_url(uint64_t window_id, const std::string& url) override;
    void set_zoom(uint64_t window_id, double factor) override;
    void detach(uint64_t window_id) override;

   private:
    struct Client
    {
        std::unique_ptr<ipc::Connection> conn;
        uint64_t                         token     = 0;
        WindowId                         window_id = INVALID_WINDOW;
    };

    // What a renderer attaching later must be told.
    struct SurfaceState
    {
        std::string url;
        double      zoom = 1.0;
    };

    void handle_message(Client& client, const ipc::Message& msg);
    void handle_hello(Client& client, const ipc::Message& msg);
    void handle_request(Client& client, const ipc::Message& msg);
    void handle_surface_report(Client& client, const ipc::Message& msg);

    bool send_to(Client& client, ipc::MessageType type, std::vector<uint8_t> payload,
                 ipc::RequestId request_id = ipc::INVALID_REQUEST);
    void reply_ok(Client& client, ipc::RequestId request_id, const ipc::Payload& result);
    void reply_err(Client& client, ipc::RequestId request_id, ipc::ErrorCode code, const std::string& message);

    Client* client_for_window(WindowId window_id);
    Client* client_for_token(uint64_t token);

    MessageBroker&  broker_;
    WindowRegistry& windows_;
    WindowBackend&  backend_;
    KeyHandler      key_handler_;

    ipc::Server                                    server_;
    std::vector<Client>                            clients_;
    std::unordered_map<WindowId, SurfaceState>     surfaces_;
    ipc::SessionId                                 session_id_;
    uint64_t                                       next_seq_   = 1;
    uint64_t                                       next_token_ = 1;
};

}   // namespace casement
