#pragma once

#include <casement/logger.hpp>

#include <cstdint>
#include <exception>
#include <functional>
#include <utility>
#include <vector>

namespace casement
{

using ConnectionId = uint64_t;

// A typed event: one Signal per event kind, so the payload shape of each
// event is fixed by its template arguments.
//
//   Signal<HotkeyId, bool> enabled_changed;
//   auto id = enabled_changed.connect([](HotkeyId, bool) { ... });
//   enabled_changed.emit(HotkeyId::QuickEntry, false);
//   enabled_changed.disconnect(id);
//
// Handlers run synchronously in connection order. Not thread-safe; all
// emitters live on the shell's event loop.
template <typename... Args>
class Signal
{
   public:
    using Handler      = std::function<void(const Args&...)>;

    Signal() = default;

    Signal(const Signal&)            = delete;
    Signal& operator=(const Signal&) = delete;

    ConnectionId connect(Handler handler)
    {
        ConnectionId id = next_id_++;
        handlers_.emplace_back(id, std::move(handler));
        return id;
    }

    void disconnect(ConnectionId id)
    {
        std::erase_if(handlers_, [id](const auto& entry) { return entry.first == id; });
    }

    void disconnect_all() { handlers_.clear(); }

    size_t subscriber_count() const { return handlers_.size(); }

    // A throwing handler is logged and skipped; the remaining handlers still run.
    void emit(const Args&... args) const
    {
        // Copy so handlers may connect or disconnect while being notified.
        auto handlers = handlers_;
        for (const auto& [id, handler] : handlers)
        {
            try
            {
                handler(args...);
            }
            catch (const std::exception& e)
            {
                CASEMENT_LOG_ERROR("events", "Subscriber {} threw: {}", id, e.what());
            }
        }
    }

   private:
    std::vector<std::pair<ConnectionId, Handler>> handlers_;
    ConnectionId                                  next_id_ = 1;
};

}   // namespace casement
