#pragma once

#include "../ipc/payload.hpp"

#include <cstdint>
#include <string>

namespace casement
{

// Connects a native window to the renderer process drawing its web surface.
class SurfaceLink
{
   public:
    virtual ~SurfaceLink() = default;

    // Returns false when no renderer is attached to `window_id`.
    virtual bool deliver(uint64_t window_id, const std::string& channel, const ipc::Payload& payload) = 0;

    // Remembered and replayed if the renderer attaches later.
    virtual void load_url(uint64_t window_id, const std::string& url) = 0;

    virtual void set_zoom(uint64_t window_id, double factor) = 0;

    // The window is gone; drop its renderer.
    virtual void detach(uint64_t window_id) = 0;
};

}   // namespace casement
