#pragma once

#include "window_role.hpp"

#include <string>
#include <string_view>

namespace casement
{

inline constexpr const char* DEFAULT_DEV_SERVER = "http://localhost:1420";

// Where the shell's own pages come from. Chosen once at startup.
class ContentSource
{
   public:
    enum class Kind
    {
        DevServer,
        Packaged,
    };

    static ContentSource dev_server(std::string base_url = DEFAULT_DEV_SERVER);
    static ContentSource packaged(std::string content_dir);

    Kind               kind() const { return kind_; }
    bool               is_dev() const { return kind_ == Kind::DevServer; }
    const std::string& base() const { return base_; }

    // URL of `page` ("index.html"), with an optional "#fragment".
    std::string page_url(const std::string& page, const std::string& fragment = {}) const;

    // Page for a role; Auth has none and yields an empty string.
    static const char* page_for(WindowRole role);

    // URL for a role's content. Settings takes its tab as the fragment.
    std::string url_for(WindowRole role, const std::string& fragment = {}) const;

    // True if `url` is one of our own pages: same origin as the dev server, or
    // a file: URL inside the content directory.
    bool owns_url(std::string_view url) const;

   private:
    ContentSource(Kind kind, std::string base) : kind_(kind), base_(std::move(base)) {}

    Kind        kind_;
    std::string base_;
};

}   // namespace casement
