#include "content_source.hpp"

#include "navigation_policy.hpp"

#include <filesystem>

namespace casement
{

ContentSource ContentSource::dev_server(std::string base_url)
{
    while (!base_url.empty() && base_url.back() == '/')
        base_url.pop_back();
    if (base_url.empty())
        base_url = DEFAULT_DEV_SERVER;
    return ContentSource(Kind::DevServer, std::move(base_url));
}

ContentSource ContentSource::packaged(std::string content_dir)
{
    std::error_code ec;
    auto            abs = std::filesystem::absolute(content_dir, ec);
    if (!ec)
        content_dir = abs.lexically_normal().string();
    while (content_dir.size() > 1 && content_dir.back() == '/')
        content_dir.pop_back();
    return ContentSource(Kind::Packaged, std::move(content_dir));
}

std::string ContentSource::page_url(const std::string& page, const std::string& fragment) const
{
    std::string url;
    if (kind_ == Kind::DevServer)
        url = base_ + "/" + page;
    else
        url = "file://" + base_ + "/" + page;

    if (!fragment.empty())
        url += "#" + fragment;
    return url;
}

const char* ContentSource::page_for(WindowRole role)
{
    switch (role)
    {
        case WindowRole::Main:
            return "index.html";
        case WindowRole::Settings:
            return "options.html";
        case WindowRole::QuickEntry:
            return "quickentry.html";
        case WindowRole::Auth:
            return "";
    }
    return "";
}

std::string ContentSource::url_for(WindowRole role, const std::string& fragment) const
{
    const char* page = page_for(role);
    if (*page == '\0')
        return {};
    return page_url(page, fragment);
}

bool ContentSource::owns_url(std::string_view url) const
{
    auto parsed = parse_url(url);
    if (!parsed)
        return false;

    if (kind_ == Kind::DevServer)
    {
        auto origin = parse_url(base_);
        return origin && parsed->scheme == origin->scheme && parsed->host == origin->host
               && parsed->port == origin->port;
    }

    if (parsed->scheme != "file" || (!parsed->host.empty() && parsed->host != "localhost"))
        return false;

    std::string_view path = parsed->path;
    path                  = path.substr(0, path.find_first_of("?#"));
    // Encoded or backslash separators could hide a "..".
    if (path.find_first_of("%\\") != std::string_view::npos)
        return false;

    std::string normal = std::filesystem::path(path).lexically_normal().string();
    std::string prefix = base_ == "/" ? base_ : base_ + "/";
    return normal.size() > prefix.size() && normal.starts_with(prefix);
}

}   // namespace casement
