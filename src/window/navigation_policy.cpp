#include "navigation_policy.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace casement
{

namespace
{

std::string to_lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(),
                   out.end(),
                   out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool valid_scheme(std::string_view scheme)
{
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0])))
        return false;
    return std::all_of(scheme.begin(),
                       scheme.end(),
                       [](char c)
                       {
                           return std::isalnum(static_cast<unsigned char>(c)) || c == '+'
                                  || c == '-' || c == '.';
                       });
}

// Schemes whose authority also ends at a backslash.
bool is_special_scheme(std::string_view scheme)
{
    return scheme == "http" || scheme == "https" || scheme == "ws" || scheme == "wss"
           || scheme == "ftp" || scheme == "file";
}

// Rejects code points a browser would refuse or rewrite in a host.
bool valid_host(std::string_view host)
{
    return std::none_of(host.begin(),
                        host.end(),
                        [](char ch)
                        {
                            auto c = static_cast<unsigned char>(ch);
                            if (c < 0x20 || c == 0x7f)
                                return true;
                            return std::string_view(" #%/:<>?@[\\]^|").find(ch)
                                   != std::string_view::npos;
                        });
}

bool valid_ipv6_literal(std::string_view host)
{
    return !host.empty()
           && std::all_of(host.begin(),
                          host.end(),
                          [](char c)
                          { return std::isxdigit(static_cast<unsigned char>(c)) || c == ':' || c == '.'; });
}

template <size_t N>
bool matches_any(std::string_view host, const std::array<std::string_view, N>& domains)
{
    return std::any_of(domains.begin(),
                       domains.end(),
                       [host](std::string_view d) { return host_matches(host, d); });
}

}   // namespace

const char* domain_class_name(DomainClass c)
{
    switch (c)
    {
        case DomainClass::Internal:
            return "internal";
        case DomainClass::OAuth:
            return "oauth";
        case DomainClass::External:
            return "external";
    }
    return "external";
}

std::optional<ParsedUrl> parse_url(std::string_view url)
{
    auto colon = url.find(':');
    if (colon == std::string_view::npos)
        return std::nullopt;

    std::string_view scheme = url.substr(0, colon);
    if (!valid_scheme(scheme))
        return std::nullopt;

    ParsedUrl out;
    out.scheme = to_lower(scheme);

    std::string_view rest = url.substr(colon + 1);
    if (rest.substr(0, 2) != "//")
    {
        // Opaque URL (mailto:, about:, data:). Only file: may omit the host.
        if (out.scheme == "http" || out.scheme == "https")
            return std::nullopt;
        out.path = std::string(rest);
        return out;
    }

    rest.remove_prefix(2);
    size_t authority_end =
        rest.find_first_of(is_special_scheme(out.scheme) ? std::string_view("/?#\\") : "/?#");
    std::string_view authority =
        authority_end == std::string_view::npos ? rest : rest.substr(0, authority_end);
    out.path = authority_end == std::string_view::npos ? std::string() : std::string(rest.substr(authority_end));

    if (auto at = authority.rfind('@'); at != std::string_view::npos)
        authority.remove_prefix(at + 1);

    std::string_view host = authority;
    std::string_view port;
    if (!host.empty() && host.front() == '[')
    {
        auto close = host.find(']');
        if (close == std::string_view::npos)
            return std::nullopt;
        std::string_view after = host.substr(close + 1);
        host                   = host.substr(1, close - 1);
        if (!valid_ipv6_literal(host))
            return std::nullopt;
        if (!after.empty())
        {
            if (after.front() != ':')
                return std::nullopt;
            port = after.substr(1);
        }
    }
    else
    {
        if (auto pc = host.rfind(':'); pc != std::string_view::npos)
        {
            port = host.substr(pc + 1);
            host = host.substr(0, pc);
        }
        if (!valid_host(host))
            return std::nullopt;
    }

    if (!port.empty())
    {
        int  value = 0;
        auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
        if (ec != std::errc() || ptr != port.data() + port.size() || value < 0 || value > 65535)
            return std::nullopt;
        out.port = value;
    }

    if (host.empty() && out.scheme != "file")
        return std::nullopt;

    out.host = to_lower(host);
    return out;
}

bool host_matches(std::string_view host, std::string_view domain)
{
    if (host == domain)
        return true;
    if (host.size() <= domain.size())
        return false;
    return host.ends_with(domain) && host[host.size() - domain.size() - 1] == '.';
}

bool is_internal_host(std::string_view host)
{
    return matches_any(host, INTERNAL_DOMAINS);
}

bool is_oauth_host(std::string_view host)
{
    return matches_any(host, OAUTH_DOMAINS);
}

DomainClass classify_host(std::string_view host)
{
    std::string h = to_lower(host);
    if (is_oauth_host(h))
        return DomainClass::OAuth;
    if (is_internal_host(h))
        return DomainClass::Internal;
    return DomainClass::External;
}

NavigationDecision decide_navigation(std::string_view url)
{
    auto parsed = parse_url(url);
    if (!parsed)
        return NavigationDecision::Block;

    if (parsed->scheme != "http" && parsed->scheme != "https")
        return NavigationDecision::Block;

    return classify_host(parsed->host) == DomainClass::External ? NavigationDecision::Block
                                                                 : NavigationDecision::Allow;
}

PopupDecision decide_popup(std::string_view url)
{
    PopupDecision decision;

    auto parsed = parse_url(url);
    if (parsed && !parsed->host.empty())
    {
        switch (classify_host(parsed->host))
        {
            case DomainClass::OAuth:
                decision.opens_auth = true;
                return decision;
            case DomainClass::Internal:
                decision.allow = true;
                return decision;
            case DomainClass::External:
                break;
        }
    }

    // Raw prefix check so unparsable http(s) strings still leave the app.
    std::string lower = to_lower(url.substr(0, 6));
    if (lower.starts_with("http:") || lower.starts_with("https:"))
        decision.opens_external = true;
    return decision;
}

}   // namespace casement
