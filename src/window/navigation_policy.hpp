#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace casement
{

// Hosts whose pages are shown inside shell windows.
inline constexpr std::array<std::string_view, 1> INTERNAL_DOMAINS = {
    "gemini.google.com",
};

// Sign-in hosts, opened in the dedicated Auth window.
inline constexpr std::array<std::string_view, 2> OAUTH_DOMAINS = {
    "accounts.google.com",
    "accounts.youtube.com",
};

inline constexpr std::string_view SIGN_IN_URL = "https://accounts.google.com";

enum class DomainClass
{
    Internal,
    OAuth,
    External,
};

const char* domain_class_name(DomainClass c);

struct ParsedUrl
{
    std::string scheme;   // lower-case, without ':'
    std::string host;     // lower-case, brackets stripped from IPv6 literals
    int         port = -1;
    std::string path;     // everything after the authority, including query/fragment
};

// Minimal absolute-URL parser: scheme ':' ['//' [userinfo '@'] host [':' port]] rest.
// Returns std::nullopt when there is no valid scheme, a hierarchical URL has no host,
// or the host holds characters outside the host grammar. For http, https, ws, wss,
// ftp and file a backslash ends the authority, as in browsers.
// file: URLs parse with an empty host.
std::optional<ParsedUrl> parse_url(std::string_view url);

// h matches d iff h == d or h ends with "." + d.
bool host_matches(std::string_view host, std::string_view domain);

bool is_internal_host(std::string_view host);
bool is_oauth_host(std::string_view host);

// OAuth is checked before Internal; every host lands in exactly one class.
DomainClass classify_host(std::string_view host);

enum class NavigationDecision
{
    Allow,
    Block,
};

struct PopupDecision
{
    bool allow          = false;
    bool opens_auth     = false;   // caller should open the URL in the Auth window
    bool opens_external = false;   // caller should hand the URL to the OS browser
};

// In-place navigation: http(s) Internal and OAuth hosts are allowed. Everything
// else, including unparsable URLs, is blocked. The shell's own pages are
// allowed by the caller (ContentSource::owns_url) before this is consulted.
NavigationDecision decide_navigation(std::string_view url);

// window.open(): OAuth → deny + Auth window, Internal → allow, otherwise deny
// and, for http/https only, open in the default browser.
PopupDecision decide_popup(std::string_view url);

}   // namespace casement
