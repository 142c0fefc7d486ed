#include "settings_store.hpp"

#include <casement/logger.hpp>

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace casement
{

// ─── Typed reads ─────────────────────────────────────────────────────────────

std::optional<bool> SettingsStore::get_bool(const std::string& key) const
{
    auto v = get(key);
    if (v && std::holds_alternative<bool>(*v))
        return std::get<bool>(*v);
    return std::nullopt;
}

std::optional<int64_t> SettingsStore::get_int(const std::string& key) const
{
    auto v = get(key);
    if (v && std::holds_alternative<int64_t>(*v))
        return std::get<int64_t>(*v);
    return std::nullopt;
}

std::optional<std::string> SettingsStore::get_string(const std::string& key) const
{
    auto v = get(key);
    if (v && std::holds_alternative<std::string>(*v))
        return std::get<std::string>(*v);
    return std::nullopt;
}

// ─── JSON serialization ──────────────────────────────────────────────────────

static std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[(c >> 4) & 0x0F];
                    out += hex[c & 0x0F];
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string JsonSettingsStore::serialize() const
{
    std::ostringstream os;
    os << "{";
    bool first = true;
    for (const auto& [key, value] : values_)
    {
        os << (first ? "\n" : ",\n");
        first = false;
        os << "  \"" << escape_json(key) << "\": ";
        if (std::holds_alternative<bool>(value))
            os << (std::get<bool>(value) ? "true" : "false");
        else if (std::holds_alternative<int64_t>(value))
            os << std::get<int64_t>(value);
        else
            os << "\"" << escape_json(std::get<std::string>(value)) << "\"";
    }
    os << (first ? "}\n" : "\n}\n");
    return os.str();
}

namespace
{

// Reader for the flat object written by serialize(). Accepts any valid JSON
// object whose values are scalars; null members are skipped.
class FlatJsonReader
{
   public:
    explicit FlatJsonReader(const std::string& text) : s_(text) {}

    std::optional<JsonSettingsStore::ValueMap> parse()
    {
        JsonSettingsStore::ValueMap out;
        skip_ws();
        if (!consume('{'))
            return std::nullopt;
        skip_ws();
        if (consume('}'))
            return finish(std::move(out));

        while (true)
        {
            skip_ws();
            auto key = read_string();
            if (!key)
                return std::nullopt;
            skip_ws();
            if (!consume(':'))
                return std::nullopt;
            skip_ws();

            if (peek() == '"')
            {
                auto str = read_string();
                if (!str)
                    return std::nullopt;
                out[*key] = std::move(*str);
            }
            else if (match("true"))
            {
                out[*key] = true;
            }
            else if (match("false"))
            {
                out[*key] = false;
            }
            else if (match("null"))
            {
                // Treated as absent.
            }
            else
            {
                auto num = read_integer();
                if (!num)
                    return std::nullopt;
                out[*key] = *num;
            }

            skip_ws();
            if (consume(','))
                continue;
            if (consume('}'))
                return finish(std::move(out));
            return std::nullopt;
        }
    }

   private:
    const std::string& s_;
    size_t             pos_ = 0;

    std::optional<JsonSettingsStore::ValueMap> finish(JsonSettingsStore::ValueMap out)
    {
        skip_ws();
        if (pos_ != s_.size())
            return std::nullopt;
        return out;
    }

    char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }

    void skip_ws()
    {
        while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_])))
            ++pos_;
    }

    bool consume(char c)
    {
        if (peek() != c)
            return false;
        ++pos_;
        return true;
    }

    bool match(const char* word)
    {
        size_t len = std::char_traits<char>::length(word);
        if (s_.compare(pos_, len, word) != 0)
            return false;
        pos_ += len;
        return true;
    }

    static void append_utf8(std::string& out, uint32_t cp)
    {
        if (cp < 0x80)
        {
            out += static_cast<char>(cp);
        }
        else if (cp < 0x800)
        {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else
        {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::optional<std::string> read_string()
    {
        if (!consume('"'))
            return std::nullopt;
        std::string out;
        while (pos_ < s_.size())
        {
            char c = s_[pos_++];
            if (c == '"')
                return out;
            if (c != '\\')
            {
                out += c;
                continue;
            }
            if (pos_ >= s_.size())
                return std::nullopt;
            char esc = s_[pos_++];
            switch (esc)
            {
                case '"':
                case '\\':
                case '/':
                    out += esc;
                    break;
                case 'b':
                    out += '\b';
                    break;
                case 'f':
                    out += '\f';
                    break;
                case 'n':
                    out += '\n';
                    break;
                case 'r':
                    out += '\r';
                    break;
                case 't':
                    out += '\t';
                    break;
                case 'u':
                {
                    if (pos_ + 4 > s_.size())
                        return std::nullopt;
                    uint32_t cp  = 0;
                    auto     res = std::from_chars(s_.data() + pos_, s_.data() + pos_ + 4, cp, 16);
                    if (res.ec != std::errc() || res.ptr != s_.data() + pos_ + 4)
                        return std::nullopt;
                    pos_ += 4;
                    append_utf8(out, cp);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::optional<int64_t> read_integer()
    {
        int64_t value = 0;
        auto    res   = std::from_chars(s_.data() + pos_, s_.data() + s_.size(), value);
        if (res.ec != std::errc())
            return std::nullopt;
        pos_ = static_cast<size_t>(res.ptr - s_.data());
        // Fractions and exponents are not part of the settings format.
        char next = peek();
        if (next == '.' || next == 'e' || next == 'E')
            return std::nullopt;
        return value;
    }
};

}   // namespace

std::optional<JsonSettingsStore::ValueMap> JsonSettingsStore::deserialize(const std::string& json)
{
    if (json.empty())
        return std::nullopt;
    FlatJsonReader reader(json);
    return reader.parse();
}

// ─── Store ───────────────────────────────────────────────────────────────────

JsonSettingsStore::JsonSettingsStore(std::string path, ValueMap defaults)
    : path_(std::move(path)), defaults_(std::move(defaults)), values_(defaults_)
{
}

bool JsonSettingsStore::load()
{
    values_ = defaults_;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec))
    {
        CASEMENT_LOG_INFO("settings", "No settings file at {}, using defaults", path_);
        return true;
    }

    std::ifstream f(path_);
    if (!f.is_open())
    {
        CASEMENT_LOG_ERROR("settings", "Cannot open {}", path_);
        return false;
    }
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    auto parsed = deserialize(json);
    if (!parsed)
    {
        CASEMENT_LOG_ERROR("settings", "Malformed settings file {}, using defaults", path_);
        return false;
    }
    for (auto& [key, value] : *parsed)
        values_[key] = std::move(value);

    CASEMENT_LOG_DEBUG("settings", "Loaded {} settings from {}", parsed->size(), path_);
    return true;
}

bool JsonSettingsStore::save() const
{
    std::error_code ec;
    auto            dir = std::filesystem::path(path_).parent_path();
    if (!dir.empty())
    {
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            CASEMENT_LOG_ERROR("settings", "Cannot create {}: {}", dir.string(), ec.message());
            return false;
        }
    }

    std::ofstream f(path_, std::ios::trunc);
    if (!f.is_open())
    {
        CASEMENT_LOG_ERROR("settings", "Cannot write {}", path_);
        return false;
    }
    f << serialize();
    f.flush();
    return f.good();
}

std::optional<SettingValue> JsonSettingsStore::get(const std::string& key) const
{
    auto it = values_.find(key);
    if (it == values_.end())
        return std::nullopt;
    return it->second;
}

bool JsonSettingsStore::set(const std::string& key, const SettingValue& value)
{
    std::optional<SettingValue> previous;
    if (auto it = values_.find(key); it != values_.end())
        previous = it->second;

    values_[key] = value;
    if (save())
        return true;

    // Keep memory and disk in agreement.
    if (previous)
        values_[key] = *previous;
    else
        values_.erase(key);
    return false;
}

bool JsonSettingsStore::reset()
{
    values_ = defaults_;
    return save();
}

std::string JsonSettingsStore::default_path(const std::string& app_name)
{
    std::filesystem::path base;
    const char*           xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0')
    {
        base = xdg;
    }
    else
    {
        const char* home = std::getenv("HOME");
        if (!home)
            return "settings.json";
        base = std::filesystem::path(home) / ".config";
    }
    return (base / app_name / "settings.json").string();
}

}   // namespace casement
