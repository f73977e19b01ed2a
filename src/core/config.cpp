#include <plotscale/config.hpp>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <plotscale/errors.hpp>
#include <plotscale/logger.hpp>
#include <sstream>
#include <system_error>

#include "core/hash.hpp"

namespace plotscale
{

static constexpr int CONFIG_VERSION = 1;

static void reject(const std::string& message)
{
    PLOTSCALE_LOG_ERROR("config", "invalid config: {}", message);
    throw NormalizeError(ErrorCode::InvalidConfig, message);
}

void NormalizeConfig::validate() const
{
    if (!std::isfinite(epsilon) || epsilon <= 0.0)
        reject(Logger::format_message("epsilon must be positive, got {}", epsilon));
    if (!std::isfinite(bar_width_ratio) || bar_width_ratio <= 0.0 || bar_width_ratio > 1.0)
        reject(Logger::format_message("bar_width_ratio must be in (0, 1], got {}", bar_width_ratio));
    if (!std::isfinite(padding) || padding < 0.0)
        reject(Logger::format_message("padding must be non-negative, got {}", padding));
    if (!std::isfinite(stack_key_quantum) || stack_key_quantum < 0.0)
        reject(Logger::format_message("stack_key_quantum must be non-negative, got {}",
                                      stack_key_quantum));
}

uint64_t NormalizeConfig::hash() const
{
    detail::Fnv1a h;
    h.mix(epsilon);
    h.mix(bar_width_ratio);
    h.mix(padding);
    h.mix(stack_key_quantum);
    return h.value();
}

// ─── JSON serialization ──────────────────────────────────────────────────────

std::string NormalizeConfig::serialize() const
{
    std::ostringstream os;
    os << std::setprecision(17);
    os << "{\n";
    os << "  \"version\": " << CONFIG_VERSION << ",\n";
    os << "  \"epsilon\": " << epsilon << ",\n";
    os << "  \"bar_width_ratio\": " << bar_width_ratio << ",\n";
    os << "  \"padding\": " << padding << ",\n";
    os << "  \"stack_key_quantum\": " << stack_key_quantum << "\n";
    os << "}\n";
    return os.str();
}

// Minimal reader for the flat object written above. Returns false when the
// key is absent or its value does not parse as a number.
static bool read_json_number(const std::string& json, const std::string& key, double& out)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return false;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return false;

    const char* begin = json.c_str() + pos + 1;
    char*       end   = nullptr;
    double      value = std::strtod(begin, &end);
    if (end == begin)
        return false;
    out = value;
    return true;
}

bool NormalizeConfig::deserialize(const std::string& json)
{
    if (json.empty())
        return false;

    double version = CONFIG_VERSION;
    if (read_json_number(json, "version", version) && version > CONFIG_VERSION)
    {
        PLOTSCALE_LOG_WARN("config", "unsupported config version {}", version);
        return false;
    }

    NormalizeConfig parsed = *this;
    read_json_number(json, "epsilon", parsed.epsilon);
    read_json_number(json, "bar_width_ratio", parsed.bar_width_ratio);
    read_json_number(json, "padding", parsed.padding);
    read_json_number(json, "stack_key_quantum", parsed.stack_key_quantum);

    try
    {
        parsed.validate();
    }
    catch (const NormalizeError& e)
    {
        PLOTSCALE_LOG_WARN("config", "ignoring config: {}", e.what());
        return false;
    }

    *this = parsed;
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool NormalizeConfig::save(const std::string& path) const
{
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            PLOTSCALE_LOG_WARN("config", "cannot create {}: {}", dir.string(), ec.message());
    }

    std::ofstream f(path);
    if (!f.is_open())
    {
        PLOTSCALE_LOG_WARN("config", "cannot open {} for writing", path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool NormalizeConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return deserialize(json);
}

std::string NormalizeConfig::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "normalize.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "plotscale";
    return (dir / "normalize.json").string();
}

}   // namespace plotscale
