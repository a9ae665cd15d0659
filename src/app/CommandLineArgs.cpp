#include "app/CommandLineArgs.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>
#include <string_view>

namespace frontier::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// --opt=value
[[nodiscard]] bool ConsumeValue(std::string_view arg, std::string_view prefix, std::string_view& outValue)
{
    if (!StartsWith(arg, prefix) || arg.size() == prefix.size() || arg[prefix.size()] != '=')
        return false;
    outValue = arg.substr(prefix.size() + 1);
    return true;
}

[[nodiscard]] std::optional<long long> ParseInteger(std::string_view s)
{
    if (s.empty())
        return std::nullopt;

    long long sign = 1;
    std::size_t i = 0;
    if (s[0] == '+') {
        i = 1;
    } else if (s[0] == '-') {
        sign = -1;
        i = 1;
    }
    if (i == s.size())
        return std::nullopt;

    long long v = 0;
    for (; i < s.size(); ++i)
    {
        const char c = s[i];
        if (c < '0' || c > '9')
            return std::nullopt;
        if (v > (std::numeric_limits<long long>::max() - (c - '0')) / 10)
            return std::nullopt;
        v = v * 10 + static_cast<long long>(c - '0');
    }
    return v * sign;
}

[[nodiscard]] std::optional<int> ParseInt(std::string_view s)
{
    const auto v = ParseInteger(s);
    if (!v || *v < 0 || *v > 1'000'000'000LL)
        return std::nullopt; // absurd
    return static_cast<int>(*v);
}

} // namespace

CommandLineArgs ParseCommandLineArgs(int argc, char** argv)
{
    CommandLineArgs out;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view raw(argv[i]);
        if (raw.empty())
            continue;

        // Values (paths) keep their case; only the option name is lowered.
        const std::size_t eq = raw.find('=');
        const std::string name = ToLower(raw.substr(0, eq));
        const std::string lowered = eq == std::string_view::npos ? name : name + std::string(raw.substr(eq));
        const std::string_view arg(lowered);

        if (arg == "--help" || arg == "-h" || arg == "-?") { out.showHelp = true; continue; }
        if (arg == "--verbose" || arg == "-v") { out.verbose = true; continue; }
        if (arg == "--no-disaster") { out.disaster = false; continue; }

        std::string_view value;

        const auto nextValue = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc)
                return std::nullopt;
            ++i;
            return std::string_view(argv[i]);
        };

        const auto stringOption = [&](std::string_view opt, std::optional<std::string>& dst) -> bool {
            if (arg == opt) {
                if (const auto v = nextValue()) dst = std::string(*v);
                else out.unknown.emplace_back(raw);
                return true;
            }
            if (ConsumeValue(arg, opt, value)) {
                dst = std::string(value);
                return true;
            }
            return false;
        };

        const auto intOption = [&](std::string_view opt, std::optional<int>& dst) -> bool {
            std::optional<std::string_view> text;
            if (arg == opt)
                text = nextValue();
            else if (ConsumeValue(arg, opt, value))
                text = value;
            else
                return false;

            const auto parsed = text ? ParseInt(*text) : std::nullopt;
            if (parsed) dst = *parsed;
            else out.unknown.emplace_back(raw);
            return true;
        };

        if (stringOption("--config", out.configPath)) continue;
        if (stringOption("--catalog", out.catalogPath)) continue;
        if (stringOption("--log-dir", out.logDir)) continue;
        if (stringOption("--dump", out.dumpPath)) continue;
        if (intOption("--hours", out.hours)) continue;
        if (intOption("--settlements", out.settlements)) continue;
        if (intOption("--threads", out.threads)) continue;

        if (arg == "--seed" || StartsWith(arg, "--seed=")) {
            std::optional<std::string_view> text = arg == "--seed" ? nextValue()
                                                                   : std::optional<std::string_view>(arg.substr(7));
            const auto parsed = text ? ParseInteger(*text) : std::nullopt;
            if (parsed) out.seed = *parsed;
            else out.unknown.emplace_back(raw);
            continue;
        }

        // Anything else is unknown.
        out.unknown.emplace_back(raw);
    }

    return out;
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "frontier_sim - headless settlement economy simulation\n\n";
    oss << "Inputs\n";
    oss << "  --config <file>              Simulation tunables (JSON, comments allowed)\n";
    oss << "  --catalog <file>             Structure/biome overrides merged over the built-in catalog\n\n";

    oss << "Run\n";
    oss << "  --hours <N>                  Simulated hours to run (default 24)\n";
    oss << "  --settlements <N>            Demo settlements to found (default 4)\n";
    oss << "  --threads <N>                Worker threads (0 = hardware)\n";
    oss << "  --seed <N>                   RNG seed (overrides the config)\n";
    oss << "  --no-disaster                Do not schedule the demo disaster\n\n";

    oss << "Output\n";
    oss << "  --log-dir <dir>              Also write frontier.log (rotating) into <dir>\n";
    oss << "  --dump <file>                Write the persisted state as JSON at exit\n";
    oss << "  --verbose, -v                Debug logging\n";
    oss << "  --help, -h                   Show this help\n\n";

    oss << "Examples\n";
    oss << "  frontier_sim --hours 72 --settlements 8\n";
    oss << "  frontier_sim --config data/sim_config.json --dump state.json\n";
    return oss.str();
}

} // namespace frontier::app
