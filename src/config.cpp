#include "config.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>

static bool parse_int(const char* s, int lo, int hi, int& out)
{
    if (!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(s, &end, 10);
    if (errno != 0 || *end != '\0' || v < lo || v > hi) return false;
    out = static_cast<int>(v);
    return true;
}

// "RE,IM,FACTOR"
static bool parse_zoom(const char* s, ZoomStep& out)
{
    double v[3];
    const char* p = s;
    for (int k = 0; k < 3; ++k) {
        char* end = nullptr;
        errno = 0;
        v[k] = std::strtod(p, &end);
        if (errno != 0 || end == p || !std::isfinite(v[k])) return false;
        if (k < 2) {
            if (*end != ',') return false;
            p = end + 1;
        } else if (*end != '\0') {
            return false;
        }
    }
    if (v[2] <= 0.0) return false;
    out.re = v[0];  out.im = v[1];  out.factor = v[2];
    return true;
}

static bool valid_level(const std::string& s)
{
    static const char* levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    for (const char* l : levels)
        if (s == l) return true;
    return false;
}

std::string parse_args(int argc, const char* const* argv, ExplorerConfig& cfg)
{
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const char*       val = (i + 1 < argc) ? argv[i + 1] : nullptr;

        auto need = [&](const char* what) -> std::string {
            return "Missing or invalid value for " + arg + " (" + what + ")";
        };

        if (arg == "-h" || arg == "--help") {
            cfg.show_help = true;
        } else if (arg == "--debounce-ms") {
            if (!parse_int(val, 0, 10000, cfg.debounce_ms)) return need("0..10000");
            ++i;
        } else if (arg == "--timeout-ms") {
            if (!parse_int(val, 0, 3600000, cfg.render_timeout_ms)) return need("0..3600000");
            ++i;
        } else if (arg == "--base-iter") {
            if (!parse_int(val, 1, 1000000, cfg.base_iterations)) return need("1..1000000");
            ++i;
        } else if (arg == "--iter-cap") {
            if (!parse_int(val, 1, 10000000, cfg.iteration_cap)) return need("1..10000000");
            ++i;
        } else if (arg == "--threads") {
            if (!parse_int(val, 0, 1024, cfg.threads)) return need("0..1024");
            ++i;
        } else if (arg == "--width") {
            if (!parse_int(val, 16, 7680, cfg.width)) return need("16..7680");
            ++i;
        } else if (arg == "--height") {
            if (!parse_int(val, 16, 4320, cfg.height)) return need("16..4320");
            ++i;
        } else if (arg == "--log-level") {
            if (!val || !valid_level(val)) return need("trace|debug|info|warn|error|off");
            cfg.log_level = val;
            ++i;
        } else if (arg == "--render") {
            if (!val || !*val) return need("output file");
            cfg.render_path = val;
            ++i;
        } else if (arg == "--zoom") {
            ZoomStep z;
            if (!parse_zoom(val ? val : "", z)) return need("RE,IM,FACTOR");
            cfg.zoom_steps.push_back(z);
            ++i;
        } else {
            return "Unknown option: " + arg;
        }
    }

    if (cfg.base_iterations > cfg.iteration_cap)
        return "--base-iter must not exceed --iter-cap";
    return {};
}

const char* usage_text()
{
    return
        "Usage: zoomscope [options]\n"
        "  --width N, --height N   window (or headless image) size\n"
        "  --debounce-ms N         delay before a burst of changes is rendered (100)\n"
        "  --timeout-ms N          abandon renders running longer than N ms (0 = never)\n"
        "  --base-iter N           iteration budget at zoom 1 (500)\n"
        "  --iter-cap N            upper bound for the dynamic budget (50000)\n"
        "  --threads N             render threads, 0 = all cores\n"
        "  --log-level LEVEL       trace|debug|info|warn|error|off\n"
        "  --render FILE           headless: render and write FILE (.png/.jxl)\n"
        "  --zoom RE,IM,FACTOR     headless: zoom step, repeatable\n"
        "  -h, --help              show this text\n";
}
