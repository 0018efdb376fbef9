#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>

#include <getopt.h>

#include "nabunet/config/adaptor_config.h"
#include "nabunet/config/adaptor_config_yaml_store.h"
#include "nabunet/core/adaptor.h"
#include "nabunet/core/logging.h"
#include "nabunet/core/version.h"
#include "nabunet/fs/fs_stdio.h"
#include "nabunet/io/core/channel.h"
#include "nabunet/pak/pak_source.h"
#include "nabunet/platform/channel_factory.h"
#include "nabunet/platform/posix/http_client_curl.h"

using namespace nabunet;

static const char* TAG = "main";

static constexpr const char* DEFAULT_CONFIG = "nabunet.yaml";

// Set while serving so SIGINT/SIGTERM can unblock the read.
static io::Channel* g_channel = nullptr;

static void on_signal(int)
{
    if (g_channel) {
        g_channel->close();
    }
}

struct Options {
    std::string configPath{DEFAULT_CONFIG};
    std::string tty;
    std::string baud;
    std::string pakDir;
    std::string cloudUrl;
    std::string nabuFile;
    std::string logLevel;
    bool pty{false};
    bool list{false};
};

static void usage(const char* argv0)
{
    std::printf(
        "usage: %s [options]\n"
        "  -c, --config FILE            config file (default: %s)\n"
        "  -t, --ttyname DEV            serial device, e.g. /dev/ttyUSB0\n"
        "  -b, --baudrate N             serial baud rate\n"
        "      --pty                    create a pseudo-terminal instead of opening a device\n"
        "  -p, --paksource DIR          directory holding <ID>.pak files\n"
        "  -i, --internetlocation URL   cloud pak location; 'none' disables it\n"
        "  -n, --nabufile FILE          serve a raw .nabu file as pak 000001\n"
        "  -l, --log_level LEVEL        error, warn, info, debug or verbose\n"
        "      --list                   list paks in the pak directory and exit\n"
        "  -h, --help                   show this help\n",
        argv0, DEFAULT_CONFIG);
}

// Returns 0 to continue, otherwise the process exit code + 1.
static int parse_args(int argc, char** argv, Options& opt)
{
    enum { OPT_PTY = 1000, OPT_LIST };

    static const struct option longOpts[] = {
        {"config",           required_argument, nullptr, 'c'},
        {"ttyname",          required_argument, nullptr, 't'},
        {"baudrate",         required_argument, nullptr, 'b'},
        {"paksource",        required_argument, nullptr, 'p'},
        {"internetlocation", required_argument, nullptr, 'i'},
        {"nabufile",         required_argument, nullptr, 'n'},
        {"log_level",        required_argument, nullptr, 'l'},
        {"pty",              no_argument,       nullptr, OPT_PTY},
        {"list",             no_argument,       nullptr, OPT_LIST},
        {"help",             no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int c;
    while ((c = ::getopt_long(argc, argv, "c:t:b:p:i:n:l:h", longOpts, nullptr)) != -1) {
        switch (c) {
        case 'c': opt.configPath = optarg; break;
        case 't': opt.tty        = optarg; break;
        case 'b': opt.baud       = optarg; break;
        case 'p': opt.pakDir     = optarg; break;
        case 'i': opt.cloudUrl   = optarg; break;
        case 'n': opt.nabuFile   = optarg; break;
        case 'l': opt.logLevel   = optarg; break;
        case OPT_PTY:  opt.pty  = true; break;
        case OPT_LIST: opt.list = true; break;
        case 'h':
            usage(argv[0]);
            return 1;
        default:
            usage(argv[0]);
            return 3;
        }
    }
    return 0;
}

// "dir/file" -> {"dir", "/file"}; "file" -> {".", "/file"}.
static std::pair<std::string, std::string> split_path(const std::string& path)
{
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos) {
        return {".", "/" + path};
    }
    std::string dir = slash == 0 ? "/" : path.substr(0, slash);
    return {dir, path.substr(slash)};
}

static bool apply_overrides(const Options& opt, config::AdaptorConfig& cfg)
{
    if (!opt.tty.empty()) {
        cfg.serial.device = opt.tty;
        cfg.serial.kind = config::ChannelKind::Tty;
    }
    if (opt.pty) {
        cfg.serial.kind = config::ChannelKind::Pty;
    }
    if (!opt.baud.empty()) {
        char* end = nullptr;
        unsigned long v = std::strtoul(opt.baud.c_str(), &end, 10);
        if (!end || *end != '\0' || v == 0) {
            NN_ELOG("invalid baud rate '%s'", opt.baud.c_str());
            return false;
        }
        cfg.serial.baudRate = static_cast<std::uint32_t>(v);
    }
    if (!opt.pakDir.empty()) {
        cfg.sources.pakDirectory = opt.pakDir;
    }
    if (!opt.cloudUrl.empty()) {
        cfg.sources.cloud.enabled = (opt.cloudUrl != "none");
        if (cfg.sources.cloud.enabled) {
            cfg.sources.cloud.url = opt.cloudUrl;
        }
    }
    if (!opt.nabuFile.empty()) {
        cfg.sources.rawImage.path = opt.nabuFile;
    }
    if (!opt.logLevel.empty()) {
        cfg.adaptor.logLevel = opt.logLevel;
    }
    return true;
}

int main(int argc, char** argv)
{
    Options opt;
    if (int rc = parse_args(argc, argv, opt); rc != 0) {
        return rc - 1;
    }

    // Config
    config::AdaptorConfig cfg;
    {
        auto [dir, file] = split_path(opt.configPath);
        auto configFs = fs::create_stdio_filesystem(dir, "config");
        config::YamlAdaptorConfigStore store(configFs.get(), file);
        cfg = store.load();
    }
    if (!apply_overrides(opt, cfg)) {
        return 2;
    }

    log::Level level{};
    if (log::parse_level(cfg.adaptor.logLevel, level)) {
        log::set_level(level);
    } else {
        NN_ELOG("unknown log level '%s'; using info", cfg.adaptor.logLevel.c_str());
    }

    NN_LOGI(TAG, "nabunet %s starting", nabunet::version());

    core::AdaptorCore core;

    if (!core.storageManager().registerFileSystem(
            fs::create_stdio_filesystem(cfg.sources.pakDirectory, core::PAK_FS_NAME))) {
        NN_LOGE(TAG, "failed to register pak directory '%s'", cfg.sources.pakDirectory.c_str());
        return 1;
    }

    if (opt.list) {
        auto* pakFs = core.storageManager().get(core::PAK_FS_NAME);
        for (auto id : pak::list_pak_ids(*pakFs)) {
            std::printf("%s\n", pak::format_pak_id(id).c_str());
        }
        return 0;
    }

    config::SourcesConfig sources = cfg.sources;
    if (!sources.rawImage.path.empty()) {
        auto [dir, file] = split_path(sources.rawImage.path);
        if (!core.storageManager().registerFileSystem(
                fs::create_stdio_filesystem(dir, core::RAW_FS_NAME))) {
            NN_LOGE(TAG, "failed to register raw image directory '%s'", dir.c_str());
            return 1;
        }
        sources.rawImage.path = file;
    }

    if (sources.cloud.enabled) {
        core.setHttpClient(platform::posix::create_http_client());
    }

    core.configureSources(sources);
    const std::size_t loaded = core.preload(cfg.adaptor.preload);
    NN_LOGI(TAG, "preloaded %zu of %zu paks", loaded, cfg.adaptor.preload.size());

    auto channel = platform::create_channel(cfg.serial);
    if (!channel) {
        NN_LOGE(TAG, "failed to create serial channel");
        return 1;
    }

    g_channel = channel.get();
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    core.serve(*channel);

    g_channel = nullptr;
    NN_LOGI(TAG, "nabunet exiting");
    return 0;
}
