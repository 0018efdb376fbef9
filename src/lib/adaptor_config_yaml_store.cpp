#include "nabunet/config/adaptor_config_yaml_store.h"
#include "nabunet/core/logging.h"
#include "nabunet/pak/pak_types.h"

#include <stdexcept>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace nabunet::config {

static constexpr const char* TAG = "config";

// ---------- tiny helpers ----------

template<typename T>
static T get_or(const YAML::Node& obj, const char* key, T def)
{
    auto n = obj[key];
    return n ? n.as<T>() : def;
}

ChannelKind parse_channel_kind(const std::string& s)
{
    if (s == "tty" || s == "TTY") return ChannelKind::Tty;
    if (s == "pty" || s == "PTY") return ChannelKind::Pty;
    return ChannelKind::Unknown;
}

std::string channel_kind_to_string(ChannelKind k)
{
    switch (k) {
    case ChannelKind::Tty: return "tty";
    case ChannelKind::Pty: return "pty";
    default:               return "unknown";
    }
}

// Pak ids are written as six hex digits so they match the file names.
static std::uint32_t pak_id_from_yaml(const YAML::Node& n)
{
    const auto text = n.as<std::string>();
    pak::PakId id = 0;
    if (!pak::parse_pak_id(text, id)) {
        throw std::runtime_error("invalid pak id '" + text + "'");
    }
    return id;
}

// ---------- from_yaml helpers ----------

static void from_yaml(const YAML::Node& node, SerialConfig& out)
{
    out.kind     = parse_channel_kind(get_or<std::string>(node, "channel", "tty"));
    out.device   = get_or<std::string>(node, "device", out.device);
    out.baudRate = get_or<std::uint32_t>(node, "baud_rate", out.baudRate);
}

static void from_yaml(const YAML::Node& node, RawImageConfig& out)
{
    out.path            = get_or<std::string>(node, "path", "");
    out.padFinalSegment = get_or<bool>(node, "pad_final_segment", false);
    if (auto n = node["pak_id"]) {
        out.pakId = pak_id_from_yaml(n);
    }
}

static void from_yaml(const YAML::Node& node, CloudConfig& out)
{
    out.enabled = get_or<bool>(node, "enabled", out.enabled);
    out.url     = get_or<std::string>(node, "url", out.url);
}

static void from_yaml(const YAML::Node& node, SourcesConfig& out)
{
    out.pakDirectory = get_or<std::string>(node, "pak_directory", out.pakDirectory);
    if (auto n = node["raw_image"]) from_yaml(n, out.rawImage);
    if (auto n = node["cloud"])     from_yaml(n, out.cloud);
}

static void from_yaml(const YAML::Node& node, AdaptorSettings& out)
{
    out.logLevel = get_or<std::string>(node, "log_level", out.logLevel);

    if (auto ids = node["preload"]; ids && ids.IsSequence()) {
        out.preload.clear();
        for (const auto& n : ids) {
            out.preload.push_back(pak_id_from_yaml(n));
        }
    }
}

// Top-level AdaptorConfig mapper.
static void from_yaml(const YAML::Node& root, AdaptorConfig& cfg)
{
    if (auto n = root["serial"])  from_yaml(n, cfg.serial);
    if (auto n = root["sources"]) from_yaml(n, cfg.sources);
    if (auto n = root["adaptor"]) from_yaml(n, cfg.adaptor);
}

// ---------- to_yaml ----------

static void to_yaml(YAML::Emitter& out, const AdaptorConfig& cfg)
{
    out << YAML::BeginMap;

    // serial:
    out << YAML::Key << "serial" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "channel"   << YAML::Value << channel_kind_to_string(cfg.serial.kind);
    out << YAML::Key << "device"    << YAML::Value << cfg.serial.device;
    out << YAML::Key << "baud_rate" << YAML::Value << cfg.serial.baudRate;
    out << YAML::EndMap;

    // sources:
    out << YAML::Key << "sources" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "pak_directory" << YAML::Value << cfg.sources.pakDirectory;

    out << YAML::Key << "raw_image" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "path"              << YAML::Value << cfg.sources.rawImage.path;
    out << YAML::Key << "pak_id"            << YAML::Value
        << YAML::DoubleQuoted << pak::format_pak_id(cfg.sources.rawImage.pakId);
    out << YAML::Key << "pad_final_segment" << YAML::Value << cfg.sources.rawImage.padFinalSegment;
    out << YAML::EndMap;

    out << YAML::Key << "cloud" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "enabled" << YAML::Value << cfg.sources.cloud.enabled;
    out << YAML::Key << "url"     << YAML::Value << cfg.sources.cloud.url;
    out << YAML::EndMap;

    out << YAML::EndMap; // sources

    // adaptor:
    out << YAML::Key << "adaptor" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "log_level" << YAML::Value << cfg.adaptor.logLevel;
    out << YAML::Key << "preload" << YAML::Value << YAML::BeginSeq;
    for (auto id : cfg.adaptor.preload) {
        out << YAML::DoubleQuoted << pak::format_pak_id(id);
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    out << YAML::EndMap; // root
}

// --- small local helpers using IFile ---

static std::string read_all(fs::IFile& file)
{
    std::string out;
    std::vector<std::uint8_t> buf(1024);

    for (;;) {
        std::size_t n = file.read(buf.data(), buf.size());
        if (n == 0) {
            break;
        }
        out.append(reinterpret_cast<const char*>(buf.data()), n);
    }
    return out;
}

static void write_all(fs::IFile& file, const std::string& data)
{
    const auto* ptr = reinterpret_cast<const std::uint8_t*>(data.data());
    std::size_t remaining = data.size();

    while (remaining > 0) {
        std::size_t written = file.write(ptr, remaining);
        if (written == 0) {
            throw std::runtime_error("short write while saving config");
        }
        remaining -= written;
        ptr       += written;
    }
    if (!file.flush()) {
        throw std::runtime_error("flush failed while saving config");
    }
}

// ---------- YamlAdaptorConfigStore methods ----------

YamlAdaptorConfigStore::YamlAdaptorConfigStore(fs::IFileSystem* fs, std::string relativePath)
    : _fs(fs)
    , _relPath(std::move(relativePath))
{
}

AdaptorConfig YamlAdaptorConfigStore::load()
{
    AdaptorConfig cfg{}; // defaults

    if (!_fs) {
        NN_LOGW(TAG, "No filesystem for config; using defaults");
        return cfg;
    }

    if (_fs->exists(_relPath)) {
        try {
            return loadFromFs(*_fs);
        } catch (const std::exception& ex) {
            NN_LOGE(TAG,
                    "Failed to load config '%s' on '%s': %s; using defaults",
                    _relPath.c_str(),
                    _fs->name().c_str(),
                    ex.what());
            return cfg;
        }
    }

    // Not found: write defaults so the file exists for next start.
    NN_LOGW(TAG, "Config '%s' not found; writing defaults", _relPath.c_str());
    save(cfg);
    return cfg;
}

void YamlAdaptorConfigStore::save(const AdaptorConfig& cfg)
{
    if (!_fs) {
        return;
    }
    try {
        saveToFs(*_fs, cfg);
    } catch (const std::exception& ex) {
        NN_LOGE(TAG,
                "Failed to save config '%s' on '%s': %s",
                _relPath.c_str(),
                _fs->name().c_str(),
                ex.what());
    }
}

AdaptorConfig YamlAdaptorConfigStore::loadFromFs(fs::IFileSystem& fs)
{
    auto file = fs.open(_relPath, "rb");
    if (!file) {
        throw std::runtime_error("open for read failed");
    }

    std::string yamlText = read_all(*file);
    if (yamlText.empty()) {
        NN_LOGW(TAG,
                "Config '%s' on '%s' is empty; using defaults",
                _relPath.c_str(), fs.name().c_str());
        return AdaptorConfig{};
    }

    YAML::Node root = YAML::Load(yamlText);

    AdaptorConfig cfg{};
    from_yaml(root, cfg);

    NN_LOGI(TAG,
            "Loaded config from '%s' on '%s'",
            _relPath.c_str(), fs.name().c_str());
    return cfg;
}

void YamlAdaptorConfigStore::saveToFs(fs::IFileSystem& fs, const AdaptorConfig& cfg)
{
    YAML::Emitter out;
    to_yaml(out, cfg);

    auto file = fs.open(_relPath, "wb");
    if (!file) {
        throw std::runtime_error("open for write failed");
    }

    const std::string text = out.c_str();
    write_all(*file, text);

    NN_LOGI(TAG,
            "Saved config to '%s' on '%s'",
            _relPath.c_str(), fs.name().c_str());
}

} // namespace nabunet::config
