#include "hostcaps/config/probe_config_yaml_store.h"
#include "hostcaps/core/logging.h"

#include <cstdint>
#include <stdexcept>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace hostcaps::config {

static constexpr const char* TAG = "config";

// ---------- tiny helpers ----------

template<typename T>
static T get_or(const YAML::Node& obj, const char* key, T def)
{
    auto n = obj[key];
    return n ? n.as<T>() : def;
}

// ---------- from_yaml helpers ----------

static void from_yaml(const YAML::Node& node, ProbeConfig& out)
{
    out.pathVariable      = get_or<std::string>(node, "path_variable", out.pathVariable);
    out.imageConvertName  = get_or<std::string>(node, "image_convert", out.imageConvertName);
    out.imageIdentifyName = get_or<std::string>(node, "image_identify", out.imageIdentifyName);
}

static void aliases_from_yaml(const YAML::Node& node, ProbeConfig& out)
{
    if (!node.IsMap()) {
        throw std::runtime_error("modules.aliases must be a map");
    }
    out.moduleAliases.clear();
    for (const auto& kv : node) {
        out.moduleAliases[kv.first.as<std::string>()] = kv.second.as<std::string>();
    }
}

ProbeConfig probe_config_from_yaml(const std::string& text)
{
    const YAML::Node root = YAML::Load(text);

    ProbeConfig cfg{};
    if (!root || root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("config root must be a map");
    }

    if (const auto n = root["probe"]) {
        from_yaml(n, cfg);
    }
    if (const auto mods = root["modules"]) {
        if (const auto aliases = mods["aliases"]) {
            aliases_from_yaml(aliases, cfg);
        }
    }
    return cfg;
}

// ---------- to_yaml ----------

static void to_yaml(YAML::Emitter& out, const ProbeConfig& cfg)
{
    out << YAML::BeginMap;

    // probe:
    out << YAML::Key << "probe" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "path_variable"  << YAML::Value << cfg.pathVariable;
    out << YAML::Key << "image_convert"  << YAML::Value << cfg.imageConvertName;
    out << YAML::Key << "image_identify" << YAML::Value << cfg.imageIdentifyName;
    out << YAML::EndMap;

    // modules:
    out << YAML::Key << "modules" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "aliases" << YAML::Value << YAML::BeginMap;
    for (const auto& [from, to] : cfg.moduleAliases) {
        out << YAML::Key << from << YAML::Value << to;
    }
    out << YAML::EndMap;
    out << YAML::EndMap; // modules

    out << YAML::EndMap; // root
}

std::string to_yaml_string(const ProbeConfig& cfg)
{
    YAML::Emitter out;
    to_yaml(out, cfg);
    std::string text = out.c_str();
    text += "\n";
    return text;
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

// ---------- YamlProbeConfigStoreFs methods ----------

YamlProbeConfigStoreFs::YamlProbeConfigStoreFs(fs::IFileSystem& fs, std::string path)
    : _fs(fs)
    , _path(std::move(path))
{
}

ProbeConfig YamlProbeConfigStoreFs::load()
{
    if (!_fs.exists(_path)) {
        HC_LOGW(TAG, "Config '%s' not found on '%s'; using defaults",
                _path.c_str(), _fs.name().c_str());
        return ProbeConfig{};
    }

    try {
        return loadFromFs();
    } catch (const std::exception& ex) {
        HC_LOGE(TAG, "Failed to load config '%s' on '%s': %s",
                _path.c_str(), _fs.name().c_str(), ex.what());
    }
    return ProbeConfig{};
}

void YamlProbeConfigStoreFs::save(const ProbeConfig& cfg)
{
    try {
        auto file = _fs.open(_path, "wb");
        if (!file) {
            throw std::runtime_error("open for write failed");
        }
        write_all(*file, to_yaml_string(cfg));

        HC_LOGI(TAG, "Saved config to '%s' on '%s'",
                _path.c_str(), _fs.name().c_str());
    } catch (const std::exception& ex) {
        HC_LOGE(TAG, "Failed to save config '%s' on '%s': %s",
                _path.c_str(), _fs.name().c_str(), ex.what());
    }
}

ProbeConfig YamlProbeConfigStoreFs::loadFromFs()
{
    auto file = _fs.open(_path, "rb");
    if (!file) {
        throw std::runtime_error("open for read failed");
    }

    const std::string yamlText = read_all(*file);
    if (yamlText.empty()) {
        HC_LOGW(TAG, "Config '%s' on '%s' is empty; using defaults",
                _path.c_str(), _fs.name().c_str());
        return ProbeConfig{};
    }

    ProbeConfig cfg = probe_config_from_yaml(yamlText);

    HC_LOGI(TAG, "Loaded config from '%s' on '%s'",
            _path.c_str(), _fs.name().c_str());
    return cfg;
}

} // namespace hostcaps::config
