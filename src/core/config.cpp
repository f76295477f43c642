// Crumble Engine Core
// config.cpp - JSON-backed configuration store implementation

#include <nlohmann/json.hpp>

#include <crumble/core/config.hpp>
#include <crumble/core/logger.hpp>
#include <crumble/platform/file_io.hpp>

namespace crumble::core {

using json = nlohmann::json;

struct Config::Impl {
    json data;
    std::filesystem::path path;
    ChangeCallback change_callback;
    bool dirty = false;

    // Returns the value stored at section.key, or nullptr when absent
    const json* find(std::string_view section, std::string_view key) const {
        auto section_it = data.find(std::string(section));
        if (section_it == data.end() || !section_it->is_object()) {
            return nullptr;
        }
        auto key_it = section_it->find(std::string(key));
        return key_it != section_it->end() ? &*key_it : nullptr;
    }

    template<typename T>
    T get(std::string_view section, std::string_view key, T default_value) const {
        const json* value = find(section, key);
        if (!value) {
            return default_value;
        }
        try {
            return value->get<T>();
        } catch (const json::exception& e) {
            CRUMBLE_LOG_WARN(log_category::CONFIG, "Config {}.{} has the wrong type: {}", section, key, e.what());
            return default_value;
        }
    }

    template<typename T>
    void set(std::string_view section, std::string_view key, T&& value) {
        data[std::string(section)][std::string(key)] = std::forward<T>(value);
        dirty = true;
        if (change_callback) {
            change_callback(section, key);
        }
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    set_defaults();
}

Config::~Config() = default;

Config::Config(Config&&) noexcept = default;
Config& Config::operator=(Config&&) noexcept = default;

bool Config::load(const std::filesystem::path& path) {
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        CRUMBLE_LOG_ERROR(log_category::CONFIG, "Failed to read config file: {}", path.string());
        return false;
    }

    if (!load_from_string(*content)) {
        return false;
    }

    impl_->path = path;
    CRUMBLE_LOG_INFO(log_category::CONFIG, "Loaded config from: {}", path.string());
    return true;
}

bool Config::load_from_string(std::string_view json_text) {
    try {
        json parsed = json::parse(json_text);
        if (!parsed.is_object()) {
            CRUMBLE_LOG_ERROR(log_category::CONFIG, "Config root must be a JSON object");
            return false;
        }
        // Loaded values overlay the defaults so missing keys keep working
        set_defaults();
        impl_->data.merge_patch(parsed);
        impl_->dirty = false;
        return true;
    } catch (const json::parse_error& e) {
        CRUMBLE_LOG_ERROR(log_category::CONFIG, "Failed to parse config: {}", e.what());
        return false;
    }
}

bool Config::save(const std::filesystem::path& path) const {
    auto parent = path.parent_path();
    if (!parent.empty() && !platform::FileSystem::exists(parent)) {
        if (!platform::FileSystem::create_directories(parent)) {
            CRUMBLE_LOG_ERROR(log_category::CONFIG, "Failed to create config directory: {}", parent.string());
            return false;
        }
    }

    if (!platform::FileSystem::write_text(path, impl_->data.dump(4))) {
        CRUMBLE_LOG_ERROR(log_category::CONFIG, "Failed to write config file: {}", path.string());
        return false;
    }

    CRUMBLE_LOG_INFO(log_category::CONFIG, "Saved config to: {}", path.string());
    return true;
}

bool Config::save() const {
    if (impl_->path.empty()) {
        CRUMBLE_LOG_ERROR(log_category::CONFIG, "Cannot save config: no path specified");
        return false;
    }
    return save(impl_->path);
}

bool Config::load_or_create_default(const std::filesystem::path& path) {
    if (platform::FileSystem::exists(path)) {
        return load(path);
    }

    set_defaults();
    impl_->path = path;

    if (!save(path)) {
        CRUMBLE_LOG_WARN(log_category::CONFIG, "Failed to save default config, using in-memory defaults");
    }

    return true;
}

std::filesystem::path Config::get_path() const {
    return impl_->path;
}

int Config::get_int(std::string_view section, std::string_view key, int default_value) const {
    return impl_->get<int>(section, key, default_value);
}

double Config::get_double(std::string_view section, std::string_view key, double default_value) const {
    return impl_->get<double>(section, key, default_value);
}

bool Config::get_bool(std::string_view section, std::string_view key, bool default_value) const {
    return impl_->get<bool>(section, key, default_value);
}

std::string Config::get_string(std::string_view section, std::string_view key, std::string_view default_value) const {
    return impl_->get<std::string>(section, key, std::string(default_value));
}

void Config::set_int(std::string_view section, std::string_view key, int value) {
    impl_->set(section, key, value);
}

void Config::set_double(std::string_view section, std::string_view key, double value) {
    impl_->set(section, key, value);
}

void Config::set_bool(std::string_view section, std::string_view key, bool value) {
    impl_->set(section, key, value);
}

void Config::set_string(std::string_view section, std::string_view key, std::string_view value) {
    impl_->set(section, key, std::string(value));
}

bool Config::has(std::string_view section, std::string_view key) const {
    return impl_->find(section, key) != nullptr;
}

bool Config::has_section(std::string_view section) const {
    return impl_->data.contains(std::string(section));
}

void Config::set_change_callback(ChangeCallback callback) {
    impl_->change_callback = std::move(callback);
}

bool Config::is_dirty() const {
    return impl_->dirty;
}

void Config::mark_clean() {
    impl_->dirty = false;
}

void Config::set_defaults() {
    impl_->data = json{{config_section::COLLAPSE,
                        {{config_key::DROP_DRAG_MIN, 0.25},
                         {config_key::DROP_DRAG_MAX, 1.0},
                         {config_key::MIN_SUPPORT, 1},
                         {config_key::BIG_COLLAPSE_THRESHOLD, 6},
                         {config_key::HIT_ACK_DELAY, 0.25},
                         {config_key::RNG_SEED, 0}}},
                       {config_section::DEBUG, {{config_key::LOG_LEVEL, "info"}}}};
    impl_->dirty = true;
}

}  // namespace crumble::core
