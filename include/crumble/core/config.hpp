// Crumble Engine Core
// config.hpp - JSON-backed configuration store

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace crumble::core {

// Section/key store persisted as a JSON document
class Config {
public:
    Config();
    ~Config();

    // Non-copyable but movable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) noexcept;
    Config& operator=(Config&&) noexcept;

    bool load(const std::filesystem::path& path);
    bool load_from_string(std::string_view json_text);
    bool save(const std::filesystem::path& path) const;
    bool save() const;
    bool load_or_create_default(const std::filesystem::path& path);

    [[nodiscard]] std::filesystem::path get_path() const;

    // Typed getters fall back to the default on a missing key or a type mismatch
    [[nodiscard]] int get_int(std::string_view section, std::string_view key, int default_value = 0) const;
    [[nodiscard]] double get_double(std::string_view section, std::string_view key,
                                    double default_value = 0.0) const;
    [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool default_value = false) const;
    [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                         std::string_view default_value = "") const;

    void set_int(std::string_view section, std::string_view key, int value);
    void set_double(std::string_view section, std::string_view key, double value);
    void set_bool(std::string_view section, std::string_view key, bool value);
    void set_string(std::string_view section, std::string_view key, std::string_view value);

    [[nodiscard]] bool has(std::string_view section, std::string_view key) const;
    [[nodiscard]] bool has_section(std::string_view section) const;

    using ChangeCallback = std::function<void(std::string_view section, std::string_view key)>;
    void set_change_callback(ChangeCallback callback);

    [[nodiscard]] bool is_dirty() const;
    void mark_clean();

    void set_defaults();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

namespace config_section {
    inline constexpr const char* COLLAPSE = "collapse";
    inline constexpr const char* DEBUG = "debug";
}  // namespace config_section

namespace config_key {
    // Collapse section
    inline constexpr const char* DROP_DRAG_MIN = "drop_drag_min";
    inline constexpr const char* DROP_DRAG_MAX = "drop_drag_max";
    inline constexpr const char* MIN_SUPPORT = "min_support";
    inline constexpr const char* BIG_COLLAPSE_THRESHOLD = "big_collapse_threshold";
    inline constexpr const char* HIT_ACK_DELAY = "hit_ack_delay";
    inline constexpr const char* RNG_SEED = "rng_seed";

    // Debug section
    inline constexpr const char* LOG_LEVEL = "log_level";
}  // namespace config_key

}  // namespace crumble::core
