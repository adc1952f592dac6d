#ifndef CLAMM_CONFIG_HPP
#define CLAMM_CONFIG_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace clamm {

// =============================================================================
// Manager Configuration
// =============================================================================

struct ManagerConfig {
    std::string log_level = "info";     // spdlog level name
    std::string log_pattern;            // empty = spdlog default
    uint32_t default_protocol_fee = 0;  // packed, applied to new pools
    bool require_settlement = true;     // unlock() throws on outstanding deltas

    // Load from JSON file
    static ManagerConfig from_file(std::string_view path);

    // Load from JSON string; unknown keys are ignored
    static ManagerConfig from_json(std::string_view content);

    std::string to_json() const;

    ManagerConfig& with_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }

    ManagerConfig& with_protocol_fee(uint32_t fee) {
        default_protocol_fee = fee;
        return *this;
    }

    ManagerConfig& allow_unsettled() {
        require_settlement = false;
        return *this;
    }
};

// Applies level and pattern to the default spdlog logger
void init_logging(const ManagerConfig& config);

} // namespace clamm

#endif // CLAMM_CONFIG_HPP
