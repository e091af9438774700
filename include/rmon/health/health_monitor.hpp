#pragma once
/**
 * @file health_monitor.hpp
 * @brief WAN link reachability: device-side probes per target, one polling loop per link,
 *        verdict aggregation and transition events.
 *
 * Per link: UNCONFIGURED (verdict UNKNOWN) <-> MONITORING (HEALTHY | DEGRADED | DOWN).
 *
 * Locks (never nested in the reverse order):
 *  - config_mu_ : serializes configure/shutdown; may be held across device calls and joins.
 *  - links_mu_  : membership of the running-loop map only.
 *  - status_mu_ : verdicts; shared for reads, so status queries never wait on a
 *                 reconfiguration.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "rmon/compat/expected.hpp"
#include "rmon/config/constants.hpp"
#include "rmon/core/device_probe.hpp"
#include "rmon/core/resource_key.hpp"
#include "rmon/core/setup_error.hpp"
#include "rmon/events/async_publisher.hpp"
#include "rmon/obs/observability.hpp"

namespace rmon::health {

/** @enum HealthVerdict
 *  @brief Aggregated reachability of one link.
 */
enum class HealthVerdict : uint8_t { Unknown, Healthy, Degraded, Down };

/** @struct HealthLinkConfig
 *  @brief Desired probe set of one link. Replacing it reconfigures or tears the link down.
 */
struct HealthLinkConfig {
    bool                     enabled{false};
    std::vector<std::string> targets; ///< Hosts watched from the device
    uint32_t interval_sec{rmon::config::constants::HEALTH_DEFAULT_INTERVAL_SEC};
    uint32_t timeout_sec{rmon::config::constants::HEALTH_DEFAULT_TIMEOUT_SEC};
    /// Device-side up/down latch of each probe; not applied by the aggregator.
    uint32_t failure_threshold{rmon::config::constants::HEALTH_DEFAULT_FAILURE_THRESHOLD};
};

/** @struct LinkStatus
 *  @brief Current verdict plus the counts it was computed from.
 */
struct LinkStatus {
    HealthVerdict verdict{HealthVerdict::Unknown};
    uint32_t      reachable{0};
    uint32_t      total{0};
    bool          monitoring{false};
    std::optional<std::chrono::system_clock::time_point> last_check;
};

enum class HealthError : uint8_t {
    InvalidKey = 1,      ///< Not "routerID:wanID", or the link is not monitored
    MissingTargets,      ///< Enabled without targets (link was torn down)
    InvalidConfig,       ///< Zero interval, timeout or threshold
    DeviceCommandFailed, ///< Listing, removing or adding device probes failed
    Cancelled,           ///< Caller scope ended during the operation
    Stopped              ///< shutdown() was called
};

/// Ordered rule: 0 total -> UNKNOWN, all up -> HEALTHY, none up -> DOWN, else DEGRADED.
HealthVerdict aggregate_health(uint32_t reachable, uint32_t total) noexcept;

const char* to_string(HealthVerdict v) noexcept;
const char* to_string(HealthError e) noexcept;

/// Comment identifying the device-side probes owned by @p link_key.
std::string probe_tag(const std::string& link_key);

struct HealthMonitorOptions {
    std::chrono::milliseconds command_timeout{rmon::config::constants::HEALTH_COMMAND_TIMEOUT_MS};
};

/** @class HealthMonitor
 *  @brief Owns every monitored link's loop and verdict.
 */
class HealthMonitor final {
public:
    static rmon_detail::expected<std::unique_ptr<HealthMonitor>, core::SetupError>
    create(std::shared_ptr<core::DeviceProbe> probe,
           std::shared_ptr<events::AsyncEventPublisher> publisher,
           std::shared_ptr<rmon::obs::Observer> observer = nullptr,
           HealthMonitorOptions opts = {});

    HealthMonitor(const HealthMonitor&)            = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;
    ~HealthMonitor();

    /**
     * @brief Apply @p cfg to @p link_key.
     * @details Enabled with targets: stop the current loop, remove every probe tagged for
     *          the link, add one probe per target, start a fresh loop (first check after
     *          one interval). Otherwise: stop the loop, remove tagged probes best effort,
     *          set UNKNOWN.
     * @param scope Cancels the device commands issued by this call.
     */
    rmon_detail::expected<void, HealthError>
    configure_health_check(const std::string& link_key, const HealthLinkConfig& cfg,
                           std::stop_token scope = {});

    /// UNKNOWN for links never configured.
    HealthVerdict get_health_status(const std::string& link_key) const;
    LinkStatus    link_status(const std::string& link_key) const;

    /// Keys with a running loop, sorted.
    std::vector<std::string> monitored_links() const;

    /// Run one check of a monitored link immediately.
    rmon_detail::expected<HealthVerdict, HealthError>
    check_now(const std::string& link_key, std::stop_token scope = {});

    /// Stop every link loop and wait for it. Idempotent.
    void shutdown();

private:
    struct Link {
        std::string       key;
        core::ResourceKey id;
        HealthLinkConfig  cfg;
        std::mutex        check_mu; ///< Orders checks of this link
        bool              active{true};
        std::jthread      worker;
    };

    HealthMonitor(std::shared_ptr<core::DeviceProbe> probe,
                  std::shared_ptr<events::AsyncEventPublisher> publisher,
                  std::shared_ptr<rmon::obs::Observer> observer, HealthMonitorOptions opts);

    void run(Link& l, std::stop_token st);
    rmon_detail::expected<HealthVerdict, HealthError> check(Link& l, std::stop_token st);

    /// Stop and join the loop of @p key, if any. Requires config_mu_.
    void retire_link(const std::string& key);

    rmon_detail::expected<void, HealthError>
    remove_probes(const core::ResourceKey& id, const std::string& key, std::stop_token st);
    rmon_detail::expected<void, HealthError>
    add_probes(const core::ResourceKey& id, const std::string& key, const HealthLinkConfig& cfg,
               std::stop_token st);

    /// Store @p next; publish wan.health.changed if the verdict changed.
    void apply(const std::string& key, const core::ResourceKey& id, LinkStatus next);

    std::shared_ptr<core::DeviceProbe>           probe_;
    std::shared_ptr<events::AsyncEventPublisher> publisher_;
    std::shared_ptr<rmon::obs::Observer>         obs_;
    const HealthMonitorOptions                   opts_;

    std::mutex config_mu_;
    bool       stopped_{false}; ///< Guarded by config_mu_

    mutable std::mutex                                     links_mu_;
    std::unordered_map<std::string, std::shared_ptr<Link>> links_;

    mutable std::shared_mutex                   status_mu_;
    std::unordered_map<std::string, LinkStatus> status_;
};

/// JSON body of the wan.health.changed event.
nlohmann::json transition_payload(const std::string& link_key, const core::ResourceKey& id,
                                  HealthVerdict previous, const LinkStatus& current);

} // namespace rmon::health
