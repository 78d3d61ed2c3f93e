#if !defined HOME_ASSISTANT_NOTIFIER_HPP
#define HOME_ASSISTANT_NOTIFIER_HPP

#include <chrono>
#include <string>

#include <curl/curl.h>

#include "PresenceNotifier.hpp"

class DhcpLeaseFile;
class Log;

// Reports presence through Home Assistant's device_tracker.see service.  That service can only
// say "seen now, consider home for N seconds"; an away is sent as a sighting with a short
// consider_home, which Home Assistant turns into not_home once it runs out.
class HomeAssistantNotifier : public PresenceNotifier
{
public:

    // host is the base URL of the Home Assistant instance, e.g. "http://hass.lan:8123"
    HomeAssistantNotifier(const std::string&          host,
                          const std::string&          token,
                          const std::chrono::seconds& home_ttl,
                          const std::chrono::seconds& away_ttl,
                          const std::chrono::seconds& timeout,
                          const std::string&          device_id_prefix,
                          const std::string&          dhcp_domain,
                          const DhcpLeaseFile&        lease_file,
                          Log&                        log);

    virtual ~HomeAssistantNotifier();

    virtual void notify(const std::string& device_id, bool home);

    // JSON body of the device_tracker.see call for this device
    void buildRequestBody(const std::string& device_id, bool home, std::string& body) const;

    // The entity name Home Assistant will know the device by
    std::string getTrackerId(const std::string& device_id, const std::string& hostname) const;

    const std::string& getServiceUrl() const;

private:

    static size_t discardResponse(char* data, size_t size, size_t count, void* user_data);

    std::string service_url;

    std::string authorization_header;

    std::chrono::seconds home_ttl;
    std::chrono::seconds away_ttl;
    std::chrono::seconds timeout;

    std::string device_id_prefix;

    std::string dhcp_domain;

    const DhcpLeaseFile& lease_file;

    Log& log;

    // Reused between calls so keep-alive connections survive
    CURL* curl;

    HomeAssistantNotifier(const HomeAssistantNotifier&);
    HomeAssistantNotifier& operator=(const HomeAssistantNotifier&);
};

#endif
