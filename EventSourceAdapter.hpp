#if !defined EVENT_SOURCE_ADAPTER_HPP
#define EVENT_SOURCE_ADAPTER_HPP

#include <chrono>
#include <set>
#include <string>
#include <vector>

#include "MacAddress.hpp"
#include "MembershipEvent.hpp"

class Log;

// Turns raw hostapd control socket frames into membership events, discarding frames for
// interfaces that aren't monitored and stations that aren't on the allow-list
class EventSourceAdapter
{
public:

    // An empty allowed_devices list means every station is tracked; throws std::runtime_error
    // if an allow-list entry isn't a MAC address
    EventSourceAdapter(const std::vector<std::string>& networks,
                       const std::vector<std::string>& allowed_devices,
                       Log&                            log);

    ~EventSourceAdapter();

    // Returns true and fills in event if the frame is a station join or leave that should be
    // tracked.  Malformed station frames are logged and dropped.
    bool normalize(const std::string&                           network_id,
                   const std::string&                           frame,
                   const std::chrono::steady_clock::time_point& timestamp,
                   MembershipEvent&                             event) const;

    bool isMonitored(const std::string& network_id) const;

    bool isAllowed(const MacAddress& mac_address) const;

    // Is this the message hostapd sends when it shuts down?
    static bool isTerminating(const std::string& frame);

    // Reads a MAC address written with ':' or '-' separators in either case.  device_id gets
    // the lower-case colon-separated form used to key devices.
    static bool parseMacAddress(const std::string& text,
                                MacAddress&        mac_address,
                                std::string&       device_id);

private:

    // Removes the "<N>" priority prefix and trailing line terminators
    static std::string stripFrame(const std::string& frame);

    // Checks the address syntax and folds it to the form MacAddress reads
    static bool normalizeMacAddress(const std::string& text, std::string& device_id);

    std::set<std::string> networks;

    std::vector<MacAddress> allowed_devices;

    Log& log;

    EventSourceAdapter(const EventSourceAdapter&);
    EventSourceAdapter& operator=(const EventSourceAdapter&);
};

#endif
