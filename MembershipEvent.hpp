#if !defined MEMBERSHIP_EVENT_HPP
#define MEMBERSHIP_EVENT_HPP

#include <chrono>
#include <string>

// A station associating with or leaving one monitored interface, normalized from a raw hostapd
// control socket frame
struct MembershipEvent
{
    enum Kind
    {
        JOINED,
        LEFT
    };

    // Lower-case, colon-separated MAC address of the station
    std::string device_id;

    // Name of the interface the station joined or left
    std::string network_id;

    Kind kind;

    // When the frame carrying this event was read
    std::chrono::steady_clock::time_point timestamp;
};

#endif
