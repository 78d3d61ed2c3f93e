#include <cctype>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "EventSourceAdapter.hpp"

#include "Log.hpp"
#include "MacAddress.hpp"
#include "MembershipEvent.hpp"

//=============================================================================================
EventSourceAdapter::EventSourceAdapter(const std::vector<std::string>& networks,
                                       const std::vector<std::string>& allowed_devices,
                                       Log&                            log) :
    networks(networks.begin(), networks.end()),
    log(log)
{
    for (std::vector<std::string>::const_iterator iter = allowed_devices.begin();
         iter != allowed_devices.end();
         ++iter)
    {
        MacAddress mac_address;
        std::string device_id;
        if (!parseMacAddress(*iter, mac_address, device_id))
        {
            throw std::runtime_error("Invalid MAC address in allow-list: " + *iter);
        }

        this->allowed_devices.push_back(mac_address);
    }
}

//=============================================================================================
EventSourceAdapter::~EventSourceAdapter()
{
}

//=============================================================================================
// Frames of interest look like "<3>AP-STA-CONNECTED 02:11:22:33:44:55", possibly followed by
// more space-separated fields
//=============================================================================================
bool EventSourceAdapter::normalize(const std::string&                           network_id,
                                   const std::string&                           frame,
                                   const std::chrono::steady_clock::time_point& timestamp,
                                   MembershipEvent&                             event) const
{
    if (!isMonitored(network_id))
    {
        return false;
    }

    std::string message = stripFrame(frame);

    std::istringstream message_stream(message);
    std::string event_name;
    std::string address;
    message_stream >> event_name >> address;

    MembershipEvent::Kind kind;
    if (event_name == "AP-STA-CONNECTED")
    {
        kind = MembershipEvent::JOINED;
    }
    else if (event_name == "AP-STA-DISCONNECTED")
    {
        kind = MembershipEvent::LEFT;
    }
    else
    {
        // hostapd reports plenty of other things (EAP, WPS, DFS...) we have no use for
        return false;
    }

    MacAddress mac_address;
    std::string device_id;
    if (!parseMacAddress(address, mac_address, device_id))
    {
        log.write("ERROR - Dropping unparseable frame from " + network_id + ": " + message);
        return false;
    }

    if (!isAllowed(mac_address))
    {
        return false;
    }

    event.device_id  = device_id;
    event.network_id = network_id;
    event.kind       = kind;
    event.timestamp  = timestamp;

    return true;
}

//=============================================================================================
bool EventSourceAdapter::isMonitored(const std::string& network_id) const
{
    return networks.find(network_id) != networks.end();
}

//=============================================================================================
bool EventSourceAdapter::isAllowed(const MacAddress& mac_address) const
{
    if (allowed_devices.empty())
    {
        return true;
    }

    for (std::vector<MacAddress>::const_iterator iter = allowed_devices.begin();
         iter != allowed_devices.end();
         ++iter)
    {
        if (*iter == mac_address)
        {
            return true;
        }
    }

    return false;
}

//=============================================================================================
bool EventSourceAdapter::isTerminating(const std::string& frame)
{
    return stripFrame(frame).compare(0, 22, "CTRL-EVENT-TERMINATING") == 0;
}

//=============================================================================================
bool EventSourceAdapter::parseMacAddress(const std::string& text,
                                         MacAddress&        mac_address,
                                         std::string&       device_id)
{
    std::string normalized;
    if (!normalizeMacAddress(text, normalized))
    {
        return false;
    }

    mac_address = normalized;
    device_id   = normalized;

    return true;
}

//=============================================================================================
// Accepts six hex octets separated by ':' or '-'
//=============================================================================================
bool EventSourceAdapter::normalizeMacAddress(const std::string& text, std::string& device_id)
{
    if (text.length() != 17)
    {
        return false;
    }

    std::string normalized(17, ':');
    for (unsigned int i = 0; i < text.length(); i++)
    {
        const unsigned char c = static_cast<unsigned char>(text[i]);

        if (i % 3 == 2)
        {
            if (c != ':' && c != '-')
            {
                return false;
            }
        }
        else if (std::isxdigit(c))
        {
            normalized[i] = static_cast<char>(std::tolower(c));
        }
        else
        {
            return false;
        }
    }

    device_id = normalized;
    return true;
}

//=============================================================================================
std::string EventSourceAdapter::stripFrame(const std::string& frame)
{
    std::string message = frame;

    // Datagrams may carry a trailing newline or NUL depending on the hostapd version
    while (!message.empty() &&
           (message[message.length() - 1] == '\n' ||
            message[message.length() - 1] == '\r' ||
            message[message.length() - 1] == '\0' ||
            message[message.length() - 1] == ' '))
    {
        message.erase(message.length() - 1);
    }

    if (!message.empty() && message[0] == '<')
    {
        std::string::size_type end_of_priority = message.find('>');
        if (end_of_priority != std::string::npos)
        {
            message.erase(0, end_of_priority + 1);
        }
    }

    return message;
}
