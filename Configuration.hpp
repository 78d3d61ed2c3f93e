#if !defined CONFIGURATION_HPP
#define CONFIGURATION_HPP

#include <istream>
#include <string>
#include <vector>

// Settings read from the hapt config file.  The file holds KEY=VALUE lines; lines starting with
// '#' are comments and unknown keys are ignored.
struct Configuration
{
    Configuration();

    // Reads settings from the named file over the current values
    bool readFile(const std::string& filename, std::string& error);

    // Reads settings from a stream over the current values; false if a value can't be parsed
    bool read(std::istream& stream, std::string& error);

    // Checks that everything needed to run is present and sane
    bool validate(std::string& error) const;

    // Splits a list value on spaces and commas
    static void splitList(const std::string& value, std::vector<std::string>& items);

    // Interfaces to monitor; when empty, everything in hostapd_control_directory is monitored
    std::vector<std::string> interfaces;

    // Where hostapd keeps its per-interface control sockets
    std::string hostapd_control_directory;

    // MAC addresses to track; when empty, every station is tracked
    std::vector<std::string> allowed_devices;

    // Seconds a device must stay connected before it's reported home
    long consider_home_connect;

    // Seconds a device must stay disconnected before it's reported away
    long consider_home_disconnect;

    // Base URL and long-lived access token of the Home Assistant instance
    std::string ha_host;
    std::string ha_token;

    // consider_home sent to Home Assistant with arrivals and departures
    long ha_home_ttl;
    long ha_away_ttl;

    // Upper bound in seconds on each Home Assistant call
    long http_timeout;

    // Prepended to device tracker ids, separated by '_'
    std::string device_id_prefix;

    // dnsmasq lease file used to name devices, and the local DNS domain
    std::string lease_filename;
    std::string dhcp_domain;

    std::string log_filename;
    std::string pid_filename;

    // Whether or not the monitor should daemonize itself
    bool daemonize;
};

#endif
