#include <fstream>
#include <istream>
#include <sstream>
#include <string>
#include <vector>

#include "Configuration.hpp"

#include "DebounceScheduler.hpp"
#include "EventSourceAdapter.hpp"
#include "MacAddress.hpp"

//=============================================================================================
// Converts a config value to a number, rejecting trailing garbage
//=============================================================================================
static bool parseNumber(const std::string& value, long& number)
{
    std::istringstream convert_to_number(value);
    convert_to_number >> number;

    if (convert_to_number.fail())
    {
        return false;
    }

    convert_to_number >> std::ws;
    return convert_to_number.eof();
}

//=============================================================================================
Configuration::Configuration() :
    hostapd_control_directory("/var/run/hostapd"),
    consider_home_connect(5),
    consider_home_disconnect(0),
    ha_home_ttl(86400),
    ha_away_ttl(180),
    http_timeout(10),
    lease_filename("/tmp/dhcp.leases"),
    log_filename("/var/log/hapt.log"),
    pid_filename("/var/run/hapt.pid"),
    daemonize(false)
{
}

//=============================================================================================
bool Configuration::readFile(const std::string& filename, std::string& error)
{
    std::ifstream config_stream(filename.c_str());
    if (config_stream.fail())
    {
        error = "cannot open " + filename;
        return false;
    }

    return read(config_stream, error);
}

//=============================================================================================
// Parses hapt config file contents
//=============================================================================================
bool Configuration::read(std::istream& stream, std::string& error)
{
    std::string config_line;
    unsigned int line_number = 0;

    while (std::getline(stream, config_line))
    {
        line_number++;

        // Tolerate files edited on Windows
        if (!config_line.empty() && config_line[config_line.length() - 1] == '\r')
        {
            config_line.erase(config_line.length() - 1);
        }

        // Ignore the line if it's blank or a comment
        if (config_line.empty() || config_line[0] == '#')
        {
            continue;
        }

        // If there isn't an equal sign, or it's at the beginning of the line, this line is bad;
        // skip it
        size_t equal_sign = config_line.find('=');
        if (equal_sign == std::string::npos || equal_sign == 0)
        {
            continue;
        }

        std::string left_side  = config_line.substr(0, equal_sign);
        std::string right_side = config_line.substr(equal_sign + 1, std::string::npos);

        // Numeric settings are checked here so the line number can be reported
        long* number = 0;

        if (left_side == "INTERFACES")
        {
            splitList(right_side, interfaces);
        }
        else if (left_side == "HOSTAPD_CTRL_DIR")
        {
            hostapd_control_directory = right_side;
        }
        else if (left_side == "ALLOWED_MACS")
        {
            splitList(right_side, allowed_devices);
        }
        else if (left_side == "CONSIDER_HOME_CONNECT")
        {
            number = &consider_home_connect;
        }
        else if (left_side == "CONSIDER_HOME_DISCONNECT")
        {
            number = &consider_home_disconnect;
        }
        else if (left_side == "HA_HOST")
        {
            ha_host = right_side;
        }
        else if (left_side == "HA_TOKEN")
        {
            ha_token = right_side;
        }
        else if (left_side == "HA_HOME_TTL")
        {
            number = &ha_home_ttl;
        }
        else if (left_side == "HA_AWAY_TTL")
        {
            number = &ha_away_ttl;
        }
        else if (left_side == "HTTP_TIMEOUT")
        {
            number = &http_timeout;
        }
        else if (left_side == "DEVICE_ID_PREFIX")
        {
            device_id_prefix = right_side;
        }
        else if (left_side == "LEASE_FILE")
        {
            lease_filename = right_side;
        }
        else if (left_side == "DHCP_DOMAIN")
        {
            dhcp_domain = right_side;
        }
        else if (left_side == "LOG_FILE")
        {
            log_filename = right_side;
        }
        else if (left_side == "PID_FILE")
        {
            pid_filename = right_side;
        }
        else if (left_side == "DAEMONIZE")
        {
            daemonize = right_side == "yes";
        }

        if (number && !parseNumber(right_side, *number))
        {
            std::ostringstream error_stream;
            error_stream << "line " << line_number << ": " << left_side
                         << " is not a number: " << right_side;
            error = error_stream.str();
            return false;
        }
    }

    return true;
}

//=============================================================================================
bool Configuration::validate(std::string& error) const
{
    if (ha_host.empty())
    {
        error = "HA_HOST is not set";
        return false;
    }

    if (ha_token.empty())
    {
        error = "HA_TOKEN is not set";
        return false;
    }

    if (consider_home_connect < 0 || consider_home_disconnect < 0)
    {
        error = "CONSIDER_HOME_CONNECT and CONSIDER_HOME_DISCONNECT must not be negative";
        return false;
    }

    const long long maximum_delay = DebounceScheduler::getMaximumDelay().count();
    if (consider_home_connect > maximum_delay || consider_home_disconnect > maximum_delay)
    {
        std::ostringstream error_stream;
        error_stream << "CONSIDER_HOME_CONNECT and CONSIDER_HOME_DISCONNECT must not be longer "
                     << "than " << maximum_delay << " seconds";
        error = error_stream.str();
        return false;
    }

    if (ha_home_ttl < 0 || ha_away_ttl < 0)
    {
        error = "HA_HOME_TTL and HA_AWAY_TTL must not be negative";
        return false;
    }

    if (http_timeout <= 0)
    {
        error = "HTTP_TIMEOUT must be positive";
        return false;
    }

    for (std::vector<std::string>::const_iterator iter = allowed_devices.begin();
         iter != allowed_devices.end();
         ++iter)
    {
        MacAddress mac_address;
        std::string device_id;
        if (!EventSourceAdapter::parseMacAddress(*iter, mac_address, device_id))
        {
            error = "ALLOWED_MACS contains an invalid MAC address: " + *iter;
            return false;
        }
    }

    return true;
}

//=============================================================================================
void Configuration::splitList(const std::string& value, std::vector<std::string>& items)
{
    items.clear();

    std::string separated = value;
    for (std::string::iterator iter = separated.begin(); iter != separated.end(); ++iter)
    {
        if (*iter == ',')
        {
            *iter = ' ';
        }
    }

    std::istringstream item_stream(separated);
    std::string item;
    while (item_stream >> item)
    {
        items.push_back(item);
    }
}
