#include <fstream>
#include <sstream>
#include <string>

#include "DhcpLeaseFile.hpp"

#include "EventSourceAdapter.hpp"
#include "MacAddress.hpp"

//=============================================================================================
DhcpLeaseFile::DhcpLeaseFile(const std::string& filename) :
    filename(filename)
{
}

//=============================================================================================
DhcpLeaseFile::~DhcpLeaseFile()
{
}

//=============================================================================================
// Lease lines are "<expiry> <mac> <ip> <hostname> <client id>"
//=============================================================================================
bool DhcpLeaseFile::lookup(const std::string& device_id,
                           std::string&       ip_address,
                           std::string&       hostname) const
{
    MacAddress wanted_address;
    std::string wanted_device_id;
    if (!EventSourceAdapter::parseMacAddress(device_id, wanted_address, wanted_device_id))
    {
        return false;
    }

    std::ifstream lease_stream(filename.c_str());
    if (lease_stream.fail())
    {
        // No DHCP server on this box, or it hasn't handed anything out yet
        return false;
    }

    std::string lease_line;
    while (std::getline(lease_stream, lease_line))
    {
        std::istringstream lease_fields(lease_line);

        std::string expiry;
        std::string mac_address;
        std::string lease_ip;
        std::string lease_hostname;
        lease_fields >> expiry >> mac_address >> lease_ip >> lease_hostname;

        MacAddress lease_address;
        std::string lease_device_id;
        if (!EventSourceAdapter::parseMacAddress(mac_address, lease_address, lease_device_id) ||
            !(lease_address == wanted_address))
        {
            continue;
        }

        ip_address = lease_ip;

        // dnsmasq writes '*' when the client didn't send a hostname
        hostname = lease_hostname == "*" ? "" : lease_hostname;

        return true;
    }

    return false;
}

//=============================================================================================
const std::string& DhcpLeaseFile::getFilename() const
{
    return filename;
}
