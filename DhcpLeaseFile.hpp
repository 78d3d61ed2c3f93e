#if !defined DHCP_LEASE_FILE_HPP
#define DHCP_LEASE_FILE_HPP

#include <string>

// Looks up devices in a dnsmasq lease file.  The file is re-read on every lookup since dnsmasq
// rewrites it as leases come and go.
class DhcpLeaseFile
{
public:

    explicit DhcpLeaseFile(const std::string& filename);

    ~DhcpLeaseFile();

    // Finds the lease held by device_id.  Returns false if the file can't be read or has no
    // lease for the device.  hostname is left empty if dnsmasq doesn't know one.
    bool lookup(const std::string& device_id,
                std::string&       ip_address,
                std::string&       hostname) const;

    const std::string& getFilename() const;

private:

    std::string filename;
};

#endif
