#if !defined HOSTAPD_CONTROL_SOCKET_HPP
#define HOSTAPD_CONTROL_SOCKET_HPP

#include <chrono>
#include <string>
#include <vector>

// Client end of a hostapd control interface, the AF_UNIX datagram socket hostapd creates for
// each interface it serves.  Used either to issue commands or, once attached, to receive
// unsolicited event messages.
class HostapdControlSocket
{
public:

    // Connects to <control_directory>/<interface_name>; throws std::runtime_error on failure
    HostapdControlSocket(const std::string& control_directory,
                         const std::string& interface_name);

    ~HostapdControlSocket();

    // Registers for event messages; throws std::runtime_error if hostapd doesn't agree
    void attach();

    // Sends a command and waits for its reply.  Event messages arriving in the meantime are
    // skipped.  Returns false on error or timeout.
    bool request(const std::string& command, std::string& response);

    // Reads one pending datagram without blocking.  Returns the number of bytes read, 0 if
    // nothing is pending or -1 if the socket failed.
    int read(char* buffer, unsigned int length);

    int getFileDescriptor() const;

    const std::string& getInterfaceName() const;

    void setRequestTimeout(const std::chrono::milliseconds& timeout);

    // Lists the interfaces hostapd has control sockets for in control_directory
    static void discoverInterfaces(const std::string&        control_directory,
                                   std::vector<std::string>& interfaces);

    static const unsigned int MESSAGE_LENGTH = 4096;

private:

    void close();

    int socket_fd;

    std::string interface_name;

    // Path this end is bound to; removed on close
    std::string local_path;

    std::chrono::milliseconds request_timeout;

    // Keeps local paths unique within this process
    static unsigned int socket_count;

    HostapdControlSocket(const HostapdControlSocket&);
    HostapdControlSocket& operator=(const HostapdControlSocket&);
};

#endif
