#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <dirent.h>
#include <poll.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#include <vector>

#include "HostapdControlSocket.hpp"

unsigned int HostapdControlSocket::socket_count = 0;

//=============================================================================================
HostapdControlSocket::HostapdControlSocket(const std::string& control_directory,
                                           const std::string& interface_name) :
    socket_fd(-1),
    interface_name(interface_name),
    request_timeout(2000)
{
    std::string remote_path = control_directory + "/" + interface_name;

    std::ostringstream local_path_stream;
    local_path_stream << "/var/run/hapt-" << interface_name << "-" << getpid() << "-"
                      << socket_count++;
    local_path = local_path_stream.str();

    sockaddr_un local_address;
    sockaddr_un remote_address;
    std::memset(&local_address,  0, sizeof(local_address));
    std::memset(&remote_address, 0, sizeof(remote_address));

    if (local_path.length()  >= sizeof(local_address.sun_path) ||
        remote_path.length() >= sizeof(remote_address.sun_path))
    {
        throw std::runtime_error("Control socket path too long for " + interface_name);
    }

    local_address.sun_family  = AF_UNIX;
    remote_address.sun_family = AF_UNIX;
    std::strncpy(local_address.sun_path,  local_path.c_str(),  sizeof(local_address.sun_path) - 1);
    std::strncpy(remote_address.sun_path, remote_path.c_str(), sizeof(remote_address.sun_path) - 1);

    socket_fd = socket(AF_UNIX, SOCK_DGRAM, 0);
    if (socket_fd < 0)
    {
        throw std::runtime_error("Cannot create control socket for " + interface_name + ": " +
                                 std::strerror(errno));
    }

    // A stale socket file may be left over from a previous process with the same PID
    unlink(local_path.c_str());

    if (bind(socket_fd, reinterpret_cast<sockaddr*>(&local_address), sizeof(local_address)) != 0)
    {
        std::string error = std::strerror(errno);
        close();
        throw std::runtime_error("Cannot bind " + local_path + ": " + error);
    }

    if (connect(socket_fd,
                reinterpret_cast<sockaddr*>(&remote_address),
                sizeof(remote_address)) != 0)
    {
        std::string error = std::strerror(errno);
        close();
        throw std::runtime_error("Cannot connect to hostapd at " + remote_path + ": " + error);
    }
}

//=============================================================================================
HostapdControlSocket::~HostapdControlSocket()
{
    close();
}

//=============================================================================================
void HostapdControlSocket::attach()
{
    std::string response;
    if (!request("ATTACH", response))
    {
        throw std::runtime_error("No response from hostapd on " + interface_name +
                                 " to ATTACH");
    }

    if (response != "OK\n")
    {
        throw std::runtime_error("Received invalid response on ATTACH from hostapd on " +
                                 interface_name + ": " + response);
    }
}

//=============================================================================================
bool HostapdControlSocket::request(const std::string& command, std::string& response)
{
    if (send(socket_fd, command.c_str(), command.length(), 0) < 0)
    {
        return false;
    }

    std::chrono::steady_clock::time_point deadline =
        std::chrono::steady_clock::now() + request_timeout;

    char buffer[MESSAGE_LENGTH];

    while (true)
    {
        std::chrono::milliseconds remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
        {
            return false;
        }

        pollfd poll_fd;
        poll_fd.fd      = socket_fd;
        poll_fd.events  = POLLIN;
        poll_fd.revents = 0;

        int ready = poll(&poll_fd, 1, static_cast<int>(remaining.count()));
        if (ready < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        else if (ready == 0)
        {
            return false;
        }

        int bytes_read = read(buffer, MESSAGE_LENGTH);
        if (bytes_read < 0)
        {
            return false;
        }
        else if (bytes_read == 0)
        {
            continue;
        }

        // Unsolicited event messages start with a priority like "<3>"; they aren't the reply
        if (buffer[0] == '<')
        {
            continue;
        }

        response.assign(buffer, bytes_read);
        return true;
    }
}

//=============================================================================================
int HostapdControlSocket::read(char* buffer, unsigned int length)
{
    ssize_t bytes_read = recv(socket_fd, buffer, length, MSG_DONTWAIT);

    if (bytes_read < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
        {
            return 0;
        }

        return -1;
    }

    return static_cast<int>(bytes_read);
}

//=============================================================================================
int HostapdControlSocket::getFileDescriptor() const
{
    return socket_fd;
}

//=============================================================================================
const std::string& HostapdControlSocket::getInterfaceName() const
{
    return interface_name;
}

//=============================================================================================
void HostapdControlSocket::setRequestTimeout(const std::chrono::milliseconds& timeout)
{
    request_timeout = timeout;
}

//=============================================================================================
// Every socket file in the control directory is an interface hostapd serves
//=============================================================================================
void HostapdControlSocket::discoverInterfaces(const std::string&        control_directory,
                                              std::vector<std::string>& interfaces)
{
    interfaces.clear();

    DIR* directory = opendir(control_directory.c_str());
    if (!directory)
    {
        return;
    }

    dirent* entry = 0;
    while ((entry = readdir(directory)) != 0)
    {
        std::string name = entry->d_name;
        if (name.empty() || name[0] == '.')
        {
            continue;
        }

        struct stat entry_stat;
        std::string path = control_directory + "/" + name;
        if (stat(path.c_str(), &entry_stat) == 0 && S_ISSOCK(entry_stat.st_mode))
        {
            interfaces.push_back(name);
        }
    }

    closedir(directory);

    std::sort(interfaces.begin(), interfaces.end());
}

//=============================================================================================
void HostapdControlSocket::close()
{
    if (socket_fd >= 0)
    {
        ::close(socket_fd);
        socket_fd = -1;

        unlink(local_path.c_str());
    }
}
