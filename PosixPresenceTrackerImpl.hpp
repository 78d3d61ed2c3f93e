#if !defined POSIX_PRESENCE_TRACKER_IMPL_HPP
#define POSIX_PRESENCE_TRACKER_IMPL_HPP

#include <chrono>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "PresenceTrackerImpl.hpp"

#include "BootstrapReconciler.hpp"
#include "Configuration.hpp"
#include "DhcpLeaseFile.hpp"
#include "EventSourceAdapter.hpp"
#include "HomeAssistantNotifier.hpp"
#include "HostapdControlSocket.hpp"
#include "HostapdStationSource.hpp"
#include "Log.hpp"
#include "PresenceEngine.hpp"

class PosixPresenceTrackerImpl : public PresenceTrackerImpl
{
public:

    PosixPresenceTrackerImpl(int argc, char** argv);

    virtual ~PosixPresenceTrackerImpl();

    virtual int run();

protected:

    // Delivered signals handled here
    virtual void processDeliveredSignals();

private:

    // One pass of the monitor loop: waits for a frame or the next debounce deadline, whichever
    // comes first, and handles whatever woke it
    void step();

    // Reports the stations connected right now and returns the exit status
    int runOneShot();

    // Connects to and attaches to hostapd on every monitored interface
    void openMonitorSockets();

    // Called on every frame read off of a monitor socket.  Returns false if hostapd went away.
    bool handleFrame(const std::string&                           interface_name,
                     const char*                                  frame_data,
                     unsigned int                                 bytes_read,
                     const std::chrono::steady_clock::time_point& now);

    // Interprets program arguments and applies corresponding state
    bool processArguments();

    // Opens the log file; used after log rotation and during startup
    void openLog();

    // Closes the log file; used before log rotation and on shutdown
    void closeLog();

    // Frees resources and makes the monitor loop stop at the end of the current pass
    void shutdown();

    // Ends the monitor loop with a failure status
    void fail(const std::string& reason);

    static void writePidToFile(const std::string& pid_filename);

    // Filename of the config file, typically located in /etc/hapt
    std::string config_filename;

    // Settings given on the command line; these win over the config file
    std::string interfaces_argument;
    std::string log_filename_argument;
    std::string pid_filename_argument;
    bool daemonize_argument;

    Configuration configuration;

    // Whether to keep running on live events or just report who's connected and exit
    bool monitor;

    // Used to log important tracker activities
    Log log;

    // Log messages go out on this stream in monitor mode
    std::ofstream log_stream;

    std::unique_ptr<EventSourceAdapter>    adapter;
    std::unique_ptr<DhcpLeaseFile>         lease_file;
    std::unique_ptr<HomeAssistantNotifier> notifier;
    std::unique_ptr<PresenceEngine>        engine;
    std::unique_ptr<HostapdStationSource>  station_source;
    std::unique_ptr<BootstrapReconciler>   reconciler;

    // One attached socket per monitored interface
    std::vector<std::unique_ptr<HostapdControlSocket> > monitor_sockets;

    // Frames are read into this buffer
    char frame_buffer[HostapdControlSocket::MESSAGE_LENGTH];

    bool terminate;

    bool shut_down;

    int exit_status;
};

#endif
