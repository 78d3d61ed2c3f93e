// Tracks wireless devices on the local access points and reports their comings and goings to
// Home Assistant.  By default it reports who is connected right now and exits; with --monitor
// it keeps listening to hostapd and reports every debounced arrival and departure.

#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

#include "PosixPresenceTrackerImpl.hpp"

#include "BootstrapReconciler.hpp"
#include "Configuration.hpp"
#include "DhcpLeaseFile.hpp"
#include "EventSourceAdapter.hpp"
#include "HomeAssistantNotifier.hpp"
#include "HostapdControlSocket.hpp"
#include "HostapdStationSource.hpp"
#include "Log.hpp"
#include "MembershipEvent.hpp"
#include "PresenceEngine.hpp"
#include "SignalManager.hpp"

//=============================================================================================
PosixPresenceTrackerImpl::PosixPresenceTrackerImpl(int argc, char** argv) :
    PresenceTrackerImpl(argc, argv),
    config_filename("/etc/hapt/config"),
    daemonize_argument(false),
    monitor(false),
    terminate(false),
    shut_down(false),
    exit_status(0)
{
    std::memset(frame_buffer, 0, HostapdControlSocket::MESSAGE_LENGTH);

    // Arguments come first since one of them may name a different config file
    if (!processArguments())
    {
        throw std::runtime_error("Cannot process arguments");
    }

    // Read configuration settings
    std::string error;
    if (!configuration.readFile(config_filename, error))
    {
        throw std::runtime_error("Cannot process configuration file: " + error);
    }

    if (!interfaces_argument.empty())
    {
        Configuration::splitList(interfaces_argument, configuration.interfaces);
    }
    if (!log_filename_argument.empty())
    {
        configuration.log_filename = log_filename_argument;
    }
    if (!pid_filename_argument.empty())
    {
        configuration.pid_filename = pid_filename_argument;
    }
    if (daemonize_argument)
    {
        configuration.daemonize = true;
    }

    if (!configuration.validate(error))
    {
        throw std::runtime_error("Invalid configuration: " + error);
    }

    // With no interfaces configured, watch everything hostapd serves
    if (configuration.interfaces.empty())
    {
        HostapdControlSocket::discoverInterfaces(configuration.hostapd_control_directory,
                                                 configuration.interfaces);

        if (configuration.interfaces.empty())
        {
            throw std::runtime_error("No interfaces configured and no hostapd control sockets "
                                     "found in " + configuration.hostapd_control_directory);
        }
    }

    // The one-shot mode is run by hand, so it talks to the terminal
    if (monitor)
    {
        if (configuration.daemonize && daemon(0, 0) != 0)
        {
            throw std::runtime_error(std::string("Cannot daemonize: ") + std::strerror(errno));
        }

        openLog();

        // Register signals to handle
        SignalManager* signal_manager = getSignalManager();
        signal_manager->registerSignal(SIGINT);
        signal_manager->registerSignal(SIGTERM);
        signal_manager->registerSignal(SIGUSR1);
        signal_manager->registerSignal(SIGUSR2);
        signal_manager->registerSignal(SIGHUP);
    }
    else
    {
        log.setOutputStream(std::cout);
        log.flushAfterWrite(true);
        log.useLocalTime();
    }

    adapter.reset(new EventSourceAdapter(configuration.interfaces,
                                         configuration.allowed_devices,
                                         log));

    lease_file.reset(new DhcpLeaseFile(configuration.lease_filename));

    notifier.reset(new HomeAssistantNotifier(configuration.ha_host,
                                             configuration.ha_token,
                                             std::chrono::seconds(configuration.ha_home_ttl),
                                             std::chrono::seconds(configuration.ha_away_ttl),
                                             std::chrono::seconds(configuration.http_timeout),
                                             configuration.device_id_prefix,
                                             configuration.dhcp_domain,
                                             *lease_file,
                                             log));

    engine.reset(new PresenceEngine(std::chrono::seconds(configuration.consider_home_connect),
                                    std::chrono::seconds(configuration.consider_home_disconnect),
                                    *notifier,
                                    log));

    station_source.reset(new HostapdStationSource(configuration.hostapd_control_directory,
                                                  log));

    reconciler.reset(new BootstrapReconciler(*station_source, *adapter, log));

    // Nothing below can fail, so the PID file won't be left behind by a failed start
    if (monitor)
    {
        writePidToFile(configuration.pid_filename);
    }

    // Note that the service has started
    log.write("Service starting");
}

//=============================================================================================
PosixPresenceTrackerImpl::~PosixPresenceTrackerImpl()
{
    shutdown();
}

//=============================================================================================
int PosixPresenceTrackerImpl::run()
{
    if (!monitor)
    {
        return runOneShot();
    }

    // Attach before querying so nothing that happens during the query is missed; those events
    // wait in the socket buffers and are applied on top of the seeded table
    try
    {
        openMonitorSockets();
    }
    catch (std::runtime_error& ex)
    {
        fail(ex.what());
        return exit_status;
    }

    std::ostringstream message_stream;
    message_stream << "Connected to hostapd on interfaces:";
    for (std::vector<std::string>::const_iterator iter = configuration.interfaces.begin();
         iter != configuration.interfaces.end();
         ++iter)
    {
        message_stream << " " << *iter;
    }
    log.write(message_stream.str());

    // Devices already connected are known but not announced
    std::vector<std::string> seeded;
    if (!engine->bootstrap(*reconciler, configuration.interfaces, seeded))
    {
        log.write("ERROR - Not every interface could be queried; stations on those will be "
                  "learned from live events");
    }

    while (!terminate)
    {
        step();
    }

    return exit_status;
}

//=============================================================================================
// Body of the monitor loop
//=============================================================================================
void PosixPresenceTrackerImpl::step()
{
    // Sleep no longer than it takes for the next debounce timer to expire
    int timeout_ms = -1;
    PresenceEngine::TimePoint deadline;
    if (engine->getNextDeadline(deadline))
    {
        PresenceEngine::TimePoint now = std::chrono::steady_clock::now();
        if (deadline <= now)
        {
            timeout_ms = 0;
        }
        else
        {
            // Round up so the loop never wakes just short of the deadline and spins
            std::chrono::milliseconds remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) +
                std::chrono::milliseconds(1);

            timeout_ms = remaining.count() > INT_MAX ?
                INT_MAX : static_cast<int>(remaining.count());
        }
    }

    std::vector<pollfd> poll_fds(monitor_sockets.size());
    for (unsigned int i = 0; i < monitor_sockets.size(); i++)
    {
        poll_fds[i].fd      = monitor_sockets[i]->getFileDescriptor();
        poll_fds[i].events  = POLLIN;
        poll_fds[i].revents = 0;
    }

    int ready = poll(poll_fds.data(), poll_fds.size(), timeout_ms);
    if (ready < 0 && errno != EINTR)
    {
        fail(std::string("Waiting for hostapd failed: ") + std::strerror(errno));
        return;
    }

    PresenceEngine::TimePoint now = std::chrono::steady_clock::now();

    for (unsigned int i = 0; ready > 0 && i < monitor_sockets.size(); i++)
    {
        const std::string& interface_name = monitor_sockets[i]->getInterfaceName();

        if (poll_fds[i].revents & POLLIN)
        {
            int bytes_read = 0;
            while ((bytes_read = monitor_sockets[i]->read(frame_buffer,
                                                          HostapdControlSocket::MESSAGE_LENGTH))
                   > 0)
            {
                if (!handleFrame(interface_name, frame_buffer, bytes_read, now))
                {
                    fail("hostapd on " + interface_name + " is terminating");
                    return;
                }
            }

            if (bytes_read < 0)
            {
                fail("Lost connection to hostapd on " + interface_name + ": " +
                     std::strerror(errno));
                return;
            }
        }
        else if (poll_fds[i].revents & (POLLERR | POLLHUP | POLLNVAL))
        {
            fail("Lost connection to hostapd on " + interface_name);
            return;
        }
    }

    engine->processExpired(std::chrono::steady_clock::now());

    // It's possible for this to run shutdown(); do it last so this pass finishes with
    // everything it needs still in place
    processDeliveredSignals();
}

//=============================================================================================
// Delivered signals handled here
//=============================================================================================
void PosixPresenceTrackerImpl::processDeliveredSignals()
{
    SignalManager* signal_manager = getSignalManager();

    if (signal_manager->isSignalDelivered(SIGUSR1))
    {
        // Logrotate uses this
        closeLog();
    }

    if (signal_manager->isSignalDelivered(SIGUSR2))
    {
        // Logrotate uses this
        openLog();
    }

    if (signal_manager->isSignalDelivered(SIGHUP))
    {
        log.write("Resynchronizing with hostapd");
        engine->resync(*reconciler, configuration.interfaces, std::chrono::steady_clock::now());
    }

    if (signal_manager->isSignalDelivered(SIGINT) ||
        signal_manager->isSignalDelivered(SIGTERM))
    {
        shutdown();
    }
}

//=============================================================================================
// Reports everybody connected right now as home
//=============================================================================================
int PosixPresenceTrackerImpl::runOneShot()
{
    std::vector<std::string> seeded;
    bool all_answered = engine->bootstrap(*reconciler, configuration.interfaces, seeded);

    unsigned int failures = engine->announce(seeded);

    if (failures > 0)
    {
        std::ostringstream message_stream;
        message_stream << "ERROR - " << failures << " of " << seeded.size()
                       << " device(s) could not be reported";
        log.write(message_stream.str());
    }

    exit_status = all_answered && failures == 0 ? 0 : 1;

    shutdown();

    return exit_status;
}

//=============================================================================================
void PosixPresenceTrackerImpl::openMonitorSockets()
{
    monitor_sockets.clear();

    for (std::vector<std::string>::const_iterator iter = configuration.interfaces.begin();
         iter != configuration.interfaces.end();
         ++iter)
    {
        std::unique_ptr<HostapdControlSocket> monitor_socket(
            new HostapdControlSocket(configuration.hostapd_control_directory, *iter));

        monitor_socket->attach();

        monitor_sockets.push_back(std::move(monitor_socket));
    }
}

//=============================================================================================
// Called to parse and respond to frames read off of the monitor sockets
//=============================================================================================
bool PosixPresenceTrackerImpl::handleFrame(const std::string&                           interface_name,
                                           const char*                                  frame_data,
                                           unsigned int                                 bytes_read,
                                           const std::chrono::steady_clock::time_point& now)
{
    std::string frame(frame_data, bytes_read);

    if (EventSourceAdapter::isTerminating(frame))
    {
        return false;
    }

    MembershipEvent event;
    if (adapter->normalize(interface_name, frame, now, event))
    {
        engine->handleEvent(event);
    }

    return true;
}

//=============================================================================================
// Interprets program arguments and applies corresponding state
//=============================================================================================
bool PosixPresenceTrackerImpl::processArguments()
{
    std::vector<std::string> arguments;
    getArguments(arguments);

    std::vector<std::string>::const_iterator current_argument = arguments.begin();

    while(current_argument != arguments.end())
    {
        // Convenience reference to the next argument
        std::vector<std::string>::const_iterator next_argument = current_argument + 1;

        // Argument --monitor keeps the tracker running on live events
        if (*current_argument == "--monitor")
        {
            monitor = true;
        }
        // Argument -D indicates this process should daemonize itself
        else if (*current_argument == "-D")
        {
            daemonize_argument = true;
        }
        else if (next_argument != arguments.end())
        {
            // Process argument pairs here

            // Assume we're going to process a valid argument here.  If we don't this will be
            // set false
            bool twoarg_processed = true;

            // Argument -c specifies the config file filename
            if (*current_argument == "-c")
            {
                config_filename = *next_argument;
            }
            // Argument -i specifies the interfaces to monitor
            else if (*current_argument == "-i")
            {
                interfaces_argument = *next_argument;
            }
            // Argument -l specifies the log file filename
            else if (*current_argument == "-l")
            {
                log_filename_argument = *next_argument;
            }
            // Argument --pidfile specifies the file in which the PID is stored
            else if (*current_argument == "--pidfile")
            {
                pid_filename_argument = *next_argument;
            }
            else
            {
                // If we get here we didn't actually process anything
                twoarg_processed = false;
            }

            // If we processed a switch with an argument then we should bump the current
            // argument here to prevent the argument from being processed again
            if (twoarg_processed)
            {
                ++current_argument;
            }
        }

        // Move on to the next argument
        ++current_argument;
    }

    // If execution reaches here there was an acceptable set of arguments provided
    return true;
}

//=============================================================================================
// Opens the log file; used after log rotation and during startup
//=============================================================================================
void PosixPresenceTrackerImpl::openLog()
{
    log_stream.open(configuration.log_filename.c_str(), std::ofstream::app);

    log.setOutputStream(log_stream);
    log.flushAfterWrite(true);
    log.useLocalTime();

    log.write("Log file open");
}

//=============================================================================================
// Closes the log file; used before log rotation and on shutdown
//=============================================================================================
void PosixPresenceTrackerImpl::closeLog()
{
    if (log_stream.is_open())
    {
        log.write("Closing log file");
        log_stream.close();
    }
}

//=============================================================================================
// Frees resources and triggers program shutdown at the end of the current pass
//=============================================================================================
void PosixPresenceTrackerImpl::shutdown()
{
    // Signal that we should stop running
    terminate = true;

    if (shut_down)
    {
        return;
    }
    shut_down = true;

    // Log that the service is stopping
    log.write("Service stopping");

    monitor_sockets.clear();

    if (monitor)
    {
        closeLog();

        // Delete the PID file
        unlink(configuration.pid_filename.c_str());
    }
}

//=============================================================================================
void PosixPresenceTrackerImpl::fail(const std::string& reason)
{
    log.write("ERROR - " + reason);
    exit_status = 1;
    shutdown();
}

//=============================================================================================
// Writes the PID of the calling process to file
//=============================================================================================
void PosixPresenceTrackerImpl::writePidToFile(const std::string& pid_filename)
{
    std::ofstream out_stream(pid_filename.c_str());
    out_stream << getpid() << "\n";
    out_stream.close();
}
