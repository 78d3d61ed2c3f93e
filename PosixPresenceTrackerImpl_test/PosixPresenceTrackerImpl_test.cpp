#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

#include "PosixPresenceTrackerImpl_test.hpp"

#include "PosixPresenceTrackerImpl.hpp"
#include "Test.hpp"
#include "TestMacros.hpp"

TEST_PROGRAM_MAIN(PosixPresenceTrackerImpl_test);

//==============================================================================
// Writes a config file with the given contents and returns its name
//==============================================================================
static std::string writeConfigFile(const std::string& contents)
{
    std::ostringstream filename_stream;
    filename_stream << "/tmp/hapt_test_config_" << getpid();

    std::ofstream config_stream(filename_stream.str().c_str());
    config_stream << contents;

    return filename_stream.str();
}

//==============================================================================
static bool fileExists(const std::string& filename)
{
    std::ifstream file_stream(filename.c_str());
    return file_stream.good();
}

//==============================================================================
void PosixPresenceTrackerImpl_test::addTestCases()
{
    ADD_TEST_CASE(Constructor);
    ADD_TEST_CASE(InvalidConfiguration);
    ADD_TEST_CASE(OneShotWithoutHostapd);
    ADD_TEST_CASE(PidFileLifetime);
    ADD_TEST_CASE(NoPidFileAfterFailedStart);
}

//==============================================================================
Test::Result PosixPresenceTrackerImpl_test::Constructor::body()
{
    try
    {
        PosixPresenceTrackerImpl hapt(0, 0);
    }
    catch (std::runtime_error& ex)
    {
        // Expected unless this machine is actually set up as an access point
        std::cout << ex.what() << "\n";
        return Test::SKIPPED;
    }

    return Test::PASSED;
}

//==============================================================================
Test::Result PosixPresenceTrackerImpl_test::InvalidConfiguration::body()
{
    std::string config_filename = writeConfigFile("HA_HOST=http://127.0.0.1:1\n"
                                                  "INTERFACES=wlan0\n");

    std::string program_name = "hapt";
    std::string config_switch = "-c";

    std::vector<char*> arguments;
    arguments.push_back(&program_name[0]);
    arguments.push_back(&config_switch[0]);
    arguments.push_back(&config_filename[0]);
    arguments.push_back(0);

    std::string error;
    try
    {
        PosixPresenceTrackerImpl hapt(3, arguments.data());
    }
    catch (std::runtime_error& ex)
    {
        error = ex.what();
    }

    std::remove(config_filename.c_str());

    MUST_BE_TRUE(error.find("HA_TOKEN is not set") != std::string::npos);

    return Test::PASSED;
}

//==============================================================================
Test::Result PosixPresenceTrackerImpl_test::OneShotWithoutHostapd::body()
{
    std::string config_filename = writeConfigFile("HA_HOST=http://127.0.0.1:1\n"
                                                  "HA_TOKEN=token\n"
                                                  "HTTP_TIMEOUT=1\n"
                                                  "INTERFACES=wlan0\n"
                                                  "HOSTAPD_CTRL_DIR=/nonexistent/hostapd\n"
                                                  "LEASE_FILE=/nonexistent/dhcp.leases\n");

    std::string program_name = "hapt";
    std::string config_switch = "-c";

    std::vector<char*> arguments;
    arguments.push_back(&program_name[0]);
    arguments.push_back(&config_switch[0]);
    arguments.push_back(&config_filename[0]);
    arguments.push_back(0);

    int exit_status = 0;
    try
    {
        PosixPresenceTrackerImpl hapt(3, arguments.data());
        exit_status = hapt.run();
    }
    catch (std::runtime_error& ex)
    {
        std::remove(config_filename.c_str());
        std::cout << ex.what() << "\n";
        return Test::FAILED;
    }

    std::remove(config_filename.c_str());

    // hostapd couldn't be asked, so the one-shot report is incomplete
    MUST_BE_TRUE(exit_status == 1);

    return Test::PASSED;
}

//==============================================================================
Test::Result PosixPresenceTrackerImpl_test::PidFileLifetime::body()
{
    std::string config_filename = writeConfigFile("HA_HOST=http://127.0.0.1:1\n"
                                                  "HA_TOKEN=token\n"
                                                  "INTERFACES=wlan0\n");

    std::ostringstream pid_filename_stream;
    pid_filename_stream << "/tmp/hapt_test_pid_" << getpid();
    std::string pid_filename = pid_filename_stream.str();

    std::ostringstream log_filename_stream;
    log_filename_stream << "/tmp/hapt_test_log_" << getpid();
    std::string log_filename = log_filename_stream.str();

    std::string program_name   = "hapt";
    std::string monitor_switch = "--monitor";
    std::string config_switch  = "-c";
    std::string log_switch     = "-l";
    std::string pid_switch     = "--pidfile";

    std::vector<char*> arguments;
    arguments.push_back(&program_name[0]);
    arguments.push_back(&monitor_switch[0]);
    arguments.push_back(&config_switch[0]);
    arguments.push_back(&config_filename[0]);
    arguments.push_back(&log_switch[0]);
    arguments.push_back(&log_filename[0]);
    arguments.push_back(&pid_switch[0]);
    arguments.push_back(&pid_filename[0]);
    arguments.push_back(0);

    bool written = false;
    try
    {
        PosixPresenceTrackerImpl hapt(8, arguments.data());
        written = fileExists(pid_filename);
    }
    catch (std::runtime_error& ex)
    {
        std::remove(config_filename.c_str());
        std::remove(log_filename.c_str());
        std::cout << ex.what() << "\n";
        return Test::FAILED;
    }

    bool removed = !fileExists(pid_filename);

    std::remove(config_filename.c_str());
    std::remove(log_filename.c_str());
    std::remove(pid_filename.c_str());

    MUST_BE_TRUE(written);
    MUST_BE_TRUE(removed);

    return Test::PASSED;
}

//==============================================================================
Test::Result PosixPresenceTrackerImpl_test::NoPidFileAfterFailedStart::body()
{
    // Fails validation, after the arguments asked for monitor mode
    std::string config_filename = writeConfigFile("HA_HOST=http://127.0.0.1:1\n"
                                                  "HA_TOKEN=token\n"
                                                  "INTERFACES=wlan0\n"
                                                  "CONSIDER_HOME_CONNECT=10000000000\n");

    std::ostringstream pid_filename_stream;
    pid_filename_stream << "/tmp/hapt_test_pid_" << getpid();
    std::string pid_filename = pid_filename_stream.str();
    std::remove(pid_filename.c_str());

    std::string program_name   = "hapt";
    std::string monitor_switch = "--monitor";
    std::string config_switch  = "-c";
    std::string pid_switch     = "--pidfile";

    std::vector<char*> arguments;
    arguments.push_back(&program_name[0]);
    arguments.push_back(&monitor_switch[0]);
    arguments.push_back(&config_switch[0]);
    arguments.push_back(&config_filename[0]);
    arguments.push_back(&pid_switch[0]);
    arguments.push_back(&pid_filename[0]);
    arguments.push_back(0);

    bool threw = false;
    try
    {
        PosixPresenceTrackerImpl hapt(6, arguments.data());
    }
    catch (std::runtime_error& ex)
    {
        threw = true;
    }

    std::remove(config_filename.c_str());

    MUST_BE_TRUE(threw);
    MUST_BE_TRUE(!fileExists(pid_filename));

    return Test::PASSED;
}
