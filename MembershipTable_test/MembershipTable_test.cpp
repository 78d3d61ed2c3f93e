#include <chrono>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "MembershipTable_test.hpp"

#include "MembershipEvent.hpp"
#include "MembershipTable.hpp"
#include "Test.hpp"
#include "TestMacros.hpp"

TEST_PROGRAM_MAIN(MembershipTable_test);

//==============================================================================
static MembershipEvent makeEvent(const std::string&    device_id,
                                 const std::string&    network_id,
                                 MembershipEvent::Kind kind)
{
    MembershipEvent event;
    event.device_id  = device_id;
    event.network_id = network_id;
    event.kind       = kind;
    event.timestamp  = std::chrono::steady_clock::now();
    return event;
}

//==============================================================================
void MembershipTable_test::addTestCases()
{
    ADD_TEST_CASE(FirstJoinIsEdge);
    ADD_TEST_CASE(SecondNetworkJoinIsNotEdge);
    ADD_TEST_CASE(LastLeaveIsEdge);
    ADD_TEST_CASE(RepeatedJoinIsNotEdge);
    ADD_TEST_CASE(DuplicateLeaveIsNoop);
    ADD_TEST_CASE(EmptyOnlyWithoutJoinedNetworks);
}

//==============================================================================
Test::Result MembershipTable_test::FirstJoinIsEdge::body()
{
    MembershipTable table;

    MUST_BE_TRUE(!table.isPresent("aa:bb:cc:dd:ee:01"));
    MUST_BE_TRUE(table.apply(makeEvent("aa:bb:cc:dd:ee:01", "wlan0", MembershipEvent::JOINED)) ==
                 MembershipTable::BECAME_NONEMPTY);
    MUST_BE_TRUE(table.isPresent("aa:bb:cc:dd:ee:01"));
    MUST_BE_TRUE(table.size() == 1);

    return Test::PASSED;
}

//==============================================================================
Test::Result MembershipTable_test::SecondNetworkJoinIsNotEdge::body()
{
    MembershipTable table;

    table.apply(makeEvent("aa:bb:cc:dd:ee:01", "wlan0", MembershipEvent::JOINED));
    MUST_BE_TRUE(table.apply(makeEvent("aa:bb:cc:dd:ee:01", "wlan1", MembershipEvent::JOINED)) ==
                 MembershipTable::NONE);

    std::set<std::string> networks;
    table.getNetworks("aa:bb:cc:dd:ee:01", networks);
    MUST_BE_TRUE(networks.size() == 2);
    MUST_BE_TRUE(networks.count("wlan0") == 1);
    MUST_BE_TRUE(networks.count("wlan1") == 1);

    return Test::PASSED;
}

//==============================================================================
Test::Result MembershipTable_test::LastLeaveIsEdge::body()
{
    MembershipTable table;

    table.apply(makeEvent("aa:bb:cc:dd:ee:01", "wlan0", MembershipEvent::JOINED));
    table.apply(makeEvent("aa:bb:cc:dd:ee:01", "wlan1", MembershipEvent::JOINED));

    MUST_BE_TRUE(table.apply(makeEvent("aa:bb:cc:dd:ee:01", "wlan0", MembershipEvent::LEFT)) ==
                 MembershipTable::NONE);
    MUST_BE_TRUE(table.isPresent("aa:bb:cc:dd:ee:01"));

    MUST_BE_TRUE(table.apply(makeEvent("aa:bb:cc:dd:ee:01", "wlan1", MembershipEvent::LEFT)) ==
                 MembershipTable::BECAME_EMPTY);
    MUST_BE_TRUE(!table.isPresent("aa:bb:cc:dd:ee:01"));
    MUST_BE_TRUE(table.size() == 0);

    return Test::PASSED;
}

//==============================================================================
Test::Result MembershipTable_test::RepeatedJoinIsNotEdge::body()
{
    MembershipTable table;

    table.apply(makeEvent("aa:bb:cc:dd:ee:01", "wlan0", MembershipEvent::JOINED));
    MUST_BE_TRUE(table.apply(makeEvent("aa:bb:cc:dd:ee:01", "wlan0", MembershipEvent::JOINED)) ==
                 MembershipTable::NONE);

    // One leave is enough, the join wasn't counted twice
    MUST_BE_TRUE(table.apply(makeEvent("aa:bb:cc:dd:ee:01", "wlan0", MembershipEvent::LEFT)) ==
                 MembershipTable::BECAME_EMPTY);

    return Test::PASSED;
}

//==============================================================================
Test::Result MembershipTable_test::DuplicateLeaveIsNoop::body()
{
    MembershipTable table;

    // Never joined at all
    MUST_BE_TRUE(table.apply(makeEvent("aa:bb:cc:dd:ee:01", "wlan0", MembershipEvent::LEFT)) ==
                 MembershipTable::NONE);
    MUST_BE_TRUE(table.size() == 0);

    table.apply(makeEvent("aa:bb:cc:dd:ee:01", "wlan0", MembershipEvent::JOINED));
    table.apply(makeEvent("aa:bb:cc:dd:ee:01", "wlan1", MembershipEvent::JOINED));
    table.apply(makeEvent("aa:bb:cc:dd:ee:01", "wlan0", MembershipEvent::LEFT));

    // wlan0 is already gone; leaving it again must not touch wlan1
    MUST_BE_TRUE(table.apply(makeEvent("aa:bb:cc:dd:ee:01", "wlan0", MembershipEvent::LEFT)) ==
                 MembershipTable::NONE);
    MUST_BE_TRUE(table.isPresent("aa:bb:cc:dd:ee:01"));

    table.apply(makeEvent("aa:bb:cc:dd:ee:01", "wlan1", MembershipEvent::LEFT));
    MUST_BE_TRUE(table.apply(makeEvent("aa:bb:cc:dd:ee:01", "wlan1", MembershipEvent::LEFT)) ==
                 MembershipTable::NONE);
    MUST_BE_TRUE(!table.isPresent("aa:bb:cc:dd:ee:01"));

    return Test::PASSED;
}

//==============================================================================
// Feeds a long pseudo-random interleaving of joins and leaves and checks the table against a
// model that only remembers the last event per (device, network)
//==============================================================================
Test::Result MembershipTable_test::EmptyOnlyWithoutJoinedNetworks::body()
{
    const char* devices[]  = {"aa:bb:cc:dd:ee:01", "aa:bb:cc:dd:ee:02", "aa:bb:cc:dd:ee:03"};
    const char* networks[] = {"wlan0", "wlan1", "wlan2"};

    MembershipTable table;
    std::map<std::pair<std::string, std::string>, bool> last_joined;

    unsigned int seed = 12345;
    for (unsigned int i = 0; i < 2000; i++)
    {
        seed = seed * 1103515245 + 12345;
        unsigned int choice = (seed >> 16) & 0x7fff;

        std::string device  = devices[choice % 3];
        std::string network = networks[(choice / 3) % 3];
        bool join = (choice / 9) % 2 == 0;

        bool was_present = table.isPresent(device);

        MembershipTable::EdgeCondition edge = table.apply(
            makeEvent(device, network, join ? MembershipEvent::JOINED : MembershipEvent::LEFT));

        last_joined[std::make_pair(device, network)] = join;

        bool expected_present = false;
        for (unsigned int n = 0; n < 3; n++)
        {
            expected_present |= last_joined[std::make_pair(device, std::string(networks[n]))];
        }

        MUST_BE_TRUE(table.isPresent(device) == expected_present);

        // Edges are reported exactly when presence flips
        MUST_BE_TRUE((edge == MembershipTable::BECAME_NONEMPTY) ==
                     (!was_present && expected_present));
        MUST_BE_TRUE((edge == MembershipTable::BECAME_EMPTY) ==
                     (was_present && !expected_present));
    }

    return Test::PASSED;
}
