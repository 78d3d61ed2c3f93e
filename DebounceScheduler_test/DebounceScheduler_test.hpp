#if !defined DEBOUNCE_SCHEDULER_TEST_HPP
#define DEBOUNCE_SCHEDULER_TEST_HPP

#include "Test.hpp"
#include "TestCases.hpp"
#include "TestMacros.hpp"

TEST_CASES_PROGRAM_BEGIN(DebounceScheduler_test)
TEST(ArrivalFiresAfterDelay)
TEST(DepartureWithZeroDelayFiresImmediately)
TEST(OppositeEdgeCancels)
TEST(RapidFlapYieldsOneArrival)
TEST(ConfirmedDeviceIsNotReannounced)
TEST(NoneEdgeChangesNothing)
TEST(NextDeadlineIsEarliest)
TEST(FiresInDeadlineOrder)
TEST(IdleRecordsAreCollected)
TEST(NegativeDelayRejected)
TEST(OverlongDelayRejected)
TEST(MarkedDeviceIsNotReannounced)
TEST_CASES_PROGRAM_END(DebounceScheduler_test)

#endif
