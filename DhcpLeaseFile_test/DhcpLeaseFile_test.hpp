#if !defined DHCP_LEASE_FILE_TEST_HPP
#define DHCP_LEASE_FILE_TEST_HPP

#include "Test.hpp"
#include "TestCases.hpp"
#include "TestMacros.hpp"

TEST_CASES_PROGRAM_BEGIN(DhcpLeaseFile_test)
TEST(KnownDevice)
TEST(DeviceWithoutHostname)
TEST(UnknownDevice)
TEST(MissingFile)
TEST_CASES_PROGRAM_END(DhcpLeaseFile_test)

#endif
