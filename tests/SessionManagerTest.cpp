#include "SimulatedTransport.hpp"

#include <flasher/IspFlasher.hpp>
#include <flasher/SessionManager.hpp>

#include <common/protocols/IspError.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <thread>

using namespace flasher;

TEST(SessionManagerTest, SupportedDevices)
{
    EXPECT_TRUE(common::isSupportedDevice(0x4348, 0x55E0));
    EXPECT_TRUE(common::isSupportedDevice(0x1A86, 0x55E0));
    EXPECT_FALSE(common::isSupportedDevice(0x1A86, 0x7523));
    EXPECT_FALSE(common::isSupportedDevice(0x0483, 0x55E0));
}

TEST(SessionManagerTest, RejectsUnsupportedDevice)
{
    SessionManager manager;
    auto transport{ std::make_shared<test::SimulatedTransport>() };
    try {
        manager.open(transport, 0x0483, 0xDF11);
        FAIL() << "IspError expected";
    }
    catch(const common::IspError& ex) {
        EXPECT_EQ(ex.getKind(), common::ErrorKind::UnsupportedFeature);
    }
    EXPECT_TRUE(transport->getCommands().empty());
    EXPECT_EQ(manager.size(), 0u);
}

TEST(SessionManagerTest, HandlesAreUniqueAndIncreasing)
{
    SessionManager manager;
    const auto first{ manager.open(std::make_shared<test::SimulatedTransport>(), 0x4348, 0x55E0) };
    const auto second{ manager.open(std::make_shared<test::SimulatedTransport>(0x82, 0x82), 0x1A86, 0x55E0) };
    EXPECT_GT(second, first);
    EXPECT_EQ(manager.size(), 2u);

    ASSERT_NE(manager.get(first), nullptr);
    EXPECT_EQ(manager.get(first)->getChip().name, "CH32V307");
    EXPECT_EQ(manager.get(second)->getChip().name, "CH582");

    EXPECT_TRUE(manager.close(first));
    EXPECT_FALSE(manager.close(first));
    EXPECT_EQ(manager.get(first), nullptr);
    EXPECT_FALSE(manager.close(12345));

    const auto third{ manager.open(std::make_shared<test::SimulatedTransport>(), 0x4348, 0x55E0) };
    EXPECT_GT(third, second);
}

TEST(SessionManagerTest, FailedIdentificationLeavesNoSession)
{
    SessionManager manager;
    auto transport{ std::make_shared<test::SimulatedTransport>() };
    transport->setSilent(true);
    EXPECT_THROW(manager.open(transport, 0x4348, 0x55E0), common::IspError);
    EXPECT_EQ(manager.size(), 0u);
}

TEST(SessionManagerTest, SessionsRunInParallel)
{
    SessionManager manager;
    auto firstTransport{ std::make_shared<test::SimulatedTransport>() };
    auto secondTransport{ std::make_shared<test::SimulatedTransport>(0x30, 0x19) };
    const auto first{ manager.open(firstTransport, 0x4348, 0x55E0) };
    const auto second{ manager.open(secondTransport, 0x4348, 0x55E0) };

    const std::vector<uint8_t> firmware(2000, 0x5A);
    auto run = [&manager, &firmware](int handle) {
        auto flasher{ manager.get(handle) };
        flasher->flash(firmware);
        flasher->verify(firmware);
    };
    std::thread firstThread{ run, first };
    std::thread secondThread{ run, second };
    firstThread.join();
    secondThread.join();

    EXPECT_EQ(manager.get(first)->getCurrentState(), FlasherState::Verified);
    EXPECT_EQ(manager.get(second)->getCurrentState(), FlasherState::Verified);
    EXPECT_TRUE(std::equal(firmware.cbegin(), firmware.cend(), firstTransport->getFlash().cbegin()));
    EXPECT_TRUE(std::equal(firmware.cbegin(), firmware.cend(), secondTransport->getFlash().cbegin()));
}
