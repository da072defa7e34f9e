#include "SimulatedTransport.hpp"

#include <common/protocols/IspError.hpp>
#include <common/protocols/IspRequestProcessor.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace common;

namespace {

IspError catchIspError(const IspRequestProcessor& processor, const IspCommand& command)
{
    try {
        processor.transfer(command);
    }
    catch(const IspError& ex) {
        return ex;
    }
    throw std::runtime_error("IspError expected");
}

}

TEST(IspRequestProcessorTest, ReturnsMatchingResponse)
{
    test::SimulatedTransport transport;
    const IspRequestProcessor processor{ transport, ProtocolSettings{} };
    const auto response{ processor.transfer(IspCommand::identify(0, 0)) };
    EXPECT_TRUE(response.isOk());
    EXPECT_EQ(response.getPayload(), (std::vector<uint8_t>{ 0x70, 0x17 }));
    EXPECT_EQ(transport.getCommands().size(), 1u);
}

TEST(IspRequestProcessorTest, DeviceStatusIsReturnedNotThrown)
{
    test::SimulatedTransport transport;
    transport.setStatus(IspCommandType::Erase, 0xFE);
    const IspRequestProcessor processor{ transport, ProtocolSettings{} };
    const auto response{ processor.transfer(IspCommand::erase(1)) };
    EXPECT_FALSE(response.isOk());
    EXPECT_EQ(response.getStatus(), 0xFE);
}

TEST(IspRequestProcessorTest, IncompleteSend)
{
    test::SimulatedTransport transport;
    transport.setShortSend(true);
    const IspRequestProcessor processor{ transport, ProtocolSettings{} };
    const auto error{ catchIspError(processor, IspCommand::identify(0, 0)) };
    EXPECT_EQ(error.getKind(), ErrorKind::TransportFailure);
    EXPECT_EQ(error.getErrorCode(), IspError::ErrorCode::IncompleteSend);
}

TEST(IspRequestProcessorTest, NoResponse)
{
    test::SimulatedTransport transport;
    transport.setSilent(true);
    const IspRequestProcessor processor{ transport, ProtocolSettings{} };
    const auto error{ catchIspError(processor, IspCommand::identify(0, 0)) };
    EXPECT_EQ(error.getKind(), ErrorKind::TransportFailure);
    EXPECT_EQ(error.getErrorCode(), IspError::ErrorCode::NoResponse);
    EXPECT_EQ(transport.getCommands().size(), 1u);
}

TEST(IspRequestProcessorTest, KindMismatch)
{
    test::SimulatedTransport transport;
    transport.setReplyKind(IspCommandType::Verify);
    const IspRequestProcessor processor{ transport, ProtocolSettings{} };
    const auto error{ catchIspError(processor, IspCommand::erase(1)) };
    EXPECT_EQ(error.getKind(), ErrorKind::KindMismatch);
}

TEST(IspRequestProcessorTest, ForeignExceptionBecomesTransportFailure)
{
    test::SimulatedTransport transport;
    transport.setSendException(true);
    const IspRequestProcessor processor{ transport, ProtocolSettings{} };
    const auto error{ catchIspError(processor, IspCommand::identify(0, 0)) };
    EXPECT_EQ(error.getKind(), ErrorKind::TransportFailure);
    EXPECT_NE(std::string{ error.what() }.find("device unplugged"), std::string::npos);
}

TEST(IspRequestProcessorTest, OversizedCommandIsNotSent)
{
    test::SimulatedTransport transport;
    const IspRequestProcessor processor{ transport, ProtocolSettings{} };
    const auto error{ catchIspError(processor, IspCommand::program(0, 0, std::vector<uint8_t>(300, 0x00))) };
    EXPECT_EQ(error.getErrorCode(), IspError::ErrorCode::PayloadTooLong);
    EXPECT_TRUE(transport.getCommands().empty());
}
