#include <common/protocols/IspCommand.hpp>
#include <common/protocols/IspError.hpp>
#include <common/protocols/IspResponse.hpp>

#include <gtest/gtest.h>

#include <functional>

using namespace common;

namespace {

ErrorKind getErrorKind(const std::function<void()>& callable, int& errorCode)
{
    try {
        callable();
    }
    catch(const IspError& ex) {
        errorCode = ex.getErrorCode();
        return ex.getKind();
    }
    ADD_FAILURE() << "IspError expected";
    return ErrorKind::UnsupportedFeature;
}

}

TEST(IspCommandTest, IdentifyEncoding)
{
    const std::vector<uint8_t> expected{ 0xA1, 0x06, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 };
    EXPECT_EQ(IspCommand::identify(0, 0).toRaw(), expected);
}

TEST(IspCommandTest, EraseEncodesLittleEndianSectors)
{
    const std::vector<uint8_t> expected{ 0xA4, 0x04, 0x00, 0x02, 0x01, 0x00, 0x00 };
    EXPECT_EQ(IspCommand::erase(0x0102).toRaw(), expected);
}

TEST(IspCommandTest, ProgramEncodesAddressPaddingAndData)
{
    const std::vector<uint8_t> expected{ 0xA5, 0x07, 0x00, 0x38, 0x00, 0x00, 0x00, 0x5C, 0xAA, 0xBB };
    EXPECT_EQ(IspCommand::program(0x38, 0x5C, { 0xAA, 0xBB }).toRaw(), expected);
}

TEST(IspCommandTest, ProgramTerminatorHasEmptyData)
{
    const std::vector<uint8_t> expected{ 0xA5, 0x05, 0x00, 0x64, 0x00, 0x00, 0x00, 0x00 };
    EXPECT_EQ(IspCommand::program(100, 0, {}).toRaw(), expected);
}

TEST(IspCommandTest, SmallPayloadLayouts)
{
    EXPECT_EQ(IspCommand::ispEnd(1).toRaw(), (std::vector<uint8_t>{ 0xA2, 0x01, 0x00, 0x01 }));
    EXPECT_EQ(IspCommand::readConfig(CFG_MASK_ALL).toRaw(),
              (std::vector<uint8_t>{ 0xA7, 0x04, 0x00, 0x1F, 0x00, 0x00, 0x00 }));
    EXPECT_EQ(IspCommand::dataErase(32).toRaw(), (std::vector<uint8_t>{ 0xA9, 0x02, 0x00, 0x20, 0x00 }));
    EXPECT_EQ(IspCommand::dataRead(0x10, 0x40).toRaw(),
              (std::vector<uint8_t>{ 0xAB, 0x06, 0x00, 0x10, 0x00, 0x00, 0x00, 0x40, 0x00 }));
    EXPECT_EQ(IspCommand::writeConfig(CFG_MASK_RDPR_USER_DATA_WPR, { 0xA5, 0x5A }).toRaw(),
              (std::vector<uint8_t>{ 0xA8, 0x06, 0x00, 0x07, 0x00, 0x00, 0x00, 0xA5, 0x5A }));
}

TEST(IspCommandTest, IspKeyCarriesSeed)
{
    const auto raw{ IspCommand::ispKey(std::vector<uint8_t>(0x1E, 0x00)).toRaw() };
    ASSERT_EQ(raw.size(), 3u + 0x1E);
    EXPECT_EQ(raw[0], 0xA3);
    EXPECT_EQ(raw[1], 0x1E);
}

TEST(IspCommandTest, PayloadTooLongIsRejected)
{
    int errorCode{ 0 };
    const auto kind{ getErrorKind([]() { IspCommand::program(0, 0, std::vector<uint8_t>(251, 0x00)).toRaw(); },
                                  errorCode) };
    EXPECT_EQ(kind, ErrorKind::ProtocolDecodeError);
    EXPECT_EQ(errorCode, IspError::ErrorCode::PayloadTooLong);
    EXPECT_NO_THROW(IspCommand::program(0, 0, std::vector<uint8_t>(250, 0x00)).toRaw());
}

TEST(IspCommandTest, CommandFrameRoundTrip)
{
    const std::vector<IspCommand> commands{
        IspCommand::identify(0x70, 0x17),
        IspCommand::ispEnd(1),
        IspCommand::ispKey(std::vector<uint8_t>(0x1E, 0x00)),
        IspCommand::erase(4),
        IspCommand::program(0x0100, 0x5C, std::vector<uint8_t>(56, 0xA7)),
        IspCommand::program(0x0138, 0x00, {}),
        IspCommand::verify(0x1000, 0x33, { 1, 2, 3, 4, 5 }),
        IspCommand::readConfig(CFG_MASK_ALL),
        IspCommand::writeConfig(CFG_MASK_RDPR_USER_DATA_WPR, std::vector<uint8_t>(12, 0xFF)),
        IspCommand::dataErase(32),
        IspCommand::dataProgram(0x20, 0x01, { 9 }),
        IspCommand::dataRead(0x40, 0x10),
    };
    for(const auto& command: commands) {
        const auto raw{ command.toRaw() };
        const auto decoded{ IspCommand::fromRaw(raw) };
        EXPECT_EQ(decoded.getType(), command.getType());
        EXPECT_EQ(decoded.getPayload(), command.getPayload());
        EXPECT_EQ(raw[1], command.getPayload().size());
    }
}

TEST(IspResponseTest, ResponseFrameRoundTrip)
{
    const std::vector<IspResponse> responses{
        { IspCommandType::Identify, 0x00, { 0x70, 0x17 } },
        { IspCommandType::IspEnd, 0x00, { 0x00, 0x00 } },
        { IspCommandType::IspKey, 0x00, { 0x5B, 0x00 } },
        { IspCommandType::Erase, 0xFE, { 0x00, 0x00 } },
        { IspCommandType::Program, 0x00, { 0x00, 0x00 } },
        { IspCommandType::Verify, 0x00, { 0xF5, 0x00 } },
        { IspCommandType::ReadConfig, 0x00, std::vector<uint8_t>(26, 0x5A) },
        { IspCommandType::WriteConfig, 0x00, { 0x00, 0x00 } },
        { IspCommandType::DataErase, 0x01, {} },
        { IspCommandType::DataProgram, 0x00, { 0x00, 0x00 } },
        { IspCommandType::DataRead, 0x00, std::vector<uint8_t>(16, 0x33) },
    };
    for(const auto& response: responses) {
        const auto raw{ response.toRaw() };
        const auto decoded{ IspResponse::fromRaw(raw) };
        EXPECT_EQ(decoded.getType(), response.getType());
        EXPECT_EQ(decoded.getStatus(), response.getStatus());
        EXPECT_EQ(decoded.getPayload(), response.getPayload());
        EXPECT_EQ(raw[1], response.getPayload().size());
    }
}

TEST(IspResponseTest, DecodesStatusAndPayload)
{
    const auto response{ IspResponse::fromRaw({ 0xA1, 0x02, 0x00, 0x00, 0x70, 0x17 }) };
    EXPECT_EQ(response.getType(), IspCommandType::Identify);
    EXPECT_TRUE(response.isOk());
    EXPECT_EQ(response.getPayload(), (std::vector<uint8_t>{ 0x70, 0x17 }));
}

TEST(IspResponseTest, NonZeroStatusIsNotOk)
{
    const auto response{ IspResponse::fromRaw({ 0xA4, 0x00, 0xFE, 0x00 }) };
    EXPECT_FALSE(response.isOk());
    EXPECT_EQ(response.getStatus(), 0xFE);
    EXPECT_TRUE(response.getPayload().empty());
}

TEST(IspResponseTest, TrailingBytesAreIgnored)
{
    const auto response{ IspResponse::fromRaw({ 0xA2, 0x01, 0x00, 0x00, 0x01, 0xEE }) };
    EXPECT_EQ(response.getPayload(), (std::vector<uint8_t>{ 0x01 }));
}

TEST(IspResponseTest, ShortBufferIsTruncated)
{
    int errorCode{ 0 };
    EXPECT_EQ(getErrorKind([]() { IspResponse::fromRaw({ 0xA1, 0x00, 0x00 }); }, errorCode),
              ErrorKind::ProtocolDecodeError);
    EXPECT_EQ(errorCode, IspError::ErrorCode::TruncatedFrame);
}

TEST(IspResponseTest, DeclaredLengthBeyondBufferIsTruncated)
{
    int errorCode{ 0 };
    EXPECT_EQ(getErrorKind([]() { IspResponse::fromRaw({ 0xA1, 0x04, 0x00, 0x00, 0x70 }); }, errorCode),
              ErrorKind::ProtocolDecodeError);
    EXPECT_EQ(errorCode, IspError::ErrorCode::TruncatedFrame);
}

TEST(IspResponseTest, UnknownKindIsRejected)
{
    int errorCode{ 0 };
    EXPECT_EQ(getErrorKind([]() { IspResponse::fromRaw({ 0xB0, 0x00, 0x00, 0x00 }); }, errorCode),
              ErrorKind::ProtocolDecodeError);
    EXPECT_EQ(errorCode, IspError::ErrorCode::UnknownKind);
}
