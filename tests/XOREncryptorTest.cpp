#include <common/encryption/XOREncryptor.hpp>

#include <gtest/gtest.h>

using namespace common;

TEST(XOREncryptorTest, KeyFromUidAndChipId)
{
    // UID byte sum 0x24, last byte offset by chip id 0x70
    const auto key{ generateXorKey({ 1, 2, 3, 4, 5, 6, 7, 8 }, 0x70) };
    const std::vector<uint8_t> expected{ 0x24, 0x24, 0x24, 0x24, 0x24, 0x24, 0x24, 0x94 };
    EXPECT_EQ(key, expected);
    EXPECT_EQ(getXorKeyChecksum(key), 0x90);
}

TEST(XOREncryptorTest, KeyArithmeticWraps)
{
    const auto key{ generateXorKey({ 0xF0, 0xF0 }, 0x30) };
    EXPECT_EQ(key.front(), 0xE0);
    EXPECT_EQ(key.back(), 0x10);
}

TEST(XOREncryptorTest, EmptyUidGivesChipIdOnly)
{
    const auto key{ generateXorKey({}, 0x82) };
    EXPECT_EQ(key, (std::vector<uint8_t>{ 0, 0, 0, 0, 0, 0, 0, 0x82 }));
}

TEST(XOREncryptorTest, EncryptIsInvolution)
{
    const XOREncryptor encryptor{ generateXorKey({ 0x11, 0x22, 0x33, 0x44 }, 0x17) };
    std::vector<uint8_t> data(130);
    for(size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i * 7);
    }
    const auto encrypted{ encryptor.encrypt(data) };
    EXPECT_NE(encrypted, data);
    EXPECT_EQ(encryptor.decrypt(encrypted), data);
    EXPECT_EQ(encrypted[9], data[9] ^ encryptor.getKey()[1]);
}

TEST(XOREncryptorTest, EmptyKeyIsRejected)
{
    EXPECT_THROW(XOREncryptor{ std::vector<uint8_t>{} }, std::invalid_argument);
}
