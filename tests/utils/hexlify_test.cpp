#include <gtest/gtest.h>
#include <certreq/utils/hexlify.hpp>
#include <certreq/utils/exception.hpp>

using namespace certreq;

TEST(HexlifyTest, Hexlify)
{
    std::vector<uint8_t> data{0x00, 0x0f, 0xa5, 0xff};
    EXPECT_EQ(utils::hexlify(data), "000fa5ff");
    EXPECT_EQ(utils::hexlify({}), "");
}

TEST(HexlifyTest, Unhexlify)
{
    EXPECT_EQ(utils::unhexlify("000FA5ff"), (std::vector<uint8_t>{0x00, 0x0f, 0xa5, 0xff}));
    EXPECT_THROW(utils::unhexlify("abc"), utils::RuntimeError);
    EXPECT_THROW(utils::unhexlify("zz"), utils::RuntimeError);
}
