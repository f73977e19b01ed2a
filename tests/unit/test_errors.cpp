#include <gtest/gtest.h>
#include <limits>
#include <plotscale/errors.hpp>
#include <stdexcept>
#include <string>

using namespace plotscale;

TEST(ErrorCodes, Names)
{
    EXPECT_STREQ(error_code_name(ErrorCode::EmptyDataset), "EmptyDataset");
    EXPECT_STREQ(error_code_name(ErrorCode::InvalidValue), "InvalidValue");
    EXPECT_STREQ(error_code_name(ErrorCode::InvalidGeometry), "InvalidGeometry");
    EXPECT_STREQ(error_code_name(ErrorCode::InvalidConfig), "InvalidConfig");
}

TEST(NormalizeErrorTest, MessageCarriesCode)
{
    NormalizeError e(ErrorCode::InvalidGeometry, "width is negative");
    EXPECT_EQ(e.code(), ErrorCode::InvalidGeometry);
    EXPECT_STREQ(e.what(), "InvalidGeometry: width is negative");
}

TEST(NormalizeErrorTest, CatchableAsRuntimeError)
{
    try
    {
        throw EmptyDatasetError("extent");
    }
    catch (const std::runtime_error& e)
    {
        EXPECT_STREQ(e.what(), "EmptyDataset: extent requires at least one point");
    }
}

TEST(NormalizeErrorTest, EmptyDatasetCode)
{
    EmptyDatasetError e("stack");
    EXPECT_EQ(e.code(), ErrorCode::EmptyDataset);
}

TEST(NormalizeErrorTest, InvalidValueDetails)
{
    InvalidValueError e("y", 3, std::numeric_limits<double>::infinity());
    EXPECT_EQ(e.code(), ErrorCode::InvalidValue);
    EXPECT_EQ(e.axis(), "y");
    EXPECT_EQ(e.index(), 3u);

    std::string what = e.what();
    EXPECT_NE(what.find("non-finite y"), std::string::npos);
    EXPECT_NE(what.find("index 3"), std::string::npos);
}

TEST(NormalizeErrorTest, SubclassesCatchableAsBase)
{
    bool caught = false;
    try
    {
        throw InvalidValueError("x", 0, 0.0);
    }
    catch (const NormalizeError& e)
    {
        caught = e.code() == ErrorCode::InvalidValue;
    }
    EXPECT_TRUE(caught);
}
