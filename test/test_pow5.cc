#include "catch2/catch.hpp"

#include "pow5.h"

#include <cstdint>

using namespace ieeeparse;

//==================================================================================================
// Logarithms
//==================================================================================================

TEST_CASE("Pow5 - FloorLog2Pow5")
{
    CHECK(0 == pow5::FloorLog2Pow5(0));
    CHECK(2 == pow5::FloorLog2Pow5(1));
    CHECK(4 == pow5::FloorLog2Pow5(2));
    CHECK(23 == pow5::FloorLog2Pow5(10));
    CHECK(715 == pow5::FloorLog2Pow5(308));
    CHECK(789 == pow5::FloorLog2Pow5(340));
    CHECK(-3 == pow5::FloorLog2Pow5(-1));
    CHECK(-24 == pow5::FloorLog2Pow5(-10));

    CHECK(1 == pow5::CeilLog2Pow5(0));
    CHECK(3 == pow5::CeilLog2Pow5(1));
    CHECK(24 == pow5::CeilLog2Pow5(10));
    CHECK(753 == pow5::CeilLog2Pow5(324));
}

TEST_CASE("Pow5 - FloorLog2")
{
    CHECK(0 == pow5::FloorLog2(uint32_t{1}));
    CHECK(1 == pow5::FloorLog2(uint32_t{3}));
    CHECK(23 == pow5::FloorLog2(uint32_t{0x00FFFFFF}));
    CHECK(31 == pow5::FloorLog2(uint32_t{0x80000000}));

    CHECK(0 == pow5::FloorLog2(uint64_t{1}));
    CHECK(52 == pow5::FloorLog2(uint64_t{1} << 52));
    CHECK(56 == pow5::FloorLog2(uint64_t{99999999999999999}));
    CHECK(63 == pow5::FloorLog2(~uint64_t{0}));
}

//==================================================================================================
// Multiplication
//==================================================================================================

TEST_CASE("Pow5 - MulPow5DivPow2 single")
{
    CHECK(29296875u == pow5::MulPow5DivPow2(uint32_t{3}, 10, 0));
    CHECK(41828787u == pow5::MulPow5DivPow2(uint32_t{123456789}, 20, 48));
    CHECK(19721522u == pow5::MulPow5DivPow2(uint32_t{1}, 38, 64));
}

TEST_CASE("Pow5 - MulPow5DivPow2 double")
{
    CHECK(10020841800044863u == pow5::MulPow5DivPow2(uint64_t{1}, 308, 662));
    CHECK(13071495981959934u == pow5::MulPow5DivPow2(uint64_t{12345678901234567}, 22, 51));
    CHECK(18014398509481981u == pow5::MulPow5DivPow2(uint64_t{17976931348623157}, 292, 678));
}

TEST_CASE("Pow5 - MulPow5InvDivPow2 single")
{
    CHECK(26843545u == pow5::MulPow5InvDivPow2(uint32_t{1}, 1, -27));
    CHECK(39125018u == pow5::MulPow5InvDivPow2(uint32_t{123456789}, 30, -68));
    CHECK(44601490u == pow5::MulPow5InvDivPow2(uint32_t{999999999}, 45, -100));
    CHECK(54924640u == pow5::MulPow5InvDivPow2(uint32_t{7}, 50, -139));
}

TEST_CASE("Pow5 - MulPow5InvDivPow2 double")
{
    CHECK(14411518807585587u == pow5::MulPow5InvDivPow2(uint64_t{1}, 1, -56));
    CHECK(13421772800000000u == pow5::MulPow5InvDivPow2(uint64_t{100000000000000000}, 9, -18));
    CHECK(18014398509481982u == pow5::MulPow5InvDivPow2(uint64_t{4940656458412465}, 339, -789));
    CHECK(18014398509481984u == pow5::MulPow5InvDivPow2(uint64_t{22250738585072014}, 324, -752));
}

//==================================================================================================
// Divisibility
//==================================================================================================

TEST_CASE("Pow5 - MultipleOfPow2")
{
    CHECK(pow5::MultipleOfPow2(uint32_t{0}, 31));
    CHECK(pow5::MultipleOfPow2(uint32_t{12}, 2));
    CHECK(!pow5::MultipleOfPow2(uint32_t{12}, 3));
    CHECK(pow5::MultipleOfPow2(uint32_t{7}, 0));

    CHECK(pow5::MultipleOfPow2(uint64_t{1} << 60, 60));
    CHECK(!pow5::MultipleOfPow2(uint64_t{1} << 60, 61));
    CHECK(pow5::MultipleOfPow2(uint64_t{0}, 63));
}

TEST_CASE("Pow5 - MultipleOfPow5")
{
    CHECK(pow5::MultipleOfPow5(uint32_t{7}, 0));
    CHECK(pow5::MultipleOfPow5(uint32_t{25}, 2));
    CHECK(!pow5::MultipleOfPow5(uint32_t{25}, 3));
    CHECK(pow5::MultipleOfPow5(uint32_t{1220703125}, 13));
    CHECK(!pow5::MultipleOfPow5(uint32_t{1220703124}, 1));
    CHECK(!pow5::MultipleOfPow5(uint32_t{1}, 20));
    CHECK(pow5::MultipleOfPow5(uint32_t{0}, 20));

    uint64_t p = 1;
    for (int e5 = 0; e5 <= 27; ++e5)
    {
        CAPTURE(e5);
        CHECK(pow5::MultipleOfPow5(p, e5));
        CHECK(pow5::MultipleOfPow5(2 * p, e5));
        CHECK(!pow5::MultipleOfPow5(p + 1, 1));
        CHECK(!pow5::MultipleOfPow5(p, e5 + 1));
        p *= 5;
    }

    CHECK(!pow5::MultipleOfPow5(uint64_t{12345678901234567}, 100));
    CHECK(pow5::MultipleOfPow5(uint64_t{0}, 100));
}
