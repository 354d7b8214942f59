// Copyright 2019 Ulf Adams
// Copyright 2019 Alexander Bolz
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "pow5.h"

#include <climits>
#include <cstdint>

using namespace ieeeparse;
using namespace ieeeparse::pow5;

static inline uint32_t Lo32(uint64_t x)
{
    return static_cast<uint32_t>(x);
}

static inline uint32_t Hi32(uint64_t x)
{
    return static_cast<uint32_t>(x >> 32);
}

//==================================================================================================
// Single-precision
//==================================================================================================
// Constant data = 752 (+ 112) bytes

static constexpr int BitsPerPow5_Single = 61;

// For k >= 0, stores the 61 leading bits of 5^k, i.e. floor( 5^k * 2^(61 - CeilLog2Pow5(k)) ).
static inline uint64_t ComputePow5_Single(int k)
{
    static constexpr int MaxDecExp = 38;
    static constexpr uint64_t Pow5[MaxDecExp + 1] = {
        0x1000000000000000, // 5^0
        0x1400000000000000, // 5^1
        0x1900000000000000, // 5^2
        0x1F40000000000000, // 5^3
        0x1388000000000000, // 5^4
        0x186A000000000000, // 5^5
        0x1E84800000000000, // 5^6
        0x1312D00000000000, // 5^7
        0x17D7840000000000, // 5^8
        0x1DCD650000000000, // 5^9
        0x12A05F2000000000, // 5^10
        0x174876E800000000, // 5^11
        0x1D1A94A200000000, // 5^12
        0x12309CE540000000, // 5^13
        0x16BCC41E90000000, // 5^14
        0x1C6BF52634000000, // 5^15
        0x11C37937E0800000, // 5^16
        0x16345785D8A00000, // 5^17
        0x1BC16D674EC80000, // 5^18
        0x1158E460913D0000, // 5^19
        0x15AF1D78B58C4000, // 5^20
        0x1B1AE4D6E2EF5000, // 5^21
        0x10F0CF064DD59200, // 5^22
        0x152D02C7E14AF680, // 5^23
        0x1A784379D99DB420, // 5^24
        0x108B2A2C28029094, // 5^25
        0x14ADF4B7320334B9, // 5^26
        0x19D971E4FE8401E7, // 5^27
        0x1027E72F1F128130, // 5^28
        0x1431E0FAE6D7217C, // 5^29
        0x193E5939A08CE9DB, // 5^30
        0x1F8DEF8808B02452, // 5^31
        0x13B8B5B5056E16B3, // 5^32
        0x18A6E32246C99C60, // 5^33
        0x1ED09BEAD87C0378, // 5^34
        0x13426172C74D822B, // 5^35
        0x1812F9CF7920E2B6, // 5^36
        0x1E17B84357691B64, // 5^37
        0x12CED32A16A1B11E, // 5^38
    };

    IEEEPARSE_ASSERT(k >= 0);
    IEEEPARSE_ASSERT(k <= MaxDecExp);
    return Pow5[static_cast<unsigned>(k)];
}

// For k >= 0, stores 5^-k in the form floor( 2^(CeilLog2Pow5(k) - 1 + 61) / 5^k ) + 1.
static inline uint64_t ComputePow5Inv_Single(int k)
{
    static constexpr int MaxDecExp = 54;
    static constexpr uint64_t Pow5Inv[MaxDecExp + 1] = {
        0x2000000000000001, // 5^-0
        0x199999999999999A, // 5^-1
        0x147AE147AE147AE2, // 5^-2
        0x10624DD2F1A9FBE8, // 5^-3
        0x1A36E2EB1C432CA6, // 5^-4
        0x14F8B588E368F085, // 5^-5
        0x10C6F7A0B5ED8D37, // 5^-6
        0x1AD7F29ABCAF4858, // 5^-7
        0x15798EE2308C39E0, // 5^-8
        0x112E0BE826D694B3, // 5^-9
        0x1B7CDFD9D7BDBAB8, // 5^-10
        0x15FD7FE179649560, // 5^-11
        0x119799812DEA111A, // 5^-12
        0x1C25C268497681C3, // 5^-13
        0x16849B86A12B9B02, // 5^-14
        0x1203AF9EE756159C, // 5^-15
        0x1CD2B297D889BC2C, // 5^-16
        0x170EF54646D4968A, // 5^-17
        0x12725DD1D243ABA1, // 5^-18
        0x1D83C94FB6D2AC35, // 5^-19
        0x179CA10C9242235E, // 5^-20
        0x12E3B40A0E9B4F7E, // 5^-21
        0x1E392010175EE597, // 5^-22
        0x182DB34012B25145, // 5^-23
        0x1357C299A88EA76B, // 5^-24
        0x1EF2D0F5DA7DD8AB, // 5^-25
        0x18C240C4AECB13BC, // 5^-26
        0x13CE9A36F23C0FCA, // 5^-27
        0x1FB0F6BE50601942, // 5^-28
        0x195A5EFEA6B34768, // 5^-29
        0x14484BFEEBC29F87, // 5^-30
        0x1039D66589687F9F, // 5^-31
        0x19F623D5A8A73298, // 5^-32
        0x14C4E977BA1F5BAD, // 5^-33
        0x109D8792FB4C4957, // 5^-34
        0x1A95A5B7F87A0EF1, // 5^-35
        0x154484932D2E725B, // 5^-36
        0x11039D428A8B8EAF, // 5^-37
        0x1B38FB9DAA78E44B, // 5^-38
        0x15C72FB1552D836F, // 5^-39
        0x116C262777579C59, // 5^-40
        0x1BE03D0BF225C6F5, // 5^-41
        0x164CFDA3281E38C4, // 5^-42
        0x11D7314F534B609D, // 5^-43
        0x1C8B821885456761, // 5^-44
        0x16D601AD376AB91B, // 5^-45
        0x1244CE242C5560E2, // 5^-46
        0x1D3AE36D13BBCE36, // 5^-47
        0x17624F8A762FD82C, // 5^-48
        0x12B50C6EC4F31356, // 5^-49
        0x1DEE7A4AD4B81EF0, // 5^-50
        0x17F1FB6F10934BF3, // 5^-51
        0x1327FC58DA0F6FF6, // 5^-52
        0x1EA6608E29B24CBC, // 5^-53
        0x18851A0B548EA3CA, // 5^-54
    };

    IEEEPARSE_ASSERT(k >= 0);
    IEEEPARSE_ASSERT(k <= MaxDecExp);
    return Pow5Inv[static_cast<unsigned>(k)];
}

static inline uint64_t MulShift(uint32_t m, uint64_t mul, int j)
{
    IEEEPARSE_ASSERT(j >= 32);
    IEEEPARSE_ASSERT(j <= 95);

#if defined(__SIZEOF_INT128__)
    __extension__ using uint128_t = unsigned __int128;
    const uint64_t shifted_sum = static_cast<uint64_t>((uint128_t{mul} * m) >> j);
#else
    const uint64_t bits0 = uint64_t{m} * Lo32(mul);
    const uint64_t bits1 = uint64_t{m} * Hi32(mul);
    const uint64_t sum = bits1 + Hi32(bits0);

    const int shift = j - 32;
    const uint64_t shifted_sum = sum >> shift;
#endif

    return shifted_sum;
}

uint32_t pow5::MulPow5DivPow2(uint32_t value, int e5, int e2)
{
    // value * 5^e5 / 2^e2 = value * Pow5[e5] / 2^j,
    // where j = e2 - (CeilLog2Pow5(e5) - BitsPerPow5).
    const int j = e2 - CeilLog2Pow5(e5) + BitsPerPow5_Single;
    const uint64_t product = MulShift(value, ComputePow5_Single(e5), j);
    IEEEPARSE_ASSERT(product <= UINT32_MAX);
    return static_cast<uint32_t>(product);
}

uint32_t pow5::MulPow5InvDivPow2(uint32_t value, int e5, int e2)
{
    // value / (5^e5 * 2^e2) = value * Pow5Inv[e5] / 2^j,
    // where j = e2 + (CeilLog2Pow5(e5) - 1 + BitsPerPow5).
    const int j = e2 + CeilLog2Pow5(e5) - 1 + BitsPerPow5_Single;
    const uint64_t product = MulShift(value, ComputePow5Inv_Single(e5), j);
    IEEEPARSE_ASSERT(product <= UINT32_MAX);
    return static_cast<uint32_t>(product);
}

bool pow5::MultipleOfPow5(uint32_t value, int e5)
{
    IEEEPARSE_ASSERT(e5 >= 0);

    struct MulCmp {
        uint32_t mul;
        uint32_t cmp;
    };

    static constexpr MulCmp Mod5[] = {
        {0x00000001u, 0xFFFFFFFFu}, // 5^0
        {0xCCCCCCCDu, 0x33333333u}, // 5^1
        {0xC28F5C29u, 0x0A3D70A3u}, // 5^2
        {0x26E978D5u, 0x020C49BAu}, // 5^3
        {0x3AFB7E91u, 0x0068DB8Bu}, // 5^4
        {0x0BCBE61Du, 0x0014F8B5u}, // 5^5
        {0x68C26139u, 0x000431BDu}, // 5^6
        {0xAE8D46A5u, 0x0000D6BFu}, // 5^7
        {0x22E90E21u, 0x00002AF3u}, // 5^8
        {0x3A2E9C6Du, 0x00000897u}, // 5^9
        {0x3ED61F49u, 0x000001B7u}, // 5^10
        {0x0C913975u, 0x00000057u}, // 5^11
        {0xCF503EB1u, 0x00000011u}, // 5^12
        {0xF6433FBDu, 0x00000003u}, // 5^13
    };

    // 5^14 > 2^32: only 0 is a multiple.
    if (e5 >= static_cast<int>(sizeof(Mod5) / sizeof(Mod5[0])))
        return value == 0;

    const auto m5 = Mod5[static_cast<unsigned>(e5)];
    return value * m5.mul <= m5.cmp;
}

//==================================================================================================
// Double-precision
//==================================================================================================
// Constant data = 10'400 (+ 448) bytes

static constexpr int BitsPerPow5_Double = 125;

namespace {
struct Uint64x2 {
    uint64_t hi;
    uint64_t lo;
};
}

// For k >= 0, stores the 125 leading bits of 5^k, i.e. floor( 5^k * 2^(125 - CeilLog2Pow5(k)) ).
static inline Uint64x2 ComputePow5_Double(int k)
{
    static constexpr int MaxDecExp = 308;
    static constexpr Uint64x2 Pow5[MaxDecExp + 1] = {
        {0x1000000000000000, 0x0000000000000000}, // 5^0
        {0x1400000000000000, 0x0000000000000000}, // 5^1
        {0x1900000000000000, 0x0000000000000000}, // 5^2
        {0x1F40000000000000, 0x0000000000000000}, // 5^3
        {0x1388000000000000, 0x0000000000000000}, // 5^4
        {0x186A000000000000, 0x0000000000000000}, // 5^5
        {0x1E84800000000000, 0x0000000000000000}, // 5^6
        {0x1312D00000000000, 0x0000000000000000}, // 5^7
        {0x17D7840000000000, 0x0000000000000000}, // 5^8
        {0x1DCD650000000000, 0x0000000000000000}, // 5^9
        {0x12A05F2000000000, 0x0000000000000000}, // 5^10
        {0x174876E800000000, 0x0000000000000000}, // 5^11
        {0x1D1A94A200000000, 0x0000000000000000}, // 5^12
        {0x12309CE540000000, 0x0000000000000000}, // 5^13
        {0x16BCC41E90000000, 0x0000000000000000}, // 5^14
        {0x1C6BF52634000000, 0x0000000000000000}, // 5^15
        {0x11C37937E0800000, 0x0000000000000000}, // 5^16
        {0x16345785D8A00000, 0x0000000000000000}, // 5^17
        {0x1BC16D674EC80000, 0x0000000000000000}, // 5^18
        {0x1158E460913D0000, 0x0000000000000000}, // 5^19
        {0x15AF1D78B58C4000, 0x0000000000000000}, // 5^20
        {0x1B1AE4D6E2EF5000, 0x0000000000000000}, // 5^21
        {0x10F0CF064DD59200, 0x0000000000000000}, // 5^22
        {0x152D02C7E14AF680, 0x0000000000000000}, // 5^23
        {0x1A784379D99DB420, 0x0000000000000000}, // 5^24
        {0x108B2A2C28029094, 0x0000000000000000}, // 5^25
        {0x14ADF4B7320334B9, 0x0000000000000000}, // 5^26
        {0x19D971E4FE8401E7, 0x4000000000000000}, // 5^27
        {0x1027E72F1F128130, 0x8800000000000000}, // 5^28
        {0x1431E0FAE6D7217C, 0xAA00000000000000}, // 5^29
        {0x193E5939A08CE9DB, 0xD480000000000000}, // 5^30
        {0x1F8DEF8808B02452, 0xC9A0000000000000}, // 5^31
        {0x13B8B5B5056E16B3, 0xBE04000000000000}, // 5^32
        {0x18A6E32246C99C60, 0xAD85000000000000}, // 5^33
        {0x1ED09BEAD87C0378, 0xD8E6400000000000}, // 5^34
        {0x13426172C74D822B, 0x878FE80000000000}, // 5^35
        {0x1812F9CF7920E2B6, 0x6973E20000000000}, // 5^36
        {0x1E17B84357691B64, 0x03D0DA8000000000}, // 5^37
        {0x12CED32A16A1B11E, 0x8262889000000000}, // 5^38
        {0x178287F49C4A1D66, 0x22FB2AB400000000}, // 5^39
        {0x1D6329F1C35CA4BF, 0xABB9F56100000000}, // 5^40
        {0x125DFA371A19E6F7, 0xCB54395CA0000000}, // 5^41
        {0x16F578C4E0A060B5, 0xBE2947B3C8000000}, // 5^42
        {0x1CB2D6F618C878E3, 0x2DB399A0BA000000}, // 5^43
        {0x11EFC659CF7D4B8D, 0xFC90400474400000}, // 5^44
        {0x166BB7F0435C9E71, 0x7BB4500591500000}, // 5^45
        {0x1C06A5EC5433C60D, 0xDAA16406F5A40000}, // 5^46
        {0x118427B3B4A05BC8, 0xA8A4DE8459868000}, // 5^47
        {0x15E531A0A1C872BA, 0xD2CE16256FE82000}, // 5^48
        {0x1B5E7E08CA3A8F69, 0x87819BAECBE22800}, // 5^49
        {0x111B0EC57E6499A1, 0xF4B1014D3F6D5900}, // 5^50
        {0x1561D276DDFDC00A, 0x71DD41A08F48AF40}, // 5^51
        {0x1ABA4714957D300D, 0x0E549208B31ADB10}, // 5^52
        {0x10B46C6CDD6E3E08, 0x28F4DB456FF0C8EA}, // 5^53
        {0x14E1878814C9CD8A, 0x33321216CBECFB24}, // 5^54
        {0x1A19E96A19FC40EC, 0xBFFE969C7EE839ED}, // 5^55
        {0x105031E2503DA893, 0xF7FF1E21CF512434}, // 5^56
        {0x14643E5AE44D12B8, 0xF5FEE5AA43256D41}, // 5^57
        {0x197D4DF19D605767, 0x337E9F14D3EEC892}, // 5^58
        {0x1FDCA16E04B86D41, 0x005E46DA08EA7AB6}, // 5^59
        {0x13E9E4E4C2F34448, 0xA03AEC4845928CB2}, // 5^60
        {0x18E45E1DF3B0155A, 0xC849A75A56F72FDE}, // 5^61
        {0x1F1D75A5709C1AB1, 0x7A5C1130ECB4FBD6}, // 5^62
        {0x13726987666190AE, 0xEC798ABE93F11D65}, // 5^63
        {0x184F03E93FF9F4DA, 0xA797ED6E38ED64BF}, // 5^64
        {0x1E62C4E38FF87211, 0x517DE8C9C728BDEF}, // 5^65
        {0x12FDBB0E39FB474A, 0xD2EEB17E1C7976B5}, // 5^66
        {0x17BD29D1C87A191D, 0x87AA5DDDA397D462}, // 5^67
        {0x1DAC74463A989F64, 0xE994F5550C7DC97B}, // 5^68
        {0x128BC8ABE49F639F, 0x11FD195527CE9DED}, // 5^69
        {0x172EBAD6DDC73C86, 0xD67C5FAA71C24568}, // 5^70
        {0x1CFA698C95390BA8, 0x8C1B77950E32D6C2}, // 5^71
        {0x121C81F7DD43A749, 0x57912ABD28DFC639}, // 5^72
        {0x16A3A275D494911B, 0xAD75756C7317B7C8}, // 5^73
        {0x1C4C8B1349B9B562, 0x98D2D2C78FDDA5BA}, // 5^74
        {0x11AFD6EC0E14115D, 0x9F83C3BCB9EA8794}, // 5^75
        {0x161BCCA7119915B5, 0x0764B4ABE8652979}, // 5^76
        {0x1BA2BFD0D5FF5B22, 0x493DE1D6E27E73D7}, // 5^77
        {0x1145B7E285BF98F5, 0x6DC6AD264D8F0866}, // 5^78
        {0x159725DB272F7F32, 0xC938586FE0F2CA80}, // 5^79
        {0x1AFCEF51F0FB5EFF, 0x7B866E8BD92F7D20}, // 5^80
        {0x10DE1593369D1B5F, 0xAD34051767BDAE34}, // 5^81
        {0x15159AF804446237, 0x9881065D41AD19C1}, // 5^82
        {0x1A5B01B605557AC5, 0x7EA147F492186032}, // 5^83
        {0x1078E111C3556CBB, 0x6F24CCF8DB4F3C1F}, // 5^84
        {0x14971956342AC7EA, 0x4AEE003712230B27}, // 5^85
        {0x19BCDFABC13579E4, 0xDDA98044D6ABCDF0}, // 5^86
        {0x10160BCB58C16C2F, 0x0A89F02B062B60B6}, // 5^87
        {0x141B8EBE2EF1C73A, 0xCD2C6C35C7B638E4}, // 5^88
        {0x1922726DBAAE3909, 0x8077874339A3C71D}, // 5^89
        {0x1F6B0F092959C74B, 0xE0956914080CB8E4}, // 5^90
        {0x13A2E965B9D81C8F, 0x6C5D61AC8507F38E}, // 5^91
        {0x188BA3BF284E23B3, 0x4774BA17A649F072}, // 5^92
        {0x1EAE8CAEF261ACA0, 0x1951E89D8FDC6C8F}, // 5^93
        {0x132D17ED577D0BE4, 0x0FD3316279E9C3D9}, // 5^94
        {0x17F85DE8AD5C4EDD, 0x13C7FDBB186434CF}, // 5^95
        {0x1DF67562D8B36294, 0x58B9FD29DE7D4203}, // 5^96
        {0x12BA095DC7701D9C, 0xB7743E3A2B0E4942}, // 5^97
        {0x17688BB5394C2503, 0xE5514DC8B5D1DB92}, // 5^98
        {0x1D42AEA2879F2E44, 0xDEA5A13AE3465277}, // 5^99
        {0x1249AD2594C37CEB, 0x0B2784C4CE0BF38A}, // 5^100
        {0x16DC186EF9F45C25, 0xCDF165F6018EF06D}, // 5^101
        {0x1C931E8AB871732F, 0x416DBF7381F2AC88}, // 5^102
        {0x11DBF316B346E7FD, 0x88E497A83137ABD5}, // 5^103
        {0x1652EFDC6018A1FC, 0xEB1DBD923D8596CA}, // 5^104
        {0x1BE7ABD3781ECA7C, 0x25E52CF6CCE6FC7D}, // 5^105
        {0x1170CB642B133E8D, 0x97AF3C1A40105DCE}, // 5^106
        {0x15CCFE3D35D80E30, 0xFD9B0B20D0147542}, // 5^107
        {0x1B403DCC834E11BD, 0x3D01CDE904199292}, // 5^108
        {0x1108269FD210CB16, 0x462120B1A28FFB9B}, // 5^109
        {0x154A3047C694FDDB, 0xD7A968DE0B33FA82}, // 5^110
        {0x1A9CBC59B83A3D52, 0xCD93C3158E00F923}, // 5^111
        {0x10A1F5B813246653, 0xC07C59ED78C09BB6}, // 5^112
        {0x14CA732617ED7FE8, 0xB09B7068D6F0C2A3}, // 5^113
        {0x19FD0FEF9DE8DFE2, 0xDCC24C830CACF34C}, // 5^114
        {0x103E29F5C2B18BED, 0xC9F96FD1E7EC180F}, // 5^115
        {0x144DB473335DEEE9, 0x3C77CBC661E71E13}, // 5^116
        {0x1961219000356AA3, 0x8B95BEB7FA60E598}, // 5^117
        {0x1FB969F40042C54C, 0x6E7B2E65F8F91EFE}, // 5^118
        {0x13D3E2388029BB4F, 0xC50CFCFFBB9BB35F}, // 5^119
        {0x18C8DAC6A0342A23, 0xB6503C3FAA82A037}, // 5^120
        {0x1EFB1178484134AC, 0xA3E44B4F95234844}, // 5^121
        {0x135CEAEB2D28C0EB, 0xE66EAF11BD360D2B}, // 5^122
        {0x183425A5F872F126, 0xE00A5AD62C839075}, // 5^123
        {0x1E412F0F768FAD70, 0x980CF18BB7A47493}, // 5^124
        {0x12E8BD69AA19CC66, 0x5F0816F752C6C8DC}, // 5^125
        {0x17A2ECC414A03F7F, 0xF6CA1CB527787B13}, // 5^126
        {0x1D8BA7F519C84F5F, 0xF47CA3E2715699D7}, // 5^127
        {0x127748F9301D319B, 0xF8CDE66D86D62026}, // 5^128
        {0x17151B377C247E02, 0xF7016008E88BA830}, // 5^129
        {0x1CDA62055B2D9D83, 0xB4C1B80B22AE923C}, // 5^130
        {0x12087D4358FC8272, 0x50F91306F5AD1B65}, // 5^131
        {0x168A9C942F3BA30E, 0xE53757C8B318623F}, // 5^132
        {0x1C2D43B93B0A8BD2, 0x9E852DBADFDE7ACF}, // 5^133
        {0x119C4A53C4E69763, 0xA3133C94CBEB0CC1}, // 5^134
        {0x16035CE8B6203D3C, 0x8BD80BB9FEE5CFF1}, // 5^135
        {0x1B843422E3A84C8B, 0xAECE0EA87E9F43EE}, // 5^136
        {0x1132A095CE492FD7, 0x4D40C9294F238A75}, // 5^137
        {0x157F48BB41DB7BCD, 0x2090FB73A2EC6D12}, // 5^138
        {0x1ADF1AEA12525AC0, 0x68B53A508BA78856}, // 5^139
        {0x10CB70D24B7378B8, 0x417144725748B536}, // 5^140
        {0x14FE4D06DE5056E6, 0x51CD958EED1AE283}, // 5^141
        {0x1A3DE04895E46C9F, 0xE640FAF2A8619B24}, // 5^142
        {0x1066AC2D5DAEC3E3, 0xEFE89CD7A93D00F7}, // 5^143
        {0x14805738B51A74DC, 0xEBE2C40D938C4134}, // 5^144
        {0x19A06D06E2611214, 0x26DB7510F86F5181}, // 5^145
        {0x100444244D7CAB4C, 0x9849292A9B4592F1}, // 5^146
        {0x1405552D60DBD61F, 0xBE5B73754216F7AD}, // 5^147
        {0x1906AA78B912CBA7, 0xADF25052929CB598}, // 5^148
        {0x1F485516E7577E91, 0x996EE4673743E2FF}, // 5^149
        {0x138D352E5096AF1A, 0xFFE54EC0828A6DDF}, // 5^150
        {0x18708279E4BC5AE1, 0xBFDEA270A32D0957}, // 5^151
        {0x1E8CA3185DEB719A, 0x2FD64B0CCBF84BAD}, // 5^152
        {0x1317E5EF3AB32700, 0x5DE5EEE7FF7B2F4C}, // 5^153
        {0x17DDDF6B095FF0C0, 0x755F6AA1FF59FB1F}, // 5^154
        {0x1DD55745CBB7ECF0, 0x92B7454A7F3079E7}, // 5^155
        {0x12A5568B9F52F416, 0x5BB28B4E8F7E4C30}, // 5^156
        {0x174EAC2E8727B11B, 0xF29F2E22335DDF3C}, // 5^157
        {0x1D22573A28F19D62, 0xEF46F9AAC035570B}, // 5^158
        {0x123576845997025D, 0xD58C5C0AB8215667}, // 5^159
        {0x16C2D4256FFCC2F5, 0x4AEF730D6629AC01}, // 5^160
        {0x1C73892ECBFBF3B2, 0x9DAB4FD0BFB41701}, // 5^161
        {0x11C835BD3F7D784F, 0xA28B11E277D08E60}, // 5^162
        {0x163A432C8F5CD663, 0x8B2DD65B15C4B1F9}, // 5^163
        {0x1BC8D3F7B3340BFC, 0x6DF94BF1DB35DE77}, // 5^164
        {0x115D847AD000877D, 0xC4BBCF772901AB0A}, // 5^165
        {0x15B4E5998400A95D, 0x35EAC354F34215CD}, // 5^166
        {0x1B221EFFE500D3B4, 0x8365742A30129B40}, // 5^167
        {0x10F5535FEF208450, 0xD21F689A5E0BA108}, // 5^168
        {0x1532A837EAE8A565, 0x06A742C0F58E894A}, // 5^169
        {0x1A7F5245E5A2CEBE, 0x4851137132F22B9D}, // 5^170
        {0x108F936BAF85C136, 0xED32AC26BFD75B42}, // 5^171
        {0x14B378469B673184, 0xA87F57306FCD3212}, // 5^172
        {0x19E056584240FDE5, 0xD29F2CFC8BC07E97}, // 5^173
        {0x102C35F729689EAF, 0xA3A37C1DD7584F1E}, // 5^174
        {0x14374374F3C2C65B, 0x8C8C5B254D2E62E6}, // 5^175
        {0x1945145230B377F2, 0x6FAF71EEA079FB9F}, // 5^176
        {0x1F965966BCE055EF, 0x0B9B4E6A48987A87}, // 5^177
        {0x13BDF7E0360C35B5, 0x674111026D5F4C94}, // 5^178
        {0x18AD75D8438F4322, 0xC111554308B71FBA}, // 5^179
        {0x1ED8D34E547313EB, 0x7155AA93CAE4E7A8}, // 5^180
        {0x13478410F4C7EC73, 0x26D58A9C5ECF10C9}, // 5^181
        {0x1819651531F9E78F, 0xF08AED437682D4FB}, // 5^182
        {0x1E1FBE5A7E786173, 0xECADA89454238A3A}, // 5^183
        {0x12D3D6F88F0B3CE8, 0x73EC895CB4963664}, // 5^184
        {0x1788CCB6B2CE0C22, 0x90E7ABB3E1BBC3FD}, // 5^185
        {0x1D6AFFE45F818F2B, 0x352196A0DA2AB4FD}, // 5^186
        {0x1262DFEEBBB0F97B, 0x0134FE24885AB11E}, // 5^187
        {0x16FB97EA6A9D37D9, 0xC1823DADAA715D65}, // 5^188
        {0x1CBA7DE5054485D0, 0x31E2CD19150DB4BF}, // 5^189
        {0x11F48EAF234AD3A2, 0x1F2DC02FAD2890F7}, // 5^190
        {0x1671B25AEC1D888A, 0xA6F9303B9872B535}, // 5^191
        {0x1C0E1EF1A724EAAD, 0x50B77C4A7E8F6282}, // 5^192
        {0x1188D357087712AC, 0x5272ADAE8F199D91}, // 5^193
        {0x15EB082CCA94D757, 0x670F591A32E004F6}, // 5^194
        {0x1B65CA37FD3A0D2D, 0x40D32F60BF980633}, // 5^195
        {0x111F9E62FE44483C, 0x4883FD9C77BF03E0}, // 5^196
        {0x156785FBBDD55A4B, 0x5AA4FD0395AEC4D8}, // 5^197
        {0x1AC1677AAD4AB0DE, 0x314E3C447B1A760E}, // 5^198
        {0x10B8E0ACAC4EAE8A, 0xDED0E5AACCF089C9}, // 5^199
        {0x14E718D7D7625A2D, 0x96851F15802CAC3B}, // 5^200
        {0x1A20DF0DCD3AF0B8, 0xFC2666DAE037D74A}, // 5^201
        {0x10548B68A044D673, 0x9D980048CC22E68E}, // 5^202
        {0x1469AE42C8560C10, 0x84FE005AFF2BA032}, // 5^203
        {0x198419D37A6B8F14, 0xA63D8071BEF6883E}, // 5^204
        {0x1FE52048590672D9, 0xCFCCE08E2EB42A4E}, // 5^205
        {0x13EF342D37A407C8, 0x21E00C58DD309A70}, // 5^206
        {0x18EB0138858D09BA, 0x2A580F6F147CC10D}, // 5^207
        {0x1F25C186A6F04C28, 0xB4EE134AD99BF150}, // 5^208
        {0x137798F428562F99, 0x7114CC0EC80176D2}, // 5^209
        {0x18557F31326BBB7F, 0xCD59FF127A01D486}, // 5^210
        {0x1E6ADEFD7F06AA5F, 0xC0B07ED7188249A8}, // 5^211
        {0x1302CB5E6F642A7B, 0xD86E4F466F516E09}, // 5^212
        {0x17C37E360B3D351A, 0xCE89E3180B25C98B}, // 5^213
        {0x1DB45DC38E0C8261, 0x822C5BDE0DEF3BEE}, // 5^214
        {0x1290BA9A38C7D17C, 0xF15BB96AC8B58575}, // 5^215
        {0x1734E940C6F9C5DC, 0x2DB2A7C57AE2E6D2}, // 5^216
        {0x1D022390F8B83753, 0x391F51B6D99BA086}, // 5^217
        {0x1221563A9B732294, 0x03B3931248014454}, // 5^218
        {0x16A9ABC9424FEB39, 0x04A077D6DA019569}, // 5^219
        {0x1C5416BB92E3E607, 0x45C895CC9081FAC3}, // 5^220
        {0x11B48E353BCE6FC4, 0x8B9D5D9FDA513CBA}, // 5^221
        {0x1621B1C28AC20BB5, 0xAE84B507D0E58BE8}, // 5^222
        {0x1BAA1E332D728EA3, 0x1A25E249C51EEEE3}, // 5^223
        {0x114A52DFFC679925, 0xF057AD6E1B33554D}, // 5^224
        {0x159CE797FB817F6F, 0x6C6D98C9A2002AA1}, // 5^225
        {0x1B04217DFA61DF4B, 0x4788FEFC0A803549}, // 5^226
        {0x10E294EEBC7D2B8F, 0x0CB59F5D8690214E}, // 5^227
        {0x151B3A2A6B9C7672, 0xCFE30734E83429A1}, // 5^228
        {0x1A6208B50683940F, 0x83DBC9022241340A}, // 5^229
        {0x107D457124123C89, 0xB2695DA15568C086}, // 5^230
        {0x149C96CD6D16CBAC, 0x1F03B509AAC2F0A7}, // 5^231
        {0x19C3BC80C85C7E97, 0x26C4A24C1573ACD1}, // 5^232
        {0x101A55D07D39CF1E, 0x783AE56F8D684C03}, // 5^233
        {0x1420EB449C8842E6, 0x16499ECB70C25F03}, // 5^234
        {0x19292615C3AA539F, 0x9BDC067E4CF2F6C4}, // 5^235
        {0x1F736F9B3494E887, 0x82D3081DE02FB476}, // 5^236
        {0x13A825C100DD1154, 0xB1C3E512AC1DD0C9}, // 5^237
        {0x18922F31411455A9, 0xDE34DE57572544FC}, // 5^238
        {0x1EB6BAFD91596B14, 0x55C215ED2CEE963B}, // 5^239
        {0x133234DE7AD7E2EC, 0xB5994DB43C151DE5}, // 5^240
        {0x17FEC216198DDBA7, 0xE2FFA1214B1A655E}, // 5^241
        {0x1DFE729B9FF15291, 0xDBBF89699DE0FEB6}, // 5^242
        {0x12BF07A143F6D39B, 0x2957B5E202AC9F31}, // 5^243
        {0x176EC98994F48881, 0xF3ADA35A8357C6FE}, // 5^244
        {0x1D4A7BEBFA31AAA2, 0x70990C31242DB8BD}, // 5^245
        {0x124E8D737C5F0AA5, 0x865FA79EB69C9376}, // 5^246
        {0x16E230D05B76CD4E, 0xE7F791866443B854}, // 5^247
        {0x1C9ABD04725480A2, 0xA1F575E7FD54A669}, // 5^248
        {0x11E0B622C774D065, 0xA53969B0FE54E801}, // 5^249
        {0x1658E3AB7952047F, 0x0E87C41D3DEA2202}, // 5^250
        {0x1BEF1C9657A6859E, 0xD229B5248D64AA82}, // 5^251
        {0x117571DDF6C81383, 0x435A1136D85EEA91}, // 5^252
        {0x15D2CE55747A1864, 0x143095848E76A536}, // 5^253
        {0x1B4781EAD1989E7D, 0x193CBAE5B2144E83}, // 5^254
        {0x110CB132C2FF630E, 0x2FC5F4CF8F4CB112}, // 5^255
        {0x154FDD7F73BF3BD1, 0xBBB77203731FDD56}, // 5^256
        {0x1AA3D4DF50AF0AC6, 0x2AA54E844FE7D4AC}, // 5^257
        {0x10A6650B926D66BB, 0xDAA75112B1F0E4EB}, // 5^258
        {0x14CFFE4E7708C06A, 0xD15125575E6D1E26}, // 5^259
        {0x1A03FDE214CAF085, 0x85A56EAD360865B0}, // 5^260
        {0x10427EAD4CFED653, 0x7387652C41C53F8E}, // 5^261
        {0x14531E58A03E8BE8, 0x50693E7752368F71}, // 5^262
        {0x1967E5EEC84E2EE2, 0x64838E1526C4334E}, // 5^263
        {0x1FC1DF6A7A61BA9A, 0xFDA4719A70754022}, // 5^264
        {0x13D92BA28C7D14A0, 0xDE86C70086494815}, // 5^265
        {0x18CF768B2F9C59C9, 0x162878C0A7DB9A1A}, // 5^266
        {0x1F03542DFB83703B, 0x5BB296F0D1D280A1}, // 5^267
        {0x1362149CBD322625, 0x194F9E5683239064}, // 5^268
        {0x183A99C3EC7EAFAE, 0x5FA385EC23EC747E}, // 5^269
        {0x1E494034E79E5B99, 0xF78C67672CE7919D}, // 5^270
        {0x12EDC82110C2F940, 0x3AB7C0A07C10BB02}, // 5^271
        {0x17A93A2954F3B790, 0x4965B0C89B14E9C3}, // 5^272
        {0x1D9388B3AA30A574, 0x5BBF1CFAC1DA2433}, // 5^273
        {0x127C35704A5E6768, 0xB957721CB92856A0}, // 5^274
        {0x171B42CC5CF60142, 0xE7AD4EA3E7726C48}, // 5^275
        {0x1CE2137F74338193, 0xA198A24CE14F075A}, // 5^276
        {0x120D4C2FA8A030FC, 0x44FF65700CD16498}, // 5^277
        {0x16909F3B92C83D3B, 0x563F3ECC1005BDBE}, // 5^278
        {0x1C34C70A777A4C8A, 0x2BCF0E7F14072D2E}, // 5^279
        {0x11A0FC668AAC6FD6, 0x5B61690F6C847C3D}, // 5^280
        {0x16093B802D578BCB, 0xF239C35347A59B4C}, // 5^281
        {0x1B8B8A6038AD6EBE, 0xEEC83428198F021F}, // 5^282
        {0x1137367C236C6537, 0x553D20990FF96153}, // 5^283
        {0x1585041B2C477E85, 0x2A8C68BF53F7B9A8}, // 5^284
        {0x1AE64521F7595E26, 0x752F82EF28F5A812}, // 5^285
        {0x10CFEB353A97DAD8, 0x093DB1D57999890B}, // 5^286
        {0x1503E602893DD18E, 0x0B8D1E4AD7FFEB4E}, // 5^287
        {0x1A44DF832B8D45F1, 0x8E7065DD8DFFE622}, // 5^288
        {0x106B0BB1FB384BB6, 0xF9063FAA78BFEFD5}, // 5^289
        {0x1485CE9E7A065EA4, 0xB747CF9516EFEBCA}, // 5^290
        {0x19A742461887F64D, 0xE519C37A5CABE6BD}, // 5^291
        {0x1008896BCF54F9F0, 0xAF301A2C79EB7036}, // 5^292
        {0x140AABC6C32A386C, 0xDAFC20B798664C43}, // 5^293
        {0x190D56B873F4C688, 0x11BB28E57E7FDF54}, // 5^294
        {0x1F50AC6690F1F82A, 0x1629F31EDE1FD72A}, // 5^295
        {0x13926BC01A973B1A, 0x4DDA37F34AD3E67A}, // 5^296
        {0x187706B0213D09E0, 0xE150C5F01D88E019}, // 5^297
        {0x1E94C85C298C4C59, 0x19A4F76C24EB181F}, // 5^298
        {0x131CFD3999F7AFB7, 0xB0071AA39712EF13}, // 5^299
        {0x17E43C8800759BA5, 0x9C08E14C7CD7AAD8}, // 5^300
        {0x1DDD4BAA0093028F, 0x030B199F9C0D958E}, // 5^301
        {0x12AA4F4A405BE199, 0x61E6F003C1887D79}, // 5^302
        {0x1754E31CD072D9FF, 0xBA60AC04B1EA9CD7}, // 5^303
        {0x1D2A1BE4048F907F, 0xA8F8D705DE65440D}, // 5^304
        {0x123A516E82D9BA4F, 0xC99B8663AAFF4A88}, // 5^305
        {0x16C8E5CA239028E3, 0xBC0267FC95BF1D2A}, // 5^306
        {0x1C7B1F3CAC74331C, 0xAB0301FBBB2EE474}, // 5^307
        {0x11CCF385EBC89FF1, 0xEAE1E13D54FD4EC9}, // 5^308
    };

    IEEEPARSE_ASSERT(k >= 0);
    IEEEPARSE_ASSERT(k <= MaxDecExp);
    return Pow5[static_cast<unsigned>(k)];
}

// For k >= 0, stores 5^-k in the form floor( 2^(CeilLog2Pow5(k) - 1 + 125) / 5^k ) + 1.
static inline Uint64x2 ComputePow5Inv_Double(int k)
{
    static constexpr int MaxDecExp = 340;
    static constexpr Uint64x2 Pow5Inv[MaxDecExp + 1] = {
        {0x2000000000000000, 0x0000000000000001}, // 5^-0
        {0x1999999999999999, 0x999999999999999A}, // 5^-1
        {0x147AE147AE147AE1, 0x47AE147AE147AE15}, // 5^-2
        {0x10624DD2F1A9FBE7, 0x6C8B4395810624DE}, // 5^-3
        {0x1A36E2EB1C432CA5, 0x7A786C226809D496}, // 5^-4
        {0x14F8B588E368F084, 0x61F9F01B866E43AB}, // 5^-5
        {0x10C6F7A0B5ED8D36, 0xB4C7F34938583622}, // 5^-6
        {0x1AD7F29ABCAF4857, 0x87A6520EC08D236A}, // 5^-7
        {0x15798EE2308C39DF, 0x9FB841A566D74F88}, // 5^-8
        {0x112E0BE826D694B2, 0xE62D01511F12A607}, // 5^-9
        {0x1B7CDFD9D7BDBAB7, 0xD6AE6881CB5109A4}, // 5^-10
        {0x15FD7FE17964955F, 0xDEF1ED34A2A73AEA}, // 5^-11
        {0x119799812DEA1119, 0x7F27F0F6E885C8BB}, // 5^-12
        {0x1C25C268497681C2, 0x650CB4BE40D60DF8}, // 5^-13
        {0x16849B86A12B9B01, 0xEA70909833DE7193}, // 5^-14
        {0x1203AF9EE756159B, 0x21F3A6E0297EC143}, // 5^-15
        {0x1CD2B297D889BC2B, 0x6985D7CD0F313537}, // 5^-16
        {0x170EF54646D49689, 0x2137DFD73F5A90F9}, // 5^-17
        {0x12725DD1D243ABA0, 0xE75FE645CC4873FA}, // 5^-18
        {0x1D83C94FB6D2AC34, 0xA5663D3C7A0D865D}, // 5^-19
        {0x179CA10C9242235D, 0x511E976394D79EB1}, // 5^-20
        {0x12E3B40A0E9B4F7D, 0xDA7EDF82DD794BC1}, // 5^-21
        {0x1E392010175EE596, 0x2A6498D1625BAC68}, // 5^-22
        {0x182DB34012B25144, 0xEEB6E0A781E2F053}, // 5^-23
        {0x1357C299A88EA76A, 0x58924D52CE4F26A9}, // 5^-24
        {0x1EF2D0F5DA7DD8AA, 0x27507BB7B07EA441}, // 5^-25
        {0x18C240C4AECB13BB, 0x52A6C95FC0655034}, // 5^-26
        {0x13CE9A36F23C0FC9, 0x0EEBD44C99EAA690}, // 5^-27
        {0x1FB0F6BE50601941, 0xB17953ADC3110A80}, // 5^-28
        {0x195A5EFEA6B34767, 0xC12DDC8B02740867}, // 5^-29
        {0x14484BFEEBC29F86, 0x3424B06F3529A052}, // 5^-30
        {0x1039D66589687F9E, 0x901D59F290EE19DB}, // 5^-31
        {0x19F623D5A8A73297, 0x4CFBC31DB4B0295F}, // 5^-32
        {0x14C4E977BA1F5BAC, 0x3D9635B15D59BAB2}, // 5^-33
        {0x109D8792FB4C4956, 0x97AB5E277DE16228}, // 5^-34
        {0x1A95A5B7F87A0EF0, 0xF2ABC9D8C9689D0D}, // 5^-35
        {0x154484932D2E725A, 0x5BBCA17A3ABA173E}, // 5^-36
        {0x11039D428A8B8EAE, 0xAFCA1AC82EFB45CB}, // 5^-37
        {0x1B38FB9DAA78E44A, 0xB2DCF7A6B1920945}, // 5^-38
        {0x15C72FB1552D836E, 0xF57D92EBC141A104}, // 5^-39
        {0x116C262777579C58, 0xC46475896767B403}, // 5^-40
        {0x1BE03D0BF225C6F4, 0x6D6D88DBD8A5ECD2}, // 5^-41
        {0x164CFDA3281E38C3, 0x8ABE071646EB23DB}, // 5^-42
        {0x11D7314F534B609C, 0x6EFE6C11D255B649}, // 5^-43
        {0x1C8B821885456760, 0xB197134FB6EF8A0E}, // 5^-44
        {0x16D601AD376AB91A, 0x27AC0F72F8BFA1A5}, // 5^-45
        {0x1244CE242C5560E1, 0xB95672C260994E1E}, // 5^-46
        {0x1D3AE36D13BBCE35, 0xF5571E03CDC21695}, // 5^-47
        {0x17624F8A762FD82B, 0x2AAC18030B01ABAB}, // 5^-48
        {0x12B50C6EC4F31355, 0xBBBCE0026F348956}, // 5^-49
        {0x1DEE7A4AD4B81EEF, 0x92C7CCD0B1EDA889}, // 5^-50
        {0x17F1FB6F10934BF2, 0xDBD30A408E57BA07}, // 5^-51
        {0x1327FC58DA0F6FF5, 0x7CA8D50071DFC806}, // 5^-52
        {0x1EA6608E29B24CBB, 0xFAA7BB33E9660CD6}, // 5^-53
        {0x18851A0B548EA3C9, 0x9552FC298784D711}, // 5^-54
        {0x139DAE6F76D88307, 0xAAA8C9BAD2D0AC0E}, // 5^-55
        {0x1F62B0B257C0D1A5, 0xDDDADC5E1E1AACE3}, // 5^-56
        {0x191BC08EAC9A4151, 0x7E48B04B4B488A4F}, // 5^-57
        {0x141633A556E1CDDA, 0xCB6D59D5D5D3A1D9}, // 5^-58
        {0x1011C2EAABE7D7E2, 0x3C577B1177DC817B}, // 5^-59
        {0x19B604AAACA62636, 0xC6F25E825960CF2A}, // 5^-60
        {0x14919D5556EB51C5, 0x6BF518684780A5BB}, // 5^-61
        {0x10747DDDDF22A7D1, 0x232A79ED06008496}, // 5^-62
        {0x1A53FC9631D10C81, 0xD1DD8FE1A3340756}, // 5^-63
        {0x150FFD44F4A73D34, 0xA7E4731AE8F66C45}, // 5^-64
        {0x10D9976A5D52975D, 0x531D28E253F8569E}, // 5^-65
        {0x1AF5BF109550F22E, 0xEB61DB03B98D5762}, // 5^-66
        {0x159165A6DDDA5B58, 0xBC4E48CFC7A445E8}, // 5^-67
        {0x11411E1F17E1E2AD, 0x6371D3D96C836B20}, // 5^-68
        {0x1B9B6364F3030448, 0x9F1C8628AD9F11CD}, // 5^-69
        {0x1615E91D8F359D06, 0xE5B06B53BE18DB0B}, // 5^-70
        {0x11AB20E472914A6B, 0xEAF3890FCB4715A2}, // 5^-71
        {0x1C45016D841BAA46, 0x44B8DB4C7871BC37}, // 5^-72
        {0x169D9ABE03495505, 0x03C715D6C6C1635F}, // 5^-73
        {0x1217AEFE69077737, 0x3638DE456BCDE919}, // 5^-74
        {0x1CF2B1970E725858, 0x56C163A2461641C1}, // 5^-75
        {0x17288E1271F51379, 0xDF011C81D1AB67CE}, // 5^-76
        {0x1286D80EC190DC61, 0x7F3416CE4155ECA5}, // 5^-77
        {0x1DA48CE468E7C702, 0x6520247D3556476E}, // 5^-78
        {0x17B6D71D20B96C01, 0xEA801D30F7783925}, // 5^-79
        {0x12F8AC174D612334, 0xBB99B0F3F92CFA84}, // 5^-80
        {0x1E5AACF215683854, 0x5F5C4E532847F739}, // 5^-81
        {0x18488A5B44536043, 0x7F7D0B75B9D32C2E}, // 5^-82
        {0x136D3B7C36A919CF, 0x9930D5F7C7DC2358}, // 5^-83
        {0x1F152BF9F10E8FB2, 0x8EB4898C72F9D226}, // 5^-84
        {0x18DDBCC7F40BA628, 0x722A07A38F2E41B8}, // 5^-85
        {0x13E497065CD61E86, 0xC1BB394FA5BE9AFA}, // 5^-86
        {0x1FD424D6FAF030D7, 0x9C5EC2190930F7F6}, // 5^-87
        {0x197683DF2F268D79, 0x49E56814075A5FF8}, // 5^-88
        {0x145ECFE5BF520AC7, 0x6E51201005E1E660}, // 5^-89
        {0x104BD984990E6F05, 0xF1DA800CD181851A}, // 5^-90
        {0x1A12F5A0F4E3E4D6, 0x4FC400148268D4F5}, // 5^-91
        {0x14DBF7B3F71CB711, 0xD96999AA01ED772B}, // 5^-92
        {0x10AFF95CC5B09274, 0xADEE1488018AC5BC}, // 5^-93
        {0x1AB328946F80EA54, 0x497CEDA668DE092C}, // 5^-94
        {0x155C2076BF9A5510, 0x3ACA57B853E4D424}, // 5^-95
        {0x1116805EFFAEAA73, 0x623B7960431D7683}, // 5^-96
        {0x1B5733CB32B110B8, 0x9D2BF566D1C8BD9E}, // 5^-97
        {0x15DF5CA28EF40D60, 0x7DBCC452416D647F}, // 5^-98
        {0x117F7D4ED8C33DE6, 0xCAFD69DB678AB6CC}, // 5^-99
        {0x1BFF2EE48E052FD7, 0xAB2F0FC572778ADF}, // 5^-100
        {0x1665BF1D3E6A8CAC, 0x88F273045B92D580}, // 5^-101
        {0x11EAFF4A98553D56, 0xD3F528D049424466}, // 5^-102
        {0x1CAB3210F3BB9557, 0xB988414D4203A0A3}, // 5^-103
        {0x16EF5B40C2FC7779, 0x6139CDD76802E6E9}, // 5^-104
        {0x125915CD68C9F92D, 0xE761717920025254}, // 5^-105
        {0x1D5B561574765B7C, 0xA568B58E999D5086}, // 5^-106
        {0x177C44DDF6C515FD, 0x5120913EE14AA6D2}, // 5^-107
        {0x12C9D0B1923744CA, 0xA74D40FF1AA21F0E}, // 5^-108
        {0x1E0FB44F50586E11, 0x0BAECE64F769CB4A}, // 5^-109
        {0x180C903F7379F1A7, 0x3C8BD850C5EE3C3B}, // 5^-110
        {0x133D4032C2C7F485, 0xCA0979DA37F1C9C9}, // 5^-111
        {0x1EC866B79E0CBA6F, 0xA9A8C2F6BFE942DB}, // 5^-112
        {0x18A0522C7E709526, 0x2153CF2BCCBA9BE3}, // 5^-113
        {0x13B374F06526DDB8, 0x1AA9728970954982}, // 5^-114
        {0x1F8587E7083E2F8C, 0xF775840F1A88759D}, // 5^-115
        {0x19379FEC0698260A, 0x5F9136727BA05E17}, // 5^-116
        {0x142C7FF0054684D5, 0x1940F85B9619E4DF}, // 5^-117
        {0x1023998CD1053710, 0xE100C6AFAB47EA4C}, // 5^-118
        {0x19D28F47B4D524E7, 0xCE67A44C453FDD47}, // 5^-119
        {0x14A8729FC3DDB71F, 0xD852E9D69DCCB106}, // 5^-120
        {0x1086C219697E2C19, 0x79DBEE454B0A2738}, // 5^-121
        {0x1A71368F0F30468F, 0x295FE3A211A9D859}, // 5^-122
        {0x15275ED8D8F36BA5, 0xBAB31C81A7BB137A}, // 5^-123
        {0x10EC4BE0AD8F8951, 0x6228E39AEC95A92F}, // 5^-124
        {0x1B13AC9AAF4C0EE8, 0x9D0E38F7E0EF7517}, // 5^-125
        {0x15A956E225D67253, 0xB0D82D931A592A79}, // 5^-126
        {0x11544581B7DEC1DC, 0x8D79BE0F4847552E}, // 5^-127
        {0x1BBA08CF8C979C94, 0x158F967EDA0BBB7C}, // 5^-128
        {0x162E6D72D6DFB076, 0x77A611FF14D62F97}, // 5^-129
        {0x11BEBDF578B2F391, 0xF951A7FF43DE8C79}, // 5^-130
        {0x1C6463225AB7EC1C, 0xC21C3FFED2FDAD8E}, // 5^-131
        {0x16B6B5B5155FF017, 0x01B0333242648AD8}, // 5^-132
        {0x122BC490DDE659AC, 0x0159C28E9B83A246}, // 5^-133
        {0x1D12D41AFCA3C2AC, 0xCEF604175F3903A3}, // 5^-134
        {0x17424348CA1C9BBD, 0x725E69AC4C2D9C83}, // 5^-135
        {0x129B69070816E2FD, 0xF5185489D68AE39C}, // 5^-136
        {0x1DC574D80CF16B2F, 0xEE8D540FBDAB05C6}, // 5^-137
        {0x17D12A4670C1228C, 0xBED77672FE226B05}, // 5^-138
        {0x130DBB6B8D674ED6, 0xFF12C528CB4EBC04}, // 5^-139
        {0x1E7C5F127BD87E24, 0xCB513B74787DF9A0}, // 5^-140
        {0x18637F41FCAD31B7, 0x090DC929F9FE614D}, // 5^-141
        {0x1382CC34CA2427C5, 0xA0D7D42194CB810A}, // 5^-142
        {0x1F37AD21436D0C6F, 0x67BFB9CF5478CE77}, // 5^-143
        {0x18F9574DCF8A7059, 0x1FCC94A5DD2D71F9}, // 5^-144
        {0x13FAAC3E3FA1F37A, 0x7FD6DD517DBDF4C7}, // 5^-145
        {0x1FF779FD329CB8C3, 0xFFBE2EE8C92FEE0B}, // 5^-146
        {0x1992C7FDC216FA36, 0x6631BF20A0F324D6}, // 5^-147
        {0x14756CCB01ABFB5E, 0xB827CC1A1A5C1D78}, // 5^-148
        {0x105DF0A267BCC918, 0x935309AE7B7CE460}, // 5^-149
        {0x1A2FE76A3F9474F4, 0x1EEB42B0C594A099}, // 5^-150
        {0x14F31F8832DD2A5C, 0xE58902270476E6E1}, // 5^-151
        {0x10C27FA028B0EEB0, 0xB7A0CE859D2BEBE7}, // 5^-152
        {0x1AD0CC33744E4AB4, 0x59014A6F61DFDFD8}, // 5^-153
        {0x1573D68F903EA229, 0xE0CDD525E7E64CAD}, // 5^-154
        {0x11297872D9CBB4EE, 0x4D7177518651D6F1}, // 5^-155
        {0x1B758D848FAC54B0, 0x7BE8BEE8D6E957E8}, // 5^-156
        {0x15F7A46A0C89DD59, 0xFCBA3253DF211320}, // 5^-157
        {0x1192E9EE706E4AAE, 0x63C8284318E74280}, // 5^-158
        {0x1C1E43171A4A1117, 0x060D0D3827D86A66}, // 5^-159
        {0x167E9C127B6E7412, 0x6B3DA42CECAD21EB}, // 5^-160
        {0x11FEE341FC585CDB, 0x88FE1CF0BD574E56}, // 5^-161
        {0x1CCB0536608D615F, 0x419694B462254A23}, // 5^-162
        {0x1708D0F84D3DE77F, 0x67ABAA29E81DD4E9}, // 5^-163
        {0x126D73F9D764B932, 0xB95621BB2017DD87}, // 5^-164
        {0x1D7BECC2F23AC1EA, 0xC223692B668C95A5}, // 5^-165
        {0x179657025B6234BB, 0xCE82BA891ED6DE1D}, // 5^-166
        {0x12DEAC01E2B4F6FC, 0xA53562074BDF1818}, // 5^-167
        {0x1E3113363787F194, 0x3B889CD87964F359}, // 5^-168
        {0x18274291C6065ADC, 0xFC6D4A46C783F5E1}, // 5^-169
        {0x13529BA7D19EAF17, 0x30576E9F06032B1A}, // 5^-170
        {0x1EEA92A61C311825, 0x1A257DCB3CD1DE90}, // 5^-171
        {0x18BBA884E35A79B7, 0x481DFE3C30A7E540}, // 5^-172
        {0x13C9539D82AEC7C5, 0xD34B31C9C0865100}, // 5^-173
        {0x1FA885C8D117A609, 0x5211E942CDA3B4CD}, // 5^-174
        {0x19539E3A40DFB807, 0x74DB21023E1C90A4}, // 5^-175
        {0x1442E4FB67196005, 0xF715B401CB4A0D50}, // 5^-176
        {0x103583FC527AB337, 0xF8DE299B09080AA7}, // 5^-177
        {0x19EF3993B72AB859, 0x8E304291A80CDDD7}, // 5^-178
        {0x14BF6142F8EEF9E1, 0x3E8D020E200A4B13}, // 5^-179
        {0x10991A9BFA58C7E7, 0x653D9B3E80083C0F}, // 5^-180
        {0x1A8E90F9908E0CA5, 0x6EC8F864000D2CE4}, // 5^-181
        {0x153EDA614071A3B7, 0x8BD3F9E999A423EA}, // 5^-182
        {0x10FF151A99F482F9, 0x3CA994BAE1501CBB}, // 5^-183
        {0x1B31BB5DC320D18E, 0xC775BAC49BB3612B}, // 5^-184
        {0x15C162B168E70E0B, 0xD2C4956A16291A89}, // 5^-185
        {0x11678227871F3E6F, 0xDBD0778811BA7BA1}, // 5^-186
        {0x1BD8D03F3E9863E6, 0x2C80BF401C5D929B}, // 5^-187
        {0x16470CFF6546B651, 0xBD33CC3349E47549}, // 5^-188
        {0x11D270CC51055EA7, 0xCA8FD68F6E505DD4}, // 5^-189
        {0x1C83E7AD4E6EFDD9, 0x4419574BE3B3C953}, // 5^-190
        {0x16CFEC8AA52597E1, 0x0347790982F63AA9}, // 5^-191
        {0x123FF06EEA847980, 0xCF6C60D468C4FBBA}, // 5^-192
        {0x1D331A4B10D3F59A, 0xE57A34870E07F92A}, // 5^-193
        {0x175C1508DA432AE2, 0x512E906C0B399422}, // 5^-194
        {0x12B010D3E1CF5581, 0xDA8BA6BCD5C7A9B5}, // 5^-195
        {0x1DE6815302E5559C, 0x90DF712E22D90F87}, // 5^-196
        {0x17EB9AA8CF1DDE16, 0xDA4C5A8B4F140C6C}, // 5^-197
        {0x1322E220A5B17E78, 0xAEA37BA2A5A9A38A}, // 5^-198
        {0x1E9E369AA2B59727, 0x7DD25F6AA2A905A9}, // 5^-199
        {0x187E92154EF7AC1F, 0x97DB7F888220D154}, // 5^-200
        {0x139874DDD8C6234C, 0x797C6606CE80A777}, // 5^-201
        {0x1F5A549627A36BAD, 0x8F2D700AE4010BF1}, // 5^-202
        {0x191510781FB5EFBE, 0x0C2459A25000D65A}, // 5^-203
        {0x1410D9F9B2F7F2FE, 0x701D1481D99A4515}, // 5^-204
        {0x100D7B2E28C65BFE, 0xC017439B147B6A77}, // 5^-205
        {0x19AF2B7D0E0A2CCA, 0xCCF205C4ED9243F2}, // 5^-206
        {0x148C22CA71A1BD6F, 0x0A5B37D0BE0E9CC2}, // 5^-207
        {0x10701BD527B4978C, 0x0848F973CB3EE3CE}, // 5^-208
        {0x1A4CF9550C5425AC, 0xDA0E5BEC78649FB0}, // 5^-209
        {0x150A6110D6A9B7BD, 0x7B3EAFF060507FC0}, // 5^-210
        {0x10D51A73DEEE2C97, 0x95CBBFF380406633}, // 5^-211
        {0x1AEE90B964B04758, 0xEFAC665266CD7052}, // 5^-212
        {0x158BA6FAB6F36C47, 0x2623850EB8A459DB}, // 5^-213
        {0x113C85955F29236C, 0x1E82D0D893B6AE49}, // 5^-214
        {0x1B9408EEFEA838AC, 0xFD9E1AF41F8AB075}, // 5^-215
        {0x16100725988693BD, 0x97B1AF29B2D559F7}, // 5^-216
        {0x11A66C1E139EDC97, 0xAC8E25BAF5777B2C}, // 5^-217
        {0x1C3D79C9B8FE2DBF, 0x7A7D092B2258C513}, // 5^-218
        {0x169794A160CB57CC, 0x61FDA0EF4EAD6A76}, // 5^-219
        {0x1212DD4DE7091309, 0xE7FE1A590BBDEEC5}, // 5^-220
        {0x1CEAFBAFD80E84DC, 0xA6635D5B45FCB13A}, // 5^-221
        {0x172262F3133ED0B0, 0x851C4AAF6B308DC8}, // 5^-222
        {0x1281E8C275CBDA26, 0xD0E36EF2BC26D7D4}, // 5^-223
        {0x1D9CA79D894629D7, 0xB49F17EAC6A48C86}, // 5^-224
        {0x17B08617A104EE46, 0x2A18DFEF0550706B}, // 5^-225
        {0x12F39E794D9D8B6B, 0x54E0B3259DD9F389}, // 5^-226
        {0x1E5297287C2F4578, 0x87CDEB6F62F65274}, // 5^-227
        {0x18421286C9BF6AC6, 0xD30B22BF825EA85D}, // 5^-228
        {0x13680ED23AFF889F, 0x0F3C1BCC684BB9E4}, // 5^-229
        {0x1F0CE4839198DA98, 0x18602C7A4079296D}, // 5^-230
        {0x18D71D360E13E213, 0x46B356C833942124}, // 5^-231
        {0x13DF4A91A4DCB4DC, 0x388F78A029434DB6}, // 5^-232
        {0x1FCBAA82A1612160, 0x5A7F2766A86BAF8A}, // 5^-233
        {0x196FBB9BB44DB44D, 0x153285EBB9EFBFA2}, // 5^-234
        {0x145962E2F6A4903D, 0xAA8ED189618C994E}, // 5^-235
        {0x1047824F2BB6D9CA, 0xEED8A7A11AD6E10C}, // 5^-236
        {0x1A0C03B1DF8AF611, 0x7E27729B5E249B45}, // 5^-237
        {0x14D6695B193BF80D, 0xFE85F549181D4904}, // 5^-238
        {0x10AB877C142FF9A4, 0xCB9E5DD4134AA0D0}, // 5^-239
        {0x1AAC0BF9B9E65C3A, 0xDF63C9535211014D}, // 5^-240
        {0x15566FFAFB1EB02F, 0x191CA10F74DA6771}, // 5^-241
        {0x1111F32F2F4BC025, 0xADB080D92A4852C1}, // 5^-242
        {0x1B4FEB7EB212CD09, 0x15E7348EAA0D5134}, // 5^-243
        {0x15D98932280F0A6D, 0xAB1F5D3EEE710DC4}, // 5^-244
        {0x117AD428200C0857, 0xBC1917658B8DA49D}, // 5^-245
        {0x1BF7B9D9CCE00D59, 0x2CF4F23C127C3A94}, // 5^-246
        {0x165FC7E170B33DE0, 0xF0C3F4FCDB969543}, // 5^-247
        {0x11E6398126F5CB1A, 0x5A365D9716121103}, // 5^-248
        {0x1CA38F350B22DE90, 0x9056FC24F01CE804}, // 5^-249
        {0x16E93F5DA2824BA6, 0xD9DF301D8CE3ECD0}, // 5^-250
        {0x125432B14ECEA2EB, 0xE17F59B13D8323DA}, // 5^-251
        {0x1D53844EE47DD179, 0x68CBC2B52F38395C}, // 5^-252
        {0x177603725064A794, 0x53D6355DBF602DE3}, // 5^-253
        {0x12C4CF8EA6B6EC76, 0xA9782AB165E68B1C}, // 5^-254
        {0x1E07B27DD78B13F1, 0x0F26AAB56FD744FA}, // 5^-255
        {0x18062864AC6F4327, 0x3F52222ABFDF6A62}, // 5^-256
        {0x1338205089F29C1F, 0x65DB4E88997F884E}, // 5^-257
        {0x1EC033B40FEA9365, 0x6FC54A7428CC0D4A}, // 5^-258
        {0x1899C2F673220F84, 0x596AA1F68709A43B}, // 5^-259
        {0x13AE3591F5B4D936, 0xADEEE7F86C07B696}, // 5^-260
        {0x1F7D228322BAF524, 0x497E3FF3E00C5756}, // 5^-261
        {0x1930E868E89590E9, 0xD464FFF64CD6AC45}, // 5^-262
        {0x14272053ED4473EE, 0x4383FFF83D7889D1}, // 5^-263
        {0x101F4D0FF1038FF1, 0xCF9CCCC69793A174}, // 5^-264
        {0x19CBAE7FE805B31C, 0x7F6147A425B90252}, // 5^-265
        {0x14A2F1FFECD15C16, 0xCC4DD2E9B7C7350F}, // 5^-266
        {0x10825B3323DAB012, 0x3D0B0F215FD290D9}, // 5^-267
        {0x1A6A2B85062AB350, 0x61AB4B689950E7C1}, // 5^-268
        {0x1521BC6A6B555C40, 0x4E22A2BA1440B967}, // 5^-269
        {0x10E7C9EEBC4449CD, 0x0B4EE894DD009453}, // 5^-270
        {0x1B0C764AC6D3A948, 0x1217DA87C800ED51}, // 5^-271
        {0x15A391D56BDC876C, 0xDB46486CA000BDDA}, // 5^-272
        {0x114FA7DDEFE39F8A, 0x490506BD4CCD64AF}, // 5^-273
        {0x1BB2A62FE638FF43, 0xA8080AC87AE23AB1}, // 5^-274
        {0x162884F31E93FF69, 0x5339A239FBE82EF4}, // 5^-275
        {0x11BA03F5B20FFF87, 0x75C7B4FB2FECF25D}, // 5^-276
        {0x1C5CD322B67FFF3F, 0x22D92191E647EA2E}, // 5^-277
        {0x16B0A8E891FFFF65, 0xB57A8141850654F2}, // 5^-278
        {0x1226ED86DB3332B7, 0xC4620101373843F5}, // 5^-279
        {0x1D0B15A491EB8459, 0x3A366801F1F39FEE}, // 5^-280
        {0x173C115074BC69E0, 0xFB5EB99B27F6198B}, // 5^-281
        {0x129674405D6387E7, 0x2F7EFAE2865E7AD6}, // 5^-282
        {0x1DBD86CD6238D971, 0xE597F7D0D6FD9156}, // 5^-283
        {0x17CAD23DE82D7AC1, 0x8479930D78CADAAB}, // 5^-284
        {0x1308A831868AC89A, 0xD06142712D6F1556}, // 5^-285
        {0x1E74404F3DAADA91, 0x4D686A4EAF182222}, // 5^-286
        {0x185D003F6488AEDA, 0xA453883EF279B4E8}, // 5^-287
        {0x137D99CC506D58AE, 0xE9DC6CFF28615D87}, // 5^-288
        {0x1F2F5C7A1A488DE4, 0xA960AE650D6895A4}, // 5^-289
        {0x18F2B061AEA07183, 0xBAB3BEB73DED4483}, // 5^-290
        {0x13F559E7BEE6C136, 0x2EF6322C318A9D36}, // 5^-291
        {0x1FEEF63F97D79B89, 0xE4BD1D13827761F0}, // 5^-292
        {0x198BF832DFDFAFA1, 0x83CA7DA9352C4E5A}, // 5^-293
        {0x146FF9C24CB2F2E7, 0x9CA1FE20F756A515}, // 5^-294
        {0x1059949B708F28B9, 0x4A1B31B3F9121DAA}, // 5^-295
        {0x1A28EDC580E50DF5, 0x435EB5ECC1B695DD}, // 5^-296
        {0x14ED8B04671DA4C4, 0x35E55E57015EDE4A}, // 5^-297
        {0x10BE08D0527E1D69, 0xC4B77EAC0118B1D5}, // 5^-298
        {0x1AC9A7B3B7302F0F, 0xA12597799B5AB622}, // 5^-299
        {0x156E1FC2F8F358D9, 0x4DB7AC6149155E81}, // 5^-300
        {0x1124E63593F5E0AD, 0xD7C6238107444B9B}, // 5^-301
        {0x1B6E3D2286563449, 0x593D059B3ED3AC2B}, // 5^-302
        {0x15F1CA820511C36D, 0xE0FD9E15CBDC89BC}, // 5^-303
        {0x118E3B9B37416924, 0xB3FE18116FE3A163}, // 5^-304
        {0x1C16C5C525357507, 0x866359B57FD29BD1}, // 5^-305
        {0x16789E3750F790D2, 0xD1E91491330EE30E}, // 5^-306
        {0x11FA182C40C60D75, 0x74BA76DA8F3F1C0B}, // 5^-307
        {0x1CC359E067A348BB, 0xEDF72490E531C678}, // 5^-308
        {0x1702AE4D1FB5D3C9, 0x8B2C1D40B75B052D}, // 5^-309
        {0x12688B70E62B0FD4, 0x6F567DCD5F7C0424}, // 5^-310
        {0x1D74124E3D11B2ED, 0x7EF0C94898C66D06}, // 5^-311
        {0x17900EA4FDA7C257, 0x98C0A106E09EBD9F}, // 5^-312
        {0x12D9A550CAEC9B79, 0x470080D24D4BCAE6}, // 5^-313
        {0x1E29088144ADC58E, 0xD800CE1D487944A2}, // 5^-314
        {0x1820D39A9D57D13F, 0x1333D8176D2DD082}, // 5^-315
        {0x134D76154AACA765, 0xA8F646792424A6CE}, // 5^-316
        {0x1EE25688777AA56F, 0x74BD3D8EA03AA47D}, // 5^-317
        {0x18B51206C5FBB78C, 0x5D64313EE6955064}, // 5^-318
        {0x13C40E6BD1962C70, 0x4AB68DCBEBAAA6B7}, // 5^-319
        {0x1FA01712E8F0471A, 0x1124161312AAA457}, // 5^-320
        {0x194CDF4253F36C14, 0xDA8344DC0EEEE9DF}, // 5^-321
        {0x143D7F6843292343, 0xE2029D7CD8BF2180}, // 5^-322
        {0x103132B9CF541C36, 0x4E687DFD7A328133}, // 5^-323
        {0x19E851294BB9C6BD, 0x4A40C9959050CEB8}, // 5^-324
        {0x14B9DA876FC7D231, 0x0833D477A6A70BC6}, // 5^-325
        {0x1094AED2BFD30E8D, 0xA02976C61EEC096B}, // 5^-326
        {0x1A877E1DFFB81749, 0x004257A364ACDBDF}, // 5^-327
        {0x153931B1996012A0, 0xCD01DFB5EA23E319}, // 5^-328
        {0x10FA8E27ADE6754D, 0x70CE4C91881CB5AE}, // 5^-329
        {0x1B2A7D0C4970BBAF, 0x1AE3ADB5A69455E2}, // 5^-330
        {0x15BB973D078D62F2, 0x7BE957C4854377E8}, // 5^-331
        {0x1162DF64060AB58E, 0xC987796A0435F987}, // 5^-332
        {0x1BD1656CD67788E4, 0x75A58F1006BCC271}, // 5^-333
        {0x16411DF0AB92D3E9, 0xF7B7A5A66BCA3527}, // 5^-334
        {0x11CDB18D560F0FEE, 0x5FC61E1EBCA1C41F}, // 5^-335
        {0x1C7C4F4889B1B316, 0xFFA363646102D365}, // 5^-336
        {0x16C9D906D48E28DF, 0x32E91C504D9BDC51}, // 5^-337
        {0x123B140576D820B2, 0x8F20E37371497D0E}, // 5^-338
        {0x1D2B533BF159CDEA, 0x7E9B0585820F2E7C}, // 5^-339
        {0x1755DC2FF447D7EE, 0xCBAF379E01A5BECA}, // 5^-340
    };

    IEEEPARSE_ASSERT(k >= 0);
    IEEEPARSE_ASSERT(k <= MaxDecExp);
    return Pow5Inv[static_cast<unsigned>(k)];
}

#if defined(__SIZEOF_INT128__)

static inline uint64_t MulShift(uint64_t m, const Uint64x2* mul, int j)
{
    __extension__ using uint128_t = unsigned __int128;

    IEEEPARSE_ASSERT(j >= 64);
    IEEEPARSE_ASSERT(j <= 127);

    const uint128_t b0 = uint128_t{m} * mul->lo;
    const uint128_t b2 = uint128_t{m} * mul->hi;

    // We need shift = j - 64 here.
    // Since 64 <= j < 128, this is equivalent to shift = (j - 64) % 64 = j % 64.
    // When written as shift = j & 63, clang can optimize the 128-bit shift into
    // a simple funnel shift.
    const int shift = j & 63;
    return static_cast<uint64_t>((b2 + static_cast<uint64_t>(b0 >> 64)) >> shift);
}

#elif defined(_MSC_VER) && defined(_M_X64)

static inline uint64_t MulShift(uint64_t m, const Uint64x2* mul, int j)
{
    IEEEPARSE_ASSERT(j >= 64);
    IEEEPARSE_ASSERT(j <= 127);

    uint64_t b0_hi;
    uint64_t b0_lo = _umul128(m, mul->lo, &b0_hi);
    uint64_t b2_hi;
    uint64_t b2_lo = _umul128(m, mul->hi, &b2_hi);
    static_cast<void>(b0_lo);

    // b2 + (b0 >> 64)
    _addcarry_u64(_addcarry_u64(0, b2_lo, b0_hi, &b2_lo), b2_hi, 0, &b2_hi);

    // For the __shiftright128 intrinsic, the shift value is always modulo 64.
    return __shiftright128(b2_lo, b2_hi, static_cast<unsigned char>(j));
}

#else

static inline Uint64x2 Mul128(uint64_t a, uint64_t b)
{
    const uint64_t b00 = uint64_t{Lo32(a)} * Lo32(b);
    const uint64_t b01 = uint64_t{Lo32(a)} * Hi32(b);
    const uint64_t b10 = uint64_t{Hi32(a)} * Lo32(b);
    const uint64_t b11 = uint64_t{Hi32(a)} * Hi32(b);

    const uint64_t mid1 = b10 + Hi32(b00);
    const uint64_t mid2 = b01 + Lo32(mid1);

    const uint64_t hi = b11 + Hi32(mid1) + Hi32(mid2);
    const uint64_t lo = Lo32(b00) | uint64_t{Lo32(mid2)} << 32;
    return {hi, lo};
}

static inline uint64_t ShiftRight128(uint64_t lo, uint64_t hi, int n)
{
    IEEEPARSE_ASSERT(n >= 0);
    IEEEPARSE_ASSERT(n <= 63);

    if (n == 0)
        return lo;

    return (hi << (64 - n)) | (lo >> n);
}

static inline uint64_t MulShift(uint64_t m, const Uint64x2* mul, int j)
{
    IEEEPARSE_ASSERT(j >= 64);
    IEEEPARSE_ASSERT(j <= 127);

    auto b0 = Mul128(m, mul->lo);
    auto b2 = Mul128(m, mul->hi);

    // b2 + (b0 >> 64)
    b2.lo += b0.hi;
    b2.hi += b2.lo < b0.hi;

    return ShiftRight128(b2.lo, b2.hi, j & 63);
}

#endif

uint64_t pow5::MulPow5DivPow2(uint64_t value, int e5, int e2)
{
    const int j = e2 - CeilLog2Pow5(e5) + BitsPerPow5_Double;
    const auto pow5 = ComputePow5_Double(e5);
    return MulShift(value, &pow5, j);
}

uint64_t pow5::MulPow5InvDivPow2(uint64_t value, int e5, int e2)
{
    const int j = e2 + CeilLog2Pow5(e5) - 1 + BitsPerPow5_Double;
    const auto pow5_inv = ComputePow5Inv_Double(e5);
    return MulShift(value, &pow5_inv, j);
}

bool pow5::MultipleOfPow5(uint64_t value, int e5)
{
    IEEEPARSE_ASSERT(e5 >= 0);

    struct MulCmp {
        uint64_t mul;
        uint64_t cmp;
    };

    static constexpr MulCmp Mod5[] = {
        {0x0000000000000001u, 0xFFFFFFFFFFFFFFFFu}, // 5^0
        {0xCCCCCCCCCCCCCCCDu, 0x3333333333333333u}, // 5^1
        {0x8F5C28F5C28F5C29u, 0x0A3D70A3D70A3D70u}, // 5^2
        {0x1CAC083126E978D5u, 0x020C49BA5E353F7Cu}, // 5^3
        {0xD288CE703AFB7E91u, 0x0068DB8BAC710CB2u}, // 5^4
        {0x5D4E8FB00BCBE61Du, 0x0014F8B588E368F0u}, // 5^5
        {0x790FB65668C26139u, 0x000431BDE82D7B63u}, // 5^6
        {0xE5032477AE8D46A5u, 0x0000D6BF94D5E57Au}, // 5^7
        {0xC767074B22E90E21u, 0x00002AF31DC46118u}, // 5^8
        {0x8E47CE423A2E9C6Du, 0x0000089705F4136Bu}, // 5^9
        {0x4FA7F60D3ED61F49u, 0x000001B7CDFD9D7Bu}, // 5^10
        {0x0FEE64690C913975u, 0x00000057F5FF85E5u}, // 5^11
        {0x3662E0E1CF503EB1u, 0x000000119799812Du}, // 5^12
        {0xA47A2CF9F6433FBDu, 0x0000000384B84D09u}, // 5^13
        {0x54186F653140A659u, 0x00000000B424DC35u}, // 5^14
        {0x7738164770402145u, 0x0000000024075F3Du}, // 5^15
        {0xE4A4D1417CD9A041u, 0x000000000734ACA5u}, // 5^16
        {0xC75429D9E5C5200Du, 0x000000000170EF54u}, // 5^17
        {0xC1773B91FAC10669u, 0x000000000049C977u}, // 5^18
        {0x26B172506559CE15u, 0x00000000000EC1E4u}, // 5^19
        {0xD489E3A9ADDEC2D1u, 0x000000000002F394u}, // 5^20
        {0x90E860BB892C8D5Du, 0x000000000000971Du}, // 5^21
        {0x502E79BF1B6F4F79u, 0x0000000000001E39u}, // 5^22
        {0xDCD618596BE30FE5u, 0x000000000000060Bu}, // 5^23
        {0x2C2AD1AB7BFA3661u, 0x0000000000000135u}, // 5^24
        {0x08D55D224BFED7ADu, 0x000000000000003Du}, // 5^25
        {0x01C445D3A8CC9189u, 0x000000000000000Cu}, // 5^26
        {0xCD27412A54F5B6B5u, 0x0000000000000002u}, // 5^27
    };

    // 5^28 > 2^64: only 0 is a multiple.
    if (e5 >= static_cast<int>(sizeof(Mod5) / sizeof(Mod5[0])))
        return value == 0;

    const auto m5 = Mod5[static_cast<unsigned>(e5)];
    return value * m5.mul <= m5.cmp;
}
