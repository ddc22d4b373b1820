/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Encoding.hpp"
#include <algorithm>

namespace otpkit {

static int
hexValue(char c)
{
    if ('0' <= c && c <= '9')
        return c - '0';
    if ('a' <= c && c <= 'f')
        return 10 + c - 'a';
    if ('A' <= c && c <= 'F')
        return 10 + c - 'A';
    return -1;
}

std::string
base16Encode(DataSlice data)
{
    const char base16Sym[] = "0123456789abcdef";
    std::string out;
    out.reserve(2 * data.size());

    for (auto byte: data)
    {
        out += base16Sym[byte >> 4];
        out += base16Sym[byte & 0xf];
    }
    return out;
}

Status
base16Decode(DataChunk &result, const std::string &in)
{
    // The string must be a multiple of 2 characters long:
    if (in.size() % 2)
        return OTP_ERROR(OTP_CC_ParseError, "Bad hex string length");

    DataChunk out;
    out.reserve(in.size() / 2);

    for (size_t i = 0; i < in.size(); i += 2)
    {
        int hi = hexValue(in[i]);
        int lo = hexValue(in[i + 1]);
        if (hi < 0 || lo < 0)
            return OTP_ERROR(OTP_CC_ParseError, "Bad hex character");
        out.push_back(static_cast<uint8_t>(hi << 4 | lo));
    }

    result = std::move(out);
    return Status();
}

std::string
base32Encode(DataSlice data)
{
    const char base32Sym[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
    std::string out;
    auto chunks = (data.size() + 4) / 5; // Rounding up
    out.reserve(8 * chunks);

    auto i = data.begin();
    uint16_t buffer = 0; // Bits waiting to be written out, MSB first
    int bits = 0; // Number of bits currently in the buffer
    while (i != data.end() || 0 < bits)
    {
        // Reload the buffer if we need more bits:
        if (i != data.end() && bits < 5)
        {
            buffer |= *i++ << (8 - bits);
            bits += 8;
        }

        // Write out 5 most-significant bits in the buffer:
        out += base32Sym[buffer >> 11];
        buffer <<= 5;
        bits -= 5;
    }

    // Pad the final string to a multiple of 8 characters long:
    out.append(-out.size() % 8, '=');
    return out;
}

Status
base32Decode(DataChunk &result, const std::string &in)
{
    // The string must be a multiple of 8 characters long:
    if (in.size() % 8)
        return OTP_ERROR(OTP_CC_ParseError, "Bad base32 string length");

    DataChunk out;
    out.reserve(5 * (in.size() / 8));

    auto i = in.begin();
    uint16_t buffer = 0; // Bits waiting to be written out, MSB first
    int bits = 0; // Number of bits currently in the buffer
    while (i != in.end())
    {
        // Read one character from the string:
        int value = 0;
        if ('A' <= *i && *i <= 'Z')
            value = *i++ - 'A';
        else if ('2' <= *i && *i <= '7')
            value = 26 + *i++ - '2';
        else
            break;

        // Append the bits to the buffer:
        buffer |= value << (11 - bits);
        bits += 5;

        // Write out some bits if the buffer has a byte's worth:
        if (8 <= bits)
        {
            out.push_back(buffer >> 8);
            buffer <<= 8;
            bits -= 8;
        }
    }

    // Any extra characters must be '=':
    if (!std::all_of(i, in.end(), [](char c){ return '=' == c; }))
        return OTP_ERROR(OTP_CC_ParseError, "Bad base32 character");

    // There cannot be extra padding:
    if (8 <= in.end() - i)
        return OTP_ERROR(OTP_CC_ParseError, "Bad base32 padding");

    // Only 0, 1, 3, 4 or 6 padding characters are possible:
    auto padding = in.end() - i;
    if (padding == 2 || padding == 5 || padding == 7)
        return OTP_ERROR(OTP_CC_ParseError, "Bad base32 padding");

    result = std::move(out);
    return Status();
}

} // namespace otpkit
