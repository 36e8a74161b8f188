#pragma once
#include <cstddef>
#include <exception>
#include <ios>
#include <istream>
#include <streambuf>
#include <string>

#include "../types/PropertiesError.hpp"


/*
------------------------------------------------------------------------------
  RAW STREAM READS
------------------------------------------------------------------------------

istream::read() raises failbit on every short read, which is how any
well-formed input ends. A caller that enabled failbit exceptions would get
std::ios_base::failure before the last chunk is handed out.

These helpers go to the stream buffer directly and leave the stream state
alone. Only a stream that is already bad, or a buffer that throws, turns
into IoFailure.
------------------------------------------------------------------------------
*/

/**
 * @brief Reads up to n bytes into dst, returning how many arrived.
 *
 * Returns 0 at end of input or when the stream is already in a failed
 * (but not bad) state.
 */
inline std::size_t readBytes(std::istream& in, char* dst, std::size_t n) {
    if (in.bad())
        throw IoFailure("read from input stream failed");
    if (in.fail() || in.eof() || n == 0)
        return 0;

    std::streambuf* sb = in.rdbuf();
    if (sb == nullptr)
        throw IoFailure("input stream has no buffer");

    try {
        std::streamsize got = sb->sgetn(dst, static_cast<std::streamsize>(n));
        return got > 0 ? static_cast<std::size_t>(got) : 0;
    } catch (const std::exception& e) {
        throw IoFailure(std::string("read from input stream failed: ") + e.what());
    }
}

// True if at least one more byte can be read.
inline bool hasMoreBytes(std::istream& in) {
    if (in.bad())
        throw IoFailure("read from input stream failed");
    if (in.fail() || in.eof())
        return false;

    std::streambuf* sb = in.rdbuf();
    if (sb == nullptr)
        return false;

    try {
        return sb->sgetc() != std::streambuf::traits_type::eof();
    } catch (const std::exception& e) {
        throw IoFailure(std::string("read from input stream failed: ") + e.what());
    }
}
