// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_DEFINE_HPP
#define LEDGERSIM_DEFINE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

// Now we use the generic helper definitions to
// define LEDGERSIM_API and LEDGERSIM_INTERNAL.
// LEDGERSIM_API is used for the public API symbols. It either DLL imports or
// DLL exports (or does nothing for static build)
// LEDGERSIM_INTERNAL is used for non-api symbols.

#if defined _MSC_VER || defined __CYGWIN__
    #define LEDGERSIM_HELPER_DLL_IMPORT __declspec(dllimport)
    #define LEDGERSIM_HELPER_DLL_EXPORT __declspec(dllexport)
    #define LEDGERSIM_HELPER_DLL_LOCAL
#else
    #define LEDGERSIM_HELPER_DLL_IMPORT __attribute__ ((visibility ("default")))
    #define LEDGERSIM_HELPER_DLL_EXPORT __attribute__ ((visibility ("default")))
    #define LEDGERSIM_HELPER_DLL_LOCAL  __attribute__ ((visibility ("internal")))
#endif

#if defined LEDGERSIM_STATIC
    #define LEDGERSIM_API
    #define LEDGERSIM_INTERNAL
#elif defined LEDGERSIM_DLL
    #define LEDGERSIM_API      LEDGERSIM_HELPER_DLL_EXPORT
    #define LEDGERSIM_INTERNAL LEDGERSIM_HELPER_DLL_LOCAL
#else
    #define LEDGERSIM_API      LEDGERSIM_HELPER_DLL_IMPORT
    #define LEDGERSIM_INTERNAL LEDGERSIM_HELPER_DLL_LOCAL
#endif

// Log name.
#define LOG_LEDGERSIM "ledgersim"

namespace ledgersim {

using data_chunk = std::vector<uint8_t>;

constexpr size_t hash_size = 32;
using hash_digest = std::array<uint8_t, hash_size>;

constexpr hash_digest null_hash {};

// Quantities are checked 128-bit signed integers: overflow throws
// std::overflow_error instead of wrapping.
using amount_t = boost::multiprecision::number<
    boost::multiprecision::cpp_int_backend<128, 128,
        boost::multiprecision::signed_magnitude,
        boost::multiprecision::checked, void>,
    boost::multiprecision::et_off>;

using slot_t = uint64_t;
using epoch_t = uint64_t;
using posix_time_t = uint64_t;     // milliseconds

LEDGERSIM_API std::string encode_base16(data_chunk const& data);
LEDGERSIM_API std::string encode_hash(hash_digest const& hash);

} // namespace ledgersim

template <>
struct fmt::formatter<ledgersim::amount_t> : fmt::ostream_formatter {};

#endif
