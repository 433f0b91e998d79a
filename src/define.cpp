// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <ledgersim/define.hpp>

#include <iterator>

#include <boost/algorithm/hex.hpp>

namespace ledgersim {

std::string encode_base16(data_chunk const& data) {
    std::string res;
    res.reserve(data.size() * 2);
    boost::algorithm::hex_lower(data.begin(), data.end(), std::back_inserter(res));
    return res;
}

std::string encode_hash(hash_digest const& hash) {
    std::string res;
    res.reserve(hash.size() * 2);
    boost::algorithm::hex_lower(hash.begin(), hash.end(), std::back_inserter(res));
    return res;
}

} // namespace ledgersim
