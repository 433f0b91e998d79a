// Copyright (c) 2016-2023 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.


#include <ledgersim/version.hpp>

namespace ledgersim {

char const* version() {
    return LEDGERSIM_VERSION;
}

} // namespace ledgersim
