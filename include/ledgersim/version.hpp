// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_VERSION_HPP_
#define LEDGERSIM_VERSION_HPP_

#include <ledgersim/define.hpp>

#define LEDGERSIM_VERSION "0.1.0-dev.1"

namespace ledgersim {

LEDGERSIM_API char const* version();

} // namespace ledgersim

#endif //LEDGERSIM_VERSION_HPP_
