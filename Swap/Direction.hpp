#ifndef SWAP_DIRECTION_HPP
#define SWAP_DIRECTION_HPP

#include<string>

namespace Swap {

/** enum Swap::Direction
 *
 * @brief which way the swap moves funds.
 *
 * @desc `Submarine` locks on-chain funds to pay an
 * off-chain invoice; the lockup is a P2SH-wrapped
 * P2WSH.
 * `ReverseSubmarine` is paid off-chain and claims
 * on-chain funds; the lockup is a native P2WSH.
 */
enum Direction
{ Submarine
, ReverseSubmarine
};

std::string direction_name(Direction);

}

#endif /* !defined(SWAP_DIRECTION_HPP) */
