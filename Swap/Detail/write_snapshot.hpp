#ifndef SWAP_DETAIL_WRITE_SNAPSHOT_HPP
#define SWAP_DETAIL_WRITE_SNAPSHOT_HPP

#include<iosfwd>
#include<string>

namespace Elements { struct Tx; }

namespace Swap { namespace Detail {

/** Swap::Detail::describe_tx
 *
 * @brief prints a human-readable listing of the
 * transaction, for debugging.
 * Not a stable format.
 */
void describe_tx(std::ostream& os, Elements::Tx const& tx);

/** Swap::Detail::write_snapshot
 *
 * @brief writes the transaction hex, then its
 * listing, to the file at `path`, replacing it.
 *
 * @return false if the file could not be written.
 */
bool write_snapshot(std::string const& path, Elements::Tx const& tx);

}}

#endif /* !defined(SWAP_DETAIL_WRITE_SNAPSHOT_HPP) */
