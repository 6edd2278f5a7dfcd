#ifndef SWAP_TX_HPP
#define SWAP_TX_HPP

#include"Elements/Address.hpp"
#include"Swap/Script.hpp"
#include<cstdint>
#include<functional>
#include<memory>
#include<string>

namespace Electrum { class ClientIF; }
namespace Elements { class TxId; }
namespace Elements { struct Tx; }
namespace Ln { class Preimage; }
namespace Secp256k1 { class KeyPair; }
namespace Secp256k1 { class Random; }
namespace Swap { class EnvIF; }
namespace Swap { struct Utxo; }

namespace Swap {

enum TxKind
{ Claim
, Refund
};

/** class Swap::Tx
 *
 * @brief a transaction spending the single output
 * that funds a swap, to a confidential destination
 * address, paying a fixed fee.
 *
 * @desc The object moves through
 *
 *     Created --locate--> Located --sign--> Signed
 *
 * and ends in `Failed` if `drain` throws.
 * `Signed` and `Failed` are terminal: `drain` on
 * them throws `Swap::TransactionError`.
 *
 * Every chain query builds a fresh client from the
 * script's `Electrum::Config` through the client
 * factory, `Electrum::create_client` by default.
 * The overloads taking a `Electrum::ClientIF&` use
 * the given client instead.
 *
 * Claims draw blinding factors and ephemeral keys
 * from a `Secp256k1::Random` constructed for that
 * claim, unless one is passed in.
 *
 * Not safe for concurrent use.
 */
class Tx {
public:
	enum State
	{ Created
	, Located
	, Signed
	, Failed
	};

	typedef std::function<
		std::unique_ptr<Electrum::ClientIF>(Electrum::Config const&)
	> ClientFactory;

private:
	TxKind kind;
	Swap::Script script;
	Elements::Address destination;
	std::uint64_t fee;
	std::unique_ptr<Swap::Utxo> utxo_p;
	State state;

	ClientFactory client_factory;
	Swap::EnvIF* env;
	std::string snapshot_dir;

	std::string logprefix(std::string const& msg) const;
	void logd(std::string const& msg) const;
	void loge(std::string const& msg) const;
	void snapshot(char const* name, Elements::Tx const& tx) const;

	std::unique_ptr<Electrum::ClientIF> make_client() const;

	Elements::Tx drain_core( Electrum::ClientIF& client
			       , Secp256k1::KeyPair const& keys
			       , Ln::Preimage const& preimage
			       , Secp256k1::Random& rand
			       );

public:
	Tx() =delete;
	Tx(Tx const&) =delete;
	Tx(Tx&&);
	~Tx();

	/* Throws `Swap::InputError` if `destination` is
	 * not a confidential address on the script's
	 * network.  */
	Tx( TxKind kind
	  , Swap::Script script
	  , std::string const& destination
	  , std::uint64_t fee
	  );

	static
	Tx new_claim( Swap::Script script
		    , std::string const& destination
		    , std::uint64_t fee
		    ) {
		return Tx(Claim, std::move(script), destination, fee);
	}
	static
	Tx new_refund( Swap::Script script
		     , std::string const& destination
		     , std::uint64_t fee
		     ) {
		return Tx(Refund, std::move(script), destination, fee);
	}

	/* Optional collaborators.  */
	void set_client_factory(ClientFactory f) {
		client_factory = std::move(f);
	}
	void set_env(Swap::EnvIF* env_) { env = env_; }
	/* Write `tx.previous` and `tx.constructed` in the
	 * given directory.  Empty string disables.  */
	void set_snapshot_dir(std::string dir) {
		snapshot_dir = std::move(dir);
	}

	/** Swap::Tx::locate
	 *
	 * @brief looks up the output funding the swap
	 * and unblinds it.
	 *
	 * @desc Only the first transaction of the lockup
	 * script's history is examined.
	 * Returns false, leaving any earlier utxo in
	 * place, if nothing pays to the lockup yet.
	 * A found output replaces the earlier one.
	 *
	 * Throws `Swap::NetworkError` if the server
	 * fails, `Swap::TransactionError` if the output
	 * cannot be unblinded.
	 */
	bool locate();
	bool locate(Electrum::ClientIF& client);

	/* Records an unblinded funding output of the
	 * network's policy asset.  */
	void manual_utxo_update( Elements::TxId const& txid
			       , std::uint32_t vout
			       , std::uint64_t value
			       );
	bool has_utxo() const { return !!utxo_p; }
	bool check_utxo_value(std::uint64_t expected) const;
	/* Throws `Swap::TransactionError` if absent.  */
	Swap::Utxo const& utxo() const;

	/** Swap::Tx::sign_claim
	 *
	 * @brief builds and signs the claim of the
	 * located output.
	 *
	 * @desc Throws `Swap::TransactionError` on a
	 * refund, on a `Signed` or `Failed` object, if no
	 * output is located, or if the fee exceeds it, and
	 * `Swap::InputError` on a missing or wrong
	 * preimage or key.
	 * On success the object is `Signed`.
	 */
	Elements::Tx sign_claim( Secp256k1::KeyPair const& keys
			       , Ln::Preimage const& preimage
			       , Secp256k1::Random& rand
			       );

	/** Swap::Tx::drain
	 *
	 * @brief locates, then signs according to the
	 * kind.
	 *
	 * @desc Finding no funding output is a
	 * `Swap::TransactionError`.
	 * Refunds always fail with a
	 * `Swap::TransactionError`.
	 * Any failure leaves the object `Failed`.
	 */
	Elements::Tx drain( Secp256k1::KeyPair const& keys
			  , Ln::Preimage const& preimage
			  );
	Elements::Tx drain( Secp256k1::KeyPair const& keys
			  , Ln::Preimage const& preimage
			  , Secp256k1::Random& rand
			  );
	Elements::Tx drain( Electrum::ClientIF& client
			  , Secp256k1::KeyPair const& keys
			  , Ln::Preimage const& preimage
			  , Secp256k1::Random& rand
			  );

	/** Swap::Tx::broadcast
	 *
	 * @brief submits the transaction and returns the
	 * txid the server reports.
	 *
	 * @desc Throws `Swap::NetworkError` carrying the
	 * server's message unchanged.
	 */
	std::string broadcast(Elements::Tx const& signed_tx);
	std::string broadcast( Electrum::ClientIF& client
			     , Elements::Tx const& signed_tx
			     );

	/* Virtual size of the signed claim, to pick a
	 * fee from a feerate.  */
	std::size_t estimated_vsize() const;

	TxKind get_kind() const { return kind; }
	State get_state() const { return state; }
	Swap::Script const& get_script() const { return script; }
	Elements::Address const& get_destination() const {
		return destination;
	}
	std::uint64_t get_fee() const { return fee; }
};

std::string state_name(Tx::State);

}

#endif /* !defined(SWAP_TX_HPP) */
