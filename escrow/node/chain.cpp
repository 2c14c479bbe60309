#include <escrow/lib/utility.hpp>
#include <escrow/node/chain.hpp>

#include <algorithm>

escrow::local_chain::local_chain (escrow::account const & admin_a, escrow::account const & fee_recipient_a, std::string const & name_a) :
ledger (admin_a, fee_recipient_a),
connection_name (name_a),
height (0),
time (escrow::seconds_since_epoch ()),
available (true),
stopped (false)
{
}

escrow::local_chain::~local_chain ()
{
	stop ();
}

std::error_code escrow::local_chain::head (uint64_t & height_a)
{
	std::error_code result;
	std::lock_guard<std::mutex> lock (mutex);
	if (available)
	{
		height_a = height;
	}
	else
	{
		result = escrow::error_ledger::unavailable;
	}
	return result;
}

std::error_code escrow::local_chain::receipt (escrow::block_hash const & hash_a, escrow::transaction_receipt & receipt_a)
{
	std::error_code result;
	std::lock_guard<std::mutex> lock (mutex);
	if (available)
	{
		auto existing (receipts.find (hash_a));
		if (existing != receipts.end ())
		{
			receipt_a = existing->second;
		}
		else
		{
			result = escrow::error_ledger::unknown_transaction;
		}
	}
	else
	{
		result = escrow::error_ledger::unavailable;
	}
	return result;
}

std::error_code escrow::local_chain::logs (uint64_t from_a, uint64_t to_a, std::vector<escrow::ledger_log> & logs_a)
{
	std::error_code result;
	std::lock_guard<std::mutex> lock (mutex);
	if (available)
	{
		auto begin (std::lower_bound (entries.begin (), entries.end (), from_a, [](escrow::ledger_log const & log_a, uint64_t height_a) {
			return log_a.height < height_a;
		}));
		for (auto i (begin), n (entries.end ()); i != n && i->height <= to_a; ++i)
		{
			logs_a.push_back (*i);
		}
	}
	else
	{
		result = escrow::error_ledger::unavailable;
	}
	return result;
}

std::error_code escrow::local_chain::submit (escrow::ledger_call const & call_a, escrow::block_hash & hash_a)
{
	std::error_code result;
	std::unique_lock<std::mutex> lock (mutex);
	if (!available)
	{
		result = escrow::error_ledger::unavailable;
	}
	else if (call_a.validate_signature ())
	{
		result = escrow::error_ledger::bad_signature;
	}
	else if (call_a.nonce != nonces[call_a.from])
	{
		result = escrow::error_ledger::bad_nonce;
	}
	else if (ledger.balance (call_a.from) < call_a.value.number ())
	{
		result = escrow::error_ledger::insufficient_balance;
	}
	else
	{
		++nonces[call_a.from];
		++height;
		hash_a = call_a.hash ();
		auto processed (ledger.process (call_a, time));
		escrow::transaction_receipt receipt;
		receipt.transaction = hash_a;
		receipt.height = height;
		receipt.success = processed.code == escrow::process_result::progress;
		receipt.result = processed.code;
		receipt.from = call_a.from;
		receipt.function = call_a.function;
		receipt.value = call_a.value;
		uint32_t index (0);
		for (auto & event : processed.events)
		{
			escrow::ledger_log log{ height, hash_a, index++, event };
			receipt.logs.push_back (log);
			entries.push_back (log);
		}
		receipts[hash_a] = receipt;
		lock.unlock ();
		condition.notify_all ();
	}
	return result;
}

std::error_code escrow::local_chain::trade_get (uint64_t trade_id_a, escrow::trade & trade_a)
{
	std::error_code result;
	std::lock_guard<std::mutex> lock (mutex);
	if (!available)
	{
		result = escrow::error_ledger::unavailable;
	}
	else if (ledger.trade_get (trade_id_a, trade_a))
	{
		result = escrow::error_ledger::unknown_trade;
	}
	return result;
}

std::error_code escrow::local_chain::nonce (escrow::account const & account_a, uint64_t & nonce_a)
{
	std::error_code result;
	std::lock_guard<std::mutex> lock (mutex);
	if (available)
	{
		auto existing (nonces.find (account_a));
		nonce_a = existing != nonces.end () ? existing->second : 0;
	}
	else
	{
		result = escrow::error_ledger::unavailable;
	}
	return result;
}

std::string escrow::local_chain::name () const
{
	return connection_name;
}

void escrow::local_chain::start (std::chrono::milliseconds const & interval_a)
{
	if (interval_a.count () > 0 && !thread.joinable ())
	{
		thread = std::thread ([this, interval_a]() {
			escrow::thread_role::set (escrow::thread_role::name::block_production);
			produce_blocks (interval_a);
		});
	}
}

void escrow::local_chain::produce_blocks (std::chrono::milliseconds interval_a)
{
	std::unique_lock<std::mutex> lock (mutex);
	while (!stopped)
	{
		condition.wait_for (lock, interval_a);
		if (!stopped)
		{
			++height;
			condition.notify_all ();
		}
	}
}

void escrow::local_chain::stop ()
{
	{
		std::lock_guard<std::mutex> lock (mutex);
		stopped = true;
	}
	condition.notify_all ();
	if (thread.joinable ())
	{
		thread.join ();
	}
}

void escrow::local_chain::mine (unsigned count_a)
{
	{
		std::lock_guard<std::mutex> lock (mutex);
		height += count_a;
	}
	condition.notify_all ();
}

void escrow::local_chain::advance_time (uint64_t seconds_a)
{
	std::lock_guard<std::mutex> lock (mutex);
	time += seconds_a;
}

uint64_t escrow::local_chain::now ()
{
	std::lock_guard<std::mutex> lock (mutex);
	return time;
}

void escrow::local_chain::online (bool available_a)
{
	std::lock_guard<std::mutex> lock (mutex);
	available = available_a;
}

void escrow::local_chain::credit (escrow::account const & account_a, escrow::uint128_t const & amount_a)
{
	std::lock_guard<std::mutex> lock (mutex);
	ledger.credit (account_a, amount_a);
}

escrow::uint128_t escrow::local_chain::balance (escrow::account const & account_a)
{
	std::lock_guard<std::mutex> lock (mutex);
	return ledger.balance (account_a);
}

escrow::uint128_t escrow::local_chain::custody ()
{
	std::lock_guard<std::mutex> lock (mutex);
	return ledger.custody ();
}

uint64_t escrow::local_chain::trade_count ()
{
	std::lock_guard<std::mutex> lock (mutex);
	return ledger.trade_count ();
}

void escrow::local_chain::reject_transfers (escrow::account const & account_a, bool reject_a)
{
	std::lock_guard<std::mutex> lock (mutex);
	ledger.reject_transfers (account_a, reject_a);
}

uint64_t escrow::local_chain::fee_bps ()
{
	std::lock_guard<std::mutex> lock (mutex);
	return ledger.fee_bps;
}

uint64_t escrow::local_chain::timeout_duration ()
{
	std::lock_guard<std::mutex> lock (mutex);
	return ledger.timeout_duration;
}

bool escrow::local_chain::wait_height (uint64_t height_a, std::chrono::milliseconds const & timeout_a)
{
	std::unique_lock<std::mutex> lock (mutex);
	return !condition.wait_for (lock, timeout_a, [this, height_a]() { return height >= height_a || stopped; }) || height < height_a;
}
