#pragma once

#include <string>

namespace apmcore {

class Transaction;
class MetricAggregator;

/**
 * @brief Abstract interface for finished-transaction consumers
 *
 * Called once per transaction from the thread that ended it, after names
 * were normalized and segment metrics recorded. The tree is complete and
 * no longer changes. Implementations must be thread-safe when transactions
 * end concurrently.
 */
class ITransactionSink {
public:
    virtual ~ITransactionSink() = default;

    virtual void consume(const Transaction& transaction, const MetricAggregator& metrics) = 0;

    /// Human-readable sink name for logging
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace apmcore
