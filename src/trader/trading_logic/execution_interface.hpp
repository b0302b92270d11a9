#ifndef EXECUTION_INTERFACE_HPP
#define EXECUTION_INTERFACE_HPP

#include "trader/data_structures/data_structures.hpp"
#include <memory>
#include <string>

namespace AryaTrader {
namespace Core {

/**
 * Execution collaborator. Requests are fire-and-forget from the engine's point of view:
 * fills and cancellations come back later as ordinary input. The collaborator owns
 * one-cancels-other enforcement for orders that declare a linked_order_id.
 * Implementations report a rejected request by throwing.
 */
class ExecutionServiceInterface {
public:
    virtual ~ExecutionServiceInterface() = default;

    virtual void insert_order(const Order& order) = 0;
    virtual void modify_order(const Order& order) = 0;
    virtual void cancel_order(OrderId order_id) = 0;

    virtual std::string get_execution_name() const = 0;
};

using ExecutionServicePtr = std::unique_ptr<ExecutionServiceInterface>;

} // namespace Core
} // namespace AryaTrader

#endif // EXECUTION_INTERFACE_HPP
