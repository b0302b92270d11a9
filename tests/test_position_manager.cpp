#include <catch2/catch.hpp>
#include "trader/trading_logic/position_manager.hpp"
#include "test_helpers.hpp"

using namespace AryaTrader::Core;
using AryaTrader::Config::OrdersConfig;
using TestHelpers::RecordingExecutionService;

namespace {

EntryRequest long_entry(double close_price) {
    return EntryRequest(OrderSide::Buy, close_price, 0.0001, 24, 77, 0.2);
}

EntryRequest short_entry(double close_price) {
    return EntryRequest(OrderSide::Sell, close_price, 0.0001, 24, 77, 0.2);
}

} // anonymous namespace

TEST_CASE("long entry sends market, stop and target in that order", "[position]") {
    RecordingExecutionService execution_service;
    OrdersConfig orders_config;
    PositionManager position_manager(execution_service, orders_config);

    position_manager.enter(long_entry(1.1000));

    REQUIRE(execution_service.requests.size() == 3);
    const Order& entry_order = execution_service.requests[0].order;
    const Order& stop_order = execution_service.requests[1].order;
    const Order& target_order = execution_service.requests[2].order;

    REQUIRE(execution_service.requests[0].action == "insert");
    REQUIRE(entry_order.order_id == 1);
    REQUIRE(entry_order.side == OrderSide::Buy);
    REQUIRE(entry_order.type == OrderType::Market);
    REQUIRE_FALSE(entry_order.price.has_value());
    REQUIRE(entry_order.label == "Enter long position");

    REQUIRE(execution_service.requests[1].action == "insert");
    REQUIRE(stop_order.order_id == 2);
    REQUIRE(stop_order.side == OrderSide::Sell);
    REQUIRE(stop_order.type == OrderType::Stop);
    REQUIRE(*stop_order.price == Approx(1.0976));
    REQUIRE(stop_order.label == "Catastrophic stop long exit");
    REQUIRE(stop_order.linked_order_id == target_order.order_id);

    REQUIRE(execution_service.requests[2].action == "insert");
    REQUIRE(target_order.order_id == 3);
    REQUIRE(target_order.side == OrderSide::Sell);
    REQUIRE(target_order.type == OrderType::Limit);
    REQUIRE(*target_order.price == Approx(1.1077));
    REQUIRE(target_order.label == "Profit stop long exit");
    REQUIRE(target_order.linked_order_id == stop_order.order_id);

    REQUIRE(position_manager.get_position_side() == PositionSide::Long);
    REQUIRE(position_manager.get_last_entry_order_id() == 1);
    REQUIRE(position_manager.get_trailing_state().acceleration == 0.2);
    REQUIRE(position_manager.get_trailing_state().furthest_close == 1.1000);
}

TEST_CASE("short entry mirrors the protective prices", "[position]") {
    RecordingExecutionService execution_service;
    OrdersConfig orders_config;
    PositionManager position_manager(execution_service, orders_config);

    position_manager.enter(short_entry(1.2000));

    REQUIRE(execution_service.requests.size() == 3);
    REQUIRE(execution_service.requests[0].order.side == OrderSide::Sell);
    REQUIRE(execution_service.requests[0].order.label == "Enter short position");
    REQUIRE(execution_service.requests[1].order.side == OrderSide::Buy);
    REQUIRE(*execution_service.requests[1].order.price == Approx(1.2024));
    REQUIRE(execution_service.requests[1].order.label == "Catastrophic stop short exit");
    REQUIRE(execution_service.requests[2].order.side == OrderSide::Buy);
    REQUIRE(*execution_service.requests[2].order.price == Approx(1.1923));
    REQUIRE(execution_service.requests[2].order.label == "Profit stop short exit");
    REQUIRE(position_manager.get_position_side() == PositionSide::Short);
}

TEST_CASE("entering while a position is open is rejected", "[position]") {
    RecordingExecutionService execution_service;
    OrdersConfig orders_config;
    PositionManager position_manager(execution_service, orders_config);

    position_manager.enter(long_entry(1.1000));
    REQUIRE_THROWS_AS(position_manager.enter(short_entry(1.1000)), std::runtime_error);
    REQUIRE(execution_service.requests.size() == 3);
    REQUIRE(position_manager.get_position_side() == PositionSide::Long);
}

TEST_CASE("entry with a non-positive tick size is rejected", "[position]") {
    RecordingExecutionService execution_service;
    OrdersConfig orders_config;
    PositionManager position_manager(execution_service, orders_config);

    REQUIRE_THROWS_AS(position_manager.enter(EntryRequest(OrderSide::Buy, 1.1, 0.0, 24, 77, 0.2)), std::runtime_error);
    REQUIRE(execution_service.requests.empty());
    REQUIRE(position_manager.is_flat());
}

TEST_CASE("exit cancels stop then target before the closing market order", "[position]") {
    RecordingExecutionService execution_service;
    OrdersConfig orders_config;
    PositionManager position_manager(execution_service, orders_config);

    position_manager.enter(long_entry(1.1000));
    execution_service.clear();
    position_manager.exit(orders_config.exit_long_label);

    REQUIRE(execution_service.requests.size() == 3);
    REQUIRE(execution_service.requests[0].action == "cancel");
    REQUIRE(execution_service.requests[0].order.order_id == 2);
    REQUIRE(execution_service.requests[1].action == "cancel");
    REQUIRE(execution_service.requests[1].order.order_id == 3);
    REQUIRE(execution_service.requests[2].action == "insert");
    REQUIRE(execution_service.requests[2].order.order_id == 4);
    REQUIRE(execution_service.requests[2].order.side == OrderSide::Sell);
    REQUIRE(execution_service.requests[2].order.type == OrderType::Market);
    REQUIRE(execution_service.requests[2].order.label == "Exit long position");
    REQUIRE(position_manager.is_flat());
    REQUIRE_THROWS_AS(position_manager.get_trailing_state(), std::runtime_error);
}

TEST_CASE("exiting a short buys to close", "[position]") {
    RecordingExecutionService execution_service;
    OrdersConfig orders_config;
    PositionManager position_manager(execution_service, orders_config);

    position_manager.enter(short_entry(1.2000));
    execution_service.clear();
    position_manager.exit(orders_config.session_close_label);

    REQUIRE(execution_service.requests.back().order.side == OrderSide::Buy);
    REQUIRE(execution_service.requests.back().order.label == "Session close exit");
    REQUIRE(position_manager.is_flat());
}

TEST_CASE("exit and stop modification require an open position", "[position]") {
    RecordingExecutionService execution_service;
    OrdersConfig orders_config;
    PositionManager position_manager(execution_service, orders_config);

    REQUIRE_THROWS_AS(position_manager.exit("Exit long position"), std::runtime_error);
    REQUIRE_THROWS_AS(position_manager.modify_stop(1.0, "Trailing stop long exit"), std::runtime_error);
    REQUIRE(execution_service.requests.empty());
}

TEST_CASE("stop modification keeps the order id and replaces price and label", "[position]") {
    RecordingExecutionService execution_service;
    OrdersConfig orders_config;
    PositionManager position_manager(execution_service, orders_config);

    position_manager.enter(long_entry(1.1000));
    execution_service.clear();
    position_manager.modify_stop(1.0985, orders_config.trailing_stop_long_label);

    REQUIRE(execution_service.requests.size() == 1);
    REQUIRE(execution_service.requests[0].action == "modify");
    REQUIRE(execution_service.requests[0].order.order_id == 2);
    REQUIRE(*execution_service.requests[0].order.price == 1.0985);
    REQUIRE(execution_service.requests[0].order.label == "Trailing stop long exit");
    REQUIRE(execution_service.requests[0].order.linked_order_id == OrderId(3));

    const OpenPosition& open_position = *position_manager.get_open_position();
    REQUIRE(*open_position.stop_order.price == 1.0985);
    REQUIRE(open_position.stop_order.label == "Trailing stop long exit");
    REQUIRE(*open_position.target_order.price == Approx(1.1077));
}

TEST_CASE("a stop or target fill flattens the position", "[position]") {
    RecordingExecutionService execution_service;
    OrdersConfig orders_config;
    PositionManager position_manager(execution_service, orders_config);

    position_manager.enter(long_entry(1.1000));

    SECTION("unknown id is ignored") {
        REQUIRE_FALSE(position_manager.handle_exit_order_filled(1));
        REQUIRE_FALSE(position_manager.handle_exit_order_filled(99));
        REQUIRE(position_manager.get_position_side() == PositionSide::Long);
    }
    SECTION("stop fill") {
        REQUIRE(position_manager.handle_exit_order_filled(2));
        REQUIRE(position_manager.is_flat());
        REQUIRE_FALSE(position_manager.handle_exit_order_filled(3));
    }
    SECTION("target fill") {
        REQUIRE(position_manager.handle_exit_order_filled(3));
        REQUIRE(position_manager.is_flat());
    }
    // No cancel or insert is sent for a venue-side exit
    REQUIRE(execution_service.requests.size() == 3);
}

TEST_CASE("order ids keep increasing across trades", "[position]") {
    RecordingExecutionService execution_service;
    OrdersConfig orders_config;
    PositionManager position_manager(execution_service, orders_config);

    position_manager.enter(long_entry(1.1000));
    position_manager.exit(orders_config.exit_long_label);
    execution_service.clear();
    position_manager.enter(short_entry(1.1000));

    REQUIRE(execution_service.requests[0].order.order_id == 5);
    REQUIRE(execution_service.requests[1].order.order_id == 6);
    REQUIRE(execution_service.requests[2].order.order_id == 7);
    REQUIRE(position_manager.get_last_entry_order_id() == 5);
}

TEST_CASE("a rejected request leaves the position unchanged", "[position]") {
    RecordingExecutionService execution_service;
    OrdersConfig orders_config;
    PositionManager position_manager(execution_service, orders_config);

    SECTION("entry") {
        execution_service.fail_on_request = 3;
        REQUIRE_THROWS_AS(position_manager.enter(long_entry(1.1000)), std::runtime_error);
        REQUIRE(position_manager.is_flat());
        REQUIRE(position_manager.get_last_entry_order_id() == 0);
    }
    SECTION("stop modification") {
        position_manager.enter(long_entry(1.1000));
        execution_service.fail_on_request = 4;
        REQUIRE_THROWS_AS(position_manager.modify_stop(1.0990, "Trailing stop long exit"), std::runtime_error);
        REQUIRE(*position_manager.get_open_position()->stop_order.price == Approx(1.0976));
        REQUIRE(position_manager.get_open_position()->stop_order.label == "Catastrophic stop long exit");
    }
    SECTION("exit") {
        position_manager.enter(long_entry(1.1000));
        execution_service.fail_on_request = 6;
        REQUIRE_THROWS_AS(position_manager.exit("Exit long position"), std::runtime_error);
        REQUIRE(position_manager.get_position_side() == PositionSide::Long);
    }
}
