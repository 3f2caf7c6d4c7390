#include "wavedag/common/value.inline.hpp"
#include "wavedag/config/executor_config_yaml.hpp"
#include "wavedag/events/event_bus.hpp"
#include "wavedag/execution/executor.hpp"
#include "wavedag/serialization/yaml_export.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace
{

using namespace wavedag;

/**
 * @brief A small order-fulfilment workflow.
 *
 * reserve_stock and charge_payment run in parallel, ship_order waits for
 * both, and notify_customer runs on its own after shipping.
 */
std::vector<StepDefinition> make_demo_steps()
{
    std::vector<StepDefinition> steps;

    StepDefinition reserve;
    reserve.step_id = "reserve_stock";
    reserve.name = "Reserve stock";
    reserve.params = {{"sku", "WD-1001"}, {"quantity", 2}};
    reserve.action = make_step_action([](const ValueMap& params, StepStateView& state) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        state.set("reserved_quantity", params.at("quantity"));
        return ValueMap{{"reservation", "R-" + params.at("sku").as<std::string>()}};
    });
    reserve.rollback = make_rollback_action([](const ValueMap& params) {
        SPDLOG_INFO("Releasing reservation for {}", params.at("sku").to_string());
    });
    steps.push_back(reserve);

    StepDefinition charge;
    charge.step_id = "charge_payment";
    charge.name = "Charge payment";
    charge.retry_count = 2;
    charge.params = {{"amount", 49.90}};
    auto charge_attempts = std::make_shared<std::atomic<int>>(0);
    charge.action = make_step_action([charge_attempts](const ValueMap& params, StepStateView& state) {
        // The payment gateway rejects the first request
        if (charge_attempts->fetch_add(1) == 0)
        {
            throw std::runtime_error("payment gateway timeout");
        }
        state.set("charged_amount", params.at("amount"));
        return ValueMap{{"transaction", "T-0001"}};
    });
    charge.rollback = make_rollback_action([](const ValueMap& params) {
        SPDLOG_INFO("Refunding {}", params.at("amount").to_string());
    });
    steps.push_back(charge);

    StepDefinition ship;
    ship.step_id = "ship_order";
    ship.name = "Ship order";
    ship.dependencies = {"reserve_stock", "charge_payment"};
    ship.timeout_seconds = 5.0;
    ship.action = make_step_action([](const ValueMap&, StepStateView& state) {
        auto quantity = state.get_or("reserved_quantity", 0).as<std::int64_t>();
        state.set("shipped", true);
        return ValueMap{{"parcels", quantity}};
    });
    steps.push_back(ship);

    StepDefinition notify;
    notify.step_id = "notify_customer";
    notify.name = "Notify customer";
    notify.dependencies = {"ship_order"};
    notify.can_run_parallel = false;
    notify.action = make_step_action([](const ValueMap&, StepStateView& state) {
        bool shipped = state.get_or("shipped", false).as<bool>();
        return ValueMap{{"sent", shipped}};
    });
    steps.push_back(notify);

    return steps;
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        std::cout << "\n\n====== wavedag ======\n" << std::flush;

        ExecutorConfig config;
        if (argc > 1)
        {
            config = load_executor_config(argv[1]);
        }
        spdlog::set_level(spdlog::level::from_str(config.log_level));

        auto bus = make_event_bus(config.event_history_limit);
        auto connection = bus->subscribe_pattern("workflow:step:*", [](const WorkflowEvent& event) {
            SPDLOG_INFO("[event] {} {}", event.key(), event.step_id);
        });

        auto executor = make_workflow_executor(config, bus);
        executor->set_progress_callback([](const StepId& step_id, const StepResult& result) {
            SPDLOG_INFO("[progress] {} -> {}", step_id, to_string(result.status));
        });

        auto steps = make_demo_steps();
        ExecutionResult result = executor->execute(steps, "order_fulfilment", {{"order_id", "O-42"}});
        std::cout << dump_yaml(to_yaml(result)) << "\n";

        if (result.success && result.checkpoint)
        {
            auto first = executor->list_checkpoints().front();
            ExecutionResult undone = executor->rollback(
                steps, result.step_results, "demo rollback", first->checkpoint_id);
            std::cout << "\n" << undone.summary() << "\n";
        }

        connection.disconnect();
        executor->shutdown();

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
