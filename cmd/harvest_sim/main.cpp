// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <harvest/core/address.hpp>
#include <harvest/core/fmt/address_fmt.hpp>
#include <harvest/core/fmt/int_fmt.hpp>
#include <harvest/core/int.hpp>
#include <harvest/core/json.hpp>
#include <harvest/core/likely.h>
#include <harvest/core/log_level_map.hpp>
#include <harvest/core/result.hpp>
#include <harvest/farm/constants.hpp>
#include <harvest/farm/farm_error.hpp>
#include <harvest/farm/farm_params.hpp>
#include <harvest/farm/staking_engine.hpp>
#include <harvest/state/state.hpp>
#include <harvest/token/ledger_token.hpp>
#include <harvest/token/token_registry.hpp>

#include <CLI/CLI.hpp>
#include <evmc/hex.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <cstdint>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>

using namespace harvest;
namespace fs = std::filesystem;

namespace
{
    // mints the initial holdings of every scenario asset
    constexpr auto ASSET_MINTER =
        0x00000000000000000000000000000000000000ff_address;

    struct Simulation
    {
        State state{};
        LedgerToken reward;
        std::deque<LedgerToken> assets{};
        TokenRegistry tokens{};
        std::set<Address> accounts{};
        std::unique_ptr<StakingEngine> engine{};

        Simulation(Address const &farm, Address const &reward_address)
            : reward{state, reward_address, "REWARD"}
        {
            reward.set_minter(farm);
            tokens.add(reward);
        }
    };

    uint64_t tick_of(StakingEngine const &engine, nlohmann::json const &action)
    {
        return action.contains("tick") ? json_to_uint64(action["tick"])
                                       : engine.latest_tick();
    }

    bool with_update(nlohmann::json const &action)
    {
        return action.value("with_update", false);
    }

    Result<void>
    setup_asset(Simulation &sim, nlohmann::json const &asset_json)
    {
        Address const address = json_to_address(asset_json.at("address"));
        auto &asset = sim.assets.emplace_back(
            sim.state, address, asset_json.value("symbol", ""));
        if (HARVEST_UNLIKELY(!sim.tokens.add(asset))) {
            LOG_ERROR("harvest_sim: asset {} declared twice", address);
            return FarmError::InvalidConfig;
        }
        asset.set_minter(ASSET_MINTER);

        if (!asset_json.contains("holders")) {
            return outcome::success();
        }
        for (auto const &[holder_hex, amount] :
             asset_json["holders"].items()) {
            Address const holder = json_to_address(holder_hex);
            BOOST_OUTCOME_TRY(
                asset.mint(ASSET_MINTER, holder, json_to_uint256(amount)));
            BOOST_OUTCOME_TRY(asset.approve(
                holder,
                sim.engine->address(),
                std::numeric_limits<uint256_t>::max()));
            sim.accounts.insert(holder);
        }
        return outcome::success();
    }

    Result<void> run_action(
        Simulation &sim, nlohmann::json const &action, nlohmann::json &record)
    {
        StakingEngine &engine = *sim.engine;
        auto const op = action.at("op").get<std::string>();
        uint64_t const tick = tick_of(engine, action);
        record["op"] = op;
        record["tick"] = tick;

        if (op == "deposit" || op == "withdraw" ||
            op == "emergency_withdraw" || op == "pending") {
            Address const participant =
                json_to_address(action.at("participant"));
            uint64_t const pool = json_to_uint64(action.at("pool"));
            sim.accounts.insert(participant);

            if (op == "deposit") {
                return engine.deposit(
                    participant,
                    pool,
                    json_to_uint256(action.at("amount")),
                    tick);
            }
            if (op == "withdraw") {
                return engine.withdraw(
                    participant,
                    pool,
                    json_to_uint256(action.at("amount")),
                    tick);
            }
            if (op == "emergency_withdraw") {
                return engine.emergency_withdraw(participant, pool, tick);
            }
            BOOST_OUTCOME_TRY(
                auto const pending,
                engine.pending_reward(pool, participant, tick));
            LOG_INFO(
                "harvest_sim: pending reward of {} in pool {} at tick {}: {}",
                participant,
                pool,
                tick,
                pending);
            record["pending"] = intx::to_string(pending, 10);
            return outcome::success();
        }
        if (op == "add_pool") {
            BOOST_OUTCOME_TRY(
                auto const id,
                engine.add_pool(
                    json_to_address(action.at("caller")),
                    json_to_uint256(action.at("weight")),
                    json_to_address(action.at("asset")),
                    with_update(action),
                    tick));
            record["pool"] = id;
            return outcome::success();
        }
        if (op == "set_pool") {
            return engine.set_pool(
                json_to_address(action.at("caller")),
                json_to_uint64(action.at("pool")),
                json_to_uint256(action.at("weight")),
                with_update(action),
                tick);
        }
        if (op == "update_pool") {
            return engine.update_pool(json_to_uint64(action.at("pool")), tick);
        }
        if (op == "mass_update_pools") {
            return engine.mass_update_pools(tick);
        }
        if (op == "transfer_ownership") {
            return engine.transfer_ownership(
                json_to_address(action.at("caller")),
                json_to_address(action.at("new_owner")));
        }
        if (op == "set_dev_address") {
            Address const dev = json_to_address(action.at("dev_address"));
            sim.accounts.insert(dev);
            return engine.set_dev_address(
                json_to_address(action.at("caller")), dev);
        }
        LOG_ERROR("harvest_sim: unknown op '{}'", op);
        return FarmError::InvalidConfig;
    }

    nlohmann::json summarize(Simulation const &sim)
    {
        StakingEngine const &engine = *sim.engine;
        nlohmann::json summary;

        summary["latest_tick"] = engine.latest_tick();
        summary["owner"] = to_hex(engine.owner());
        summary["dev_address"] = to_hex(engine.dev_address());
        summary["total_allocation_weight"] =
            intx::to_string(engine.total_allocation_weight(), 10);
        summary["reward_supply"] =
            intx::to_string(sim.reward.total_supply(), 10);

        auto &pools = summary["pools"] = nlohmann::json::array();
        for (uint64_t id = 0; id < engine.pool_length(); ++id) {
            auto const pool = engine.pool(id).value();
            nlohmann::json entry;
            entry["id"] = id;
            entry["staked_asset"] = to_hex(pool.staked_asset);
            entry["alloc_weight"] = intx::to_string(pool.alloc_weight, 10);
            entry["last_refresh_tick"] = pool.last_refresh_tick;
            entry["acc_reward_per_share"] =
                intx::to_string(pool.acc_reward_per_share, 10);

            auto &positions = entry["positions"] = nlohmann::json::object();
            for (auto const &account : sim.accounts) {
                auto const position = engine.position(id, account).value();
                if (position.amount == 0 && position.reward_debt == 0) {
                    continue;
                }
                positions[to_hex(account)] = {
                    {"amount", intx::to_string(position.amount, 10)},
                    {"reward_debt", intx::to_string(position.reward_debt, 10)}};
            }
            pools.push_back(std::move(entry));
        }

        auto &balances = summary["reward_balances"] = nlohmann::json::object();
        for (auto const &account : sim.accounts) {
            balances[to_hex(account)] =
                intx::to_string(sim.reward.balance_of(account), 10);
        }
        balances[to_hex(engine.address())] =
            intx::to_string(sim.reward.balance_of(engine.address()), 10);

        auto &events = summary["events"] = nlohmann::json::array();
        for (auto const &log : sim.state.logs()) {
            nlohmann::json entry;
            entry["address"] = to_hex(log.address);
            entry["topics"] = nlohmann::json::array();
            for (auto const &topic : log.topics) {
                entry["topics"].push_back(
                    "0x" + evmc::hex({topic.bytes, sizeof(topic.bytes)}));
            }
            entry["data"] =
                "0x" + evmc::hex({log.data.data(), log.data.size()});
            events.push_back(std::move(entry));
        }
        return summary;
    }

    int run(
        FarmParams const &params, nlohmann::json const &scenario,
        Address const &farm)
    {
        Simulation sim{farm, DEFAULT_REWARD_TOKEN_ADDRESS};
        sim.engine = std::make_unique<StakingEngine>(
            sim.state, farm, params, sim.reward, sim.tokens);
        sim.accounts.insert(params.owner);
        sim.accounts.insert(params.dev_address);

        try {
            for (auto const &asset_json : scenario.value(
                     "assets", nlohmann::json::array())) {
                auto const res = setup_asset(sim, asset_json);
                if (HARVEST_UNLIKELY(res.has_error())) {
                    LOG_ERROR(
                        "harvest_sim: asset setup failed: {}",
                        res.assume_error().message().c_str());
                    return 1;
                }
            }
        }
        catch (std::exception const &e) {
            LOG_ERROR("harvest_sim: malformed asset: {}", e.what());
            return 1;
        }

        nlohmann::json results = nlohmann::json::array();
        unsigned failures = 0;
        for (auto const &action :
             scenario.value("actions", nlohmann::json::array())) {
            nlohmann::json record;
            try {
                auto const res = run_action(sim, action, record);
                if (res.has_error()) {
                    ++failures;
                    record["status"] = res.assume_error().message().c_str();
                    LOG_WARNING(
                        "harvest_sim: action {} ({}) failed: {}",
                        results.size(),
                        action.dump(),
                        res.assume_error().message().c_str());
                }
                else {
                    record["status"] = "ok";
                }
            }
            catch (std::exception const &e) {
                ++failures;
                record["status"] = std::string{"malformed action: "} + e.what();
                LOG_WARNING(
                    "harvest_sim: action {} is malformed: {}",
                    results.size(),
                    e.what());
            }
            results.push_back(std::move(record));
        }

        auto summary = summarize(sim);
        summary["actions"] = std::move(results);
        summary["failures"] = failures;
        std::cout << summary.dump(2) << std::endl;

        LOG_INFO(
            "harvest_sim: ran {} actions, {} failed",
            summary["actions"].size(),
            failures);
        return 0;
    }
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"harvest_sim"};
    cli.option_defaults()->always_capture_default();

    fs::path params_file{};
    fs::path scenario_file{};
    std::string farm_hex = to_hex(DEFAULT_FARM_ADDRESS);
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--params", params_file, "farm parameters json")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--scenario", scenario_file, "scenario json")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--farm", farm_hex, "address of the farm");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::RequiredError const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stderr_handler = quill::stderr_handler();
    stderr_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stderr_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    Address farm{};
    try {
        farm = json_to_address(nlohmann::json(farm_hex));
    }
    catch (std::invalid_argument const &e) {
        LOG_ERROR("harvest_sim: --farm {}: {}", farm_hex, e.what());
        return 1;
    }

    auto const params = load_farm_params(params_file);
    if (HARVEST_UNLIKELY(params.has_error())) {
        LOG_ERROR(
            "harvest_sim: cannot load {}: {}",
            params_file.string(),
            params.assume_error().message().c_str());
        return 1;
    }

    std::ifstream ifile(scenario_file.c_str());
    auto const scenario = nlohmann::json::parse(ifile, nullptr, false);
    if (HARVEST_UNLIKELY(scenario.is_discarded() || !scenario.is_object())) {
        LOG_ERROR(
            "harvest_sim: {} is not a json object", scenario_file.string());
        return 1;
    }

    return run(params.value(), scenario, farm);
}
