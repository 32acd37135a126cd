// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0

#include "json_loader.hpp"
#include <CLI/CLI.hpp>
#include <evmc/hex.hpp>
#include <warden/predicate.hpp>
#include <warden/session.hpp>
#include <warden/user_operation.hpp>
#include <warden/warden.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;
using namespace warden;
using namespace warden::cmd;

namespace
{
std::ifstream open_input(const fs::path& path)
{
    std::ifstream f{path};
    if (!f)
        throw std::runtime_error{"cannot open " + path.string()};
    return f;
}

json::json proof_to_json(const std::vector<bytes32>& proof)
{
    auto j = json::json::array();
    for (const auto& node : proof)
        j.push_back(to_json_hex(node));
    return j;
}

bytes hex_option(const std::string& s)
{
    auto data = evmc::from_hex(s);
    if (!data)
        throw std::invalid_argument{"invalid hex: " + s};
    return std::move(*data);
}
}  // namespace

int main(int argc, char* argv[])
{
    try
    {
        CLI::App app{"warden session key tool"};
        app.set_version_flag("--version", "warden " WARDEN_VERSION);
        app.require_subcommand(1);

        fs::path session_file;
        auto& leaf_cmd = *app.add_subcommand("leaf", "Compute the Merkle leaf of the session");
        leaf_cmd.add_option("session", session_file, "Session JSON file")
            ->required()
            ->check(CLI::ExistingFile);

        fs::path sessions_file;
        auto& tree_cmd =
            *app.add_subcommand("tree", "Build the session tree and output the root and proofs");
        tree_cmd.add_option("sessions", sessions_file, "Session JSON array file")
            ->required()
            ->check(CLI::ExistingFile);

        std::string allowed_hex;
        std::string actual_hex;
        std::string value_str = "0";
        auto& check_cmd =
            *app.add_subcommand("check", "Evaluate the argument predicates against the arguments");
        check_cmd.add_option("--allowed", allowed_hex, "RLP list of predicates (hex)")->required();
        check_cmd.add_option("--actual", actual_hex, "RLP list of actual arguments (hex)")
            ->required();
        check_cmd.add_option("--value", value_str, "Native value of the call");

        fs::path op_file;
        std::string entry_point_hex;
        uint64_t chain_id = 1;
        auto& hash_cmd = *app.add_subcommand("user-op-hash", "Compute the user operation hash");
        hash_cmd.add_option("op", op_file, "User operation JSON file")
            ->required()
            ->check(CLI::ExistingFile);
        hash_cmd.add_option("--entry-point", entry_point_hex, "EntryPoint address")->required();
        hash_cmd.add_option("--chain-id", chain_id, "Chain id")->capture_default_str();

        CLI11_PARSE(app, argc, argv);

        auto& out = std::cout;

        if (leaf_cmd)
        {
            auto f = open_input(session_file);
            const auto sessions = load_sessions(f);
            for (const auto& session : sessions)
                out << to_json_hex(session_leaf_hash(session)) << "\n";
        }
        else if (tree_cmd)
        {
            auto f = open_input(sessions_file);
            const SessionTree tree{load_sessions(f)};

            json::json j;
            j["root"] = to_json_hex(tree.root());
            auto& leaves = j["leaves"] = json::json::array();
            for (size_t i = 0; i < tree.sessions().size(); ++i)
            {
                leaves.push_back(
                    {{"leaf", to_json_hex(tree.leaf(i))}, {"proof", proof_to_json(tree.proof(i))}});
            }
            out << j.dump(2) << "\n";
        }
        else if (check_cmd)
        {
            const auto allowed = hex_option(allowed_hex);
            const auto actual = hex_option(actual_hex);
            const auto value = intx::from_string<intx::uint256>(value_str);
            try
            {
                out << (predicate::is_allowed_calldata(allowed, actual, value) ? "allowed" :
                                                                                 "denied")
                    << "\n";
            }
            catch (const ValidationError& e)
            {
                out << "error: " << e.code().message() << "\n";
                return 1;
            }
        }
        else if (hash_cmd)
        {
            const auto entry_point = evmc::from_hex<address>(entry_point_hex);
            if (!entry_point)
                throw std::invalid_argument{"invalid entry point address: " + entry_point_hex};
            auto f = open_input(op_file);
            const auto op = load_user_operation(f);
            out << to_json_hex(user_op_hash(op, *entry_point, chain_id)) << "\n";
        }
        return 0;
    }
    catch (const std::exception& ex)
    {
        std::cerr << ex.what() << "\n";
        return -1;
    }
}
