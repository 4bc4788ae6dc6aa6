// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license
// Unspent pool inspection tool

#include <node/chain_db.h>
#include <primitives/address.h>
#include <util/config.h>
#include <util/error_format.h>
#include <util/logging.h>
#include <iostream>
#include <string>
#include <vector>

struct InspectConfig {
    std::string datadir;
    std::vector<std::string> addresses;
    bool verify = false;
    bool debug = false;

    bool ParseArgs(int argc, char* argv[]);
    void PrintUsage(const char* program) const;
};

bool InspectConfig::ParseArgs(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg.find("-datadir=") == 0) {
            datadir = arg.substr(9);
        } else if (arg.find("-address=") == 0) {
            addresses.push_back(arg.substr(9));
        } else if (arg == "-verify") {
            verify = true;
        } else if (arg == "-debug") {
            debug = true;
        } else if (arg == "-help" || arg == "--help" || arg == "-h") {
            return false;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

void InspectConfig::PrintUsage(const char* program) const {
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -datadir=<dir>      Data directory (default: " << GetDefaultDataDir() << ")" << std::endl;
    std::cout << "  -address=<hex>      List unspent outputs of an address (repeatable)" << std::endl;
    std::cout << "  -verify             Check the cache, checksum and store agree" << std::endl;
    std::cout << "  -debug              Enable debug logging" << std::endl;
    std::cout << "  -help               Print this message" << std::endl;
}

static void PrintUxOut(const CUxOut& ux) {
    std::cout << "    " << ux.GetHash().GetHex()
              << "  coins=" << ux.body.nCoins
              << " hours=" << ux.body.nHours
              << " seq=" << ux.head.nBkSeq
              << " tx=" << ux.body.hashSrcTx.GetHex() << std::endl;
}

int main(int argc, char* argv[]) {
    InspectConfig config;
    if (!config.ParseArgs(argc, argv)) {
        config.PrintUsage(argv[0]);
        return 1;
    }

    std::string initial_datadir = config.datadir.empty() ? GetDefaultDataDir() : config.datadir;

    CConfigParser config_parser;
    if (!config_parser.LoadConfigFile(GetConfigFilePath(initial_datadir))) {
        ErrorMessage error = CErrorFormatter::ConfigError("conf", "cannot read " + config_parser.GetConfigFilePath());
        std::cerr << CErrorFormatter::FormatForUser(error) << std::endl;
        return 1;
    }

    // Command-line values override the config file
    if (!config.datadir.empty()) {
        config_parser.Set("datadir", config.datadir);
    }
    if (config.debug) {
        config_parser.Set("debug", "1");
    }
    for (const std::string& address : config_parser.GetList("address")) {
        config.addresses.push_back(address);
    }

    std::string datadir = config_parser.GetString("datadir", initial_datadir);

    ApplyLoggingSettings(config_parser);
    if (!CLogger::GetInstance().Initialize(datadir)) {
        std::cerr << "Warning: Failed to initialize logging system" << std::endl;
    }

    std::vector<CAddress> addresses;
    for (const std::string& hex : config.addresses) {
        CAddress address;
        if (!address.SetHex(hex)) {
            ErrorMessage error = CErrorFormatter::ConfigError("address", "'" + hex + "' is not a 42-digit hex address");
            std::cerr << CErrorFormatter::FormatForUser(error) << std::endl;
            return 1;
        }
        addresses.push_back(address);
    }

    DBOptions options = CChainDB::OptionsFromConfig(config_parser);
    options.create_if_missing = false;

    std::cout << "======================================" << std::endl;
    std::cout << "Uxledger Unspent Pool Inspector" << std::endl;
    std::cout << "======================================" << std::endl;
    std::cout << "Data directory: " << datadir << std::endl << std::endl;

    CChainDB chain;
    std::string db_error;
    if (!chain.Open(datadir, options, db_error)) {
        ErrorMessage error = CErrorFormatter::DatabaseError("open", db_error);
        std::cerr << CErrorFormatter::FormatForUser(error) << std::endl;
        return 1;
    }

    CBlockHeader head;
    if (chain.Tree().GetHead(head)) {
        std::cout << "Head block:     " << head.GetHash().GetHex() << std::endl;
        std::cout << "  Sequence:     " << head.nBkSeq << std::endl;
        std::cout << "  Time:         " << head.nTime << std::endl;
    } else {
        std::cout << "Head block:     (none)" << std::endl;
    }
    std::cout << "Unspent count:  " << chain.Unspents().Len() << std::endl;
    std::cout << "Unspent hash:   " << chain.Unspents().GetUxHash().GetHex() << std::endl;

    if (!addresses.empty()) {
        AddressUxOuts byAddress = chain.Unspents().GetUnspentsOfAddrs(addresses);
        for (const CAddress& address : addresses) {
            auto it = byAddress.find(address);
            size_t count = it == byAddress.end() ? 0 : it->second.size();
            uint64_t coins = 0;

            std::cout << std::endl << "Address " << address.GetHex() << ": " << count << " unspent" << std::endl;
            if (it != byAddress.end()) {
                for (const CUxOut& ux : it->second) {
                    PrintUxOut(ux);
                    coins += ux.body.nCoins;
                }
            }
            std::cout << "  Total coins: " << coins << std::endl;
        }
    }

    int ret = 0;
    if (config.verify) {
        CUnspentError error;
        std::cout << std::endl;
        if (chain.Unspents().VerifyConsistency(error)) {
            std::cout << "Consistency check: OK" << std::endl;
        } else {
            ErrorMessage message = CErrorFormatter::ConsistencyError(UnspentErrorTypeName(error.type), error.message);
            std::cerr << CErrorFormatter::FormatForUser(message) << std::endl;
            LogPrintUnspent(ERROR, "%s", CErrorFormatter::FormatForLog(message).c_str());
            ret = 2;
        }
    }

    std::cout << std::endl;
    std::cout << "======================================" << std::endl;

    chain.Close();
    CLogger::GetInstance().Shutdown();
    return ret;
}
