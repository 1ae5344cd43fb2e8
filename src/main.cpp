// SecureWallet command line front end
//
// Wires the wallet library to a JSON-RPC node through Foundry's `cast` tool and
// to a JSON key file holding the sealed software key. This build has no secure
// element or pairing transport, so the software backend is the one that
// detection finds; the selection logic is the same one a device build uses.
//
// Usage:
//   securewallet [--config <file>] <command> [args]
//
// Commands:
//   create                      generate a new software key
//   import <private-key-hex>    store an existing key
//   address                     print the active address
//   balance                     print the active balance
//   fee <to> <amount>           estimate the network fee of a transfer
//   send <to> <amount> [--wait] send, optionally waiting for confirmations
//   sign-message <text>         EIP-191 personal message signature
//   delete                      erase the active wallet
//   chain                       compare the node's chain id with the configuration

#include "cli_rpc_provider.hpp"
#include "config.hpp"
#include "error.hpp"
#include "external_signer.hpp"
#include "file_key_store.hpp"
#include "logger.hpp"
#include "signing_lock.hpp"
#include "software_signer.hpp"
#include "transaction_dispatcher.hpp"
#include "wallet_manager.hpp"
#include <iostream>
#include <string>
#include <termios.h>
#include <unistd.h>
#include <vector>

using namespace securewallet;

namespace {

constexpr auto DEFAULT_CONFIG_FILE = "securewallet.json";

void print_usage() {
    std::cerr << "usage: securewallet [--config <file>] <command> [args]\n"
              << "commands:\n"
              << "  create\n"
              << "  import <private-key-hex>\n"
              << "  address\n"
              << "  balance\n"
              << "  fee <to> <amount>\n"
              << "  send <to> <amount> [--wait]\n"
              << "  sign-message <text>\n"
              << "  delete\n"
              << "  chain\n";
}

// Reads a line from the terminal with echo turned off
std::string prompt_passphrase() {
    std::cerr << "Passphrase: " << std::flush;

    termios old_settings{};
    bool restore = tcgetattr(STDIN_FILENO, &old_settings) == 0;
    if (restore) {
        termios silent = old_settings;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        tcsetattr(STDIN_FILENO, TCSANOW, &silent);
    }

    std::string passphrase;
    std::getline(std::cin, passphrase);

    if (restore) {
        tcsetattr(STDIN_FILENO, TCSANOW, &old_settings);
    }
    std::cerr << std::endl;

    if (passphrase.empty()) {
        throw WalletError(WalletError::ErrorType::KeyStoreError, "No passphrase given");
    }
    return passphrase;
}

void print_account(const std::optional<Account>& account) {
    if (!account) {
        std::cout << "no wallet" << std::endl;
        return;
    }
    std::cout << account->address.to_checksum_string() << " (" << backend_name(account->kind) << ")" << std::endl;
}

void require_args(const std::vector<std::string>& args, size_t count) {
    if (args.size() < count) {
        print_usage();
        throw WalletError(WalletError::ErrorType::InvalidInput, "Missing arguments for '" + args[0] + "'");
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string config_path = DEFAULT_CONFIG_FILE;

    if (args.size() >= 2 && args[0] == "--config") {
        config_path = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) {
        print_usage();
        return 2;
    }

    try {
        WalletConfig config = WalletConfig::load(config_path);
        config.apply_environment();
        config.validate();

        Log::set_level(Log::parse_level(config.log_level));
        if (!config.log_file.empty()) {
            Log::open_file(config.log_file);
        }

        auto rpc = std::make_shared<CliRpcProvider>(config.rpc_url);
        auto store = std::make_shared<FileKeyStore>(config.key_store_path);

        std::string configured_passphrase = config.passphrase;
        auto software = std::make_shared<SoftwareSigner>(store, [configured_passphrase]() {
            return configured_passphrase.empty() ? prompt_passphrase() : configured_passphrase;
        });
        auto external = std::make_shared<ExternalSigner>();

        auto dispatcher = std::make_shared<TransactionDispatcher>(
            rpc, TransactionBuilder(config.max_send_amount), config.chain_id,
            std::make_shared<SigningLockRegistry>());

        WalletManager manager(nullptr, software, external, rpc, dispatcher);
        manager.refresh();

        const std::string& command = args[0];

        if (command == "create") {
            if (manager.get_active_account()) {
                throw WalletError(WalletError::ErrorType::InvalidInput,
                    "A wallet already exists; delete it first");
            }
            manager.create_wallet(BackendKind::Software, false);
            print_account(manager.get_active_account());
        } else if (command == "import") {
            require_args(args, 2);
            if (manager.get_active_account()) {
                throw WalletError(WalletError::ErrorType::InvalidInput,
                    "A wallet already exists; delete it first");
            }
            software->import_key(args[1]);
            print_account(manager.refresh());
        } else if (command == "address") {
            print_account(manager.get_active_account());
        } else if (command == "balance") {
            std::cout << manager.get_balance() << std::endl;
        } else if (command == "fee") {
            require_args(args, 3);
            std::cout << manager.estimate_fee(args[1], args[2]) << std::endl;
        } else if (command == "send") {
            require_args(args, 3);
            bool wait = args.size() > 3 && args[3] == "--wait";

            SendResult result = manager.send(args[1], args[2]);
            std::cout << result.tx_hash << std::endl;

            if (wait && result.broadcast_locally) {
                bool confirmed = dispatcher->await_confirmations(
                    result.tx_hash, config.confirmations,
                    std::chrono::milliseconds(config.confirmation_poll_ms), DEFAULT_CONFIRMATION_MAX_POLLS);
                std::cout << (confirmed ? "confirmed" : "pending") << std::endl;
            }
        } else if (command == "sign-message") {
            require_args(args, 2);
            std::cout << manager.sign_message(args[1]) << std::endl;
        } else if (command == "delete") {
            manager.delete_active_wallet();
            print_account(manager.get_active_account());
        } else if (command == "chain") {
            uint64_t node_chain = rpc->get_chain_id();
            std::cout << "node chain id " << node_chain << ", configured " << config.chain_id << std::endl;
            if (node_chain != config.chain_id) {
                LOG_WARN << "The node serves a different chain than the one configured";
                return 1;
            }
        } else {
            print_usage();
            return 2;
        }
    } catch (const WalletError& e) {
        std::cerr << "Error (" << WalletError::type_name(e.type()) << "): " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
