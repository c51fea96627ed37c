#include "adapters/primary/CommandLineHandler.hpp"
#include "application/projections/AccountBalancesProjector.hpp"
#include "application/projections/TransactionHistoryProjector.hpp"
#include "domain/Exceptions.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace eventstore::adapters::primary {

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_CANCELLED = 130;

} // namespace

CommandLineHandler::CommandLineHandler(
    std::shared_ptr<ports::input::IEventStatsService> statsService,
    std::shared_ptr<ports::input::IProjectionService> projectionService,
    std::shared_ptr<ports::input::IAccountService> accountService,
    std::shared_ptr<utils::CancellationToken> cancellation)
    : statsService_(std::move(statsService))
    , projectionService_(std::move(projectionService))
    , accountService_(std::move(accountService))
    , cancellation_(std::move(cancellation))
{}

int CommandLineHandler::handle(const std::vector<std::string>& args) {
    if (args.empty() || args[0] == "help" || args[0] == "--help") {
        printUsage(std::cout);
        return args.empty() ? EXIT_USAGE : EXIT_OK;
    }

    const std::string& command = args[0];
    try {
        if (command == "stats") return stats(args);
        if (command == "events") return events(args);
        if (command == "projectors") return projectors();
        if (command == "rebuild") return rebuild(args);
        if (command == "demo") return demo();
    } catch (const std::invalid_argument& e) {
        std::cerr << "[CLI] " << e.what() << std::endl;
        return EXIT_USAGE;
    } catch (const domain::ProjectorNotFoundException& e) {
        std::cerr << "[CLI] " << e.what() << std::endl;
        return EXIT_ERROR;
    } catch (const domain::RebuildCancelledException& e) {
        std::cerr << "[CLI] " << e.what() << std::endl;
        return EXIT_CANCELLED;
    }

    std::cerr << "[CLI] Unknown command: " << command << std::endl;
    printUsage(std::cerr);
    return EXIT_USAGE;
}

void CommandLineHandler::printUsage(std::ostream& out) {
    out << "Usage: event-store-cli <command> [args]\n"
        << "  stats [top]        event log statistics\n"
        << "  events [limit]     latest stored events (default 20)\n"
        << "  projectors         registered projections\n"
        << "  rebuild <name>     rebuild one projection from the event log\n"
        << "  rebuild --all      rebuild all projections\n"
        << "  demo               run the bank account scenario" << std::endl;
}

// ============================================================================
// COMMANDS
// ============================================================================

int CommandLineHandler::stats(const std::vector<std::string>& args) {
    auto statistics = statsService_->collect(parseCount(args, 1, 10));
    std::cout << statistics.toJson().dump(2) << std::endl;
    return EXIT_OK;
}

int CommandLineHandler::events(const std::vector<std::string>& args) {
    auto stored = statsService_->listEvents(parseCount(args, 1, 20));
    if (stored.empty()) {
        std::cout << "No events found" << std::endl;
        return EXIT_OK;
    }
    for (const auto& envelope : stored) {
        std::cout << envelope.toJson().dump() << std::endl;
    }
    return EXIT_OK;
}

int CommandLineHandler::projectors() {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& projector : projectionService_->getProjectors()) {
        list.push_back({
            {"name", projector->getName()},
            {"handles", projector->getHandledEvents()},
            {"position", projectionService_->getPosition(projector->getName())}
        });
    }
    std::cout << list.dump(2) << std::endl;
    return EXIT_OK;
}

int CommandLineHandler::rebuild(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        throw std::invalid_argument("rebuild requires a projector name or --all");
    }
    cancellation_->reset();
    if (args[1] == "--all") {
        projectionService_->rebuildAll(*cancellation_);
        std::cout << "All projections rebuilt" << std::endl;
    } else {
        projectionService_->rebuild(args[1], *cancellation_);
        std::cout << "Projection " << args[1] << " rebuilt, position "
                  << projectionService_->getPosition(args[1]) << std::endl;
    }
    return EXIT_OK;
}

int CommandLineHandler::demo() {
    std::cout << "[CLI] Running bank account demo..." << std::endl;

    auto alice = accountService_->openAccount("Alice", "EUR");
    auto bob = accountService_->openAccount("Bob", "EUR");

    for (int i = 1; i <= 12; ++i) {
        accountService_->deposit(alice, 1000, "salary-" + std::to_string(i));
    }
    accountService_->withdraw(alice, 2500, "rent");
    accountService_->deposit(bob, 500, "gift");
    accountService_->renameAccount(bob, "Robert");
    accountService_->withdraw(bob, 500, "cash");
    accountService_->closeAccount(bob, "moved abroad");

    auto balances = std::dynamic_pointer_cast<application::AccountBalancesProjector>(
        projectionService_->getProjector(application::AccountBalancesProjector::NAME));
    auto history = std::dynamic_pointer_cast<application::TransactionHistoryProjector>(
        projectionService_->getProjector(application::TransactionHistoryProjector::NAME));

    if (auto account = accountService_->getAccount(alice)) {
        std::cout << "Aggregate " << alice << ": balance " << account->getBalance()
                  << ", version " << account->getVersion() << std::endl;
    }
    if (balances) {
        for (const auto& view : balances->getAll()) {
            std::cout << "Read model " << view.accountId << " (" << view.holderName << "): "
                      << view.balance << " " << view.currency
                      << (view.closed ? " [closed]" : "") << std::endl;
        }
    }
    if (history) {
        std::cout << "Transactions recorded: " << history->size() << std::endl;
    }
    return EXIT_OK;
}

size_t CommandLineHandler::parseCount(const std::vector<std::string>& args, size_t index, size_t defaultValue) {
    if (args.size() <= index) {
        return defaultValue;
    }
    try {
        long long value = std::stoll(args[index]);
        if (value <= 0) {
            throw std::invalid_argument("must be positive");
        }
        return static_cast<size_t>(value);
    } catch (const std::exception&) {
        throw std::invalid_argument("Expected a positive number, got: " + args[index]);
    }
}

} // namespace eventstore::adapters::primary
