// include/EventStoreApp.hpp
#pragma once

#include <boost/di.hpp>

// Ports
#include "ports/input/IAccountService.hpp"
#include "ports/input/IEventStatsService.hpp"
#include "ports/input/IProjectionService.hpp"
#include "ports/output/IEventStore.hpp"
#include "ports/output/ISnapshotStore.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/EventStoreSettings.hpp"

// Application
#include "application/AccountService.hpp"
#include "application/EventStatsService.hpp"
#include "application/ProjectionManager.hpp"
#include "application/SnapshotPolicy.hpp"
#include "application/events/AccountEventCodecs.hpp"
#include "application/events/EventCodecRegistry.hpp"
#include "application/projections/AccountBalancesProjector.hpp"
#include "application/projections/TransactionHistoryProjector.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/InMemoryEventStore.hpp"
#include "adapters/secondary/persistence/InMemorySnapshotStore.hpp"
#include "adapters/secondary/persistence/PostgresEventStore.hpp"
#include "adapters/secondary/persistence/PostgresSnapshotStore.hpp"

// Primary Adapters
#include "adapters/primary/CommandLineHandler.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace di = boost::di;

namespace eventstore {

/**
 * @brief Консольное приложение журнала событий
 *
 * Template Method:
 * 1. loadEnvironment() - аргументы и настройки из ENV
 * 2. configureInjection() - выбор хранилищ по драйверу, сборка через Boost.DI
 * 3. run() - выполнение команды
 */
class EventStoreApp {
public:
    EventStoreApp() { std::cout << "[EventStoreApp] Initializing..." << std::endl; }
    virtual ~EventStoreApp() { std::cout << "[EventStoreApp] Shutting down..." << std::endl; }

    /**
     * @return Код выхода команды
     */
    int run(int argc, char* argv[]) {
        loadEnvironment(argc, argv);
        configureInjection();
        return handler_->handle(args_);
    }

    /**
     * @brief Прервать текущее перестроение (вызывается из обработчика сигнала)
     */
    void stop() noexcept {
        cancellation_->cancel();
    }

protected:
    virtual void loadEnvironment(int argc, char* argv[]) {
        args_.assign(argv + 1, argv + argc);

        auto settingsInjector = di::make_injector(
            di::bind<settings::DbSettings>().in(di::singleton),
            di::bind<settings::EventStoreSettings>().in(di::singleton)
        );
        dbSettings_ = settingsInjector.create<std::shared_ptr<settings::DbSettings>>();
        storeSettings_ = settingsInjector.create<std::shared_ptr<settings::EventStoreSettings>>();

        std::cout << "[EventStoreApp] Event store: "
                  << settings::EventStoreSettings::toString(storeSettings_->getStoreDriver())
                  << ", snapshots: "
                  << (storeSettings_->areSnapshotsEnabled()
                          ? settings::EventStoreSettings::toString(storeSettings_->getSnapshotDriver()) +
                                " every " + std::to_string(storeSettings_->getSnapshotThreshold())
                          : std::string("disabled"))
                  << std::endl;
    }

    virtual void configureInjection() {
        std::cout << "[EventStoreApp] Configuring DI..." << std::endl;

        // Шаг 1: декодеры событий
        auto codecs = std::make_shared<application::EventCodecRegistry>(storeSettings_->tolerateUnknownTypes());
        application::registerBankAccountEvents(*codecs);

        // Шаг 2: хранилища по драйверу
        std::shared_ptr<ports::output::IEventStore> eventStore;
        if (storeSettings_->getStoreDriver() == settings::StorageDriver::DATABASE) {
            eventStore = std::make_shared<adapters::secondary::PostgresEventStore>(dbSettings_, storeSettings_, codecs);
        } else {
            eventStore = std::make_shared<adapters::secondary::InMemoryEventStore>();
        }

        std::shared_ptr<ports::output::ISnapshotStore> snapshotStore;
        std::shared_ptr<application::ISnapshotPolicy> snapshotPolicy;
        if (storeSettings_->areSnapshotsEnabled()) {
            if (storeSettings_->getSnapshotDriver() == settings::StorageDriver::DATABASE) {
                snapshotStore = std::make_shared<adapters::secondary::PostgresSnapshotStore>(dbSettings_);
            } else {
                snapshotStore = std::make_shared<adapters::secondary::InMemorySnapshotStore>();
            }
            snapshotPolicy = std::make_shared<application::EveryNthVersionPolicy>(storeSettings_->getSnapshotThreshold());
        } else {
            snapshotStore = std::make_shared<adapters::secondary::InMemorySnapshotStore>();
            snapshotPolicy = std::make_shared<application::NeverSnapshotPolicy>();
        }

        // Шаг 3: основной injector с instance binding для хранилищ
        auto injector = di::make_injector(
            di::bind<settings::DbSettings>().to(dbSettings_),
            di::bind<settings::EventStoreSettings>().to(storeSettings_),
            di::bind<utils::CancellationToken>().to(cancellation_),

            di::bind<ports::output::IEventStore>().to(eventStore),
            di::bind<ports::output::ISnapshotStore>().to(snapshotStore),
            di::bind<application::ISnapshotPolicy>().to(snapshotPolicy),

            di::bind<application::BankAccountRepository>().in(di::singleton),
            di::bind<ports::input::IProjectionService>().to<application::ProjectionManager>().in(di::singleton),
            di::bind<ports::input::IEventStatsService>().to<application::EventStatsService>().in(di::singleton),
            di::bind<ports::input::IAccountService>().to<application::AccountService>().in(di::singleton)
        );

        // Шаг 4: проекции
        auto projections = injector.create<std::shared_ptr<ports::input::IProjectionService>>();
        projections->registerProjectors({
            std::make_shared<application::AccountBalancesProjector>(),
            std::make_shared<application::TransactionHistoryProjector>()
        });

        handler_ = injector.create<std::shared_ptr<adapters::primary::CommandLineHandler>>();
        std::cout << "[EventStoreApp] Ready" << std::endl;
    }

private:
    std::vector<std::string> args_;
    std::shared_ptr<settings::DbSettings> dbSettings_;
    std::shared_ptr<settings::EventStoreSettings> storeSettings_;
    std::shared_ptr<utils::CancellationToken> cancellation_ = std::make_shared<utils::CancellationToken>();
    std::shared_ptr<adapters::primary::CommandLineHandler> handler_;
};

} // namespace eventstore
