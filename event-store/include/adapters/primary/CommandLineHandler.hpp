#pragma once

#include "ports/input/IAccountService.hpp"
#include "ports/input/IEventStatsService.hpp"
#include "ports/input/IProjectionService.hpp"
#include "utils/CancellationToken.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace eventstore::adapters::primary {

/**
 * @brief Консольные команды event-store-cli
 *
 * - stats [top]          - статистика журнала
 * - events [limit]       - последние события (default: 20)
 * - projectors           - зарегистрированные проекции и их позиции
 * - rebuild <name>       - перестроить одну проекцию
 * - rebuild --all        - перестроить все проекции
 * - demo                 - сценарий с банковскими счетами
 */
class CommandLineHandler {
public:
    CommandLineHandler(
        std::shared_ptr<ports::input::IEventStatsService> statsService,
        std::shared_ptr<ports::input::IProjectionService> projectionService,
        std::shared_ptr<ports::input::IAccountService> accountService,
        std::shared_ptr<utils::CancellationToken> cancellation
    );

    /**
     * @param args Аргументы после имени программы
     * @return Код выхода процесса
     */
    int handle(const std::vector<std::string>& args);

    static void printUsage(std::ostream& out);

private:
    int stats(const std::vector<std::string>& args);
    int events(const std::vector<std::string>& args);
    int projectors();
    int rebuild(const std::vector<std::string>& args);
    int demo();

    static size_t parseCount(const std::vector<std::string>& args, size_t index, size_t defaultValue);

    std::shared_ptr<ports::input::IEventStatsService> statsService_;
    std::shared_ptr<ports::input::IProjectionService> projectionService_;
    std::shared_ptr<ports::input::IAccountService> accountService_;
    std::shared_ptr<utils::CancellationToken> cancellation_;
};

} // namespace eventstore::adapters::primary
