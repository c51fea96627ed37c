#pragma once

#include "ports/output/IProjector.hpp"
#include "domain/Exceptions.hpp"
#include <functional>
#include <string>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace eventstore::application {

/**
 * @brief Базовый проектор с таблицей обработчиков "тип события → метод"
 *
 * Наследник регистрирует обработчики в конструкторе через when<E>().
 * Список getHandledEvents() строится из той же таблицы, поэтому
 * заявленные и реально обрабатываемые типы не расходятся.
 */
class AbstractProjector : public ports::output::IProjector {
public:
    AbstractProjector() = default;

    // Обработчики держат указатель на this
    AbstractProjector(const AbstractProjector&) = delete;
    AbstractProjector& operator=(const AbstractProjector&) = delete;

    std::vector<std::string> getHandledEvents() const override {
        return handledTypes_;
    }

    void project(const domain::DomainEvent& event) override {
        auto it = handlers_.find(event.eventType);
        if (it != handlers_.end()) {
            it->second(event);
        }
    }

protected:
    using Handler = std::function<void(const domain::DomainEvent&)>;

    template <typename E, typename Self>
    void when(const std::string& eventType, void (Self::*handler)(const E&)) {
        Self* self = static_cast<Self*>(this);
        if (handlers_.count(eventType) == 0) {
            handledTypes_.push_back(eventType);
        }
        handlers_[eventType] = [self, handler, eventType](const domain::DomainEvent& event) {
            const auto* typed = dynamic_cast<const E*>(&event);
            if (!typed) {
                throw domain::CorruptEventException(eventType,
                    std::string("projector expected ") + typeid(E).name());
            }
            (self->*handler)(*typed);
        };
    }

private:
    std::unordered_map<std::string, Handler> handlers_;
    std::vector<std::string> handledTypes_;
};

} // namespace eventstore::application
