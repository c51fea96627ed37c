// include/application/events/EventCodecRegistry.hpp
#pragma once

#include "domain/Exceptions.hpp"
#include "domain/events/DomainEventFactory.hpp"
#include "domain/events/GenericDomainEvent.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace eventstore::application {

/**
 * @brief Реестр декодеров событий "тип → конструктор из EventData"
 *
 * Регистрация выполняется при старте приложения, после этого реестр
 * только читается и может использоваться из любых потоков.
 */
class EventCodecRegistry final : public domain::DomainEventFactory {
public:
    using Decoder = std::function<domain::EventPtr(const domain::EventData&)>;

    /**
     * @param tolerateUnknownTypes true - неизвестный тип декодируется в
     *        GenericDomainEvent вместо CorruptEventException
     */
    explicit EventCodecRegistry(bool tolerateUnknownTypes = false)
        : tolerateUnknownTypes_(tolerateUnknownTypes) {}

    void registerEvent(const std::string& eventType, Decoder decoder) {
        decoders_[eventType] = std::move(decoder);
    }

    /**
     * @brief Регистрация события, у которого есть конструктор из EventData
     */
    template <typename E>
    void registerEvent() {
        registerEvent(E::TYPE, [](const domain::EventData& data) -> domain::EventPtr {
            return std::make_shared<const E>(data);
        });
    }

    domain::EventPtr create(const domain::EventData& data) const override {
        return decode(data);
    }

    /**
     * @throws CorruptEventException битый payload или неизвестный тип (strict)
     */
    domain::EventPtr decode(const domain::EventData& data) const {
        auto it = decoders_.find(data.eventType);
        if (it == decoders_.end()) {
            if (!tolerateUnknownTypes_) {
                throw domain::CorruptEventException(data.eventType, "event type is not registered");
            }
            std::cerr << "[EventCodecRegistry] Unknown event type '" << data.eventType
                      << "' (event " << data.eventId << "), decoded as generic" << std::endl;
            return std::make_shared<const domain::GenericDomainEvent>(data);
        }

        try {
            return it->second(data);
        } catch (const nlohmann::json::exception& e) {
            throw domain::CorruptEventException(data.eventType, e.what());
        }
    }

    domain::EventData encode(const domain::DomainEvent& event) const {
        return event.toEventData();
    }

    bool isRegistered(const std::string& eventType) const {
        return decoders_.count(eventType) > 0;
    }

    std::vector<std::string> registeredTypes() const {
        std::vector<std::string> types;
        types.reserve(decoders_.size());
        for (const auto& [type, decoder] : decoders_) {
            types.push_back(type);
        }
        std::sort(types.begin(), types.end());
        return types;
    }

    bool tolerateUnknownTypes() const { return tolerateUnknownTypes_; }

private:
    bool tolerateUnknownTypes_;
    std::unordered_map<std::string, Decoder> decoders_;
};

} // namespace eventstore::application
