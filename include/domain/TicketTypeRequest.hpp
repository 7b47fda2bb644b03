#pragma once

#include "enums/TicketType.hpp"

namespace cinema::domain {

/**
 * @brief Одна позиция заказа: категория билета и количество
 *
 * Immutable value object. Количество не проверяется при создании,
 * валидацией занимается PurchaseValidator.
 */
class TicketTypeRequest {
public:
    TicketTypeRequest(TicketType type, int noOfTickets)
        : type_(type)
        , noOfTickets_(noOfTickets)
    {}

    TicketType getTicketType() const { return type_; }
    int getNoOfTickets() const { return noOfTickets_; }

    bool operator==(const TicketTypeRequest& other) const {
        return type_ == other.type_ && noOfTickets_ == other.noOfTickets_;
    }

private:
    TicketType type_;
    int noOfTickets_;
};

} // namespace cinema::domain
