#pragma once

#include "ports/input/ITicketService.hpp"
#include "ports/output/ITicketPaymentService.hpp"
#include "ports/output/ISeatReservationService.hpp"
#include "application/PurchaseValidator.hpp"
#include <memory>
#include <iostream>

namespace cinema::application {

/**
 * @brief Сервис покупки билетов
 *
 * Поток:
 * - PurchaseValidator проверяет заказ и считает сумму/места
 * - оплата через ITicketPaymentService
 * - бронирование через ISeatReservationService
 *
 * Ошибки портов пробрасываются без обёртки. Компенсации нет:
 * если бронирование упало после успешной оплаты, оплата остаётся списанной.
 */
class TicketService : public ports::input::ITicketService {
public:
    TicketService(
        std::shared_ptr<ports::output::ITicketPaymentService> paymentService,
        std::shared_ptr<ports::output::ISeatReservationService> reservationService
    ) : paymentService_(std::move(paymentService))
      , reservationService_(std::move(reservationService))
    {
        std::cout << "[TicketService] Created" << std::endl;
    }

    void purchaseTickets(
        int64_t accountId,
        const std::vector<domain::TicketTypeRequest>& ticketTypeRequests) override
    {
        domain::PurchaseOutcome outcome;
        try {
            outcome = validator_.validate(accountId, ticketTypeRequests);
        } catch (const domain::InvalidPurchaseException& e) {
            std::cout << "[TicketService] REJECTED account=" << accountId
                      << " code=" << domain::toString(e.getErrorCode())
                      << ": " << e.what() << std::endl;
            throw;
        }

        paymentService_->makePayment(accountId, outcome.totalPrice);
        reservationService_->reserveSeat(accountId, outcome.totalSeats);

        std::cout << "[TicketService] Purchased account=" << accountId
                  << " price=" << outcome.totalPrice
                  << " seats=" << outcome.totalSeats << std::endl;
    }

    domain::PurchaseOutcome quoteTickets(
        int64_t accountId,
        const std::vector<domain::TicketTypeRequest>& ticketTypeRequests) const override
    {
        return validator_.validate(accountId, ticketTypeRequests);
    }

private:
    std::shared_ptr<ports::output::ITicketPaymentService> paymentService_;
    std::shared_ptr<ports::output::ISeatReservationService> reservationService_;
    PurchaseValidator validator_;
};

} // namespace cinema::application
