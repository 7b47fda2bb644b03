#pragma once

#include <cstdint>

namespace cinema::ports::output {

/**
 * @brief Интерфейс внешнего платёжного шлюза
 *
 * Реализация считается надёжной: ошибки шлюза не перехватываются
 * сервисом и уходят вызывающему как есть.
 */
class ITicketPaymentService {
public:
    virtual ~ITicketPaymentService() = default;

    /**
     * @brief Списать оплату с аккаунта
     * @param accountId ID аккаунта (> 0)
     * @param totalAmountToPay Сумма к оплате (>= 0)
     */
    virtual void makePayment(int64_t accountId, int totalAmountToPay) = 0;
};

} // namespace cinema::ports::output
