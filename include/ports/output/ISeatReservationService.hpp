#pragma once

#include <cstdint>

namespace cinema::ports::output {

/**
 * @brief Интерфейс внешней системы бронирования мест
 */
class ISeatReservationService {
public:
    virtual ~ISeatReservationService() = default;

    /**
     * @brief Зарезервировать места за аккаунтом
     * @param accountId ID аккаунта (> 0)
     * @param totalSeatsToAllocate Количество мест (>= 0), без младенцев
     */
    virtual void reserveSeat(int64_t accountId, int totalSeatsToAllocate) = 0;
};

} // namespace cinema::ports::output
