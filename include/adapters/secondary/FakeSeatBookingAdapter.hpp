#pragma once

#include "ports/output/ISeatReservationService.hpp"
#include "settings/AppSettings.hpp"
#include <unordered_map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <iostream>

namespace cinema::adapters::secondary {

/**
 * @brief Fake система бронирования мест
 *
 * Копит число зарезервированных мест по аккаунтам.
 * При RESERVATION_FAIL=1 бросает std::runtime_error.
 */
class FakeSeatBookingAdapter : public ports::output::ISeatReservationService {
public:
    explicit FakeSeatBookingAdapter(std::shared_ptr<settings::AppSettings> settings)
        : failing_(settings && settings->isReservationFailing())
    {
        std::cout << "[FakeSeatBookingAdapter] Created"
                  << (failing_ ? " (failing mode)" : "") << std::endl;
    }

    void reserveSeat(int64_t accountId, int totalSeatsToAllocate) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failing_) {
            std::cerr << "[FakeSeatBookingAdapter] Reservation failed: account=" << accountId << std::endl;
            throw std::runtime_error("Seat booking unavailable");
        }

        reserved_[accountId] += totalSeatsToAllocate;
        ++reservationCount_;

        std::cout << "[FakeSeatBookingAdapter] Reserved account=" << accountId
                  << " seats=" << totalSeatsToAllocate << std::endl;
    }

    int getReservedSeats(int64_t accountId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = reserved_.find(accountId);
        return it != reserved_.end() ? it->second : 0;
    }

    int getReservationCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reservationCount_;
    }

    void setFailing(bool failing) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_ = failing;
    }

private:
    std::unordered_map<int64_t, int> reserved_;
    int reservationCount_ = 0;
    bool failing_;
    mutable std::mutex mutex_;
};

} // namespace cinema::adapters::secondary
