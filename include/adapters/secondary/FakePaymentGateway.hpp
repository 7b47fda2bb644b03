#pragma once

#include "ports/output/ITicketPaymentService.hpp"
#include "settings/AppSettings.hpp"
#include <unordered_map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <iostream>

namespace cinema::adapters::secondary {

/**
 * @brief Fake платёжный шлюз для разработки
 *
 * Ничего никуда не отправляет: пишет в лог и копит сумму по аккаунтам.
 * При PAYMENT_FAIL=1 каждый платёж заканчивается std::runtime_error.
 *
 * TODO: заменить HTTP-клиентом к настоящему платёжному шлюзу
 */
class FakePaymentGateway : public ports::output::ITicketPaymentService {
public:
    explicit FakePaymentGateway(std::shared_ptr<settings::AppSettings> settings)
        : failing_(settings && settings->isPaymentFailing())
    {
        std::cout << "[FakePaymentGateway] Created"
                  << (failing_ ? " (failing mode)" : "") << std::endl;
    }

    void makePayment(int64_t accountId, int totalAmountToPay) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failing_) {
            std::cerr << "[FakePaymentGateway] Payment declined: account=" << accountId << std::endl;
            throw std::runtime_error("Payment gateway unavailable");
        }

        charged_[accountId] += totalAmountToPay;
        ++paymentCount_;

        std::cout << "[FakePaymentGateway] Charged account=" << accountId
                  << " amount=" << totalAmountToPay << std::endl;
    }

    // Состояние для диагностики и тестов
    int64_t getTotalCharged(int64_t accountId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = charged_.find(accountId);
        return it != charged_.end() ? it->second : 0;
    }

    int getPaymentCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return paymentCount_;
    }

    void setFailing(bool failing) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_ = failing;
    }

private:
    std::unordered_map<int64_t, int64_t> charged_;
    int paymentCount_ = 0;
    bool failing_;
    mutable std::mutex mutex_;
};

} // namespace cinema::adapters::secondary
