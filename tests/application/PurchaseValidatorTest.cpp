/**
 * @file PurchaseValidatorTest.cpp
 * @brief Unit tests for PurchaseValidator
 */

#include <gtest/gtest.h>
#include "application/PurchaseValidator.hpp"

#include <limits>

using namespace cinema;
using namespace cinema::application;
using domain::TicketType;
using domain::TicketTypeRequest;
using domain::PurchaseErrorCode;

class PurchaseValidatorTest : public ::testing::Test {
protected:
    PurchaseValidator validator_;

    /// Код ошибки отклонённого заказа (тест падает, если заказ принят)
    PurchaseErrorCode rejectionCode(int64_t accountId, const std::vector<TicketTypeRequest>& requests) {
        try {
            validator_.validate(accountId, requests);
        } catch (const domain::InvalidPurchaseException& e) {
            return e.getErrorCode();
        }
        ADD_FAILURE() << "Purchase was expected to be rejected";
        return PurchaseErrorCode::INVALID_ACCOUNT_ID;
    }
};

// ============================================
// ACCEPTED ORDERS
// ============================================

TEST_F(PurchaseValidatorTest, AdultsAndChild_PriceAndSeats) {
    auto outcome = validator_.validate(123, {
        {TicketType::ADULT, 2},
        {TicketType::CHILD, 1}
    });

    EXPECT_EQ(outcome.accountId, 123);
    EXPECT_EQ(outcome.totalPrice, 50);
    EXPECT_EQ(outcome.totalSeats, 3);
}

TEST_F(PurchaseValidatorTest, InfantIsFreeAndHasNoSeat) {
    auto outcome = validator_.validate(123, {
        {TicketType::ADULT, 2},
        {TicketType::CHILD, 1},
        {TicketType::INFANT, 1}
    });

    EXPECT_EQ(outcome.totalPrice, 50);
    EXPECT_EQ(outcome.totalSeats, 3);
}

TEST_F(PurchaseValidatorTest, OrderOfLinesDoesNotMatter) {
    auto forward = validator_.validate(7, {
        {TicketType::ADULT, 3}, {TicketType::CHILD, 4}, {TicketType::INFANT, 2}
    });
    auto backward = validator_.validate(7, {
        {TicketType::INFANT, 2}, {TicketType::CHILD, 4}, {TicketType::ADULT, 3}
    });

    EXPECT_EQ(forward, backward);
    EXPECT_EQ(forward.totalPrice, 3 * 20 + 4 * 10);
    EXPECT_EQ(forward.totalSeats, 7);
}

TEST_F(PurchaseValidatorTest, SameTypeOnSeveralLines_Accumulates) {
    auto outcome = validator_.validate(1, {
        {TicketType::ADULT, 5}, {TicketType::ADULT, 5}, {TicketType::CHILD, 2}
    });

    EXPECT_EQ(outcome.totalPrice, 220);
    EXPECT_EQ(outcome.totalSeats, 12);
}

TEST_F(PurchaseValidatorTest, ExactlyTwentySeats_Accepted) {
    auto outcome = validator_.validate(1, {
        {TicketType::ADULT, 10}, {TicketType::CHILD, 10}
    });

    EXPECT_EQ(outcome.totalSeats, 20);
    EXPECT_EQ(outcome.totalPrice, 300);
}

TEST_F(PurchaseValidatorTest, ZeroQuantityLines_Accepted) {
    auto outcome = validator_.validate(1, {{TicketType::ADULT, 0}});

    EXPECT_EQ(outcome.totalPrice, 0);
    EXPECT_EQ(outcome.totalSeats, 0);
}

TEST_F(PurchaseValidatorTest, InfantsSpreadOverLines_NotCountedInLimit) {
    // Каждая строка младенцев сравнивается с 10 занятыми местами,
    // но сама места не добавляет: всего 30 билетов проходят
    auto outcome = validator_.validate(1, {
        {TicketType::ADULT, 10},
        {TicketType::INFANT, 10},
        {TicketType::INFANT, 10}
    });

    EXPECT_EQ(outcome.totalSeats, 10);
    EXPECT_EQ(outcome.totalPrice, 200);
}

// ============================================
// REJECTED ORDERS
// ============================================

TEST_F(PurchaseValidatorTest, NonPositiveAccount_Rejected) {
    EXPECT_EQ(rejectionCode(0, {{TicketType::ADULT, 2}}), PurchaseErrorCode::INVALID_ACCOUNT_ID);
    EXPECT_EQ(rejectionCode(-5, {{TicketType::ADULT, 2}}), PurchaseErrorCode::INVALID_ACCOUNT_ID);
}

TEST_F(PurchaseValidatorTest, AccountCheckedBeforeEverythingElse) {
    EXPECT_EQ(rejectionCode(0, {}), PurchaseErrorCode::INVALID_ACCOUNT_ID);
    EXPECT_EQ(rejectionCode(-1, {{TicketType::CHILD, -3}}), PurchaseErrorCode::INVALID_ACCOUNT_ID);
}

TEST_F(PurchaseValidatorTest, EmptyRequests_Rejected) {
    try {
        validator_.validate(1, {});
        FAIL() << "Expected InvalidPurchaseException";
    } catch (const domain::InvalidPurchaseException& e) {
        EXPECT_EQ(e.getErrorCode(), PurchaseErrorCode::MISSING_TICKET_REQUEST);
        EXPECT_STREQ(e.what(), "At least one ticket type request is required");
    }
}

TEST_F(PurchaseValidatorTest, NegativeQuantity_Rejected) {
    try {
        validator_.validate(1, {{TicketType::ADULT, 2}, {TicketType::CHILD, -1}});
        FAIL() << "Expected InvalidPurchaseException";
    } catch (const domain::InvalidPurchaseException& e) {
        EXPECT_EQ(e.getErrorCode(), PurchaseErrorCode::INVALID_TICKET_QUANTITY);
        EXPECT_STREQ(e.what(), "Invalid ticket quantity: -1");
    }
}

TEST_F(PurchaseValidatorTest, TooManyAdults_Rejected) {
    try {
        validator_.validate(1, {{TicketType::ADULT, 21}});
        FAIL() << "Expected InvalidPurchaseException";
    } catch (const domain::InvalidPurchaseException& e) {
        EXPECT_EQ(e.getErrorCode(), PurchaseErrorCode::MAX_TICKETS_EXCEEDED);
        EXPECT_STREQ(e.what(), "Maximum 20 tickets can be purchased at a time");
    }
}

TEST_F(PurchaseValidatorTest, SeatsCrossLimitOnLaterLine_Rejected) {
    EXPECT_EQ(rejectionCode(123, {
        {TicketType::ADULT, 20}, {TicketType::CHILD, 1}, {TicketType::INFANT, 1}
    }), PurchaseErrorCode::MAX_TICKETS_EXCEEDED);

    EXPECT_EQ(rejectionCode(1, {
        {TicketType::CHILD, 15}, {TicketType::ADULT, 6}
    }), PurchaseErrorCode::MAX_TICKETS_EXCEEDED);
}

TEST_F(PurchaseValidatorTest, InfantLineLargerThanHeadroom_Rejected) {
    EXPECT_EQ(rejectionCode(1, {{TicketType::ADULT, 20}, {TicketType::INFANT, 1}}),
              PurchaseErrorCode::MAX_TICKETS_EXCEEDED);
    EXPECT_EQ(rejectionCode(1, {{TicketType::ADULT, 1}, {TicketType::INFANT, 20}}),
              PurchaseErrorCode::MAX_TICKETS_EXCEEDED);
}

TEST_F(PurchaseValidatorTest, HugeQuantityAfterSeatedLine_Rejected) {
    const int huge = std::numeric_limits<int>::max();

    EXPECT_EQ(rejectionCode(1, {{TicketType::ADULT, 1}, {TicketType::ADULT, huge}}),
              PurchaseErrorCode::MAX_TICKETS_EXCEEDED);
    EXPECT_EQ(rejectionCode(1, {{TicketType::ADULT, 20}, {TicketType::CHILD, huge}}),
              PurchaseErrorCode::MAX_TICKETS_EXCEEDED);
    EXPECT_EQ(rejectionCode(1, {{TicketType::ADULT, 5}, {TicketType::INFANT, huge}}),
              PurchaseErrorCode::MAX_TICKETS_EXCEEDED);
}

TEST_F(PurchaseValidatorTest, FirstViolationWins) {
    // Лимит нарушен раньше, чем встретилось отрицательное количество
    EXPECT_EQ(rejectionCode(1, {{TicketType::ADULT, 25}, {TicketType::CHILD, -1}}),
              PurchaseErrorCode::MAX_TICKETS_EXCEEDED);
    // Без взрослого, но лимит проверяется по ходу прохода
    EXPECT_EQ(rejectionCode(1, {{TicketType::CHILD, 25}}),
              PurchaseErrorCode::MAX_TICKETS_EXCEEDED);
    EXPECT_EQ(rejectionCode(1, {{TicketType::CHILD, -2}}),
              PurchaseErrorCode::INVALID_TICKET_QUANTITY);
}

TEST_F(PurchaseValidatorTest, ChildOrInfantWithoutAdult_Rejected) {
    EXPECT_EQ(rejectionCode(123, {{TicketType::CHILD, 1}, {TicketType::INFANT, 1}}),
              PurchaseErrorCode::MISSING_ADULT_TICKET);
    EXPECT_EQ(rejectionCode(123, {{TicketType::CHILD, 1}}),
              PurchaseErrorCode::MISSING_ADULT_TICKET);
    EXPECT_EQ(rejectionCode(123, {{TicketType::INFANT, 0}}),
              PurchaseErrorCode::MISSING_ADULT_TICKET);
}

TEST_F(PurchaseValidatorTest, ZeroAdultsLineCountsAsAdult) {
    auto outcome = validator_.validate(1, {{TicketType::ADULT, 0}, {TicketType::CHILD, 2}});

    EXPECT_EQ(outcome.totalSeats, 2);
    EXPECT_EQ(outcome.totalPrice, 20);
}
