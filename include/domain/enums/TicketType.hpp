#pragma once

#include <string>
#include <stdexcept>

namespace cinema::domain {

/**
 * @brief Категория билета
 */
enum class TicketType {
    ADULT,   ///< Взрослый, занимает место
    CHILD,   ///< Детский, занимает место
    INFANT   ///< Младенец, сидит на коленях у взрослого, места не занимает
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(TicketType type) {
    switch (type) {
        case TicketType::ADULT:  return "ADULT";
        case TicketType::CHILD:  return "CHILD";
        case TicketType::INFANT: return "INFANT";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline TicketType parseTicketType(const std::string& str) {
    if (str == "ADULT" || str == "adult")   return TicketType::ADULT;
    if (str == "CHILD" || str == "child")   return TicketType::CHILD;
    if (str == "INFANT" || str == "infant") return TicketType::INFANT;
    throw std::invalid_argument("Unknown ticket type: " + str);
}

/**
 * @brief Занимает ли билет этой категории место в зале
 */
inline bool occupiesSeat(TicketType type) {
    return type != TicketType::INFANT;
}

} // namespace cinema::domain
