#include "domain/TransactionType.hpp"

#include <stdexcept>

namespace ledger::domain {

TransactionType TransactionType::categoryFunding(const std::string& category) {
    if (category.empty()) {
        throw std::invalid_argument("Category label must not be empty");
    }
    if (isReservedLabel(category)) {
        throw std::invalid_argument("Category label is reserved: " + category);
    }
    return TransactionType(TransactionKind::CATEGORY_FUNDING, category);
}

TransactionType TransactionType::restore(TransactionKind kind, const std::string& category) {
    if (kind == TransactionKind::CATEGORY_FUNDING) {
        return categoryFunding(category);
    }
    if (!category.empty()) {
        throw std::invalid_argument("Category is only allowed for CATEGORY_FUNDING, got kind " + toString(kind));
    }
    return TransactionType(kind, "");
}

TransactionType TransactionType::fromLabel(const std::string& label) {
    if (label == "Deposit")    return deposit();
    if (label == "Withdrawal") return withdrawal();
    if (label == "Transfer")   return transfer();
    return categoryFunding(label);
}

bool TransactionType::isReservedLabel(const std::string& label) {
    return label == "Deposit" || label == "Withdrawal" || label == "Transfer";
}

// Без default: новый вид без ветки здесь ломает сборку (-Werror=switch)
bool TransactionType::isInflow() const {
    switch (kind_) {
        case TransactionKind::DEPOSIT:
            return true;
        case TransactionKind::WITHDRAWAL:
        case TransactionKind::TRANSFER:
        case TransactionKind::CATEGORY_FUNDING:
            return false;
    }
    return false;
}

std::string TransactionType::label() const {
    switch (kind_) {
        case TransactionKind::DEPOSIT:          return "Deposit";
        case TransactionKind::WITHDRAWAL:       return "Withdrawal";
        case TransactionKind::TRANSFER:         return "Transfer";
        case TransactionKind::CATEGORY_FUNDING: return category_;
    }
    return category_;
}

} // namespace ledger::domain
