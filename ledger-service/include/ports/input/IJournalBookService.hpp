#pragma once

#include "domain/JournalBook.hpp"

namespace ledger::ports::input {

/**
 * @brief Libro Diario
 */
class IJournalBookService {
public:
    virtual ~IJournalBookService() = default;
    virtual domain::JournalBook getLibroDiario(const domain::JournalFilter& filter) = 0;
};

} // namespace ledger::ports::input
